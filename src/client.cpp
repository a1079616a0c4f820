/*
 * 설명: 주 IRC 연결 세션 구현. 연결 단계 진행, NICK/USER 등록, PING/PONG, DCC 제안 라우팅, Update 배출.
 * 버전: v0.6.0
 * 관련 문서: DESIGN.md (Client Driver)
 * 테스트: tests/unit/manager_test.cpp (ServerHandle 경로)
 */
#include "client.hpp"

#include <sstream>
#include <stdexcept>

#include "dcc/send.hpp"

namespace {

const char kErrNicknameInUse[] = "433";
const char kRplWelcome[] = "001";

transport::Security ToSecurity(const config::ServerSettings &server) {
    if (!server.tls) {
        return transport::Security::Unsecured();
    }
    transport::Security security = transport::Security::Secured(server.accept_invalid_certs);
    security.root_cert_path = server.root_cert_path;
    security.client_cert_path = server.client_cert_path;
    security.client_key_path = server.client_key_path;
    return security;
}

transport::Proxy ToProxy(const config::ProxySettings &settings) {
    transport::Proxy proxy;
    switch (settings.kind) {
        case config::ProxyKind::kNone:
            proxy.kind = transport::Proxy::kNone;
            break;
        case config::ProxyKind::kHttp:
            proxy.kind = transport::Proxy::kHttp;
            break;
        case config::ProxyKind::kSocks5:
            proxy.kind = transport::Proxy::kSocks5;
            break;
    }
    proxy.host = settings.host;
    proxy.port = settings.port;
    proxy.username = settings.username;
    proxy.password = settings.password;
    return proxy;
}

}  // namespace

bool OutboundQueue::Send(const protocol::Message &message) {
    if (closed_ || !protocol::FitsLineLimit(protocol::FormatMessage(message))) {
        return false;
    }
    pending_.push_back(message);
    return true;
}

bool OutboundQueue::TakeNext(protocol::Message &out) {
    if (pending_.empty()) {
        return false;
    }
    out = pending_.front();
    pending_.pop_front();
    return true;
}

void OutboundQueue::Close() {
    closed_ = true;
    pending_.clear();
}

ClientSession::ClientSession(net::Reactor &reactor, const config::Settings &settings,
                             Logger &logger)
    : server_name_(settings.server.host),
      server_settings_(settings.server),
      logger_(logger),
      outbound_(std::make_shared<OutboundQueue>()),
      manager_(reactor, outbound_, settings.server.host, settings.file_transfer,
               ToProxy(settings.proxy), logger),
      state_(kConnecting),
      failed_(false),
      listing_requested_(false),
      nickname_(settings.server.nickname) {
    if (server_settings_.host.empty() || nickname_.empty()) {
        throw std::runtime_error("server.host 와 server.nickname 은 필수");
    }
    connector_.reset(new transport::Connector(server_settings_.host, server_settings_.port,
                                              ToSecurity(server_settings_),
                                              ToProxy(settings.proxy)));
    std::ostringstream oss;
    oss << "서버 연결 시작: " << server_settings_.host << ":" << server_settings_.port
        << (server_settings_.tls ? " (TLS)" : "");
    logger_.Info(oss.str());
}

void ClientSession::QueueSend(const std::string &remote_user, const std::string &path) {
    pending_sends_.push_back(std::make_pair(remote_user, path));
}

void ClientSession::RequestQuit() {
    if (state_ == kClosed || state_ == kQuitting) {
        return;
    }
    if (!connection_) {
        Close(false);
        return;
    }
    connection_->Send(protocol::MakeCommand("QUIT", "bye"));
    state_ = kQuitting;
}

int ClientSession::PollFd() const {
    if (connection_) {
        return connection_->Fd();
    }
    if (connector_) {
        return connector_->Fd();
    }
    return -1;
}

short ClientSession::PollEvents() const {
    if (connection_) {
        return connection_->PollEvents();
    }
    if (connector_) {
        return connector_->PollEvents();
    }
    return 0;
}

bool ClientSession::Runnable() const {
    if (state_ == kClosed) {
        return false;
    }
    // 이름 해석 전에는 감시할 소켓이 없다.
    if (state_ == kConnecting && connector_ && connector_->Fd() < 0) {
        return true;
    }
    if (listing_requested_ || outbound_->HasPending()) {
        return true;
    }
    if (connection_ && connection_->ReadPending()) {
        return true;
    }
    if (state_ == kQuitting && connection_ && !connection_->HasPendingOutput()) {
        return true;
    }
    for (std::size_t i = 0; i < updates_.size(); ++i) {
        if (updates_[i].HasPending() || updates_[i].IsFinished()) {
            return true;
        }
    }
    return false;
}

void ClientSession::Resume(short revents) {
    if (listing_requested_) {
        listing_requested_ = false;
        LogTransfers();
    }
    if (state_ == kConnecting) {
        StepConnect();
        if (state_ != kRegistering) {
            return;
        }
    } else if (revents != 0 || (connection_ && connection_->ReadPending())) {
        ReadLines();
        if (state_ == kClosed) {
            return;
        }
    }

    DrainUpdates();
    DrainOutbound();
    FlushOrClose();
}

void ClientSession::StepConnect() {
    transport::ConnectionError error;
    transport::IoStatus status = connector_->Step(error);
    if (status == transport::IoStatus::kWouldBlock) {
        return;
    }
    if (status != transport::IoStatus::kOk) {
        logger_.Error("서버 연결 실패: " + error.Describe());
        Close(true);
        return;
    }

    std::string initial_data;
    std::unique_ptr<transport::Stream> stream = connector_->TakeStream(initial_data);
    connector_.reset();
    connection_.reset(new transport::Connection<transport::LineCodec>(
        std::move(stream), transport::LineCodec(), initial_data));
    logger_.Info("서버 연결 완료: " + server_name_);
    state_ = kRegistering;
    Register();
}

void ClientSession::Register() {
    connection_->Send(protocol::MakeCommand("NICK", nickname_));
    std::vector<std::string> params;
    params.push_back(server_settings_.username);
    params.push_back("0");
    params.push_back("*");
    params.push_back(server_settings_.realname);
    connection_->Send(protocol::MakeCommand("USER", params));
}

void ClientSession::ReadLines() {
    std::vector<transport::LineFrame> frames;
    std::string error;
    transport::IoStatus status = connection_->Receive(frames, error);

    for (std::size_t i = 0; i < frames.size() && state_ != kClosed; ++i) {
        if (!frames[i].ok) {
            logger_.Warn("메시지 파싱 실패: " + frames[i].error.Describe());
            continue;
        }
        HandleMessage(frames[i].message);
    }

    if (state_ == kClosed) {
        return;
    }
    if (status == transport::IoStatus::kClosed) {
        if (state_ == kQuitting) {
            logger_.Info("서버 연결 종료");
            Close(false);
        } else {
            logger_.Error("서버가 연결을 닫음");
            Close(true);
        }
    } else if (status == transport::IoStatus::kError) {
        logger_.Error("서버 연결 오류: " + error);
        Close(true);
    }
}

void ClientSession::HandleMessage(const protocol::Message &message) {
    const std::string &verb = message.command.verb;
    const std::vector<std::string> &params = message.command.params;

    if (verb == "PING") {
        connection_->Send(protocol::MakeCommand("PONG", params));
        return;
    }
    if (verb == kRplWelcome) {
        if (!params.empty()) {
            nickname_ = params[0];
        }
        if (state_ == kRegistering) {
            state_ = kRegistered;
            logger_.Info("등록 완료: " + nickname_);
            StartPendingSends();
        }
        return;
    }
    if (verb == kErrNicknameInUse && state_ == kRegistering) {
        nickname_ += "_";
        logger_.Warn("닉네임 사용 중, 재시도: " + nickname_);
        connection_->Send(protocol::MakeCommand("NICK", nickname_));
        return;
    }
    if (verb == "ERROR") {
        logger_.Error("서버 ERROR: " + (params.empty() ? std::string() : params.back()));
        return;
    }
    if (verb == "PRIVMSG" || verb == "NOTICE") {
        HandleOffer(message);
    }
}

void ClientSession::HandleOffer(const protocol::Message &message) {
    if (message.source.kind != protocol::Source::kUser) {
        return;
    }
    dcc::Send request;
    if (!dcc::Decode(message, request)) {
        return;
    }

    transfer::NewTransfer created;
    if (!manager_.Receive(request, message.source.user, created)) {
        return;
    }
    std::ostringstream oss;
    oss << "DCC 제안 #" << created.record.id << ": " << created.record.remote_user << " \""
        << created.record.filename << "\" (" << created.record.size << " bytes)";
    logger_.Info(oss.str());
    Track(created);
}

void ClientSession::StartPendingSends() {
    for (std::size_t i = 0; i < pending_sends_.size(); ++i) {
        transfer::NewTransfer created;
        if (!manager_.Send(pending_sends_[i].second, pending_sends_[i].first, created)) {
            continue;
        }
        std::ostringstream oss;
        oss << "파일 송신 시작 #" << created.record.id << ": " << created.record.remote_user
            << " \"" << created.record.filename << "\"";
        logger_.Info(oss.str());
        Track(created);
    }
    pending_sends_.clear();
}

void ClientSession::Track(transfer::NewTransfer &created) {
    updates_.push_back(std::move(created.updates));
}

void ClientSession::DrainUpdates() {
    std::size_t i = 0;
    while (i < updates_.size()) {
        bool terminal = false;
        transfer::Update update;
        while (!terminal && updates_[i].TryReceive(update)) {
            manager_.Update(update);
            terminal = update.IsTerminal();
        }
        if (terminal || updates_[i].IsFinished()) {
            updates_.erase(updates_.begin() + i);
            continue;
        }
        ++i;
    }
}

void ClientSession::DrainOutbound() {
    protocol::Message message;
    while (outbound_->TakeNext(message)) {
        if (connection_ && state_ != kQuitting) {
            connection_->Send(message);
        }
    }
}

void ClientSession::FlushOrClose() {
    if (!connection_) {
        return;
    }
    std::string error;
    if (state_ == kQuitting) {
        transport::IoStatus status = connection_->Shutdown(error);
        if (status == transport::IoStatus::kWouldBlock && connection_->HasPendingOutput()) {
            return;
        }
        Close(false);
        return;
    }
    transport::IoStatus status = connection_->Flush(error);
    if (status == transport::IoStatus::kError || status == transport::IoStatus::kClosed) {
        logger_.Error("서버 전송 실패: " + error);
        Close(true);
    }
}

void ClientSession::LogTransfers() {
    std::vector<transfer::FileTransfer> records = manager_.List();
    std::ostringstream header;
    header << "전송 목록 (" << records.size() << "건)";
    logger_.Info(header.str());
    for (std::size_t i = 0; i < records.size(); ++i) {
        const transfer::FileTransfer &record = records[i];
        std::ostringstream oss;
        oss << "  #" << record.id << " " << transfer::DirectionToString(record.direction) << " "
            << record.remote_user << " \"" << record.filename << "\" "
            << static_cast<int>(record.progress() * 100.0) << "% "
            << transfer::StatusToString(record.status);
        logger_.Info(oss.str());
    }
}

void ClientSession::Close(bool failed) {
    if (state_ == kClosed) {
        return;
    }
    state_ = kClosed;
    failed_ = failed;
    outbound_->Close();
    connector_.reset();
    connection_.reset();
    LogTransfers();
}
