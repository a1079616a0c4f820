/*
 * 설명: 수신/송신 전송 상태 기계. 승인 대기, 포트 대기, 역방향 확인 대기, 연결/수락, 전송, 종료 단계를 밟는다.
 * 버전: v0.5.0
 * 관련 문서: DESIGN.md (Transfer Task Engine)
 * 테스트: tests/unit/task_test.cpp
 */
#include "transfer/task.hpp"

#include <algorithm>
#include <sstream>
#include <utility>
#include <vector>

namespace {

std::string EncodeAck(std::uint64_t transferred) {
    std::uint32_t value = static_cast<std::uint32_t>(transferred & 0xFFFFFFFFULL);
    std::string ack(4, '\0');
    ack[0] = static_cast<char>((value >> 24) & 0xFF);
    ack[1] = static_cast<char>((value >> 16) & 0xFF);
    ack[2] = static_cast<char>((value >> 8) & 0xFF);
    ack[3] = static_cast<char>(value & 0xFF);
    return ack;
}

std::uint32_t DecodeAck(const std::string &buffer) {
    const unsigned char *b = reinterpret_cast<const unsigned char *>(buffer.data());
    return (static_cast<std::uint32_t>(b[0]) << 24) | (static_cast<std::uint32_t>(b[1]) << 16) |
           (static_cast<std::uint32_t>(b[2]) << 8) | static_cast<std::uint32_t>(b[3]);
}

std::string ToString(transfer::Id id) {
    std::ostringstream oss;
    oss << id;
    return oss.str();
}

}  // namespace

namespace transfer {

TaskSpec ReceiveSpec(Id id, const dcc::Send &request, const std::string &remote_user) {
    TaskSpec spec;
    spec.role = Role::kReceive;
    spec.id = id;
    spec.remote_user = remote_user;
    spec.filename = request.filename;
    spec.secure = request.secure;
    spec.reverse = request.kind == dcc::Send::kReverse;
    spec.size = request.size;
    spec.host = request.host;
    spec.port = request.port;
    spec.token = request.token;
    return spec;
}

TaskSpec SendSpec(Id id, const std::string &path, const std::string &filename,
                  const std::string &remote_user, bool reverse) {
    TaskSpec spec;
    spec.role = Role::kSend;
    spec.id = id;
    spec.remote_user = remote_user;
    spec.filename = filename;
    spec.reverse = reverse;
    spec.path = path;
    spec.token = ToString(id);
    return spec;
}

TransferTask::TransferTask(const TaskSpec &spec, const std::shared_ptr<ServerHandle> &server,
                           const TaskSettings &settings, utils::Receiver<Action> actions,
                           utils::Sender<Update> updates)
    : spec_(spec),
      server_(server),
      settings_(settings),
      actions_(std::move(actions)),
      updates_(std::move(updates)),
      state_(kStart),
      cancelled_(false),
      transferred_(0),
      reported_(0),
      acknowledged_(0),
      acknowledged_any_(false) {}

int TransferTask::PollFd() const {
    switch (state_) {
        case kConnecting:
            return connector_ ? connector_->Fd() : -1;
        case kAccepting:
            return listener_ ? listener_->Fd() : -1;
        case kTransferring:
        case kClosing:
            return connection_ ? connection_->Fd() : -1;
        default:
            break;
    }
    return -1;
}

short TransferTask::PollEvents() const {
    // Update 큐가 막혀 있으면 소켓 이벤트로 깨어나지 않는다.
    if (!backlog_.empty()) {
        return 0;
    }
    switch (state_) {
        case kConnecting:
            return connector_ ? connector_->PollEvents() : 0;
        case kAccepting:
            return POLLIN;
        case kTransferring:
            return connection_ ? connection_->PollEvents() : 0;
        case kClosing:
            if (!connection_) {
                return 0;
            }
            return connection_->HasPendingOutput() ? POLLOUT : POLLIN;
        default:
            break;
    }
    return 0;
}

bool TransferTask::Runnable() const {
    if (cancelled_) {
        return false;
    }
    if (state_ == kStart) {
        return true;
    }
    if (!backlog_.empty()) {
        return updates_.HasRoom();
    }
    if (WaitingForAction() && actions_.HasPending()) {
        return true;
    }
    return state_ == kTransferring && connection_ && connection_->ReadPending();
}

bool TransferTask::WaitingForAction() const {
    return state_ == kWaitApproval || state_ == kWaitPort || state_ == kWaitConfirmation;
}

bool TransferTask::WaitingForRemote() const {
    return state_ == kWaitConfirmation || state_ == kAccepting;
}

bool TransferTask::HasDeadline() const { return !cancelled_ && backlog_.empty() && WaitingForRemote(); }

net::Clock::time_point TransferTask::Deadline() const { return wait_started_ + settings_.timeout; }

bool TransferTask::Done() const { return cancelled_ || (state_ == kFinished && backlog_.empty()); }

void TransferTask::Cancel() {
    cancelled_ = true;
    backlog_.clear();
    Release();
    state_ = kFinished;
}

void TransferTask::Resume(short) {
    if (cancelled_) {
        return;
    }
    if (!DrainBacklog() || state_ == kFinished) {
        return;
    }
    if (state_ == kStart) {
        Start();
    }
    if (HasDeadline() && net::Clock::now() >= Deadline()) {
        Fail("상대 응답 대기 시간 초과");
        return;
    }
    Step();
}

void TransferTask::Step() {
    // 상태가 바뀌면 새 상태에서 바로 할 수 있는 일을 이어서 한다.
    State before = kFinished;
    while (state_ != before && state_ != kFinished && backlog_.empty()) {
        before = state_;
        switch (state_) {
            case kWaitApproval:
            case kWaitPort:
            case kWaitConfirmation: {
                Action action;
                if (actions_.TryReceive(action)) {
                    HandleAction(action);
                }
                break;
            }
            case kConnecting:
                StepConnect();
                break;
            case kAccepting:
                StepAccept();
                break;
            case kTransferring:
                if (spec_.role == Role::kReceive) {
                    StepReceive();
                } else {
                    StepSend();
                }
                break;
            case kClosing:
                StepClose();
                break;
            case kStart:
            case kFinished:
                break;
        }
    }
}

void TransferTask::Start() {
    if (spec_.role == Role::kReceive) {
        state_ = kWaitApproval;
        return;
    }

    input_.open(spec_.path.c_str(), std::ios::in | std::ios::binary);
    if (!input_.is_open()) {
        Fail("파일을 열 수 없음: " + spec_.path);
        return;
    }
    input_.seekg(0, std::ios::end);
    std::streamoff end = input_.tellg();
    input_.seekg(0, std::ios::beg);
    if (end < 0 || !input_) {
        Fail("파일 크기를 알 수 없음: " + spec_.path);
        return;
    }
    spec_.size = static_cast<std::uint64_t>(end);
    Emit(Update::Metadata(spec_.id, spec_.size));

    if (spec_.reverse) {
        dcc::Send offer = dcc::MakeReverseOffer(spec_.filename, spec_.token, spec_.size, false);
        if (!server_->Send(dcc::Encode(offer, spec_.remote_user))) {
            Fail("서버로 DCC 제안을 보내지 못함");
            return;
        }
        wait_started_ = net::Clock::now();
        state_ = kWaitConfirmation;
    } else {
        Emit(Update::Queued(spec_.id));
        state_ = kWaitPort;
    }
}

void TransferTask::HandleAction(const Action &action) {
    if (state_ == kWaitApproval && action.kind == Action::kApprove) {
        Approve(action.save_path);
    } else if (state_ == kWaitPort && action.kind == Action::kPortAvailable) {
        Listen(action.port);
    } else if (state_ == kWaitConfirmation && action.kind == Action::kReverseConfirmed) {
        Connect(action.host, action.port, transport::Security::Unsecured());
    }
}

transport::Security TransferTask::TransferSecurity() const {
    // SSEND 상대 인증서는 보통 자체 서명이므로 검증하지 않는다.
    return spec_.secure ? transport::Security::Secured(true) : transport::Security::Unsecured();
}

void TransferTask::Approve(const std::string &save_path) {
    output_.open(save_path.c_str(), std::ios::out | std::ios::binary | std::ios::trunc);
    if (!output_.is_open()) {
        Fail("파일을 만들 수 없음: " + save_path);
        return;
    }

    if (!spec_.reverse) {
        Connect(spec_.host, spec_.port, TransferSecurity());
        return;
    }
    Emit(Update::Queued(spec_.id));
    state_ = kWaitPort;
}

void TransferTask::Connect(const std::string &host, int port, const transport::Security &security) {
    connector_.reset(new transport::Connector(host, port, security, settings_.proxy));
    state_ = kConnecting;
}

void TransferTask::Listen(int port) {
    transport::Security security =
        spec_.role == Role::kReceive ? TransferSecurity() : transport::Security::Unsecured();
    transport::ConnectionError error;
    listener_.reset(new transport::Listener());
    if (!listener_->Bind(settings_.bind_address, port, security, error)) {
        Fail(error.Describe());
        return;
    }

    const int bound_port = listener_->LocalPort();
    dcc::Send announce;
    if (spec_.role == Role::kReceive) {
        announce = dcc::MakeReverseConfirmation(spec_.filename, settings_.public_address,
                                                bound_port, spec_.size, spec_.token, spec_.secure);
    } else {
        announce = dcc::MakeDirect(spec_.filename, settings_.public_address, bound_port,
                                   spec_.size, false);
    }
    if (!server_->Send(dcc::Encode(announce, spec_.remote_user))) {
        Fail("서버로 DCC 제안을 보내지 못함");
        return;
    }

    Emit(Update::Ready(spec_.id));
    wait_started_ = net::Clock::now();
    state_ = kAccepting;
}

void TransferTask::StepConnect() {
    transport::ConnectionError error;
    transport::IoStatus status = connector_->Step(error);
    if (status == transport::IoStatus::kWouldBlock) {
        return;
    }
    if (status != transport::IoStatus::kOk) {
        Fail(error.Describe());
        return;
    }
    std::string initial;
    std::unique_ptr<transport::Stream> stream = connector_->TakeStream(initial);
    connector_.reset();
    StartTransfer(std::move(stream), initial);
}

void TransferTask::StepAccept() {
    transport::ConnectionError error;
    std::unique_ptr<transport::Stream> stream;
    transport::IoStatus status = listener_->Accept(stream, error);
    if (status == transport::IoStatus::kWouldBlock) {
        return;
    }
    if (status != transport::IoStatus::kOk) {
        Fail(error.Describe());
        return;
    }
    listener_.reset();
    StartTransfer(std::move(stream), std::string());
}

void TransferTask::StartTransfer(std::unique_ptr<transport::Stream> stream,
                                 const std::string &initial_data) {
    connection_.reset(new transport::Connection<transport::BytesCodec>(
        std::move(stream), transport::BytesCodec(), initial_data));
    started_at_ = net::Clock::now();
    last_progress_ = started_at_;
    state_ = kTransferring;
}

void TransferTask::StepReceive() {
    std::vector<std::string> chunks;
    std::string error;
    transport::IoStatus status = connection_->Receive(chunks, error);

    for (std::size_t i = 0; i < chunks.size() && transferred_ < spec_.size; ++i) {
        std::uint64_t remaining = spec_.size - transferred_;
        std::size_t take = static_cast<std::size_t>(
            std::min<std::uint64_t>(remaining, static_cast<std::uint64_t>(chunks[i].size())));
        output_.write(chunks[i].data(), static_cast<std::streamsize>(take));
        if (!output_) {
            Fail("파일 쓰기 실패");
            return;
        }
        sha256_.Update(chunks[i].data(), take);
        transferred_ += take;
        connection_->Send(EncodeAck(transferred_));
    }

    if (status == transport::IoStatus::kError) {
        Fail("io error: " + error);
        return;
    }
    if (connection_->Flush(error) == transport::IoStatus::kError) {
        Fail("io error: " + error);
        return;
    }

    ReportProgress();

    if (transferred_ >= spec_.size) {
        BeginClosing();
    } else if (status == transport::IoStatus::kClosed) {
        Fail("상대가 전송 완료 전에 연결을 닫음");
    }
}

void TransferTask::StepSend() {
    std::vector<std::string> chunks;
    std::string error;
    transport::IoStatus status = connection_->Receive(chunks, error);
    if (status == transport::IoStatus::kError) {
        Fail("io error: " + error);
        return;
    }
    for (std::size_t i = 0; i < chunks.size(); ++i) {
        ack_buffer_ += chunks[i];
    }
    while (ack_buffer_.size() >= 4) {
        acknowledged_ = DecodeAck(ack_buffer_);
        acknowledged_any_ = true;
        ack_buffer_.erase(0, 4);
    }

    char buf[kSendChunkSize];
    while (!connection_->HasPendingOutput() && transferred_ < spec_.size) {
        std::uint64_t remaining = spec_.size - transferred_;
        std::size_t want = static_cast<std::size_t>(
            std::min<std::uint64_t>(remaining, static_cast<std::uint64_t>(sizeof(buf))));
        input_.read(buf, static_cast<std::streamsize>(want));
        std::size_t got = static_cast<std::size_t>(input_.gcount());
        if (got == 0) {
            Fail("파일 읽기 실패: " + spec_.path);
            return;
        }
        sha256_.Update(buf, got);
        connection_->Send(std::string(buf, got));
        transferred_ += got;
        if (connection_->Flush(error) == transport::IoStatus::kError) {
            Fail("io error: " + error);
            return;
        }
    }
    if (connection_->Flush(error) == transport::IoStatus::kError) {
        Fail("io error: " + error);
        return;
    }

    ReportProgress();

    const std::uint32_t expected = static_cast<std::uint32_t>(spec_.size & 0xFFFFFFFFULL);
    const bool all_sent = transferred_ >= spec_.size && !connection_->HasPendingOutput();
    const bool all_acknowledged = spec_.size == 0 || (acknowledged_any_ && acknowledged_ == expected);
    if (all_sent && all_acknowledged) {
        BeginClosing();
    } else if (status == transport::IoStatus::kClosed) {
        // 마지막 확인 응답까지 받아야 상대가 파일을 모두 받은 것이다.
        Fail("상대가 전송 완료 전에 연결을 닫음");
    }
}

void TransferTask::BeginClosing() {
    if (output_.is_open()) {
        output_.close();
        if (output_.fail()) {
            Fail("파일 닫기 실패");
            return;
        }
    }
    state_ = kClosing;
}

void TransferTask::StepClose() {
    std::string error;
    transport::IoStatus status = connection_->Shutdown(error);
    if (status == transport::IoStatus::kWouldBlock) {
        return;
    }
    // 데이터는 이미 모두 처리했으므로 반쪽 닫기 실패는 결과에 영향이 없다.
    Complete();
}

void TransferTask::ReportProgress() {
    net::Clock::time_point now = net::Clock::now();
    if (transferred_ == reported_ || now - last_progress_ < kProgressInterval) {
        return;
    }
    last_progress_ = now;
    reported_ = transferred_;
    Emit(Update::Progress(spec_.id, transferred_, Elapsed()));
}

Duration TransferTask::Elapsed() const {
    return std::chrono::duration_cast<Duration>(net::Clock::now() - started_at_);
}

void TransferTask::Complete() {
    Emit(Update::Finished(spec_.id, Elapsed(), sha256_.HexDigest()));
    Release();
    state_ = kFinished;
}

void TransferTask::Fail(const std::string &reason) {
    Emit(Update::Failed(spec_.id, reason));
    Release();
    state_ = kFinished;
}

void TransferTask::Release() {
    connector_.reset();
    listener_.reset();
    connection_.reset();
    if (output_.is_open()) {
        output_.close();
    }
    if (input_.is_open()) {
        input_.close();
    }
}

void TransferTask::Emit(const Update &update) {
    backlog_.push_back(update);
    DrainBacklog();
}

bool TransferTask::DrainBacklog() {
    while (!backlog_.empty()) {
        if (updates_.TrySend(backlog_.front()) == utils::SendStatus::kFull) {
            return false;
        }
        // kClosed 면 받을 쪽이 없으므로 버린다.
        backlog_.pop_front();
    }
    return true;
}

TaskHandle::TaskHandle() : reactor_(NULL) {}

TaskHandle::TaskHandle(std::unique_ptr<TransferTask> task, net::Reactor *reactor,
                       utils::Sender<Action> actions)
    : task_(std::move(task)), reactor_(reactor), actions_(std::move(actions)) {}

TaskHandle::TaskHandle(TaskHandle &&other)
    : task_(std::move(other.task_)), reactor_(other.reactor_), actions_(std::move(other.actions_)) {
    other.reactor_ = NULL;
}

TaskHandle &TaskHandle::operator=(TaskHandle &&other) {
    if (this != &other) {
        Abort();
        task_ = std::move(other.task_);
        reactor_ = other.reactor_;
        actions_ = std::move(other.actions_);
        other.reactor_ = NULL;
    }
    return *this;
}

TaskHandle::~TaskHandle() { Abort(); }

bool TaskHandle::Deliver(const Action &action) {
    if (!task_) {
        return false;
    }
    return actions_.TrySend(action) == utils::SendStatus::kSent;
}

bool TaskHandle::Approve(const std::string &save_path) { return Deliver(Action::Approve(save_path)); }

bool TaskHandle::ConfirmReverse(const std::string &host, int port) {
    return Deliver(Action::ReverseConfirmed(host, port));
}

bool TaskHandle::PortAvailable(int port) { return Deliver(Action::PortAvailable(port)); }

void TaskHandle::Abort() {
    if (!task_) {
        return;
    }
    task_->Cancel();
    if (reactor_ != NULL) {
        reactor_->Remove(task_.get());
    }
    task_.reset();
    actions_.Close();
}

bool TaskHandle::IsRunning() const { return task_ && !task_->Done(); }

TaskHandle Spawn(net::Reactor &reactor, const TaskSpec &spec,
                 const std::shared_ptr<ServerHandle> &server, const TaskSettings &settings,
                 utils::Receiver<Update> &updates) {
    utils::Sender<Action> action_tx;
    utils::Receiver<Action> action_rx;
    utils::MakeChannel(kActionCapacity, action_tx, action_rx);

    utils::Sender<Update> update_tx;
    utils::MakeChannel(kUpdateCapacity, update_tx, updates);

    std::unique_ptr<TransferTask> task(
        new TransferTask(spec, server, settings, std::move(action_rx), std::move(update_tx)));
    reactor.Add(task.get());
    return TaskHandle(std::move(task), &reactor, std::move(action_tx));
}

}  // namespace transfer
