/*
 * 설명: 전송 레코드 맵의 단일 작성자. 작업 생성, 역방향 확인 상관, 포트 배정/회수, Update 반영과 로그를 처리한다.
 * 버전: v0.5.0
 * 관련 문서: DESIGN.md (Transfer Manager)
 * 테스트: tests/unit/manager_test.cpp
 */
#include "transfer/manager.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace {

const std::size_t kIdSpace = 65536;

bool ParseId(const std::string &token, transfer::Id &out) {
    if (token.empty() || token.size() > 5) {
        return false;
    }
    for (std::size_t i = 0; i < token.size(); ++i) {
        if (!std::isdigit(static_cast<unsigned char>(token[i]))) {
            return false;
        }
    }
    unsigned long value = std::strtoul(token.c_str(), NULL, 10);
    if (value > 65535) {
        return false;
    }
    out = static_cast<transfer::Id>(value);
    return true;
}

std::string BaseName(const std::string &path) {
    std::size_t slash = path.find_last_of('/');
    return slash == std::string::npos ? path : path.substr(slash + 1);
}

// 상대가 보낸 파일명이 저장 디렉터리 밖을 가리키지 못하게 한다.
std::string SafeFilename(const std::string &filename) {
    std::string out = filename;
    for (std::size_t i = 0; i < out.size(); ++i) {
        if (out[i] == '/' || out[i] == '\\') {
            out[i] = '_';
        }
    }
    if (out.empty() || out == "." || out == "..") {
        out = "download";
    }
    return out;
}

std::string JoinPath(const std::string &directory, const std::string &name) {
    if (directory.empty() || directory[directory.size() - 1] == '/') {
        return directory + name;
    }
    return directory + "/" + name;
}

std::string Describe(const transfer::FileTransfer &record) {
    std::ostringstream oss;
    oss << transfer::DirectionToString(record.direction) << " " << record.remote_user << " for \""
        << record.filename << "\"";
    return oss.str();
}

}  // namespace

namespace transfer {

Manager::Manager(net::Reactor &reactor, const std::shared_ptr<ServerHandle> &server,
                 const std::string &server_name, const config::FileTransferSettings &settings,
                 const transport::Proxy &proxy, Logger &logger)
    : reactor_(reactor),
      server_(server),
      server_name_(server_name),
      settings_(settings),
      proxy_(proxy),
      logger_(logger),
      rng_(std::random_device()()) {}

Id Manager::NextId() {
    if (items_.size() >= kIdSpace) {
        throw std::runtime_error("전송 식별자 공간 소진");
    }
    std::uniform_int_distribution<unsigned int> dist(0, 65535);
    while (true) {
        Id id = static_cast<Id>(dist(rng_));
        if (items_.find(id) == items_.end()) {
            return id;
        }
    }
}

TaskSettings Manager::MakeTaskSettings() const {
    TaskSettings task_settings;
    task_settings.timeout = std::chrono::seconds(settings_.timeout_seconds);
    task_settings.public_address = settings_.public_address;
    task_settings.bind_address = settings_.bind_address;
    task_settings.proxy = proxy_;
    return task_settings;
}

FileTransfer Manager::MakeRecord(Id id, Direction direction, const std::string &remote_user,
                                 const std::string &filename) const {
    FileTransfer record;
    record.id = id;
    record.server = server_name_;
    record.created_at = std::chrono::system_clock::now();
    record.direction = direction;
    record.remote_user = remote_user;
    record.filename = filename;
    return record;
}

bool Manager::ShouldAutoAccept(const protocol::User &from) const {
    if (!settings_.auto_accept) {
        return false;
    }
    const std::vector<std::string> &nicks = settings_.auto_accept_nicks;
    if (!nicks.empty() && std::find(nicks.begin(), nicks.end(), from.nickname) == nicks.end()) {
        return false;
    }
    const std::vector<std::string> &masks = settings_.auto_accept_masks;
    if (masks.empty()) {
        return true;
    }
    for (std::size_t i = 0; i < masks.size(); ++i) {
        if (protocol::MatchesMask(from, masks[i])) {
            return true;
        }
    }
    return false;
}

bool Manager::Receive(const dcc::Send &request, const std::string &remote_user, NewTransfer &out) {
    protocol::User from;
    from.nickname = remote_user;
    return Receive(request, from, out);
}

bool Manager::Receive(const dcc::Send &request, const protocol::User &from, NewTransfer &out) {
    const std::string &remote_user = from.nickname;
    Id token_id = 0;
    if (request.kind == dcc::Send::kReverse && request.HasHost() && request.HasPort() &&
        ParseId(request.token, token_id)) {
        std::map<Id, Item>::iterator it = items_.find(token_id);
        if (it != items_.end() && it->second.working &&
            it->second.record.direction == Direction::kSent &&
            it->second.record.filename == request.filename) {
            logger_.Debug("역방향 확인 수신: " + remote_user + " for \"" + request.filename + "\"");
            if (!it->second.task.ConfirmReverse(request.host, request.port)) {
                logger_.Warn("역방향 확인을 작업에 전달하지 못함: " + request.filename);
            }
            return false;
        }
    }

    logger_.Debug("파일 전송 요청 수신: " + remote_user + " for \"" + request.filename + "\"");

    Id id = NextId();
    FileTransfer record = MakeRecord(id, Direction::kReceived, remote_user, request.filename);
    record.secure = request.secure;
    record.size = request.size;
    record.status = Status(Status::kPendingApproval);

    Item item;
    item.record = record;
    item.task = Spawn(reactor_, ReceiveSpec(id, request, remote_user), server_, MakeTaskSettings(),
                      out.updates);

    if (ShouldAutoAccept(from)) {
        if (settings_.save_directory.empty()) {
            logger_.Warn("auto_accept 가 켜져 있지만 save_directory 가 없어 수동 승인이 필요함");
        } else {
            std::string save_path = JoinPath(settings_.save_directory, SafeFilename(record.filename));
            logger_.Debug("파일 전송 자동 수락: " + remote_user + " for \"" + record.filename + "\"");
            item.task.Approve(save_path);
        }
    }

    items_.insert(std::make_pair(id, std::move(item)));
    out.record = record;
    return true;
}

bool Manager::Send(const std::string &path, const std::string &remote_user, NewTransfer &out) {
    std::string filename = BaseName(path);
    std::replace(filename.begin(), filename.end(), ' ', '_');
    if (filename.empty()) {
        logger_.Error("보낼 파일 이름이 없음: " + path);
        return false;
    }

    const bool reverse = settings_.passive;
    logger_.Debug("파일 전송 송신 요청: " + remote_user + " for \"" + filename + "\"");

    Id id = NextId();
    FileTransfer record = MakeRecord(id, Direction::kSent, remote_user, filename);
    // 크기는 작업의 Metadata 로 채워진다.
    record.status = Status(reverse ? Status::kPendingReverseConfirmation : Status::kQueued);

    Item item;
    item.record = record;
    item.task = Spawn(reactor_, SendSpec(id, path, filename, remote_user, reverse), server_,
                      MakeTaskSettings(), out.updates);

    items_.insert(std::make_pair(id, std::move(item)));
    out.record = record;
    return true;
}

bool Manager::AllocatePort(int &port) const {
    if (!settings_.has_server) {
        return false;
    }
    for (int candidate = settings_.bind_port_first; candidate <= settings_.bind_port_last;
         ++candidate) {
        bool used = false;
        for (std::map<Id, int>::const_iterator it = used_ports_.begin(); it != used_ports_.end();
             ++it) {
            if (it->second == candidate) {
                used = true;
                break;
            }
        }
        if (!used) {
            port = candidate;
            return true;
        }
    }
    return false;
}

void Manager::AssignPort(Id id) {
    std::map<Id, Item>::iterator it = items_.find(id);
    if (it == items_.end() || !it->second.working) {
        return;
    }
    Item &item = it->second;

    if (!settings_.has_server) {
        item.task.Abort();
        item.working = false;
        item.record.status = Status::Failed("리슨 서버(file_transfer.public_address, bind_port_*) 설정 없음");
        logger_.Error("파일 전송 실패 " + Describe(item.record) + ": " + item.record.status.reason);
        return;
    }

    item.record.status = Status(Status::kQueued);
    int port = 0;
    if (AllocatePort(port) && item.task.PortAvailable(port)) {
        used_ports_[id] = port;
        return;
    }
    queued_.push_back(id);
}

void Manager::RecyclePort(Id id) {
    std::map<Id, int>::iterator used = used_ports_.find(id);
    if (used == used_ports_.end()) {
        return;
    }
    int port = used->second;
    used_ports_.erase(used);

    while (!queued_.empty()) {
        Id next = queued_.front();
        queued_.pop_front();
        std::map<Id, Item>::iterator it = items_.find(next);
        if (it != items_.end() && it->second.working && it->second.task.PortAvailable(port)) {
            used_ports_[next] = port;
            return;
        }
    }
}

void Manager::Update(const transfer::Update &update) {
    std::map<Id, Item>::iterator it = items_.find(update.id);
    if (it == items_.end()) {
        return;
    }
    Item &item = it->second;
    FileTransfer &record = item.record;

    switch (update.kind) {
        case transfer::Update::kMetadata:
            record.size = update.size;
            break;
        case transfer::Update::kQueued:
            AssignPort(update.id);
            break;
        case transfer::Update::kReady:
            if (item.working) {
                record.status = Status(Status::kReady);
            }
            break;
        case transfer::Update::kProgress:
            if (item.working && !record.status.IsTerminal()) {
                record.status = Status::Active(update.transferred, update.elapsed);
            }
            break;
        case transfer::Update::kFinished: {
            if (!item.working) {
                break;
            }
            std::ostringstream oss;
            oss << "파일 전송 완료 " << Describe(record) << " in " << std::fixed
                << std::setprecision(2) << static_cast<double>(update.elapsed.count()) / 1000.0
                << "s";
            logger_.Debug(oss.str());
            record.status = Status::Completed(update.elapsed, update.checksum);
            item.working = false;
            item.task = TaskHandle();
            RecyclePort(update.id);
            break;
        }
        case transfer::Update::kFailed:
            if (!item.working) {
                break;
            }
            logger_.Error("파일 전송 실패 " + Describe(record) + ": " + update.reason);
            record.status = Status::Failed(update.reason);
            item.working = false;
            item.task = TaskHandle();
            queued_.erase(std::remove(queued_.begin(), queued_.end(), update.id), queued_.end());
            RecyclePort(update.id);
            break;
    }
}

bool Manager::Approve(Id id, const std::string &save_path) {
    std::map<Id, Item>::iterator it = items_.find(id);
    if (it == items_.end() || !it->second.working) {
        return false;
    }
    logger_.Debug("파일 전송 승인: " + Describe(it->second.record) + " -> " + save_path);
    return it->second.task.Approve(save_path);
}

bool Manager::Remove(Id id) {
    std::map<Id, Item>::iterator it = items_.find(id);
    if (it == items_.end()) {
        return false;
    }
    // TaskHandle 소멸자가 작업을 중단한다.
    items_.erase(it);
    queued_.erase(std::remove(queued_.begin(), queued_.end(), id), queued_.end());
    RecyclePort(id);
    return true;
}

const FileTransfer *Manager::Get(Id id) const {
    std::map<Id, Item>::const_iterator it = items_.find(id);
    if (it == items_.end()) {
        return NULL;
    }
    return &it->second.record;
}

std::vector<FileTransfer> Manager::List() const {
    std::vector<FileTransfer> records;
    records.reserve(items_.size());
    for (std::map<Id, Item>::const_iterator it = items_.begin(); it != items_.end(); ++it) {
        records.push_back(it->second.record);
    }
    std::sort(records.begin(), records.end());
    return records;
}

}  // namespace transfer
