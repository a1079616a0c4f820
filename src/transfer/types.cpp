/*
 * 설명: 전송 상태/Action/Update 생성 헬퍼와 레코드 정렬, 진행률 계산.
 * 버전: v0.4.0
 * 관련 문서: DESIGN.md (Transfer Manager)
 * 테스트: tests/unit/manager_test.cpp
 */
#include "transfer/types.hpp"

#include <iomanip>
#include <sstream>

namespace transfer {

Status Status::Active(std::uint64_t transferred, Duration elapsed) {
    Status status(kActive);
    status.transferred = transferred;
    status.elapsed = elapsed;
    return status;
}

Status Status::Completed(Duration elapsed, const std::string &checksum) {
    Status status(kCompleted);
    status.elapsed = elapsed;
    status.checksum = checksum;
    return status;
}

Status Status::Failed(const std::string &reason) {
    Status status(kFailed);
    status.reason = reason;
    return status;
}

double FileTransfer::progress() const {
    if (status.kind == Status::kCompleted) {
        return 1.0;
    }
    if (status.kind != Status::kActive || size == 0) {
        return 0.0;
    }
    double ratio = static_cast<double>(status.transferred) / static_cast<double>(size);
    return ratio > 1.0 ? 1.0 : ratio;
}

bool FileTransfer::operator<(const FileTransfer &other) const {
    if (created_at != other.created_at) {
        return created_at < other.created_at;
    }
    if (remote_user != other.remote_user) {
        return remote_user < other.remote_user;
    }
    if (filename != other.filename) {
        return filename < other.filename;
    }
    return id < other.id;
}

Action Action::Approve(const std::string &save_path) {
    Action action;
    action.kind = kApprove;
    action.save_path = save_path;
    return action;
}

Action Action::ReverseConfirmed(const std::string &host, int port) {
    Action action;
    action.kind = kReverseConfirmed;
    action.host = host;
    action.port = port;
    return action;
}

Action Action::PortAvailable(int port) {
    Action action;
    action.kind = kPortAvailable;
    action.port = port;
    return action;
}

Update Update::Metadata(Id id, std::uint64_t size) {
    Update update;
    update.id = id;
    update.kind = kMetadata;
    update.size = size;
    return update;
}

Update Update::Queued(Id id) {
    Update update;
    update.id = id;
    update.kind = kQueued;
    return update;
}

Update Update::Ready(Id id) {
    Update update;
    update.id = id;
    update.kind = kReady;
    return update;
}

Update Update::Progress(Id id, std::uint64_t transferred, Duration elapsed) {
    Update update;
    update.id = id;
    update.kind = kProgress;
    update.transferred = transferred;
    update.elapsed = elapsed;
    return update;
}

Update Update::Finished(Id id, Duration elapsed, const std::string &checksum) {
    Update update;
    update.id = id;
    update.kind = kFinished;
    update.elapsed = elapsed;
    update.checksum = checksum;
    return update;
}

Update Update::Failed(Id id, const std::string &reason) {
    Update update;
    update.id = id;
    update.kind = kFailed;
    update.reason = reason;
    return update;
}

std::string StatusToString(const Status &status) {
    std::ostringstream oss;
    switch (status.kind) {
        case Status::kPendingApproval:
            return "pending approval";
        case Status::kPendingReverseConfirmation:
            return "pending reverse confirmation";
        case Status::kQueued:
            return "queued";
        case Status::kReady:
            return "ready";
        case Status::kActive:
            oss << "active " << status.transferred << " bytes";
            return oss.str();
        case Status::kCompleted:
            oss << "completed in " << std::fixed << std::setprecision(2)
                << static_cast<double>(status.elapsed.count()) / 1000.0 << "s";
            if (!status.checksum.empty()) {
                oss << " sha256=" << status.checksum;
            }
            return oss.str();
        case Status::kFailed:
            return "failed: " + status.reason;
    }
    return "unknown";
}

std::string DirectionToString(Direction direction) {
    return direction == Direction::kSent ? "to" : "from";
}

}  // namespace transfer
