/*
 * 설명: 파일 전송 레코드, 상태, 작업 제어(Action)와 진행 보고(Update) 값, 서버 핸들 인터페이스.
 * 버전: v0.4.0
 * 관련 문서: DESIGN.md (Transfer Task Engine, Transfer Manager)
 * 테스트: tests/unit/manager_test.cpp, tests/unit/task_test.cpp
 */
#pragma once

#include <chrono>
#include <cstdint>
#include <string>

#include "protocol/message.hpp"

namespace transfer {

typedef std::uint16_t Id;
typedef std::chrono::milliseconds Duration;

enum class Direction { kSent, kReceived };

struct Status {
    enum Kind {
        kPendingApproval,
        kPendingReverseConfirmation,
        kQueued,
        kReady,
        kActive,
        kCompleted,
        kFailed
    };

    Kind kind;
    std::uint64_t transferred;
    Duration elapsed;
    std::string checksum;
    std::string reason;

    Status() : kind(kPendingApproval), transferred(0), elapsed(0) {}
    explicit Status(Kind k) : kind(k), transferred(0), elapsed(0) {}

    static Status Active(std::uint64_t transferred, Duration elapsed);
    static Status Completed(Duration elapsed, const std::string &checksum);
    static Status Failed(const std::string &reason);

    bool IsTerminal() const { return kind == kCompleted || kind == kFailed; }
};

struct FileTransfer {
    Id id;
    std::string server;
    std::chrono::system_clock::time_point created_at;
    Direction direction;
    std::string remote_user;
    bool secure;
    std::string filename;
    std::uint64_t size;
    Status status;

    FileTransfer() : id(0), direction(Direction::kReceived), secure(false), size(0) {}

    // 0.0 ~ 1.0. 완료되면 1, 크기를 모르면 0.
    double progress() const;

    // 생성 시각, 상대 닉, 파일명 순.
    bool operator<(const FileTransfer &other) const;
};

struct Action {
    enum Kind { kApprove, kReverseConfirmed, kPortAvailable };

    Kind kind;
    std::string save_path;
    std::string host;
    int port;

    Action() : kind(kApprove), port(0) {}

    static Action Approve(const std::string &save_path);
    static Action ReverseConfirmed(const std::string &host, int port);
    static Action PortAvailable(int port);
};

struct Update {
    enum Kind { kMetadata, kQueued, kReady, kProgress, kFinished, kFailed };

    Id id;
    Kind kind;
    std::uint64_t size;
    std::uint64_t transferred;
    Duration elapsed;
    std::string checksum;
    std::string reason;

    Update() : id(0), kind(kQueued), size(0), transferred(0), elapsed(0) {}

    static Update Metadata(Id id, std::uint64_t size);
    static Update Queued(Id id);
    static Update Ready(Id id);
    static Update Progress(Id id, std::uint64_t transferred, Duration elapsed);
    static Update Finished(Id id, Duration elapsed, const std::string &checksum);
    static Update Failed(Id id, const std::string &reason);

    bool IsTerminal() const { return kind == kFinished || kind == kFailed; }
};

// 주 IRC 연결로 메시지를 보내는 통로. 작업은 이것으로 DCC 제안을 알린다.
class ServerHandle {
   public:
    virtual ~ServerHandle() {}
    virtual bool Send(const protocol::Message &message) = 0;
};

std::string StatusToString(const Status &status);
std::string DirectionToString(Direction direction);

}  // namespace transfer
