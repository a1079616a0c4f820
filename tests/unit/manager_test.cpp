/*
 * 설명: 전송 관리자의 레코드 생성, 역방향 확인 상관, 자동 수락, 포트 배정/회수, Update 반영과 로그를 확인한다.
 * 버전: v0.5.0
 * 관련 문서: DESIGN.md (Transfer Manager, Logging)
 * 테스트: 이 파일 자체
 */
#include "transfer/manager.hpp"

#include <cassert>
#include <csignal>
#include <cstdio>
#include <fstream>
#include <iterator>
#include <memory>
#include <set>
#include <sstream>
#include <string>
#include <vector>

#include "dcc/send.hpp"
#include "net/reactor.hpp"
#include "transport/listener.hpp"
#include "utils/logger.hpp"

namespace {
const char kLogPath[] = "ircdcc_manager_test.log";
const char kSourcePath[] = "ircdcc manager source.bin";

class RecordingServer : public transfer::ServerHandle {
   public:
    bool Send(const protocol::Message &message) {
        sent.push_back(message);
        return true;
    }

    std::vector<protocol::Message> sent;
};

std::string ReadFile(const char *path) {
    std::ifstream file(path, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
}

bool FileExists(const char *path) {
    std::ifstream file(path);
    return file.is_open();
}

void WriteSource(std::size_t size) {
    std::ofstream file(kSourcePath, std::ios::binary);
    file << std::string(size, 'z');
}

// 잠깐 바인드했다가 닫은 포트. 연결은 거부되고 다시 바인드할 수 있다.
int FreePort() {
    transport::Listener probe;
    transport::ConnectionError error;
    bool ok = probe.Bind("127.0.0.1", 0, transport::Security::Unsecured(), error);
    assert(ok);
    return probe.LocalPort();
}

struct Harness {
    net::Reactor reactor;
    std::shared_ptr<RecordingServer> server;
    Logger logger;
    transfer::Manager manager;
    std::vector<utils::Receiver<transfer::Update> > updates;

    explicit Harness(const config::FileTransferSettings &settings)
        : server(std::make_shared<RecordingServer>()),
          manager(reactor, server, "irc.example.org", settings, transport::Proxy(), logger) {
        std::remove(kLogPath);
        logger.SetLevel(config::LogLevel::kDebug);
        logger.SetOutput(kLogPath);
    }

    void Track(transfer::NewTransfer &created) { updates.push_back(std::move(created.updates)); }

    void Pump(int rounds) {
        for (int round = 0; round < rounds; ++round) {
            reactor.RunOnce(10);
            for (std::size_t i = 0; i < updates.size(); ++i) {
                transfer::Update update;
                while (updates[i].TryReceive(update)) {
                    manager.Update(update);
                }
            }
        }
    }

    transfer::Status::Kind StatusOf(transfer::Id id) const {
        const transfer::FileTransfer *record = manager.Get(id);
        assert(record != NULL);
        return record->status.kind;
    }
};

config::FileTransferSettings ListenSettings(int port) {
    config::FileTransferSettings settings;
    settings.passive = false;
    settings.has_server = true;
    settings.public_address = "127.0.0.1";
    settings.bind_address = "127.0.0.1";
    settings.bind_port_first = port;
    settings.bind_port_last = port;
    return settings;
}
}  // namespace

void TestReceiveCreatesPendingRecord() {
    Harness h((config::FileTransferSettings()));
    transfer::NewTransfer created;
    assert(h.manager.Receive(dcc::MakeDirect("a.txt", "127.0.0.1", 4000, 100, true), "alice",
                             created));
    h.Track(created);

    const transfer::FileTransfer &record = created.record;
    assert(record.direction == transfer::Direction::kReceived);
    assert(record.server == "irc.example.org");
    assert(record.remote_user == "alice");
    assert(record.filename == "a.txt");
    assert(record.secure);
    assert(record.size == 100);
    assert(record.status.kind == transfer::Status::kPendingApproval);
    assert(h.manager.List().size() == 1);
    assert(!h.manager.IsEmpty());

    h.Pump(3);
    assert(h.StatusOf(record.id) == transfer::Status::kPendingApproval);
    assert(h.reactor.Size() == 1);

    assert(!h.manager.Approve(static_cast<transfer::Id>(record.id + 1), "x"));
    assert(h.manager.Remove(record.id));
    assert(h.manager.Get(record.id) == NULL);
    assert(h.manager.IsEmpty());
    assert(h.reactor.Size() == 0);
    assert(!h.manager.Remove(record.id));
}

void TestIdsStayUniqueWhileTracked() {
    WriteSource(4);
    Harness h((config::FileTransferSettings()));
    std::set<transfer::Id> tracked;

    for (int i = 0; i < 2000; ++i) {
        transfer::NewTransfer created;
        if (i % 10 == 0) {
            assert(h.manager.Send(kSourcePath, "bob", created));
        } else {
            assert(h.manager.Receive(dcc::MakeDirect("f.bin", "127.0.0.1", 4000, 4, false),
                                     "alice", created));
        }
        assert(tracked.insert(created.record.id).second);
    }
    assert(h.manager.List().size() == tracked.size());

    // 절반을 지운 뒤 새로 받은 식별자도 남아 있는 것과 겹치지 않는다.
    std::set<transfer::Id> remaining;
    bool drop = true;
    for (std::set<transfer::Id>::const_iterator it = tracked.begin(); it != tracked.end(); ++it) {
        if (drop) {
            assert(h.manager.Remove(*it));
        } else {
            remaining.insert(*it);
        }
        drop = !drop;
    }
    for (int i = 0; i < 500; ++i) {
        transfer::NewTransfer created;
        assert(h.manager.Receive(dcc::MakeDirect("g.bin", "127.0.0.1", 4000, 4, false), "carol",
                                 created));
        assert(remaining.insert(created.record.id).second);
    }
    assert(h.manager.List().size() == remaining.size());
    std::remove(kSourcePath);
}

void TestReverseConfirmationIsCorrelated() {
    WriteSource(64);
    Harness h((config::FileTransferSettings()));

    transfer::NewTransfer sending;
    assert(h.manager.Send(kSourcePath, "bob", sending));
    h.Track(sending);
    assert(sending.record.direction == transfer::Direction::kSent);
    assert(sending.record.filename == "ircdcc_manager_source.bin");
    assert(sending.record.status.kind == transfer::Status::kPendingReverseConfirmation);

    h.Pump(3);
    assert(h.manager.Get(sending.record.id)->size == 64);
    assert(h.server->sent.size() == 1);
    dcc::Send offer;
    assert(dcc::Decode(h.server->sent[0], offer));
    assert(offer.kind == dcc::Send::kReverse);
    std::ostringstream token;
    token << sending.record.id;
    assert(offer.token == token.str());

    const int port = FreePort();

    // 파일명이 다르면 새 수신 제안으로 본다.
    transfer::NewTransfer other;
    assert(h.manager.Receive(
        dcc::MakeReverseConfirmation("other.bin", "127.0.0.1", port, 64, offer.token, false),
        "bob", other));
    h.Track(other);
    assert(h.manager.List().size() == 2);

    transfer::NewTransfer ignored;
    assert(!h.manager.Receive(
        dcc::MakeReverseConfirmation(offer.filename, "127.0.0.1", port, 64, offer.token, false),
        "bob", ignored));
    assert(h.manager.List().size() == 2);

    // 확인을 받은 송신 작업은 닫힌 포트로 연결을 시도하다 실패한다.
    for (int i = 0; i < 100 && h.StatusOf(sending.record.id) != transfer::Status::kFailed; ++i) {
        h.Pump(1);
    }
    assert(h.StatusOf(sending.record.id) == transfer::Status::kFailed);
    assert(ReadFile(kLogPath).find("파일 전송 실패") != std::string::npos);
    std::remove(kSourcePath);
}

void TestQueuedWithoutListenServerFails() {
    WriteSource(8);
    config::FileTransferSettings settings;
    settings.passive = false;
    Harness h(settings);

    transfer::NewTransfer sending;
    assert(h.manager.Send(kSourcePath, "bob", sending));
    h.Track(sending);
    assert(sending.record.status.kind == transfer::Status::kQueued);

    h.Pump(3);
    const transfer::FileTransfer *record = h.manager.Get(sending.record.id);
    assert(record->status.kind == transfer::Status::kFailed);
    assert(record->status.reason.find("리슨 서버") != std::string::npos);
    assert(h.reactor.Size() == 0);
    assert(h.server->sent.empty());
    assert(!h.manager.Approve(sending.record.id, "x"));
    std::remove(kSourcePath);
}

void TestPortIsRecycled() {
    WriteSource(8);
    const int port = FreePort();
    Harness h(ListenSettings(port));

    transfer::NewTransfer first;
    assert(h.manager.Send(kSourcePath, "alice", first));
    h.Track(first);
    transfer::NewTransfer second;
    assert(h.manager.Send(kSourcePath, "bob", second));
    h.Track(second);

    h.Pump(5);
    transfer::Status::Kind a = h.StatusOf(first.record.id);
    transfer::Status::Kind b = h.StatusOf(second.record.id);
    assert((a == transfer::Status::kReady) != (b == transfer::Status::kReady));
    assert(a == transfer::Status::kQueued || b == transfer::Status::kQueued);
    assert(h.server->sent.size() == 1);
    dcc::Send announced;
    assert(dcc::Decode(h.server->sent[0], announced));
    assert(announced.kind == dcc::Send::kDirect);
    assert(announced.port == port);

    transfer::Id ready = a == transfer::Status::kReady ? first.record.id : second.record.id;
    transfer::Id waiting = ready == first.record.id ? second.record.id : first.record.id;
    assert(h.manager.Remove(ready));

    h.Pump(5);
    assert(h.StatusOf(waiting) == transfer::Status::kReady);
    assert(h.server->sent.size() == 2);
    assert(dcc::Decode(h.server->sent[1], announced));
    assert(announced.port == port);
    std::remove(kSourcePath);
}

void TestAutoAccept() {
    const char kSanitized[] = ".._evil.txt";
    std::remove(kSanitized);
    config::FileTransferSettings settings;
    settings.auto_accept = true;
    settings.auto_accept_nicks.push_back("alice");
    settings.save_directory = ".";
    Harness h(settings);
    const int port = FreePort();

    transfer::NewTransfer trusted;
    assert(h.manager.Receive(dcc::MakeDirect("../evil.txt", "127.0.0.1", port, 10, false),
                             "alice", trusted));
    h.Track(trusted);
    transfer::NewTransfer stranger;
    assert(h.manager.Receive(dcc::MakeDirect("b.txt", "127.0.0.1", port, 10, false), "mallory",
                             stranger));
    h.Track(stranger);

    for (int i = 0; i < 100 && h.StatusOf(trusted.record.id) != transfer::Status::kFailed; ++i) {
        h.Pump(1);
    }
    assert(h.StatusOf(trusted.record.id) == transfer::Status::kFailed);
    assert(FileExists(kSanitized));
    assert(h.StatusOf(stranger.record.id) == transfer::Status::kPendingApproval);
    std::remove(kSanitized);
}

void TestAutoAcceptByMask() {
    const char kAccepted[] = "masked.txt";
    std::remove(kAccepted);
    config::FileTransferSettings settings;
    settings.auto_accept = true;
    settings.auto_accept_masks.push_back("*!*@*.trusted.org");
    settings.save_directory = ".";
    Harness h(settings);
    const int port = FreePort();

    transfer::NewTransfer trusted;
    assert(h.manager.Receive(dcc::MakeDirect(kAccepted, "127.0.0.1", port, 10, false),
                             protocol::UserSource("Eve", "e", "Box.Trusted.org").user, trusted));
    h.Track(trusted);
    transfer::NewTransfer outsider;
    assert(h.manager.Receive(dcc::MakeDirect("other.txt", "127.0.0.1", port, 10, false),
                             protocol::UserSource("eve", "e", "box.untrusted.net").user, outsider));
    h.Track(outsider);
    // 호스트를 모르는 닉만으로는 마스크에 맞지 않는다.
    transfer::NewTransfer unknown;
    assert(h.manager.Receive(dcc::MakeDirect("third.txt", "127.0.0.1", port, 10, false), "eve",
                             unknown));
    h.Track(unknown);
    assert(trusted.record.remote_user == "Eve");

    for (int i = 0; i < 100 && h.StatusOf(trusted.record.id) != transfer::Status::kFailed; ++i) {
        h.Pump(1);
    }
    assert(h.StatusOf(trusted.record.id) == transfer::Status::kFailed);
    assert(FileExists(kAccepted));
    assert(h.StatusOf(outsider.record.id) == transfer::Status::kPendingApproval);
    assert(h.StatusOf(unknown.record.id) == transfer::Status::kPendingApproval);
    std::remove(kAccepted);
}

void TestAutoAcceptNeedsSaveDirectory() {
    config::FileTransferSettings settings;
    settings.auto_accept = true;
    Harness h(settings);

    transfer::NewTransfer created;
    assert(h.manager.Receive(dcc::MakeDirect("c.txt", "127.0.0.1", 4000, 10, false), "alice",
                             created));
    h.Track(created);
    h.Pump(2);
    assert(h.StatusOf(created.record.id) == transfer::Status::kPendingApproval);
    assert(ReadFile(kLogPath).find("[warn]") != std::string::npos);
}

void TestUpdatesApplyToRecord() {
    Harness h((config::FileTransferSettings()));
    transfer::NewTransfer created;
    assert(h.manager.Receive(dcc::MakeDirect("d.txt", "127.0.0.1", 4000, 100, false), "alice",
                             created));
    h.Track(created);
    const transfer::Id id = created.record.id;

    h.manager.Update(transfer::Update::Progress(id, 40, transfer::Duration(100)));
    const transfer::FileTransfer *record = h.manager.Get(id);
    assert(record->status.kind == transfer::Status::kActive);
    assert(record->status.transferred == 40);
    assert(record->progress() > 0.39 && record->progress() < 0.41);

    h.manager.Update(transfer::Update::Finished(id, transfer::Duration(1500), "abc"));
    record = h.manager.Get(id);
    assert(record->status.kind == transfer::Status::kCompleted);
    assert(record->status.checksum == "abc");
    assert(record->progress() == 1.0);
    assert(h.reactor.Size() == 0);

    // 종료 뒤의 Update 는 무시한다.
    h.manager.Update(transfer::Update::Failed(id, "late"));
    h.manager.Update(transfer::Update::Progress(id, 50, transfer::Duration(200)));
    assert(h.manager.Get(id)->status.kind == transfer::Status::kCompleted);
    h.manager.Update(transfer::Update::Failed(static_cast<transfer::Id>(id + 1), "unknown"));

    assert(transfer::StatusToString(record->status) == "completed in 1.50s sha256=abc");
    assert(ReadFile(kLogPath).find("파일 전송 완료 from alice for \"d.txt\" in 1.50s") !=
           std::string::npos);
}

void TestListIsOrdered() {
    Harness h((config::FileTransferSettings()));
    transfer::NewTransfer first;
    assert(h.manager.Receive(dcc::MakeDirect("z.txt", "127.0.0.1", 4000, 1, false), "alice",
                             first));
    h.Track(first);
    transfer::NewTransfer second;
    assert(h.manager.Receive(dcc::MakeDirect("a.txt", "127.0.0.1", 4000, 1, false), "bob",
                             second));
    h.Track(second);

    std::vector<transfer::FileTransfer> records = h.manager.List();
    assert(records.size() == 2);
    assert(records[0].remote_user == "alice");
    assert(records[1].remote_user == "bob");
    assert(transfer::DirectionToString(records[0].direction) == "from");
    assert(transfer::StatusToString(records[0].status) == "pending approval");
}

int main() {
    std::signal(SIGPIPE, SIG_IGN);
    TestReceiveCreatesPendingRecord();
    TestIdsStayUniqueWhileTracked();
    TestReverseConfirmationIsCorrelated();
    TestQueuedWithoutListenServerFails();
    TestPortIsRecycled();
    TestAutoAccept();
    TestAutoAcceptByMask();
    TestAutoAcceptNeedsSaveDirectory();
    TestUpdatesApplyToRecord();
    TestListIsOrdered();
    std::remove(kLogPath);
    return 0;
}
