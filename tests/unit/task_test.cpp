/*
 * 설명: 한 리액터 안에서 송신 작업과 수신 작업을 127.0.0.1 로 맞물려 직접/역방향 전송, 체크섬, 시간 초과, 중단을 확인한다.
 * 버전: v0.5.0
 * 관련 문서: DESIGN.md (Transfer Task Engine)
 * 테스트: 이 파일 자체
 */
#include "transfer/task.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cassert>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <iterator>
#include <memory>
#include <string>
#include <vector>

#include "dcc/send.hpp"
#include "net/reactor.hpp"
#include "utils/channel.hpp"
#include "utils/sha256.hpp"

namespace {
const char kSourcePath[] = "ircdcc_task_source.bin";
const char kTargetPath[] = "ircdcc_task_target.bin";

class RecordingServer : public transfer::ServerHandle {
   public:
    bool Send(const protocol::Message &message) {
        sent.push_back(message);
        return true;
    }

    std::vector<protocol::Message> sent;
};

struct Observed {
    utils::Receiver<transfer::Update> updates;
    std::vector<transfer::Update> seen;

    void Drain() {
        transfer::Update update;
        while (updates.TryReceive(update)) {
            seen.push_back(update);
        }
    }

    bool Has(transfer::Update::Kind kind) const {
        for (std::size_t i = 0; i < seen.size(); ++i) {
            if (seen[i].kind == kind) {
                return true;
            }
        }
        return false;
    }

    bool Terminated() const { return !seen.empty() && seen.back().IsTerminal(); }
};

template <typename Predicate>
bool RunUntil(net::Reactor &reactor, Observed &a, Observed &b, Predicate done) {
    net::Clock::time_point limit = net::Clock::now() + std::chrono::seconds(10);
    while (net::Clock::now() < limit) {
        a.Drain();
        b.Drain();
        if (done()) {
            return true;
        }
        reactor.RunOnce(50);
    }
    a.Drain();
    b.Drain();
    return done();
}

std::string WriteSource(std::size_t size) {
    std::string data;
    data.reserve(size);
    for (std::size_t i = 0; i < size; ++i) {
        data.push_back(static_cast<char>((i * 31 + 7) & 0xFF));
    }
    std::ofstream file(kSourcePath, std::ios::binary);
    file.write(data.data(), static_cast<std::streamsize>(data.size()));
    return data;
}

std::string ReadFile(const char *path) {
    std::ifstream file(path, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
}

std::string HexSha256(const std::string &data) {
    utils::Sha256 sha;
    sha.Update(data.data(), data.size());
    return sha.HexDigest();
}

transfer::TaskSettings LoopbackSettings() {
    transfer::TaskSettings settings;
    settings.timeout = std::chrono::seconds(5);
    settings.public_address = "127.0.0.1";
    settings.bind_address = "127.0.0.1";
    return settings;
}

void CheckProgress(const Observed &observed, std::uint64_t size) {
    std::uint64_t last = 0;
    for (std::size_t i = 0; i < observed.seen.size(); ++i) {
        if (observed.seen[i].kind != transfer::Update::kProgress) {
            continue;
        }
        assert(observed.seen[i].transferred >= last);
        assert(observed.seen[i].transferred <= size);
        last = observed.seen[i].transferred;
    }
}

void Cleanup() {
    std::remove(kSourcePath);
    std::remove(kTargetPath);
}
}  // namespace

void TestSha256KnownVector() {
    assert(HexSha256("abc") ==
           "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    utils::Sha256 empty;
    assert(empty.HexDigest() ==
           "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
    assert(empty.HexDigest() ==
           "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

void TestDirectTransfer() {
    const std::size_t kSize = 300000;
    const std::string data = WriteSource(kSize);
    net::Reactor reactor;
    std::shared_ptr<RecordingServer> server = std::make_shared<RecordingServer>();
    transfer::TaskSettings settings = LoopbackSettings();

    Observed sender;
    Observed receiver;
    transfer::TaskHandle send_task =
        transfer::Spawn(reactor, transfer::SendSpec(1, kSourcePath, "payload.bin", "bob", false),
                        server, settings, sender.updates);
    assert(send_task.IsRunning());

    assert(RunUntil(reactor, sender, receiver,
                    [&]() { return sender.Has(transfer::Update::kQueued); }));
    assert(sender.seen[0].kind == transfer::Update::kMetadata);
    assert(sender.seen[0].size == kSize);
    assert(send_task.PortAvailable(0));

    assert(RunUntil(reactor, sender, receiver, [&]() { return !server->sent.empty(); }));
    assert(sender.Has(transfer::Update::kReady));
    dcc::Send offer;
    assert(dcc::Decode(server->sent[0], offer));
    assert(server->sent[0].command.params[0] == "bob");
    assert(offer.kind == dcc::Send::kDirect);
    assert(offer.filename == "payload.bin");
    assert(offer.host == "127.0.0.1");
    assert(offer.HasPort());
    assert(offer.size == kSize);

    transfer::TaskHandle receive_task = transfer::Spawn(
        reactor, transfer::ReceiveSpec(2, offer, "alice"), server, settings, receiver.updates);
    assert(receive_task.Approve(kTargetPath));

    assert(RunUntil(reactor, sender, receiver,
                    [&]() { return sender.Terminated() && receiver.Terminated(); }));
    const transfer::Update &sent = sender.seen.back();
    const transfer::Update &received = receiver.seen.back();
    assert(sent.kind == transfer::Update::kFinished);
    assert(received.kind == transfer::Update::kFinished);
    assert(sent.id == 1);
    assert(received.id == 2);
    assert(sent.checksum == HexSha256(data));
    assert(received.checksum == sent.checksum);
    assert(ReadFile(kTargetPath) == data);
    CheckProgress(sender, kSize);
    CheckProgress(receiver, kSize);

    // 끝난 작업은 리액터에서 빠진다.
    assert(RunUntil(reactor, sender, receiver, [&]() { return reactor.Size() == 0; }));
    assert(!send_task.IsRunning());
    assert(!receive_task.IsRunning());
    Cleanup();
}

void TestReverseTransfer() {
    const std::size_t kSize = 20000;
    const std::string data = WriteSource(kSize);
    net::Reactor reactor;
    std::shared_ptr<RecordingServer> server = std::make_shared<RecordingServer>();
    transfer::TaskSettings settings = LoopbackSettings();

    Observed sender;
    Observed receiver;
    transfer::TaskHandle send_task =
        transfer::Spawn(reactor, transfer::SendSpec(77, kSourcePath, "rev.bin", "bob", true),
                        server, settings, sender.updates);

    assert(RunUntil(reactor, sender, receiver, [&]() { return !server->sent.empty(); }));
    dcc::Send offer;
    assert(dcc::Decode(server->sent[0], offer));
    assert(offer.kind == dcc::Send::kReverse);
    assert(!offer.HasHost());
    assert(offer.token == "77");
    assert(offer.size == kSize);
    assert(!sender.Has(transfer::Update::kQueued));

    transfer::TaskHandle receive_task = transfer::Spawn(
        reactor, transfer::ReceiveSpec(5, offer, "alice"), server, settings, receiver.updates);
    assert(receive_task.Approve(kTargetPath));
    assert(RunUntil(reactor, sender, receiver,
                    [&]() { return receiver.Has(transfer::Update::kQueued); }));
    assert(receive_task.PortAvailable(0));

    assert(RunUntil(reactor, sender, receiver, [&]() { return server->sent.size() == 2; }));
    assert(receiver.Has(transfer::Update::kReady));
    dcc::Send confirmation;
    assert(dcc::Decode(server->sent[1], confirmation));
    assert(confirmation.kind == dcc::Send::kReverse);
    assert(confirmation.host == "127.0.0.1");
    assert(confirmation.HasPort());
    assert(confirmation.token == "77");
    assert(confirmation.filename == "rev.bin");

    assert(send_task.ConfirmReverse(confirmation.host, confirmation.port));
    assert(RunUntil(reactor, sender, receiver,
                    [&]() { return sender.Terminated() && receiver.Terminated(); }));
    assert(sender.seen.back().kind == transfer::Update::kFinished);
    assert(receiver.seen.back().kind == transfer::Update::kFinished);
    assert(receiver.seen.back().checksum == HexSha256(data));
    assert(ReadFile(kTargetPath) == data);
    Cleanup();
}

void TestEmptyFile() {
    WriteSource(0);
    net::Reactor reactor;
    std::shared_ptr<RecordingServer> server = std::make_shared<RecordingServer>();
    transfer::TaskSettings settings = LoopbackSettings();

    Observed sender;
    Observed receiver;
    transfer::TaskHandle send_task =
        transfer::Spawn(reactor, transfer::SendSpec(3, kSourcePath, "empty", "bob", false), server,
                        settings, sender.updates);
    assert(RunUntil(reactor, sender, receiver,
                    [&]() { return sender.Has(transfer::Update::kQueued); }));
    assert(send_task.PortAvailable(0));
    assert(RunUntil(reactor, sender, receiver, [&]() { return !server->sent.empty(); }));

    dcc::Send offer;
    assert(dcc::Decode(server->sent[0], offer));
    assert(offer.size == 0);
    transfer::TaskHandle receive_task = transfer::Spawn(
        reactor, transfer::ReceiveSpec(4, offer, "alice"), server, settings, receiver.updates);
    assert(receive_task.Approve(kTargetPath));

    assert(RunUntil(reactor, sender, receiver,
                    [&]() { return sender.Terminated() && receiver.Terminated(); }));
    assert(sender.seen.back().kind == transfer::Update::kFinished);
    assert(receiver.seen.back().kind == transfer::Update::kFinished);
    assert(receiver.seen.back().checksum == HexSha256(""));
    assert(ReadFile(kTargetPath).empty());
    Cleanup();
}

void TestReverseConfirmationTimeout() {
    WriteSource(10);
    net::Reactor reactor;
    std::shared_ptr<RecordingServer> server = std::make_shared<RecordingServer>();
    transfer::TaskSettings settings = LoopbackSettings();
    settings.timeout = std::chrono::milliseconds(100);

    Observed sender;
    Observed unused;
    transfer::TaskHandle send_task =
        transfer::Spawn(reactor, transfer::SendSpec(9, kSourcePath, "late.bin", "bob", true),
                        server, settings, sender.updates);
    assert(RunUntil(reactor, sender, unused, [&]() { return sender.Terminated(); }));
    assert(sender.seen.back().kind == transfer::Update::kFailed);
    assert(sender.seen.back().reason.find("시간 초과") != std::string::npos);
    assert(!send_task.IsRunning());
    Cleanup();
}

void TestMissingSourceFails() {
    std::remove(kSourcePath);
    net::Reactor reactor;
    std::shared_ptr<RecordingServer> server = std::make_shared<RecordingServer>();

    Observed sender;
    Observed unused;
    transfer::TaskHandle send_task = transfer::Spawn(
        reactor, transfer::SendSpec(10, kSourcePath, "gone.bin", "bob", false), server,
        LoopbackSettings(), sender.updates);
    assert(RunUntil(reactor, sender, unused, [&]() { return sender.Terminated(); }));
    assert(sender.seen.size() == 1);
    assert(sender.seen[0].kind == transfer::Update::kFailed);
    assert(server->sent.empty());
}

void TestConnectFailure() {
    net::Reactor reactor;
    std::shared_ptr<RecordingServer> server = std::make_shared<RecordingServer>();

    // 잠깐 바인드했다가 닫은 포트는 연결을 거부한다.
    int closed_port = 0;
    {
        transport::Listener probe;
        transport::ConnectionError bind_error;
        assert(probe.Bind("127.0.0.1", 0, transport::Security::Unsecured(), bind_error));
        closed_port = probe.LocalPort();
    }
    assert(closed_port > 0);

    dcc::Send offer = dcc::MakeDirect("x.bin", "127.0.0.1", closed_port, 10, false);
    Observed receiver;
    Observed unused;
    transfer::TaskHandle receive_task = transfer::Spawn(
        reactor, transfer::ReceiveSpec(11, offer, "alice"), server, LoopbackSettings(),
        receiver.updates);
    assert(receive_task.Approve(kTargetPath));
    assert(RunUntil(reactor, receiver, unused, [&]() { return receiver.Terminated(); }));
    assert(receiver.seen.back().kind == transfer::Update::kFailed);
    assert(!receiver.seen.back().reason.empty());
    Cleanup();
}

void TestSendFailsWhenPeerClosesEarly() {
    const std::size_t kSize = 16 * 1024 * 1024;
    WriteSource(kSize);
    net::Reactor reactor;
    std::shared_ptr<RecordingServer> server = std::make_shared<RecordingServer>();

    Observed sender;
    Observed unused;
    transfer::TaskHandle send_task =
        transfer::Spawn(reactor, transfer::SendSpec(13, kSourcePath, "big.bin", "bob", false),
                        server, LoopbackSettings(), sender.updates);
    assert(RunUntil(reactor, sender, unused,
                    [&]() { return sender.Has(transfer::Update::kQueued); }));
    assert(send_task.PortAvailable(0));
    assert(RunUntil(reactor, sender, unused, [&]() { return !server->sent.empty(); }));
    dcc::Send offer;
    assert(dcc::Decode(server->sent[0], offer));

    // 확인 응답 없이 일부만 읽고 끊는 상대.
    int fd = socket(AF_INET, SOCK_STREAM, 0);
    assert(fd >= 0);
    sockaddr_in addr;
    std::memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_port = htons(static_cast<unsigned short>(offer.port));
    assert(inet_pton(AF_INET, "127.0.0.1", &addr.sin_addr) == 1);
    assert(connect(fd, reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) == 0);

    std::size_t peer_read = 0;
    char buf[8192];
    net::Clock::time_point limit = net::Clock::now() + std::chrono::seconds(10);
    while (peer_read < 65536 && net::Clock::now() < limit) {
        reactor.RunOnce(10);
        ssize_t n = recv(fd, buf, sizeof(buf), MSG_DONTWAIT);
        if (n > 0) {
            peer_read += static_cast<std::size_t>(n);
        }
    }
    assert(peer_read >= 65536);
    close(fd);

    assert(RunUntil(reactor, sender, unused, [&]() { return sender.Terminated(); }));
    assert(sender.seen.back().kind == transfer::Update::kFailed);
    assert(!sender.Has(transfer::Update::kFinished));
    assert(!send_task.IsRunning());
    Cleanup();
}

void TestAbortDetachesImmediately() {
    net::Reactor reactor;
    std::shared_ptr<RecordingServer> server = std::make_shared<RecordingServer>();
    dcc::Send offer = dcc::MakeDirect("x.bin", "127.0.0.1", 4000, 10, false);

    Observed receiver;
    transfer::TaskHandle receive_task = transfer::Spawn(
        reactor, transfer::ReceiveSpec(12, offer, "alice"), server, LoopbackSettings(),
        receiver.updates);
    assert(reactor.Size() == 1);
    reactor.RunOnce(0);

    receive_task.Abort();
    assert(reactor.Size() == 0);
    assert(!receive_task.IsRunning());
    assert(!receive_task.Approve(kTargetPath));
    receiver.Drain();
    assert(!receiver.Terminated());
    assert(receiver.updates.IsFinished());
}

int main() {
    std::signal(SIGPIPE, SIG_IGN);
    TestSha256KnownVector();
    TestDirectTransfer();
    TestReverseTransfer();
    TestEmptyFile();
    TestReverseConfirmationTimeout();
    TestMissingSourceFails();
    TestConnectFailure();
    TestSendFailsWhenPeerClosesEarly();
    TestAbortDetachesImmediately();
    return 0;
}
