/*
 * 설명: 전송 하나를 맡는 상태 기계(수신/송신, 직접/역방향). 리액터에서 재개되며 Action 을 받고 Update 를 보낸다.
 * 버전: v0.5.0
 * 관련 문서: DESIGN.md (Transfer Task Engine)
 * 테스트: tests/unit/task_test.cpp
 */
#pragma once

#include <cstdint>
#include <deque>
#include <fstream>
#include <memory>
#include <string>

#include "dcc/send.hpp"
#include "net/reactor.hpp"
#include "transfer/types.hpp"
#include "transport/connection.hpp"
#include "transport/connector.hpp"
#include "transport/listener.hpp"
#include "utils/channel.hpp"
#include "utils/sha256.hpp"

namespace transfer {

const std::size_t kActionCapacity = 1;
const std::size_t kUpdateCapacity = 100;
const std::size_t kSendChunkSize = 8192;
const Duration kProgressInterval(16);

enum class Role { kReceive, kSend };

struct TaskSettings {
    Duration timeout;
    // 리슨 서버가 없으면 PortAvailable 이 오지 않는다.
    std::string public_address;
    std::string bind_address;
    transport::Proxy proxy;

    TaskSettings() : timeout(std::chrono::seconds(300)), bind_address("0.0.0.0") {}
};

struct TaskSpec {
    Role role;
    Id id;
    std::string remote_user;
    std::string filename;
    bool secure;
    bool reverse;
    std::uint64_t size;
    // 수신 직접 모드의 상대 주소, 역방향 모드의 토큰.
    std::string host;
    int port;
    std::string token;
    // 송신할 원본 파일.
    std::string path;

    TaskSpec() : role(Role::kReceive), id(0), secure(false), reverse(false), size(0), port(0) {}
};

TaskSpec ReceiveSpec(Id id, const dcc::Send &request, const std::string &remote_user);
TaskSpec SendSpec(Id id, const std::string &path, const std::string &filename,
                  const std::string &remote_user, bool reverse);

class TransferTask : public net::Pollable {
   public:
    TransferTask(const TaskSpec &spec, const std::shared_ptr<ServerHandle> &server,
                 const TaskSettings &settings, utils::Receiver<Action> actions,
                 utils::Sender<Update> updates);

    int PollFd() const;
    short PollEvents() const;
    bool Runnable() const;
    bool HasDeadline() const;
    net::Clock::time_point Deadline() const;
    void Resume(short revents);
    bool Done() const;

    // 즉시 중단한다. 열린 소켓과 파일을 닫고 더 이상 Update 를 보내지 않는다.
    void Cancel();

   private:
    enum State {
        kStart,
        kWaitApproval,
        kWaitPort,
        kWaitConfirmation,
        kConnecting,
        kAccepting,
        kTransferring,
        kClosing,
        kFinished
    };

    TransferTask(const TransferTask &);
    TransferTask &operator=(const TransferTask &);

    void Step();
    void Start();
    void HandleAction(const Action &action);
    void Approve(const std::string &save_path);
    void Connect(const std::string &host, int port, const transport::Security &security);
    void Listen(int port);
    void StepConnect();
    void StepAccept();
    void StartTransfer(std::unique_ptr<transport::Stream> stream, const std::string &initial_data);
    void StepReceive();
    void StepSend();
    void BeginClosing();
    void StepClose();
    void ReportProgress();
    void Complete();
    void Fail(const std::string &reason);
    void Release();
    void Emit(const Update &update);
    bool DrainBacklog();
    bool WaitingForAction() const;
    bool WaitingForRemote() const;
    transport::Security TransferSecurity() const;
    Duration Elapsed() const;

    TaskSpec spec_;
    std::shared_ptr<ServerHandle> server_;
    TaskSettings settings_;
    utils::Receiver<Action> actions_;
    utils::Sender<Update> updates_;
    std::deque<Update> backlog_;

    State state_;
    bool cancelled_;

    std::unique_ptr<transport::Connector> connector_;
    std::unique_ptr<transport::Listener> listener_;
    std::unique_ptr<transport::Connection<transport::BytesCodec> > connection_;
    std::ofstream output_;
    std::ifstream input_;
    utils::Sha256 sha256_;

    std::uint64_t transferred_;
    std::uint64_t reported_;
    std::uint32_t acknowledged_;
    bool acknowledged_any_;
    std::string ack_buffer_;

    net::Clock::time_point started_at_;
    net::Clock::time_point last_progress_;
    net::Clock::time_point wait_started_;
};

// 작업의 소유자. 소멸하거나 Abort 하면 작업이 리액터에서 즉시 빠진다.
class TaskHandle {
   public:
    TaskHandle();
    TaskHandle(std::unique_ptr<TransferTask> task, net::Reactor *reactor,
               utils::Sender<Action> actions);
    TaskHandle(TaskHandle &&other);
    TaskHandle &operator=(TaskHandle &&other);
    ~TaskHandle();

    bool Approve(const std::string &save_path);
    bool ConfirmReverse(const std::string &host, int port);
    bool PortAvailable(int port);
    void Abort();
    bool IsRunning() const;

   private:
    TaskHandle(const TaskHandle &);
    TaskHandle &operator=(const TaskHandle &);

    bool Deliver(const Action &action);

    std::unique_ptr<TransferTask> task_;
    net::Reactor *reactor_;
    utils::Sender<Action> actions_;
};

// 작업을 만들어 리액터에 등록하고 Update 수신측을 updates 로 넘긴다.
TaskHandle Spawn(net::Reactor &reactor, const TaskSpec &spec,
                 const std::shared_ptr<ServerHandle> &server, const TaskSettings &settings,
                 utils::Receiver<Update> &updates);

}  // namespace transfer
