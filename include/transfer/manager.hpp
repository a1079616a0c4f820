/*
 * 설명: 전송 식별자별 레코드와 작업 핸들을 관리한다. 수신 제안 상관, 자동 수락, 포트 배정, Update 반영, 목록 제공.
 * 버전: v0.5.0
 * 관련 문서: DESIGN.md (Transfer Manager)
 * 테스트: tests/unit/manager_test.cpp
 */
#pragma once

#include <deque>
#include <map>
#include <memory>
#include <random>
#include <string>
#include <vector>

#include "dcc/send.hpp"
#include "net/reactor.hpp"
#include "protocol/message.hpp"
#include "transfer/task.hpp"
#include "transfer/types.hpp"
#include "utils/channel.hpp"
#include "utils/config.hpp"
#include "utils/logger.hpp"

namespace transfer {

// 새 전송이 생기면 소유자가 updates 를 비워 Manager::Update 로 넘겨야 한다.
struct NewTransfer {
    FileTransfer record;
    utils::Receiver<Update> updates;
};

class Manager {
   public:
    Manager(net::Reactor &reactor, const std::shared_ptr<ServerHandle> &server,
            const std::string &server_name, const config::FileTransferSettings &settings,
            const transport::Proxy &proxy, Logger &logger);

    // 역방향 확인이면 진행 중인 송신 작업에 전달하고 false, 새 수신이면 out 을 채우고 true.
    bool Receive(const dcc::Send &request, const protocol::User &from, NewTransfer &out);
    // 닉만 아는 경우. 마스크 비교는 빈 user/host 로 한다.
    bool Receive(const dcc::Send &request, const std::string &remote_user, NewTransfer &out);
    bool Send(const std::string &path, const std::string &remote_user, NewTransfer &out);
    void Update(const transfer::Update &update);

    bool Approve(Id id, const std::string &save_path);
    bool Remove(Id id);
    const FileTransfer *Get(Id id) const;
    std::vector<FileTransfer> List() const;
    bool IsEmpty() const { return items_.empty(); }

   private:
    struct Item {
        FileTransfer record;
        TaskHandle task;
        bool working;

        Item() : working(true) {}
        Item(Item &&other)
            : record(other.record), task(std::move(other.task)), working(other.working) {}
    };

    Manager(const Manager &);
    Manager &operator=(const Manager &);

    Id NextId();
    bool ShouldAutoAccept(const protocol::User &from) const;
    bool AllocatePort(int &port) const;
    void AssignPort(Id id);
    void RecyclePort(Id id);
    TaskSettings MakeTaskSettings() const;
    FileTransfer MakeRecord(Id id, Direction direction, const std::string &remote_user,
                            const std::string &filename) const;

    net::Reactor &reactor_;
    std::shared_ptr<ServerHandle> server_;
    std::string server_name_;
    config::FileTransferSettings settings_;
    transport::Proxy proxy_;
    Logger &logger_;

    std::map<Id, Item> items_;
    // 포트 배정을 기다리는 전송.
    std::deque<Id> queued_;
    std::map<Id, int> used_ports_;
    std::mt19937 rng_;
};

}  // namespace transfer
