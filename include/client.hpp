/*
 * 설명: 주 IRC 연결 세션. 접속/등록, PING 응답, DCC 제안을 전송 관리자로 넘기고 작업 Update 를 반영한다.
 * 버전: v0.6.0
 * 관련 문서: DESIGN.md (Client Driver)
 * 테스트: tests/unit/manager_test.cpp (ServerHandle 경로)
 */
#pragma once

#include <deque>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "net/reactor.hpp"
#include "protocol/message.hpp"
#include "transfer/manager.hpp"
#include "transfer/types.hpp"
#include "transport/connection.hpp"
#include "transport/connector.hpp"
#include "utils/channel.hpp"
#include "utils/config.hpp"
#include "utils/logger.hpp"

// 작업이 보낸 메시지를 세션이 다음 재개 때 주 연결로 옮긴다.
class OutboundQueue : public transfer::ServerHandle {
   public:
    OutboundQueue() : closed_(false) {}

    bool Send(const protocol::Message &message);
    bool TakeNext(protocol::Message &out);
    bool HasPending() const { return !pending_.empty(); }
    void Close();

   private:
    std::deque<protocol::Message> pending_;
    bool closed_;
};

class ClientSession : public net::Pollable {
   public:
    ClientSession(net::Reactor &reactor, const config::Settings &settings, Logger &logger);

    // 등록이 끝난 뒤 순서대로 시작한다.
    void QueueSend(const std::string &remote_user, const std::string &path);
    // QUIT 을 보내고 출력이 비면 연결을 닫는다.
    void RequestQuit();
    void RequestListing() { listing_requested_ = true; }

    bool Failed() const { return failed_; }
    const transfer::Manager &manager() const { return manager_; }

    int PollFd() const;
    short PollEvents() const;
    bool Runnable() const;
    void Resume(short revents);
    bool Done() const { return state_ == kClosed; }

   private:
    enum State { kConnecting, kRegistering, kRegistered, kQuitting, kClosed };

    ClientSession(const ClientSession &);
    ClientSession &operator=(const ClientSession &);

    void StepConnect();
    void Register();
    void ReadLines();
    void HandleMessage(const protocol::Message &message);
    void HandleOffer(const protocol::Message &message);
    void StartPendingSends();
    void Track(transfer::NewTransfer &created);
    void DrainUpdates();
    void DrainOutbound();
    void FlushOrClose();
    void LogTransfers();
    void Close(bool failed);

    std::string server_name_;
    config::ServerSettings server_settings_;
    Logger &logger_;
    std::shared_ptr<OutboundQueue> outbound_;
    transfer::Manager manager_;

    State state_;
    bool failed_;
    bool listing_requested_;
    std::string nickname_;

    std::unique_ptr<transport::Connector> connector_;
    std::unique_ptr<transport::Connection<transport::LineCodec> > connection_;
    std::vector<utils::Receiver<transfer::Update> > updates_;
    std::vector<std::pair<std::string, std::string> > pending_sends_;
};
