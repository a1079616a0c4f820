/*
 * 설명: HTTP CONNECT 와 SOCKS5 터널 협상을 소켓과 분리된 바이트 단위 상태 기계로 구현한다.
 * 버전: v0.2.0
 * 관련 문서: DESIGN.md (Transport Connection)
 * 테스트: tests/unit/proxy_test.cpp
 */
#pragma once

#include <cstddef>
#include <string>

#include "transport/security.hpp"

namespace transport {

class ProxyHandshake {
   public:
    enum Result { kNeedMore, kDone, kFailed };

    ProxyHandshake(const Proxy &proxy, const std::string &target_host, int target_port);

    // 다음에 프록시로 보낼 바이트. 보낸 만큼 ConsumeOutgoing 으로 덜어낸다.
    const std::string &Outgoing() const { return outgoing_; }
    void ConsumeOutgoing(std::size_t n);

    Result Feed(const char *data, std::size_t len, std::string &error);
    bool IsDone() const { return stage_ == kStageDone; }
    // 생성 시점에 이미 협상할 수 없는 설정이면 true. 이유는 FailureReason().
    bool IsFailed() const { return stage_ == kStageFailed; }
    const std::string &FailureReason() const { return failure_; }
    // 협상 응답 뒤에 이미 도착한 터널 데이터.
    const std::string &Leftover() const { return leftover_; }

   private:
    enum Stage {
        kStageHttpResponse,
        kStageSocksMethod,
        kStageSocksAuth,
        kStageSocksConnect,
        kStageDone,
        kStageFailed
    };

    bool HasCredentials() const;
    void StartHttp();
    void StartSocks();
    void QueueSocksConnect();
    Result Fail(const std::string &reason, std::string &error);
    Result StepHttp(std::string &error);
    Result StepSocks(std::string &error);

    Proxy proxy_;
    std::string target_host_;
    int target_port_;
    Stage stage_;
    std::string outgoing_;
    std::string inbound_;
    std::string leftover_;
    std::string failure_;
};

std::string EncodeBase64(const std::string &input);

}  // namespace transport
