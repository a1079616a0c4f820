/*
 * 설명: 이름 해석, 논블로킹 TCP 연결, 프록시 협상, TLS 핸드셰이크를 차례로 밟는 아웃바운드 연결 상태 기계.
 * 버전: v0.3.0
 * 관련 문서: DESIGN.md (Transport Connection)
 * 테스트: tests/unit/task_test.cpp
 */
#pragma once

#include <netdb.h>

#include <memory>
#include <string>

#include "transport/proxy.hpp"
#include "transport/security.hpp"
#include "transport/stream.hpp"
#include "transport/tls_stream.hpp"

namespace transport {

class Connector {
   public:
    Connector(const std::string &host, int port, const Security &security, const Proxy &proxy);
    ~Connector();

    // kOk 면 연결 완료, kWouldBlock 이면 Fd()/PollEvents() 를 기다린 뒤 다시 호출한다.
    IoStatus Step(ConnectionError &error);
    int Fd() const;
    short PollEvents() const;

    // 완료 후 한 번만 호출한다. initial_data 는 프록시 응답 뒤에 딸려 온 바이트.
    std::unique_ptr<Stream> TakeStream(std::string &initial_data);

   private:
    enum Stage { kStart, kConnecting, kProxy, kTls, kDone, kFailed };

    Connector(const Connector &);
    Connector &operator=(const Connector &);

    IoStatus Resolve(ConnectionError &error);
    IoStatus TryNextAddress(ConnectionError &error);
    IoStatus OnConnected(ConnectionError &error);
    IoStatus StepProxy(ConnectionError &error);
    IoStatus StartTls(ConnectionError &error);
    IoStatus Fail(const ConnectionError &cause, ConnectionError &error);
    void CloseSocket();

    std::string host_;
    int port_;
    Security security_;
    Proxy proxy_;
    Stage stage_;

    struct addrinfo *addresses_;
    struct addrinfo *current_;
    int fd_;
    std::string last_error_;

    std::unique_ptr<ProxyHandshake> handshake_;
    std::unique_ptr<TlsStream> tls_;
};

}  // namespace transport
