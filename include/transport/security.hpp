/*
 * 설명: 연결 보안 설정, 프록시 설정, 전송 계층 오류와 I/O 상태 값을 정의한다.
 * 버전: v0.2.0
 * 관련 문서: DESIGN.md (Transport Connection)
 * 테스트: tests/unit/proxy_test.cpp, tests/unit/task_test.cpp
 */
#pragma once

#include <string>

namespace transport {

enum class IoStatus { kOk, kWouldBlock, kClosed, kError };

struct Security {
    bool secured;
    // 인증서 검증을 건너뛴다. 명시적으로 켠 경우에만 사용한다.
    bool accept_invalid_certs;
    std::string root_cert_path;
    std::string client_cert_path;
    std::string client_key_path;

    Security() : secured(false), accept_invalid_certs(false) {}

    static Security Unsecured() { return Security(); }
    static Security Secured(bool accept_invalid_certs) {
        Security security;
        security.secured = true;
        security.accept_invalid_certs = accept_invalid_certs;
        return security;
    }
};

struct Proxy {
    enum Kind { kNone, kHttp, kSocks5 };

    Kind kind;
    std::string host;
    int port;
    std::string username;
    std::string password;

    Proxy() : kind(kNone), port(0) {}
};

struct ConnectionError {
    enum Kind { kIo, kTls, kProxy, kClientCertificate };

    Kind kind;
    std::string detail;

    ConnectionError() : kind(kIo) {}
    ConnectionError(Kind k, const std::string &d) : kind(k), detail(d) {}

    std::string Describe() const;
};

}  // namespace transport
