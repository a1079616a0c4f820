/*
 * 설명: OpenSSL 기반 TLS 클라이언트 스트림. 논블로킹 핸드셰이크와 WANT_READ/WANT_WRITE 재시도를 처리한다.
 * 버전: v0.2.0
 * 관련 문서: DESIGN.md (Transport Connection)
 * 테스트: tests/unit/task_test.cpp (평문 경로), 수동 점검 (TLS 서버)
 */
#pragma once

#include <openssl/ssl.h>

#include <memory>
#include <string>

#include "transport/stream.hpp"

namespace transport {

class TlsStream : public Stream {
   public:
    // fd 소유권을 가져간다. 실패하면 fd 는 닫히고 빈 포인터를 돌려준다.
    static std::unique_ptr<TlsStream> CreateClient(int fd, const std::string &host,
                                                   const Security &security,
                                                   ConnectionError &error);
    ~TlsStream();

    // kOk 면 완료, kWouldBlock 이면 HandshakeEvents 가 가리키는 이벤트를 기다린다.
    IoStatus Handshake(std::string &error);
    short HandshakeEvents() const;

    int Fd() const { return fd_; }
    bool IsSecure() const { return true; }
    IoStatus Read(char *buf, std::size_t len, std::size_t &n, std::string &error);
    IoStatus Write(const char *buf, std::size_t len, std::size_t &n, std::string &error);
    IoStatus Shutdown(std::string &error);
    bool WantsWrite() const { return want_write_; }

   private:
    TlsStream(int fd, SSL *ssl);
    TlsStream(const TlsStream &);
    TlsStream &operator=(const TlsStream &);

    IoStatus TranslateError(int ret, std::string &error);

    int fd_;
    SSL *ssl_;
    bool want_write_;
};

// 큐에 쌓인 OpenSSL 오류를 한 줄로 모은다.
std::string DrainOpenSslErrors();

}  // namespace transport
