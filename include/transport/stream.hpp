/*
 * 설명: 평문 TCP 와 TLS 소켓을 같은 방식으로 다루기 위한 논블로킹 스트림 인터페이스.
 * 버전: v0.2.0
 * 관련 문서: DESIGN.md (Transport Connection)
 * 테스트: tests/unit/task_test.cpp
 */
#pragma once

#include <cstddef>
#include <string>

#include "transport/security.hpp"

namespace transport {

class Stream {
   public:
    virtual ~Stream() {}

    virtual int Fd() const = 0;
    virtual bool IsSecure() const = 0;
    // n 에 실제로 처리한 바이트 수를 남긴다. kClosed 는 상대가 닫았음을 뜻한다.
    virtual IoStatus Read(char *buf, std::size_t len, std::size_t &n, std::string &error) = 0;
    virtual IoStatus Write(const char *buf, std::size_t len, std::size_t &n, std::string &error) = 0;
    // 쓰기 방향만 닫는다. kWouldBlock 이면 다시 호출해야 한다.
    virtual IoStatus Shutdown(std::string &error) = 0;
    // TLS 재협상처럼 읽기를 진행하려면 쓰기 가능 이벤트가 필요한 경우.
    virtual bool WantsWrite() const { return false; }
};

class PlainStream : public Stream {
   public:
    explicit PlainStream(int fd);
    ~PlainStream();

    int Fd() const { return fd_; }
    bool IsSecure() const { return false; }
    IoStatus Read(char *buf, std::size_t len, std::size_t &n, std::string &error);
    IoStatus Write(const char *buf, std::size_t len, std::size_t &n, std::string &error);
    IoStatus Shutdown(std::string &error);

   private:
    PlainStream(const PlainStream &);
    PlainStream &operator=(const PlainStream &);

    int fd_;
};

bool SetNonBlocking(int fd);

}  // namespace transport
