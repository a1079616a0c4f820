/*
 * 설명: 지정 주소/포트에 바인드하고 인바운드 연결 하나만 받는 DCC 용 리스너.
 * 버전: v0.2.0
 * 관련 문서: DESIGN.md (Transport Connection)
 * 테스트: tests/unit/task_test.cpp
 */
#pragma once

#include <memory>
#include <string>

#include "transport/security.hpp"
#include "transport/stream.hpp"

namespace transport {

class Listener {
   public:
    Listener();
    ~Listener();

    // Secured 는 지원하지 않으므로 오류를 돌려준다. port 가 0 이면 커널이 고른다.
    bool Bind(const std::string &address, int port, const Security &security,
              ConnectionError &error);
    // kOk 면 out 에 연결이 담기고 리스닝 소켓은 닫힌다.
    IoStatus Accept(std::unique_ptr<Stream> &out, ConnectionError &error);

    int Fd() const { return fd_; }
    int LocalPort() const;

   private:
    Listener(const Listener &);
    Listener &operator=(const Listener &);

    void Close();

    int fd_;
};

}  // namespace transport
