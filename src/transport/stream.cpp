/*
 * 설명: 평문 TCP 스트림의 논블로킹 읽기/쓰기/반쪽 닫기와 연결 오류 문자열화.
 * 버전: v0.2.0
 * 관련 문서: DESIGN.md (Transport Connection)
 * 테스트: tests/unit/task_test.cpp
 */
#include "transport/stream.hpp"

#include <fcntl.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>

namespace transport {

std::string ConnectionError::Describe() const {
    switch (kind) {
        case kIo:
            return "io error: " + detail;
        case kTls:
            return "tls error: " + detail;
        case kProxy:
            return "proxy error: " + detail;
        case kClientCertificate:
            return "client certificate error: " + detail;
    }
    return detail;
}

bool SetNonBlocking(int fd) {
    int flags = fcntl(fd, F_GETFL, 0);
    if (flags < 0) {
        return false;
    }
    return fcntl(fd, F_SETFL, flags | O_NONBLOCK) == 0;
}

PlainStream::PlainStream(int fd) : fd_(fd) {}

PlainStream::~PlainStream() {
    if (fd_ >= 0) {
        close(fd_);
    }
}

IoStatus PlainStream::Read(char *buf, std::size_t len, std::size_t &n, std::string &error) {
    n = 0;
    while (true) {
        ssize_t ret = recv(fd_, buf, len, 0);
        if (ret > 0) {
            n = static_cast<std::size_t>(ret);
            return IoStatus::kOk;
        }
        if (ret == 0) {
            return IoStatus::kClosed;
        }
        if (errno == EINTR) {
            continue;
        }
        if (errno == EAGAIN || errno == EWOULDBLOCK) {
            return IoStatus::kWouldBlock;
        }
        error = std::strerror(errno);
        return IoStatus::kError;
    }
}

IoStatus PlainStream::Write(const char *buf, std::size_t len, std::size_t &n, std::string &error) {
    n = 0;
    while (true) {
        ssize_t ret = send(fd_, buf, len, MSG_NOSIGNAL);
        if (ret >= 0) {
            n = static_cast<std::size_t>(ret);
            return IoStatus::kOk;
        }
        if (errno == EINTR) {
            continue;
        }
        if (errno == EAGAIN || errno == EWOULDBLOCK) {
            return IoStatus::kWouldBlock;
        }
        error = std::strerror(errno);
        return IoStatus::kError;
    }
}

IoStatus PlainStream::Shutdown(std::string &error) {
    if (::shutdown(fd_, SHUT_WR) < 0 && errno != ENOTCONN) {
        error = std::strerror(errno);
        return IoStatus::kError;
    }
    return IoStatus::kOk;
}

}  // namespace transport
