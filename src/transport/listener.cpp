/*
 * 설명: IPv4/IPv6 주소에 논블로킹 리스닝 소켓을 열고 첫 연결만 받아들인다.
 * 버전: v0.2.0
 * 관련 문서: DESIGN.md (Transport Connection)
 * 테스트: tests/unit/task_test.cpp
 */
#include "transport/listener.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>

namespace transport {

Listener::Listener() : fd_(-1) {}

Listener::~Listener() { Close(); }

void Listener::Close() {
    if (fd_ >= 0) {
        close(fd_);
        fd_ = -1;
    }
}

bool Listener::Bind(const std::string &address, int port, const Security &security,
                    ConnectionError &error) {
    if (security.secured) {
        error = ConnectionError(ConnectionError::kTls, "TLS 리스닝은 지원하지 않음");
        return false;
    }

    struct sockaddr_storage storage;
    std::memset(&storage, 0, sizeof(storage));
    socklen_t addr_len = 0;

    sockaddr_in *v4 = reinterpret_cast<sockaddr_in *>(&storage);
    sockaddr_in6 *v6 = reinterpret_cast<sockaddr_in6 *>(&storage);
    if (inet_pton(AF_INET, address.c_str(), &v4->sin_addr) == 1) {
        v4->sin_family = AF_INET;
        v4->sin_port = htons(static_cast<unsigned short>(port));
        addr_len = sizeof(sockaddr_in);
    } else if (inet_pton(AF_INET6, address.c_str(), &v6->sin6_addr) == 1) {
        v6->sin6_family = AF_INET6;
        v6->sin6_port = htons(static_cast<unsigned short>(port));
        addr_len = sizeof(sockaddr_in6);
    } else {
        error = ConnectionError(ConnectionError::kIo, "잘못된 바인드 주소: " + address);
        return false;
    }

    Close();
    fd_ = ::socket(storage.ss_family, SOCK_STREAM, 0);
    if (fd_ < 0) {
        error = ConnectionError(ConnectionError::kIo, std::string("소켓 생성 실패: ") + std::strerror(errno));
        return false;
    }

    SetNonBlocking(fd_);

    int opt = 1;
    setsockopt(fd_, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

    if (bind(fd_, reinterpret_cast<sockaddr *>(&storage), addr_len) < 0) {
        error = ConnectionError(ConnectionError::kIo, std::string("바인드 실패: ") + std::strerror(errno));
        Close();
        return false;
    }

    if (listen(fd_, 1) < 0) {
        error = ConnectionError(ConnectionError::kIo, std::string("리스닝 실패: ") + std::strerror(errno));
        Close();
        return false;
    }
    return true;
}

IoStatus Listener::Accept(std::unique_ptr<Stream> &out, ConnectionError &error) {
    if (fd_ < 0) {
        error = ConnectionError(ConnectionError::kIo, "리스너가 열려 있지 않음");
        return IoStatus::kError;
    }

    while (true) {
        int client_fd = accept(fd_, NULL, NULL);
        if (client_fd < 0) {
            if (errno == EINTR) {
                continue;
            }
            if (errno == EAGAIN || errno == EWOULDBLOCK) {
                return IoStatus::kWouldBlock;
            }
            error = ConnectionError(ConnectionError::kIo, std::string("accept 실패: ") + std::strerror(errno));
            return IoStatus::kError;
        }

        SetNonBlocking(client_fd);
        out.reset(new PlainStream(client_fd));
        Close();
        return IoStatus::kOk;
    }
}

int Listener::LocalPort() const {
    struct sockaddr_storage storage;
    socklen_t len = sizeof(storage);
    if (fd_ < 0 || getsockname(fd_, reinterpret_cast<sockaddr *>(&storage), &len) < 0) {
        return 0;
    }
    if (storage.ss_family == AF_INET6) {
        return ntohs(reinterpret_cast<sockaddr_in6 *>(&storage)->sin6_port);
    }
    return ntohs(reinterpret_cast<sockaddr_in *>(&storage)->sin_port);
}

}  // namespace transport
