/*
 * 설명: getaddrinfo 결과를 차례로 시도하는 논블로킹 connect 와 그 뒤의 프록시/TLS 단계를 구현한다.
 * 버전: v0.3.0
 * 관련 문서: DESIGN.md (Transport Connection)
 * 테스트: tests/unit/task_test.cpp
 */
#include "transport/connector.hpp"

#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <sstream>

namespace transport {

Connector::Connector(const std::string &host, int port, const Security &security, const Proxy &proxy)
    : host_(host),
      port_(port),
      security_(security),
      proxy_(proxy),
      stage_(kStart),
      addresses_(NULL),
      current_(NULL),
      fd_(-1) {}

Connector::~Connector() {
    CloseSocket();
    if (addresses_ != NULL) {
        freeaddrinfo(addresses_);
    }
}

void Connector::CloseSocket() {
    if (fd_ >= 0) {
        close(fd_);
        fd_ = -1;
    }
}

int Connector::Fd() const {
    if (tls_) {
        return tls_->Fd();
    }
    return fd_;
}

short Connector::PollEvents() const {
    switch (stage_) {
        case kConnecting:
            return POLLOUT;
        case kProxy:
            return handshake_ && !handshake_->Outgoing().empty() ? POLLOUT : POLLIN;
        case kTls:
            return tls_ ? tls_->HandshakeEvents() : 0;
        default:
            break;
    }
    return 0;
}

IoStatus Connector::Fail(const ConnectionError &cause, ConnectionError &error) {
    stage_ = kFailed;
    error = cause;
    CloseSocket();
    tls_.reset();
    return IoStatus::kError;
}

IoStatus Connector::Step(ConnectionError &error) {
    switch (stage_) {
        case kStart:
            return Resolve(error);
        case kConnecting: {
            int so_error = 0;
            socklen_t len = sizeof(so_error);
            if (getsockopt(fd_, SOL_SOCKET, SO_ERROR, &so_error, &len) < 0) {
                so_error = errno;
            }
            if (so_error == EINPROGRESS || so_error == EALREADY) {
                return IoStatus::kWouldBlock;
            }
            if (so_error != 0) {
                last_error_ = std::strerror(so_error);
                CloseSocket();
                current_ = current_->ai_next;
                return TryNextAddress(error);
            }
            return OnConnected(error);
        }
        case kProxy:
            return StepProxy(error);
        case kTls: {
            std::string detail;
            IoStatus status = tls_->Handshake(detail);
            if (status == IoStatus::kOk) {
                stage_ = kDone;
                return IoStatus::kOk;
            }
            if (status == IoStatus::kWouldBlock) {
                return status;
            }
            return Fail(ConnectionError(ConnectionError::kTls, detail), error);
        }
        case kDone:
            return IoStatus::kOk;
        case kFailed:
            break;
    }
    error = ConnectionError(ConnectionError::kIo, "연결 시도가 이미 실패함");
    return IoStatus::kError;
}

IoStatus Connector::Resolve(ConnectionError &error) {
    const bool via_proxy = proxy_.kind != Proxy::kNone;
    const std::string &connect_host = via_proxy ? proxy_.host : host_;
    const int connect_port = via_proxy ? proxy_.port : port_;

    std::ostringstream port_text;
    port_text << connect_port;

    struct addrinfo hints;
    std::memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_flags = AI_NUMERICSERV;

    int ret = getaddrinfo(connect_host.c_str(), port_text.str().c_str(), &hints, &addresses_);
    if (ret != 0) {
        addresses_ = NULL;
        return Fail(ConnectionError(ConnectionError::kIo,
                                    "이름 해석 실패 (" + connect_host + "): " + gai_strerror(ret)),
                    error);
    }
    current_ = addresses_;
    last_error_ = "주소 없음";
    return TryNextAddress(error);
}

IoStatus Connector::TryNextAddress(ConnectionError &error) {
    for (; current_ != NULL; current_ = current_->ai_next) {
        fd_ = ::socket(current_->ai_family, current_->ai_socktype, current_->ai_protocol);
        if (fd_ < 0) {
            last_error_ = std::strerror(errno);
            continue;
        }
        if (!SetNonBlocking(fd_)) {
            last_error_ = std::strerror(errno);
            CloseSocket();
            continue;
        }
        if (connect(fd_, current_->ai_addr, current_->ai_addrlen) == 0) {
            return OnConnected(error);
        }
        if (errno == EINPROGRESS) {
            stage_ = kConnecting;
            return IoStatus::kWouldBlock;
        }
        last_error_ = std::strerror(errno);
        CloseSocket();
    }
    return Fail(ConnectionError(ConnectionError::kIo, "연결 실패: " + last_error_), error);
}

IoStatus Connector::OnConnected(ConnectionError &error) {
    freeaddrinfo(addresses_);
    addresses_ = NULL;
    current_ = NULL;

    if (proxy_.kind != Proxy::kNone) {
        handshake_.reset(new ProxyHandshake(proxy_, host_, port_));
        if (handshake_->IsFailed()) {
            return Fail(ConnectionError(ConnectionError::kProxy, handshake_->FailureReason()),
                        error);
        }
        stage_ = kProxy;
        return StepProxy(error);
    }
    return StartTls(error);
}

IoStatus Connector::StepProxy(ConnectionError &error) {
    while (true) {
        while (!handshake_->Outgoing().empty()) {
            const std::string &out = handshake_->Outgoing();
            ssize_t n = send(fd_, out.data(), out.size(), MSG_NOSIGNAL);
            if (n < 0) {
                if (errno == EINTR) {
                    continue;
                }
                if (errno == EAGAIN || errno == EWOULDBLOCK) {
                    return IoStatus::kWouldBlock;
                }
                return Fail(ConnectionError(ConnectionError::kIo, std::strerror(errno)), error);
            }
            handshake_->ConsumeOutgoing(static_cast<std::size_t>(n));
        }

        if (handshake_->IsDone()) {
            if (security_.secured && !handshake_->Leftover().empty()) {
                return Fail(ConnectionError(ConnectionError::kProxy, "TLS 시작 전에 예상치 못한 데이터"),
                            error);
            }
            return StartTls(error);
        }

        char buf[512];
        ssize_t n = recv(fd_, buf, sizeof(buf), 0);
        if (n == 0) {
            return Fail(ConnectionError(ConnectionError::kProxy, "프록시가 연결을 닫음"), error);
        }
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            if (errno == EAGAIN || errno == EWOULDBLOCK) {
                return IoStatus::kWouldBlock;
            }
            return Fail(ConnectionError(ConnectionError::kIo, std::strerror(errno)), error);
        }

        std::string detail;
        if (handshake_->Feed(buf, static_cast<std::size_t>(n), detail) == ProxyHandshake::kFailed) {
            return Fail(ConnectionError(ConnectionError::kProxy, detail), error);
        }
    }
}

IoStatus Connector::StartTls(ConnectionError &error) {
    if (!security_.secured) {
        stage_ = kDone;
        return IoStatus::kOk;
    }

    ConnectionError cause;
    int fd = fd_;
    fd_ = -1;
    tls_ = TlsStream::CreateClient(fd, host_, security_, cause);
    if (!tls_) {
        return Fail(cause, error);
    }
    stage_ = kTls;
    return Step(error);
}

std::unique_ptr<Stream> Connector::TakeStream(std::string &initial_data) {
    initial_data.clear();
    if (stage_ != kDone) {
        return std::unique_ptr<Stream>();
    }
    if (handshake_) {
        initial_data = handshake_->Leftover();
    }
    stage_ = kFailed;
    if (tls_) {
        return std::unique_ptr<Stream>(tls_.release());
    }
    std::unique_ptr<Stream> stream(new PlainStream(fd_));
    fd_ = -1;
    return stream;
}

}  // namespace transport
