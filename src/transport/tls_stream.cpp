/*
 * 설명: TLS 클라이언트 컨텍스트 구성(신뢰 루트, 추가 루트 인증서, 클라이언트 인증서)과 논블로킹 SSL 입출력.
 * 버전: v0.2.0
 * 관련 문서: DESIGN.md (Transport Connection)
 * 테스트: 수동 점검 (TLS 서버)
 */
#include "transport/tls_stream.hpp"

#include <arpa/inet.h>
#include <openssl/err.h>
#include <openssl/x509v3.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>

namespace {

int AcceptAnyCertificate(int, X509_STORE_CTX *) { return 1; }

bool IsIpLiteral(const std::string &host) {
    unsigned char buf[sizeof(struct in6_addr)];
    return inet_pton(AF_INET, host.c_str(), buf) == 1 || inet_pton(AF_INET6, host.c_str(), buf) == 1;
}

SSL_CTX *CreateContext(const transport::Security &security, transport::ConnectionError &error) {
    SSL_CTX *ctx = SSL_CTX_new(TLS_client_method());
    if (ctx == NULL) {
        error = transport::ConnectionError(transport::ConnectionError::kTls,
                                           "SSL_CTX_new 실패: " + transport::DrainOpenSslErrors());
        return NULL;
    }
    SSL_CTX_set_options(ctx, SSL_OP_IGNORE_UNEXPECTED_EOF);
    SSL_CTX_set_mode(ctx, SSL_MODE_ENABLE_PARTIAL_WRITE | SSL_MODE_ACCEPT_MOVING_WRITE_BUFFER);

    if (security.accept_invalid_certs) {
        SSL_CTX_set_verify(ctx, SSL_VERIFY_PEER, AcceptAnyCertificate);
    } else {
        SSL_CTX_set_verify(ctx, SSL_VERIFY_PEER, NULL);
        if (SSL_CTX_set_default_verify_paths(ctx) != 1) {
            error = transport::ConnectionError(transport::ConnectionError::kTls,
                                               "기본 신뢰 루트 로드 실패: " +
                                                   transport::DrainOpenSslErrors());
            SSL_CTX_free(ctx);
            return NULL;
        }
    }

    if (!security.root_cert_path.empty() &&
        SSL_CTX_load_verify_locations(ctx, security.root_cert_path.c_str(), NULL) != 1) {
        error = transport::ConnectionError(transport::ConnectionError::kTls,
                                           "루트 인증서 로드 실패 (" + security.root_cert_path +
                                               "): " + transport::DrainOpenSslErrors());
        SSL_CTX_free(ctx);
        return NULL;
    }

    if (!security.client_cert_path.empty()) {
        // 키 경로가 없으면 인증서 파일 안의 키를 쓴다.
        const std::string &key_path =
            security.client_key_path.empty() ? security.client_cert_path : security.client_key_path;
        if (SSL_CTX_use_certificate_chain_file(ctx, security.client_cert_path.c_str()) != 1 ||
            SSL_CTX_use_PrivateKey_file(ctx, key_path.c_str(), SSL_FILETYPE_PEM) != 1 ||
            SSL_CTX_check_private_key(ctx) != 1) {
            error = transport::ConnectionError(transport::ConnectionError::kClientCertificate,
                                               security.client_cert_path + ": " +
                                                   transport::DrainOpenSslErrors());
            SSL_CTX_free(ctx);
            return NULL;
        }
    }

    return ctx;
}

}  // namespace

namespace transport {

std::string DrainOpenSslErrors() {
    std::string out;
    unsigned long code = 0;
    while ((code = ERR_get_error()) != 0) {
        char buf[256];
        ERR_error_string_n(code, buf, sizeof(buf));
        if (!out.empty()) {
            out += "; ";
        }
        out += buf;
    }
    if (out.empty()) {
        out = "알 수 없는 오류";
    }
    return out;
}

std::unique_ptr<TlsStream> TlsStream::CreateClient(int fd, const std::string &host,
                                                   const Security &security,
                                                   ConnectionError &error) {
    SSL_CTX *ctx = CreateContext(security, error);
    if (ctx == NULL) {
        close(fd);
        return std::unique_ptr<TlsStream>();
    }

    SSL *ssl = SSL_new(ctx);
    // SSL 이 컨텍스트 참조를 잡고 있으므로 여기서 놓아도 된다.
    SSL_CTX_free(ctx);
    if (ssl == NULL) {
        error = ConnectionError(ConnectionError::kTls, "SSL_new 실패: " + DrainOpenSslErrors());
        close(fd);
        return std::unique_ptr<TlsStream>();
    }

    std::unique_ptr<TlsStream> stream(new TlsStream(fd, ssl));
    if (SSL_set_fd(ssl, fd) != 1) {
        error = ConnectionError(ConnectionError::kTls, "SSL_set_fd 실패: " + DrainOpenSslErrors());
        return std::unique_ptr<TlsStream>();
    }
    if (!IsIpLiteral(host)) {
        SSL_set_tlsext_host_name(ssl, host.c_str());
    }
    if (!security.accept_invalid_certs && SSL_set1_host(ssl, host.c_str()) != 1) {
        error = ConnectionError(ConnectionError::kTls, "호스트 이름 검증 설정 실패: " + host);
        return std::unique_ptr<TlsStream>();
    }
    SSL_set_connect_state(ssl);
    return stream;
}

TlsStream::TlsStream(int fd, SSL *ssl) : fd_(fd), ssl_(ssl), want_write_(false) {}

TlsStream::~TlsStream() {
    if (ssl_ != NULL) {
        SSL_free(ssl_);
    }
    if (fd_ >= 0) {
        close(fd_);
    }
}

IoStatus TlsStream::TranslateError(int ret, std::string &error) {
    int code = SSL_get_error(ssl_, ret);
    switch (code) {
        case SSL_ERROR_WANT_READ:
            want_write_ = false;
            return IoStatus::kWouldBlock;
        case SSL_ERROR_WANT_WRITE:
            want_write_ = true;
            return IoStatus::kWouldBlock;
        case SSL_ERROR_ZERO_RETURN:
            return IoStatus::kClosed;
        case SSL_ERROR_SYSCALL:
            if (errno == 0) {
                return IoStatus::kClosed;
            }
            error = std::strerror(errno);
            ERR_clear_error();
            return IoStatus::kError;
        default:
            break;
    }
    error = DrainOpenSslErrors();
    long verify = SSL_get_verify_result(ssl_);
    if (verify != X509_V_OK) {
        error += " (" + std::string(X509_verify_cert_error_string(verify)) + ")";
    }
    return IoStatus::kError;
}

IoStatus TlsStream::Handshake(std::string &error) {
    ERR_clear_error();
    errno = 0;
    int ret = SSL_do_handshake(ssl_);
    if (ret == 1) {
        want_write_ = false;
        return IoStatus::kOk;
    }
    IoStatus status = TranslateError(ret, error);
    if (status == IoStatus::kClosed) {
        error = "핸드셰이크 중 연결 종료";
        return IoStatus::kError;
    }
    return status;
}

short TlsStream::HandshakeEvents() const { return want_write_ ? POLLOUT : POLLIN; }

IoStatus TlsStream::Read(char *buf, std::size_t len, std::size_t &n, std::string &error) {
    n = 0;
    ERR_clear_error();
    errno = 0;
    std::size_t read = 0;
    int ret = SSL_read_ex(ssl_, buf, len, &read);
    if (ret == 1) {
        want_write_ = false;
        n = read;
        return IoStatus::kOk;
    }
    return TranslateError(ret, error);
}

IoStatus TlsStream::Write(const char *buf, std::size_t len, std::size_t &n, std::string &error) {
    n = 0;
    ERR_clear_error();
    errno = 0;
    std::size_t written = 0;
    int ret = SSL_write_ex(ssl_, buf, len, &written);
    if (ret == 1) {
        want_write_ = false;
        n = written;
        return IoStatus::kOk;
    }
    IoStatus status = TranslateError(ret, error);
    if (status == IoStatus::kClosed) {
        error = "연결 종료됨";
        return IoStatus::kError;
    }
    return status;
}

IoStatus TlsStream::Shutdown(std::string &error) {
    ERR_clear_error();
    errno = 0;
    int ret = SSL_shutdown(ssl_);
    if (ret < 0) {
        IoStatus status = TranslateError(ret, error);
        if (status != IoStatus::kWouldBlock) {
            // close_notify 를 못 보내도 TCP 반쪽 닫기는 진행한다.
            ::shutdown(fd_, SHUT_WR);
        }
        return status == IoStatus::kClosed ? IoStatus::kOk : status;
    }
    ::shutdown(fd_, SHUT_WR);
    return IoStatus::kOk;
}

}  // namespace transport
