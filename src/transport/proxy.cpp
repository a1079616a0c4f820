/*
 * 설명: HTTP CONNECT(Basic 인증 선택)와 SOCKS5(무인증/사용자 인증, 도메인 주소) 협상 메시지를 만들고 응답을 해석한다.
 * 버전: v0.2.0
 * 관련 문서: DESIGN.md (Transport Connection)
 * 테스트: tests/unit/proxy_test.cpp
 */
#include "transport/proxy.hpp"

#include <openssl/evp.h>

#include <sstream>
#include <vector>

namespace {
const unsigned char kSocksVersion = 0x05;
const unsigned char kSocksNoAuth = 0x00;
const unsigned char kSocksUserPass = 0x02;
const unsigned char kSocksNoAcceptable = 0xFF;
const unsigned char kSocksConnect = 0x01;
const unsigned char kSocksDomain = 0x03;
const unsigned char kSocksIpv4 = 0x01;
const unsigned char kSocksIpv6 = 0x04;
const std::size_t kMaxHttpResponse = 8192;

std::string SocksReplyText(unsigned char code) {
    switch (code) {
        case 0x01:
            return "general failure";
        case 0x02:
            return "connection not allowed by ruleset";
        case 0x03:
            return "network unreachable";
        case 0x04:
            return "host unreachable";
        case 0x05:
            return "connection refused";
        case 0x06:
            return "TTL expired";
        case 0x07:
            return "command not supported";
        case 0x08:
            return "address type not supported";
        default:
            break;
    }
    std::ostringstream oss;
    oss << "reply code " << static_cast<int>(code);
    return oss.str();
}
}  // namespace

namespace transport {

std::string EncodeBase64(const std::string &input) {
    std::vector<unsigned char> out(4 * ((input.size() + 2) / 3) + 1);
    int len = EVP_EncodeBlock(&out[0], reinterpret_cast<const unsigned char *>(input.data()),
                              static_cast<int>(input.size()));
    return std::string(reinterpret_cast<const char *>(&out[0]), static_cast<std::size_t>(len));
}

ProxyHandshake::ProxyHandshake(const Proxy &proxy, const std::string &target_host, int target_port)
    : proxy_(proxy), target_host_(target_host), target_port_(target_port), stage_(kStageFailed) {
    if (proxy_.kind == Proxy::kHttp) {
        StartHttp();
    } else if (proxy_.kind == Proxy::kSocks5) {
        StartSocks();
    } else {
        failure_ = "프록시 종류 없음";
    }
}

bool ProxyHandshake::HasCredentials() const {
    return !proxy_.username.empty() && !proxy_.password.empty();
}

void ProxyHandshake::StartHttp() {
    std::ostringstream target;
    if (target_host_.find(':') != std::string::npos) {
        target << "[" << target_host_ << "]:" << target_port_;
    } else {
        target << target_host_ << ":" << target_port_;
    }

    std::ostringstream request;
    request << "CONNECT " << target.str() << " HTTP/1.1\r\n";
    request << "Host: " << target.str() << "\r\n";
    if (HasCredentials()) {
        request << "Proxy-Authorization: Basic "
                << EncodeBase64(proxy_.username + ":" + proxy_.password) << "\r\n";
    }
    request << "\r\n";

    outgoing_ = request.str();
    stage_ = kStageHttpResponse;
}

void ProxyHandshake::StartSocks() {
    if (target_host_.size() > 255) {
        failure_ = "SOCKS5 대상 호스트 이름이 255 바이트를 넘음";
        stage_ = kStageFailed;
        return;
    }
    outgoing_.push_back(static_cast<char>(kSocksVersion));
    if (HasCredentials()) {
        outgoing_.push_back(static_cast<char>(2));
        outgoing_.push_back(static_cast<char>(kSocksNoAuth));
        outgoing_.push_back(static_cast<char>(kSocksUserPass));
    } else {
        outgoing_.push_back(static_cast<char>(1));
        outgoing_.push_back(static_cast<char>(kSocksNoAuth));
    }
    stage_ = kStageSocksMethod;
}

void ProxyHandshake::QueueSocksConnect() {
    outgoing_.push_back(static_cast<char>(kSocksVersion));
    outgoing_.push_back(static_cast<char>(kSocksConnect));
    outgoing_.push_back(static_cast<char>(0x00));
    outgoing_.push_back(static_cast<char>(kSocksDomain));
    outgoing_.push_back(static_cast<char>(target_host_.size()));
    outgoing_ += target_host_;
    outgoing_.push_back(static_cast<char>((target_port_ >> 8) & 0xFF));
    outgoing_.push_back(static_cast<char>(target_port_ & 0xFF));
    stage_ = kStageSocksConnect;
}

void ProxyHandshake::ConsumeOutgoing(std::size_t n) {
    if (n >= outgoing_.size()) {
        outgoing_.clear();
    } else {
        outgoing_.erase(0, n);
    }
}

ProxyHandshake::Result ProxyHandshake::Fail(const std::string &reason, std::string &error) {
    stage_ = kStageFailed;
    error = reason;
    return kFailed;
}

ProxyHandshake::Result ProxyHandshake::Feed(const char *data, std::size_t len, std::string &error) {
    if (stage_ == kStageFailed) {
        return Fail(failure_.empty() ? "협상을 시작할 수 없음" : failure_, error);
    }
    if (stage_ == kStageDone) {
        leftover_.append(data, len);
        return kDone;
    }
    inbound_.append(data, len);
    if (proxy_.kind == Proxy::kHttp) {
        return StepHttp(error);
    }
    return StepSocks(error);
}

ProxyHandshake::Result ProxyHandshake::StepHttp(std::string &error) {
    std::size_t end = inbound_.find("\r\n\r\n");
    if (end == std::string::npos) {
        if (inbound_.size() > kMaxHttpResponse) {
            return Fail("HTTP 프록시 응답이 너무 김", error);
        }
        return kNeedMore;
    }

    std::string status_line = inbound_.substr(0, inbound_.find("\r\n"));
    // "HTTP/1.1 200 Connection established"
    std::istringstream iss(status_line);
    std::string version;
    int code = 0;
    iss >> version >> code;
    if (version.compare(0, 5, "HTTP/") != 0) {
        return Fail("HTTP 프록시 응답 형식 오류: " + status_line, error);
    }
    if (code < 200 || code > 299) {
        return Fail("HTTP 프록시 거부: " + status_line, error);
    }

    leftover_ = inbound_.substr(end + 4);
    inbound_.clear();
    stage_ = kStageDone;
    return kDone;
}

ProxyHandshake::Result ProxyHandshake::StepSocks(std::string &error) {
    while (true) {
        const unsigned char *bytes = reinterpret_cast<const unsigned char *>(inbound_.data());

        if (stage_ == kStageSocksMethod) {
            if (inbound_.size() < 2) {
                return kNeedMore;
            }
            if (bytes[0] != kSocksVersion) {
                return Fail("SOCKS5 버전 불일치", error);
            }
            unsigned char method = bytes[1];
            inbound_.erase(0, 2);
            if (method == kSocksNoAuth) {
                QueueSocksConnect();
            } else if (method == kSocksUserPass && HasCredentials()) {
                if (proxy_.username.size() > 255 || proxy_.password.size() > 255) {
                    return Fail("SOCKS5 인증 정보가 너무 김", error);
                }
                outgoing_.push_back(static_cast<char>(0x01));
                outgoing_.push_back(static_cast<char>(proxy_.username.size()));
                outgoing_ += proxy_.username;
                outgoing_.push_back(static_cast<char>(proxy_.password.size()));
                outgoing_ += proxy_.password;
                stage_ = kStageSocksAuth;
            } else if (method == kSocksNoAcceptable) {
                return Fail("SOCKS5 서버가 인증 방식을 거부함", error);
            } else {
                return Fail("SOCKS5 서버가 지원하지 않는 인증 방식을 선택함", error);
            }
            continue;
        }

        if (stage_ == kStageSocksAuth) {
            if (inbound_.size() < 2) {
                return kNeedMore;
            }
            if (bytes[1] != 0x00) {
                return Fail("SOCKS5 사용자 인증 실패", error);
            }
            inbound_.erase(0, 2);
            QueueSocksConnect();
            continue;
        }

        if (stage_ == kStageSocksConnect) {
            if (inbound_.size() < 5) {
                return kNeedMore;
            }
            if (bytes[0] != kSocksVersion) {
                return Fail("SOCKS5 버전 불일치", error);
            }
            if (bytes[1] != 0x00) {
                return Fail("SOCKS5 연결 거부: " + SocksReplyText(bytes[1]), error);
            }
            std::size_t address_len = 0;
            if (bytes[3] == kSocksIpv4) {
                address_len = 4;
            } else if (bytes[3] == kSocksIpv6) {
                address_len = 16;
            } else if (bytes[3] == kSocksDomain) {
                address_len = 1 + bytes[4];
            } else {
                return Fail("SOCKS5 응답 주소 형식 오류", error);
            }
            std::size_t total = 4 + address_len + 2;
            if (inbound_.size() < total) {
                return kNeedMore;
            }
            leftover_ = inbound_.substr(total);
            inbound_.clear();
            stage_ = kStageDone;
            return kDone;
        }

        return kDone;
    }
}

}  // namespace transport
