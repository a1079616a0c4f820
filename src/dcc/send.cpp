/*
 * 설명: DCC SEND 페이로드 토큰 해석(파일명 따옴표, 정수/리터럴 호스트, 역방향 토큰)과 인코딩.
 * 버전: v0.3.0
 * 관련 문서: DESIGN.md (DCC Negotiation Decoder)
 * 테스트: tests/unit/dcc_test.cpp
 */
#include "dcc/send.hpp"

#include <arpa/inet.h>

#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <sstream>
#include <vector>

#include "protocol/ctcp.hpp"

namespace {

std::vector<std::string> SplitWhitespace(const std::string &text) {
    std::vector<std::string> tokens;
    std::istringstream iss(text);
    std::string token;
    while (iss >> token) {
        tokens.push_back(token);
    }
    return tokens;
}

std::string ToLower(const std::string &text) {
    std::string out = text;
    for (std::size_t i = 0; i < out.size(); ++i) {
        out[i] = static_cast<char>(std::tolower(static_cast<unsigned char>(out[i])));
    }
    return out;
}

bool IsAllDigits(const std::string &text) {
    if (text.empty()) {
        return false;
    }
    for (std::size_t i = 0; i < text.size(); ++i) {
        if (!std::isdigit(static_cast<unsigned char>(text[i]))) {
            return false;
        }
    }
    return true;
}

bool ParseUnsigned(const std::string &text, std::uint64_t max, std::uint64_t &out) {
    if (!IsAllDigits(text) || text.size() > 20) {
        return false;
    }
    char *end = NULL;
    errno = 0;
    unsigned long long value = std::strtoull(text.c_str(), &end, 10);
    if (errno == ERANGE || end == NULL || *end != '\0' || value > max) {
        return false;
    }
    out = static_cast<std::uint64_t>(value);
    return true;
}

bool ParsePort(const std::string &text, int &out) {
    std::uint64_t value = 0;
    if (!ParseUnsigned(text, 65535, value)) {
        return false;
    }
    out = static_cast<int>(value);
    return true;
}

// 첫 토큰이 따옴표로 시작하면 닫는 따옴표가 있는 토큰까지 이어 붙인다.
bool TakeFilename(const std::vector<std::string> &tokens, std::size_t &pos, std::string &out) {
    if (pos >= tokens.size()) {
        return false;
    }
    const std::string &first = tokens[pos];
    if (first[0] != '"') {
        out = first;
        ++pos;
        return true;
    }

    std::string joined = first;
    std::size_t i = pos;
    while (joined.size() < 2 || joined[joined.size() - 1] != '"') {
        ++i;
        if (i >= tokens.size()) {
            return false;
        }
        joined += " " + tokens[i];
    }
    out = joined.substr(1, joined.size() - 2);
    if (out.empty()) {
        return false;
    }
    pos = i + 1;
    return true;
}

std::string QuoteFilename(const std::string &filename) {
    if (filename.find(' ') == std::string::npos) {
        return filename;
    }
    return "\"" + filename + "\"";
}

std::string EncodeHost(const std::string &host) {
    std::string decoded;
    if (dcc::DecodeHost(host, decoded)) {
        return decoded;
    }
    return host;
}

}  // namespace

namespace dcc {

Send MakeDirect(const std::string &filename, const std::string &host, int port,
                std::uint64_t size, bool secure) {
    Send send;
    send.kind = Send::kDirect;
    send.secure = secure;
    send.filename = filename;
    send.host = host;
    send.port = port;
    send.size = size;
    return send;
}

Send MakeReverseOffer(const std::string &filename, const std::string &token, std::uint64_t size,
                      bool secure) {
    Send send;
    send.kind = Send::kReverse;
    send.secure = secure;
    send.filename = filename;
    send.size = size;
    send.token = token;
    return send;
}

Send MakeReverseConfirmation(const std::string &filename, const std::string &host, int port,
                             std::uint64_t size, const std::string &token, bool secure) {
    Send send = MakeReverseOffer(filename, token, size, secure);
    send.host = host;
    send.port = port;
    return send;
}

bool DecodeHost(const std::string &token, std::string &out) {
    if (IsAllDigits(token)) {
        std::uint64_t value = 0;
        if (!ParseUnsigned(token, 0xFFFFFFFFULL, value)) {
            return false;
        }
        struct in_addr addr;
        addr.s_addr = htonl(static_cast<std::uint32_t>(value));
        char buf[INET_ADDRSTRLEN];
        if (inet_ntop(AF_INET, &addr, buf, sizeof(buf)) == NULL) {
            return false;
        }
        out = buf;
        return true;
    }

    unsigned char raw[sizeof(struct in6_addr)];
    if (inet_pton(AF_INET, token.c_str(), raw) == 1) {
        char buf[INET_ADDRSTRLEN];
        if (inet_ntop(AF_INET, raw, buf, sizeof(buf)) == NULL) {
            return false;
        }
        out = buf;
        return true;
    }
    if (inet_pton(AF_INET6, token.c_str(), raw) == 1) {
        char buf[INET6_ADDRSTRLEN];
        if (inet_ntop(AF_INET6, raw, buf, sizeof(buf)) == NULL) {
            return false;
        }
        out = buf;
        return true;
    }
    return false;
}

bool DecodePayload(const std::string &payload, Send &out) {
    std::vector<std::string> tokens = SplitWhitespace(payload);
    if (tokens.size() < 2 || tokens[0] != "DCC") {
        return false;
    }

    Send send;
    const std::string verb = ToLower(tokens[1]);
    if (verb == "send") {
        send.secure = false;
    } else if (verb == "ssend") {
        send.secure = true;
    } else {
        return false;
    }

    std::size_t pos = 2;
    if (!TakeFilename(tokens, pos, send.filename)) {
        return false;
    }
    if (pos >= tokens.size()) {
        return false;
    }

    // DCC SEND f 0 token size
    if (tokens[pos] == "0") {
        if (tokens.size() != pos + 3) {
            return false;
        }
        send.kind = Send::kReverse;
        send.token = tokens[pos + 1];
        if (!ParseUnsigned(tokens[pos + 2], ~static_cast<std::uint64_t>(0), send.size)) {
            return false;
        }
        out = send;
        return true;
    }

    // DCC SEND f host port size [token]
    if (tokens.size() != pos + 3 && tokens.size() != pos + 4) {
        return false;
    }
    if (!DecodeHost(tokens[pos], send.host)) {
        return false;
    }
    if (!ParsePort(tokens[pos + 1], send.port)) {
        return false;
    }
    if (!ParseUnsigned(tokens[pos + 2], ~static_cast<std::uint64_t>(0), send.size)) {
        return false;
    }

    if (tokens.size() == pos + 4) {
        send.kind = Send::kReverse;
        send.token = tokens[pos + 3];
    } else {
        if (send.port == 0) {
            return false;
        }
        send.kind = Send::kDirect;
    }
    out = send;
    return true;
}

bool Decode(const protocol::Message &message, Send &out) {
    std::string payload;
    if (!protocol::ExtractCtcpPayload(message, payload)) {
        return false;
    }
    return DecodePayload(payload, out);
}

protocol::Message Encode(const Send &send, const std::string &target) {
    std::ostringstream params;
    params << QuoteFilename(send.filename) << " ";
    if (send.kind == Send::kReverse && !send.HasHost()) {
        params << "0 " << send.token << " " << send.size;
    } else {
        params << EncodeHost(send.host) << " " << send.port << " " << send.size;
        if (send.kind == Send::kReverse) {
            params << " " << send.token;
        }
    }
    return protocol::FormatCtcpQuery(target, "DCC", std::string(send.secure ? "SSEND " : "SEND ") +
                                                        params.str());
}

}  // namespace dcc
