/*
 * 설명: CTCP DCC SEND/SSEND 요청을 해석하고 직접/역방향 제안과 역방향 확인 메시지를 만든다.
 * 버전: v0.3.0
 * 관련 문서: DESIGN.md (DCC Negotiation Decoder)
 * 테스트: tests/unit/dcc_test.cpp
 */
#pragma once

#include <cstdint>
#include <string>

#include "protocol/message.hpp"

namespace dcc {

struct Send {
    enum Kind { kDirect, kReverse };

    Kind kind;
    bool secure;
    std::string filename;
    // 역방향 첫 제안에는 host/port 가 없다. port 가 0 이면 없음.
    std::string host;
    int port;
    std::uint64_t size;
    std::string token;

    Send() : kind(kDirect), secure(false), port(0), size(0) {}

    bool HasHost() const { return !host.empty(); }
    bool HasPort() const { return port != 0; }

    bool operator==(const Send &other) const {
        return kind == other.kind && secure == other.secure && filename == other.filename &&
               host == other.host && port == other.port && size == other.size &&
               token == other.token;
    }
};

Send MakeDirect(const std::string &filename, const std::string &host, int port,
                std::uint64_t size, bool secure);
Send MakeReverseOffer(const std::string &filename, const std::string &token, std::uint64_t size,
                      bool secure);
Send MakeReverseConfirmation(const std::string &filename, const std::string &host, int port,
                             std::uint64_t size, const std::string &token, bool secure);

// PRIVMSG/NOTICE 안의 CTCP DCC SEND 만 받아들인다. 형식이 어긋나면 false.
bool Decode(const protocol::Message &message, Send &out);
bool DecodePayload(const std::string &payload, Send &out);
protocol::Message Encode(const Send &send, const std::string &target);

// 32비트 정수 또는 IPv4/IPv6 리터럴을 표준 문자열 표기로 바꾼다.
bool DecodeHost(const std::string &token, std::string &out);

}  // namespace dcc
