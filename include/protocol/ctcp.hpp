/*
 * 설명: 0x01 로 감싼 CTCP 질의를 PRIVMSG/NOTICE 본문에서 꺼내고 다시 만든다.
 * 버전: v0.1.0
 * 관련 문서: DESIGN.md (DCC Negotiation Decoder)
 * 테스트: tests/unit/dcc_test.cpp
 */
#pragma once

#include <string>

#include "protocol/message.hpp"

namespace protocol {

const char kCtcpDelimiter = '\x01';

struct CtcpQuery {
    std::string command;
    std::string params;
};

// PRIVMSG/NOTICE 의 본문이 0x01 로 시작하고 끝나며 길이가 2 보다 커야 한다.
bool ExtractCtcpPayload(const Message &message, std::string &payload);
bool ParseCtcpQuery(const std::string &text, CtcpQuery &out);
Message FormatCtcpQuery(const std::string &target, const std::string &command,
                        const std::string &params);

}  // namespace protocol
