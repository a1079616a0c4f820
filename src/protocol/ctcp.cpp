/*
 * 설명: CTCP 구분자 처리와 질의 메시지 생성을 담당한다.
 * 버전: v0.1.0
 * 관련 문서: DESIGN.md (DCC Negotiation Decoder)
 * 테스트: tests/unit/dcc_test.cpp
 */
#include "protocol/ctcp.hpp"

#include <cctype>

namespace protocol {

bool ExtractCtcpPayload(const Message &message, std::string &payload) {
    if (message.command.raw) {
        return false;
    }
    if (message.command.verb != "PRIVMSG" && message.command.verb != "NOTICE") {
        return false;
    }
    if (message.command.params.size() < 2) {
        return false;
    }
    const std::string &text = message.command.params.back();
    if (text.size() <= 2 || text[0] != kCtcpDelimiter || text[text.size() - 1] != kCtcpDelimiter) {
        return false;
    }
    payload = text.substr(1, text.size() - 2);
    return true;
}

bool ParseCtcpQuery(const std::string &text, CtcpQuery &out) {
    std::string query = text;
    if (!query.empty() && query[query.size() - 1] == kCtcpDelimiter) {
        query.erase(query.size() - 1);
    }
    if (query.empty() || query[0] != kCtcpDelimiter) {
        return false;
    }
    query.erase(0, 1);

    std::size_t split = 0;
    while (split < query.size() && !std::isspace(static_cast<unsigned char>(query[split]))) {
        ++split;
    }
    out.command = query.substr(0, split);
    out.params = split < query.size() ? query.substr(split + 1) : std::string();
    return true;
}

Message FormatCtcpQuery(const std::string &target, const std::string &command,
                        const std::string &params) {
    std::string body(1, kCtcpDelimiter);
    body += command;
    if (!params.empty()) {
        body += " " + params;
    }
    body += kCtcpDelimiter;
    return MakeCommand("PRIVMSG", target, body);
}

}  // namespace protocol
