/*
 * 설명: Message 를 IRC 라인으로 직렬화한다. 길이 제한은 호출자가 FitsLineLimit 으로 확인한다.
 * 버전: v0.4.0
 * 관련 문서: DESIGN.md (Message Codec)
 * 테스트: tests/unit/format_test.cpp
 */
#include "protocol/message.hpp"

#include <string>

namespace {

bool NeedsTrailingPrefix(const std::string &param) {
    return param.empty() || param.find(' ') != std::string::npos || param[0] == ':';
}

}  // namespace

namespace protocol {

std::string EscapeTagValue(const std::string &value) {
    std::string out;
    out.reserve(value.size());
    for (std::size_t i = 0; i < value.size(); ++i) {
        switch (value[i]) {
            case '\\':
                out += "\\\\";
                break;
            case ';':
                out += "\\:";
                break;
            case ' ':
                out += "\\s";
                break;
            case '\r':
                out += "\\r";
                break;
            case '\n':
                out += "\\n";
                break;
            default:
                out.push_back(value[i]);
                break;
        }
    }
    return out;
}

std::string FormatSource(const Source &source) {
    switch (source.kind) {
        case Source::kServer:
            return source.server;
        case Source::kUser: {
            std::string out = source.user.nickname;
            if (source.user.has_username) {
                out += "!" + source.user.username;
            }
            if (source.user.has_hostname) {
                out += "@" + source.user.hostname;
            }
            return out;
        }
        case Source::kNone:
            break;
    }
    return "";
}

std::string FormatMessage(const Message &message) {
    std::string out;

    if (!message.tags.empty()) {
        out += "@";
        for (std::size_t i = 0; i < message.tags.size(); ++i) {
            if (i > 0) {
                out += ";";
            }
            out += message.tags[i].key;
            if (message.tags[i].has_value && !message.tags[i].value.empty()) {
                out += "=" + EscapeTagValue(message.tags[i].value);
            }
        }
        out += " ";
    }

    if (message.source.kind != Source::kNone) {
        out += ":" + FormatSource(message.source) + " ";
    }

    if (message.command.raw) {
        out += message.command.verb;
        out += "\r\n";
        return out;
    }

    out += message.command.verb;
    const std::vector<std::string> &params = message.command.params;
    for (std::size_t i = 0; i < params.size(); ++i) {
        out += " ";
        if (i + 1 == params.size() && NeedsTrailingPrefix(params[i])) {
            out += ":";
        }
        out += params[i];
    }
    out += "\r\n";
    return out;
}

bool FitsLineLimit(const std::string &encoded) { return encoded.size() <= kMaxLineLength; }

}  // namespace protocol
