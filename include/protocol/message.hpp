/*
 * 설명: IRC 메시지(tags/source/command) 구조체와 생성 헬퍼, 파싱/직렬화 진입점을 정의한다.
 * 버전: v0.4.0
 * 관련 문서: DESIGN.md (Message Codec)
 * 테스트: tests/unit/message_test.cpp, tests/unit/format_test.cpp
 */
#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace protocol {

// CRLF 포함 한 줄의 최대 길이.
const std::size_t kMaxLineLength = 512;

struct Tag {
    std::string key;
    std::string value;
    bool has_value;

    Tag() : has_value(false) {}
    // 빈 값은 값이 없는 태그와 같다. `key=` 도 `key` 로 읽힌다.
    Tag(const std::string &k, const std::string &v) : key(k), value(v), has_value(!v.empty()) {}
    explicit Tag(const std::string &k) : key(k), has_value(false) {}

    bool operator==(const Tag &other) const {
        return key == other.key && has_value == other.has_value && value == other.value;
    }
};

struct User {
    std::string nickname;
    std::string username;
    std::string hostname;
    bool has_username;
    bool has_hostname;

    User() : has_username(false), has_hostname(false) {}

    bool operator==(const User &other) const {
        return nickname == other.nickname && has_username == other.has_username &&
               username == other.username && has_hostname == other.has_hostname &&
               hostname == other.hostname;
    }
};

struct Source {
    enum Kind { kNone, kServer, kUser };

    Kind kind;
    std::string server;
    User user;

    Source() : kind(kNone) {}

    bool operator==(const Source &other) const {
        if (kind != other.kind) {
            return false;
        }
        if (kind == kServer) {
            return server == other.server;
        }
        if (kind == kUser) {
            return user == other.user;
        }
        return true;
    }
};

// raw 가 true 이면 verb 에 줄 본문 전체가 들어 있고 그대로 출력된다.
struct Command {
    std::string verb;
    std::vector<std::string> params;
    bool raw;

    Command() : raw(false) {}

    bool operator==(const Command &other) const {
        return raw == other.raw && verb == other.verb && params == other.params;
    }
};

struct Message {
    std::vector<Tag> tags;
    Source source;
    Command command;

    bool operator==(const Message &other) const {
        return tags == other.tags && source == other.source && command == other.command;
    }
    bool operator!=(const Message &other) const { return !(*this == other); }
};

struct ParseError {
    std::string input;
    std::string diagnostic;

    std::string Describe() const;
};

Message MakeCommand(const std::string &verb, const std::vector<std::string> &params);
Message MakeCommand(const std::string &verb, const std::string &p1);
Message MakeCommand(const std::string &verb, const std::string &p1, const std::string &p2);
Message MakeRaw(const std::string &line);

Source ServerSource(const std::string &host);
Source UserSource(const std::string &nickname, const std::string &username,
                  const std::string &hostname);

const Tag *FindTag(const Message &message, const std::string &key);

// 항상 nick!user@host 세 칸을 채운 형태. 빠진 부분은 빈 문자열.
std::string FormatMask(const User &user);
// `*!*@*.example.org` 같은 와일드카드 마스크와 대소문자 구분 없이 비교한다.
bool MatchesMask(const User &user, const std::string &mask);

// CRLF 로 끝나는 한 줄을 파싱한다. 실패 시 error 에 원문과 진단 메시지를 남긴다.
bool ParseMessage(const std::string &line, Message &out, ParseError &error);
bool ParseTags(const std::string &text, std::vector<Tag> &out, ParseError &error);

std::string FormatMessage(const Message &message);
std::string FormatSource(const Source &source);
bool FitsLineLimit(const std::string &encoded);

std::string EscapeTagValue(const std::string &value);
std::string UnescapeTagValue(const std::string &value);

bool IsValidUtf8(const std::string &text);

}  // namespace protocol
