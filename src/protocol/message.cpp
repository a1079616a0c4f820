/*
 * 설명: IRC 라인을 tags/source/command 로 파싱한다. 문법을 벗어나거나 UTF-8 이 아니면 ParseError 를 돌려준다.
 * 버전: v0.4.0
 * 관련 문서: DESIGN.md (Message Codec)
 * 테스트: tests/unit/message_test.cpp
 */
#include "protocol/message.hpp"

#include <cctype>
#include <cstring>
#include <sstream>
#include <string>
#include <vector>

namespace {

bool IsLetter(char c) { return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z'); }
bool IsDigit(char c) { return c >= '0' && c <= '9'; }
bool IsAlnum(char c) { return IsLetter(c) || IsDigit(c); }

bool IsNickSpecial(char c) { return std::strchr("-[]\\`_^{|}*/@", c) != NULL && c != '\0'; }

bool IsNickChar(char c) { return IsAlnum(c) || IsNickSpecial(c); }

// NUL, CR, LF, ':' 과 공백을 제외한 문자
bool IsNoSpCrLfCl(char c) { return c != '\0' && c != '\r' && c != '\n' && c != ':' && c != ' '; }

class LineParser {
   public:
    explicit LineParser(const std::string &line) : line_(line), pos_(0) {}

    bool Parse(protocol::Message &out) {
        if (Peek() == '@') {
            ++pos_;
            if (!ParseTagList(out.tags)) {
                return false;
            }
            if (!SkipSpaces()) {
                return Fail("expected space after tags");
            }
        }
        if (Peek() == ':') {
            ++pos_;
            if (!ParseSource(out.source)) {
                return false;
            }
        }
        if (!ParseCommand(out.command)) {
            return false;
        }
        return ParseLineEnd();
    }

    bool ParseTagList(std::vector<protocol::Tag> &tags) {
        while (true) {
            protocol::Tag tag;
            if (!ParseTag(tag)) {
                return false;
            }
            bool duplicate = false;
            for (std::size_t i = 0; i < tags.size(); ++i) {
                if (tags[i].key == tag.key) {
                    tags[i] = tag;
                    duplicate = true;
                    break;
                }
            }
            if (!duplicate) {
                tags.push_back(tag);
            }
            if (Peek() != ';') {
                return true;
            }
            ++pos_;
        }
    }

    bool AtEnd() const { return pos_ >= line_.size(); }
    const std::string &diagnostic() const { return diagnostic_; }

   private:
    char Peek() const { return pos_ < line_.size() ? line_[pos_] : '\0'; }

    bool Fail(const std::string &what) {
        std::ostringstream oss;
        oss << what << " at offset " << pos_;
        diagnostic_ = oss.str();
        return false;
    }

    bool SkipSpaces() {
        std::size_t start = pos_;
        while (Peek() == ' ') {
            ++pos_;
        }
        return pos_ > start;
    }

    bool ParseTag(protocol::Tag &tag) {
        std::size_t start = pos_;
        if (Peek() == '+') {
            ++pos_;
        }
        // vendor 접두사는 '/' 앞까지
        std::size_t vendor_end = pos_;
        while (vendor_end < line_.size() && std::strchr("/ ;=", line_[vendor_end]) == NULL) {
            ++vendor_end;
        }
        if (vendor_end < line_.size() && line_[vendor_end] == '/' && vendor_end > pos_) {
            pos_ = vendor_end + 1;
        }
        std::size_t name_start = pos_;
        while (pos_ < line_.size() && (IsAlnum(line_[pos_]) || line_[pos_] == '-')) {
            ++pos_;
        }
        if (pos_ == name_start) {
            return Fail("expected tag key");
        }
        tag.key = line_.substr(start, pos_ - start);
        tag.has_value = false;
        tag.value.clear();

        if (Peek() != '=') {
            return true;
        }
        ++pos_;
        std::size_t value_start = pos_;
        while (pos_ < line_.size() && std::strchr("; \r\n", line_[pos_]) == NULL) {
            ++pos_;
        }
        if (pos_ > value_start) {
            tag.value = protocol::UnescapeTagValue(line_.substr(value_start, pos_ - value_start));
            tag.has_value = !tag.value.empty();
        }
        return true;
    }

    // ':' 이후 공백 전까지. 사용자 형식이 아니면 서버 이름으로 본다.
    bool ParseSource(protocol::Source &source) {
        std::size_t end = line_.find(' ', pos_);
        if (end == std::string::npos || end == pos_) {
            return Fail("expected source followed by space");
        }
        std::string token = line_.substr(pos_, end - pos_);
        for (std::size_t i = 0; i < token.size(); ++i) {
            if (token[i] == '\0' || token[i] == '\r' || token[i] == '\n') {
                return Fail("invalid character in source");
            }
        }

        protocol::User user;
        if (ParseUser(token, user)) {
            source.kind = protocol::Source::kUser;
            source.user = user;
        } else {
            source.kind = protocol::Source::kServer;
            source.server = token;
        }
        pos_ = end;
        SkipSpaces();
        return true;
    }

    static bool ParseUser(const std::string &token, protocol::User &user) {
        std::size_t nick_end = 0;

        // 브리지 닉네임(foo:matrix.org)은 ':' 과 '.' 을 모두 포함하고 '!' 로 끝나야 한다.
        std::size_t expanded = 0;
        while (expanded < token.size() &&
               (IsNickChar(token[expanded]) || token[expanded] == ':' || token[expanded] == '.')) {
            ++expanded;
        }
        std::string candidate = token.substr(0, expanded);
        if (expanded > 0 && expanded < token.size() && token[expanded] == '!' &&
            candidate.find(':') != std::string::npos && candidate.find('.') != std::string::npos) {
            nick_end = expanded;
        } else {
            while (nick_end < token.size() && IsNickChar(token[nick_end])) {
                ++nick_end;
            }
        }
        if (nick_end == 0) {
            return false;
        }

        std::size_t pos = nick_end;
        std::string username;
        bool has_username = false;
        if (pos < token.size() && token[pos] == '!') {
            std::size_t start = ++pos;
            while (pos < token.size() && token[pos] != '@') {
                ++pos;
            }
            if (pos == start) {
                return false;
            }
            username = token.substr(start, pos - start);
            has_username = true;
        }

        std::string hostname;
        bool has_hostname = false;
        if (pos < token.size() && token[pos] == '@') {
            ++pos;
            if (pos >= token.size()) {
                return false;
            }
            hostname = token.substr(pos);
            has_hostname = true;
            pos = token.size();
        }

        if (pos != token.size()) {
            return false;
        }

        user.nickname = token.substr(0, nick_end);
        user.username = username;
        user.has_username = has_username;
        user.hostname = hostname;
        user.has_hostname = has_hostname;
        return true;
    }

    bool ParseCommand(protocol::Command &command) {
        std::size_t start = pos_;
        if (IsLetter(Peek())) {
            while (IsLetter(Peek())) {
                ++pos_;
            }
        } else if (pos_ + 3 <= line_.size() && IsDigit(line_[pos_]) && IsDigit(line_[pos_ + 1]) &&
                   IsDigit(line_[pos_ + 2])) {
            pos_ += 3;
        } else {
            return Fail("expected command");
        }

        command.verb = line_.substr(start, pos_ - start);
        for (std::size_t i = 0; i < command.verb.size(); ++i) {
            command.verb[i] = static_cast<char>(std::toupper(static_cast<unsigned char>(command.verb[i])));
        }
        command.params.clear();
        command.raw = false;

        while (true) {
            std::size_t before = pos_;
            if (!SkipSpaces()) {
                return true;
            }
            char c = Peek();
            if (c == ':') {
                ++pos_;
                std::size_t trailing_start = pos_;
                while (pos_ < line_.size() && line_[pos_] != '\0' && line_[pos_] != '\r' &&
                       line_[pos_] != '\n') {
                    ++pos_;
                }
                command.params.push_back(line_.substr(trailing_start, pos_ - trailing_start));
                return true;
            }
            if (!IsNoSpCrLfCl(c)) {
                // 줄 끝 앞의 공백은 ParseLineEnd 가 처리한다.
                pos_ = before;
                return true;
            }
            std::size_t middle_start = pos_;
            while (pos_ < line_.size() && (IsNoSpCrLfCl(line_[pos_]) || line_[pos_] == ':')) {
                ++pos_;
            }
            command.params.push_back(line_.substr(middle_start, pos_ - middle_start));
        }
    }

    bool ParseLineEnd() {
        SkipSpaces();
        if (Peek() == '\r' && pos_ + 1 < line_.size() && line_[pos_ + 1] == '\r') {
            ++pos_;
        }
        if (Peek() != '\r' || pos_ + 1 >= line_.size() || line_[pos_ + 1] != '\n') {
            return Fail("expected CRLF");
        }
        pos_ += 2;
        if (!AtEnd()) {
            return Fail("unexpected data after CRLF");
        }
        return true;
    }

    const std::string &line_;
    std::size_t pos_;
    std::string diagnostic_;
};

bool SameLetter(char a, char b) {
    return std::tolower(static_cast<unsigned char>(a)) == std::tolower(static_cast<unsigned char>(b));
}

// '*' 는 0 개 이상, '?' 는 정확히 한 글자. 대소문자는 구분하지 않는다.
bool WildcardMatch(const std::string &pattern, const std::string &text) {
    std::size_t p = 0;
    std::size_t t = 0;
    std::size_t star = std::string::npos;
    std::size_t resume = 0;
    while (t < text.size()) {
        if (p < pattern.size() && (pattern[p] == '?' || SameLetter(pattern[p], text[t]))) {
            ++p;
            ++t;
        } else if (p < pattern.size() && pattern[p] == '*') {
            star = p++;
            resume = t;
        } else if (star != std::string::npos) {
            p = star + 1;
            t = ++resume;
        } else {
            return false;
        }
    }
    while (p < pattern.size() && pattern[p] == '*') {
        ++p;
    }
    return p == pattern.size();
}

}  // namespace

namespace protocol {

std::string ParseError::Describe() const {
    return "parsing failed: " + diagnostic + " in \"" + input + "\"";
}

bool IsValidUtf8(const std::string &text) {
    std::size_t i = 0;
    while (i < text.size()) {
        unsigned char c = static_cast<unsigned char>(text[i]);
        std::size_t extra = 0;
        unsigned int code = 0;
        if (c < 0x80) {
            ++i;
            continue;
        } else if ((c & 0xE0) == 0xC0) {
            extra = 1;
            code = c & 0x1F;
        } else if ((c & 0xF0) == 0xE0) {
            extra = 2;
            code = c & 0x0F;
        } else if ((c & 0xF8) == 0xF0) {
            extra = 3;
            code = c & 0x07;
        } else {
            return false;
        }
        if (i + extra >= text.size()) {
            return false;
        }
        for (std::size_t k = 1; k <= extra; ++k) {
            unsigned char cont = static_cast<unsigned char>(text[i + k]);
            if ((cont & 0xC0) != 0x80) {
                return false;
            }
            code = (code << 6) | (cont & 0x3F);
        }
        // overlong, surrogate, 범위 초과
        if ((extra == 1 && code < 0x80) || (extra == 2 && code < 0x800) ||
            (extra == 3 && code < 0x10000) || code > 0x10FFFF || (code >= 0xD800 && code <= 0xDFFF)) {
            return false;
        }
        i += extra + 1;
    }
    return true;
}

std::string UnescapeTagValue(const std::string &value) {
    std::string out;
    out.reserve(value.size());
    for (std::size_t i = 0; i < value.size(); ++i) {
        if (value[i] != '\\') {
            out.push_back(value[i]);
            continue;
        }
        if (i + 1 >= value.size()) {
            // 끝에 남은 '\' 는 버린다.
            break;
        }
        char next = value[++i];
        switch (next) {
            case ':':
                out.push_back(';');
                break;
            case 's':
                out.push_back(' ');
                break;
            case '\\':
                out.push_back('\\');
                break;
            case 'r':
                out.push_back('\r');
                break;
            case 'n':
                out.push_back('\n');
                break;
            default:
                out.push_back(next);
                break;
        }
    }
    return out;
}

bool ParseMessage(const std::string &line, Message &out, ParseError &error) {
    out = Message();
    if (!IsValidUtf8(line)) {
        error.input = line;
        error.diagnostic = "invalid utf-8 encoding";
        return false;
    }
    LineParser parser(line);
    if (!parser.Parse(out)) {
        error.input = line;
        error.diagnostic = parser.diagnostic();
        out = Message();
        return false;
    }
    return true;
}

bool ParseTags(const std::string &text, std::vector<Tag> &out, ParseError &error) {
    out.clear();
    LineParser parser(text);
    if (!parser.ParseTagList(out) || !parser.AtEnd()) {
        error.input = text;
        error.diagnostic = parser.diagnostic().empty() ? "unexpected data after tags" : parser.diagnostic();
        out.clear();
        return false;
    }
    return true;
}

Message MakeCommand(const std::string &verb, const std::vector<std::string> &params) {
    Message message;
    message.command.verb = verb;
    for (std::size_t i = 0; i < message.command.verb.size(); ++i) {
        message.command.verb[i] =
            static_cast<char>(std::toupper(static_cast<unsigned char>(message.command.verb[i])));
    }
    message.command.params = params;
    return message;
}

Message MakeCommand(const std::string &verb, const std::string &p1) {
    return MakeCommand(verb, std::vector<std::string>(1, p1));
}

Message MakeCommand(const std::string &verb, const std::string &p1, const std::string &p2) {
    std::vector<std::string> params;
    params.push_back(p1);
    params.push_back(p2);
    return MakeCommand(verb, params);
}

Message MakeRaw(const std::string &line) {
    Message message;
    message.command.verb = line;
    message.command.raw = true;
    return message;
}

Source ServerSource(const std::string &host) {
    Source source;
    source.kind = Source::kServer;
    source.server = host;
    return source;
}

Source UserSource(const std::string &nickname, const std::string &username,
                  const std::string &hostname) {
    Source source;
    source.kind = Source::kUser;
    source.user.nickname = nickname;
    source.user.username = username;
    source.user.has_username = !username.empty();
    source.user.hostname = hostname;
    source.user.has_hostname = !hostname.empty();
    return source;
}

const Tag *FindTag(const Message &message, const std::string &key) {
    for (std::size_t i = 0; i < message.tags.size(); ++i) {
        if (message.tags[i].key == key) {
            return &message.tags[i];
        }
    }
    return NULL;
}

std::string FormatMask(const User &user) {
    return user.nickname + "!" + user.username + "@" + user.hostname;
}

bool MatchesMask(const User &user, const std::string &mask) {
    return WildcardMatch(mask, FormatMask(user));
}

}  // namespace protocol
