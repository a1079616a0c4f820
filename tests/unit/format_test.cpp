/*
 * 설명: Message 직렬화가 태그 이스케이프, 출처, trailing 파라미터, 원문 명령과 길이 제한을 지키는지 확인한다.
 * 버전: v0.4.0
 * 관련 문서: DESIGN.md (Message Codec)
 * 테스트: 이 파일 자체
 */
#include "protocol/message.hpp"

#include <cassert>
#include <string>
#include <vector>

void TestPlainCommand() {
    assert(protocol::FormatMessage(protocol::MakeCommand("nick", "alice")) == "NICK alice\r\n");

    std::vector<std::string> params;
    params.push_back("ircdcc");
    params.push_back("0");
    params.push_back("*");
    params.push_back("Real Name");
    assert(protocol::FormatMessage(protocol::MakeCommand("USER", params)) ==
           "USER ircdcc 0 * :Real Name\r\n");
}

void TestTrailingPrefix() {
    assert(protocol::FormatMessage(protocol::MakeCommand("PRIVMSG", "bob", "")) ==
           "PRIVMSG bob :\r\n");
    assert(protocol::FormatMessage(protocol::MakeCommand("PRIVMSG", "bob", ":-)")) ==
           "PRIVMSG bob ::-)\r\n");
    assert(protocol::FormatMessage(protocol::MakeCommand("PRIVMSG", "bob", "hi")) ==
           "PRIVMSG bob hi\r\n");
}

void TestTagsAndSource() {
    protocol::Message message = protocol::MakeCommand("PRIVMSG", "#chan", "hello there");
    message.tags.push_back(protocol::Tag("label", "a b;c\\"));
    message.tags.push_back(protocol::Tag("flag"));
    message.source = protocol::UserSource("nick", "user", "host");
    assert(protocol::FormatMessage(message) ==
           "@label=a\\sb\\:c\\\\;flag :nick!user@host PRIVMSG #chan :hello there\r\n");

    message.tags.clear();
    message.source = protocol::ServerSource("irc.example.org");
    assert(protocol::FormatMessage(message) == ":irc.example.org PRIVMSG #chan :hello there\r\n");

    assert(protocol::FormatSource(protocol::UserSource("nick", "", "host")) == "nick@host");
}

void TestRawCommand() {
    protocol::Message raw = protocol::MakeRaw("PRIVMSG #chan :already formatted");
    assert(protocol::FormatMessage(raw) == "PRIVMSG #chan :already formatted\r\n");
}

void TestEscapeUnescape() {
    const std::string value = "semi;space \\back\r\n";
    std::string escaped = protocol::EscapeTagValue(value);
    assert(escaped == "semi\\:space\\s\\\\back\\r\\n");
    assert(protocol::UnescapeTagValue(escaped) == value);
}

void TestParsedLineFormatsBack() {
    const std::string line = "@id=1 :nick!u@h PRIVMSG #chan :hello world\r\n";
    protocol::Message message;
    protocol::ParseError error;
    assert(protocol::ParseMessage(line, message, error));
    assert(protocol::FormatMessage(message) == line);
}

void TestLineLimit() {
    // "PRIVMSG bob :" + 497 + CRLF = 512
    std::string body(496, 'x');
    std::string fits = protocol::FormatMessage(protocol::MakeCommand("PRIVMSG", "bob", body + " "));
    assert(fits.size() == 512);
    assert(protocol::FitsLineLimit(fits));

    std::string too_long =
        protocol::FormatMessage(protocol::MakeCommand("PRIVMSG", "bob", body + "  "));
    assert(too_long.size() == 513);
    assert(!protocol::FitsLineLimit(too_long));
}

int main() {
    TestPlainCommand();
    TestTrailingPrefix();
    TestTagsAndSource();
    TestRawCommand();
    TestEscapeUnescape();
    TestParsedLineFormatsBack();
    TestLineLimit();
    return 0;
}
