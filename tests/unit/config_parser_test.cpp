/*
 * 설명: INI 설정 파서가 기본값, 섹션별 값, 리슨 서버 검증과 오류 줄 번호를 올바르게 처리하는지 확인한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md (Configuration)
 * 테스트: 이 파일 자체
 */
#include "utils/config.hpp"

#include <cassert>
#include <cstdio>
#include <fstream>
#include <string>

namespace {
const char kConfigPath[] = "ircdcc_config_test.ini";

void WriteConfig(const std::string &body) {
    std::ofstream file(kConfigPath);
    file << body;
}

bool LoadWritten(const std::string &body, config::Settings &settings, std::string &error) {
    WriteConfig(body);
    bool ok = config::LoadFromFile(kConfigPath, settings, error);
    std::remove(kConfigPath);
    return ok;
}
}  // namespace

void TestDefaultsWhenFileMissing() {
    config::Settings settings;
    std::string error;
    bool ok = config::LoadFromFile("does_not_exist.ini", settings, error);
    assert(ok);
    assert(error.empty());
    assert(settings.log_level == config::LogLevel::kInfo);
    assert(settings.log_file.empty());
    assert(settings.server.port == 6667);
    assert(settings.server.username == "ircdcc");
    assert(!settings.server.tls);
    assert(settings.proxy.kind == config::ProxyKind::kNone);
    assert(settings.file_transfer.passive);
    assert(settings.file_transfer.timeout_seconds == 300);
    assert(!settings.file_transfer.auto_accept);
    assert(!settings.file_transfer.has_server);
    assert(settings.file_transfer.bind_address == "0.0.0.0");
}

void TestParseCustomValues() {
    config::Settings settings;
    std::string error;
    bool ok = LoadWritten(
        "# 주석\n"
        "[logging]\n"
        "level=WARN\n"
        "file=logs/ircdcc.log\n"
        "\n"
        "[server]\n"
        "host = irc.example.org\n"
        "port = 6697\n"
        "nickname = alice\n"
        "tls = yes\n"
        "root_cert_path = /etc/ssl/ca.pem\n"
        "[proxy]\n"
        "type=socks5\n"
        "host=127.0.0.1\n"
        "port=1080\n"
        "username=u\n"
        "password=p\n"
        "[file_transfer]\n"
        "save_directory=/tmp/downloads\n"
        "passive=false\n"
        "timeout=60\n"
        "auto_accept=true\n"
        "auto_accept_nicks=bob, carol ,,dave\n"
        "auto_accept_masks=*!*@*.example.org, bob!*@*\n"
        "public_address=203.0.113.10\n"
        "bind_port_first=5000\n"
        "bind_port_last=5010\n",
        settings, error);
    assert(ok);
    assert(error.empty());
    assert(settings.log_level == config::LogLevel::kWarn);
    assert(settings.log_file == "logs/ircdcc.log");
    assert(settings.server.host == "irc.example.org");
    assert(settings.server.port == 6697);
    assert(settings.server.nickname == "alice");
    assert(settings.server.tls);
    assert(settings.server.root_cert_path == "/etc/ssl/ca.pem");
    assert(settings.proxy.kind == config::ProxyKind::kSocks5);
    assert(settings.proxy.port == 1080);
    assert(settings.proxy.username == "u");
    assert(settings.proxy.password == "p");

    const config::FileTransferSettings &ft = settings.file_transfer;
    assert(ft.save_directory == "/tmp/downloads");
    assert(!ft.passive);
    assert(ft.timeout_seconds == 60);
    assert(ft.auto_accept);
    assert(ft.auto_accept_nicks.size() == 3);
    assert(ft.auto_accept_nicks[0] == "bob");
    assert(ft.auto_accept_nicks[1] == "carol");
    assert(ft.auto_accept_nicks[2] == "dave");
    assert(ft.auto_accept_masks.size() == 2);
    assert(ft.auto_accept_masks[0] == "*!*@*.example.org");
    assert(ft.auto_accept_masks[1] == "bob!*@*");
    assert(ft.has_server);
    assert(ft.public_address == "203.0.113.10");
    assert(ft.bind_port_first == 5000);
    assert(ft.bind_port_last == 5010);
}

void TestRejectInvalid() {
    config::Settings settings;
    std::string error;

    assert(!LoadWritten("[logging]\nlevel=verbose\n", settings, error));
    assert(error.find("(2)") != std::string::npos);

    error.clear();
    assert(!LoadWritten("[server]\nport=70000\n", settings, error));
    assert(!error.empty());

    error.clear();
    assert(!LoadWritten("[limits]\nmessages_per_5s=15\n", settings, error));
    assert(error.find("(2)") != std::string::npos);

    error.clear();
    assert(!LoadWritten("[server]\nmystery=1\n", settings, error));

    error.clear();
    assert(!LoadWritten("host=irc.example.org\n", settings, error));

    error.clear();
    assert(!LoadWritten("[file_transfer]\npublic_address=not-an-ip\n", settings, error));
}

void TestListenServerNeedsAllKeys() {
    config::Settings settings;
    std::string error;

    assert(!LoadWritten("[file_transfer]\npublic_address=10.0.0.1\nbind_port_first=5000\n",
                        settings, error));
    assert(!error.empty());

    error.clear();
    assert(!LoadWritten("[file_transfer]\npublic_address=10.0.0.1\n"
                        "bind_port_first=5010\nbind_port_last=5000\n",
                        settings, error));
    assert(!error.empty());

    error.clear();
    assert(!LoadWritten("[proxy]\ntype=http\n", settings, error));
    assert(!error.empty());
}

void TestLogLevelNames() {
    assert(config::LogLevelToString(config::LogLevel::kDebug) == "debug");
    assert(config::LogLevelToString(config::LogLevel::kError) == "error");
}

int main() {
    TestDefaultsWhenFileMissing();
    TestParseCustomValues();
    TestRejectInvalid();
    TestListenServerNeedsAllKeys();
    TestLogLevelNames();
    return 0;
}
