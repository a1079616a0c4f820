/*
 * 설명: INI 설정 파일을 로드해 접속, 프록시, 파일 전송, 로깅 설정 구조체를 만든다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md (Configuration)
 * 테스트: tests/unit/config_parser_test.cpp
 */
#pragma once

#include <string>
#include <vector>

namespace config {

enum class LogLevel { kDebug = 0, kInfo = 1, kWarn = 2, kError = 3 };

enum class ProxyKind { kNone, kHttp, kSocks5 };

struct ServerSettings {
    std::string host;
    int port;
    std::string nickname;
    std::string username;
    std::string realname;
    bool tls;
    bool accept_invalid_certs;
    std::string root_cert_path;
    std::string client_cert_path;
    std::string client_key_path;

    ServerSettings();
};

struct ProxySettings {
    ProxyKind kind;
    std::string host;
    int port;
    std::string username;
    std::string password;

    ProxySettings();
};

struct FileTransferSettings {
    std::string save_directory;
    bool passive;
    std::size_t timeout_seconds;
    bool auto_accept;
    std::vector<std::string> auto_accept_nicks;
    // nick!user@host 와일드카드 마스크. 닉 목록과 함께 쓰면 둘 다 맞아야 한다.
    std::vector<std::string> auto_accept_masks;

    // public_address 와 포트 범위가 모두 있어야 리슨 서버가 켜진다.
    bool has_server;
    std::string public_address;
    std::string bind_address;
    int bind_port_first;
    int bind_port_last;

    FileTransferSettings();
};

struct Settings {
    LogLevel log_level;
    std::string log_file;
    ServerSettings server;
    ProxySettings proxy;
    FileTransferSettings file_transfer;

    Settings();
};

bool LoadFromFile(const std::string &path, Settings &out, std::string &error);
std::string LogLevelToString(LogLevel level);

}  // namespace config
