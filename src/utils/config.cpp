/*
 * 설명: INI 파일을 파싱해 클라이언트 설정을 생성하고 검증한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md (Configuration)
 * 테스트: tests/unit/config_parser_test.cpp
 */
#include "utils/config.hpp"

#include <arpa/inet.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace {
bool StartsWith(const std::string &text, char c) { return !text.empty() && text[0] == c; }

std::string Trim(const std::string &text) {
    std::size_t start = 0;
    while (start < text.size() && std::isspace(static_cast<unsigned char>(text[start]))) {
        ++start;
    }
    std::size_t end = text.size();
    while (end > start && std::isspace(static_cast<unsigned char>(text[end - 1]))) {
        --end;
    }
    return text.substr(start, end - start);
}

std::string ToLower(const std::string &text) {
    std::string lowered = text;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lowered;
}

bool ParseLogLevel(const std::string &raw, config::LogLevel &out) {
    const std::string lowered = ToLower(raw);
    if (lowered == "debug") {
        out = config::LogLevel::kDebug;
        return true;
    }
    if (lowered == "info") {
        out = config::LogLevel::kInfo;
        return true;
    }
    if (lowered == "warn") {
        out = config::LogLevel::kWarn;
        return true;
    }
    if (lowered == "error") {
        out = config::LogLevel::kError;
        return true;
    }
    return false;
}

bool ParsePositiveNumber(const std::string &raw, std::size_t &out) {
    if (raw.empty()) {
        return false;
    }
    char *end = NULL;
    unsigned long value = std::strtoul(raw.c_str(), &end, 10);
    if (end == NULL || *end != '\0' || raw[0] == '-') {
        return false;
    }
    out = static_cast<std::size_t>(value);
    return true;
}

bool ParsePort(const std::string &raw, int &out) {
    std::size_t number = 0;
    if (!ParsePositiveNumber(raw, number) || number == 0 || number > 65535) {
        return false;
    }
    out = static_cast<int>(number);
    return true;
}

bool ParseBool(const std::string &raw, bool &out) {
    const std::string lowered = ToLower(raw);
    if (lowered == "true" || lowered == "yes" || lowered == "1") {
        out = true;
        return true;
    }
    if (lowered == "false" || lowered == "no" || lowered == "0") {
        out = false;
        return true;
    }
    return false;
}

bool IsIpAddress(const std::string &raw) {
    unsigned char buf[sizeof(struct in6_addr)];
    return inet_pton(AF_INET, raw.c_str(), buf) == 1 || inet_pton(AF_INET6, raw.c_str(), buf) == 1;
}

std::vector<std::string> SplitList(const std::string &raw) {
    std::vector<std::string> items;
    std::istringstream iss(raw);
    std::string item;
    while (std::getline(iss, item, ',')) {
        item = Trim(item);
        if (!item.empty()) {
            items.push_back(item);
        }
    }
    return items;
}

std::string LineError(const std::string &what, std::size_t line_no) {
    std::ostringstream oss;
    oss << what << " (" << line_no << ")";
    return oss.str();
}

bool ApplyServerKey(const std::string &key, const std::string &value, config::ServerSettings &out) {
    if (key == "host") {
        out.host = value;
        return !value.empty();
    }
    if (key == "port") {
        return ParsePort(value, out.port);
    }
    if (key == "nickname") {
        out.nickname = value;
        return !value.empty();
    }
    if (key == "username") {
        out.username = value;
        return true;
    }
    if (key == "realname") {
        out.realname = value;
        return true;
    }
    if (key == "tls") {
        return ParseBool(value, out.tls);
    }
    if (key == "accept_invalid_certs") {
        return ParseBool(value, out.accept_invalid_certs);
    }
    if (key == "root_cert_path") {
        out.root_cert_path = value;
        return true;
    }
    if (key == "client_cert_path") {
        out.client_cert_path = value;
        return true;
    }
    if (key == "client_key_path") {
        out.client_key_path = value;
        return true;
    }
    return false;
}

bool ApplyProxyKey(const std::string &key, const std::string &value, config::ProxySettings &out) {
    if (key == "type") {
        const std::string lowered = ToLower(value);
        if (lowered == "http") {
            out.kind = config::ProxyKind::kHttp;
            return true;
        }
        if (lowered == "socks5") {
            out.kind = config::ProxyKind::kSocks5;
            return true;
        }
        return false;
    }
    if (key == "host") {
        out.host = value;
        return !value.empty();
    }
    if (key == "port") {
        return ParsePort(value, out.port);
    }
    if (key == "username") {
        out.username = value;
        return true;
    }
    if (key == "password") {
        out.password = value;
        return true;
    }
    return false;
}

bool ApplyFileTransferKey(const std::string &key, const std::string &value,
                          config::FileTransferSettings &out) {
    if (key == "save_directory") {
        out.save_directory = value;
        return true;
    }
    if (key == "passive") {
        return ParseBool(value, out.passive);
    }
    if (key == "timeout") {
        return ParsePositiveNumber(value, out.timeout_seconds) && out.timeout_seconds > 0;
    }
    if (key == "auto_accept") {
        return ParseBool(value, out.auto_accept);
    }
    if (key == "auto_accept_nicks") {
        out.auto_accept_nicks = SplitList(value);
        return true;
    }
    if (key == "auto_accept_masks") {
        out.auto_accept_masks = SplitList(value);
        return true;
    }
    if (key == "public_address") {
        out.public_address = value;
        return IsIpAddress(value);
    }
    if (key == "bind_address") {
        out.bind_address = value;
        return IsIpAddress(value);
    }
    if (key == "bind_port_first") {
        return ParsePort(value, out.bind_port_first);
    }
    if (key == "bind_port_last") {
        return ParsePort(value, out.bind_port_last);
    }
    return false;
}
}  // namespace

namespace config {

ServerSettings::ServerSettings()
    : port(6667), username("ircdcc"), realname("ircdcc"), tls(false), accept_invalid_certs(false) {}

ProxySettings::ProxySettings() : kind(ProxyKind::kNone), port(0) {}

FileTransferSettings::FileTransferSettings()
    : passive(true),
      timeout_seconds(300),
      auto_accept(false),
      has_server(false),
      bind_address("0.0.0.0"),
      bind_port_first(0),
      bind_port_last(0) {}

Settings::Settings() : log_level(LogLevel::kInfo) {}

bool LoadFromFile(const std::string &path, Settings &out, std::string &error) {
    Settings defaults;
    out = defaults;

    if (path.empty()) {
        return true;
    }

    std::ifstream file(path.c_str());
    if (!file.is_open()) {
        return true;
    }

    std::string section;
    std::string line;
    std::size_t line_no = 0;

    while (std::getline(file, line)) {
        ++line_no;
        std::string trimmed = Trim(line);
        if (trimmed.empty() || StartsWith(trimmed, '#') || StartsWith(trimmed, ';')) {
            continue;
        }

        if (StartsWith(trimmed, '[')) {
            if (trimmed.size() < 3 || trimmed[trimmed.size() - 1] != ']') {
                error = LineError("잘못된 섹션 선언", line_no);
                return false;
            }
            section = ToLower(trimmed.substr(1, trimmed.size() - 2));
            continue;
        }

        std::size_t eq_pos = trimmed.find('=');
        if (eq_pos == std::string::npos) {
            error = LineError("키=값 형식 오류", line_no);
            return false;
        }

        std::string key = ToLower(Trim(trimmed.substr(0, eq_pos)));
        std::string value = Trim(trimmed.substr(eq_pos + 1));
        if (section.empty()) {
            error = LineError("섹션 없음", line_no);
            return false;
        }

        bool ok = false;
        if (section == "logging" && key == "level") {
            ok = ParseLogLevel(value, out.log_level);
        } else if (section == "logging" && key == "file") {
            out.log_file = value;
            ok = true;
        } else if (section == "server") {
            ok = ApplyServerKey(key, value, out.server);
        } else if (section == "proxy") {
            ok = ApplyProxyKey(key, value, out.proxy);
        } else if (section == "file_transfer") {
            ok = ApplyFileTransferKey(key, value, out.file_transfer);
        } else {
            error = LineError("알 수 없는 섹션/키", line_no);
            return false;
        }

        if (!ok) {
            error = LineError(section + "." + key + " 오류", line_no);
            return false;
        }
    }

    if (out.proxy.kind != ProxyKind::kNone && (out.proxy.host.empty() || out.proxy.port == 0)) {
        error = "proxy.host 또는 proxy.port 누락";
        return false;
    }

    FileTransferSettings &ft = out.file_transfer;
    bool any_server_key = !ft.public_address.empty() || ft.bind_port_first != 0 || ft.bind_port_last != 0;
    if (any_server_key) {
        if (ft.public_address.empty() || ft.bind_port_first == 0 || ft.bind_port_last == 0) {
            error = "file_transfer.public_address, bind_port_first, bind_port_last 는 함께 지정해야 함";
            return false;
        }
        if (ft.bind_port_last < ft.bind_port_first) {
            error = "file_transfer.bind_port_last 는 bind_port_first 이상이어야 함";
            return false;
        }
        ft.has_server = true;
    }

    return true;
}

std::string LogLevelToString(LogLevel level) {
    switch (level) {
        case LogLevel::kDebug:
            return "debug";
        case LogLevel::kInfo:
            return "info";
        case LogLevel::kWarn:
            return "warn";
        case LogLevel::kError:
            return "error";
    }
    return "info";
}

}  // namespace config
