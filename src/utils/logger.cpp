/*
 * 설명: 로그 레벨 필터링, 시각 접두사, 파일/표준 오류 출력 전환을 담당한다.
 * 버전: v0.9.0
 * 관련 문서: DESIGN.md (Logging)
 * 테스트: tests/unit/manager_test.cpp
 */
#include "utils/logger.hpp"

#include <ctime>
#include <iostream>
#include <sstream>

namespace {
std::string Timestamp() {
    std::time_t now = std::time(NULL);
    std::tm parts;
    gmtime_r(&now, &parts);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &parts);
    return buf;
}
}  // namespace

Logger::Logger() : level_(config::LogLevel::kInfo) {}

void Logger::SetLevel(config::LogLevel level) { level_ = level; }

bool Logger::SetOutput(const std::string &path) {
    path_ = path;
    if (file_.is_open()) {
        file_.close();
    }

    if (!path.empty() && path != "-") {
        file_.open(path.c_str(), std::ios::out | std::ios::app);
        return file_.is_open();
    }
    return true;
}

void Logger::Log(config::LogLevel level, const std::string &message) {
    if (!IsEnabled(level)) {
        return;
    }
    std::ostringstream oss;
    oss << Timestamp() << " [" << config::LogLevelToString(level) << "] " << message;
    WriteLine(oss.str());
}

bool Logger::IsEnabled(config::LogLevel level) const {
    return static_cast<int>(level) >= static_cast<int>(level_);
}

void Logger::WriteLine(const std::string &line) {
    if (file_.is_open()) {
        file_ << line << '\n';
        file_.flush();
        return;
    }
    std::cerr << line << '\n';
}
