/*
 * 설명: 로그 레벨과 출력 경로를 제어하는 로거. 세션과 전송 관리자가 공유한다.
 * 버전: v0.9.0
 * 관련 문서: DESIGN.md (Logging)
 * 테스트: tests/unit/config_parser_test.cpp (설정 적용 경로), tests/unit/manager_test.cpp
 */
#pragma once

#include <fstream>
#include <string>

#include "utils/config.hpp"

class Logger {
   public:
    Logger();

    void SetLevel(config::LogLevel level);
    bool SetOutput(const std::string &path);
    void Log(config::LogLevel level, const std::string &message);
    bool IsEnabled(config::LogLevel level) const;

    void Debug(const std::string &message) { Log(config::LogLevel::kDebug, message); }
    void Info(const std::string &message) { Log(config::LogLevel::kInfo, message); }
    void Warn(const std::string &message) { Log(config::LogLevel::kWarn, message); }
    void Error(const std::string &message) { Log(config::LogLevel::kError, message); }

   private:
    config::LogLevel level_;
    std::string path_;
    std::ofstream file_;

    void WriteLine(const std::string &line);
};
