/*
 * 설명: ircdcc 실행 진입점. 설정을 읽어 로거와 세션을 만들고 리액터를 돌린다.
 * 버전: v0.6.0
 * 관련 문서: DESIGN.md (Client Driver, Configuration)
 * 테스트: tests/unit/config_parser_test.cpp
 */
#include <csignal>
#include <exception>
#include <cstring>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

#include "client.hpp"
#include "net/reactor.hpp"
#include "utils/config.hpp"
#include "utils/logger.hpp"

namespace {
volatile std::sig_atomic_t g_quit_requested = 0;
volatile std::sig_atomic_t g_listing_requested = 0;

void HandleQuitSignal(int) { g_quit_requested = 1; }
void HandleListingSignal(int) { g_listing_requested = 1; }

void PrintUsage() {
    std::cerr << "사용법: ./ircdcc [config_path] [--send <nick> <path>]...\n";
}
}  // namespace

int main(int argc, char *argv[]) {
    std::string config_path = "config/ircdcc.ini";
    std::vector<std::pair<std::string, std::string> > sends;

    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--send") == 0) {
            if (i + 2 >= argc) {
                PrintUsage();
                return 1;
            }
            sends.push_back(std::make_pair(std::string(argv[i + 1]), std::string(argv[i + 2])));
            i += 2;
            continue;
        }
        if (argv[i][0] == '-') {
            PrintUsage();
            return 1;
        }
        config_path = argv[i];
    }

    config::Settings settings;
    std::string error;
    if (!config::LoadFromFile(config_path, settings, error)) {
        std::cerr << "설정 파일 오류: " << error << "\n";
        return 1;
    }

    Logger logger;
    logger.SetLevel(settings.log_level);
    if (!logger.SetOutput(settings.log_file)) {
        std::cerr << "로그 파일을 열 수 없음: " << settings.log_file << "\n";
        return 1;
    }

    std::signal(SIGPIPE, SIG_IGN);
    std::signal(SIGINT, HandleQuitSignal);
    std::signal(SIGTERM, HandleQuitSignal);
    std::signal(SIGUSR1, HandleListingSignal);

    try {
        net::Reactor reactor;
        ClientSession session(reactor, settings, logger);
        for (std::size_t i = 0; i < sends.size(); ++i) {
            session.QueueSend(sends[i].first, sends[i].second);
        }
        reactor.Add(&session);

        while (!session.Done()) {
            reactor.RunOnce(-1);
            if (g_quit_requested) {
                g_quit_requested = 0;
                logger.Info("종료 요청 수신");
                session.RequestQuit();
            }
            if (g_listing_requested) {
                g_listing_requested = 0;
                session.RequestListing();
            }
        }
        reactor.Remove(&session);
        return session.Failed() ? 1 : 0;
    } catch (const std::exception &ex) {
        logger.Error(std::string("실행 오류: ") + ex.what());
        return 1;
    }
}
