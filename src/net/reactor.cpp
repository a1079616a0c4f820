/*
 * 설명: Pollable 목록으로 pollfd 배열과 타임아웃을 계산하고, 준비된 단위만 재개한다.
 * 버전: v0.3.0
 * 관련 문서: DESIGN.md (Reactor)
 * 테스트: tests/unit/task_test.cpp
 */
#include "net/reactor.hpp"

#include <poll.h>

#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <string>

namespace net {

Reactor::Reactor() : next_serial_(1) {}

void Reactor::Add(Pollable *unit) {
    if (unit == NULL || Contains(unit)) {
        return;
    }
    Entry entry;
    entry.unit = unit;
    entry.serial = next_serial_++;
    units_.push_back(entry);
}

void Reactor::Remove(Pollable *unit) {
    for (std::size_t i = 0; i < units_.size(); ++i) {
        if (units_[i].unit == unit) {
            units_.erase(units_.begin() + i);
            return;
        }
    }
}

bool Reactor::Contains(const Pollable *unit) const {
    for (std::size_t i = 0; i < units_.size(); ++i) {
        if (units_[i].unit == unit) {
            return true;
        }
    }
    return false;
}

bool Reactor::IsRegistered(std::uint64_t serial) const {
    for (std::size_t i = 0; i < units_.size(); ++i) {
        if (units_[i].serial == serial) {
            return true;
        }
    }
    return false;
}

int Reactor::ComputeTimeout(int max_wait_ms, Clock::time_point now) const {
    long timeout = max_wait_ms;
    for (std::size_t i = 0; i < units_.size(); ++i) {
        const Pollable *unit = units_[i].unit;
        if (unit->Runnable()) {
            return 0;
        }
        if (!unit->HasDeadline()) {
            continue;
        }
        Clock::time_point deadline = unit->Deadline();
        long remaining = 0;
        if (deadline > now) {
            // 올림해서 마감 직전에 깨어나 다시 잠드는 일을 막는다.
            remaining = static_cast<long>(
                std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now).count() + 1);
        }
        if (timeout < 0 || remaining < timeout) {
            timeout = remaining;
        }
    }
    return static_cast<int>(timeout);
}

void Reactor::RunOnce(int max_wait_ms) {
    std::vector<Entry> snapshot = units_;
    std::vector<struct pollfd> fds;
    std::vector<int> fd_index(snapshot.size(), -1);

    for (std::size_t i = 0; i < snapshot.size(); ++i) {
        int fd = snapshot[i].unit->PollFd();
        short events = snapshot[i].unit->PollEvents();
        if (fd < 0 || events == 0) {
            continue;
        }
        struct pollfd pfd;
        pfd.fd = fd;
        pfd.events = events;
        pfd.revents = 0;
        fd_index[i] = static_cast<int>(fds.size());
        fds.push_back(pfd);
    }

    int timeout = ComputeTimeout(max_wait_ms, Clock::now());
    int ret = poll(fds.empty() ? NULL : &fds[0], fds.size(), timeout);
    if (ret < 0) {
        if (errno == EINTR) {
            return;
        }
        throw std::runtime_error(std::string("poll 실패: ") + std::strerror(errno));
    }

    Clock::time_point now = Clock::now();
    for (std::size_t i = 0; i < snapshot.size(); ++i) {
        // 앞선 단위가 이 단위를 제거했을 수 있다.
        if (!IsRegistered(snapshot[i].serial)) {
            continue;
        }
        Pollable *unit = snapshot[i].unit;
        short revents = fd_index[i] >= 0 ? fds[fd_index[i]].revents : 0;
        bool expired = unit->HasDeadline() && unit->Deadline() <= now;
        if (revents == 0 && !expired && !unit->Runnable()) {
            continue;
        }

        unit->Resume(revents);

        if (IsRegistered(snapshot[i].serial) && unit->Done()) {
            Remove(unit);
        }
    }
}

void Reactor::Run() {
    while (!units_.empty()) {
        RunOnce(-1);
    }
}

}  // namespace net
