/*
 * 설명: poll 기반 단일 스레드 이벤트 루프. 세션과 전송 작업을 Pollable 로 등록해 협조적으로 실행한다.
 * 버전: v0.3.0
 * 관련 문서: DESIGN.md (Reactor)
 * 테스트: tests/unit/task_test.cpp
 */
#pragma once

#include <chrono>
#include <cstdint>
#include <vector>

namespace net {

typedef std::chrono::steady_clock Clock;

class Pollable {
   public:
    virtual ~Pollable() {}

    // 감시할 소켓이 없으면 -1.
    virtual int PollFd() const = 0;
    virtual short PollEvents() const = 0;
    // I/O 없이 바로 진행할 일이 있으면 true. 이번 반복만 poll 타임아웃이 0 이 된다.
    virtual bool Runnable() const { return false; }
    virtual bool HasDeadline() const { return false; }
    virtual Clock::time_point Deadline() const { return Clock::time_point(); }
    // revents 는 소켓 이벤트가 없으면 0.
    virtual void Resume(short revents) = 0;
    virtual bool Done() const = 0;
};

class Reactor {
   public:
    Reactor();

    void Add(Pollable *unit);
    void Remove(Pollable *unit);
    bool Contains(const Pollable *unit) const;
    std::size_t Size() const { return units_.size(); }

    // 한 번 poll 하고 준비된 단위를 재개한다. max_wait_ms 가 음수면 무기한 대기.
    void RunOnce(int max_wait_ms);
    // 등록된 단위가 없어질 때까지 실행한다.
    void Run();

   private:
    struct Entry {
        Pollable *unit;
        std::uint64_t serial;
    };

    bool IsRegistered(std::uint64_t serial) const;
    int ComputeTimeout(int max_wait_ms, Clock::time_point now) const;

    std::vector<Entry> units_;
    std::uint64_t next_serial_;
};

}  // namespace net
