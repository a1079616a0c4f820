/*
 * 설명: 단일 스레드 리액터 안에서 작업과 소유자 사이에 쓰는 용량 제한 단방향 큐.
 * 버전: v0.2.0
 * 관련 문서: DESIGN.md (Transfer Task Engine)
 * 테스트: tests/unit/channel_test.cpp
 */
#pragma once

#include <cstddef>
#include <deque>
#include <memory>
#include <utility>

namespace utils {

enum class SendStatus { kSent, kFull, kClosed };

template <typename T>
struct ChannelState {
    std::deque<T> items;
    std::size_t capacity;
    bool sender_alive;
    bool receiver_alive;

    explicit ChannelState(std::size_t cap) : capacity(cap), sender_alive(true), receiver_alive(true) {}
};

template <typename T>
class Sender {
   public:
    Sender() {}
    explicit Sender(const std::shared_ptr<ChannelState<T> > &state) : state_(state) {}
    Sender(Sender &&other) : state_(std::move(other.state_)) {}
    Sender &operator=(Sender &&other) {
        if (this != &other) {
            Close();
            state_ = std::move(other.state_);
        }
        return *this;
    }
    ~Sender() { Close(); }

    SendStatus TrySend(const T &item) {
        if (!state_ || !state_->receiver_alive) {
            return SendStatus::kClosed;
        }
        if (state_->items.size() >= state_->capacity) {
            return SendStatus::kFull;
        }
        state_->items.push_back(item);
        return SendStatus::kSent;
    }

    bool HasRoom() const {
        return state_ && (!state_->receiver_alive || state_->items.size() < state_->capacity);
    }

    bool IsClosed() const { return !state_ || !state_->receiver_alive; }

    void Close() {
        if (state_) {
            state_->sender_alive = false;
            state_.reset();
        }
    }

   private:
    Sender(const Sender &);
    Sender &operator=(const Sender &);

    std::shared_ptr<ChannelState<T> > state_;
};

template <typename T>
class Receiver {
   public:
    Receiver() {}
    explicit Receiver(const std::shared_ptr<ChannelState<T> > &state) : state_(state) {}
    Receiver(Receiver &&other) : state_(std::move(other.state_)) {}
    Receiver &operator=(Receiver &&other) {
        if (this != &other) {
            Close();
            state_ = std::move(other.state_);
        }
        return *this;
    }
    ~Receiver() { Close(); }

    bool TryReceive(T &out) {
        if (!state_ || state_->items.empty()) {
            return false;
        }
        out = state_->items.front();
        state_->items.pop_front();
        return true;
    }

    bool HasPending() const { return state_ && !state_->items.empty(); }

    // 송신측이 사라졌고 남은 항목도 없으면 더 받을 것이 없다.
    bool IsFinished() const { return !state_ || (!state_->sender_alive && state_->items.empty()); }

    void Close() {
        if (state_) {
            state_->receiver_alive = false;
            state_->items.clear();
            state_.reset();
        }
    }

   private:
    Receiver(const Receiver &);
    Receiver &operator=(const Receiver &);

    std::shared_ptr<ChannelState<T> > state_;
};

template <typename T>
void MakeChannel(std::size_t capacity, Sender<T> &sender, Receiver<T> &receiver) {
    std::shared_ptr<ChannelState<T> > state = std::make_shared<ChannelState<T> >(capacity);
    sender = Sender<T>(state);
    receiver = Receiver<T>(state);
}

}  // namespace utils
