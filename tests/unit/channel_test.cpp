/*
 * 설명: 용량 제한 큐의 가득 참, 양쪽 종료, 이동 후 상태를 확인한다.
 * 버전: v0.2.0
 * 관련 문서: DESIGN.md (Transfer Task Engine)
 * 테스트: 이 파일 자체
 */
#include "utils/channel.hpp"

#include <cassert>
#include <string>
#include <utility>

void TestCapacity() {
    utils::Sender<int> tx;
    utils::Receiver<int> rx;
    utils::MakeChannel(2, tx, rx);

    assert(tx.HasRoom());
    assert(tx.TrySend(1) == utils::SendStatus::kSent);
    assert(tx.TrySend(2) == utils::SendStatus::kSent);
    assert(!tx.HasRoom());
    assert(tx.TrySend(3) == utils::SendStatus::kFull);

    int value = 0;
    assert(rx.HasPending());
    assert(rx.TryReceive(value) && value == 1);
    assert(tx.HasRoom());
    assert(rx.TryReceive(value) && value == 2);
    assert(!rx.TryReceive(value));
    assert(!rx.IsFinished());
}

void TestSenderDropFinishesAfterDrain() {
    utils::Receiver<std::string> rx;
    {
        utils::Sender<std::string> tx;
        utils::MakeChannel(4, tx, rx);
        assert(tx.TrySend("last") == utils::SendStatus::kSent);
    }
    assert(!rx.IsFinished());
    std::string value;
    assert(rx.TryReceive(value) && value == "last");
    assert(rx.IsFinished());
}

void TestReceiverDropClosesSender() {
    utils::Sender<int> tx;
    {
        utils::Receiver<int> rx;
        utils::MakeChannel(1, tx, rx);
        assert(tx.TrySend(1) == utils::SendStatus::kSent);
        assert(!tx.HasRoom());
    }
    assert(tx.IsClosed());
    assert(tx.HasRoom());
    assert(tx.TrySend(2) == utils::SendStatus::kClosed);
}

void TestMove() {
    utils::Sender<int> tx;
    utils::Receiver<int> rx;
    utils::MakeChannel(1, tx, rx);

    utils::Receiver<int> moved(std::move(rx));
    assert(!rx.HasPending());
    assert(rx.IsFinished());
    assert(tx.TrySend(7) == utils::SendStatus::kSent);
    assert(moved.HasPending());

    utils::Sender<int> other;
    other = std::move(tx);
    assert(tx.IsClosed());
    assert(!other.IsClosed());

    int value = 0;
    assert(moved.TryReceive(value) && value == 7);
    other.Close();
    assert(moved.IsFinished());
}

void TestDefaultEndsAreClosed() {
    utils::Sender<int> tx;
    utils::Receiver<int> rx;
    assert(tx.TrySend(1) == utils::SendStatus::kClosed);
    assert(!tx.HasRoom());
    assert(rx.IsFinished());
}

int main() {
    TestCapacity();
    TestSenderDropFinishesAfterDrain();
    TestReceiverDropClosesSender();
    TestMove();
    TestDefaultEndsAreClosed();
    return 0;
}
