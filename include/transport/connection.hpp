/*
 * 설명: Stream 위에 코덱을 얹은 양방향 연결. IRC 라인 코덱과 DCC 바이트 코덱을 같은 틀로 다룬다.
 * 버전: v0.3.0
 * 관련 문서: DESIGN.md (Transport Connection)
 * 테스트: tests/unit/task_test.cpp, tests/unit/framer_test.cpp
 */
#pragma once

#include <poll.h>

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include "protocol/framer.hpp"
#include "protocol/message.hpp"
#include "transport/security.hpp"
#include "transport/stream.hpp"

namespace transport {

struct LineFrame {
    bool ok;
    protocol::Message message;
    protocol::ParseError error;

    LineFrame() : ok(false) {}
};

class LineCodec {
   public:
    typedef LineFrame Frame;
    typedef protocol::Message Item;

    explicit LineCodec(std::size_t max_length = protocol::kMaxTaggedLineLength);

    void Decode(std::string &buffer, std::vector<Frame> &out);
    std::string Encode(const Item &item) const;

   private:
    std::size_t max_length_;
};

class BytesCodec {
   public:
    typedef std::string Frame;
    typedef std::string Item;

    void Decode(std::string &buffer, std::vector<Frame> &out);
    std::string Encode(const Item &item) const { return item; }
};

template <typename Codec>
class Connection {
   public:
    typedef typename Codec::Frame Frame;
    typedef typename Codec::Item Item;

    static const std::size_t kReadChunk = 8192;
    static const std::size_t kMaxReadPerCall = 64 * 1024;

    Connection(std::unique_ptr<Stream> stream, const Codec &codec,
               const std::string &initial_data = std::string())
        : stream_(std::move(stream)),
          codec_(codec),
          read_buffer_(initial_data),
          write_offset_(0),
          read_closed_(false),
          read_pending_(!initial_data.empty()) {}

    int Fd() const { return stream_->Fd(); }
    bool IsSecure() const { return stream_->IsSecure(); }

    short PollEvents() const {
        short events = 0;
        if (!read_closed_) {
            events |= POLLIN;
        }
        if (HasPendingOutput() || stream_->WantsWrite()) {
            events |= POLLOUT;
        }
        return events;
    }

    // 읽기 한도에 걸려 멈췄거나 아직 해석하지 않은 데이터가 남아 있다.
    bool ReadPending() const { return read_pending_; }

    // 읽을 수 있는 만큼 읽어 frames 에 덧붙인다. 상대가 닫으면 kClosed.
    IoStatus Receive(std::vector<Frame> &frames, std::string &error) {
        read_pending_ = false;
        if (!read_buffer_.empty()) {
            codec_.Decode(read_buffer_, frames);
        }
        if (read_closed_) {
            return IoStatus::kClosed;
        }

        std::size_t total = 0;
        char buf[kReadChunk];
        while (total < kMaxReadPerCall) {
            std::size_t n = 0;
            IoStatus status = stream_->Read(buf, sizeof(buf), n, error);
            if (status == IoStatus::kOk) {
                read_buffer_.append(buf, n);
                total += n;
                codec_.Decode(read_buffer_, frames);
                continue;
            }
            if (status == IoStatus::kWouldBlock) {
                return IoStatus::kOk;
            }
            if (status == IoStatus::kClosed) {
                read_closed_ = true;
            }
            return status;
        }
        read_pending_ = true;
        return IoStatus::kOk;
    }

    void Send(const Item &item) { write_buffer_ += codec_.Encode(item); }

    IoStatus Flush(std::string &error) {
        while (write_offset_ < write_buffer_.size()) {
            std::size_t n = 0;
            IoStatus status = stream_->Write(write_buffer_.data() + write_offset_,
                                             write_buffer_.size() - write_offset_, n, error);
            if (status != IoStatus::kOk) {
                return status;
            }
            write_offset_ += n;
        }
        write_buffer_.clear();
        write_offset_ = 0;
        return IoStatus::kOk;
    }

    // 남은 출력을 먼저 비운 뒤 쓰기 방향을 닫는다.
    IoStatus Shutdown(std::string &error) {
        IoStatus status = Flush(error);
        if (status != IoStatus::kOk) {
            return status;
        }
        return stream_->Shutdown(error);
    }

    bool HasPendingOutput() const { return write_offset_ < write_buffer_.size(); }
    bool IsReadClosed() const { return read_closed_; }

   private:
    Connection(const Connection &);
    Connection &operator=(const Connection &);

    std::unique_ptr<Stream> stream_;
    Codec codec_;
    std::string read_buffer_;
    std::string write_buffer_;
    std::size_t write_offset_;
    bool read_closed_;
    bool read_pending_;
};

template <typename Codec>
const std::size_t Connection<Codec>::kReadChunk;
template <typename Codec>
const std::size_t Connection<Codec>::kMaxReadPerCall;

}  // namespace transport
