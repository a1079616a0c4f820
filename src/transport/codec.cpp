/*
 * 설명: 수신 버퍼를 IRC 메시지 또는 원시 바이트 조각으로 바꾸는 코덱 구현.
 * 버전: v0.3.0
 * 관련 문서: DESIGN.md (Transport Connection)
 * 테스트: tests/unit/framer_test.cpp
 */
#include "transport/connection.hpp"

namespace transport {

LineCodec::LineCodec(std::size_t max_length) : max_length_(max_length) {}

void LineCodec::Decode(std::string &buffer, std::vector<Frame> &out) {
    protocol::FrameResult result = protocol::ExtractLines(buffer, max_length_);
    std::size_t next_too_long = 0;
    for (std::size_t i = 0; i <= result.lines.size(); ++i) {
        while (next_too_long < result.too_long_at.size() && result.too_long_at[next_too_long] == i) {
            LineFrame frame;
            frame.ok = false;
            frame.error.diagnostic = "line too long";
            out.push_back(frame);
            ++next_too_long;
        }
        if (i == result.lines.size()) {
            break;
        }
        LineFrame frame;
        frame.ok = protocol::ParseMessage(result.lines[i], frame.message, frame.error);
        out.push_back(frame);
    }
}

std::string LineCodec::Encode(const Item &item) const { return protocol::FormatMessage(item); }

void BytesCodec::Decode(std::string &buffer, std::vector<Frame> &out) {
    if (buffer.empty()) {
        return;
    }
    out.push_back(std::string());
    out.back().swap(buffer);
}

}  // namespace transport
