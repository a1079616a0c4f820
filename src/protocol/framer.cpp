/*
 * 설명: 수신 버퍼를 LF 기준으로 분리하고 길이 초과 여부를 판정한다. 라인에는 CRLF 가 그대로 남는다.
 * 버전: v0.2.0
 * 관련 문서: DESIGN.md (Message Codec)
 * 테스트: tests/unit/framer_test.cpp
 */
#include "protocol/framer.hpp"

#include <cstddef>

namespace protocol {

FrameResult ExtractLines(std::string &buffer, std::size_t max_length) {
    FrameResult result;
    result.line_too_long = false;

    std::size_t start = 0;
    std::size_t pos = std::string::npos;
    while ((pos = buffer.find('\n', start)) != std::string::npos) {
        std::size_t length = pos + 1 - start;
        if (length > max_length) {
            result.line_too_long = true;
            result.too_long_at.push_back(result.lines.size());
        } else {
            result.lines.push_back(buffer.substr(start, length));
        }
        start = pos + 1;
    }
    buffer.erase(0, start);

    // LF 도달 이전에 길이 초과한 경우 남은 조각을 버린다.
    if (buffer.size() > max_length) {
        buffer.clear();
        result.line_too_long = true;
        result.too_long_at.push_back(result.lines.size());
    }

    return result;
}

}  // namespace protocol
