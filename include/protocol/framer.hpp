/*
 * 설명: 수신 버퍼를 LF 기준으로 잘라 종결자를 포함한 라인을 꺼내고 길이 제한을 검사한다.
 * 버전: v0.2.0
 * 관련 문서: DESIGN.md (Message Codec)
 * 테스트: tests/unit/framer_test.cpp
 */
#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace protocol {

// 태그 블록(최대 8191 바이트)과 본문 512 바이트를 합한 수신 한도.
const std::size_t kMaxTaggedLineLength = 8191 + 512;

struct FrameResult {
    std::vector<std::string> lines;
    bool line_too_long;
    // 길이 초과 라인이 있던 자리. 값은 그 앞에 온 정상 라인 수.
    std::vector<std::size_t> too_long_at;
};

FrameResult ExtractLines(std::string &buffer, std::size_t max_length);

}  // namespace protocol
