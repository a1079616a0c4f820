/*
 * 설명: OpenSSL EVP 로 전송 중 스트리밍 SHA-256 을 계산하고 16진 문자열로 돌려준다.
 * 버전: v0.1.0
 * 관련 문서: DESIGN.md (Transfer Task Engine)
 * 테스트: tests/unit/task_test.cpp
 */
#pragma once

#include <openssl/evp.h>

#include <cstddef>
#include <string>

namespace utils {

class Sha256 {
   public:
    Sha256();
    ~Sha256();

    void Update(const char *data, std::size_t len);
    // 첫 호출에서 확정하고 이후에는 같은 값을 돌려준다.
    std::string HexDigest();

   private:
    Sha256(const Sha256 &);
    Sha256 &operator=(const Sha256 &);

    EVP_MD_CTX *ctx_;
    bool finalized_;
    std::string digest_;
};

}  // namespace utils
