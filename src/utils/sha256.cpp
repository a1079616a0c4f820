/*
 * 설명: EVP_MD_CTX 수명 관리와 다이제스트 16진 인코딩.
 * 버전: v0.1.0
 * 관련 문서: DESIGN.md (Transfer Task Engine)
 * 테스트: tests/unit/task_test.cpp
 */
#include "utils/sha256.hpp"

#include <stdexcept>

namespace utils {

Sha256::Sha256() : ctx_(EVP_MD_CTX_new()), finalized_(false) {
    if (ctx_ == NULL || EVP_DigestInit_ex(ctx_, EVP_sha256(), NULL) != 1) {
        EVP_MD_CTX_free(ctx_);
        throw std::runtime_error("SHA-256 컨텍스트 초기화 실패");
    }
}

Sha256::~Sha256() { EVP_MD_CTX_free(ctx_); }

void Sha256::Update(const char *data, std::size_t len) {
    if (finalized_ || len == 0) {
        return;
    }
    EVP_DigestUpdate(ctx_, data, len);
}

std::string Sha256::HexDigest() {
    if (finalized_) {
        return digest_;
    }
    finalized_ = true;

    unsigned char md[EVP_MAX_MD_SIZE];
    unsigned int md_len = 0;
    if (EVP_DigestFinal_ex(ctx_, md, &md_len) != 1) {
        return digest_;
    }

    static const char kHex[] = "0123456789abcdef";
    digest_.reserve(md_len * 2);
    for (unsigned int i = 0; i < md_len; ++i) {
        digest_.push_back(kHex[md[i] >> 4]);
        digest_.push_back(kHex[md[i] & 0x0F]);
    }
    return digest_;
}

}  // namespace utils
