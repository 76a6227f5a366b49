#include "token.hpp"

#include <iomanip>
#include <memory>
#include <sstream>
#include <utility>
#include <openssl/err.h>
#include <openssl/evp.h>

#include "base62.hpp"
#include "crc32.hpp"

namespace asftoken {

namespace {
    struct EvpMdCtxDeleter {
        void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
    };
    using EvpMdCtxPtr = std::unique_ptr<EVP_MD_CTX, EvpMdCtxDeleter>;

    std::string lastOpenSslError() {
        char buffer[256] = {0};
        ERR_error_string_n(ERR_get_error(), buffer, sizeof(buffer));
        return buffer;
    }
}

Token::Token(std::string component, std::string entropy, std::string checksum)
    : component_(std::move(component)),
      entropy_(std::move(entropy)),
      checksum_(std::move(checksum)) {}

std::string Token::toString() const {
    std::string text;
    text.reserve(length());
    text.append(kTokenPrefix);
    text.push_back(kTokenSeparator);
    text.append(component_);
    text.push_back(kTokenSeparator);
    text.append(entropy_);
    text.append(checksum_);
    return text;
}

std::size_t Token::length() const {
    return kTokenPrefix.size() + 1 + component_.size() + 1 + entropy_.size() + checksum_.size();
}

Result<std::string> Token::fingerprint() const {
    return fingerprintToken(toString());
}

bool Token::operator==(const Token& other) const {
    return component_ == other.component_ &&
           entropy_ == other.entropy_ &&
           checksum_ == other.checksum_;
}

Result<std::string> computeChecksum(std::string_view entropy) {
    return Base62::encode(Crc32::compute(entropy), kChecksumLength);
}

Result<std::string> fingerprintToken(std::string_view token_text) {
    EvpMdCtxPtr ctx(EVP_MD_CTX_new());
    if (!ctx) {
        return Error::Internal("Failed to allocate digest context", lastOpenSslError());
    }

    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_length = 0;

    if (EVP_DigestInit_ex(ctx.get(), EVP_sha3_256(), nullptr) != 1 ||
        EVP_DigestUpdate(ctx.get(), token_text.data(), token_text.size()) != 1 ||
        EVP_DigestFinal_ex(ctx.get(), digest, &digest_length) != 1) {
        return Error::Internal("SHA3-256 digest failed", lastOpenSslError());
    }

    std::ostringstream hex;
    for (unsigned int i = 0; i < digest_length; ++i) {
        hex << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(digest[i]);
    }
    return hex.str();
}

} // namespace asftoken
