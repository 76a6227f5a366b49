#include "entropy_source.hpp"

#include <climits>
#include <string>
#include <crow/logging.h>
#include <openssl/err.h>
#include <openssl/rand.h>

namespace asftoken {

Result<std::vector<std::uint8_t>> OpenSslEntropySource::nextBytes(std::size_t count) {
    if (count > static_cast<std::size_t>(INT_MAX)) {
        return Error::EntropyFailure("Entropy request too large",
                                    "Requested " + std::to_string(count) + " bytes");
    }

    std::vector<std::uint8_t> bytes(count);
    if (count == 0) {
        return bytes;
    }

    if (RAND_bytes(bytes.data(), static_cast<int>(count)) != 1) {
        char buffer[256] = {0};
        ERR_error_string_n(ERR_get_error(), buffer, sizeof(buffer));
        CROW_LOG_ERROR << "RAND_bytes failed: " << buffer;
        return Error::EntropyFailure("Secure random source failed", buffer);
    }

    return bytes;
}

} // namespace asftoken
