#include "zkemu/utils/crypto.hpp"

#include <openssl/err.h>
#include <openssl/rand.h>
#include <stdexcept>

namespace zkemu::utils {

std::vector<uint8_t> Crypto::randomBytes(size_t count) {
    std::vector<uint8_t> bytes(count);
    if (count == 0) {
        return bytes;
    }
    if (RAND_bytes(bytes.data(), static_cast<int>(count)) != 1) {
        char reason[256];
        ERR_error_string_n(ERR_get_error(), reason, sizeof(reason));
        throw std::runtime_error(std::string("RAND_bytes failed: ") + reason);
    }
    return bytes;
}

uint16_t Crypto::randomNonZeroU16() {
    uint16_t value = 0;
    while (value == 0) {
        auto bytes = randomBytes(2);
        value = static_cast<uint16_t>(bytes[0] | (bytes[1] << 8));
    }
    return value;
}

std::string Crypto::toHex(const uint8_t* data, size_t length, bool spaced) {
    static const char digits[] = "0123456789abcdef";
    std::string out;
    out.reserve(length * (spaced ? 3 : 2));
    for (size_t i = 0; i < length; i++) {
        if (spaced && i > 0) {
            out.push_back(' ');
        }
        out.push_back(digits[data[i] >> 4]);
        out.push_back(digits[data[i] & 0x0F]);
    }
    return out;
}

std::string Crypto::toHex(const std::vector<uint8_t>& data, bool spaced) {
    return toHex(data.data(), data.size(), spaced);
}

} // namespace zkemu::utils
