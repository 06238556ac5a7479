#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace zkemu::utils {

/**
 * Byte helpers backed by OpenSSL
 */
class Crypto {
public:
    /**
     * Fill a buffer from the OpenSSL CSPRNG.
     * Throws std::runtime_error if the generator is not seeded.
     */
    static std::vector<uint8_t> randomBytes(size_t count);

    // Random 16-bit value, never zero
    static uint16_t randomNonZeroU16();

    /**
     * Lowercase hex, space separated every byte when spaced is set
     */
    static std::string toHex(const uint8_t* data, size_t length, bool spaced = false);
    static std::string toHex(const std::vector<uint8_t>& data, bool spaced = false);
};

} // namespace zkemu::utils
