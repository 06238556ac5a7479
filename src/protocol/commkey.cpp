#include "zkemu/protocol/commkey.hpp"

namespace zkemu::protocol {

CommKey makeCommKey(uint32_t password, uint16_t sessionId, uint8_t ticks) {
    uint32_t reversed = 0;
    for (int i = 0; i < 32; i++) {
        reversed = (reversed << 1) | ((password >> i) & 1u);
    }
    uint32_t mixed = reversed + sessionId;

    uint8_t b0 = static_cast<uint8_t>(mixed & 0xFF) ^ 'Z';
    uint8_t b1 = static_cast<uint8_t>((mixed >> 8) & 0xFF) ^ 'K';
    uint8_t b2 = static_cast<uint8_t>((mixed >> 16) & 0xFF) ^ 'S';
    uint8_t b3 = static_cast<uint8_t>((mixed >> 24) & 0xFF) ^ 'O';

    // Swap the 16-bit halves, then salt with the tick byte
    return CommKey{
        static_cast<uint8_t>(b2 ^ ticks),
        static_cast<uint8_t>(b3 ^ ticks),
        ticks,
        static_cast<uint8_t>(b1 ^ ticks)
    };
}

bool verifyCommKey(const CommKey& key, uint32_t password, uint16_t sessionId) {
    return makeCommKey(password, sessionId, key[2]) == key;
}

} // namespace zkemu::protocol
