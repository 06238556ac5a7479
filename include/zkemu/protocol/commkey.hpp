#pragma once

#include <array>
#include <cstdint>

namespace zkemu::protocol {

using CommKey = std::array<uint8_t, 4>;

constexpr uint8_t kDefaultCommKeyTicks = 50;

/**
 * Derive the CMD_AUTH key from the numeric device password and the
 * session id assigned by CMD_CONNECT.
 */
CommKey makeCommKey(uint32_t password, uint16_t sessionId, uint8_t ticks = kDefaultCommKeyTicks);

/**
 * Device side check. The ticks byte is taken from the received key.
 */
bool verifyCommKey(const CommKey& key, uint32_t password, uint16_t sessionId);

} // namespace zkemu::protocol
