#pragma once

#include <algorithm>
#include <cstdint>
#include <cstring>
#include <stdexcept>
#include <string>
#include <vector>

namespace zkemu::utils {

using Bytes = std::vector<uint8_t>;

/**
 * Little-endian reader over a byte range.
 *
 * Throws std::out_of_range when a read runs past the end.
 */
class BufferReader {
public:
    explicit BufferReader(const Bytes& data)
        : m_data(data.data())
        , m_size(data.size())
        , m_pos(0)
    {}

    BufferReader(const uint8_t* data, size_t size)
        : m_data(data)
        , m_size(size)
        , m_pos(0)
    {}

    uint8_t readU8() {
        checkBounds(1);
        return m_data[m_pos++];
    }

    int8_t readI8() {
        return static_cast<int8_t>(readU8());
    }

    uint16_t readU16() {
        checkBounds(2);
        uint16_t value = static_cast<uint16_t>(m_data[m_pos] | (m_data[m_pos + 1] << 8));
        m_pos += 2;
        return value;
    }

    int16_t readI16() {
        return static_cast<int16_t>(readU16());
    }

    uint32_t readU32() {
        checkBounds(4);
        uint32_t value = static_cast<uint32_t>(m_data[m_pos]) |
                         (static_cast<uint32_t>(m_data[m_pos + 1]) << 8) |
                         (static_cast<uint32_t>(m_data[m_pos + 2]) << 16) |
                         (static_cast<uint32_t>(m_data[m_pos + 3]) << 24);
        m_pos += 4;
        return value;
    }

    int32_t readI32() {
        return static_cast<int32_t>(readU32());
    }

    // Fixed-width text field, cut at the first NUL
    std::string readFixedString(size_t length) {
        checkBounds(length);
        std::string result(reinterpret_cast<const char*>(m_data + m_pos), length);
        m_pos += length;
        size_t nullPos = result.find('\0');
        if (nullPos != std::string::npos) {
            result.resize(nullPos);
        }
        return result;
    }

    Bytes readBytes(size_t count) {
        checkBounds(count);
        Bytes result(m_data + m_pos, m_data + m_pos + count);
        m_pos += count;
        return result;
    }

    void skip(size_t count) {
        checkBounds(count);
        m_pos += count;
    }

    size_t position() const { return m_pos; }
    size_t remaining() const { return m_size - m_pos; }
    bool hasMore() const { return m_pos < m_size; }

private:
    void checkBounds(size_t count) const {
        if (count > m_size - m_pos) {
            throw std::out_of_range("Buffer read out of bounds");
        }
    }

    const uint8_t* m_data;
    size_t m_size;
    size_t m_pos;
};

/**
 * Little-endian writer building a byte vector.
 */
class BufferWriter {
public:
    BufferWriter() {
        m_data.reserve(64);
    }

    explicit BufferWriter(size_t reserveSize) {
        m_data.reserve(reserveSize);
    }

    void writeU8(uint8_t value) {
        m_data.push_back(value);
    }

    void writeI8(int8_t value) {
        writeU8(static_cast<uint8_t>(value));
    }

    void writeU16(uint16_t value) {
        m_data.push_back(value & 0xFF);
        m_data.push_back((value >> 8) & 0xFF);
    }

    void writeI16(int16_t value) {
        writeU16(static_cast<uint16_t>(value));
    }

    void writeU32(uint32_t value) {
        m_data.push_back(value & 0xFF);
        m_data.push_back((value >> 8) & 0xFF);
        m_data.push_back((value >> 16) & 0xFF);
        m_data.push_back((value >> 24) & 0xFF);
    }

    void writeI32(int32_t value) {
        writeU32(static_cast<uint32_t>(value));
    }

    // Fixed-width text field, truncated or NUL padded to length
    void writeFixedString(const std::string& str, size_t length) {
        size_t writeLen = std::min(str.size(), length);
        m_data.insert(m_data.end(), str.begin(), str.begin() + writeLen);
        m_data.insert(m_data.end(), length - writeLen, 0);
    }

    // NUL-terminated text
    void writeCString(const std::string& str) {
        m_data.insert(m_data.end(), str.begin(), str.end());
        m_data.push_back(0);
    }

    void writeBytes(const uint8_t* data, size_t count) {
        m_data.insert(m_data.end(), data, data + count);
    }

    void writeBytes(const Bytes& data) {
        m_data.insert(m_data.end(), data.begin(), data.end());
    }

    void pad(size_t count) {
        m_data.insert(m_data.end(), count, 0);
    }

    const Bytes& data() const { return m_data; }
    Bytes take() { return std::move(m_data); }
    size_t size() const { return m_data.size(); }

private:
    Bytes m_data;
};

} // namespace zkemu::utils
