#include "test_framework.hpp"
#include "zkemu/client/transfer.hpp"

#include <map>
#include <set>

namespace transfer_tests {

using zkemu::ErrorCode;
using zkemu::Result;
using zkemu::client::ChunkSource;
using zkemu::client::PendingTransfer;
using zkemu::protocol::Bytes;

Bytes pattern(size_t size) {
    Bytes data(size);
    for (size_t i = 0; i < size; i++) {
        data[i] = static_cast<uint8_t>(i * 7 + 3);
    }
    return data;
}

/**
 * Serves slices of a fixed buffer, failing chosen fetches
 */
class ScriptedSource : public ChunkSource {
public:
    explicit ScriptedSource(Bytes data) : m_data(std::move(data)) {}

    // Fail the n-th fetch of `index` (1 based) with `code`
    void failFetch(uint32_t index, int attempt, ErrorCode code) {
        m_failures[{index, attempt}] = code;
    }

    // Fail every fetch of `index`
    void failAlways(uint32_t index) { m_alwaysFail.insert(index); }

    Result<Bytes> fetch(uint32_t index, uint32_t offset, uint32_t size) override {
        m_requests.push_back(index);
        int attempt = ++m_attempts[index];

        if (m_alwaysFail.count(index)) {
            return zkemu::makeError(ErrorCode::Timeout, "chunk never arrives");
        }
        auto it = m_failures.find({index, attempt});
        if (it != m_failures.end()) {
            return zkemu::makeError(it->second, "scripted failure");
        }
        return Bytes(m_data.begin() + offset, m_data.begin() + offset + size);
    }

    const std::vector<uint32_t>& requests() const { return m_requests; }

private:
    Bytes m_data;
    std::map<std::pair<uint32_t, int>, ErrorCode> m_failures;
    std::set<uint32_t> m_alwaysFail;
    std::map<uint32_t, int> m_attempts;
    std::vector<uint32_t> m_requests;
};

} // namespace transfer_tests

// =============================================================================
// Pending transfer
// =============================================================================

TEST(Pending_ChunkGeometry) {
    using namespace transfer_tests;
    PendingTransfer pending(100, 32);
    ASSERT_EQ(pending.chunkCount(), 4u);
    ASSERT_EQ(pending.chunkOffset(3), 96u);
    ASSERT_EQ(pending.chunkLength(0), 32u);
    ASSERT_EQ(pending.chunkLength(3), 4u);
    ASSERT_EQ(pending.chunkLength(4), 0u);
    PASS();
}

TEST(Pending_OutOfOrderAndDuplicates) {
    using namespace transfer_tests;
    Bytes data = pattern(100);
    PendingTransfer pending(100, 32);

    for (uint32_t index : {3u, 1u, 1u, 0u}) {
        Bytes chunk(data.begin() + pending.chunkOffset(index),
                    data.begin() + pending.chunkOffset(index) + pending.chunkLength(index));
        ASSERT_OK(pending.accept(index, chunk));
    }

    ASSERT_FALSE(pending.complete());
    ASSERT_EQ(pending.receivedBytes(), 68u);
    ASSERT_EQ(pending.missing().size(), 1u);
    ASSERT_EQ(pending.missing()[0], 2u);

    // Nothing leaves before the last gap is filled
    ASSERT_ERROR(pending.take(), ErrorCode::Transfer);

    ASSERT_OK(pending.accept(2, Bytes(data.begin() + 64, data.begin() + 96)));
    ASSERT_TRUE(pending.complete());

    auto assembled = pending.take();
    ASSERT_OK(assembled);
    ASSERT_TRUE(assembled.value() == data);
    PASS();
}

TEST(Pending_RejectsBadChunks) {
    using namespace transfer_tests;
    PendingTransfer pending(100, 32);
    ASSERT_ERROR(pending.accept(4, Bytes(4, 0)), ErrorCode::Transfer);
    ASSERT_ERROR(pending.accept(0, Bytes(31, 0)), ErrorCode::Transfer);
    ASSERT_ERROR(pending.accept(3, Bytes(32, 0)), ErrorCode::Transfer);
    ASSERT_EQ(pending.receivedBytes(), 0u);
    PASS();
}

TEST(Pending_AbortDiscardsData) {
    using namespace transfer_tests;
    PendingTransfer pending(64, 32);
    ASSERT_OK(pending.accept(0, Bytes(32, 1)));
    pending.abort();

    ASSERT_TRUE(pending.aborted());
    ASSERT_EQ(pending.receivedBytes(), 0u);
    ASSERT_ERROR(pending.accept(1, Bytes(32, 2)), ErrorCode::Transfer);
    ASSERT_ERROR(pending.take(), ErrorCode::Transfer);
    PASS();
}

// =============================================================================
// Reassembly
// =============================================================================

TEST(Reassemble_RerequestsOnlyTheGap) {
    using namespace transfer_tests;
    Bytes data = pattern(5 * 64);
    ScriptedSource source(data);
    source.failFetch(2, 1, ErrorCode::Timeout);

    auto assembled = zkemu::client::reassemble(5 * 64, 64, source, 3);
    ASSERT_OK(assembled);
    ASSERT_TRUE(assembled.value() == data);

    std::vector<uint32_t> expected = {0, 1, 2, 3, 4, 2};
    ASSERT_TRUE(source.requests() == expected);
    PASS();
}

TEST(Reassemble_ChecksumGapRecovered) {
    using namespace transfer_tests;
    Bytes data = pattern(1000);
    ScriptedSource source(data);
    source.failFetch(0, 1, ErrorCode::Checksum);
    source.failFetch(0, 2, ErrorCode::MalformedFrame);
    source.failFetch(3, 1, ErrorCode::Timeout);

    auto assembled = zkemu::client::reassemble(1000, 256, source, 3);
    ASSERT_OK(assembled);
    ASSERT_TRUE(assembled.value() == data);

    std::vector<uint32_t> expected = {0, 1, 2, 3, 0, 3, 0};
    ASSERT_TRUE(source.requests() == expected);
    PASS();
}

TEST(Reassemble_ConnectionLostAborts) {
    using namespace transfer_tests;
    ScriptedSource source(pattern(5 * 64));
    source.failFetch(2, 1, ErrorCode::ConnectionLost);

    auto assembled = zkemu::client::reassemble(5 * 64, 64, source, 3);
    ASSERT_ERROR(assembled, ErrorCode::Transfer);

    // Nothing after the failing chunk is requested
    std::vector<uint32_t> expected = {0, 1, 2};
    ASSERT_TRUE(source.requests() == expected);
    PASS();
}

TEST(Reassemble_RetriesExhausted) {
    using namespace transfer_tests;
    ScriptedSource source(pattern(3 * 64));
    source.failAlways(1);

    auto assembled = zkemu::client::reassemble(3 * 64, 64, source, 3);
    ASSERT_ERROR(assembled, ErrorCode::Transfer);

    // One pass plus three re-request rounds
    std::vector<uint32_t> expected = {0, 1, 2, 1, 1, 1};
    ASSERT_TRUE(source.requests() == expected);
    PASS();
}

TEST(Reassemble_SingleShortChunk) {
    using namespace transfer_tests;
    Bytes data = pattern(10);
    ScriptedSource source(data);

    auto assembled = zkemu::client::reassemble(10, 0xFFC0, source, 3);
    ASSERT_OK(assembled);
    ASSERT_EQ(assembled.value().size(), 10u);
    ASSERT_EQ(source.requests().size(), 1u);
    PASS();
}
