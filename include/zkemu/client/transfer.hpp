#pragma once

#include "zkemu/client/command_dispatcher.hpp"
#include "zkemu/core/result.hpp"
#include <cstdint>
#include <vector>

namespace zkemu::client {

/**
 * Reassembly buffer for one inbound data set
 *
 * Chunks are addressed by index; each has a fixed offset and length
 * derived from the announced total. Data only leaves through take()
 * once every chunk has arrived.
 */
class PendingTransfer {
public:
    PendingTransfer(uint32_t totalSize, uint32_t chunkSize);

    uint32_t totalSize() const { return m_totalSize; }
    uint32_t chunkSize() const { return m_chunkSize; }
    uint32_t chunkCount() const { return static_cast<uint32_t>(m_received.size()); }
    uint32_t chunkOffset(uint32_t index) const { return index * m_chunkSize; }
    uint32_t chunkLength(uint32_t index) const;

    /**
     * Store a chunk. A repeated index is ignored; an index out of range
     * or a length that differs from chunkLength() is a TransferError.
     */
    Status accept(uint32_t index, const Bytes& data);

    bool has(uint32_t index) const { return index < m_received.size() && m_received[index]; }
    std::vector<uint32_t> missing() const;
    uint32_t receivedBytes() const { return m_receivedBytes; }
    bool complete() const { return !m_aborted && m_receivedBytes == m_totalSize; }
    bool aborted() const { return m_aborted; }

    Result<Bytes> take();
    void abort();

private:
    uint32_t m_totalSize;
    uint32_t m_chunkSize;
    Bytes m_buffer;
    std::vector<bool> m_received;
    uint32_t m_receivedBytes = 0;
    bool m_aborted = false;
};

/**
 * Where chunk bytes come from
 */
class ChunkSource {
public:
    virtual ~ChunkSource() = default;

    /**
     * Fetch [offset, offset + size). Timeout, Checksum and MalformedFrame
     * failures leave the chunk to be re-requested, anything else aborts.
     */
    virtual Result<Bytes> fetch(uint32_t index, uint32_t offset, uint32_t size) = 0;
};

/**
 * Pull every chunk once in order, then re-request the gaps by index
 * for up to retryRounds passes.
 */
Result<Bytes> reassemble(uint32_t totalSize, uint32_t chunkSize, ChunkSource& source, int retryRounds);

/**
 * Chunked transfer engine
 *
 * Inbound: PREPARE_BUFFER announces the staged size, READ_BUFFER pulls
 * it chunk by chunk, FREE_DATA releases it. Outbound: PREPARE_DATA
 * announces the size and DATA frames carry it.
 */
class TransferEngine {
public:
    static constexpr uint32_t kTcpChunkSize = 0xFFC0;
    static constexpr uint32_t kUdpChunkSize = 16 * 1024;
    static constexpr uint32_t kUploadChunkSize = 1024;
    static constexpr uint32_t kMaxDataSetSize = 64 * 1024 * 1024;
    static constexpr int kRetryRounds = 3;

    explicit TransferEngine(CommandDispatcher& commands);

    /**
     * Read the data set that `command` (USERTEMP_RRQ, ATTLOG_RRQ, DB_RRQ)
     * would return, staged on the device first.
     */
    Result<Bytes> readBuffer(uint16_t command, uint32_t table = 0, uint32_t ext = 0);

    /**
     * Stage `data` on the device for a following command such as
     * SAVE_USERTEMPS.
     */
    Status writeBuffer(const Bytes& data);

    /**
     * Payload of a reply that is either inline DATA or a PREPARE_DATA
     * announcement followed by DATA frames and ACK_OK.
     */
    Result<Bytes> collectReply(const Frame& first);

    Status freeData();

    /**
     * READ_BUFFER chunk size: 0xFFC0 on TCP, 16 KiB on UDP unless
     * overridden for firmware with smaller buffers.
     */
    uint32_t chunkSize() const;
    void setChunkSize(uint32_t size) { m_chunkSize = size; }

private:
    CommandDispatcher& m_commands;
    uint32_t m_chunkSize = 0;   // 0 selects the transport default
};

} // namespace zkemu::client
