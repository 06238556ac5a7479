#include "zkemu/client/transfer.hpp"
#include "zkemu/utils/buffer.hpp"
#include "zkemu/utils/logger.hpp"

#include <algorithm>
#include <cstring>
#include <fmt/format.h>

namespace zkemu::client {

using protocol::CommandId;

// =============================================================================
// Pending Transfer
// =============================================================================

PendingTransfer::PendingTransfer(uint32_t totalSize, uint32_t chunkSize)
    : m_totalSize(totalSize)
    , m_chunkSize(chunkSize == 0 ? 1 : chunkSize)
    , m_buffer(totalSize)
    , m_received((totalSize + m_chunkSize - 1) / m_chunkSize, false)
{
}

uint32_t PendingTransfer::chunkLength(uint32_t index) const {
    uint32_t offset = chunkOffset(index);
    if (offset >= m_totalSize) {
        return 0;
    }
    return std::min(m_chunkSize, m_totalSize - offset);
}

Status PendingTransfer::accept(uint32_t index, const Bytes& data) {
    if (m_aborted) {
        return makeError(ErrorCode::Transfer, "transfer already aborted");
    }
    if (index >= m_received.size()) {
        return makeError(ErrorCode::Transfer,
                         fmt::format("chunk {} beyond the {} announced", index, m_received.size()));
    }
    if (m_received[index]) {
        LOG_DEBUG("[Transfer] Ignoring duplicate chunk {}", index);
        return Status::success();
    }
    if (data.size() != chunkLength(index)) {
        return makeError(ErrorCode::Transfer,
                         fmt::format("chunk {} carried {} bytes, expected {}",
                                     index, data.size(), chunkLength(index)));
    }

    std::memcpy(m_buffer.data() + chunkOffset(index), data.data(), data.size());
    m_received[index] = true;
    m_receivedBytes += static_cast<uint32_t>(data.size());
    return Status::success();
}

std::vector<uint32_t> PendingTransfer::missing() const {
    std::vector<uint32_t> indices;
    for (uint32_t i = 0; i < m_received.size(); i++) {
        if (!m_received[i]) {
            indices.push_back(i);
        }
    }
    return indices;
}

Result<Bytes> PendingTransfer::take() {
    if (!complete()) {
        return makeError(ErrorCode::Transfer,
                         fmt::format("incomplete transfer: {} of {} bytes", m_receivedBytes, m_totalSize));
    }
    Bytes data = std::move(m_buffer);
    m_buffer.clear();
    m_receivedBytes = 0;
    m_aborted = true;
    return data;
}

void PendingTransfer::abort() {
    m_aborted = true;
    m_buffer.clear();
    m_buffer.shrink_to_fit();
    std::fill(m_received.begin(), m_received.end(), false);
    m_receivedBytes = 0;
}

// =============================================================================
// Reassembly
// =============================================================================

namespace {

bool isGap(ErrorCode code) {
    return code == ErrorCode::Timeout || code == ErrorCode::Checksum ||
           code == ErrorCode::MalformedFrame;
}

std::string joinIndices(const std::vector<uint32_t>& indices) {
    std::string out;
    for (auto index : indices) {
        if (!out.empty()) out += ",";
        out += std::to_string(index);
    }
    return out;
}

} // namespace

Result<Bytes> reassemble(uint32_t totalSize, uint32_t chunkSize, ChunkSource& source, int retryRounds) {
    PendingTransfer pending(totalSize, chunkSize);

    auto pull = [&](uint32_t index) -> Status {
        auto chunk = source.fetch(index, pending.chunkOffset(index), pending.chunkLength(index));
        if (!chunk) {
            if (isGap(chunk.code())) {
                LOG_WARN("[Transfer] Chunk {} missing: {}", index, chunk.error().message);
                return Status::success();
            }
            return chunk.error();
        }
        return pending.accept(index, chunk.value());
    };

    for (uint32_t index = 0; index < pending.chunkCount(); index++) {
        auto status = pull(index);
        if (!status) {
            pending.abort();
            return makeError(ErrorCode::Transfer, fmt::format("transfer aborted: {}", status.error().message));
        }
    }

    for (int round = 1; !pending.complete(); round++) {
        auto gaps = pending.missing();
        if (round > retryRounds) {
            pending.abort();
            return makeError(ErrorCode::Transfer,
                             fmt::format("chunks [{}] not received after {} retries", joinIndices(gaps), retryRounds));
        }

        LOG_INFO("[Transfer] Re-requesting chunks [{}] (round {})", joinIndices(gaps), round);
        for (auto index : gaps) {
            auto status = pull(index);
            if (!status) {
                pending.abort();
                return makeError(ErrorCode::Transfer, fmt::format("transfer aborted: {}", status.error().message));
            }
        }
    }

    return pending.take();
}

// =============================================================================
// Transfer Engine
// =============================================================================

namespace {

/**
 * READ_BUFFER against the staged data set
 */
class ReadBufferSource : public ChunkSource {
public:
    ReadBufferSource(CommandDispatcher& commands, TransferEngine& engine)
        : m_commands(commands), m_engine(engine) {}

    Result<Bytes> fetch(uint32_t index, uint32_t offset, uint32_t size) override {
        LOG_TRACE("[Transfer] READ_BUFFER chunk {} offset={} size={}", index, offset, size);

        auto reply = m_commands.executeOnce(protocol::ReadBufferRequest{offset, size});
        if (!reply) {
            return lost(reply.error());
        }
        auto data = m_engine.collectReply(reply.value());
        if (!data) {
            return lost(data.error());
        }
        return data;
    }

private:
    Result<Bytes> lost(const Error& error) {
        if (!m_commands.session().isConnected()) {
            return makeError(ErrorCode::ConnectionLost, error.message);
        }
        return error;
    }

    CommandDispatcher& m_commands;
    TransferEngine& m_engine;
};

} // namespace

TransferEngine::TransferEngine(CommandDispatcher& commands)
    : m_commands(commands)
{
}

uint32_t TransferEngine::chunkSize() const {
    if (m_chunkSize != 0) {
        return m_chunkSize;
    }
    return m_commands.session().transportKind() == TransportKind::Tcp ? kTcpChunkSize : kUdpChunkSize;
}

Result<Bytes> TransferEngine::collectReply(const Frame& first) {
    if (first.is(CommandId::Data)) {
        return first.payload;
    }
    if (!first.is(CommandId::PrepareData)) {
        return makeError(ErrorCode::Transfer,
                         fmt::format("expected DATA or PREPARE_DATA, got {}", protocol::commandName(first.command)));
    }
    if (first.payload.size() < 4) {
        return makeError(ErrorCode::Transfer, "PREPARE_DATA without a size");
    }

    uint32_t announced = utils::BufferReader(first.payload).readU32();
    if (announced > kMaxDataSetSize) {
        return makeError(ErrorCode::Transfer, fmt::format("announced size {} too large", announced));
    }

    Bytes data;
    data.reserve(announced);

    Session& session = m_commands.session();
    while (data.size() < announced) {
        auto frame = session.awaitFollowUp();
        if (!frame) {
            return frame.error();
        }
        if (!frame.value().is(CommandId::Data)) {
            return makeError(ErrorCode::Transfer,
                             fmt::format("{} inside a data stream", protocol::commandName(frame.value().command)));
        }
        const Bytes& part = frame.value().payload;
        if (data.size() + part.size() > announced) {
            return makeError(ErrorCode::Transfer,
                             fmt::format("stream exceeded the announced {} bytes", announced));
        }
        data.insert(data.end(), part.begin(), part.end());
    }

    // Stream is closed by ACK_OK
    auto done = session.awaitFollowUp();
    if (!done) {
        return done.error();
    }
    if (!done.value().is(CommandId::AckOk)) {
        return makeError(ErrorCode::Transfer,
                         fmt::format("stream ended with {}", protocol::commandName(done.value().command)));
    }

    return data;
}

Status TransferEngine::freeData() {
    auto reply = m_commands.execute(protocol::FreeDataRequest{});
    if (!reply) {
        return reply.error();
    }
    return Status::success();
}

Result<Bytes> TransferEngine::readBuffer(uint16_t command, uint32_t table, uint32_t ext) {
    auto prepared = m_commands.execute(protocol::PrepareBufferRequest{command, table, ext});
    if (!prepared) {
        return prepared.error();
    }

    const Frame& reply = prepared.value();
    if (reply.is(CommandId::Data) || reply.is(CommandId::PrepareData)) {
        auto inline_data = collectReply(reply);
        if (!inline_data) {
            return makeError(ErrorCode::Transfer,
                             fmt::format("inline transfer failed: {}", inline_data.error().message));
        }
        return inline_data;
    }

    if (!reply.is(CommandId::AckOk) || reply.payload.size() < 5) {
        return makeError(ErrorCode::Transfer,
                         fmt::format("PREPARE_BUFFER answered with {} ({} bytes)",
                                     protocol::commandName(reply.command), reply.payload.size()));
    }

    utils::BufferReader reader(reply.payload);
    reader.skip(1);
    uint32_t total = reader.readU32();

    Result<Bytes> result = Bytes{};
    if (total > kMaxDataSetSize) {
        result = makeError(ErrorCode::Transfer, fmt::format("staged size {} too large", total));
    }
    else if (total > 0) {
        LOG_DEBUG("[Transfer] {} staged {} bytes, {} byte chunks",
                  protocol::commandName(command), total, chunkSize());
        ReadBufferSource source(m_commands, *this);
        result = reassemble(total, chunkSize(), source, kRetryRounds);
    }

    if (m_commands.session().isConnected()) {
        auto freed = freeData();
        if (!freed) {
            LOG_WARN("[Transfer] FREE_DATA failed: {}", freed.error().message);
        }
    }

    return result;
}

Status TransferEngine::writeBuffer(const Bytes& data) {
    auto freed = freeData();
    if (!freed) {
        return freed;
    }

    auto prepared = m_commands.execute(protocol::PrepareDataRequest{static_cast<uint32_t>(data.size())});
    if (!prepared) {
        return makeError(ErrorCode::Transfer,
                         fmt::format("PREPARE_DATA refused: {}", prepared.error().message));
    }

    for (size_t offset = 0; offset < data.size(); offset += kUploadChunkSize) {
        size_t length = std::min<size_t>(kUploadChunkSize, data.size() - offset);
        protocol::DataRequest chunk{Bytes(data.begin() + offset, data.begin() + offset + length)};

        auto reply = m_commands.execute(chunk);
        if (!reply) {
            if (m_commands.session().isConnected()) {
                auto released = freeData();
                if (!released) {
                    LOG_WARN("[Transfer] FREE_DATA after failed upload: {}", released.error().message);
                }
            }
            return makeError(ErrorCode::Transfer,
                             fmt::format("upload aborted at byte {}: {}", offset, reply.error().message));
        }
    }

    LOG_DEBUG("[Transfer] Uploaded {} bytes", data.size());
    return Status::success();
}

} // namespace zkemu::client
