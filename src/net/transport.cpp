#include "zkemu/net/transport.hpp"
#include "zkemu/utils/crypto.hpp"
#include "zkemu/utils/logger.hpp"

#include <fmt/format.h>

namespace zkemu::net {

using asio::ip::tcp;
using asio::ip::udp;

namespace {

Error ioError(const char* what, const asio::error_code& ec) {
    if (ec == asio::error::eof || ec == asio::error::connection_reset ||
        ec == asio::error::connection_refused || ec == asio::error::broken_pipe ||
        ec == asio::error::connection_aborted) {
        return makeError(ErrorCode::ConnectionLost, fmt::format("{}: {}", what, ec.message()));
    }
    return makeError(ErrorCode::Io, fmt::format("{}: {}", what, ec.message()));
}

Error timeoutError(const char* what, std::chrono::milliseconds timeout) {
    return makeError(ErrorCode::Timeout, fmt::format("{} timed out after {} ms", what, timeout.count()));
}

} // namespace

// =============================================================================
// TCP
// =============================================================================

TcpTransport::TcpTransport(std::string host, uint16_t port)
    : m_host(std::move(host))
    , m_port(port)
    , m_socket(m_io)
{
}

TcpTransport::~TcpTransport() {
    close();
}

std::string TcpTransport::peer() const {
    return fmt::format("{}:{}", m_host, m_port);
}

void TcpTransport::runFor(std::chrono::steady_clock::duration timeout) {
    m_io.restart();
    m_io.run_for(timeout);
    if (m_io.stopped()) {
        return;
    }

    // Deadline passed: cancel and let the aborted handler run before returning
    asio::error_code ec;
    m_socket.cancel(ec);
    m_io.restart();
    m_io.run();
}

Status TcpTransport::open(std::chrono::milliseconds timeout) {
    close();
    m_frames.reset();

    asio::error_code ec;
    tcp::resolver resolver(m_io);
    auto endpoints = resolver.resolve(m_host, std::to_string(m_port), ec);
    if (ec) {
        return ioError("resolve", ec);
    }

    bool done = false;
    asio::error_code connectError;
    asio::async_connect(m_socket, endpoints,
        [&](const asio::error_code& error, const tcp::endpoint&) {
            connectError = error;
            done = true;
        });

    runFor(timeout);
    if (!done || connectError == asio::error::operation_aborted) {
        close();
        return timeoutError("connect", timeout);
    }
    if (connectError) {
        close();
        return ioError("connect", connectError);
    }

    m_socket.set_option(tcp::no_delay(true), ec);
    LOG_DEBUG("[tcp] Connected to {}", peer());
    return Status::success();
}

void TcpTransport::close() {
    if (!m_socket.is_open()) return;

    asio::error_code ec;
    m_socket.shutdown(tcp::socket::shutdown_both, ec);
    m_socket.close(ec);
    m_frames.reset();
    LOG_DEBUG("[tcp] Closed {}", peer());
}

Status TcpTransport::send(const Bytes& packet) {
    if (!m_socket.is_open()) {
        return makeError(ErrorCode::ConnectionLost, "socket is closed");
    }

    Bytes framed = protocol::TcpFrameBuffer::wrap(packet);
    LOG_TRACE("[tcp] >> {}", utils::Crypto::toHex(framed, true));

    asio::error_code ec;
    asio::write(m_socket, asio::buffer(framed), ec);
    if (ec) {
        return ioError("send", ec);
    }
    return Status::success();
}

Result<Bytes> TcpTransport::receive(std::chrono::milliseconds timeout) {
    if (!m_socket.is_open()) {
        return makeError(ErrorCode::ConnectionLost, "socket is closed");
    }

    auto deadline = std::chrono::steady_clock::now() + timeout;
    Bytes packet;

    while (true) {
        auto status = m_frames.next(packet);
        if (status == protocol::TcpFrameBuffer::Status::Packet) {
            LOG_TRACE("[tcp] << {}", utils::Crypto::toHex(packet, true));
            return packet;
        }
        if (status == protocol::TcpFrameBuffer::Status::BadPrefix) {
            LOG_WARN("[tcp] Stream from {} lost framing, dropping connection", peer());
            close();
            return makeError(ErrorCode::MalformedFrame, "bad TCP frame prefix");
        }

        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            return timeoutError("receive", timeout);
        }

        bool done = false;
        size_t received = 0;
        asio::error_code readError;
        m_socket.async_read_some(asio::buffer(m_readBuffer),
            [&](const asio::error_code& error, size_t bytes) {
                readError = error;
                received = bytes;
                done = true;
            });

        runFor(deadline - now);
        if (!done || readError == asio::error::operation_aborted) {
            // Bytes already buffered stay for the next receive
            return timeoutError("receive", timeout);
        }
        if (readError) {
            close();
            return ioError("receive", readError);
        }
        m_frames.feed(m_readBuffer.data(), received);
    }
}

// =============================================================================
// UDP
// =============================================================================

UdpTransport::UdpTransport(std::string host, uint16_t port)
    : m_host(std::move(host))
    , m_port(port)
    , m_socket(m_io)
    , m_datagram(kMaxDatagram)
{
}

UdpTransport::~UdpTransport() {
    close();
}

std::string UdpTransport::peer() const {
    return fmt::format("{}:{}", m_host, m_port);
}

void UdpTransport::runFor(std::chrono::steady_clock::duration timeout) {
    m_io.restart();
    m_io.run_for(timeout);
    if (m_io.stopped()) {
        return;
    }

    // Deadline passed: cancel and let the aborted handler run before returning
    asio::error_code ec;
    m_socket.cancel(ec);
    m_io.restart();
    m_io.run();
}

Status UdpTransport::open(std::chrono::milliseconds /*timeout*/) {
    close();

    asio::error_code ec;
    udp::resolver resolver(m_io);
    auto endpoints = resolver.resolve(udp::v4(), m_host, std::to_string(m_port), ec);
    if (ec || endpoints.empty()) {
        return ioError("resolve", ec);
    }

    m_socket.open(udp::v4(), ec);
    if (ec) {
        return ioError("open", ec);
    }

    // Connected UDP: only the device's datagrams are delivered
    m_socket.connect(*endpoints.begin(), ec);
    if (ec) {
        close();
        return ioError("connect", ec);
    }

    LOG_DEBUG("[udp] Bound for {}", peer());
    return Status::success();
}

void UdpTransport::close() {
    if (!m_socket.is_open()) return;

    asio::error_code ec;
    m_socket.close(ec);
    LOG_DEBUG("[udp] Closed {}", peer());
}

Status UdpTransport::send(const Bytes& packet) {
    if (!m_socket.is_open()) {
        return makeError(ErrorCode::ConnectionLost, "socket is closed");
    }

    LOG_TRACE("[udp] >> {}", utils::Crypto::toHex(packet, true));

    asio::error_code ec;
    m_socket.send(asio::buffer(packet), 0, ec);
    if (ec) {
        return ioError("send", ec);
    }
    return Status::success();
}

Result<Bytes> UdpTransport::receive(std::chrono::milliseconds timeout) {
    if (!m_socket.is_open()) {
        return makeError(ErrorCode::ConnectionLost, "socket is closed");
    }

    bool done = false;
    size_t received = 0;
    asio::error_code readError;
    m_socket.async_receive(asio::buffer(m_datagram),
        [&](const asio::error_code& error, size_t bytes) {
            readError = error;
            received = bytes;
            done = true;
        });

    runFor(timeout);
    if (!done || readError == asio::error::operation_aborted) {
        return timeoutError("receive", timeout);
    }
    if (readError) {
        return ioError("receive", readError);
    }

    Bytes packet(m_datagram.begin(), m_datagram.begin() + received);
    LOG_TRACE("[udp] << {}", utils::Crypto::toHex(packet, true));
    return packet;
}

// =============================================================================
// Factory
// =============================================================================

std::unique_ptr<Transport> makeTransport(const ClientConfig& config) {
    if (config.transport == TransportKind::Udp) {
        return std::make_unique<UdpTransport>(config.device_address, config.device_port);
    }
    return std::make_unique<TcpTransport>(config.device_address, config.device_port);
}

} // namespace zkemu::net
