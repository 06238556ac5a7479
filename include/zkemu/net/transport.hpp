#pragma once

#include "zkemu/core/result.hpp"
#include "zkemu/core/types.hpp"
#include "zkemu/protocol/packet.hpp"
#include <array>
#include <asio.hpp>
#include <chrono>
#include <memory>
#include <string>

namespace zkemu::net {

using Bytes = protocol::Bytes;

/**
 * Packet transport to a terminal
 *
 * send() takes an encoded packet, receive() hands back exactly one
 * packet. TCP framing is added and removed here.
 */
class Transport {
public:
    virtual ~Transport() = default;

    virtual Status open(std::chrono::milliseconds timeout) = 0;
    virtual void close() = 0;
    virtual bool isOpen() const = 0;

    virtual Status send(const Bytes& packet) = 0;
    virtual Result<Bytes> receive(std::chrono::milliseconds timeout) = 0;

    virtual TransportKind kind() const = 0;
    virtual std::string peer() const = 0;
};

/**
 * Blocking TCP client with deadlines
 */
class TcpTransport : public Transport {
public:
    TcpTransport(std::string host, uint16_t port);
    ~TcpTransport() override;

    Status open(std::chrono::milliseconds timeout) override;
    void close() override;
    bool isOpen() const override { return m_socket.is_open(); }

    Status send(const Bytes& packet) override;
    Result<Bytes> receive(std::chrono::milliseconds timeout) override;

    TransportKind kind() const override { return TransportKind::Tcp; }
    std::string peer() const override;

private:
    void runFor(std::chrono::steady_clock::duration timeout);

    std::string m_host;
    uint16_t m_port;
    asio::io_context m_io;
    asio::ip::tcp::socket m_socket;
    protocol::TcpFrameBuffer m_frames;
    std::array<uint8_t, 4096> m_readBuffer{};
};

/**
 * Blocking UDP client; one datagram is one packet
 */
class UdpTransport : public Transport {
public:
    static constexpr size_t kMaxDatagram = 65535;

    UdpTransport(std::string host, uint16_t port);
    ~UdpTransport() override;

    Status open(std::chrono::milliseconds timeout) override;
    void close() override;
    bool isOpen() const override { return m_socket.is_open(); }

    Status send(const Bytes& packet) override;
    Result<Bytes> receive(std::chrono::milliseconds timeout) override;

    TransportKind kind() const override { return TransportKind::Udp; }
    std::string peer() const override;

private:
    void runFor(std::chrono::steady_clock::duration timeout);

    std::string m_host;
    uint16_t m_port;
    asio::io_context m_io;
    asio::ip::udp::socket m_socket;
    std::vector<uint8_t> m_datagram;
};

std::unique_ptr<Transport> makeTransport(const ClientConfig& config);

} // namespace zkemu::net
