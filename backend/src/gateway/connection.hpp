#pragma once
#include "config/gateway_config.hpp"
#include "gateway/address.hpp"
#include "gateway/control_frames.hpp"
#include "gateway/wire_frame.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

// One established gateway session.
// Not thread-safe: exactly one owner drives it at a time. The only call that
// may come from another thread is cancel().
class GatewayConnection
{
public:
    ~GatewayConnection();
    GatewayConnection(GatewayConnection &&) noexcept;
    GatewayConnection &operator=(GatewayConnection &&) noexcept;
    GatewayConnection(const GatewayConnection &) = delete;
    GatewayConnection &operator=(const GatewayConnection &) = delete;

    // Next data frame (text or binary), or a CloseFrame when the peer closed.
    // blocking = false returns std::nullopt right away when nothing is queued;
    // the underlying read stays in flight for the next call.
    // Throws TransportError on stream failure, ConnectionClosedError once closed.
    std::optional<WireFrame> read_frame(bool blocking);

    void write_text(const std::string &payload);

    // Sends a close frame and waits for the peer's answer.
    // Throws like read_frame() when the connection is already closed or failed.
    void close(std::uint16_t code = 1000);

    // Safe from any thread. Tears down the socket so a blocking read_frame()
    // elsewhere returns with an io failure. No-op on a moved-from connection.
    void cancel() noexcept;

    // False for a moved-from connection too.
    bool is_open() const;
    const GatewayAddress &address() const;
    const char *backend_name() const;
    const ControlStats &control_stats() const;

private:
    struct Impl;
    explicit GatewayConnection(std::unique_ptr<Impl> impl);
    friend GatewayConnection gateway_connect(const std::string &address, const GatewayConfig &cfg);

    std::unique_ptr<Impl> impl_;
};

// Opens the socket, secures it with the configured backend and performs the
// websocket upgrade. Throws TransportError (certificate_validation,
// handshake_failure, io) and std::invalid_argument for a bad address.
GatewayConnection gateway_connect(const std::string &address, const GatewayConfig &cfg);
