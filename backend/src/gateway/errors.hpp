#pragma once
#include <boost/system/error_code.hpp>

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>

// Closed set of failure kinds. Callers branch on kind(), never on what().
enum class GatewayErrorKind
{
    certificate_validation, // peer certificate or hostname rejected before the upgrade
    handshake_failure,      // TLS or websocket upgrade refused by the peer
    io,                     // stream failure during connect, read or write
    malformed,              // payload (inflated if binary) is not valid JSON
    connection_closed,      // peer sent a close frame
    encode,                 // outbound value could not be serialized
};

const char *to_string(GatewayErrorKind kind);

class GatewayError : public std::runtime_error
{
public:
    GatewayError(GatewayErrorKind kind, const std::string &what)
        : std::runtime_error(what), kind_(kind) {}

    GatewayErrorKind kind() const noexcept { return kind_; }

private:
    GatewayErrorKind kind_;
};

class TransportError : public GatewayError
{
public:
    TransportError(GatewayErrorKind kind, const std::string &what, boost::system::error_code ec = {});

    const boost::system::error_code &code() const noexcept { return ec_; }

private:
    boost::system::error_code ec_;
};

class DecodeError : public GatewayError
{
public:
    DecodeError(const std::string &what, std::string raw, bool binary,
                std::optional<std::string> inflated = std::nullopt);

    // Bytes exactly as received on the wire.
    const std::string &raw() const noexcept { return raw_; }
    bool binary() const noexcept { return binary_; }
    // Only set for binary frames that inflated but failed to parse.
    const std::optional<std::string> &inflated() const noexcept { return inflated_; }

private:
    std::string raw_;
    bool binary_;
    std::optional<std::string> inflated_;
};

class ConnectionClosedError : public GatewayError
{
public:
    ConnectionClosedError(std::optional<std::uint16_t> code, std::string reason);

    const std::optional<std::uint16_t> &close_code() const noexcept { return code_; }
    const std::string &reason() const noexcept { return reason_; }

private:
    std::optional<std::uint16_t> code_;
    std::string reason_;
};

class EncodeError : public GatewayError
{
public:
    explicit EncodeError(const std::string &what)
        : GatewayError(GatewayErrorKind::encode, what) {}
};
