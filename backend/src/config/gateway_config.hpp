#pragma once

#include <string>

// Which secure-transport implementation gateway_connect() uses.
enum class TransportBackend
{
    openssl, // wss:// through Boost.Asio SSL on OpenSSL
    plain,   // ws:// without TLS, for local endpoints
};

// Where the OpenSSL backend gets its trust anchors from.
enum class TrustSource
{
    system,     // OpenSSL default verify paths
    pem_file,   // ca_file
    pem_inline, // ca_pem
};

// What receive_decoded() does when the peer sends a close frame.
enum class ClosePolicy
{
    terminal,   // throw ConnectionClosedError with code and reason
    no_message, // report "nothing available" once, then fail like terminal
};

struct GatewayConfig
{
    TransportBackend backend = TransportBackend::openssl;
    TrustSource trust = TrustSource::system;
    std::string ca_file;
    std::string ca_pem;

    // Validation name used when the address carries no host.
    std::string fallback_validation_host = "discord.gg";

    // Attach timestamps and a raw frame copy to every decoded event.
    bool capture_receipts = false;

    ClosePolicy close_policy = ClosePolicy::terminal;

    std::string user_agent = "gateway-ws/0.1";
};

// Overlays GATEWAY_* environment variables on top of base.
// Unknown values are reported on stderr and leave the field untouched.
GatewayConfig gateway_config_from_env(GatewayConfig base = {});

const char *to_string(TransportBackend backend);
const char *to_string(ClosePolicy policy);
