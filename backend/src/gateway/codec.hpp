#pragma once
#include "config/gateway_config.hpp"
#include "gateway/connection.hpp"
#include "gateway/diagnostics.hpp"
#include "gateway/errors.hpp"
#include "gateway/wire_frame.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <memory>
#include <optional>

// Filled only when GatewayConfig::capture_receipts is on.
struct ReceiptMetadata
{
    std::chrono::system_clock::time_point received_at;
    std::chrono::steady_clock::time_point received_steady;
    WireFrame frame;
};

struct DecodedEvent
{
    std::optional<ReceiptMetadata> receipt;
};

// Either a parsed value or the reason it could not be parsed.
struct DecodeOutcome
{
    std::optional<nlohmann::json> value;
    std::optional<DecodeError> error;

    bool ok() const { return !error.has_value(); }
};

struct ReceivedEvent
{
    DecodedEvent event;
    DecodeOutcome outcome;
};

// Text frames are parsed as JSON, binary frames are zlib-inflated first.
// Failures go to sink and come back as the outcome's error.
// Ping, pong and close frames yield std::nullopt.
std::optional<DecodeOutcome> decode_frame(const WireFrame &frame, IDiagnosticSink &sink);

// JSON in, JSON out over one gateway connection.
class GatewayCodec
{
public:
    // sink may be null, in which case failures are logged to stderr.
    GatewayCodec(GatewayConnection conn, const GatewayConfig &cfg,
                 std::shared_ptr<IDiagnosticSink> sink = nullptr);

    // std::nullopt means no message is available right now (polling), or the
    // peer closed under ClosePolicy::no_message. A bad payload is reported in
    // the outcome and leaves the connection usable.
    // Throws TransportError, and ConnectionClosedError on a terminal close.
    std::optional<ReceivedEvent> receive_decoded(bool blocking);

    // Compact JSON dump, sent as a single text frame. Never compressed.
    // Throws EncodeError, TransportError or ConnectionClosedError.
    void send_encoded(const nlohmann::json &value);

    void close(std::uint16_t code = 1000) { conn_.close(code); }
    void cancel() noexcept { conn_.cancel(); }

    GatewayConnection &connection() { return conn_; }
    const GatewayConnection &connection() const { return conn_; }

private:
    GatewayConnection conn_;
    bool capture_receipts_;
    ClosePolicy close_policy_;
    std::shared_ptr<IDiagnosticSink> sink_;
};
