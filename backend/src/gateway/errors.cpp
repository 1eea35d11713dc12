#include "gateway/errors.hpp"

#include <utility>

const char *to_string(GatewayErrorKind kind)
{
    switch (kind)
    {
    case GatewayErrorKind::certificate_validation: return "certificate_validation";
    case GatewayErrorKind::handshake_failure:      return "handshake_failure";
    case GatewayErrorKind::io:                     return "io";
    case GatewayErrorKind::malformed:              return "malformed";
    case GatewayErrorKind::connection_closed:      return "connection_closed";
    case GatewayErrorKind::encode:                 return "encode";
    }
    return "unknown";
}

TransportError::TransportError(GatewayErrorKind kind, const std::string &what, boost::system::error_code ec)
    : GatewayError(kind, what), ec_(ec) {}

DecodeError::DecodeError(const std::string &what, std::string raw, bool binary,
                         std::optional<std::string> inflated)
    : GatewayError(GatewayErrorKind::malformed, what),
      raw_(std::move(raw)), binary_(binary), inflated_(std::move(inflated)) {}

static std::string describe_close(const std::optional<std::uint16_t> &code, const std::string &reason)
{
    std::string out = "connection closed";
    if (code)
        out += " (code " + std::to_string(*code) + ")";
    if (!reason.empty())
        out += ": " + reason;
    return out;
}

ConnectionClosedError::ConnectionClosedError(std::optional<std::uint16_t> code, std::string reason)
    : GatewayError(GatewayErrorKind::connection_closed, describe_close(code, reason)),
      code_(code), reason_(std::move(reason)) {}
