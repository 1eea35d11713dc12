#pragma once
#include <string>
#include <string_view>

// A parsed ws:// or wss:// gateway URL.
struct GatewayAddress
{
    std::string scheme; // "ws" or "wss"
    std::string host;
    std::string port;   // defaults to 80 / 443
    std::string target; // path + query, at least "/"

    bool secure() const { return scheme == "wss"; }
};

// Throws std::invalid_argument for anything that is not a ws/wss URL with a host.
GatewayAddress parse_gateway_address(std::string_view url);

// Name the peer certificate is validated against: everything after the
// second-from-right '.' of the host ("gateway.discord.gg" -> "discord.gg").
// Hosts with fewer than two dots are used whole; an empty host yields fallback.
std::string validation_host(std::string_view host, std::string_view fallback);
