#include "gateway/address.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

GatewayAddress parse_gateway_address(std::string_view url)
{
    GatewayAddress out;

    auto sep = url.find("://");
    if (sep == std::string_view::npos)
        throw std::invalid_argument("gateway address has no scheme: " + std::string(url));

    out.scheme.assign(url.substr(0, sep));
    std::transform(out.scheme.begin(), out.scheme.end(), out.scheme.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (out.scheme != "ws" && out.scheme != "wss")
        throw std::invalid_argument("unsupported gateway scheme: " + out.scheme);

    std::string_view rest = url.substr(sep + 3);
    auto path_at = rest.find_first_of("/?");
    std::string_view authority = rest.substr(0, path_at);
    if (path_at == std::string_view::npos)
        out.target = "/";
    else if (rest[path_at] == '?')
        out.target = "/" + std::string(rest.substr(path_at));
    else
        out.target.assign(rest.substr(path_at));

    // Drop userinfo, it is never sent on the upgrade request.
    if (auto at = authority.rfind('@'); at != std::string_view::npos)
        authority.remove_prefix(at + 1);

    std::string_view host = authority;
    std::string_view port;
    if (!authority.empty() && authority.front() == '[')
    {
        auto close = authority.find(']');
        if (close == std::string_view::npos)
            throw std::invalid_argument("unterminated IPv6 literal in gateway address");
        host = authority.substr(1, close - 1);
        if (close + 1 < authority.size())
        {
            if (authority[close + 1] != ':')
                throw std::invalid_argument("garbage after IPv6 literal in gateway address");
            port = authority.substr(close + 2);
        }
    }
    else if (auto colon = authority.rfind(':'); colon != std::string_view::npos)
    {
        host = authority.substr(0, colon);
        port = authority.substr(colon + 1);
    }

    if (host.empty())
        throw std::invalid_argument("gateway address has no host: " + std::string(url));
    if (!port.empty() && !std::all_of(port.begin(), port.end(),
                                      [](unsigned char c) { return std::isdigit(c) != 0; }))
        throw std::invalid_argument("invalid port in gateway address: " + std::string(port));

    out.host.assign(host);
    if (port.empty())
        out.port = out.secure() ? "443" : "80";
    else
        out.port.assign(port);
    return out;
}

std::string validation_host(std::string_view host, std::string_view fallback)
{
    if (host.empty())
        return std::string(fallback);

    auto last = host.rfind('.');
    if (last == std::string_view::npos || last == 0)
        return std::string(host);
    auto second = host.rfind('.', last - 1);
    // No second dot, or it is the very first character: keep the host whole.
    if (second == std::string_view::npos || second == 0)
        return std::string(host);
    return std::string(host.substr(second + 1));
}
