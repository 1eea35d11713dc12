#include "config/gateway_config.hpp"
#include "gateway/codec.hpp"
#include "gateway/connection.hpp"
#include "gateway/errors.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdlib>
#include <iostream>
#include <string>

using json = nlohmann::json;

// gateway_probe <url> [max_messages] [max_seconds]
//
// Connects to a gateway, prints every decoded payload and stops after
// max_messages payloads or max_seconds, whichever comes first.
// Backend, trust anchors and close policy come from GATEWAY_* env vars.
int main(int argc, char **argv)
{
    if (argc < 2)
    {
        std::cerr << "usage: " << argv[0] << " <ws(s)://host[:port]/path> [max_messages] [max_seconds]\n";
        return 2;
    }

    const std::string url = argv[1];
    const long max_messages = argc > 2 ? std::strtol(argv[2], nullptr, 10) : 10;
    const long max_seconds = argc > 3 ? std::strtol(argv[3], nullptr, 10) : 30;

    GatewayConfig cfg;
    if (url.rfind("ws://", 0) == 0)
        cfg.backend = TransportBackend::plain;
    cfg = gateway_config_from_env(cfg);

    try
    {
        GatewayCodec codec{gateway_connect(url, cfg), cfg};
        std::cout << "[gateway-probe] connected to " << codec.connection().address().host
                  << " via " << codec.connection().backend_name() << "\n";

        const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(max_seconds);
        long seen = 0;
        while (seen < max_messages && std::chrono::steady_clock::now() < deadline)
        {
            auto ev = codec.receive_decoded(true);
            if (!ev)
                break; // closed under no_message policy

            ++seen;
            if (ev->outcome.ok())
                std::cout << ev->outcome.value->dump() << "\n";
            else
                std::cout << "[gateway-probe] undecodable " << (ev->outcome.error->binary() ? "binary" : "text")
                          << " frame (" << ev->outcome.error->raw().size() << " bytes)\n";
        }

        const auto &stats = codec.connection().control_stats();
        std::cout << "[gateway-probe] " << seen << " messages, " << stats.pings << " pings answered\n";
        if (codec.connection().is_open())
            codec.close();
    }
    catch (const GatewayError &e)
    {
        std::cerr << "[gateway-probe] " << to_string(e.kind()) << ": " << e.what() << "\n";
        return 1;
    }
    catch (const std::invalid_argument &e)
    {
        std::cerr << "[gateway-probe] " << e.what() << "\n";
        return 2;
    }
    return 0;
}
