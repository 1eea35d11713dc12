#include "gateway/transport.hpp"

std::unique_ptr<ISecureTransport> make_secure_transport(const GatewayConfig &cfg)
{
    switch (cfg.backend)
    {
    case TransportBackend::openssl:
        return std::make_unique<OpenSslTransport>(cfg);
    case TransportBackend::plain:
        return std::make_unique<PlainTransport>(cfg);
    }
    return nullptr;
}
