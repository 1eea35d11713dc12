#include "config/gateway_config.hpp"

#include <cstdlib>
#include <iostream>

const char *to_string(TransportBackend backend)
{
    return backend == TransportBackend::openssl ? "openssl" : "plain";
}

const char *to_string(ClosePolicy policy)
{
    return policy == ClosePolicy::terminal ? "terminal" : "no_message";
}

static const char *env_value(const char *key)
{
    const char *v = std::getenv(key);
    return (v && *v) ? v : nullptr;
}

GatewayConfig gateway_config_from_env(GatewayConfig cfg)
{
    if (const char *v = env_value("GATEWAY_TLS_BACKEND"))
    {
        std::string s{v};
        if (s == "openssl")
            cfg.backend = TransportBackend::openssl;
        else if (s == "plain")
            cfg.backend = TransportBackend::plain;
        else
            std::cerr << "[gateway-config] Unknown GATEWAY_TLS_BACKEND '" << s
                      << "', keeping " << to_string(cfg.backend) << "\n";
    }

    if (const char *v = env_value("GATEWAY_CA_FILE"))
    {
        cfg.ca_file = v;
        cfg.trust = TrustSource::pem_file;
    }

    if (const char *v = env_value("GATEWAY_CAPTURE_RECEIPTS"))
    {
        std::string s{v};
        if (s == "1" || s == "true" || s == "yes")
            cfg.capture_receipts = true;
        else if (s == "0" || s == "false" || s == "no")
            cfg.capture_receipts = false;
        else
            std::cerr << "[gateway-config] Unknown GATEWAY_CAPTURE_RECEIPTS '" << s << "'\n";
    }

    if (const char *v = env_value("GATEWAY_CLOSE_POLICY"))
    {
        std::string s{v};
        if (s == "terminal")
            cfg.close_policy = ClosePolicy::terminal;
        else if (s == "no_message")
            cfg.close_policy = ClosePolicy::no_message;
        else
            std::cerr << "[gateway-config] Unknown GATEWAY_CLOSE_POLICY '" << s
                      << "', keeping " << to_string(cfg.close_policy) << "\n";
    }

    if (const char *v = env_value("GATEWAY_USER_AGENT"))
        cfg.user_agent = v;

    return cfg;
}
