#pragma once
#include "config/gateway_config.hpp"
#include "gateway/address.hpp"
#include "gateway/frame_stream.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ssl/context.hpp>

#include <memory>
#include <string>

// A way of turning a gateway address into an upgraded websocket.
// open() either returns a fully upgraded stream or throws TransportError;
// nothing half-connected ever escapes.
struct ISecureTransport
{
    virtual ~ISecureTransport() = default;
    virtual const char *name() const = 0;
    virtual std::unique_ptr<IFrameStream> open(net::io_context &ioc, const GatewayAddress &addr) = 0;
};

// wss:// over Boost.Asio SSL. Owns the SSL context, so it must outlive every
// stream it opened.
class OpenSslTransport : public ISecureTransport
{
public:
    explicit OpenSslTransport(const GatewayConfig &cfg);

    const char *name() const override { return "openssl"; }
    std::unique_ptr<IFrameStream> open(net::io_context &ioc, const GatewayAddress &addr) override;

private:
    net::ssl::context ctx_{net::ssl::context::tls_client};
    std::string fallback_host_;
    std::string user_agent_;
};

// ws:// with no TLS at all.
class PlainTransport : public ISecureTransport
{
public:
    explicit PlainTransport(const GatewayConfig &cfg) : user_agent_(cfg.user_agent) {}

    const char *name() const override { return "plain"; }
    std::unique_ptr<IFrameStream> open(net::io_context &ioc, const GatewayAddress &addr) override;

private:
    std::string user_agent_;
};

std::unique_ptr<ISecureTransport> make_secure_transport(const GatewayConfig &cfg);
