#include "gateway/transport.hpp"
#include "gateway/transport_steps.hpp"

#include <boost/asio/ssl/host_name_verification.hpp>
#include <boost/beast/ssl.hpp>
#include <openssl/err.h>
#include <openssl/ssl.h>

using tcp = net::ip::tcp;

OpenSslTransport::OpenSslTransport(const GatewayConfig &cfg)
    : fallback_host_(cfg.fallback_validation_host), user_agent_(cfg.user_agent)
{
    beast::error_code ec;
    switch (cfg.trust)
    {
    case TrustSource::system:
        ctx_.set_default_verify_paths(ec);
        break;
    case TrustSource::pem_file:
        ctx_.load_verify_file(cfg.ca_file, ec);
        break;
    case TrustSource::pem_inline:
        ctx_.add_certificate_authority(net::buffer(cfg.ca_pem), ec);
        break;
    }
    if (ec)
        throw TransportError(GatewayErrorKind::certificate_validation,
                             "could not load trust anchors: " + ec.message(), ec);

    ctx_.set_verify_mode(net::ssl::verify_peer);
}

std::unique_ptr<IFrameStream> OpenSslTransport::open(net::io_context &ioc, const GatewayAddress &addr)
{
    using Stream = BeastFrameStream<beast::ssl_stream<tcp::socket>>;

    auto results = transport_steps::resolve(ioc, addr);
    auto stream = std::make_unique<Stream>(ioc, ctx_);
    auto &ws = stream->ws();

    transport_steps::connect_tcp(beast::get_lowest_layer(ws), results);

    // SNI carries the full host; the certificate is checked against the base name.
    if (!SSL_set_tlsext_host_name(ws.next_layer().native_handle(), addr.host.c_str()))
    {
        beast::error_code ec{static_cast<int>(::ERR_get_error()), net::error::get_ssl_category()};
        throw classify_failure(FailureStage::tls_handshake, ec);
    }

    auto rejected = std::make_shared<bool>(false);
    ws.next_layer().set_verify_mode(net::ssl::verify_peer);
    ws.next_layer().set_verify_callback(
        [verify = net::ssl::host_name_verification(validation_host(addr.host, fallback_host_)),
         rejected](bool preverified, net::ssl::verify_context &vctx) {
            bool ok = verify(preverified, vctx);
            if (!ok)
                *rejected = true;
            return ok;
        });

    beast::error_code ec;
    ws.next_layer().handshake(net::ssl::stream_base::client, ec);
    if (ec)
        throw classify_failure(FailureStage::tls_handshake, ec, *rejected);

    transport_steps::upgrade(ws, addr, user_agent_);
    return stream;
}
