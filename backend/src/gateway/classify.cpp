#include "gateway/classify.hpp"

#include <boost/asio/error.hpp>
#include <boost/asio/ssl/error.hpp>
#include <openssl/err.h>
#include <openssl/ssl.h>

namespace net = boost::asio;

const char *to_string(FailureStage stage)
{
    switch (stage)
    {
    case FailureStage::resolve:       return "resolve";
    case FailureStage::tcp_connect:   return "tcp connect";
    case FailureStage::tls_handshake: return "TLS handshake";
    case FailureStage::upgrade:       return "websocket upgrade";
    case FailureStage::read:          return "read";
    case FailureStage::write:         return "write";
    case FailureStage::close:         return "close";
    }
    return "unknown";
}

static bool is_certificate_failure(const boost::system::error_code &ec)
{
    if (ec.category() != net::error::get_ssl_category())
        return false;
    return ERR_GET_REASON(static_cast<unsigned long>(ec.value())) == SSL_R_CERTIFICATE_VERIFY_FAILED;
}

static bool is_plain_io(const boost::system::error_code &ec)
{
    return ec.category() == boost::system::system_category() ||
           ec.category() == net::error::get_misc_category() ||
           ec.category() == net::error::get_netdb_category() ||
           ec.category() == net::error::get_addrinfo_category();
}

TransportError classify_failure(FailureStage stage, const boost::system::error_code &ec,
                                bool certificate_rejected)
{
    std::string what = std::string(to_string(stage)) + " failed: " + ec.message();

    if (certificate_rejected || is_certificate_failure(ec))
        return TransportError(GatewayErrorKind::certificate_validation,
                              "peer certificate rejected during " + what, ec);

    if ((stage == FailureStage::tls_handshake || stage == FailureStage::upgrade) && !is_plain_io(ec))
        return TransportError(GatewayErrorKind::handshake_failure, what, ec);

    return TransportError(GatewayErrorKind::io, what, ec);
}
