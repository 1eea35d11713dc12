#pragma once
#include "gateway/errors.hpp"

#include <boost/system/error_code.hpp>

// Where in the life of a connection a failure was observed.
enum class FailureStage
{
    resolve,
    tcp_connect,
    tls_handshake,
    upgrade,
    read,
    write,
    close,
};

const char *to_string(FailureStage stage);

// Maps a Boost/OpenSSL/Beast error into the closed taxonomy.
// certificate_rejected is set when the verify callback refused the peer.
TransportError classify_failure(FailureStage stage, const boost::system::error_code &ec,
                                bool certificate_rejected = false);
