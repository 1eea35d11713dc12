#pragma once
// Connection steps shared by the transport backends.
#include "gateway/address.hpp"
#include "gateway/classify.hpp"

#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>

#include <string>

namespace transport_steps {

using tcp = boost::asio::ip::tcp;

inline tcp::resolver::results_type resolve(boost::asio::io_context &ioc, const GatewayAddress &addr)
{
    tcp::resolver resolver{ioc};
    boost::beast::error_code ec;
    auto results = resolver.resolve(addr.host, addr.port, ec);
    if (ec)
        throw classify_failure(FailureStage::resolve, ec);
    return results;
}

template <class Socket>
void connect_tcp(Socket &sock, const tcp::resolver::results_type &results)
{
    boost::beast::error_code ec;
    boost::asio::connect(sock, results, ec);
    if (ec)
        throw classify_failure(FailureStage::tcp_connect, ec);
}

// Host header value: the port is only spelled out when it is not the default.
inline std::string host_header(const GatewayAddress &addr)
{
    const char *def = addr.secure() ? "443" : "80";
    std::string host = addr.host.find(':') != std::string::npos ? "[" + addr.host + "]" : addr.host;
    return addr.port == def ? host : host + ":" + addr.port;
}

template <class NextLayer>
void upgrade(boost::beast::websocket::stream<NextLayer> &ws, const GatewayAddress &addr,
             const std::string &user_agent)
{
    namespace websocket = boost::beast::websocket;
    namespace http = boost::beast::http;

    ws.set_option(websocket::stream_base::timeout::suggested(boost::beast::role_type::client));
    ws.set_option(websocket::stream_base::decorator([user_agent](websocket::request_type &req) {
        req.set(http::field::user_agent, user_agent);
    }));

    boost::beast::error_code ec;
    ws.handshake(host_header(addr), addr.target, ec);
    if (ec)
        throw classify_failure(FailureStage::upgrade, ec);
}

} // namespace transport_steps
