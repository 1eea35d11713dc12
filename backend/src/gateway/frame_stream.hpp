#pragma once
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>

#include <cstddef>
#include <functional>
#include <utility>

namespace beast = boost::beast;
namespace websocket = beast::websocket;
namespace net = boost::asio;

// Type-erased upgraded websocket. Lets the connection hold either a plain or a
// TLS stream chosen at runtime by the transport backend.
class IFrameStream
{
public:
    using IoHandler = std::function<void(beast::error_code, std::size_t)>;
    using CloseHandler = std::function<void(beast::error_code)>;
    using ControlCallback = std::function<void(websocket::frame_type, beast::string_view)>;

    virtual ~IFrameStream() = default;

    virtual void async_read(beast::flat_buffer &buffer, IoHandler handler) = 0;
    virtual void async_write_text(net::const_buffer payload, IoHandler handler) = 0;
    virtual void async_close(const websocket::close_reason &reason, CloseHandler handler) = 0;

    // Whether the last completed read was a binary message.
    virtual bool got_binary() const = 0;
    virtual const websocket::close_reason &reason() const = 0;
    virtual void control_callback(ControlCallback cb) = 0;

    // Hard stop: cancels pending operations with operation_aborted.
    virtual void shutdown_socket() noexcept = 0;
};

template <class NextLayer>
class BeastFrameStream final : public IFrameStream
{
public:
    template <class... Args>
    explicit BeastFrameStream(Args &&...args) : ws_(std::forward<Args>(args)...) {}

    websocket::stream<NextLayer> &ws() { return ws_; }

    void async_read(beast::flat_buffer &buffer, IoHandler handler) override
    {
        ws_.async_read(buffer, std::move(handler));
    }

    void async_write_text(net::const_buffer payload, IoHandler handler) override
    {
        ws_.text(true);
        ws_.async_write(payload, std::move(handler));
    }

    void async_close(const websocket::close_reason &reason, CloseHandler handler) override
    {
        ws_.async_close(reason, std::move(handler));
    }

    bool got_binary() const override { return ws_.got_binary(); }
    const websocket::close_reason &reason() const override { return ws_.reason(); }
    void control_callback(ControlCallback cb) override { ws_.control_callback(std::move(cb)); }

    void shutdown_socket() noexcept override
    {
        beast::error_code ec;
        auto &sock = beast::get_lowest_layer(ws_);
        sock.shutdown(net::ip::tcp::socket::shutdown_both, ec);
        sock.close(ec);
    }

private:
    websocket::stream<NextLayer> ws_;
};
