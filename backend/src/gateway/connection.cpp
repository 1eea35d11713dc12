#include "gateway/connection.hpp"

#include "gateway/classify.hpp"
#include "gateway/errors.hpp"
#include "gateway/frame_stream.hpp"
#include "gateway/transport.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>
#include <iostream>
#include <stdexcept>

struct GatewayConnection::Impl
{
    enum class State { open, closed, failed };

    // Members are torn down bottom-up: the stream goes first, then the
    // transport that owns the SSL context, the io_context last.
    net::io_context ioc{1};
    GatewayAddress addr;
    ControlFrameHandler control;

    State state = State::open;
    CloseFrame close_info;

    beast::flat_buffer buffer;
    bool read_pending = false;
    bool read_done = false;
    beast::error_code read_ec;

    std::unique_ptr<ISecureTransport> transport;
    std::unique_ptr<IFrameStream> ws;

    ~Impl()
    {
        if (ws && state == State::open)
            ws->shutdown_socket();
    }

    void ensure_usable() const
    {
        if (state == State::closed)
            throw ConnectionClosedError(close_info.code, close_info.reason);
        if (state == State::failed)
            throw TransportError(GatewayErrorKind::io, "connection is no longer usable");
    }

    // Runs handlers until done flips. False if the io_context ran dry first.
    bool drive_until(const bool &done)
    {
        ioc.restart();
        while (!done)
        {
            if (ioc.run_one() == 0)
                return false;
        }
        return true;
    }

    void mark_closed_by_peer()
    {
        state = State::closed;
        const auto &r = ws->reason();
        close_info.code = r.code == websocket::close_code::none
                              ? std::nullopt
                              : std::optional<std::uint16_t>(static_cast<std::uint16_t>(r.code));
        close_info.reason.assign(r.reason.data(), r.reason.size());
    }

    std::optional<WireFrame> read_frame(bool blocking)
    {
        ensure_usable();

        if (!read_pending)
        {
            read_pending = true;
            read_done = false;
            ws->async_read(buffer, [this](beast::error_code ec, std::size_t) {
                read_ec = ec;
                read_done = true;
            });
        }

        if (blocking)
        {
            if (!drive_until(read_done))
            {
                state = State::failed;
                throw TransportError(GatewayErrorKind::io, "read stalled with no pending work");
            }
        }
        else
        {
            ioc.restart();
            ioc.poll();
            if (!read_done)
                return std::nullopt;
        }

        read_pending = false;
        if (read_ec == websocket::error::closed)
        {
            mark_closed_by_peer();
            return WireFrame{close_info};
        }
        if (read_ec)
        {
            state = State::failed;
            throw classify_failure(FailureStage::read, read_ec);
        }

        std::string data = beast::buffers_to_string(buffer.cdata());
        buffer.consume(buffer.size());
        if (ws->got_binary())
            return WireFrame{BinaryFrame{std::move(data)}};
        return WireFrame{TextFrame{std::move(data)}};
    }

    void write_text(const std::string &payload)
    {
        ensure_usable();

        bool done = false;
        beast::error_code ec;
        ws->async_write_text(net::buffer(payload), [&](beast::error_code e, std::size_t) {
            ec = e;
            done = true;
        });
        if (!drive_until(done))
        {
            state = State::failed;
            throw TransportError(GatewayErrorKind::io, "write stalled with no pending work");
        }

        if (ec == websocket::error::closed)
        {
            mark_closed_by_peer();
            throw ConnectionClosedError(close_info.code, close_info.reason);
        }
        if (ec)
        {
            state = State::failed;
            throw classify_failure(FailureStage::write, ec);
        }
    }

    void close(std::uint16_t code)
    {
        ensure_usable();

        bool done = false;
        beast::error_code ec;
        ws->async_close(websocket::close_reason(code), [&](beast::error_code e) {
            ec = e;
            done = true;
        });
        bool finished = drive_until(done);

        state = State::closed;
        close_info = CloseFrame{code, "closed by client"};
        if (!finished)
            throw TransportError(GatewayErrorKind::io, "close stalled with no pending work");
        if (ec && ec != websocket::error::closed && ec != net::error::operation_aborted)
            throw classify_failure(FailureStage::close, ec);
    }
};

GatewayConnection::GatewayConnection(std::unique_ptr<Impl> impl) : impl_(std::move(impl)) {}
GatewayConnection::~GatewayConnection() = default;
GatewayConnection::GatewayConnection(GatewayConnection &&) noexcept = default;
GatewayConnection &GatewayConnection::operator=(GatewayConnection &&) noexcept = default;

std::optional<WireFrame> GatewayConnection::read_frame(bool blocking) { return impl_->read_frame(blocking); }
void GatewayConnection::write_text(const std::string &payload) { impl_->write_text(payload); }
void GatewayConnection::close(std::uint16_t code) { impl_->close(code); }

void GatewayConnection::cancel() noexcept
{
    if (!impl_ || !impl_->ws)
        return;
    net::post(impl_->ioc, [s = impl_->ws.get()] { s->shutdown_socket(); });
}

bool GatewayConnection::is_open() const { return impl_ && impl_->state == Impl::State::open; }
const GatewayAddress &GatewayConnection::address() const { return impl_->addr; }
const char *GatewayConnection::backend_name() const { return impl_->transport->name(); }
const ControlStats &GatewayConnection::control_stats() const
{
    static const ControlStats none;
    return impl_ ? impl_->control.stats() : none;
}

GatewayConnection gateway_connect(const std::string &address, const GatewayConfig &cfg)
{
    GatewayAddress addr = parse_gateway_address(address);
    if (addr.secure() != (cfg.backend == TransportBackend::openssl))
        throw std::invalid_argument("scheme '" + addr.scheme + "' does not match transport backend '" +
                                    to_string(cfg.backend) + "'");

    auto impl = std::make_unique<GatewayConnection::Impl>();
    impl->addr = addr;
    try
    {
        impl->transport = make_secure_transport(cfg);
        impl->ws = impl->transport->open(impl->ioc, addr);
    }
    catch (const TransportError &e)
    {
        std::cerr << "[gateway-connect] " << addr.host << ":" << addr.port << " " << to_string(e.kind())
                  << ": " << e.what() << "\n";
        throw;
    }
    impl->control.attach(*impl->ws);
    return GatewayConnection(std::move(impl));
}
