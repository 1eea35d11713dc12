#include "gateway/transport.hpp"
#include "gateway/transport_steps.hpp"

using tcp = net::ip::tcp;

std::unique_ptr<IFrameStream> PlainTransport::open(net::io_context &ioc, const GatewayAddress &addr)
{
    auto results = transport_steps::resolve(ioc, addr);
    auto stream = std::make_unique<BeastFrameStream<tcp::socket>>(ioc);

    transport_steps::connect_tcp(stream->ws().next_layer(), results);
    transport_steps::upgrade(stream->ws(), addr, user_agent_);
    return stream;
}
