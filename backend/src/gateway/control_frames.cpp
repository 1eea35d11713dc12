#include "gateway/control_frames.hpp"

void ControlFrameHandler::on_frame(websocket::frame_type kind, beast::string_view payload)
{
    switch (kind)
    {
    case websocket::frame_type::ping:
        ++stats_.pings;
        stats_.last_ping.assign(payload.data(), payload.size());
        break;
    case websocket::frame_type::pong:
        ++stats_.pongs;
        stats_.last_pong.assign(payload.data(), payload.size());
        break;
    case websocket::frame_type::close:
        // Close is picked up from the stream's reason() once the read completes.
        break;
    }
}

void ControlFrameHandler::attach(IFrameStream &stream)
{
    stream.control_callback([this](websocket::frame_type kind, beast::string_view payload) {
        on_frame(kind, payload);
    });
}
