#pragma once
#include "gateway/frame_stream.hpp"

#include <cstdint>
#include <string>

// Keep-alive bookkeeping for the control frames Beast consumes inside read.
// Beast answers each ping with a pong carrying the same payload before the
// read goes on, so nothing here writes to the socket.
struct ControlStats
{
    std::uint64_t pings = 0;
    std::uint64_t pongs = 0;
    std::string last_ping;
    std::string last_pong;
};

class ControlFrameHandler
{
public:
    void on_frame(websocket::frame_type kind, beast::string_view payload);

    // Installs this handler as the stream's control callback.
    // The handler must outlive the stream's pending operations.
    void attach(IFrameStream &stream);

    const ControlStats &stats() const { return stats_; }

private:
    ControlStats stats_;
};
