#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <variant>

// One frame as it travels on the gateway socket.
// Payloads are kept as raw bytes in std::string, same as the rest of the backend.
struct TextFrame   { std::string payload; };
struct BinaryFrame { std::string payload; };
struct PingFrame   { std::string payload; };
struct PongFrame   { std::string payload; };
struct CloseFrame
{
    std::optional<std::uint16_t> code;
    std::string reason;
};

using WireFrame = std::variant<TextFrame, BinaryFrame, PingFrame, PongFrame, CloseFrame>;

