#include "gateway/diagnostics.hpp"

#include <cstdio>
#include <iostream>

std::string printable_bytes(std::string_view bytes)
{
    std::string out;
    out.reserve(bytes.size());
    for (char c : bytes)
    {
        auto u = static_cast<unsigned char>(c);
        if (u == '\\')
            out += "\\\\";
        else if (u >= 0x20 && u < 0x7f)
            out += c;
        else
        {
            char buf[5];
            std::snprintf(buf, sizeof(buf), "\\x%02x", u);
            out += buf;
        }
    }
    return out;
}

void StderrDiagnosticSink::decode_failed(const DecodeError &err)
{
    std::cerr << "[gateway-codec] Err deserializing " << (err.binary() ? "bytes" : "text") << ": "
              << err.what() << "; " << (err.binary() ? "bytes" : "text") << ": " << printable_bytes(err.raw())
              << "\n";
}
