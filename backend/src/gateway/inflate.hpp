#pragma once
#include <string>
#include <string_view>

// Inflates one complete zlib stream (RFC 1950 header, not raw deflate).
// On failure returns false and sets err; out holds whatever was produced.
bool zlib_inflate(std::string_view in, std::string &out, std::string &err);
