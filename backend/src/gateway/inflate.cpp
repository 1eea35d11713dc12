#include "gateway/inflate.hpp"

#include <zlib.h>

bool zlib_inflate(std::string_view in, std::string &out, std::string &err)
{
    out.clear();

    z_stream zs{};
    int ret = inflateInit(&zs);
    if (ret != Z_OK)
    {
        err = std::string("inflateInit failed: ") + zError(ret);
        return false;
    }

    zs.next_in = reinterpret_cast<Bytef *>(const_cast<char *>(in.data()));
    zs.avail_in = static_cast<uInt>(in.size());

    char chunk[16384];
    do
    {
        zs.next_out = reinterpret_cast<Bytef *>(chunk);
        zs.avail_out = sizeof(chunk);
        ret = inflate(&zs, Z_NO_FLUSH);
        if (ret == Z_NEED_DICT || ret == Z_DATA_ERROR || ret == Z_MEM_ERROR || ret == Z_STREAM_ERROR)
        {
            err = zs.msg ? zs.msg : zError(ret);
            inflateEnd(&zs);
            return false;
        }
        out.append(chunk, sizeof(chunk) - zs.avail_out);
        // Z_BUF_ERROR: input used up before the end of the stream.
    } while (ret != Z_STREAM_END && ret != Z_BUF_ERROR);

    inflateEnd(&zs);
    if (ret != Z_STREAM_END)
    {
        err = "truncated zlib stream";
        return false;
    }
    return true;
}
