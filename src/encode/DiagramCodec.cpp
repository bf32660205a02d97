#include "drawlink/encode/DiagramCodec.h"
#include "drawlink/core/Errors.h"

#include <zlib.h>

#include <array>
#include <format>

namespace drawlink::codec {

namespace {

constexpr size_t ZLIB_HEADER_SIZE = 2;
constexpr size_t ZLIB_TRAILER_SIZE = 4;
constexpr size_t INFLATE_CHUNK = 16384;

constexpr const char* BASE64_TABLE =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

int base64Value(char c) {
    if (c >= 'A' && c <= 'Z') return c - 'A';
    if (c >= 'a' && c <= 'z') return c - 'a' + 26;
    if (c >= '0' && c <= '9') return c - '0' + 52;
    if (c == '+') return 62;
    if (c == '/') return 63;
    return -1;
}

int hexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    return -1;
}

bool isUnreserved(unsigned char c) {
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9');
}

}  // namespace

std::string deflateRaw(std::string_view data, int level) {
    if (level < Z_DEFAULT_COMPRESSION || level > Z_BEST_COMPRESSION) {
        throw CodecError(std::format("invalid compression level: {}", level));
    }

    uLongf bound = compressBound(static_cast<uLong>(data.size()));
    std::string compressed;
    compressed.resize(bound);

    int zres = compress2(reinterpret_cast<Bytef*>(compressed.data()), &bound,
                         reinterpret_cast<const Bytef*>(data.data()),
                         static_cast<uLong>(data.size()), level);
    if (zres != Z_OK) {
        throw CodecError(std::format("compress2 failed: {}", zError(zres)));
    }
    compressed.resize(bound);

    if (compressed.size() < ZLIB_HEADER_SIZE + ZLIB_TRAILER_SIZE) {
        throw CodecError("zlib stream shorter than its framing");
    }
    return compressed.substr(ZLIB_HEADER_SIZE,
                             compressed.size() - ZLIB_HEADER_SIZE - ZLIB_TRAILER_SIZE);
}

std::string inflateRaw(std::string_view compressed) {
    z_stream stream{};
    // Negative window bits: raw deflate, no header or checksum
    if (inflateInit2(&stream, -MAX_WBITS) != Z_OK) {
        throw CodecError("inflateInit2 failed");
    }

    stream.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(compressed.data()));
    stream.avail_in = static_cast<uInt>(compressed.size());

    std::string output;
    std::array<char, INFLATE_CHUNK> buffer;
    int zres = Z_OK;
    do {
        stream.next_out = reinterpret_cast<Bytef*>(buffer.data());
        stream.avail_out = static_cast<uInt>(buffer.size());

        zres = inflate(&stream, Z_NO_FLUSH);
        if (zres != Z_OK && zres != Z_STREAM_END) {
            std::string message = stream.msg ? stream.msg : zError(zres);
            inflateEnd(&stream);
            throw CodecError("inflate failed: " + message);
        }
        output.append(buffer.data(), buffer.size() - stream.avail_out);

        if (zres == Z_OK && stream.avail_in == 0 && stream.avail_out != 0) {
            // All input consumed without reaching the final block
            inflateEnd(&stream);
            throw CodecError("inflate failed: truncated deflate stream");
        }
    } while (zres != Z_STREAM_END);

    inflateEnd(&stream);
    return output;
}

std::string base64Encode(std::string_view data) {
    std::string out;
    size_t i = 0, n = data.size();
    out.reserve(((n + 2) / 3) * 4);

    auto byteAt = [&](size_t idx) { return static_cast<unsigned>(static_cast<unsigned char>(data[idx])); };

    while (i + 2 < n) {
        unsigned v = (byteAt(i) << 16) | (byteAt(i + 1) << 8) | byteAt(i + 2);
        out.push_back(BASE64_TABLE[(v >> 18) & 63]);
        out.push_back(BASE64_TABLE[(v >> 12) & 63]);
        out.push_back(BASE64_TABLE[(v >> 6) & 63]);
        out.push_back(BASE64_TABLE[v & 63]);
        i += 3;
    }
    if (i + 1 == n) {
        unsigned v = byteAt(i) << 16;
        out.push_back(BASE64_TABLE[(v >> 18) & 63]);
        out.push_back(BASE64_TABLE[(v >> 12) & 63]);
        out.append("==");
    } else if (i + 2 == n) {
        unsigned v = (byteAt(i) << 16) | (byteAt(i + 1) << 8);
        out.push_back(BASE64_TABLE[(v >> 18) & 63]);
        out.push_back(BASE64_TABLE[(v >> 12) & 63]);
        out.push_back(BASE64_TABLE[(v >> 6) & 63]);
        out.push_back('=');
    }
    return out;
}

std::string base64Decode(std::string_view text) {
    if (text.size() % 4 != 0) {
        throw CodecError(std::format("base64 length {} is not a multiple of 4", text.size()));
    }

    std::string out;
    out.reserve(text.size() / 4 * 3);

    unsigned buffer = 0;
    int bitsCollected = 0;
    size_t padding = 0;
    for (size_t i = 0; i < text.size(); ++i) {
        char c = text[i];
        if (c == '=') {
            // Padding only in the last two positions
            if (i + 2 < text.size()) {
                throw CodecError(std::format("unexpected base64 padding at offset {}", i));
            }
            ++padding;
            continue;
        }
        if (padding > 0) {
            throw CodecError(std::format("base64 data after padding at offset {}", i));
        }
        int value = base64Value(c);
        if (value < 0) {
            throw CodecError(std::format("invalid base64 character at offset {}", i));
        }
        buffer = (buffer << 6) | static_cast<unsigned>(value);
        bitsCollected += 6;
        if (bitsCollected >= 8) {
            bitsCollected -= 8;
            out.push_back(static_cast<char>((buffer >> bitsCollected) & 0xFF));
        }
    }
    return out;
}

std::string percentEncode(std::string_view text) {
    static constexpr char HEX[] = "0123456789ABCDEF";

    std::string out;
    out.reserve(text.size() * 3);
    for (char ch : text) {
        auto c = static_cast<unsigned char>(ch);
        if (isUnreserved(c)) {
            out.push_back(ch);
        } else {
            out.push_back('%');
            out.push_back(HEX[c >> 4]);
            out.push_back(HEX[c & 0x0F]);
        }
    }
    return out;
}

std::string percentDecode(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (size_t i = 0; i < text.size(); ++i) {
        if (text[i] != '%') {
            out.push_back(text[i]);
            continue;
        }
        if (i + 2 >= text.size()) {
            throw CodecError(std::format("truncated percent escape at offset {}", i));
        }
        int hi = hexValue(text[i + 1]);
        int lo = hexValue(text[i + 2]);
        if (hi < 0 || lo < 0) {
            throw CodecError(std::format("invalid percent escape at offset {}", i));
        }
        out.push_back(static_cast<char>((hi << 4) | lo));
        i += 2;
    }
    return out;
}

std::string encodeDocument(std::string_view xml, int level) {
    return percentEncode(base64Encode(deflateRaw(xml, level)));
}

std::string decodeDocument(std::string_view payload) {
    return inflateRaw(base64Decode(percentDecode(payload)));
}

}  // namespace drawlink::codec
