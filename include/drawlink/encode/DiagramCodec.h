#pragma once

#include <string>
#include <string_view>

namespace drawlink::codec {

/// zlib default level, matching Z_DEFAULT_COMPRESSION
inline constexpr int DEFAULT_COMPRESSION_LEVEL = -1;

/// Compress with zlib and strip the 2-byte header and 4-byte Adler-32 trailer,
/// leaving the raw deflate stream draw.io expects.
/// @throws CodecError if zlib fails or level is outside [-1, 9]
std::string deflateRaw(std::string_view data, int level = DEFAULT_COMPRESSION_LEVEL);

/// Inflate a raw (headerless) deflate stream
/// @throws CodecError on a corrupt or truncated stream
std::string inflateRaw(std::string_view compressed);

/// Standard base64 alphabet with '=' padding
std::string base64Encode(std::string_view data);

/// @throws CodecError on characters outside the alphabet or bad padding
std::string base64Decode(std::string_view text);

/// Escape every byte that is not [A-Za-z0-9] as %XX (uppercase hex)
std::string percentEncode(std::string_view text);

/// @throws CodecError on a truncated or non-hex escape
std::string percentDecode(std::string_view text);

/// deflateRaw -> base64Encode -> percentEncode
std::string encodeDocument(std::string_view xml, int level = DEFAULT_COMPRESSION_LEVEL);

/// percentDecode -> base64Decode -> inflateRaw
std::string decodeDocument(std::string_view payload);

}  // namespace drawlink::codec
