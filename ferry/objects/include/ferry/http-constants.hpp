#pragma once

#include <cstdint>
#include <string_view>

namespace ferry::http {

// Header field names are case-insensitive (RFC 9110 §5.1). They are stored here in their conventional
// canonical form for emission, lookups in Headers are case-insensitive.
// Token values (e.g. "chunked", "keep-alive") are also case-insensitive in the protocol; we keep them lowercase.

// Standard Header Field Names
inline constexpr std::string_view Connection = "Connection";
inline constexpr std::string_view TransferEncoding = "Transfer-Encoding";
inline constexpr std::string_view ContentLength = "Content-Length";
inline constexpr std::string_view ContentType = "Content-Type";
inline constexpr std::string_view ContentEncoding = "Content-Encoding";
inline constexpr std::string_view AcceptEncoding = "Accept-Encoding";
inline constexpr std::string_view UserAgent = "User-Agent";
inline constexpr std::string_view Host = "Host";
inline constexpr std::string_view Location = "Location";
inline constexpr std::string_view Authorization = "Authorization";
inline constexpr std::string_view ProxyAuthorization = "Proxy-Authorization";
inline constexpr std::string_view Cookie = "Cookie";
inline constexpr std::string_view Trailer = "Trailer";

inline constexpr std::string_view HeaderSep = ": ";
inline constexpr std::string_view CRLF = "\r\n";
inline constexpr std::string_view DoubleCRLF = "\r\n\r\n";

// Schemes
inline constexpr std::string_view http = "http";
inline constexpr std::string_view https = "https";
inline constexpr std::uint16_t kDefaultHttpPort = 80;
inline constexpr std::uint16_t kDefaultHttpsPort = 443;

// Content codings
inline constexpr std::string_view identity = "identity";
inline constexpr std::string_view gzip = "gzip";
inline constexpr std::string_view deflate = "deflate";
inline constexpr std::string_view zstd = "zstd";  // RFC 8878
inline constexpr std::string_view br = "br";      // RFC 7932 (Brotli)

// Common Header Values
inline constexpr std::string_view keepalive = "keep-alive";
inline constexpr std::string_view close = "close";
inline constexpr std::string_view chunked = "chunked";

}  // namespace ferry::http
