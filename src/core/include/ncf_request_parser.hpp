#ifndef NCF_REQUEST_PARSER_HPP
#define NCF_REQUEST_PARSER_HPP

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace ncf {

/// Record type 0x16, version 0x03xx, handshake type ClientHello.
bool is_tls_client_hello(const uint8_t* data, size_t len);

/**
 * @brief Offset of the first SNI host_name byte inside a ClientHello record
 *
 * Returns -1 when the buffer is not a ClientHello or carries no SNI.
 * Never reads past len.
 */
int find_sni_hostname_offset(const uint8_t* data, size_t len);

/// Lower-cased SNI host name of a ClientHello, if present and printable.
std::optional<std::string> extract_sni(const uint8_t* data, size_t len);

struct HttpRequestHead {
    std::string method;
    std::string target;     // request-target as sent
    std::string host;       // Host header, port stripped, lower-case
};

/**
 * @brief Parse the request line and Host header of an HTTP/1.x request
 *
 * Only needs the bytes up to the blank line; returns nullopt if those
 * are not a well-formed request head.
 */
std::optional<HttpRequestHead> parse_http_request_head(const std::string& head);

} // namespace ncf

#endif // NCF_REQUEST_PARSER_HPP
