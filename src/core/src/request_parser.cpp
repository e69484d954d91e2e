#include "ncf_request_parser.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace ncf {

namespace {

constexpr size_t kMaxHostLength = 253;

uint16_t be16(const uint8_t* p) {
    return static_cast<uint16_t>((static_cast<uint16_t>(p[0]) << 8) | p[1]);
}

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string trim(const std::string& s) {
    size_t b = 0, e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
    return s.substr(b, e - b);
}

bool host_chars_ok(const std::string& host) {
    if (host.empty() || host.size() > kMaxHostLength) return false;
    return std::all_of(host.begin(), host.end(), [](unsigned char c) {
        return std::isalnum(c) || c == '-' || c == '.' || c == '_';
    });
}

} // namespace

bool is_tls_client_hello(const uint8_t* data, size_t len) {
    return data && len > 5 && data[0] == 0x16 && data[1] == 0x03 && data[5] == 0x01;
}

int find_sni_hostname_offset(const uint8_t* data, size_t len) {
    // Record header (5) + handshake header (4)
    if (!data || len < 5 + 4) return -1;
    if (!is_tls_client_hello(data, len)) return -1;

    size_t pos = 5 + 4;

    // client_version (2) + random (32) + session_id length (1)
    if (pos + 2 + 32 + 1 > len) return -1;
    pos += 2 + 32;

    uint8_t session_id_len = data[pos];
    pos += 1;
    if (pos + session_id_len > len) return -1;
    pos += session_id_len;

    if (pos + 2 > len) return -1;
    uint16_t cipher_suites_len = be16(data + pos);
    pos += 2;
    if (pos + cipher_suites_len > len) return -1;
    pos += cipher_suites_len;

    if (pos + 1 > len) return -1;
    uint8_t compression_methods_len = data[pos];
    pos += 1;
    if (pos + compression_methods_len > len) return -1;
    pos += compression_methods_len;

    if (pos + 2 > len) return -1;
    uint16_t extensions_len = be16(data + pos);
    pos += 2;

    size_t exts_end = std::min(pos + extensions_len, len);

    while (pos + 4 <= exts_end) {
        uint16_t ext_type = be16(data + pos);
        uint16_t ext_data_len = be16(data + pos + 2);
        pos += 4;
        if (pos + ext_data_len > exts_end) break;

        if (ext_type == 0x0000) {   // server_name
            size_t sni_pos = pos;
            size_t sni_end = pos + ext_data_len;
            if (sni_pos + 2 > sni_end) return -1;
            uint16_t list_len = be16(data + sni_pos);
            sni_pos += 2;
            if (sni_pos + list_len > sni_end || list_len < 3) return -1;

            // First entry only; 0x00 is host_name
            if (data[sni_pos] != 0x00) return -1;
            sni_pos += 1;
            uint16_t host_len = be16(data + sni_pos);
            sni_pos += 2;
            if (host_len == 0 || sni_pos + host_len > sni_end) return -1;
            return static_cast<int>(sni_pos);
        }
        pos += ext_data_len;
    }
    return -1;
}

std::optional<std::string> extract_sni(const uint8_t* data, size_t len) {
    int off = find_sni_hostname_offset(data, len);
    if (off < 2) return std::nullopt;
    size_t start = static_cast<size_t>(off);
    uint16_t host_len = be16(data + start - 2);

    std::string host = to_lower(std::string(reinterpret_cast<const char*>(data + start), host_len));
    while (!host.empty() && host.back() == '.') host.pop_back();
    if (!host_chars_ok(host)) return std::nullopt;
    return host;
}

std::optional<HttpRequestHead> parse_http_request_head(const std::string& head) {
    std::istringstream in(head);
    std::string line;
    if (!std::getline(in, line)) return std::nullopt;
    if (!line.empty() && line.back() == '\r') line.pop_back();

    HttpRequestHead req;
    std::istringstream request_line(line);
    std::string version;
    if (!(request_line >> req.method >> req.target >> version)) return std::nullopt;
    if (version.compare(0, 5, "HTTP/") != 0) return std::nullopt;
    if (!std::all_of(req.method.begin(), req.method.end(),
                     [](unsigned char c) { return std::isupper(c); })) {
        return std::nullopt;
    }

    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty()) break;
        auto colon = line.find(':');
        if (colon == std::string::npos) continue;
        if (to_lower(trim(line.substr(0, colon))) != "host") continue;

        std::string host = to_lower(trim(line.substr(colon + 1)));
        if (!host.empty() && host.front() == '[') {
            auto close = host.find(']');
            host = close == std::string::npos ? "" : host.substr(0, close + 1);
        } else {
            auto port = host.find(':');
            if (port != std::string::npos) host.erase(port);
        }
        while (!host.empty() && host.back() == '.') host.pop_back();
        req.host = host;
        break;
    }

    // Absolute-form target carries the host too
    if (req.host.empty() && req.target.compare(0, 7, "http://") == 0) {
        std::string rest = req.target.substr(7);
        req.host = to_lower(rest.substr(0, rest.find_first_of(":/")));
    }
    return req;
}

} // namespace ncf
