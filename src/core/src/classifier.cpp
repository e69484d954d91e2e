#include "ncf_classifier.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>

namespace ncf {

namespace {

std::string http_response(const std::string& status, const std::string& body,
                          const std::string& extra_headers = "") {
    std::string out = "HTTP/1.1 " + status + "\r\n";
    out += extra_headers;
    out += "Content-Type: text/html; charset=utf-8\r\n";
    out += "Content-Length: " + std::to_string(body.size()) + "\r\n";
    out += "Cache-Control: no-store\r\n";
    out += "Connection: close\r\n\r\n";
    out += body;
    return out;
}

std::string html_escape(const std::string& s) {
    std::string out;
    for (char c : s) {
        switch (c) {
            case '&': out += "&amp;"; break;
            case '<': out += "&lt;"; break;
            case '>': out += "&gt;"; break;
            case '"': out += "&quot;"; break;
            default: out += c;
        }
    }
    return out;
}

const std::string* lookup(const std::map<std::string, std::string>& list,
                          const std::vector<std::string>& candidates) {
    for (const auto& d : candidates) {
        auto it = list.find(d);
        if (it != list.end()) return &it->second;
    }
    return nullptr;
}

} // namespace

const char* to_string(BlockReason reason) {
    switch (reason) {
        case BlockReason::TimeRestricted: return "time_restricted";
        case BlockReason::Manual:         return "manual";
        case BlockReason::Category:       return "category";
        case BlockReason::AgeRestricted:  return "age_restricted";
        case BlockReason::Allowed:        return "allowed";
    }
    return "unknown";
}

namespace classifier {

std::vector<std::string> candidate_domains(const std::string& host) {
    std::vector<std::string> out;
    std::string h = host;
    std::transform(h.begin(), h.end(), h.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    while (!h.empty() && h.back() == '.') h.pop_back();
    if (h.empty()) return out;

    out.push_back(h);
    size_t pos = 0;
    while ((pos = h.find('.', pos)) != std::string::npos) {
        ++pos;
        if (pos < h.size()) out.push_back(h.substr(pos));
    }
    return out;
}

BlockedRequestContext classify(const std::string& host, const std::string& scheme,
                               const BlockRules& rules, const AccessDecision& access) {
    BlockedRequestContext ctx;
    ctx.host = host;
    ctx.scheme = scheme;

    if (!access.allowed) {
        ctx.reason = BlockReason::TimeRestricted;
        ctx.category = "time_restriction";
        ctx.detail = access.reason;
        return ctx;
    }

    const auto candidates = candidate_domains(host);

    if (const std::string* cat = lookup(rules.manual, candidates)) {
        ctx.reason = BlockReason::Manual;
        ctx.category = cat->empty() ? "MANUAL" : *cat;
        ctx.detail = "blocked by administrator";
        return ctx;
    }
    if (const std::string* cat = lookup(rules.categories, candidates)) {
        ctx.reason = BlockReason::Category;
        ctx.category = *cat;
        ctx.detail = "blocked category";
        return ctx;
    }
    for (const auto& d : candidates) {
        if (rules.age_restricted.count(d)) {
            ctx.reason = BlockReason::AgeRestricted;
            ctx.category = "age_restricted";
            ctx.detail = "age restricted";
            return ctx;
        }
    }

    ctx.reason = BlockReason::Allowed;
    ctx.detail = "not blocked";
    return ctx;
}

std::string url_encode(const std::string& value) {
    std::string out;
    char buf[4];
    for (unsigned char c : value) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            out += static_cast<char>(c);
        } else {
            std::snprintf(buf, sizeof(buf), "%%%02X", c);
            out += buf;
        }
    }
    return out;
}

std::string block_page_location(const BlockedRequestContext& ctx,
                                 const std::string& block_page_url) {
    std::string loc = block_page_url;
    loc += block_page_url.find('?') == std::string::npos ? '?' : '&';
    loc += "url=" + url_encode(ctx.url());
    loc += "&reason=" + url_encode(ctx.detail);
    loc += "&category=" + url_encode(ctx.category);
    if (ctx.reason == BlockReason::TimeRestricted) {
        loc += "&time_restriction=" + url_encode(ctx.detail);
    }
    return loc;
}

std::string build_block_response(const BlockedRequestContext& ctx,
                                 const std::string& block_page_url) {
    const std::string location = block_page_location(ctx, block_page_url);
    const std::string esc = html_escape(location);
    std::string body =
        "<!DOCTYPE html>\n<html>\n<head>\n<title>Page Blocked</title>\n"
        "<meta http-equiv=\"refresh\" content=\"0;url=" + esc + "\">\n</head>\n<body>\n"
        "<h1>Page Blocked</h1>\n"
        "<p>" + html_escape(ctx.host) + " has been blocked: " + html_escape(ctx.detail) + ".</p>\n"
        "<p><a href=\"" + esc + "\">Click here if you are not redirected automatically</a></p>\n"
        "</body>\n</html>\n";
    return http_response("302 Found", body, "Location: " + location + "\r\n");
}

std::string build_not_found_response() {
    return http_response("404 Not Found", "<html><body><h1>Page Not Found</h1></body></html>");
}

std::string build_health_response() {
    std::string out = "HTTP/1.1 200 OK\r\n";
    out += "Content-Type: text/plain\r\nContent-Length: 2\r\nConnection: close\r\n\r\nok";
    return out;
}

} // namespace classifier

} // namespace ncf
