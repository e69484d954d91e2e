#ifndef NCF_CLASSIFIER_HPP
#define NCF_CLASSIFIER_HPP

#include "ncf_policy.hpp"
#include "ncf_schedule.hpp"

#include <string>
#include <vector>

namespace ncf {

enum class BlockReason {
    TimeRestricted,
    Manual,
    Category,
    AgeRestricted,
    Allowed         // redirected but no longer blocked
};

const char* to_string(BlockReason reason);

/**
 * @brief What one intercepted request asked for and why it is blocked
 *
 * Lives for one connection and is never persisted.
 */
struct BlockedRequestContext {
    std::string host;
    std::string scheme;             // "http" or "https"
    std::string target = "/";
    BlockReason reason = BlockReason::Allowed;
    std::string category;
    std::string detail;             // human-readable reason
    std::string client_address;

    bool blocked() const { return reason != BlockReason::Allowed; }
    std::string url() const { return scheme + "://" + host + target; }
};

namespace classifier {

/// host itself followed by each parent domain, most specific first.
std::vector<std::string> candidate_domains(const std::string& host);

/**
 * @brief Classify a requested host
 *
 * Order: time restriction, manual list, active categories, age
 * restriction. Lists match the host or any parent domain.
 */
BlockedRequestContext classify(const std::string& host, const std::string& scheme,
                               const BlockRules& rules, const AccessDecision& access);

/// RFC 3986 percent-encoding of everything but unreserved characters.
std::string url_encode(const std::string& value);

/// Redirect target: block_page_url?url=..&reason=..&category=..
std::string block_page_location(const BlockedRequestContext& ctx,
                                const std::string& block_page_url);

/// Full HTTP/1.1 302 response with a meta-refresh body.
std::string build_block_response(const BlockedRequestContext& ctx,
                                 const std::string& block_page_url);

std::string build_not_found_response();
std::string build_health_response();

} // namespace classifier

} // namespace ncf

#endif // NCF_CLASSIFIER_HPP
