#ifndef NCF_INTERCEPTION_SERVER_HPP
#define NCF_INTERCEPTION_SERVER_HPP

#include "ncf_cert_cache.hpp"
#include "ncf_classifier.hpp"
#include "ncf_policy.hpp"
#include "ncf_schedule.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <thread>

namespace ncf {

struct ServerConfig {
    std::string bind_address = "127.0.0.1";
    uint16_t http_port = 8080;          // 0 picks an ephemeral port
    uint16_t https_port = 8443;         // 0 picks an ephemeral port
    size_t workers = 16;
    size_t max_pending = 256;
    std::chrono::milliseconds connection_timeout{5000};
    std::string block_page_url = "http://localhost:5000/blocked";
};

struct ServerStats {
    uint64_t connections = 0;
    uint64_t blocked = 0;
    uint64_t allowed = 0;
    uint64_t overflow_rejected = 0;
    uint64_t tls_handshakes = 0;
    uint64_t tls_failures = 0;
    uint64_t bad_requests = 0;
    uint64_t health_checks = 0;
};

/// server name (empty when the client sent no SNI) -> certificate to present
using CertificateSelector =
    std::function<std::shared_ptr<const DomainCertificate>(const std::string& server_name)>;

/**
 * @brief Selector backed by a DomainCertificateCache
 *
 * Clients without SNI get the certificate for default_name.
 */
CertificateSelector make_cache_selector(std::shared_ptr<DomainCertificateCache> cache,
                                        std::string default_name = "localhost");

/**
 * @brief HTTP and TLS listeners answering redirected requests with a block response
 *
 * The HTTP listener also accepts a TLS ClientHello, so both redirected
 * ports may point at it. Connections are served by a bounded worker pool;
 * each one, TLS handshake included, must finish within connection_timeout.
 */
class InterceptionServer {
public:
    /// selector may be empty, in which case TLS connections are reset.
    InterceptionServer(ServerConfig config, CertificateSelector selector);
    ~InterceptionServer();

    InterceptionServer(const InterceptionServer&) = delete;
    InterceptionServer& operator=(const InterceptionServer&) = delete;

    /// Bind both listeners and start accepting. @throws ConfigurationError
    void start();

    /**
     * @brief Stop accepting, let in-flight connections finish
     *
     * Connections still open after drain_timeout are shut down forcibly.
     */
    void stop(std::chrono::milliseconds drain_timeout = std::chrono::milliseconds(3000));

    bool is_running() const;

    void set_block_rules(BlockRules rules);
    void set_access(AccessDecision access);

    /// Bound ports (differ from the configured ones when those were 0).
    uint16_t http_port() const;
    uint16_t https_port() const;

    ServerStats stats() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

/**
 * @brief Minimal single-thread fallback answering every request with a
 *        fixed block page
 *
 * CloseOnly resets each connection at once; it holds the TLS port so
 * redirected HTTPS fails fast instead of hanging.
 */
class StaticResponder {
public:
    enum class Mode { BlockPage, CloseOnly };

    StaticResponder(std::string bind_address, uint16_t port, Mode mode = Mode::BlockPage);
    ~StaticResponder();

    StaticResponder(const StaticResponder&) = delete;
    StaticResponder& operator=(const StaticResponder&) = delete;

    /// @throws ConfigurationError if the port cannot be bound
    void start();
    void stop();
    bool is_running() const { return running_.load(); }
    uint16_t port() const { return port_; }

    static std::string response();

private:
    void loop();

    std::string bind_address_;
    uint16_t port_;
    Mode mode_;
    int listen_fd_ = -1;
    std::atomic<bool> running_{false};
    std::thread thread_;
};

/**
 * @brief Liveness probe: GET /healthz must answer 200 within timeout
 */
bool probe_http_health(const std::string& host, uint16_t port,
                       std::chrono::milliseconds timeout);

} // namespace ncf

#endif // NCF_INTERCEPTION_SERVER_HPP
