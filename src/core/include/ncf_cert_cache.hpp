#ifndef NCF_CERT_CACHE_HPP
#define NCF_CERT_CACHE_HPP

/**
 * @file ncf_cert_cache.hpp
 * @brief Per-domain leaf certificates, issued on first use and cached
 */

#include "ncf_cert_authority.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

namespace ncf {

/**
 * @brief Leaf certificate presented for one intercepted domain
 */
struct DomainCertificate {
    std::string domain;
    std::string cert_pem;
    std::shared_ptr<X509> cert;
    std::shared_ptr<EVP_PKEY> key;
    std::chrono::system_clock::time_point not_before;
    std::chrono::system_clock::time_point not_after;
    std::string cert_path;
    std::string key_path;
    std::string ca_fingerprint;     // CA that signed it
    bool from_disk = false;
};

struct CertCacheConfig {
    std::string dir = "/var/lib/netcurfew/certs/domains";
    int key_bits = 2048;
    int validity_days = 365;
    std::chrono::hours renew_before = std::chrono::hours(7 * 24);
    size_t max_entries = 1024;      // in memory, least recently used go first; 0 = no cap
};

struct CertCacheStats {
    uint64_t hits = 0;
    uint64_t misses = 0;
    uint64_t issued = 0;
    uint64_t disk_loads = 0;
    uint64_t evictions = 0;
    uint64_t failures = 0;
    size_t current_size = 0;
    size_t domain_locks = 0;        // creations in flight
};

/**
 * @brief Thread-safe issue-on-miss certificate cache
 *
 * Lookups hit memory first, then <dir>/<name>.crt|.key, and only then ask
 * the CA to sign. Concurrent misses for the same domain are serialised on a
 * per-domain lock so exactly one certificate is written. Certificates not
 * signed by the current CA are never served.
 */
class DomainCertificateCache {
public:
    DomainCertificateCache(std::shared_ptr<const CertificateAuthority> ca,
                           CertCacheConfig config);
    ~DomainCertificateCache();

    DomainCertificateCache(const DomainCertificateCache&) = delete;
    DomainCertificateCache& operator=(const DomainCertificateCache&) = delete;

    /**
     * @brief Certificate for domain, issuing one if none is usable
     * @throws CertificateError, IOError
     */
    std::shared_ptr<const DomainCertificate> get(const std::string& domain);

    /// Forget domain in memory and on disk; the next get() reissues.
    void invalidate(const std::string& domain);

    /**
     * @brief Delete cached pairs whose files are older than max_age
     * @return number of certificates removed
     */
    size_t sweep(std::chrono::hours max_age);

    CertCacheStats stats() const;

    /// Cache file stem: lower-case, '*' -> "wildcard", '/' -> '_'.
    static std::string file_stem(const std::string& domain);

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace ncf

#endif // NCF_CERT_CACHE_HPP
