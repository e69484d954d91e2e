#include "ncf_cert_cache.hpp"
#include "ncf_errors.hpp"
#include "ncf_logger.hpp"
#include "ncf_system.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <ctime>
#include <fstream>
#include <iterator>
#include <list>
#include <map>
#include <mutex>
#include <vector>

#include <dirent.h>
#include <sys/stat.h>
#include <unistd.h>

namespace ncf {

namespace {

constexpr const char* kLog = "certs";

std::string normalize(const std::string& domain) {
    std::string d = domain;
    std::transform(d.begin(), d.end(), d.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    while (!d.empty() && d.back() == '.') d.pop_back();
    return d;
}

bool read_file(const std::string& path, std::string& out) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) return false;
    out.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    return !in.bad();
}

bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::shared_ptr<DomainCertificate> wrap(const std::string& domain, X509Ptr cert,
                                        EvpPkeyPtr key, std::string cert_pem) {
    auto dc = std::make_shared<DomainCertificate>();
    dc->domain = domain;
    dc->not_before = ossl::not_before(cert.get());
    dc->not_after = ossl::not_after(cert.get());
    dc->cert_pem = std::move(cert_pem);
    dc->cert = std::shared_ptr<X509>(cert.release(), X509Deleter());
    dc->key = std::shared_ptr<EVP_PKEY>(key.release(), EvpPkeyDeleter());
    return dc;
}

} // namespace

struct DomainCertificateCache::Impl {
    std::shared_ptr<const CertificateAuthority> ca;
    CertCacheConfig config;

    struct Entry {
        std::shared_ptr<const DomainCertificate> cert;
        std::list<std::string>::iterator recency;
    };

    mutable std::mutex mtx;
    std::map<std::string, Entry> entries;
    std::list<std::string> recency;     // most recently used first
    std::map<std::string, std::shared_ptr<std::mutex>> domain_locks;
    CertCacheStats stats;

    /// Serialises creation for one domain; the map slot goes once unused.
    class Lease {
    public:
        Lease(Impl& impl, std::string domain)
            : impl_(impl), domain_(std::move(domain))
        {
            {
                std::lock_guard<std::mutex> lock(impl_.mtx);
                auto& m = impl_.domain_locks[domain_];
                if (!m) m = std::make_shared<std::mutex>();
                mutex_ = m;
            }
            mutex_->lock();
        }

        ~Lease() {
            mutex_->unlock();
            mutex_.reset();
            std::lock_guard<std::mutex> lock(impl_.mtx);
            auto it = impl_.domain_locks.find(domain_);
            if (it != impl_.domain_locks.end() && it->second.use_count() == 1) {
                impl_.domain_locks.erase(it);
            }
        }

        Lease(const Lease&) = delete;
        Lease& operator=(const Lease&) = delete;

    private:
        Impl& impl_;
        std::string domain_;
        std::shared_ptr<std::mutex> mutex_;
    };

    bool fresh(const DomainCertificate& dc) const {
        return std::chrono::system_clock::now() + config.renew_before < dc.not_after;
    }

    std::string cert_path(const std::string& domain) const {
        return config.dir + "/" + file_stem(domain) + ".crt";
    }

    std::string key_path(const std::string& domain) const {
        return config.dir + "/" + file_stem(domain) + ".key";
    }

    // ---- memory map, mtx held ----

    std::shared_ptr<const DomainCertificate> lookup(const std::string& domain,
                                                    const std::string& ca_fp) {
        auto it = entries.find(domain);
        if (it == entries.end()) return nullptr;
        const DomainCertificate& dc = *it->second.cert;
        if (!fresh(dc) || dc.ca_fingerprint != ca_fp) return nullptr;
        recency.splice(recency.begin(), recency, it->second.recency);
        return it->second.cert;
    }

    void erase(std::map<std::string, Entry>::iterator it) {
        recency.erase(it->second.recency);
        entries.erase(it);
    }

    void insert(const std::string& domain, std::shared_ptr<const DomainCertificate> dc) {
        auto it = entries.find(domain);
        if (it != entries.end()) erase(it);
        recency.push_front(domain);
        entries[domain] = Entry{std::move(dc), recency.begin()};

        while (config.max_entries > 0 && entries.size() > config.max_entries) {
            erase(entries.find(recency.back()));
            ++stats.evictions;
        }
        stats.current_size = entries.size();
    }

    // ---- disk and CA ----

    std::shared_ptr<DomainCertificate> load_from_disk(const std::string& domain) {
        std::string cert_pem, key_raw;
        if (!read_file(cert_path(domain), cert_pem) || !read_file(key_path(domain), key_raw)) {
            return nullptr;
        }
        SecureString key_pem(key_raw.data(), key_raw.size());
        SecureOps::secure_zero(&key_raw[0], key_raw.size());

        try {
            X509Ptr cert = ossl::certificate_from_pem(cert_pem);
            EvpPkeyPtr key = ossl::private_key_from_pem(key_pem);
            if (X509_check_private_key(cert.get(), key.get()) != 1) {
                NCF_LOG_WARN(kLog, "key/certificate mismatch for " + domain + ", reissuing");
                return nullptr;
            }
            // left over from before the CA was regenerated
            if (!ca->issued(cert.get())) {
                NCF_LOG_WARN(kLog, "cached certificate for " + domain +
                                   " not signed by the current CA, reissuing");
                return nullptr;
            }
            auto dc = wrap(domain, std::move(cert), std::move(key), std::move(cert_pem));
            dc->cert_path = cert_path(domain);
            dc->key_path = key_path(domain);
            dc->from_disk = true;
            return dc;
        } catch (const CertificateError& e) {
            NCF_LOG_WARN(kLog, "unreadable cached certificate for " + domain + ": " + e.what());
            return nullptr;
        }
    }

    std::shared_ptr<DomainCertificate> issue(const std::string& domain) {
        IssuedCertificate issued = ca->issue(domain, config.key_bits, config.validity_days);

        ensure_directory(config.dir, 0755);
        write_file_atomic(key_path(domain), issued.key_pem.data(), issued.key_pem.size(), 0600);
        write_file_atomic(cert_path(domain), issued.cert_pem, 0644);

        auto dc = wrap(domain, std::move(issued.cert), std::move(issued.key),
                       std::move(issued.cert_pem));
        dc->cert_path = cert_path(domain);
        dc->key_path = key_path(domain);
        NCF_LOG_INFO(kLog, "issued certificate for " + domain);
        return dc;
    }
};

DomainCertificateCache::DomainCertificateCache(std::shared_ptr<const CertificateAuthority> ca,
                                               CertCacheConfig config)
    : impl_(std::make_unique<Impl>())
{
    if (!ca) throw std::invalid_argument("DomainCertificateCache: CA is null");
    impl_->ca = std::move(ca);
    impl_->config = std::move(config);
}

DomainCertificateCache::~DomainCertificateCache() = default;

std::string DomainCertificateCache::file_stem(const std::string& domain) {
    std::string out;
    for (char c : normalize(domain)) {
        if (c == '*') out += "wildcard";
        else if (c == '/') out += '_';
        else out += c;
    }
    return out;
}

std::shared_ptr<const DomainCertificate> DomainCertificateCache::get(const std::string& raw) {
    const std::string domain = normalize(raw);
    if (domain.empty()) throw CertificateError("empty domain");

    // Entries signed by a CA that has since been replaced count as misses.
    const std::string ca_fp = impl_->ca->fingerprint();
    {
        std::lock_guard<std::mutex> lock(impl_->mtx);
        if (auto hit = impl_->lookup(domain, ca_fp)) {
            ++impl_->stats.hits;
            return hit;
        }
        ++impl_->stats.misses;
    }

    // One creator per domain; latecomers find the entry on re-check.
    Impl::Lease creating(*impl_, domain);
    {
        std::lock_guard<std::mutex> lock(impl_->mtx);
        if (auto hit = impl_->lookup(domain, ca_fp)) return hit;
    }

    std::shared_ptr<DomainCertificate> dc;
    try {
        dc = impl_->load_from_disk(domain);
        if (dc && !impl_->fresh(*dc)) {
            NCF_LOG_INFO(kLog, "certificate for " + domain + " near expiry, renewing");
            dc.reset();
        }
        bool loaded = static_cast<bool>(dc);
        if (!dc) dc = impl_->issue(domain);
        dc->ca_fingerprint = ca_fp;

        std::lock_guard<std::mutex> lock(impl_->mtx);
        if (loaded) ++impl_->stats.disk_loads;
        else ++impl_->stats.issued;
        impl_->insert(domain, dc);
    } catch (const Error&) {
        std::lock_guard<std::mutex> lock(impl_->mtx);
        ++impl_->stats.failures;
        throw;
    }
    return dc;
}

void DomainCertificateCache::invalidate(const std::string& raw) {
    const std::string domain = normalize(raw);
    Impl::Lease creating(*impl_, domain);

    unlink(impl_->cert_path(domain).c_str());
    unlink(impl_->key_path(domain).c_str());

    std::lock_guard<std::mutex> lock(impl_->mtx);
    auto it = impl_->entries.find(domain);
    if (it != impl_->entries.end()) {
        impl_->erase(it);
        ++impl_->stats.evictions;
    }
    impl_->stats.current_size = impl_->entries.size();
}

size_t DomainCertificateCache::sweep(std::chrono::hours max_age) {
    const auto cutoff = std::chrono::system_clock::now() - max_age;
    const std::time_t cutoff_t = std::chrono::system_clock::to_time_t(cutoff);

    std::vector<std::string> stale;
    if (DIR* dir = opendir(impl_->config.dir.c_str())) {
        while (struct dirent* ent = readdir(dir)) {
            std::string name = ent->d_name;
            if (!ends_with(name, ".crt")) continue;
            std::string path = impl_->config.dir + "/" + name;
            struct stat st;
            if (stat(path.c_str(), &st) == 0 && st.st_mtime < cutoff_t) {
                stale.push_back(name.substr(0, name.size() - 4));
            }
        }
        closedir(dir);
    }

    size_t removed = 0;
    for (const auto& stem : stale) {
        std::string crt = impl_->config.dir + "/" + stem + ".crt";
        std::string key = impl_->config.dir + "/" + stem + ".key";
        if (unlink(crt.c_str()) != 0 && errno != ENOENT) {
            NCF_LOG_WARN(kLog, "cannot remove " + crt + ": " + std::strerror(errno));
            continue;
        }
        unlink(key.c_str());
        ++removed;

        std::lock_guard<std::mutex> lock(impl_->mtx);
        for (auto it = impl_->entries.begin(); it != impl_->entries.end();) {
            auto next = std::next(it);
            if (it->second.cert->cert_path == crt) impl_->erase(it);
            it = next;
        }
    }

    std::lock_guard<std::mutex> lock(impl_->mtx);
    impl_->stats.evictions += removed;
    impl_->stats.current_size = impl_->entries.size();
    if (removed > 0) {
        NCF_LOG_INFO(kLog, "swept " + std::to_string(removed) + " stale certificates");
    }
    return removed;
}

CertCacheStats DomainCertificateCache::stats() const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    CertCacheStats out = impl_->stats;
    out.domain_locks = impl_->domain_locks.size();
    return out;
}

} // namespace ncf
