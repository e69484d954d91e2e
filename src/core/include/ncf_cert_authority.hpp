#ifndef NCF_CERT_AUTHORITY_HPP
#define NCF_CERT_AUTHORITY_HPP

#include "ncf_openssl.hpp"
#include "ncf_secure_memory.hpp"

#include <chrono>
#include <mutex>
#include <string>

namespace ncf {

struct CaOptions {
    std::string dir = "/var/lib/netcurfew/certs";
    int key_bits = 4096;
    int validity_days = 3650;
    std::string common_name = "netcurfew Root CA";
    std::string organization = "netcurfew";
};

/**
 * @brief Freshly signed leaf material
 */
struct IssuedCertificate {
    X509Ptr cert;
    EvpPkeyPtr key;
    std::string cert_pem;
    SecureString key_pem;
};

/**
 * @brief Private root CA used to sign per-domain leaf certificates
 *
 * Key lives at <dir>/ca.key (0600), certificate at <dir>/ca.crt (0644).
 * Trusting ca.crt in the OS or browser store is left to the installer.
 */
class CertificateAuthority {
public:
    explicit CertificateAuthority(CaOptions options);

    CertificateAuthority(const CertificateAuthority&) = delete;
    CertificateAuthority& operator=(const CertificateAuthority&) = delete;

    /// Create and persist a new CA, replacing any existing one.
    void generate();

    /// Load ca.key/ca.crt. @throws IOError, CertificateError
    void load();

    /**
     * @brief Load the CA, generating it first if either file is missing
     * @return true when a new CA was generated
     */
    bool ensure();

    bool is_loaded() const;

    /**
     * @brief Sign a leaf certificate for domain
     *
     * Subject CN = domain; SAN = domain plus www.domain; serverAuth.
     * @throws CertificateError
     */
    IssuedCertificate issue(const std::string& domain, int key_bits, int validity_days) const;

    /// True when leaf names this CA as issuer and carries its signature.
    bool issued(X509* leaf) const;

    std::string cert_path() const { return options_.dir + "/ca.crt"; }
    std::string key_path() const { return options_.dir + "/ca.key"; }

    std::string certificate_pem() const;
    std::string fingerprint() const;
    std::chrono::system_clock::time_point expires() const;
    const CaOptions& options() const { return options_; }

private:
    CaOptions options_;
    mutable std::mutex mtx_;
    X509Ptr cert_;
    EvpPkeyPtr key_;
};

} // namespace ncf

#endif // NCF_CERT_AUTHORITY_HPP
