#include "ncf_cert_authority.hpp"
#include "ncf_errors.hpp"
#include "ncf_logger.hpp"
#include "ncf_system.hpp"

#include <cerrno>
#include <cstring>
#include <fstream>
#include <iterator>

#include <openssl/err.h>
#include <openssl/x509v3.h>
#include <sys/stat.h>

namespace ncf {

namespace {

constexpr const char* kLog = "ca";
constexpr long kBackdateSeconds = 3600;   // tolerate client clock skew

bool exists(const std::string& path) {
    struct stat st;
    return stat(path.c_str(), &st) == 0;
}

std::string slurp(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) throw IOError("cannot read " + path + ": " + std::strerror(errno));
    return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
}

SecureString slurp_secret(const std::string& path) {
    std::string raw = slurp(path);
    SecureString out(raw.data(), raw.size());
    SecureOps::secure_zero(&raw[0], raw.size());
    return out;
}

void set_validity(X509* cert, int days) {
    if (!X509_gmtime_adj(X509_getm_notBefore(cert), -kBackdateSeconds) ||
        !X509_gmtime_adj(X509_getm_notAfter(cert), static_cast<long>(days) * 86400L)) {
        throw CertificateError("cannot set validity: " + ossl::last_error());
    }
}

void add_name_entry(X509_NAME* name, const char* field, const std::string& value) {
    if (!X509_NAME_add_entry_by_txt(name, field, MBSTRING_UTF8,
                                    reinterpret_cast<const unsigned char*>(value.c_str()),
                                    -1, -1, 0)) {
        throw CertificateError(std::string("cannot set subject ") + field + ": " +
                               ossl::last_error());
    }
}

void sign(X509* cert, EVP_PKEY* key) {
    if (X509_sign(cert, key, EVP_sha256()) <= 0) {
        throw CertificateError("signing failed: " + ossl::last_error());
    }
}

bool valid_dns_name(const std::string& domain) {
    if (domain.empty() || domain.size() > 253) return false;
    for (char c : domain) {
        bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') ||
                  c == '-' || c == '.' || c == '*';
        if (!ok) return false;
    }
    return domain.front() != '.' && domain.front() != '-';
}

} // namespace

CertificateAuthority::CertificateAuthority(CaOptions options)
    : options_(std::move(options))
{
}

void CertificateAuthority::generate() {
    SecureOps::init();
    NCF_LOG_INFO(kLog, "generating RSA-" + std::to_string(options_.key_bits) + " root CA");

    EvpPkeyPtr key = ossl::generate_rsa_key(options_.key_bits);
    X509Ptr cert(X509_new());
    if (!cert) throw CertificateError("X509_new failed");

    X509_set_version(cert.get(), 2);
    ossl::assign_random_serial(cert.get());
    set_validity(cert.get(), options_.validity_days);
    if (X509_set_pubkey(cert.get(), key.get()) != 1) {
        throw CertificateError("cannot set CA public key: " + ossl::last_error());
    }

    X509_NAME* name = X509_get_subject_name(cert.get());
    add_name_entry(name, "CN", options_.common_name);
    add_name_entry(name, "O", options_.organization);
    X509_set_issuer_name(cert.get(), name);

    ossl::add_extension(cert.get(), cert.get(), NID_basic_constraints, "critical,CA:TRUE");
    ossl::add_extension(cert.get(), cert.get(), NID_key_usage, "critical,keyCertSign,cRLSign");
    ossl::add_extension(cert.get(), cert.get(), NID_subject_key_identifier, "hash");
    ossl::add_extension(cert.get(), cert.get(), NID_authority_key_identifier, "keyid:always");
    sign(cert.get(), key.get());

    ensure_directory(options_.dir, 0755);
    SecureString key_pem = ossl::private_key_to_pem(key.get());
    write_file_atomic(key_path(), key_pem.data(), key_pem.size(), 0600);
    write_file_atomic(cert_path(), ossl::certificate_to_pem(cert.get()), 0644);

    std::lock_guard<std::mutex> lock(mtx_);
    cert_ = std::move(cert);
    key_ = std::move(key);
    NCF_LOG_INFO(kLog, "root CA written to " + cert_path());
}

void CertificateAuthority::load() {
    X509Ptr cert = ossl::certificate_from_pem(slurp(cert_path()));
    EvpPkeyPtr key = ossl::private_key_from_pem(slurp_secret(key_path()));
    if (X509_check_private_key(cert.get(), key.get()) != 1) {
        throw CertificateError("CA key does not match " + cert_path());
    }
    if (X509_check_ca(cert.get()) == 0) {
        throw CertificateError(cert_path() + " is not a CA certificate");
    }

    std::lock_guard<std::mutex> lock(mtx_);
    cert_ = std::move(cert);
    key_ = std::move(key);
    NCF_LOG_DEBUG(kLog, "loaded root CA from " + cert_path());
}

bool CertificateAuthority::ensure() {
    if (exists(cert_path()) && exists(key_path())) {
        load();
        return false;
    }
    generate();
    return true;
}

bool CertificateAuthority::is_loaded() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return cert_ && key_;
}

IssuedCertificate CertificateAuthority::issue(const std::string& domain, int key_bits,
                                              int validity_days) const {
    if (!valid_dns_name(domain)) {
        throw CertificateError("refusing to issue for '" + domain + "'");
    }

    // Key generation dominates; do it before touching the CA.
    EvpPkeyPtr key = ossl::generate_rsa_key(key_bits);
    X509Ptr cert(X509_new());
    if (!cert) throw CertificateError("X509_new failed");

    X509_set_version(cert.get(), 2);
    ossl::assign_random_serial(cert.get());
    set_validity(cert.get(), validity_days);
    if (X509_set_pubkey(cert.get(), key.get()) != 1) {
        throw CertificateError("cannot set leaf public key: " + ossl::last_error());
    }
    X509_NAME* name = X509_get_subject_name(cert.get());
    add_name_entry(name, "CN", domain);
    add_name_entry(name, "O", options_.organization);

    std::string san = "DNS:" + domain;
    if (domain.compare(0, 4, "www.") != 0 && domain.compare(0, 2, "*.") != 0) {
        san += ",DNS:www." + domain;
    }

    {
        std::lock_guard<std::mutex> lock(mtx_);
        if (!cert_ || !key_) throw CertificateError("certificate authority not loaded");

        X509_set_issuer_name(cert.get(), X509_get_subject_name(cert_.get()));
        ossl::add_extension(cert.get(), cert_.get(), NID_basic_constraints, "critical,CA:FALSE");
        ossl::add_extension(cert.get(), cert_.get(), NID_key_usage,
                            "critical,digitalSignature,keyEncipherment");
        ossl::add_extension(cert.get(), cert_.get(), NID_ext_key_usage, "serverAuth");
        ossl::add_extension(cert.get(), cert_.get(), NID_subject_alt_name, san);
        ossl::add_extension(cert.get(), cert_.get(), NID_subject_key_identifier, "hash");
        ossl::add_extension(cert.get(), cert_.get(), NID_authority_key_identifier, "keyid");
        sign(cert.get(), key_.get());
    }

    IssuedCertificate out;
    out.cert_pem = ossl::certificate_to_pem(cert.get());
    out.key_pem = ossl::private_key_to_pem(key.get());
    out.cert = std::move(cert);
    out.key = std::move(key);
    return out;
}

std::string CertificateAuthority::certificate_pem() const {
    std::lock_guard<std::mutex> lock(mtx_);
    if (!cert_) throw CertificateError("certificate authority not loaded");
    return ossl::certificate_to_pem(cert_.get());
}

bool CertificateAuthority::issued(X509* leaf) const {
    std::lock_guard<std::mutex> lock(mtx_);
    if (!cert_ || !leaf) return false;
    bool ok = X509_check_issued(cert_.get(), leaf) == X509_V_OK &&
              X509_verify(leaf, X509_get0_pubkey(cert_.get())) == 1;
    ERR_clear_error();
    return ok;
}

std::string CertificateAuthority::fingerprint() const {
    std::lock_guard<std::mutex> lock(mtx_);
    if (!cert_) throw CertificateError("certificate authority not loaded");
    return ossl::fingerprint_sha256(cert_.get());
}

std::chrono::system_clock::time_point CertificateAuthority::expires() const {
    std::lock_guard<std::mutex> lock(mtx_);
    if (!cert_) throw CertificateError("certificate authority not loaded");
    return ossl::not_after(cert_.get());
}

} // namespace ncf
