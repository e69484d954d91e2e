#ifndef NCF_OPENSSL_HPP
#define NCF_OPENSSL_HPP

#include "ncf_secure_memory.hpp"

#include <chrono>
#include <memory>
#include <string>

#include <openssl/bio.h>
#include <openssl/evp.h>
#include <openssl/ssl.h>
#include <openssl/x509.h>

namespace ncf {

// RAII owners for OpenSSL handles

struct X509Deleter    { void operator()(X509* p) const { X509_free(p); } };
struct EvpPkeyDeleter { void operator()(EVP_PKEY* p) const { EVP_PKEY_free(p); } };
struct BioDeleter     { void operator()(BIO* p) const { BIO_free_all(p); } };
struct SslCtxDeleter  { void operator()(SSL_CTX* p) const { SSL_CTX_free(p); } };
struct SslDeleter     { void operator()(SSL* p) const { SSL_free(p); } };

using X509Ptr    = std::unique_ptr<X509, X509Deleter>;
using EvpPkeyPtr = std::unique_ptr<EVP_PKEY, EvpPkeyDeleter>;
using BioPtr     = std::unique_ptr<BIO, BioDeleter>;
using SslCtxPtr  = std::unique_ptr<SSL_CTX, SslCtxDeleter>;
using SslPtr     = std::unique_ptr<SSL, SslDeleter>;

namespace ossl {

/// Drain the OpenSSL error queue into one line.
std::string last_error();

/// RSA key of the given size. @throws CertificateError
EvpPkeyPtr generate_rsa_key(int bits);

std::string certificate_to_pem(X509* cert);
/// Unencrypted PKCS#8 PEM, held in zero-on-release memory.
SecureString private_key_to_pem(EVP_PKEY* key);

/// @throws CertificateError on malformed input
X509Ptr certificate_from_pem(const std::string& pem);
EvpPkeyPtr private_key_from_pem(const SecureString& pem);

std::chrono::system_clock::time_point not_before(const X509* cert);
std::chrono::system_clock::time_point not_after(const X509* cert);

/// Colon-separated upper-case hex SHA-256 of the DER encoding.
std::string fingerprint_sha256(X509* cert);

/// Random positive 128-bit serial. @throws CertificateError
void assign_random_serial(X509* cert);

/// Add an X509v3 extension given in openssl.cnf syntax. @throws CertificateError
void add_extension(X509* cert, X509* issuer, int nid, const std::string& value);

} // namespace ossl

} // namespace ncf

#endif // NCF_OPENSSL_HPP
