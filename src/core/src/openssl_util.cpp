#include "ncf_openssl.hpp"
#include "ncf_errors.hpp"

#include <cstdio>
#include <ctime>

#include <openssl/asn1.h>
#include <openssl/bn.h>
#include <openssl/err.h>
#include <openssl/pem.h>
#include <openssl/rsa.h>
#include <openssl/x509v3.h>

namespace ncf {
namespace ossl {

namespace {

std::chrono::system_clock::time_point asn1_to_time_point(const ASN1_TIME* t) {
    std::tm tm_buf{};
    if (!t || ASN1_TIME_to_tm(t, &tm_buf) != 1) {
        throw CertificateError("unreadable certificate validity: " + last_error());
    }
    return std::chrono::system_clock::from_time_t(timegm(&tm_buf));
}

std::string bio_contents(BIO* bio) {
    char* data = nullptr;
    long len = BIO_get_mem_data(bio, &data);
    if (len <= 0 || !data) return std::string();
    return std::string(data, static_cast<size_t>(len));
}

} // namespace

std::string last_error() {
    std::string out;
    unsigned long code;
    char buf[256];
    while ((code = ERR_get_error()) != 0) {
        ERR_error_string_n(code, buf, sizeof(buf));
        if (!out.empty()) out += "; ";
        out += buf;
    }
    return out.empty() ? "unknown OpenSSL error" : out;
}

EvpPkeyPtr generate_rsa_key(int bits) {
    EvpPkeyPtr key(EVP_RSA_gen(static_cast<unsigned int>(bits)));
    if (!key) {
        throw CertificateError("RSA-" + std::to_string(bits) + " key generation failed: " +
                               last_error());
    }
    return key;
}

std::string certificate_to_pem(X509* cert) {
    BioPtr bio(BIO_new(BIO_s_mem()));
    if (!bio || PEM_write_bio_X509(bio.get(), cert) != 1) {
        throw CertificateError("certificate PEM encoding failed: " + last_error());
    }
    return bio_contents(bio.get());
}

SecureString private_key_to_pem(EVP_PKEY* key) {
    BioPtr bio(BIO_new(BIO_s_secmem()));
    if (!bio || PEM_write_bio_PrivateKey(bio.get(), key, nullptr, nullptr, 0,
                                         nullptr, nullptr) != 1) {
        throw CertificateError("private key PEM encoding failed: " + last_error());
    }
    char* data = nullptr;
    long len = BIO_get_mem_data(bio.get(), &data);
    if (len <= 0 || !data) throw CertificateError("private key PEM encoding produced no data");
    return SecureString(data, static_cast<size_t>(len));
}

X509Ptr certificate_from_pem(const std::string& pem) {
    BioPtr bio(BIO_new_mem_buf(pem.data(), static_cast<int>(pem.size())));
    X509Ptr cert(bio ? PEM_read_bio_X509(bio.get(), nullptr, nullptr, nullptr) : nullptr);
    if (!cert) throw CertificateError("invalid certificate PEM: " + last_error());
    return cert;
}

EvpPkeyPtr private_key_from_pem(const SecureString& pem) {
    BioPtr bio(BIO_new_mem_buf(pem.data(), static_cast<int>(pem.size())));
    EvpPkeyPtr key(bio ? PEM_read_bio_PrivateKey(bio.get(), nullptr, nullptr, nullptr)
                       : nullptr);
    if (!key) throw CertificateError("invalid private key PEM: " + last_error());
    return key;
}

std::chrono::system_clock::time_point not_before(const X509* cert) {
    return asn1_to_time_point(X509_get0_notBefore(cert));
}

std::chrono::system_clock::time_point not_after(const X509* cert) {
    return asn1_to_time_point(X509_get0_notAfter(cert));
}

std::string fingerprint_sha256(X509* cert) {
    unsigned char md[EVP_MAX_MD_SIZE];
    unsigned int len = 0;
    if (X509_digest(cert, EVP_sha256(), md, &len) != 1) {
        throw CertificateError("certificate digest failed: " + last_error());
    }
    std::string out;
    char hex[4];
    for (unsigned int i = 0; i < len; ++i) {
        std::snprintf(hex, sizeof(hex), i ? ":%02X" : "%02X", md[i]);
        out += hex;
    }
    return out;
}

void assign_random_serial(X509* cert) {
    auto bytes = SecureOps::random_bytes(16);
    bytes[0] &= 0x7F;   // keep the INTEGER positive
    bytes[0] |= 0x01;   // and 128 bits long

    std::unique_ptr<BIGNUM, decltype(&BN_free)> bn(
        BN_bin2bn(bytes.data(), static_cast<int>(bytes.size()), nullptr), &BN_free);
    if (!bn || !BN_to_ASN1_INTEGER(bn.get(), X509_get_serialNumber(cert))) {
        throw CertificateError("cannot set certificate serial: " + last_error());
    }
}

void add_extension(X509* cert, X509* issuer, int nid, const std::string& value) {
    X509V3_CTX ctx;
    X509V3_set_ctx_nodb(&ctx);
    X509V3_set_ctx(&ctx, issuer, cert, nullptr, nullptr, 0);

    X509_EXTENSION* ext = X509V3_EXT_conf_nid(nullptr, &ctx, nid, value.c_str());
    if (!ext) {
        throw CertificateError("bad extension " + std::string(OBJ_nid2sn(nid)) + "=" + value +
                               ": " + last_error());
    }
    int rc = X509_add_ext(cert, ext, -1);
    X509_EXTENSION_free(ext);
    if (rc != 1) throw CertificateError("cannot add extension: " + last_error());
}

} // namespace ossl
} // namespace ncf
