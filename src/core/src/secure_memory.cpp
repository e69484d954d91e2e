#include "ncf_secure_memory.hpp"
#include "ncf_errors.hpp"

#include <sodium.h>
#include <cstring>
#include <mutex>
#include <new>
#include <utility>

namespace ncf {

namespace SecureOps {

void init() {
    static std::once_flag once;
    static bool ok = false;
    std::call_once(once, [] { ok = sodium_init() >= 0; });
    if (!ok) throw CertificateError("libsodium initialisation failed");
}

void secure_zero(void* ptr, size_t size) {
    if (ptr && size > 0) sodium_memzero(ptr, size);
}

std::vector<uint8_t> random_bytes(size_t size) {
    init();
    std::vector<uint8_t> out(size);
    if (size > 0) randombytes_buf(out.data(), size);
    return out;
}

} // namespace SecureOps

// Key PEM lives in sodium_malloc memory: guard pages around it, and
// sodium_free wipes it before release.
SecureString::SecureString(const char* str, size_t len) {
    if (!str || len == 0) return;
    SecureOps::init();
    auto* p = static_cast<char*>(sodium_malloc(len + 1));
    if (!p) throw std::bad_alloc();
    std::memcpy(p, str, len);
    p[len] = '\0';
    data_ = p;
    size_ = len;
}

SecureString::~SecureString() {
    clear();
}

SecureString::SecureString(SecureString&& other) noexcept {
    swap(other);
}

SecureString& SecureString::operator=(SecureString&& other) noexcept {
    if (this != &other) {
        clear();
        swap(other);
    }
    return *this;
}

void SecureString::swap(SecureString& other) noexcept {
    std::swap(data_, other.data_);
    std::swap(size_, other.size_);
}

void SecureString::clear() {
    if (data_) sodium_free(data_);
    data_ = nullptr;
    size_ = 0;
}

} // namespace ncf
