#ifndef NCF_SECURE_MEMORY_HPP
#define NCF_SECURE_MEMORY_HPP

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace ncf {

/**
 * @brief Non-copyable byte string in libsodium guarded memory
 *
 * Holds private-key PEM while it is being written to or read from disk.
 * Always NUL-terminated; wiped when released.
 */
class SecureString {
public:
    SecureString() = default;
    SecureString(const char* str, size_t len);
    ~SecureString();

    SecureString(const SecureString&) = delete;
    SecureString& operator=(const SecureString&) = delete;

    SecureString(SecureString&& other) noexcept;
    SecureString& operator=(SecureString&& other) noexcept;

    const char* data() const { return data_; }
    size_t size() const { return size_; }
    bool empty() const { return size_ == 0; }

    void clear();
    void swap(SecureString& other) noexcept;

private:
    char* data_ = nullptr;
    size_t size_ = 0;
};

namespace SecureOps {
    /// Initialise libsodium once; throws CertificateError on failure.
    void init();

    void secure_zero(void* ptr, size_t size);

    /// CSPRNG bytes (libsodium randombytes_buf).
    std::vector<uint8_t> random_bytes(size_t size);
}

} // namespace ncf

#endif // NCF_SECURE_MEMORY_HPP
