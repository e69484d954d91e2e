#ifndef NCF_TEST_HELPERS_HPP
#define NCF_TEST_HELPERS_HPP

#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <string>
#include <vector>

#include <ftw.h>
#include <unistd.h>

namespace ncf {
namespace test {

/// mkdtemp directory removed recursively on destruction.
class TempDir {
public:
    TempDir() {
        char tmpl[] = "/tmp/ncf_test_XXXXXX";
        if (!mkdtemp(tmpl)) throw std::runtime_error("mkdtemp failed");
        path_ = tmpl;
    }
    ~TempDir() {
        nftw(path_.c_str(), &TempDir::remove_entry, 16, FTW_DEPTH | FTW_PHYS);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::string& path() const { return path_; }
    std::string file(const std::string& name) const { return path_ + "/" + name; }

private:
    static int remove_entry(const char* p, const struct stat*, int, struct FTW*) {
        return std::remove(p);
    }

    std::string path_;
};

inline std::string read_all(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
}

inline void write_all(const std::string& path, const std::string& content) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << content;
}

inline void put16(std::vector<uint8_t>& out, size_t v) {
    out.push_back(static_cast<uint8_t>((v >> 8) & 0xFF));
    out.push_back(static_cast<uint8_t>(v & 0xFF));
}

/// Minimal TLS 1.2 ClientHello record, optionally with a server_name extension.
inline std::vector<uint8_t> client_hello(const std::string& host, uint8_t name_type = 0x00) {
    std::vector<uint8_t> ext;
    // a non-SNI extension first (supported_groups)
    put16(ext, 0x000a);
    put16(ext, 4);
    put16(ext, 2);
    put16(ext, 0x001d);
    if (!host.empty()) {
        put16(ext, 0x0000);
        put16(ext, host.size() + 5);
        put16(ext, host.size() + 3);
        ext.push_back(name_type);
        put16(ext, host.size());
        ext.insert(ext.end(), host.begin(), host.end());
    }

    std::vector<uint8_t> body;
    put16(body, 0x0303);
    body.insert(body.end(), 32, 0xAB);      // random
    body.push_back(0);                      // session id
    put16(body, 2);
    put16(body, 0xc02f);                    // one cipher suite
    body.push_back(1);
    body.push_back(0);                      // null compression
    put16(body, ext.size());
    body.insert(body.end(), ext.begin(), ext.end());

    std::vector<uint8_t> hs;
    hs.push_back(0x01);
    hs.push_back(0);
    put16(hs, body.size());
    hs.insert(hs.end(), body.begin(), body.end());

    std::vector<uint8_t> rec{0x16, 0x03, 0x01};
    put16(rec, hs.size());
    rec.insert(rec.end(), hs.begin(), hs.end());
    return rec;
}

} // namespace test
} // namespace ncf

#endif // NCF_TEST_HELPERS_HPP
