/**
 * @file test_cert_cache.cpp
 * @brief Tests for CertificateAuthority and DomainCertificateCache
 */

#include <gtest/gtest.h>
#include "ncf_cert_authority.hpp"
#include "ncf_cert_cache.hpp"
#include "ncf_errors.hpp"
#include "ncf_openssl.hpp"
#include "test_helpers.hpp"

#include <openssl/x509v3.h>

#include <chrono>
#include <ctime>
#include <memory>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include <sys/stat.h>
#include <utime.h>

using namespace ncf;
using ncf::test::TempDir;
using ncf::test::read_all;
using ncf::test::write_all;

class CertificateTest : public ::testing::Test {
protected:
    static void SetUpTestSuite() {
        ca_dir_ = new TempDir();
        CaOptions opts;
        opts.dir = ca_dir_->path();
        opts.key_bits = 2048;
        opts.validity_days = 30;
        ca_ = std::make_shared<CertificateAuthority>(opts);
        ca_->generate();
    }

    static void TearDownTestSuite() {
        ca_.reset();
        delete ca_dir_;
        ca_dir_ = nullptr;
    }

    CertCacheConfig cache_config() const {
        CertCacheConfig c;
        c.dir = dir_.file("domains");
        c.key_bits = 1024;
        c.validity_days = 30;
        return c;
    }

    static TempDir* ca_dir_;
    static std::shared_ptr<CertificateAuthority> ca_;
    TempDir dir_;
};

TempDir* CertificateTest::ca_dir_ = nullptr;
std::shared_ptr<CertificateAuthority> CertificateTest::ca_;

// ---- Certificate authority ----

TEST_F(CertificateTest, CaFilesWrittenWithModes) {
    struct stat st;
    ASSERT_EQ(stat(ca_->key_path().c_str(), &st), 0);
    EXPECT_EQ(st.st_mode & 0777, 0600u);
    ASSERT_EQ(stat(ca_->cert_path().c_str(), &st), 0);
    EXPECT_EQ(st.st_mode & 0777, 0644u);
    EXPECT_TRUE(ca_->is_loaded());
}

TEST_F(CertificateTest, EnsureLoadsExistingCa) {
    CertificateAuthority again(ca_->options());
    EXPECT_FALSE(again.ensure());
    EXPECT_EQ(again.fingerprint(), ca_->fingerprint());

    X509Ptr cert = ossl::certificate_from_pem(again.certificate_pem());
    EXPECT_EQ(X509_check_ca(cert.get()), 1);
}

TEST_F(CertificateTest, EnsureGeneratesWhenMissing) {
    CaOptions opts;
    opts.dir = dir_.file("ca");
    opts.key_bits = 1024;
    CertificateAuthority fresh(opts);
    EXPECT_FALSE(fresh.is_loaded());
    EXPECT_TRUE(fresh.ensure());
    EXPECT_TRUE(fresh.is_loaded());
    EXPECT_GT(fresh.expires(), std::chrono::system_clock::now());
}

TEST_F(CertificateTest, LoadRejectsMismatchedKey) {
    CaOptions opts;
    opts.dir = dir_.file("ca");
    opts.key_bits = 1024;
    CertificateAuthority other(opts);
    other.generate();

    // pair another CA's certificate with our key
    write_all(other.cert_path(), ca_->certificate_pem());
    CertificateAuthority broken(opts);
    EXPECT_THROW(broken.load(), CertificateError);
}

TEST_F(CertificateTest, IssuedLeafIsSignedByCa) {
    IssuedCertificate leaf = ca_->issue("example.com", 1024, 30);
    X509Ptr ca_cert = ossl::certificate_from_pem(ca_->certificate_pem());

    EvpPkeyPtr ca_pub(X509_get_pubkey(ca_cert.get()));
    EXPECT_EQ(X509_verify(leaf.cert.get(), ca_pub.get()), 1);
    EXPECT_EQ(X509_check_issued(ca_cert.get(), leaf.cert.get()), X509_V_OK);
    EXPECT_EQ(X509_check_ca(leaf.cert.get()), 0);

    EXPECT_EQ(X509_check_host(leaf.cert.get(), "example.com", 0, 0, nullptr), 1);
    EXPECT_EQ(X509_check_host(leaf.cert.get(), "www.example.com", 0, 0, nullptr), 1);
    EXPECT_NE(X509_check_host(leaf.cert.get(), "other.com", 0, 0, nullptr), 1);
    EXPECT_EQ(X509_check_private_key(leaf.cert.get(), leaf.key.get()), 1);
    EXPECT_FALSE(leaf.key_pem.empty());
}

TEST_F(CertificateTest, IssueRejectsBadNames) {
    EXPECT_THROW(ca_->issue("", 1024, 30), CertificateError);
    EXPECT_THROW(ca_->issue("bad name.com", 1024, 30), CertificateError);
    EXPECT_THROW(ca_->issue("evil.com/path", 1024, 30), CertificateError);
}

// ---- Domain cache ----

TEST_F(CertificateTest, SecondGetIsMemoryHit) {
    DomainCertificateCache cache(ca_, cache_config());
    auto first = cache.get("example.com");
    auto second = cache.get("EXAMPLE.com.");
    EXPECT_EQ(first.get(), second.get());
    EXPECT_FALSE(first->from_disk);

    CertCacheStats st = cache.stats();
    EXPECT_EQ(st.issued, 1u);
    EXPECT_EQ(st.hits, 1u);
    EXPECT_EQ(st.current_size, 1u);
}

TEST_F(CertificateTest, PersistedMaterialIsReused) {
    std::string pem;
    {
        DomainCertificateCache cache(ca_, cache_config());
        auto dc = cache.get("kids.org");
        pem = dc->cert_pem;

        struct stat st;
        ASSERT_EQ(stat(dc->key_path.c_str(), &st), 0);
        EXPECT_EQ(st.st_mode & 0777, 0600u);
    }

    DomainCertificateCache reopened(ca_, cache_config());
    auto dc = reopened.get("kids.org");
    EXPECT_TRUE(dc->from_disk);
    EXPECT_EQ(dc->cert_pem, pem);
    EXPECT_EQ(reopened.stats().disk_loads, 1u);
    EXPECT_EQ(reopened.stats().issued, 0u);
}

TEST_F(CertificateTest, ConcurrentGetsIssueOnce) {
    DomainCertificateCache cache(ca_, cache_config());
    std::vector<std::shared_ptr<const DomainCertificate>> results(8);
    std::vector<std::thread> threads;
    for (size_t i = 0; i < results.size(); ++i) {
        threads.emplace_back([&cache, &results, i] { results[i] = cache.get("race.net"); });
    }
    for (auto& t : threads) t.join();

    for (const auto& r : results) {
        ASSERT_TRUE(r);
        EXPECT_EQ(r.get(), results[0].get());
    }
    EXPECT_EQ(cache.stats().issued, 1u);
}

TEST_F(CertificateTest, InvalidateForcesReissue) {
    DomainCertificateCache cache(ca_, cache_config());
    auto before = cache.get("example.com");
    cache.invalidate("example.com");

    struct stat st;
    EXPECT_NE(stat(before->cert_path.c_str(), &st), 0);

    auto after = cache.get("example.com");
    EXPECT_NE(after->cert_pem, before->cert_pem);
    EXPECT_EQ(cache.stats().issued, 2u);
    EXPECT_EQ(cache.stats().evictions, 1u);
}

TEST_F(CertificateTest, CorruptKeyIsReplaced) {
    std::string key_path;
    {
        DomainCertificateCache cache(ca_, cache_config());
        key_path = cache.get("broken.com")->key_path;
    }
    write_all(key_path, "garbage");

    DomainCertificateCache cache(ca_, cache_config());
    auto dc = cache.get("broken.com");
    EXPECT_FALSE(dc->from_disk);
    EXPECT_NE(read_all(key_path), "garbage");
}

TEST_F(CertificateTest, LeafFromReplacedCaIsReissued) {
    CaOptions opts;
    opts.dir = dir_.file("ca");
    opts.key_bits = 1024;
    auto ca = std::make_shared<CertificateAuthority>(opts);
    ca->generate();

    std::string old_pem;
    {
        DomainCertificateCache cache(ca, cache_config());
        auto before = cache.get("rotate.com");
        old_pem = before->cert_pem;

        // same process: the memory entry no longer counts
        ca->generate();
        auto after = cache.get("rotate.com");
        EXPECT_NE(after->cert_pem, old_pem);
        EXPECT_TRUE(ca->issued(after->cert.get()));
        old_pem = after->cert_pem;
    }

    // new process after `ca generate`: the file on disk no longer counts
    ca->generate();
    auto reloaded = std::make_shared<CertificateAuthority>(opts);
    reloaded->load();
    DomainCertificateCache cache(reloaded, cache_config());
    auto dc = cache.get("rotate.com");
    EXPECT_FALSE(dc->from_disk);
    EXPECT_NE(dc->cert_pem, old_pem);
    EXPECT_TRUE(reloaded->issued(dc->cert.get()));
    EXPECT_EQ(cache.stats().disk_loads, 0u);
    EXPECT_EQ(cache.stats().issued, 1u);
}

TEST_F(CertificateTest, ForeignLeafIsNotIssued) {
    CaOptions opts;
    opts.dir = dir_.file("ca");
    opts.key_bits = 1024;
    CertificateAuthority other(opts);
    other.generate();

    IssuedCertificate leaf = other.issue("example.com", 1024, 30);
    EXPECT_TRUE(other.issued(leaf.cert.get()));
    EXPECT_FALSE(ca_->issued(leaf.cert.get()));
    EXPECT_FALSE(ca_->issued(nullptr));
}

TEST_F(CertificateTest, MemoryHoldsMostRecentlyUsed) {
    CertCacheConfig config = cache_config();
    config.max_entries = 2;
    DomainCertificateCache cache(ca_, config);

    cache.get("a.com");
    cache.get("b.com");
    cache.get("c.com");
    CertCacheStats st = cache.stats();
    EXPECT_EQ(st.current_size, 2u);
    EXPECT_EQ(st.evictions, 1u);
    EXPECT_EQ(st.domain_locks, 0u);

    cache.get("b.com");
    EXPECT_EQ(cache.stats().hits, 1u);

    // a.com fell out of memory but its files remain; c.com is now oldest
    EXPECT_TRUE(cache.get("a.com")->from_disk);
    cache.get("b.com");
    st = cache.stats();
    EXPECT_EQ(st.disk_loads, 1u);
    EXPECT_EQ(st.hits, 2u);
    EXPECT_EQ(st.current_size, 2u);
    EXPECT_EQ(st.evictions, 2u);
}

TEST_F(CertificateTest, DomainLocksDoNotAccumulate) {
    DomainCertificateCache cache(ca_, cache_config());
    std::vector<std::thread> threads;
    for (int i = 0; i < 6; ++i) {
        threads.emplace_back([&cache, i] {
            cache.get("host" + std::to_string(i % 3) + ".net");
        });
    }
    for (auto& t : threads) t.join();
    cache.invalidate("host0.net");
    cache.invalidate("never-seen.net");

    CertCacheStats st = cache.stats();
    EXPECT_EQ(st.domain_locks, 0u);
    EXPECT_EQ(st.issued, 3u);
}

TEST_F(CertificateTest, SweepRemovesOldFiles) {
    DomainCertificateCache cache(ca_, cache_config());
    auto old_cert = cache.get("old.com");
    auto new_cert = cache.get("new.com");

    // age old.com by 40 days
    struct utimbuf times;
    times.actime = times.modtime = std::time(nullptr) - 40 * 24 * 3600;
    ASSERT_EQ(utime(old_cert->cert_path.c_str(), &times), 0);

    EXPECT_EQ(cache.sweep(std::chrono::hours(30 * 24)), 1u);

    struct stat st;
    EXPECT_NE(stat(old_cert->cert_path.c_str(), &st), 0);
    EXPECT_NE(stat(old_cert->key_path.c_str(), &st), 0);
    EXPECT_EQ(stat(new_cert->cert_path.c_str(), &st), 0);
    EXPECT_EQ(cache.stats().current_size, 1u);

    // swept domain is reissued on demand
    EXPECT_NE(cache.get("old.com")->cert_pem, old_cert->cert_pem);
}

TEST_F(CertificateTest, SweepOnMissingDirectory) {
    DomainCertificateCache cache(ca_, cache_config());
    EXPECT_EQ(cache.sweep(std::chrono::hours(1)), 0u);
}

TEST_F(CertificateTest, EmptyDomainRejected) {
    DomainCertificateCache cache(ca_, cache_config());
    EXPECT_THROW(cache.get(""), CertificateError);
    EXPECT_EQ(cache.stats().failures, 0u);
}

TEST(CertCacheHelpersTest, FileStem) {
    EXPECT_EQ(DomainCertificateCache::file_stem("Example.COM."), "example.com");
    EXPECT_EQ(DomainCertificateCache::file_stem("*.example.com"), "wildcard.example.com");
    EXPECT_EQ(DomainCertificateCache::file_stem("a/b"), "a_b");
}
