#ifndef NCF_APPLICATION_HPP
#define NCF_APPLICATION_HPP

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <set>
#include <string>

#include "core/include/ncf_config.hpp"
#include "core/include/ncf_enforcement_daemon.hpp"
#include "core/include/ncf_logger.hpp"
#include "core/include/ncf_settings.hpp"

namespace ncf {

/**
 * @brief The netcurfewd service
 *
 * Wires the interception server, hosts block, port redirect, enforcement
 * daemon and watchdog together and keeps them fed from the policy store.
 */
class Application {
public:
    Application(int argc, char** argv);
    ~Application();

    // Prevent copying
    Application(const Application&) = delete;
    Application& operator=(const Application&) = delete;

    /// Block until requestStop(); returns the process exit status.
    int run();

    void loadConfig(const std::string& config_path);

    // Lifecycle management
    void initialize();
    void shutdown();

    /// Async-signal-safe.
    static void requestStop();
    /// Async-signal-safe; the log file is reopened on the next loop pass.
    static void requestLogReopen();

    bool isInitialized() const { return initialized_; }
    const std::string& configPath() const { return config_path_; }

    Config& config() { return Config::instance(); }
    Logger& logger() { return Logger::instance(); }

private:
    void initializeLogging();
    void initializeCertificates();
    void initializeServer();
    void initializeNetwork();
    void initializeSupervision();

    void refreshPolicy();
    void restartServer();
    void startFallback();

    void parseArguments();

    bool initialized_;
    std::string config_path_;
    int argc_;
    char** argv_;

    std::shared_ptr<FirewallBackend> firewall_;
    std::unique_ptr<HostsFileManager> hosts_;
    std::unique_ptr<PortRedirector> redirector_;
    std::shared_ptr<NetworkAccessEnforcer> enforcer_;
    std::shared_ptr<PolicySource> policy_;
    std::shared_ptr<CertificateAuthority> ca_;
    std::shared_ptr<DomainCertificateCache> certs_;
    std::unique_ptr<InterceptionServer> server_;
    std::unique_ptr<StaticResponder> fallback_;
    std::unique_ptr<StaticResponder> fallback_tls_;
    std::unique_ptr<EnforcementDaemon> daemon_;
    std::unique_ptr<Watchdog> watchdog_;

    std::mutex server_mtx_;
    std::set<std::string> applied_domains_;
    bool domains_applied_ = false;

    static std::atomic<bool> stop_requested_;
    static std::atomic<bool> reopen_requested_;
};

} // namespace ncf

#endif // NCF_APPLICATION_HPP
