#include "Application.hpp"
#include "core/include/ncf_errors.hpp"

#include <csignal>
#include <cstdlib>
#include <iostream>
#include <thread>

namespace ncf {

namespace {
constexpr const char* kLog = "netcurfewd";
constexpr const char* kVersion = "1.0.0";
}

std::atomic<bool> Application::stop_requested_(false);
std::atomic<bool> Application::reopen_requested_(false);

Application::Application(int argc, char** argv)
    : initialized_(false)
    , argc_(argc)
    , argv_(argv)
{
    parseArguments();
}

Application::~Application() {
    shutdown();
}

void Application::requestStop() {
    stop_requested_ = true;
}

void Application::requestLogReopen() {
    reopen_requested_ = true;
}

void Application::parseArguments() {
    std::string cli_config;
    for (int i = 1; i < argc_; ++i) {
        std::string arg(argv_[i]);
        if (arg == "--config" && i + 1 < argc_) {
            cli_config = argv_[++i];
        }
    }
    config_path_ = settings::config_path(cli_config);
}

void Application::loadConfig(const std::string& config_path) {
    config_path_ = config_path;
    auto& cfg = Config::instance();
    if (!cfg.loadFromFile(config_path)) {
        NCF_LOG_WARN(kLog, "config file not found: " + config_path + ", using defaults");
    } else {
        NCF_LOG_INFO(kLog, "configuration loaded from " + config_path);
        for (const auto& key : cfg.unknownKeys()) {
            NCF_LOG_WARN(kLog, "unknown configuration key '" + key + "' ignored");
        }
    }
}

void Application::initialize() {
    if (initialized_) return;

    initializeLogging();
    NCF_LOG_INFO(kLog, std::string("starting netcurfewd ") + kVersion);

    policy_ = settings::policy_source(config());
    firewall_ = settings::firewall_backend();

    initializeCertificates();
    initializeServer();
    initializeNetwork();
    initializeSupervision();

    initialized_ = true;
    NCF_LOG_INFO(kLog, "all components running");
}

void Application::initializeLogging() {
    settings::apply_logging(config());
    Logger::instance().setAlertHandler([](const std::string& component, const std::string& msg) {
        // Also reaches syslog through journald when run as a unit
        std::cerr << "netcurfewd ALERT [" << component << "] " << msg << std::endl;
    });
}

void Application::initializeCertificates() {
    ca_ = std::make_shared<CertificateAuthority>(settings::ca_options(config()));
    if (ca_->ensure()) {
        NCF_LOG_WARN(kLog, "generated a new root CA; install " + ca_->cert_path() +
                           " into the trust store");
    }
    certs_ = std::make_shared<DomainCertificateCache>(ca_, settings::cert_cache_config(config()));
    int max_age = config().getInt("certs.max_age_days", 30);
    certs_->sweep(std::chrono::hours(24 * max_age));
}

void Application::initializeServer() {
    server_ = std::make_unique<InterceptionServer>(settings::server_config(config()),
                                                   make_cache_selector(certs_));
    refreshPolicy();
    server_->start();
}

void Application::initializeNetwork() {
    hosts_ = settings::hosts_manager(config());
    redirector_ = settings::port_redirector(config(), firewall_);
    enforcer_ = settings::network_enforcer(config(), firewall_);

    redirector_->enable(server_->http_port(), server_->https_port());
    refreshPolicy();
}

void Application::initializeSupervision() {
    auto& cfg = config();
    daemon_ = std::make_unique<EnforcementDaemon>(
        enforcer_, policy_, cfg.getSeconds("daemon.interval_seconds", 60),
        cfg.getInt("daemon.alert_after_failures", 3));
    daemon_->start();

    const std::string address = cfg.get("server.bind_address", "127.0.0.1");
    const uint16_t port = server_->http_port();
    const auto timeout = cfg.getMillis("server.connection_timeout_ms", 5000);
    watchdog_ = std::make_unique<Watchdog>(
        settings::watchdog_config(cfg),
        [address, port, timeout] { return probe_http_health(address, port, timeout); },
        [this] { restartServer(); },
        [this] { startFallback(); });
    watchdog_->start();
}

void Application::refreshPolicy() {
    try {
        BlockRules rules = policy_->block_rules();
        WallClock now = WallClock::now();
        AccessDecision access =
            ScheduleEvaluator::is_allowed(now, policy_->schedules(), policy_->usage(now));

        std::set<std::string> domains = rules.all_domains();
        {
            std::lock_guard<std::mutex> lock(server_mtx_);
            if (server_) {
                server_->set_block_rules(rules);
                server_->set_access(access);
            }
        }

        if (hosts_ && (!domains_applied_ || domains != applied_domains_)) {
            hosts_->update(domains);
            applied_domains_ = std::move(domains);
            domains_applied_ = true;
        }
    } catch (const std::exception& e) {
        NCF_LOG_ERROR(kLog, std::string("policy refresh failed: ") + e.what());
    }
}

void Application::restartServer() {
    std::lock_guard<std::mutex> lock(server_mtx_);
    server_->stop(config().getMillis("server.drain_timeout_ms", 3000));
    server_->start();
}

void Application::startFallback() {
    std::lock_guard<std::mutex> lock(server_mtx_);
    const uint16_t http_port = server_->http_port();
    const uint16_t https_port = server_->https_port();
    const std::string bind = config().get("server.bind_address", "127.0.0.1");
    server_->stop(std::chrono::milliseconds(0));

    fallback_ = std::make_unique<StaticResponder>(bind, http_port);
    fallback_->start();
    // Redirected HTTPS still lands here; refuse it rather than leave it hanging
    fallback_tls_ = std::make_unique<StaticResponder>(bind, https_port,
                                                      StaticResponder::Mode::CloseOnly);
    fallback_tls_->start();
}

int Application::run() {
    if (!initialized_) {
        initialize();
    }

    const auto refresh = config().getSeconds("policy.refresh_seconds", 30);
    const auto sweep_every = std::chrono::hours(24);
    const int max_age = config().getInt("certs.max_age_days", 30);
    auto next_refresh = std::chrono::steady_clock::now() + refresh;
    auto next_sweep = std::chrono::steady_clock::now() + sweep_every;

    while (!stop_requested_.load()) {
        std::this_thread::sleep_for(std::chrono::seconds(1));
        if (reopen_requested_.exchange(false) && !logger().reopen()) {
            NCF_LOG_WARN(kLog, "log file reopen failed");
        }
        auto now = std::chrono::steady_clock::now();
        if (now >= next_refresh) {
            refreshPolicy();
            next_refresh = now + refresh;
        }
        if (now >= next_sweep) {
            try {
                certs_->sweep(std::chrono::hours(24 * max_age));
            } catch (const std::exception& e) {
                NCF_LOG_ERROR(kLog, std::string("certificate sweep failed: ") + e.what());
            }
            next_sweep = now + sweep_every;
        }
    }

    NCF_LOG_INFO(kLog, "shutdown signal received");
    shutdown();
    return EXIT_SUCCESS;
}

void Application::shutdown() {
    if (!initialized_) return;
    initialized_ = false;

    if (watchdog_) watchdog_->stop();
    if (daemon_) daemon_->stop();   // leaves the network unrestricted

    try {
        if (redirector_) redirector_->disable();
    } catch (const std::exception& e) {
        NCF_LOG_ERROR(kLog, std::string("cannot disable port redirect: ") + e.what());
    }

    {
        std::lock_guard<std::mutex> lock(server_mtx_);
        if (server_) server_->stop(config().getMillis("server.drain_timeout_ms", 3000));
        if (fallback_) fallback_->stop();
        if (fallback_tls_) fallback_tls_->stop();
    }
    NCF_LOG_INFO(kLog, "stopped");
}

} // namespace ncf
