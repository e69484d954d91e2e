#include "ncf_settings.hpp"
#include "ncf_errors.hpp"
#include "ncf_logger.hpp"
#include "ncf_system.hpp"

#include <algorithm>
#include <cstdlib>

namespace ncf {
namespace settings {

namespace {
constexpr const char* kDefaultConfig = "/etc/netcurfew/netcurfew.conf";
}

std::string config_path(const std::string& cli_value) {
    if (!cli_value.empty()) return cli_value;
    const char* env = std::getenv("NETCURFEW_CONFIG");
    if (env && *env) return env;
    return kDefaultConfig;
}

void apply_logging(const Config& cfg) {
    auto& log = Logger::instance();
    log.setLevel(Logger::levelFromString(cfg.get("log.level", "info")));
    log.setConsoleOutput(cfg.getBool("log.console", true));
    log.setMaxFileBytes(static_cast<uint64_t>(std::max(0, cfg.getInt("log.max_kb", 10240))) * 1024);

    std::string log_file = cfg.get("log.file");
    if (!log_file.empty() && !log.setFileOutput(log_file)) {
        NCF_LOG_WARN("config", "cannot open log file " + log_file);
    }
}

std::shared_ptr<FirewallBackend> firewall_backend() {
    return std::make_shared<IptablesBackend>(std::make_shared<ProcessRunner>());
}

std::unique_ptr<HostsFileManager> hosts_manager(const Config& cfg) {
    int keep = cfg.getInt("hosts.keep_backups", 10);
    return std::make_unique<HostsFileManager>(
        cfg.get("hosts.path", "/etc/hosts"),
        cfg.get("hosts.backup_dir", "/var/lib/netcurfew/backups"),
        static_cast<size_t>(keep > 0 ? keep : 1),
        cfg.get("lock.path"));
}

std::unique_ptr<PortRedirector> port_redirector(const Config& cfg,
                                                std::shared_ptr<FirewallBackend> backend) {
    return std::make_unique<PortRedirector>(std::move(backend),
                                            cfg.get("redirect.chain", "NCF_REDIRECT"),
                                            cfg.get("lock.path"));
}

std::shared_ptr<NetworkAccessEnforcer> network_enforcer(const Config& cfg,
                                                        std::shared_ptr<FirewallBackend> backend) {
    return std::make_shared<NetworkAccessEnforcer>(std::move(backend),
                                                   cfg.get("enforce.chain", "NCF_ENFORCE"),
                                                   cfg.get("lock.path"));
}

CaOptions ca_options(const Config& cfg) {
    CaOptions o;
    o.dir = cfg.get("ca.dir", o.dir);
    o.key_bits = cfg.getInt("ca.key_bits", o.key_bits);
    o.validity_days = cfg.getInt("ca.validity_days", o.validity_days);
    return o;
}

CertCacheConfig cert_cache_config(const Config& cfg) {
    CertCacheConfig c;
    c.dir = cfg.get("certs.dir", c.dir);
    c.key_bits = cfg.getInt("certs.key_bits", c.key_bits);
    c.validity_days = cfg.getInt("certs.validity_days", c.validity_days);
    c.renew_before = std::chrono::hours(24 * cfg.getInt("certs.renew_before_days", 7));
    c.max_entries = static_cast<size_t>(
        std::max(0, cfg.getInt("certs.max_entries", static_cast<int>(c.max_entries))));
    return c;
}

ServerConfig server_config(const Config& cfg) {
    ServerConfig s;
    s.bind_address = cfg.get("server.bind_address", s.bind_address);
    s.http_port = cfg.getPort("server.http_port", s.http_port);
    s.https_port = cfg.getPort("server.https_port", s.https_port);
    s.workers = static_cast<size_t>(std::max(1, cfg.getInt("server.workers", 16)));
    s.max_pending = static_cast<size_t>(std::max(1, cfg.getInt("server.max_pending", 256)));
    s.connection_timeout = cfg.getMillis("server.connection_timeout_ms", 5000);
    s.block_page_url = cfg.get("server.block_page_url", s.block_page_url);
    return s;
}

WatchdogConfig watchdog_config(const Config& cfg) {
    WatchdogConfig w;
    w.interval = cfg.getSeconds("watchdog.interval_seconds", 10);
    w.failure_threshold = cfg.getInt("watchdog.failure_threshold", 3);
    w.max_restarts = cfg.getInt("watchdog.max_restarts", 5);
    w.restart_window = cfg.getSeconds("watchdog.restart_window_seconds", 600);
    w.fallback_enabled = cfg.getBool("watchdog.fallback", true);
    return w;
}

std::shared_ptr<PolicySource> policy_source(const Config& cfg) {
    std::string db = cfg.get("policy.db", "/var/lib/ubuntu-parental/control.json");
    try {
        return std::make_shared<JsonPolicyStore>(db);
    } catch (const ConfigurationError& e) {
        NCF_LOG_WARN("policy", std::string(e.what()) + "; no schedules or block lists");
        return std::make_shared<StaticPolicySource>();
    }
}

} // namespace settings
} // namespace ncf
