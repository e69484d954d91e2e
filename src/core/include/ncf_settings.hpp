#ifndef NCF_SETTINGS_HPP
#define NCF_SETTINGS_HPP

#include "ncf_cert_authority.hpp"
#include "ncf_cert_cache.hpp"
#include "ncf_config.hpp"
#include "ncf_firewall.hpp"
#include "ncf_hosts.hpp"
#include "ncf_interception_server.hpp"
#include "ncf_network_enforcer.hpp"
#include "ncf_policy.hpp"
#include "ncf_port_redirector.hpp"
#include "ncf_watchdog.hpp"

#include <memory>
#include <string>

namespace ncf {

/**
 * @brief Components built from the process Config
 *
 * Shared by the service and the CLI so both act on the same files,
 * chains and lock.
 */
namespace settings {

/// --config argument, else $NETCURFEW_CONFIG, else /etc/netcurfew/netcurfew.conf.
std::string config_path(const std::string& cli_value);

/// Apply log.level, log.console and log.file to the Logger.
void apply_logging(const Config& cfg);

std::shared_ptr<FirewallBackend> firewall_backend();
std::unique_ptr<HostsFileManager> hosts_manager(const Config& cfg);
std::unique_ptr<PortRedirector> port_redirector(const Config& cfg,
                                                std::shared_ptr<FirewallBackend> backend);
std::shared_ptr<NetworkAccessEnforcer> network_enforcer(const Config& cfg,
                                                        std::shared_ptr<FirewallBackend> backend);

CaOptions ca_options(const Config& cfg);
CertCacheConfig cert_cache_config(const Config& cfg);
ServerConfig server_config(const Config& cfg);
WatchdogConfig watchdog_config(const Config& cfg);

/// JsonPolicyStore on policy.db; an empty static source when it cannot be loaded.
std::shared_ptr<PolicySource> policy_source(const Config& cfg);

} // namespace settings

} // namespace ncf

#endif // NCF_SETTINGS_HPP
