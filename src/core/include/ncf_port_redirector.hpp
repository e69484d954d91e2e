#ifndef NCF_PORT_REDIRECTOR_HPP
#define NCF_PORT_REDIRECTOR_HPP

#include "ncf_firewall.hpp"

#include <cstdint>
#include <memory>
#include <string>

namespace ncf {

/**
 * @brief NAT redirect of loopback TCP/80 and TCP/443 into the interception listener
 *
 * Owns one dedicated chain in the nat table, hooked exactly once into OUTPUT
 * while enabled.
 */
class PortRedirector {
public:
    PortRedirector(std::shared_ptr<FirewallBackend> backend,
                   std::string chain = "NCF_REDIRECT",
                   std::string lock_path = "");

    /**
     * @brief Redirect 127.0.0.1:80 to listen_port and 127.0.0.1:443 to tls_port
     *
     * Idempotent: the chain is flushed and repopulated, and hook count is
     * forced to one. tls_port of 0 means "same as listen_port".
     * @throws ConfigurationError, StateInconsistencyError
     */
    void enable(uint16_t listen_port, uint16_t tls_port = 0);

    /// Flush and unhook. No-op when already disabled.
    void disable();

    /// Remove the chain entirely.
    void cleanup();

    ChainState status();

    /// Rules enable() installs, in order.
    static std::vector<ChainRule> redirect_rules(uint16_t listen_port, uint16_t tls_port);

private:
    ManagedChain chain_;
};

} // namespace ncf

#endif // NCF_PORT_REDIRECTOR_HPP
