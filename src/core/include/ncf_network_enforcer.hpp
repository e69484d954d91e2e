#ifndef NCF_NETWORK_ENFORCER_HPP
#define NCF_NETWORK_ENFORCER_HPP

#include "ncf_firewall.hpp"

#include <memory>
#include <string>

namespace ncf {

/**
 * @brief The kill switch as seen by the EnforcementDaemon
 *
 * The active/inactive state lives in the kernel and is only ever observed
 * through status().
 */
class AccessEnforcer {
public:
    virtual ~AccessEnforcer() = default;

    virtual void enable_block(const std::string& reason) = 0;
    virtual void disable_block() = 0;
    virtual ChainState status() = 0;
};

/**
 * @brief Egress filter chain rejecting everything but loopback, LAN, DNS
 *        and established flows
 */
class NetworkAccessEnforcer : public AccessEnforcer {
public:
    NetworkAccessEnforcer(std::shared_ptr<FirewallBackend> backend,
                          std::string chain = "NCF_ENFORCE",
                          std::string lock_path = "");

    /// Flush and repopulate the chain, hooked once. Idempotent.
    void enable_block(const std::string& reason) override;
    /// Flush the rules and drop the hook. Safe when already disabled.
    void disable_block() override;
    ChainState status() override;

    /// Unhook, flush and delete the chain.
    void cleanup();

    /// First match wins; the last rule is the catch-all reject.
    static std::vector<ChainRule> block_rules();

    /// Whether a chain state denotes an active block (hooked with rules).
    static bool is_active(const ChainState& state);

private:
    ManagedChain chain_;
};

} // namespace ncf

#endif // NCF_NETWORK_ENFORCER_HPP
