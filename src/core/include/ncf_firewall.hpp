#ifndef NCF_FIREWALL_HPP
#define NCF_FIREWALL_HPP

#include "ncf_system.hpp"

#include <memory>
#include <string>
#include <vector>

namespace ncf {

/// One rule of a managed chain: the match/target arguments after `-A <chain>`.
using ChainRule = std::vector<std::string>;

/**
 * @brief Observed state of one managed chain
 */
struct ChainState {
    std::string table;
    std::string chain;
    bool exists = false;
    int hook_references = 0;          // jumps from OUTPUT into the chain
    std::vector<ChainRule> rules;

    size_t rule_count() const { return rules.size(); }
    bool hooked_once() const { return hook_references == 1; }
};

/**
 * @brief Kernel packet-filter operations used by netcurfew
 *
 * Every call names a table ("nat", "filter") and a chain. Implementations
 * throw ConfigurationError when the kernel refuses an operation.
 */
class FirewallBackend {
public:
    virtual ~FirewallBackend() = default;

    /// Create the chain; an existing chain is not an error.
    virtual void create_chain(const std::string& table, const std::string& chain) = 0;
    virtual bool chain_exists(const std::string& table, const std::string& chain) = 0;
    virtual void delete_chain(const std::string& table, const std::string& chain) = 0;

    /// Number of `-j chain` rules in the built-in OUTPUT chain.
    virtual int hook_references(const std::string& table, const std::string& chain) = 0;
    /// Insert a jump at OUTPUT position 1.
    virtual void insert_hook(const std::string& table, const std::string& chain) = 0;
    /// Remove one jump from OUTPUT.
    virtual void delete_hook(const std::string& table, const std::string& chain) = 0;

    virtual void flush_chain(const std::string& table, const std::string& chain) = 0;
    virtual void append_rule(const std::string& table, const std::string& chain,
                             const ChainRule& rule) = 0;
    virtual std::vector<ChainRule> list_rules(const std::string& table,
                                              const std::string& chain) = 0;
};

/**
 * @brief FirewallBackend driving the `iptables` utility
 */
class IptablesBackend : public FirewallBackend {
public:
    explicit IptablesBackend(std::shared_ptr<CommandRunner> runner,
                             std::string binary = "iptables");

    void create_chain(const std::string& table, const std::string& chain) override;
    bool chain_exists(const std::string& table, const std::string& chain) override;
    void delete_chain(const std::string& table, const std::string& chain) override;

    int hook_references(const std::string& table, const std::string& chain) override;
    void insert_hook(const std::string& table, const std::string& chain) override;
    void delete_hook(const std::string& table, const std::string& chain) override;

    void flush_chain(const std::string& table, const std::string& chain) override;
    void append_rule(const std::string& table, const std::string& chain,
                     const ChainRule& rule) override;
    std::vector<ChainRule> list_rules(const std::string& table,
                                      const std::string& chain) override;

    /// Parse `iptables -S <chain>` output into the rules appended to chain.
    static std::vector<ChainRule> parse_rules(const std::string& listing,
                                              const std::string& chain);

private:
    CommandResult exec(const std::string& table, const std::vector<std::string>& args);
    void exec_checked(const std::string& table, const std::vector<std::string>& args,
                      const std::string& what);

    std::shared_ptr<CommandRunner> runner_;
    std::string binary_;
};

/**
 * @brief A dedicated chain hooked exactly once into OUTPUT
 *
 * Shared mechanics of the NAT redirect chain and the egress filter chain.
 * Every mutating call holds the process-wide MutationLock.
 */
class ManagedChain {
public:
    ManagedChain(std::shared_ptr<FirewallBackend> backend, std::string table,
                 std::string chain, std::string lock_path);

    /// Create the chain if needed and leave exactly one OUTPUT hook.
    void ensure_hooked();
    /// Flush, then append rules in order. Hook is verified first.
    void replace_rules(const std::vector<ChainRule>& rules);
    /// Flush all rules and drop every OUTPUT hook. Safe when absent.
    void flush_and_unhook();
    /// Unhook, flush and delete the chain entirely.
    void remove();

    ChainState status();

    const std::string& table() const { return table_; }
    const std::string& chain() const { return chain_; }

private:
    std::shared_ptr<FirewallBackend> backend_;
    std::string table_;
    std::string chain_;
    std::string lock_path_;
};

} // namespace ncf

#endif // NCF_FIREWALL_HPP
