#include "ncf_network_enforcer.hpp"
#include "ncf_logger.hpp"

namespace ncf {

namespace {
constexpr const char* kLog = "enforcer";
constexpr const char* kFilterTable = "filter";
}

NetworkAccessEnforcer::NetworkAccessEnforcer(std::shared_ptr<FirewallBackend> backend,
                                             std::string chain, std::string lock_path)
    : chain_(std::move(backend), kFilterTable, std::move(chain), std::move(lock_path))
{
}

std::vector<ChainRule> NetworkAccessEnforcer::block_rules() {
    return {
        {"-o", "lo", "-j", "ACCEPT"},
        {"-m", "conntrack", "--ctstate", "ESTABLISHED,RELATED", "-j", "ACCEPT"},
        {"-d", "10.0.0.0/8", "-j", "ACCEPT"},
        {"-d", "172.16.0.0/12", "-j", "ACCEPT"},
        {"-d", "192.168.0.0/16", "-j", "ACCEPT"},
        {"-p", "udp", "--dport", "53", "-j", "ACCEPT"},
        {"-p", "tcp", "--dport", "53", "-j", "ACCEPT"},
        {"-j", "REJECT", "--reject-with", "icmp-net-prohibited"},
    };
}

bool NetworkAccessEnforcer::is_active(const ChainState& state) {
    return state.exists && state.hook_references > 0 && !state.rules.empty();
}

void NetworkAccessEnforcer::enable_block(const std::string& reason) {
    chain_.replace_rules(block_rules());
    NCF_LOG_WARN(kLog, "outbound network blocked: " + reason);
}

void NetworkAccessEnforcer::disable_block() {
    chain_.flush_and_unhook();
    NCF_LOG_INFO(kLog, "outbound network restored");
}

ChainState NetworkAccessEnforcer::status() {
    return chain_.status();
}

void NetworkAccessEnforcer::cleanup() {
    chain_.remove();
}

} // namespace ncf
