#include "ncf_firewall.hpp"
#include "ncf_errors.hpp"
#include "ncf_logger.hpp"

#include <sstream>

namespace ncf {

namespace {

constexpr const char* kLog = "firewall";

bool mentions(const std::string& text, const char* needle) {
    return text.find(needle) != std::string::npos;
}

std::string join(const std::vector<std::string>& parts) {
    std::string out;
    for (const auto& p : parts) {
        if (!out.empty()) out += ' ';
        out += p;
    }
    return out;
}

std::vector<std::string> split_ws(const std::string& line) {
    std::istringstream iss(line);
    std::vector<std::string> tokens;
    std::string tok;
    while (iss >> tok) {
        // iptables -S quotes comments; strip the quotes
        if (tok.size() >= 2 && tok.front() == '"' && tok.back() == '"') {
            tok = tok.substr(1, tok.size() - 2);
        }
        tokens.push_back(tok);
    }
    return tokens;
}

} // namespace

// ==================== IptablesBackend ====================

IptablesBackend::IptablesBackend(std::shared_ptr<CommandRunner> runner, std::string binary)
    : runner_(std::move(runner))
    , binary_(std::move(binary))
{
    if (!runner_) throw std::invalid_argument("IptablesBackend: runner is null");
}

CommandResult IptablesBackend::exec(const std::string& table,
                                    const std::vector<std::string>& args) {
    std::vector<std::string> argv = {binary_, "-w", "-t", table};
    argv.insert(argv.end(), args.begin(), args.end());
    CommandResult r = runner_->run(argv);
    NCF_LOG_TRACE(kLog, join(argv) + " -> " + std::to_string(r.exit_code));
    return r;
}

void IptablesBackend::exec_checked(const std::string& table,
                                   const std::vector<std::string>& args,
                                   const std::string& what) {
    CommandResult r = exec(table, args);
    if (!r.ok()) {
        std::string detail = r.error.empty() ? r.output : r.error;
        if (mentions(detail, "Permission denied") || r.exit_code == 4) {
            throw ConfigurationError(what + ": permission denied (run as root): " + detail);
        }
        throw ConfigurationError(what + " failed (exit " + std::to_string(r.exit_code) +
                                 "): " + detail);
    }
}

void IptablesBackend::create_chain(const std::string& table, const std::string& chain) {
    CommandResult r = exec(table, {"-N", chain});
    if (r.ok() || mentions(r.error, "already exists")) return;
    throw ConfigurationError("create chain " + table + "/" + chain + " failed: " + r.error);
}

bool IptablesBackend::chain_exists(const std::string& table, const std::string& chain) {
    return exec(table, {"-S", chain}).ok();
}

void IptablesBackend::delete_chain(const std::string& table, const std::string& chain) {
    CommandResult r = exec(table, {"-X", chain});
    if (r.ok() || mentions(r.error, "No chain") || mentions(r.error, "does not exist")) return;
    throw ConfigurationError("delete chain " + table + "/" + chain + " failed: " + r.error);
}

int IptablesBackend::hook_references(const std::string& table, const std::string& chain) {
    CommandResult r = exec(table, {"-S", "OUTPUT"});
    if (!r.ok()) {
        throw ConfigurationError("list " + table + "/OUTPUT failed: " + r.error);
    }
    int refs = 0;
    for (const auto& rule : parse_rules(r.output, "OUTPUT")) {
        if (rule.size() == 2 && rule[0] == "-j" && rule[1] == chain) ++refs;
    }
    return refs;
}

void IptablesBackend::insert_hook(const std::string& table, const std::string& chain) {
    exec_checked(table, {"-I", "OUTPUT", "1", "-j", chain}, "hook " + chain + " into OUTPUT");
}

void IptablesBackend::delete_hook(const std::string& table, const std::string& chain) {
    CommandResult r = exec(table, {"-D", "OUTPUT", "-j", chain});
    if (r.ok() || mentions(r.error, "does a matching rule exist") ||
        mentions(r.error, "No chain") || mentions(r.error, "Bad rule")) {
        return;
    }
    throw ConfigurationError("unhook " + chain + " failed: " + r.error);
}

void IptablesBackend::flush_chain(const std::string& table, const std::string& chain) {
    exec_checked(table, {"-F", chain}, "flush " + table + "/" + chain);
}

void IptablesBackend::append_rule(const std::string& table, const std::string& chain,
                                  const ChainRule& rule) {
    std::vector<std::string> args = {"-A", chain};
    args.insert(args.end(), rule.begin(), rule.end());
    exec_checked(table, args, "append to " + table + "/" + chain);
}

std::vector<ChainRule> IptablesBackend::list_rules(const std::string& table,
                                                   const std::string& chain) {
    CommandResult r = exec(table, {"-S", chain});
    if (!r.ok()) {
        throw ConfigurationError("list " + table + "/" + chain + " failed: " + r.error);
    }
    return parse_rules(r.output, chain);
}

std::vector<ChainRule> IptablesBackend::parse_rules(const std::string& listing,
                                                    const std::string& chain) {
    std::vector<ChainRule> rules;
    std::istringstream iss(listing);
    std::string line;
    while (std::getline(iss, line)) {
        auto tokens = split_ws(line);
        if (tokens.size() < 2 || tokens[0] != "-A" || tokens[1] != chain) continue;
        rules.emplace_back(tokens.begin() + 2, tokens.end());
    }
    return rules;
}

// ==================== ManagedChain ====================

ManagedChain::ManagedChain(std::shared_ptr<FirewallBackend> backend, std::string table,
                           std::string chain, std::string lock_path)
    : backend_(std::move(backend))
    , table_(std::move(table))
    , chain_(std::move(chain))
    , lock_path_(std::move(lock_path))
{
    if (!backend_) throw std::invalid_argument("ManagedChain: backend is null");
    if (chain_.empty()) throw std::invalid_argument("ManagedChain: chain name is empty");
}

void ManagedChain::ensure_hooked() {
    MutationLock lock(lock_path_);

    backend_->create_chain(table_, chain_);

    // A duplicate hook would apply every rule twice; collapse to exactly one.
    int refs = backend_->hook_references(table_, chain_);
    if (refs > 1) {
        NCF_LOG_WARN(kLog, chain_ + " hooked " + std::to_string(refs) +
                           " times into OUTPUT, dropping extras");
        for (int i = 1; i < refs; ++i) backend_->delete_hook(table_, chain_);
    } else if (refs == 0) {
        backend_->insert_hook(table_, chain_);
        NCF_LOG_INFO(kLog, "hooked " + table_ + "/" + chain_ + " into OUTPUT");
    }

    refs = backend_->hook_references(table_, chain_);
    if (refs != 1) {
        throw StateInconsistencyError(chain_, refs);
    }
}

void ManagedChain::replace_rules(const std::vector<ChainRule>& rules) {
    MutationLock lock(lock_path_);
    ensure_hooked();
    backend_->flush_chain(table_, chain_);
    for (const auto& rule : rules) {
        backend_->append_rule(table_, chain_, rule);
    }
    NCF_LOG_DEBUG(kLog, table_ + "/" + chain_ + " now has " + std::to_string(rules.size()) +
                        " rules");
}

void ManagedChain::flush_and_unhook() {
    MutationLock lock(lock_path_);
    if (!backend_->chain_exists(table_, chain_)) return;
    backend_->flush_chain(table_, chain_);
    int refs = backend_->hook_references(table_, chain_);
    for (int i = 0; i < refs; ++i) backend_->delete_hook(table_, chain_);
}

void ManagedChain::remove() {
    MutationLock lock(lock_path_);
    flush_and_unhook();
    backend_->delete_chain(table_, chain_);
    NCF_LOG_INFO(kLog, "removed " + table_ + "/" + chain_);
}

ChainState ManagedChain::status() {
    ChainState st;
    st.table = table_;
    st.chain = chain_;
    st.exists = backend_->chain_exists(table_, chain_);
    if (!st.exists) return st;
    st.hook_references = backend_->hook_references(table_, chain_);
    st.rules = backend_->list_rules(table_, chain_);
    return st;
}

} // namespace ncf
