#include "ncf_port_redirector.hpp"
#include "ncf_logger.hpp"

#include <stdexcept>

namespace ncf {

namespace {
constexpr const char* kLog = "redirect";
constexpr const char* kNatTable = "nat";
}

PortRedirector::PortRedirector(std::shared_ptr<FirewallBackend> backend,
                               std::string chain, std::string lock_path)
    : chain_(std::move(backend), kNatTable, std::move(chain), std::move(lock_path))
{
}

std::vector<ChainRule> PortRedirector::redirect_rules(uint16_t listen_port, uint16_t tls_port) {
    if (tls_port == 0) tls_port = listen_port;
    return {
        {"-p", "tcp", "-d", "127.0.0.1", "--dport", "80",
         "-j", "REDIRECT", "--to-ports", std::to_string(listen_port)},
        {"-p", "tcp", "-d", "127.0.0.1", "--dport", "443",
         "-j", "REDIRECT", "--to-ports", std::to_string(tls_port)},
    };
}

void PortRedirector::enable(uint16_t listen_port, uint16_t tls_port) {
    if (listen_port == 0) {
        throw std::invalid_argument("PortRedirector: listen port must be non-zero");
    }
    chain_.replace_rules(redirect_rules(listen_port, tls_port));
    NCF_LOG_INFO(kLog, "loopback 80/443 redirected to " + std::to_string(listen_port) + "/" +
                       std::to_string(tls_port == 0 ? listen_port : tls_port));
}

void PortRedirector::disable() {
    chain_.flush_and_unhook();
    NCF_LOG_INFO(kLog, "port redirect disabled");
}

void PortRedirector::cleanup() {
    chain_.remove();
}

ChainState PortRedirector::status() {
    return chain_.status();
}

} // namespace ncf
