#include "ncf_config.hpp"
#include "ncf_enforcement_daemon.hpp"
#include "ncf_errors.hpp"
#include "ncf_logger.hpp"
#include "ncf_schedule.hpp"
#include "ncf_settings.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <csignal>
#include <ctime>
#include <functional>
#include <iomanip>
#include <iostream>
#include <map>
#include <memory>
#include <set>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace ncf;

// ============================================================================
// Globals
// ============================================================================

std::atomic<bool> g_running(false);

// ============================================================================
// Signal handler
// ============================================================================

void signal_handler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        g_running = false;  // Only set flag, cleanup happens in the handler loop
    }
}

// ============================================================================
// ArgumentParser
// ============================================================================

class ArgumentParser {
public:
    struct Command {
        std::string name;
        std::string description;
        std::function<void(const std::vector<std::string>&)> handler;
        std::vector<std::string> args_help;
    };

    ArgumentParser(const std::string& prog_name, const std::string& version)
        : prog_name_(prog_name), version_(version) {}

    void add_command(
        const std::string& name,
        const std::string& description,
        std::function<void(const std::vector<std::string>&)> handler,
        const std::vector<std::string>& args_help = {}
    ) {
        commands_[name] = {name, description, handler, args_help};
    }

    /// @return process exit status
    int parse_and_execute(const std::vector<std::string>& argv) {
        if (argv.empty()) {
            print_usage();
            return 1;
        }

        const std::string& cmd = argv[0];
        if (cmd == "help" || cmd == "--help" || cmd == "-h") {
            print_usage();
            return 0;
        }
        if (cmd == "version" || cmd == "--version" || cmd == "-v") {
            std::cout << prog_name_ << " " << version_ << std::endl;
            return 0;
        }

        auto it = commands_.find(cmd);
        if (it == commands_.end()) {
            std::cerr << "Unknown command: " << cmd << "\n";
            print_usage();
            return 1;
        }

        std::vector<std::string> args(argv.begin() + 1, argv.end());
        it->second.handler(args);
        return 0;
    }

private:
    void print_usage() const {
        std::cout << prog_name_ << " " << version_ << " - parental control enforcement\n";
        std::cout << "\nUsage: " << prog_name_ << " [--config <file>] <command> [options]\n\n";
        std::cout << "Commands:\n";
        for (const auto& [name, cmd] : commands_) {
            std::cout << "  " << cmd.name;
            for (const auto& arg : cmd.args_help)
                std::cout << " " << arg;
            std::cout << "\n    " << cmd.description << "\n\n";
        }
        std::cout << "  help\n    Show this help message\n\n";
        std::cout << "  version\n    Show version information\n";
    }

    std::string prog_name_;
    std::string version_;
    std::map<std::string, Command> commands_;
};

// ============================================================================
// Utility functions
// ============================================================================

static std::string get_arg(const std::vector<std::string>& args, size_t index, const std::string& default_val = "") {
    return index < args.size() ? args[index] : default_val;
}

static bool has_flag(const std::vector<std::string>& args, const std::string& flag) {
    return std::find(args.begin(), args.end(), flag) != args.end();
}

static std::string get_option(const std::vector<std::string>& args, const std::string& option, const std::string& default_val = "") {
    auto it = std::find(args.begin(), args.end(), option);
    if (it != args.end() && ++it != args.end()) return *it;
    return default_val;
}

static int parse_int(const std::string& text, const std::string& what) {
    try {
        size_t used = 0;
        int v = std::stoi(text, &used);
        if (used == text.size()) return v;
    } catch (const std::logic_error&) {
    }
    throw std::invalid_argument("invalid " + what + ": " + text);
}

static uint16_t parse_port(const std::string& text) {
    int v = parse_int(text, "port");
    if (v < 1 || v > 65535) throw std::invalid_argument("port out of range: " + text);
    return static_cast<uint16_t>(v);
}

static std::string format_time(std::chrono::system_clock::time_point tp) {
    std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm_buf{};
    localtime_r(&t, &tm_buf);
    std::ostringstream out;
    out << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
    return out.str();
}

static void print_chain(const ChainState& st) {
    std::cout << "  Chain:  " << st.table << "/" << st.chain
              << (st.exists ? "" : " (absent)") << "\n";
    std::cout << "  Hooks:  " << st.hook_references << "\n";
    std::cout << "  Rules:  " << st.rule_count() << "\n";
    for (const auto& rule : st.rules) {
        std::cout << "    ";
        for (const auto& part : rule) std::cout << part << " ";
        std::cout << "\n";
    }
}

// ============================================================================
// Forward declarations
// ============================================================================

void handle_hosts(const std::vector<std::string>& args);
void handle_redirect(const std::vector<std::string>& args);
void handle_block(const std::vector<std::string>& args);
void handle_ca(const std::vector<std::string>& args);
void handle_cert(const std::vector<std::string>& args);
void handle_certs(const std::vector<std::string>& args);
void handle_evaluate(const std::vector<std::string>& args);
void handle_enforce(const std::vector<std::string>& args);

// ============================================================================
// main()
// ============================================================================

int main(int argc, char* argv[]) {
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    // --config is global; strip it before dispatch
    std::string cli_config;
    std::vector<std::string> rest;
    for (int i = 1; i < argc; ++i) {
        std::string arg(argv[i]);
        if (arg == "--config" && i + 1 < argc) {
            cli_config = argv[++i];
        } else {
            rest.push_back(arg);
        }
    }

    auto& cfg = Config::instance();
    cfg.loadFromFile(settings::config_path(cli_config));
    settings::apply_logging(cfg);

    ArgumentParser parser("netcurfew", "v1.0.0");

    parser.add_command("hosts", "Manage the hosts file block", handle_hosts,
                       {"update <domain...> | list | clear | restore [<backup>] | backups"});
    parser.add_command("redirect", "Port 80/443 redirect to the interception server", handle_redirect,
                       {"enable [<port>] [<tls_port>] | disable | status | cleanup"});
    parser.add_command("block", "Network kill switch", handle_block,
                       {"enable [<reason>] | disable | status | cleanup"});
    parser.add_command("ca", "Root certificate authority", handle_ca,
                       {"generate | ensure | show"});
    parser.add_command("cert", "Issue or load the certificate for a domain", handle_cert,
                       {"<domain>"});
    parser.add_command("certs", "Domain certificate store maintenance", handle_certs,
                       {"sweep [<days>]"});
    parser.add_command("evaluate", "Evaluate the access policy now", handle_evaluate);
    parser.add_command("enforce", "Run the schedule enforcement loop", handle_enforce,
                       {"[--interval <seconds>]", "[--cleanup]"});

    try {
        return parser.parse_and_execute(rest);
    } catch (const std::exception& e) {
        std::cerr << "[!] " << e.what() << "\n";
        return 1;
    }
}

// ============================================================================
// Handler implementations
// ============================================================================

void handle_hosts(const std::vector<std::string>& args) {
    auto hosts = settings::hosts_manager(Config::instance());
    std::string action = get_arg(args, 0, "list");

    if (action == "update") {
        std::set<std::string> domains(args.begin() + 1, args.end());
        hosts->update(domains);
        std::cout << "[+] Blocked " << hosts->current_domains().size()
                  << " domains in " << hosts->hosts_path() << "\n";
    } else if (action == "list") {
        for (const auto& d : hosts->current_domains()) std::cout << d << "\n";
    } else if (action == "clear") {
        hosts->clear();
        std::cout << "[+] Managed block cleared\n";
    } else if (action == "restore") {
        hosts->restore(get_arg(args, 1));
        std::cout << "[+] Hosts file restored\n";
    } else if (action == "backups") {
        for (const auto& b : hosts->backups()) std::cout << b << "\n";
    } else {
        throw std::invalid_argument("unknown hosts action: " + action);
    }
}

void handle_redirect(const std::vector<std::string>& args) {
    auto& cfg = Config::instance();
    auto redirector = settings::port_redirector(cfg, settings::firewall_backend());
    std::string action = get_arg(args, 0, "status");

    if (action == "enable") {
        uint16_t port = args.size() > 1 ? parse_port(args[1]) : cfg.getPort("server.http_port", 8080);
        uint16_t tls_port = args.size() > 2 ? parse_port(args[2]) : cfg.getPort("server.https_port", 8443);
        redirector->enable(port, tls_port);
        std::cout << "[+] Redirecting 80 -> " << port << ", 443 -> " << tls_port << "\n";
    } else if (action == "disable") {
        redirector->disable();
        std::cout << "[+] Redirect disabled\n";
    } else if (action == "status") {
        std::cout << "Port redirect:\n";
        print_chain(redirector->status());
    } else if (action == "cleanup") {
        redirector->cleanup();
        std::cout << "[+] Redirect chain removed\n";
    } else {
        throw std::invalid_argument("unknown redirect action: " + action);
    }
}

void handle_block(const std::vector<std::string>& args) {
    auto enforcer = settings::network_enforcer(Config::instance(), settings::firewall_backend());
    std::string action = get_arg(args, 0, "status");

    if (action == "enable") {
        enforcer->enable_block(get_arg(args, 1, "manual block"));
        std::cout << "[+] Network blocked\n";
    } else if (action == "disable") {
        enforcer->disable_block();
        std::cout << "[+] Network unblocked\n";
    } else if (action == "status") {
        ChainState st = enforcer->status();
        std::cout << "Kill switch: "
                  << (NetworkAccessEnforcer::is_active(st) ? "ACTIVE" : "inactive") << "\n";
        print_chain(st);
    } else if (action == "cleanup") {
        enforcer->cleanup();
        std::cout << "[+] Enforcement chain removed\n";
    } else {
        throw std::invalid_argument("unknown block action: " + action);
    }
}

void handle_ca(const std::vector<std::string>& args) {
    CertificateAuthority ca(settings::ca_options(Config::instance()));
    std::string action = get_arg(args, 0, "show");

    if (action == "generate") {
        ca.generate();
        std::cout << "[+] Generated " << ca.cert_path() << "\n";
    } else if (action == "ensure") {
        bool created = ca.ensure();
        std::cout << (created ? "[+] Generated " : "[*] Loaded ") << ca.cert_path() << "\n";
    } else if (action == "show") {
        ca.load();
        std::cout << "Certificate: " << ca.cert_path() << "\n";
        std::cout << "SHA-256:     " << ca.fingerprint() << "\n";
        std::cout << "Expires:     " << format_time(ca.expires()) << "\n";
        if (has_flag(args, "--pem")) std::cout << ca.certificate_pem();
    } else {
        throw std::invalid_argument("unknown ca action: " + action);
    }
}

void handle_cert(const std::vector<std::string>& args) {
    std::string domain = get_arg(args, 0);
    if (domain.empty()) throw std::invalid_argument("usage: cert <domain>");

    auto& cfg = Config::instance();
    auto ca = std::make_shared<CertificateAuthority>(settings::ca_options(cfg));
    ca->load();
    DomainCertificateCache cache(ca, settings::cert_cache_config(cfg));

    auto cert = cache.get(domain);
    std::cout << "Domain:   " << cert->domain << (cert->from_disk ? " (stored)" : " (issued)") << "\n";
    std::cout << "Cert:     " << cert->cert_path << "\n";
    std::cout << "Key:      " << cert->key_path << "\n";
    std::cout << "Valid:    " << format_time(cert->not_before) << " - "
              << format_time(cert->not_after) << "\n";
}

void handle_certs(const std::vector<std::string>& args) {
    std::string action = get_arg(args, 0);
    if (action != "sweep") throw std::invalid_argument("usage: certs sweep [<days>]");

    auto& cfg = Config::instance();
    int days = args.size() > 1 ? parse_int(args[1], "days") : cfg.getInt("certs.max_age_days", 30);
    if (days < 0) throw std::invalid_argument("days must not be negative");

    auto ca = std::make_shared<CertificateAuthority>(settings::ca_options(cfg));
    ca->load();
    DomainCertificateCache cache(ca, settings::cert_cache_config(cfg));
    size_t removed = cache.sweep(std::chrono::hours(24 * days));
    std::cout << "[+] Removed " << removed << " certificates older than " << days << " days\n";
}

void handle_evaluate(const std::vector<std::string>&) {
    auto policy = settings::policy_source(Config::instance());
    WallClock now = WallClock::now();
    UsageCounter usage = policy->usage(now);
    AccessDecision d = ScheduleEvaluator::is_allowed(now, policy->schedules(), usage);

    std::cout << "Access:   " << (d.allowed ? "allowed" : "DENIED") << "\n";
    std::cout << "Reason:   " << d.reason << "\n";
    std::cout << "Used:     " << usage.accumulated_seconds / 60 << " min";
    if (usage.daily_limit_minutes) std::cout << " of " << *usage.daily_limit_minutes;
    std::cout << "\n";
    if (d.next_available) {
        std::cout << "Next:     " << format_time(*d.next_available) << "\n";
    }
    std::cout << "Blocked:  " << policy->blocked_domains().size() << " domains\n";
}

void handle_enforce(const std::vector<std::string>& args) {
    auto& cfg = Config::instance();
    auto enforcer = settings::network_enforcer(cfg, settings::firewall_backend());

    if (has_flag(args, "--cleanup")) {
        enforcer->cleanup();
        std::cout << "[+] Enforcement chain removed\n";
        return;
    }

    int interval = cfg.getInt("daemon.interval_seconds", 60);
    std::string opt = get_option(args, "--interval");
    if (!opt.empty()) interval = parse_int(opt, "interval");
    if (interval < 1) throw std::invalid_argument("interval must be at least 1 second");

    EnforcementDaemon daemon(enforcer, settings::policy_source(cfg),
                             std::chrono::seconds(interval),
                             cfg.getInt("daemon.alert_after_failures", 3));

    std::cout << "[*] Enforcing schedules every " << interval << "s (Ctrl+C to stop)\n";
    g_running = true;
    daemon.start();
    while (g_running) {
        std::this_thread::sleep_for(std::chrono::seconds(1));
    }
    std::cout << "\n[!] Shutdown signal received...\n";
    daemon.stop();
    std::cout << "[+] Block lifted\n";
}
