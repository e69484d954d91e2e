#include "ncf_config.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>

namespace ncf {

namespace {

std::string trim(const std::string& s) {
    const char* ws = " \t\r";
    auto b = s.find_first_not_of(ws);
    if (b == std::string::npos) return "";
    return s.substr(b, s.find_last_not_of(ws) - b + 1);
}

} // namespace

Config& Config::instance() {
    static Config cfg;
    return cfg;
}

const std::map<std::string, std::string>& Config::defaults() {
    static const std::map<std::string, std::string> d = {
        {"log.level", "info"},
        {"log.console", "true"},
        {"log.file", ""},
        {"log.max_kb", "10240"},

        {"lock.path", "/run/netcurfew.lock"},

        {"hosts.path", "/etc/hosts"},
        {"hosts.backup_dir", "/var/lib/netcurfew/backups"},
        {"hosts.keep_backups", "10"},

        {"redirect.chain", "NCF_REDIRECT"},
        {"enforce.chain", "NCF_ENFORCE"},

        {"server.bind_address", "127.0.0.1"},
        {"server.http_port", "8080"},
        {"server.https_port", "8443"},
        {"server.workers", "16"},
        {"server.max_pending", "256"},
        {"server.connection_timeout_ms", "5000"},
        {"server.drain_timeout_ms", "3000"},
        {"server.block_page_url", "http://localhost:5000/blocked"},

        {"ca.dir", "/var/lib/netcurfew/certs"},
        {"ca.key_bits", "4096"},
        {"ca.validity_days", "3650"},
        {"certs.dir", "/var/lib/netcurfew/certs/domains"},
        {"certs.key_bits", "2048"},
        {"certs.validity_days", "365"},
        {"certs.renew_before_days", "7"},
        {"certs.max_age_days", "30"},
        {"certs.max_entries", "1024"},

        {"daemon.interval_seconds", "60"},
        {"daemon.alert_after_failures", "3"},

        {"watchdog.interval_seconds", "10"},
        {"watchdog.failure_threshold", "3"},
        {"watchdog.max_restarts", "5"},
        {"watchdog.restart_window_seconds", "600"},
        {"watchdog.fallback", "true"},

        {"policy.db", "/var/lib/ubuntu-parental/control.json"},
        {"policy.refresh_seconds", "30"},
    };
    return d;
}

std::string Config::get(const std::string& key, const std::string& default_val) const {
    std::lock_guard<std::mutex> lock(mtx_);
    auto it = values_.find(key);
    return (it != values_.end()) ? it->second : default_val;
}

int Config::getInt(const std::string& key, int default_val) const {
    std::string v = get(key);
    if (v.empty()) return default_val;
    try {
        size_t used = 0;
        int n = std::stoi(v, &used);
        return used == v.size() ? n : default_val;
    } catch (const std::exception&) {
        return default_val;
    }
}

bool Config::getBool(const std::string& key, bool default_val) const {
    std::string v = get(key);
    if (v.empty()) return default_val;
    std::transform(v.begin(), v.end(), v.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (v == "true" || v == "1" || v == "yes" || v == "on") return true;
    if (v == "false" || v == "0" || v == "no" || v == "off") return false;
    return default_val;
}

uint16_t Config::getPort(const std::string& key, uint16_t default_val) const {
    int v = getInt(key, default_val);
    if (v <= 0 || v > 65535) return default_val;
    return static_cast<uint16_t>(v);
}

std::chrono::seconds Config::getSeconds(const std::string& key, int default_val) const {
    return std::chrono::seconds(getInt(key, default_val));
}

std::chrono::milliseconds Config::getMillis(const std::string& key, int default_val) const {
    return std::chrono::milliseconds(getInt(key, default_val));
}

void Config::set(const std::string& key, const std::string& value) {
    std::lock_guard<std::mutex> lock(mtx_);
    values_[key] = value;
}

void Config::setInt(const std::string& key, int value) {
    set(key, std::to_string(value));
}

void Config::setBool(const std::string& key, bool value) {
    set(key, value ? "true" : "false");
}

bool Config::loadFromFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) return false;

    std::map<std::string, std::string> parsed;
    std::string section;
    std::string line;
    while (std::getline(file, line)) {
        line = trim(line);
        if (line.empty() || line[0] == '#' || line[0] == ';') continue;

        if (line.front() == '[' && line.back() == ']') {
            section = trim(line.substr(1, line.size() - 2));
            continue;
        }

        auto pos = line.find('=');
        if (pos == std::string::npos) continue;
        std::string key = trim(line.substr(0, pos));
        if (key.empty()) continue;
        if (!section.empty()) key = section + "." + key;
        parsed[key] = trim(line.substr(pos + 1));
    }

    std::lock_guard<std::mutex> lock(mtx_);
    unknown_.clear();
    const auto& known = defaults();
    for (auto& kv : parsed) {
        if (known.find(kv.first) == known.end()) unknown_.push_back(kv.first);
        values_[kv.first] = std::move(kv.second);
    }
    return true;
}

std::vector<std::string> Config::unknownKeys() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return unknown_;
}

std::map<std::string, std::string> Config::snapshot() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return values_;
}

void Config::restore(std::map<std::string, std::string> values) {
    std::lock_guard<std::mutex> lock(mtx_);
    values_ = std::move(values);
}

void Config::loadDefaults() {
    std::lock_guard<std::mutex> lock(mtx_);
    for (const auto& kv : defaults()) values_[kv.first] = kv.second;
}

void Config::clear() {
    std::lock_guard<std::mutex> lock(mtx_);
    values_.clear();
    unknown_.clear();
}

} // namespace ncf
