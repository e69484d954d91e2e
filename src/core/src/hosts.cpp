#include "ncf_hosts.hpp"
#include "ncf_errors.hpp"
#include "ncf_logger.hpp"
#include "ncf_system.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <chrono>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <fstream>
#include <iterator>
#include <sstream>

#include <arpa/inet.h>
#include <dirent.h>
#include <sys/stat.h>
#include <unistd.h>

namespace ncf {

namespace {

constexpr const char* kLog = "hosts";
constexpr size_t kMaxDomainLength = 253;

std::string trim(const std::string& s) {
    size_t b = 0, e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
    return s.substr(b, e - b);
}

bool valid_label(const std::string& label) {
    if (label.empty() || label.size() > 63) return false;
    if (label.front() == '-' || label.back() == '-') return false;
    for (char c : label) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '-') return false;
    }
    return true;
}

bool is_ip_address(const std::string& text) {
    unsigned char buf[sizeof(struct in6_addr)];
    return inet_pton(AF_INET, text.c_str(), buf) == 1 ||
           inet_pton(AF_INET6, text.c_str(), buf) == 1;
}

std::string timestamp_suffix() {
    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                  now.time_since_epoch()).count() % 1000;
    std::tm tm_buf{};
    localtime_r(&t, &tm_buf);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y%m%d_%H%M%S", &tm_buf);
    char ms_buf[8];
    std::snprintf(ms_buf, sizeof(ms_buf), "_%03d", static_cast<int>(ms));
    return std::string(buf) + ms_buf;
}

bool file_exists(const std::string& path) {
    struct stat st;
    return stat(path.c_str(), &st) == 0;
}

} // namespace

HostsFileManager::HostsFileManager(std::string hosts_path, std::string backup_dir,
                                   size_t keep_backups, std::string lock_path)
    : hosts_path_(std::move(hosts_path))
    , backup_dir_(std::move(backup_dir))
    , keep_backups_(keep_backups == 0 ? 1 : keep_backups)
    , lock_path_(std::move(lock_path))
{
}

// ==================== Pure helpers ====================

std::optional<std::string> HostsFileManager::clean_domain(const std::string& raw) {
    std::string d = trim(raw);
    std::transform(d.begin(), d.end(), d.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    while (!d.empty() && d.back() == '.') d.pop_back();

    if (d.empty() || d.size() > kMaxDomainLength) return std::nullopt;
    if (d == "localhost" || d == "localhost.localdomain") return std::nullopt;

    size_t start = 0;
    while (true) {
        size_t dot = d.find('.', start);
        std::string label = d.substr(start, dot == std::string::npos ? std::string::npos
                                                                     : dot - start);
        if (!valid_label(label)) return std::nullopt;
        if (dot == std::string::npos) break;
        start = dot + 1;
    }
    return d;
}

std::string HostsFileManager::build_block(const std::set<std::string>& domains) {
    std::set<std::string> hosts;
    for (const auto& d : domains) {
        hosts.insert(d);
        if (d.compare(0, 4, "www.") != 0) hosts.insert("www." + d);
    }
    if (hosts.empty()) return "";

    std::ostringstream out;
    out << kStartMarker << '\n';
    for (const auto& h : hosts) {
        out << "127.0.0.1\t" << h << '\n';
        out << "::1\t" << h << '\n';
    }
    out << kEndMarker << '\n';
    return out.str();
}

namespace {

enum class Marker { None, Start, End };

// Marker lines match whole (surrounding blanks aside), never as substrings.
Marker marker_of(const std::string& line) {
    const std::string t = trim(line);
    if (t == HostsFileManager::kStartMarker) return Marker::Start;
    if (t == HostsFileManager::kEndMarker) return Marker::End;
    return Marker::None;
}

/// Empty when every START has a matching END with no nesting.
std::string marker_problem(const std::string& content) {
    std::istringstream in(content);
    std::string line;
    size_t lineno = 0, opened_at = 0;
    bool inside = false;
    while (std::getline(in, line)) {
        ++lineno;
        Marker m = marker_of(line);
        if (m == Marker::Start) {
            if (inside) {
                return "line " + std::to_string(lineno) + ": managed block opened twice";
            }
            inside = true;
            opened_at = lineno;
        } else if (m == Marker::End) {
            if (!inside) {
                return "line " + std::to_string(lineno) + ": managed block end without start";
            }
            inside = false;
        }
    }
    if (inside) return "line " + std::to_string(opened_at) + ": managed block never closed";
    return "";
}

} // namespace

std::string HostsFileManager::strip_block(const std::string& content) {
    const std::string problem = marker_problem(content);
    if (!problem.empty()) throw IOError("unbalanced markers: " + problem);

    std::istringstream in(content);
    std::vector<std::string> kept;
    std::string line;
    bool inside = false;
    while (std::getline(in, line)) {
        Marker m = marker_of(line);
        if (m != Marker::None) {
            inside = m == Marker::Start;
            continue;
        }
        if (!inside) kept.push_back(line);
    }
    while (!kept.empty() && trim(kept.back()).empty()) kept.pop_back();

    std::string out;
    for (const auto& l : kept) {
        out += l;
        out += '\n';
    }
    return out;
}

std::set<std::string> HostsFileManager::parse_block(const std::string& content) {
    std::set<std::string> hosts;
    std::istringstream in(content);
    std::string line;
    bool inside = false;
    while (std::getline(in, line)) {
        Marker m = marker_of(line);
        if (m != Marker::None) {
            inside = m == Marker::Start;
            continue;
        }
        if (!inside) continue;
        std::istringstream fields(line.substr(0, line.find('#')));
        std::string ip, host;
        if (!(fields >> ip)) continue;
        while (fields >> host) hosts.insert(host);
    }
    return hosts;
}

bool HostsFileManager::validate_content(const std::string& content, std::string* why) {
    auto fail = [why](const std::string& reason) {
        if (why) *why = reason;
        return false;
    };

    std::istringstream in(content);
    std::string line;
    size_t lineno = 0;
    bool has_localhost = false;
    while (std::getline(in, line)) {
        ++lineno;
        std::string body = trim(line.substr(0, line.find('#')));
        if (body.empty()) continue;

        std::istringstream fields(body);
        std::string ip, host;
        fields >> ip;
        if (!is_ip_address(ip)) {
            return fail("line " + std::to_string(lineno) + ": invalid address '" + ip + "'");
        }
        bool any_host = false;
        while (fields >> host) {
            any_host = true;
            if (ip == "127.0.0.1" && host == "localhost") has_localhost = true;
        }
        if (!any_host) {
            return fail("line " + std::to_string(lineno) + ": address without hostname");
        }
    }
    if (!has_localhost) return fail("missing 127.0.0.1 localhost entry");
    std::string problem = marker_problem(content);
    if (!problem.empty()) return fail(problem);
    return true;
}

// ==================== File operations ====================

std::string HostsFileManager::read_file(const std::string& path) const {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        throw IOError("cannot read " + path + ": " + std::strerror(errno));
    }
    std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad()) throw IOError("read error on " + path);
    return content;
}

void HostsFileManager::write_atomic(const std::string& content) {
    write_file_atomic(hosts_path_, content, 0644);
}

std::string HostsFileManager::backup_current() {
    ensure_directory(backup_dir_, 0700);
    std::string content = read_file(hosts_path_);

    std::string base = backup_dir_ + "/" + kBackupPrefix + timestamp_suffix();
    std::string path = base;
    for (int n = 1; file_exists(path); ++n) {
        path = base + "." + std::to_string(n);
    }

    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) throw IOError("cannot write backup " + path);
    out << content;
    out.close();
    if (!out) throw IOError("write error on backup " + path);

    prune_backups();
    NCF_LOG_DEBUG(kLog, "backed up " + hosts_path_ + " to " + path);
    return path;
}

std::vector<std::string> HostsFileManager::backups() const {
    std::vector<std::string> found;
    DIR* dir = opendir(backup_dir_.c_str());
    if (!dir) return found;
    const size_t prefix_len = std::strlen(kBackupPrefix);
    while (struct dirent* ent = readdir(dir)) {
        std::string name = ent->d_name;
        if (name.compare(0, prefix_len, kBackupPrefix) == 0) {
            found.push_back(backup_dir_ + "/" + name);
        }
    }
    closedir(dir);
    // Timestamped names sort chronologically
    std::sort(found.begin(), found.end(), std::greater<std::string>());
    return found;
}

void HostsFileManager::prune_backups() {
    auto all = backups();
    for (size_t i = keep_backups_; i < all.size(); ++i) {
        if (unlink(all[i].c_str()) != 0) {
            NCF_LOG_WARN(kLog, "cannot prune backup " + all[i] + ": " + std::strerror(errno));
        }
    }
}

// ==================== Public operations ====================

void HostsFileManager::update(const std::set<std::string>& domains) {
    std::set<std::string> clean;
    for (const auto& raw : domains) {
        auto d = clean_domain(raw);
        if (d) {
            clean.insert(*d);
        } else {
            NCF_LOG_WARN(kLog, "skipping invalid domain '" + raw + "'");
        }
    }

    MutationLock lock(lock_path_);
    // throws before anything is touched if the markers do not pair up
    std::string content = strip_block(read_file(hosts_path_));
    backup_current();

    std::string block = build_block(clean);
    if (!block.empty()) {
        if (!content.empty()) content += '\n';
        content += block;
    }

    std::string why;
    if (!validate_content(content, &why)) {
        throw IOError("refusing to write " + hosts_path_ + ": " + why);
    }
    write_atomic(content);
    NCF_LOG_INFO(kLog, "managed block now redirects " + std::to_string(clean.size()) +
                       " domains");
}

void HostsFileManager::clear() {
    update({});
}

void HostsFileManager::restore(const std::string& backup_path) {
    MutationLock lock(lock_path_);

    std::string source = backup_path;
    if (source.empty()) {
        auto all = backups();
        if (all.empty()) throw IOError("no hosts backup in " + backup_dir_);
        source = all.front();
    }

    std::string content = read_file(source);
    std::string why;
    if (!validate_content(content, &why)) {
        throw IOError("backup " + source + " failed validation: " + why);
    }
    write_atomic(content);
    NCF_LOG_INFO(kLog, "restored " + hosts_path_ + " from " + source);
}

std::set<std::string> HostsFileManager::current_domains() const {
    return parse_block(read_file(hosts_path_));
}

} // namespace ncf
