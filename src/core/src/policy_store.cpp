#include "ncf_policy.hpp"
#include "ncf_errors.hpp"
#include "ncf_logger.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <fstream>
#include <iterator>
#include <optional>
#include <sstream>

#include <sys/stat.h>

namespace {

using nlohmann::json;

constexpr const char* kLog = "policy";

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.pop_back();
    size_t b = 0;
    while (b < s.size() && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    return s.substr(b);
}

std::optional<long> to_long(const std::string& s) {
    char* end = nullptr;
    errno = 0;
    long v = std::strtol(s.c_str(), &end, 10);
    while (end && std::isspace(static_cast<unsigned char>(*end))) ++end;
    if (s.empty() || errno != 0 || !end || *end != '\0' || end == s.c_str()) return std::nullopt;
    return v;
}

std::string text(const json& row, const char* key) {
    auto it = row.find(key);
    return it != row.end() && it->is_string() ? it->get<std::string>() : std::string();
}

bool flag(const json& row, const char* key, bool fallback) {
    auto it = row.find(key);
    if (it == row.end()) return fallback;
    if (it->is_boolean()) return it->get<bool>();
    if (it->is_number()) return it->get<double>() != 0;
    if (it->is_string()) {
        const std::string v = lower(it->get<std::string>());
        return v == "1" || v == "true";
    }
    return fallback;
}

std::optional<long> number(const json& row, const char* key) {
    auto it = row.find(key);
    if (it == row.end()) return std::nullopt;
    if (it->is_number()) return static_cast<long>(it->get<double>());
    if (it->is_string()) return to_long(it->get<std::string>());
    return std::nullopt;
}

// UT1 lists whose category_type is "adult"
bool age_category(const json& row) {
    const std::string name = text(row, "name");
    return text(row, "category_type") == "adult" || name == "adult" || name == "porn";
}

std::string local_date(std::chrono::system_clock::time_point tp) {
    std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm_buf{};
    localtime_r(&t, &tm_buf);
    char date[16];
    std::strftime(date, sizeof(date), "%Y-%m-%d", &tm_buf);
    return date;
}

} // anonymous namespace

namespace ncf {

// ==================== BlockRules ====================

std::set<std::string> BlockRules::all_domains() const {
    std::set<std::string> out;
    for (const auto& kv : manual) out.insert(kv.first);
    for (const auto& kv : categories) out.insert(kv.first);
    out.insert(age_restricted.begin(), age_restricted.end());
    return out;
}

// ==================== StaticPolicySource ====================

void StaticPolicySource::set_schedules(std::vector<Schedule> s) {
    std::lock_guard<std::mutex> lock(mtx_);
    schedules_ = std::move(s);
}

void StaticPolicySource::set_usage(UsageCounter u) {
    std::lock_guard<std::mutex> lock(mtx_);
    usage_ = u;
}

void StaticPolicySource::set_block_rules(BlockRules r) {
    std::lock_guard<std::mutex> lock(mtx_);
    rules_ = std::move(r);
}

std::vector<Schedule> StaticPolicySource::schedules() {
    std::lock_guard<std::mutex> lock(mtx_);
    return schedules_;
}

UsageCounter StaticPolicySource::usage(const WallClock&) {
    std::lock_guard<std::mutex> lock(mtx_);
    return usage_;
}

BlockRules StaticPolicySource::block_rules() {
    std::lock_guard<std::mutex> lock(mtx_);
    return rules_;
}

// ==================== JsonPolicyStore ====================

JsonPolicyStore::JsonPolicyStore(std::string path)
    : path_(std::move(path))
{
    std::lock_guard<std::mutex> lock(mtx_);
    if (!reload()) {
        throw ConfigurationError("cannot load policy database " + path_);
    }
    NCF_LOG_DEBUG(kLog, "loaded " + path_);
}

bool JsonPolicyStore::reload() {
    struct stat st;
    if (stat(path_.c_str(), &st) != 0) {
        NCF_LOG_WARN(kLog, "cannot stat " + path_ + ": " + std::strerror(errno));
        return false;
    }
    if (loaded_ && st.st_mtim.tv_sec == mtime_.tv_sec &&
        st.st_mtim.tv_nsec == mtime_.tv_nsec && st.st_size == size_) {
        return true;
    }

    std::ifstream in(path_, std::ios::binary);
    if (!in.is_open()) {
        NCF_LOG_WARN(kLog, "cannot read " + path_ + ": " + std::strerror(errno));
        return false;
    }
    std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());

    try {
        json doc = json::parse(content);
        if (!doc.is_object()) {
            NCF_LOG_WARN(kLog, path_ + " is not a table document");
            return false;
        }
        doc_ = std::move(doc);
    } catch (const json::parse_error& e) {
        // the writer truncates before it writes; try again next time
        NCF_LOG_WARN(kLog, "unparseable " + path_ + ": " + e.what());
        return false;
    }
    mtime_ = st.st_mtim;
    size_ = st.st_size;
    loaded_ = true;
    return true;
}

std::vector<json> JsonPolicyStore::rows(const std::string& table) {
    std::lock_guard<std::mutex> lock(mtx_);
    if (!reload() && loaded_) {
        NCF_LOG_DEBUG(kLog, "keeping previous copy of " + path_);
    }

    std::vector<json> out;
    auto t = doc_.find(table);
    if (t == doc_.end() || !t->is_object()) return out;

    // rows are keyed by document id; keep insertion order
    std::map<long, const json*> ordered;
    for (auto it = t->begin(); it != t->end(); ++it) {
        if (!it.value().is_object()) continue;
        if (auto id = to_long(it.key())) {
            ordered.emplace(*id, &it.value());
        } else {
            NCF_LOG_DEBUG(kLog, table + ": skipping row '" + it.key() + "'");
        }
    }
    out.reserve(ordered.size());
    for (const auto& kv : ordered) out.push_back(*kv.second);
    return out;
}

std::set<int> JsonPolicyStore::parse_days(const json& days) {
    std::set<int> out;
    auto add = [&out](std::optional<long> d) {
        if (d && *d >= 0 && *d <= 6) out.insert(static_cast<int>(*d));
    };
    if (days.is_array()) {
        for (const auto& d : days) {
            if (d.is_number_integer()) add(d.get<long>());
            else if (d.is_string()) add(to_long(d.get<std::string>()));
        }
    } else if (days.is_string()) {
        // older exports kept "0,1,4"
        std::istringstream in(days.get<std::string>());
        std::string item;
        while (std::getline(in, item, ',')) {
            size_t b = item.find_first_not_of(' ');
            add(b == std::string::npos ? std::nullopt : to_long(item.substr(b)));
        }
    }
    return out;
}

std::vector<Schedule> JsonPolicyStore::schedules() {
    std::vector<Schedule> out;
    for (const auto& row : rows("time_schedules")) {
        const std::string name = text(row, "name");
        auto start = TimeOfDay::parse(text(row, "start_time"));
        auto end = TimeOfDay::parse(text(row, "end_time"));
        if (!start || !end) {
            NCF_LOG_WARN(kLog, "schedule '" + name + "' has invalid times, ignored");
            continue;
        }
        Schedule s;
        s.name = name;
        s.start = *start;
        s.end = *end;
        auto days = row.find("days");
        if (days != row.end()) s.days = parse_days(*days);
        s.enabled = flag(row, "is_active", true);
        out.push_back(std::move(s));
    }
    return out;
}

UsageCounter JsonPolicyStore::usage(const WallClock& now) {
    UsageCounter u;

    const std::string today = local_date(now.instant);
    for (const auto& row : rows("daily_usage")) {
        if (text(row, "date") != today) continue;
        auto minutes = number(row, "minutes_used");
        if (minutes && *minutes > 0) u.accumulated_seconds = *minutes * 60;
        break;
    }

    // the limit lives on the first settings record that carries one
    for (const auto& row : rows("settings")) {
        auto minutes = number(row, "time_limit_minutes");
        if (!minutes) continue;
        if (*minutes > 0 && flag(row, "is_active", true)) {
            u.daily_limit_minutes = static_cast<int>(*minutes);
        }
        break;
    }
    return u;
}

BlockRules JsonPolicyStore::block_rules() {
    BlockRules rules;
    for (const auto& row : rows("blocked_sites")) {
        std::string d = lower(text(row, "domain"));
        if (!d.empty()) rules.manual[d] = text(row, "category");
    }

    std::set<std::string> active, age_restricted;
    for (const auto& row : rows("blacklist_categories")) {
        if (!flag(row, "is_active", true)) continue;
        const std::string name = text(row, "name");
        active.insert(name);
        if (age_category(row)) age_restricted.insert(name);
    }
    for (const auto& row : rows("blacklist_domains")) {
        const std::string category = text(row, "category");
        if (!active.count(category)) continue;
        std::string d = lower(text(row, "domain"));
        if (d.empty()) continue;
        if (age_restricted.count(category)) rules.age_restricted.insert(d);
        else rules.categories.emplace(d, category);
    }
    return rules;
}

} // namespace ncf
