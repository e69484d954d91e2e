#ifndef NCF_POLICY_HPP
#define NCF_POLICY_HPP

#include "ncf_schedule.hpp"

#include <ctime>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace ncf {

/**
 * @brief Block lists supplied by the administrative store
 *
 * All keys are lower-case hostnames.
 */
struct BlockRules {
    std::map<std::string, std::string> manual;      // domain -> category label
    std::map<std::string, std::string> categories;  // domain -> active category
    std::set<std::string> age_restricted;

    /// Every domain any list names.
    std::set<std::string> all_domains() const;
    bool empty() const { return manual.empty() && categories.empty() && age_restricted.empty(); }
};

/**
 * @brief Read-only view of the external administrative store
 */
class PolicySource {
public:
    virtual ~PolicySource() = default;

    virtual std::vector<Schedule> schedules() = 0;
    virtual UsageCounter usage(const WallClock& now) = 0;
    virtual BlockRules block_rules() = 0;

    /// Domain set for the hosts file.
    virtual std::set<std::string> blocked_domains() { return block_rules().all_domains(); }
};

/**
 * @brief In-memory PolicySource, settable at runtime
 */
class StaticPolicySource : public PolicySource {
public:
    StaticPolicySource() = default;

    void set_schedules(std::vector<Schedule> s);
    void set_usage(UsageCounter u);
    void set_block_rules(BlockRules r);

    std::vector<Schedule> schedules() override;
    UsageCounter usage(const WallClock& now) override;
    BlockRules block_rules() override;

private:
    std::mutex mtx_;
    std::vector<Schedule> schedules_;
    UsageCounter usage_;
    BlockRules rules_;
};

/**
 * @brief PolicySource reading the parental-control JSON database
 *
 * The file is a TinyDB document: one object per table, each row keyed by
 * its numeric id. It is only ever read. The document is parsed again when
 * the file's mtime or size changes; a copy that does not parse leaves the
 * previous one in use. A missing table reads as empty.
 */
class JsonPolicyStore : public PolicySource {
public:
    /// @throws ConfigurationError if the file cannot be read or parsed
    explicit JsonPolicyStore(std::string path);

    std::vector<Schedule> schedules() override;
    UsageCounter usage(const WallClock& now) override;
    BlockRules block_rules() override;

    /// Weekdays (0 = Monday) from a JSON list or a "0,1,4" string; others dropped.
    static std::set<int> parse_days(const nlohmann::json& days);

private:
    bool reload();
    std::vector<nlohmann::json> rows(const std::string& table);

    std::mutex mtx_;
    std::string path_;
    nlohmann::json doc_;
    bool loaded_ = false;
    timespec mtime_{};
    long long size_ = -1;
};

} // namespace ncf

#endif // NCF_POLICY_HPP
