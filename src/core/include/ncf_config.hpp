#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace ncf {

/**
 * @brief Runtime configuration for netcurfew
 *
 * Flat `section.key = value` store. Files are INI-like: `key = value`
 * lines, `#` or `;` comments, and optional `[section]` headers that prefix
 * the keys below them (`[server]` + `http_port` is `server.http_port`).
 * Every component reads its parameters from here at construction time.
 * Thread-safe singleton.
 */
class Config {
public:
    static Config& instance();

    Config(const Config&) = delete;
    Config& operator=(const Config&) = delete;

    std::string get(const std::string& key, const std::string& default_val = "") const;
    /// Whole-string integer; default_val on absence or garbage.
    int getInt(const std::string& key, int default_val = 0) const;
    bool getBool(const std::string& key, bool default_val = false) const;
    /// 1..65535, else default_val.
    uint16_t getPort(const std::string& key, uint16_t default_val) const;
    std::chrono::seconds getSeconds(const std::string& key, int default_val) const;
    std::chrono::milliseconds getMillis(const std::string& key, int default_val) const;

    void set(const std::string& key, const std::string& value);
    void setInt(const std::string& key, int value);
    void setBool(const std::string& key, bool value);

    /// Merge a file over the current values; false if it cannot be read.
    bool loadFromFile(const std::string& path);

    /// Keys from the last loadFromFile() that have no built-in default.
    std::vector<std::string> unknownKeys() const;

    std::map<std::string, std::string> snapshot() const;
    void restore(std::map<std::string, std::string> values);

    void loadDefaults();
    void clear();

private:
    Config() { loadDefaults(); }

    static const std::map<std::string, std::string>& defaults();

    mutable std::mutex mtx_;
    std::map<std::string, std::string> values_;
    std::vector<std::string> unknown_;
};

} // namespace ncf
