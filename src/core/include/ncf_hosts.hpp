#ifndef NCF_HOSTS_HPP
#define NCF_HOSTS_HPP

#include <cstddef>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace ncf {

/**
 * @brief Maintains the managed redirect block of the system hosts file
 *
 * Everything between the start and end marker lines belongs to netcurfew;
 * every other byte of the file is preserved as-is. Writes go through a
 * temporary file in the same directory followed by rename(), so a failed
 * update never leaves a partially written file behind.
 */
class HostsFileManager {
public:
    static constexpr const char* kStartMarker = "# netcurfew managed block - START";
    static constexpr const char* kEndMarker = "# netcurfew managed block - END";
    static constexpr const char* kBackupPrefix = "hosts_backup_";

    HostsFileManager(std::string hosts_path, std::string backup_dir,
                     size_t keep_backups = 10, std::string lock_path = "");

    /**
     * @brief Replace the managed block with entries for domains
     *
     * Backs up the current file, drops invalid names, and writes
     * `127.0.0.1` and `::1` entries for each domain and its `www.` form.
     * An empty (or all-invalid) set removes the block.
     * @throws IOError on backup, validation or write failure
     */
    void update(const std::set<std::string>& domains);

    /// Remove the managed block.
    void clear();

    /**
     * @brief Overwrite the live file with a backup
     * @param backup_path Backup to restore; empty selects the newest one
     * @throws IOError if no backup exists or it fails validation
     */
    void restore(const std::string& backup_path = "");

    /// Hostnames currently inside the managed block.
    std::set<std::string> current_domains() const;

    /// Retained backups, newest first.
    std::vector<std::string> backups() const;

    const std::string& hosts_path() const { return hosts_path_; }

    // Content helpers (pure)

    /// Trimmed, lower-cased hostname, or nullopt when unusable.
    static std::optional<std::string> clean_domain(const std::string& raw);
    static std::string build_block(const std::set<std::string>& domains);
    /**
     * @brief Content with the managed block and trailing blank lines removed
     * @throws IOError when START/END marker lines do not pair up
     */
    static std::string strip_block(const std::string& content);
    static std::set<std::string> parse_block(const std::string& content);
    /// Every entry line parses as `IP host...`, 127.0.0.1 maps localhost and markers pair up.
    static bool validate_content(const std::string& content, std::string* why = nullptr);

private:
    std::string read_file(const std::string& path) const;
    void write_atomic(const std::string& content);
    std::string backup_current();
    void prune_backups();

    std::string hosts_path_;
    std::string backup_dir_;
    size_t keep_backups_;
    std::string lock_path_;
};

} // namespace ncf

#endif // NCF_HOSTS_HPP
