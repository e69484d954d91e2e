#ifndef NCF_SYSTEM_HPP
#define NCF_SYSTEM_HPP

#include <cstddef>
#include <string>
#include <vector>
#include <mutex>

#include <sys/types.h>

namespace ncf {

/**
 * @brief Result of one external command invocation
 */
struct CommandResult {
    int exit_code = -1;       // -1: fork/exec failed or killed by signal
    std::string output;       // stdout
    std::string error;        // stderr

    bool ok() const { return exit_code == 0; }
};

/**
 * @brief Adapter for every external OS utility netcurfew invokes
 *
 * The real implementation execs the program directly; tests substitute a
 * scripted fake.
 */
class CommandRunner {
public:
    virtual ~CommandRunner() = default;

    /// argv[0] is looked up on PATH. No shell is involved.
    virtual CommandResult run(const std::vector<std::string>& argv) = 0;
};

/**
 * @brief fork()+execvp() runner with captured stdout/stderr
 */
class ProcessRunner : public CommandRunner {
public:
    CommandResult run(const std::vector<std::string>& argv) override;
};

/**
 * @brief Process-wide advisory lock serialising kernel-state mutation
 *
 * Combines an in-process mutex with flock(LOCK_EX) on lock_path so that
 * two netcurfew processes (service and CLI) never interleave updates of
 * the hosts file or the managed chains. An empty lock_path takes only
 * the in-process mutex.
 */
class MutationLock {
public:
    explicit MutationLock(const std::string& lock_path);
    ~MutationLock();

    MutationLock(const MutationLock&) = delete;
    MutationLock& operator=(const MutationLock&) = delete;

private:
    std::unique_lock<std::recursive_mutex> local_;
    int fd_ = -1;
};

/**
 * @brief Replace path with data via a temp file in the same directory
 *
 * The temp file is fsync()ed and given mode before rename(), so readers
 * see either the old or the new content, never a mix.
 * @throws IOError
 */
void write_file_atomic(const std::string& path, const char* data, size_t size, mode_t mode);

inline void write_file_atomic(const std::string& path, const std::string& content, mode_t mode) {
    write_file_atomic(path, content.data(), content.size(), mode);
}

/// Create dir (one level) with mode; an existing directory is fine. @throws IOError
void ensure_directory(const std::string& dir, mode_t mode);

} // namespace ncf

#endif // NCF_SYSTEM_HPP
