#include "ncf_system.hpp"
#include "ncf_errors.hpp"

#include <array>
#include <cerrno>
#include <cstdio>
#include <cstring>

#include <fcntl.h>
#include <poll.h>
#include <sys/file.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <unistd.h>

namespace ncf {

namespace {

std::recursive_mutex& mutation_mutex() {
    static std::recursive_mutex mtx;
    return mtx;
}

// Nesting depth of MutationLock on this thread; only the outermost holds flock.
thread_local int g_lock_depth = 0;

std::string dirname_of(const std::string& path) {
    auto pos = path.find_last_of('/');
    if (pos == std::string::npos) return ".";
    if (pos == 0) return "/";
    return path.substr(0, pos);
}

std::string basename_of(const std::string& path) {
    auto pos = path.find_last_of('/');
    return pos == std::string::npos ? path : path.substr(pos + 1);
}

void close_pipe(int fds[2]) {
    if (fds[0] >= 0) close(fds[0]);
    if (fds[1] >= 0) close(fds[1]);
}

} // namespace

// ==================== ProcessRunner ====================

CommandResult ProcessRunner::run(const std::vector<std::string>& argv) {
    CommandResult result;
    if (argv.empty()) {
        result.error = "empty command";
        return result;
    }

    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    if (pipe(out_pipe) == -1) {
        result.error = std::string("pipe: ") + std::strerror(errno);
        return result;
    }
    if (pipe(err_pipe) == -1) {
        result.error = std::string("pipe: ") + std::strerror(errno);
        close_pipe(out_pipe);
        return result;
    }

    pid_t pid = fork();
    if (pid == -1) {
        result.error = std::string("fork: ") + std::strerror(errno);
        close_pipe(out_pipe);
        close_pipe(err_pipe);
        return result;
    }

    if (pid == 0) {
        // Child: exec directly, no shell interpretation
        dup2(out_pipe[1], STDOUT_FILENO);
        dup2(err_pipe[1], STDERR_FILENO);
        close_pipe(out_pipe);
        close_pipe(err_pipe);

        std::vector<char*> args;
        args.reserve(argv.size() + 1);
        for (const auto& a : argv) args.push_back(const_cast<char*>(a.c_str()));
        args.push_back(nullptr);
        execvp(args[0], args.data());
        _exit(127);
    }

    close(out_pipe[1]);
    close(err_pipe[1]);

    // Drain both pipes together so a chatty stderr cannot block the child.
    std::array<char, 4096> buffer;
    struct pollfd fds[2] = {{out_pipe[0], POLLIN, 0}, {err_pipe[0], POLLIN, 0}};
    int open_fds = 2;
    while (open_fds > 0) {
        if (poll(fds, 2, -1) < 0) {
            if (errno == EINTR) continue;
            break;
        }
        for (int i = 0; i < 2; ++i) {
            if (fds[i].fd < 0 || fds[i].revents == 0) continue;
            ssize_t n = read(fds[i].fd, buffer.data(), buffer.size());
            if (n > 0) {
                (i == 0 ? result.output : result.error).append(buffer.data(), static_cast<size_t>(n));
            } else if (n == 0 || errno != EINTR) {
                close(fds[i].fd);
                fds[i].fd = -1;
                --open_fds;
            }
        }
    }
    for (auto& p : fds) {
        if (p.fd >= 0) close(p.fd);
    }

    int status = 0;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            result.error += std::string("waitpid: ") + std::strerror(errno);
            return result;
        }
    }
    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
        if (result.exit_code == 127 && result.error.empty()) {
            result.error = argv[0] + ": command not found";
        }
    }
    return result;
}

// ==================== Files ====================

void write_file_atomic(const std::string& path, const char* data, size_t size, mode_t mode) {
    std::string tmpl = dirname_of(path) + "/." + basename_of(path) + ".XXXXXX";
    std::vector<char> tmp_path(tmpl.begin(), tmpl.end());
    tmp_path.push_back('\0');

    int fd = mkstemp(tmp_path.data());
    if (fd < 0) {
        throw IOError("cannot create temp file for " + path + ": " + std::strerror(errno));
    }
    const std::string tmp(tmp_path.data());

    auto fail = [&](const std::string& what) {
        int err = errno;
        close(fd);
        unlink(tmp.c_str());
        throw IOError(what + " " + tmp + ": " + std::strerror(err));
    };

    // mkstemp creates 0600; widen (or keep) before any data lands
    if (fchmod(fd, mode) != 0) fail("chmod");
    while (size > 0) {
        ssize_t n = write(fd, data, size);
        if (n < 0) {
            if (errno == EINTR) continue;
            fail("write");
        }
        data += n;
        size -= static_cast<size_t>(n);
    }
    if (fsync(fd) != 0) fail("fsync");
    close(fd);

    if (rename(tmp.c_str(), path.c_str()) != 0) {
        int err = errno;
        unlink(tmp.c_str());
        throw IOError("rename onto " + path + ": " + std::strerror(err));
    }
}

void ensure_directory(const std::string& dir, mode_t mode) {
    if (mkdir(dir.c_str(), mode) == 0) return;
    if (errno != EEXIST) {
        throw IOError("cannot create directory " + dir + ": " + std::strerror(errno));
    }
    struct stat st;
    if (stat(dir.c_str(), &st) != 0 || !S_ISDIR(st.st_mode)) {
        throw IOError(dir + " exists and is not a directory");
    }
}

// ==================== MutationLock ====================

MutationLock::MutationLock(const std::string& lock_path)
    : local_(mutation_mutex())
{
    if (g_lock_depth++ > 0 || lock_path.empty()) return;

    fd_ = open(lock_path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0600);
    if (fd_ < 0) {
        --g_lock_depth;
        throw ConfigurationError("cannot open lock file " + lock_path + ": " +
                                 std::strerror(errno));
    }
    while (flock(fd_, LOCK_EX) != 0) {
        if (errno == EINTR) continue;
        int err = errno;
        close(fd_);
        fd_ = -1;
        --g_lock_depth;
        throw ConfigurationError("cannot lock " + lock_path + ": " + std::strerror(err));
    }
}

MutationLock::~MutationLock() {
    if (fd_ >= 0) {
        flock(fd_, LOCK_UN);
        close(fd_);
    }
    --g_lock_depth;
}

} // namespace ncf
