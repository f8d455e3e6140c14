#include "process.hpp"
#include <core/log.hpp>

#include <unistd.h>
#include <sys/wait.h>
#include <poll.h>
#include <fcntl.h>
#include <cerrno>
#include <cstring>

namespace platform {

// ── Pipe helpers ─────────────────────────────────────────────

namespace {

struct Pipe {
    int fds[2] = {-1, -1};

    bool open() { return pipe2(fds, O_CLOEXEC) == 0; }
    int read_end() const { return fds[0]; }
    int write_end() const { return fds[1]; }

    void close_read() {
        if (fds[0] >= 0) { ::close(fds[0]); fds[0] = -1; }
    }
    void close_write() {
        if (fds[1] >= 0) { ::close(fds[1]); fds[1] = -1; }
    }
    ~Pipe() { close_read(); close_write(); }
};

// Drain both pipes until EOF on each, without letting either fill up.
void drain(Pipe& out, Pipe& err, std::string& out_data, std::string& err_data) {
    char buf[65536];
    bool out_open = true, err_open = true;

    while (out_open || err_open) {
        struct pollfd pfds[2];
        int n = 0;
        if (out_open) { pfds[n].fd = out.read_end(); pfds[n].events = POLLIN; n++; }
        if (err_open) { pfds[n].fd = err.read_end(); pfds[n].events = POLLIN; n++; }

        int ready = poll(pfds, n, -1);
        if (ready < 0) {
            if (errno == EINTR) continue;
            break;
        }

        for (int i = 0; i < n; i++) {
            if (!(pfds[i].revents & (POLLIN | POLLHUP | POLLERR))) continue;
            ssize_t got = ::read(pfds[i].fd, buf, sizeof(buf));
            if (got < 0 && errno == EINTR) continue;
            bool is_out = pfds[i].fd == out.read_end();
            if (got <= 0) {
                if (is_out) out_open = false; else err_open = false;
                continue;
            }
            (is_out ? out_data : err_data).append(buf, static_cast<size_t>(got));
        }
    }
}

} // namespace

// ── run_capture ──────────────────────────────────────────────

ProcessResult run_capture(const std::string& program,
                          const std::vector<std::string>& args,
                          const std::filesystem::path& cwd) {
    ProcessResult result{-1, "", ""};

    Pipe out, err;
    if (!out.open() || !err.open()) {
        result.stderr_data = std::string("pipe failed: ") + std::strerror(errno);
        return result;
    }

    // Build argv before fork; the child must not allocate
    std::vector<const char*> argv;
    argv.push_back(program.c_str());
    for (const auto& a : args) argv.push_back(a.c_str());
    argv.push_back(nullptr);
    std::string cwd_str = cwd.string();

    pid_t pid = fork();
    if (pid < 0) {
        result.stderr_data = std::string("fork failed: ") + std::strerror(errno);
        return result;
    }

    if (pid == 0) {
        // Child process
        int devnull = ::open("/dev/null", O_RDONLY);
        if (devnull >= 0) { dup2(devnull, STDIN_FILENO); ::close(devnull); }
        dup2(out.write_end(), STDOUT_FILENO);
        dup2(err.write_end(), STDERR_FILENO);

        if (!cwd_str.empty() && chdir(cwd_str.c_str()) != 0) {
            const char msg[] = "cannot change into working directory\n";
            ssize_t ignored = ::write(STDERR_FILENO, msg, sizeof(msg) - 1);
            (void)ignored;
            _exit(127);
        }

        execvp(program.c_str(), const_cast<char* const*>(argv.data()));
        const char msg[] = "failed to execute program\n";
        ssize_t ignored = ::write(STDERR_FILENO, msg, sizeof(msg) - 1);
        (void)ignored;
        _exit(127);  // exec failed
    }

    // Parent
    out.close_write();
    err.close_write();
    drain(out, err, result.stdout_data, result.stderr_data);

    int status = 0;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            result.stderr_data += std::string("waitpid failed: ") + std::strerror(errno);
            return result;
        }
    }
    result.exit_code = WIFEXITED(status) ? WEXITSTATUS(status) : -1;

    cc_log("run " + program + " -> exit " + std::to_string(result.exit_code));
    return result;
}

} // namespace platform
