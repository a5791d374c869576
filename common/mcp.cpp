#include "mcp.hpp"
#include "log.h"

#include <subprocess.h>

#include <algorithm>
#include <cerrno>
#include <climits>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <thread>

#include <fcntl.h>
#include <poll.h>
#include <sys/stat.h>
#include <unistd.h>

// Environment variables deemed safe to inherit for MCP subprocesses.
// Keep in sync with MCP TypeScript SDK:
// https://github.com/modelcontextprotocol/typescript-sdk/blob/main/packages/client/src/client/stdio.ts
static const std::vector<std::string> MCP_INHERITED_ENV_VARS = {
    "HOME", "LOGNAME", "PATH", "SHELL", "TERM", "USER"
};

static std::vector<const char*> to_cstr_array(const std::vector<std::string> & strings) {
    std::vector<const char*> result;
    result.reserve(strings.size() + 1);
    for (const auto & s : strings) {
        result.push_back(s.c_str());
    }
    result.push_back(nullptr);
    return result;
}

std::vector<std::string> mcp_stdio_environment(const std::map<std::string, std::string> & overrides) {
    std::vector<std::string> env_strings;
    for (const auto & var : MCP_INHERITED_ENV_VARS) {
        const char * val = std::getenv(var.c_str());
        if (val != nullptr) {
            env_strings.push_back(var + "=" + val);
        }
    }

    // config overrides inherited
    for (const auto & [key, value] : overrides) {
        std::string prefix = key + "=";
        env_strings.erase(
            std::remove_if(env_strings.begin(), env_strings.end(),
                [&prefix](const std::string & s) {
                    return s.compare(0, prefix.size(), prefix) == 0;
                }),
            env_strings.end());
        env_strings.push_back(key + "=" + value);
    }
    return env_strings;
}

const char * mcp_stdio_status_name(mcp_stdio_status status) {
    switch (status) {
        case MCP_STDIO_OK:      return "ok";
        case MCP_STDIO_TIMEOUT: return "timeout";
        case MCP_STDIO_ERROR:   return "error";
    }
    return "unknown";
}

// Owns the child and its pipes; the child is killed (if needed) and reaped on destruction
struct mcp_stdio_process {
    subprocess_s proc;
    bool created = false;
    bool reaped  = false;

    mcp_stdio_process() {
        std::memset(&proc, 0, sizeof(proc));
    }

    ~mcp_stdio_process() {
        if (!created) {
            return;
        }
        kill();
        subprocess_destroy(&proc);
    }

    mcp_stdio_process(const mcp_stdio_process &) = delete;
    mcp_stdio_process & operator=(const mcp_stdio_process &) = delete;

    void close_stdin() {
        if (proc.stdin_file) {
            fclose(proc.stdin_file);
            proc.stdin_file = nullptr;
        }
    }

    void kill() {
        if (!created || reaped) {
            return;
        }
        close_stdin();
        subprocess_terminate(&proc);
        subprocess_join(&proc, nullptr);
        reaped = true;
    }
};

static bool set_nonblocking(int fd) {
    const int flags = fcntl(fd, F_GETFL, 0);
    if (flags == -1) {
        return false;
    }
    return fcntl(fd, F_SETFL, flags | O_NONBLOCK) != -1;
}

// clamped to what poll() accepts, long timeouts are waited for in several polls
static int remaining_ms(std::chrono::steady_clock::time_point deadline) {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
    if (left.count() <= 0) {
        return 0;
    }
    return static_cast<int>(std::min<int64_t>(left.count(), INT_MAX));
}

// reads whatever is available; returns false on a read error, sets `open` to false at EOF
static bool drain_fd(int fd, std::string & out, bool & open) {
    char buffer[4096];
    while (true) {
        const ssize_t n = read(fd, buffer, sizeof(buffer));
        if (n > 0) {
            out.append(buffer, static_cast<size_t>(n));
            continue;
        }
        if (n == 0) {
            open = false;
            return true;
        }
        if (errno == EINTR) {
            continue;
        }
        if (errno == EAGAIN || errno == EWOULDBLOCK) {
            return true;
        }
        return false;
    }
}

// 0 if path is an executable regular file, else the errno execve would fail with
static int check_executable(const std::string & path) {
    struct stat st;
    if (stat(path.c_str(), &st) != 0) {
        return errno;
    }
    if (S_ISDIR(st.st_mode)) {
        return EISDIR;
    }
    if (!S_ISREG(st.st_mode)) {
        return EACCES;
    }
    if (access(path.c_str(), X_OK) != 0) {
        return errno;
    }
    return 0;
}

// same lookup as execvp: a name with a '/' is used as is, anything else is searched in PATH
static int find_program(const std::string & program) {
    if (program.find('/') != std::string::npos) {
        return check_executable(program);
    }

    const char * path_env = std::getenv("PATH");
    const std::string path = path_env ? path_env : "/bin:/usr/bin";

    int err = ENOENT;
    size_t start = 0;
    while (start <= path.size()) {
        size_t end = path.find(':', start);
        if (end == std::string::npos) {
            end = path.size();
        }
        std::string dir = path.substr(start, end - start);
        if (dir.empty()) {
            dir = ".";
        }
        const int res = check_executable(dir + "/" + program);
        if (res == 0) {
            return 0;
        }
        // a match that cannot be run is reported over "not found", as execvp does
        if (res == EACCES) {
            err = EACCES;
        }
        start = end + 1;
    }
    return err;
}

static mcp_stdio_result make_error(const std::string & msg) {
    mcp_stdio_result result;
    result.status = MCP_STDIO_ERROR;
    result.error  = msg;
    return result;
}

static mcp_stdio_result make_timeout(std::chrono::milliseconds timeout) {
    mcp_stdio_result result;
    result.status = MCP_STDIO_TIMEOUT;
    result.error  = "timed out after " + std::to_string(timeout.count()) + " ms";
    return result;
}

mcp_stdio_result mcp_stdio_exchange(
    const mcp_stdio_command & cmd,
    const std::string & input,
    std::chrono::milliseconds timeout)
{
    if (cmd.argv.empty() || cmd.argv[0].empty()) {
        return make_error("no command to run");
    }

    const std::string & program = cmd.argv[0];

    // posix_spawn does not tell us why it failed, so resolve the program up front
    const int spawn_errno = find_program(program);
    if (spawn_errno != 0) {
        return make_error("failed to spawn " + program + ": " + strerror(spawn_errno));
    }

    auto argv = to_cstr_array(cmd.argv);
    auto env_strings = mcp_stdio_environment(cmd.env);
    auto envp = to_cstr_array(env_strings);

    int options = subprocess_option_no_window
                | subprocess_option_search_user_path;

    mcp_stdio_process p;
    if (subprocess_create_ex(argv.data(), options, envp.data(), &p.proc) != 0) {
        return make_error("failed to spawn " + program);
    }
    p.created = true;

    LOG_DBG("%s: started %s\n", __func__, program.c_str());

    const auto deadline = std::chrono::steady_clock::now() + timeout;

    FILE * stdout_file = subprocess_stdout(&p.proc);
    FILE * stderr_file = subprocess_stderr(&p.proc);
    if (!p.proc.stdin_file || !stdout_file || !stderr_file) {
        return make_error("failed to get pipes for " + program);
    }

    const int in_fd  = fileno(p.proc.stdin_file);
    const int out_fd = fileno(stdout_file);
    const int err_fd = fileno(stderr_file);
    if (!set_nonblocking(in_fd) || !set_nonblocking(out_fd) || !set_nonblocking(err_fd)) {
        return make_error(std::string("fcntl failed: ") + strerror(errno));
    }

    const std::string line = input + "\n";
    size_t written = 0;

    bool in_open  = true;
    bool out_open = true;
    bool err_open = true;

    mcp_stdio_result result;

    while (in_open || out_open || err_open) {
        const int wait_ms = remaining_ms(deadline);
        if (wait_ms <= 0) {
            LOG_DBG("%s: deadline reached, killing %s\n", __func__, program.c_str());
            p.kill();
            return make_timeout(timeout);
        }

        struct pollfd fds[3];
        int nfds = 0;
        int in_idx = -1, out_idx = -1, err_idx = -1;
        if (in_open)  { in_idx  = nfds; fds[nfds++] = { in_fd,  POLLOUT, 0 }; }
        if (out_open) { out_idx = nfds; fds[nfds++] = { out_fd, POLLIN,  0 }; }
        if (err_open) { err_idx = nfds; fds[nfds++] = { err_fd, POLLIN,  0 }; }

        const int ready = poll(fds, nfds, wait_ms);
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            return make_error(std::string("poll failed: ") + strerror(errno));
        }
        if (ready == 0) {
            continue; // re-checked against the deadline above
        }

        if (in_idx >= 0 && fds[in_idx].revents != 0) {
            if (fds[in_idx].revents & (POLLERR | POLLHUP | POLLNVAL)) {
                LOG_DBG("%s: %s closed its stdin after %zu/%zu bytes\n", __func__, program.c_str(), written, line.size());
                p.close_stdin();
                in_open = false;
            } else {
                const ssize_t n = write(in_fd, line.data() + written, line.size() - written);
                if (n < 0) {
                    if (errno == EPIPE) {
                        LOG_DBG("%s: %s closed its stdin after %zu/%zu bytes\n", __func__, program.c_str(), written, line.size());
                        p.close_stdin();
                        in_open = false;
                    } else if (errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR) {
                        return make_error(std::string("write to " + program + " failed: ") + strerror(errno));
                    }
                } else {
                    written += static_cast<size_t>(n);
                    if (written == line.size()) {
                        LOG_DBG("%s: wrote %zu bytes to %s\n", __func__, written, program.c_str());
                        p.close_stdin();
                        in_open = false;
                    }
                }
            }
        }

        if (out_idx >= 0 && fds[out_idx].revents != 0) {
            if (!drain_fd(out_fd, result.out, out_open)) {
                return make_error(std::string("read from " + program + " stdout failed: ") + strerror(errno));
            }
        }

        if (err_idx >= 0 && fds[err_idx].revents != 0) {
            if (!drain_fd(err_fd, result.err, err_open)) {
                return make_error(std::string("read from " + program + " stderr failed: ") + strerror(errno));
            }
        }
    }

    // both output pipes are closed, wait for the process itself
    while (true) {
        const int alive = subprocess_alive(&p.proc);
        if (alive < 0) {
            // the wait already consumed the child, there is nothing left to kill
            p.reaped = true;
            return make_error("failed to wait for " + program);
        }
        if (alive == 0) {
            p.reaped = true;
            break;
        }
        if (remaining_ms(deadline) <= 0) {
            LOG_DBG("%s: deadline reached, killing %s\n", __func__, program.c_str());
            p.kill();
            return make_timeout(timeout);
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }

    if (subprocess_join(&p.proc, &result.exit_code) != 0) {
        return make_error("failed to join " + program);
    }

    LOG_DBG("%s: %s exited with status %d (%zu bytes stdout, %zu bytes stderr)\n",
            __func__, program.c_str(), result.exit_code, result.out.size(), result.err.size());

    result.status = MCP_STDIO_OK;
    return result;
}
