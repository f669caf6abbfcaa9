#include "../include/Executor.hpp"
#include <array>
#include <cerrno>
#include <cstring>
#include <string>
#include <vector>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <unistd.h>
#include <sys/wait.h>

using namespace devops;
using namespace std;

namespace {
    constexpr int POLL_TIMEOUT_MS = 10;
    constexpr size_t PIPE_BUFFER_SIZE = 8192;
}

static void close_fd(int &fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

static void close_pipe(array<int, 2> &p) {
    close_fd(p[0]);
    close_fd(p[1]);
}

// Reads what is available without blocking. Closes fd on EOF.
static void drain(int &fd, string &dst) {
    array<char, PIPE_BUFFER_SIZE> buf{};
    while (fd >= 0) {
        const ssize_t n = ::read(fd, buf.data(), buf.size());
        if (n > 0) {
            dst.append(buf.data(), static_cast<size_t>(n));
            continue;
        }
        if (n == 0) {
            close_fd(fd);
            return;
        }
        if (errno == EINTR) continue;
        if (errno != EAGAIN && errno != EWOULDBLOCK) close_fd(fd);
        return;
    }
}

static int decode_status(const int status) {
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return -1;
}

static pid_t wait_child(const pid_t pid, int &status, const int options) {
    pid_t w;
    do {
        w = ::waitpid(pid, &status, options);
    } while (w < 0 && errno == EINTR);
    return w;
}

ExecError::ExecError(const Kind kind, const string &command, const string &detail)
    : runtime_error(kind == Kind::cancelled
                        ? "command '" + command + "' cancelled: " + detail
                        : "failed to start '" + command + "': " + detail),
      error_kind(kind), cmd(command) {
    partial.exit_code = -1;
}

ShellExecutor::ShellExecutor(string shell) : shell_path(std::move(shell)) {
}

void ShellExecutor::add_env(vector<string> e) {
    env = std::move(e);
}

CommandResult ShellExecutor::execute(const Context &ctx, const string &command) {
    CommandResult result;
    if (command.empty()) return result;
    if (ctx.done()) throw ExecError(ExecError::Kind::cancelled, command, ctx.reason_text());

    // Everything the child touches is prepared before fork().
    string shell = shell_path;
    string dash_c = "-c";
    string line = command;
    const array<char *, 4> argv = {shell.data(), dash_c.data(), line.data(), nullptr};
    vector<string> env_storage;
    vector<char *> envp;
    if (env) {
        env_storage = *env;
        envp.reserve(env_storage.size() + 1);
        for (auto &e: env_storage) envp.push_back(e.data());
        envp.push_back(nullptr);
    }

    array<int, 2> out_pipe{-1, -1};
    array<int, 2> err_pipe{-1, -1};
    array<int, 2> exec_pipe{-1, -1}; // child reports exec() errno here
    if (::pipe2(out_pipe.data(), O_CLOEXEC) != 0 || ::pipe2(err_pipe.data(), O_CLOEXEC) != 0 ||
        ::pipe2(exec_pipe.data(), O_CLOEXEC) != 0) {
        const string why = strerror(errno);
        close_pipe(out_pipe);
        close_pipe(err_pipe);
        close_pipe(exec_pipe);
        throw ExecError(ExecError::Kind::launch, command, "pipe: " + why);
    }

    const pid_t pid = ::fork();
    if (pid < 0) {
        const string why = strerror(errno);
        close_pipe(out_pipe);
        close_pipe(err_pipe);
        close_pipe(exec_pipe);
        throw ExecError(ExecError::Kind::launch, command, "fork: " + why);
    }
    if (pid == 0) {
        // Own process group so cancellation reaches everything the shell spawns.
        ::setpgid(0, 0);
        // A background group reading the terminal would stop on SIGTTIN.
        if (const int null_fd = ::open("/dev/null", O_RDONLY); null_fd >= 0) {
            ::dup2(null_fd, STDIN_FILENO);
            if (null_fd != STDIN_FILENO) ::close(null_fd);
        } else {
            ::close(STDIN_FILENO);
        }
        ::dup2(out_pipe[1], STDOUT_FILENO);
        ::dup2(err_pipe[1], STDERR_FILENO);
        if (env) ::execvpe(argv[0], argv.data(), envp.data());
        else ::execvp(argv[0], argv.data());
        const int e = errno;
        ssize_t ignored = ::write(exec_pipe[1], &e, sizeof(e));
        (void) ignored;
        _exit(127);
    }

    ::setpgid(pid, pid);
    close_fd(out_pipe[1]);
    close_fd(err_pipe[1]);
    close_fd(exec_pipe[1]);

    // EOF means exec() succeeded (O_CLOEXEC), an int means it failed.
    int exec_errno = 0;
    ssize_t got;
    do {
        got = ::read(exec_pipe[0], &exec_errno, sizeof(exec_errno));
    } while (got < 0 && errno == EINTR);
    close_fd(exec_pipe[0]);
    int status = 0;
    if (got == static_cast<ssize_t>(sizeof(exec_errno))) {
        wait_child(pid, status, 0);
        close_pipe(out_pipe);
        close_pipe(err_pipe);
        throw ExecError(ExecError::Kind::launch, command, shell_path + ": " + strerror(exec_errno));
    }

    ::fcntl(out_pipe[0], F_SETFL, O_NONBLOCK);
    ::fcntl(err_pipe[0], F_SETFL, O_NONBLOCK);

    bool exited = false;
    while (!exited) {
        if (ctx.done()) {
            ::kill(-pid, SIGKILL);
            ::kill(pid, SIGKILL);
            wait_child(pid, status, 0);
            close_pipe(out_pipe);
            close_pipe(err_pipe);
            throw ExecError(ExecError::Kind::cancelled, command, ctx.reason_text());
        }

        array<pollfd, 2> fds = {{{out_pipe[0], POLLIN, 0}, {err_pipe[0], POLLIN, 0}}};
        if (::poll(fds.data(), fds.size(), POLL_TIMEOUT_MS) > 0) {
            drain(out_pipe[0], result.stdout_text);
            drain(err_pipe[0], result.stderr_text);
        }

        const pid_t w = wait_child(pid, status, WNOHANG);
        if (w == pid) exited = true;
        else if (w < 0) {
            const string why = strerror(errno);
            close_pipe(out_pipe);
            close_pipe(err_pipe);
            throw ExecError(ExecError::Kind::launch, command, "waitpid: " + why);
        }
    }

    // Whatever the child wrote before exiting is still buffered in the pipes.
    // Background jobs that keep the write ends open are not waited for.
    drain(out_pipe[0], result.stdout_text);
    drain(err_pipe[0], result.stderr_text);
    close_pipe(out_pipe);
    close_pipe(err_pipe);

    result.exit_code = decode_status(status);
    return result;
}
