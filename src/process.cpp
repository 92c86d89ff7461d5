#include "process.hpp"
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>
#include <glog/logging.h>
#include <boost/algorithm/string/join.hpp>
#include <cerrno>
#include <cstring>
#include <mutex>
#include "common/utils.hpp"
#include "config.hpp"

namespace codebox {
using namespace std;

void cancel_token::cancel() noexcept {
    flag = true;
}

bool cancel_token::cancelled() const noexcept {
    return flag;
}

// 轮询取消标记以及回收子进程的间隔
static constexpr int POLL_INTERVAL_MS = 20;

posix_process_runner::posix_process_runner() {
    // 子进程提前退出时，写标准输入会产生 SIGPIPE
    static once_flag ignore_sigpipe;
    call_once(ignore_sigpipe, [] { signal(SIGPIPE, SIG_IGN); });
}

static void close_fd(int &fd) {
    if (fd >= 0) {
        close(fd);
        fd = -1;
    }
}

static process_result spawn_failure(const string &program, int err, long long runtime_ms) {
    process_result result;
    result.spawn_failed = true;
    result.exit_code = err == ENOENT ? 127 : 1;
    result.std_err = "Execution error: spawn " + program + " " + strerror(err);
    result.runtime_ms = runtime_ms;
    return result;
}

static void kill_group(pid_t pid) {
    kill(-pid, SIGKILL);
    kill(pid, SIGKILL);
}

process_result posix_process_runner::run(const vector<string> &argv,
                                         const string &input,
                                         chrono::milliseconds timeout,
                                         const cancel_token *cancel) {
    elapsed_time timer;
    if (argv.empty()) return spawn_failure("", EINVAL, 0);

    if (DEBUG) LOG(INFO) << "Running " << boost::algorithm::join(argv, " ");

    vector<char *> args;
    for (auto &arg : argv) args.push_back(const_cast<char *>(arg.c_str()));
    args.push_back(nullptr);

    // exec_pipe 用于把 execvp 的错误码传回父进程，exec 成功时因为 O_CLOEXEC 自动关闭
    int in_pipe[2], out_pipe[2], err_pipe[2], exec_pipe[2];
    if (pipe2(in_pipe, O_CLOEXEC) < 0) return spawn_failure(argv[0], errno, 0);
    if (pipe2(out_pipe, O_CLOEXEC) < 0) {
        int err = errno;
        close(in_pipe[0]), close(in_pipe[1]);
        return spawn_failure(argv[0], err, 0);
    }
    if (pipe2(err_pipe, O_CLOEXEC) < 0) {
        int err = errno;
        close(in_pipe[0]), close(in_pipe[1]), close(out_pipe[0]), close(out_pipe[1]);
        return spawn_failure(argv[0], err, 0);
    }
    if (pipe2(exec_pipe, O_CLOEXEC) < 0) {
        int err = errno;
        close(in_pipe[0]), close(in_pipe[1]), close(out_pipe[0]), close(out_pipe[1]);
        close(err_pipe[0]), close(err_pipe[1]);
        return spawn_failure(argv[0], err, 0);
    }

    pid_t pid = fork();
    if (pid == 0) {  // 子进程
        setpgid(0, 0);
        signal(SIGPIPE, SIG_DFL);
        dup2(in_pipe[0], STDIN_FILENO);
        dup2(out_pipe[1], STDOUT_FILENO);
        dup2(err_pipe[1], STDERR_FILENO);
        execvp(args[0], args.data());
        int err = errno;
        ssize_t written = write(exec_pipe[1], &err, sizeof(err));
        (void)written;
        _exit(127);
    }

    int stdin_fd = in_pipe[1], stdout_fd = out_pipe[0], stderr_fd = err_pipe[0], exec_fd = exec_pipe[0];
    close(in_pipe[0]), close(out_pipe[1]), close(err_pipe[1]), close(exec_pipe[1]);

    if (pid < 0) {  // fork 失败
        int err = errno;
        close_fd(stdin_fd), close_fd(stdout_fd), close_fd(stderr_fd), close_fd(exec_fd);
        return spawn_failure(argv[0], err, timer.duration<chrono::milliseconds>().count());
    }
    // 避免子进程 setpgid 之前父进程就向进程组发送信号
    setpgid(pid, pid);

    int exec_errno = 0;
    ssize_t n;
    while ((n = read(exec_fd, &exec_errno, sizeof(exec_errno))) < 0 && errno == EINTR)
        ;
    close_fd(exec_fd);
    if (n == sizeof(exec_errno)) {
        close_fd(stdin_fd), close_fd(stdout_fd), close_fd(stderr_fd);
        waitpid(pid, nullptr, 0);
        return spawn_failure(argv[0], exec_errno, timer.duration<chrono::milliseconds>().count());
    }

    fcntl(stdin_fd, F_SETFL, fcntl(stdin_fd, F_GETFL) | O_NONBLOCK);
    size_t input_offset = 0;
    if (input.empty()) close_fd(stdin_fd);

    process_result result;
    auto deadline = chrono::steady_clock::now() + timeout;
    bool reaped = false;
    int status = 0;
    char buffer[4096];

    while (true) {
        if (!reaped) {
            pid_t ret = waitpid(pid, &status, WNOHANG);
            if (ret == pid) reaped = true;
        }
        if (reaped && stdout_fd < 0 && stderr_fd < 0) break;

        bool expired = chrono::steady_clock::now() >= deadline;
        bool cancelled = cancel && cancel->cancelled();
        if (expired || cancelled) {
            kill_group(pid);
            if (!reaped) waitpid(pid, &status, 0);
            close_fd(stdin_fd), close_fd(stdout_fd), close_fd(stderr_fd);

            process_result killed;
            killed.runtime_ms = timer.duration<chrono::milliseconds>().count();
            if (cancelled) {
                killed.cancelled = true;
                killed.exit_code = 130;
                killed.std_err = "Execution cancelled";
            } else {
                killed.timed_out = true;
                killed.exit_code = 124;
                killed.std_err = "Time limit exceeded";
            }
            return killed;
        }

        vector<pollfd> fds;
        if (stdout_fd >= 0) fds.push_back({stdout_fd, POLLIN, 0});
        if (stderr_fd >= 0) fds.push_back({stderr_fd, POLLIN, 0});
        if (stdin_fd >= 0) fds.push_back({stdin_fd, POLLOUT, 0});

        auto remaining = chrono::duration_cast<chrono::milliseconds>(deadline - chrono::steady_clock::now()).count();
        int wait_ms = (int)max(0LL, min<long long>(remaining, POLL_INTERVAL_MS));
        int ready = fds.empty() ? (usleep(wait_ms * 1000), 0) : poll(fds.data(), fds.size(), wait_ms);
        if (ready < 0 && errno != EINTR) {
            LOG(ERROR) << "poll failed: " << strerror(errno);
            kill_group(pid);
            break;
        }
        if (ready <= 0) continue;

        for (auto &p : fds) {
            if (p.revents == 0) continue;
            if (p.fd == stdin_fd) {
                ssize_t written = write(stdin_fd, input.data() + input_offset, input.size() - input_offset);
                if (written > 0) input_offset += written;
                if ((written < 0 && errno != EAGAIN && errno != EINTR) || input_offset >= input.size())
                    close_fd(stdin_fd);
            } else {
                ssize_t count = read(p.fd, buffer, sizeof(buffer));
                if (count > 0) {
                    (p.fd == stdout_fd ? result.std_out : result.std_err).append(buffer, count);
                } else if (count == 0 || (errno != EAGAIN && errno != EINTR)) {
                    if (p.fd == stdout_fd)
                        close_fd(stdout_fd);
                    else
                        close_fd(stderr_fd);
                }
            }
        }
    }

    close_fd(stdin_fd), close_fd(stdout_fd), close_fd(stderr_fd);
    if (!reaped) waitpid(pid, &status, 0);

    result.runtime_ms = timer.duration<chrono::milliseconds>().count();
    if (WIFEXITED(status))
        result.exit_code = WEXITSTATUS(status);
    else if (WIFSIGNALED(status))
        result.exit_code = 128 + WTERMSIG(status);
    return result;
}

}  // namespace codebox
