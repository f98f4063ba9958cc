#include "sandbox/supervisor.hpp"
#include <fcntl.h>
#include <glog/logging.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>
#include <cstring>
#include <system_error>
#include "common/defer.hpp"
#include "common/exceptions.hpp"

namespace codebox {
using namespace std;

#define PIPE_IN 1
#define PIPE_OUT 0

const size_t BUF_SIZE = 4 * 1024;
const struct timespec killdelay = {0, 100000000L};  // 0.1s
const chrono::milliseconds poll_interval(20);
const chrono::seconds reap_timeout(5);

void captured_stream::append(const char *buf, size_t n, size_t limit) {
    total += n;
    if (data.size() >= limit) return;
    data.append(buf, min(n, limit - data.size()));
}

static void close_fd(int &fd) {
    if (fd >= 0) close(fd);
    fd = -1;
}

/**
 * @brief 读出管道中当前可读的所有数据
 * @return 管道是否已经到达 EOF
 */
static bool pump_pipe(int &fd, captured_stream &stream, size_t stream_size) {
    char buf[BUF_SIZE];
    while (fd >= 0) {
        ssize_t nread = read(fd, buf, BUF_SIZE);
        if (nread > 0) {
            bool was_full = stream.data.size() >= stream_size;
            stream.append(buf, nread, stream_size);
            if (!was_full && stream.data.size() >= stream_size)
                DLOG(INFO) << "child fd " << fd << " limit reached";
            continue;
        }
        if (nread == 0) {
            close_fd(fd);
            return true;
        }
        if (errno == EINTR) continue;
        if (errno == EAGAIN || errno == EWOULDBLOCK) return false;
        throw system_error(errno, generic_category(), "copying data from child pipe");
    }
    return true;
}

/**
 * @brief 子进程是否已经退出（不回收，保证进程组号在杀死残留进程之前不会被复用）
 */
static bool child_exited(pid_t pid) {
    siginfo_t info;
    memset(&info, 0, sizeof(info));
    if (waitid(P_PID, pid, &info, WEXITED | WNOHANG | WNOWAIT) != 0)
        throw system_error(errno, generic_category(), "waiting on child");
    return info.si_pid == pid;
}

/**
 * @brief 先尝试 SIGTERM 让程序体面退出，再用 SIGKILL 强制杀死整个进程组
 */
static void terminate_group(pid_t pid) {
    LOG(INFO) << "sending SIGTERM to process group " << pid;
    if (kill(-pid, SIGTERM) != 0 && errno != ESRCH)
        LOG(ERROR) << "unable to send SIGTERM to process group " << pid << ": " << strerror(errno);

    nanosleep(&killdelay, nullptr);

    LOG(INFO) << "sending SIGKILL to process group " << pid;
    if (kill(-pid, SIGKILL) != 0 && errno != ESRCH)
        LOG(ERROR) << "unable to send SIGKILL to process group " << pid << ": " << strerror(errno);
}

static int reap(pid_t pid, supervisor_result &result) {
    auto deadline = chrono::steady_clock::now() + reap_timeout;
    int status = 0;
    while (true) {
        pid_t r = waitpid(pid, &status, WNOHANG);
        if (r == pid) break;
        if (r < 0 && errno != EINTR) throw system_error(errno, generic_category(), "reaping child");
        if (chrono::steady_clock::now() > deadline)
            throw context_fault("process " + to_string(pid) + " survived SIGKILL");
        nanosleep(&killdelay, nullptr);
    }

    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.signal = WTERMSIG(status);
        return result.signal + 128;
    }
    return -1;
}

void kill_and_reap(pid_t pid) {
    if (kill(-pid, SIGKILL) != 0 && errno != ESRCH)
        LOG(ERROR) << "unable to kill process group " << pid << ": " << strerror(errno);

    auto deadline = chrono::steady_clock::now() + reap_timeout;
    int status;
    while (true) {
        pid_t r = waitpid(pid, &status, WNOHANG);
        if (r == pid || (r < 0 && errno != EINTR)) return;
        if (chrono::steady_clock::now() > deadline) {
            LOG(ERROR) << "process " << pid << " survived SIGKILL, leaving it unreaped";
            return;
        }
        nanosleep(&killdelay, nullptr);
    }
}

supervisor_result supervise(const supervisor_options &opt) {
    if (opt.command.empty()) throw invalid_argument("empty command");

    supervisor_result result;
    int child_pipefd[3][2] = {{-1, -1}, {-1, -1}, {-1, -1}};
    int stdin_fd = -1;
    defer {
        for (int i = 1; i <= 2; ++i) {
            close_fd(child_pipefd[i][PIPE_IN]);
            close_fd(child_pipefd[i][PIPE_OUT]);
        }
        close_fd(stdin_fd);
    };

    for (int i = 1; i <= 2; i++) {
        if (pipe2(child_pipefd[i], O_CLOEXEC) != 0)
            throw system_error(errno, generic_category(), "creating pipe for fd " + to_string(i));
    }

    const char *input = opt.stdin_filename.empty() ? "/dev/null" : opt.stdin_filename.c_str();
    stdin_fd = open(input, O_RDONLY | O_CLOEXEC);
    if (stdin_fd < 0)
        throw system_error(errno, generic_category(), string("opening stdin file ") + input);

    // 在 fork 之前准备好 argv，子进程里只调用 async-signal-safe 的函数
    vector<char *> argv;
    for (auto &arg : opt.command) argv.push_back(const_cast<char *>(arg.c_str()));
    argv.push_back(nullptr);

    auto start = chrono::steady_clock::now();
    pid_t pid = fork();
    if (pid < 0) throw system_error(errno, generic_category(), "fork");

    if (pid == 0) {
        // 子进程
        setpgid(0, 0);
        sigset_t emptymask;
        sigemptyset(&emptymask);
        sigprocmask(SIG_SETMASK, &emptymask, nullptr);
        signal(SIGPIPE, SIG_DFL);

        if (dup2(stdin_fd, STDIN_FILENO) < 0 ||
            dup2(child_pipefd[STDOUT_FILENO][PIPE_IN], STDOUT_FILENO) < 0 ||
            dup2(child_pipefd[STDERR_FILENO][PIPE_IN], STDERR_FILENO) < 0)
            _exit(127);

        execvp(argv[0], argv.data());
        const char msg[] = "unable to execute command\n";
        ssize_t ignored = write(STDERR_FILENO, msg, sizeof(msg) - 1);
        (void)ignored;
        _exit(127);
    }

    // 父进程
    setpgid(pid, pid);  // 和子进程里的 setpgid 竞争，保证 kill(-pid) 之前进程组已经建立
    auto deadline = start + opt.wall_limit;
    bool limited = opt.wall_limit.count() > 0;
    bool killed = false;
    chrono::steady_clock::time_point killed_at;
    try {
        close_fd(stdin_fd);
        for (int i = 1; i <= 2; i++) {
            close_fd(child_pipefd[i][PIPE_IN]);
            int flags = fcntl(child_pipefd[i][PIPE_OUT], F_GETFL);
            if (flags == -1 || fcntl(child_pipefd[i][PIPE_OUT], F_SETFL, flags | O_NONBLOCK) == -1)
                throw system_error(errno, generic_category(), "fcntl, setting flags");
        }

        while (true) {
            pollfd fds[2];
            nfds_t nfds = 0;
            for (int i = 1; i <= 2; i++)
                if (child_pipefd[i][PIPE_OUT] >= 0)
                    fds[nfds++] = {child_pipefd[i][PIPE_OUT], POLLIN, 0};

            auto timeout = poll_interval;
            if (limited && !killed) {
                auto remaining = chrono::duration_cast<chrono::milliseconds>(deadline - chrono::steady_clock::now());
                timeout = max(chrono::milliseconds(0), min(timeout, remaining));
            }

            if (nfds > 0) {
                if (poll(fds, nfds, (int)timeout.count()) < 0 && errno != EINTR)
                    throw system_error(errno, generic_category(), "waiting for child data");
            } else {
                struct timespec ts = {0, (long)chrono::duration_cast<chrono::nanoseconds>(timeout).count()};
                nanosleep(&ts, nullptr);
            }

            pump_pipe(child_pipefd[STDOUT_FILENO][PIPE_OUT], result.out, opt.stream_size);
            pump_pipe(child_pipefd[STDERR_FILENO][PIPE_OUT], result.err, opt.stream_size);

            if (child_exited(pid)) break;

            if (killed && chrono::steady_clock::now() - killed_at > reap_timeout)
                throw context_fault("process group " + to_string(pid) + " survived SIGKILL");

            if (!killed && limited && chrono::steady_clock::now() >= deadline) {
                LOG(WARNING) << "timelimit exceeded (hard wall time): aborting command " << opt.command[0];
                result.time_limit_exceeded = true;
                terminate_group(pid);
                killed = true;
                killed_at = chrono::steady_clock::now();
            } else if (!killed && is_cancelled(opt.cancel)) {
                LOG(WARNING) << "execution cancelled: aborting command " << opt.command[0];
                result.cancelled = true;
                terminate_group(pid);
                killed = true;
                killed_at = chrono::steady_clock::now();
            }
        }
    } catch (...) {
        // 任何错误都不能留下失控的进程
        kill_and_reap(pid);
        throw;
    }

    // 子进程已经退出，杀死进程组中残留的进程后再回收
    if (kill(-pid, SIGKILL) != 0 && errno != ESRCH)
        LOG(ERROR) << "unable to kill remaining processes of group " << pid << ": " << strerror(errno);
    result.exitcode = reap(pid, result);
    result.wall_time = chrono::duration<double>(chrono::steady_clock::now() - start).count();

    // 读出管道中剩余的数据，残留进程已被杀死，管道写端很快会全部关闭
    auto drain_deadline = chrono::steady_clock::now() + chrono::seconds(1);
    while ((child_pipefd[STDOUT_FILENO][PIPE_OUT] >= 0 || child_pipefd[STDERR_FILENO][PIPE_OUT] >= 0) &&
           chrono::steady_clock::now() < drain_deadline) {
        pollfd fds[2];
        nfds_t nfds = 0;
        for (int i = 1; i <= 2; i++)
            if (child_pipefd[i][PIPE_OUT] >= 0)
                fds[nfds++] = {child_pipefd[i][PIPE_OUT], POLLIN, 0};
        if (poll(fds, nfds, (int)poll_interval.count()) < 0 && errno != EINTR)
            throw system_error(errno, generic_category(), "draining child data");
        pump_pipe(child_pipefd[STDOUT_FILENO][PIPE_OUT], result.out, opt.stream_size);
        pump_pipe(child_pipefd[STDERR_FILENO][PIPE_OUT], result.err, opt.stream_size);
    }

    if (result.signal > 0 && !killed)
        LOG(WARNING) << "Command terminated with signal (" << result.signal << ", " << strsignal(result.signal) << ")";
    return result;
}

}  // namespace codebox
