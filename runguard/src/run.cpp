#include "run.hpp"
#include <fcntl.h>
#include <fmt/core.h>
#include <glog/logging.h>
#include <math.h>
#include <signal.h>
#include <string.h>
#include <sys/select.h>
#include <sys/stat.h>
#include <sys/time.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#include <boost/algorithm/string/join.hpp>
#include <iostream>
#include <system_error>
#include <vector>
#include "limits.hpp"
#include "meta.hpp"

using namespace std;

static const struct timespec killdelay = {0, 100000000L};  // 0.1s

static const int BUF_SIZE = 4096;

static const int PIPE_IN = 1;
static const int PIPE_OUT = 0;

static pid_t child_pid = -1;
static volatile sig_atomic_t received_SIGCHLD = 0;
static volatile sig_atomic_t received_signal = -1;
static volatile sig_atomic_t hard_timelimit = 0;

template <typename... Args>
[[noreturn]] static void error(int err, const char *format, Args &&... args) {
    throw system_error(err, system_category(), fmt::format(format, std::forward<Args>(args)...));
}

static void kill_children() {
    if (child_pid <= 0) return;
    if (kill(-child_pid, SIGKILL) != 0 && errno != ESRCH)
        LOG(ERROR) << "unable to send SIGKILL to children: " << strerror(errno);
    nanosleep(&killdelay, nullptr);
}

/**
 * @brief 未捕获异常时记录 internal-error，评测进程据此判断为沙箱故障
 */
static void runguard_terminate_handler() {
    sigset_t sigs;
    sigemptyset(&sigs);
    sigaddset(&sigs, SIGALRM);
    sigaddset(&sigs, SIGTERM);
    sigprocmask(SIG_BLOCK, &sigs, nullptr);

    if (exception_ptr cur = current_exception()) {
        try {
            rethrow_exception(cur);
        } catch (const exception &e) {
            cerr << e.what() << endl;
            meta.append("internal-error", e.what());
        }
    }

    kill_children();
    exit(EXIT_FAILURE);
}

/**
 * @brief SIGALRM（硬时钟时间限制）和 SIGTERM 的处理函数
 * 先发 SIGTERM 再发 SIGKILL 给整个进程组
 */
static void terminate_child(int sig) {
    struct sigaction sigact;
    sigact.sa_handler = SIG_DFL;
    sigact.sa_flags = 0;
    sigemptyset(&sigact.sa_mask);
    sigaction(SIGTERM, &sigact, nullptr);
    sigaction(SIGALRM, &sigact, nullptr);

    if (sig == SIGALRM) hard_timelimit = 1;
    received_signal = sig;

    kill(-child_pid, SIGTERM);
    nanosleep(&killdelay, nullptr);
    kill(-child_pid, SIGKILL);
    nanosleep(&killdelay, nullptr);
}

static void child_handler(int) {
    received_SIGCHLD = 1;
}

struct stream_pump {
    int pipefd[3][2];
    int redirfd[3] = {-1, -1, -1};
    size_t data_read[3] = {0, 0, 0};
    size_t data_passed[3] = {0, 0, 0};

    /**
     * @brief 将管道中可读的数据转存到文件，超过 stream_size 的数据读出后丢弃
     */
    void pump(const runguard_options &opt, fd_set *readfds) {
        char buf[BUF_SIZE];
        for (int i = 1; i <= 2; i++) {
            int fd = pipefd[i][PIPE_OUT];
            if (fd == -1 || !FD_ISSET(fd, readfds)) continue;

            ssize_t nread = read(fd, buf, BUF_SIZE);
            if (nread == -1) {
                if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) continue;
                error(errno, "copying data fd {}", i);
            }
            if (nread == 0) {
                if (close(fd) != 0) error(errno, "closing pipe for fd {}", i);
                pipefd[i][PIPE_OUT] = -1;
                continue;
            }
            data_read[i] += nread;

            size_t to_write = nread;
            if (opt.stream_size >= 0)
                to_write = min<size_t>(to_write, opt.stream_size - min<size_t>(opt.stream_size, data_passed[i]));
            for (size_t offset = 0; offset < to_write;) {
                ssize_t nwritten = write(redirfd[i], buf + offset, to_write - offset);
                if (nwritten == -1) {
                    if (errno == EINTR) continue;
                    error(errno, "writing output of fd {}", i);
                }
                offset += nwritten;
            }
            data_passed[i] += to_write;
        }
    }

    bool open() const {
        return pipefd[1][PIPE_OUT] != -1 || pipefd[2][PIPE_OUT] != -1;
    }
};

static void install_handlers(const runguard_options &opt) {
    sigset_t emptymask, sigmask;
    if (sigemptyset(&emptymask) != 0) error(errno, "creating empty signal mask");

    // SIGCHLD 只在 pselect 中被递送
    sigmask = emptymask;
    if (sigaddset(&sigmask, SIGCHLD) != 0) error(errno, "setting signal mask");
    if (sigprocmask(SIG_SETMASK, &sigmask, nullptr) != 0) error(errno, "masking SIGCHLD");

    struct sigaction sigact;
    sigact.sa_handler = child_handler;
    sigact.sa_flags = 0;
    sigact.sa_mask = emptymask;
    if (sigaction(SIGCHLD, &sigact, nullptr) != 0) error(errno, "installing SIGCHLD handler");

    sigact.sa_handler = terminate_child;
    sigact.sa_flags = SA_RESETHAND | SA_RESTART;
    sigact.sa_mask = emptymask;
    sigaddset(&sigact.sa_mask, SIGALRM);
    sigaddset(&sigact.sa_mask, SIGTERM);
    if (sigaction(SIGTERM, &sigact, nullptr) != 0) error(errno, "installing SIGTERM handler");

    if (opt.use_wall_limit) {
        if (sigaction(SIGALRM, &sigact, nullptr) != 0) error(errno, "installing SIGALRM handler");

        double integral;
        struct itimerval itimer;
        itimer.it_interval.tv_sec = 0;
        itimer.it_interval.tv_usec = 0;
        itimer.it_value.tv_sec = (time_t)opt.wall_limit.hard;
        itimer.it_value.tv_usec = (suseconds_t)(modf(opt.wall_limit.hard, &integral) * 1E6);
        if (setitimer(ITIMER_REAL, &itimer, nullptr) != 0) error(errno, "setting timer");
        DLOG(INFO) << fmt::format("hard wall-time limit {:.3f}s", opt.wall_limit.hard);
    }
}

[[noreturn]] static void run_child(const runguard_options &opt, stream_pump &streams) {
    if (!opt.stdin_filename.empty()) {
        int fd = open(opt.stdin_filename.c_str(), O_RDONLY);
        if (fd < 0 || dup2(fd, STDIN_FILENO) < 0) error(errno, "redirecting stdin from {}", opt.stdin_filename);
        close(fd);
    }

    for (int i = 1; i <= 2; ++i) {
        if (dup2(streams.pipefd[i][PIPE_IN], i) < 0) error(errno, "redirecting child fd {}", i);
        if (close(streams.pipefd[i][PIPE_IN]) != 0 || close(streams.pipefd[i][PIPE_OUT]) != 0)
            error(errno, "closing pipe for fd {}", i);
    }

    set_restrictions(opt);
    set_seccomp(opt);

    vector<char *> args;
    for (auto &arg : opt.command) args.push_back(const_cast<char *>(arg.c_str()));
    args.push_back(nullptr);
    execvp(args[0], args.data());
    error(errno, "unable to start command {}", opt.command[0]);
}

static int open_output(const string &filename) {
    int fd = creat(filename.c_str(), S_IRUSR | S_IWUSR);
    if (fd < 0) error(errno, "opening file '{}'", filename);
    return fd;
}

int runit(struct runguard_options opt) {
    set_terminate(runguard_terminate_handler);
    meta.open(opt.metafile_path);

    stream_pump streams;
    for (int i = 1; i <= 2; i++)
        if (pipe(streams.pipefd[i]) != 0) error(errno, "creating pipe for fd {}", i);

    cgroup_guard::init();
    opt.cgroupname = fmt::format("/arbiter/runguard_{}_{}", getpid(), (long)time(nullptr));
    cgroup_create(opt);

    if (!opt.bind_dir.empty() && opt.user_id >= 0)
        if (chown(opt.bind_dir.c_str(), opt.user_id, opt.group_id) != 0)
            error(errno, "changing owner of {}", opt.bind_dir);

    isolate(opt);

    struct timeval starttime, endtime;
    if (gettimeofday(&starttime, nullptr)) error(errno, "getting time");

    switch (child_pid = fork()) {
        case -1:
            error(errno, "unable to fork");
        case 0:
            run_child(opt, streams);
        default:
            break;
    }

    for (int i = 1; i <= 2; i++)
        if (close(streams.pipefd[i][PIPE_IN]) != 0) error(errno, "closing pipe for fd {}", i);
    streams.redirfd[STDOUT_FILENO] = open_output(opt.stdout_filename.empty() ? "/dev/null" : opt.stdout_filename);
    streams.redirfd[STDERR_FILENO] = opt.stderr_filename.empty() ? open_output("/dev/null") : open_output(opt.stderr_filename);

    install_handlers(opt);

    sigset_t emptymask;
    sigemptyset(&emptymask);
    int status = 0;
    while (true) {
        fd_set readfds;
        FD_ZERO(&readfds);
        int nfds = -1;
        for (int i = 1; i <= 2; i++) {
            if (streams.pipefd[i][PIPE_OUT] >= 0) {
                FD_SET(streams.pipefd[i][PIPE_OUT], &readfds);
                nfds = max(nfds, streams.pipefd[i][PIPE_OUT]);
            }
        }

        int r = pselect(nfds + 1, &readfds, nullptr, nullptr, nullptr, &emptymask);
        if (r == -1 && errno != EINTR) error(errno, "waiting for child data");

        if (received_SIGCHLD || hard_timelimit) {
            pid_t pid = waitpid(child_pid, &status, WNOHANG);
            if (pid < 0) error(errno, "waiting on child");
            if (pid == child_pid) break;
            received_SIGCHLD = 0;
        }

        if (r > 0) streams.pump(opt, &readfds);
    }

    // 先杀死残留的后代进程，否则它们持有的管道永远不会关闭
    cgroup_kill(opt);

    // 取走管道中剩余的数据
    while (streams.open()) {
        fd_set readfds;
        FD_ZERO(&readfds);
        for (int i = 1; i <= 2; i++)
            if (streams.pipefd[i][PIPE_OUT] >= 0) FD_SET(streams.pipefd[i][PIPE_OUT], &readfds);
        streams.pump(opt, &readfds);
    }

    if (gettimeofday(&endtime, nullptr)) error(errno, "getting time");
    for (int i = 1; i <= 2; i++)
        if (close(streams.redirfd[i]) != 0) error(errno, "closing output fd {}", i);

    bool cpu_hard_limit = false;
    int exitcode;
    if (WIFEXITED(status)) {
        exitcode = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        int sig = WTERMSIG(status);
        if (received_signal == -1) received_signal = sig;
        exitcode = sig + 128;
        if (sig == SIGXCPU) cpu_hard_limit = true;
        LOG(INFO) << "command terminated with signal " << sig << " (" << strsignal(sig) << ")";
    } else {
        throw runtime_error(fmt::format("unknown status: {:x}", status));
    }

    cgroup_usage usage = cgroup_collect(opt);
    cgroup_delete(opt);

    double walldiff = (endtime.tv_sec - starttime.tv_sec) + (endtime.tv_usec - starttime.tv_usec) * 1E-6;

    string time_result;
    if (hard_timelimit || cpu_hard_limit)
        time_result = "hard-timelimit";
    else if ((opt.use_wall_limit && walldiff > opt.wall_limit.soft) ||
             (opt.use_cpu_limit && usage.cpu_seconds > opt.cpu_limit.soft))
        time_result = "soft-timelimit";

    string memory_result;
    if (usage.oom_killed)
        memory_result = "oom";
    else if (usage.limit_hit)
        memory_result = "limit-hit";

    vector<string> truncated;
    if (streams.data_passed[STDOUT_FILENO] < streams.data_read[STDOUT_FILENO]) truncated.push_back("stdout");
    if (streams.data_passed[STDERR_FILENO] < streams.data_read[STDERR_FILENO]) truncated.push_back("stderr");

    meta.append("exitcode", exitcode);
    if (received_signal != -1) meta.append("signal", (int)received_signal);
    meta.append("wall-time", fmt::format("{:.3f}", walldiff));
    meta.append("cpu-time", fmt::format("{:.3f}", usage.cpu_seconds));
    meta.append("memory-bytes", usage.max_memory_bytes);
    meta.append("memory-result", memory_result);
    meta.append("time-result", time_result);
    meta.append("output-truncated", boost::algorithm::join(truncated, ","));
    meta.append("stdout-bytes", streams.data_read[STDOUT_FILENO]);
    meta.append("stderr-bytes", streams.data_read[STDERR_FILENO]);

    LOG(INFO) << fmt::format("wall {:.3f}s, cpu {:.3f}s, memory {}KB{}", walldiff, usage.cpu_seconds,
                             usage.max_memory_bytes / 1024, time_result.empty() ? "" : ", " + time_result);
    return exitcode;
}
