#include "limits.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <grp.h>
#include <libcgroup.h>
#include <math.h>
#include <sched.h>
#include <seccomp.h>
#include <signal.h>
#include <sys/mount.h>
#include <sys/resource.h>
#include <sys/stat.h>
#include <unistd.h>
#include <filesystem>
#include <fstream>
#include <system_error>
#include "cgroup.hpp"

using namespace std;

static void ensure(int ret, const string &what) {
    if (ret != 0) throw system_error(errno, generic_category(), what);
}

void cgroup_create(const runguard_options &opt) {
    cgroup_guard cg(opt.cgroupname);

    cgroup_ctrl memory = cg.add_controller("memory");
    if (opt.memory_limit > 0) {
        // 将 RAM 和 RAM+交换 的大小限制设为一样可以强制不发生交换
        memory.add_value("memory.limit_in_bytes", opt.memory_limit);
        memory.add_value("memory.memsw.limit_in_bytes", opt.memory_limit);
    }

    if (!opt.cpuset.empty()) {
        cgroup_ctrl cpuset = cg.add_controller("cpuset");
        cpuset.add_value("cpuset.mems", string("0"));
        cpuset.add_value("cpuset.cpus", opt.cpuset);
    }

    cg.add_controller("cpuacct");
    cg.create_cgroup(1);
}

void cgroup_attach(const runguard_options &opt) {
    cgroup_guard cg(opt.cgroupname);
    cg.get_cgroup();
    cg.attach_task();
}

cgroup_usage cgroup_collect(const runguard_options &opt) {
    cgroup_usage usage;
    cgroup_guard cg(opt.cgroupname);
    cg.get_cgroup();

    cgroup_ctrl memory = cg.get_controller("memory");
    usage.max_memory_bytes = memory.get_value_int64("memory.max_usage_in_bytes");
    usage.limit_hit = memory.get_value_int64("memory.failcnt") > 0;

    cgroup_ctrl cpuacct = cg.get_controller("cpuacct");
    usage.cpu_seconds = (double)cpuacct.get_value_int64("cpuacct.usage") / 1e9;

    // libcgroup 无法读出 memory.oom_control 中的多个键值，直接读取 cgroupfs
    char *mount_point = nullptr;
    if (cgroup_get_subsys_mount_point("memory", &mount_point) == 0 && mount_point) {
        ifstream fin(string(mount_point) + opt.cgroupname + "/memory.oom_control");
        free(mount_point);
        string key;
        int64_t value;
        while (fin >> key >> value)
            if (key == "oom_kill" && value > 0)
                usage.oom_killed = true;
    }
    return usage;
}

void cgroup_kill(const runguard_options &opt) {
    void *handle = nullptr;
    pid_t pid;
    int ret = cgroup_get_task_begin(opt.cgroupname.c_str(), "memory", &handle, &pid);
    while (ret == 0) {
        kill(pid, SIGKILL);
        ret = cgroup_get_task_next(&handle, &pid);
    }
    cgroup_get_task_end(&handle);
}

void cgroup_delete(const runguard_options &opt) {
    cgroup_guard cg(opt.cgroupname);
    cg.add_controller("cpuacct");
    cg.add_controller("memory");
    if (!opt.cpuset.empty())
        cg.add_controller("cpuset");
    cg.delete_cgroup();
}

void isolate(const runguard_options &opt) {
    /*
     * CLONE_FILES：不共享调用者打开的文件描述符表
     * CLONE_NEWIPC：受控程序无法与主机进程进行进程间通信
     * CLONE_NEWNET：新的网络命名空间中只有未启用的 lo，受控程序无法访问网络
     * CLONE_NEWNS：新的挂载命名空间，下面的 bind mount 只对受控程序可见
     * CLONE_NEWPID：受控程序看不到主机的进程，也无法向它们发送信号
     * CLONE_NEWUTS：隔离 hostname
     */
    int flags = CLONE_FILES | CLONE_FS | CLONE_NEWIPC | CLONE_NEWNS | CLONE_NEWPID | CLONE_NEWUTS | CLONE_SYSVSEM;
    if (!opt.allow_network) flags |= CLONE_NEWNET;
    ensure(unshare(flags), "unshare");

    if (opt.chroot_dir.empty() || opt.bind_dir.empty()) return;

    // 不让挂载事件传播回主机的挂载命名空间
    ensure(mount(nullptr, "/", nullptr, MS_REC | MS_PRIVATE, nullptr), "making / private");

    filesystem::path target = filesystem::path(opt.chroot_dir) / filesystem::path(opt.sandbox_dir).relative_path();
    filesystem::create_directories(target);
    ensure(mount(opt.bind_dir.c_str(), target.c_str(), nullptr, MS_BIND, nullptr),
           fmt::format("bind mounting {} to {}", opt.bind_dir, target.string()));
    ensure(mount(nullptr, target.c_str(), nullptr, MS_REMOUNT | MS_BIND | MS_NOSUID | MS_NODEV, nullptr),
           fmt::format("remounting {}", target.string()));
}

static void set_rlimit(int resource, rlim_t cur, rlim_t max) {
    struct rlimit lim;
    lim.rlim_cur = cur;
    lim.rlim_max = max;
    ensure(setrlimit(resource, &lim), "setrlimit");
}

void set_restrictions(const runguard_options &opt) {
    clearenv();
    setenv("PATH", "/usr/local/bin:/usr/bin:/bin", true);
    for (auto &entry : opt.env) {
        auto idx = entry.find('=');
        if (idx == string::npos) continue;
        setenv(entry.substr(0, idx).c_str(), entry.substr(idx + 1).c_str(), true);
    }

    if (opt.use_cpu_limit) {
        // 到达软限制时内核发送 SIGXCPU，硬限制时发送 SIGKILL
        rlim_t cputime_limit = (rlim_t)ceil(opt.cpu_limit.hard);
        set_rlimit(RLIMIT_CPU, cputime_limit, cputime_limit + 1);
    }

    // 内存限制由 cgroup 负责
    set_rlimit(RLIMIT_AS, RLIM_INFINITY, RLIM_INFINITY);
    set_rlimit(RLIMIT_DATA, RLIM_INFINITY, RLIM_INFINITY);
    set_rlimit(RLIMIT_STACK, RLIM_INFINITY, RLIM_INFINITY);

    if (opt.file_limit > 0) set_rlimit(RLIMIT_FSIZE, opt.file_limit, opt.file_limit + 1);
    if (opt.nproc > 0) set_rlimit(RLIMIT_NPROC, opt.nproc, opt.nproc);
    if (opt.no_core_dumps) set_rlimit(RLIMIT_CORE, 0, 0);

    cgroup_attach(opt);

    // 独立的进程组，看门狗可以一次性杀死受控程序及其所有子进程
    if (setsid() == -1)
        throw system_error(errno, generic_category(), "unable to setsid");

    if (!opt.chroot_dir.empty()) {
        ensure(chroot(opt.chroot_dir.c_str()), fmt::format("unable to chroot to {}", opt.chroot_dir));
        ensure(chdir("/"), "unable to chdir to / in chroot");
        if (!opt.bind_dir.empty())
            ensure(chdir(opt.sandbox_dir.c_str()), fmt::format("unable to chdir to {}", opt.sandbox_dir));
    } else if (!opt.bind_dir.empty()) {
        ensure(chdir(opt.bind_dir.c_str()), fmt::format("unable to chdir to {}", opt.bind_dir));
    }

    if (opt.group_id >= 0) {
        ensure(setgid(opt.group_id), "unable to set group id");
        gid_t aux_groups[1] = {(gid_t)opt.group_id};
        ensure(setgroups(1, aux_groups), "unable to clear auxiliary groups");
    }

    if (opt.user_id >= 0)
        ensure(setuid(opt.user_id), "unable to set user id");
    else
        ensure(setuid(getuid()), "unable to reset user id");

    if (geteuid() == 0 || getuid() == 0)
        throw runtime_error("you cannot run user command as root");
}

static const int DENIED_SYSCALLS[] = {
    SCMP_SYS(mount), SCMP_SYS(umount2), SCMP_SYS(pivot_root), SCMP_SYS(chroot),
    SCMP_SYS(setns), SCMP_SYS(unshare), SCMP_SYS(ptrace), SCMP_SYS(process_vm_readv),
    SCMP_SYS(process_vm_writev), SCMP_SYS(reboot), SCMP_SYS(kexec_load), SCMP_SYS(init_module),
    SCMP_SYS(finit_module), SCMP_SYS(delete_module), SCMP_SYS(swapon), SCMP_SYS(swapoff),
    SCMP_SYS(acct), SCMP_SYS(settimeofday), SCMP_SYS(clock_settime), SCMP_SYS(bpf),
    SCMP_SYS(perf_event_open), SCMP_SYS(keyctl), SCMP_SYS(add_key), SCMP_SYS(request_key)};

void set_seccomp(const runguard_options &opt) {
    if (!opt.syscall_filter) return;

    scmp_filter_ctx ctx = seccomp_init(SCMP_ACT_ALLOW);
    if (!ctx) throw runtime_error("unable to initialize seccomp");
    for (int syscall : DENIED_SYSCALLS) {
        int ret = seccomp_rule_add(ctx, SCMP_ACT_KILL, syscall, 0);
        if (ret < 0) {
            seccomp_release(ctx);
            throw system_error(-ret, generic_category(), fmt::format("unable to add seccomp rule for syscall {}", syscall));
        }
    }
    int ret = seccomp_load(ctx);
    seccomp_release(ctx);
    if (ret < 0) throw system_error(-ret, generic_category(), "unable to load seccomp filter");
}
