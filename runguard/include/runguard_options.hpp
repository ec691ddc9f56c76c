#pragma once

#include <cstdint>
#include <limits>
#include <string>
#include <vector>

struct time_limit {
    double soft, hard;
};

struct runguard_options {
    std::string cgroupname;

    /**
     * @brief chroot 根目录，需要预先装好编译器和运行时
     */
    std::string chroot_dir;

    /**
     * @brief 本次运行的临时目录，会被 bind mount 到 chroot 内的 sandbox_dir
     */
    std::string bind_dir;

    /**
     * @brief bind_dir 在 chroot 内的挂载点，同时也是子进程的工作路径
     */
    std::string sandbox_dir = "/sandbox";

    size_t nproc = 0;
    int user_id = -1;
    int group_id = -1;
    std::string cpuset;

    bool use_wall_limit = false;
    struct time_limit wall_limit;  // wall clock time
    bool use_cpu_limit = false;
    struct time_limit cpu_limit;  // CPU time

    int64_t memory_limit = -1;  // bytes
    int64_t file_limit = -1;    // bytes
    int64_t stream_size = -1;   // bytes
    bool no_core_dumps = false;
    bool allow_network = false;

    /**
     * @brief 是否加载 seccomp 过滤器
     */
    bool syscall_filter = true;

    std::string stdin_filename;
    std::string stdout_filename;
    std::string stderr_filename;

    std::vector<std::string> env;

    std::string metafile_path;
    std::vector<std::string> command;
};
