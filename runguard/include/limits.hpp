#pragma once

#include "runguard_options.hpp"

/**
 * @brief 受控程序的资源使用统计，从 cgroup 中读出
 */
struct cgroup_usage {
    int64_t max_memory_bytes = 0;
    double cpu_seconds = 0;
    bool oom_killed = false;

    /**
     * @brief 内存使用曾经触及上限（不一定被 OOM killer 杀死）
     */
    bool limit_hit = false;
};

/**
 * @brief 创建 cgroup 并设置内存上限、CPU 核心
 * 内存和内存+交换区的上限设为相同以禁止交换
 */
void cgroup_create(const runguard_options &opt);

/**
 * @brief 将当前进程移入 cgroup，只在子进程中调用
 */
void cgroup_attach(const runguard_options &opt);

/**
 * @brief 读取 cgroup 中的内存峰值、CPU 时间以及是否发生 OOM
 */
cgroup_usage cgroup_collect(const runguard_options &opt);

/**
 * @brief 杀死 cgroup 内的所有进程，确保受控程序 fork 出的进程不会留驻
 */
void cgroup_kill(const runguard_options &opt);

void cgroup_delete(const runguard_options &opt);

/**
 * @brief 分离命名空间并将 bind_dir 挂载到 chroot 内
 * 在 fork 之前调用，子进程继承新的命名空间
 */
void isolate(const runguard_options &opt);

/**
 * @brief 在子进程中设置 rlimit、cgroup、chroot 并降权
 */
void set_restrictions(const runguard_options &opt);

/**
 * @brief 加载 seccomp 过滤器，受控程序调用挂载、调试、内核模块等系统调用时会被杀死
 * 必须在降权之后、execvp 之前调用
 */
void set_seccomp(const runguard_options &opt);
