#pragma once

#include "runguard_options.hpp"

/**
 * @brief 根据传入的设置运行指定的程序
 * @note 该函数必须在 main 函数最后调用
 * 1. 创建 cgroup，限制内存和 CPU 核心
 * 2. 分离 IPC、NET、NS、UTS、PID 命名空间，将临时目录挂载到 chroot 内
 * 3. fork 子进程
 *    1. 子进程设置 rlimit、加入 cgroup、setsid、chroot、降权后 exec
 *    2. 父进程通过 setitimer 实现硬时钟时间限制，到时杀死整个进程组，
 *       并通过管道转存子进程的 stdout/stderr，超过 stream_size 的部分丢弃
 * 4. 读取 cgroup 的监测数据，得到 CPU 时间、内存峰值、是否 OOM
 * 5. 杀死 cgroup 内残留的进程，删除 cgroup，将结果写入 meta 文件
 * @return 受控程序的返回值，因信号终止时为 128 + 信号编号
 */
int runit(struct runguard_options opt);
