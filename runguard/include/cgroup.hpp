#pragma once

#include <cstdint>
#include <exception>
#include <string>

struct cgroup;
struct cgroup_controller;

struct cgroup_exception : public std::exception {
    cgroup_exception(const std::string &cgroup_op, int err);

    const char *what() const noexcept override;

    static void ensure(const std::string &cgroup_op, int err);

private:
    std::string errmsg;
};

/**
 * @brief cgroup 中的一个 controller，如 memory、cpuacct、cpuset
 */
struct cgroup_ctrl {
    struct cgroup_controller *ctrl;

    void add_value(const std::string &name, int64_t value);

    void add_value(const std::string &name, const std::string &value);

    int64_t get_value_int64(const std::string &name);
};

/**
 * @brief libcgroup 中 struct cgroup 的 RAII 包装
 * 构造时只在内存中描述 cgroup，create_cgroup 才会写入内核
 */
struct cgroup_guard {
    explicit cgroup_guard(const std::string &cgroup_name);
    cgroup_guard(const cgroup_guard &) = delete;
    ~cgroup_guard();

    cgroup_guard &operator=(const cgroup_guard &) = delete;

    void create_cgroup(int ignore_ownership);

    /**
     * @throw cgroup_exception 当创建失败时
     */
    cgroup_ctrl add_controller(const std::string &name);

    /**
     * @brief 获得已添加的或者 get_cgroup 从内核读入的 controller
     * @throw cgroup_exception 当 controller 不存在时
     */
    cgroup_ctrl get_controller(const std::string &name);

    /**
     * @brief 从内核中读入 cgroup 的所有 controller 和参数
     */
    void get_cgroup();

    /**
     * @brief 将当前进程移入本 cgroup
     */
    void attach_task();

    /**
     * @brief 从内核中删除这个 cgroup，包括所有子 cgroup
     */
    void delete_cgroup();

    static void init();

private:
    struct cgroup *cg;
};
