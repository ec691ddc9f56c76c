#pragma once

#include <filesystem>
#include <string>

namespace arbiter {

/**
 * @brief 选手程序编译及运行的根目录
 * 每次编译或运行都会在该目录下创建一个以 uuid 命名的全新目录，
 * 运行结束后立即删除，RUN_DIR 的文件结构如下：
 *
 * RUN_DIR
 * ├── 1f0e...c2 // 某个提交的编译目录
 * │   ├── src // 选手代码，如 main.cpp
 * │   └── bin // 编译产物，运行时复制进沙箱
 * ├── 7a3b...9d // 某次运行的临时目录
 * │   ├── box // 挂载到 chroot 内的 /sandbox，选手程序只能看到这个目录
 * │   ├── testdata.in // 当前数据点的输入
 * │   ├── program.out // 选手程序的 stdout 输出
 * │   ├── program.err // 选手程序的 stderr 输出
 * │   └── program.meta // runguard 写出的运行信息
 * └── ...
 */
extern std::filesystem::path RUN_DIR;

/**
 * @brief 配置好的 chroot 路径，需要包含各语言的编译器和运行时
 */
extern std::filesystem::path CHROOT_DIR;

/**
 * @brief runguard 可执行文件路径
 */
extern std::filesystem::path RUNGUARD;

/**
 * @brief 运行选手程序使用的低权限用户和用户组
 */
extern std::string RUN_USER;
extern std::string RUN_GROUP;

/**
 * @brief 是否开启 DEBUG 模式
 * 如果开启 DEBUG 模式，评测系统将不再检查程序是否在特权模式下执行，
 * 并且不会删除产生的沙箱目录，以便手动检查文件内容是否符合预期。
 */
extern bool DEBUG;

}  // namespace arbiter
