#include "common/utils.hpp"
#include <sys/wait.h>
#include <unistd.h>
#include <csignal>
#include <sstream>
#include <system_error>
using namespace std;

int exec_program(const map<string, string> &env, const char **argv) {
    pid_t pid;
    switch (pid = fork()) {
        case -1:  // fork 失败
            throw system_error(errno, system_category(), "fork");
        case 0:  // 子进程
            // 避免子进程被终止，要求父进程处理中断信号
            signal(SIGINT, SIG_IGN);
            for (auto &[key, value] : env)
                set_env(key, value);
            execvp(argv[0], (char **)argv);
            _exit(EXIT_FAILURE);
        default:  // 父进程
            int status;
            while (waitpid(pid, &status, 0) < 0)
                if (errno != EINTR)
                    throw system_error(errno, system_category(), "waitpid");
            if (WIFEXITED(status))
                return WEXITSTATUS(status);
            else
                return -1;
    }
}

int call_process(const vector<string> &args, const map<string, string> &env) {
    vector<const char *> argv;
    for (auto &arg : args)
        argv.push_back(arg.c_str());
    argv.push_back(nullptr);

#ifndef NDEBUG
    stringstream ss;
    for (auto &arg : args)
        ss << arg << ' ';
    DLOG(INFO) << ss.str();
#endif

    return exec_program(env, argv.data());
}

string get_env(const string &key, const string &def_value) {
    char *result = getenv(key.c_str());
    return !result ? def_value : string(result);
}

void set_env(const string &key, const string &value, bool replace) {
    setenv(key.c_str(), value.c_str(), replace);
}

string truncate_message(const string &message, size_t limit) {
    static const string suffix = "\n... (truncated)";
    if (message.size() <= limit) return message;
    if (limit <= suffix.size()) return message.substr(0, limit);
    return message.substr(0, limit - suffix.size()) + suffix;
}

elapsed_time::elapsed_time() {
    start = chrono::steady_clock::now();
}
