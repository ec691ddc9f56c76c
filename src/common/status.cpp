#include "common/status.hpp"
#include <boost/assign.hpp>
#include <unordered_map>

namespace arbiter {
using namespace std;

// clang-format off
static const unordered_map<status, const char *> status_string = boost::assign::map_list_of
    (status::PENDING, "Pending")
    (status::COMPILING, "Compiling")
    (status::JUDGING, "Judging")
    (status::ACCEPTED, "Accepted")
    (status::WRONG_ANSWER, "Wrong Answer")
    (status::TIME_LIMIT_EXCEEDED, "Time Limit Exceeded")
    (status::MEMORY_LIMIT_EXCEEDED, "Memory Limit Exceeded")
    (status::RUNTIME_ERROR, "Runtime Error")
    (status::COMPILATION_ERROR, "Compilation Error")
    (status::INTERNAL_ERROR, "Internal Error");
// clang-format on

const char *get_display_message(status stat) {
    return status_string.at(stat);
}

optional<status> parse_status(const string &name) {
    for (auto &[stat, display] : status_string)
        if (name == display)
            return stat;
    return nullopt;
}

bool is_terminal(status stat) {
    return stat != status::PENDING && stat != status::COMPILING && stat != status::JUDGING;
}

bool is_user_caused(status stat) {
    switch (stat) {
        case status::WRONG_ANSWER:
        case status::TIME_LIMIT_EXCEEDED:
        case status::MEMORY_LIMIT_EXCEEDED:
        case status::RUNTIME_ERROR:
        case status::COMPILATION_ERROR:
            return true;
        default:
            return false;
    }
}

}  // namespace arbiter
