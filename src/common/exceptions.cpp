#include "common/exceptions.hpp"
#include <boost/exception/diagnostic_information.hpp>
#include <filesystem>
#include <system_error>

namespace arbiter {
using namespace std;

judge_exception::judge_exception()
    : judge_exception("") {}

judge_exception::judge_exception(const string &message)
    : message(message), stacktrace(make_shared<boost::stacktrace::stacktrace>()) {}

const char *judge_exception::what() const noexcept {
    return message.c_str();
}

std::ostream &operator<<(std::ostream &os, const judge_exception &ex) {
    os << boost::diagnostic_information(ex) << endl << *ex.stacktrace;
    return os;
}

internal_error::internal_error()
    : judge_exception() {}

internal_error::internal_error(const string &message)
    : judge_exception(message) {}

sandbox_error::sandbox_error()
    : internal_error() {}

sandbox_error::sandbox_error(const string &message)
    : internal_error(message) {}

network_error::network_error()
    : judge_exception() {}

network_error::network_error(const string &message)
    : judge_exception(message) {}

database_error::database_error()
    : judge_exception() {}

database_error::database_error(const string &message)
    : judge_exception(message) {}

malformed_job_error::malformed_job_error()
    : judge_exception() {}

malformed_job_error::malformed_job_error(const string &message)
    : judge_exception(message) {}

bool is_infrastructure_error(const exception &ex) {
    return dynamic_cast<const internal_error *>(&ex) ||
           dynamic_cast<const network_error *>(&ex) ||
           dynamic_cast<const database_error *>(&ex) ||
           dynamic_cast<const std::system_error *>(&ex) ||
           dynamic_cast<const std::filesystem::filesystem_error *>(&ex);
}

}  // namespace arbiter
