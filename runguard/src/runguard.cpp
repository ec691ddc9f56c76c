#include <glog/logging.h>
#include <math.h>
#include <boost/lexical_cast.hpp>
#include <boost/program_options.hpp>
#include <iostream>
#include "run.hpp"
#include "utils.hpp"

using namespace std;

void validate(boost::any &v, const vector<string> &values, struct time_limit *, int) {
    using namespace boost::program_options;
    validators::check_first_occurrence(v);

    struct time_limit result;
    string const &s = validators::get_single_string(values);
    auto colon = s.find(':');
    string left = s.substr(0, colon);
    string right = colon < s.size() ? s.substr(colon + 1) : "";

    try {
        result.soft = boost::lexical_cast<double>(left);
        result.hard = right.empty() ? result.soft : boost::lexical_cast<double>(right);
    } catch (boost::bad_lexical_cast &) {
        throw validation_error(validation_error::invalid_option_value);
    }

    if (result.hard < result.soft || !isfinite(result.hard) || !isfinite(result.soft) || result.soft < 0)
        throw validation_error(validation_error::invalid_option_value);

    v = result;
}

static int64_t kilobytes(const boost::program_options::variables_map &vm, const char *key) {
    return (int64_t)vm[key].as<size_t>() * 1024;
}

int main(int argc, const char *argv[]) {
    google::InitGoogleLogging(argv[0]);

    namespace po = boost::program_options;
    po::options_description desc("runguard options");
    po::positional_options_description pos;
    po::variables_map vm;

    struct runguard_options opt;

    // clang-format off
    desc.add_options()
        ("root,r", po::value<string>(), "run command with root directory set to root")
        ("bind,b", po::value<string>(), "mount this directory at the sandbox directory inside root, used as working directory")
        ("sandbox-dir", po::value<string>()->default_value("/sandbox"), "mount point of the bound directory inside root")
        ("user,u", po::value<string>(), "run command as user with username or user id")
        ("group,g", po::value<string>(), "run command under group with groupname or group id")
        ("wall-time,T", po::value<time_limit>(), "soft:hard wall clock limit in seconds, the command is killed at the hard limit")
        ("cpu-time,t", po::value<time_limit>(), "soft:hard CPU time limit in seconds")
        ("memory-limit,m", po::value<size_t>(), "maximum memory of the command in KB, enforced by cgroup")
        ("file-limit,f", po::value<size_t>(), "maximum size of a file created by the command in KB")
        ("nproc,p", po::value<size_t>(), "maximum number of processes")
        ("cpuset,P", po::value<string>(), "processor IDs the command may use (e.g. \"0,2-3\")")
        ("no-core-dumps", "disable core dumps")
        ("allow-network", "keep the network namespace of the caller")
        ("no-syscall-filter", "do not load the seccomp filter")
        ("standard-input-file,i", po::value<string>(), "redirect command standard input from file")
        ("standard-output-file,o", po::value<string>(), "redirect command standard output to file")
        ("standard-error-file,e", po::value<string>(), "redirect command standard error to file")
        ("stream-size,s", po::value<size_t>(), "truncate command output streams at the size in KB")
        ("variable,V", po::value<vector<string>>(), "additional environment variables (e.g. -Vkey1=value1)")
        ("out-meta,M", po::value<string>(), "write run time, exitcode, memory usage to file")
        ("cmd", po::value<vector<string>>()->composing()->required(), "command")
        ("help", "display this help text");
    // clang-format on

    pos.add("cmd", -1);

    try {
        po::store(po::command_line_parser(argc, argv).options(desc).positional(pos).run(), vm);
        if (vm.count("help")) {
            cout << "Usage: " << argv[0] << " [options] -- command" << endl
                 << desc << endl;
            return 0;
        }
        po::notify(vm);
    } catch (po::error &e) {
        cerr << e.what() << endl
             << endl
             << desc << endl;
        return 1;
    }

    try {
        if (vm.count("root")) opt.chroot_dir = vm["root"].as<string>();
        if (vm.count("bind")) opt.bind_dir = vm["bind"].as<string>();
        opt.sandbox_dir = vm["sandbox-dir"].as<string>();

        if (vm.count("user")) {
            string user = vm["user"].as<string>();
            opt.user_id = is_number(user) ? boost::lexical_cast<int>(user) : get_userid(user);
        }
        if (vm.count("group")) {
            string group = vm["group"].as<string>();
            opt.group_id = is_number(group) ? boost::lexical_cast<int>(group) : get_groupid(group);
        } else if (opt.user_id >= 0) {
            opt.group_id = opt.user_id;
        }
    } catch (exception &e) {
        cerr << e.what() << endl;
        return 1;
    }

    if (vm.count("wall-time")) opt.use_wall_limit = true, opt.wall_limit = vm["wall-time"].as<time_limit>();
    if (vm.count("cpu-time")) opt.use_cpu_limit = true, opt.cpu_limit = vm["cpu-time"].as<time_limit>();
    if (vm.count("memory-limit")) opt.memory_limit = kilobytes(vm, "memory-limit");
    if (vm.count("file-limit")) opt.file_limit = kilobytes(vm, "file-limit");
    if (vm.count("stream-size")) opt.stream_size = kilobytes(vm, "stream-size");
    if (vm.count("nproc")) opt.nproc = vm["nproc"].as<size_t>();
    if (vm.count("cpuset")) opt.cpuset = vm["cpuset"].as<string>();
    if (vm.count("no-core-dumps")) opt.no_core_dumps = true;
    if (vm.count("allow-network")) opt.allow_network = true;
    if (vm.count("no-syscall-filter")) opt.syscall_filter = false;
    if (vm.count("standard-input-file")) opt.stdin_filename = vm["standard-input-file"].as<string>();
    if (vm.count("standard-output-file")) opt.stdout_filename = vm["standard-output-file"].as<string>();
    if (vm.count("standard-error-file")) opt.stderr_filename = vm["standard-error-file"].as<string>();
    if (vm.count("variable")) opt.env = vm["variable"].as<vector<string>>();
    if (vm.count("out-meta")) opt.metafile_path = vm["out-meta"].as<string>();
    opt.command = vm["cmd"].as<vector<string>>();

    return runit(opt);
}
