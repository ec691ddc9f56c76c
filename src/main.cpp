#include <glog/logging.h>
#include <signal.h>
#include <sys/stat.h>
#include <unistd.h>
#include <boost/lexical_cast.hpp>
#include <boost/program_options.hpp>
#include <iostream>
#include <thread>
#include "common/utils.hpp"
#include "config.hpp"
#include "judge/contest_scorer.hpp"
#include "judge/programming.hpp"
#include "monitor/monitor.hpp"
#include "sandbox/sandbox.hpp"
#include "server/config.hpp"
#include "server/mysql_store.hpp"
#include "server/rabbitmq.hpp"
#include "server/redis.hpp"
#include "server/result_sink.hpp"
#include "worker.hpp"
using namespace std;
using namespace arbiter;
namespace po = boost::program_options;

/**
 * @brief 命令行参数优先，其次是 ARBITER_ 开头的环境变量
 */
static optional<string> option_or_env(const po::variables_map &vm, const string &name, const string &env) {
    if (vm.count(name)) return vm.at(name).as<string>();
    string value = get_env(env, "");
    if (!value.empty()) return value;
    return nullopt;
}

static unique_ptr<server::event_channel> make_event_channel(const server::system_config &config) {
    if (config.event_transport == "redis") {
        CHECK(config.event_redis) << "events.redis should be configured when events.transport is redis";
        return make_unique<server::redis_event_channel>(*config.event_redis);
    } else if (config.event_transport == "amqp") {
        CHECK(config.event_amqp) << "events.amqp should be configured when events.transport is amqp";
        return make_unique<server::rabbitmq_event_channel>(*config.event_amqp);
    } else if (config.event_transport == "none") {
        return make_unique<server::local_event_channel>();
    }
    LOG(FATAL) << "Unrecognized event transport " << config.event_transport;
    return nullptr;
}

int main(int argc, char *argv[]) {
    google::InitGoogleLogging(argv[0]);

    po::options_description desc("arbiter options");
    po::variables_map vm;

    // clang-format off
    desc.add_options()
        ("config", po::value<string>(), "configuration file path. You can either pass it from environ ARBITER_CONFIG")
        ("cores", po::value<string>(), "set the cores the workers are pinned to, for example 0-3. You can either pass it from environ ARBITER_CORES")
        ("workers", po::value<string>(), "number of submissions judged concurrently, defaults to the number of cores. You can either pass it from environ ARBITER_WORKERS")
        ("run-dir", po::value<string>(), "set the directory to compile and run user programs. You can either pass it from environ ARBITER_RUN_DIR")
        ("chroot-dir", po::value<string>(), "set the chroot directory. You can either pass it from environ ARBITER_CHROOT_DIR")
        ("runguard", po::value<string>(), "set the path of runguard executable. You can either pass it from environ ARBITER_RUNGUARD")
        ("run-user", po::value<string>(), "set run user. You can either pass it from environ ARBITER_RUN_USER")
        ("run-group", po::value<string>(), "set run group. You can either pass it from environ ARBITER_RUN_GROUP")
        ("debug", "turn on the debug mode to disable checking whether it is in privileged mode, and not to delete working directories to check the validity of result files.")
        ("help", "display this help text")
        ("version", "display version of this application");
    // clang-format on

    try {
        po::store(po::command_line_parser(argc, argv).options(desc).run(), vm);
        po::notify(vm);
    } catch (po::error &e) {
        cerr << e.what() << endl
             << endl;
        cerr << desc << endl;
        return EXIT_FAILURE;
    }

    if (vm.count("help")) {
        cout << "arbiter: Fetch submissions from the job queue, judge them and record the verdicts" << endl
             << "This app requires root privilege" << endl
             << "Usage: " << argv[0] << " --config <file> [options]" << endl;
        cout << desc << endl;
        return EXIT_SUCCESS;
    }

    if (vm.count("version")) {
        cout << "arbiter 1.0" << endl;
        return EXIT_SUCCESS;
    }

    if (vm.count("debug") || getenv("ARBITER_DEBUG")) {
        DEBUG = true;
        FLAGS_v = 1;
    }

    if (getuid() != 0) {
        cerr << "You should run this program in privileged mode" << endl;
        if (!DEBUG) return EXIT_FAILURE;
    }

    auto config_path = option_or_env(vm, "config", "ARBITER_CONFIG");
    if (!config_path) {
        cerr << "Configuration file should be specified by --config or ARBITER_CONFIG" << endl;
        return EXIT_FAILURE;
    }

    server::system_config config;
    try {
        config = server::load_config(*config_path);
    } catch (std::exception &e) {
        LOG(ERROR) << e.what();
        return EXIT_FAILURE;
    }

    if (auto dir = option_or_env(vm, "run-dir", "ARBITER_RUN_DIR")) RUN_DIR = *dir;
    if (auto dir = option_or_env(vm, "chroot-dir", "ARBITER_CHROOT_DIR")) CHROOT_DIR = *dir;
    if (auto path = option_or_env(vm, "runguard", "ARBITER_RUNGUARD")) RUNGUARD = *path;
    if (auto user = option_or_env(vm, "run-user", "ARBITER_RUN_USER")) RUN_USER = *user;
    if (auto group = option_or_env(vm, "run-group", "ARBITER_RUN_GROUP")) RUN_GROUP = *group;

    filesystem::create_directories(RUN_DIR);
    CHECK(filesystem::is_directory(RUN_DIR))
        << "Run directory " << RUN_DIR << " does not exist";
    CHECK(filesystem::is_directory(CHROOT_DIR))
        << "Chroot directory " << CHROOT_DIR << " does not exist";
    CHECK(filesystem::exists(RUNGUARD))
        << "runguard executable " << RUNGUARD << " does not exist";

    vector<size_t> cores;
    if (auto list = option_or_env(vm, "cores", "ARBITER_CORES")) {
        try {
            cores = parse_cpu_list(*list);
        } catch (std::invalid_argument &e) {
            cerr << e.what() << endl;
            return EXIT_FAILURE;
        }
    }

    dispatcher_options options;
    options.workers = cores.empty() ? config.workers : cores.size();
    if (auto workers = option_or_env(vm, "workers", "ARBITER_WORKERS")) {
        try {
            options.workers = boost::lexical_cast<size_t>(*workers);
        } catch (boost::bad_lexical_cast &) {
            cerr << "Invalid worker count " << *workers << endl;
            return EXIT_FAILURE;
        }
    }
    if (options.workers == 0) {
        cerr << "At least one worker is required" << endl;
        return EXIT_FAILURE;
    }
    options.retry = config.retry;
    if (!cores.empty())
        for (size_t i = 0; i < options.workers; ++i)
            options.cpusets.push_back(to_string(cores[i % cores.size()]));

    // 让评测系统写入的数据只允许当前用户写入
    umask(0022);

    // 信号只由主线程处理，其他线程继承这个屏蔽字
    sigset_t signals;
    sigemptyset(&signals);
    sigaddset(&signals, SIGINT);
    sigaddset(&signals, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &signals, nullptr);

    sandbox_options box_options;
    box_options.runguard = RUNGUARD;
    box_options.run_dir = RUN_DIR;
    box_options.chroot_dir = CHROOT_DIR;
    box_options.run_user = RUN_USER;
    box_options.run_group = RUN_GROUP;
    box_options.kill_grace_ms = config.kill_grace_ms;
    box_options.keep_scratch = DEBUG;
    runguard_sandbox box(box_options);

    language_table languages = language_table::defaults();
    for (auto &lang : config.languages) languages.add(lang);

    judge_options judge = config.judge;
    judge.work_dir = RUN_DIR;
    judge.keep_work_dir = DEBUG;
    programming_judger judger(box, languages, judge);

    unique_ptr<server::rabbitmq_job_queue> queue;
    unique_ptr<server::mysql_store> store;
    unique_ptr<server::event_channel> events;
    try {
        queue = make_unique<server::rabbitmq_job_queue>(config.queue, (uint16_t)options.workers);
        store = make_unique<server::mysql_store>(config.db);
        events = make_event_channel(config);
    } catch (std::exception &e) {
        LOG(ERROR) << "Unable to connect to external services: " << e.what();
        return EXIT_FAILURE;
    }

    contest_scorer scorer(config.penalty_per_wrong_minutes);
    server::result_sink sink(*store, *events, scorer, config.retry);
    log_monitor mon;

    dispatcher dispatch(*queue, *store, judger, sink, mon, options);
    auto threads = dispatch.start();
    if (!cores.empty()) {
        // 每个 worker 绑定到一个 CPU 核心上
        for (size_t i = 0; i < threads.size(); ++i)
            pin_thread(*threads[i], cores[i % cores.size()]);
    }

    int signum = 0;
    sigwait(&signals, &signum);
    LOG(WARNING) << "Received signal " << signum << ", stopping workers";
    dispatch.stop();
    dispatch.join();
    LOG(INFO) << "All workers stopped";

    return EXIT_SUCCESS;
}
