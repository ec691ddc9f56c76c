#include "server/config.hpp"
#include <fstream>

namespace arbiter::server {
using namespace std;
using namespace nlohmann;

void from_json(const json &j, amqp &mq) {
    j.at("hostname").get_to(mq.hostname);
    if (j.count("port")) j.at("port").get_to(mq.port);
    if (j.count("username")) j.at("username").get_to(mq.username);
    if (j.count("password")) j.at("password").get_to(mq.password);
    if (j.count("vhost")) j.at("vhost").get_to(mq.vhost);
    if (j.count("exchange")) j.at("exchange").get_to(mq.exchange);
    if (j.count("exchange_type")) j.at("exchange_type").get_to(mq.exchange_type);
    j.at("queue").get_to(mq.queue);
    if (j.count("routing_key")) j.at("routing_key").get_to(mq.routing_key);
    // 默认 exchange 按队列名路由
    if (mq.routing_key.empty()) mq.routing_key = mq.queue;
}

void from_json(const json &j, database &db) {
    j.at("host").get_to(db.host);
    if (j.count("port")) j.at("port").get_to(db.port);
    j.at("user").get_to(db.user);
    j.at("password").get_to(db.password);
    j.at("database").get_to(db.database);
}

void from_json(const json &j, redis &redis_config) {
    j.at("host").get_to(redis_config.host);
    if (j.count("port")) j.at("port").get_to(redis_config.port);
    if (j.count("password")) j.at("password").get_to(redis_config.password);
    if (j.count("channel")) j.at("channel").get_to(redis_config.channel);
    if (j.count("retry_interval")) j.at("retry_interval").get_to(redis_config.retry_interval);
}

static void from_json(const json &j, retry_policy &policy) {
    if (j.count("max_attempts")) j.at("max_attempts").get_to(policy.max_attempts);
    if (j.count("initial_backoff_ms")) policy.initial_backoff = chrono::milliseconds(j.at("initial_backoff_ms").get<int64_t>());
    if (j.count("max_backoff_ms")) policy.max_backoff = chrono::milliseconds(j.at("max_backoff_ms").get<int64_t>());
}

void from_json(const json &j, system_config &config) {
    if (j.count("workers")) j.at("workers").get_to(config.workers);
    j.at("queue").get_to(config.queue);
    j.at("database").get_to(config.db);

    if (j.count("events")) {
        auto &events = j.at("events");
        if (events.count("transport")) events.at("transport").get_to(config.event_transport);
        if (events.count("redis")) config.event_redis = events.at("redis").get<redis>();
        if (events.count("amqp")) config.event_amqp = events.at("amqp").get<amqp>();
    }

    if (j.count("judge")) j.at("judge").get_to(config.judge);
    if (j.count("sandbox") && j.at("sandbox").count("kill_grace_ms"))
        j.at("sandbox").at("kill_grace_ms").get_to(config.kill_grace_ms);
    if (j.count("retry")) from_json(j.at("retry"), config.retry);
    if (j.count("contest") && j.at("contest").count("penalty_per_wrong_minutes"))
        j.at("contest").at("penalty_per_wrong_minutes").get_to(config.penalty_per_wrong_minutes);
    if (j.count("languages")) j.at("languages").get_to(config.languages);
}

system_config load_config(const string &path) {
    ifstream fin(path);
    if (!fin) throw runtime_error("unable to open config file " + path);
    try {
        return json::parse(fin).get<system_config>();
    } catch (json::exception &ex) {
        throw runtime_error("malformed config file " + path + ": " + ex.what());
    }
}

}  // namespace arbiter::server
