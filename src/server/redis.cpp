#include "server/redis.hpp"
#include <glog/logging.h>
#include <thread>
#include "common/exceptions.hpp"

namespace arbiter::server {
using namespace std;

static bool connect_to_server(cpp_redis::client &redis_client, const redis &redis_config) {
    LOG(INFO) << "Redis: Setup connection with server " << redis_config.host << ":" << redis_config.port;
    try {
        redis_client.connect(redis_config.host, redis_config.port,
                             [](const string &host, size_t port, cpp_redis::connect_state status) {
                                 if (status == cpp_redis::connect_state::dropped)
                                     LOG(INFO) << "Redis: client disconnected from " << host << ":" << port;
                             });
    } catch (cpp_redis::redis_error &e) {
        LOG(ERROR) << "Redis: " << e.what();
        return false;
    }
    if (!redis_config.password.empty()) {
        LOG(INFO) << "Redis: Trying to Auth";
        auto future = redis_client.auth(redis_config.password);
        redis_client.sync_commit();
        LOG(INFO) << "Redis: Auth Reply: " << future.get();
    }
    if (redis_client.is_connected()) {
        LOG(INFO) << "Redis: Connecting to redis server succeeded " << redis_config.host << ":" << redis_config.port;
        return true;
    } else {
        LOG(ERROR) << "Redis: Unable to connect to redis server " << redis_config.host << ":" << redis_config.port;
        return false;
    }
}

redis_conn::redis_conn(const redis &redis_config)
    : redis_config(redis_config) {}

void redis_conn::reconnect(bool force) {
    int fail = 0;
    if (force)
        connect_to_server(redis_client, redis_config);
    for (; !redis_client.is_connected() && fail < 5; ++fail) {
        LOG(INFO) << "Redis: Lost connection, trying to reconnect";
        if (fail > 0)
            this_thread::sleep_for(chrono::milliseconds(redis_config.retry_interval));
        connect_to_server(redis_client, redis_config);
    }
    if (fail >= 5)
        throw network_error("Redis: unable to connect to redis server");
}

void redis_conn::execute(const function<void(cpp_redis::client &, vector<future<cpp_redis::reply>> &)> &callback) {
    lock_guard<mutex> guard(mut);
    // cpp_redis 的 is_connected 在连接断开后仍可能为真，操作失败时强制重连
    reconnect(false);
    string message;
    for (int fail = 0; fail < 5; ++fail) {
        bool reconn = false;
        vector<future<cpp_redis::reply>> replies;
        callback(redis_client, replies);
        redis_client.sync_commit();
        for (auto &reply : replies) {  // 阻塞到所有操作完成为止
            cpp_redis::reply r = reply.get();
            if (!r.ok()) reconn = true, message = r.error();
        }
        if (!reconn) return;
        reconnect(true);
    }
    throw network_error("Redis: unable to finish execution: " + message);
}

redis_event_channel::redis_event_channel(const redis &redis_config)
    : channel(redis_config.channel), conn(redis_config) {}

void redis_event_channel::publish(const status_event &event) {
    string message = nlohmann::json(event).dump();
    conn.execute([&](cpp_redis::client &client, vector<future<cpp_redis::reply>> &replies) {
        replies.push_back(client.publish(channel, message));
    });
    DLOG(INFO) << "Redis: published " << message << " to " << channel;
}

}  // namespace arbiter::server
