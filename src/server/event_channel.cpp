#include "server/event_channel.hpp"

namespace arbiter::server {
using namespace std;

event_channel::~event_channel() {}

void local_event_channel::subscribe(subscriber callback) {
    lock_guard<mutex> guard(mut);
    subscribers.push_back(move(callback));
}

void local_event_channel::publish(const status_event &event) {
    vector<subscriber> targets;
    {
        lock_guard<mutex> guard(mut);
        targets = subscribers;
    }
    for (auto &callback : targets) callback(event);
}

}  // namespace arbiter::server
