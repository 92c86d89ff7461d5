#include "events/publisher.hpp"
#include <glog/logging.h>

namespace codebox {
using namespace std;

void to_json(nlohmann::json &j, const event &e) {
    j = {{"event", e.name}, {"room", nullptr}, {"data", e.payload}};
    if (e.room) j["room"] = *e.room;
}

event session_event(const string &session_id, const string &status, const string &language, const nlohmann::json &extra) {
    event e;
    e.name = "compiler:session:update";
    e.payload = {{"sessionId", session_id}, {"status", status}, {"language", language}};
    for (auto &[key, value] : extra.items())
        e.payload[key] = value;
    return e;
}

event submission_event(const string &user_id, const string &submission_id, const string &status) {
    event e;
    e.name = "compiler:submission:update";
    e.room = "user:" + user_id;
    e.payload = {{"submissionId", submission_id}, {"status", status}};
    return e;
}

string log_event_sink::name() const {
    return "log";
}

void log_event_sink::publish(const event &e) {
    LOG(INFO) << "Event " << e.name << (e.room ? " to " + *e.room : string()) << ": " << e.payload.dump();
}

redis_event_sink::redis_event_sink(server::redis_conn &conn, string channel)
    : conn(conn), channel(move(channel)) {}

string redis_event_sink::name() const {
    return "redis";
}

void redis_event_sink::publish(const event &e) {
    string message = nlohmann::json(e).dump();
    conn.execute([&](cpp_redis::client &client, vector<future<cpp_redis::reply>> &replies) {
        replies.push_back(client.publish(channel, message));
    });
}

amqp_event_sink::amqp_event_sink(unique_ptr<server::rabbitmq> mq) : mq(move(mq)) {}

string amqp_event_sink::name() const {
    return "amqp";
}

void amqp_event_sink::publish(const event &e) {
    mq->report(e.name, nlohmann::json(e).dump());
}

event_publisher::event_publisher(size_t capacity) : queue(capacity) {}

event_publisher::~event_publisher() {
    stop();
}

void event_publisher::add_sink(unique_ptr<event_sink> sink) {
    sinks.push_back(move(sink));
}

void event_publisher::start() {
    if (dispatcher.joinable()) return;
    dispatcher = thread([this] { dispatch_loop(); });
}

void event_publisher::stop() {
    queue.close();
    if (dispatcher.joinable()) dispatcher.join();
}

bool event_publisher::publish(event e) {
    if (queue.try_push(move(e))) return true;
    size_t dropped = ++dropped_count;
    LOG(WARNING) << "Event queue is full, dropped " << dropped << " events so far";
    return false;
}

size_t event_publisher::dropped() const {
    return dropped_count;
}

size_t event_publisher::delivered() const {
    return delivered_count;
}

void event_publisher::dispatch_loop() {
    while (auto e = queue.pop()) {
        for (auto &sink : sinks) {
            try {
                sink->publish(*e);
            } catch (std::exception &ex) {
                LOG(ERROR) << "Unable to publish " << e->name << " to " << sink->name() << ": " << ex.what();
            }
        }
        ++delivered_count;
    }
}

}  // namespace codebox
