#include "server/rabbitmq.hpp"
#include <glog/logging.h>
#include <thread>

namespace codebox::server {
using namespace std;

rabbitmq::rabbitmq(const amqp &amqp) : queue(amqp) {
    connect();
}

void rabbitmq::connect() {
    LOG(INFO) << "AMQP: Connecting to " << queue.hostname << ":" << queue.port << ", exchange " << queue.exchange;
    channel = AmqpClient::Channel::Create(queue.hostname, queue.port);
    channel->DeclareExchange(queue.exchange, queue.exchange_type, /* passive */ false, /* durable */ true);
}

void rabbitmq::report(const string &routing_key, const string &message) {
    lock_guard<mutex> guard(mut);
    AmqpClient::BasicMessage::ptr_t msg = AmqpClient::BasicMessage::Create(message);
    msg->ContentType("application/json");
    DLOG(INFO) << "Sending message to exchange:" << queue.exchange << ", routing_key=" << routing_key;

    int retry = 2;
    while (true) {
        try {
            channel->BasicPublish(queue.exchange, routing_key, msg);
            return;
        } catch (AmqpClient::AmqpException &e) {
            if (--retry <= 0) throw;
            LOG(WARNING) << "AMQP: publishing failed, reconnecting: " << e.what();
            this_thread::sleep_for(chrono::seconds(1));
            connect();
        }
    }
}

}  // namespace codebox::server
