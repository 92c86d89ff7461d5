#include <cstdlib>
#include "gtest/gtest.h"
#include "common/utils.hpp"
#include "server/config.hpp"

using namespace std;
using namespace codebox;
using namespace codebox::server;

TEST(ConfigTest, DefaultsTest) {
    system_config config = nlohmann::json::object();
    EXPECT_EQ(config.sandbox.type, "docker");
    EXPECT_EQ(config.sandbox.limits.cpus, "1.0");
    EXPECT_EQ(config.sandbox.limits.memory, "512m");
    EXPECT_EQ(config.sandbox.limits.pids_limit, 256);
    EXPECT_TRUE(config.backends.local);
    EXPECT_EQ(config.backends.piston_url, "https://emkc.org/api/v2/piston");
    EXPECT_EQ(config.http.port, 5000);
    EXPECT_FALSE(config.redis_server);
    EXPECT_FALSE(config.amqp_server);
}

TEST(ConfigTest, ParseJsonTest) {
    nlohmann::json j = R"({
        "languages": {"cppImage": "gcc:13", "runTimeout": "5000"},
        "sandbox": {"type": "direct", "memory": "256m", "pidsLimit": 64},
        "backends": {"local": false, "remote": "http://10.0.0.2:5000", "piston": "", "pistonVersions": {"python": "3.12.0"}},
        "service": {"workers": 8, "queueCapacity": 16, "syncCapacity": 1, "store": "redis"},
        "http": {"port": 8080, "runLimit": 10},
        "redis": {"host": "redis", "port": "6380", "channel": "codebox-events", "sessionTtl": 600},
        "amqp": {"hostname": "mq", "exchange": "codebox"}
    })"_json;
    system_config config = j;

    EXPECT_EQ(config.languages.cpp_image, "gcc:13");
    EXPECT_EQ(config.languages.run_timeout_ms, 5000);
    EXPECT_EQ(config.sandbox.type, "direct");
    EXPECT_EQ(config.sandbox.limits.memory, "256m");
    EXPECT_EQ(config.sandbox.limits.pids_limit, 64);
    EXPECT_FALSE(config.backends.local);
    EXPECT_EQ(config.backends.remote_url, "http://10.0.0.2:5000");
    EXPECT_EQ(config.backends.piston_url, "");
    EXPECT_EQ(config.backends.piston_versions["python"], "3.12.0");
    EXPECT_EQ(config.backends.piston_versions["java"], "15.0.2");
    EXPECT_EQ(config.service.workers, 8);
    EXPECT_EQ(config.service.queue_capacity, 16);
    EXPECT_EQ(config.service.sync_capacity, 1);
    EXPECT_EQ(config.http.port, 8080);
    EXPECT_EQ(config.http.run_limit, 10);
    ASSERT_TRUE(config.redis_server);
    EXPECT_EQ(config.redis_server->port, 6380);
    EXPECT_EQ(config.redis_server->session_ttl, 600);
    ASSERT_TRUE(config.amqp_server);
    EXPECT_EQ(config.amqp_server->exchange_type, "topic");
}

TEST(ConfigTest, EnvironmentOverrideTest) {
    set_env("PY_IMAGE", "python:3.12-alpine");
    set_env("RUN_TIMEOUT_MS", "1234");
    set_env("SANDBOX_PIDS", "not-a-number");
    set_env("PISTON_API_URL", "http://piston.local/api/v2");

    system_config config;
    apply_environment(config);
    EXPECT_EQ(config.languages.python_image, "python:3.12-alpine");
    EXPECT_EQ(config.languages.run_timeout_ms, 1234);
    // 无法解析的值保持默认
    EXPECT_EQ(config.sandbox.limits.pids_limit, 256);
    EXPECT_EQ(config.backends.piston_url, "http://piston.local/api/v2");
    EXPECT_EQ(config.languages.cpp_image, "gcc:12.2.0");

    unsetenv("PY_IMAGE");
    unsetenv("RUN_TIMEOUT_MS");
    unsetenv("SANDBOX_PIDS");
    unsetenv("PISTON_API_URL");
}
