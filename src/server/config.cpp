#include "server/config.hpp"
#include "common/utils.hpp"

namespace codebox::server {
using namespace std;
using namespace nlohmann;

void from_json(const json &j, amqp &mq) {
    j.at("hostname").get_to(mq.hostname);
    j.at("exchange").get_to(mq.exchange);
    get_value_if_exists(j, "port", mq.port);
    get_value_if_exists(j, "exchange_type", mq.exchange_type);
}

void from_json(const json &j, redis &redis_config) {
    j.at("host").get_to(redis_config.host);
    get_value_if_exists(j, "port", redis_config.port);
    get_value_if_exists(j, "password", redis_config.password);
    get_value_if_exists(j, "channel", redis_config.channel);
    get_value_if_exists(j, "retryInterval", redis_config.retry_interval);
    get_value_if_exists(j, "sessionTtl", redis_config.session_ttl);
}

void from_json(const json &j, language_config &config) {
    get_value_if_exists(j, "pythonImage", config.python_image);
    get_value_if_exists(j, "cppImage", config.cpp_image);
    get_value_if_exists(j, "javaImage", config.java_image);
    get_value_if_exists(j, "compileTimeout", config.compile_timeout_ms);
    get_value_if_exists(j, "runTimeout", config.run_timeout_ms);
    get_value_if_exists(j, "javaRunTimeout", config.java_run_timeout_ms);
}

void from_json(const json &j, sandbox_config &config) {
    get_value_if_exists(j, "type", config.type);
    get_value_if_exists(j, "cpus", config.limits.cpus);
    get_value_if_exists(j, "memory", config.limits.memory);
    get_value_if_exists(j, "pidsLimit", config.limits.pids_limit);
}

void from_json(const json &j, backend_config &config) {
    get_value_if_exists(j, "local", config.local);
    get_value_if_exists(j, "remote", config.remote_url);
    get_value_if_exists(j, "piston", config.piston_url);
    get_value_if_exists(j, "httpTimeout", config.http_timeout_ms);
    if (j.count("pistonVersions"))
        for (auto &[language, version] : j.at("pistonVersions").items())
            config.piston_versions[language] = version.get<string>();
}

void from_json(const json &j, service_config &config) {
    get_value_if_exists(j, "workers", config.workers);
    get_value_if_exists(j, "queueCapacity", config.queue_capacity);
    get_value_if_exists(j, "syncCapacity", config.sync_capacity);
    get_value_if_exists(j, "eventQueueCapacity", config.event_queue_capacity);
    get_value_if_exists(j, "problemDir", config.problem_dir);
    get_value_if_exists(j, "store", config.store);
}

void from_json(const json &j, http_config &config) {
    get_value_if_exists(j, "host", config.host);
    get_value_if_exists(j, "port", config.port);
    get_value_if_exists(j, "runLimit", config.run_limit);
    get_value_if_exists(j, "resultLimit", config.result_limit);
    get_value_if_exists(j, "submitLimit", config.submit_limit);
}

void from_json(const json &j, system_config &config) {
    if (j.count("languages")) j.at("languages").get_to(config.languages);
    if (j.count("sandbox")) j.at("sandbox").get_to(config.sandbox);
    if (j.count("backends")) j.at("backends").get_to(config.backends);
    if (j.count("service")) j.at("service").get_to(config.service);
    if (j.count("http")) j.at("http").get_to(config.http);
    if (nlohmann::exists(j, "redis")) config.redis_server = j.at("redis").get<redis>();
    if (nlohmann::exists(j, "amqp")) config.amqp_server = j.at("amqp").get<amqp>();
}

void apply_environment(system_config &config) {
    auto &lang = config.languages;
    lang.python_image = get_env("PY_IMAGE", lang.python_image);
    lang.cpp_image = get_env("CPP_IMAGE", lang.cpp_image);
    lang.java_image = get_env("JAVA_IMAGE", lang.java_image);
    lang.compile_timeout_ms = get_env_as("COMPILE_TIMEOUT_MS", lang.compile_timeout_ms);
    lang.run_timeout_ms = get_env_as("RUN_TIMEOUT_MS", lang.run_timeout_ms);
    lang.java_run_timeout_ms = get_env_as("JAVA_RUN_TIMEOUT_MS", lang.java_run_timeout_ms);

    auto &limits = config.sandbox.limits;
    limits.cpus = get_env("SANDBOX_CPUS", limits.cpus);
    limits.memory = get_env("SANDBOX_MEMORY", limits.memory);
    limits.pids_limit = get_env_as("SANDBOX_PIDS", limits.pids_limit);

    config.backends.piston_url = get_env("PISTON_API_URL", config.backends.piston_url);
    config.backends.remote_url = get_env("REMOTE_EXECUTOR_URL", config.backends.remote_url);
}

}  // namespace codebox::server
