#include <glog/logging.h>
#include <signal.h>
#include <sys/stat.h>
#include <boost/exception/diagnostic_information.hpp>
#include <boost/program_options.hpp>
#include <iostream>
#include "common/io_utils.hpp"
#include "common/utils.hpp"
#include "config.hpp"
#include "events/publisher.hpp"
#include "executor/executor.hpp"
#include "http/server.hpp"
#include "judge/pipeline.hpp"
#include "judge/warm_pool.hpp"
#include "repository.hpp"
#include "server/config.hpp"
#include "server/rabbitmq.hpp"
#include "server/redis.hpp"
#include "service.hpp"
#include "session/redis_session_store.hpp"
using namespace std;

codebox::http::http_server *running_server = nullptr;

void sigintHandler(int /* signum */) {
    LOG(ERROR) << "Received SIGINT, stopping HTTP server";
    if (running_server) running_server->stop();
}

int main(int argc, char* argv[]) {
    google::InitGoogleLogging(argv[0]);

    namespace po = boost::program_options;
    po::options_description desc("codebox options");
    po::variables_map vm;

    // clang-format off
    desc.add_options()
        ("config", po::value<string>(), "load configuration of languages, sandbox, backends, redis and amqp from the given json file. You can either pass it from environ CODEBOX_CONFIG")
        ("host", po::value<string>(), "set the address the HTTP server binds to, default to 0.0.0.0. You can either pass it from environ HOST")
        ("port", po::value<int>(), "set the port the HTTP server listens on, default to 5000. You can either pass it from environ PORT")
        ("workers", po::value<unsigned>(), "set the number of worker threads running jobs, default to 4. You can either pass it from environ WORKERS")
        ("queue-capacity", po::value<size_t>(), "set the maximum number of pending jobs, default to 64. You can either pass it from environ QUEUE_CAPACITY")
        ("run-dir", po::value<string>(), "set the directory to create job workspaces in. You can either pass it from environ RUNDIR")
        ("problem-dir", po::value<string>(), "set the directory storing <problem>.json test case files. You can either pass it from environ PROBLEM_DIR")
        ("sandbox", po::value<string>(), "set the sandbox type, docker or direct, default to docker. You can either pass it from environ SANDBOX")
        ("store", po::value<string>(), "set where sessions and submissions are stored, memory or redis, default to memory. You can either pass it from environ STORE")
        ("debug", "turn on the debug mode to log the command line of every spawned process.")
        ("help", "display this help text")
        ("version", "display version of this application");
    // clang-format on

    try {
        po::store(po::command_line_parser(argc, argv)
                      .options(desc)
                      .run(),
                  vm);
        po::notify(vm);
    } catch (po::error& e) {
        cerr << e.what() << endl
             << endl;
        cerr << desc << endl;
        return EXIT_FAILURE;
    }

    if (vm.count("help")) {
        cout << "codebox: Run untrusted code in sandboxes and report results through pollable sessions" << endl
             << "Usage: " << argv[0] << " [options]" << endl;
        cout << desc << endl;
        return EXIT_SUCCESS;
    }

    if (vm.count("version")) {
        cout << "codebox 1.0" << endl;
        return EXIT_SUCCESS;
    }

    if (vm.count("debug") || getenv("DEBUG")) {
        codebox::DEBUG = true;
    }

    codebox::server::system_config config;
    string config_file = vm.count("config") ? vm["config"].as<string>() : codebox::get_env("CODEBOX_CONFIG", "");
    if (!config_file.empty()) {
        CHECK(filesystem::is_regular_file(config_file))
            << "Configuration file " << config_file << " does not exist";
        try {
            nlohmann::json j = nlohmann::json::parse(codebox::read_file_content(config_file));
            j.get_to(config);
        } catch (std::exception& e) {
            LOG(FATAL) << "Configuration file " << config_file << " is malformed: " << e.what();
        }
    }
    codebox::server::apply_environment(config);

    if (vm.count("host")) config.http.host = vm["host"].as<string>();
    else config.http.host = codebox::get_env("HOST", config.http.host);
    if (vm.count("port")) config.http.port = vm["port"].as<int>();
    else config.http.port = codebox::get_env_as<int>("PORT", config.http.port);
    if (vm.count("workers")) config.service.workers = vm["workers"].as<unsigned>();
    else config.service.workers = codebox::get_env_as<unsigned>("WORKERS", config.service.workers);
    if (vm.count("queue-capacity")) config.service.queue_capacity = vm["queue-capacity"].as<size_t>();
    else config.service.queue_capacity = codebox::get_env_as<size_t>("QUEUE_CAPACITY", config.service.queue_capacity);
    if (vm.count("problem-dir")) config.service.problem_dir = vm["problem-dir"].as<string>();
    else config.service.problem_dir = codebox::get_env("PROBLEM_DIR", config.service.problem_dir);
    if (vm.count("sandbox")) config.sandbox.type = vm["sandbox"].as<string>();
    else config.sandbox.type = codebox::get_env("SANDBOX", config.sandbox.type);
    if (vm.count("store")) config.service.store = vm["store"].as<string>();
    else config.service.store = codebox::get_env("STORE", config.service.store);

    if (vm.count("run-dir")) {
        codebox::RUN_DIR = filesystem::path(vm.at("run-dir").as<string>());
    } else if (getenv("RUNDIR")) {
        codebox::RUN_DIR = filesystem::path(getenv("RUNDIR"));
    }
    filesystem::create_directories(codebox::RUN_DIR);
    CHECK(filesystem::is_directory(codebox::RUN_DIR))
        << "Run directory " << codebox::RUN_DIR << " does not exist";

    CHECK(config.service.workers > 0) << "At least one worker is required";
    CHECK(config.service.store == "memory" || config.service.store == "redis")
        << "Unrecognized store " << config.service.store;
    CHECK(config.service.store == "memory" || config.redis_server)
        << "Redis store requires redis configuration";

    // 工作目录挂载进容器，容器内的用户需要能读取代码
    umask(0022);

    auto languages = codebox::language_registry::builtin(config.languages);

    unique_ptr<codebox::sandbox> box;
    if (config.sandbox.type == "docker") {
        box = make_unique<codebox::docker_sandbox>();
    } else if (config.sandbox.type == "direct") {
        LOG(WARNING) << "Running user programs without isolation, use it in development only";
        box = make_unique<codebox::direct_sandbox>();
    } else {
        LOG(FATAL) << "Unrecognized sandbox type " << config.sandbox.type;
    }

    codebox::posix_process_runner runner;
    codebox::warm_pool warmer(*box, runner, config.sandbox.limits, codebox::RUN_DIR);
    codebox::pipeline local_pipeline(languages, *box, runner, config.sandbox.limits, codebox::RUN_DIR, &warmer);

    auto http_timeout = chrono::milliseconds(config.backends.http_timeout_ms);
    vector<unique_ptr<codebox::executor>> backends;
    if (config.backends.local)
        backends.push_back(make_unique<codebox::local_executor>(local_pipeline));
    if (!config.backends.remote_url.empty())
        backends.push_back(make_unique<codebox::remote_executor>(config.backends.remote_url, http_timeout));
    if (!config.backends.piston_url.empty())
        backends.push_back(make_unique<codebox::piston_executor>(config.backends.piston_url, config.backends.piston_versions, http_timeout));
    if (backends.empty())
        LOG(WARNING) << "No execution backend is configured, every job will end with a server error";
    codebox::best_effort_executor executor(move(backends));

    codebox::server::redis_conn redis;
    if (config.redis_server) redis.init(*config.redis_server);

    unique_ptr<codebox::session_store> sessions;
    unique_ptr<codebox::submission_repository> submissions;
    if (config.service.store == "redis") {
        sessions = make_unique<codebox::redis_session_store>(redis, chrono::seconds(config.redis_server->session_ttl));
        submissions = make_unique<codebox::redis_submission_repository>(redis);
    } else {
        sessions = make_unique<codebox::memory_session_store>();
        submissions = make_unique<codebox::memory_submission_repository>();
    }
    codebox::json_problem_repository problems(config.service.problem_dir);

    codebox::event_publisher events(config.service.event_queue_capacity);
    events.add_sink(make_unique<codebox::log_event_sink>());
    if (config.redis_server && !config.redis_server->channel.empty())
        events.add_sink(make_unique<codebox::redis_event_sink>(redis, config.redis_server->channel));
    if (config.amqp_server)
        events.add_sink(make_unique<codebox::amqp_event_sink>(make_unique<codebox::server::rabbitmq>(*config.amqp_server)));
    events.start();

    codebox::local_executor sync_executor(local_pipeline);
    codebox::execution_service service(languages, executor, *sessions, *submissions, problems, events,
                                       config.backends.local ? &sync_executor : nullptr,
                                       config.service.queue_capacity, config.service.sync_capacity);
    service.start(config.service.workers);

    codebox::http::http_server server(service, config.http);
    running_server = &server;
    signal(SIGINT, sigintHandler);
    signal(SIGTERM, sigintHandler);

    bool listened = server.listen();
    running_server = nullptr;

    service.stop();
    events.stop();

    if (!listened) {
        LOG(ERROR) << "Unable to listen on " << config.http.host << ":" << config.http.port;
        return EXIT_FAILURE;
    }
    return 0;
}
