#include "repository.hpp"
#include <glog/logging.h>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/utils.hpp"

namespace codebox {
using namespace std;
namespace fs = std::filesystem;

json_problem_repository::json_problem_repository(fs::path problem_dir)
    : problem_dir(move(problem_dir)) {}

optional<vector<test_case>> json_problem_repository::test_cases(const string &problem_id) {
    fs::path file = problem_dir / (assert_safe_path(problem_id) + ".json");
    if (!fs::is_regular_file(file)) return nullopt;

    try {
        nlohmann::json j = nlohmann::json::parse(read_file_content(file));
        vector<test_case> cases;
        if (j.count("testCases")) j.at("testCases").get_to(cases);
        return cases;
    } catch (nlohmann::json::exception &ex) {
        throw store_error("problem " + problem_id + " is malformed: " + ex.what());
    }
}

void memory_problem_repository::add(const string &problem_id, vector<test_case> cases) {
    lock_guard<mutex> guard(mut);
    problems[problem_id] = move(cases);
}

optional<vector<test_case>> memory_problem_repository::test_cases(const string &problem_id) {
    lock_guard<mutex> guard(mut);
    auto it = problems.find(problem_id);
    if (it == problems.end()) return nullopt;
    return it->second;
}

string memory_submission_repository::create(const new_submission &submission) {
    lock_guard<mutex> guard(mut);
    submission_record record;
    record.id = generate_uuid();
    record.fields = submission;
    record.status = submission_status::QUEUED;
    record.started_at = now_millis();
    submissions[record.id] = record;
    return record.id;
}

void memory_submission_repository::update(const string &submission_id, const submission_update &update) {
    lock_guard<mutex> guard(mut);
    auto it = submissions.find(submission_id);
    if (it == submissions.end()) throw not_found_error("submission " + submission_id + " does not exist");
    it->second.status = update.status;
    it->second.last_update = update;
    it->second.completed_at = now_millis();
}

optional<string> memory_submission_repository::owner(const string &submission_id) {
    lock_guard<mutex> guard(mut);
    auto it = submissions.find(submission_id);
    if (it == submissions.end()) return nullopt;
    return it->second.fields.user_id;
}

optional<submission_record> memory_submission_repository::get(const string &submission_id) {
    lock_guard<mutex> guard(mut);
    auto it = submissions.find(submission_id);
    if (it == submissions.end()) return nullopt;
    return it->second;
}

redis_submission_repository::redis_submission_repository(server::redis_conn &conn) : conn(conn) {}

string redis_submission_repository::key(const string &submission_id) {
    return "submission:" + submission_id;
}

string redis_submission_repository::create(const new_submission &submission) {
    string id = generate_uuid();
    vector<pair<string, string>> fields = {
        {"user", submission.user_id},
        {"problem", submission.problem_id},
        {"contest", submission.contest_id.value_or("")},
        {"code", submission.code},
        {"language", submission.language},
        {"input", submission.input},
        {"status", get_display_message(submission_status::QUEUED)},
        {"startedAt", std::to_string(now_millis())}};
    if (submission.total_tests) fields.emplace_back("totalTests", std::to_string(*submission.total_tests));

    conn.execute([&](cpp_redis::client &client, vector<future<cpp_redis::reply>> &replies) {
        replies.push_back(client.hmset(key(id), fields));
    });
    return id;
}

void redis_submission_repository::update(const string &submission_id, const submission_update &update) {
    vector<pair<string, string>> fields = {
        {"status", get_display_message(update.status)},
        {"completedAt", std::to_string(now_millis())}};
    if (update.output) fields.emplace_back("output", *update.output);
    if (update.error) fields.emplace_back("error", *update.error);
    if (update.runtime_ms) fields.emplace_back("runtimeMs", std::to_string(*update.runtime_ms));
    if (update.memory_kb) fields.emplace_back("memoryKb", std::to_string(*update.memory_kb));
    if (update.tests_passed) fields.emplace_back("testsPassed", std::to_string(*update.tests_passed));
    if (update.total_tests) fields.emplace_back("totalTests", std::to_string(*update.total_tests));
    if (update.test_results) fields.emplace_back("testResults", update.test_results->dump());

    conn.execute([&](cpp_redis::client &client, vector<future<cpp_redis::reply>> &replies) {
        replies.push_back(client.hmset(key(submission_id), fields));
    });
}

optional<string> redis_submission_repository::owner(const string &submission_id) {
    auto replies = conn.execute([&](cpp_redis::client &client, vector<future<cpp_redis::reply>> &replies) {
        replies.push_back(client.hget(key(submission_id), "user"));
    });
    if (replies.empty() || !replies[0].is_string() || replies[0].as_string().empty()) return nullopt;
    return replies[0].as_string();
}

}  // namespace codebox
