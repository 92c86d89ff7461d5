#include <condition_variable>
#include <mutex>
#include <thread>
#include "gtest/gtest.h"
#include "common/exceptions.hpp"
#include "service.hpp"
#include "test/assertions.hpp"
#include "test/environment.hpp"

using namespace std;
using namespace codebox;

struct collecting_sink : public event_sink {
    string name() const override { return "collecting"; }

    void publish(const event &e) override {
        lock_guard<mutex> guard(mut);
        events.push_back(e);
    }

    vector<event> snapshot() {
        lock_guard<mutex> guard(mut);
        return events;
    }

    mutex mut;
    vector<event> events;
};

/**
 * @brief 终止状态的写入总是失败的会话存储
 */
struct failing_terminal_store : public session_store {
    void create(const session &s) override {
        if (is_terminal(s.status)) throw store_error("session store is down");
        inner.create(s);
    }

    void patch(const string &session_id, const session_patch &patch) override {
        inner.patch(session_id, patch);
    }

    optional<session> get(const string &session_id) override {
        return inner.get(session_id);
    }

    memory_session_store inner;
};

class ExecutionServiceTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto s = make_unique<collecting_sink>();
        sink = s.get();
        events.add_sink(move(s));
        events.start();

        problems.add("1001", {{"1 2", "3", false}, {"2 2", "4", false}, {"5 5", "10", true}});
        problems.add("empty", {});
    }

    void TearDown() override {
        if (service) service->stop();
        events.stop();
    }

    void make_service(test::scripted_executor::script script, unsigned workers = 2, size_t capacity = 16) {
        exec = make_unique<test::scripted_executor>(move(script));
        service = make_unique<execution_service>(languages, *exec, sessions, submissions, problems, events, nullptr, capacity, 2);
        if (workers) service->start(workers);
    }

    /**
     * @brief 同步接口使用 local 作为本机执行后端
     */
    void make_sync_service(test::scripted_executor::script local, size_t sync_capacity) {
        exec = make_unique<test::scripted_executor>(add);
        sync_exec = make_unique<test::scripted_executor>(move(local));
        service = make_unique<execution_service>(languages, *exec, sessions, submissions, problems, events,
                                                 sync_exec.get(), 16, sync_capacity);
    }

    nlohmann::json wait_for_terminal(const string &session_id) {
        for (int i = 0; i < 500; ++i) {
            auto s = sessions.get(session_id);
            if (s && is_terminal(s->status)) return service->result(session_id);
            this_thread::sleep_for(chrono::milliseconds(10));
        }
        ADD_FAILURE() << "session " << session_id << " did not finish";
        return nullptr;
    }

    static execution_result add(const execution_request &request) {
        istringstream in(request.input);
        long long a = 0, b = 0;
        in >> a >> b;
        return test::success_result(to_string(a + b) + "\n", 4);
    }

    language_registry languages = language_registry::builtin(server::language_config());
    memory_session_store sessions;
    memory_submission_repository submissions;
    memory_problem_repository problems;
    event_publisher events{1024};
    collecting_sink *sink = nullptr;
    unique_ptr<test::scripted_executor> exec;
    unique_ptr<test::scripted_executor> sync_exec;
    unique_ptr<execution_service> service;
};

TEST_F(ExecutionServiceTest, RunTest) {
    make_service([](const execution_request &request) { return test::success_result("echo:" + request.input); });
    string session_id = service->run("py", "print(input())", "hello");
    ASSERT_FALSE(session_id.empty());

    auto result = wait_for_terminal(session_id);
    EXPECT_EQ(result["status"], "completed");
    EXPECT_EQ(result["output"], "echo:hello");
    EXPECT_EQ(result["verdict"], "Completed");
    EXPECT_EQ(result["runtime"], "10ms");

    // 执行后端收到规范化后的语言名
    ASSERT_EQ(exec->requests().size(), 1);
    EXPECT_EQ(exec->requests()[0].language, "python");
    EXPECT_EQ(sessions.get(session_id)->language, "python");
}

TEST_F(ExecutionServiceTest, UnsupportedLanguageTest) {
    make_service(add);
    EXPECT_THROW(service->run("ruby", "puts 1", ""), unsupported_language);
    EXPECT_THROW(service->submit("u1", "1001", "x", "ruby", nullopt, ""), unsupported_language);
    this_thread::sleep_for(chrono::milliseconds(50));
    EXPECT_TRUE(exec->requests().empty());
}

TEST_F(ExecutionServiceTest, FailedRunEndsInErrorTest) {
    make_service([](const execution_request &) {
        execution_result result;
        result.system_error = true;
        result.exit_code = 1;
        result.std_err = "All execution backends failed: local: docker missing";
        return result;
    });
    string session_id = service->run("cpp", "int main() {}", "");
    auto result = wait_for_terminal(session_id);
    EXPECT_EQ(result["status"], "error");
    EXPECT_EQ(result["verdict"], "Server Error");
    EXPECT_EQ(sessions.get(session_id)->status, session_status::error);
}

TEST_F(ExecutionServiceTest, ExecutorExceptionEndsInErrorTest) {
    make_service([](const execution_request &) -> execution_result { throw internal_error("disk full"); });
    auto ticket = service->submit("u1", "1001", "code", "cpp", nullopt, "1 2");
    auto result = wait_for_terminal(ticket.session_id);
    EXPECT_EQ(result["status"], "error");
    EXPECT_EQ(result["error"], "disk full");
    EXPECT_EQ(submissions.get(ticket.submission_id)->status, submission_status::SERVER_ERROR);
}

TEST_F(ExecutionServiceTest, SubmitTest) {
    make_service([](const execution_request &) {
        execution_result result;
        result.compile_failed = true;
        result.exit_code = 1;
        result.std_err = "main.cpp:1:1: error";
        return result;
    });
    auto ticket = service->submit("u1", "1001", "int main(", "c++", string("c9"), "");
    auto result = wait_for_terminal(ticket.session_id);
    EXPECT_EQ(result["status"], "completed");
    EXPECT_EQ(result["verdict"], "Compilation Error");
    EXPECT_EQ(result["error"], "main.cpp:1:1: error");

    auto record = submissions.get(ticket.submission_id);
    ASSERT_TRUE(record);
    EXPECT_EQ(record->status, submission_status::COMPILATION_ERROR);
    EXPECT_EQ(record->fields.user_id, "u1");
    EXPECT_EQ(record->fields.contest_id.value_or(""), "c9");
    EXPECT_EQ(record->fields.language, "cpp");
    EXPECT_EQ(sessions.get(ticket.session_id)->submission_id.value_or(""), ticket.submission_id);
}

TEST_F(ExecutionServiceTest, SubmitUnknownProblemTest) {
    make_service(add);
    EXPECT_THROW(service->submit("u1", "404", "code", "cpp", nullopt, ""), not_found_error);
    EXPECT_THROW(service->submit_batch("u1", "404", "code", "cpp", nullopt, compare_mode::relaxed), not_found_error);
    EXPECT_THROW(service->submit_batch("u1", "empty", "code", "cpp", nullopt, compare_mode::relaxed), invalid_request);
    EXPECT_THROW(service->submit("", "1001", "code", "cpp", nullopt, ""), invalid_request);
}

TEST_F(ExecutionServiceTest, BatchTest) {
    make_service(add);
    auto ticket = service->submit_batch("u7", "1001", "code", "python", nullopt, compare_mode::relaxed);
    auto result = wait_for_terminal(ticket.session_id);

    EXPECT_EQ(result["status"], "completed");
    EXPECT_EQ(result["verdict"], "Accepted");
    EXPECT_EQ(result["testsPassed"], 3);
    EXPECT_EQ(result["totalTests"], 3);
    EXPECT_EQ(result["runtimeMs"], 12);
    ASSERT_EQ(result["testResults"].size(), 3);
    EXPECT_EQ(result["testResults"][2]["input"], "");

    auto record = submissions.get(ticket.submission_id);
    EXPECT_EQ(record->status, submission_status::ACCEPTED);
    EXPECT_EQ(record->last_update.tests_passed.value_or(-1), 3);

    auto stored = sessions.get(ticket.session_id);
    ASSERT_TRUE(stored->progress);
    EXPECT_EQ(stored->progress->current, 3);
    EXPECT_EQ(stored->progress->total, 3);
}

TEST_F(ExecutionServiceTest, BatchEventsTest) {
    make_service(add);
    auto ticket = service->submit_batch("u7", "1001", "code", "python", nullopt, compare_mode::relaxed);
    wait_for_terminal(ticket.session_id);
    service->stop();
    events.stop();

    int last = 0;
    bool owner_notified = false;
    for (auto &e : sink->snapshot()) {
        if (e.name == "compiler:submission:update") {
            EXPECT_EQ(e.room.value_or(""), "user:u7");
            EXPECT_EQ(e.payload["status"], "Accepted");
            owner_notified = true;
            continue;
        }
        if (e.payload.value("sessionId", "") != ticket.session_id || !e.payload.count("progress")) continue;
        int current = e.payload["progress"]["current"];
        EXPECT_GE(current, last);
        EXPECT_LE(current, (int)e.payload["progress"]["total"]);
        last = current;
    }
    EXPECT_EQ(last, 3);
    EXPECT_TRUE(owner_notified);
}

TEST_F(ExecutionServiceTest, WrongAnswerTest) {
    make_service([](const execution_request &) { return test::success_result("3\n"); });
    auto ticket = service->submit_batch("u1", "1001", "code", "cpp", nullopt, compare_mode::strict);
    auto result = wait_for_terminal(ticket.session_id);
    EXPECT_EQ(result["verdict"], "Wrong Answer");
    EXPECT_EQ(result["testsPassed"], 1);
    EXPECT_EQ(submissions.get(ticket.submission_id)->status, submission_status::WRONG_ANSWER);
}

TEST_F(ExecutionServiceTest, QueueFullTest) {
    make_service(add, 0, 1);
    string first = service->run("python", "code", "");
    EXPECT_THROW(service->run("python", "code", ""), service_unavailable);
    EXPECT_EQ(sessions.get(first)->status, session_status::queued);
}

TEST_F(ExecutionServiceTest, CancelQueuedJobTest) {
    make_service(add, 0);
    auto ticket = service->submit("u1", "1001", "code", "cpp", nullopt, "1 2");
    EXPECT_TRUE(service->cancel(ticket.session_id));
    EXPECT_FALSE(service->cancel("unknown-session"));

    service->start(1);
    auto result = wait_for_terminal(ticket.session_id);
    EXPECT_EQ(result["status"], "error");
    EXPECT_EQ(result["error"], "Execution cancelled");
    EXPECT_EQ(submissions.get(ticket.submission_id)->status, submission_status::CANCELLED);
    EXPECT_TRUE(exec->requests().empty());
}

TEST_F(ExecutionServiceTest, ResultOfUnknownSessionTest) {
    make_service(add);
    EXPECT_JSON_EQ(service->result("nope"), (nlohmann::json{{"status", "not_found"}, {"error", "Session not found"}}));
}

TEST_F(ExecutionServiceTest, ExecuteSyncWithoutLocalPipelineTest) {
    make_service(add);
    EXPECT_THROW(service->execute_sync({"code", "python", "", nullopt}), service_unavailable);
    EXPECT_THROW(service->execute_sync({"code", "ruby", "", nullopt}), unsupported_language);
}

TEST_F(ExecutionServiceTest, ExecuteSyncTimeoutIsClampedTest) {
    make_sync_service([](const execution_request &request) { return test::success_result(request.input); }, 2);
    auto limit = languages.at("python").run_timeout;

    auto result = service->execute_sync({"code", "py", "hi", chrono::milliseconds(1000000000)});
    EXPECT_EQ(result.std_out, "hi");
    EXPECT_EQ(service->execute_sync({"code", "python", "", chrono::milliseconds(100)}).exit_code, 0);
    service->execute_sync({"code", "python", "", nullopt});

    auto received = sync_exec->requests();
    ASSERT_EQ(received.size(), 3);
    EXPECT_EQ(received[0].language, "python");
    EXPECT_EQ(received[0].timeout, limit);
    EXPECT_EQ(received[1].timeout, chrono::milliseconds(100));
    EXPECT_EQ(received[2].timeout, limit);
    EXPECT_TRUE(exec->requests().empty());
}

TEST_F(ExecutionServiceTest, ExecuteSyncAdmissionLimitTest) {
    mutex mut;
    condition_variable cond;
    int entered = 0;
    bool released = false;
    make_sync_service([&](const execution_request &request) {
        unique_lock<mutex> lock(mut);
        ++entered;
        cond.notify_all();
        cond.wait(lock, [&] { return released; });
        return test::success_result(request.input);
    }, 1);

    thread first([&] { EXPECT_EQ(service->execute_sync({"code", "python", "first", nullopt}).std_out, "first"); });
    {
        unique_lock<mutex> lock(mut);
        EXPECT_TRUE(cond.wait_for(lock, chrono::seconds(5), [&] { return entered == 1; }));
    }

    // 已有一个同步执行在进行
    EXPECT_THROW(service->execute_sync({"code", "python", "second", nullopt}), service_unavailable);

    {
        lock_guard<mutex> guard(mut);
        released = true;
    }
    cond.notify_all();
    first.join();

    // 名额被释放
    EXPECT_EQ(service->execute_sync({"code", "python", "third", nullopt}).std_out, "third");
    EXPECT_EQ(entered, 2);
}

TEST_F(ExecutionServiceTest, SessionStoreFailureKeepsVerdictTest) {
    failing_terminal_store store;
    exec = make_unique<test::scripted_executor>(add);
    service = make_unique<execution_service>(languages, *exec, store, submissions, problems, events, nullptr, 16, 2);
    service->start(1);

    auto ticket = service->submit_batch("u3", "1001", "code", "python", nullopt, compare_mode::relaxed);
    bool notified = false;
    for (int i = 0; i < 500 && !notified; ++i) {
        for (auto &e : sink->snapshot())
            if (e.name == "compiler:submission:update") notified = true;
        if (!notified) this_thread::sleep_for(chrono::milliseconds(10));
    }
    ASSERT_TRUE(notified);
    service->stop();
    events.stop();

    EXPECT_EQ(submissions.get(ticket.submission_id)->status, submission_status::ACCEPTED);
    int owner_events = 0;
    for (auto &e : sink->snapshot()) {
        if (e.name != "compiler:submission:update") continue;
        ++owner_events;
        EXPECT_EQ(e.payload["status"], "Accepted");
    }
    EXPECT_EQ(owner_events, 1);
}
