#include "service.hpp"
#include <fmt/format.h>
#include <glog/logging.h>
#include <boost/exception/diagnostic_information.hpp>
#include "common/defer.hpp"
#include "common/exceptions.hpp"
#include "common/utils.hpp"

namespace codebox {
using namespace std;

static const string CANCELLED_MESSAGE = "Execution cancelled";

static submission_status verdict_of(execution_outcome outcome) {
    switch (outcome) {
        case execution_outcome::success: return submission_status::COMPLETED;
        case execution_outcome::compilation_error: return submission_status::COMPILATION_ERROR;
        case execution_outcome::time_limit_exceeded: return submission_status::TIME_LIMIT_EXCEEDED;
        case execution_outcome::runtime_error: return submission_status::RUNTIME_ERROR;
        case execution_outcome::server_error: return submission_status::SERVER_ERROR;
        case execution_outcome::cancelled: return submission_status::CANCELLED;
    }
    return submission_status::SERVER_ERROR;
}

static string display_runtime(long long runtime_ms) {
    return fmt::format("{}ms", runtime_ms);
}

execution_service::execution_service(const language_registry &languages,
                                     executor &exec,
                                     session_store &sessions,
                                     submission_repository &submissions,
                                     problem_repository &problems,
                                     event_publisher &events,
                                     executor *local,
                                     size_t queue_capacity,
                                     size_t sync_capacity)
    : languages(languages),
      exec(exec),
      sessions(sessions),
      submissions(submissions),
      problems(problems),
      events(events),
      local(local),
      sync_capacity(sync_capacity),
      jobs(queue_capacity) {}

execution_service::~execution_service() {
    stop();
}

void execution_service::start(unsigned count) {
    for (unsigned i = 0; i < count; ++i)
        workers.emplace_back([this, i] { worker_loop(i); });
    LOG(INFO) << "Started " << count << " workers";
}

void execution_service::stop() {
    jobs.close();
    {
        // 等待队列中剩余的任务会以取消结束
        lock_guard<mutex> guard(active_mutex);
        for (auto &[session_id, token] : active) token->cancel();
    }
    for (auto &worker : workers)
        if (worker.joinable()) worker.join();
    workers.clear();
}

const language_registry &execution_service::registry() const {
    return languages;
}

string execution_service::open_session(const optional<string> &submission_id, const string &language) {
    session s;
    s.session_id = generate_uuid();
    s.submission_id = submission_id;
    s.status = session_status::queued;
    s.language = language;
    sessions.create(s);
    nlohmann::json extra = {{"stage", "queued"}};
    if (submission_id) extra["submissionId"] = *submission_id;
    events.publish(session_event(s.session_id, "queued", language, extra));
    return s.session_id;
}

void execution_service::enqueue(job j) {
    auto token = make_shared<cancel_token>();
    j.cancel = token;
    string session_id = j.session_id;
    optional<string> submission_id = j.submission_id;
    {
        lock_guard<mutex> guard(active_mutex);
        active[session_id] = token;
    }
    if (jobs.try_push(move(j))) return;

    {
        lock_guard<mutex> guard(active_mutex);
        active.erase(session_id);
    }
    const string message = "Server is busy, please retry later";
    LOG(WARNING) << "Rejected job " << session_id << ": pending queue is full";
    if (submission_id) {
        submission_update update;
        update.status = submission_status::SERVER_ERROR;
        update.error = message;
        submissions.update(*submission_id, update);
    }
    session_patch patch;
    patch.status = session_status::error;
    patch.result = nlohmann::json{{"status", "error"}, {"output", ""}, {"error", message}};
    sessions.patch(session_id, patch);
    throw service_unavailable(message);
}

string execution_service::run(const string &language, const string &code, const string &input) {
    const language_profile &profile = languages.at(language);

    job j;
    j.type = job::kind::single;
    j.language = profile.id;
    j.code = code;
    j.input = input;
    j.session_id = open_session(nullopt, profile.id);
    string session_id = j.session_id;
    enqueue(move(j));
    return session_id;
}

submit_ticket execution_service::submit(const string &user_id,
                                        const string &problem_id,
                                        const string &code,
                                        const string &language,
                                        const optional<string> &contest_id,
                                        const string &input) {
    const language_profile &profile = languages.at(language);
    if (user_id.empty()) throw invalid_request("User is required");
    if (!problems.test_cases(problem_id)) throw not_found_error("Problem not found");

    new_submission fields;
    fields.user_id = user_id;
    fields.problem_id = problem_id;
    fields.contest_id = contest_id;
    fields.code = code;
    fields.language = profile.id;
    fields.input = input;

    job j;
    j.type = job::kind::single;
    j.language = profile.id;
    j.code = code;
    j.input = input;
    j.user_id = user_id;
    j.submission_id = submissions.create(fields);
    j.session_id = open_session(j.submission_id, profile.id);

    submit_ticket ticket{*j.submission_id, j.session_id};
    enqueue(move(j));
    return ticket;
}

submit_ticket execution_service::submit_batch(const string &user_id,
                                              const string &problem_id,
                                              const string &code,
                                              const string &language,
                                              const optional<string> &contest_id,
                                              compare_mode mode) {
    const language_profile &profile = languages.at(language);
    if (user_id.empty()) throw invalid_request("User is required");
    auto cases = problems.test_cases(problem_id);
    if (!cases) throw not_found_error("Problem not found");
    if (cases->empty()) throw invalid_request("No test cases configured for this problem");

    new_submission fields;
    fields.user_id = user_id;
    fields.problem_id = problem_id;
    fields.contest_id = contest_id;
    fields.code = code;
    fields.language = profile.id;
    fields.total_tests = (int)cases->size();

    job j;
    j.type = job::kind::batch;
    j.language = profile.id;
    j.code = code;
    j.cases = move(*cases);
    j.mode = mode;
    j.user_id = user_id;
    j.submission_id = submissions.create(fields);
    j.session_id = open_session(j.submission_id, profile.id);

    submit_ticket ticket{*j.submission_id, j.session_id};
    enqueue(move(j));
    return ticket;
}

nlohmann::json execution_service::result(const string &session_id) {
    return project(sessions.get(session_id));
}

bool execution_service::cancel(const string &session_id) {
    lock_guard<mutex> guard(active_mutex);
    auto it = active.find(session_id);
    if (it == active.end()) return false;
    LOG(INFO) << "Cancelling job " << session_id;
    it->second->cancel();
    return true;
}

execution_result execution_service::execute_sync(execution_request request) {
    const language_profile &profile = languages.at(request.language);
    request.language = profile.id;
    if (!local) throw service_unavailable("Local execution is disabled on this node");
    if (!request.timeout || *request.timeout > profile.run_timeout) request.timeout = profile.run_timeout;

    {
        lock_guard<mutex> guard(sync_mutex);
        if (sync_running >= sync_capacity) {
            LOG(WARNING) << "Rejected synchronous execution: " << sync_running << " already running";
            throw service_unavailable("Server is busy, please retry later");
        }
        ++sync_running;
    }
    defer {
        lock_guard<mutex> guard(sync_mutex);
        --sync_running;
    };
    return local->execute(request, nullptr);
}

void execution_service::worker_loop(unsigned worker_id) {
    DLOG(INFO) << "Worker " << worker_id << " started";
    while (auto j = jobs.pop()) {
        defer {
            lock_guard<mutex> guard(active_mutex);
            active.erase(j->session_id);
        };
        process(*j);
    }
    DLOG(INFO) << "Worker " << worker_id << " stopped";
}

void execution_service::process(job &j) {
    try {
        if (j.type == job::kind::batch)
            run_batch(j);
        else
            run_single(j);
    } catch (codebox_exception &ex) {
        LOG(ERROR) << "Job " << j.session_id << " crashed: " << ex;
        fail(j, ex.what());
    } catch (std::exception &ex) {
        LOG(ERROR) << "Job " << j.session_id << " crashed: " << boost::diagnostic_information(ex);
        fail(j, ex.what());
    }
}

void execution_service::run_single(job &j) {
    if (j.cancel->cancelled()) {
        if (j.submission_id) {
            submission_update update;
            update.status = submission_status::CANCELLED;
            update.error = CANCELLED_MESSAGE;
            submissions.update(*j.submission_id, update);
        }
        finish(j, session_status::error, submission_status::CANCELLED,
               {{"status", "error"}, {"output", ""}, {"error", CANCELLED_MESSAGE}});
        return;
    }

    session_patch running;
    running.status = session_status::running;
    sessions.patch(j.session_id, running);
    events.publish(session_event(j.session_id, "running", j.language, {{"stage", "running"}}));

    execution_request request;
    request.code = j.code;
    request.language = j.language;
    request.input = j.input;
    execution_result r = exec.execute(request, j.cancel.get());

    execution_outcome outcome = r.outcome();
    submission_status verdict = verdict_of(outcome);
    bool failed = outcome == execution_outcome::server_error || outcome == execution_outcome::cancelled;

    nlohmann::json result = {{"status", failed ? "error" : "completed"},
                             {"verdict", get_display_message(verdict)},
                             {"output", r.std_out},
                             {"error", r.std_err},
                             {"exitCode", r.exit_code},
                             {"runtime", display_runtime(r.runtime_ms)},
                             {"runtimeMs", r.runtime_ms},
                             {"memory", nullptr},
                             {"backend", r.backend}};
    if (r.peak_memory_kb) result["memory"] = *r.peak_memory_kb;

    if (j.submission_id) {
        submission_update update;
        update.status = verdict;
        update.output = r.std_out;
        update.error = r.std_err;
        update.runtime_ms = r.runtime_ms;
        update.memory_kb = r.peak_memory_kb;
        submissions.update(*j.submission_id, update);
    }
    finish(j, failed ? session_status::error : session_status::completed, verdict, result);
}

void execution_service::run_batch(job &j) {
    int total = (int)j.cases.size();
    if (j.cancel->cancelled()) {
        submission_update update;
        update.status = submission_status::CANCELLED;
        update.error = CANCELLED_MESSAGE;
        update.tests_passed = 0;
        update.total_tests = total;
        submissions.update(*j.submission_id, update);
        finish(j, session_status::error, submission_status::CANCELLED,
               {{"status", "error"}, {"error", CANCELLED_MESSAGE}, {"testsPassed", 0}, {"totalTests", total}});
        return;
    }

    session_patch running;
    running.status = session_status::running;
    running.progress = session_progress{0, total};
    sessions.patch(j.session_id, running);
    events.publish(session_event(j.session_id, "running", j.language,
                                  {{"stage", "running"}, {"progress", session_progress{0, total}}}));

    batch_runner runner(exec);
    auto on_progress = [&](int current, int count) {
        session_patch progress;
        progress.progress = session_progress{current, count};
        sessions.patch(j.session_id, progress);
        events.publish(session_event(j.session_id, "running", j.language,
                                      {{"stage", "running"}, {"progress", session_progress{current, count}}}));
    };
    batch_result batch = runner.run(j.code, j.language, j.cases, j.mode, on_progress, j.cancel.get());

    nlohmann::json test_results = batch.cases;
    submission_status verdict = batch.cancelled ? submission_status::CANCELLED : batch.status;

    submission_update update;
    update.status = verdict;
    update.tests_passed = batch.tests_passed;
    update.total_tests = batch.total_tests;
    update.runtime_ms = batch.runtime_ms;
    update.test_results = test_results;
    if (batch.cancelled) update.error = CANCELLED_MESSAGE;
    submissions.update(*j.submission_id, update);

    nlohmann::json result = {{"status", batch.cancelled ? "error" : "completed"},
                             {"verdict", get_display_message(verdict)},
                             {"testsPassed", batch.tests_passed},
                             {"totalTests", batch.total_tests},
                             {"runtime", display_runtime(batch.runtime_ms)},
                             {"runtimeMs", batch.runtime_ms},
                             {"testResults", test_results}};
    if (batch.cancelled) result["error"] = CANCELLED_MESSAGE;
    finish(j, batch.cancelled ? session_status::error : session_status::completed, verdict, result);
}

void execution_service::finish(job &j, session_status status, submission_status verdict, const nlohmann::json &result) {
    session s;
    s.session_id = j.session_id;
    s.submission_id = j.submission_id;
    s.status = status;
    s.language = j.language;
    s.result = result;
    // 提交记录已经写入最终结果，这里的存储错误只记录日志
    try {
        if (j.type == job::kind::batch) {
            int done = result.value("testsPassed", 0);
            auto current = sessions.get(j.session_id);
            if (current && current->progress) s.progress = current->progress;
            else s.progress = session_progress{done, (int)j.cases.size()};
        }
        sessions.create(s);
    } catch (std::exception &ex) {
        LOG(ERROR) << "Unable to write terminal state of session " << j.session_id << ": " << boost::diagnostic_information(ex);
    }

    nlohmann::json extra = result;
    extra.erase("status");
    events.publish(session_event(j.session_id, get_display_message(status), j.language, extra));
    notify_owner(j, verdict);
    LOG(INFO) << "Job " << j.session_id << " finished: " << get_display_message(verdict);
}

void execution_service::fail(job &j, const string &message) {
    if (j.submission_id) {
        try {
            submission_update update;
            update.status = submission_status::SERVER_ERROR;
            update.error = message;
            submissions.update(*j.submission_id, update);
        } catch (std::exception &ex) {
            LOG(ERROR) << "Unable to update submission " << *j.submission_id << ": " << ex.what();
        }
    }
    try {
        session s;
        s.session_id = j.session_id;
        s.submission_id = j.submission_id;
        s.status = session_status::error;
        s.language = j.language;
        s.result = nlohmann::json{{"status", "error"}, {"output", ""}, {"error", message}};
        sessions.create(s);
    } catch (std::exception &ex) {
        LOG(ERROR) << "Unable to write terminal state of session " << j.session_id << ": " << ex.what();
    }
    events.publish(session_event(j.session_id, "error", j.language, {{"error", message}}));
    notify_owner(j, submission_status::SERVER_ERROR);
}

void execution_service::notify_owner(job &j, submission_status verdict) {
    if (!j.submission_id) return;
    try {
        // 提交者以提交记录为准
        auto owner = submissions.owner(*j.submission_id);
        if (owner) events.publish(submission_event(*owner, *j.submission_id, get_display_message(verdict)));
    } catch (std::exception &ex) {
        LOG(WARNING) << "Unable to find owner of submission " << *j.submission_id << ": " << ex.what();
    }
}

}  // namespace codebox
