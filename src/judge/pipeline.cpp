#include "judge/pipeline.hpp"
#include <glog/logging.h>
#include <regex>
#include "common/defer.hpp"
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/utils.hpp"
#include "telemetry.hpp"

namespace codebox {
using namespace std;
namespace fs = std::filesystem;

static const string COMPILED_SENTINEL = "__COMPILED__";
static const string STDIN_FILE = "stdin.txt";
static const string TIME_FILE = "time.txt";

const char *get_display_message(execution_outcome outcome) {
    switch (outcome) {
        case execution_outcome::success: return "success";
        case execution_outcome::compilation_error: return "compilation_error";
        case execution_outcome::time_limit_exceeded: return "time_limit_exceeded";
        case execution_outcome::runtime_error: return "runtime_error";
        case execution_outcome::server_error: return "server_error";
        case execution_outcome::cancelled: return "cancelled";
    }
    return "server_error";
}

execution_outcome execution_result::outcome() const {
    if (system_error) return execution_outcome::server_error;
    if (cancelled) return execution_outcome::cancelled;
    if (compile_failed) return execution_outcome::compilation_error;
    if (timed_out) return execution_outcome::time_limit_exceeded;
    if (exit_code != 0 || !std_err.empty()) return execution_outcome::runtime_error;
    return execution_outcome::success;
}

void to_json(nlohmann::json &j, const execution_result &result) {
    j = {{"stdout", result.std_out},
         {"stderr", result.std_err},
         {"output", result.std_out},
         {"exitCode", result.exit_code},
         {"runtimeMs", result.runtime_ms},
         {"memoryKb", nullptr},
         {"compileFailed", result.compile_failed},
         {"timedOut", result.timed_out},
         {"status", get_display_message(result.outcome())},
         {"backend", result.backend}};
    if (result.peak_memory_kb) j["memoryKb"] = *result.peak_memory_kb;
}

pipeline::pipeline(const language_registry &languages,
                   const sandbox &box,
                   process_runner &runner,
                   sandbox_limits limits,
                   fs::path run_dir,
                   warm_pool *warmer)
    : languages(languages), box(box), runner(runner), limits(move(limits)), run_dir(move(run_dir)), warmer(warmer) {}

process_result pipeline::run_stage(const language_profile &profile,
                                   const fs::path &workspace,
                                   const vector<string> &args,
                                   chrono::milliseconds timeout,
                                   const string &name,
                                   const cancel_token *cancel) const {
    auto result = runner.run(box.build(profile.image, workspace, args, limits, name), "", timeout, cancel);
    if (result.timed_out || result.cancelled) box.reap(name, runner);
    if (result.spawn_failed)
        throw internal_error("unable to start " + box.type() + " sandbox: " + result.std_err);
    return result;
}

static execution_result cancelled_result(long long runtime_ms) {
    execution_result result;
    result.backend = "local";
    result.cancelled = true;
    result.exit_code = 130;
    result.std_err = "Execution cancelled";
    result.runtime_ms = runtime_ms;
    return result;
}

execution_result pipeline::execute(const execution_request &request, const cancel_token *cancel) const {
    const language_profile &profile = languages.at(request.language);
    if (cancel && cancel->cancelled()) return cancelled_result(0);

    fs::path workspace = make_temp_directory(run_dir, "job-");
    defer {
        error_code ec;
        fs::remove_all(workspace, ec);
        if (ec) LOG(WARNING) << "Unable to remove workspace " << workspace << ": " << ec.message();
    };

    string source = unescape_html(request.code);
    string entry = profile.entry_point(source);
    write_file_content(workspace / profile.source_file(entry), source);
    write_file_content(workspace / STDIN_FILE, request.input);

    // 容器名需要在所有并发任务中唯一，工作目录名由 mkdtemp 保证唯一
    string name = "codebox-" + workspace.filename().string();

    execution_result result;
    result.backend = "local";

    auto compile_args = profile.compile_args(entry);
    if (!compile_args.empty()) {
        auto compiled = run_stage(profile, workspace, compile_args, profile.compile_timeout, name + "-compile", cancel);
        if (compiled.cancelled) return cancelled_result(compiled.runtime_ms);
        if (compiled.exit_code != 0 || compiled.std_out.find(COMPILED_SENTINEL) == string::npos) {
            DLOG(INFO) << "Compilation of " << profile.id << " failed with exit code " << compiled.exit_code;
            result.compile_failed = true;
            result.exit_code = compiled.exit_code == 0 ? 1 : compiled.exit_code;
            result.runtime_ms = compiled.runtime_ms;
            if (!compiled.std_err.empty())
                result.std_err = compiled.std_err;
            else if (!compiled.std_out.empty())
                result.std_err = compiled.std_out;
            else
                result.std_err = "Compilation failed";
            return result;
        }
    }

    if (warmer) warmer->warm(profile);
    if (cancel && cancel->cancelled()) return cancelled_result(0);

    auto timeout = request.timeout.value_or(profile.run_timeout);
    string command = shell_join(profile.run_args(entry)) + " < " + STDIN_FILE;
    auto executed = run_stage(profile, workspace, {"bash", "-c", "/usr/bin/time -v -o " + TIME_FILE + " " + command},
                              timeout, name, cancel);

    // 只认 shell 报告 /usr/bin/time 本身不存在的错误
    static const regex time_missing(R"((^|\n)(ba)?sh(: line \d+|: \d+)?: /usr/bin/time: (No such file or directory|not found))");
    if (executed.exit_code == 127 && regex_search(executed.std_err, time_missing)) {
        LOG(WARNING) << "/usr/bin/time is not available in " << profile.image << ", running without resource report";
        executed = run_stage(profile, workspace, {"bash", "-c", command}, timeout, name + "-plain", cancel);
    }

    if (executed.cancelled) return cancelled_result(executed.runtime_ms);

    result.std_out = move(executed.std_out);
    result.std_err = move(executed.std_err);
    result.exit_code = executed.exit_code;
    result.timed_out = executed.timed_out;
    result.runtime_ms = executed.runtime_ms;

    if (!executed.timed_out) {
        auto usage = read_resource_usage(workspace / TIME_FILE);
        result.peak_memory_kb = usage.peak_memory_kb;
        if (usage.cpu_time_ms) result.runtime_ms = *usage.cpu_time_ms;
    }
    return result;
}

}  // namespace codebox
