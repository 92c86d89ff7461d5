#include "executor/executor.hpp"
#include <glog/logging.h>
#include "common/exceptions.hpp"
#include "common/json_utils.hpp"
#include "common/utils.hpp"
#include "executor/http_client.hpp"

namespace codebox {
using namespace std;

piston_executor::piston_executor(string base_url, map<string, string> versions, chrono::milliseconds timeout)
    : base_url(move(base_url)), versions(move(versions)), timeout(timeout) {}

string piston_executor::name() const {
    return "piston";
}

nlohmann::json piston_executor::build_request(const execution_request &request) const {
    auto version = versions.find(request.language);
    if (version == versions.end()) throw unsupported_language(request.language);

    return {{"language", request.language},
            {"version", version->second},
            {"files", nlohmann::json::array({{{"content", unescape_html(request.code)}}})},
            {"stdin", request.input},
            {"args", nlohmann::json::array()},
            {"compile_timeout", 10000},
            {"run_timeout", request.timeout.value_or(chrono::milliseconds(8000)).count()}};
}

execution_result piston_executor::parse_response(const nlohmann::json &response) {
    if (!nlohmann::exists(response, "run") || !response.at("run").is_object())
        throw network_error("malformed response from piston: " + response.dump().substr(0, 200));

    execution_result result;
    result.backend = "piston";

    if (nlohmann::exists(response, "compile")) {
        auto &compile = response.at("compile");
        int code = 0;
        string compile_signal;
        get_value_if_exists(compile, "code", code);
        get_value_if_exists(compile, "signal", compile_signal);
        if (code == 0 && !compile_signal.empty()) code = 1;
        if (code != 0) {
            result.compile_failed = true;
            result.exit_code = code;
            get_value_if_exists(compile, "stderr", result.std_err);
            if (result.std_err.empty()) get_value_if_exists(compile, "output", result.std_err);
            if (result.std_err.empty()) result.std_err = "Compilation failed";
            return result;
        }
    }

    auto &run = response.at("run");
    get_value_if_exists(run, "stdout", result.std_out);
    get_value_if_exists(run, "stderr", result.std_err);
    get_value_if_exists(run, "code", result.exit_code);

    string signal;
    get_value_if_exists(run, "signal", signal);
    if (signal == "SIGKILL" && result.exit_code == 0) {
        // piston 超时时只返回 signal，没有返回值
        result.timed_out = true;
        result.exit_code = 124;
        if (result.std_err.empty()) result.std_err = "Time limit exceeded";
    } else if (!signal.empty() && result.exit_code == 0) {
        result.exit_code = 1;
    }

    if (run.count("cpu_time")) result.runtime_ms = parse_runtime_ms(run.at("cpu_time")).value_or(0);
    else if (run.count("wall_time")) result.runtime_ms = parse_runtime_ms(run.at("wall_time")).value_or(0);
    if (run.count("memory") && run.at("memory").is_number())
        result.peak_memory_kb = run.at("memory").get<long long>() / 1024;
    return result;
}

execution_result piston_executor::execute(const execution_request &request, const cancel_token *) {
    auto body = build_request(request);
    DLOG(INFO) << "Sending " << request.language << " job to piston " << base_url;
    auto response = http_post_json(base_url + "/execute", body.dump(), timeout);
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(response.body);
    } catch (nlohmann::json::exception &ex) {
        throw network_error(string("unable to parse response from piston: ") + ex.what());
    }
    return parse_response(j);
}

}  // namespace codebox
