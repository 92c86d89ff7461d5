#include "executor/executor.hpp"
#include <glog/logging.h>
#include "common/exceptions.hpp"
#include "common/json_utils.hpp"
#include "executor/http_client.hpp"

namespace codebox {
using namespace std;

remote_executor::remote_executor(string base_url, chrono::milliseconds timeout)
    : base_url(move(base_url)), timeout(timeout) {}

string remote_executor::name() const {
    return "remote";
}

execution_result remote_executor::parse_response(const nlohmann::json &response) {
    const nlohmann::json &j = nlohmann::exists(response, "data") && response.at("data").is_object()
                                  ? response.at("data")
                                  : response;
    if (!nlohmann::exists(j, "stdout") && !nlohmann::exists(j, "output"))
        throw network_error("malformed response from remote executor: " + response.dump().substr(0, 200));

    execution_result result;
    result.backend = "remote";
    if (nlohmann::exists(j, "stdout"))
        get_value_if_exists(j, "stdout", result.std_out);
    else
        get_value_if_exists(j, "output", result.std_out);
    if (nlohmann::exists(j, "stderr"))
        get_value_if_exists(j, "stderr", result.std_err);
    else
        get_value_if_exists(j, "error", result.std_err);
    get_value_if_exists(j, "exitCode", result.exit_code);
    get_value_if_exists(j, "compileFailed", result.compile_failed);
    get_value_if_exists(j, "timedOut", result.timed_out);

    if (nlohmann::exists(j, "runtimeMs"))
        result.runtime_ms = parse_runtime_ms(j.at("runtimeMs")).value_or(0);
    else if (nlohmann::exists(j, "runtime"))
        result.runtime_ms = parse_runtime_ms(j.at("runtime")).value_or(0);

    if (nlohmann::exists(j, "memoryKb"))
        result.peak_memory_kb = parse_memory_kb(j.at("memoryKb"));
    else if (nlohmann::exists(j, "memory"))
        result.peak_memory_kb = parse_memory_kb(j.at("memory"));

    string status;
    get_value_if_exists(j, "status", status);
    if (status == "server_error") result.system_error = true;
    if (status == "cancelled") result.cancelled = true;
    return result;
}

execution_result remote_executor::execute(const execution_request &request, const cancel_token *) {
    nlohmann::json body = {{"code", request.code},
                           {"language", request.language},
                           {"input", request.input}};
    if (request.timeout) body["timeoutMs"] = request.timeout->count();

    DLOG(INFO) << "Sending " << request.language << " job to remote executor " << base_url;
    auto response = http_post_json(base_url + "/execute", body.dump(), timeout);
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(response.body);
    } catch (nlohmann::json::exception &ex) {
        throw network_error(string("unable to parse response from remote executor: ") + ex.what());
    }
    return parse_response(j);
}

}  // namespace codebox
