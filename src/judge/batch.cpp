#include "judge/batch.hpp"
#include <glog/logging.h>
#include <boost/algorithm/string.hpp>
#include <regex>
#include "common/json_utils.hpp"

namespace codebox {
using namespace std;

compare_mode parse_compare_mode(const string &text) {
    return boost::iequals(boost::trim_copy(text), "strict") ? compare_mode::strict : compare_mode::relaxed;
}

string normalize_relaxed(const string &text) {
    static const regex whitespace(R"(\s+)");
    string unified = boost::replace_all_copy(text, "\r\n", "\n");
    vector<string> lines;
    boost::split(lines, unified, boost::is_any_of("\n"));

    string result;
    for (auto &line : lines) {
        string collapsed = boost::trim_copy(regex_replace(line, whitespace, " "));
        if (collapsed.empty()) continue;
        if (!result.empty()) result += '\n';
        result += collapsed;
    }
    return boost::to_lower_copy(result);
}

string normalize_strict(const string &text) {
    return boost::trim_copy(boost::replace_all_copy(text, "\r\n", "\n"));
}

bool outputs_match(const string &actual, const string &expected, compare_mode mode) {
    if (mode == compare_mode::strict)
        return normalize_strict(actual) == normalize_strict(expected);
    return normalize_relaxed(actual) == normalize_relaxed(expected);
}

void from_json(const nlohmann::json &j, test_case &tc) {
    get_value_if_exists(j, "input", tc.input);
    get_value_if_exists(j, "expectedOutput", tc.expected_output);
    get_value_if_exists(j, "isHidden", tc.hidden);
}

void to_json(nlohmann::json &j, const case_result &result) {
    j = {{"input", result.test.hidden ? "" : result.test.input},
         {"expectedOutput", result.test.hidden ? "" : result.test.expected_output},
         {"actualOutput", result.actual_output},
         {"passed", result.passed},
         {"isHidden", result.test.hidden},
         {"runtimeMs", result.runtime_ms}};
    if (result.error) j["error"] = *result.error;
    if (result.memory_kb) j["memoryKb"] = *result.memory_kb;
}

batch_runner::batch_runner(executor &exec) : exec(exec) {}

batch_result batch_runner::run(const string &code,
                               const string &language,
                               const vector<test_case> &cases,
                               compare_mode mode,
                               const progress_callback &on_progress,
                               const cancel_token *cancel) {
    batch_result batch;
    batch.total_tests = (int)cases.size();
    bool had_error = false;
    bool had_server_error = false;

    for (size_t i = 0; i < cases.size(); ++i) {
        if (cancel && cancel->cancelled()) {
            batch.cancelled = true;
            break;
        }

        execution_request request;
        request.code = code;
        request.language = language;
        request.input = cases[i].input;
        execution_result result = exec.execute(request, cancel);
        if (result.cancelled) {
            batch.cancelled = true;
            break;
        }

        case_result current;
        current.test = cases[i];
        current.actual_output = result.std_out;
        current.runtime_ms = result.runtime_ms;
        current.memory_kb = result.peak_memory_kb;
        if (result.outcome() != execution_outcome::success) {
            had_error = true;
            if (result.outcome() == execution_outcome::server_error) had_server_error = true;
            current.error = result.std_err.empty() ? string(get_display_message(result.outcome())) : result.std_err;
        } else {
            current.passed = outputs_match(result.std_out, cases[i].expected_output, mode);
        }
        DLOG(INFO) << "Test case " << i + 1 << "/" << cases.size() << (current.passed ? " passed" : " failed")
                   << " (" << get_display_message(result.outcome()) << ")";

        if (current.passed) ++batch.tests_passed;
        batch.runtime_ms += current.runtime_ms;
        batch.cases.push_back(move(current));

        if (on_progress) on_progress((int)i + 1, batch.total_tests);
    }

    if (batch.tests_passed == batch.total_tests && !had_error)
        batch.status = submission_status::ACCEPTED;
    else if (had_server_error)
        batch.status = submission_status::SERVER_ERROR;
    else if (had_error)
        batch.status = submission_status::RUNTIME_ERROR;
    else
        batch.status = submission_status::WRONG_ANSWER;
    return batch;
}

}  // namespace codebox
