#include "executor/executor.hpp"
#include <boost/algorithm/string.hpp>
#include <cmath>
#include <regex>

namespace codebox {
using namespace std;

local_executor::local_executor(const pipeline &runner) : runner(runner) {}

string local_executor::name() const {
    return "local";
}

execution_result local_executor::execute(const execution_request &request, const cancel_token *cancel) {
    return runner.execute(request, cancel);
}

optional<long long> parse_runtime_ms(const nlohmann::json &value) {
    if (value.is_number()) return llround(value.get<double>());
    if (!value.is_string()) return nullopt;

    string text = boost::trim_copy(value.get<string>());
    static const regex plain(R"(^([0-9]+(?:\.[0-9]+)?)$)");
    static const regex millis(R"(([0-9]+(?:\.[0-9]+)?)\s*ms)", regex::icase);
    static const regex seconds(R"(([0-9]+(?:\.[0-9]+)?)\s*s(ec)?)", regex::icase);
    smatch matches;
    if (regex_search(text, matches, plain)) return llround(stod(matches[1].str()));
    if (regex_search(text, matches, millis)) return llround(stod(matches[1].str()));
    if (regex_search(text, matches, seconds)) return llround(stod(matches[1].str()) * 1000);
    return nullopt;
}

optional<long long> parse_memory_kb(const nlohmann::json &value) {
    if (value.is_number()) return llround(value.get<double>());
    if (!value.is_string()) return nullopt;

    string text = boost::trim_copy(value.get<string>());
    static const regex amount(R"(^([0-9]+(?:\.[0-9]+)?)\s*([a-z]*)$)", regex::icase);
    smatch matches;
    if (!regex_search(text, matches, amount)) return nullopt;
    double number = stod(matches[1].str());
    string unit = boost::to_lower_copy(matches[2].str());
    if (unit.empty() || unit == "k" || unit == "kb" || unit == "kib") return llround(number);
    if (unit == "m" || unit == "mb" || unit == "mib") return llround(number * 1024);
    if (unit == "g" || unit == "gb" || unit == "gib") return llround(number * 1024 * 1024);
    if (unit == "b" || unit == "bytes") return llround(number / 1024);
    return nullopt;
}

}  // namespace codebox
