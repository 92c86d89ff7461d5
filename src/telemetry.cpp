#include "telemetry.hpp"
#include <boost/algorithm/string.hpp>
#include <boost/lexical_cast.hpp>
#include <cmath>
#include <sstream>
#include <vector>
#include "common/io_utils.hpp"

namespace codebox {
using namespace std;

map<string, string> read_metadata(const string &content) {
    map<string, string> mp;
    istringstream fin(content);
    string line;
    while (getline(fin, line)) {
        // "Elapsed (wall clock) time (h:mm:ss or m:ss): 0:00.01" 的键中也有冒号，因此查找 ": "
        size_t end = line.find(": ");
        if (end == string::npos) continue;
        string key = boost::trim_copy(line.substr(0, end));
        string value = boost::trim_copy(line.substr(end + 2));
        mp[key] = value;
    }
    return mp;
}

template <typename T>
optional<T> try_to_parse(const map<string, string> &metadata, const string &key) {
    auto it = metadata.find(key);
    if (it == metadata.end()) return nullopt;
    try {
        return boost::lexical_cast<T>(it->second);
    } catch (boost::bad_lexical_cast &) {
        return nullopt;
    }
}

/**
 * @brief 解析 h:mm:ss 或者 m:ss.ss 格式的时间
 */
static optional<double> parse_clock(const string &text) {
    vector<string> parts;
    boost::split(parts, text, boost::is_any_of(":"));
    double seconds = 0;
    try {
        for (auto &part : parts)
            seconds = seconds * 60 + boost::lexical_cast<double>(part);
    } catch (boost::bad_lexical_cast &) {
        return nullopt;
    }
    return seconds;
}

resource_usage parse_resource_usage(const string &report) {
    auto metadata = read_metadata(report);
    resource_usage usage;
    usage.peak_memory_kb = try_to_parse<long long>(metadata, "Maximum resident set size (kbytes)");
    usage.exit_status = try_to_parse<int>(metadata, "Exit status");

    auto user = try_to_parse<double>(metadata, "User time (seconds)");
    auto sys = try_to_parse<double>(metadata, "System time (seconds)");
    if (user && sys)
        usage.cpu_time_ms = llround((*user + *sys) * 1000);

    for (auto &[key, value] : metadata)
        if (boost::starts_with(key, "Elapsed (wall clock) time"))
            usage.wall_time = parse_clock(value);
    return usage;
}

resource_usage read_resource_usage(const filesystem::path &report_file) {
    return parse_resource_usage(read_file_content(report_file, ""));
}

}  // namespace codebox
