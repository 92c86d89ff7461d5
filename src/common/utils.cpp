#include "common/utils.hpp"
#include <boost/algorithm/string/replace.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <cstdlib>

namespace codebox {
using namespace std;

string get_env(const string &key, const string &def_value) {
    char *result = getenv(key.c_str());
    return !result || !*result ? def_value : string(result);
}

void set_env(const string &key, const string &value, bool replace) {
    setenv(key.c_str(), value.c_str(), replace);
}

string unescape_html(const string &text) {
    string result = text;
    boost::replace_all(result, "&lt;", "<");
    boost::replace_all(result, "&gt;", ">");
    boost::replace_all(result, "&quot;", "\"");
    boost::replace_all(result, "&#39;", "'");
    boost::replace_all(result, "&amp;", "&");
    return result;
}

string shell_quote(const string &arg) {
    string result = "'";
    for (char c : arg) {
        if (c == '\'')
            result += "'\\''";
        else
            result += c;
    }
    result += '\'';
    return result;
}

string shell_join(const vector<string> &args) {
    string result;
    for (size_t i = 0; i < args.size(); ++i) {
        if (i > 0) result += ' ';
        result += shell_quote(args[i]);
    }
    return result;
}

string generate_uuid() {
    // random_generator 不是线程安全的
    thread_local boost::uuids::random_generator generator;
    return boost::uuids::to_string(generator());
}

long long now_millis() {
    return chrono::duration_cast<chrono::milliseconds>(chrono::system_clock::now().time_since_epoch()).count();
}

elapsed_time::elapsed_time() {
    start = chrono::steady_clock::now();
}

}  // namespace codebox
