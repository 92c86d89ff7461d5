#include "language.hpp"
#include <boost/algorithm/string.hpp>
#include <regex>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"

namespace codebox {
using namespace std;

static const string JAVA_FLAGS = "-Djava.security.egd=file:/dev/./urandom";

static string expand(string text, const string &entry, const string &source) {
    boost::replace_all(text, "{entry}", entry);
    boost::replace_all(text, "{source}", source);
    return text;
}

static string normalize_id(const string &id) {
    return boost::to_lower_copy(boost::trim_copy(id));
}

string language_profile::entry_point(const string &source) const {
    if (!entry_from_declared_class) return default_entry;
    static const regex declared_class(R"(public\s+class\s+(\w+))");
    smatch matches;
    if (regex_search(source, matches, declared_class))
        return assert_safe_path(matches[1].str());
    return default_entry;
}

string language_profile::source_file(const string &entry) const {
    return expand(source_filename, entry, "");
}

vector<string> language_profile::compile_args(const string &entry) const {
    if (!compile_command) return {};
    return {"bash", "-c", expand(*compile_command, entry, source_file(entry))};
}

vector<string> language_profile::run_args(const string &entry) const {
    vector<string> args;
    for (auto &arg : run_command)
        args.push_back(expand(arg, entry, source_file(entry)));
    return args;
}

vector<string> language_profile::warmup_args() const {
    if (!warmup_command) return {};
    return {"bash", "-c", *warmup_command};
}

language_registry::language_registry(vector<language_profile> profiles)
    : list(move(profiles)) {
    for (size_t i = 0; i < list.size(); ++i) {
        index[normalize_id(list[i].id)] = i;
        for (auto &alias : list[i].aliases)
            index[normalize_id(alias)] = i;
    }
}

language_registry language_registry::builtin(const server::language_config &config) {
    chrono::milliseconds compile_timeout(config.compile_timeout_ms);

    language_profile python;
    python.id = "python";
    python.aliases = {"py", "python3"};
    python.image = config.python_image;
    python.source_filename = "main.py";
    python.run_command = {"python", "{source}"};
    python.compile_timeout = compile_timeout;
    python.run_timeout = chrono::milliseconds(config.run_timeout_ms);

    language_profile cpp;
    cpp.id = "cpp";
    cpp.aliases = {"c++"};
    cpp.image = config.cpp_image;
    cpp.source_filename = "main.cpp";
    cpp.compile_command = "g++ -O2 -std=c++17 {source} -o main && echo __COMPILED__";
    cpp.run_command = {"./main"};
    cpp.compile_timeout = compile_timeout;
    cpp.run_timeout = chrono::milliseconds(config.run_timeout_ms);

    language_profile java;
    java.id = "java";
    java.image = config.java_image;
    java.source_filename = "{entry}.java";
    java.compile_command = "javac -J" + JAVA_FLAGS + " -d . {source} && echo __COMPILED__";
    java.run_command = {"java", JAVA_FLAGS, "-Xms16m", "-Xmx256m", "-XX:+UseSerialGC", "-cp", ".", "{entry}"};
    java.compile_timeout = compile_timeout;
    java.run_timeout = chrono::milliseconds(config.java_run_timeout_ms);
    java.warmup_command = "echo 'class _W{public static void main(String[]a){}}' > _W.java && javac -J" + JAVA_FLAGS +
                          " -d . _W.java && java " + JAVA_FLAGS + " -cp . _W";
    java.entry_from_declared_class = true;
    java.default_entry = "Main";

    return language_registry({python, cpp, java});
}

const language_profile *language_registry::find(const string &id) const {
    auto it = index.find(normalize_id(id));
    if (it == index.end()) return nullptr;
    return &list[it->second];
}

const language_profile &language_registry::at(const string &id) const {
    if (auto profile = find(id)) return *profile;
    throw unsupported_language(id);
}

const vector<language_profile> &language_registry::profiles() const {
    return list;
}

}  // namespace codebox
