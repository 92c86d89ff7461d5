#include "common/io_utils.hpp"
#include <fmt/format.h>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <vector>
#include "common/exceptions.hpp"

namespace codebox {
using namespace std;
namespace fs = std::filesystem;

string read_file_content(fs::path const &path) {
    ifstream fin(path.string());
    string str((istreambuf_iterator<char>(fin)),
               (istreambuf_iterator<char>()));
    return str;
}

string read_file_content(fs::path const &path, const string &def) {
    if (!fs::exists(path)) {
        return def;
    } else {
        return read_file_content(path);
    }
}

void write_file_content(const fs::path &path, const string &content) {
    ofstream fout(path.string(), ios::binary | ios::trunc);
    if (!fout) throw internal_error("unable to open " + path.string() + " for writing");
    fout << content;
    if (!fout) throw internal_error("unable to write " + path.string());
}

string assert_safe_path(const string &subpath) {
    if (subpath.empty() || subpath.find("..") != string::npos || subpath.find('/') != string::npos)
        throw invalid_request("subpath is not safe " + subpath);
    return subpath;
}

fs::path make_temp_directory(const fs::path &parent, const string &prefix) {
    error_code ec;
    fs::create_directories(parent, ec);
    if (ec) throw internal_error(fmt::format("unable to create directory {}: {}", parent.string(), ec.message()));

    string pattern = (parent / (prefix + "XXXXXX")).string();
    vector<char> buffer(pattern.begin(), pattern.end());
    buffer.push_back('\0');
    if (!mkdtemp(buffer.data()))
        throw internal_error(fmt::format("unable to create workspace under {}: {}", parent.string(), strerror(errno)));
    return fs::path(buffer.data());
}

}  // namespace codebox
