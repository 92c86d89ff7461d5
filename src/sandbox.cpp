#include "sandbox.hpp"
#include <glog/logging.h>

namespace codebox {
using namespace std;

string docker_sandbox::type() const {
    return "docker";
}

vector<string> docker_sandbox::build(const string &image,
                                     const filesystem::path &workspace,
                                     const vector<string> &args,
                                     const sandbox_limits &limits,
                                     const string &name) const {
    vector<string> command = {
        "docker", "run", "--rm",
        "--name", name,
        "--network", "none",
        "--cpus", limits.cpus,
        "--memory", limits.memory,
        "--pids-limit", to_string(limits.pids_limit),
        "-v", workspace.string() + ":/code:rw",
        "-w", "/code",
        image};
    command.insert(command.end(), args.begin(), args.end());
    return command;
}

void docker_sandbox::reap(const string &name, process_runner &runner) const {
    // 杀死 docker 客户端并不会停止容器
    auto result = runner.run({"docker", "rm", "-f", name}, "", chrono::seconds(10));
    if (result.exit_code != 0)
        LOG(WARNING) << "Unable to remove container " << name << ": " << result.std_err;
}

string direct_sandbox::type() const {
    return "direct";
}

vector<string> direct_sandbox::build(const string &,
                                     const filesystem::path &workspace,
                                     const vector<string> &args,
                                     const sandbox_limits &,
                                     const string &) const {
    vector<string> command = {"/bin/sh", "-c", "cd \"$0\" && exec \"$@\"", workspace.string()};
    command.insert(command.end(), args.begin(), args.end());
    return command;
}

void direct_sandbox::reap(const string &, process_runner &) const {
    // 进程组已经被杀死，没有需要清理的内容
}

}  // namespace codebox
