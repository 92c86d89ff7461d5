#include "judge/warm_pool.hpp"
#include <glog/logging.h>
#include "common/defer.hpp"
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"

namespace codebox {
using namespace std;

warm_pool::warm_pool(const sandbox &box, process_runner &runner, sandbox_limits limits, filesystem::path run_dir)
    : box(box), runner(runner), limits(move(limits)), run_dir(move(run_dir)) {}

void warm_pool::warm(const language_profile &profile) {
    if (!profile.warmup_command) return;

    once_flag *flag;
    {
        lock_guard<mutex> guard(mut);
        auto &f = flags[profile.id];
        if (!f) f = make_unique<once_flag>();
        flag = f.get();
    }
    call_once(*flag, [&] { run_warmup(profile); });
}

bool warm_pool::warmed(const string &language) const {
    lock_guard<mutex> guard(mut);
    auto it = done.find(language);
    return it != done.end() && it->second;
}

void warm_pool::run_warmup(const language_profile &profile) {
    try {
        auto workspace = make_temp_directory(run_dir, "warm-");
        defer {
            error_code ec;
            filesystem::remove_all(workspace, ec);
        };

        LOG(INFO) << "Warming up " << profile.id << " in " << workspace;
        string name = "codebox-" + workspace.filename().string();
        auto result = runner.run(box.build(profile.image, workspace, profile.warmup_args(), limits, name),
                                 "", profile.compile_timeout);
        if (result.timed_out) box.reap(name, runner);
        if (result.exit_code != 0)
            LOG(WARNING) << "Warm-up of " << profile.id << " exited with " << result.exit_code << ": " << result.std_err;
    } catch (codebox_exception &ex) {
        LOG(WARNING) << "Warm-up of " << profile.id << " failed: " << ex.what();
    }

    lock_guard<mutex> guard(mut);
    done[profile.id] = true;
}

}  // namespace codebox
