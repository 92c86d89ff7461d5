#include "executor/executor.hpp"
#include <glog/logging.h>
#include <boost/algorithm/string/join.hpp>

namespace codebox {
using namespace std;

best_effort_executor::best_effort_executor(vector<unique_ptr<executor>> backends)
    : backends(move(backends)) {}

string best_effort_executor::name() const {
    return "best-effort";
}

size_t best_effort_executor::size() const {
    return backends.size();
}

execution_result best_effort_executor::execute(const execution_request &request, const cancel_token *cancel) {
    vector<string> failures;
    for (auto &backend : backends) {
        if (cancel && cancel->cancelled()) {
            execution_result result;
            result.cancelled = true;
            result.exit_code = 130;
            result.std_err = "Execution cancelled";
            result.backend = backend->name();
            return result;
        }

        try {
            execution_result result = backend->execute(request, cancel);
            if (result.system_error) {
                LOG(WARNING) << "Executor " << backend->name() << " reported a server error: " << result.std_err;
                failures.push_back(backend->name() + ": " + result.std_err);
                continue;
            }
            if (result.backend.empty()) result.backend = backend->name();
            return result;
        } catch (std::exception &ex) {
            LOG(WARNING) << "Executor " << backend->name() << " is unavailable for " << request.language << ": " << ex.what();
            failures.push_back(backend->name() + ": " + ex.what());
        }
    }

    LOG(ERROR) << "All executors failed for " << request.language;
    execution_result result;
    result.system_error = true;
    result.exit_code = 1;
    result.backend = "none";
    result.std_err = failures.empty()
                         ? "No execution backend is configured"
                         : "All execution backends failed: " + boost::algorithm::join(failures, "; ");
    return result;
}

}  // namespace codebox
