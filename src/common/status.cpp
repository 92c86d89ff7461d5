#include "common/status.hpp"
#include <boost/assign.hpp>
#include <unordered_map>

namespace codebox {
using namespace std;

// clang-format off
static const unordered_map<submission_status, const char *> status_string = boost::assign::map_list_of
    (submission_status::QUEUED, "Queued")
    (submission_status::RUNNING, "Running")
    (submission_status::COMPLETED, "Completed")
    (submission_status::COMPILATION_ERROR, "Compilation Error")
    (submission_status::TIME_LIMIT_EXCEEDED, "Time Limit Exceeded")
    (submission_status::RUNTIME_ERROR, "Runtime Error")
    (submission_status::ACCEPTED, "Accepted")
    (submission_status::WRONG_ANSWER, "Wrong Answer")
    (submission_status::SERVER_ERROR, "Server Error")
    (submission_status::CANCELLED, "Cancelled");
// clang-format on

const char *get_display_message(submission_status stat) {
    return status_string.at(stat);
}

}  // namespace codebox
