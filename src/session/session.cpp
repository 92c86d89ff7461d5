#include "session/session.hpp"
#include <algorithm>
#include <stdexcept>

namespace codebox {
using namespace std;

const char *get_display_message(session_status status) {
    switch (status) {
        case session_status::queued: return "queued";
        case session_status::running: return "running";
        case session_status::completed: return "completed";
        case session_status::error: return "error";
    }
    return "error";
}

session_status parse_session_status(const string &text) {
    if (text == "queued") return session_status::queued;
    if (text == "running") return session_status::running;
    if (text == "completed") return session_status::completed;
    if (text == "error") return session_status::error;
    throw out_of_range("unknown session status " + text);
}

bool is_terminal(session_status status) {
    return status == session_status::completed || status == session_status::error;
}

session_patch session_patch::from(const session &s) {
    session_patch patch;
    patch.submission_id = s.submission_id;
    patch.status = s.status;
    patch.language = s.language;
    patch.progress = s.progress;
    patch.result = s.result;
    return patch;
}

bool merge_session(session &current, const session_patch &patch, long long now) {
    if (is_terminal(current.status)) return false;

    if (patch.submission_id) current.submission_id = patch.submission_id;
    if (patch.status) current.status = *patch.status;
    if (patch.language) current.language = *patch.language;
    if (patch.result) current.result = patch.result;
    if (patch.progress) {
        session_progress next = *patch.progress;
        if (current.progress) next.current = max(next.current, current.progress->current);
        next.current = clamp(next.current, 0, max(next.total, 0));
        current.progress = next;
    }
    if (current.created_at == 0) current.created_at = now;
    current.updated_at = now;
    return true;
}

nlohmann::json project(const optional<session> &s) {
    if (!s) return {{"status", "not_found"}, {"error", "Session not found"}};
    if (is_terminal(s->status)) {
        if (s->result) return *s->result;
        return {{"status", get_display_message(s->status)}};
    }
    nlohmann::json j = {{"status", get_display_message(s->status)}};
    if (s->progress) j["progress"] = *s->progress;
    return j;
}

void to_json(nlohmann::json &j, const session_progress &progress) {
    j = {{"current", progress.current}, {"total", progress.total}};
}

void from_json(const nlohmann::json &j, session_progress &progress) {
    j.at("current").get_to(progress.current);
    j.at("total").get_to(progress.total);
}

void to_json(nlohmann::json &j, const session &s) {
    j = {{"sessionId", s.session_id},
         {"status", get_display_message(s.status)},
         {"language", s.language},
         {"createdAt", s.created_at},
         {"updatedAt", s.updated_at}};
    if (s.submission_id) j["submissionId"] = *s.submission_id;
    if (s.progress) j["progress"] = *s.progress;
    if (s.result) j["result"] = *s.result;
}

}  // namespace codebox
