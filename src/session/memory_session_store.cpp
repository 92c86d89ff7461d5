#include <glog/logging.h>
#include <algorithm>
#include "common/utils.hpp"
#include "session/session_store.hpp"

namespace codebox {
using namespace std;

void memory_session_store::create(const session &s) {
    lock_guard<mutex> guard(mut);
    auto it = sessions.find(s.session_id);
    if (it == sessions.end()) {
        session record = s;
        long long now = now_millis();
        if (record.created_at == 0) record.created_at = now;
        record.updated_at = now;
        sessions.emplace(s.session_id, move(record));
        return;
    }

    session &current = it->second;
    if (is_terminal(current.status)) {
        LOG(WARNING) << "Dropped write to terminal session " << s.session_id;
        return;
    }
    // 覆盖整条记录，但是进度不能回退
    session record = s;
    record.created_at = current.created_at;
    record.updated_at = now_millis();
    if (record.progress && current.progress)
        record.progress->current = clamp(max(record.progress->current, current.progress->current), 0, record.progress->total);
    current = move(record);
}

void memory_session_store::patch(const string &session_id, const session_patch &patch) {
    lock_guard<mutex> guard(mut);
    auto [it, inserted] = sessions.try_emplace(session_id);
    if (inserted) it->second.session_id = session_id;
    if (!merge_session(it->second, patch, now_millis()))
        LOG(WARNING) << "Dropped write to terminal session " << session_id;
}

optional<session> memory_session_store::get(const string &session_id) {
    lock_guard<mutex> guard(mut);
    auto it = sessions.find(session_id);
    if (it == sessions.end()) return nullopt;
    return it->second;
}

}  // namespace codebox
