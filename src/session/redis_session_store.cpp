#include "session/redis_session_store.hpp"
#include <glog/logging.h>
#include <boost/lexical_cast.hpp>
#include <map>
#include "common/exceptions.hpp"
#include "common/utils.hpp"

namespace codebox {
using namespace std;

// KEYS[1] = 会话键，ARGV = ttl, now, mode, field1, value1, ...
// 返回 0 表示会话已经终止，写入被丢弃
static const char *WRITE_SESSION_SCRIPT = R"lua(
local key = KEYS[1]
local ttl = tonumber(ARGV[1])
local now = ARGV[2]
local status = redis.call('HGET', key, 'status')
if status == 'completed' or status == 'error' then
  return 0
end
local previous = tonumber(redis.call('HGET', key, 'progressCurrent') or '0') or 0
local created = redis.call('HGET', key, 'createdAt')
if ARGV[3] == 'replace' then
  redis.call('DEL', key)
end
for i = 4, #ARGV, 2 do
  local field, value = ARGV[i], ARGV[i + 1]
  if field == 'progressCurrent' and tonumber(value) < previous then
    value = tostring(previous)
  end
  redis.call('HSET', key, field, value)
end
local current = tonumber(redis.call('HGET', key, 'progressCurrent') or '')
local total = tonumber(redis.call('HGET', key, 'progressTotal') or '')
if current and total and current > total then
  redis.call('HSET', key, 'progressCurrent', tostring(total))
end
redis.call('HSET', key, 'createdAt', created or now)
redis.call('HSET', key, 'updatedAt', now)
redis.call('EXPIRE', key, ttl)
return 1
)lua";

redis_session_store::redis_session_store(server::redis_conn &conn, chrono::seconds ttl)
    : conn(conn), ttl(ttl) {}

string redis_session_store::key(const string &session_id) {
    return "session:" + session_id;
}

void redis_session_store::write(const string &session_id, const session_patch &patch, bool replace) {
    vector<string> command = {"EVAL", WRITE_SESSION_SCRIPT, "1", key(session_id),
                              to_string(ttl.count()), to_string(now_millis()), replace ? "replace" : "merge",
                              "sessionId", session_id};
    if (patch.submission_id) command.insert(command.end(), {"submissionId", *patch.submission_id});
    if (patch.status) command.insert(command.end(), {"status", get_display_message(*patch.status)});
    if (patch.language) command.insert(command.end(), {"language", *patch.language});
    if (patch.progress) {
        command.insert(command.end(), {"progressCurrent", to_string(max(patch.progress->current, 0))});
        command.insert(command.end(), {"progressTotal", to_string(patch.progress->total)});
    }
    if (patch.result) command.insert(command.end(), {"result", patch.result->dump()});

    auto replies = conn.execute([&](cpp_redis::client &client, vector<future<cpp_redis::reply>> &replies) {
        replies.push_back(client.send(command));
    });
    if (!replies.empty() && replies[0].is_integer() && replies[0].as_integer() == 0)
        LOG(WARNING) << "Dropped write to terminal session " << session_id;
}

void redis_session_store::create(const session &s) {
    write(s.session_id, session_patch::from(s), true);
}

void redis_session_store::patch(const string &session_id, const session_patch &patch) {
    write(session_id, patch, false);
}

optional<session> redis_session_store::get(const string &session_id) {
    auto replies = conn.execute([&](cpp_redis::client &client, vector<future<cpp_redis::reply>> &replies) {
        replies.push_back(client.hgetall(key(session_id)));
    });
    if (replies.empty() || !replies[0].is_array()) return nullopt;

    map<string, string> fields;
    auto &array = replies[0].as_array();
    for (size_t i = 0; i + 1 < array.size(); i += 2)
        fields[array[i].as_string()] = array[i + 1].as_string();
    if (fields.empty()) return nullopt;

    try {
        session s;
        s.session_id = session_id;
        if (fields.count("submissionId")) s.submission_id = fields.at("submissionId");
        if (fields.count("status")) s.status = parse_session_status(fields.at("status"));
        if (fields.count("language")) s.language = fields.at("language");
        if (fields.count("progressTotal")) {
            session_progress progress;
            progress.total = boost::lexical_cast<int>(fields.at("progressTotal"));
            if (fields.count("progressCurrent")) progress.current = boost::lexical_cast<int>(fields.at("progressCurrent"));
            s.progress = progress;
        }
        if (fields.count("result")) s.result = nlohmann::json::parse(fields.at("result"));
        if (fields.count("createdAt")) s.created_at = boost::lexical_cast<long long>(fields.at("createdAt"));
        if (fields.count("updatedAt")) s.updated_at = boost::lexical_cast<long long>(fields.at("updatedAt"));
        return s;
    } catch (std::exception &ex) {
        throw store_error("malformed session " + session_id + ": " + ex.what());
    }
}

}  // namespace codebox
