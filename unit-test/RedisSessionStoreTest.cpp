#include <thread>
#include "gtest/gtest.h"
#include "common/utils.hpp"
#include "session/redis_session_store.hpp"
#include "test/assertions.hpp"
#include "test/environment.hpp"

using namespace std;
using namespace codebox;

// 需要一个可以连接的 Redis 服务器，参见 test::test_redis_config
class RedisSessionStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        if (!test::redis_available()) GTEST_SKIP() << "redis is not available";
        conn.init(test::test_redis_config());
        store = make_unique<redis_session_store>(conn, chrono::seconds(120));
        session_id = "test-" + generate_uuid();
    }

    void TearDown() override {
        if (!store) return;
        conn.execute([&](cpp_redis::client &client, vector<future<cpp_redis::reply>> &replies) {
            replies.push_back(client.del({redis_session_store::key(session_id)}));
        });
    }

    session make_session(session_status status) {
        session s;
        s.session_id = session_id;
        s.status = status;
        s.language = "python";
        return s;
    }

    static session_patch status_patch(session_status status) {
        session_patch patch;
        patch.status = status;
        return patch;
    }

    static session_patch progress_patch(int current, int total) {
        session_patch patch;
        patch.progress = session_progress{current, total};
        return patch;
    }

    server::redis_conn conn;
    unique_ptr<redis_session_store> store;
    string session_id;
};

TEST_F(RedisSessionStoreTest, LifecycleTest) {
    EXPECT_FALSE(store->get(session_id));

    store->create(make_session(session_status::queued));
    auto queued = store->get(session_id);
    ASSERT_TRUE(queued);
    EXPECT_EQ(queued->status, session_status::queued);
    EXPECT_EQ(queued->language, "python");

    store->patch(session_id, status_patch(session_status::running));
    EXPECT_EQ(store->get(session_id)->status, session_status::running);

    session done = make_session(session_status::completed);
    done.submission_id = "sub-1";
    done.result = nlohmann::json{{"status", "completed"}, {"output", "3\n"}};
    store->create(done);
    auto stored = store->get(session_id);
    EXPECT_EQ(stored->submission_id.value_or(""), "sub-1");
    EXPECT_JSON_EQ(project(stored), (nlohmann::json{{"status", "completed"}, {"output", "3\n"}}));
}

TEST_F(RedisSessionStoreTest, TerminalIsFinalTest) {
    session failed = make_session(session_status::error);
    failed.result = nlohmann::json{{"status", "error"}, {"error", "boom"}};
    store->create(failed);

    store->patch(session_id, status_patch(session_status::running));
    store->patch(session_id, progress_patch(2, 3));
    session late = make_session(session_status::completed);
    late.result = nlohmann::json{{"status", "completed"}};
    store->create(late);

    auto stored = store->get(session_id);
    EXPECT_EQ(stored->status, session_status::error);
    EXPECT_FALSE(stored->progress);
    EXPECT_JSON_EQ(*stored->result, (nlohmann::json{{"status", "error"}, {"error", "boom"}}));
}

TEST_F(RedisSessionStoreTest, ProgressIsMonotonicAndClampedTest) {
    store->create(make_session(session_status::running));

    store->patch(session_id, progress_patch(3, 5));
    store->patch(session_id, progress_patch(1, 5));
    EXPECT_EQ(store->get(session_id)->progress->current, 3);

    store->patch(session_id, progress_patch(9, 5));
    auto progress = store->get(session_id)->progress;
    EXPECT_EQ(progress->current, 5);
    EXPECT_EQ(progress->total, 5);

    // 整体替换时进度同样不会回退
    session replaced = make_session(session_status::running);
    replaced.progress = session_progress{0, 5};
    store->create(replaced);
    EXPECT_EQ(store->get(session_id)->progress->current, 5);
}

TEST_F(RedisSessionStoreTest, CreatedAtSurvivesReplaceTest) {
    store->create(make_session(session_status::queued));
    auto first = store->get(session_id);
    ASSERT_TRUE(first);
    EXPECT_GT(first->created_at, 0);

    this_thread::sleep_for(chrono::milliseconds(5));
    store->create(make_session(session_status::running));
    auto second = store->get(session_id);
    EXPECT_EQ(second->created_at, first->created_at);
    EXPECT_GT(second->updated_at, first->updated_at);
}

TEST_F(RedisSessionStoreTest, ExpireTest) {
    store->create(make_session(session_status::queued));
    auto replies = conn.execute([&](cpp_redis::client &client, vector<future<cpp_redis::reply>> &replies) {
        replies.push_back(client.ttl(redis_session_store::key(session_id)));
    });
    ASSERT_EQ(replies.size(), 1);
    ASSERT_TRUE(replies[0].is_integer());
    EXPECT_GT(replies[0].as_integer(), 0);
    EXPECT_LE(replies[0].as_integer(), 120);
}
