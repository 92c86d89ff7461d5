#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <thread>
#include <vector>
#include "common/concurrent_queue.hpp"
#include "events/publisher.hpp"
#include "executor/executor.hpp"
#include "judge/batch.hpp"
#include "language.hpp"
#include "repository.hpp"
#include "session/session_store.hpp"

/**
 * 执行服务
 * 接口线程校验请求、创建会话（以及提交记录）后把任务放进有界的等待队列，立即返回会话号。
 * 固定数量的 worker 线程从等待队列中取出任务执行，并把进度和结果写入会话存储、发送事件。
 *
 * 每个任务都以恰好一次终止状态的会话写入结束：
 * 先更新提交记录，再写入会话的终止状态，最后通知提交者。
 */
namespace codebox {

/**
 * @brief 提交接口的返回值
 */
struct submit_ticket {
    std::string submission_id;
    std::string session_id;
};

struct execution_service {
    /**
     * @param languages 语言表，用于在创建任何资源之前拒绝不支持的语言
     * @param exec 异步任务使用的执行后端
     * @param local 同步接口使用的本机执行后端，为空时同步接口不可用
     * @param queue_capacity 等待队列长度，队列满时拒绝新任务
     * @param sync_capacity 同时进行的同步执行数量上限
     */
    execution_service(const language_registry &languages,
                      executor &exec,
                      session_store &sessions,
                      submission_repository &submissions,
                      problem_repository &problems,
                      event_publisher &events,
                      executor *local,
                      std::size_t queue_capacity,
                      std::size_t sync_capacity);
    ~execution_service();

    /**
     * @brief 启动 worker 线程
     */
    void start(unsigned workers);

    /**
     * @brief 停止接受新任务，取消所有未完成的任务，并等待 worker 退出
     */
    void stop();

    /**
     * @brief 执行一段代码，不产生提交记录
     * @return 会话号
     * @throw unsupported_language 语言不存在
     * @throw service_unavailable 等待队列已满
     */
    std::string run(const std::string &language, const std::string &code, const std::string &input);

    /**
     * @brief 针对题目提交代码，使用 input 作为标准输入运行一次
     * @throw not_found_error 题目不存在
     */
    submit_ticket submit(const std::string &user_id,
                         const std::string &problem_id,
                         const std::string &code,
                         const std::string &language,
                         const std::optional<std::string> &contest_id,
                         const std::string &input);

    /**
     * @brief 针对题目提交代码，运行题目的所有测试用例
     * @throw not_found_error 题目不存在
     * @throw invalid_request 题目没有测试用例
     */
    submit_ticket submit_batch(const std::string &user_id,
                               const std::string &problem_id,
                               const std::string &code,
                               const std::string &language,
                               const std::optional<std::string> &contest_id,
                               compare_mode mode);

    /**
     * @brief 会话的当前状态或结果，参见 project
     */
    nlohmann::json result(const std::string &session_id);

    /**
     * @brief 取消等待中或者执行中的任务
     * @return 任务不存在或者已经结束时返回 false
     */
    bool cancel(const std::string &session_id);

    /**
     * @brief 在当前线程中使用本机执行后端执行，超时时间不超过语言的运行时限
     * @throw unsupported_language 语言不存在
     * @throw service_unavailable 本机执行未启用，或者同步执行数量已满
     */
    execution_result execute_sync(execution_request request);

    const language_registry &registry() const;

private:
    struct job {
        enum class kind { single, batch };

        kind type = kind::single;
        std::string session_id;
        std::optional<std::string> submission_id;
        std::optional<std::string> user_id;
        std::string language;
        std::string code;
        std::string input;
        std::vector<test_case> cases;
        compare_mode mode = compare_mode::relaxed;
        std::shared_ptr<cancel_token> cancel;
    };

    void enqueue(job j);
    void worker_loop(unsigned worker_id);
    void process(job &j);
    void run_single(job &j);
    void run_batch(job &j);
    void finish(job &j, session_status status, submission_status verdict, const nlohmann::json &result);
    void fail(job &j, const std::string &message);
    void notify_owner(job &j, submission_status verdict);
    std::string open_session(const std::optional<std::string> &submission_id, const std::string &language);

    const language_registry &languages;
    executor &exec;
    session_store &sessions;
    submission_repository &submissions;
    problem_repository &problems;
    event_publisher &events;
    executor *local;
    std::size_t sync_capacity;

    concurrent_queue<job> jobs;
    std::vector<std::thread> workers;

    std::mutex sync_mutex;
    std::size_t sync_running = 0;

    std::mutex active_mutex;
    std::map<std::string, std::shared_ptr<cancel_token>> active;
};

}  // namespace codebox
