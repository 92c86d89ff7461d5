#include "http/server.hpp"
#include <glog/logging.h>
#include <boost/algorithm/string.hpp>
#include <boost/exception/diagnostic_information.hpp>
#include <boost/lexical_cast.hpp>
#include "common/exceptions.hpp"
#include "common/json_utils.hpp"

namespace codebox::http {
using namespace std;

static const string JSON_TYPE = "application/json";
static const string USER_HEADER = "X-User-Id";

rate_limiter::rate_limiter(unsigned limit, chrono::seconds window)
    : limit(limit), window(window) {}

bool rate_limiter::allow(const string &key, chrono::steady_clock::time_point now) {
    lock_guard<mutex> guard(mut);
    // 每个窗口清理一次已经过期的 key
    if (now - last_sweep >= window) {
        for (auto it = buckets.begin(); it != buckets.end();) {
            if (now - it->second.window_start >= window)
                it = buckets.erase(it);
            else
                ++it;
        }
        last_sweep = now;
    }

    auto &b = buckets[key];
    if (b.count == 0 || now - b.window_start >= window) {
        b.window_start = now;
        b.count = 0;
    }
    if (b.count >= limit) return false;
    ++b.count;
    return true;
}

size_t rate_limiter::size() {
    lock_guard<mutex> guard(mut);
    return buckets.size();
}

void send_error(httplib::Response &res, int status, const string &message) {
    res.status = status;
    res.set_content(nlohmann::json{{"success", false}, {"message", message}}.dump(), JSON_TYPE.c_str());
}

void send_data(httplib::Response &res, int status, const nlohmann::json &data) {
    res.status = status;
    res.set_content(nlohmann::json{{"success", true}, {"data", data}}.dump(), JSON_TYPE.c_str());
}

static nlohmann::json parse_body(const httplib::Request &req) {
    nlohmann::json body = nlohmann::json::parse(req.body.empty() ? "{}" : req.body, nullptr, false);
    if (body.is_discarded() || !body.is_object()) throw invalid_request("Request body must be a JSON object");
    return body;
}

static string required_string(const nlohmann::json &body, const string &key, const string &message) {
    string value;
    get_value_if_exists(body, key, value);
    if (value.empty()) throw invalid_request(message);
    return value;
}

static string user_of(const httplib::Request &req) {
    string user = boost::trim_copy(req.get_header_value(USER_HEADER.c_str()));
    if (user.empty()) throw invalid_request("Missing " + USER_HEADER + " header");
    return user;
}

http_server::http_server(execution_service &service, const server::http_config &config)
    : service(service),
      config(config),
      run_limiter(config.run_limit),
      result_limiter(config.result_limit),
      submit_limiter(config.submit_limit) {
    srv.Post("/run", guarded(&http_server::handle_run, run_limiter));
    srv.Post("/execute", guarded(&http_server::handle_execute, run_limiter));
    srv.Post("/submit", guarded(&http_server::handle_submit, submit_limiter));
    srv.Post("/submit/batch", guarded(&http_server::handle_submit_batch, submit_limiter));
    srv.Get(R"(/result/([\w\-]+))", guarded(&http_server::handle_result, result_limiter));
    srv.Post(R"(/cancel/([\w\-]+))", guarded(&http_server::handle_cancel, submit_limiter));
    srv.Get("/languages", guarded(&http_server::handle_languages, result_limiter));
    srv.Get("/health", [](const httplib::Request &, httplib::Response &res) {
        res.set_content("ok", "text/plain");
    });
}

bool http_server::listen() {
    LOG(INFO) << "HTTP server listening on " << config.host << ":" << config.port;
    return srv.listen(config.host.c_str(), config.port);
}

void http_server::stop() {
    srv.stop();
}

bool http_server::running() const {
    return srv.is_running();
}

httplib::Server::Handler http_server::guarded(handler h, rate_limiter &limiter) {
    return [this, h, &limiter](const httplib::Request &req, httplib::Response &res) {
        if (!limiter.allow(req.remote_addr)) {
            send_error(res, 429, "Too many requests, please retry later");
            return;
        }
        try {
            (this->*h)(req, res);
        } catch (unsupported_language &ex) {
            send_error(res, 400, ex.what());
        } catch (invalid_request &ex) {
            send_error(res, 400, ex.what());
        } catch (not_found_error &ex) {
            send_error(res, 404, ex.what());
        } catch (service_unavailable &ex) {
            send_error(res, 503, ex.what());
        } catch (nlohmann::json::exception &ex) {
            send_error(res, 400, string("Malformed request: ") + ex.what());
        } catch (boost::bad_lexical_cast &ex) {
            send_error(res, 400, string("Malformed request: ") + ex.what());
        } catch (std::exception &ex) {
            LOG(ERROR) << "Request " << req.method << " " << req.path << " failed: " << boost::diagnostic_information(ex);
            send_error(res, 500, "Execution service error");
        }
    };
}

void http_server::handle_run(const httplib::Request &req, httplib::Response &res) {
    nlohmann::json body = parse_body(req);
    string code, language, input;
    get_value_if_exists(body, "code", code);
    get_value_if_exists(body, "language", language);
    get_value_if_exists(body, "input", input);
    if (code.empty() || language.empty()) throw invalid_request("Code and language are required");

    string session_id = service.run(language, code, input);
    send_data(res, 202, {{"sessionId", session_id}});
}

void http_server::handle_submit(const httplib::Request &req, httplib::Response &res) {
    string user = user_of(req);
    nlohmann::json body = parse_body(req);
    string problem = required_string(body, "problemId", "Problem is required");
    string code, language, input;
    optional<string> contest;
    get_value_if_exists(body, "code", code);
    get_value_if_exists(body, "language", language);
    get_value_if_exists(body, "input", input);
    get_value_if_exists(body, "contestId", contest);
    if (code.empty() || language.empty()) throw invalid_request("Code and language are required");

    submit_ticket ticket = service.submit(user, problem, code, language, contest, input);
    send_data(res, 202, {{"submissionId", ticket.submission_id}, {"sessionId", ticket.session_id}});
}

void http_server::handle_submit_batch(const httplib::Request &req, httplib::Response &res) {
    string user = user_of(req);
    nlohmann::json body = parse_body(req);
    string problem = required_string(body, "problemId", "Problem is required");
    string code, language, mode;
    optional<string> contest;
    get_value_if_exists(body, "code", code);
    get_value_if_exists(body, "language", language);
    get_value_if_exists(body, "contestId", contest);
    get_value_if_exists(body, "compareMode", mode);
    if (code.empty() || language.empty()) throw invalid_request("Code and language are required");

    submit_ticket ticket = service.submit_batch(user, problem, code, language, contest, parse_compare_mode(mode));
    send_data(res, 202, {{"submissionId", ticket.submission_id}, {"sessionId", ticket.session_id}});
}

void http_server::handle_result(const httplib::Request &req, httplib::Response &res) {
    send_data(res, 200, service.result(req.matches[1].str()));
}

void http_server::handle_cancel(const httplib::Request &req, httplib::Response &res) {
    string session_id = req.matches[1].str();
    if (!service.cancel(session_id)) throw not_found_error("No running job for session " + session_id);
    send_data(res, 202, {{"sessionId", session_id}});
}

void http_server::handle_execute(const httplib::Request &req, httplib::Response &res) {
    nlohmann::json body = parse_body(req);
    execution_request request;
    get_value_if_exists(body, "code", request.code);
    get_value_if_exists(body, "language", request.language);
    get_value_if_exists(body, "input", request.input);
    optional<long long> timeout_ms;
    get_value_if_exists(body, "timeoutMs", timeout_ms);
    if (timeout_ms && *timeout_ms > 0) request.timeout = chrono::milliseconds(*timeout_ms);
    if (request.code.empty() || request.language.empty()) throw invalid_request("Code and language are required");

    nlohmann::json result = service.execute_sync(request);
    res.status = 200;
    res.set_content(result.dump(), JSON_TYPE.c_str());
}

void http_server::handle_languages(const httplib::Request &, httplib::Response &res) {
    nlohmann::json languages = nlohmann::json::array();
    for (auto &profile : service.registry().profiles()) {
        languages.push_back({{"id", profile.id},
                             {"aliases", profile.aliases},
                             {"image", profile.image},
                             {"compiled", profile.compile_command.has_value()},
                             {"compileTimeoutMs", profile.compile_timeout.count()},
                             {"runTimeoutMs", profile.run_timeout.count()}});
    }
    send_data(res, 200, languages);
}

}  // namespace codebox::http
