#include "executor/http_client.hpp"
#include <curl/curl.h>
#include <fmt/format.h>
#include <memory>
#include <mutex>
#include "common/exceptions.hpp"

namespace codebox {
using namespace std;

static size_t write_body(char *data, size_t size, size_t nmemb, void *userdata) {
    static_cast<string *>(userdata)->append(data, size * nmemb);
    return size * nmemb;
}

http_response http_post_json(const string &url, const string &body, chrono::milliseconds timeout) {
    static once_flag curl_initialized;
    call_once(curl_initialized, [] { curl_global_init(CURL_GLOBAL_ALL); });

    unique_ptr<CURL, decltype(&curl_easy_cleanup)> curl(curl_easy_init(), curl_easy_cleanup);
    if (!curl) throw network_error("unable to initialize curl for " + url);

    unique_ptr<curl_slist, decltype(&curl_slist_free_all)> headers(nullptr, curl_slist_free_all);
    headers.reset(curl_slist_append(headers.release(), "Content-Type: application/json"));
    headers.reset(curl_slist_append(headers.release(), "Accept: application/json"));

    http_response response;
    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_POST, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE, (long)body.size());
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, (long)timeout.count());
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_body);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response.body);

    CURLcode res = curl_easy_perform(curl.get());
    if (res != CURLE_OK)
        throw network_error(fmt::format("request to {} failed: {}", url, curl_easy_strerror(res)));

    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response.status);
    if (response.status >= 400)
        throw network_error(fmt::format("request to {} failed with status {}: {}", url, response.status, response.body.substr(0, 200)));
    return response;
}

}  // namespace codebox
