#pragma once

#include <chrono>
#include <string>

namespace codebox {

/**
 * @brief HTTP 响应
 */
struct http_response {
    long status = 0;
    std::string body;
};

/**
 * @brief 以 application/json 发送 POST 请求
 * @param url 完整的请求地址
 * @param body 请求体
 * @param timeout 整个请求的超时
 * @throw network_error 无法建立连接、请求超时或者服务器返回 4xx/5xx
 */
http_response http_post_json(const std::string &url, const std::string &body, std::chrono::milliseconds timeout);

}  // namespace codebox
