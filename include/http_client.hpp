#ifndef HTTP_CLIENT_HPP
#define HTTP_CLIENT_HPP
#include <chrono>
#include <string>

namespace update {

struct HttpResponse {
    bool ok = false;  ///< The transfer completed (any HTTP status).
    long status = 0;  ///< HTTP status code.
    std::string body; ///< Response body.
    std::string error; ///< Transport error description when !ok.
};

/**
 * @brief Perform a single blocking HTTP GET with libcurl.
 *
 * Redirects are followed. @p timeout bounds the whole transfer, connection
 * included, and is raised to 1ms when smaller.
 */
HttpResponse http_get(const std::string& url, const std::string& user_agent,
                      std::chrono::milliseconds timeout);

} // namespace update

#endif // HTTP_CLIENT_HPP
