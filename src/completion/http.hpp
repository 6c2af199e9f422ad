#pragma once

#include <optional>
#include <string>
#include <vector>

namespace mcpchat::completion::http
{

struct Response
{
    long status_code = 0;
    std::string body;
};

/// POST a JSON body. Only transport failures throw (CompletionError); HTTP error
/// statuses are returned to the caller.
Response post_json(const std::string& url, const std::vector<std::string>& headers,
                   const std::string& body, int timeout_ms);

std::string join_url(const std::string& base_url, const std::string& path);

/// Provider error text from an error response body ({"error": {"message": ...}} or raw)
std::string error_message(const std::string& body);

/// Non-empty value of an environment variable
std::optional<std::string> get_env(const std::string& name);

} // namespace mcpchat::completion::http
