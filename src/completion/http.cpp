#include "http.hpp"

#include "mcpchat/exceptions.hpp"
#include "mcpchat/util/json.hpp"

#include <cstdlib>
#include <curl/curl.h>
#include <memory>
#include <mutex>

namespace mcpchat::completion::http
{
namespace
{

struct EasyDeleter
{
    void operator()(CURL* curl) const
    {
        curl_easy_cleanup(curl);
    }
};

struct SlistDeleter
{
    void operator()(curl_slist* list) const
    {
        curl_slist_free_all(list);
    }
};

size_t write_to_string(void* ptr, size_t size, size_t nmemb, void* userdata)
{
    size_t total = size * nmemb;
    auto* out = static_cast<std::string*>(userdata);
    out->append(static_cast<const char*>(ptr), total);
    return total;
}

void ensure_curl_initialized()
{
    static std::once_flag once;
    std::call_once(once, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

} // namespace

std::string join_url(const std::string& base_url, const std::string& path)
{
    std::string base = base_url;
    while (!base.empty() && base.back() == '/')
        base.pop_back();
    if (path.empty())
        return base;
    if (path.front() == '/')
        return base + path;
    return base + "/" + path;
}

std::string error_message(const std::string& body)
{
    constexpr size_t kMaxRaw = 512;
    if (auto j = util::json::try_parse(body); j && j->is_object() && j->contains("error"))
    {
        const auto& err = (*j)["error"];
        if (err.is_string())
            return err.get<std::string>();
        if (err.is_object() && err.contains("message") && err["message"].is_string())
            return err["message"].get<std::string>();
    }
    return body.size() > kMaxRaw ? body.substr(0, kMaxRaw) + "..." : body;
}

std::optional<std::string> get_env(const std::string& name)
{
    if (name.empty())
        return std::nullopt;
    if (const char* v = std::getenv(name.c_str()); v != nullptr && v[0] != '\0')
        return std::string(v);
    return std::nullopt;
}

Response post_json(const std::string& url, const std::vector<std::string>& headers,
                   const std::string& body, int timeout_ms)
{
    ensure_curl_initialized();

    std::unique_ptr<CURL, EasyDeleter> curl(curl_easy_init());
    if (!curl)
        throw CompletionError("curl_easy_init failed");

    std::unique_ptr<curl_slist, SlistDeleter> hdrs;
    for (const auto& h : headers)
    {
        curl_slist* appended = curl_slist_append(hdrs.get(), h.c_str());
        if (!appended)
            throw CompletionError("curl_slist_append failed");
        hdrs.release();
        hdrs.reset(appended);
    }

    Response response;
    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, hdrs.get());
    curl_easy_setopt(curl.get(), CURLOPT_POST, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, &write_to_string);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, static_cast<long>(timeout_ms > 0 ? timeout_ms : 0));
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);

    CURLcode rc = curl_easy_perform(curl.get());
    if (rc != CURLE_OK)
        throw CompletionError("request to " + url + " failed: " + curl_easy_strerror(rc));

    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response.status_code);
    return response;
}

} // namespace mcpchat::completion::http
