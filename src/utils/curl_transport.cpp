#include "utils/curl_transport.hpp"
#include "utils/logger.hpp"

#include <cctype>
#include <mutex>

#include <curl/curl.h>

namespace syncdesk::sync
{

namespace
{

void ensure_curl_global_init()
{
    static std::once_flag once;
    std::call_once(once,
                   []
                   {
                       const CURLcode rc = curl_global_init(CURL_GLOBAL_DEFAULT);
                       if (rc != CURLE_OK)
                       {
                           LOGGER_ERROR("CurlTransport: curl_global_init failed: {}",
                                        curl_easy_strerror(rc));
                       }
                   });
}

size_t write_cb(char *ptr, size_t size, size_t nmemb, void *userdata)
{
    auto *out = static_cast<std::string *>(userdata);
    const size_t total = size * nmemb;
    out->append(ptr, total);
    return total;
}

std::string percent_encode(std::string_view s)
{
    static constexpr char kHex[] = "0123456789ABCDEF";
    std::string out;
    out.reserve(s.size());
    for (unsigned char c : s)
    {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~')
        {
            out.push_back(static_cast<char>(c));
        }
        else
        {
            out.push_back('%');
            out.push_back(kHex[c >> 4]);
            out.push_back(kHex[c & 0x0F]);
        }
    }
    return out;
}

struct EasyDeleter
{
    void operator()(CURL *h) const noexcept { curl_easy_cleanup(h); }
};

struct SlistDeleter
{
    void operator()(curl_slist *l) const noexcept { curl_slist_free_all(l); }
};

} // namespace

CurlTransport::CurlTransport(std::string base_url, std::chrono::milliseconds timeout)
    : m_base_url(std::move(base_url)), m_timeout(timeout)
{
    while (!m_base_url.empty() && m_base_url.back() == '/')
        m_base_url.pop_back();
    ensure_curl_global_init();
}

std::string CurlTransport::build_url(const std::string &base, const HttpRequest &request)
{
    std::string url = base;
    if (request.path.empty() || request.path.front() != '/')
        url.push_back('/');
    url += request.path;
    char sep = request.path.find('?') == std::string::npos ? '?' : '&';
    for (const auto &[key, value] : request.query)
    {
        url.push_back(sep);
        url += percent_encode(key);
        url.push_back('=');
        url += percent_encode(value);
        sep = '&';
    }
    return url;
}

HttpResponse CurlTransport::send(const HttpRequest &request)
{
    HttpResponse response;
    std::unique_ptr<CURL, EasyDeleter> curl(curl_easy_init());
    if (!curl)
    {
        response.error = "curl_easy_init failed";
        return response;
    }

    const std::string url = build_url(m_base_url, request);
    std::string payload;
    std::string received;
    char error_buf[CURL_ERROR_SIZE] = {0};

    curl_slist *raw_headers = nullptr;
    raw_headers = curl_slist_append(raw_headers, "Accept: application/json");
    raw_headers = curl_slist_append(raw_headers, "Content-Type: application/json");
    const std::string auth =
        request.bearer_token.empty() ? std::string{} : "Authorization: Bearer " + request.bearer_token;
    if (!auth.empty())
        raw_headers = curl_slist_append(raw_headers, auth.c_str());
    std::unique_ptr<curl_slist, SlistDeleter> headers(raw_headers);

    CURL *h = curl.get();
    curl_easy_setopt(h, CURLOPT_URL, url.c_str());
    curl_easy_setopt(h, CURLOPT_HTTPHEADER, headers.get());
    curl_easy_setopt(h, CURLOPT_TIMEOUT_MS, static_cast<long>(m_timeout.count()));
    curl_easy_setopt(h, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(h, CURLOPT_USERAGENT, "syncdesk/1.0");
    curl_easy_setopt(h, CURLOPT_WRITEFUNCTION, write_cb);
    curl_easy_setopt(h, CURLOPT_WRITEDATA, &received);
    curl_easy_setopt(h, CURLOPT_ERRORBUFFER, error_buf);

    if (!request.body.is_null())
        payload = request.body.dump();
    switch (request.method)
    {
    case HttpMethod::Get:
        curl_easy_setopt(h, CURLOPT_HTTPGET, 1L);
        break;
    case HttpMethod::Post:
        curl_easy_setopt(h, CURLOPT_POST, 1L);
        curl_easy_setopt(h, CURLOPT_POSTFIELDS, payload.c_str());
        curl_easy_setopt(h, CURLOPT_POSTFIELDSIZE, static_cast<long>(payload.size()));
        break;
    case HttpMethod::Put:
    case HttpMethod::Delete:
        curl_easy_setopt(h, CURLOPT_CUSTOMREQUEST, to_string(request.method));
        if (!payload.empty())
        {
            curl_easy_setopt(h, CURLOPT_POSTFIELDS, payload.c_str());
            curl_easy_setopt(h, CURLOPT_POSTFIELDSIZE, static_cast<long>(payload.size()));
        }
        break;
    }

    const CURLcode rc = curl_easy_perform(h);
    if (rc != CURLE_OK)
    {
        response.error = error_buf[0] != '\0' ? error_buf : curl_easy_strerror(rc);
        LOGGER_DEBUG("CurlTransport: {} {} failed: {}", to_string(request.method), url,
                     response.error);
        return response;
    }

    long status = 0;
    curl_easy_getinfo(h, CURLINFO_RESPONSE_CODE, &status);
    response.status = static_cast<int>(status);
    if (!received.empty())
    {
        response.body = nlohmann::json::parse(received, nullptr, /*allow_exceptions=*/false);
        if (response.body.is_discarded())
            response.body = received;
    }
    LOGGER_TRACE("CurlTransport: {} {} -> {}", to_string(request.method), url, response.status);
    return response;
}

} // namespace syncdesk::sync
