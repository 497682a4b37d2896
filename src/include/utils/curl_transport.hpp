#pragma once
/**
 * @file curl_transport.hpp
 * @brief RemoteTransport over libcurl.
 *
 * One easy handle per request, so concurrent `send()` calls share nothing. JSON bodies go out
 * with `Content-Type: application/json`; a response body that is not JSON is kept as a string.
 */
#include "utils/remote_transport.hpp"

#include <chrono>
#include <string>

namespace syncdesk::sync
{

class SYNCDESK_UTILS_EXPORT CurlTransport final : public RemoteTransport
{
  public:
    explicit CurlTransport(std::string base_url,
                           std::chrono::milliseconds timeout = std::chrono::milliseconds(10000));

    HttpResponse send(const HttpRequest &request) override;

    [[nodiscard]] const std::string &base_url() const noexcept { return m_base_url; }

    /// `base + path + ?query`, with the query values percent-encoded.
    [[nodiscard]] static std::string build_url(const std::string &base,
                                               const HttpRequest &request);

  private:
    std::string m_base_url;
    std::chrono::milliseconds m_timeout;
};

} // namespace syncdesk::sync
