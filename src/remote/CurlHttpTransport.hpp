// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <remote/HttpTransport.hpp>

#include <chrono>

namespace pushscribe
{

/// @brief HttpTransport backed by libcurl's easy interface.
///
/// Each post() uses its own easy handle, so concurrent calls from different
/// worker threads are safe. Cancellation is observed from the transfer
/// progress callback.
class CurlHttpTransport: public HttpTransport
{
  public:
    explicit CurlHttpTransport(std::chrono::milliseconds connectTimeout = std::chrono::seconds(10));
    ~CurlHttpTransport() override;

    CurlHttpTransport(const CurlHttpTransport&) = delete;
    CurlHttpTransport& operator=(const CurlHttpTransport&) = delete;

    [[nodiscard]] auto post(const HttpRequest& request, std::stop_token stopToken) -> Result<HttpResponse> override;

  private:
    std::chrono::milliseconds _connectTimeout;
    bool _globalAcquired = false;
};

} // namespace pushscribe
