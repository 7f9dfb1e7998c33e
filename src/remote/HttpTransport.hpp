// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <chrono>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

namespace pushscribe
{

/// @brief A JSON POST request.
struct HttpRequest
{
    std::string url;
    std::vector<std::string> headers; ///< Extra "Name: value" header lines.
    std::string body;
    std::chrono::milliseconds timeout { 0 }; ///< Whole-transfer limit; zero means none.
};

struct HttpResponse
{
    long status = 0;
    std::string body;
};

/// @brief Abstract HTTP transport used by the remote services.
class HttpTransport
{
  public:
    virtual ~HttpTransport() = default;

    /// @brief Performs a blocking POST.
    ///
    /// The transfer is aborted promptly once @p stopToken is signalled.
    /// @return The response (any status code), NetworkError on transport failure,
    ///         or Cancelled if the stop token fired.
    [[nodiscard]] virtual auto post(const HttpRequest& request, std::stop_token stopToken)
        -> Result<HttpResponse> = 0;
};

/// @brief Maps a response status to the remote-service error taxonomy.
///
/// 2xx is success, 401 and 403 are AuthError, anything else is NetworkError.
/// The message includes the error text of a Google-style error body when present.
[[nodiscard]] auto checkStatus(const HttpResponse& response, std::string_view service) -> VoidResult;

} // namespace pushscribe
