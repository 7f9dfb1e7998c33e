// SPDX-License-Identifier: Apache-2.0
#include "HttpTransport.hpp"

#include <core/JsonUtils.hpp>

#include <format>

namespace pushscribe
{

namespace
{

    auto errorDetail(std::string_view body) -> std::string
    {
        auto parsed = json::parse(body);
        if (!parsed)
            return {};
        if (auto const* error = json::findObject(*parsed, "error"))
            return json::getStringOr(*error, "message", "");
        return {};
    }

} // namespace

auto checkStatus(const HttpResponse& response, std::string_view service) -> VoidResult
{
    if (response.status >= 200 && response.status < 300)
        return {};

    auto const detail = errorDetail(response.body);
    auto message = detail.empty() ? std::format("{} returned HTTP {}", service, response.status)
                                  : std::format("{} returned HTTP {}: {}", service, response.status, detail);

    if (response.status == 401 || response.status == 403)
        return makeError(ErrorCode::AuthError, std::move(message));
    return makeError(ErrorCode::NetworkError, std::move(message));
}

} // namespace pushscribe
