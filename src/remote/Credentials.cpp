// SPDX-License-Identifier: Apache-2.0
#include "Credentials.hpp"

#include <core/StringUtils.hpp>

#include <cstdlib>
#include <format>

namespace pushscribe
{

auto Credentials::resolve(const Lookup& lookup) -> Credentials
{
    auto nonEmpty = [&](std::string_view name) -> std::optional<std::string> {
        auto value = lookup(name);
        if (value && !trim(*value).empty())
            return std::string(trim(*value));
        return std::nullopt;
    };

    for (auto const name: { "PUSHSCRIBE_API_KEY", "GOOGLE_API_KEY" })
        if (auto key = nonEmpty(name))
            return Credentials { .kind = Kind::ApiKey, .secret = std::move(*key), .project = {} };

    if (auto token = nonEmpty("GOOGLE_OAUTH_ACCESS_TOKEN"))
        return Credentials {
            .kind = Kind::AccessToken,
            .secret = std::move(*token),
            .project = nonEmpty("GOOGLE_CLOUD_PROJECT").value_or(""),
        };

    return Credentials {};
}

auto Credentials::fromEnvironment() -> Credentials
{
    return resolve([](std::string_view name) -> std::optional<std::string> {
        if (auto const* value = std::getenv(std::string(name).c_str()))
            return std::string(value);
        return std::nullopt;
    });
}

auto Credentials::apply(HttpRequest& request) const -> VoidResult
{
    switch (kind)
    {
        case Kind::None:
            return makeError(ErrorCode::AuthError,
                             "No credentials: set PUSHSCRIBE_API_KEY, GOOGLE_API_KEY or GOOGLE_OAUTH_ACCESS_TOKEN");
        case Kind::ApiKey:
            request.url += request.url.find('?') == std::string::npos ? "?key=" : "&key=";
            request.url += secret;
            return {};
        case Kind::AccessToken:
            request.headers.push_back(std::format("Authorization: Bearer {}", secret));
            if (!project.empty())
                request.headers.push_back(std::format("x-goog-user-project: {}", project));
            return {};
    }
    return makeError(ErrorCode::AuthError, "Unsupported credential kind");
}

} // namespace pushscribe
