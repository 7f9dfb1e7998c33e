// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <remote/HttpTransport.hpp>

#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace pushscribe
{

/// @brief Google API credentials resolved from the environment.
struct Credentials
{
    enum class Kind
    {
        None,
        ApiKey,      ///< Sent as the "key" query parameter.
        AccessToken, ///< Sent as an OAuth bearer token.
    };

    Kind kind = Kind::None;
    std::string secret;
    std::string project; ///< Quota project for access tokens; may be empty.

    /// @brief Environment lookup, injectable for tests.
    using Lookup = std::function<std::optional<std::string>(std::string_view name)>;

    /// @brief Resolves credentials in priority order: PUSHSCRIBE_API_KEY,
    /// GOOGLE_API_KEY, then GOOGLE_OAUTH_ACCESS_TOKEN (with GOOGLE_CLOUD_PROJECT).
    [[nodiscard]] static auto resolve(const Lookup& lookup) -> Credentials;

    /// @brief Resolves credentials from the process environment.
    [[nodiscard]] static auto fromEnvironment() -> Credentials;

    [[nodiscard]] auto empty() const noexcept -> bool { return kind == Kind::None; }

    /// @brief Adds the credentials to a request.
    /// @return AuthError if no credentials are available.
    [[nodiscard]] auto apply(HttpRequest& request) const -> VoidResult;
};

} // namespace pushscribe
