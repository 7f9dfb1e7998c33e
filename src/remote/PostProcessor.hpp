// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>

#include <stop_token>
#include <string>

namespace pushscribe
{

/// @brief Abstract transcript rewriter.
///
/// rewrite() is non-virtual: it returns the text unchanged, without calling the
/// implementation, when the instruction or the text is empty, and it treats an
/// empty rewrite as "no change". Implementations override doRewrite().
class PostProcessor
{
  public:
    virtual ~PostProcessor() = default;

    /// @brief Rewrites @p text according to @p instruction.
    /// @return The rewritten text, or NetworkError, AuthError or Cancelled.
    [[nodiscard]] auto rewrite(const std::string& text,
                               const PostProcessInstruction& instruction,
                               std::stop_token stopToken) -> Result<std::string>;

  protected:
    [[nodiscard]] virtual auto doRewrite(const std::string& text,
                                         const PostProcessInstruction& instruction,
                                         std::stop_token stopToken) -> Result<std::string> = 0;
};

} // namespace pushscribe
