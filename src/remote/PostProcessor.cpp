// SPDX-License-Identifier: Apache-2.0
#include "PostProcessor.hpp"

#include <core/Log.hpp>
#include <core/StringUtils.hpp>

namespace pushscribe
{

auto PostProcessor::rewrite(const std::string& text,
                            const PostProcessInstruction& instruction,
                            std::stop_token stopToken) -> Result<std::string>
{
    if (instruction.empty() || trim(text).empty())
        return text;

    auto result = doRewrite(text, instruction, std::move(stopToken));
    if (!result)
        return result;

    if (trim(*result).empty())
    {
        log::debug("Post-processor returned no text; keeping the transcript");
        return text;
    }
    return result;
}

} // namespace pushscribe
