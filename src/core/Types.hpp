// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace pushscribe
{

/// @brief Languages supported by the transcription backend.
enum class Language : std::uint8_t
{
    EnglishUS,
    EnglishUK,
    ChineseMandarin,
    Spanish,
    French,
    German,
    Japanese,
    Korean,
    PortugueseBR,
    Hindi,
};

/// @brief Static metadata for a supported language.
struct LanguageInfo
{
    Language language;
    std::string_view code;        ///< BCP-47 code sent to the speech service.
    std::string_view displayName; ///< Human-readable name.
};

namespace detail
{
    inline constexpr auto Languages = std::array<LanguageInfo, 10> { {
        { Language::EnglishUS, "en-US", "English (US)" },
        { Language::EnglishUK, "en-GB", "English (UK)" },
        { Language::ChineseMandarin, "zh", "Chinese (Mandarin)" },
        { Language::Spanish, "es-ES", "Spanish" },
        { Language::French, "fr-FR", "French" },
        { Language::German, "de-DE", "German" },
        { Language::Japanese, "ja-JP", "Japanese" },
        { Language::Korean, "ko-KR", "Korean" },
        { Language::PortugueseBR, "pt-BR", "Portuguese (BR)" },
        { Language::Hindi, "hi-IN", "Hindi" },
    } };
} // namespace detail

/// @brief Returns all supported languages in display order.
[[nodiscard]] constexpr auto supportedLanguages() -> std::span<const LanguageInfo>
{
    return detail::Languages;
}

/// @brief Returns the BCP-47 code of a language.
[[nodiscard]] constexpr auto languageCode(Language language) -> std::string_view
{
    for (auto const& info: detail::Languages)
        if (info.language == language)
            return info.code;
    return "en-US";
}

/// @brief Returns the display name of a language.
[[nodiscard]] constexpr auto languageDisplayName(Language language) -> std::string_view
{
    for (auto const& info: detail::Languages)
        if (info.language == language)
            return info.displayName;
    return "English (US)";
}

/// @brief Parses a BCP-47 code into a supported Language.
/// @param code The language code, e.g. "fr-FR". Matching is exact.
/// @return The language, or std::nullopt if it is not supported.
[[nodiscard]] constexpr auto parseLanguage(std::string_view code) -> std::optional<Language>
{
    for (auto const& info: detail::Languages)
        if (info.code == code)
            return info.language;
    return std::nullopt;
}

/// @brief User instruction for rewriting a transcript. An empty prompt disables rewriting.
struct PostProcessInstruction
{
    std::string prompt;

    /// @brief Returns true if the prompt has no non-whitespace characters.
    [[nodiscard]] auto empty() const -> bool { return prompt.find_first_not_of(" \t\r\n") == std::string::npos; }
};

} // namespace pushscribe
