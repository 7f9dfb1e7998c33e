// SPDX-License-Identifier: Apache-2.0
#include "OutputInjector.hpp"

#include <core/StringUtils.hpp>

namespace pushscribe
{

auto outputBackendName(OutputBackend backend) -> std::string_view
{
    switch (backend)
    {
        case OutputBackend::Auto: return "auto";
        case OutputBackend::X11: return "x11";
        case OutputBackend::Wayland: return "wayland";
    }
    return "auto";
}

auto parseOutputBackend(std::string_view name) -> std::optional<OutputBackend>
{
    auto const lower = toLower(trim(name));
    if (lower == "auto")
        return OutputBackend::Auto;
    if (lower == "x11")
        return OutputBackend::X11;
    if (lower == "wayland")
        return OutputBackend::Wayland;
    return std::nullopt;
}

auto outputMethodName(OutputMethod method) -> std::string_view
{
    switch (method)
    {
        case OutputMethod::Paste: return "paste";
        case OutputMethod::Type: return "type";
    }
    return "paste";
}

auto parseOutputMethod(std::string_view name) -> std::optional<OutputMethod>
{
    auto const lower = toLower(trim(name));
    if (lower == "paste")
        return OutputMethod::Paste;
    if (lower == "type")
        return OutputMethod::Type;
    return std::nullopt;
}

auto resolveOutputBackend(OutputBackend requested, const EnvironmentLookup& lookup) -> Result<OutputBackend>
{
    if (requested != OutputBackend::Auto)
        return requested;

    auto const isSet = [&](std::string_view name) {
        auto const value = lookup(name);
        return value && !value->empty();
    };

    if (isSet("WAYLAND_DISPLAY"))
        return OutputBackend::Wayland;
    if (isSet("DISPLAY"))
        return OutputBackend::X11;
    return makeError(ErrorCode::InjectionFailed, "No graphical session found (neither WAYLAND_DISPLAY nor DISPLAY set)");
}

} // namespace pushscribe
