#include "deckwarden/core/SessionStatus.hpp"
#include <algorithm>
#include <cctype>

namespace deckwarden::core
{
namespace
{

[[nodiscard]] std::string trimmedLower(std::string_view raw)
{
    const auto isSpace = [](char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; };

    while (!raw.empty() && isSpace(raw.front()))
    {
        raw.remove_prefix(1);
    }
    while (!raw.empty() && isSpace(raw.back()))
    {
        raw.remove_suffix(1);
    }

    std::string out(raw);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](char c) { return static_cast<char>(std::tolower(static_cast<unsigned char>(c))); });
    return out;
}

} // namespace

SessionStatus parseSessionStatus(std::string_view raw) noexcept
{
    try
    {
        const auto value = trimmedLower(raw);
        if (value.empty())
        {
            return SessionStatus::Unknown;
        }
        if (value == "unlocked")
        {
            return SessionStatus::Unlocked;
        }
        if (value == "locked")
        {
            return SessionStatus::Locked;
        }
        return SessionStatus::Error;
    }
    catch (...)
    {
        return SessionStatus::Unknown;
    }
}

std::string_view toString(SessionStatus status) noexcept
{
    switch (status)
    {
    case SessionStatus::Unknown:
        return "unknown";
    case SessionStatus::Locked:
        return "locked";
    case SessionStatus::Unlocked:
        return "unlocked";
    case SessionStatus::Error:
        return "error";
    }
    return "unknown";
}

std::string describe(const SessionInfo& info)
{
    std::string text{ info.rawStatus.empty() ? std::string{ toString(info.status) } : info.rawStatus };
    if (info.userEmail && !info.userEmail->empty())
    {
        text += " (";
        text += *info.userEmail;
        text += ")";
    }
    return text;
}

} // namespace deckwarden::core
