#include "deckwarden/core/ErrorClassifier.hpp"
#include <algorithm>
#include <array>
#include <cctype>
#include <string>

namespace deckwarden::core
{
namespace
{
constexpr std::array<std::string_view, 3> g_sessionLossMarkers{
    "no active session",
    "unauthenticated",
    "locked",
};
} // namespace

ErrorClass classifyError(std::string_view message)
{
    std::string lowered(message);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](char c) { return static_cast<char>(std::tolower(static_cast<unsigned char>(c))); });

    const bool sessionLost = std::any_of(g_sessionLossMarkers.begin(), g_sessionLossMarkers.end(),
                                         [&](std::string_view marker)
                                         { return lowered.find(marker) != std::string::npos; });

    return sessionLost ? ErrorClass::Transient : ErrorClass::Permanent;
}

} // namespace deckwarden::core
