#ifndef INCLUDE_DECKWARDEN_CORE_ERRORCLASSIFIER_HPP
#define INCLUDE_DECKWARDEN_CORE_ERRORCLASSIFIER_HPP

#include <cstdint>
#include <string_view>

namespace deckwarden::core
{

enum class ErrorClass : std::uint8_t
{
    // The session was likely lost underneath us; the caller should reconcile with refreshStatus().
    Transient,
    // The failure concerns the request itself; cached status stays as it is.
    Permanent,
};

// The CLI reports session loss as free-text operation errors, so this is a substring heuristic
// over the lower-cased message. Keep every caller behind this one function.
[[nodiscard]] ErrorClass classifyError(std::string_view message);

[[nodiscard]] inline bool isTransient(std::string_view message)
{
    return classifyError(message) == ErrorClass::Transient;
}

} // namespace deckwarden::core

#endif // INCLUDE_DECKWARDEN_CORE_ERRORCLASSIFIER_HPP
