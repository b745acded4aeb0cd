#ifndef INCLUDE_DECKWARDEN_SECURITY_MEMORYWIPER_HPP
#define INCLUDE_DECKWARDEN_SECURITY_MEMORYWIPER_HPP

#include <cstddef>
#include <string>
#include <span>
#include <type_traits>

namespace deckwarden::security
{
void secureWipe(std::span<std::byte> bytes) noexcept;

template <typename T>
    requires(!std::is_const_v<T> && std::is_trivially_copyable_v<T>)
void secureWipe(std::span<T> buffer) noexcept
{
    secureWipe(std::as_writable_bytes(buffer));
}

// Wipes the contents of a std::string in place; the caller still owns the (now zeroed) storage.
void secureWipe(std::string& text) noexcept;
} // namespace deckwarden::security

#endif // INCLUDE_DECKWARDEN_SECURITY_MEMORYWIPER_HPP
