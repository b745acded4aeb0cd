#ifndef INCLUDE_DECKWARDEN_SECURITY_SECURESTRING_HPP
#define INCLUDE_DECKWARDEN_SECURITY_SECURESTRING_HPP

#include "deckwarden/security/MemoryWiper.hpp"
#include <cstddef>
#include <limits>
#include <new>
#include <span>
#include <string_view>
#include <type_traits>
#include <vector>

namespace deckwarden::security
{

// Allocator that wipes every block before handing it back to the heap.
template <class T> struct ZeroAllocator
{
    ZeroAllocator() noexcept = default;

    template <class U> constexpr explicit ZeroAllocator([[maybe_unused]] const ZeroAllocator<U>& u) noexcept {};

    using value_type = T;
    using is_always_equal = std::true_type;
    using propagate_on_container_move_assignment = std::true_type;
    using propagate_on_container_swap = std::true_type;

    T* allocate(std::size_t n)
    {
        if (n == 0U)
        {
            return nullptr;
        }
        if (n > (std::numeric_limits<std::size_t>::max() / sizeof(T)))
        {
            throw std::bad_array_new_length{};
        }
        return static_cast<T*>(::operator new(n * sizeof(T), std::align_val_t{ alignof(T) }));
    }

    void deallocate(T* p, std::size_t n) noexcept
    {
        if (p == nullptr)
        {
            return;
        }
        if (n != 0U)
        {
            secureWipe(std::span<std::byte>{ reinterpret_cast<std::byte*>(p), n * sizeof(T) });
        }
        ::operator delete(p, std::align_val_t{ alignof(T) });
    }
};

template <class T, class U>
constexpr bool operator==([[maybe_unused]] const ZeroAllocator<T>& t,
                          [[maybe_unused]] const ZeroAllocator<U>& u) noexcept
{
    return true;
}

// Holds passwords and other field contents that must not linger after use.
using SecureString = std::vector<char, ZeroAllocator<char>>;

[[nodiscard]] inline SecureString secureStringFrom(std::string_view s)
{
    // NOLINTNEXTLINE(modernize-return-braced-init-list)
    return SecureString(s.begin(), s.end());
}

[[nodiscard]] inline std::string_view asStringView(const SecureString& s) noexcept
{
    if (s.empty())
    {
        return {};
    }
    return std::string_view{ s.data(), s.size() };
}

[[nodiscard]] inline bool isBlank(const SecureString& s) noexcept
{
    for (const char c : s)
    {
        if (c != ' ' && c != '\t' && c != '\n' && c != '\r')
        {
            return false;
        }
    }
    return true;
}

inline void secureClear(SecureString& s) noexcept
{
    secureWipe(std::as_writable_bytes(std::span{ s }));
    s.clear();
}

} // namespace deckwarden::security

#endif // INCLUDE_DECKWARDEN_SECURITY_SECURESTRING_HPP
