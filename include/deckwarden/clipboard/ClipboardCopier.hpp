#ifndef INCLUDE_DECKWARDEN_CLIPBOARD_CLIPBOARDCOPIER_HPP
#define INCLUDE_DECKWARDEN_CLIPBOARD_CLIPBOARDCOPIER_HPP

#include "deckwarden/clipboard/IClipboard.hpp"
#include "deckwarden/notify/INotifier.hpp"
#include <cstdint>
#include <string_view>

namespace deckwarden::clipboard
{

enum class CopyFailure : std::uint8_t
{
    None,
    NothingToCopy,
    WriteFailed,
};

struct CopyResult final
{
    bool success{ false };
    // True when the clipboard was read back and matched, or when read-back was unavailable.
    bool verified{ false };
    CopyFailure failure{ CopyFailure::None };
};

class ClipboardCopier final
{
public:
    // `fallback`, `reader` and `notifier` are optional.
    ClipboardCopier(IClipboardWriter& primary, IClipboardWriter* fallback, IClipboardReader* reader,
                    deckwarden::notify::INotifier* notifier) noexcept;

    [[nodiscard]] CopyResult copy(std::string_view value, std::string_view label);

private:
    [[nodiscard]] bool write(std::string_view value);
    [[nodiscard]] bool verify(std::string_view value);
    void report(const CopyResult& result, std::string_view label);

    IClipboardWriter* m_primary{ nullptr };
    IClipboardWriter* m_fallback{ nullptr };
    IClipboardReader* m_reader{ nullptr };
    deckwarden::notify::INotifier* m_notifier{ nullptr };
};

} // namespace deckwarden::clipboard

#endif // INCLUDE_DECKWARDEN_CLIPBOARD_CLIPBOARDCOPIER_HPP
