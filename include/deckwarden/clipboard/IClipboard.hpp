#ifndef INCLUDE_DECKWARDEN_CLIPBOARD_ICLIPBOARD_HPP
#define INCLUDE_DECKWARDEN_CLIPBOARD_ICLIPBOARD_HPP

#include <optional>
#include <string>
#include <string_view>

namespace deckwarden::clipboard
{

class IClipboardWriter
{
public:
    IClipboardWriter() = default;
    IClipboardWriter(const IClipboardWriter&) = delete;
    IClipboardWriter& operator=(const IClipboardWriter&) = delete;
    IClipboardWriter(IClipboardWriter&&) = delete;
    IClipboardWriter& operator=(IClipboardWriter&&) = delete;
    virtual ~IClipboardWriter() = default;

    // Returns false when the text could not be placed on the clipboard.
    [[nodiscard]] virtual bool writeText(std::string_view text) = 0;
};

class IClipboardReader
{
public:
    IClipboardReader() = default;
    IClipboardReader(const IClipboardReader&) = delete;
    IClipboardReader& operator=(const IClipboardReader&) = delete;
    IClipboardReader(IClipboardReader&&) = delete;
    IClipboardReader& operator=(IClipboardReader&&) = delete;
    virtual ~IClipboardReader() = default;

    // std::nullopt when read-back is unsupported here or failed.
    [[nodiscard]] virtual std::optional<std::string> readText() = 0;
};

} // namespace deckwarden::clipboard

#endif // INCLUDE_DECKWARDEN_CLIPBOARD_ICLIPBOARD_HPP
