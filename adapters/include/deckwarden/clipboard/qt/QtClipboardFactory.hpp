#ifndef INCLUDE_DECKWARDEN_CLIPBOARD_QT_QTCLIPBOARDFACTORY_HPP
#define INCLUDE_DECKWARDEN_CLIPBOARD_QT_QTCLIPBOARDFACTORY_HPP

#include "deckwarden/clipboard/IClipboard.hpp"
#include <memory>

namespace deckwarden::clipboard::qt
{

// QGuiApplication::clipboard(). Writing fails, so a fallback writer can take over, when there is no
// QGuiApplication or the clipboard does not hold the text afterwards.
[[nodiscard]] std::unique_ptr<deckwarden::clipboard::IClipboardWriter> makeQtClipboardWriter();
[[nodiscard]] std::unique_ptr<deckwarden::clipboard::IClipboardReader> makeQtClipboardReader();

// Pipes the text into wl-copy (Wayland) or xclip (X11), whichever is installed.
[[nodiscard]] std::unique_ptr<deckwarden::clipboard::IClipboardWriter> makeCommandClipboardWriter();

} // namespace deckwarden::clipboard::qt

#endif // INCLUDE_DECKWARDEN_CLIPBOARD_QT_QTCLIPBOARDFACTORY_HPP
