#include "deckwarden/clipboard/ClipboardCopier.hpp"
#include "deckwarden/security/MemoryWiper.hpp"
#include <string>

namespace deckwarden::clipboard
{

ClipboardCopier::ClipboardCopier(IClipboardWriter& primary, IClipboardWriter* fallback, IClipboardReader* reader,
                                 deckwarden::notify::INotifier* notifier) noexcept
    : m_primary(&primary), m_fallback(fallback), m_reader(reader), m_notifier(notifier)
{
}

CopyResult ClipboardCopier::copy(std::string_view value, std::string_view label)
{
    CopyResult result{};
    if (value.empty())
    {
        result.failure = CopyFailure::NothingToCopy;
        report(result, label);
        return result;
    }

    if (!write(value))
    {
        result.failure = CopyFailure::WriteFailed;
        report(result, label);
        return result;
    }

    result.success = true;
    result.verified = verify(value);
    report(result, label);
    return result;
}

bool ClipboardCopier::write(std::string_view value)
{
    if (m_primary->writeText(value))
    {
        return true;
    }
    return (m_fallback != nullptr) && m_fallback->writeText(value);
}

bool ClipboardCopier::verify(std::string_view value)
{
    // Verification is best effort: no reader, or a reader that cannot answer, counts as verified.
    if (m_reader == nullptr)
    {
        return true;
    }

    auto readBack = m_reader->readText();
    if (!readBack)
    {
        return true;
    }

    const bool matches = (*readBack == value);
    deckwarden::security::secureWipe(*readBack);
    return matches;
}

void ClipboardCopier::report(const CopyResult& result, std::string_view label)
{
    if (m_notifier == nullptr)
    {
        return;
    }

    const std::string name{ label.empty() ? std::string_view{ "Value" } : label };
    switch (result.failure)
    {
    case CopyFailure::NothingToCopy:
        m_notifier->notify("Nothing to copy", name + " is empty.");
        return;
    case CopyFailure::WriteFailed:
        m_notifier->notify("Copy failed", "Could not copy " + name + " to the clipboard.");
        return;
    case CopyFailure::None:
        break;
    }

    if (result.verified)
    {
        m_notifier->notify("Copied", name + " copied to clipboard.");
    }
    else
    {
        m_notifier->notify("Copied", name + " copied, but the clipboard holds a different value.");
    }
}

} // namespace deckwarden::clipboard
