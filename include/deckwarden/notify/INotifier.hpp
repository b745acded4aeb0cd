#ifndef INCLUDE_DECKWARDEN_NOTIFY_INOTIFIER_HPP
#define INCLUDE_DECKWARDEN_NOTIFY_INOTIFIER_HPP

#include <string_view>

namespace deckwarden::notify
{

// Fire-and-forget sink for user-visible outcome messages.
class INotifier
{
public:
    INotifier() = default;
    INotifier(const INotifier&) = delete;
    INotifier& operator=(const INotifier&) = delete;
    INotifier(INotifier&&) = delete;
    INotifier& operator=(INotifier&&) = delete;
    virtual ~INotifier() = default;

    virtual void notify(std::string_view title, std::string_view body) = 0;
};

} // namespace deckwarden::notify

#endif // INCLUDE_DECKWARDEN_NOTIFY_INOTIFIER_HPP
