#ifndef INCLUDE_DECKWARDEN_CORE_COMMANDSERIALIZER_HPP
#define INCLUDE_DECKWARDEN_CORE_COMMANDSERIALIZER_HPP

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string_view>

namespace deckwarden::core
{

enum class CommandKind : std::uint8_t
{
    Refresh,
    Login,
    Unlock,
    Sync,
    Lock,
    Logout,
    Search,
    SelectItem,
};

[[nodiscard]] std::string_view toString(CommandKind kind) noexcept;

enum class Admission : std::uint8_t
{
    Started,
    // Another command holds the slot; nothing was done and nothing is queued.
    Busy,
    // The user declined a confirmation step; nothing was done.
    Declined,
};

class CommandLease;

// The single busy flag guarding all session-mutating commands.
class CommandSlot final
{
public:
    [[nodiscard]] bool busy() const noexcept
    {
        return m_owner.has_value();
    }

    [[nodiscard]] std::optional<CommandKind> owner() const noexcept
    {
        return m_owner;
    }

private:
    friend class CommandLease;

    std::optional<CommandKind> m_owner{};
};

// Scoped ownership of the slot. The slot is released by release() or, at the latest, by the destructor,
// so a command whose continuation is dropped or throws can never wedge the slot. A lease may outlive
// its serializer; releasing it then does nothing.
class [[nodiscard]] CommandLease final
{
public:
    CommandLease(const std::shared_ptr<CommandSlot>& slot, CommandKind kind) noexcept;
    CommandLease(const CommandLease&) = delete;
    CommandLease& operator=(const CommandLease&) = delete;
    CommandLease(CommandLease&&) = delete;
    CommandLease& operator=(CommandLease&&) = delete;
    ~CommandLease() noexcept;

    void release() noexcept;

    [[nodiscard]] bool held() const noexcept
    {
        return m_held && !m_slot.expired();
    }

    [[nodiscard]] CommandKind kind() const noexcept
    {
        return m_kind;
    }

private:
    std::weak_ptr<CommandSlot> m_slot;
    CommandKind m_kind;
    bool m_held{ true };
};

using LeaseHandle = std::shared_ptr<CommandLease>;

class CommandSerializer final
{
public:
    // The action receives the lease and keeps it alive in its continuations; the last owner
    // (or an explicit release()) frees the slot. Exceptions from the action release the slot
    // and then propagate.
    using Action = std::function<void(LeaseHandle)>;

    [[nodiscard]] Admission run(CommandKind kind, const Action& action);

    [[nodiscard]] bool busy() const noexcept;
    [[nodiscard]] std::optional<CommandKind> activeCommand() const noexcept;

private:
    std::shared_ptr<CommandSlot> m_slot{ std::make_shared<CommandSlot>() };
};

} // namespace deckwarden::core

#endif // INCLUDE_DECKWARDEN_CORE_COMMANDSERIALIZER_HPP
