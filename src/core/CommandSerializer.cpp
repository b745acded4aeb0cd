#include "deckwarden/core/CommandSerializer.hpp"

namespace deckwarden::core
{

std::string_view toString(CommandKind kind) noexcept
{
    switch (kind)
    {
    case CommandKind::Refresh:
        return "refresh";
    case CommandKind::Login:
        return "login";
    case CommandKind::Unlock:
        return "unlock";
    case CommandKind::Sync:
        return "sync";
    case CommandKind::Lock:
        return "lock";
    case CommandKind::Logout:
        return "logout";
    case CommandKind::Search:
        return "search";
    case CommandKind::SelectItem:
        return "select";
    }
    return "unknown";
}

CommandLease::CommandLease(const std::shared_ptr<CommandSlot>& slot, CommandKind kind) noexcept
    : m_slot(slot), m_kind(kind)
{
    slot->m_owner = kind;
}

CommandLease::~CommandLease() noexcept
{
    release();
}

void CommandLease::release() noexcept
{
    if (!m_held)
    {
        return;
    }
    m_held = false;
    if (const auto slot = m_slot.lock())
    {
        slot->m_owner.reset();
    }
    m_slot.reset();
}

Admission CommandSerializer::run(CommandKind kind, const Action& action)
{
    if (m_slot->busy())
    {
        return Admission::Busy;
    }

    auto lease = std::make_shared<CommandLease>(m_slot, kind);
    try
    {
        action(lease);
    }
    catch (...)
    {
        lease->release();
        throw;
    }
    return Admission::Started;
}

bool CommandSerializer::busy() const noexcept
{
    return m_slot->busy();
}

std::optional<CommandKind> CommandSerializer::activeCommand() const noexcept
{
    return m_slot->owner();
}

} // namespace deckwarden::core
