#ifndef INCLUDE_DECKWARDEN_GATEWAY_BWCLI_BWCLIGATEWAYFACTORY_HPP
#define INCLUDE_DECKWARDEN_GATEWAY_BWCLI_BWCLIGATEWAYFACTORY_HPP

#include "deckwarden/gateway/IVaultGateway.hpp"
#include <chrono>
#include <functional>
#include <memory>
#include <string>

namespace deckwarden::gateway::bwcli
{

struct BwCliOptions final
{
    std::string program{ "bw" };
    std::chrono::milliseconds timeout{ 60000 };
};

// Read before every invocation, so settings changes apply to the next command.
using BwCliOptionsProvider = std::function<BwCliOptions()>;

// Runs the Bitwarden CLI through QProcess; completions are delivered from the Qt event loop.
[[nodiscard]] std::unique_ptr<deckwarden::gateway::IVaultGateway> makeBwCliGateway(BwCliOptionsProvider options);

} // namespace deckwarden::gateway::bwcli

#endif // INCLUDE_DECKWARDEN_GATEWAY_BWCLI_BWCLIGATEWAYFACTORY_HPP
