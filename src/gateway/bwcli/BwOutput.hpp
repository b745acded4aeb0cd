#ifndef SRC_GATEWAY_BWCLI_BWOUTPUT_HPP
#define SRC_GATEWAY_BWCLI_BWOUTPUT_HPP

#include "deckwarden/core/VaultItem.hpp"
#include "deckwarden/gateway/IVaultGateway.hpp"
#include <QByteArray>
#include <QString>
#include <QStringList>
#include <vector>

namespace deckwarden::gateway::bwcli
{

// `bw status` prints one JSON object; a missing "status" field yields an empty status string.
[[nodiscard]] GatewayResult<StatusPayload> parseStatus(const QByteArray& json);

// `bw list items` prints a JSON array of items.
[[nodiscard]] GatewayResult<std::vector<deckwarden::core::VaultItemSummary>> parseItemList(const QByteArray& json);

// `bw get item` prints one JSON item.
[[nodiscard]] GatewayResult<deckwarden::core::VaultItemDetail> parseItem(const QByteArray& json);

// Trimmed stderr, else trimmed stdout, else a generic exit-code message.
[[nodiscard]] QString errorText(const QByteArray& stderrData, const QByteArray& stdoutData, int exitCode);

// Argument list with values that must not reach the log replaced by "***".
[[nodiscard]] QStringList redactedArguments(const QStringList& args);

} // namespace deckwarden::gateway::bwcli

#endif // SRC_GATEWAY_BWCLI_BWOUTPUT_HPP
