#include "gateway/bwcli/BwOutput.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

using deckwarden::core::VaultItemDetail;
using deckwarden::core::VaultItemSummary;
using deckwarden::gateway::GatewayError;
using deckwarden::gateway::StatusPayload;
namespace bwcli = deckwarden::gateway::bwcli;

TEST(BwOutput, ParsesStatusWithEmail)
{
    const auto result = bwcli::parseStatus(
        R"({"serverUrl":null,"lastSync":"2024-01-01T00:00:00.000Z","userEmail":"user@example.com","status":"locked"})");

    const auto* payload = std::get_if<StatusPayload>(&result);
    ASSERT_NE(payload, nullptr);
    EXPECT_EQ(payload->status, "locked");
    EXPECT_EQ(payload->userEmail, "user@example.com");
}

TEST(BwOutput, StatusWithoutFieldsYieldsEmptyStatus)
{
    const auto result = bwcli::parseStatus(R"({"status":null})");

    const auto* payload = std::get_if<StatusPayload>(&result);
    ASSERT_NE(payload, nullptr);
    EXPECT_TRUE(payload->status.empty());
    EXPECT_FALSE(payload->userEmail.has_value());
}

TEST(BwOutput, MalformedStatusIsAnError)
{
    const auto result = bwcli::parseStatus("? Master password: [hidden]");

    const auto* error = std::get_if<GatewayError>(&result);
    ASSERT_NE(error, nullptr);
    EXPECT_THAT(error->message, ::testing::HasSubstr("Unexpected status output from bw"));
}

TEST(BwOutput, ItemListSkipsEntriesWithoutId)
{
    const auto result = bwcli::parseItemList(R"([{"id":"a1","name":"Bank"},{"name":"orphan"},{"id":"b2","name":"Mail"}])");

    const auto* items = std::get_if<std::vector<VaultItemSummary>>(&result);
    ASSERT_NE(items, nullptr);
    ASSERT_EQ(items->size(), 2U);
    EXPECT_EQ((*items)[0], (VaultItemSummary{ "a1", "Bank" }));
    EXPECT_EQ((*items)[1], (VaultItemSummary{ "b2", "Mail" }));
}

TEST(BwOutput, ItemListMustBeAnArray)
{
    const auto result = bwcli::parseItemList(R"({"id":"a1"})");
    EXPECT_TRUE(std::holds_alternative<GatewayError>(result));
}

TEST(BwOutput, ParsesLoginItem)
{
    const auto result = bwcli::parseItem(R"({
        "id": "a1",
        "name": "Bank",
        "login": {
            "username": "alice",
            "password": "s3cret",
            "totp": "",
            "uris": [ { "match": null, "uri": "https://bank.example" }, { "uri": "" } ]
        }
    })");

    const auto* item = std::get_if<VaultItemDetail>(&result);
    ASSERT_NE(item, nullptr);
    EXPECT_EQ(item->id, "a1");
    EXPECT_EQ(item->name, "Bank");
    EXPECT_EQ(item->username, "alice");
    EXPECT_EQ(item->password, "s3cret");
    EXPECT_FALSE(item->totp.has_value());
    ASSERT_EQ(item->uris.size(), 1U);
    EXPECT_EQ(item->uris[0], "https://bank.example");
}

TEST(BwOutput, NonLoginItemHasNoCredentials)
{
    const auto result = bwcli::parseItem(R"({"id":"n1","name":"Note","type":2,"notes":"text"})");

    const auto* item = std::get_if<VaultItemDetail>(&result);
    ASSERT_NE(item, nullptr);
    EXPECT_FALSE(item->username.has_value());
    EXPECT_FALSE(item->password.has_value());
    EXPECT_TRUE(item->uris.empty());
}

TEST(BwOutput, ItemWithoutIdIsAnError)
{
    const auto result = bwcli::parseItem(R"({"name":"Bank"})");

    const auto* error = std::get_if<GatewayError>(&result);
    ASSERT_NE(error, nullptr);
    EXPECT_THAT(error->message, ::testing::HasSubstr("missing id"));
}

TEST(BwOutput, ErrorTextPrefersStderr)
{
    EXPECT_EQ(bwcli::errorText("  Invalid master password.\n", "ignored", 1), QStringLiteral("Invalid master password."));
    EXPECT_EQ(bwcli::errorText("", "You are not logged in.\n", 1), QStringLiteral("You are not logged in."));
    EXPECT_EQ(bwcli::errorText("", "", 3), QStringLiteral("bw exited with code 3"));
}

TEST(BwOutput, RedactsSecondFactorCodeAndSessionKey)
{
    const QStringList args{ "login", "user@example.com", "--method", "0", "--code", "123456", "--session", "KEY" };

    const QStringList redacted = bwcli::redactedArguments(args);

    ASSERT_EQ(redacted.size(), args.size());
    EXPECT_FALSE(redacted.contains(QStringLiteral("123456")));
    EXPECT_FALSE(redacted.contains(QStringLiteral("KEY")));
    EXPECT_EQ(redacted.at(5), QStringLiteral("***"));
    EXPECT_EQ(redacted.at(1), QStringLiteral("user@example.com"));
}
