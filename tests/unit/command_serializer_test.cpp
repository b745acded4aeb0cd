#include "deckwarden/core/CommandSerializer.hpp"

#include <gtest/gtest.h>
#include <stdexcept>
#include <utility>

using deckwarden::core::Admission;
using deckwarden::core::CommandKind;
using deckwarden::core::CommandSerializer;
using deckwarden::core::LeaseHandle;

TEST(CommandSerializer, IdleByDefault)
{
    const CommandSerializer serializer{};
    EXPECT_FALSE(serializer.busy());
    EXPECT_FALSE(serializer.activeCommand().has_value());
}

TEST(CommandSerializer, SecondCommandIsRejectedWhileFirstHoldsTheSlot)
{
    CommandSerializer serializer{};
    LeaseHandle kept{};

    ASSERT_EQ(serializer.run(CommandKind::Sync, [&](LeaseHandle lease) { kept = std::move(lease); }),
              Admission::Started);
    EXPECT_TRUE(serializer.busy());
    EXPECT_EQ(serializer.activeCommand(), CommandKind::Sync);

    bool secondRan = false;
    EXPECT_EQ(serializer.run(CommandKind::Lock, [&](const LeaseHandle&) { secondRan = true; }), Admission::Busy);
    EXPECT_FALSE(secondRan);

    kept->release();
    EXPECT_FALSE(serializer.busy());
    EXPECT_EQ(serializer.run(CommandKind::Lock, [&](const LeaseHandle&) { secondRan = true; }), Admission::Started);
    EXPECT_TRUE(secondRan);
}

TEST(CommandSerializer, DroppingTheLeaseReleasesTheSlot)
{
    CommandSerializer serializer{};
    LeaseHandle kept{};

    ASSERT_EQ(serializer.run(CommandKind::Search, [&](LeaseHandle lease) { kept = std::move(lease); }),
              Admission::Started);
    ASSERT_TRUE(serializer.busy());

    kept.reset();
    EXPECT_FALSE(serializer.busy());
}

TEST(CommandSerializer, SynchronousActionReleasesOnReturn)
{
    CommandSerializer serializer{};
    ASSERT_EQ(serializer.run(CommandKind::Refresh, [](const LeaseHandle&) {}), Admission::Started);
    EXPECT_FALSE(serializer.busy());
}

TEST(CommandSerializer, ThrowingActionReleasesAndPropagates)
{
    CommandSerializer serializer{};
    LeaseHandle leaked{};

    EXPECT_THROW((void)serializer.run(CommandKind::Login,
                                      [&](LeaseHandle lease)
                                      {
                                          leaked = std::move(lease);
                                          throw std::runtime_error("boom");
                                      }),
                 std::runtime_error);

    EXPECT_FALSE(serializer.busy());
    ASSERT_NE(leaked, nullptr);
    EXPECT_FALSE(leaked->held());
}

TEST(CommandSerializer, ReleaseIsIdempotent)
{
    CommandSerializer serializer{};
    LeaseHandle kept{};
    ASSERT_EQ(serializer.run(CommandKind::Sync, [&](LeaseHandle lease) { kept = std::move(lease); }),
              Admission::Started);

    kept->release();
    ASSERT_EQ(serializer.run(CommandKind::Lock, [&](LeaseHandle lease) { lease.reset(); }), Admission::Started);
    kept->release();
    EXPECT_FALSE(serializer.busy());
    EXPECT_EQ(kept->kind(), CommandKind::Sync);
}

TEST(CommandSerializer, LeaseMayOutliveTheSerializer)
{
    LeaseHandle kept{};
    {
        CommandSerializer serializer{};
        ASSERT_EQ(serializer.run(CommandKind::Sync, [&](LeaseHandle lease) { kept = std::move(lease); }),
                  Admission::Started);
        ASSERT_TRUE(kept->held());
    }

    EXPECT_FALSE(kept->held());
    kept->release();
    kept.reset();
}
