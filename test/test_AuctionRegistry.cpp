#include <gtest/gtest.h>
#include "AuctionRegistry.hpp"

#include <atomic>
#include <chrono>
#include <string>
#include <thread>
#include <vector>

using namespace gavel;
using namespace std;

// -----------------------
// HELPER FUNCTIONS
// -----------------------
static Auction makeAuction(const string& channel, const string& item = "Sword") {
    Auction auction;
    auction.channelId = channel;
    auction.item = item;
    auction.endTime = Clock::now() + chrono::minutes(5);
    return auction;
}

// -----------------------
// BASIC TESTS
// -----------------------
TEST(AuctionRegistryTest, InsertAndFind) {
    AuctionRegistry registry;
    auto entry = registry.insertIfAbsent(makeAuction("chan-1"));
    ASSERT_NE(entry, nullptr);

    auto found = registry.find("chan-1");
    ASSERT_EQ(found, entry);
    EXPECT_EQ(found->auction.item, "Sword");
    EXPECT_TRUE(found->auction.bids.empty());
    EXPECT_FALSE(found->closed);
    EXPECT_EQ(registry.size(), 1u);
}

TEST(AuctionRegistryTest, SecondInsertForSameChannelFails) {
    AuctionRegistry registry;
    ASSERT_NE(registry.insertIfAbsent(makeAuction("chan-1", "Sword")), nullptr);
    EXPECT_EQ(registry.insertIfAbsent(makeAuction("chan-1", "Shield")), nullptr);

    EXPECT_EQ(registry.size(), 1u);
    EXPECT_EQ(registry.find("chan-1")->auction.item, "Sword");
}

TEST(AuctionRegistryTest, ChannelsAreIndependent) {
    AuctionRegistry registry;
    ASSERT_NE(registry.insertIfAbsent(makeAuction("chan-1")), nullptr);
    ASSERT_NE(registry.insertIfAbsent(makeAuction("chan-2")), nullptr);
    EXPECT_EQ(registry.size(), 2u);
    EXPECT_TRUE(registry.contains("chan-2"));
    EXPECT_FALSE(registry.contains("chan-3"));
    EXPECT_EQ(registry.find("chan-3"), nullptr);
}

TEST(AuctionRegistryTest, RemoveIfSameOnlyRemovesThatEntry) {
    AuctionRegistry registry;
    auto first = registry.insertIfAbsent(makeAuction("chan-1"));
    ASSERT_TRUE(registry.removeIfSame("chan-1", first));
    EXPECT_FALSE(registry.contains("chan-1"));

    // Already gone
    EXPECT_FALSE(registry.removeIfSame("chan-1", first));

    // A newer auction in the same channel is not removed through the old handle
    auto second = registry.insertIfAbsent(makeAuction("chan-1", "Shield"));
    ASSERT_NE(second, nullptr);
    EXPECT_FALSE(registry.removeIfSame("chan-1", first));
    EXPECT_TRUE(registry.contains("chan-1"));
}

TEST(AuctionRegistryTest, SnapshotIsACopy) {
    AuctionRegistry registry;
    auto entry = registry.insertIfAbsent(makeAuction("chan-1"));
    registry.insertIfAbsent(makeAuction("chan-2"));

    auto entries = registry.snapshot();
    ASSERT_EQ(entries.size(), 2u);

    ASSERT_TRUE(registry.removeIfSame("chan-1", entry));
    EXPECT_EQ(entries.size(), 2u);
    EXPECT_EQ(registry.size(), 1u);
}

// -----------------------
// STRESS TESTS
// -----------------------
TEST(AuctionRegistryTest, ConcurrentInsertsForOneChannelHaveOneWinner) {
    AuctionRegistry registry;
    const int N = 16;
    atomic<int> winners{0};

    vector<thread> threads;
    for (int i = 0; i < N; ++i) {
        threads.emplace_back([&registry, &winners, i] {
            if (registry.insertIfAbsent(makeAuction("contested", "item-" + to_string(i)))) {
                winners++;
            }
        });
    }
    for (auto& t : threads) t.join();

    EXPECT_EQ(winners.load(), 1);
    EXPECT_EQ(registry.size(), 1u);
}

TEST(AuctionRegistryTest, ConcurrentRemovesHaveOneWinner) {
    AuctionRegistry registry;
    auto entry = registry.insertIfAbsent(makeAuction("chan-1"));
    atomic<int> removals{0};

    vector<thread> threads;
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&] {
            if (registry.removeIfSame("chan-1", entry)) {
                removals++;
            }
        });
    }
    for (auto& t : threads) t.join();

    EXPECT_EQ(removals.load(), 1);
    EXPECT_EQ(registry.size(), 0u);
}

TEST(AuctionRegistryTest, StressManyChannels) {
    AuctionRegistry registry;
    const int N = 1000;
    for (int i = 0; i < N; ++i) {
        ASSERT_NE(registry.insertIfAbsent(makeAuction("chan-" + to_string(i))), nullptr);
    }
    EXPECT_EQ(registry.size(), static_cast<size_t>(N));
    EXPECT_EQ(registry.snapshot().size(), static_cast<size_t>(N));
}
