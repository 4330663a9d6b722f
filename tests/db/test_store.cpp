// SEALBID - Bid Store Tests
// Copyright (c) 2024 SEALBID Developers
// MIT License

#include <gtest/gtest.h>
#include "sealbid/db/memorydb.h"
#include "sealbid/ledger/store.h"
#include "sealbid/util/logging.h"

#include <string>
#include <vector>

namespace sealbid {
namespace ledger {
namespace test {

// ============================================================================
// Test Fixtures
// ============================================================================

class BidStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        util::Logger::Instance().ClearSinks();
        auto db = std::make_unique<db::MemoryDatabase>();
        mem_ = db.get();
        store_ = std::make_unique<BidStore>(std::move(db));
    }
    
    static Hash256 MakeHash(Byte fill) {
        std::vector<Byte> bytes(32, fill);
        return Hash256(bytes.data(), bytes.size());
    }
    
    static BidHeader MakeHeader(const std::string& bidder, Byte fill, BlockHeight height) {
        BidHeader h;
        h.bidder = bidder;
        h.commitment = MakeHash(fill);
        h.submittedAt = height;
        return h;
    }
    
    db::MemoryDatabase* mem_{nullptr};
    std::unique_ptr<BidStore> store_;
};

// ============================================================================
// Keys
// ============================================================================

TEST_F(BidStoreTest, ProjectKeyIsBigEndian) {
    std::string key = ProjectKey(0x0102);
    ASSERT_EQ(key.size(), 9u);
    EXPECT_EQ(key[0], prefix::PROJECT);
    EXPECT_EQ(key[7], '\x01');
    EXPECT_EQ(key[8], '\x02');
}

TEST_F(BidStoreTest, BidKeyAppendsBidder) {
    std::string key = BidKey(1, "bidder1");
    EXPECT_EQ(key[0], prefix::BID);
    EXPECT_EQ(key.substr(9), "bidder1");
    EXPECT_NE(BidKey(1, "a"), BidKey(2, "a"));
}

// ============================================================================
// Projects
// ============================================================================

TEST_F(BidStoreTest, CreateAndReadProject) {
    EXPECT_FALSE(store_->HasProject(7));
    ASSERT_TRUE(store_->CreateProject(7).ok());
    EXPECT_TRUE(store_->HasProject(7));
    
    ProjectBidList list;
    ASSERT_TRUE(store_->ReadProjectBids(7, &list).ok());
    EXPECT_TRUE(list.IsEmpty());
}

TEST_F(BidStoreTest, ReadUnknownProjectIsNotFound) {
    ProjectBidList list;
    EXPECT_TRUE(store_->ReadProjectBids(99, &list).IsNotFound());
}

TEST_F(BidStoreTest, ListProjectsInOrder) {
    ASSERT_TRUE(store_->CreateProject(300).ok());
    ASSERT_TRUE(store_->CreateProject(2).ok());
    ASSERT_TRUE(store_->CreateProject(256).ok());
    ASSERT_TRUE(store_->WriteAccessControl({"deployer", false}).ok());
    
    std::vector<ProjectId> expected = {2, 256, 300};
    EXPECT_EQ(store_->ListProjects(), expected);
}

TEST_F(BidStoreTest, ListProjectsStopsAtNextPrefix) {
    ASSERT_TRUE(store_->CreateProject(7).ok());
    ASSERT_TRUE(mem_->Put(std::string(1, static_cast<char>(prefix::PROJECT + 1)) + "x", "v").ok());
    
    std::vector<ProjectId> expected = {7};
    EXPECT_EQ(store_->ListProjects(), expected);
}

// ============================================================================
// Bids
// ============================================================================

TEST_F(BidStoreTest, InsertBidWritesListAndRecord) {
    ASSERT_TRUE(store_->CreateProject(1).ok());
    
    ProjectBidList list;
    ASSERT_TRUE(list.Append(MakeHeader("alice", 0xaa, 100)));
    BidRecord record = BidRecord::Sealed(MakeHash(0xaa));
    
    ASSERT_TRUE(store_->InsertBid(1, list, "alice", record).ok());
    
    ProjectBidList storedList;
    ASSERT_TRUE(store_->ReadProjectBids(1, &storedList).ok());
    EXPECT_EQ(storedList, list);
    
    BidRecord storedRecord;
    ASSERT_TRUE(store_->ReadBid(1, "alice", &storedRecord).ok());
    EXPECT_EQ(storedRecord, record);
    EXPECT_FALSE(storedRecord.revealedAt.has_value());
}

TEST_F(BidStoreTest, EraseBidRemovesRecord) {
    ASSERT_TRUE(store_->CreateProject(1).ok());
    ProjectBidList list;
    list.Append(MakeHeader("alice", 0xaa, 100));
    ASSERT_TRUE(store_->InsertBid(1, list, "alice", BidRecord::Sealed(MakeHash(0xaa))).ok());
    
    list.Remove("alice");
    ASSERT_TRUE(store_->EraseBid(1, list, "alice").ok());
    
    BidRecord record;
    EXPECT_TRUE(store_->ReadBid(1, "alice", &record).IsNotFound());
    
    ProjectBidList storedList;
    ASSERT_TRUE(store_->ReadProjectBids(1, &storedList).ok());
    EXPECT_TRUE(storedList.IsEmpty());
}

TEST_F(BidStoreTest, FailedInsertWritesNothing) {
    ASSERT_TRUE(store_->CreateProject(1).ok());
    size_t before = mem_->Size();
    
    ProjectBidList list;
    list.Append(MakeHeader("alice", 0xaa, 100));
    
    mem_->FailNextWrites(1);
    EXPECT_TRUE(store_->InsertBid(1, list, "alice", BidRecord::Sealed(MakeHash(0xaa))).IsIOError());
    
    EXPECT_EQ(mem_->Size(), before);
    ProjectBidList storedList;
    ASSERT_TRUE(store_->ReadProjectBids(1, &storedList).ok());
    EXPECT_TRUE(storedList.IsEmpty());
}

TEST_F(BidStoreTest, CorruptValueReported) {
    ASSERT_TRUE(mem_->Put(BidKey(1, "alice"), "\x01\x02").ok());
    
    BidRecord record;
    EXPECT_TRUE(store_->ReadBid(1, "alice", &record).IsCorruption());
}

// ============================================================================
// Ledger State
// ============================================================================

TEST_F(BidStoreTest, AccessControlRoundTrip) {
    AccessControl ac;
    EXPECT_TRUE(store_->ReadAccessControl(&ac).IsNotFound());
    
    ac.admin = "board";
    ac.paused = true;
    ASSERT_TRUE(store_->WriteAccessControl(ac).ok());
    
    AccessControl stored;
    ASSERT_TRUE(store_->ReadAccessControl(&stored).ok());
    EXPECT_EQ(stored, ac);
}

TEST_F(BidStoreTest, HeightRoundTrip) {
    BlockHeight height = 0;
    EXPECT_TRUE(store_->ReadHeight(&height).IsNotFound());
    
    ASSERT_TRUE(store_->WriteHeight(12345).ok());
    ASSERT_TRUE(store_->ReadHeight(&height).ok());
    EXPECT_EQ(height, 12345u);
}

} // namespace test
} // namespace ledger
} // namespace sealbid
