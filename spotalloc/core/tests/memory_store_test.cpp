#include <spotalloc/core/error.hpp>
#include <spotalloc/core/memory_store.hpp>

#include <gtest/gtest.h>

#include <stdexcept>
#include <vector>

using namespace spotalloc::core;

namespace {

class CollectingRecorder : public AuditRecorder {
public:
    void record(const AuditRecord& record) override { records.push_back(record); }
    std::vector<AuditRecord> records;
};

class FailingRecorder : public AuditRecorder {
public:
    void record(const AuditRecord& /*record*/) override {
        throw std::runtime_error("audit sink unavailable");
    }
};

Truck make_truck(std::string id, std::optional<std::string> spot = std::nullopt) {
    Truck truck;
    truck.id = std::move(id);
    truck.spot = std::move(spot);
    return truck;
}

AuditRecord spot_record(const TruckId& id) {
    AuditRecord record;
    record.entity_id = id;
    record.field = "spot";
    record.new_value = std::string("B1_F1_V1");
    return record;
}

} // anonymous namespace

class MemoryStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        store.put_truck(make_truck("a", "B1_F1_V1"));
        store.put_truck(make_truck("b", "B1_F1_V2"));
        store.put_truck(make_truck("c"));
    }

    CollectingRecorder recorder;
    InMemoryEntityStore store{&recorder};
};

// =============================================================================
// Reads
// =============================================================================

TEST_F(MemoryStoreTest, FindTruck) {
    auto truck = store.find_truck("a");
    ASSERT_TRUE(truck.has_value());
    EXPECT_EQ(truck->spot, "B1_F1_V1");
    EXPECT_FALSE(store.find_truck("zzz").has_value());
}

TEST_F(MemoryStoreTest, FindTrucksInSpots) {
    std::vector<std::string> tokens{"B1_F1_V2", "B1_F1_V3"};
    auto trucks = store.find_trucks_in_spots(tokens);
    ASSERT_EQ(trucks.size(), 1u);
    EXPECT_EQ(trucks[0].id, "b");
}

TEST_F(MemoryStoreTest, TrucksOrderedById) {
    auto trucks = store.trucks();
    ASSERT_EQ(trucks.size(), 3u);
    EXPECT_EQ(trucks[0].id, "a");
    EXPECT_EQ(trucks[2].id, "c");
    EXPECT_EQ(store.size(), 3u);
}

// =============================================================================
// Transactions
// =============================================================================

TEST_F(MemoryStoreTest, CommitPublishesChangesAndRecords) {
    store.run_in_transaction([](StoreTransaction& tx) {
        auto truck = tx.find_truck("c");
        ASSERT_TRUE(truck.has_value());
        truck->spot = "B1_F1_V3";
        tx.save_truck(*truck);
        tx.record(spot_record("c"));
    });

    EXPECT_EQ(store.find_truck("c")->spot, "B1_F1_V3");
    ASSERT_EQ(recorder.records.size(), 1u);
    EXPECT_EQ(recorder.records[0].entity_id, "c");
}

TEST_F(MemoryStoreTest, TransactionSeesItsOwnWrites) {
    store.run_in_transaction([](StoreTransaction& tx) {
        std::vector<SpotUpdate> updates{{"c", std::string("B2_F1_V1")}};
        tx.update_spots(updates);
        std::vector<std::string> tokens{"B2_F1_V1"};
        EXPECT_EQ(tx.find_trucks_in_spots(tokens).size(), 1u);
    });
}

TEST_F(MemoryStoreTest, ThrowRollsBackEverything) {
    EXPECT_THROW(store.run_in_transaction([](StoreTransaction& tx) {
        std::vector<SpotUpdate> updates{{"a", std::nullopt}};
        tx.update_spots(updates);
        tx.record(spot_record("a"));
        throw std::runtime_error("boom");
    }),
                 std::runtime_error);

    EXPECT_EQ(store.find_truck("a")->spot, "B1_F1_V1");
    EXPECT_TRUE(recorder.records.empty());
}

TEST_F(MemoryStoreTest, SaveUnknownTruckThrowsNotFound) {
    EXPECT_THROW(store.run_in_transaction(
                     [](StoreTransaction& tx) { tx.save_truck(make_truck("ghost")); }),
                 NotFoundError);
}

TEST_F(MemoryStoreTest, UpdateSpotsIsAllOrNothing) {
    EXPECT_THROW(store.run_in_transaction([](StoreTransaction& tx) {
        std::vector<SpotUpdate> updates{{"a", std::nullopt}, {"ghost", std::nullopt}};
        try {
            tx.update_spots(updates);
        } catch (const NotFoundError&) {
            // The working copy must be untouched after the failed call
            EXPECT_EQ(tx.find_truck("a")->spot, "B1_F1_V1");
            throw;
        }
    }),
                 NotFoundError);

    EXPECT_EQ(store.find_truck("a")->spot, "B1_F1_V1");
}

TEST_F(MemoryStoreTest, RecorderFailureAbortsCommit) {
    FailingRecorder failing;
    store.set_audit_recorder(&failing);

    EXPECT_THROW(store.run_in_transaction([](StoreTransaction& tx) {
        std::vector<SpotUpdate> updates{{"c", std::string("B1_F1_V3")}};
        tx.update_spots(updates);
        tx.record(spot_record("c"));
    }),
                 std::runtime_error);

    EXPECT_FALSE(store.find_truck("c")->spot.has_value());
}

TEST_F(MemoryStoreTest, NoRecorderStillCommits) {
    store.set_audit_recorder(nullptr);
    store.run_in_transaction([](StoreTransaction& tx) {
        std::vector<SpotUpdate> updates{{"c", std::string("B1_F1_V3")}};
        tx.update_spots(updates);
        tx.record(spot_record("c"));
    });
    EXPECT_EQ(store.find_truck("c")->spot, "B1_F1_V3");
}

TEST_F(MemoryStoreTest, UnitOfWorkReturnsResult) {
    auto count = unit_of_work(store, [](StoreTransaction& tx) {
        std::vector<std::string> tokens{"B1_F1_V1", "B1_F1_V2"};
        return tx.find_trucks_in_spots(tokens).size();
    });
    EXPECT_EQ(count, 2u);
}
