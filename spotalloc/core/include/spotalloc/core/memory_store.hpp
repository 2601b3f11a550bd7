#pragma once

/// @file memory_store.hpp
/// @brief In-process EntityStore backend.
/// @ingroup core_store

#include <spotalloc/core/audit.hpp>
#include <spotalloc/core/entity_store.hpp>

#include <cstddef>
#include <map>
#include <mutex>
#include <vector>

namespace spotalloc::core {

/// @brief EntityStore kept in memory, serialised by a single mutex.
///
/// A transaction copies the truck table, lets the work mutate the copy,
/// delivers the queued audit records to the attached recorder and only
/// then publishes the copy. Reads and transactions are mutually
/// exclusive, so snapshot reads never observe a partial batch.
///
/// The work callback must not call back into the store itself (only
/// through the handle it receives); doing so deadlocks.
///
/// @ingroup core_store
/// @see EntityStore, AuditRecorder
class InMemoryEntityStore : public EntityStore {
public:
    /// @brief Construct an empty store.
    /// @param recorder Optional audit sink (must outlive the store).
    explicit InMemoryEntityStore(AuditRecorder* recorder = nullptr);

    /// @brief Attach or replace the audit sink (nullptr discards records).
    void set_audit_recorder(AuditRecorder* recorder);

    /// @brief Insert or replace a truck outside any transaction.
    ///
    /// Used to seed the store the way the surrounding CRUD flows would.
    void put_truck(Truck truck);

    /// @brief Snapshot of every truck, ordered by id.
    [[nodiscard]] std::vector<Truck> trucks() const;

    /// @brief Number of stored trucks.
    [[nodiscard]] std::size_t size() const;

    [[nodiscard]] std::optional<Truck> find_truck(const TruckId& id) const override;

    [[nodiscard]] std::vector<Truck> find_trucks_in_spots(
        std::span<const std::string> tokens) const override;

    void run_in_transaction(const std::function<void(StoreTransaction&)>& work) override;

    InMemoryEntityStore(const InMemoryEntityStore&) = delete;
    InMemoryEntityStore& operator=(const InMemoryEntityStore&) = delete;
    InMemoryEntityStore(InMemoryEntityStore&&) = delete;
    InMemoryEntityStore& operator=(InMemoryEntityStore&&) = delete;

private:
    using Table = std::map<TruckId, Truck>;

    static std::vector<Truck> select_in_spots(const Table& table,
                                              std::span<const std::string> tokens);

    class Transaction;

    mutable std::mutex mutex_;
    Table trucks_;
    AuditRecorder* recorder_;
};

} // namespace spotalloc::core
