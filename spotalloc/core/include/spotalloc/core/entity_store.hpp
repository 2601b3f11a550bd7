#pragma once

/// @file entity_store.hpp
/// @brief Storage contract used by the allocation engine.
/// @ingroup core_store

#include <spotalloc/core/audit.hpp>
#include <spotalloc/core/truck.hpp>

#include <functional>
#include <optional>
#include <span>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace spotalloc::core {

/// @brief New spot token for one truck (nullopt clears the spot).
/// @ingroup core_store
struct SpotUpdate {
    TruckId truck_id;
    std::optional<std::string> spot;
};

/// @brief Handle on an open unit of work.
/// @ingroup core_store
///
/// Reads see the writes made earlier through the same handle. Nothing is
/// visible to other readers until the unit of work commits.
///
/// @see EntityStore::run_in_transaction
class StoreTransaction {
public:
    virtual ~StoreTransaction() = default;

    /// @brief Read a truck, including its layout and spot token.
    /// @return The truck, or std::nullopt if it does not exist.
    [[nodiscard]] virtual std::optional<Truck> find_truck(const TruckId& id) = 0;

    /// @brief Read every truck whose spot token is one of @p tokens.
    [[nodiscard]] virtual std::vector<Truck> find_trucks_in_spots(
        std::span<const std::string> tokens) = 0;

    /// @brief Overwrite a truck record.
    /// @throws NotFoundError if the truck does not exist.
    virtual void save_truck(const Truck& truck) = 0;

    /// @brief Apply several spot tokens at once.
    ///
    /// Either every update is applied or, if one names an unknown truck,
    /// none is.
    ///
    /// @throws NotFoundError if an update names an unknown truck.
    virtual void update_spots(std::span<const SpotUpdate> updates) = 0;

    /// @brief Queue an audit record; delivered when the unit of work commits.
    virtual void record(AuditRecord record) = 0;

protected:
    StoreTransaction() = default;
    StoreTransaction(const StoreTransaction&) = default;
    StoreTransaction& operator=(const StoreTransaction&) = default;
    StoreTransaction(StoreTransaction&&) = default;
    StoreTransaction& operator=(StoreTransaction&&) = default;
};

/// @brief Durable, transactional truck storage.
/// @ingroup core_store
///
/// Snapshot reads serve availability computation; all mutations go
/// through run_in_transaction(), which spans occupancy writes and audit
/// records alike. The allocation logic depends only on this interface.
///
/// @see InMemoryEntityStore
class EntityStore {
public:
    virtual ~EntityStore() = default;

    /// @brief Snapshot read of one truck.
    [[nodiscard]] virtual std::optional<Truck> find_truck(const TruckId& id) const = 0;

    /// @brief Snapshot read of every truck parked on one of @p tokens.
    [[nodiscard]] virtual std::vector<Truck> find_trucks_in_spots(
        std::span<const std::string> tokens) const = 0;

    /// @brief Run @p work as one atomic unit of work.
    ///
    /// If @p work returns normally its writes and audit records commit
    /// together. If it throws, nothing is written and the exception
    /// propagates.
    ///
    /// @param work Callback receiving the transactional handle.
    virtual void run_in_transaction(const std::function<void(StoreTransaction&)>& work) = 0;

protected:
    EntityStore() = default;
    EntityStore(const EntityStore&) = default;
    EntityStore& operator=(const EntityStore&) = default;
    EntityStore(EntityStore&&) = default;
    EntityStore& operator=(EntityStore&&) = default;
};

/// @brief Run @p work in a transaction and return its result.
///
/// @code
/// auto count = unit_of_work(store, [&](StoreTransaction& tx) {
///     return tx.find_trucks_in_spots(tokens).size();
/// });
/// @endcode
template<typename Work>
auto unit_of_work(EntityStore& store, Work&& work) {
    using Result = std::invoke_result_t<Work&, StoreTransaction&>;
    if constexpr (std::is_void_v<Result>) {
        store.run_in_transaction([&](StoreTransaction& tx) { work(tx); });
    } else {
        std::optional<Result> result;
        store.run_in_transaction([&](StoreTransaction& tx) { result.emplace(work(tx)); });
        return std::move(*result);
    }
}

} // namespace spotalloc::core
