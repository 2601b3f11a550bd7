#include <spotalloc/core/memory_store.hpp>
#include <spotalloc/core/error.hpp>

#include <algorithm>
#include <unordered_set>
#include <utility>

namespace spotalloc::core {

// =============================================================================
// Transaction
// =============================================================================

class InMemoryEntityStore::Transaction : public StoreTransaction {
public:
    explicit Transaction(Table working)
        : working_(std::move(working)) {}

    std::optional<Truck> find_truck(const TruckId& id) override {
        auto it = working_.find(id);
        if (it == working_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    std::vector<Truck> find_trucks_in_spots(std::span<const std::string> tokens) override {
        return select_in_spots(working_, tokens);
    }

    void save_truck(const Truck& truck) override {
        auto it = working_.find(truck.id);
        if (it == working_.end()) {
            throw NotFoundError("truck '" + truck.id + "' not found");
        }
        it->second = truck;
    }

    void update_spots(std::span<const SpotUpdate> updates) override {
        // Check every id first so a bad update leaves the working copy intact
        for (const auto& update : updates) {
            if (!working_.contains(update.truck_id)) {
                throw NotFoundError("truck '" + update.truck_id + "' not found");
            }
        }
        for (const auto& update : updates) {
            working_.at(update.truck_id).spot = update.spot;
        }
    }

    void record(AuditRecord record) override {
        pending_.push_back(std::move(record));
    }

    Table& working() noexcept { return working_; }
    const std::vector<AuditRecord>& pending() const noexcept { return pending_; }

private:
    Table working_;
    std::vector<AuditRecord> pending_;
};

// =============================================================================
// InMemoryEntityStore
// =============================================================================

InMemoryEntityStore::InMemoryEntityStore(AuditRecorder* recorder)
    : recorder_(recorder) {}

void InMemoryEntityStore::set_audit_recorder(AuditRecorder* recorder) {
    std::lock_guard<std::mutex> lock(mutex_);
    recorder_ = recorder;
}

void InMemoryEntityStore::put_truck(Truck truck) {
    std::lock_guard<std::mutex> lock(mutex_);
    TruckId id = truck.id;
    trucks_.insert_or_assign(std::move(id), std::move(truck));
}

std::vector<Truck> InMemoryEntityStore::trucks() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Truck> result;
    result.reserve(trucks_.size());
    for (const auto& [id, truck] : trucks_) {
        result.push_back(truck);
    }
    return result;
}

std::size_t InMemoryEntityStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return trucks_.size();
}

std::optional<Truck> InMemoryEntityStore::find_truck(const TruckId& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = trucks_.find(id);
    if (it == trucks_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<Truck> InMemoryEntityStore::find_trucks_in_spots(
    std::span<const std::string> tokens) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return select_in_spots(trucks_, tokens);
}

void InMemoryEntityStore::run_in_transaction(
    const std::function<void(StoreTransaction&)>& work) {
    std::lock_guard<std::mutex> lock(mutex_);

    Transaction tx(trucks_);
    work(tx);

    // Audit shares the commit: a recorder failure propagates before the
    // working copy is published.
    if (recorder_) {
        for (const auto& record : tx.pending()) {
            recorder_->record(record);
        }
    }
    trucks_ = std::move(tx.working());
}

std::vector<Truck> InMemoryEntityStore::select_in_spots(const Table& table,
                                                        std::span<const std::string> tokens) {
    std::unordered_set<std::string_view> wanted(tokens.begin(), tokens.end());
    std::vector<Truck> result;
    for (const auto& [id, truck] : table) {
        if (truck.spot && wanted.contains(*truck.spot)) {
            result.push_back(truck);
        }
    }
    return result;
}

} // namespace spotalloc::core
