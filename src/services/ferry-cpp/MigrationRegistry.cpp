#include "MigrationRegistry.hpp"

#include <utility>

ActiveMigration::ActiveMigration(MigrationResult initial)
    : result_(std::move(initial)) {}

MigrationResult ActiveMigration::Snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return result_;
}

void ActiveMigration::Publish(const MigrationResult& result) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (cancelled_) {
        return;
    }
    result_ = result;
}

bool ActiveMigration::MarkCancelled(const std::string& reason) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (cancelled_) {
        return false;
    }

    cancelled_ = true;
    result_.success = false;
    result_.status = MigrationStatus::FAILED;
    result_.errorKind = ErrorKind::Cancelled;
    result_.errorMessage = reason;
    return true;
}

bool ActiveMigration::IsCancelled() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cancelled_;
}

std::shared_ptr<ActiveMigration> MigrationRegistry::TryAcquire(
    const std::string& containerId, const MigrationResult& initial) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (retiring_.count(containerId) > 0) {
        return nullptr;
    }

    auto [it, inserted] = entries_.emplace(containerId, nullptr);
    if (!inserted) {
        return nullptr;
    }

    it->second = std::make_shared<ActiveMigration>(initial);
    return it->second;
}

bool MigrationRegistry::Release(const std::string& containerId, const std::shared_ptr<ActiveMigration>& entry) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto* table : {&entries_, &retiring_}) {
        const auto it = table->find(containerId);
        if (it != table->end() && it->second == entry) {
            table->erase(it);
            return true;
        }
    }
    return false;
}

bool MigrationRegistry::Retire(const std::string& containerId, const std::shared_ptr<ActiveMigration>& entry) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = entries_.find(containerId);
    if (it == entries_.end() || it->second != entry) {
        return false;
    }

    retiring_[containerId] = it->second;
    entries_.erase(it);
    return true;
}

std::shared_ptr<ActiveMigration> MigrationRegistry::Find(const std::string& containerId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = entries_.find(containerId);
    return it == entries_.end() ? nullptr : it->second;
}

bool MigrationRegistry::Contains(const std::string& containerId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.count(containerId) > 0;
}

std::vector<MigrationResult> MigrationRegistry::List() const {
    std::vector<std::shared_ptr<ActiveMigration>> entries;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [id, entry] : entries_) {
            entries.push_back(entry);
        }
    }

    std::vector<MigrationResult> results;
    results.reserve(entries.size());
    for (const auto& entry : entries) {
        results.push_back(entry->Snapshot());
    }
    return results;
}

MigrationLease::MigrationLease(MigrationRegistry& registry, std::string containerId, std::shared_ptr<ActiveMigration> entry)
    : registry_(registry),
      containerId_(std::move(containerId)),
      entry_(std::move(entry)) {}

MigrationLease::~MigrationLease() {
    registry_.Release(containerId_, entry_);
}
