#pragma once

#include "MigrationTypes.hpp"
#include "ProcessRunner.hpp"

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

// Shared record of one in-flight migration. The migrating call publishes its
// progress here; CancelMigration reads it and signals the live child.
class ActiveMigration {
public:
    explicit ActiveMigration(MigrationResult initial);

    MigrationResult Snapshot() const;
    void Publish(const MigrationResult& result);

    // Returns false if the migration was already cancelled.
    bool MarkCancelled(const std::string& reason);
    bool IsCancelled() const;

    ChildTracker& Child() { return child_; }

private:
    mutable std::mutex mutex_;
    MigrationResult result_;
    bool cancelled_ = false;
    ChildTracker child_;
};

class MigrationRegistry {
public:
    // Null when a migration for the container is tracked or still retiring.
    std::shared_ptr<ActiveMigration> TryAcquire(const std::string& containerId, const MigrationResult& initial);
    // Removes the entry only if it is still the one acquired by the caller.
    bool Release(const std::string& containerId, const std::shared_ptr<ActiveMigration>& entry);
    // Drops the entry from the table but keeps the container id reserved until
    // the holder calls Release.
    bool Retire(const std::string& containerId, const std::shared_ptr<ActiveMigration>& entry);

    std::shared_ptr<ActiveMigration> Find(const std::string& containerId) const;
    bool Contains(const std::string& containerId) const;
    std::vector<MigrationResult> List() const;

private:
    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<ActiveMigration>> entries_;
    std::map<std::string, std::shared_ptr<ActiveMigration>> retiring_;
};

class MigrationLease {
public:
    MigrationLease(MigrationRegistry& registry, std::string containerId, std::shared_ptr<ActiveMigration> entry);
    ~MigrationLease();

    MigrationLease(const MigrationLease&) = delete;
    MigrationLease& operator=(const MigrationLease&) = delete;

private:
    MigrationRegistry& registry_;
    std::string containerId_;
    std::shared_ptr<ActiveMigration> entry_;
};
