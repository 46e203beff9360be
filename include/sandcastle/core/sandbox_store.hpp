/**
 * @file sandbox_store.hpp
 * @brief In-memory, concurrency-safe table of sandbox records
 *
 * The store is the single source of truth for which sandboxes exist and what
 * state they are in. Records live in a lock-striped table: each shard guards
 * its id map with a reader/writer lock, and each record carries its own mutex
 * for data and a transition lock for lifecycle changes. Mutating two different
 * sandboxes never contends on the same lock.
 *
 * **Lock order**: name index -> shard -> record. No method holds a record
 * mutex while taking a shard lock.
 *
 * @date 2025
 */

#pragma once

#include "sandcastle/core/types.hpp"

#include <string>
#include <vector>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <optional>
#include <functional>
#include <unordered_map>
#include <chrono>

namespace sandcastle {
namespace core {

/**
 * @struct SandboxFilter
 * @brief Selection for List()
 */
struct SandboxFilter {
    std::optional<std::string> owner;
    std::optional<SandboxState> state;
    bool include_terminal{false};   ///< Include DESTROYED and FAILED records
};

/**
 * @class SandboxStore
 * @brief Lock-striped sandbox record table
 *
 * **Usage Example**:
 * @code
 * SandboxStore store;
 * store.Put(sandbox);                                   // CREATING
 * store.CompareAndSwapState(sandbox.id, SandboxState::CREATING, SandboxState::ACTIVE);
 * auto snapshot = store.Get("my-sandbox");              // by id or name
 * @endcode
 */
class SandboxStore {
public:
    explicit SandboxStore(std::size_t shard_count = 16);
    ~SandboxStore() = default;

    SandboxStore(const SandboxStore&) = delete;
    SandboxStore& operator=(const SandboxStore&) = delete;

    /**
     * @brief Insert a new record
     * @throws SandboxException CONFLICT when the id exists or the name is held
     *         by a sandbox that is not DESTROYED/FAILED
     */
    void Put(const Sandbox& sandbox);

    /**
     * @brief Snapshot by id, falling back to a live name
     * @throws SandboxException NOT_FOUND
     */
    Sandbox Get(const std::string& id_or_name) const;

    std::optional<Sandbox> Find(const std::string& id_or_name) const;

    /**
     * @brief Snapshot of matching records, ordered by creation time
     *
     * Each record is copied under its own lock; the list as a whole is not an
     * atomic cut across records.
     */
    std::vector<Sandbox> List(const SandboxFilter& filter = {}) const;

    /**
     * @brief Drop a record and release its name. Returns false if unknown.
     */
    bool Remove(const std::string& id);

    /**
     * @brief Atomically move @p id from @p expected to @p next
     *
     * Moving into DESTROYED or FAILED releases the name and stamps destroyed_at.
     * @return false when the current state is not @p expected
     * @throws SandboxException NOT_FOUND
     */
    bool CompareAndSwapState(const std::string& id, SandboxState expected, SandboxState next);

    /**
     * @brief Apply @p mutator to one record atomically, returning the result
     *
     * Identity and state are owned by the store; changes to id, name or state
     * made by the mutator are discarded.
     * @throws SandboxException NOT_FOUND
     */
    Sandbox Update(const std::string& id, const std::function<void(Sandbox&)>& mutator);

    std::size_t Count(const std::function<bool(const Sandbox&)>& predicate) const;

    std::optional<Sandbox> FindByContainer(const std::string& container_ref) const;

    /**
     * @brief Evict DESTROYED/FAILED records older than @p retention
     * @return Number of records evicted
     */
    std::size_t EvictTerminal(std::chrono::seconds retention);

    /**
     * @brief The record's transition lock
     *
     * Held shared while work is being admitted against the sandbox and
     * exclusively while its lifecycle state changes. The returned pointer keeps
     * the lock alive even if the record is evicted meanwhile.
     * @throws SandboxException NOT_FOUND
     */
    std::shared_ptr<std::shared_mutex> TransitionLock(const std::string& id) const;

    std::size_t Size() const;

private:
    struct Entry {
        mutable std::mutex mutex;         ///< Guards sandbox
        Sandbox sandbox;
        std::shared_mutex transition;     ///< Lifecycle transition lock
    };

    struct Shard {
        mutable std::shared_mutex mutex;
        std::unordered_map<std::string, std::shared_ptr<Entry>> entries;
    };

    Shard& ShardFor(const std::string& id) const;
    std::shared_ptr<Entry> FindEntry(const std::string& id) const;
    std::shared_ptr<Entry> Resolve(const std::string& id_or_name) const;
    void ReleaseName(const std::optional<std::string>& name, const std::string& id);

    std::vector<std::unique_ptr<Shard>> shards_;

    mutable std::mutex names_mutex_;
    std::unordered_map<std::string, std::string> names_;  ///< Live name -> id
};

} // namespace core
} // namespace sandcastle
