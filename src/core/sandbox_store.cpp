/**
 * @file sandbox_store.cpp
 * @brief Implementation of the lock-striped sandbox record table
 *
 * @date 2025
 */

#include "sandcastle/core/sandbox_store.hpp"
#include "sandcastle/core/errors.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace sandcastle {
namespace core {

SandboxStore::SandboxStore(std::size_t shard_count) {
    if (shard_count == 0) {
        shard_count = 1;
    }
    shards_.reserve(shard_count);
    for (std::size_t i = 0; i < shard_count; ++i) {
        shards_.push_back(std::make_unique<Shard>());
    }
}

SandboxStore::Shard& SandboxStore::ShardFor(const std::string& id) const {
    return *shards_[std::hash<std::string>{}(id) % shards_.size()];
}

std::shared_ptr<SandboxStore::Entry> SandboxStore::FindEntry(const std::string& id) const {
    auto& shard = ShardFor(id);
    std::shared_lock<std::shared_mutex> lock(shard.mutex);
    auto it = shard.entries.find(id);
    return it == shard.entries.end() ? nullptr : it->second;
}

std::shared_ptr<SandboxStore::Entry> SandboxStore::Resolve(const std::string& id_or_name) const {
    if (auto entry = FindEntry(id_or_name)) {
        return entry;
    }

    std::string id;
    {
        std::lock_guard<std::mutex> lock(names_mutex_);
        auto it = names_.find(id_or_name);
        if (it == names_.end()) {
            return nullptr;
        }
        id = it->second;
    }
    return FindEntry(id);
}

void SandboxStore::ReleaseName(const std::optional<std::string>& name, const std::string& id) {
    if (!name) {
        return;
    }
    std::lock_guard<std::mutex> lock(names_mutex_);
    auto it = names_.find(*name);
    if (it != names_.end() && it->second == id) {
        names_.erase(it);
    }
}

// ============================================================================
// INSERT / LOOKUP
// ============================================================================

void SandboxStore::Put(const Sandbox& sandbox) {
    if (sandbox.id.empty()) {
        throw SandboxException(ErrorCode::INVALID_ARGUMENT, "Sandbox id must not be empty");
    }

    std::lock_guard<std::mutex> names_lock(names_mutex_);

    if (sandbox.name && names_.count(*sandbox.name)) {
        throw SandboxException(ErrorCode::CONFLICT,
                               "Sandbox name '" + *sandbox.name + "' is already in use",
                               ErrorContext{names_.at(*sandbox.name), "", ""});
    }

    auto& shard = ShardFor(sandbox.id);
    {
        std::unique_lock<std::shared_mutex> lock(shard.mutex);
        if (shard.entries.count(sandbox.id)) {
            throw SandboxException(ErrorCode::CONFLICT, "Sandbox id already exists",
                                   ErrorContext{sandbox.id, "", ""});
        }
        auto entry = std::make_shared<Entry>();
        entry->sandbox = sandbox;
        shard.entries.emplace(sandbox.id, std::move(entry));
    }

    if (sandbox.name && !IsTerminal(sandbox.state)) {
        names_[*sandbox.name] = sandbox.id;
    }

    spdlog::debug("Store: put {} ({})", sandbox.id, SandboxStateToString(sandbox.state));
}

Sandbox SandboxStore::Get(const std::string& id_or_name) const {
    auto entry = Resolve(id_or_name);
    if (!entry) {
        throw SandboxException(ErrorCode::NOT_FOUND, "Sandbox not found: " + id_or_name,
                               ErrorContext{id_or_name, "", ""});
    }
    std::lock_guard<std::mutex> lock(entry->mutex);
    return entry->sandbox;
}

std::optional<Sandbox> SandboxStore::Find(const std::string& id_or_name) const {
    auto entry = Resolve(id_or_name);
    if (!entry) {
        return std::nullopt;
    }
    std::lock_guard<std::mutex> lock(entry->mutex);
    return entry->sandbox;
}

std::vector<Sandbox> SandboxStore::List(const SandboxFilter& filter) const {
    std::vector<std::shared_ptr<Entry>> entries;
    for (const auto& shard : shards_) {
        std::shared_lock<std::shared_mutex> lock(shard->mutex);
        for (const auto& [id, entry] : shard->entries) {
            entries.push_back(entry);
        }
    }

    std::vector<Sandbox> result;
    result.reserve(entries.size());
    for (const auto& entry : entries) {
        Sandbox snapshot;
        {
            std::lock_guard<std::mutex> lock(entry->mutex);
            snapshot = entry->sandbox;
        }
        if (!filter.include_terminal && IsTerminal(snapshot.state)) {
            continue;
        }
        if (filter.owner && snapshot.owner != *filter.owner) {
            continue;
        }
        if (filter.state && snapshot.state != *filter.state) {
            continue;
        }
        result.push_back(std::move(snapshot));
    }

    std::sort(result.begin(), result.end(), [](const Sandbox& a, const Sandbox& b) {
        return a.created_at < b.created_at || (a.created_at == b.created_at && a.id < b.id);
    });
    return result;
}

std::optional<Sandbox> SandboxStore::FindByContainer(const std::string& container_ref) const {
    if (container_ref.empty()) {
        return std::nullopt;
    }
    for (const auto& sandbox : List(SandboxFilter{std::nullopt, std::nullopt, true})) {
        if (sandbox.container_ref == container_ref) {
            return sandbox;
        }
    }
    return std::nullopt;
}

std::size_t SandboxStore::Count(const std::function<bool(const Sandbox&)>& predicate) const {
    std::size_t count = 0;
    for (const auto& sandbox : List(SandboxFilter{std::nullopt, std::nullopt, true})) {
        if (predicate(sandbox)) {
            ++count;
        }
    }
    return count;
}

std::size_t SandboxStore::Size() const {
    std::size_t size = 0;
    for (const auto& shard : shards_) {
        std::shared_lock<std::shared_mutex> lock(shard->mutex);
        size += shard->entries.size();
    }
    return size;
}

// ============================================================================
// MUTATION
// ============================================================================

bool SandboxStore::Remove(const std::string& id) {
    std::shared_ptr<Entry> removed;
    {
        auto& shard = ShardFor(id);
        std::unique_lock<std::shared_mutex> lock(shard.mutex);
        auto it = shard.entries.find(id);
        if (it == shard.entries.end()) {
            return false;
        }
        removed = it->second;
        shard.entries.erase(it);
    }

    std::optional<std::string> name;
    {
        std::lock_guard<std::mutex> lock(removed->mutex);
        name = removed->sandbox.name;
    }
    ReleaseName(name, id);

    spdlog::debug("Store: removed {}", id);
    return true;
}

bool SandboxStore::CompareAndSwapState(const std::string& id, SandboxState expected, SandboxState next) {
    auto entry = FindEntry(id);
    if (!entry) {
        throw SandboxException(ErrorCode::NOT_FOUND, "Sandbox not found: " + id, ErrorContext{id, "", ""});
    }

    std::optional<std::string> release;
    {
        std::lock_guard<std::mutex> lock(entry->mutex);
        if (entry->sandbox.state != expected) {
            return false;
        }
        entry->sandbox.state = next;
        if (IsTerminal(next) && !IsTerminal(expected)) {
            entry->sandbox.destroyed_at = Clock::now();
            release = entry->sandbox.name;
        }
    }
    ReleaseName(release, id);

    spdlog::debug("Store: {} {} -> {}", id, SandboxStateToString(expected), SandboxStateToString(next));
    return true;
}

Sandbox SandboxStore::Update(const std::string& id, const std::function<void(Sandbox&)>& mutator) {
    auto entry = FindEntry(id);
    if (!entry) {
        throw SandboxException(ErrorCode::NOT_FOUND, "Sandbox not found: " + id, ErrorContext{id, "", ""});
    }

    std::lock_guard<std::mutex> lock(entry->mutex);
    Sandbox& sandbox = entry->sandbox;
    auto state = sandbox.state;
    auto name = sandbox.name;

    mutator(sandbox);

    sandbox.id = id;
    sandbox.state = state;
    sandbox.name = name;
    return sandbox;
}

std::size_t SandboxStore::EvictTerminal(std::chrono::seconds retention) {
    auto cutoff = Clock::now() - retention;
    std::size_t evicted = 0;

    for (auto& shard : shards_) {
        std::unique_lock<std::shared_mutex> lock(shard->mutex);
        for (auto it = shard->entries.begin(); it != shard->entries.end();) {
            bool expired = false;
            {
                std::lock_guard<std::mutex> entry_lock(it->second->mutex);
                const auto& sandbox = it->second->sandbox;
                expired = IsTerminal(sandbox.state) &&
                          sandbox.destroyed_at.value_or(Clock::now()) <= cutoff;
            }
            if (expired) {
                it = shard->entries.erase(it);
                ++evicted;
            } else {
                ++it;
            }
        }
    }

    if (evicted > 0) {
        spdlog::debug("Store: evicted {} terminal record(s)", evicted);
    }
    return evicted;
}

std::shared_ptr<std::shared_mutex> SandboxStore::TransitionLock(const std::string& id) const {
    auto entry = FindEntry(id);
    if (!entry) {
        throw SandboxException(ErrorCode::NOT_FOUND, "Sandbox not found: " + id, ErrorContext{id, "", ""});
    }
    // Aliasing constructor: shares ownership of the entry
    return std::shared_ptr<std::shared_mutex>(entry, &entry->transition);
}

} // namespace core
} // namespace sandcastle
