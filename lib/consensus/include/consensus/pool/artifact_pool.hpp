#pragma once

#include "consensus/artifact.hpp"
#include "consensus/common.hpp"
#include "consensus/logger.hpp"
#include <array>
#include <expected>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <ranges>
#include <shared_mutex>
#include <system_error>
#include <vector>

namespace Subnet::Consensus {

struct PoolEntry {
    ArtifactId id;
    Artifact artifact;
    Time added_at; ///< When the entry entered its current partition
};

/**
 * One partition of the pool, indexed by height and kind.
 * Entries are immutable and shared, so copying a section is cheap.
 **/
class PoolSection {
public:
    using EntryPtr = std::shared_ptr<const PoolEntry>;

    [[nodiscard]] bool contains(const ArtifactId& id) const { return entries_.contains(id); }
    [[nodiscard]] const PoolEntry* find(const ArtifactId& id) const;
    [[nodiscard]] size_t size() const { return entries_.size(); }

    bool insert(EntryPtr entry);
    EntryPtr remove(const ArtifactId& id);

    /// Removes every entry strictly below `height`. Returns the number removed.
    size_t purge_below(Height height);

    /// Lazy view in insertion order. Valid until the section is mutated.
    auto by_height_and_kind(Height height, ArtifactKind kind) const
    {
        return std::views::all(bucket(height, kind))
            | std::views::transform([](const EntryPtr& e) -> const PoolEntry& { return *e; });
    }

    template <typename T>
    auto get(Height height) const
    {
        return by_height_and_kind(height, kind_of_v<T>)
            | std::views::transform([](const PoolEntry& e) -> const T& { return std::get<T>(e.artifact); });
    }

    [[nodiscard]] size_t count(Height height, ArtifactKind kind) const { return bucket(height, kind).size(); }

    [[nodiscard]] std::optional<Height> min_height() const;
    [[nodiscard]] std::optional<Height> max_height() const;
    [[nodiscard]] std::optional<Height> max_height_with(ArtifactKind kind) const;

    /// All entries ordered by height, then kind, then insertion.
    [[nodiscard]] std::vector<EntryPtr> ordered_entries() const;

private:
    using Buckets = std::array<std::vector<EntryPtr>, ARTIFACT_KIND_COUNT>;

    const std::vector<EntryPtr>& bucket(Height height, ArtifactKind kind) const;

    std::map<ArtifactId, EntryPtr> entries_;
    std::map<Height, Buckets> index_;
};

/// Consistent read of the pool. Holds the validated side shared-locked for its lifetime
/// and a copy of the unvalidated side, so ingestion proceeds while it is alive.
/// Must be released before the owning thread mutates the validated side.
class PoolSnapshot {
public:
    PoolSnapshot(PoolSnapshot&&) = default;

    [[nodiscard]] const PoolSection& validated() const { return *validated_; }
    [[nodiscard]] const PoolSection& unvalidated() const { return unvalidated_; }

private:
    friend class ArtifactPool;

    PoolSnapshot(std::shared_lock<std::shared_mutex> lock, const PoolSection& validated, PoolSection unvalidated)
        : lock_(std::move(lock))
        , validated_(&validated)
        , unvalidated_(std::move(unvalidated))
    {
    }

    std::shared_lock<std::shared_mutex> lock_;
    const PoolSection* validated_;
    PoolSection unvalidated_;
};

/**
 * Validated and unvalidated consensus artifacts.
 *
 * insert_unvalidated may be called from any thread. Every other mutation
 * touches the validated side and is serialized by its exclusive lock.
 * Lock order is validated side first, then unvalidated side.
 **/
class ArtifactPool {
public:
    explicit ArtifactPool(Logger logger = std_out_logger("pool"));

    /// DuplicateArtifact if the id is present in either partition.
    std::expected<ArtifactId, std::error_code> insert_unvalidated(Artifact artifact, Time now);

    /// DuplicateArtifact if already validated, or if an aggregate with the same content is.
    /// Throws InvariantViolation on a second finalized block at one height.
    std::expected<ArtifactId, std::error_code> add_to_validated(Artifact artifact, Time now);

    /// NotFound if absent from the unvalidated side. Same admission rules as add_to_validated.
    std::expected<void, std::error_code> move_to_validated(const ArtifactId& id, Time now);

    std::expected<void, std::error_code> remove_unvalidated(const ArtifactId& id);

    size_t purge_unvalidated_below(Height height);
    size_t purge_validated_below(Height height);

    [[nodiscard]] PoolSnapshot snapshot() const;

private:
    // Caller holds validated_mutex_ exclusively.
    std::expected<void, std::error_code> admit_validated(const PoolSection::EntryPtr& entry);

    Logger logger_;

    mutable std::shared_mutex validated_mutex_;
    PoolSection validated_;

    mutable std::mutex unvalidated_mutex_;
    PoolSection unvalidated_;
};

} // namespace Subnet::Consensus
