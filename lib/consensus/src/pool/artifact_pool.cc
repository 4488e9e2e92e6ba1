#include "consensus/pool/artifact_pool.hpp"
#include "consensus/error.hpp"

#include <algorithm>

namespace Subnet::Consensus {

// ---------------------------------------------------------------------------
// PoolSection
// ---------------------------------------------------------------------------

const PoolEntry* PoolSection::find(const ArtifactId& id) const
{
    auto it = entries_.find(id);
    return it == entries_.end() ? nullptr : it->second.get();
}

bool PoolSection::insert(EntryPtr entry)
{
    auto [it, inserted] = entries_.try_emplace(entry->id, entry);
    if (!inserted)
        return false;
    auto kind = static_cast<size_t>(kind_of(entry->artifact));
    index_[height_of(entry->artifact)][kind].push_back(std::move(entry));
    return true;
}

PoolSection::EntryPtr PoolSection::remove(const ArtifactId& id)
{
    auto it = entries_.find(id);
    if (it == entries_.end())
        return nullptr;

    EntryPtr entry = std::move(it->second);
    entries_.erase(it);

    auto height = height_of(entry->artifact);
    auto& buckets = index_.at(height);
    auto& vec = buckets[static_cast<size_t>(kind_of(entry->artifact))];
    std::erase_if(vec, [&](const EntryPtr& e) { return e->id == id; });
    if (std::ranges::all_of(buckets, [](const auto& b) { return b.empty(); }))
        index_.erase(height);
    return entry;
}

size_t PoolSection::purge_below(Height height)
{
    size_t removed = 0;
    auto end = index_.lower_bound(height);
    for (auto it = index_.begin(); it != end; ++it) {
        for (const auto& vec : it->second) {
            for (const auto& e : vec) {
                entries_.erase(e->id);
                ++removed;
            }
        }
    }
    index_.erase(index_.begin(), end);
    return removed;
}

std::optional<Height> PoolSection::min_height() const
{
    if (index_.empty())
        return std::nullopt;
    return index_.begin()->first;
}

std::optional<Height> PoolSection::max_height() const
{
    if (index_.empty())
        return std::nullopt;
    return index_.rbegin()->first;
}

std::optional<Height> PoolSection::max_height_with(ArtifactKind kind) const
{
    for (auto it = index_.rbegin(); it != index_.rend(); ++it) {
        if (!it->second[static_cast<size_t>(kind)].empty())
            return it->first;
    }
    return std::nullopt;
}

std::vector<PoolSection::EntryPtr> PoolSection::ordered_entries() const
{
    std::vector<EntryPtr> out;
    out.reserve(entries_.size());
    for (const auto& [height, buckets] : index_)
        for (const auto& vec : buckets)
            out.insert(out.end(), vec.begin(), vec.end());
    return out;
}

const std::vector<PoolSection::EntryPtr>& PoolSection::bucket(Height height, ArtifactKind kind) const
{
    static const std::vector<EntryPtr> empty;
    auto it = index_.find(height);
    if (it == index_.end())
        return empty;
    return it->second[static_cast<size_t>(kind)];
}

// ---------------------------------------------------------------------------
// ArtifactPool
// ---------------------------------------------------------------------------

namespace {

    template <typename Content>
    bool same_content_present(const PoolSection& section, const Aggregate<Content>& aggregate)
    {
        auto height = height_of(Artifact { aggregate });
        for (const auto& other : section.get<Aggregate<Content>>(height)) {
            if (other.content == aggregate.content)
                return true;
        }
        return false;
    }

} // namespace

ArtifactPool::ArtifactPool(Logger logger)
    : logger_(std::move(logger))
{
}

std::expected<ArtifactId, std::error_code> ArtifactPool::insert_unvalidated(Artifact artifact, Time now)
{
    auto entry = std::make_shared<const PoolEntry>(PoolEntry {
        .id = artifact_id(artifact),
        .artifact = std::move(artifact),
        .added_at = now });

    std::shared_lock validated_lock(validated_mutex_);
    std::lock_guard unvalidated_lock(unvalidated_mutex_);

    if (validated_.contains(entry->id) || !unvalidated_.insert(entry)) {
        logger_->debug("Duplicate {}", describe(entry->artifact));
        return std::unexpected(Error::DuplicateArtifact);
    }
    return entry->id;
}

std::expected<ArtifactId, std::error_code> ArtifactPool::add_to_validated(Artifact artifact, Time now)
{
    auto entry = std::make_shared<const PoolEntry>(PoolEntry {
        .id = artifact_id(artifact),
        .artifact = std::move(artifact),
        .added_at = now });

    std::unique_lock validated_lock(validated_mutex_);
    if (auto admitted = admit_validated(entry); !admitted)
        return std::unexpected(admitted.error());

    // The same artifact may have arrived from a peer in the meantime.
    std::lock_guard unvalidated_lock(unvalidated_mutex_);
    unvalidated_.remove(entry->id);
    return entry->id;
}

std::expected<void, std::error_code> ArtifactPool::move_to_validated(const ArtifactId& id, Time now)
{
    std::unique_lock validated_lock(validated_mutex_);
    std::lock_guard unvalidated_lock(unvalidated_mutex_);

    const PoolEntry* pending = unvalidated_.find(id);
    if (pending == nullptr)
        return std::unexpected(Error::NotFound);

    auto entry = std::make_shared<const PoolEntry>(PoolEntry {
        .id = id,
        .artifact = pending->artifact,
        .added_at = now });

    auto admitted = admit_validated(entry);
    // Admitted or redundant, it leaves the unvalidated side either way.
    unvalidated_.remove(id);
    return admitted;
}

std::expected<void, std::error_code> ArtifactPool::remove_unvalidated(const ArtifactId& id)
{
    std::lock_guard lock(unvalidated_mutex_);
    if (!unvalidated_.remove(id))
        return std::unexpected(Error::NotFound);
    return {};
}

size_t ArtifactPool::purge_unvalidated_below(Height height)
{
    std::lock_guard lock(unvalidated_mutex_);
    auto removed = unvalidated_.purge_below(height);
    if (removed > 0)
        logger_->debug("Purged {} unvalidated artifacts below height {}", removed, height);
    return removed;
}

size_t ArtifactPool::purge_validated_below(Height height)
{
    std::unique_lock lock(validated_mutex_);
    auto removed = validated_.purge_below(height);
    if (removed > 0)
        logger_->debug("Purged {} validated artifacts below height {}", removed, height);
    return removed;
}

PoolSnapshot ArtifactPool::snapshot() const
{
    std::shared_lock validated_lock(validated_mutex_);
    PoolSection unvalidated_copy;
    {
        std::lock_guard lock(unvalidated_mutex_);
        unvalidated_copy = unvalidated_;
    }
    return PoolSnapshot(std::move(validated_lock), validated_, std::move(unvalidated_copy));
}

std::expected<void, std::error_code> ArtifactPool::admit_validated(const PoolSection::EntryPtr& entry)
{
    if (validated_.contains(entry->id)) {
        logger_->debug("Already validated: {}", describe(entry->artifact));
        return std::unexpected(Error::DuplicateArtifact);
    }

    if (const auto* fin = std::get_if<Finalization>(&entry->artifact)) {
        for (const auto& other : validated_.get<Finalization>(fin->content.height)) {
            if (other.content.block != fin->content.block) {
                logger_->critical("Two finalized blocks at height {}: {} and {}",
                    fin->content.height, short_hex(other.content.block), short_hex(fin->content.block));
                throw InvariantViolation("conflicting finalizations at one height");
            }
        }
    }

    bool redundant = std::visit([&]<typename T>(const T& v) {
        if constexpr (requires { v.signers; })
            return same_content_present(validated_, v);
        else
            return false;
    },
        entry->artifact);
    if (redundant) {
        logger_->debug("Aggregate with the same content already validated: {}", describe(entry->artifact));
        return std::unexpected(Error::DuplicateArtifact);
    }

    validated_.insert(entry);
    return {};
}

} // namespace Subnet::Consensus
