#pragma once
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "cache/entity_types.hpp"
#include "quality/lod_types.hpp"

namespace mrc::cache {

struct EntityCacheConfig {
    double position_epsilon = 1e-6;      // degrees
    uint32_t removal_grace_batches = 1;  // consecutive absent batches before removal
    size_t entity_cap = quality::LodConfig::kUnboundedCap;
    bool enable_diagnostics = false;
};

struct DiffFilter {
    bool selection_only = false;
    std::function<bool(const EntityUpdate&)> predicate; // keep when true
};

struct EntityChange {
    std::string id;
    ChangeFlags flags = ChangeFlags::None;
};

struct DiffResult {
    size_t created = 0;     // constructions, first-time plus rebuilds
    size_t rebuilt = 0;     // subset of created that replaced an object
    size_t reused = 0;
    size_t removed = 0;
    size_t malformed = 0;
    size_t duplicates = 0;
    size_t filtered = 0;
    size_t capped = 0;
    size_t build_failures = 0;
    std::vector<std::string> removed_ids; // sorted
    std::vector<EntityChange> changes;    // one per rebuild
    // Render list for this batch, in batch order.
    std::vector<std::shared_ptr<VisualObject>> objects;
};

struct EntityCacheStats {
    size_t size = 0;
    uint64_t batches = 0;
    uint64_t created = 0;
    uint64_t rebuilt = 0;
    uint64_t reused = 0;
    uint64_t removed = 0;
    uint64_t malformed = 0;
    uint64_t position_changes = 0;
    uint64_t state_changes = 0;
    uint64_t selection_changes = 0;
    double efficiency = 0.0;
};

/**
 * @brief Diff-based cache of per-entity visual objects
 *
 * Each batch is compared with the state every object was built from, and only
 * entities whose position, drawn state or selection actually changed are
 * rebuilt. Constructions per diff never exceed the number of real changes.
 */
class EntityRenderCache final : public quality::ILodConsumer {
public:
    explicit EntityRenderCache(IVisualFactory& factory, EntityCacheConfig config = {});
    ~EntityRenderCache();

    EntityRenderCache(const EntityRenderCache&) = delete;
    EntityRenderCache& operator=(const EntityRenderCache&) = delete;

    /**
     * @brief Reconcile the cache with one batch of updates
     *
     * Malformed updates are skipped and counted. Duplicate ids collapse to the
     * last occurrence. Selected entities are admitted before the entity cap is
     * applied; the rest fill the remaining capacity in batch order.
     */
    DiffResult diff(const std::vector<EntityUpdate>& updates,
                    const std::unordered_set<std::string>& selected_ids = {},
                    const DiffFilter& filter = {});

    // Sets the entity cap and the build context used for new objects.
    void apply_lod(quality::LodMode mode, const quality::LodConfig& config) override;

    // Disposes every cached object.
    void clear();

    std::shared_ptr<VisualObject> find(const std::string& id) const;
    bool contains(const std::string& id) const { return snapshots_.count(id) != 0; }
    size_t size() const { return snapshots_.size(); }

    // Cumulative reused / (reused + created); 0 before the first construction.
    double efficiency() const;
    EntityCacheStats stats() const;
    const EntityCacheConfig& config() const { return config_; }

private:
    struct Snapshot {
        EntityUpdate built_from;
        bool selected = false;
        std::shared_ptr<VisualObject> object;
        uint64_t last_seen_batch = 0;
        uint32_t missed_batches = 0;
    };

    ChangeFlags compare(const Snapshot& snap, const EntityUpdate& update, bool selected) const;
    void dispose(Snapshot& snap);
    // Null when the factory returns nothing or throws.
    std::shared_ptr<VisualObject> build(const EntityUpdate& update, bool selected);

    IVisualFactory& factory_;
    EntityCacheConfig config_;
    BuildContext build_ctx_;
    std::unordered_map<std::string, Snapshot> snapshots_;

    uint64_t batches_ = 0;
    uint64_t created_ = 0;
    uint64_t rebuilt_ = 0;
    uint64_t reused_ = 0;
    uint64_t removed_ = 0;
    uint64_t malformed_ = 0;
    uint64_t position_changes_ = 0;
    uint64_t state_changes_ = 0;
    uint64_t selection_changes_ = 0;
};

} // namespace mrc::cache
