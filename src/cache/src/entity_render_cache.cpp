#include "cache/entity_render_cache.hpp"
#include "core/log.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <exception>

namespace mrc::cache {

const char* to_string(UpdateError e) noexcept {
    switch(e) {
        case UpdateError::EmptyId: return "empty id";
        case UpdateError::NonFinitePosition: return "non-finite position";
        case UpdateError::LatitudeOutOfRange: return "latitude out of range";
        case UpdateError::LongitudeOutOfRange: return "longitude out of range";
    }
    return "unknown";
}

std::string to_string(ChangeFlags f) {
    if(f == ChangeFlags::None) return "none";
    std::string out;
    auto add = [&](ChangeFlags bit, const char* name) {
        if(!has_flag(f, bit)) return;
        if(!out.empty()) out += '|';
        out += name;
    };
    add(ChangeFlags::Position, "position");
    add(ChangeFlags::State, "state");
    add(ChangeFlags::Selection, "selection");
    return out;
}

expected<GeoPoint, UpdateError> validate_update(const EntityUpdate& update) {
    if(update.id.empty()) return make_unexpected(UpdateError::EmptyId);
    const GeoPoint& p = update.position;
    if(!std::isfinite(p.lat) || !std::isfinite(p.lon)) return make_unexpected(UpdateError::NonFinitePosition);
    if(p.lat < -90.0 || p.lat > 90.0) return make_unexpected(UpdateError::LatitudeOutOfRange);
    if(p.lon < -180.0 || p.lon > 180.0) return make_unexpected(UpdateError::LongitudeOutOfRange);
    return p;
}

EntityRenderCache::EntityRenderCache(IVisualFactory& factory, EntityCacheConfig config)
    : factory_(factory), config_(config) {
    if(!(config_.position_epsilon >= 0.0)) {
        log::warn("[EntityCache] position_epsilon must be non-negative, using 1e-6");
        config_.position_epsilon = 1e-6;
    }
    if(config_.removal_grace_batches < 1) {
        log::warn("[EntityCache] removal_grace_batches clamped to 1");
        config_.removal_grace_batches = 1;
    }
}

EntityRenderCache::~EntityRenderCache() {
    clear();
}

ChangeFlags EntityRenderCache::compare(const Snapshot& snap, const EntityUpdate& update, bool selected) const {
    ChangeFlags flags = ChangeFlags::None;
    const GeoPoint& a = snap.built_from.position;
    const GeoPoint& b = update.position;
    if(std::abs(a.lat - b.lat) > config_.position_epsilon || std::abs(a.lon - b.lon) > config_.position_epsilon) {
        flags |= ChangeFlags::Position;
    }
    if(snap.built_from.state != update.state) flags |= ChangeFlags::State;
    if(snap.selected != selected) flags |= ChangeFlags::Selection;
    return flags;
}

void EntityRenderCache::dispose(Snapshot& snap) {
    if(snap.object) factory_.dispose(*snap.object);
    snap.object.reset();
}

std::shared_ptr<VisualObject> EntityRenderCache::build(const EntityUpdate& update, bool selected) {
    BuildContext ctx = build_ctx_;
    ctx.selected = selected;
    try {
        auto object = factory_.build(update, ctx);
        if(!object) log::warn("[EntityCache] factory returned no object for '" + update.id + "'");
        return object;
    } catch(const std::exception& e) {
        log::error("[EntityCache] build failed for '" + update.id + "': " + e.what());
        return nullptr;
    }
}

DiffResult EntityRenderCache::diff(const std::vector<EntityUpdate>& updates,
                                   const std::unordered_set<std::string>& selected_ids,
                                   const DiffFilter& filter) {
    DiffResult result;
    const uint64_t batch = ++batches_;

    // Validate and collapse duplicates to the last occurrence.
    std::vector<const EntityUpdate*> valid;
    valid.reserve(updates.size());
    std::unordered_map<std::string, size_t> last_index;
    for(const auto& u : updates) {
        auto checked = validate_update(u);
        if(!checked) {
            ++result.malformed;
            if(config_.enable_diagnostics) {
                log::debug("[EntityCache] skipped update '" + u.id + "': " + to_string(checked.error()));
            }
            continue;
        }
        last_index[u.id] = valid.size();
        valid.push_back(&u);
    }

    std::vector<const EntityUpdate*> passing;
    passing.reserve(last_index.size());
    size_t selected_passing = 0;
    for(size_t i = 0; i < valid.size(); ++i) {
        const EntityUpdate& u = *valid[i];
        if(last_index[u.id] != i) {
            ++result.duplicates;
            continue;
        }
        const bool selected = selected_ids.count(u.id) != 0;
        if((filter.selection_only && !selected) || (filter.predicate && !filter.predicate(u))) {
            ++result.filtered;
            continue;
        }
        if(selected) ++selected_passing;
        passing.push_back(&u);
    }

    // Selected entities always get in; the cap limits the rest.
    const size_t cap = config_.entity_cap;
    size_t unselected_room = cap > selected_passing ? cap - selected_passing : 0;
    std::vector<const EntityUpdate*> admitted;
    admitted.reserve(passing.size());
    for(const EntityUpdate* u : passing) {
        if(selected_ids.count(u->id) != 0) {
            admitted.push_back(u);
        } else if(unselected_room > 0) {
            --unselected_room;
            admitted.push_back(u);
        } else {
            ++result.capped;
        }
    }

    result.objects.reserve(admitted.size());
    for(const EntityUpdate* u : admitted) {
        const bool selected = selected_ids.count(u->id) != 0;
        auto it = snapshots_.find(u->id);

        if(it != snapshots_.end()) {
            Snapshot& snap = it->second;
            const ChangeFlags flags = compare(snap, *u, selected);
            if(flags == ChangeFlags::None) {
                snap.last_seen_batch = batch;
                snap.missed_batches = 0;
                ++result.reused;
                result.objects.push_back(snap.object);
                continue;
            }
            auto object = build(*u, selected);
            snap.last_seen_batch = batch;
            snap.missed_batches = 0;
            if(!object) {
                ++result.build_failures;
                result.objects.push_back(snap.object);
                continue;
            }
            dispose(snap);
            snap.object = std::move(object);
            snap.built_from = *u;
            snap.selected = selected;
            ++result.created;
            ++result.rebuilt;
            result.changes.push_back(EntityChange{u->id, flags});
            if(has_flag(flags, ChangeFlags::Position)) ++position_changes_;
            if(has_flag(flags, ChangeFlags::State)) ++state_changes_;
            if(has_flag(flags, ChangeFlags::Selection)) ++selection_changes_;
            result.objects.push_back(snap.object);
            continue;
        }

        auto object = build(*u, selected);
        if(!object) {
            ++result.build_failures;
            continue;
        }
        Snapshot snap;
        snap.built_from = *u;
        snap.selected = selected;
        snap.object = std::move(object);
        snap.last_seen_batch = batch;
        result.objects.push_back(snap.object);
        snapshots_.emplace(u->id, std::move(snap));
        ++result.created;
    }

    // Anything not admitted this batch ages toward removal.
    for(auto it = snapshots_.begin(); it != snapshots_.end();) {
        Snapshot& snap = it->second;
        if(snap.last_seen_batch == batch) { ++it; continue; }
        if(++snap.missed_batches < config_.removal_grace_batches) { ++it; continue; }
        dispose(snap);
        result.removed_ids.push_back(it->first);
        it = snapshots_.erase(it);
    }
    std::sort(result.removed_ids.begin(), result.removed_ids.end());
    result.removed = result.removed_ids.size();

    created_ += result.created;
    rebuilt_ += result.rebuilt;
    reused_ += result.reused;
    removed_ += result.removed;
    malformed_ += result.malformed;

    if(config_.enable_diagnostics) {
        char eff[16];
        std::snprintf(eff, sizeof(eff), "%.1f%%", efficiency() * 100.0);
        log::debug("[EntityCache] batch " + std::to_string(batch) + ": created " + std::to_string(result.created) +
                   " (rebuilt " + std::to_string(result.rebuilt) + "), reused " + std::to_string(result.reused) +
                   ", removed " + std::to_string(result.removed) + ", malformed " + std::to_string(result.malformed) +
                   ", capped " + std::to_string(result.capped) + ", efficiency " + eff);
    }
    return result;
}

void EntityRenderCache::apply_lod(quality::LodMode mode, const quality::LodConfig& config) {
    config_.entity_cap = config.entity_cap;
    build_ctx_.mode = mode;
    build_ctx_.simplification_epsilon = config.simplification_epsilon;
}

void EntityRenderCache::clear() {
    for(auto& [id, snap] : snapshots_) dispose(snap);
    removed_ += snapshots_.size();
    snapshots_.clear();
}

std::shared_ptr<VisualObject> EntityRenderCache::find(const std::string& id) const {
    auto it = snapshots_.find(id);
    return it == snapshots_.end() ? nullptr : it->second.object;
}

double EntityRenderCache::efficiency() const {
    const uint64_t total = reused_ + created_;
    return total ? double(reused_) / double(total) : 0.0;
}

EntityCacheStats EntityRenderCache::stats() const {
    EntityCacheStats st;
    st.size = snapshots_.size();
    st.batches = batches_;
    st.created = created_;
    st.rebuilt = rebuilt_;
    st.reused = reused_;
    st.removed = removed_;
    st.malformed = malformed_;
    st.position_changes = position_changes_;
    st.state_changes = state_changes_;
    st.selection_changes = selection_changes_;
    st.efficiency = efficiency();
    return st;
}

} // namespace mrc::cache
