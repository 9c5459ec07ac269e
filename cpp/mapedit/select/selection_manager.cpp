#include "mapedit/select/selection_manager.h"
#include "mapedit/feature/feature_layer.h"
#include <algorithm>

SelectionManager::SelectionManager(const FeatureLayer& layer)
    : layer_(layer) {}

bool SelectionManager::setSelection(const std::uint32_t* ids, std::uint32_t count, Mode mode) {
    std::unordered_set<std::uint32_t> set;
    std::vector<std::uint32_t> ordered;
    if (mode != Mode::Replace) {
        set = set_;
        ordered = ordered_;
    }

    auto applyInsert = [&](std::uint32_t id) {
        if (set.insert(id).second) ordered.push_back(id);
    };
    auto applyErase = [&](std::uint32_t id) {
        if (set.erase(id) > 0) {
            ordered.erase(std::remove(ordered.begin(), ordered.end(), id), ordered.end());
        }
    };

    for (std::uint32_t i = 0; i < count; i++) {
        const std::uint32_t id = ids[i];
        if (!layer_.hasFeature(id)) continue;

        switch (mode) {
            case Mode::Replace:
            case Mode::Add:
                applyInsert(id);
                break;
            case Mode::Remove:
                applyErase(id);
                break;
            case Mode::Toggle:
                if (set.find(id) != set.end()) {
                    applyErase(id);
                } else {
                    applyInsert(id);
                }
                break;
        }
    }

    if (ordered == ordered_) return false;
    set_ = std::move(set);
    ordered_ = std::move(ordered);
    generation_++;
    return true;
}

bool SelectionManager::setSelection(const std::vector<std::uint32_t>& ids, Mode mode) {
    return setSelection(ids.data(), static_cast<std::uint32_t>(ids.size()), mode);
}

bool SelectionManager::clearSelection() {
    if (set_.empty()) return false;
    set_.clear();
    ordered_.clear();
    generation_++;
    return true;
}

bool SelectionManager::selectByPick(std::uint32_t id, ModificationKey key, bool multi) {
    Mode mode = Mode::Replace;
    if (multi && (hasFlag(key, ModificationKey::Ctrl) || hasFlag(key, ModificationKey::Shift))) {
        mode = Mode::Toggle;
    }

    if (id == 0) {
        if (mode == Mode::Replace) return clearSelection();
        return false;
    }
    if (!layer_.hasFeature(id)) return false;

    return setSelection(&id, 1, mode);
}

bool SelectionManager::prune() {
    bool changed = false;
    for (auto it = set_.begin(); it != set_.end();) {
        if (!layer_.hasFeature(*it)) {
            it = set_.erase(it);
            changed = true;
        } else {
            ++it;
        }
    }

    if (changed) {
        ordered_.erase(
            std::remove_if(ordered_.begin(), ordered_.end(), [this](std::uint32_t id) { return !isSelected(id); }),
            ordered_.end());
        generation_++;
    }
    return changed;
}

void SelectionManager::clear() {
    set_.clear();
    ordered_.clear();
    generation_ = 0;
}
