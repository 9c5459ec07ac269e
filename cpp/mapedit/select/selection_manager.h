#pragma once

#include "mapedit/interaction/interaction_types.h"
#include <cstdint>
#include <unordered_set>
#include <vector>

class FeatureLayer;

// Selected feature ids of one layer, in selection order. Every change bumps the
// generation counter.
class SelectionManager {
public:
    enum class Mode : std::uint8_t {
        Replace = 0,
        Add = 1,
        Remove = 2,
        Toggle = 3,
    };

    explicit SelectionManager(const FeatureLayer& layer);

    // Ids missing from the layer are ignored. Returns true if the selection changed.
    bool setSelection(const std::uint32_t* ids, std::uint32_t count, Mode mode);
    bool setSelection(const std::vector<std::uint32_t>& ids, Mode mode);
    bool clearSelection();

    // Click selection: CTRL or SHIFT toggle the picked id when `multi` is set, otherwise it
    // replaces the selection. A click on nothing (id 0) clears unless toggling.
    bool selectByPick(std::uint32_t id, ModificationKey key, bool multi);

    // Drops ids no longer in the layer.
    bool prune();
    // Resets the selection and the generation counter without reporting a change.
    void clear();

    const std::vector<std::uint32_t>& getOrdered() const { return ordered_; }
    bool isSelected(std::uint32_t id) const { return set_.find(id) != set_.end(); }
    std::size_t size() const { return ordered_.size(); }
    bool empty() const { return ordered_.empty(); }
    std::uint32_t getGeneration() const { return generation_; }

private:
    const FeatureLayer& layer_;
    std::unordered_set<std::uint32_t> set_;
    std::vector<std::uint32_t> ordered_;
    std::uint32_t generation_ = 0;
};
