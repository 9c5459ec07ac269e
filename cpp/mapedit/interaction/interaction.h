#pragma once

#include "mapedit/interaction/interaction_types.h"
#include <cstdint>

// Base of every event handler placed in an InteractionChain. An interaction receives an
// event only if its active mask, modification key and pointer key accept it.
class Interaction {
public:
    explicit Interaction(
        EventType defaultActive = EventType::All,
        ModificationKey defaultModificationKey = ModificationKey::All,
        PointerKey defaultPointerKey = PointerKey::All);
    virtual ~Interaction() = default;

    Interaction(const Interaction&) = delete;
    Interaction& operator=(const Interaction&) = delete;

    virtual void pipe(InteractionEvent& event) = 0;
    virtual void modifierChanged(ModificationKey modifier);
    // Releases resources created by the interaction. Safe to call more than once.
    virtual void destroy();

    bool accepts(const InteractionEvent& event) const;

    // Resets active mask, modification key and pointer key to their defaults.
    void setActive();
    void setActive(bool active);
    void setActive(EventType mask);
    void setModification();
    void setModification(ModificationKey key);
    void setPointer();
    void setPointer(PointerKey key);

    EventType active() const noexcept { return active_; }
    ModificationKey modificationKey() const noexcept { return modificationKey_; }
    PointerKey pointerKey() const noexcept { return pointerKey_; }
    std::uint32_t id() const noexcept { return id_; }

private:
    EventType defaultActive_;
    ModificationKey defaultModificationKey_;
    PointerKey defaultPointerKey_;
    EventType active_;
    ModificationKey modificationKey_;
    PointerKey pointerKey_;
    std::uint32_t id_;
};
