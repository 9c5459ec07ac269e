#include "mapedit/interaction/interaction.h"

namespace {
    std::uint32_t nextInteractionId() {
        static std::uint32_t counter = 0;
        return ++counter;
    }
}

Interaction::Interaction(EventType defaultActive, ModificationKey defaultModificationKey, PointerKey defaultPointerKey)
    : defaultActive_(defaultActive),
      defaultModificationKey_(defaultModificationKey),
      defaultPointerKey_(defaultPointerKey),
      active_(defaultActive),
      modificationKey_(defaultModificationKey),
      pointerKey_(defaultPointerKey),
      id_(nextInteractionId()) {}

void Interaction::modifierChanged(ModificationKey) {}

void Interaction::destroy() {}

bool Interaction::accepts(const InteractionEvent& event) const {
    return hasFlag(active_, event.type)
        && hasFlag(modificationKey_, event.key)
        && hasFlag(pointerKey_, event.pointer);
}

void Interaction::setActive() {
    active_ = defaultActive_;
    modificationKey_ = defaultModificationKey_;
    pointerKey_ = defaultPointerKey_;
}

void Interaction::setActive(bool active) {
    active_ = active ? defaultActive_ : EventType::None;
}

void Interaction::setActive(EventType mask) {
    active_ = mask;
}

void Interaction::setModification() {
    modificationKey_ = defaultModificationKey_;
}

void Interaction::setModification(ModificationKey key) {
    modificationKey_ = key;
}

void Interaction::setPointer() {
    pointerKey_ = defaultPointerKey_;
}

void Interaction::setPointer(PointerKey key) {
    pointerKey_ = key;
}
