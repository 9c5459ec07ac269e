#include "tests/editor_test_common.h"
#include "mapedit/interaction/event_dispatcher.h"
#include "mapedit/interaction/interaction_chain.h"
#include "mapedit/session/disposer_list.h"
#include "mapedit/session/session_helpers.h"
#include "mapedit/session/suspend_guard.h"
#include <memory>

using namespace editor_test;

TEST(InteractionChainTest, PipesInRegistrationOrderUntilStopped) {
    std::vector<int> log;
    InteractionChain chain;
    auto first = std::make_shared<RecordingInteraction>(EventType::All, ModificationKey::All, &log, 1);
    auto second = std::make_shared<RecordingInteraction>(EventType::All, ModificationKey::All, &log, 2, true);
    auto third = std::make_shared<RecordingInteraction>(EventType::All, ModificationKey::All, &log, 3);
    chain.addInteraction(first);
    chain.addInteraction(third);
    chain.addInteraction(second, 1);

    InteractionEvent event = makeEvent(EventType::Click, nullptr, {});
    chain.pipe(event);

    ASSERT_EQ(log.size(), 2u);
    EXPECT_EQ(log[0], 1);
    EXPECT_EQ(log[1], 2);
    EXPECT_TRUE(third->events.empty());
}

TEST(InteractionChainTest, SkipsInteractionsNotAcceptingTheEvent) {
    InteractionChain chain;
    auto clicks = std::make_shared<RecordingInteraction>(EventType::Click);
    auto shiftOnly = std::make_shared<RecordingInteraction>(EventType::All, ModificationKey::Shift);
    chain.addInteraction(clicks);
    chain.addInteraction(shiftOnly);

    InteractionEvent move = makeEvent(EventType::Move, nullptr, {});
    chain.pipe(move);
    InteractionEvent click = makeEvent(EventType::Click, nullptr, {}, nullptr, 0, ModificationKey::Shift);
    chain.pipe(click);

    ASSERT_EQ(clicks->events.size(), 1u);
    EXPECT_EQ(clicks->events[0], EventType::Click);
    ASSERT_EQ(shiftOnly->events.size(), 1u);
    EXPECT_EQ(shiftOnly->events[0], EventType::Click);
}

TEST(InteractionChainTest, RemoveReturnsFormerIndex) {
    InteractionChain chain;
    auto a = std::make_shared<RecordingInteraction>();
    auto b = std::make_shared<RecordingInteraction>();
    chain.addInteraction(a);
    chain.addInteraction(b);

    EXPECT_EQ(chain.removeInteraction(b.get()), 1);
    EXPECT_EQ(chain.removeInteraction(b.get()), -1);
    EXPECT_EQ(chain.size(), 1u);
}

TEST(InteractionChainTest, DestroyOnlyDestroysRegisteredInteractions) {
    InteractionChain chain;
    auto kept = std::make_shared<RecordingInteraction>();
    auto removed = std::make_shared<RecordingInteraction>();
    chain.addInteraction(kept);
    chain.addInteraction(removed);
    chain.removeInteraction(removed.get());

    chain.destroy();

    EXPECT_EQ(kept->destroyCount, 1);
    EXPECT_EQ(removed->destroyCount, 0);
    EXPECT_EQ(chain.size(), 0u);
}

TEST(InteractionChainTest, ForwardsModifierChanges) {
    InteractionChain chain;
    auto a = std::make_shared<RecordingInteraction>(EventType::Click);
    chain.addInteraction(a);
    chain.modifierChanged(ModificationKey::Ctrl);
    ASSERT_EQ(a->modifiers.size(), 1u);
    EXPECT_EQ(a->modifiers[0], ModificationKey::Ctrl);
}

TEST(InteractionChainTest, SetActiveResetsToDefaults) {
    RecordingInteraction interaction(EventType::Click, ModificationKey::Shift);
    interaction.setActive(false);
    EXPECT_EQ(interaction.active(), EventType::None);
    interaction.setActive(EventType::Move);
    interaction.setModification(ModificationKey::Ctrl);
    interaction.setPointer(PointerKey::Right);
    EXPECT_EQ(interaction.pointerKey(), PointerKey::Right);
    interaction.setActive();
    EXPECT_EQ(interaction.active(), EventType::Click);
    EXPECT_EQ(interaction.modificationKey(), ModificationKey::Shift);
    EXPECT_EQ(interaction.pointerKey(), PointerKey::All);
}

TEST(EventDispatcherTest, ExclusiveRegistrationDisplacesOtherIds) {
    EventDispatcher dispatcher;
    int firstRemoved = 0;
    int secondRemoved = 0;
    auto first = std::make_shared<RecordingInteraction>();
    auto second = std::make_shared<RecordingInteraction>();

    dispatcher.addExclusiveInteraction(first, [&firstRemoved]() { firstRemoved++; });
    const std::string firstId = dispatcher.exclusiveId();
    EXPECT_EQ(firstId.rfind("exclusive-", 0), 0u);
    dispatcher.addExclusiveInteraction(second, [&secondRemoved]() { secondRemoved++; });
    EXPECT_NE(dispatcher.exclusiveId(), firstId);

    EXPECT_EQ(firstRemoved, 1);
    EXPECT_EQ(secondRemoved, 0);
    EXPECT_FALSE(dispatcher.interactionChain().contains(first.get()));
    EXPECT_TRUE(dispatcher.interactionChain().contains(second.get()));
}

TEST(EventDispatcherTest, ExclusiveRegistrationsWithSameIdAreGrouped) {
    EventDispatcher dispatcher;
    int removed = 0;
    auto a = std::make_shared<RecordingInteraction>();
    auto b = std::make_shared<RecordingInteraction>();

    dispatcher.addExclusiveInteraction(a, [&removed]() { removed++; }, -1, "editor");
    dispatcher.addExclusiveInteraction(b, [&removed]() { removed++; }, -1, "editor");
    EXPECT_EQ(removed, 0);
    EXPECT_EQ(dispatcher.exclusiveId(), "editor");
    EXPECT_TRUE(dispatcher.interactionChain().contains(a.get()));

    dispatcher.removeExclusive();
    EXPECT_EQ(removed, 2);
    EXPECT_FALSE(dispatcher.hasExclusive());
}

TEST(EventDispatcherTest, RemoverDoesNotCallRemovedCallback) {
    EventDispatcher dispatcher;
    int removed = 0;
    auto a = std::make_shared<RecordingInteraction>();
    auto unlisten = dispatcher.addExclusiveInteraction(a, [&removed]() { removed++; });
    unlisten();
    EXPECT_EQ(removed, 0);
    EXPECT_FALSE(dispatcher.interactionChain().contains(a.get()));
    EXPECT_FALSE(dispatcher.hasExclusive());
}

TEST(EventDispatcherTest, ModifierChangesAreBroadcastOnce) {
    EventDispatcher dispatcher;
    auto a = std::make_shared<RecordingInteraction>();
    dispatcher.addPersistentInteraction(a);
    int raised = 0;
    dispatcher.modifierChanged.addListener([&raised](ModificationKey) { raised++; });

    dispatcher.setModifier(ModificationKey::Shift);
    dispatcher.setModifier(ModificationKey::Shift);

    EXPECT_EQ(raised, 1);
    ASSERT_EQ(a->modifiers.size(), 1u);
    EXPECT_EQ(a->modifiers[0], ModificationKey::Shift);
}

TEST(EventDispatcherTest, DropsFeaturesThatAreNotPickable) {
    EventDispatcher dispatcher;
    FeatureLayer layer("features");
    Feature hidden;
    hidden.geometry = makeGeometry(GeometryKind::Point, {{1.0, 1.0, 0.0}});
    hidden.allowPicking = false;
    const std::uint32_t id = layer.addFeature(hidden);

    InteractionEvent event = makeEvent(EventType::Click, nullptr, {1.0, 1.0, 0.0}, &layer, id);
    dispatcher.dispatch(event);
    EXPECT_EQ(event.featureId, 0u);
    EXPECT_EQ(event.featureLayer, nullptr);
}

TEST(EventDispatcherTest, CarriesDragStartFeatureThroughDrag) {
    EventDispatcher dispatcher;
    FeatureLayer layer("features");
    const std::uint32_t id = layer.addFeature(makeGeometry(GeometryKind::Point, {{1.0, 1.0, 0.0}}));

    InteractionEvent start = makeEvent(EventType::DragStart, nullptr, {1.0, 1.0, 0.0}, &layer, id);
    dispatcher.dispatch(start);
    InteractionEvent drag = makeEvent(EventType::Drag, nullptr, {2.0, 2.0, 0.0});
    dispatcher.dispatch(drag);
    InteractionEvent end = makeEvent(EventType::DragEnd, nullptr, {2.0, 2.0, 0.0});
    dispatcher.dispatch(end);
    InteractionEvent after = makeEvent(EventType::Drag, nullptr, {3.0, 3.0, 0.0});
    dispatcher.dispatch(after);

    EXPECT_EQ(drag.featureId, id);
    EXPECT_EQ(end.featureId, id);
    EXPECT_EQ(after.featureId, 0u);
}

TEST_F(EditorTest, InteractionChainSetupRestoresFeatureInteraction) {
    FeatureInteraction& featureInteraction = context.dispatcher().featureInteraction();
    const EventType before = featureInteraction.active();
    int removed = 0;

    InteractionChainSetup setup = setupInteractionChain(context.dispatcher());
    setup.removed->addListener([&removed]() { removed++; });
    EXPECT_EQ(featureInteraction.active(), EventType::ClickMove | EventType::DragEvents);
    EXPECT_TRUE(context.dispatcher().interactionChain().contains(setup.chain.get()));

    setup.destroy();
    EXPECT_EQ(removed, 0);
    EXPECT_EQ(featureInteraction.active(), before);
    EXPECT_FALSE(context.dispatcher().interactionChain().contains(setup.chain.get()));
}

TEST_F(EditorTest, ScratchLayerIsTopmostAndExcludedFromPickPosition) {
    FeatureLayer other("other", 4);
    context.layers().add(&other);
    FeatureInteraction& featureInteraction = context.dispatcher().featureInteraction();

    ScratchLayerSetup scratch = setupScratchLayer(context.layers(), featureInteraction);
    EXPECT_EQ(scratch.layer->zIndex(), 5);
    EXPECT_TRUE(scratch.layer->isVolatile());
    const std::uint32_t id = scratch.layer->addFeature(makeGeometry(GeometryKind::Point, {{0.0, 0.0, 0.0}}));
    EXPECT_TRUE(featureInteraction.isExcludedFromPickPosition(scratch.layer.get(), id));

    scratch.destroy();
    EXPECT_FALSE(featureInteraction.isExcludedFromPickPosition(scratch.layer.get(), id));
    EXPECT_FALSE(context.layers().contains(scratch.layer.get()));
    EXPECT_EQ(scratch.layer->featureCount(), 0u);
    context.layers().remove(&other);
}

TEST(DisposerListTest, DisposesOnceInReverseOrder) {
    std::vector<int> order;
    DisposerList disposers;
    disposers.push([&order]() { order.push_back(1); });
    disposers.push([&order]() { order.push_back(2); });
    disposers.dispose();
    disposers.dispose();
    ASSERT_EQ(order.size(), 2u);
    EXPECT_EQ(order[0], 2);
    EXPECT_EQ(order[1], 1);
}

TEST(SuspendGuardTest, RestoresPreviousValue) {
    bool suspended = false;
    {
        SuspendGuard outer(suspended);
        EXPECT_TRUE(suspended);
        {
            SuspendGuard inner(suspended);
            EXPECT_TRUE(suspended);
        }
        EXPECT_TRUE(suspended);
    }
    EXPECT_FALSE(suspended);
}

TEST(SignalTest, ListenerRemovedWhileRaisingIsSkipped) {
    Signal<int> signal;
    int secondCalls = 0;
    Signal<int>::ListenerId second = 0;
    signal.addListener([&](int) { signal.removeListener(second); });
    second = signal.addListener([&secondCalls](int) { secondCalls++; });
    signal.raise(1);
    EXPECT_EQ(secondCalls, 0);
    EXPECT_EQ(signal.listenerCount(), 1u);
}
