#include "tests/editor_test_common.h"
#include "mapedit/select/selection_manager.h"

using namespace editor_test;

class SelectionManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        for (int i = 0; i < 3; i++) {
            ids.push_back(layer.addFeature(makeGeometry(GeometryKind::Point, {{double(i), 0.0, 0.0}})));
        }
    }

    FeatureLayer layer{"features"};
    std::vector<std::uint32_t> ids;
};

TEST_F(SelectionManagerTest, ReplaceKeepsSelectionOrderAndSkipsUnknownIds) {
    SelectionManager selection(layer);
    EXPECT_TRUE(selection.setSelection({ids[2], 999, ids[0], ids[2]}, SelectionManager::Mode::Replace));

    const auto& selected = selection.getOrdered();
    ASSERT_EQ(selected.size(), 2u);
    EXPECT_EQ(selected[0], ids[2]);
    EXPECT_EQ(selected[1], ids[0]);
    EXPECT_TRUE(selection.isSelected(ids[0]));
    EXPECT_FALSE(selection.isSelected(ids[1]));
    EXPECT_EQ(selection.getGeneration(), 1u);
}

TEST_F(SelectionManagerTest, GenerationOnlyAdvancesOnChange) {
    SelectionManager selection(layer);
    selection.setSelection({ids[0]}, SelectionManager::Mode::Replace);
    EXPECT_FALSE(selection.setSelection({ids[0]}, SelectionManager::Mode::Replace));
    EXPECT_FALSE(selection.setSelection({ids[0]}, SelectionManager::Mode::Add));
    EXPECT_FALSE(selection.setSelection({ids[1]}, SelectionManager::Mode::Remove));
    EXPECT_EQ(selection.getGeneration(), 1u);

    EXPECT_TRUE(selection.clearSelection());
    EXPECT_FALSE(selection.clearSelection());
    EXPECT_EQ(selection.getGeneration(), 2u);
}

TEST_F(SelectionManagerTest, AddRemoveAndToggle) {
    SelectionManager selection(layer);
    selection.setSelection({ids[0]}, SelectionManager::Mode::Replace);

    selection.setSelection({ids[1], ids[2]}, SelectionManager::Mode::Add);
    EXPECT_EQ(selection.size(), 3u);

    selection.setSelection({ids[1]}, SelectionManager::Mode::Remove);
    ASSERT_EQ(selection.size(), 2u);
    EXPECT_EQ(selection.getOrdered()[1], ids[2]);

    selection.setSelection({ids[0], ids[1]}, SelectionManager::Mode::Toggle);
    ASSERT_EQ(selection.size(), 2u);
    EXPECT_EQ(selection.getOrdered()[0], ids[2]);
    EXPECT_EQ(selection.getOrdered()[1], ids[1]);
}

TEST_F(SelectionManagerTest, PickTogglesOnlyInMultiMode) {
    SelectionManager selection(layer);
    EXPECT_TRUE(selection.selectByPick(ids[0], ModificationKey::None, true));
    EXPECT_TRUE(selection.selectByPick(ids[1], ModificationKey::Ctrl, true));
    EXPECT_EQ(selection.size(), 2u);
    EXPECT_TRUE(selection.selectByPick(ids[0], ModificationKey::Shift, true));
    ASSERT_EQ(selection.size(), 1u);
    EXPECT_EQ(selection.getOrdered()[0], ids[1]);

    EXPECT_TRUE(selection.selectByPick(ids[2], ModificationKey::Ctrl, false));
    ASSERT_EQ(selection.size(), 1u);
    EXPECT_EQ(selection.getOrdered()[0], ids[2]);
}

TEST_F(SelectionManagerTest, PickOnNothingClearsUnlessToggling) {
    SelectionManager selection(layer);
    selection.setSelection({ids[0], ids[1]}, SelectionManager::Mode::Replace);

    EXPECT_FALSE(selection.selectByPick(0, ModificationKey::Ctrl, true));
    EXPECT_EQ(selection.size(), 2u);
    EXPECT_FALSE(selection.selectByPick(999, ModificationKey::None, true));
    EXPECT_EQ(selection.size(), 2u);

    EXPECT_TRUE(selection.selectByPick(0, ModificationKey::None, true));
    EXPECT_TRUE(selection.empty());
}

TEST_F(SelectionManagerTest, PruneDropsRemovedFeatures) {
    SelectionManager selection(layer);
    selection.setSelection(ids, SelectionManager::Mode::Replace);
    const std::uint32_t generation = selection.getGeneration();

    EXPECT_FALSE(selection.prune());
    layer.removeFeature(ids[1]);
    EXPECT_TRUE(selection.prune());

    ASSERT_EQ(selection.size(), 2u);
    EXPECT_EQ(selection.getOrdered()[0], ids[0]);
    EXPECT_EQ(selection.getOrdered()[1], ids[2]);
    EXPECT_EQ(selection.getGeneration(), generation + 1);

    selection.clear();
    EXPECT_TRUE(selection.empty());
    EXPECT_EQ(selection.getGeneration(), 0u);
}
