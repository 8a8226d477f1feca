#include <gtest/gtest.h>
#include <render/marker_scene_applier.hpp>
#include "test_helpers.hpp"

using namespace atlas;
using namespace atlas::markers;
using test_utils::make_sample;

namespace {

SceneContext scene_with(const std::string& selected) {
    SceneContext scene;
    scene.globe_scale = vec3(1.0f);
    scene.selected_country = selected;
    return scene;
}

} // namespace

class MarkerSceneApplierTest : public ::testing::Test {
protected:
    test_utils::RecordingRenderer renderer;
    render::MarkerSceneApplier applier{renderer};
    MarkerReconciler reconciler;
};

TEST_F(MarkerSceneApplierTest, CreatesMarkersWithLabelAndGlow) {
    std::vector<data::MetricSample> samples = {make_sample("A", 1.0), make_sample("B", 2.0, 30.0, 40.0)};
    applier.apply(reconciler.reconcile(samples, {}, data::Metric::Ghg, 2.0, scene_with("B")));

    EXPECT_EQ(renderer.creates, 2);
    EXPECT_EQ(applier.marker_count(), 2u);
    ASSERT_NE(renderer.find("B"), nullptr);
    EXPECT_TRUE(renderer.find("B")->label);
    EXPECT_TRUE(renderer.find("B")->glow);
    EXPECT_FALSE(renderer.find("A")->label);
    EXPECT_FALSE(renderer.find("A")->glow);
    EXPECT_TRUE(applier.handle_for("A").has_value());
    EXPECT_FALSE(applier.handle_for("Z").has_value());
}

TEST_F(MarkerSceneApplierTest, UpdatesMoveAndMoveGlow) {
    std::vector<data::MetricSample> samples = {make_sample("A", 1.0), make_sample("B", 2.0, 30.0, 40.0)};
    auto first = reconciler.reconcile(samples, {}, data::Metric::Ghg, 2.0, scene_with("B"));
    applier.apply(first);

    samples[0].value = 2.0;
    auto second = reconciler.reconcile(samples, first.markers, data::Metric::Ghg, 2.0, scene_with("A"));
    applier.apply(second);

    EXPECT_EQ(renderer.creates, 2);
    EXPECT_EQ(renderer.moves, 2);
    EXPECT_FLOAT_EQ(renderer.last_duration, 0.6f);
    EXPECT_TRUE(renderer.find("A")->glow);
    EXPECT_TRUE(renderer.find("A")->label);
    EXPECT_FALSE(renderer.find("B")->glow);
    EXPECT_FALSE(renderer.find("B")->label);
    test_utils::expect_vec3_near(renderer.find("A")->position, second.markers.at("A").position);
}

TEST_F(MarkerSceneApplierTest, RemovesDestroyEntities) {
    std::vector<data::MetricSample> samples = {make_sample("A", 1.0), make_sample("B", 2.0, 30.0, 40.0)};
    auto first = reconciler.reconcile(samples, {}, data::Metric::Ghg, 2.0, scene_with(""));
    applier.apply(first);

    samples.pop_back();
    applier.apply(reconciler.reconcile(samples, first.markers, data::Metric::Ghg, 2.0, scene_with("")));

    EXPECT_EQ(renderer.removes, 1);
    EXPECT_EQ(renderer.find("B"), nullptr);
    EXPECT_EQ(applier.marker_count(), 1u);
}

TEST_F(MarkerSceneApplierTest, UpdateForUnknownMarkerRecreatesIt) {
    ReconcileResult result;
    MarkerState state;
    state.key = "Ghost";
    state.bin = 3;
    result.operations.push_back(MarkerOp::make_update(state, 0.6f));
    applier.apply(result);

    EXPECT_EQ(renderer.creates, 1);
    ASSERT_NE(renderer.find("Ghost"), nullptr);
    EXPECT_EQ(renderer.find("Ghost")->bin, 3);
}

TEST_F(MarkerSceneApplierTest, LandmarkSlotHoldsOne) {
    Landmark factory{LandmarkKind::Factory, vec3(0.0f), quat{}, 0.1f};
    Landmark towers{LandmarkKind::CoolingTowers, vec3(1.0f), quat{}, 0.1f};

    applier.apply(std::vector<LandmarkOp>{{LandmarkOpType::Create, factory}});
    applier.apply(std::vector<LandmarkOp>{{LandmarkOpType::Create, towers}});
    ASSERT_EQ(renderer.landmarks.size(), 1u);
    EXPECT_EQ(renderer.landmarks.begin()->second.kind, LandmarkKind::CoolingTowers);
    EXPECT_TRUE(applier.has_landmark());

    applier.apply(std::vector<LandmarkOp>{{LandmarkOpType::Remove, towers}});
    EXPECT_TRUE(renderer.landmarks.empty());
    EXPECT_FALSE(applier.has_landmark());
}
