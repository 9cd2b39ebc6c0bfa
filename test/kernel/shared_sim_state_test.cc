#include <gtest/gtest.h>
#include "../../src/kernel/shared_sim_state.h"

using namespace IsingSim;

class SharedSimStateTest : public ::testing::Test {
protected:
    void SetUp() override {
        SharedSimStateOptions options;
        options.initial_temperature = 2.0;
        options.brush_radius = 2;
        options.image_size = ImageSize{32, 32};
        options.stats_window = 10;
        state_ = std::make_unique<SharedSimState>(options);
    }

    std::unique_ptr<SharedSimState> state_;
};

TEST_F(SharedSimStateTest, InitialValues) {
    EXPECT_FLOAT_EQ(state_->Temperature(), 2.0f);
    EXPECT_EQ(state_->BrushRadius(), 2);
    EXPECT_EQ(state_->CopyBrushMask().size(), DiscreteGraph::OrderedCircle(2).size());
    EXPECT_EQ(state_->GetImageSize().width, 32);
    EXPECT_EQ(state_->UpdatesWindow().Window(), 10u);
    EXPECT_EQ(state_->MagnetizationWindow().Name(), "magnetization");
    EXPECT_TRUE(state_->ShouldRun());
    EXPECT_FALSE(state_->IsRunning());
    EXPECT_FALSE(state_->AnalysisRunning());
    EXPECT_EQ(state_->Phase(), HotLoopPhase::kStopped);
}

TEST_F(SharedSimStateTest, UpdateCounterIsTakenAtomically) {
    for (int i = 0; i < 5; ++i) {
        state_->CountUpdate();
    }
    EXPECT_EQ(state_->PendingUpdates(), 5);
    EXPECT_EQ(state_->TakeUpdates(), 5);
    EXPECT_EQ(state_->TakeUpdates(), 0);
}

TEST_F(SharedSimStateTest, BrushUpdateReplacesMask) {
    state_->SetBrush(0, DiscreteGraph::OrderedCircle(0));
    EXPECT_EQ(state_->BrushRadius(), 0);
    EXPECT_EQ(state_->CopyBrushMask().size(), 1u);

    state_->SetBrushValue(-1.0f);
    EXPECT_FLOAT_EQ(state_->BrushValue(), -1.0f);
}

TEST_F(SharedSimStateTest, StopAndRunToggleShouldRun) {
    state_->RequestStop();
    EXPECT_FALSE(state_->ShouldRun());
    // Nothing is running, so parking is immediate
    state_->WaitUntilParked();
    state_->RequestRun();
    EXPECT_TRUE(state_->ShouldRun());
}

TEST_F(SharedSimStateTest, PublishedStatistics) {
    state_->PublishMagnetization(0.5f);
    state_->PublishUpdatesPerFrame(1234);
    EXPECT_FLOAT_EQ(state_->Magnetization(), 0.5f);
    EXPECT_EQ(state_->UpdatesPerFrame(), 1234);
}

TEST(HotLoopPhaseNameTest, NamesEveryPhase) {
    EXPECT_STREQ(HotLoopPhaseName(HotLoopPhase::kStopped), "Stopped");
    EXPECT_STREQ(HotLoopPhaseName(HotLoopPhase::kRunning), "Running");
    EXPECT_STREQ(HotLoopPhaseName(HotLoopPhase::kDraining), "Draining");
    EXPECT_STREQ(HotLoopPhaseName(HotLoopPhase::kReconfiguring), "Reconfiguring");
}
