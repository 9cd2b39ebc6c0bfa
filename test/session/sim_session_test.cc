#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "../../src/session/sim_session.h"
#include <atomic>
#include <chrono>
#include <filesystem>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace IsingSim;
using namespace std::chrono_literals;
using ::testing::_;
using ::testing::NiceMock;
using ::testing::Return;

class MockSnapshotSink : public ISnapshotSink {
public:
    MOCK_METHOD(ImageBuffer, Render, (const AnyGraph& graph), (override));
    MOCK_METHOD(bool, Persist, (const ImageBuffer& buffer, const std::string& label), (override));
};

class SimSessionTest : public ::testing::Test {
protected:
    void SetUp() override {
        options_.graph_size = 16;
        options_.seed = 7;
        options_.stats_window = 2;
        options_.inline_tasks = true;
        options_.max_distance = 4;
        options_.pairs_per_distance = 64;

        ImageBuffer buffer;
        buffer.width = 16;
        buffer.height = 16;
        buffer.pixels.assign(256, 0xFF808080u);

        auto sink = std::make_unique<NiceMock<MockSnapshotSink>>();
        sink_ = sink.get();
        ON_CALL(*sink_, Render(_)).WillByDefault(Return(buffer));
        ON_CALL(*sink_, Persist(_, _)).WillByDefault(Return(true));
        session_ = std::make_unique<SimSession>(options_, std::move(sink));
    }

    void TearDown() override {
        session_->Shutdown();
    }

    SweepConfig FastSweep() {
        SweepConfig config;
        config.t_initial = 1.0f;
        config.t_final = 2.0f;
        config.t_step = 1.0f;
        config.sample_points = 1;
        config.sample_wait = 0ms;
        return config;
    }

    SessionOptions options_;
    NiceMock<MockSnapshotSink>* sink_ = nullptr;
    std::unique_ptr<SimSession> session_;
};

TEST_F(SimSessionTest, SnapshotLabelFormat) {
    EXPECT_EQ(SnapshotLabel(1.5f), "Ising T1.5");
    EXPECT_EQ(SnapshotLabel(13.0f), "Ising T13");
}

TEST_F(SimSessionTest, BrushRadiusScalesWithLattice) {
    // 10% of 16, rounded
    EXPECT_EQ(session_->State().BrushRadius(), 2);
    EXPECT_EQ(session_->State().GetImageSize().width, 16);
}

TEST_F(SimSessionTest, FrameTicksPublishStatistics) {
    EXPECT_CALL(*sink_, Render(_)).Times(2);
    session_->Start();
    std::this_thread::sleep_for(20ms);

    session_->TimedFunctions();
    session_->TimedFunctions();

    EXPECT_EQ(session_->State().UpdatesWindow().Flushes(), 1u);
    EXPECT_EQ(session_->State().MagnetizationWindow().Flushes(), 1u);
    EXPECT_GT(session_->State().UpdatesPerFrame(), 0);

    ImageBuffer latest;
    ASSERT_TRUE(session_->CopyLatestImage(&latest));
    EXPECT_EQ(latest.width, 16);
    EXPECT_EQ(session_->ImageGate().Completed(), 2u);
    EXPECT_EQ(session_->UpfGate().Completed(), 2u);
    EXPECT_EQ(session_->MagnetizationGate().Completed(), 2u);
}

TEST_F(SimSessionTest, NoImageBeforeFirstTick) {
    ImageBuffer latest;
    EXPECT_FALSE(session_->CopyLatestImage(&latest));
}

TEST_F(SimSessionTest, RenderFailureDoesNotStopOtherTasks) {
    EXPECT_CALL(*sink_, Render(_)).WillOnce([](const AnyGraph&) -> ImageBuffer {
        throw std::runtime_error("no display");
    });
    session_->TimedFunctions();
    EXPECT_EQ(session_->ImageGate().Failures(), 1u);
    EXPECT_EQ(session_->UpfGate().Completed(), 1u);
    EXPECT_EQ(session_->MagnetizationGate().Completed(), 1u);
}

TEST_F(SimSessionTest, ReconfigurationWhileRunning) {
    session_->Start();
    std::this_thread::sleep_for(5ms);

    const size_t added = session_->AddRandomDefects(0.25);
    EXPECT_EQ(added, 64u);
    EXPECT_TRUE(GraphHasDefects(session_->Graph()));

    session_->SetWeighted(false);
    const auto& graph = *std::get<std::unique_ptr<DiscreteGraph>>(session_->Graph());
    EXPECT_EQ(graph.GetHamiltonian(), Hamiltonian::kPlain);

    session_->Reinitialize();
    EXPECT_FALSE(GraphHasDefects(session_->Graph()));

    EXPECT_TRUE(session_->Healthy());
    EXPECT_NO_THROW(session_->CheckHealth());
    EXPECT_GE(session_->HotLoop().Branches(), 1u);
    EXPECT_TRUE(session_->State().ShouldRun());
}

TEST_F(SimSessionTest, PaintUsesCurrentBrush) {
    session_->SetBrushRadius(1);
    session_->SetBrushValue(-1.0f);
    EXPECT_EQ(session_->PaintAt(5, 5), 5u);

    const auto& graph = *std::get<std::unique_ptr<DiscreteGraph>>(session_->Graph());
    EXPECT_EQ(graph.Get(graph.Index(5, 5)), -1);
    EXPECT_EQ(graph.Get(graph.Index(6, 5)), -1);
    EXPECT_EQ(session_->PaintAt(0, 0, true), 3u);
}

TEST_F(SimSessionTest, SweepPersistsTaggedSnapshots) {
    EXPECT_CALL(*sink_, Persist(_, "Ising T1")).WillOnce(Return(true));
    EXPECT_CALL(*sink_, Persist(_, "Ising T2")).WillOnce(Return(false));
    session_->Start();

    SweepConfig config = FastSweep();
    config.save_snapshots = true;
    SweepReport report;
    EXPECT_EQ(session_->RunSweep(config, &report), SweepStatus::kCompleted);

    EXPECT_EQ(report.snapshots_saved, 1u);
    ASSERT_EQ(report.samples.size(), 2u);
    EXPECT_EQ(report.samples[0].correlation.size(), 4u);
    EXPECT_FALSE(session_->State().AnalysisRunning());
}

TEST_F(SimSessionTest, BackgroundSweepCanBeCancelled) {
    session_->Start();
    SweepConfig config = FastSweep();
    config.sample_wait = 60s;

    ASSERT_TRUE(session_->StartSweep(config));
    EXPECT_FALSE(session_->StartSweep(config));

    session_->CancelSweep();
    session_->JoinSweep();
    ASSERT_TRUE(session_->LastSweepStatus().has_value());
    EXPECT_EQ(*session_->LastSweepStatus(), SweepStatus::kCancelled);
    EXPECT_FALSE(session_->State().AnalysisRunning());

    // A finished sweep frees the slot
    EXPECT_TRUE(session_->StartSweep(FastSweep()));
    session_->JoinSweep();
    EXPECT_EQ(*session_->LastSweepStatus(), SweepStatus::kCompleted);
    EXPECT_EQ(session_->LastSweepReport().temperatures.size(), 2u);
}

TEST_F(SimSessionTest, FailedBackgroundSweepPublishesTerminalStatus) {
    EXPECT_CALL(*sink_, Render(_)).WillRepeatedly([](const AnyGraph&) -> ImageBuffer {
        throw std::runtime_error("render failed");
    });
    session_->Start();

    SweepConfig config = FastSweep();
    config.save_snapshots = true;
    ASSERT_TRUE(session_->StartSweep(config));
    session_->JoinSweep();

    ASSERT_TRUE(session_->LastSweepStatus().has_value());
    EXPECT_EQ(*session_->LastSweepStatus(), SweepStatus::kFailed);
    EXPECT_FALSE(session_->State().AnalysisRunning());
    EXPECT_TRUE(session_->Healthy());

    // A new sweep clears the previous result until it finishes
    config = FastSweep();
    config.sample_wait = 60s;
    ASSERT_TRUE(session_->StartSweep(config));
    EXPECT_FALSE(session_->LastSweepStatus().has_value());
    EXPECT_TRUE(session_->LastSweepReport().temperatures.empty());
    session_->CancelSweep();
    session_->JoinSweep();
    EXPECT_EQ(*session_->LastSweepStatus(), SweepStatus::kCancelled);
}

TEST_F(SimSessionTest, EmptyReconfigureLeavesStateUntouched) {
    // Leave both windows part-way through and some updates uncounted
    session_->TimedFunctions();
    for (int i = 0; i < 5; ++i) {
        session_->State().CountUpdate();
    }

    const auto& graph = *std::get<std::unique_ptr<DiscreteGraph>>(session_->Graph());
    auto sites = [&graph]() {
        std::vector<int8_t> out;
        for (int i = 0; i < graph.Side(); ++i) {
            for (int j = 0; j < graph.Side(); ++j) {
                out.push_back(graph.Get(graph.Index(i, j)));
            }
        }
        return out;
    };
    SharedSimState& state = session_->State();
    const std::vector<int8_t> sites_before = sites();
    const int64_t pending_before = state.PendingUpdates();
    const std::vector<double> upf_before = state.UpdatesWindow().Snapshot();
    const size_t upf_frames_before = state.UpdatesWindow().FrameCount();
    const std::vector<double> m_before = state.MagnetizationWindow().Snapshot();
    const size_t m_frames_before = state.MagnetizationWindow().FrameCount();
    const uint64_t flushes_before = state.MagnetizationWindow().Flushes();

    session_->HotLoop().RequestReconfigure([] {});

    EXPECT_EQ(sites(), sites_before);
    EXPECT_EQ(state.PendingUpdates(), pending_before);
    EXPECT_EQ(pending_before, 5);
    EXPECT_EQ(state.UpdatesWindow().Snapshot(), upf_before);
    EXPECT_EQ(state.UpdatesWindow().FrameCount(), upf_frames_before);
    EXPECT_EQ(upf_frames_before, 1u);
    EXPECT_EQ(state.MagnetizationWindow().Snapshot(), m_before);
    EXPECT_EQ(state.MagnetizationWindow().FrameCount(), m_frames_before);
    EXPECT_EQ(state.MagnetizationWindow().Flushes(), flushes_before);
}

TEST_F(SimSessionTest, SaveSnapshotOnDemand) {
    EXPECT_CALL(*sink_, Render(_)).Times(1);
    EXPECT_CALL(*sink_, Persist(_, "Ising manual")).WillOnce(Return(true));
    EXPECT_TRUE(session_->SaveSnapshot("Ising manual"));
}

TEST_F(SimSessionTest, PaintingNeverOverwritesNewDefects) {
    session_->SetBrushRadius(2);
    session_->SetBrushValue(1.0f);

    std::atomic<bool> stop{false};
    std::thread painter([&] {
        int k = 0;
        while (!stop.load()) {
            session_->PaintAt(k % 16, (k * 7) % 16);
            ++k;
        }
    });
    for (int round = 0; round < 4; ++round) {
        session_->AddRandomDefects(0.2);
    }
    stop.store(true);
    painter.join();

    const auto& graph = *std::get<std::unique_ptr<DiscreteGraph>>(session_->Graph());
    size_t defects = 0;
    for (size_t site = 0; site < 256; ++site) {
        if (graph.IsDefect(site)) {
            ++defects;
            EXPECT_EQ(graph.Get(site), 0) << "site " << site;
        }
    }
    EXPECT_GT(defects, 0u);
}

TEST_F(SimSessionTest, InvalidBackgroundSweepIsRefused) {
    SweepConfig config = FastSweep();
    config.t_step = -1.0f;
    EXPECT_FALSE(session_->StartSweep(config));
    EXPECT_FALSE(session_->LastSweepStatus().has_value());
}

TEST_F(SimSessionTest, ShutdownIsIdempotent) {
    session_->Start();
    session_->Shutdown();
    session_->Shutdown();
    EXPECT_EQ(session_->State().Phase(), HotLoopPhase::kStopped);
}

TEST(SimSessionPoolTest, PooledTasksRunOffTheDriverThread) {
    SessionOptions options;
    options.graph_size = 8;
    options.seed = 11;
    options.stats_window = 1;
    options.worker_threads = 2;
    options.max_distance = 2;
    options.pairs_per_distance = 16;
    options.snapshot_dir = (std::filesystem::temp_directory_path() / "isingsim_pool_test").string();

    SimSession session(options);
    session.Start();
    session.TimedFunctions();
    ASSERT_TRUE(session.ImageGate().WaitIdle(absl::Seconds(5)));
    ASSERT_TRUE(session.UpfGate().WaitIdle(absl::Seconds(5)));
    ASSERT_TRUE(session.MagnetizationGate().WaitIdle(absl::Seconds(5)));

    EXPECT_EQ(session.ImageGate().Completed(), 1u);
    ImageBuffer latest;
    EXPECT_TRUE(session.CopyLatestImage(&latest));
    EXPECT_EQ(latest.width, 8);
    session.Shutdown();
}
