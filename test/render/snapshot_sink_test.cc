#include <gtest/gtest.h>
#include "../../src/render/snapshot_sink.h"
#include <filesystem>
#include <fstream>
#include <string>

using namespace IsingSim;

class PgmSnapshotSinkTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = std::filesystem::temp_directory_path() /
            ("isingsim_sink_" + std::to_string(::testing::UnitTest::GetInstance()->random_seed()) + "_" +
             ::testing::UnitTest::GetInstance()->current_test_info()->name());
        std::filesystem::remove_all(dir_);
        rng_.seed(3);
    }

    void TearDown() override {
        std::filesystem::remove_all(dir_);
    }

    std::filesystem::path dir_;
    std::mt19937_64 rng_;
};

TEST_F(PgmSnapshotSinkTest, RenderMapsSpinsToGrey) {
    AnyGraph graph = MakeGraph(false, 4, false, rng_);
    auto& g = *std::get<std::unique_ptr<DiscreteGraph>>(graph);
    for (size_t site = 0; site < g.SiteCount(); ++site) {
        g.Set(site, 1);
    }
    g.Set(0, -1);

    PgmSnapshotSink sink(dir_.string());
    const ImageBuffer buffer = sink.Render(graph);
    EXPECT_EQ(buffer.width, 4);
    EXPECT_EQ(buffer.height, 4);
    ASSERT_EQ(buffer.pixels.size(), 16u);
    EXPECT_EQ(buffer.pixels[0], 0xFF000000u);
    EXPECT_EQ(buffer.pixels[1], 0xFFFFFFFFu);
}

TEST_F(PgmSnapshotSinkTest, PersistWritesPgmUnderLabel) {
    AnyGraph graph = MakeGraph(true, 8, false, rng_);
    PgmSnapshotSink sink(dir_.string());
    ASSERT_TRUE(sink.Persist(sink.Render(graph), "Ising T1.5"));

    const std::string path = sink.PathFor("Ising T1.5");
    EXPECT_EQ(std::filesystem::path(path).filename().string(), "Ising T1.5.pgm");
    ASSERT_TRUE(std::filesystem::exists(path));

    std::ifstream in(path, std::ios::binary);
    std::string magic;
    int width = 0;
    int height = 0;
    int maxval = 0;
    in >> magic >> width >> height >> maxval;
    EXPECT_EQ(magic, "P5");
    EXPECT_EQ(width, 8);
    EXPECT_EQ(height, 8);
    EXPECT_EQ(maxval, 255);
    EXPECT_EQ(std::filesystem::file_size(path), std::string("P5\n8 8\n255\n").size() + 64);
}

TEST_F(PgmSnapshotSinkTest, MalformedBufferIsRejected) {
    PgmSnapshotSink sink(dir_.string());
    ImageBuffer buffer;
    buffer.width = 2;
    buffer.height = 2;
    buffer.pixels.resize(3);
    EXPECT_FALSE(sink.Persist(buffer, "bad"));
    EXPECT_FALSE(std::filesystem::exists(sink.PathFor("bad")));
}

TEST_F(PgmSnapshotSinkTest, UnwritableDirectoryFails) {
    // A regular file where the directory should be
    std::filesystem::create_directories(dir_);
    const std::filesystem::path blocker = dir_ / "blocker";
    std::ofstream(blocker) << "x";

    AnyGraph graph = MakeGraph(false, 4, false, rng_);
    PgmSnapshotSink sink((blocker / "nested").string());
    EXPECT_FALSE(sink.Persist(sink.Render(graph), "Ising T1"));
}
