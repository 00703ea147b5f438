#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <string>
#include <system_error>

#include "app/survey.h"

namespace {

class TempDirGuard {
public:
    explicit TempDirGuard(const char* tag) {
        const auto stamp = std::chrono::high_resolution_clock::now().time_since_epoch().count();
        m_path = std::filesystem::temp_directory_path() / ("delve_" + std::string(tag) + "_" + std::to_string(stamp));
    }
    ~TempDirGuard() {
        std::error_code ec;
        std::filesystem::remove_all(m_path, ec);
    }

    const std::filesystem::path& path() const { return m_path; }

private:
    std::filesystem::path m_path;
};

delve::app::SurveyConfig smallSurvey(const std::filesystem::path& dir) {
    delve::app::SurveyConfig config{};
    config.store.chunkDirectory = dir;
    config.store.chunkSize = delve::core::Cell3i{8, 16, 8};
    config.seedRadius = 6;
    config.seedTopY = 10;
    config.pathfinder.maxExpansions = 100000;
    return config;
}

} // namespace

TEST(Survey, MinesEveryOreCellAndPersistsTheResult) {
    TempDirGuard dir("survey");

    {
        delve::app::SurveyApp app(smallSurvey(dir.path()));
        ASSERT_TRUE(app.init());
        const std::size_t ore = app.oreRemaining();
        ASSERT_GT(ore, 0u);

        app.run();
        EXPECT_EQ(app.oreRemaining(), 0u);
        EXPECT_GE(app.minedCount(), ore);
        ASSERT_TRUE(app.shutdown());
    }
    EXPECT_TRUE(std::filesystem::exists(dir.path() / "0_0_0.chnk"));
    EXPECT_TRUE(std::filesystem::exists(dir.path() / "-1_0_-1.chnk"));

    delve::app::SurveyApp reloaded(smallSurvey(dir.path()));
    ASSERT_TRUE(reloaded.init());
    EXPECT_EQ(reloaded.oreRemaining(), 0u);
    reloaded.run();
    EXPECT_EQ(reloaded.minedCount(), 0u);
    EXPECT_TRUE(reloaded.shutdown());
}
