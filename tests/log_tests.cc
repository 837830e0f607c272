#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "core/log.h"
#include "world/voxel.h"
#include "world/world.h"

namespace {

struct CapturedLine {
    subvox::core::LogLevel level;
    std::string category;
    std::string message;
};

class LogCapture : public ::testing::Test {
protected:
    void SetUp() override {
        subvox::core::initializeLogLevelFromEnvironment();
        m_previousLevel = subvox::core::logLevel();
        subvox::core::setLogSink([this](subvox::core::LogLevel level, std::string_view category, std::string_view message) {
            m_lines.push_back(CapturedLine{level, std::string(category), std::string(message)});
        });
    }

    void TearDown() override {
        subvox::core::setLogSink({});
        subvox::core::setLogLevel(m_previousLevel);
    }

    std::vector<CapturedLine> m_lines;

private:
    subvox::core::LogLevel m_previousLevel = subvox::core::LogLevel::Info;
};

} // namespace

TEST(Log, ParsesLevelNamesAndDigits) {
    EXPECT_EQ(subvox::core::parseLogLevel("error"), subvox::core::LogLevel::Error);
    EXPECT_EQ(subvox::core::parseLogLevel("WARNING"), subvox::core::LogLevel::Warn);
    EXPECT_EQ(subvox::core::parseLogLevel("Info"), subvox::core::LogLevel::Info);
    EXPECT_EQ(subvox::core::parseLogLevel("3"), subvox::core::LogLevel::Debug);
    EXPECT_EQ(subvox::core::parseLogLevel("trace"), subvox::core::LogLevel::Trace);
    EXPECT_FALSE(subvox::core::parseLogLevel("verbose").has_value());
    EXPECT_FALSE(subvox::core::parseLogLevel("").has_value());
    EXPECT_STREQ(subvox::core::logLevelName(subvox::core::LogLevel::Warn), "warn");
}

TEST_F(LogCapture, SinkReceivesFormattedLine) {
    subvox::core::setLogLevel(subvox::core::LogLevel::Info);
    SUBVOX_LOGI("world") << "Loaded " << 3 << " voxels\n";

    ASSERT_EQ(m_lines.size(), 1u);
    EXPECT_EQ(m_lines[0].level, subvox::core::LogLevel::Info);
    EXPECT_EQ(m_lines[0].category, "world");
    EXPECT_EQ(m_lines[0].message, "Loaded 3 voxels");
}

TEST_F(LogCapture, LinesBelowThresholdAreDropped) {
    subvox::core::setLogLevel(subvox::core::LogLevel::Warn);
    SUBVOX_LOGI("world") << "hidden";
    SUBVOX_LOGD("world") << "hidden";
    SUBVOX_LOGW("world") << "shown";
    SUBVOX_LOGE("world") << "shown";

    ASSERT_EQ(m_lines.size(), 2u);
    EXPECT_EQ(m_lines[0].level, subvox::core::LogLevel::Warn);
    EXPECT_EQ(m_lines[1].level, subvox::core::LogLevel::Error);
    EXPECT_FALSE(subvox::core::shouldLog(subvox::core::LogLevel::Debug));
}

TEST_F(LogCapture, CorruptVoxelTagIsReportedAsWarning) {
    subvox::core::setLogLevel(subvox::core::LogLevel::Warn);
    subvox::world::VoxelRecord record{};
    record.patternTag = 77;
    const subvox::world::VoxelShape shape = subvox::world::resolveVoxelShape(record);
    EXPECT_TRUE(shape.fellBack);

    ASSERT_EQ(m_lines.size(), 1u);
    EXPECT_EQ(m_lines[0].level, subvox::core::LogLevel::Warn);
    EXPECT_EQ(m_lines[0].category, "geometry");
}

TEST_F(LogCapture, VoxelOutsideCollisionGridWarnsOncePerChunk) {
    subvox::core::setLogLevel(subvox::core::LogLevel::Warn);
    subvox::world::VoxelWorld world;
    const std::vector<subvox::world::VoxelRecord> records = {
        subvox::world::makeVoxelRecord(subvox::core::Cell3i{1 << 21, 0, 0}, subvox::world::SubVoxelPattern::Full)
    };
    EXPECT_EQ(world.loadVoxels(records), 1u);
    EXPECT_EQ(world.stats().colliderCount, 0u);

    ASSERT_EQ(m_lines.size(), 1u);
    EXPECT_EQ(m_lines[0].level, subvox::core::LogLevel::Warn);
    EXPECT_EQ(m_lines[0].category, "world");
    EXPECT_NE(m_lines[0].message.find("512 of 512"), std::string::npos);
}
