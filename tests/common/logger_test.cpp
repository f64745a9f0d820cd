// =============================================================================
// sendstream-upgrade - Logger Tests
// =============================================================================

#include "ssu/common/logger.h"

#include <gtest/gtest.h>

namespace ssu::log {
namespace {

TEST(LogLevelTest, ParsesNamesCaseInsensitively) {
    EXPECT_EQ(levelFromString("trace"), Level::kTrace);
    EXPECT_EQ(levelFromString("DEBUG"), Level::kDebug);
    EXPECT_EQ(levelFromString("Warn"), Level::kWarning);
    EXPECT_EQ(levelFromString("warning"), Level::kWarning);
    EXPECT_EQ(levelFromString("error"), Level::kError);
    EXPECT_EQ(levelFromString("fatal"), Level::kCritical);
}

TEST(LogLevelTest, UnknownNamesFallBackToInfo) {
    EXPECT_EQ(levelFromString(""), Level::kInfo);
    EXPECT_EQ(levelFromString("loud"), Level::kInfo);
}

TEST(LogLevelTest, NamesRoundTrip) {
    for (const auto level : {Level::kTrace, Level::kDebug, Level::kInfo, Level::kWarning,
                             Level::kError, Level::kCritical}) {
        EXPECT_EQ(levelFromString(levelToString(level)), level) << levelToString(level);
    }
}

TEST(LogLevelTest, MapsOntoQuillLevels) {
    EXPECT_EQ(toQuillLevel(Level::kDebug), quill::LogLevel::Debug);
    EXPECT_EQ(toQuillLevel(Level::kError), quill::LogLevel::Error);
    EXPECT_EQ(toQuillLevel(Level::kCritical), quill::LogLevel::Critical);
}

}  // namespace
}  // namespace ssu::log
