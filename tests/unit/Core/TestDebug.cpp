#include <gtest/gtest.h>

#include <sstream>

#include <geo_kernel/core/debug.hpp>

using geo_kernel::Debug;
using geo_kernel::LogLevel;

class DebugTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        m_previousLevel = Debug::GetMinimumLevel();
        Debug::SetOutputStream(&m_stream);
    }

    void TearDown() override
    {
        Debug::ResetOutputToConsole();
        Debug::SetMinimumLevel(m_previousLevel);
    }

    std::ostringstream m_stream;
    LogLevel m_previousLevel = LogLevel::Info;
};

TEST_F(DebugTest, WritesLevelTagAndMessage)
{
    Debug::SetMinimumLevel(LogLevel::Info);
    GK_LOG_INFO("sphere radius {}", 2);

    const std::string output = m_stream.str();
    EXPECT_NE(output.find("[INFO]"), std::string::npos);
    EXPECT_NE(output.find("sphere radius 2"), std::string::npos);
    // Sem cores ANSI fora do console.
    EXPECT_EQ(output.find("\033["), std::string::npos);
}

TEST_F(DebugTest, MinimumLevelFiltersLessSevereMessages)
{
    Debug::SetMinimumLevel(LogLevel::Warn);

    GK_LOG_DEBUG("hidden debug");
    GK_LOG_INFO("hidden info");
    GK_LOG_SUCCESS("hidden success");
    GK_LOG_WARN("visible warn");
    GK_LOG_ERROR("visible error");

    const std::string output = m_stream.str();
    EXPECT_EQ(output.find("hidden"), std::string::npos);
    EXPECT_NE(output.find("visible warn"), std::string::npos);
    EXPECT_NE(output.find("visible error"), std::string::npos);
}

TEST_F(DebugTest, DebugLevelShowsEverything)
{
    Debug::SetMinimumLevel(LogLevel::Debug);
    GK_LOG_DEBUG("trace {}", "on");

    EXPECT_NE(m_stream.str().find("[DEBUG] trace on"), std::string::npos);
}

TEST_F(DebugTest, ThrowLogsAndRaises)
{
    Debug::SetMinimumLevel(LogLevel::Error);

    try {
        GK_LOG_THROW("bad shape '{}'", "cone");
        FAIL() << "GK_LOG_THROW returned";
    } catch (const std::runtime_error& e) {
        EXPECT_STREQ(e.what(), "bad shape 'cone'");
    }

    EXPECT_NE(m_stream.str().find("[ERROR] bad shape 'cone'"), std::string::npos);
}

TEST(Debug, UnwritableLogFileThrows)
{
    EXPECT_THROW(Debug::SetLogFile("/nonexistent-directory/geo_kernel.log"), std::runtime_error);
}
