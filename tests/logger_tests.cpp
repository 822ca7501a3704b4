#include "gtest/gtest.h"
#include "utilities/json_utils.hpp"
#include "utilities/logger.h"
#include <cstdio> // For std::remove
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

// Helper function to read file contents
static std::string readFileContents(const std::string& path) {
    std::ifstream ifs(path);
    if (!ifs) {
        return "";
    }
    return std::string((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
}

static bool fileExists(const std::string& path) {
    std::ifstream f(path);
    return f.good();
}

// Test fixture for Logger tests
class LoggerTest : public ::testing::Test {
protected:
    std::vector<std::string> files_to_remove_;

    void TearDown() override {
        // Point the singleton at a scratch file so the test files are closed.
        Logger::init("dummy_cleanup.log", LogLevel::DEBUG, 1024, 1);
        for (const auto& file : files_to_remove_) {
            std::remove(file.c_str());
        }
        files_to_remove_.clear();
        std::remove("dummy_cleanup.log");
        std::remove("dummy_cleanup.log.1");
    }

    void addFileForCleanup(const std::string& filename) {
        files_to_remove_.push_back(filename);
        std::remove(filename.c_str());
    }

    // Closes the current log file so its contents can be read back.
    void flush() {
        Logger::init("dummy_flush.log", LogLevel::DEBUG, 1024, 0);
        addFileForCleanup("dummy_flush.log");
    }
};

TEST_F(LoggerTest, LogLevelFiltering) {
    const std::string testLogFile = "md_test_level_filter.log";
    addFileForCleanup(testLogFile);

    Logger::init(testLogFile, LogLevel::INFO);
    Logger& logger = Logger::getInstance();

    logger.log(LogLevel::TRACE, "This is a trace message."); // Should not appear
    logger.log(LogLevel::DEBUG, "This is a debug message."); // Should not appear
    logger.log(LogLevel::INFO, "This is an info message.");
    logger.log(LogLevel::WARN, "This is a warning message.");
    logger.log(LogLevel::ERROR, "This is an error message.");
    logger.log(LogLevel::FATAL, "This is a fatal message.");
    flush();

    std::string logContents = readFileContents(testLogFile);
    ASSERT_NE(logContents, "");

    EXPECT_EQ(logContents.find("This is a trace message."), std::string::npos);
    EXPECT_EQ(logContents.find("This is a debug message."), std::string::npos);
    EXPECT_NE(logContents.find("This is an info message."), std::string::npos);
    EXPECT_NE(logContents.find("This is a warning message."), std::string::npos);
    EXPECT_NE(logContents.find("This is an error message."), std::string::npos);
    EXPECT_NE(logContents.find("This is a fatal message."), std::string::npos);
}

TEST_F(LoggerTest, SetLogLevelAtRuntime) {
    const std::string testLogFile = "md_test_set_level.log";
    addFileForCleanup(testLogFile);

    Logger::init(testLogFile, LogLevel::ERROR);
    Logger::getInstance().log(LogLevel::WARN, "suppressed warning");
    Logger::getInstance().setLogLevel(LogLevel::DEBUG);
    EXPECT_EQ(Logger::getInstance().getLogLevel(), LogLevel::DEBUG);
    Logger::getInstance().log(LogLevel::DEBUG, "visible debug");
    flush();

    std::string logContents = readFileContents(testLogFile);
    EXPECT_EQ(logContents.find("suppressed warning"), std::string::npos);
    EXPECT_NE(logContents.find("visible debug"), std::string::npos);
}

TEST_F(LoggerTest, JsonOutputFormat) {
    const std::string testLogFile = "md_test_json_format.log";
    addFileForCleanup(testLogFile);

    Logger::init(testLogFile, LogLevel::DEBUG);
    Logger::getInstance().log(LogLevel::INFO, "Special chars \" \\ / \b \f \n \r \t");
    flush();

    std::string logContents = readFileContents(testLogFile);
    ASSERT_NE(logContents, "");
    EXPECT_NE(logContents.find("\"level\":\"INFO\""), std::string::npos);
    EXPECT_NE(logContents.find("\"message\":\"Special chars \\\" \\\\ / \\b \\f \\n \\r \\t\""),
              std::string::npos);
    EXPECT_NE(logContents.find("\"timestamp\":\""), std::string::npos);

    // Each record is one line holding one JSON object.
    std::istringstream lines(logContents);
    std::string line;
    ASSERT_TRUE(std::getline(lines, line));
    Json::Value record = merkledrop::utils::parse_json(line, "log record");
    EXPECT_EQ(record["level"].asString(), "INFO");
    EXPECT_EQ(record["message"].asString(), "Special chars \" \\ / \b \f \n \r \t");
    EXPECT_FALSE(std::getline(lines, line));
}

TEST_F(LoggerTest, LogRotation) {
    const std::string baseLogFile = "md_test_rotation.log";
    const int maxBackupFiles = 2;
    const long long maxFileSize = 1024; // 1KB

    addFileForCleanup(baseLogFile);
    for (int i = 1; i <= maxBackupFiles + 1; ++i) {
        addFileForCleanup(baseLogFile + "." + std::to_string(i));
    }

    Logger::init(baseLogFile, LogLevel::DEBUG, maxFileSize, maxBackupFiles);
    Logger& logger = Logger::getInstance();

    std::string singleMessage = "Rotation test message. This message is intended to be somewhat long. "; // ~70 bytes
    for (int k = 0; k < 4; ++k) singleMessage += singleMessage; // ~1100 bytes

    // Every record exceeds maxFileSize, so each write after the first rotates.
    for (int i = 0; i < 6; ++i) {
        logger.log(LogLevel::INFO, singleMessage + " #" + std::to_string(i));
    }
    flush();

    EXPECT_TRUE(fileExists(baseLogFile)) << baseLogFile << " should exist.";
    EXPECT_TRUE(fileExists(baseLogFile + ".1")) << baseLogFile << ".1 should exist.";
    EXPECT_TRUE(fileExists(baseLogFile + ".2")) << baseLogFile << ".2 should exist.";
    EXPECT_FALSE(fileExists(baseLogFile + ".3")) << baseLogFile << ".3 should NOT exist.";

    // Newest record in the live file, the one before it in .1
    EXPECT_NE(readFileContents(baseLogFile).find(" #5"), std::string::npos);
    EXPECT_NE(readFileContents(baseLogFile + ".1").find(" #4"), std::string::npos);
}

TEST_F(LoggerTest, LogRotationNoBackups) {
    const std::string baseLogFile = "md_test_no_backup_rotation.log";
    const int maxBackupFiles = 0;
    const long long maxFileSize = 512;

    addFileForCleanup(baseLogFile);
    addFileForCleanup(baseLogFile + ".1");

    Logger::init(baseLogFile, LogLevel::DEBUG, maxFileSize, maxBackupFiles);
    Logger& logger = Logger::getInstance();

    std::string singleMessage = "No backup rotation test. This message is intended to be somewhat long. ";
    for (int k = 0; k < 2; ++k) singleMessage += singleMessage; // ~280 bytes

    for (int i = 0; i < 5; ++i) {
        logger.log(LogLevel::INFO, singleMessage + " #" + std::to_string(i));
    }
    flush();

    EXPECT_TRUE(fileExists(baseLogFile));
    EXPECT_FALSE(fileExists(baseLogFile + ".1")) << baseLogFile << ".1 should NOT exist.";
    EXPECT_EQ(readFileContents(baseLogFile).find(" #0"), std::string::npos);
}

// Re-initialising must switch both the target file and the level.
TEST_F(LoggerTest, ReinitializationTest) {
    const std::string logFile1 = "md_test_reinit1.log";
    const std::string logFile2 = "md_test_reinit2.log";
    addFileForCleanup(logFile1);
    addFileForCleanup(logFile2);

    Logger::init(logFile1, LogLevel::INFO);
    Logger::getInstance().log(LogLevel::INFO, "Message for logfile1");

    Logger::init(logFile2, LogLevel::WARN);
    Logger::getInstance().log(LogLevel::WARN, "Message for logfile2");
    Logger::getInstance().log(LogLevel::INFO, "Info message for logfile2"); // Below WARN
    flush();

    std::string contents1 = readFileContents(logFile1);
    EXPECT_NE(contents1.find("Message for logfile1"), std::string::npos);
    EXPECT_EQ(contents1.find("Message for logfile2"), std::string::npos);

    std::string contents2 = readFileContents(logFile2);
    EXPECT_NE(contents2.find("Message for logfile2"), std::string::npos);
    EXPECT_EQ(contents2.find("Info message for logfile2"), std::string::npos);
    EXPECT_EQ(contents2.find("Message for logfile1"), std::string::npos);
}

TEST_F(LoggerTest, TraceFormatsPrintfStyle) {
    const std::string testLogFile = "md_test_trace.log";
    addFileForCleanup(testLogFile);

    Logger::init(testLogFile, LogLevel::TRACE);
    Logger::trace("proof for leaf %d has %zu entries", 4, static_cast<size_t>(1));
    flush();

    std::string logContents = readFileContents(testLogFile);
    EXPECT_NE(logContents.find("\"level\":\"TRACE\""), std::string::npos);
    EXPECT_NE(logContents.find("proof for leaf 4 has 1 entries"), std::string::npos);
}
