/**
 * @file test_platform.cpp
 * @brief Unit tests for taskq platform helpers
 *
 * Tests coverage for:
 * - OS family detection
 * - Thread IDs used in log records
 * - Environment lookup used by TASKQ_LOG_LEVEL
 */

#include <taskq/common/platform.hpp>

#include <cstdlib>
#include <string>
#include <thread>

#include <gtest/gtest.h>

using namespace taskq::common::platform;

// ============================================================================
// OS Detection Tests
// ============================================================================

TEST(OsDetectionTest, AtMostOneFamily) {
#if defined(TASKQ_OS_WINDOWS)
    #if defined(TASKQ_OS_POSIX)
    FAIL() << "Windows builds must not be flagged POSIX";
    #endif
#endif
#if defined(TASKQ_OS_LINUX) || defined(TASKQ_OS_MACOS)
    #if !defined(TASKQ_OS_POSIX)
    FAIL() << "Linux and macOS are POSIX";
    #endif
#endif
    SUCCEED();
}

#if defined(__linux__)
TEST(OsDetectionTest, LinuxIsDetected) {
    #if !defined(TASKQ_OS_LINUX)
    FAIL() << "TASKQ_OS_LINUX not defined on Linux";
    #endif
    SUCCEED();
}
#endif

// ============================================================================
// Thread ID Tests
// ============================================================================

class ThreadIdTest : public ::testing::Test {};

TEST_F(ThreadIdTest, StableWithinThread) {
    EXPECT_EQ(get_thread_id(), get_thread_id());
}

TEST_F(ThreadIdTest, DifferentForDifferentThreads) {
    uint64_t main_tid  = get_thread_id();
    uint64_t other_tid = main_tid;

    std::thread t([&other_tid]() { other_tid = get_thread_id(); });
    t.join();

    EXPECT_NE(main_tid, other_tid);
}

// ============================================================================
// Environment Tests
// ============================================================================

class EnvVarTest : public ::testing::Test {};

TEST_F(EnvVarTest, UnsetVariableIsEmpty) {
    EXPECT_TRUE(get_env("TASKQ_NONEXISTENT_VAR_12345").empty());
}

#if defined(TASKQ_OS_POSIX)
TEST_F(EnvVarTest, ReadsValue) {
    ::setenv("TASKQ_TEST_VAR", "value with spaces=and/special:chars", 1);
    EXPECT_EQ(get_env("TASKQ_TEST_VAR"), "value with spaces=and/special:chars");

    ::unsetenv("TASKQ_TEST_VAR");
    EXPECT_TRUE(get_env("TASKQ_TEST_VAR").empty());
}
#endif

// ============================================================================
// Terminal Detection Tests
// ============================================================================

TEST(TerminalTest, InvalidDescriptorIsNotTerminal) {
    EXPECT_FALSE(is_terminal(-1));
}
