/**
 * @file test_timer.cpp
 * @brief Unit tests for Platform/Timer.h
 */

#include <PathoMorph/Platform/Timer.h>
#include <gtest/gtest.h>

#include <chrono>
#include <thread>

using namespace Patho::Morph::Platform;

TEST(TimerTest, RunsFromConstruction) {
    Timer timer;
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
    EXPECT_GE(timer.ElapsedMs(), 5.0);
}

TEST(TimerTest, LapRestartsMeasurement) {
    Timer timer;
    std::this_thread::sleep_for(std::chrono::milliseconds(20));

    double first = timer.Lap();
    EXPECT_GE(first, 15.0);
    EXPECT_LT(timer.ElapsedMs(), first);
}

TEST(TimerTest, LapsSumToTotal) {
    Timer total;
    Timer stage;
    double sum = 0.0;
    for (int i = 0; i < 3; ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
        sum += stage.Lap();
    }
    EXPECT_LE(sum, total.ElapsedMs() + 1.0);
    EXPECT_GE(sum, 4.0);
}
