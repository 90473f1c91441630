#include <gtest/gtest.h>
#include <nrx/llm/download_monitor.hpp>

#include "fakes.hpp"

#include <thread>

using namespace nrx;
using namespace nrx::llm;
using namespace std::chrono_literals;

// ============================================================================
// Progress Arithmetic
// ============================================================================

TEST(DownloadProgressTest, PercentageAndEta) {
    auto p = DownloadMonitor::compute(50, 100, 1s);
    EXPECT_EQ(p.bytes_downloaded, 50u);
    EXPECT_EQ(p.total_bytes, 100u);
    EXPECT_EQ(p.percentage, 50);
    ASSERT_TRUE(p.estimated_seconds_remaining.has_value());
    EXPECT_EQ(*p.estimated_seconds_remaining, 1);
}

TEST(DownloadProgressTest, CappedBelowHundred) {
    EXPECT_EQ(DownloadMonitor::compute(100, 100, 1s).percentage, 99);
    EXPECT_EQ(DownloadMonitor::compute(150, 100, 1s).percentage, 99);
    EXPECT_EQ(DownloadMonitor::compute(150, 100, 1s).estimated_seconds_remaining.value_or(-1), 0);
}

TEST(DownloadProgressTest, NoEstimateWithoutThroughput) {
    auto p = DownloadMonitor::compute(0, 100, 2s);
    EXPECT_EQ(p.percentage, 0);
    EXPECT_FALSE(p.estimated_seconds_remaining.has_value());
}

TEST(DownloadProgressTest, UnknownTotal) {
    auto p = DownloadMonitor::compute(10, 0, 1s);
    EXPECT_EQ(p.percentage, 0);
}

// ============================================================================
// Polling Thread
// ============================================================================

class DownloadMonitorTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir_ = fs::temp_directory_path() / "nrx_monitor_test";
        fs::remove_all(test_dir_);
        fs::create_directories(test_dir_);
        file_ = test_dir_ / "model.gguf";
    }

    void TearDown() override {
        fs::remove_all(test_dir_);
    }

    // Waits until `pred` holds or two seconds pass
    template <typename Pred>
    static bool eventually(Pred pred) {
        auto deadline = std::chrono::steady_clock::now() + 2s;
        while (std::chrono::steady_clock::now() < deadline) {
            if (pred()) return true;
            std::this_thread::sleep_for(5ms);
        }
        return pred();
    }

    fs::path test_dir_;
    fs::path file_;
    std::atomic<bool> cancelled_{false};
    std::mutex mutex_;
    std::vector<DownloadProgress> reports_;

    DownloadProgressCallback recorder() {
        return [this](const DownloadProgress& p) {
            std::lock_guard<std::mutex> lock(mutex_);
            reports_.push_back(p);
        };
    }

    size_t report_count() {
        std::lock_guard<std::mutex> lock(mutex_);
        return reports_.size();
    }
};

TEST_F(DownloadMonitorTest, ReportsFileGrowth) {
    test::FakeDownloader::write_file(file_, 25);

    DownloadMonitor monitor(file_, 100, 10ms, cancelled_, recorder());
    ASSERT_TRUE(eventually([this]() { return report_count() > 0; }));
    monitor.stop();

    std::lock_guard<std::mutex> lock(mutex_);
    EXPECT_EQ(reports_.front().bytes_downloaded, 25u);
    EXPECT_EQ(reports_.front().percentage, 25);
}

TEST_F(DownloadMonitorTest, NoReportsAfterStop) {
    test::FakeDownloader::write_file(file_, 25);

    DownloadMonitor monitor(file_, 100, 10ms, cancelled_, recorder());
    ASSERT_TRUE(eventually([this]() { return report_count() > 0; }));
    monitor.stop();

    size_t after_stop = report_count();
    std::this_thread::sleep_for(50ms);
    EXPECT_EQ(report_count(), after_stop);
}

TEST_F(DownloadMonitorTest, SilentWhileFileMissing) {
    {
        DownloadMonitor monitor(file_, 100, 5ms, cancelled_, recorder());
        std::this_thread::sleep_for(50ms);
    }
    EXPECT_EQ(report_count(), 0u);
}

TEST_F(DownloadMonitorTest, SilentWhenCancelled) {
    test::FakeDownloader::write_file(file_, 25);
    cancelled_ = true;
    {
        DownloadMonitor monitor(file_, 100, 5ms, cancelled_, recorder());
        std::this_thread::sleep_for(50ms);
    }
    EXPECT_EQ(report_count(), 0u);
}

TEST_F(DownloadMonitorTest, StopWithoutCallbackReturnsPromptly) {
    auto start = std::chrono::steady_clock::now();
    {
        DownloadMonitor monitor(file_, 100, 10s, cancelled_, nullptr);
    }
    EXPECT_LT(std::chrono::steady_clock::now() - start, 1s);
}
