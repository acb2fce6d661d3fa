#include "analysis/analytics_commands.hpp"
#include "analysis/log_store.hpp"
#include "haproxy_line_builder.hpp"
#include "io/log_readers/memory_log_reader.hpp"
#include "utils/utils.hpp"
#include <gtest/gtest.h>

#include <algorithm>
#include <memory>
#include <string>
#include <vector>

namespace {

constexpr uint64_t kBaseMs = 1386593986000ULL; // 09/Dec/2013:12:59:46.000

std::vector<LogEntry> entries_with_queues(const std::vector<int> &depths) {
  std::vector<LogEntry> entries;
  for (size_t i = 0; i < depths.size(); ++i) {
    LogEntry entry;
    entry.valid = true;
    entry.original_line_number = i + 1;
    entry.accept_date_ms = kBaseMs + i * 1000;
    entry.queue_backend = depths[i];
    entries.push_back(entry);
  }
  return entries;
}

std::string second(int s) {
  return "09/Dec/2013:13:00:" + std::string(s < 10 ? "0" : "") +
         std::to_string(s) + ".000";
}

} // namespace

class AnalyticsCommandsTest : public ::testing::Test {
protected:
  void ingest(std::vector<std::string> lines) {
    store_ = std::make_unique<LogStore>(
        std::make_shared<MemoryLogReader>(std::move(lines)));
    store_->ingest();
  }

  std::unique_ptr<LogStore> store_;
};

// --- queue_peaks ---
TEST(QueuePeakDetectionTest, EmitsEveryRunAboveThreshold) {
  auto entries = entries_with_queues({0, 2, 3, 0, 0, 5, 0});
  auto peaks = AnalyticsCommands::detect_queue_peaks(entries, 1);

  ASSERT_EQ(peaks.size(), 2u);
  EXPECT_EQ(peaks[0].peak, 3);
  EXPECT_EQ(peaks[0].span, 2u);
  EXPECT_EQ(peaks[0].first_ms, entries[1].accept_date_ms);
  EXPECT_EQ(peaks[0].last_ms, entries[3].accept_date_ms);

  EXPECT_EQ(peaks[1].peak, 5);
  EXPECT_EQ(peaks[1].span, 1u);
  EXPECT_EQ(peaks[1].first_ms, entries[5].accept_date_ms);
  EXPECT_EQ(peaks[1].last_ms, entries[6].accept_date_ms);
}

TEST(QueuePeakDetectionTest, RunNotAboveThresholdIsDiscarded) {
  EXPECT_TRUE(
      AnalyticsCommands::detect_queue_peaks(entries_with_queues({0, 1, 0}), 1)
          .empty());
  EXPECT_TRUE(AnalyticsCommands::detect_queue_peaks(
                  entries_with_queues({1, 1, 1, 1}), 1)
                  .empty());
  EXPECT_TRUE(AnalyticsCommands::detect_queue_peaks({}, 1).empty());
}

TEST(QueuePeakDetectionTest, RunBelowThresholdCarriesIntoNextRun) {
  // The [1, 1] run is not reported, but its span and first queued time are
  // kept until a run above the threshold closes
  auto entries = entries_with_queues({1, 1, 0, 0, 2, 0});
  auto peaks = AnalyticsCommands::detect_queue_peaks(entries, 1);

  ASSERT_EQ(peaks.size(), 1u);
  EXPECT_EQ(peaks[0].peak, 2);
  EXPECT_EQ(peaks[0].span, 3u);
  EXPECT_EQ(peaks[0].first_ms, entries[0].accept_date_ms);
  EXPECT_EQ(peaks[0].last_ms, entries[5].accept_date_ms);
}

TEST(QueuePeakDetectionTest, ReportedRunStartsTheNextOneFresh) {
  auto entries = entries_with_queues({3, 0, 1, 0, 2, 0});
  auto peaks = AnalyticsCommands::detect_queue_peaks(entries, 1);

  ASSERT_EQ(peaks.size(), 2u);
  EXPECT_EQ(peaks[0].peak, 3);
  EXPECT_EQ(peaks[0].span, 1u);
  EXPECT_EQ(peaks[0].first_ms, entries[0].accept_date_ms);
  EXPECT_EQ(peaks[0].last_ms, entries[1].accept_date_ms);

  EXPECT_EQ(peaks[1].peak, 2);
  EXPECT_EQ(peaks[1].span, 2u);
  EXPECT_EQ(peaks[1].first_ms, entries[2].accept_date_ms);
  EXPECT_EQ(peaks[1].last_ms, entries[5].accept_date_ms);
}

TEST(QueuePeakDetectionTest, RunOpenAtEndClosesOnLastEntry) {
  auto entries = entries_with_queues({0, 0, 2, 4, 3});
  auto peaks = AnalyticsCommands::detect_queue_peaks(entries, 1);

  ASSERT_EQ(peaks.size(), 1u);
  EXPECT_EQ(peaks[0].peak, 4);
  EXPECT_EQ(peaks[0].span, 3u);
  EXPECT_EQ(peaks[0].first_ms, entries[2].accept_date_ms);
  EXPECT_EQ(peaks[0].last_ms, entries[4].accept_date_ms);
}

TEST(QueuePeakDetectionTest, ThresholdIsConfigurable) {
  auto entries = entries_with_queues({1, 0, 3, 0});
  EXPECT_EQ(AnalyticsCommands::detect_queue_peaks(entries, 0).size(), 2u);
  EXPECT_TRUE(AnalyticsCommands::detect_queue_peaks(entries, 3).empty());
}

TEST_F(AnalyticsCommandsTest, QueuePeaksFollowAcceptOrderNotFileOrder) {
  // File order is completion order; the run only exists once resequenced
  ingest({HaproxyLine().at(second(3)).queue(0).str(),
          HaproxyLine().at(second(1)).queue(2).str(),
          HaproxyLine().at(second(0)).queue(0).str(),
          HaproxyLine().at(second(2)).queue(4).str()});

  auto peaks = AnalyticsCommands(*store_).queue_peaks();
  ASSERT_EQ(peaks.size(), 1u);
  EXPECT_EQ(peaks[0].peak, 4);
  EXPECT_EQ(peaks[0].span, 2u);
  EXPECT_EQ(peaks[0].first_ms, *Utils::convert_accept_date_to_ms(second(1)));
  EXPECT_EQ(peaks[0].last_ms, *Utils::convert_accept_date_to_ms(second(3)));
}

// --- top_ips ---
TEST(TopIpSelectionTest, KeepsTheTenMostRepeated) {
  StringHistogram histogram = {{"A", 50}, {"B", 45}, {"C", 40}, {"D", 35},
                               {"E", 30}, {"F", 25}, {"G", 20}, {"H", 15},
                               {"I", 10}, {"J", 8},  {"K", 5}};
  auto top = AnalyticsCommands::select_top(histogram, 10);

  ASSERT_EQ(top.size(), 10u);
  EXPECT_EQ(top.front().ip, "A");
  EXPECT_EQ(top.front().repetitions, 50u);
  EXPECT_EQ(top.back().ip, "J");
  EXPECT_EQ(top.back().repetitions, 8u);
  for (size_t i = 1; i < top.size(); ++i)
    EXPECT_GE(top[i - 1].repetitions, top[i].repetitions);
  EXPECT_TRUE(std::none_of(top.begin(), top.end(), [](const TopIpEntry &e) {
    return e.ip == "K";
  }));
}

TEST(TopIpSelectionTest, FewerKeysThanCount) {
  auto top = AnalyticsCommands::select_top({{"10.0.0.1", 3}, {"10.0.0.2", 7}},
                                           10);
  ASSERT_EQ(top.size(), 2u);
  EXPECT_EQ(top[0].ip, "10.0.0.2");
  EXPECT_EQ(top[1].ip, "10.0.0.1");

  EXPECT_TRUE(AnalyticsCommands::select_top({}, 10).empty());
  EXPECT_TRUE(AnalyticsCommands::select_top({{"10.0.0.1", 3}}, 0).empty());
}

TEST(TopIpSelectionTest, TiesOnlyFixTheReturnedCounts) {
  auto top = AnalyticsCommands::select_top(
      {{"a", 5}, {"b", 5}, {"c", 5}, {"d", 9}, {"e", 1}}, 3);

  ASSERT_EQ(top.size(), 3u);
  EXPECT_EQ(top[0].ip, "d");
  EXPECT_EQ(top[0].repetitions, 9u);
  EXPECT_EQ(top[1].repetitions, 5u);
  EXPECT_EQ(top[2].repetitions, 5u);
}

TEST_F(AnalyticsCommandsTest, TopIpsUsesConfiguredCount) {
  ingest({HaproxyLine().captured("{1.1.1.1}").str(),
          HaproxyLine().captured("{2.2.2.2}").str(),
          HaproxyLine().captured("{2.2.2.2}").str(),
          HaproxyLine().captured("{3.3.3.3}").str(),
          HaproxyLine().captured("{3.3.3.3}").str(),
          HaproxyLine().captured("{3.3.3.3}").str()});

  Config::AnalyticsConfig config;
  config.top_ips_count = 2;
  auto top = AnalyticsCommands(*store_, config).top_ips();

  ASSERT_EQ(top.size(), 2u);
  EXPECT_EQ(top[0].ip, "3.3.3.3");
  EXPECT_EQ(top[0].repetitions, 3u);
  EXPECT_EQ(top[1].ip, "2.2.2.2");
  EXPECT_EQ(top[1].repetitions, 2u);
}

// --- slow_requests ---
TEST_F(AnalyticsCommandsTest, SlowRequestsStrictlyAboveThreshold) {
  ingest({HaproxyLine().at(second(5)).response_time(2000).str(),
          HaproxyLine().at(second(1)).response_time(1000).str(),
          HaproxyLine().at(second(2)).response_time(1001).str(),
          HaproxyLine().at(second(3)).response_time(-1).str()});

  auto slow = AnalyticsCommands(*store_).slow_requests();
  EXPECT_EQ(slow, (std::vector<int64_t>{1001, 2000}));

  Config::AnalyticsConfig strict;
  strict.slow_request_threshold_ms = 1500;
  EXPECT_EQ(AnalyticsCommands(*store_, strict).slow_requests(),
            (std::vector<int64_t>{2000}));
}

// --- histograms ---
TEST_F(AnalyticsCommandsTest, CountersAndHistograms) {
  HaproxyLine post;
  post.request = "POST /login HTTP/1.1";
  post.server = "instance2";
  post.status = 302;

  HaproxyLine missing;
  missing.request = "GET /nope HTTP/1.1";
  missing.status = 404;

  ingest({HaproxyLine().str(), post.str(), missing.str(), "garbage",
          HaproxyLine().str()});
  AnalyticsCommands commands(*store_);

  EXPECT_EQ(commands.counter(), 4u);
  EXPECT_EQ(commands.counter_invalid(), 1u);

  EXPECT_EQ(commands.http_methods(),
            (StringHistogram{{"GET", 3}, {"POST", 1}}));
  EXPECT_EQ(commands.status_codes_counter(),
            (StatusCodeHistogram{{200, 2}, {302, 1}, {404, 1}}));
  EXPECT_EQ(commands.request_path_counter(),
            (StringHistogram{
                {"/path/to/image", 2}, {"/login", 1}, {"/nope", 1}}));
  EXPECT_EQ(commands.server_load(),
            (StringHistogram{{"instance8", 3}, {"instance2", 1}}));
}

TEST_F(AnalyticsCommandsTest, IpCounterStripsBracesAndSkipsMissingHeaders) {
  ingest({HaproxyLine().captured("{77.24.148.74}").str(),
          HaproxyLine().captured("{77.24.148.74}").str(),
          HaproxyLine().captured("").str(),
          HaproxyLine().captured("{10.1.1.1} {text/html}").str()});

  EXPECT_EQ(AnalyticsCommands(*store_).ip_counter(),
            (StringHistogram{{"77.24.148.74", 2}, {"10.1.1.1", 1}}));
}

TEST_F(AnalyticsCommandsTest, ResultsAreEmptyBeforeIngestion) {
  LogStore store(std::make_shared<MemoryLogReader>(
      std::vector<std::string>{HaproxyLine().str()}));
  AnalyticsCommands commands(store);

  EXPECT_EQ(commands.counter(), 0u);
  EXPECT_EQ(commands.counter_invalid(), 0u);
  EXPECT_TRUE(commands.http_methods().empty());
  EXPECT_TRUE(commands.ip_counter().empty());
  EXPECT_TRUE(commands.top_ips().empty());
  EXPECT_TRUE(commands.queue_peaks().empty());
  EXPECT_TRUE(commands.slow_requests().empty());
}

TEST_F(AnalyticsCommandsTest, RepeatedQueriesGiveIdenticalResults) {
  ingest({HaproxyLine().at(second(1)).queue(3).captured("{1.1.1.1}").str(),
          HaproxyLine().at(second(2)).queue(0).response_time(5000).str(),
          HaproxyLine().at(second(0)).queue(0).captured("{2.2.2.2}").str(),
          "broken"});
  AnalyticsCommands commands(*store_);

  EXPECT_EQ(commands.counter(), commands.counter());
  EXPECT_EQ(commands.counter_invalid(), commands.counter_invalid());
  EXPECT_EQ(commands.http_methods(), commands.http_methods());
  EXPECT_EQ(commands.status_codes_counter(), commands.status_codes_counter());
  EXPECT_EQ(commands.request_path_counter(), commands.request_path_counter());
  EXPECT_EQ(commands.server_load(), commands.server_load());
  EXPECT_EQ(commands.ip_counter(), commands.ip_counter());
  EXPECT_EQ(commands.slow_requests(), commands.slow_requests());

  auto top_first = commands.top_ips();
  auto top_second = commands.top_ips();
  ASSERT_EQ(top_first.size(), top_second.size());
  for (size_t i = 0; i < top_first.size(); ++i) {
    EXPECT_EQ(top_first[i].ip, top_second[i].ip);
    EXPECT_EQ(top_first[i].repetitions, top_second[i].repetitions);
  }

  auto peaks_first = commands.queue_peaks();
  auto peaks_second = commands.queue_peaks();
  ASSERT_EQ(peaks_first.size(), 1u);
  ASSERT_EQ(peaks_second.size(), 1u);
  EXPECT_EQ(peaks_first[0].peak, peaks_second[0].peak);
  EXPECT_EQ(peaks_first[0].span, peaks_second[0].span);
  EXPECT_EQ(peaks_first[0].first_ms, peaks_second[0].first_ms);
  EXPECT_EQ(peaks_first[0].last_ms, peaks_second[0].last_ms);
}
