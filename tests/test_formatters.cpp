#include "utils/json_formatter.hpp"
#include "utils/text_formatter.hpp"
#include <gtest/gtest.h>

#include <nlohmann/json.hpp>

#include <string>
#include <utility>
#include <vector>

TEST(JsonFormatterTest, ConvertsEveryResultShape) {
  using JsonFormatter::command_result_to_json;

  EXPECT_EQ(command_result_to_json(CommandResult{uint64_t{42}}),
            nlohmann::json(42));

  auto methods = command_result_to_json(
      CommandResult{StringHistogram{{"GET", 3}, {"POST", 1}}});
  EXPECT_EQ(methods, nlohmann::json({{"GET", 3}, {"POST", 1}}));

  auto codes = command_result_to_json(
      CommandResult{StatusCodeHistogram{{200, 5}, {404, 2}}});
  ASSERT_TRUE(codes.is_object());
  EXPECT_EQ(codes["200"], 5);
  EXPECT_EQ(codes["404"], 2);

  auto slow =
      command_result_to_json(CommandResult{std::vector<int64_t>{1001, 2500}});
  EXPECT_EQ(slow, nlohmann::json::array({1001, 2500}));

  auto top = command_result_to_json(
      CommandResult{std::vector<TopIpEntry>{{"1.1.1.1", 9}, {"2.2.2.2", 4}}});
  ASSERT_TRUE(top.is_array());
  ASSERT_EQ(top.size(), 2u);
  EXPECT_EQ(top[0]["ip"], "1.1.1.1");
  EXPECT_EQ(top[0]["repetitions"], 9);
  EXPECT_EQ(top[1]["ip"], "2.2.2.2");
}

TEST(JsonFormatterTest, QueuePeaksUseAcceptDateFormat) {
  auto peaks = JsonFormatter::command_result_to_json(CommandResult{
      std::vector<QueuePeak>{{5, 3, 1386593986633ULL, 1386593990000ULL}}});

  ASSERT_EQ(peaks.size(), 1u);
  EXPECT_EQ(peaks[0]["peak"], 5);
  EXPECT_EQ(peaks[0]["span"], 3);
  EXPECT_EQ(peaks[0]["first"], "09/Dec/2013:12:59:46.633");
  EXPECT_EQ(peaks[0]["last"], "09/Dec/2013:12:59:50.000");
}

TEST(JsonFormatterTest, KeepsCommandOrder) {
  std::vector<std::pair<std::string, CommandResult>> results = {
      {"top_ips", std::vector<TopIpEntry>{}},
      {"counter", uint64_t{7}},
      {"counter_invalid", uint64_t{1}}};

  std::string text = JsonFormatter::format_results_to_json(results, -1);
  EXPECT_EQ(text, R"({"top_ips":[],"counter":7,"counter_invalid":1})");

  auto parsed = nlohmann::json::parse(
      JsonFormatter::format_results_to_json(results));
  EXPECT_EQ(parsed["counter"], 7);
}

TEST(TextFormatterTest, CountIsPrintedUnderTheName) {
  EXPECT_EQ(TextFormatter::format_command_result("counter", uint64_t{12}),
            "counter\n=======\n12\n");
}

TEST(TextFormatterTest, HistogramIsSortedByCountThenKey) {
  std::string text = TextFormatter::format_command_result(
      "server_load",
      StringHistogram{{"web02", 4}, {"web01", 4}, {"web03", 9}});
  EXPECT_EQ(text, "server_load\n===========\n"
                  "- web03: 9\n"
                  "- web01: 4\n"
                  "- web02: 4\n");

  std::string codes = TextFormatter::format_command_result(
      "status_codes_counter", StatusCodeHistogram{{404, 1}, {200, 3}});
  EXPECT_NE(codes.find("- 200: 3\n- 404: 1\n"), std::string::npos);
}

TEST(TextFormatterTest, ListsAndPeaks) {
  EXPECT_EQ(TextFormatter::format_command_result(
                "slow_requests", std::vector<int64_t>{1200, 3000}),
            "slow_requests\n=============\n- 1200 ms\n- 3000 ms\n");

  EXPECT_EQ(TextFormatter::format_command_result(
                "top_ips", std::vector<TopIpEntry>{{"10.0.0.1", 3}}),
            "top_ips\n=======\n- 10.0.0.1: 3\n");

  std::string peaks = TextFormatter::format_command_result(
      "queue_peaks",
      std::vector<QueuePeak>{{4, 2, 1386593986633ULL, 1386593987000ULL}});
  EXPECT_EQ(peaks, "queue_peaks\n===========\n"
                   "- peak: 4, span: 2, first: 09/Dec/2013:12:59:46.633, "
                   "last: 09/Dec/2013:12:59:47.000\n");
}
