#include <gtest/gtest.h>
#include <spdlog/spdlog.h>
#include "pathviz/core/demo_graph.hpp"
#include "pathviz/core/error.hpp"
#include "pathviz/core/logging.hpp"
#include "pathviz/core/shortest_paths.hpp"

using namespace pathviz::core;

TEST(Logging, InitInstallsNamedDefaultLogger) {
  init_logging();
  init_logging();
  ASSERT_NE(spdlog::get("pathviz"), nullptr);
  EXPECT_EQ(spdlog::default_logger()->name(), "pathviz");
}

TEST(Logging, SetLevelByName) {
  set_log_level("trace");
  EXPECT_EQ(spdlog::get_level(), spdlog::level::trace);
  // Queries log at trace/debug; running one exercises every log statement.
  auto g = make_demo_graph();
  (void)compute_dijkstra(g, "A", "C");
  (void)compute_bellman_ford(g, "A", "C");
  set_log_level("warn");
  EXPECT_EQ(spdlog::get_level(), spdlog::level::warn);
  set_log_level("off");
  EXPECT_EQ(spdlog::get_level(), spdlog::level::off);
  set_log_level(spdlog::level::info);
}

TEST(Logging, UnknownLevelThrows) {
  EXPECT_THROW(set_log_level("chatty"), InvalidArgument);
}
