#include <vigil/core/logging.hpp>
#include <gtest/gtest.h>

namespace vc = vigil::core;

TEST(Logging, SameComponentReturnsSameLogger) {
  auto a = vc::get_logger("logging_test");
  auto b = vc::get_logger("logging_test");
  EXPECT_EQ(a.get(), b.get());
  EXPECT_EQ(a->name(), "vigil.logging_test");
}

TEST(Logging, LevelReachesLoggersHeldBeforeTheChange) {
  auto held = vc::get_logger("logging_test_held");
  vc::set_log_level("error");
  EXPECT_EQ(held->level(), spdlog::level::err);
  vc::set_log_level("debug");
  EXPECT_EQ(held->level(), spdlog::level::debug);
  vc::set_log_level("info");
}

TEST(Logging, UnknownLevelMapsToInfo) {
  auto held = vc::get_logger("logging_test_unknown");
  vc::set_log_level("chatty");
  EXPECT_EQ(held->level(), spdlog::level::info);
}
