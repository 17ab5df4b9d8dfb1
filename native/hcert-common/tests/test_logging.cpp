// Copyright (c) Microsoft Corporation.
// Licensed under the MIT License.

#include <catch2/catch_test_macros.hpp>

#include <hcert/common/logging.h>

TEST_CASE("Logger is a single named instance defaulting to warn") {
  auto a = hcert::common::Logger();
  auto b = hcert::common::Logger();
  REQUIRE(a == b);
  REQUIRE(a->name() == hcert::common::kLoggerName);
}

TEST_CASE("SetLogLevel accepts known level names only") {
  auto logger = hcert::common::Logger();
  const auto original = logger->level();

  REQUIRE(hcert::common::SetLogLevel("debug"));
  REQUIRE(logger->level() == spdlog::level::debug);

  REQUIRE(hcert::common::SetLogLevel("off"));
  REQUIRE(logger->level() == spdlog::level::off);

  REQUIRE_FALSE(hcert::common::SetLogLevel("loud"));
  REQUIRE(logger->level() == spdlog::level::off);

  logger->set_level(original);
}
