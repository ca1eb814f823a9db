/// Test entry point. Loggers are initialized quietly so key generation and
/// rotation messages do not flood test output, and spdlog is shut down
/// explicitly before _exit() to dodge static destruction order problems in
/// the spdlog shared library.

#include <gtest/gtest.h>
#include <spdlog/spdlog.h>
#include <unistd.h>

#include "common/Logger.hpp"

int main(int argc, char** argv) {
  ::testing::InitGoogleTest(&argc, argv);
  jwks::common::Logger::init("warn");

  const int iResult = RUN_ALL_TESTS();

  spdlog::drop_all();
  spdlog::shutdown();
  _exit(iResult);
}
