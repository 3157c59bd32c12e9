#include <gtest/gtest.h>
#include <trainlog/util/util.hpp>

int main(int argc, char **argv) {
  testing::InitGoogleTest(&argc, argv);
  trainlog::Log::Context log_context(argc, argv);
  return RUN_ALL_TESTS();
}
