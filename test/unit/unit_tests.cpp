#include <gtest/gtest.h>
#include <control.hpp>

int main(int argc, char** argv) {
  stvk::initialize();
  ::testing::InitGoogleTest(&argc, argv);
  ::testing::FLAGS_gtest_death_test_style = "threadsafe";
  int const result = RUN_ALL_TESTS();
  stvk::finalize();
  return result;
}
