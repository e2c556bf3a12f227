#include "surfbridge/Logging.hpp"

#include <gtest/gtest.h>

int main(int argc, char ** argv)
{
  surfbridge::InitLogging();
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
