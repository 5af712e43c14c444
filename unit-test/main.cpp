#include <glog/logging.h>
#include <filesystem>
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "test/fake_runtime.hpp"

class GlobalEnv : public ::testing::Environment {
 public:
  virtual void SetUp() {
    scorer::test::setup_test_environment();
  }
  virtual void TearDown() {
    std::error_code ec;
    std::filesystem::remove_all("/tmp/test/run", ec);
  }
};

int main(int argc, char *argv[]) {
  google::InitGoogleLogging(argv[0]);
  FLAGS_logtostderr = true;
  FLAGS_minloglevel = 1;  // WARNING

  AddGlobalTestEnvironment(new GlobalEnv);
  ::testing::InitGoogleMock(&argc, argv);
  return RUN_ALL_TESTS();
}
