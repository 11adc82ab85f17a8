// =============================================================================
// service_config_test.cpp
// =============================================================================
// Tests for parseServiceConfig() / loadServiceConfig().
// =============================================================================

#include "qless/config/service_config.hpp"

#include <gtest/gtest.h>

#include <cstdio>
#include <fstream>
#include <stdexcept>
#include <string>

namespace {

// Writes contents to a file under the system temp dir; removed on scope exit.
class TempFile {
 public:
  explicit TempFile(const std::string& contents)
      : path_(::testing::TempDir() + "qless_config_" +
              std::to_string(counter_++) + ".json") {
    std::ofstream out(path_);
    out << contents;
  }
  ~TempFile() { std::remove(path_.c_str()); }

  const std::string& path() const { return path_; }

 private:
  static inline int counter_ = 0;
  std::string path_;
};

}  // namespace

TEST(ServiceConfigTest, EmptyObjectKeepsDefaults) {
  const auto config = qless::parseServiceConfig(nlohmann::json::object());

  EXPECT_EQ(config.command_endpoint, "tcp://127.0.0.1:5556");
  EXPECT_EQ(config.publish_endpoint, "tcp://127.0.0.1:5557");
  EXPECT_EQ(config.publish_queue_capacity, 4096u);
  EXPECT_EQ(config.max_transition_retries, 3);
  EXPECT_EQ(config.history_limit, 200u);
  EXPECT_EQ(config.owner_history_limit, 50u);
  EXPECT_TRUE(config.menu.empty());
}

TEST(ServiceConfigTest, OverridesAndIgnoresUnknownKeys) {
  const auto config = qless::parseServiceConfig(nlohmann::json{
      {"publish_endpoint", "tcp://0.0.0.0:6000"},
      {"max_transition_retries", 5},
      {"theme", "dark"},
      {"menu",
       {{{"ref", "m1"}, {"name", "Burger"}, {"price", 50}},
        {{"ref", "m2"}, {"price", 12.5}, {"available", false}}}}});

  EXPECT_EQ(config.command_endpoint, "tcp://127.0.0.1:5556");
  EXPECT_EQ(config.publish_endpoint, "tcp://0.0.0.0:6000");
  EXPECT_EQ(config.max_transition_retries, 5);

  ASSERT_EQ(config.menu.size(), 2u);
  EXPECT_EQ(config.menu[0].name, "Burger");
  EXPECT_DOUBLE_EQ(config.menu[0].price, 50.0);
  EXPECT_TRUE(config.menu[0].available);
  EXPECT_EQ(config.menu[1].name, "m2");
  EXPECT_FALSE(config.menu[1].available);
}

TEST(ServiceConfigTest, WrongTypesAreRejected) {
  EXPECT_THROW(qless::parseServiceConfig(nlohmann::json::array()),
               std::runtime_error);
  EXPECT_THROW(
      qless::parseServiceConfig(nlohmann::json{{"history_limit", "lots"}}),
      std::runtime_error);
  EXPECT_THROW(qless::parseServiceConfig(nlohmann::json{{"menu", 3}}),
               std::runtime_error);
  EXPECT_THROW(qless::parseServiceConfig(
                   nlohmann::json{{"menu", {{{"name", "no ref"}}}}}),
               std::runtime_error);
  EXPECT_THROW(
      qless::parseServiceConfig(nlohmann::json{{"max_transition_retries", -1}}),
      std::runtime_error);
}

TEST(ServiceConfigTest, LoadFromFile) {
  TempFile file(R"({"publish_queue_capacity": 16, "history_limit": 10})");

  const auto config = qless::loadServiceConfig(file.path());
  EXPECT_EQ(config.publish_queue_capacity, 16u);
  EXPECT_EQ(config.history_limit, 10u);
}

TEST(ServiceConfigTest, MalformedFileNamesThePath) {
  TempFile file("{ this is not json");

  try {
    qless::loadServiceConfig(file.path());
    FAIL() << "expected std::runtime_error";
  } catch (const std::runtime_error& e) {
    EXPECT_NE(std::string(e.what()).find(file.path()), std::string::npos);
  }
}

TEST(ServiceConfigTest, MissingFileThrows) {
  EXPECT_THROW(qless::loadServiceConfig("/nonexistent/qless.json"),
               std::runtime_error);
}
