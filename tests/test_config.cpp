#include <cstdlib>
#include <filesystem>
#include <fstream>

#include <catch2/catch.hpp>

#include "shortsmith/config.hpp"
#include "shortsmith/errors.hpp"

using namespace shortsmith;

TEST_CASE("split_list trims and drops empty items", "[config]") {
  auto items = Config::split_list(" amazing, key point ,,epic ");
  REQUIRE(items.size() == 3);
  CHECK(items[0] == "amazing");
  CHECK(items[1] == "key point");
  CHECK(items[2] == "epic");
  CHECK(Config::split_list("").empty());
}

TEST_CASE("get_env_list reads comma-separated overrides", "[config]") {
  ::setenv("SHORTSMITH_TEST_LIST", "a,b", 1);
  auto items = Config::get_env_list("SHORTSMITH_TEST_LIST", {"x"});
  CHECK(items == std::vector<std::string>{"a", "b"});
  ::unsetenv("SHORTSMITH_TEST_LIST");
  CHECK(Config::get_env_list("SHORTSMITH_TEST_LIST", {"x"}) ==
        std::vector<std::string>{"x"});
}

TEST_CASE("load_env_file exports unset variables only", "[config]") {
  namespace fs = std::filesystem;
  fs::path path = fs::temp_directory_path() / "shortsmith_config_test.env";
  {
    std::ofstream out(path);
    out << "# comment\n"
        << "\n"
        << "SHORTSMITH_TEST_A=1\n"
        << "export SHORTSMITH_TEST_B=\"two words\"\n"
        << "SHORTSMITH_TEST_PRESET=from-file\n"
        << "not a setting\n";
  }
  ::unsetenv("SHORTSMITH_TEST_A");
  ::unsetenv("SHORTSMITH_TEST_B");
  ::setenv("SHORTSMITH_TEST_PRESET", "from-env", 1);

  CHECK(Config::load_env_file(path.string()) == 2);
  CHECK(std::string(std::getenv("SHORTSMITH_TEST_A")) == "1");
  CHECK(std::string(std::getenv("SHORTSMITH_TEST_B")) == "two words");
  CHECK(std::string(std::getenv("SHORTSMITH_TEST_PRESET")) == "from-env");

  fs::remove(path);
  CHECK(Config::load_env_file(path.string()) == -1);
}

TEST_CASE("EngineConfig defaults are valid", "[config]") {
  EngineConfig config;
  CHECK_NOTHROW(config.validate());
  CHECK(config.min_duration == Approx(30.0));
  CHECK(config.max_duration == Approx(90.0));
  CHECK(config.max_highlights == 5);
  CHECK(config.context_window == Approx(5.0));
  CHECK_FALSE(config.legacy_right_pad);
}

TEST_CASE("EngineConfig::validate rejects inconsistent values", "[config]") {
  EngineConfig inverted;
  inverted.min_duration = 90.0;
  inverted.max_duration = 30.0;
  CHECK_THROWS_AS(inverted.validate(), InvalidInputError);

  EngineConfig threshold;
  threshold.scene_threshold = 300.0;
  CHECK_THROWS_AS(threshold.validate(), InvalidInputError);

  EngineConfig density;
  density.density_fps = 0.0;
  CHECK_THROWS_AS(density.validate(), InvalidInputError);
}

TEST_CASE("default keyword tiers keep the stock split", "[config]") {
  auto tiers = KeywordTiers::defaults();
  CHECK(tiers.high_impact.size() == 30);
  CHECK(tiers.content_indicator.size() == 6);
  CHECK(tiers.emotional_trigger.empty());
  CHECK(tiers.call_to_action.empty());
}
