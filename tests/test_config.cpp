/**
 * @file test_config.cpp
 * @brief Tests for Loader defaults and the JSON route table format.
 */
#include <gtest/gtest.h>
#include <cstdio>
#include <fstream>
#include <sstream>
#include <string>

#include "wbr/config/config_loader.hpp"
#include "wbr/routing/dispatch_engine.hpp"
#include "wbr/version.hpp"
#include "test_sources.hpp"

using wbr::config::ConfigErr;
using wbr::config::Loader;
using wbr::routing::RawWeight;

namespace {
wbr::config::LoadResult parse(const std::string& text) {
  std::istringstream in(text);
  return Loader::load_from_stream(in);
}
} // namespace

TEST(ConfigLoader, Defaults_Are_FiftyFifty) {
  const auto dc = Loader::defaults();
  ASSERT_EQ(dc.routing.routes.size(), 2u);
  EXPECT_EQ(dc.routing.routes[0].name, "Route A");
  EXPECT_EQ(dc.routing.routes[1].name, "Route B");
  EXPECT_EQ(dc.routing.routes[0].weight, RawWeight{50.0});
  EXPECT_EQ(dc.routing.routes[1].weight, RawWeight{50.0});
  EXPECT_FALSE(dc.routing.routes[0].override_value.has_value());
  EXPECT_FALSE(dc.routing.enable_else);
  EXPECT_EQ(dc.seed, 0u);
  EXPECT_FALSE(dc.log_decisions);
}

/**
 * @test ConfigLoader_Parses_Routes_And_Settings
 * @brief Top-level settings applied; route fields mapped by JSON type.
 */
TEST(ConfigLoader, Parses_Routes_And_Settings) {
  auto r = parse(R"({
    "else": true,
    "seed": 42,
    "log": false,
    "routes": [
      {"route_name": "Fast", "percentage": 70},
      {"route_name": "Slow", "percentage": 12.5, "output_value": "canned reply"},
      {"route_name": "Unweighted"},
      {"route_name": "Nulled", "percentage": null, "output_value": null},
      {"route_name": "Broken", "percentage": "lots"},
      {"percentage": "5"}
    ]
  })");
  ASSERT_TRUE(r) << r.error().message;
  const auto& dc = *r;
  EXPECT_TRUE(dc.routing.enable_else);
  EXPECT_EQ(dc.seed, 42u);
  EXPECT_FALSE(dc.log_decisions);

  const auto& routes = dc.routing.routes;
  ASSERT_EQ(routes.size(), 6u);
  EXPECT_EQ(routes[0].name, "Fast");
  EXPECT_EQ(routes[0].weight, RawWeight{70.0});
  EXPECT_FALSE(routes[0].override_value);

  EXPECT_EQ(routes[1].weight, RawWeight{12.5});
  ASSERT_TRUE(routes[1].override_value);
  EXPECT_EQ(*routes[1].override_value, "canned reply");

  EXPECT_TRUE(std::holds_alternative<std::monostate>(routes[2].weight));
  EXPECT_TRUE(std::holds_alternative<std::monostate>(routes[3].weight));
  EXPECT_FALSE(routes[3].override_value);

  EXPECT_EQ(routes[4].weight, RawWeight{std::string{"lots"}});
  EXPECT_EQ(routes[5].name, "Route 6");
  EXPECT_EQ(routes[5].weight, RawWeight{std::string{"5"}});
}

TEST(ConfigLoader, Empty_Override_Is_Kept_And_Falls_Back) {
  auto r = parse(R"({"routes": [{"route_name": "A", "percentage": 100, "output_value": ""}]})");
  ASSERT_TRUE(r);
  ASSERT_TRUE(r->routing.routes[0].override_value);
  EXPECT_FALSE(wbr::routing::usable_override(r->routing.routes[0].override_value));
}

TEST(ConfigLoader, Missing_Routes_Key_Means_No_Routes) {
  auto r = parse(R"({"else": true})");
  ASSERT_TRUE(r);
  EXPECT_TRUE(r->routing.routes.empty());
  EXPECT_TRUE(r->routing.enable_else);
}

TEST(ConfigLoader, Malformed_Json_Is_Syntax_Error) {
  auto r = parse("{\"routes\": [ {\"route_name\": \"A\" ");
  ASSERT_FALSE(r);
  EXPECT_EQ(r.error().code, ConfigErr::Syntax);
  EXPECT_GT(r.error().offset, 0u);
}

TEST(ConfigLoader, Unknown_Keys_Are_Rejected) {
  {
    auto r = parse(R"({"colour": "blue"})");
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ConfigErr::Syntax);
    EXPECT_NE(r.error().message.find("colour"), std::string::npos);
  }
  {
    auto r = parse(R"({"routes": [{"route_name": "A", "weight": 5}]})");
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ConfigErr::Syntax);
    EXPECT_NE(r.error().message.find("routes[0].weight"), std::string::npos);
  }
}

TEST(ConfigLoader, Wrong_Types_Are_Type_Errors) {
  const char* cases[] = {
    R"([1, 2])",
    R"({"else": "maybe"})",
    R"({"log": 1})",
    R"({"seed": -1})",
    R"({"seed": 1.5})",
    R"({"routes": {"route_name": "A"}})",
    R"({"routes": ["A"]})",
    R"({"routes": [{"route_name": 7}]})",
    R"({"routes": [{"route_name": "A", "percentage": true}]})",
    R"({"routes": [{"route_name": "A", "percentage": [50]}]})",
    R"({"routes": [{"route_name": "A", "output_value": 5}]})",
  };
  for (const char* text : cases) {
    auto r = parse(text);
    ASSERT_FALSE(r) << text;
    EXPECT_EQ(r.error().code, ConfigErr::Type) << text;
  }
}

TEST(ConfigLoader, Missing_File_Is_Io_Error) {
  auto r = Loader::load_from_file("/nonexistent/wbr/routes.json");
  ASSERT_FALSE(r);
  EXPECT_EQ(r.error().code, ConfigErr::Io);
}

TEST(ConfigLoader, Load_From_File_Through_Engine) {
  const std::string path = ::testing::TempDir() + "wbr_routes.json";
  {
    std::ofstream out(path);
    out << R"({"else": true, "routes": [)"
           R"({"route_name": "Keep", "percentage": 0, "output_value": "kept"},)"
           R"({"route_name": "Drop", "percentage": "nonsense"}]})";
  }
  auto r = Loader::load_from_file(path);
  std::remove(path.c_str());
  ASSERT_TRUE(r) << r.error().message;

  wbr::test::FixedSource rng{63.0};
  wbr::routing::DispatchEngine engine{rng};
  wbr::routing::EvaluationContext ctx{r->routing};

  // Only "Keep" is usable (0% alone -> equal share of 100%).
  auto keep = engine.route_output(ctx, "Keep", std::string{"in"});
  ASSERT_TRUE(keep.active);
  EXPECT_EQ(std::get<wbr::routing::Literal>(keep.payload).text, "kept");
  EXPECT_FALSE(engine.route_output(ctx, "Drop", std::string{"in"}).active);
  EXPECT_FALSE(engine.else_output(ctx, std::string{"in"}).active);
}

/**
 * @test Version_String_Matches_Components
 * @brief The build-stamped version string agrees with the numeric components.
 */
TEST(Version, String_Matches_Components) {
  const std::string expect = std::to_string(wbr::version.major) + "." +
                             std::to_string(wbr::version.minor) + "." +
                             std::to_string(wbr::version.patch);
  EXPECT_EQ(std::string{wbr::version_string}, expect);
}

TEST(ConfigLoader, Errors_Propagate_Through_Expected) {
  auto r = parse(R"({"routes": [{"route_name": "A"}, {"route_name": "B", "percentage": {}}]})");
  ASSERT_FALSE(r);
  EXPECT_EQ(r.error().code, ConfigErr::Type);
  EXPECT_NE(r.error().message.find("routes[1].percentage"), std::string::npos);
}
