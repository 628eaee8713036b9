// test_project_config.cpp - Unit tests for stencil.yaml loading
//
#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>
#include <system_error>

#include "stencil/project/project_config.hpp"

namespace fs = std::filesystem;

namespace stencil
{

TEST(ProjectConfig, EmptyDocumentYieldsDefaults)
{
  const auto result = parse_project_config("", "/srv/site");
  ASSERT_TRUE(result.success) << result.error;

  EXPECT_EQ(result.config.engine.views_dir.string(), "views");
  EXPECT_EQ(result.config.engine.extension, ".stn");
  EXPECT_TRUE(result.config.engine.cache);
  EXPECT_EQ(result.config.engine.max_render_depth, k_default_max_render_depth);
  EXPECT_TRUE(result.config.globals.is_object());
  EXPECT_TRUE(result.config.globals.empty());
  EXPECT_EQ(result.config.resolved_views_dir().string(), "/srv/site/views");
}

TEST(ProjectConfig, ParsesEngineSection)
{
  const auto result = parse_project_config(
    "engine:\n"
    "  views_dir: templates\n"
    "  extension: .html\n"
    "  cache: false\n"
    "  max_render_depth: 8\n",
    "/srv/site");
  ASSERT_TRUE(result.success) << result.error;

  EXPECT_EQ(result.config.engine.views_dir.string(), "templates");
  EXPECT_EQ(result.config.engine.extension, ".html");
  EXPECT_FALSE(result.config.engine.cache);
  EXPECT_EQ(result.config.engine.max_render_depth, 8U);
  EXPECT_EQ(result.config.resolved_views_dir().string(), "/srv/site/templates");
}

TEST(ProjectConfig, AbsoluteViewsDirIsKept)
{
  const auto result = parse_project_config("engine:\n  views_dir: /opt/views\n", "/srv/site");
  ASSERT_TRUE(result.success) << result.error;
  EXPECT_EQ(result.config.resolved_views_dir().string(), "/opt/views");
}

TEST(ProjectConfig, GlobalsKeepScalarTypes)
{
  const auto result = parse_project_config(
    "globals:\n"
    "  site_name: My Blog\n"
    "  year: 2024\n"
    "  ratio: 1.5\n"
    "  debug: true\n"
    "  quoted_number: '42'\n"
    "  nothing: ~\n"
    "  menu:\n"
    "    - Home\n"
    "    - About\n"
    "  author:\n"
    "    name: Ada\n",
    ".");
  ASSERT_TRUE(result.success) << result.error;

  const Value & g = result.config.globals;
  EXPECT_EQ(g["site_name"], Value("My Blog"));
  EXPECT_EQ(g["year"], Value(2024));
  EXPECT_EQ(g["ratio"], Value(1.5));
  EXPECT_EQ(g["debug"], Value(true));
  EXPECT_EQ(g["quoted_number"], Value("42"));
  EXPECT_TRUE(g["nothing"].is_null());
  EXPECT_EQ(g["menu"], Value::array({"Home", "About"}));
  EXPECT_EQ(g["author"]["name"], Value("Ada"));
}

TEST(ProjectConfig, RejectsExtensionWithoutDot)
{
  const auto result = parse_project_config("engine:\n  extension: html\n", ".");
  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.error, "invalid engine.extension: 'html' (must start with '.')");
}

TEST(ProjectConfig, RejectsNonPositiveDepth)
{
  const auto result = parse_project_config("engine:\n  max_render_depth: 0\n", ".");
  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.error, "engine.max_render_depth must be positive");
}

TEST(ProjectConfig, RejectsMisshapenSections)
{
  EXPECT_EQ(parse_project_config("- a\n- b\n", ".").error, "configuration root must be a map");
  EXPECT_EQ(parse_project_config("engine: 3\n", ".").error, "engine must be a map");
  EXPECT_EQ(parse_project_config("globals: [1, 2]\n", ".").error, "globals must be a map");
}

TEST(ProjectConfig, ReportsYamlSyntaxErrors)
{
  const auto result = parse_project_config("engine: [unclosed\n", ".");
  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.error.rfind("failed to parse YAML: ", 0), 0U) << result.error;
}

TEST(ProjectConfig, ReportsBadScalarType)
{
  const auto result = parse_project_config("engine:\n  max_render_depth: deep\n", ".");
  EXPECT_FALSE(result.success);
}

// ============================================================================
// Files on disk
// ============================================================================

class ProjectConfigFileTest : public ::testing::Test
{
protected:
  void SetUp() override
  {
    root_ = fs::temp_directory_path() /
            (std::string("stencil_config_") +
             ::testing::UnitTest::GetInstance()->current_test_info()->name());
    fs::create_directories(root_ / "views" / "pages");
  }

  void TearDown() override
  {
    std::error_code ec;
    fs::remove_all(root_, ec);
  }

  fs::path root_;
};

TEST_F(ProjectConfigFileTest, LoadsFileAndResolvesAgainstItsDirectory)
{
  std::ofstream(root_ / k_project_config_file_name) << "engine:\n  views_dir: views\n";

  const auto result = load_project_config(root_ / k_project_config_file_name);
  ASSERT_TRUE(result.success) << result.error;
  EXPECT_EQ(result.config.project_root.string(), fs::absolute(root_).string());
  EXPECT_EQ(result.config.resolved_views_dir().string(), (fs::absolute(root_) / "views").string());
}

TEST_F(ProjectConfigFileTest, MissingFileFails)
{
  const auto result = load_project_config(root_ / "absent.yaml");
  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.error.rfind("configuration file not found: ", 0), 0U) << result.error;
}

TEST_F(ProjectConfigFileTest, FindsConfigInAncestorDirectory)
{
  std::ofstream(root_ / k_project_config_file_name) << "";

  const auto found = find_project_config(root_ / "views" / "pages");
  ASSERT_TRUE(found.has_value());
  EXPECT_EQ(found->string(), (fs::absolute(root_) / k_project_config_file_name).string());
}

TEST_F(ProjectConfigFileTest, StartingFromFileUsesItsDirectory)
{
  std::ofstream(root_ / k_project_config_file_name) << "";
  std::ofstream(root_ / "views" / "index.stn") << "home";

  const auto found = find_project_config(root_ / "views" / "index.stn");
  ASSERT_TRUE(found.has_value());
  EXPECT_EQ(found->string(), (fs::absolute(root_) / k_project_config_file_name).string());
}

}  // namespace stencil
