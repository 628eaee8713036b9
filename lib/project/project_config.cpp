// stencil/project/project_config.cpp - Project configuration implementation
//
#include "stencil/project/project_config.hpp"

#include <yaml-cpp/yaml.h>

#include <cstdint>
#include <fstream>
#include <sstream>
#include <system_error>
#include <utility>

namespace stencil
{

namespace
{

/// Convert a YAML scalar to the narrowest JSON type it spells.
Value scalar_to_value(const YAML::Node & node)
{
  // Quoted scalars are always strings.
  if (node.Tag() == "!") {
    return Value(node.Scalar());
  }

  const std::string & text = node.Scalar();
  if (text == "~" || text == "null" || text == "Null" || text == "NULL") {
    return Value(nullptr);
  }

  bool b = false;
  if (YAML::convert<bool>::decode(node, b)) {
    return Value(b);
  }

  int64_t i = 0;
  if (YAML::convert<int64_t>::decode(node, i)) {
    return Value(i);
  }

  double d = 0.0;
  if (YAML::convert<double>::decode(node, d)) {
    return Value(d);
  }

  return Value(text);
}

Value yaml_to_value(const YAML::Node & node)
{
  switch (node.Type()) {
    case YAML::NodeType::Null:
    case YAML::NodeType::Undefined:
      return Value(nullptr);
    case YAML::NodeType::Scalar:
      return scalar_to_value(node);
    case YAML::NodeType::Sequence: {
      Value arr = Value::array();
      for (const auto & item : node) {
        arr.push_back(yaml_to_value(item));
      }
      return arr;
    }
    case YAML::NodeType::Map: {
      Value obj = Value::object();
      for (const auto & entry : node) {
        obj[entry.first.as<std::string>()] = yaml_to_value(entry.second);
      }
      return obj;
    }
  }
  return Value(nullptr);
}

/// Parse the 'engine' section; returns an error message on failure.
std::optional<std::string> parse_engine_section(const YAML::Node & node, EngineConfig & out)
{
  if (!node.IsMap()) {
    return "engine must be a map";
  }

  if (node["views_dir"]) {
    out.views_dir = node["views_dir"].as<std::string>();
  }

  if (node["extension"]) {
    out.extension = node["extension"].as<std::string>();
    if (out.extension.empty() || out.extension.front() != '.') {
      return "invalid engine.extension: '" + out.extension + "' (must start with '.')";
    }
  }

  if (node["cache"]) {
    out.cache = node["cache"].as<bool>();
  }

  if (node["max_render_depth"]) {
    const auto depth = node["max_render_depth"].as<int64_t>();
    if (depth <= 0) {
      return "engine.max_render_depth must be positive";
    }
    out.max_render_depth = static_cast<size_t>(depth);
  }

  return std::nullopt;
}

}  // namespace

ConfigLoadResult parse_project_config(
  const std::string & yaml_text, const std::filesystem::path & project_root)
{
  ProjectConfig config;
  config.project_root = project_root;

  try {
    const YAML::Node root = YAML::Load(yaml_text);

    if (root.IsNull()) {
      return ConfigLoadResult::ok(std::move(config));
    }
    if (!root.IsMap()) {
      return ConfigLoadResult::fail("configuration root must be a map");
    }

    if (root["engine"]) {
      if (auto err = parse_engine_section(root["engine"], config.engine)) {
        return ConfigLoadResult::fail(std::move(*err));
      }
    }

    if (root["globals"]) {
      const auto & globals = root["globals"];
      if (!globals.IsMap()) {
        return ConfigLoadResult::fail("globals must be a map");
      }
      config.globals = yaml_to_value(globals);
    }
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("failed to parse YAML: " + std::string(e.what()));
  }

  return ConfigLoadResult::ok(std::move(config));
}

ConfigLoadResult load_project_config(const std::filesystem::path & config_path)
{
  namespace fs = std::filesystem;

  std::error_code ec;
  if (!fs::exists(config_path, ec)) {
    return ConfigLoadResult::fail("configuration file not found: " + config_path.string());
  }

  std::ifstream file(config_path, std::ios::binary);
  if (!file) {
    return ConfigLoadResult::fail("failed to read configuration file: " + config_path.string());
  }
  std::ostringstream text;
  text << file.rdbuf();

  return parse_project_config(text.str(), fs::absolute(config_path).parent_path());
}

std::optional<std::filesystem::path> find_project_config(const std::filesystem::path & start_dir)
{
  namespace fs = std::filesystem;

  fs::path current = fs::absolute(start_dir);

  // If start_dir is a file, start from its parent
  if (fs::is_regular_file(current)) {
    current = current.parent_path();
  }

  while (true) {
    fs::path candidate = current / k_project_config_file_name;
    if (fs::exists(candidate)) {
      return candidate;
    }

    const fs::path parent = current.parent_path();
    if (parent == current) {
      break;
    }
    current = parent;
  }

  return std::nullopt;
}

}  // namespace stencil
