// stencil - Template engine command line interface
//
// Usage:
//   stencil render <component> [--locals file.json] [--config stencil.yaml]
//                  [--views dir] [--no-cache] [-v]
//   stencil check <component> [options]
//   stencil dump-ast <component> [options]
//
#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

#ifdef _WIN32
#include <io.h>
#define isatty _isatty
#define fileno _fileno
#else
#include <unistd.h>
#endif

#include "stencil/ast/ast_utils.hpp"
#include "stencil/ast/json_visitor.hpp"
#include "stencil/basic/diagnostic_printer.hpp"
#include "stencil/engine.hpp"
#include "stencil/project/project_config.hpp"
#include "stencil/runtime/builtin_tools.hpp"
#include "stencil/runtime/render_error.hpp"

namespace fs = std::filesystem;

namespace
{

// ============================================================================
// Output Formatting
// ============================================================================

void print_usage(const char * program_name)
{
  std::cerr << "stencil template engine v0.1.0\n\n"
            << "Usage: " << program_name << " <command> <component> [options]\n\n"
            << "Commands:\n"
            << "  render <component>       Render a component to stdout\n"
            << "  check <component>        Parse a component and report diagnostics\n"
            << "  dump-ast <component>     Print the component's AST as JSON\n\n"
            << "Options:\n"
            << "  --locals <file.json>     Initial locals (JSON object)\n"
            << "  --config <stencil.yaml>  Project configuration (default: search upward)\n"
            << "  --views <dir>            Component root directory\n"
            << "  --no-cache               Re-read and re-parse every component\n"
            << "  -v, --verbose            Verbose output\n"
            << "  -h, --help               Show this help message\n";
}

void print_diagnostics(const stencil::ParsedComponent & unit)
{
  const bool use_color = isatty(fileno(stderr)) != 0;
  stencil::DiagnosticPrinter printer(std::cerr, use_color);
  printer.print_all(unit.diags, unit.source);
}

// ============================================================================
// Argument Parsing
// ============================================================================

struct CommandArgs
{
  std::string command;
  std::string component;
  std::string locals_file;
  std::string config_file;
  std::string views_dir;
  bool no_cache = false;
  bool verbose = false;
  bool show_help = false;
};

CommandArgs parse_args(int argc, char * argv[])
{
  CommandArgs args;

  if (argc < 2) {
    args.show_help = true;
    return args;
  }

  args.command = argv[1];

  if (args.command == "-h" || args.command == "--help") {
    args.show_help = true;
    return args;
  }

  for (int i = 2; i < argc; ++i) {
    std::string arg = argv[i];

    if (arg == "--locals") {
      if (i + 1 < argc) {
        args.locals_file = argv[++i];
      }
    } else if (arg == "--config") {
      if (i + 1 < argc) {
        args.config_file = argv[++i];
      }
    } else if (arg == "--views") {
      if (i + 1 < argc) {
        args.views_dir = argv[++i];
      }
    } else if (arg == "--no-cache") {
      args.no_cache = true;
    } else if (arg == "-v" || arg == "--verbose") {
      args.verbose = true;
    } else if (arg == "-h" || arg == "--help") {
      args.show_help = true;
    } else if (arg[0] != '-' && args.component.empty()) {
      args.component = arg;
    }
  }

  return args;
}

// ============================================================================
// Setup
// ============================================================================

struct Setup
{
  stencil::ProjectConfig config;
  std::unique_ptr<stencil::Engine> engine;
};

/// Load configuration and build the engine; prints errors and returns nullopt on failure.
std::optional<Setup> make_setup(const CommandArgs & args)
{
  Setup setup;
  setup.config.project_root = fs::current_path();

  std::optional<fs::path> config_path;
  if (!args.config_file.empty()) {
    config_path = fs::path(args.config_file);
  } else {
    config_path = stencil::find_project_config(fs::current_path());
  }

  if (config_path) {
    auto result = stencil::load_project_config(*config_path);
    if (!result.success) {
      std::cerr << "error: " << result.error << "\n";
      return std::nullopt;
    }
    setup.config = std::move(result.config);
    if (args.verbose) {
      std::cerr << "Using configuration: " << config_path->string() << "\n";
    }
  } else {
    // Without a configuration file, components are looked up in the current directory.
    setup.config.engine.views_dir = ".";
  }

  const fs::path views =
    args.views_dir.empty() ? setup.config.resolved_views_dir() : fs::path(args.views_dir);
  if (args.verbose) {
    std::cerr << "Views directory: " << views.string() << "\n";
  }

  stencil::EnvironmentBuilder builder;
  stencil::register_builtin_tools(builder);
  builder.add_globals(setup.config.globals);

  stencil::EngineOptions options;
  options.cache = setup.config.engine.cache && !args.no_cache;
  options.max_render_depth = setup.config.engine.max_render_depth;

  setup.engine = std::make_unique<stencil::Engine>(
    options,
    std::make_shared<stencil::FileSourceLoader>(views, setup.config.engine.extension),
    builder.build());
  return setup;
}

std::optional<nlohmann::json> load_locals(const std::string & path)
{
  if (path.empty()) {
    return nlohmann::json::object();
  }

  std::ifstream file(path);
  if (!file) {
    std::cerr << "error: cannot open locals file: " << path << "\n";
    return std::nullopt;
  }

  auto locals = nlohmann::json::parse(file, nullptr, false);
  if (locals.is_discarded() || !locals.is_object()) {
    std::cerr << "error: locals file must contain a JSON object: " << path << "\n";
    return std::nullopt;
  }
  return locals;
}

/// Parse without caching; prints diagnostics. Returns nullptr on any error.
std::shared_ptr<stencil::ParsedComponent> parse_checked(
  stencil::Engine & engine, const std::string & component)
{
  auto unit = engine.loader().parse_uncached(component);
  if (!unit) {
    std::cerr << "error[" << stencil::to_string(stencil::ErrorKind::Source)
              << "]: component '" << component << "' could not be loaded\n";
    return nullptr;
  }
  if (!unit->diags.empty()) {
    print_diagnostics(*unit);
  }
  if (unit->has_errors()) {
    return nullptr;
  }
  return unit;
}

// ============================================================================
// Commands
// ============================================================================

int cmd_render(const CommandArgs & args, Setup & setup)
{
  const auto locals = load_locals(args.locals_file);
  if (!locals) {
    return 1;
  }

  if (args.verbose) {
    std::cerr << "Rendering: " << args.component << "\n";
  }

  try {
    std::cout << setup.engine->render(args.component, *locals).get();
  } catch (const stencil::RenderError & e) {
    // Parse failures get the full diagnostic rendering of the failing component.
    if (e.kind() == stencil::ErrorKind::Syntax || e.kind() == stencil::ErrorKind::Composition) {
      if (auto unit = setup.engine->loader().parse_uncached(e.component())) {
        if (unit->has_errors()) {
          print_diagnostics(*unit);
          return 1;
        }
      }
    }
    std::cerr << "error[" << stencil::to_string(e.kind()) << "]: " << e.detail();
    if (!e.component().empty()) {
      std::cerr << "\n  --> " << e.component();
      if (e.line() != 0) {
        std::cerr << ":" << e.line();
      }
    }
    std::cerr << "\n";
    return 1;
  } catch (const std::exception & e) {
    std::cerr << "error: " << e.what() << "\n";
    return 1;
  }

  return 0;
}

int cmd_check(const CommandArgs & args, Setup & setup)
{
  const auto unit = parse_checked(*setup.engine, args.component);
  if (!unit) {
    return 1;
  }

  if (args.verbose) {
    for (const auto name : stencil::collect_placeholders(unit->root)) {
      std::cerr << "placeholder: " << name << "\n";
    }
    for (const auto name : stencil::collect_tool_calls(unit->root)) {
      std::cerr << "tool: " << name << "\n";
    }
    for (const auto name : stencil::collect_static_dependencies(unit->root)) {
      std::cerr << "depends on: " << name << "\n";
    }
  }

  std::cout << args.component << ": OK\n";
  return 0;
}

int cmd_dump_ast(const CommandArgs & args, Setup & setup)
{
  const auto unit = parse_checked(*setup.engine, args.component);
  if (!unit) {
    return 1;
  }
  std::cout << stencil::to_json(unit->root).dump(2) << "\n";
  return 0;
}

}  // namespace

// ============================================================================
// Main
// ============================================================================

int main(int argc, char * argv[])
{
  const CommandArgs args = parse_args(argc, argv);

  if (args.show_help) {
    print_usage(argv[0]);
    return 0;
  }

  if (args.command != "render" && args.command != "check" && args.command != "dump-ast") {
    std::cerr << "error: unknown command '" << args.command << "'\n\n";
    print_usage(argv[0]);
    return 1;
  }

  if (args.component.empty()) {
    std::cerr << "error: component name required\n";
    std::cerr << "usage: " << argv[0] << " " << args.command << " <component>\n";
    return 1;
  }

  auto setup = make_setup(args);
  if (!setup) {
    return 1;
  }

  if (args.command == "render") {
    return cmd_render(args, *setup);
  }
  if (args.command == "check") {
    return cmd_check(args, *setup);
  }
  return cmd_dump_ast(args, *setup);
}
