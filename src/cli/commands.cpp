#include "vesper/cli/commands.hpp"

#include "vesper/common/fs.hpp"
#include "vesper/common/strings.hpp"
#include "vesper/config/config.hpp"
#include "vesper/observability/global.hpp"
#include "vesper/office/extractor.hpp"
#include "vesper/render/text.hpp"
#include "vesper/runtime/app.hpp"
#include "vesper/service/loader.hpp"

#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#if defined(_WIN32)
#include <io.h>
#define VESPER_ISATTY _isatty
#define VESPER_FILENO _fileno
#else
#include <unistd.h>
#define VESPER_ISATTY isatty
#define VESPER_FILENO fileno
#endif

namespace vesper::cli {

namespace {

std::string version_string() {
#ifdef VESPER_VERSION
  std::string version = VESPER_VERSION;
#else
  std::string version = "0.1.0";
#endif
#ifdef VESPER_GIT_COMMIT
  const std::string commit = VESPER_GIT_COMMIT;
  if (!commit.empty() && commit != "unknown") {
    version += " (" + commit + ")";
  }
#endif
  return "vesper " + version;
}

std::vector<std::string> collect_args(int argc, char **argv) {
  std::vector<std::string> out;
  out.reserve(static_cast<std::size_t>(argc));
  for (int i = 0; i < argc; ++i) {
    out.emplace_back(argv[i]);
  }
  return out;
}

bool take_option(std::vector<std::string> &args, const std::string &long_name,
                 const std::string &short_name, std::string &out_value) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == long_name || (!short_name.empty() && args[i] == short_name)) {
      if (i + 1 >= args.size()) {
        return false;
      }
      out_value = args[i + 1];
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      return true;
    }
  }
  return false;
}

bool take_flag(std::vector<std::string> &args, const std::string &name) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == name) {
      args.erase(args.begin() + static_cast<long>(i));
      return true;
    }
  }
  return false;
}

/// A flag given without its value is an error rather than silently ignored.
bool dangling_option(const std::vector<std::string> &args, const std::string &name) {
  return !args.empty() && args.back() == name;
}

bool parse_count(const std::string &text, std::size_t &out) {
  if (text.empty() || text.find_first_not_of("0123456789") != std::string::npos ||
      text.size() > 9) {
    return false;
  }
  out = static_cast<std::size_t>(std::strtoul(text.c_str(), nullptr, 10));
  return true;
}

bool apply_global_options(std::vector<std::string> &args, std::string &error) {
  for (std::size_t i = 0; i < args.size();) {
    if (args[i] == "--config") {
      if (i + 1 >= args.size()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(args[i + 1]);
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      continue;
    }
    if (common::starts_with(args[i], "--config=")) {
      const auto value = args[i].substr(std::string("--config=").size());
      if (value.empty()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(value);
      args.erase(args.begin() + static_cast<long>(i));
      continue;
    }
    ++i;
  }
  return true;
}

std::string read_stdin_all() {
  std::ostringstream out;
  out << std::cin.rdbuf();
  return out.str();
}

bool stdout_is_tty() { return VESPER_ISATTY(VESPER_FILENO(stdout)) != 0; }
bool stderr_is_tty() { return VESPER_ISATTY(VESPER_FILENO(stderr)) != 0; }

void print_document(const office::Document &document, const bool json,
                    const render::RenderOptions &options) {
  if (json) {
    std::cout << render::render_json(document) << "\n";
  } else {
    std::cout << render::render_text(document, options);
  }
}

int run_pray(std::vector<std::string> args) {
  runtime::LoaderOptions loader_options;
  std::string value;
  if (take_option(args, "--url", "-u", value)) {
    loader_options.url = value;
  }
  if (take_option(args, "--file", "-f", value)) {
    loader_options.file = common::expand_path(value);
  }
  std::optional<std::size_t> width;
  if (take_option(args, "--width", "-w", value)) {
    std::size_t parsed = 0;
    if (!parse_count(value, parsed) || parsed < 20) {
      std::cerr << "--width expects a number of columns (at least 20)\n";
      return 1;
    }
    width = parsed;
  }
  std::size_t retries = 0;
  if (take_option(args, "--retries", "", value) && !parse_count(value, retries)) {
    std::cerr << "--retries expects a non-negative number\n";
    return 1;
  }
  const bool json = take_flag(args, "--json");
  const bool plain = take_flag(args, "--plain");
  loader_options.mark_completed = !take_flag(args, "--no-mark");

  for (const char *name : {"--url", "--file", "--width", "--retries"}) {
    if (dangling_option(args, name)) {
      std::cerr << "missing value for " << name << "\n";
      return 1;
    }
  }
  if (!args.empty()) {
    std::cerr << "unexpected argument: " << args.front() << "\n";
    return 1;
  }

  auto context = runtime::RuntimeContext::from_disk();
  if (!context.ok()) {
    std::cerr << context.error() << "\n";
    return 1;
  }
  auto loader = context.value().create_loader(loader_options);
  if (!loader.ok()) {
    std::cerr << loader.error() << "\n";
    return 1;
  }

  const bool show_progress = !json && stderr_is_tty();
  const auto progress = loader.value()->subscribe([show_progress](const service::LoadState &state) {
    if (show_progress && state.phase == service::LoadPhase::Loading) {
      std::cerr << "\033[2mLoading today's office...\033[0m\r" << std::flush;
    }
  });

  auto state = loader.value()->load();
  for (std::size_t attempt = 0; state.phase == service::LoadPhase::Failed && attempt < retries;
       ++attempt) {
    state = loader.value()->retry();
  }
  loader.value()->unsubscribe(progress);
  if (show_progress) {
    std::cerr << "\033[2K" << std::flush;
  }

  if (state.phase != service::LoadPhase::Loaded || !state.document.has_value()) {
    const std::string message =
        state.failure.has_value() ? state.failure->message : std::string("nothing loaded");
    std::cerr << "error: " << message << "\n";
    std::cerr << "Run 'vesper pray' again to retry.\n";
    return 1;
  }

  const auto &cfg = context.value().config();
  render::RenderOptions options;
  options.width = width.value_or(cfg.render.width);
  options.color = cfg.render.color && !plain && stdout_is_tty();
  print_document(*state.document, json, options);
  return 0;
}

int run_extract(std::vector<std::string> args) {
  const bool json = take_flag(args, "--json");
  const bool plain = take_flag(args, "--plain");
  if (args.size() > 1) {
    std::cerr << "usage: vesper extract [PATH|-] [--json]\n";
    return 1;
  }

  std::string html;
  if (args.empty() || args[0] == "-") {
    html = read_stdin_all();
  } else {
    auto read = common::read_file(common::expand_path(args[0]));
    if (!read.ok()) {
      std::cerr << read.error() << "\n";
      return 1;
    }
    html = std::move(read.value());
  }
  if (!common::is_valid_utf8(html)) {
    std::cerr << "error: " << service::DECODE_FAILURE_MESSAGE << "\n";
    return 1;
  }

  auto cfg = config::load_config();
  if (!cfg.ok()) {
    std::cerr << cfg.error() << "\n";
    return 1;
  }
  render::RenderOptions options;
  options.width = cfg.value().render.width;
  options.color = cfg.value().render.color && !plain && stdout_is_tty();
  print_document(office::extract_office(html), json, options);
  return 0;
}

int run_history(std::vector<std::string> args) {
  std::size_t limit = 0;
  std::string value;
  if (take_option(args, "--limit", "-n", value) && !parse_count(value, limit)) {
    std::cerr << "--limit expects a non-negative number\n";
    return 1;
  }
  if (!args.empty()) {
    std::cerr << "usage: vesper history [--limit N]\n";
    return 1;
  }

  auto context = runtime::RuntimeContext::from_disk();
  if (!context.ok()) {
    std::cerr << context.error() << "\n";
    return 1;
  }
  auto store = context.value().create_tracker();
  if (!store.ok()) {
    std::cerr << store.error() << "\n";
    return 1;
  }
  if (store.value() == nullptr) {
    std::cout << "Day tracking is disabled (tracker.enabled = false).\n";
    return 0;
  }

  auto days = store.value()->list();
  if (!days.ok()) {
    std::cerr << days.error() << "\n";
    return 1;
  }
  if (days.value().empty()) {
    std::cout << "No completed days yet.\n";
    return 0;
  }
  std::size_t shown = 0;
  for (const auto &day : days.value()) {
    if (limit > 0 && shown >= limit) {
      break;
    }
    std::cout << day << "\n";
    ++shown;
  }
  return 0;
}

int run_config(const std::vector<std::string> &args) {
  if (!args.empty() && args[0] == "schema") {
    std::cout << config::json_schema() << "\n";
    return 0;
  }

  auto cfg = config::load_config();
  if (!cfg.ok()) {
    std::cerr << cfg.error() << "\n";
    return 1;
  }

  if (args.empty() || args[0] == "show") {
    for (const auto &key : config::config_keys()) {
      auto value = config::get_value(cfg.value(), key);
      if (!value.ok()) {
        std::cerr << value.error() << "\n";
        return 1;
      }
      std::cout << key << " = " << value.value() << "\n";
    }
    return 0;
  }

  if (args[0] == "get") {
    if (args.size() < 2) {
      std::cerr << "usage: vesper config get <key>\n";
      return 1;
    }
    auto value = config::get_value(cfg.value(), args[1]);
    if (!value.ok()) {
      std::cerr << value.error() << "\n";
      return 1;
    }
    std::cout << value.value() << "\n";
    return 0;
  }

  if (args[0] == "set") {
    if (args.size() < 3) {
      std::cerr << "usage: vesper config set <key> <value>\n";
      return 1;
    }
    auto assigned = config::set_value(cfg.value(), args[1], args[2]);
    if (!assigned.ok()) {
      std::cerr << assigned.error() << "\n";
      return 1;
    }
    auto validated = config::validate_config(cfg.value());
    if (!validated.ok()) {
      std::cerr << validated.error() << "\n";
      return 1;
    }
    for (const auto &warning : validated.value()) {
      std::cerr << "warning: " << warning << "\n";
    }
    auto saved = config::save_config(cfg.value());
    if (!saved.ok()) {
      std::cerr << saved.error() << "\n";
      return 1;
    }
    return 0;
  }

  std::cerr << "unknown config command\n";
  return 1;
}

void print_help() {
  constexpr const char *RESET   = "\033[0m";
  constexpr const char *BOLD    = "\033[1m";
  constexpr const char *DIM     = "\033[2m";
  constexpr const char *CYAN    = "\033[36m";
  constexpr const char *GREEN   = "\033[32m";

  std::cout << "\n";
  std::cout << BOLD << CYAN << "   Vesper" << RESET << DIM
            << "  Fixed-hour prayer in the terminal." << RESET << "\n";
  std::cout << DIM << "  " << version_string() << RESET << "\n\n";

  std::cout << BOLD << "  USAGE" << RESET << "\n";
  std::cout << DIM << "  $ " << RESET << "vesper [--config PATH] <command> [options]\n\n";

  std::cout << BOLD << "  PRAYER" << RESET << "\n";
  std::cout << "  " << GREEN << "pray" << RESET << DIM << "           Fetch and show today's office" << RESET << "\n";
  std::cout << DIM << "                 --url URL  --file PATH  --json  --width N  --plain" << RESET << "\n";
  std::cout << DIM << "                 --no-mark  --retries N" << RESET << "\n";
  std::cout << "  " << GREEN << "extract" << RESET << " PATH" << DIM << "   Extract an office from a saved page (- for stdin)" << RESET << "\n";
  std::cout << "  " << GREEN << "history" << RESET << DIM << "        List days marked as prayed" << RESET << "\n\n";

  std::cout << BOLD << "  CONFIGURATION" << RESET << "\n";
  std::cout << "  " << GREEN << "config show" << RESET << DIM << "    Display current configuration" << RESET << "\n";
  std::cout << "  " << GREEN << "config get" << RESET << " KEY" << DIM << " Print one value" << RESET << "\n";
  std::cout << "  " << GREEN << "config set" << RESET << " KEY VALUE" << DIM << "  Update and save" << RESET << "\n";
  std::cout << "  " << GREEN << "config schema" << RESET << DIM << "  Print the JSON schema" << RESET << "\n";
  std::cout << "  " << GREEN << "config-path" << RESET << DIM << "    Show the config file location" << RESET << "\n\n";

  std::cout << BOLD << "  OTHER" << RESET << "\n";
  std::cout << "  " << GREEN << "version" << RESET << DIM << "        Show version" << RESET << "\n";
  std::cout << "  " << GREEN << "help" << RESET << DIM << "           Show this help" << RESET << "\n";
  std::cout << "\n";
}

} // namespace

int run_cli(int argc, char **argv) {
  std::vector<std::string> args = collect_args(argc > 0 ? argc - 1 : 0, argv + 1);
  std::string global_error;
  if (!apply_global_options(args, global_error)) {
    std::cerr << global_error << "\n";
    return 1;
  }

  if (args.empty()) {
    print_help();
    return 0;
  }

  const std::string subcommand = args[0];
  args.erase(args.begin());

  if (subcommand == "--help" || subcommand == "-h" || subcommand == "help") {
    print_help();
    return 0;
  }
  if (subcommand == "--version" || subcommand == "-V" || subcommand == "version") {
    std::cout << version_string() << "\n";
    return 0;
  }
  if (subcommand == "config-path") {
    auto path_result = config::config_path();
    if (!path_result.ok()) {
      std::cerr << path_result.error() << "\n";
      return 1;
    }
    std::cout << path_result.value().string() << "\n";
    return 0;
  }
  if (subcommand == "pray") {
    return run_pray(std::move(args));
  }
  if (subcommand == "extract") {
    return run_extract(std::move(args));
  }
  if (subcommand == "history") {
    return run_history(std::move(args));
  }
  if (subcommand == "config") {
    return run_config(args);
  }

  std::cerr << "Unknown command: " << subcommand << "\n";
  print_help();
  return 1;
}

} // namespace vesper::cli
