#include "cli.h"

#include "CLI11.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace quire {

cli_args cli_parse(int argc, char **argv) {
  CLI::App app{ "quire - self-contained source bundles from a package distribution" };

  bool verbose{ false };
  app.add_flag("--verbose",
               verbose,
               "Enable decorated verbose logging (timestamp and level prefixes)");

  std::string trace_spec;
  auto *trace_option{ app.add_option("--trace",
                                     trace_spec,
                                     "Enable trace logging. Provide a comma-separated "
                                     "list: 'stderr' for human-readable stderr and/or "
                                     "'file:<path>' for JSONL file output. Defaults to "
                                     "stderr if no value provided.") };
  trace_option->expected(0, 1);

  bool version_flag_short{ false };
  bool version_flag_long{ false };
  app.add_flag("-v", version_flag_short, "Show version information");
  app.add_flag("--version", version_flag_long, "Show version information");

  std::optional<cli_args::cmd_cfg_t> cmd_cfg;

  auto *version{ app.add_subcommand("version", "Show version information") };
  version->callback([&cmd_cfg] { cmd_cfg = cmd_version::cfg{}; });

  cmd_bundle::cfg bundle_cfg{};
  auto *bundle{ app.add_subcommand("bundle",
                                   "Resolve systems and write a self-contained bundle") };
  bundle->add_option("systems", bundle_cfg.systems, "Systems to include")->required();
  bundle->add_option("--to", bundle_cfg.target, "Bundle directory to create")->required();
  bundle->add_option("--dist",
                     bundle_cfg.dist,
                     "Distribution directory containing quire-dist.lua");
  bundle->add_option("--cache-root", bundle_cfg.cache_root, "Archive cache directory");
  bundle->callback([&cmd_cfg, &bundle_cfg] { cmd_cfg = bundle_cfg; });

  cmd_resolve::cfg resolve_cfg{};
  auto *resolve{ app.add_subcommand("resolve",
                                    "Print the releases and systems a bundle would hold") };
  resolve->add_option("systems", resolve_cfg.systems, "Systems to resolve")->required();
  resolve->add_option("--dist",
                      resolve_cfg.dist,
                      "Distribution directory containing quire-dist.lua");
  resolve->callback([&cmd_cfg, &resolve_cfg] { cmd_cfg = resolve_cfg; });

  cli_args args{};

  try {
    app.parse(argc, argv);
  } catch (CLI::CallForHelp const &) {
    args.cli_output = app.help();
  } catch (CLI::ParseError const &e) { args.cli_output = std::string(e.what()); }

  // --trace with no value means stderr
  bool const trace_requested{ trace_option->count() > 0 };
  std::vector<std::string> trace_specs_tokens;

  if (trace_requested) {
    if (trace_spec.empty()) {
      trace_specs_tokens.push_back("stderr");
    } else {
      for (std::string_view sv{ trace_spec }; !sv.empty();) {
        auto const pos{ sv.find(',') };
        auto const token{ sv.substr(0, pos) };
        if (!token.empty()) { trace_specs_tokens.emplace_back(token); }
        sv = (pos == std::string_view::npos) ? std::string_view{} : sv.substr(pos + 1);
      }
    }
  }

  if (!trace_specs_tokens.empty()) {
    args.verbosity = tui::level::TUI_TRACE;
    args.decorated_logging = true;
    for (auto const &spec : trace_specs_tokens) {
      if (spec == "stderr") {
        args.trace_outputs.push_back({ tui::trace_output_type::std_err, std::nullopt });
      } else if (spec.rfind("file:", 0) == 0 && spec.size() > 5) {
        args.trace_outputs.push_back(
            { tui::trace_output_type::file, std::filesystem::path{ spec.substr(5) } });
      } else {
        args.cli_output = "Invalid trace output spec: " + spec;
        args.trace_outputs.clear();
        cmd_cfg.reset();
        break;
      }
    }
  } else if (verbose) {
    args.verbosity = tui::level::TUI_DEBUG;
    args.decorated_logging = true;
  } else {
    args.verbosity = tui::level::TUI_INFO;
    args.decorated_logging = false;
  }

  if ((version_flag_short || version_flag_long) && args.cli_output.empty()) {
    args.cmd_cfg = cmd_version::cfg{};
    return args;
  }

  if (cmd_cfg) {
    args.cmd_cfg = *cmd_cfg;
  } else if (args.cli_output.empty()) {
    args.cli_output = app.help();
  }

  return args;
}

}  // namespace quire
