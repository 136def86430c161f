#include "cli.h"
#include "tui.h"

#include <cstdlib>
#include <exception>
#include <variant>

int main(int argc, char **argv) {
  quire::tui::init();

  auto args{ quire::cli_parse(argc, argv) };
  quire::tui::configure_trace_outputs(args.trace_outputs);
  quire::tui::scope tui_scope{ args.verbosity, args.decorated_logging };

  if (!args.cmd_cfg.has_value()) {
    quire::tui::error("%s", args.cli_output.c_str());
    return EXIT_FAILURE;
  }

  auto cmd{ std::visit([](auto const &cfg) { return quire::cmd::create(cfg); },
                       *args.cmd_cfg) };

  try {
    cmd->execute();
  } catch (std::exception const &ex) {
    quire::tui::error("%s", ex.what());
    return EXIT_FAILURE;
  }

  return EXIT_SUCCESS;
}
