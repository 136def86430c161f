#pragma once

#include "cmds/cmd_bundle.h"
#include "cmds/cmd_resolve.h"
#include "cmds/cmd_version.h"
#include "tui.h"

#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace quire {

struct cli_args {
  using cmd_cfg_t = std::variant<cmd_bundle::cfg, cmd_resolve::cfg, cmd_version::cfg>;

  std::optional<cmd_cfg_t> cmd_cfg;
  std::optional<tui::level> verbosity;
  bool decorated_logging{ false };
  std::vector<tui::trace_output_spec> trace_outputs;
  std::string cli_output;  // help text or parse error
};

cli_args cli_parse(int argc, char **argv);

}  // namespace quire
