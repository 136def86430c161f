#pragma once

#include "cmd.h"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace quire {

// Prints the closure of the requested systems without writing anything.
class cmd_resolve : public cmd {
 public:
  struct cfg : cmd_cfg<cmd_resolve> {
    std::vector<std::string> systems;
    std::optional<std::filesystem::path> dist;
  };

  explicit cmd_resolve(cfg cfg);

  void execute() override;
  cfg const &get_cfg() const { return cfg_; }

 private:
  cfg cfg_;
};

}  // namespace quire
