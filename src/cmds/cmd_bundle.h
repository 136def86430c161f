#pragma once

#include "cmd.h"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace quire {

class cmd_bundle : public cmd {
 public:
  struct cfg : cmd_cfg<cmd_bundle> {
    std::vector<std::string> systems;
    std::filesystem::path target;
    std::optional<std::filesystem::path> dist;
    std::optional<std::filesystem::path> cache_root;
  };

  explicit cmd_bundle(cfg cfg);

  void execute() override;
  cfg const &get_cfg() const { return cfg_; }

 private:
  cfg cfg_;
};

}  // namespace quire
