#pragma once

#include "cmd.h"

namespace quire {

class cmd_version : public cmd {
 public:
  struct cfg : cmd_cfg<cmd_version> {};

  explicit cmd_version(cfg cfg);

  void execute() override;
  cfg const &get_cfg() const { return cfg_; }

 private:
  cfg cfg_;
};

}  // namespace quire
