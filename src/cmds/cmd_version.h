#pragma once

#include "cmd.h"

namespace sdkgraph {

class cmd_version : public cmd {
 public:
  struct cfg : cmd_cfg<cmd_version> {};

  explicit cmd_version(cfg cfg);

  bool execute() override;

 private:
  cfg cfg_;
};

}  // namespace sdkgraph
