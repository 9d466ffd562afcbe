#include "cmd.h"

#include "doctest.h"

namespace {

class test_cmd : public sdkgraph::cmd {
 public:
  struct cfg : sdkgraph::cmd_cfg<test_cmd> {
    bool result{ true };
  };
  explicit test_cmd(cfg c) : cfg_{ c } {}
  bool execute() override { return cfg_.result; }

 private:
  cfg cfg_;
};

}  // namespace

TEST_CASE("cmd_cfg exposes cmd_t alias") {
  using config_type = test_cmd::cfg;
  using expected_command = test_cmd;
  using actual_command = config_type::cmd_t;
  CHECK(std::is_same_v<actual_command, expected_command>);
}

TEST_CASE("cmd factory creates command from cfg") {
  test_cmd::cfg cfg{};
  cfg.result = false;
  auto cmd{ sdkgraph::cmd::create(cfg) };
  REQUIRE(cmd);
  CHECK(dynamic_cast<test_cmd *>(cmd.get()));
  CHECK_FALSE(cmd->execute());
}
