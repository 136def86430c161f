#include "cmd.h"
#include "cmd_bundle.h"
#include "cmd_common.h"
#include "cmd_resolve.h"

#include "archive_cache.h"
#include "bundle_error.h"
#include "lua_catalog.h"
#include "test_support.h"

#include "doctest.h"

#include <filesystem>
#include <optional>
#include <string>
#include <type_traits>
#include <vector>

namespace {

class test_cmd : public quire::cmd {
 public:
  struct cfg : quire::cmd_cfg<test_cmd> {};
  explicit test_cmd(cfg) {}
  void execute() override {}
};

void write_dist(quire::test::temp_dir const &dir) {
  quire::test::write_tgz(dir / "dist" / "archives" / "alpha-1.0.tgz",
                         { { "alpha-1.0/alpha.src", "(alpha)\n" } });
  quire::test::write_tgz(dir / "dist" / "archives" / "beta-2.0.tgz",
                         { { "beta-2.0/beta.src", "(beta)\n" } });
  quire::test::write_text(dir / "dist" / "quire-dist.lua", R"lua(
RELEASES = {
  ["alpha-1.0"] = {
    archive = "archives/alpha-1.0.tgz",
    systems = { { name = "alpha", files = { "alpha.src" } } },
  },
  ["beta-2.0"] = {
    archive = "archives/beta-2.0.tgz",
    systems = { { name = "beta", files = { "beta.src" }, depends = { "alpha" } } },
  },
}
)lua");
}

}  // namespace

TEST_CASE("cmd_cfg exposes cmd_t alias") {
  CHECK(std::is_same_v<test_cmd::cfg::cmd_t, test_cmd>);
  CHECK(std::is_same_v<quire::cmd_bundle::cfg::cmd_t, quire::cmd_bundle>);
}

TEST_CASE("cmd factory creates command from cfg") {
  auto cmd{ quire::cmd::create(test_cmd::cfg{}) };
  REQUIRE(cmd);
  CHECK(dynamic_cast<test_cmd *>(cmd.get()));
}

TEST_CASE("cmd_resolve_dist_root defaults to the current directory") {
  CHECK(quire::cmd_resolve_dist_root(std::nullopt) ==
        std::filesystem::current_path().lexically_normal());
  CHECK(quire::cmd_resolve_dist_root(std::filesystem::path{ "/a/b/../dist" }) ==
        std::filesystem::path{ "/a/dist" });
}

TEST_CASE("cmd_resolve_cache_root prefers the explicit value") {
  CHECK(quire::cmd_resolve_cache_root(std::filesystem::path{ "/cache/./root" }) ==
        std::filesystem::path{ "/cache/root" });
}

TEST_CASE("cmd_bundle writes a bundle from a distribution directory") {
  quire::test::temp_dir dir{ "cmd-bundle" };
  write_dist(dir);

  quire::cmd_bundle::cfg cfg{};
  cfg.systems = { "beta" };
  cfg.target = dir / "out";
  cfg.dist = dir / "dist";
  cfg.cache_root = dir / "cache";

  auto const dist_before{ quire::test::list_files(dir / "dist") };
  auto cmd{ quire::cmd::create(cfg) };
  cmd->execute();

  CHECK(quire::test::list_files(dir / "dist") == dist_before);
  CHECK(quire::test::read_text(dir / "out" / "system-index.txt") ==
        "software/alpha-1.0/alpha.src\nsoftware/beta-2.0/beta.src\n");
  CHECK(std::filesystem::exists(dir / "out" / "bundle-loader.lua"));
  auto const beta{ quire::lua_catalog{ dir / "dist" }.lookup_release("beta-2.0") };
  REQUIRE(beta);
  CHECK(quire::archive_cache::is_entry_complete(
      quire::archive_cache{ dir / "cache" }.entry_dir(*beta)));
}

TEST_CASE("cmd_bundle fails on an unknown system without writing") {
  quire::test::temp_dir dir{ "cmd-bundle" };
  write_dist(dir);

  quire::cmd_bundle::cfg cfg{};
  cfg.systems = { "gamma" };
  cfg.target = dir / "out";
  cfg.dist = dir / "dist";
  cfg.cache_root = dir / "cache";

  auto const dist_before{ quire::test::list_files(dir / "dist") };
  CHECK_THROWS_WITH_AS(quire::cmd::create(cfg)->execute(),
                       "System not found: gamma",
                       quire::bundle_error);
  CHECK_FALSE(std::filesystem::exists(dir / "out"));
  CHECK(quire::test::list_files(dir / "dist") == dist_before);
  CHECK_FALSE(std::filesystem::exists(dir / "dist" / "quire-dist.lock"));
}

TEST_CASE("cmd_resolve fails on an unknown system") {
  quire::test::temp_dir dir{ "cmd-resolve" };
  write_dist(dir);

  quire::cmd_resolve::cfg cfg{};
  cfg.systems = { "alpha", "delta" };
  cfg.dist = dir / "dist";

  auto const dist_before{ quire::test::list_files(dir / "dist") };
  CHECK_THROWS_WITH_AS(quire::cmd::create(cfg)->execute(),
                       "System not found: delta",
                       quire::bundle_error);
  CHECK(quire::test::list_files(dir / "dist") == dist_before);
}
