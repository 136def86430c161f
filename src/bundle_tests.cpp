#include "bundle.h"

#include "bundle_error.h"
#include "test_support.h"

#include "doctest.h"

#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

using quire::test::make_release;
using quire::test::make_system;

namespace {

quire::test::fake_catalog make_alpha_beta_catalog() {
  quire::test::fake_catalog cat;
  cat.add_release(make_release("beta-2.0", { make_system("beta", { "beta.src" }, { "alpha" }) }));
  cat.add_release(make_release("alpha-1.0",
                               { make_system("alpha", { "alpha.src" }),
                                 make_system("alpha-tests", { "tests.src" }, { "alpha" }) }));
  return cat;
}

// Every system's release is registered and every registered release's systems are too.
void check_consistent(quire::bundle const &b) {
  for (auto const *sys : b.provided_systems()) {
    auto const *owner{ b.find_release(sys->release) };
    REQUIRE(owner);
  }
  for (auto const *release : b.provided_releases()) {
    for (auto const &sys : release->systems) { CHECK(b.find_system(sys.name)); }
  }
}

}  // namespace

TEST_CASE("bundle::ensure_system registers the system and its whole release") {
  auto cat{ make_alpha_beta_catalog() };
  quire::bundle b{ cat };

  auto const &alpha{ b.ensure_system("alpha") };
  CHECK(alpha.name == "alpha");
  CHECK(alpha.release == "alpha-1.0");

  CHECK(b.release_count() == 1);
  CHECK(b.system_count() == 2);
  CHECK(b.find_system("alpha-tests"));
  check_consistent(b);
}

TEST_CASE("bundle::ensure_system is idempotent and consults the catalog once") {
  auto cat{ make_alpha_beta_catalog() };
  quire::bundle b{ cat };

  auto const &first{ b.ensure_system("alpha") };
  auto const lookups{ cat.system_lookups + cat.release_lookups };
  auto const &second{ b.ensure_system("alpha") };
  auto const &sibling{ b.ensure_system("alpha-tests") };

  CHECK(&first == &second);
  CHECK(sibling.release == "alpha-1.0");
  CHECK(cat.system_lookups + cat.release_lookups == lookups);
}

TEST_CASE("bundle::ensure_release is idempotent") {
  auto cat{ make_alpha_beta_catalog() };
  quire::bundle b{ cat };

  auto const &first{ b.ensure_release("beta-2.0") };
  auto const &second{ b.ensure_release("beta-2.0") };

  CHECK(&first == &second);
  CHECK(cat.release_lookups == 1);
  CHECK(b.find_system("beta"));
  check_consistent(b);
}

TEST_CASE("bundle names compare case-insensitively") {
  auto cat{ make_alpha_beta_catalog() };
  quire::bundle b{ cat };

  auto const &lower{ b.ensure_system("alpha") };
  auto const &upper{ b.ensure_system("ALPHA") };

  CHECK(&lower == &upper);
  CHECK(b.find_release("Alpha-1.0") == b.find_release("alpha-1.0"));
  CHECK(b.system_count() == 2);
}

TEST_CASE("bundle::ensure_system throws SYSTEM_NOT_FOUND for unknown systems") {
  auto cat{ make_alpha_beta_catalog() };
  quire::bundle b{ cat };

  try {
    b.ensure_system("gamma");
    FAIL("expected bundle_error");
  } catch (quire::bundle_error const &e) {
    CHECK(e.kind() == quire::error_kind::SYSTEM_NOT_FOUND);
    CHECK(e.name() == "gamma");
  }
  CHECK(b.system_count() == 0);
  CHECK(b.release_count() == 0);
}

TEST_CASE("bundle::ensure_release throws RELEASE_NOT_FOUND for unknown releases") {
  auto cat{ make_alpha_beta_catalog() };
  quire::bundle b{ cat };

  try {
    b.ensure_release("delta-0.1");
    FAIL("expected bundle_error");
  } catch (quire::bundle_error const &e) {
    CHECK(e.kind() == quire::error_kind::RELEASE_NOT_FOUND);
    CHECK(e.name() == "delta-0.1");
  }
}

TEST_CASE("bundle::ensure_system surfaces a dangling release reference") {
  struct dangling_catalog : quire::test::fake_catalog {
    std::optional<quire::release_info> lookup_release(std::string_view) override {
      return std::nullopt;
    }
  } dangling;
  dangling.add_release(make_release("orphan-1.0", { make_system("orphan", { "o.src" }) }));

  quire::bundle b{ dangling };
  try {
    b.ensure_system("orphan");
    FAIL("expected bundle_error");
  } catch (quire::bundle_error const &e) {
    CHECK(e.kind() == quire::error_kind::RELEASE_NOT_FOUND);
    CHECK(e.name() == "orphan-1.0");
  }
  CHECK(b.system_count() == 0);
}

TEST_CASE("bundle::provided_* are sorted regardless of insertion order") {
  quire::test::fake_catalog cat;
  cat.add_release(make_release("zeta-1", { make_system("zeta", { "z.src" }) }));
  cat.add_release(make_release("Mu-1", { make_system("mu", { "m.src" }) }));
  cat.add_release(make_release("alpha-1", { make_system("Alpha", { "a.src" }) }));

  quire::bundle b{ cat };
  b.ensure_system("zeta");
  b.ensure_system("alpha");
  b.ensure_system("mu");

  std::vector<std::string> releases;
  for (auto const *r : b.provided_releases()) { releases.push_back(r->name); }
  CHECK(releases == std::vector<std::string>{ "alpha-1", "Mu-1", "zeta-1" });

  std::vector<std::string> systems;
  for (auto const *s : b.provided_systems()) { systems.push_back(s->name); }
  CHECK(systems == std::vector<std::string>{ "Alpha", "mu", "zeta" });
}

TEST_CASE("bundle::ensure_release fills a missing prefix with the release name") {
  quire::test::fake_catalog cat;
  auto r{ make_release("plain-3.1", { make_system("plain", { "p.src" }) }) };
  r.prefix.clear();
  cat.add_release(r);

  quire::bundle b{ cat };
  CHECK(b.ensure_release("plain-3.1").prefix == "plain-3.1");
}

TEST_CASE("bundle::mark_expanded flags a system once") {
  auto cat{ make_alpha_beta_catalog() };
  quire::bundle b{ cat };
  b.ensure_system("alpha");

  CHECK(b.mark_expanded("alpha"));
  CHECK_FALSE(b.mark_expanded("ALPHA"));
  CHECK(b.mark_expanded("alpha-tests"));
  CHECK_THROWS_AS(b.mark_expanded("beta"), std::logic_error);
}
