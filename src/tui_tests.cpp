#include "tui.h"

#include "test_support.h"

#include "doctest.h"

#include <filesystem>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

TEST_CASE("tui init can only run once") {
  CHECK_THROWS_AS(quire::tui::init(), std::logic_error);
}

TEST_CASE("tui enforces run/shutdown sequencing") {
  auto const handler{ [](std::string_view) {} };
  CHECK_NOTHROW(quire::tui::set_output_handler(handler));
  CHECK_NOTHROW(quire::tui::run(quire::tui::level::TUI_INFO));
  CHECK_THROWS_AS(quire::tui::set_output_handler(handler), std::logic_error);
  CHECK_THROWS_AS(quire::tui::run(std::nullopt), std::logic_error);
  CHECK_NOTHROW(quire::tui::shutdown());
  CHECK_THROWS_AS(quire::tui::shutdown(), std::logic_error);
  CHECK_NOTHROW(quire::tui::set_output_handler(handler));
}

namespace {

struct captured_output {
  std::vector<std::string> messages;

  captured_output() {
    quire::tui::set_output_handler(
        [this](std::string_view value) { messages.emplace_back(value); });
  }

  ~captured_output() { quire::tui::set_output_handler([](std::string_view) {}); }
};

void expect_json_tokens(quire::trace_event_t const &event, std::vector<std::string> tokens) {
  auto const json{ quire::trace_event_to_json(event) };
  CHECK(json.front() == '{');
  CHECK(json.back() == '}');
  CHECK_MESSAGE(json.find("\"ts\":\"") != std::string::npos, "missing timestamp: " << json);
  tokens.push_back("\"event\":\"" + std::string{ quire::trace_event_name(event) } + "\"");
  for (auto const &token : tokens) {
    CHECK_MESSAGE(json.find(token) != std::string::npos,
                  "missing token: " << token << " in json: " << json);
  }
}

}  // namespace

TEST_CASE_FIXTURE(captured_output, "tui logs are raw messages when undecorated") {
  CHECK_NOTHROW(quire::tui::run(quire::tui::level::TUI_DEBUG));
  quire::tui::debug("hello %s", "world");
  quire::tui::info("value %d", 42);
  quire::tui::warn("three %d", 3);
  quire::tui::error("boom");
  CHECK_NOTHROW(quire::tui::shutdown());

  CHECK(messages ==
        std::vector<std::string>{ "hello world\n", "value 42\n", "three 3\n", "boom\n" });
}

TEST_CASE_FIXTURE(captured_output, "tui decorated logs carry a level prefix") {
  CHECK_NOTHROW(quire::tui::run(quire::tui::level::TUI_DEBUG, true));
  quire::tui::info("structured %d", 7);
  CHECK_NOTHROW(quire::tui::shutdown());

  REQUIRE(messages.size() == 1);
  auto const &line{ messages[0] };
  CHECK(line.front() == '[');
  CHECK(line.find("] [INF] ") != std::string::npos);
  CHECK(line.ends_with("structured 7\n"));
}

TEST_CASE_FIXTURE(captured_output, "tui severity filtering honors threshold") {
  CHECK_NOTHROW(quire::tui::run(quire::tui::level::TUI_WARN));
  quire::tui::debug("debug");
  quire::tui::info("info");
  quire::tui::warn("warn");
  quire::tui::error("error");
  CHECK_NOTHROW(quire::tui::shutdown());

  CHECK(messages == std::vector<std::string>{ "warn\n", "error\n" });
}

TEST_CASE_FIXTURE(captured_output, "tui writes synchronously while not running") {
  CHECK_NOTHROW(quire::tui::run(quire::tui::level::TUI_INFO));
  CHECK_NOTHROW(quire::tui::shutdown());
  quire::tui::warn("early %s", "warning");
  CHECK(messages == std::vector<std::string>{ "early warning\n" });
}

TEST_CASE_FIXTURE(captured_output, "tui trace events reach the handler") {
  quire::tui::configure_trace_outputs({ { quire::tui::trace_output_type::std_err, std::nullopt } });
  CHECK(quire::tui::g_trace_enabled);
  CHECK_NOTHROW(quire::tui::run(quire::tui::level::TUI_TRACE));

  QUIRE_TRACE_DEPENDENCY_ADDED(std::string{ "beta" }, std::string{ "alpha" });

  CHECK_NOTHROW(quire::tui::shutdown());
  quire::tui::configure_trace_outputs({});
  CHECK_FALSE(quire::tui::g_trace_enabled);

  REQUIRE(messages.size() == 1);
  CHECK(messages[0] == "dependency_added parent=beta dependency=alpha\n");
}

TEST_CASE_FIXTURE(captured_output, "trace macros are inert when tracing is disabled") {
  quire::tui::configure_trace_outputs({});
  CHECK_NOTHROW(quire::tui::run(quire::tui::level::TUI_TRACE));
  QUIRE_TRACE_CATALOG_LOOKUP(std::string{ "system" }, std::string{ "alpha" }, true);
  QUIRE_TRACE_ARTIFACT_WRITTEN(std::string{ "/out/system-index.txt" }, 42);
  CHECK_NOTHROW(quire::tui::shutdown());
  CHECK(messages.empty());
}

TEST_CASE("trace file output writes JSONL") {
  quire::test::temp_dir dir{ "trace" };
  auto const trace_path{ dir / "trace.jsonl" };

  quire::tui::configure_trace_outputs({ { quire::tui::trace_output_type::file, trace_path } });
  CHECK_NOTHROW(quire::tui::run(quire::tui::level::TUI_TRACE));
  QUIRE_TRACE_RELEASE_REGISTERED(std::string{ "alpha-1.0" }, 2);
  QUIRE_TRACE_SYSTEM_REGISTERED(std::string{ "alpha" }, std::string{ "alpha-1.0" });
  CHECK_NOTHROW(quire::tui::shutdown());
  quire::tui::configure_trace_outputs({});

  auto const contents{ quire::test::read_text(trace_path) };
  auto const first_nl{ contents.find('\n') };
  REQUIRE(first_nl != std::string::npos);
  CHECK(contents.find("\"event\":\"release_registered\"") < first_nl);
  CHECK(contents.find("\"event\":\"system_registered\"") > first_nl);
  CHECK(contents.back() == '\n');
}

TEST_CASE("configure_trace_outputs rejects multiple file outputs") {
  quire::test::temp_dir dir{ "trace" };
  CHECK_THROWS_AS(quire::tui::configure_trace_outputs(
                      { { quire::tui::trace_output_type::file, dir / "a.jsonl" },
                        { quire::tui::trace_output_type::file, dir / "b.jsonl" } }),
                  std::logic_error);
  quire::tui::configure_trace_outputs({});
}

TEST_CASE("trace_event_to_json serializes every event type") {
  using namespace quire::trace_events;

  expect_json_tokens(catalog_lookup{ .kind = "system", .name = "alpha", .found = false },
                     { "\"kind\":\"system\"", "\"name\":\"alpha\"", "\"found\":false" });
  expect_json_tokens(snapshot_acquired{ .catalog = "/dist",
                                        .lock_path = "/dist/quire-dist.lock",
                                        .wait_duration_ms = 5 },
                     { "\"catalog\":\"/dist\"",
                       "\"lock_path\":\"/dist/quire-dist.lock\"",
                       "\"wait_duration_ms\":5" });
  expect_json_tokens(snapshot_released{ .catalog = "/dist", .hold_duration_ms = 12 },
                     { "\"hold_duration_ms\":12" });
  expect_json_tokens(release_registered{ .release = "alpha-1.0", .system_count = 2 },
                     { "\"release\":\"alpha-1.0\"", "\"system_count\":2" });
  expect_json_tokens(system_registered{ .system = "alpha", .release = "alpha-1.0" },
                     { "\"system\":\"alpha\"", "\"release\":\"alpha-1.0\"" });
  expect_json_tokens(dependency_added{ .parent = "beta", .dependency = "alpha" },
                     { "\"parent\":\"beta\"", "\"dependency\":\"alpha\"" });
  expect_json_tokens(archive_cache_hit{ .release = "alpha-1.0", .archive_path = "/c/a.tgz" },
                     { "\"archive_path\":\"/c/a.tgz\"" });
  expect_json_tokens(archive_fetch_start{ .release = "alpha-1.0",
                                          .url = "https://x/a.tgz",
                                          .destination = "/c/a.tgz" },
                     { "\"url\":\"https://x/a.tgz\"", "\"destination\":\"/c/a.tgz\"" });
  expect_json_tokens(archive_fetch_complete{ .release = "alpha-1.0",
                                             .url = "https://x/a.tgz",
                                             .bytes_downloaded = 2048,
                                             .duration_ms = 30 },
                     { "\"bytes_downloaded\":2048", "\"duration_ms\":30" });
  expect_json_tokens(extract_start{ .release = "alpha-1.0",
                                    .archive_path = "/out/software/alpha-1.0.tar",
                                    .destination = "/out/software/alpha-1.0" },
                     { "\"destination\":\"/out/software/alpha-1.0\"" });
  expect_json_tokens(extract_complete{ .release = "alpha-1.0",
                                       .files_extracted = 3,
                                       .duration_ms = 1 },
                     { "\"files_extracted\":3" });
  expect_json_tokens(artifact_written{ .path = "/out/system-index.txt", .bytes = 52 },
                     { "\"path\":\"/out/system-index.txt\"", "\"bytes\":52" });
}

TEST_CASE("trace_event_to_json escapes special characters") {
  auto const json{ quire::trace_event_to_json(
      quire::trace_events::system_registered{ .system = "we\"ird\\name\n",
                                              .release = "r\t1" }) };
  CHECK(json.find(R"("system":"we\"ird\\name\n")") != std::string::npos);
  CHECK(json.find(R"("release":"r\t1")") != std::string::npos);
}

TEST_CASE("trace_event_to_string formats key=value pairs") {
  CHECK(quire::trace_event_to_string(quire::trace_events::catalog_lookup{
            .kind = "release", .name = "beta-2.0", .found = true }) ==
        "catalog_lookup kind=release name=beta-2.0 found=true");
  CHECK(quire::trace_event_to_string(quire::trace_events::extract_complete{
            .release = "beta-2.0", .files_extracted = 4, .duration_ms = 9 }) ==
        "extract_complete release=beta-2.0 files=4 duration_ms=9");
  CHECK(quire::trace_event_to_string(quire::trace_events::snapshot_acquired{
            .catalog = "/d", .lock_path = "/d/l", .wait_duration_ms = 0 }) ==
        "snapshot_acquired catalog=/d lock_path=/d/l wait_ms=0");
}
