#include "uri.h"

#include "doctest.h"

#include <filesystem>
#include <stdexcept>
#include <string_view>

namespace {

std::filesystem::path normalize(std::filesystem::path const &p) {
  return std::filesystem::absolute(p).lexically_normal();
}

void expect_uri(std::string_view input,
                quire::uri_scheme expected_scheme,
                std::string_view expected_canonical) {
  auto const info{ quire::uri_classify(input) };
  CHECK(info.scheme == expected_scheme);
  CHECK(info.canonical == expected_canonical);
}

}  // namespace

TEST_CASE("uri_classify detects http and ftp schemes") {
  expect_uri("http://example.com/alpha-1.0.tgz",
             quire::uri_scheme::HTTP,
             "http://example.com/alpha-1.0.tgz");
  expect_uri("https://example.com/alpha-1.0.tgz",
             quire::uri_scheme::HTTPS,
             "https://example.com/alpha-1.0.tgz");
  expect_uri("HTTPS://EXAMPLE.COM/FILE", quire::uri_scheme::HTTPS, "HTTPS://EXAMPLE.COM/FILE");
  expect_uri("ftp://mirror.example/beta.tgz",
             quire::uri_scheme::FTP,
             "ftp://mirror.example/beta.tgz");
  expect_uri("ftps://mirror.example/beta.tgz",
             quire::uri_scheme::FTPS,
             "ftps://mirror.example/beta.tgz");
}

TEST_CASE("uri_classify reduces file URIs to paths") {
  expect_uri("file:///srv/dist/alpha.tgz",
             quire::uri_scheme::LOCAL_FILE_ABSOLUTE,
             "/srv/dist/alpha.tgz");
  expect_uri("file://localhost/srv/dist/alpha.tgz",
             quire::uri_scheme::LOCAL_FILE_ABSOLUTE,
             "/srv/dist/alpha.tgz");
  expect_uri("file://server/share/alpha.tgz",
             quire::uri_scheme::LOCAL_FILE_ABSOLUTE,
             "//server/share/alpha.tgz");
  expect_uri("file:////server/share/alpha.tgz",
             quire::uri_scheme::LOCAL_FILE_ABSOLUTE,
             "//server/share/alpha.tgz");
}

TEST_CASE("uri_classify detects plain paths") {
  expect_uri("/srv/dist/alpha.tgz", quire::uri_scheme::LOCAL_FILE_ABSOLUTE, "/srv/dist/alpha.tgz");
  expect_uri("archives/alpha.tgz", quire::uri_scheme::LOCAL_FILE_RELATIVE, "archives/alpha.tgz");
  expect_uri("../alpha.tgz", quire::uri_scheme::LOCAL_FILE_RELATIVE, "../alpha.tgz");
}

TEST_CASE("uri_classify handles whitespace and unknown schemes") {
  expect_uri("  https://example.com/a.tgz \n",
             quire::uri_scheme::HTTPS,
             "https://example.com/a.tgz");
  expect_uri("s3://bucket/a.tgz", quire::uri_scheme::UNKNOWN, "s3://bucket/a.tgz");
  expect_uri("", quire::uri_scheme::UNKNOWN, "");
  expect_uri("   ", quire::uri_scheme::UNKNOWN, "");
}

TEST_CASE("uri_is_remote") {
  CHECK(quire::uri_is_remote(quire::uri_scheme::HTTP));
  CHECK(quire::uri_is_remote(quire::uri_scheme::HTTPS));
  CHECK(quire::uri_is_remote(quire::uri_scheme::FTP));
  CHECK(quire::uri_is_remote(quire::uri_scheme::FTPS));
  CHECK_FALSE(quire::uri_is_remote(quire::uri_scheme::LOCAL_FILE_ABSOLUTE));
  CHECK_FALSE(quire::uri_is_remote(quire::uri_scheme::LOCAL_FILE_RELATIVE));
  CHECK_FALSE(quire::uri_is_remote(quire::uri_scheme::UNKNOWN));
}

TEST_CASE("uri_resolve_local_file_relative anchors relative paths") {
  auto const dist_root{ std::filesystem::current_path() / "dists/example" };
  CHECK(quire::uri_resolve_local_file_relative("archives/alpha.tgz", dist_root) ==
        normalize(dist_root / "archives/alpha.tgz"));
  CHECK(quire::uri_resolve_local_file_relative("./archives/../alpha.tgz", dist_root) ==
        normalize(dist_root / "alpha.tgz"));
}

TEST_CASE("uri_resolve_local_file_relative without anchor uses the current directory") {
  CHECK(quire::uri_resolve_local_file_relative("relative/file.tgz", std::nullopt) ==
        normalize("relative/file.tgz"));
}

TEST_CASE("uri_resolve_local_file_relative keeps absolute paths and file URIs") {
  auto const dist_root{ std::filesystem::current_path() / "dists/example" };
  CHECK(quire::uri_resolve_local_file_relative("/srv/alpha.tgz", dist_root) ==
        std::filesystem::path("/srv/alpha.tgz"));
  CHECK(quire::uri_resolve_local_file_relative("file:///srv/alpha.tgz", dist_root) ==
        std::filesystem::path("/srv/alpha.tgz"));
}

TEST_CASE("uri_resolve_local_file_relative rejects remote and empty values") {
  CHECK_THROWS_AS(quire::uri_resolve_local_file_relative("https://example.com/a.tgz",
                                                         std::nullopt),
                  std::invalid_argument);
  CHECK_THROWS_AS(quire::uri_resolve_local_file_relative("", std::nullopt),
                  std::invalid_argument);
  CHECK_THROWS_AS(quire::uri_resolve_local_file_relative("  ", std::nullopt),
                  std::invalid_argument);
}

TEST_CASE("uri_extract_filename") {
  CHECK(quire::uri_extract_filename("https://example.com/dist/alpha-1.0.tgz") ==
        "alpha-1.0.tgz");
  CHECK(quire::uri_extract_filename("https://example.com/a.tgz?token=1#frag") == "a.tgz");
  CHECK(quire::uri_extract_filename("/srv/dist/beta.tar.gz") == "beta.tar.gz");
  CHECK(quire::uri_extract_filename("beta.tgz") == "beta.tgz");
  CHECK(quire::uri_extract_filename("https://example.com/dist/").empty());
  CHECK(quire::uri_extract_filename("https://example.com").empty());
  CHECK(quire::uri_extract_filename("").empty());
}
