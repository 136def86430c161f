#include "cmd_version.h"

#include "tui.h"

#include "CLI11.hpp"
#include "archive.h"
#include "mbedtls/version.h"
#include "sol/sol.hpp"

#include <curl/curl.h>

#include <array>
#include <utility>

#ifndef QUIRE_VERSION_STR
#error "QUIRE_VERSION_STR must be defined by the build system"
#endif

namespace quire {

cmd_version::cmd_version(cmd_version::cfg cfg) : cfg_{ std::move(cfg) } {}

void cmd_version::execute() {
  tui::info("quire version %s", QUIRE_VERSION_STR);
  tui::info("Third-party component versions:");

  curl_version_info_data const *curl_info{ curl_version_info(CURLVERSION_NOW) };
  tui::info("  libcurl: %s", curl_info->version);

  std::array<char, 32> mbedtls_version{};
  mbedtls_version_get_string_full(mbedtls_version.data());
  tui::info("  mbedTLS: %s", mbedtls_version.data());

  tui::info("  libarchive: %s", archive_version_details());
  tui::info("  Lua: %s", LUA_RELEASE);
  tui::info("  Sol2: %s", SOL_VERSION_STRING);
  tui::info("  CLI11: %s", CLI11_VERSION);
}

}  // namespace quire
