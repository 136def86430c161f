#include "libcurl_util.h"

#include <curl/curl.h>

#include <fstream>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>

#ifndef QUIRE_VERSION_STR
#error "QUIRE_VERSION_STR must be defined by the build system"
#endif

namespace quire {

namespace {

constexpr char kDefaultUserAgent[]{ "quire/" QUIRE_VERSION_STR };

struct download_sink {
  std::ofstream stream;
  std::uint64_t written{ 0 };
};

size_t curl_write_file(char *ptr, size_t size, size_t nmemb, void *userdata) {
  auto *sink{ static_cast<download_sink *>(userdata) };
  size_t const total{ size * nmemb };
  sink->stream.write(ptr, static_cast<std::streamsize>(total));
  if (!sink->stream) { return 0; }
  sink->written += total;
  return total;
}

}  // namespace

void libcurl_ensure_initialized() {
  static std::once_flag once;
  std::call_once(once, [] {
    CURLcode const code{ curl_global_init(CURL_GLOBAL_DEFAULT) };
    if (code != CURLE_OK) {
      throw std::runtime_error(std::string("curl_global_init failed: ") +
                               curl_easy_strerror(code));
    }
  });
}

std::uint64_t libcurl_download(std::string_view url,
                               std::filesystem::path const &destination) {
  libcurl_ensure_initialized();

  if (destination.empty()) {
    throw std::invalid_argument("libcurl_download: destination is empty");
  }

  std::string const url_copy{ url };

  download_sink sink;
  sink.stream.open(destination, std::ios::binary | std::ios::trunc);
  if (!sink.stream.is_open()) {
    throw std::runtime_error("libcurl_download: failed to open destination: " +
                             destination.string());
  }

  std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> handle{ curl_easy_init(),
                                                              &curl_easy_cleanup };
  if (!handle) { throw std::runtime_error("curl_easy_init failed"); }

  auto const setopt = [handle = handle.get()](auto option, auto value) {
    CURLcode const rc{ curl_easy_setopt(handle, option, value) };
    if (rc != CURLE_OK) {
      throw std::runtime_error(std::string("curl_easy_setopt failed: ") +
                               curl_easy_strerror(rc));
    }
  };

  setopt(CURLOPT_URL, url_copy.c_str());
  setopt(CURLOPT_FOLLOWLOCATION, 1L);
  setopt(CURLOPT_FAILONERROR, 1L);
  setopt(CURLOPT_NOSIGNAL, 1L);
  setopt(CURLOPT_USERAGENT, kDefaultUserAgent);
  setopt(CURLOPT_WRITEFUNCTION, curl_write_file);
  setopt(CURLOPT_WRITEDATA, &sink);
  setopt(CURLOPT_NOPROGRESS, 1L);

  auto const discard_partial = [&] {
    sink.stream.close();
    std::error_code ec;
    std::filesystem::remove(destination, ec);
  };

  CURLcode const perform_result{ curl_easy_perform(handle.get()) };
  if (perform_result != CURLE_OK) {
    discard_partial();
    throw std::runtime_error(std::string("curl_easy_perform failed: ") +
                             curl_easy_strerror(perform_result) + ": " + url_copy);
  }

  sink.stream.flush();
  if (!sink.stream) {
    discard_partial();
    throw std::runtime_error("libcurl_download: failed to flush destination file: " +
                             destination.string());
  }
  sink.stream.close();

  return sink.written;
}

}  // namespace quire
