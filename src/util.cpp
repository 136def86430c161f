#include "util.h"

#include "platform.h"

#include <algorithm>
#include <array>
#include <cctype>
#include <cstdio>
#include <iomanip>
#include <random>
#include <sstream>
#include <stdexcept>
#include <system_error>
#include <utility>

namespace quire {

namespace {

unsigned char fold(char c) {
  return static_cast<unsigned char>(std::tolower(static_cast<unsigned char>(c)));
}

}  // namespace

std::string util_bytes_to_hex(void const *data, size_t length) {
  static constexpr char hex_chars[] = "0123456789abcdef";

  auto const bytes = static_cast<unsigned char const *>(data);
  std::string result;
  result.reserve(length * 2);

  for (size_t i{}; i < length; ++i) {
    result += hex_chars[(bytes[i] >> 4) & 0xf];
    result += hex_chars[bytes[i] & 0xf];
  }

  return result;
}

int util_hex_char_to_int(char c) {
  if (c >= '0' && c <= '9') { return c - '0'; }
  if (c >= 'a' && c <= 'f') { return c - 'a' + 10; }
  if (c >= 'A' && c <= 'F') { return c - 'A' + 10; }
  return -1;
}

std::vector<unsigned char> util_hex_to_bytes(std::string const &hex) {
  if (hex.size() % 2 != 0) {
    throw std::runtime_error("util_hex_to_bytes: hex string must have even length, got " +
                             std::to_string(hex.size()));
  }

  std::vector<unsigned char> result;
  result.reserve(hex.size() / 2);

  for (size_t i{}; i < hex.size(); i += 2) {
    int const hi{ util_hex_char_to_int(hex[i]) };
    int const lo{ util_hex_char_to_int(hex[i + 1]) };

    if (hi < 0 || lo < 0) {
      throw std::runtime_error("util_hex_to_bytes: invalid character at position " +
                               std::to_string(hi < 0 ? i : i + 1));
    }

    result.push_back(static_cast<unsigned char>((hi << 4) | lo));
  }

  return result;
}

bool util_iequals(std::string_view lhs, std::string_view rhs) {
  return std::ranges::equal(lhs, rhs, {}, fold, fold);
}

bool util_iless(std::string_view lhs, std::string_view rhs) {
  return std::ranges::lexicographical_compare(lhs, rhs, {}, fold, fold);
}

void file_deleter::operator()(std::FILE *file) const noexcept {
  if (file) { static_cast<void>(std::fclose(file)); }
}

file_ptr_t util_open_file(std::filesystem::path const &path, char const *mode) {
  return file_ptr_t{ std::fopen(path.c_str(), mode) };
}

std::string util_load_file(std::filesystem::path const &path) {
  auto file{ util_open_file(path, "rb") };
  if (!file) {
    throw std::runtime_error("util_load_file: failed to open file: " + path.string());
  }

  std::string contents;
  char buf[16384];
  for (;;) {
    size_t const n{ std::fread(buf, 1, sizeof(buf), file.get()) };
    contents.append(buf, n);
    if (n < sizeof(buf)) { break; }
  }

  if (std::ferror(file.get())) {
    throw std::runtime_error("util_load_file: failed to read file: " + path.string());
  }
  return contents;
}

void util_write_file_atomic(std::filesystem::path const &path, std::string_view contents) {
  static thread_local std::mt19937_64 rng{ std::random_device{}() };

  std::filesystem::path tmp{ path };
  tmp += ".tmp-" + std::to_string(rng());

  scoped_path_cleanup tmp_cleanup{ tmp };
  {
    file_ptr_t file{ util_open_file(tmp, "wb") };
    if (!file) {
      throw std::runtime_error("util_write_file_atomic: failed to open " + tmp.string());
    }

    if (!contents.empty() &&
        std::fwrite(contents.data(), 1, contents.size(), file.get()) != contents.size()) {
      throw std::runtime_error("util_write_file_atomic: short write to " + tmp.string());
    }

    if (std::fflush(file.get()) != 0) {
      throw std::runtime_error("util_write_file_atomic: failed to flush " + tmp.string());
    }
  }

  try {
    platform::atomic_rename(tmp, path);
  } catch (std::system_error const &e) {
    throw std::runtime_error(std::string("util_write_file_atomic: ") + e.what());
  }
  tmp_cleanup.reset();
}

std::string util_format_bytes(std::uint64_t bytes) {
  static constexpr std::array<char const *, 5> kUnits{ "B", "KB", "MB", "GB", "TB" };

  double value{ static_cast<double>(bytes) };
  std::size_t unit{ 0 };

  while (value >= 1024.0 && unit + 1 < kUnits.size()) {
    value /= 1024.0;
    ++unit;
  }

  if (unit == 0) { return std::to_string(static_cast<std::uint64_t>(value)) + "B"; }

  std::ostringstream oss;
  oss.setf(std::ios::fixed, std::ios::floatfield);
  oss << std::setprecision(1) << value << kUnits[unit];
  return oss.str();
}

scoped_path_cleanup::scoped_path_cleanup(std::filesystem::path path)
    : path_{ std::move(path) } {}

scoped_path_cleanup::~scoped_path_cleanup() { cleanup(); }

void scoped_path_cleanup::reset(std::filesystem::path path) {
  cleanup();
  path_ = std::move(path);
}

void scoped_path_cleanup::cleanup() {
  if (path_.empty()) { return; }
  std::error_code ec;
  std::filesystem::remove(path_, ec);
  path_.clear();
}

}  // namespace quire
