#include "cortex/common/fs.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <iomanip>
#include <openssl/rand.h>
#include <random>
#include <regex>
#include <sstream>

namespace cortex::common {

std::string trim(const std::string &input) {
  auto first = std::find_if_not(input.begin(), input.end(), [](unsigned char c) {
    return std::isspace(c) != 0;
  });
  auto last = std::find_if_not(input.rbegin(), input.rend(), [](unsigned char c) {
    return std::isspace(c) != 0;
  }).base();

  if (first >= last) {
    return "";
  }
  return std::string(first, last);
}

bool starts_with(const std::string &value, const std::string &prefix) {
  return value.rfind(prefix, 0) == 0;
}

std::string to_lower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return value;
}

std::vector<std::string> split(std::string_view value, const char delimiter) {
  std::vector<std::string> parts;
  std::size_t start = 0;
  while (true) {
    const std::size_t pos = value.find(delimiter, start);
    if (pos == std::string_view::npos) {
      parts.emplace_back(value.substr(start));
      break;
    }
    parts.emplace_back(value.substr(start, pos - start));
    start = pos + 1;
  }
  return parts;
}

std::string join(const std::vector<std::string> &parts, std::string_view separator,
                 const std::size_t count) {
  std::string out;
  const std::size_t limit = std::min(count, parts.size());
  for (std::size_t i = 0; i < limit; ++i) {
    if (i > 0) {
      out += separator;
    }
    out += parts[i];
  }
  return out;
}

Result<std::filesystem::path> home_dir() {
  if (const char *home = std::getenv("HOME"); home != nullptr && *home != '\0') {
    return Result<std::filesystem::path>::success(std::filesystem::path(home));
  }
  return Result<std::filesystem::path>::failure(
      make_error(ErrorCode::InvalidConfig, "HOME is not set"));
}

Result<std::filesystem::path> ensure_dir(const std::filesystem::path &path) {
  std::error_code ec;
  std::filesystem::create_directories(path, ec);
  if (ec) {
    return Result<std::filesystem::path>::failure(
        io_error(ErrorCode::WriteFailed, "Failed to create directory", path.string(), ec));
  }
  return Result<std::filesystem::path>::success(path);
}

std::string expand_path(std::string value) {
  if (value.empty()) {
    return value;
  }

  if (value[0] == '~') {
    if (auto home = home_dir(); home.ok()) {
      value.replace(0, 1, home.value().string());
    }
  }

  std::regex env_pattern(R"(\$\{?([A-Za-z_][A-Za-z0-9_]*)\}?)");
  std::smatch match;
  std::string expanded;
  std::string remaining = value;

  while (std::regex_search(remaining, match, env_pattern)) {
    expanded += match.prefix().str();
    const std::string var_name = match[1].str();
    if (const char *var = std::getenv(var_name.c_str()); var != nullptr) {
      expanded += var;
    }
    remaining = match.suffix().str();
  }

  expanded += remaining;
  return expanded;
}

std::string random_hex(const std::size_t bytes) {
  std::vector<unsigned char> data(bytes);
  if (RAND_bytes(data.data(), static_cast<int>(data.size())) != 1) {
    // Staging and temp names only need uniqueness.
    std::random_device device;
    for (auto &byte : data) {
      byte = static_cast<unsigned char>(device() & 0xFFU);
    }
  }

  std::ostringstream stream;
  stream << std::hex << std::setfill('0');
  for (const auto byte : data) {
    stream << std::setw(2) << static_cast<int>(byte);
  }
  return stream.str();
}

Result<std::optional<std::string>> read_text_file(const std::filesystem::path &path,
                                                  const ErrorCode failure_code) {
  std::error_code ec;
  const auto status = std::filesystem::status(path, ec);
  if (ec || !std::filesystem::exists(status)) {
    if (!ec || ec == std::errc::no_such_file_or_directory) {
      return Result<std::optional<std::string>>::success(std::nullopt);
    }
    return Result<std::optional<std::string>>::failure(
        io_error(failure_code, "Failed to stat file", path.string(), ec));
  }
  if (!std::filesystem::is_regular_file(status)) {
    return Result<std::optional<std::string>>::failure(
        make_error(failure_code, "Not a regular file", path.string()));
  }

  std::ifstream in(path, std::ios::binary);
  if (!in) {
    return Result<std::optional<std::string>>::failure(
        make_error(failure_code, "Failed to open file", path.string()));
  }
  std::ostringstream buffer;
  buffer << in.rdbuf();
  if (in.bad()) {
    return Result<std::optional<std::string>>::failure(
        make_error(failure_code, "Failed to read file", path.string()));
  }
  return Result<std::optional<std::string>>::success(buffer.str());
}

Status write_text_file_atomic(const std::filesystem::path &path, const std::string &contents,
                              const ErrorCode failure_code) {
  std::error_code ec;
  if (!path.parent_path().empty()) {
    std::filesystem::create_directories(path.parent_path(), ec);
    if (ec) {
      return Status::failure(io_error(failure_code, "Failed to create parent directory",
                                      path.parent_path().string(), ec));
    }
  }

  std::filesystem::path tmp_path = path;
  tmp_path += ".tmp-" + random_hex(6);
  {
    std::ofstream out(tmp_path, std::ios::binary | std::ios::trunc);
    if (!out) {
      return Status::failure(make_error(failure_code, "Failed to open temporary file",
                                        tmp_path.string()));
    }
    out << contents;
    out.close();
    if (!out) {
      std::filesystem::remove(tmp_path, ec);
      return Status::failure(make_error(failure_code, "Failed writing temporary file",
                                        tmp_path.string()));
    }
  }

  std::filesystem::rename(tmp_path, path, ec);
  if (ec) {
    std::error_code cleanup_ec;
    std::filesystem::remove(tmp_path, cleanup_ec);
    return Status::failure(io_error(failure_code, "Failed to replace file", path.string(), ec));
  }
  return Status::success();
}

} // namespace cortex::common
