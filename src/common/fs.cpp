#include "teamlens/common/fs.hpp"

#include <algorithm>
#include <iterator>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <regex>
#include <sstream>

namespace teamlens::common {

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

bool ends_with(const std::string &value, const std::string &suffix) {
  return value.size() >= suffix.size() &&
         value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::string to_lower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return value;
}

Result<std::filesystem::path> home_dir() {
  if (const char *home = std::getenv("HOME"); home != nullptr && *home != '\0') {
    return Result<std::filesystem::path>::success(std::filesystem::path(home));
  }
  return Result<std::filesystem::path>::failure("HOME is not set");
}

Result<std::filesystem::path> ensure_dir(const std::filesystem::path &path) {
  std::error_code ec;
  std::filesystem::create_directories(path, ec);
  if (ec) {
    return Result<std::filesystem::path>::failure("Failed to create directory: " +
                                                  path.string() + ": " + ec.message());
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

bool is_subpath(const std::filesystem::path &candidate, const std::filesystem::path &parent) {
  auto c_it = candidate.begin();
  auto p_it = parent.begin();

  for (; p_it != parent.end(); ++p_it, ++c_it) {
    if (p_it->empty() && std::next(p_it) == parent.end()) {
      // trailing separator on the parent
      break;
    }
    if (c_it == candidate.end() || *c_it != *p_it) {
      return false;
    }
  }

  return true;
}

Result<std::string> read_text_file(const std::filesystem::path &path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    return Result<std::string>::failure("unable to open " + path.string());
  }
  std::ostringstream buffer;
  buffer << in.rdbuf();
  if (in.bad()) {
    return Result<std::string>::failure("read error on " + path.string());
  }
  std::string content = buffer.str();
  if (trim(content).empty()) {
    return Result<std::string>::failure("empty file " + path.string());
  }
  return Result<std::string>::success(std::move(content));
}

std::string now_rfc3339() {
  const auto now = std::chrono::system_clock::now();
  const auto t = std::chrono::system_clock::to_time_t(now);
  std::tm tm{};
  gmtime_r(&t, &tm);

  std::ostringstream out;
  out << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
  return out.str();
}

std::int64_t now_epoch_ms() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

} // namespace teamlens::common
