#include "teamlens/common/toml.hpp"

#include "teamlens/common/fs.hpp"

#include <charconv>
#include <sstream>

namespace teamlens::common {

namespace {

std::string at_line(const std::string &message, const std::size_t line) {
  return message + " at line " + std::to_string(line);
}

// Cuts a trailing comment, ignoring '#' inside either kind of string.
std::string strip_comment(const std::string &line) {
  char quote = 0;
  for (std::size_t i = 0; i < line.size(); ++i) {
    const char ch = line[i];
    if (quote == '"' && ch == '\\') {
      ++i;
      continue;
    }
    if (quote != 0) {
      if (ch == quote) {
        quote = 0;
      }
      continue;
    }
    if (ch == '"' || ch == '\'') {
      quote = ch;
    } else if (ch == '#') {
      return line.substr(0, i);
    }
  }
  return line;
}

Result<TomlEntry> parse_basic_string(const std::string &raw, const std::size_t line) {
  std::string text;
  std::size_t i = 1;
  for (; i < raw.size() && raw[i] != '"'; ++i) {
    if (raw[i] != '\\') {
      text.push_back(raw[i]);
      continue;
    }
    if (++i >= raw.size()) {
      break;
    }
    switch (raw[i]) {
    case '"':
      text.push_back('"');
      break;
    case '\\':
      text.push_back('\\');
      break;
    case 'n':
      text.push_back('\n');
      break;
    case 't':
      text.push_back('\t');
      break;
    default:
      return Result<TomlEntry>::failure(at_line(std::string("Unsupported escape \\") + raw[i], line));
    }
  }
  if (i >= raw.size()) {
    return Result<TomlEntry>::failure(at_line("Unterminated string", line));
  }
  if (i + 1 != raw.size()) {
    return Result<TomlEntry>::failure(at_line("Unexpected text after string", line));
  }
  return Result<TomlEntry>::success(
      TomlEntry{.type = TomlType::String, .text = std::move(text), .line = line});
}

bool is_integer_literal(const std::string &raw) {
  std::size_t start = raw.front() == '-' ? 1 : 0;
  if (start >= raw.size() || raw[start] == '_' || raw.back() == '_') {
    return false;
  }
  for (std::size_t i = start; i < raw.size(); ++i) {
    const char ch = raw[i];
    if (ch == '_' && raw[i - 1] != '_') {
      continue;
    }
    if (ch < '0' || ch > '9') {
      return false;
    }
  }
  return true;
}

Result<TomlEntry> parse_value(const std::string &raw, const std::size_t line) {
  if (raw.empty()) {
    return Result<TomlEntry>::failure(at_line("Missing value", line));
  }
  if (raw.front() == '"') {
    return parse_basic_string(raw, line);
  }
  if (raw.front() == '\'') {
    const auto close = raw.find('\'', 1);
    if (close == std::string::npos) {
      return Result<TomlEntry>::failure(at_line("Unterminated string", line));
    }
    if (close + 1 != raw.size()) {
      return Result<TomlEntry>::failure(at_line("Unexpected text after string", line));
    }
    return Result<TomlEntry>::success(
        TomlEntry{.type = TomlType::String, .text = raw.substr(1, close - 1), .line = line});
  }
  if (raw == "true" || raw == "false") {
    return Result<TomlEntry>::success(TomlEntry{.type = TomlType::Boolean, .text = raw, .line = line});
  }
  if (is_integer_literal(raw)) {
    std::string digits;
    for (const char ch : raw) {
      if (ch != '_') {
        digits.push_back(ch);
      }
    }
    return Result<TomlEntry>::success(
        TomlEntry{.type = TomlType::Integer, .text = std::move(digits), .line = line});
  }
  return Result<TomlEntry>::failure(at_line("Invalid value '" + raw + "'", line));
}

} // namespace

bool TomlDocument::has(const std::string &key) const { return entries_.contains(key); }

std::vector<std::string> TomlDocument::keys() const {
  std::vector<std::string> out;
  out.reserve(entries_.size());
  for (const auto &[key, entry] : entries_) {
    out.push_back(key);
  }
  return out;
}

Status TomlDocument::type_error(const std::string &key, const TomlEntry &entry,
                                const std::string &expected) const {
  return Status::error(key + " (line " + std::to_string(entry.line) + "): expected " + expected);
}

Status TomlDocument::read_string(const std::string &key, std::string &out) const {
  const auto it = entries_.find(key);
  if (it == entries_.end()) {
    return Status::success();
  }
  if (it->second.type != TomlType::String) {
    return type_error(key, it->second, "a quoted string");
  }
  out = it->second.text;
  return Status::success();
}

Status TomlDocument::read_bool(const std::string &key, bool &out) const {
  const auto it = entries_.find(key);
  if (it == entries_.end()) {
    return Status::success();
  }
  if (it->second.type != TomlType::Boolean) {
    return type_error(key, it->second, "true or false");
  }
  out = it->second.text == "true";
  return Status::success();
}

Status TomlDocument::read_u64(const std::string &key, std::uint64_t &out,
                              const std::uint64_t max) const {
  const auto it = entries_.find(key);
  if (it == entries_.end()) {
    return Status::success();
  }
  const auto &entry = it->second;
  const std::string expected = "an integer in 0.." + std::to_string(max);
  if (entry.type != TomlType::Integer || entry.text.front() == '-') {
    return type_error(key, entry, expected);
  }
  std::uint64_t value = 0;
  const auto *first = entry.text.data();
  const auto *last = first + entry.text.size();
  const auto [ptr, ec] = std::from_chars(first, last, value);
  if (ec != std::errc() || ptr != last || value > max) {
    return type_error(key, entry, expected);
  }
  out = value;
  return Status::success();
}

Result<TomlDocument> parse_toml(const std::string &content) {
  TomlDocument document;
  std::istringstream stream(content);
  std::string line;
  std::string current_section;
  std::size_t line_number = 0;

  while (std::getline(stream, line)) {
    ++line_number;
    const std::string clean_line = trim(strip_comment(line));
    if (clean_line.empty()) {
      continue;
    }

    if (clean_line.front() == '[') {
      if (clean_line.back() != ']') {
        return Result<TomlDocument>::failure(at_line("Unterminated section header", line_number));
      }
      current_section = trim(clean_line.substr(1, clean_line.size() - 2));
      if (current_section.empty()) {
        return Result<TomlDocument>::failure(at_line("Invalid empty section", line_number));
      }
      continue;
    }

    const std::size_t equals_index = clean_line.find('=');
    if (equals_index == std::string::npos) {
      return Result<TomlDocument>::failure(at_line("Invalid key/value", line_number));
    }
    const std::string key = trim(clean_line.substr(0, equals_index));
    if (key.empty()) {
      return Result<TomlDocument>::failure(at_line("Missing key", line_number));
    }
    auto value = parse_value(trim(clean_line.substr(equals_index + 1)), line_number);
    if (!value.ok()) {
      return Result<TomlDocument>::failure(value.error());
    }

    const std::string full_key = current_section.empty() ? key : current_section + "." + key;
    const auto [it, inserted] = document.entries_.emplace(full_key, std::move(value.value()));
    if (!inserted) {
      return Result<TomlDocument>::failure(
          at_line("Duplicate key '" + full_key + "' (first set at line " +
                      std::to_string(it->second.line) + ")",
                  line_number));
    }
  }

  return Result<TomlDocument>::success(std::move(document));
}

} // namespace teamlens::common
