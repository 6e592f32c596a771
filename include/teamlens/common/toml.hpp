#pragma once

#include "teamlens/common/result.hpp"

#include <cstdint>
#include <limits>
#include <map>
#include <string>
#include <vector>

namespace teamlens::common {

enum class TomlType {
  String,
  Integer,
  Boolean,
};

struct TomlEntry {
  TomlType type = TomlType::String;
  // Decoded text for strings, digits for integers, "true"/"false" for booleans.
  std::string text;
  std::size_t line = 0;
};

// Readers leave `out` untouched when the key is absent.
class TomlDocument {
public:
  [[nodiscard]] bool has(const std::string &key) const;
  [[nodiscard]] std::vector<std::string> keys() const;

  [[nodiscard]] Status read_string(const std::string &key, std::string &out) const;
  [[nodiscard]] Status read_bool(const std::string &key, bool &out) const;

  template <typename UInt> [[nodiscard]] Status read_uint(const std::string &key, UInt &out) const {
    std::uint64_t value = out;
    auto status = read_u64(key, value, std::numeric_limits<UInt>::max());
    if (status.ok()) {
      out = static_cast<UInt>(value);
    }
    return status;
  }

private:
  friend Result<TomlDocument> parse_toml(const std::string &content);

  [[nodiscard]] Status read_u64(const std::string &key, std::uint64_t &out,
                                std::uint64_t max) const;
  [[nodiscard]] Status type_error(const std::string &key, const TomlEntry &entry,
                                  const std::string &expected) const;

  std::map<std::string, TomlEntry> entries_;
};

[[nodiscard]] Result<TomlDocument> parse_toml(const std::string &content);

} // namespace teamlens::common
