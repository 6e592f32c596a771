#include "teamlens/common/json_util.hpp"

#include <cctype>
#include <cstdint>
#include <cstdio>
#include <sstream>

namespace teamlens::common {

namespace {

constexpr std::size_t kMaxNestingDepth = 256;

void append_utf8(std::string &out, std::uint32_t code_point) {
  if (code_point < 0x80u) {
    out.push_back(static_cast<char>(code_point));
  } else if (code_point < 0x800u) {
    out.push_back(static_cast<char>(0xC0u | (code_point >> 6u)));
    out.push_back(static_cast<char>(0x80u | (code_point & 0x3Fu)));
  } else if (code_point < 0x10000u) {
    out.push_back(static_cast<char>(0xE0u | (code_point >> 12u)));
    out.push_back(static_cast<char>(0x80u | ((code_point >> 6u) & 0x3Fu)));
    out.push_back(static_cast<char>(0x80u | (code_point & 0x3Fu)));
  } else {
    out.push_back(static_cast<char>(0xF0u | (code_point >> 18u)));
    out.push_back(static_cast<char>(0x80u | ((code_point >> 12u) & 0x3Fu)));
    out.push_back(static_cast<char>(0x80u | ((code_point >> 6u) & 0x3Fu)));
    out.push_back(static_cast<char>(0x80u | (code_point & 0x3Fu)));
  }
}

bool parse_hex4(const std::string &raw, std::size_t pos, std::uint32_t &out) {
  if (pos + 4 > raw.size()) {
    return false;
  }
  out = 0;
  for (std::size_t i = pos; i < pos + 4; ++i) {
    const char ch = raw[i];
    out <<= 4u;
    if (ch >= '0' && ch <= '9') {
      out |= static_cast<std::uint32_t>(ch - '0');
    } else if (ch >= 'a' && ch <= 'f') {
      out |= static_cast<std::uint32_t>(ch - 'a' + 10);
    } else if (ch >= 'A' && ch <= 'F') {
      out |= static_cast<std::uint32_t>(ch - 'A' + 10);
    } else {
      return false;
    }
  }
  return true;
}

// Recursive-descent validator. Each function returns the position just past
// the value it consumed, or npos on a syntax error.
class Validator {
public:
  explicit Validator(const std::string &text) : text_(text) {}

  [[nodiscard]] bool run() {
    std::size_t pos = json_skip_ws(text_, 0);
    pos = value(pos, 0);
    if (pos == std::string::npos) {
      return false;
    }
    return json_skip_ws(text_, pos) == text_.size();
  }

private:
  std::size_t value(std::size_t pos, std::size_t depth) {
    if (pos >= text_.size() || depth > kMaxNestingDepth) {
      return std::string::npos;
    }
    switch (text_[pos]) {
    case '{':
      return object(pos, depth + 1);
    case '[':
      return array(pos, depth + 1);
    case '"':
      return string_token(pos);
    case 't':
      return literal(pos, "true");
    case 'f':
      return literal(pos, "false");
    case 'n':
      return literal(pos, "null");
    default:
      return number(pos);
    }
  }

  std::size_t object(std::size_t pos, std::size_t depth) {
    pos = json_skip_ws(text_, pos + 1);
    if (pos < text_.size() && text_[pos] == '}') {
      return pos + 1;
    }
    while (pos < text_.size()) {
      if (text_[pos] != '"') {
        return std::string::npos;
      }
      pos = string_token(pos);
      if (pos == std::string::npos) {
        return pos;
      }
      pos = json_skip_ws(text_, pos);
      if (pos >= text_.size() || text_[pos] != ':') {
        return std::string::npos;
      }
      pos = value(json_skip_ws(text_, pos + 1), depth);
      if (pos == std::string::npos) {
        return pos;
      }
      pos = json_skip_ws(text_, pos);
      if (pos >= text_.size()) {
        return std::string::npos;
      }
      if (text_[pos] == '}') {
        return pos + 1;
      }
      if (text_[pos] != ',') {
        return std::string::npos;
      }
      pos = json_skip_ws(text_, pos + 1);
    }
    return std::string::npos;
  }

  std::size_t array(std::size_t pos, std::size_t depth) {
    pos = json_skip_ws(text_, pos + 1);
    if (pos < text_.size() && text_[pos] == ']') {
      return pos + 1;
    }
    while (pos < text_.size()) {
      pos = value(pos, depth);
      if (pos == std::string::npos) {
        return pos;
      }
      pos = json_skip_ws(text_, pos);
      if (pos >= text_.size()) {
        return std::string::npos;
      }
      if (text_[pos] == ']') {
        return pos + 1;
      }
      if (text_[pos] != ',') {
        return std::string::npos;
      }
      pos = json_skip_ws(text_, pos + 1);
    }
    return std::string::npos;
  }

  std::size_t string_token(std::size_t pos) {
    for (std::size_t i = pos + 1; i < text_.size(); ++i) {
      const auto ch = static_cast<unsigned char>(text_[i]);
      if (ch == '"') {
        return i + 1;
      }
      if (ch < 0x20u) {
        return std::string::npos;
      }
      if (ch != '\\') {
        continue;
      }
      if (++i >= text_.size()) {
        return std::string::npos;
      }
      const char esc = text_[i];
      if (esc == 'u') {
        std::uint32_t ignored = 0;
        if (!parse_hex4(text_, i + 1, ignored)) {
          return std::string::npos;
        }
        i += 4;
      } else if (esc != '"' && esc != '\\' && esc != '/' && esc != 'b' && esc != 'f' &&
                 esc != 'n' && esc != 'r' && esc != 't') {
        return std::string::npos;
      }
    }
    return std::string::npos;
  }

  std::size_t literal(std::size_t pos, const char *word) {
    const std::string expected(word);
    if (text_.compare(pos, expected.size(), expected) != 0) {
      return std::string::npos;
    }
    return pos + expected.size();
  }

  std::size_t number(std::size_t pos) {
    const auto digit = [this](std::size_t p) {
      return p < text_.size() && std::isdigit(static_cast<unsigned char>(text_[p])) != 0;
    };
    if (pos < text_.size() && text_[pos] == '-') {
      ++pos;
    }
    if (!digit(pos)) {
      return std::string::npos;
    }
    if (text_[pos] == '0') {
      ++pos;
    } else {
      while (digit(pos)) {
        ++pos;
      }
    }
    if (pos < text_.size() && text_[pos] == '.') {
      ++pos;
      if (!digit(pos)) {
        return std::string::npos;
      }
      while (digit(pos)) {
        ++pos;
      }
    }
    if (pos < text_.size() && (text_[pos] == 'e' || text_[pos] == 'E')) {
      ++pos;
      if (pos < text_.size() && (text_[pos] == '+' || text_[pos] == '-')) {
        ++pos;
      }
      if (!digit(pos)) {
        return std::string::npos;
      }
      while (digit(pos)) {
        ++pos;
      }
    }
    return pos;
  }

  const std::string &text_;
};

std::size_t skip_scalar(const std::string &json, std::size_t pos) {
  while (pos < json.size() && json[pos] != ',' && json[pos] != '}' && json[pos] != ']' &&
         std::isspace(static_cast<unsigned char>(json[pos])) == 0) {
    ++pos;
  }
  return pos;
}

constexpr const char *REPLACEMENT_CHARACTER = "\xEF\xBF\xBD";

// Length of the well-formed UTF-8 sequence starting at `pos`, 0 if there is none.
std::size_t utf8_sequence_length(const std::string &value, const std::size_t pos) {
  const auto lead = static_cast<unsigned char>(value[pos]);
  std::size_t length = 0;
  unsigned char low = 0x80;
  unsigned char high = 0xBF;
  if (lead >= 0xC2 && lead <= 0xDF) {
    length = 2;
  } else if (lead >= 0xE0 && lead <= 0xEF) {
    length = 3;
    if (lead == 0xE0) {
      low = 0xA0;
    } else if (lead == 0xED) {
      high = 0x9F;
    }
  } else if (lead >= 0xF0 && lead <= 0xF4) {
    length = 4;
    if (lead == 0xF0) {
      low = 0x90;
    } else if (lead == 0xF4) {
      high = 0x8F;
    }
  } else {
    return 0;
  }
  if (pos + length > value.size()) {
    return 0;
  }
  for (std::size_t i = 1; i < length; ++i) {
    const auto byte = static_cast<unsigned char>(value[pos + i]);
    const unsigned char min = i == 1 ? low : 0x80;
    const unsigned char max = i == 1 ? high : 0xBF;
    if (byte < min || byte > max) {
      return 0;
    }
  }
  return length;
}

} // namespace

std::string json_escape(const std::string &value) {
  std::string escaped;
  escaped.reserve(value.size() + 8);
  for (std::size_t i = 0; i < value.size(); ++i) {
    const char ch = value[i];
    switch (ch) {
    case '"':
      escaped += "\\\"";
      break;
    case '\\':
      escaped += "\\\\";
      break;
    case '\n':
      escaped += "\\n";
      break;
    case '\r':
      escaped += "\\r";
      break;
    case '\t':
      escaped += "\\t";
      break;
    case '\b':
      escaped += "\\b";
      break;
    case '\f':
      escaped += "\\f";
      break;
    default:
      if (static_cast<unsigned char>(ch) < 0x20u) {
        char buffer[8];
        std::snprintf(buffer, sizeof(buffer), "\\u%04x", static_cast<unsigned>(ch));
        escaped += buffer;
      } else if (static_cast<unsigned char>(ch) < 0x80u) {
        escaped.push_back(ch);
      } else if (const auto length = utf8_sequence_length(value, i); length > 0) {
        escaped.append(value, i, length);
        i += length - 1;
      } else {
        // Text frames must be valid UTF-8.
        escaped += REPLACEMENT_CHARACTER;
      }
      break;
    }
  }
  return escaped;
}

std::string json_unescape(const std::string &raw) {
  std::string out;
  out.reserve(raw.size());
  for (std::size_t i = 0; i < raw.size(); ++i) {
    const char ch = raw[i];
    if (ch != '\\' || i + 1 >= raw.size()) {
      out.push_back(ch);
      continue;
    }
    const char esc = raw[++i];
    switch (esc) {
    case 'n':
      out.push_back('\n');
      break;
    case 'r':
      out.push_back('\r');
      break;
    case 't':
      out.push_back('\t');
      break;
    case 'b':
      out.push_back('\b');
      break;
    case 'f':
      out.push_back('\f');
      break;
    case 'u': {
      std::uint32_t code_point = 0;
      if (!parse_hex4(raw, i + 1, code_point)) {
        out.push_back('u');
        break;
      }
      i += 4;
      // Surrogate pair.
      if (code_point >= 0xD800u && code_point <= 0xDBFFu && i + 2 < raw.size() &&
          raw[i + 1] == '\\' && raw[i + 2] == 'u') {
        std::uint32_t low = 0;
        if (parse_hex4(raw, i + 3, low) && low >= 0xDC00u && low <= 0xDFFFu) {
          code_point = 0x10000u + ((code_point - 0xD800u) << 10u) + (low - 0xDC00u);
          i += 6;
        }
      }
      append_utf8(out, code_point);
      break;
    }
    default:
      out.push_back(esc);
      break;
    }
  }
  return out;
}

std::size_t json_skip_ws(const std::string &text, std::size_t pos) {
  while (pos < text.size() && std::isspace(static_cast<unsigned char>(text[pos])) != 0) {
    ++pos;
  }
  return pos;
}

std::size_t json_find_string_end(const std::string &json, std::size_t quote_pos) {
  bool escaped = false;
  for (std::size_t i = quote_pos + 1; i < json.size(); ++i) {
    const char ch = json[i];
    if (!escaped && ch == '"') {
      return i;
    }
    if (!escaped && ch == '\\') {
      escaped = true;
      continue;
    }
    escaped = false;
  }
  return std::string::npos;
}

std::size_t json_find_matching_token(const std::string &json, std::size_t open_pos,
                                      const char open_ch, const char close_ch) {
  if (open_pos >= json.size() || json[open_pos] != open_ch) {
    return std::string::npos;
  }
  std::size_t depth = 0;
  bool in_string = false;
  bool escaped = false;
  for (std::size_t i = open_pos; i < json.size(); ++i) {
    const char ch = json[i];
    if (in_string) {
      if (!escaped && ch == '"') {
        in_string = false;
      } else if (!escaped && ch == '\\') {
        escaped = true;
        continue;
      }
      escaped = false;
      continue;
    }
    if (ch == '"') {
      in_string = true;
      escaped = false;
      continue;
    }
    if (ch == open_ch) {
      ++depth;
    } else if (ch == close_ch) {
      if (depth == 0) {
        return std::string::npos;
      }
      --depth;
      if (depth == 0) {
        return i;
      }
    }
  }
  return std::string::npos;
}

bool json_is_valid(const std::string &json) { return Validator(json).run(); }

bool json_is_object(const std::string &json) {
  const auto pos = json_skip_ws(json, 0);
  return pos < json.size() && json[pos] == '{';
}

bool json_is_array(const std::string &json) {
  const auto pos = json_skip_ws(json, 0);
  return pos < json.size() && json[pos] == '[';
}

bool json_is_null(const std::string &raw) {
  const std::string text = json_scalar_text(raw);
  return text.empty() || text == "null";
}

JsonFlatMap json_parse_flat(const std::string &json) {
  JsonFlatMap result;
  std::size_t pos = json_skip_ws(json, 0);
  if (pos >= json.size() || json[pos] != '{') {
    return result;
  }

  ++pos; // skip opening {
  while (pos < json.size()) {
    pos = json_skip_ws(json, pos);
    if (pos >= json.size() || json[pos] == '}') {
      break;
    }
    if (json[pos] == ',') {
      ++pos;
      continue;
    }

    if (json[pos] != '"') {
      ++pos;
      continue;
    }
    const auto key_end = json_find_string_end(json, pos);
    if (key_end == std::string::npos) {
      break;
    }
    const std::string key = json_unescape(json.substr(pos + 1, key_end - pos - 1));
    pos = json_skip_ws(json, key_end + 1);
    if (pos >= json.size() || json[pos] != ':') {
      break;
    }
    pos = json_skip_ws(json, pos + 1);
    if (pos >= json.size()) {
      break;
    }

    if (json[pos] == '"') {
      const auto val_end = json_find_string_end(json, pos);
      if (val_end == std::string::npos) {
        break;
      }
      result[key] = json_unescape(json.substr(pos + 1, val_end - pos - 1));
      pos = val_end + 1;
    } else if (json[pos] == '{' || json[pos] == '[') {
      const char open = json[pos];
      const char close = (open == '{') ? '}' : ']';
      const auto end = json_find_matching_token(json, pos, open, close);
      if (end == std::string::npos) {
        break;
      }
      result[key] = json.substr(pos, end - pos + 1);
      pos = end + 1;
    } else {
      // number, true, false, null
      const std::size_t start = pos;
      pos = skip_scalar(json, pos);
      result[key] = json.substr(start, pos - start);
    }
  }

  return result;
}

std::vector<std::string> json_split_top_level_objects(const std::string &array_json) {
  std::vector<std::string> out;
  for (auto &element : json_split_top_level_values(array_json)) {
    if (!element.empty() && element.front() == '{') {
      out.push_back(std::move(element));
    }
  }
  return out;
}

std::vector<std::string> json_split_top_level_values(const std::string &array_json) {
  std::vector<std::string> out;
  std::size_t pos = json_skip_ws(array_json, 0);
  if (pos >= array_json.size() || array_json[pos] != '[') {
    return out;
  }

  ++pos;
  while (pos < array_json.size()) {
    pos = json_skip_ws(array_json, pos);
    if (pos >= array_json.size() || array_json[pos] == ']') {
      break;
    }
    if (array_json[pos] == ',') {
      ++pos;
      continue;
    }
    const char ch = array_json[pos];
    std::size_t end = std::string::npos;
    if (ch == '"') {
      end = json_find_string_end(array_json, pos);
    } else if (ch == '{') {
      end = json_find_matching_token(array_json, pos, '{', '}');
    } else if (ch == '[') {
      end = json_find_matching_token(array_json, pos, '[', ']');
    } else {
      const std::size_t scalar_end = skip_scalar(array_json, pos);
      out.push_back(array_json.substr(pos, scalar_end - pos));
      pos = scalar_end;
      continue;
    }
    if (end == std::string::npos) {
      break;
    }
    out.push_back(array_json.substr(pos, end - pos + 1));
    pos = end + 1;
  }
  return out;
}

std::string json_scalar_text(const std::string &raw) {
  if (raw.size() >= 2 && raw.front() == '"' && raw.back() == '"') {
    return json_unescape(raw.substr(1, raw.size() - 2));
  }
  const auto first = json_skip_ws(raw, 0);
  std::size_t last = raw.size();
  while (last > first && std::isspace(static_cast<unsigned char>(raw[last - 1])) != 0) {
    --last;
  }
  return raw.substr(first, last - first);
}

std::string json_string_array(const std::vector<std::string> &values) {
  std::ostringstream out;
  out << "[";
  for (std::size_t i = 0; i < values.size(); ++i) {
    if (i > 0) {
      out << ",";
    }
    out << "\"" << json_escape(values[i]) << "\"";
  }
  out << "]";
  return out.str();
}

} // namespace teamlens::common
