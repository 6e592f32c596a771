#include "test_framework.hpp"

#include "teamlens/common/fs.hpp"
#include "teamlens/common/json_util.hpp"
#include "teamlens/common/toml.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <cstdint>
#include <cstdlib>
#include <string>

void register_common_tests(std::vector<teamlens::tests::TestCase> &tests) {
  using teamlens::tests::require;
  namespace c = teamlens::common;

  tests.push_back({"json_validator_accepts_documents", [] {
                     require(c::json_is_valid(R"({"a":[1,2.5e3,-0.1,true,false,null],"b":{}})"),
                             "nested document should validate");
                     require(c::json_is_valid("  [ ]  "), "empty array with whitespace");
                     require(c::json_is_valid(R"("\u00e9\n")"), "escaped string");
                   }});

  tests.push_back({"json_validator_rejects_truncated_and_trailing", [] {
                     require(!c::json_is_valid(R"({"name":"alpha","members":[)"),
                             "truncated object must fail");
                     require(!c::json_is_valid(R"([{"from":"a"})"), "unterminated array");
                     require(!c::json_is_valid(R"({"a":1} x)"), "trailing garbage");
                     require(!c::json_is_valid(R"({"a":01})"), "leading zero");
                     require(!c::json_is_valid(R"({'a':1})"), "single quotes");
                     require(!c::json_is_valid(""), "empty text");
                   }});

  tests.push_back({"json_parse_flat_unescapes_strings_keeps_raw", [] {
                     const auto fields =
                         c::json_parse_flat(R"({"text":"line\nnext \"q\"","n":42,"arr":[1,"x"],"nil":null})");
                     require(fields.at("text") == "line\nnext \"q\"", "string should be unescaped");
                     require(fields.at("n") == "42", "number kept raw");
                     require(fields.at("arr") == R"([1,"x"])", "array kept raw");
                     require(c::json_is_null(fields.at("nil")), "null literal detected");
                     require(c::json_is_null(""), "empty is null");
                   }});

  tests.push_back({"json_unicode_escapes_to_utf8", [] {
                     require(c::json_unescape(R"(caf\u00e9)") == "caf\xc3\xa9", "BMP escape");
                     require(c::json_unescape(R"(\ud83d\ude00)") == "\xf0\x9f\x98\x80",
                             "surrogate pair");
                     require(c::json_escape(std::string("a\x01", 2)) == "a\\u0001",
                             "control character escaped");
                   }});

  tests.push_back({"json_escape_replaces_invalid_utf8", [] {
                     const std::string replacement = "\xef\xbf\xbd";
                     require(c::json_escape("caf\xc3\xa9 \xf0\x9f\x98\x80") ==
                                 "caf\xc3\xa9 \xf0\x9f\x98\x80",
                             "valid multibyte text kept");
                     require(c::json_escape(std::string("a\xff") + "b") == "a" + replacement + "b",
                             "stray byte replaced");
                     require(c::json_escape(std::string("x\xc3")) == "x" + replacement,
                             "truncated sequence replaced");
                     require(c::json_escape(std::string("\xc0\xaf")) == replacement + replacement,
                             "overlong encoding replaced");
                     require(c::json_escape(std::string("\xed\xa0\x80")) ==
                                 replacement + replacement + replacement,
                             "encoded surrogate replaced");
                     require(c::json_is_valid("\"" + c::json_escape(std::string("\x80\"q")) + "\""),
                             "escaped output stays valid json");
                   }});

  tests.push_back({"json_split_values_and_scalars", [] {
                     const auto values = c::json_split_top_level_values(R"(["1", 2, null, {"a":[3]}])");
                     require(values.size() == 4, "four elements expected");
                     require(c::json_scalar_text(values[0]) == "1", "quoted string unwrapped");
                     require(c::json_scalar_text(values[1]) == "2", "number text");
                     require(c::json_is_null(values[2]), "null element");
                     const auto objects = c::json_split_top_level_objects(R"([{"a":1}, 5, {"b":"}"}])");
                     require(objects.size() == 2, "only objects kept");
                     require(objects[1] == R"({"b":"}"})", "brace inside string handled");
                     require(c::json_string_array({"a", "b\"c"}) == R"(["a","b\"c"])",
                             "string array rendering");
                   }});

  tests.push_back({"toml_sections_and_typed_reads", [] {
                     const auto parsed = c::parse_toml(
                         "# comment\n[watch]\nteams_dir = \"~/te#ams\" # trailing\ndebounce_ms = 2_50\n"
                         "[broadcast]\ntls_enabled = true\nport = 4000\nhost = 'local \\ host'\n");
                     require(parsed.ok(), parsed.error());
                     const auto &doc = parsed.value();

                     std::string teams = "unset";
                     require(doc.read_string("watch.teams_dir", teams).ok(), "string read");
                     require(teams == "~/te#ams", "hash inside quotes kept");
                     std::uint32_t debounce = 0;
                     require(doc.read_uint("watch.debounce_ms", debounce).ok() && debounce == 250,
                             "underscored integer");
                     bool tls = false;
                     require(doc.read_bool("broadcast.tls_enabled", tls).ok() && tls, "bool read");
                     std::string host;
                     require(doc.read_string("broadcast.host", host).ok() && host == "local \\ host",
                             "literal string is raw");

                     std::uint16_t missing = 7;
                     require(doc.read_uint("broadcast.missing", missing).ok() && missing == 7,
                             "absent key leaves value");
                     require(doc.keys().size() == 5, "five keys");
                   }});

  tests.push_back({"toml_rejects_malformed_and_mistyped_values", [] {
                     require(!c::parse_toml("[]\n").ok(), "empty section rejected");
                     require(!c::parse_toml("[watch\n").ok(), "open section rejected");
                     require(!c::parse_toml("novalue\n").ok(), "line without = rejected");
                     require(!c::parse_toml("a = \"open\n").ok(), "unterminated string rejected");
                     require(!c::parse_toml("a = bare words\n").ok(), "bare value rejected");
                     const auto duplicate = c::parse_toml("[s]\na = 1\na = 2\n");
                     require(!duplicate.ok(), "duplicate key rejected");
                     require(duplicate.error().find("line 3") != std::string::npos &&
                                 duplicate.error().find("line 2") != std::string::npos,
                             "duplicate names both lines");

                     const auto parsed = c::parse_toml("[b]\nport = 70000\nname = 5\nneg = -1\n");
                     require(parsed.ok(), parsed.error());
                     std::uint16_t port = 1;
                     const auto range = parsed.value().read_uint("b.port", port);
                     require(!range.ok() && port == 1, "out of range leaves value");
                     require(range.error() == "b.port (line 2): expected an integer in 0..65535",
                             range.error());
                     std::string name;
                     require(!parsed.value().read_string("b.name", name).ok(), "number is not string");
                     std::uint64_t neg = 0;
                     require(!parsed.value().read_uint("b.neg", neg).ok(), "negative rejected");
                   }});

  tests.push_back({"fs_expand_path_home_and_env", [] {
                     setenv("TEAMLENS_TEST_VAR", "/opt/x", 1);
                     require(c::expand_path("$TEAMLENS_TEST_VAR/db") == "/opt/x/db", "env expansion");
                     require(c::expand_path("${TEAMLENS_TEST_VAR}") == "/opt/x", "braced env");
                     unsetenv("TEAMLENS_TEST_VAR");
                     const auto home = c::home_dir();
                     if (home.ok()) {
                       require(c::expand_path("~/a") == (home.value() / "a").string(),
                               "tilde expansion");
                     }
                   }});

  tests.push_back({"fs_read_text_file_rejects_missing_and_empty", [] {
                     teamlens::testing::TempWorkspace workspace;
                     workspace.create_file("empty.json", "");
                     workspace.create_file("full.json", "[]");
                     require(!c::read_text_file(workspace.path() / "missing.json").ok(), "missing");
                     require(!c::read_text_file(workspace.path() / "empty.json").ok(), "empty");
                     const auto full = c::read_text_file(workspace.path() / "full.json");
                     require(full.ok() && full.value() == "[]", "content read back");
                   }});
}
