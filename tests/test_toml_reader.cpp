#include "minitest.hpp"
#include "util/TomlReader.hpp"
#include <filesystem>
#include <fstream>
#include <string>

using paceline::util::TomlReader;

static std::string tmp_path(const char* suffix) {
  return std::string("/tmp/paceline_test_toml_") + suffix + ".toml";
}

static void write_file(const std::string& path, const std::string& content) {
  std::ofstream f(path);
  f << content;
}

static void remove_file(const std::string& path) {
  std::error_code ec;
  std::filesystem::remove(path, ec);
}

TEST(toml_load_missing_file) {
  TomlReader tr;
  ASSERT_TRUE(!tr.load("/tmp/paceline_test_toml_nonexistent_file.toml"));
}

TEST(toml_load_file) {
  auto path = tmp_path("basic");
  write_file(path,
    "[theme]\n"
    "name = \"ember\"\n"
    "\n"
    "[gauge]\n"
    "five_hour_width = 12\n"
  );
  TomlReader tr;
  ASSERT_TRUE(tr.load(path));
  ASSERT_EQ(tr.get_string("theme", "name"), "ember");
  ASSERT_EQ(tr.get_int("gauge", "five_hour_width"), 12);
  remove_file(path);
}

TEST(toml_defaults_for_missing_keys) {
  TomlReader tr;
  tr.load_text("[line]\nmax_cols = 80\n");
  ASSERT_EQ(tr.get_string("line", "missing_key", "fallback"), "fallback");
  ASSERT_EQ(tr.get_int("line", "missing_int", 42), 42);
  ASSERT_EQ(tr.get_bool("line", "missing_bool", true), true);
  ASSERT_NEAR(tr.get_double("line", "missing_double", 2.5), 2.5, 1e-12);
  ASSERT_EQ(tr.get_string("nosection", "key", "nope"), "nope");
  ASSERT_EQ(tr.get_int("nosection", "key", -1), -1);
}

TEST(toml_has) {
  TomlReader tr;
  tr.load_text("[colors]\naccent = \"#5FAFFF\"\n");
  ASSERT_TRUE(tr.has("colors", "accent"));
  ASSERT_TRUE(!tr.has("colors", "missing"));
  ASSERT_TRUE(!tr.has("nosection", "accent"));
}

TEST(toml_bool_variants) {
  TomlReader tr;
  tr.load_text(
    "[b]\n"
    "a = true\n"
    "b = True\n"
    "c = 1\n"
    "d = false\n"
    "e = FALSE\n"
    "f = 0\n"
    "g = junk\n"
  );
  ASSERT_EQ(tr.get_bool("b", "a"), true);
  ASSERT_EQ(tr.get_bool("b", "b"), true);
  ASSERT_EQ(tr.get_bool("b", "c"), true);
  ASSERT_EQ(tr.get_bool("b", "d"), false);
  ASSERT_EQ(tr.get_bool("b", "e"), false);
  ASSERT_EQ(tr.get_bool("b", "f"), false);
  ASSERT_EQ(tr.get_bool("b", "g", true), true);
  ASSERT_EQ(tr.get_bool("b", "g", false), false);
}

TEST(toml_numbers) {
  TomlReader tr;
  tr.load_text(
    "[n]\n"
    "pos = 42\n"
    "neg = -7\n"
    "frac = 1.4\n"
    "str = hello\n"
  );
  ASSERT_EQ(tr.get_int("n", "pos"), 42);
  ASSERT_EQ(tr.get_int("n", "neg"), -7);
  ASSERT_EQ(tr.get_int("n", "str", 99), 99);
  ASSERT_NEAR(tr.get_double("n", "frac"), 1.4, 1e-12);
  ASSERT_NEAR(tr.get_double("n", "pos"), 42.0, 1e-12);
  ASSERT_NEAR(tr.get_double("n", "str", 0.5), 0.5, 1e-12);
}

TEST(toml_quoted_strings) {
  TomlReader tr;
  tr.load_text(
    "[s]\n"
    "plain = hello\n"
    "quoted = \"world\"\n"
    "empty = \"\"\n"
    "sep = \" | \"\n"
    "hash = \"a # b\"\n"
  );
  ASSERT_EQ(tr.get_string("s", "plain"), "hello");
  ASSERT_EQ(tr.get_string("s", "quoted"), "world");
  ASSERT_EQ(tr.get_string("s", "empty", "x"), "");
  ASSERT_EQ(tr.get_string("s", "sep"), " | ");
  ASSERT_EQ(tr.get_string("s", "hash"), "a # b");
}

TEST(toml_comments_and_bare_hex) {
  TomlReader tr;
  tr.load_text(
    "# top-level comment\n"
    "[ colors ]  \n"
    "  accent  =  #FF00AA  \n"
    "# between keys\n"
    "muted = #808080   # dimmer text\n"
    "text = 42# not a comment\n"
  );
  ASSERT_EQ(tr.get_string("colors", "accent"), "#FF00AA");
  ASSERT_EQ(tr.get_string("colors", "muted"), "#808080");
  ASSERT_EQ(tr.get_string("colors", "text"), "42# not a comment");
}

TEST(toml_entries_keep_file_order) {
  TomlReader tr;
  tr.load_text(
    "[colors]\n"
    "critical = \"#FF0000\"\n"
    "accent = \"#00FF00\"\n"
    "gradient_1 = \"#0000FF\"\n"
    "accent = \"#FFFFFF\"\n"
  );
  auto e = tr.entries("colors");
  ASSERT_EQ(e.size(), 3u);
  ASSERT_EQ(e[0].first, std::string("critical"));
  ASSERT_EQ(e[1].first, std::string("accent"));
  ASSERT_EQ(e[1].second, std::string("#FFFFFF"));
  ASSERT_EQ(e[2].first, std::string("gradient_1"));
  ASSERT_TRUE(tr.entries("missing").empty());
}

TEST(toml_reload_replaces_sections) {
  TomlReader tr;
  tr.load_text("[theme]\nname = ocean\n[line]\nmax_cols = 40\n");
  ASSERT_EQ(tr.get_string("theme", "name"), "ocean");
  tr.load_text("[theme]\n");
  ASSERT_TRUE(!tr.has("theme", "name"));
  ASSERT_TRUE(!tr.has("line", "max_cols"));
}
