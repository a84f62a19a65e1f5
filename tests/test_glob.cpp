#include <catch2/catch.hpp>
#include <ctext/glob.hpp>

using namespace ctext;

// ---- Literal matching ----

TEST_CASE("glob literal exact match", "[glob]") {
    REQUIRE(glob_match("PUTS", "PUTS"));
    REQUIRE_FALSE(glob_match("PUTS", "PUTS2"));
    REQUIRE_FALSE(glob_match("PUTS", "PUT"));
}

TEST_CASE("glob literal case sensitivity", "[glob]") {
    REQUIRE_FALSE(glob_match("puts", "PUTS"));
}

// ---- Wildcards ----

TEST_CASE("glob star matches suffix", "[glob]") {
    REQUIRE(glob_match("LOG_*", "LOG_INFO"));
    REQUIRE(glob_match("LOG_*", "LOG_"));
    REQUIRE_FALSE(glob_match("LOG_*", "LOG"));
    REQUIRE_FALSE(glob_match("LOG_*", "MYLOG_INFO"));
}

TEST_CASE("glob star in middle of name", "[glob]") {
    REQUIRE(glob_match("TEST_*_FUNC", "TEST_INNER_FUNC"));
    REQUIRE_FALSE(glob_match("TEST_*_FUNC", "TEST_INNER_FUNC2"));
}

TEST_CASE("glob consecutive stars collapse", "[glob]") {
    REQUIRE(glob_match("A**B", "AxyzB"));
    REQUIRE(glob_match("**", ""));
}

TEST_CASE("glob question mark single char", "[glob]") {
    REQUIRE(glob_match("TRACE?", "TRACE1"));
    REQUIRE_FALSE(glob_match("TRACE?", "TRACE12"));
    REQUIRE_FALSE(glob_match("TRACE?", "TRACE"));
}

// ---- Character classes ----

TEST_CASE("glob char class set", "[glob]") {
    REQUIRE(glob_match("[ABC]_LOG", "A_LOG"));
    REQUIRE_FALSE(glob_match("[ABC]_LOG", "D_LOG"));
}

TEST_CASE("glob char class range", "[glob]") {
    REQUIRE(glob_match("TRACE[0-9]", "TRACE5"));
    REQUIRE_FALSE(glob_match("TRACE[0-9]", "TRACEx"));
}

TEST_CASE("glob char class negation", "[glob]") {
    REQUIRE(glob_match("LOG[!_]", "LOGX"));
    REQUIRE_FALSE(glob_match("LOG[!_]", "LOG_"));
}

// ---- Metacharacter detection ----

TEST_CASE("glob_has_meta", "[glob]") {
    REQUIRE(glob_has_meta("LOG_*"));
    REQUIRE(glob_has_meta("TRACE?"));
    REQUIRE(glob_has_meta("[AB]"));
    REQUIRE_FALSE(glob_has_meta("PUTS"));
    REQUIRE_FALSE(glob_has_meta(""));
}
