#include <catch2/catch.hpp>
#include <ctext/lang/strip.hpp>
#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <sstream>

using namespace ctext;

static std::string fixture_dir() {
    const char* src = std::getenv("CTEXT_SOURCE_DIR");
    if (src) return std::string(src) + "/tests/fixtures";
    return "../tests/fixtures";
}

static std::string read_fixture(const std::string& name) {
    std::ifstream in(fixture_dir() + "/" + name, std::ios::binary);
    REQUIRE(in.is_open());
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

static std::string strip_ok(const std::string& source, const StripOptions& opts = {}) {
    auto r = strip_comments(source, opts);
    if (r.is_err()) FAIL(r.error().format());
    return r.value();
}

TEST_CASE("strip removes comments entirely", "[strip]") {
    REQUIRE(strip_ok("a /* x */ b") == "a  b");
    REQUIRE(strip_ok("int x; // note\nint y;") == "int x; int y;");
    REQUIRE(strip_ok("/* only */") == "");
    REQUIRE(strip_ok("") == "");
}

TEST_CASE("strip keeps whitespace before a trailing comment", "[strip]") {
    REQUIRE(strip_ok("x = 1;   // one\n") == "x = 1;   ");
}

TEST_CASE("strip removes a line comment at end of input", "[strip]") {
    REQUIRE(strip_ok("x; // tail") == "x; ");
}

TEST_CASE("strip leaves strings alone", "[strip]") {
    std::string src = "puts(\"/* not a comment */ // nor this\");\n";
    REQUIRE(strip_ok(src) == src);
}

TEST_CASE("strip with keep_lines matches the fixture", "[strip]") {
    StripOptions opts;
    opts.filename = "strip_input.c";
    opts.keep_lines = true;
    REQUIRE(strip_ok(read_fixture("strip_input.c"), opts) ==
            read_fixture("strip_expected.c"));
}

TEST_CASE("strip with keep_lines preserves line count", "[strip]") {
    StripOptions opts;
    opts.keep_lines = true;
    std::string src = read_fixture("hello_world.c");
    std::string out = strip_ok(src, opts);
    REQUIRE(std::count(out.begin(), out.end(), '\n') ==
            std::count(src.begin(), src.end(), '\n'));
}

TEST_CASE("stripping twice changes nothing", "[strip]") {
    std::string once = strip_ok(read_fixture("hello_world.c"));
    REQUIRE(strip_ok(once) == once);
}

TEST_CASE("strip drops carriage returns", "[strip]") {
    REQUIRE(strip_ok("a;\r\n// c\r\nb;\r\n") == "a;\nb;\n");
}

TEST_CASE("strip reports an unterminated comment", "[strip]") {
    StripOptions opts;
    opts.filename = "bad.c";
    std::istringstream in("int x;\n/* open");
    std::ostringstream out;
    auto st = strip_comments(out, in, opts);
    REQUIRE(st.is_err());
    REQUIRE(st.error().code == CtextError::UnterminatedComment);
    REQUIRE(st.error().file == "bad.c");
    REQUIRE(out.str() == "int x;\n");
}

TEST_CASE("strip reports a failed write", "[strip]") {
    std::istringstream in("int x;\n");
    std::ostringstream out;
    out.setstate(std::ios::badbit);
    auto st = strip_comments(out, in);
    REQUIRE(st.is_err());
    REQUIRE(st.error().code == CtextError::IO);
}
