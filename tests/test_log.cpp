#include <catch2/catch.hpp>
#include <tyck/log.hpp>
#include <cstdio>
#include <cstdlib>
#include <functional>
#include <string>

using namespace tyck::log;

// Run fn with log output redirected to a temp file and return what it wrote.
static std::string capture_log(const std::function<void()>& fn) {
    std::FILE* tmp = std::tmpfile();
    REQUIRE(tmp != nullptr);
    set_output(tmp);
    set_color_enabled(false);

    fn();

    std::fflush(tmp);
    set_output(nullptr);

    std::string output;
    std::rewind(tmp);
    char buf[1024];
    size_t n;
    while ((n = std::fread(buf, 1, sizeof(buf), tmp)) > 0) {
        output.append(buf, n);
    }
    std::fclose(tmp);
    return output;
}

TEST_CASE("set_level / get_level roundtrip", "[log]") {
    for (Level lvl : {Trace, Debug, Info, Warn, Error}) {
        set_level(lvl);
        REQUIRE(get_level() == lvl);
    }
    set_level(Warn);
}

TEST_CASE("level_name() returns correct strings", "[log]") {
    REQUIRE(std::string(level_name(Trace)) == "trace");
    REQUIRE(std::string(level_name(Debug)) == "debug");
    REQUIRE(std::string(level_name(Info)) == "info");
    REQUIRE(std::string(level_name(Warn)) == "warn");
    REQUIRE(std::string(level_name(Error)) == "error");
}

TEST_CASE("parse_level accepts level names only", "[log]") {
    REQUIRE(parse_level("debug") == Debug);
    REQUIRE(parse_level("error") == Error);
    REQUIRE_FALSE(parse_level("DEBUG").has_value());
    REQUIRE_FALSE(parse_level("verbose").has_value());
}

TEST_CASE("init_from_env applies TYCK_LOG", "[log]") {
    set_level(Warn);
    #ifdef _WIN32
    _putenv_s("TYCK_LOG", "trace");
    #else
    setenv("TYCK_LOG", "trace", 1);
    #endif

    init_from_env();
    REQUIRE(get_level() == Trace);

    #ifdef _WIN32
    _putenv_s("TYCK_LOG", "");
    #else
    unsetenv("TYCK_LOG");
    #endif
    set_level(Warn);
}

TEST_CASE("set_color_enabled / is_color_enabled", "[log]") {
    set_color_enabled(true);
    REQUIRE(is_color_enabled());

    set_color_enabled(false);
    REQUIRE_FALSE(is_color_enabled());
}

TEST_CASE("Messages below threshold are suppressed", "[log]") {
    set_level(Warn);
    auto output = capture_log([] {
        info("should not appear");
        debug("nor this");
    });
    REQUIRE(output.empty());
}

TEST_CASE("Messages at and above threshold are emitted", "[log]") {
    set_level(Warn);
    auto output = capture_log([] {
        warn("this is a warning");
        error("this is an error");
    });
    REQUIRE(output.find("tyck warn: this is a warning\n") != std::string::npos);
    REQUIRE(output.find("tyck error: this is an error\n") != std::string::npos);
}

TEST_CASE("Format string substitution", "[log]") {
    set_level(Info);
    auto output = capture_log([] {
        info("value: %d, name: %s", 42, "test");
    });
    REQUIRE(output == "tyck info: value: 42, name: test\n");
    set_level(Warn);
}
