#include <catch2/catch.hpp>
#include <pcomb/log.hpp>
#include <functional>
#include <cstdio>
#include <cstring>
#include <string>

#ifdef _WIN32
#include <io.h>
#define dup _dup
#define dup2 _dup2
#define fileno _fileno
#define read _read
#define write _write
#define close _close
#define pipe _pipe
#else
#include <unistd.h>
#endif

using namespace pcomb::log;

// Helper: capture stderr output from a callable
static std::string capture_stderr(std::function<void()> fn) {
    // Flush before redirect
    std::fflush(stderr);

    // Save original stderr
    int saved_stderr = dup(fileno(stderr));

    // Create a pipe
    int pipefd[2];
    pipe(pipefd);

    // Redirect stderr to the write end of the pipe
    dup2(pipefd[1], fileno(stderr));
    close(pipefd[1]);

    // Run the function
    fn();

    // Flush and restore stderr
    std::fflush(stderr);
    dup2(saved_stderr, fileno(stderr));
    close(saved_stderr);

    // Read from the pipe
    std::string output;
    char buf[1024];
    ssize_t n;
    while ((n = read(pipefd[0], buf, sizeof(buf))) > 0) {
        output.append(buf, n);
    }
    close(pipefd[0]);

    return output;
}

TEST_CASE("set_level / get_level roundtrip", "[log]") {
    for (Level lvl : {Trace, Debug, Info, Warn, Error}) {
        set_level(lvl);
        REQUIRE(get_level() == lvl);
    }
    set_level(Info);
}

TEST_CASE("enabled() follows the threshold", "[log]") {
    set_level(Warn);
    REQUIRE_FALSE(enabled(Debug));
    REQUIRE_FALSE(enabled(Info));
    REQUIRE(enabled(Warn));
    REQUIRE(enabled(Error));
    set_level(Info);
}

TEST_CASE("level_name() and parse_level() agree", "[log]") {
    for (Level lvl : {Trace, Debug, Info, Warn, Error}) {
        auto parsed = parse_level(level_name(lvl));
        REQUIRE(parsed.is_ok());
        REQUIRE(parsed.value() == lvl);
    }
    REQUIRE(parse_level("warning").value() == Warn);
}

TEST_CASE("parse_level() rejects unknown names", "[log]") {
    auto r = parse_level("verbose");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == pcomb::PcombError::InvalidArg);
    REQUIRE(r.error().message == "unknown log level: verbose");
}

TEST_CASE("set_color_enabled / is_color_enabled", "[log]") {
    set_color_enabled(true);
    REQUIRE(is_color_enabled() == true);

    set_color_enabled(false);
    REQUIRE(is_color_enabled() == false);
}

TEST_CASE("Messages below threshold are suppressed", "[log]") {
    set_level(Warn);
    set_color_enabled(false);

    auto output = capture_stderr([] {
        debug("consumed %d tokens", 3);
    });
    REQUIRE(output.empty());

    set_level(Info);
}

TEST_CASE("Messages at or above threshold are emitted", "[log]") {
    set_level(Warn);
    set_color_enabled(false);

    auto output = capture_stderr([] {
        warn("ignoring config");
        error("cannot open %s", "doc.items");
    });
    REQUIRE(output.find("warn: ignoring config") != std::string::npos);
    REQUIRE(output.find("error: cannot open doc.items") != std::string::npos);

    set_level(Info);
}

TEST_CASE("Colored prefix when color is enabled", "[log]") {
    set_level(Info);
    set_color_enabled(true);

    auto output = capture_stderr([] {
        info("value: %zu", static_cast<size_t>(7));
    });
    REQUIRE(output.find("\033[32minfo\033[0m: value: 7") != std::string::npos);

    set_color_enabled(false);
}

TEST_CASE("Each level function tags its own level", "[log]") {
    set_level(Trace);
    set_color_enabled(false);

    auto output = capture_stderr([] {
        trace("t%d", 1);
        debug("d%d", 2);
        info("i%d", 3);
        warn("w%d", 4);
        error("e%d", 5);
    });
    REQUIRE(output == "trace: t1\ndebug: d2\ninfo: i3\nwarn: w4\nerror: e5\n");

    set_level(Info);
}
