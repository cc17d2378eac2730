#include <catch2/catch_test_macros.hpp>

#include <QStringList>

#include "app/cli_options.hpp"
#include "app/logging.hpp"

using booksum::ErrorKind;
using booksum::app::logging_filter_rules;
using booksum::app::parse_cli_options;

namespace {

QStringList args(std::initializer_list<const char*> rest) {
    QStringList out{QStringLiteral("book-summary")};
    for (const auto* a : rest) {
        out.append(QString::fromUtf8(a));
    }
    return out;
}

} // namespace

TEST_CASE("CLI options: defaults", "[app][cli]") {
    const auto result = parse_cli_options(args({}));
    REQUIRE(result.is_ok());

    const auto& options = result.unwrap();
    REQUIRE(options.format == QStringLiteral("md"));
    REQUIRE(options.title == QStringLiteral("Summary"));
    REQUIRE(options.outputFile == QStringLiteral("SUMMARY.md"));
    REQUIRE(options.notesDir == QStringLiteral("."));
    REQUIRE_FALSE(options.sort.has_value());
    REQUIRE_FALSE(options.overwrite);
    REQUIRE(options.verbosity == 0);
    REQUIRE_FALSE(options.titleSet);
    REQUIRE_FALSE(options.notesDirSet);
}

TEST_CASE("CLI options: explicit values", "[app][cli]") {
    const auto result = parse_cli_options(args({
        "-f", "git", "--title", "My Notes", "-o", "TOC.md", "-n", "docs", "-y", "--log-file", "run.log",
    }));
    REQUIRE(result.is_ok());

    const auto& options = result.unwrap();
    REQUIRE(options.format == QStringLiteral("git"));
    REQUIRE(options.title == QStringLiteral("My Notes"));
    REQUIRE(options.titleSet);
    REQUIRE(options.outputFile == QStringLiteral("TOC.md"));
    REQUIRE(options.notesDir == QStringLiteral("docs"));
    REQUIRE(options.notesDirSet);
    REQUIRE(options.overwrite);
    REQUIRE(options.logFile == QStringLiteral("run.log"));
}

TEST_CASE("CLI options: verbosity counts repeats", "[app][cli]") {
    REQUIRE(parse_cli_options(args({"-v"})).unwrap().verbosity == 1);
    REQUIRE(parse_cli_options(args({"-vvv"})).unwrap().verbosity == 3);
    REQUIRE(parse_cli_options(args({"-v", "--verbose"})).unwrap().verbosity == 2);
}

TEST_CASE("CLI options: sort list", "[app][cli][sort]") {
    SECTION("repeated option") {
        const auto result = parse_cli_options(args({"-s", "part4", "-s", "part3"}));
        REQUIRE(result.is_ok());
        REQUIRE(*result.unwrap().sort == QStringList{"part4", "part3"});
    }

    SECTION("comma separated value") {
        const auto result = parse_cli_options(args({"--sort", "part4, part5,part3"}));
        REQUIRE(result.is_ok());
        REQUIRE(*result.unwrap().sort == QStringList{"part4", "part5", "part3"});
    }

    SECTION("names may contain spaces") {
        const auto result = parse_cli_options(args({"-s", "part one,part two", "-s", "appendix b"}));
        REQUIRE(result.is_ok());
        REQUIRE(*result.unwrap().sort == QStringList{"part one", "part two", "appendix b"});
    }

    SECTION("trailing names continue the list") {
        const auto result = parse_cli_options(args({"-s", "part4", "part5", "part3"}));
        REQUIRE(result.is_ok());
        REQUIRE(*result.unwrap().sort == QStringList{"part4", "part5", "part3"});
    }
}

TEST_CASE("CLI options: usage errors", "[app][cli]") {
    SECTION("unknown option") {
        const auto result = parse_cli_options(args({"--frobnicate"}));
        REQUIRE(result.is_err());
        REQUIRE(result.unwrap_err().kind == ErrorKind::Usage);
    }

    SECTION("stray positional argument") {
        const auto result = parse_cli_options(args({"part1"}));
        REQUIRE(result.is_err());
        REQUIRE(result.unwrap_err().kind == ErrorKind::Usage);
    }

    SECTION("empty output file") {
        const auto result = parse_cli_options(args({"-o", ""}));
        REQUIRE(result.is_err());
        REQUIRE(result.unwrap_err().kind == ErrorKind::Usage);
    }
}

TEST_CASE("Verbosity maps to logging filter rules", "[app][cli][logging]") {
    const auto quiet = logging_filter_rules(0).split(QLatin1Char('\n'));
    REQUIRE(quiet.contains(QStringLiteral("booksum.*.info=false")));
    REQUIRE(quiet.contains(QStringLiteral("booksum.*.debug=false")));

    const auto info = logging_filter_rules(1).split(QLatin1Char('\n'));
    REQUIRE(info.contains(QStringLiteral("booksum.*.info=true")));
    REQUIRE(info.contains(QStringLiteral("default.debug=false")));

    const auto debug = logging_filter_rules(3).split(QLatin1Char('\n'));
    REQUIRE(debug.contains(QStringLiteral("booksum.*.debug=true")));
    REQUIRE(debug.contains(QStringLiteral("default.info=true")));
}
