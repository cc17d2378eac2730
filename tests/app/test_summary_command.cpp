#include <catch2/catch_test_macros.hpp>

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QTemporaryDir>
#include <QTextStream>

#include "app/summary_command.hpp"

using booksum::ErrorKind;
using namespace booksum::app;

namespace {

void writeFile(const QString& path, const QByteArray& content) {
    REQUIRE(QDir().mkpath(QFileInfo(path).absolutePath()));
    QFile f(path);
    REQUIRE(f.open(QIODevice::WriteOnly | QIODevice::Truncate));
    REQUIRE(f.write(content) == content.size());
}

QByteArray readFile(const QString& path) {
    QFile f(path);
    if (!f.open(QIODevice::ReadOnly)) {
        return {};
    }
    return f.readAll();
}

struct Console {
    QString input;
    QString output;
    QTextStream in{&input, QIODevice::ReadOnly};
    QTextStream out{&output, QIODevice::WriteOnly};

    explicit Console(const QString& answers = {}) : input(answers) {}
};

CliOptions optionsFor(const QString& notesDir) {
    CliOptions options;
    options.notesDir = notesDir;
    options.notesDirSet = true;
    return options;
}

} // namespace

TEST_CASE("Summary run: mdBook layout with book.toml", "[app][run]") {
    QTemporaryDir tmp;
    REQUIRE(tmp.isValid());
    writeFile(tmp.filePath("book.toml"), "[book]\ntitle = \"Field Notes\"\nsrc = \"src\"\n");
    writeFile(tmp.filePath("src/intro.md"), "");
    writeFile(tmp.filePath("src/part_one/README.md"), "");
    writeFile(tmp.filePath("src/part_one/first_steps.md"), "");
    writeFile(tmp.filePath("src/notes.txt"), "");

    auto options = optionsFor(tmp.path());
    options.notesDirSet = false;
    Console console;

    const auto result = run_summary(options, console.in, console.out);
    REQUIRE(result.is_ok());

    const auto& outcome = result.unwrap();
    REQUIRE(outcome.status == SummaryOutcome::Status::Written);
    REQUIRE(outcome.noteCount == 3);
    REQUIRE(outcome.rejectedCount == 0);
    REQUIRE(outcome.outputPath == QDir(QDir::cleanPath(tmp.filePath("src"))).filePath("SUMMARY.md"));

    REQUIRE(readFile(outcome.outputPath) ==
            "# Field Notes\n"
            "\n"
            "- [Intro](intro.md)\n"
            "- [Part One](part_one/README.md)\n"
            "    - [First Steps](part_one/first_steps.md)\n");
    REQUIRE(console.output.startsWith(QStringLiteral("Successfully created ")));
}

TEST_CASE("Summary run: GitBook layout with sort order", "[app][run]") {
    QTemporaryDir tmp;
    REQUIRE(tmp.isValid());
    writeFile(tmp.filePath("book.json"), R"({"title": "Handbook"})");
    writeFile(tmp.filePath("alpha/a.md"), "");
    writeFile(tmp.filePath("beta/b.md"), "");

    auto options = optionsFor(tmp.path());
    options.format = QStringLiteral("git");
    options.sort = QStringList{"beta"};
    Console console;

    const auto result = run_summary(options, console.in, console.out);
    REQUIRE(result.is_ok());
    REQUIRE(readFile(result.unwrap().outputPath) ==
            "# Handbook\n"
            "\n"
            "* Beta\n"
            "    * [B](beta/b.md)\n"
            "* Alpha\n"
            "    * [A](alpha/a.md)\n");
}

TEST_CASE("Summary run: existing output file", "[app][run]") {
    QTemporaryDir tmp;
    REQUIRE(tmp.isValid());
    writeFile(tmp.filePath("page.md"), "");
    writeFile(tmp.filePath("SUMMARY.md"), "keep me\n");

    SECTION("declined at the prompt") {
        Console console(QStringLiteral("n\n"));
        const auto result = run_summary(optionsFor(tmp.path()), console.in, console.out);
        REQUIRE(result.is_ok());
        REQUIRE(result.unwrap().status == SummaryOutcome::Status::Declined);
        REQUIRE(readFile(tmp.filePath("SUMMARY.md")) == "keep me\n");
        REQUIRE(console.output.contains(QStringLiteral("already exists")));
    }

    SECTION("accepted at the prompt") {
        Console console(QStringLiteral("y\n"));
        const auto result = run_summary(optionsFor(tmp.path()), console.in, console.out);
        REQUIRE(result.is_ok());
        REQUIRE(result.unwrap().status == SummaryOutcome::Status::Written);
        REQUIRE(readFile(tmp.filePath("SUMMARY.md")) == "# Summary\n\n- [Page](page.md)\n");
    }

    SECTION("overwrite flag skips the prompt") {
        auto options = optionsFor(tmp.path());
        options.overwrite = true;
        Console console;
        const auto result = run_summary(options, console.in, console.out);
        REQUIRE(result.is_ok());
        REQUIRE(result.unwrap().status == SummaryOutcome::Status::Written);
        REQUIRE_FALSE(console.output.contains(QStringLiteral("already exists")));
    }
}

TEST_CASE("Summary run: failures", "[app][run]") {
    QTemporaryDir tmp;
    REQUIRE(tmp.isValid());

    SECTION("unknown format") {
        auto options = optionsFor(tmp.path());
        options.format = QStringLiteral("docx");
        Console console;
        const auto result = run_summary(options, console.in, console.out);
        REQUIRE(result.is_err());
        REQUIRE(result.unwrap_err().kind == ErrorKind::UnknownFormat);
    }

    SECTION("missing notes directory") {
        Console console;
        const auto result = run_summary(optionsFor(tmp.filePath("absent")), console.in, console.out);
        REQUIRE(result.is_err());
        REQUIRE(result.unwrap_err().kind == ErrorKind::Io);
    }
}
