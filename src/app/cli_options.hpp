#pragma once

#include <QString>
#include <QStringList>

#include <optional>

#include "core/result.hpp"

class QCommandLineParser;

namespace booksum::app {

struct CliOptions {
    QString format = QStringLiteral("md");
    QString title = QStringLiteral("Summary");
    std::optional<QStringList> sort;
    QString outputFile = QStringLiteral("SUMMARY.md");
    QString notesDir = QStringLiteral(".");
    bool overwrite = false;
    int verbosity = 0;
    QString logFile;

    // Which values came from the command line; book config only fills the rest.
    bool titleSet = false;
    bool notesDirSet = false;
};

// Registers every book-summary option (plus --help/--version) on `parser`.
void configure_parser(QCommandLineParser& parser);

// Reads options from a parser that has already parsed/processed argv.
[[nodiscard]] Result<CliOptions> read_cli_options(const QCommandLineParser& parser);

// configure_parser + parse + read_cli_options, for callers that own no
// QCoreApplication (tests, tools).
[[nodiscard]] Result<CliOptions> parse_cli_options(const QStringList& arguments);

} // namespace booksum::app
