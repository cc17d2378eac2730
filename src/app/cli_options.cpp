#include "app/cli_options.hpp"

#include <QCommandLineOption>
#include <QCommandLineParser>

namespace booksum::app {

namespace {

[[nodiscard]] QString string_value(const QCommandLineParser& parser, const QString& name, const QString& fallback) {
    return parser.isSet(name) ? parser.value(name) : fallback;
}

[[nodiscard]] int count_verbose_flags(const QCommandLineParser& parser) {
    int count = 0;
    for (const auto& name : parser.optionNames()) {
        if (name == QStringLiteral("v") || name == QStringLiteral("verbose")) {
            ++count;
        }
    }
    return count;
}

// "-s part4 -s 'part5,part3'" and "-s part4 part5 part3" both name three
// chapters. Only commas separate names; "part one" stays a single chapter.
[[nodiscard]] QStringList split_sort_values(const QStringList& values) {
    QStringList names;
    for (const auto& value : values) {
        for (const auto& part : value.split(QLatin1Char(','))) {
            const auto name = part.trimmed();
            if (!name.isEmpty()) {
                names.append(name);
            }
        }
    }
    return names;
}

} // namespace

void configure_parser(QCommandLineParser& parser) {
    parser.setApplicationDescription(
        QStringLiteral("Create a SUMMARY.md table of contents for an mdBook or GitBook notes directory."));
    parser.addHelpOption();
    // -v is taken by --verbose, so --version is registered without a short name.
    parser.addOption(QCommandLineOption(QStringList{QStringLiteral("version")},
                                        QStringLiteral("Displays version information.")));

    parser.addOption(QCommandLineOption(
        QStringList{QStringLiteral("f"), QStringLiteral("format")},
        QStringLiteral("Output format: md (mdBook) or git (GitBook)."),
        QStringLiteral("format"),
        QStringLiteral("md")));

    parser.addOption(QCommandLineOption(
        QStringList{QStringLiteral("t"), QStringLiteral("title")},
        QStringLiteral("Title of the summary (defaults to the book config title, then 'Summary')."),
        QStringLiteral("title"),
        QStringLiteral("Summary")));

    parser.addOption(QCommandLineOption(
        QStringList{QStringLiteral("s"), QStringLiteral("sort")},
        QStringLiteral("Start with these chapters; repeat the option or separate names by commas."),
        QStringLiteral("chapter")));

    parser.addOption(QCommandLineOption(
        QStringList{QStringLiteral("o"), QStringLiteral("outputfile")},
        QStringLiteral("Output file, relative to the notes directory."),
        QStringLiteral("file"),
        QStringLiteral("SUMMARY.md")));

    parser.addOption(QCommandLineOption(
        QStringList{QStringLiteral("n"), QStringLiteral("notesdir")},
        QStringLiteral("Notes directory to build the summary from."),
        QStringLiteral("dir"),
        QStringLiteral(".")));

    parser.addOption(QCommandLineOption(
        QStringList{QStringLiteral("y"), QStringLiteral("overwrite")},
        QStringLiteral("Overwrite an existing output file without asking.")));

    parser.addOption(QCommandLineOption(
        QStringList{QStringLiteral("v"), QStringLiteral("verbose")},
        QStringLiteral("Verbose output; repeat for more (-v, -vv, -vvv).")));

    parser.addOption(QCommandLineOption(
        QStringList{QStringLiteral("log-file")},
        QStringLiteral("Also append log output to this file."),
        QStringLiteral("path")));

    parser.addPositionalArgument(QStringLiteral("chapters"),
                                 QStringLiteral("Further chapter names for --sort."),
                                 QStringLiteral("[chapters...]"));
}

Result<CliOptions> read_cli_options(const QCommandLineParser& parser) {
    CliOptions options;

    options.format = string_value(parser, QStringLiteral("format"), options.format).trimmed();

    options.titleSet = parser.isSet(QStringLiteral("title"));
    options.title = string_value(parser, QStringLiteral("title"), options.title);

    options.notesDirSet = parser.isSet(QStringLiteral("notesdir"));
    options.notesDir = string_value(parser, QStringLiteral("notesdir"), options.notesDir);
    if (options.notesDir.trimmed().isEmpty()) {
        return Result<CliOptions>::err(Error{ErrorKind::Usage, "--notesdir must not be empty"});
    }

    options.outputFile = string_value(parser, QStringLiteral("outputfile"), options.outputFile).trimmed();
    if (options.outputFile.isEmpty()) {
        return Result<CliOptions>::err(Error{ErrorKind::Usage, "--outputfile must not be empty"});
    }

    const auto positional = parser.positionalArguments();
    if (parser.isSet(QStringLiteral("sort"))) {
        options.sort = split_sort_values(parser.values(QStringLiteral("sort")) + positional);
    } else if (!positional.isEmpty()) {
        return Result<CliOptions>::err(Error{
            ErrorKind::Usage,
            ("Unexpected argument: " + positional.first() + " (chapter names belong to --sort)").toStdString()});
    }

    options.overwrite = parser.isSet(QStringLiteral("overwrite"));
    options.verbosity = count_verbose_flags(parser);
    options.logFile = parser.value(QStringLiteral("log-file"));

    return Result<CliOptions>::ok(std::move(options));
}

Result<CliOptions> parse_cli_options(const QStringList& arguments) {
    QCommandLineParser parser;
    configure_parser(parser);
    if (!parser.parse(arguments)) {
        return Result<CliOptions>::err(Error{ErrorKind::Usage, parser.errorText().toStdString()});
    }
    return read_cli_options(parser);
}

} // namespace booksum::app
