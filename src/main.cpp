#include <QCommandLineParser>
#include <QCoreApplication>
#include <QTextStream>

#include "app/cli_options.hpp"
#include "app/logging.hpp"
#include "app/summary_command.hpp"

#ifndef BOOKSUM_VERSION
#define BOOKSUM_VERSION "0.0.0"
#endif

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName(QStringLiteral("book-summary"));
    app.setApplicationVersion(QStringLiteral(BOOKSUM_VERSION));

    QCommandLineParser parser;
    booksum::app::configure_parser(parser);
    parser.process(app);

    if (parser.isSet(QStringLiteral("version"))) {
        parser.showVersion();
    }

    QTextStream err(stderr);
    const auto options = booksum::app::read_cli_options(parser);
    if (options.is_err()) {
        err << "Error: " << QString::fromStdString(options.unwrap_err().message) << Qt::endl;
        return 1;
    }

    booksum::app::install_cli_logging(options.unwrap().verbosity, options.unwrap().logFile);
    if (options.unwrap().verbosity > 2) {
        qInfo() << "book-summary" << app.applicationVersion() << "arguments:" << app.arguments();
    }

    QTextStream in(stdin);
    QTextStream out(stdout);
    const auto result = booksum::app::run_summary(options.unwrap(), in, out);
    if (result.is_err()) {
        const auto& error = result.unwrap_err();
        err << "Error: " << QString::fromStdString(error.message)
            << " (" << booksum::to_string(error.kind) << ")" << Qt::endl;
        return 1;
    }

    return 0;
}
