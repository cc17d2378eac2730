#include "app/logging.hpp"

#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QMutex>
#include <QStringList>
#include <QtGlobal>

#include <cstdio>

Q_LOGGING_CATEGORY(booksumScanLog, "booksum.scan")
Q_LOGGING_CATEGORY(booksumConfigLog, "booksum.config")
Q_LOGGING_CATEGORY(booksumSummaryLog, "booksum.summary")

namespace booksum::app {
namespace {

const char* level_tag(QtMsgType type) {
    switch (type) {
        case QtDebugMsg: return "D";
        case QtInfoMsg: return "I";
        case QtWarningMsg: return "W";
        case QtCriticalMsg: return "C";
        case QtFatalMsg: return "F";
    }
    return "?";
}

struct LoggerState {
    QMutex mu;
    QFile err;
    QFile file;
    QString filePath;
    bool initialized = false;
};

LoggerState& state() {
    static LoggerState s{};
    return s;
}

void ensure_open(LoggerState& s) {
    if (s.initialized) return;
    s.initialized = true;

    s.err.open(stderr, QIODevice::WriteOnly | QIODevice::Unbuffered);

    if (s.filePath.isEmpty()) {
        return;
    }

    QDir dir(QFileInfo(s.filePath).absolutePath());
    dir.mkpath(QStringLiteral("."));

    s.file.setFileName(s.filePath);
    if (!s.file.open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
        const auto warning = QStringLiteral("W booksum: cannot open log file %1: %2\n")
                                 .arg(s.filePath, s.file.errorString());
        s.err.write(warning.toUtf8());
    }
}

void message_handler(QtMsgType type,
                     const QMessageLogContext& ctx,
                     const QString& msg) {
    auto& s = state();
    QMutexLocker lock(&s.mu);
    ensure_open(s);

    const auto cat = ctx.category ? QString::fromLatin1(ctx.category) : QStringLiteral("default");
    const auto line = QStringLiteral("%1 %2: %3\n").arg(QString::fromLatin1(level_tag(type)), cat, msg);

    if (s.err.isOpen()) {
        s.err.write(line.toUtf8());
    }

    if (s.file.isOpen()) {
        const auto ts = QDateTime::currentDateTimeUtc().toString(Qt::ISODateWithMs);
        s.file.write((ts + QLatin1Char(' ') + line).toUtf8());
        s.file.flush();
    }
}

} // namespace

QString logging_filter_rules(int verbosity) {
    const auto flag = [](bool on) { return on ? QStringLiteral("true") : QStringLiteral("false"); };
    QStringList rules;
    for (const auto* category : {"booksum.*", "default"}) {
        const auto name = QString::fromLatin1(category);
        rules << name + QStringLiteral(".debug=") + flag(verbosity >= 2)
              << name + QStringLiteral(".info=") + flag(verbosity >= 1);
    }
    return rules.join(QLatin1Char('\n'));
}

void install_cli_logging(int verbosity, const QString& logFilePath) {
    {
        auto& s = state();
        QMutexLocker lock(&s.mu);
        s.filePath = logFilePath;
    }
    QLoggingCategory::setFilterRules(logging_filter_rules(verbosity));
    qInstallMessageHandler(message_handler);
}

} // namespace booksum::app
