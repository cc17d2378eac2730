#include "app/summary_writer.hpp"

#include <QSaveFile>
#include <QTextStream>

#include "app/logging.hpp"

namespace booksum::app {

bool confirm_overwrite(const QString& fileName, QTextStream& in, QTextStream& out) {
    while (true) {
        out << "File " << fileName << " already exists, do you want to overwrite it? [Y/n]\n";
        out.flush();

        const auto answer = in.readLine();
        if (answer.isNull()) {
            return false;
        }
        if (answer.isEmpty() || answer == QStringLiteral("y") || answer == QStringLiteral("Y")) {
            return true;
        }
        if (answer == QStringLiteral("n") || answer == QStringLiteral("N")) {
            return false;
        }
    }
}

Result<void> write_summary(const QString& path, const QString& text) {
    QSaveFile file(path);
    if (!file.open(QIODevice::WriteOnly)) {
        return Result<void>::err(Error{ErrorKind::Io,
                                       ("Couldn't create " + path + ": " + file.errorString()).toStdString()});
    }

    const auto bytes = text.toUtf8();
    if (file.write(bytes) != bytes.size()) {
        return Result<void>::err(Error{ErrorKind::Io,
                                       ("Couldn't write to " + path + ": " + file.errorString()).toStdString()});
    }
    if (!file.commit()) {
        return Result<void>::err(Error{ErrorKind::Io,
                                       ("Couldn't write to " + path + ": " + file.errorString()).toStdString()});
    }

    qCDebug(booksumSummaryLog) << "Wrote" << bytes.size() << "bytes to" << path;
    return Result<void>::ok();
}

} // namespace booksum::app
