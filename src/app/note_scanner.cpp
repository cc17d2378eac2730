#include "app/note_scanner.hpp"

#include <QDir>
#include <QFileInfo>
#include <QFileInfoList>

#include <algorithm>

#include "app/logging.hpp"

namespace booksum::app {

namespace {

[[nodiscard]] bool is_hidden(const QFileInfo& info) {
    return info.fileName().startsWith(QLatin1Char('.'));
}

[[nodiscard]] bool is_note(const QFileInfo& info) {
    return info.isFile() && info.suffix().compare(QStringLiteral("md"), Qt::CaseInsensitive) == 0;
}

[[nodiscard]] QFileInfoList sorted_entries(const QDir& dir) {
    auto entries = dir.entryInfoList(QDir::Dirs | QDir::Files | QDir::Hidden | QDir::NoDotAndDotDot,
                                     QDir::NoSort);
    std::sort(entries.begin(), entries.end(), [](const QFileInfo& a, const QFileInfo& b) {
        return a.fileName() < b.fileName();
    });
    return entries;
}

void collect_notes(const QDir& dir,
                   const QString& prefix,
                   const QString& outputFile,
                   QStringList& out) {
    for (const auto& info : sorted_entries(dir)) {
        if (is_hidden(info)) {
            continue;
        }

        const auto relative = prefix + info.fileName();
        if (info.isDir()) {
            if (info.isSymLink()) {
                qCDebug(booksumScanLog) << "Not following symlinked directory" << relative;
                continue;
            }
            collect_notes(QDir(info.absoluteFilePath()), relative + QLatin1Char('/'), outputFile, out);
            continue;
        }

        if (!is_note(info)) {
            continue;
        }
        if (relative == outputFile) {
            continue;
        }
        if (prefix.isEmpty() && relative.compare(QStringLiteral("readme.md"), Qt::CaseInsensitive) == 0) {
            continue;
        }
        out.append(relative);
    }
}

} // namespace

Result<QStringList> scan_notes(const QString& rootDir, const QString& outputFile) {
    const QFileInfo root(rootDir);
    if (!root.isDir()) {
        return Result<QStringList>::err(Error{ErrorKind::Io, ("Path " + rootDir + " not found!").toStdString()});
    }

    // "./SUMMARY.md", "docs/../SUMMARY.md" and an absolute path below the
    // root all name the same file as "SUMMARY.md".
    const QDir rootDirectory(root.absoluteFilePath());
    const auto excluded = QDir::cleanPath(
        rootDirectory.relativeFilePath(rootDirectory.absoluteFilePath(QDir::fromNativeSeparators(outputFile))));

    QStringList notes;
    collect_notes(rootDirectory, QString{}, excluded, notes);
    qCInfo(booksumScanLog) << "Found" << notes.size() << "notes in" << root.absoluteFilePath();
    return Result<QStringList>::ok(std::move(notes));
}

} // namespace booksum::app
