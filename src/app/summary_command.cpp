#include "app/summary_command.hpp"

#include <QDir>
#include <QFileInfo>
#include <QTextStream>

#include <optional>
#include <string>
#include <vector>

#include "app/book_config.hpp"
#include "app/logging.hpp"
#include "app/note_scanner.hpp"
#include "app/summary_writer.hpp"
#include "core/chapter_tree.hpp"
#include "core/format.hpp"
#include "core/summary_renderer.hpp"

namespace booksum::app {

namespace {

[[nodiscard]] std::vector<std::string> to_std_strings(const QStringList& list) {
    std::vector<std::string> out;
    out.reserve(static_cast<std::size_t>(list.size()));
    for (const auto& s : list) {
        out.push_back(s.toStdString());
    }
    return out;
}

[[nodiscard]] std::optional<std::vector<std::string>> preferred_order(const CliOptions& options) {
    if (!options.sort) return std::nullopt;
    return to_std_strings(*options.sort);
}

void dump_chapter(const Chapter& chapter, int depth) {
    const auto indent = QString(depth * 2, QLatin1Char(' '));
    qCDebug(booksumSummaryLog).noquote() << indent + QString::fromStdString(chapter.name())
                                         << "files=" << chapter.files().size();
    for (const auto& child : chapter.chapters()) {
        dump_chapter(child, depth + 1);
    }
}

} // namespace

Result<SummaryOutcome> run_summary(CliOptions options, QTextStream& in, QTextStream& out) {
    using Out = Result<SummaryOutcome>;

    auto formatResult = parse_format(options.format.toStdString());
    if (formatResult.is_err()) {
        return Out::err(formatResult.unwrap_err());
    }
    const auto format = formatResult.unwrap();

    auto config = load_book_config(options.notesDir, format);
    if (config.is_err()) {
        return Out::err(config.unwrap_err());
    }
    apply_book_config(options, config.unwrap());

    const auto formatName = format.name();
    qCInfo(booksumSummaryLog) << "Building" << QLatin1String(formatName.data(), static_cast<qsizetype>(formatName.size()))
                              << "summary for" << options.notesDir;

    auto scanned = scan_notes(options.notesDir, options.outputFile);
    if (scanned.is_err()) {
        return Out::err(scanned.unwrap_err());
    }
    const auto& entries = scanned.unwrap();
    if (options.verbosity > 2) {
        for (const auto& entry : entries) {
            qCDebug(booksumScanLog) << "entry" << entry;
        }
    }

    auto build = build_chapter_tree(options.title.toStdString(), to_std_strings(entries));
    for (const auto& rejected : build.rejected) {
        qCWarning(booksumSummaryLog) << "Skipping entry:" << QString::fromStdString(rejected.message);
    }
    if (options.verbosity > 2) {
        dump_chapter(build.book, 0);
    }

    SummaryOutcome outcome;
    outcome.outputPath = QDir(options.notesDir).filePath(options.outputFile);
    outcome.noteCount = count_files(build.book);
    outcome.rejectedCount = build.rejected.size();

    if (QFileInfo::exists(outcome.outputPath) && !options.overwrite
        && !confirm_overwrite(options.outputFile, in, out)) {
        qCInfo(booksumSummaryLog) << "Left" << outcome.outputPath << "unchanged";
        outcome.status = SummaryOutcome::Status::Declined;
        return Out::ok(std::move(outcome));
    }

    const auto text = render_summary(build.book, format, preferred_order(options));
    auto written = write_summary(outcome.outputPath, QString::fromStdString(text));
    if (written.is_err()) {
        return Out::err(written.unwrap_err());
    }

    out << "Successfully created " << outcome.outputPath << "\n";
    out.flush();
    return Out::ok(std::move(outcome));
}

} // namespace booksum::app
