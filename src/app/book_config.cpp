#include "app/book_config.hpp"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <QStringList>

#include "app/logging.hpp"

namespace booksum::app {

namespace {

[[nodiscard]] Error config_error(const QString& path, const QString& what) {
    return Error{ErrorKind::Config, (path + QStringLiteral(": ") + what).toStdString()};
}

[[nodiscard]] QString resolve_against(const QString& configPath, const QString& dir) {
    const auto base = QFileInfo(configPath).absolutePath();
    return QDir::cleanPath(QDir(base).absoluteFilePath(dir));
}

// Quote-aware walk over one TOML line. Stops at a '#' comment.
// Returns the line without its comment; `bracketDelta` counts '[' minus ']'.
QString strip_toml_comment(const QString& line, int* bracketDelta = nullptr) {
    QChar quote;
    bool escaped = false;
    int depth = 0;
    for (qsizetype i = 0; i < line.size(); ++i) {
        const auto c = line.at(i);
        if (!quote.isNull()) {
            if (escaped) {
                escaped = false;
            } else if (c == QLatin1Char('\\') && quote == QLatin1Char('"')) {
                escaped = true;
            } else if (c == quote) {
                quote = QChar();
            }
            continue;
        }
        if (c == QLatin1Char('"') || c == QLatin1Char('\'')) {
            quote = c;
        } else if (c == QLatin1Char('[')) {
            ++depth;
        } else if (c == QLatin1Char(']')) {
            --depth;
        } else if (c == QLatin1Char('#')) {
            if (bracketDelta) *bracketDelta = depth;
            return line.left(i);
        }
    }
    if (bracketDelta) *bracketDelta = depth;
    return line;
}

[[nodiscard]] QString unquote_key(QString key) {
    key = key.trimmed();
    if (key.size() >= 2 && (key.startsWith(QLatin1Char('"')) || key.startsWith(QLatin1Char('\'')))
        && key.back() == key.front()) {
        return key.mid(1, key.size() - 2);
    }
    return key;
}

// Parses a single-line TOML string value. Non-string values yield nullopt.
[[nodiscard]] Result<std::optional<QString>> parse_toml_string(const QString& value) {
    using Out = Result<std::optional<QString>>;
    if (value.isEmpty()) {
        return Out::err(Error{ErrorKind::Config, "missing value"});
    }

    const auto open = value.front();
    if (open == QLatin1Char('\'')) {
        const auto close = value.indexOf(QLatin1Char('\''), 1);
        if (close < 0) {
            return Out::err(Error{ErrorKind::Config, "unterminated string"});
        }
        return Out::ok(value.mid(1, close - 1));
    }
    if (open != QLatin1Char('"')) {
        return Out::ok(std::nullopt);
    }

    QString out;
    for (qsizetype i = 1; i < value.size(); ++i) {
        const auto c = value.at(i);
        if (c == QLatin1Char('"')) {
            return Out::ok(out);
        }
        if (c != QLatin1Char('\\')) {
            out += c;
            continue;
        }
        if (++i >= value.size()) break;
        switch (value.at(i).unicode()) {
            case 'n': out += QLatin1Char('\n'); break;
            case 't': out += QLatin1Char('\t'); break;
            case 'r': out += QLatin1Char('\r'); break;
            case 'u': {
                bool ok = false;
                const auto code = value.mid(i + 1, 4).toUInt(&ok, 16);
                if (!ok) {
                    return Out::err(Error{ErrorKind::Config, "invalid \\u escape"});
                }
                out += QChar(static_cast<char16_t>(code));
                i += 4;
                break;
            }
            default: out += value.at(i); break;
        }
    }
    return Out::err(Error{ErrorKind::Config, "unterminated string"});
}

[[nodiscard]] Result<BookConfig> parse_book_json_object(const QJsonObject& obj, const QString& path) {
    BookConfig config;
    config.path = path;

    const auto title = obj.value(QStringLiteral("title"));
    if (title.isString() && !title.toString().isEmpty()) {
        config.title = title.toString();
    }
    const auto root = obj.value(QStringLiteral("root"));
    if (root.isString() && !root.toString().isEmpty()) {
        config.sourceDir = resolve_against(path, root.toString());
    }
    return Result<BookConfig>::ok(std::move(config));
}

[[nodiscard]] Result<BookConfig> read_config_file(const QString& path) {
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        return Result<BookConfig>::err(config_error(path, QStringLiteral("cannot open: ") + file.errorString()));
    }
    const auto bytes = file.readAll();

    const auto suffix = QFileInfo(path).suffix().toLower();
    if (suffix == QStringLiteral("toml")) {
        return parse_book_toml(QString::fromUtf8(bytes), path);
    }
    return parse_book_json(bytes, path, suffix == QStringLiteral("js"));
}

void merge_missing(BookConfig& into, const BookConfig& from) {
    if (!into.found()) {
        into = from;
        return;
    }
    if (!into.title) into.title = from.title;
    if (!into.sourceDir) into.sourceDir = from.sourceDir;
}

} // namespace

Result<BookConfig> parse_book_toml(const QString& text, const QString& path) {
    BookConfig config;
    config.path = path;

    QString table;
    QString openMultiline;  // """ or ''' while inside a multi-line string
    int openBrackets = 0;   // while inside a multi-line array

    const auto lines = text.split(QLatin1Char('\n'));
    for (qsizetype n = 0; n < lines.size(); ++n) {
        const auto& raw = lines.at(n);
        const auto lineNo = QString::number(n + 1);

        if (!openMultiline.isEmpty()) {
            if (raw.contains(openMultiline)) openMultiline.clear();
            continue;
        }
        int delta = 0;
        const auto line = strip_toml_comment(raw, &delta).trimmed();
        if (openBrackets > 0) {
            openBrackets += delta;
            continue;
        }
        if (line.isEmpty()) {
            continue;
        }

        if (line.startsWith(QLatin1Char('['))) {
            if (!line.endsWith(QLatin1Char(']'))) {
                return Result<BookConfig>::err(config_error(path, QStringLiteral("line %1: unterminated table header").arg(lineNo)));
            }
            auto name = line;
            while (name.startsWith(QLatin1Char('['))) name.remove(0, 1);
            while (name.endsWith(QLatin1Char(']'))) name.chop(1);
            table = unquote_key(name);
            continue;
        }

        const auto eq = line.indexOf(QLatin1Char('='));
        if (eq <= 0) {
            return Result<BookConfig>::err(config_error(path, QStringLiteral("line %1: expected key = value").arg(lineNo)));
        }

        auto key = unquote_key(line.left(eq));
        const auto value = line.mid(eq + 1).trimmed();

        if (value.startsWith(QStringLiteral("\"\"\"")) || value.startsWith(QStringLiteral("'''"))) {
            const auto delimiter = value.left(3);
            if (value.indexOf(delimiter, 3) < 0) openMultiline = delimiter;
            continue;
        }
        if (value.startsWith(QLatin1Char('['))) {
            strip_toml_comment(value, &openBrackets);
            continue;
        }

        auto effectiveTable = table;
        if (table.isEmpty() && key.startsWith(QStringLiteral("book."))) {
            effectiveTable = QStringLiteral("book");
            key = key.mid(5);
        }
        if (effectiveTable != QStringLiteral("book")
            || (key != QStringLiteral("title") && key != QStringLiteral("src"))) {
            continue;
        }

        auto parsed = parse_toml_string(value);
        if (parsed.is_err()) {
            return Result<BookConfig>::err(config_error(
                path, QStringLiteral("line %1: %2").arg(lineNo, QString::fromStdString(parsed.unwrap_err().message))));
        }
        const auto& str = parsed.unwrap();
        if (!str || str->isEmpty()) {
            continue;
        }
        if (key == QStringLiteral("title")) {
            config.title = *str;
        } else {
            config.sourceDir = resolve_against(path, *str);
        }
    }

    return Result<BookConfig>::ok(std::move(config));
}

Result<BookConfig> parse_book_json(const QByteArray& bytes, const QString& path, bool scriptWrapper) {
    auto body = bytes;
    if (scriptWrapper) {
        const auto first = bytes.indexOf('{');
        const auto last = bytes.lastIndexOf('}');
        if (first < 0 || last < first) {
            return Result<BookConfig>::err(config_error(path, QStringLiteral("no object literal found")));
        }
        body = bytes.mid(first, last - first + 1);
    }

    QJsonParseError parseError{};
    const auto doc = QJsonDocument::fromJson(body, &parseError);
    if (parseError.error != QJsonParseError::NoError) {
        return Result<BookConfig>::err(config_error(path, parseError.errorString()));
    }
    if (!doc.isObject()) {
        return Result<BookConfig>::err(config_error(path, QStringLiteral("expected a JSON object")));
    }
    return parse_book_json_object(doc.object(), path);
}

Result<BookConfig> load_book_config(const QString& notesDir, Format format) {
    BookConfig merged;
    const QDir dir(notesDir);

    for (const auto& name : format.config_file_names()) {
        const auto path = dir.filePath(QString::fromStdString(name));
        if (!QFileInfo::exists(path)) {
            qCDebug(booksumConfigLog) << "Book config file" << path << "not found";
            continue;
        }

        auto parsed = read_config_file(path);
        if (parsed.is_err()) {
            return parsed;
        }
        qCInfo(booksumConfigLog) << "Found book config file:" << path;
        merge_missing(merged, parsed.unwrap());
    }
    return Result<BookConfig>::ok(std::move(merged));
}

void apply_book_config(CliOptions& options, const BookConfig& config) {
    if (!options.titleSet && config.title) {
        qCInfo(booksumConfigLog) << "Using title from" << config.path << ":" << *config.title;
        options.title = *config.title;
    }
    if (!options.notesDirSet && config.sourceDir) {
        qCInfo(booksumConfigLog) << "Using notes directory from" << config.path << ":" << *config.sourceDir;
        options.notesDir = *config.sourceDir;
    }
}

} // namespace booksum::app
