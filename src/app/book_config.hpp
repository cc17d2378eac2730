#pragma once

#include <QByteArray>
#include <QString>

#include <optional>

#include "app/cli_options.hpp"
#include "core/format.hpp"
#include "core/result.hpp"

namespace booksum::app {

/**
 * Values picked up from a book's own config file:
 *   mdBook  -> book.toml  [book] title, src
 *   GitBook -> book.json / book.js  title, root
 */
struct BookConfig {
    std::optional<QString> title;
    std::optional<QString> sourceDir;  // absolute, resolved against the config file's directory
    QString path;                      // first config file found; empty if none

    [[nodiscard]] bool found() const { return !path.isEmpty(); }
};

// Looks up the config files for `format` in `notesDir`. Missing files are not
// an error; unreadable or malformed ones are (ErrorKind::Config).
[[nodiscard]] Result<BookConfig> load_book_config(const QString& notesDir, Format format);

[[nodiscard]] Result<BookConfig> parse_book_toml(const QString& text, const QString& path);

// `scriptWrapper` accepts GitBook's book.js ("module.exports = {...};").
[[nodiscard]] Result<BookConfig> parse_book_json(const QByteArray& bytes, const QString& path, bool scriptWrapper);

// Fills title and notes dir from the config where the command line left them unset.
void apply_book_config(CliOptions& options, const BookConfig& config);

} // namespace booksum::app
