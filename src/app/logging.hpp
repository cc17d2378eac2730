#pragma once

#include <QLoggingCategory>
#include <QString>

Q_DECLARE_LOGGING_CATEGORY(booksumScanLog)
Q_DECLARE_LOGGING_CATEGORY(booksumConfigLog)
Q_DECLARE_LOGGING_CATEGORY(booksumSummaryLog)

namespace booksum::app {

// Installs a Qt message handler that writes to stderr and, when logFilePath is
// non-empty, appends the same lines (with a UTC timestamp) to that file.
void install_cli_logging(int verbosity, const QString& logFilePath = {});

// Category filter rules for a -v count: 0 warnings, 1 info, 2+ debug.
[[nodiscard]] QString logging_filter_rules(int verbosity);

} // namespace booksum::app
