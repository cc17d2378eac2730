#pragma once

#include <QString>

#include "core/result.hpp"

class QTextStream;

namespace booksum::app {

// Asks on `out` whether `fileName` may be overwritten and reads answers from
// `in` until one is valid. "y", "Y" or an empty line mean yes; "n" or "N" mean
// no. End of input counts as no.
[[nodiscard]] bool confirm_overwrite(const QString& fileName, QTextStream& in, QTextStream& out);

// Writes `text` as UTF-8, replacing `path` atomically.
[[nodiscard]] Result<void> write_summary(const QString& path, const QString& text);

} // namespace booksum::app
