#pragma once

#include <QString>
#include <QStringList>

#include "core/result.hpp"

namespace booksum::app {

// Recursively lists the markdown notes below `rootDir` as '/'-separated
// paths relative to it, depth first with siblings sorted by name.
// Hidden entries, the output file and a root-level README.md are left out.
[[nodiscard]] Result<QStringList> scan_notes(const QString& rootDir, const QString& outputFile);

} // namespace booksum::app
