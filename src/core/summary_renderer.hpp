#pragma once

#include "core/chapter_tree.hpp"
#include "core/format.hpp"
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace booksum {

/**
 * Render the SUMMARY.md text for a book.
 *
 * Layout:
 *   # <book title>
 *   <blank line>
 *   <root notes>
 *   <chapters; nested chapters indented by four spaces per level>
 *
 * `preferred_order` names root chapters (case-insensitive) to emit first, in
 * the given order; names without a matching chapter are ignored. The
 * remaining chapters follow in tree order.
 */
[[nodiscard]] std::string render_summary(
    const Chapter& book,
    Format format,
    const std::optional<std::vector<std::string>>& preferred_order = std::nullopt);

/**
 * True if the final segment of `path` is README.md (any case).
 */
[[nodiscard]] bool is_readme(std::string_view path);

/**
 * Root chapters in render order for the given preference list.
 */
[[nodiscard]] std::vector<const Chapter*> ordered_chapters(
    const Chapter& book,
    const std::optional<std::vector<std::string>>& preferred_order);

} // namespace booksum
