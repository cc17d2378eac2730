#pragma once

#include <string>
#include <string_view>

namespace booksum {

/**
 * Turn a file or directory name into a display title.
 *
 * Drops the leading run of non-letters ("01-", "3_"), turns underscores into
 * spaces and capitalizes words. Small words (of, and, the, ...) stay lower
 * case unless first or last; words that already carry inner capitals
 * ("WritingIsGood") are kept as written. Letters are whatever QChar
 * classifies as one, so emoji, digits of any script and combining marks all
 * count as prefix.
 *
 *   title_case("1-chapter_1")          == "Chapter 1"
 *   title_case("First_part_of_part_2") == "First Part of Part 2"
 */
[[nodiscard]] std::string title_case(std::string_view raw);

/**
 * Final path segment without its last extension: "a/b/intro.md" -> "intro".
 */
[[nodiscard]] std::string_view file_stem(std::string_view path);

/**
 * Final path segment: "a/b/intro.md" -> "intro.md".
 */
[[nodiscard]] std::string_view file_name(std::string_view path);

/**
 * ASCII lower-casing, used for case-insensitive name comparisons.
 */
[[nodiscard]] std::string to_lower_ascii(std::string_view text);

} // namespace booksum
