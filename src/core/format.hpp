#pragma once

#include "core/result.hpp"
#include <string>
#include <string_view>
#include <vector>

namespace booksum {

/**
 * Format - the output dialect of SUMMARY.md.
 *
 * A closed set: mdBook lists with '-' and marks a chapter without README as
 * "[Title](#)"; GitBook lists with '*' and prints the bare title.
 */
class Format {
public:
    enum class Kind {
        MdBook,
        GitBook
    };

    [[nodiscard]] static constexpr Format mdbook() noexcept { return Format(Kind::MdBook); }
    [[nodiscard]] static constexpr Format gitbook() noexcept { return Format(Kind::GitBook); }

    [[nodiscard]] constexpr char marker() const noexcept {
        switch (kind_) {
            case Kind::MdBook: return '-';
            case Kind::GitBook: return '*';
        }
        return '-';
    }

    /**
     * Heading text for a chapter that has no README to link to.
     */
    [[nodiscard]] std::string unlinked_heading(std::string_view title) const;

    /**
     * Book config files read for this dialect, in lookup order.
     */
    [[nodiscard]] std::vector<std::string> config_file_names() const;

    // "mdbook" or "gitbook", for log lines.
    [[nodiscard]] std::string_view name() const noexcept;

    constexpr bool operator==(const Format&) const = default;

private:
    explicit constexpr Format(Kind kind) noexcept : kind_(kind) {}

    Kind kind_;
};

/**
 * Map a CLI/config selector to a Format. Accepts "md", "mdbook", "git" and
 * "gitbook" in any case; anything else is ErrorKind::UnknownFormat.
 */
[[nodiscard]] Result<Format> parse_format(std::string_view selector);

} // namespace booksum
