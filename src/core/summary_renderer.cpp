#include "core/summary_renderer.hpp"

#include "core/title_case.hpp"

#include <algorithm>
#include <unordered_set>

namespace booksum {
namespace {

constexpr std::size_t kIndentWidth = 4;

[[nodiscard]] std::string render_link(std::string_view title, std::string_view target) {
    std::string out;
    out.reserve(title.size() + target.size() + 4);
    out += '[';
    out += title;
    out += "](";
    out += target;
    out += ')';
    return out;
}

void append_line(std::string& out, std::size_t level, char marker, std::string_view text) {
    out.append(level * kIndentWidth, ' ');
    out += marker;
    out += ' ';
    out += text;
    out += '\n';
}

void render_files(std::string& out, const std::vector<std::string>& files, std::size_t level, char marker) {
    for (const auto& file : files) {
        if (is_readme(file)) {
            continue;
        }
        append_line(out, level, marker, render_link(title_case(file_stem(file)), file));
    }
}

[[nodiscard]] const std::string* find_readme(const Chapter& chapter) {
    const auto& files = chapter.files();
    const auto it = std::find_if(files.begin(), files.end(),
                                 [](const std::string& f) { return is_readme(f); });
    return it == files.end() ? nullptr : &*it;
}

void render_chapter(std::string& out, const Chapter& chapter, std::size_t level, const Format& format) {
    const auto title = title_case(chapter.name());
    if (const auto* readme = find_readme(chapter)) {
        append_line(out, level, format.marker(), render_link(title, *readme));
    } else {
        append_line(out, level, format.marker(), format.unlinked_heading(title));
    }

    render_files(out, chapter.files(), level + 1, format.marker());
    for (const auto& child : chapter.chapters()) {
        render_chapter(out, child, level + 1, format);
    }
}

} // namespace

bool is_readme(std::string_view path) {
    return to_lower_ascii(file_name(path)) == "readme.md";
}

std::vector<const Chapter*> ordered_chapters(const Chapter& book,
                                             const std::optional<std::vector<std::string>>& preferred_order) {
    const auto& chapters = book.chapters();
    std::vector<const Chapter*> out;
    out.reserve(chapters.size());
    std::unordered_set<const Chapter*> placed;

    if (preferred_order) {
        for (const auto& wanted : *preferred_order) {
            const auto key = to_lower_ascii(wanted);
            for (const auto& chapter : chapters) {
                if (to_lower_ascii(chapter.name()) == key && placed.insert(&chapter).second) {
                    out.push_back(&chapter);
                }
            }
        }
    }

    for (const auto& chapter : chapters) {
        if (placed.insert(&chapter).second) {
            out.push_back(&chapter);
        }
    }
    return out;
}

std::string render_summary(const Chapter& book,
                           Format format,
                           const std::optional<std::vector<std::string>>& preferred_order) {
    std::string out = "# " + book.name() + "\n\n";
    render_files(out, book.files(), 0, format.marker());
    for (const auto* chapter : ordered_chapters(book, preferred_order)) {
        render_chapter(out, *chapter, 0, format);
    }
    return out;
}

} // namespace booksum
