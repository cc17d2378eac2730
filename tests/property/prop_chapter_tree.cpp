#include <catch2/catch_test_macros.hpp>
#include <rapidcheck.h>
#include "core/chapter_tree.hpp"
#include "core/summary_renderer.hpp"

#include <algorithm>
#include <string>
#include <vector>

using namespace booksum;

namespace {

const std::vector<std::string> kSegments = {
    "intro", "part1", "part2", "Part1", "notes", "README", "readme", "01-setup", "chapter_2",
};

// Relative note paths with 1-4 segments from a small alphabet, so that
// entries share directories.
rc::Gen<std::string> genNotePath() {
    return rc::gen::mapcat(rc::gen::inRange(1, 5), [](int depth) {
        return rc::gen::map(
            rc::gen::container<std::vector<std::string>>(static_cast<std::size_t>(depth),
                                                         rc::gen::elementOf(kSegments)),
            [](const std::vector<std::string>& parts) {
                std::string path;
                for (std::size_t i = 0; i < parts.size(); ++i) {
                    if (i > 0) path += '/';
                    path += parts[i];
                }
                return path + ".md";
            });
    });
}

rc::Gen<std::vector<std::string>> genNotePaths() {
    return rc::gen::container<std::vector<std::string>>(genNotePath());
}

void collect_files(const Chapter& chapter, std::vector<std::string>& out) {
    out.insert(out.end(), chapter.files().begin(), chapter.files().end());
    for (const auto& child : chapter.chapters()) {
        collect_files(child, out);
    }
}

std::size_t count_chapters(const Chapter& chapter) {
    std::size_t total = chapter.chapters().size();
    for (const auto& child : chapter.chapters()) {
        total += count_chapters(child);
    }
    return total;
}

} // namespace

TEST_CASE("Property: every path lands in exactly one chapter", "[property][chapter_tree]") {
    rc::check("collected files equal the input multiset", [] {
        auto paths = *genNotePaths();
        const auto build = build_chapter_tree("Book", paths);
        RC_ASSERT(build.rejected.empty());

        std::vector<std::string> stored;
        collect_files(build.book, stored);

        std::sort(paths.begin(), paths.end());
        std::sort(stored.begin(), stored.end());
        RC_ASSERT(stored == paths);
    });
}

TEST_CASE("Property: building is deterministic", "[property][chapter_tree]") {
    rc::check("same input gives an equal tree and equal text", [] {
        const auto paths = *genNotePaths();
        const auto first = build_chapter_tree("Book", paths);
        const auto second = build_chapter_tree("Book", paths);

        RC_ASSERT(first.book == second.book);
        RC_ASSERT(render_summary(first.book, Format::mdbook()) ==
                  render_summary(second.book, Format::mdbook()));
    });
}

TEST_CASE("Property: one line per chapter and per non-README note", "[property][renderer]") {
    rc::check("rendered line count matches the tree", [] {
        const auto paths = *genNotePaths();
        const auto build = build_chapter_tree("Book", paths);

        std::vector<std::string> files;
        collect_files(build.book, files);
        const auto notes = static_cast<std::size_t>(
            std::count_if(files.begin(), files.end(), [](const std::string& f) { return !is_readme(f); }));

        const auto text = render_summary(build.book, Format::gitbook());
        const auto lines = static_cast<std::size_t>(std::count(text.begin(), text.end(), '\n'));
        RC_ASSERT(lines == 2 + count_chapters(build.book) + notes);
    });
}

TEST_CASE("Property: preferred order never drops a chapter", "[property][renderer]") {
    rc::check("ordered_chapters is a permutation of the root chapters", [] {
        const auto paths = *genNotePaths();
        const auto order = *rc::gen::container<std::vector<std::string>>(rc::gen::elementOf(kSegments));
        const auto build = build_chapter_tree("Book", paths);

        auto ordered = ordered_chapters(build.book, order);
        RC_ASSERT(ordered.size() == build.book.chapters().size());

        std::sort(ordered.begin(), ordered.end());
        RC_ASSERT(std::adjacent_find(ordered.begin(), ordered.end()) == ordered.end());
    });
}
