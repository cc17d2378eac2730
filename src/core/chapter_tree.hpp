#pragma once

#include "core/result.hpp"
#include <cstddef>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace booksum {

/**
 * Chapter - one node of the book hierarchy.
 *
 * The root chapter is named after the book title. Every other chapter is
 * named after one directory segment. `files` holds full relative paths of
 * the notes that live directly in this chapter; `chapters` holds the
 * sub-directories in the order they were first seen.
 */
class Chapter {
public:
    Chapter() = default;
    explicit Chapter(std::string name) : name_(std::move(name)) {}

    [[nodiscard]] const std::string& name() const noexcept { return name_; }
    [[nodiscard]] const std::vector<std::string>& files() const noexcept { return files_; }
    [[nodiscard]] const std::vector<Chapter>& chapters() const noexcept { return chapters_; }

    /**
     * Insert one slash-delimited relative path below this chapter.
     * Fails with ErrorKind::MalformedPath if the path is empty or has an
     * empty segment; the tree is left untouched in that case.
     */
    Result<void> add_entry(std::string_view path);

    /**
     * Child chapter with exactly this name, or nullptr.
     */
    [[nodiscard]] const Chapter* find_chapter(std::string_view name) const;

    bool operator==(const Chapter& other) const {
        return name_ == other.name_ && files_ == other.files_ && chapters_ == other.chapters_;
    }

private:
    Chapter& chapter_named(std::string_view name);
    void insert(std::string_view full_path, std::string_view remaining);

    std::string name_;
    std::vector<std::string> files_;
    std::vector<Chapter> chapters_;
    std::unordered_map<std::string, std::size_t> chapter_index_;
};

struct ChapterBuild {
    Chapter book;
    std::vector<Error> rejected;  // one MalformedPath per skipped entry
};

/**
 * Build the chapter tree for a book from an ordered list of note paths.
 * Ordering is first-appearance order; nothing is sorted.
 */
[[nodiscard]] ChapterBuild build_chapter_tree(std::string title,
                                              const std::vector<std::string>& paths);

/**
 * Total number of note paths stored in `chapter` and all of its descendants.
 */
[[nodiscard]] std::size_t count_files(const Chapter& chapter);

} // namespace booksum
