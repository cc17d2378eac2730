#include "core/chapter_tree.hpp"

namespace booksum {
namespace {

[[nodiscard]] bool has_empty_segment(std::string_view path) {
    if (path.empty()) return true;
    if (path.front() == '/' || path.back() == '/') return true;
    return path.find("//") != std::string_view::npos;
}

} // namespace

Result<void> Chapter::add_entry(std::string_view path) {
    if (has_empty_segment(path)) {
        return Result<void>::err(Error{ErrorKind::MalformedPath,
                                       "empty path segment in '" + std::string(path) + "'"});
    }
    insert(path, path);
    return Result<void>::ok();
}

const Chapter* Chapter::find_chapter(std::string_view name) const {
    const auto it = chapter_index_.find(std::string(name));
    if (it == chapter_index_.end()) return nullptr;
    return &chapters_[it->second];
}

Chapter& Chapter::chapter_named(std::string_view name) {
    auto key = std::string(name);
    if (const auto it = chapter_index_.find(key); it != chapter_index_.end()) {
        return chapters_[it->second];
    }
    chapter_index_.emplace(key, chapters_.size());
    return chapters_.emplace_back(std::move(key));
}

void Chapter::insert(std::string_view full_path, std::string_view remaining) {
    const auto slash = remaining.find('/');
    if (slash == std::string_view::npos) {
        files_.emplace_back(full_path);
        return;
    }
    chapter_named(remaining.substr(0, slash)).insert(full_path, remaining.substr(slash + 1));
}

ChapterBuild build_chapter_tree(std::string title, const std::vector<std::string>& paths) {
    ChapterBuild out{.book = Chapter(std::move(title)), .rejected = {}};
    for (const auto& path : paths) {
        auto added = out.book.add_entry(path);
        if (added.is_err()) {
            out.rejected.push_back(added.unwrap_err());
        }
    }
    return out;
}

std::size_t count_files(const Chapter& chapter) {
    auto total = chapter.files().size();
    for (const auto& child : chapter.chapters()) {
        total += count_files(child);
    }
    return total;
}

} // namespace booksum
