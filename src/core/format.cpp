#include "core/format.hpp"

#include "core/title_case.hpp"

namespace booksum {

std::string Format::unlinked_heading(std::string_view title) const {
    switch (kind_) {
        case Kind::MdBook: return "[" + std::string(title) + "](#)";
        case Kind::GitBook: return std::string(title);
    }
    return std::string(title);
}

std::vector<std::string> Format::config_file_names() const {
    switch (kind_) {
        case Kind::MdBook: return {"book.toml"};
        case Kind::GitBook: return {"book.json", "book.js"};
    }
    return {};
}

std::string_view Format::name() const noexcept {
    switch (kind_) {
        case Kind::MdBook: return "mdbook";
        case Kind::GitBook: return "gitbook";
    }
    return "mdbook";
}

Result<Format> parse_format(std::string_view selector) {
    const auto key = to_lower_ascii(selector);
    if (key == "md" || key == "mdbook") {
        return Result<Format>::ok(Format::mdbook());
    }
    if (key == "git" || key == "gitbook") {
        return Result<Format>::ok(Format::gitbook());
    }
    return Result<Format>::err(Error{ErrorKind::UnknownFormat,
                                     "unknown format '" + std::string(selector) +
                                         "' (expected md or git)"});
}

} // namespace booksum
