#include "core/title_case.hpp"

#include <QChar>
#include <QString>

#include <algorithm>
#include <array>
#include <cstddef>
#include <vector>

namespace booksum {
namespace {

// Words kept lower case in the middle of a title.
constexpr std::array<std::u32string_view, 21> kSmallWords = {
    U"a", U"an", U"and", U"as", U"at", U"but", U"by", U"en", U"for", U"if", U"in",
    U"nor", U"of", U"on", U"or", U"per", U"the", U"to", U"v", U"vs", U"via",
};

[[nodiscard]] std::u32string decode(std::string_view utf8) {
    return QString::fromUtf8(utf8.data(), static_cast<qsizetype>(utf8.size())).toStdU32String();
}

[[nodiscard]] std::string encode(const std::u32string& text) {
    return QString::fromStdU32String(text).toStdString();
}

[[nodiscard]] bool is_small_word(std::u32string_view word) {
    std::u32string lower;
    lower.reserve(word.size());
    for (const auto cp : word) {
        lower.push_back(QChar::toLower(cp));
    }
    return std::find(kSmallWords.begin(), kSmallWords.end(), lower) != kSmallWords.end();
}

[[nodiscard]] bool has_inner_capital(std::u32string_view word) {
    bool seen_letter = false;
    for (const auto cp : word) {
        if (!QChar::isLetter(cp)) continue;
        if (seen_letter && QChar::isUpper(cp)) return true;
        seen_letter = true;
    }
    return false;
}

// Upper-cases the first letter unless a digit comes before it.
std::u32string capitalize_word(std::u32string_view word) {
    std::u32string out(word);
    if (has_inner_capital(word)) {
        return out;
    }
    const auto first = std::find_if(out.begin(), out.end(),
                                    [](char32_t cp) { return QChar::isLetterOrNumber(cp); });
    if (first != out.end() && QChar::isLetter(*first)) {
        *first = QChar::toUpper(*first);
    }
    return out;
}

std::vector<std::u32string_view> split_words(std::u32string_view text) {
    std::vector<std::u32string_view> words;
    std::size_t start = 0;
    while (true) {
        const auto space = text.find(U' ', start);
        words.push_back(text.substr(start, space - start));
        if (space == std::u32string_view::npos) break;
        start = space + 1;
    }
    return words;
}

} // namespace

std::string title_case(std::string_view raw) {
    const auto decoded = decode(raw);
    const auto first_letter = std::find_if(decoded.begin(), decoded.end(),
                                           [](char32_t cp) { return QChar::isLetter(cp); });
    if (first_letter == decoded.end()) {
        return {};
    }

    std::u32string text(first_letter, decoded.end());
    std::replace(text.begin(), text.end(), U'_', U' ');

    const auto words = split_words(text);
    std::size_t first = words.size();
    std::size_t last = 0;
    for (std::size_t i = 0; i < words.size(); ++i) {
        if (words[i].empty()) continue;
        first = std::min(first, i);
        last = i;
    }

    std::u32string out;
    out.reserve(text.size());
    for (std::size_t i = 0; i < words.size(); ++i) {
        if (i > 0) out.push_back(U' ');
        const auto word = words[i];
        if (i != first && i != last && is_small_word(word)) {
            for (const auto cp : word) {
                out.push_back(QChar::toLower(cp));
            }
        } else {
            out += capitalize_word(word);
        }
    }
    return encode(out);
}

std::string_view file_name(std::string_view path) {
    const auto slash = path.rfind('/');
    return slash == std::string_view::npos ? path : path.substr(slash + 1);
}

std::string_view file_stem(std::string_view path) {
    const auto name = file_name(path);
    const auto dot = name.rfind('.');
    if (dot == std::string_view::npos || dot == 0) {
        return name;
    }
    return name.substr(0, dot);
}

std::string to_lower_ascii(std::string_view text) {
    std::string out(text);
    std::transform(out.begin(), out.end(), out.begin(), [](char c) {
        return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
    });
    return out;
}

} // namespace booksum
