#include "strings.hpp"

#include <cctype>

namespace chromatone::utility {

std::vector<std::string> split(std::string_view s,
                               std::string_view delimiter) {
    std::vector<std::string> tokens;
    if (s.empty() || delimiter.empty()) {
        if (!s.empty()) {
            tokens.emplace_back(s);
        }
        return tokens;
    }

    size_t start = 0;
    while (true) {
        size_t pos = s.find(delimiter, start);
        if (pos == std::string_view::npos) {
            tokens.emplace_back(s.substr(start));
            break;
        }
        tokens.emplace_back(s.substr(start, pos - start));
        start = pos + delimiter.size();
    }
    return tokens;
}

std::string join(const std::vector<std::string> &parts,
                 std::string_view separator) {
    std::string out;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) {
            out.append(separator);
        }
        out.append(parts[i]);
    }
    return out;
}

std::string trim(std::string_view s) {
    size_t first = 0;
    while (first < s.size() &&
           std::isspace(static_cast<unsigned char>(s[first]))) {
        ++first;
    }
    size_t last = s.size();
    while (last > first &&
           std::isspace(static_cast<unsigned char>(s[last - 1]))) {
        --last;
    }
    return std::string(s.substr(first, last - first));
}

std::string to_lower(std::string_view s) {
    std::string out(s);
    for (auto &c : out) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return out;
}

std::string title_case(std::string_view s) {
    std::string out(s);
    bool word_start = true;
    for (auto &c : out) {
        auto uc = static_cast<unsigned char>(c);
        if (std::isalpha(uc)) {
            c = static_cast<char>(word_start ? std::toupper(uc)
                                             : std::tolower(uc));
            word_start = false;
        } else {
            word_start = true;
        }
    }
    return out;
}

} // namespace chromatone::utility
