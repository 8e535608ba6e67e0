#include "page_range.hpp"

#include <algorithm>
#include <cctype>
#include <set>

namespace pdf_mt {

namespace {

std::string trim(const std::string& s) {
    std::size_t begin = 0;
    std::size_t end = s.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(s[begin]))) {
        ++begin;
    }
    while (end > begin && std::isspace(static_cast<unsigned char>(s[end - 1]))) {
        --end;
    }
    return s.substr(begin, end - begin);
}

bool parse_page_number(const std::string& token, int& out, std::string& error) {
    const std::string value = trim(token);
    if (value.empty() || !std::all_of(value.begin(), value.end(), [](unsigned char c) { return std::isdigit(c) != 0; })) {
        error = "Invalid page number: '" + token + "'";
        return false;
    }

    try {
        out = std::stoi(value);
    } catch (const std::exception&) {
        error = "Page number out of range: " + value;
        return false;
    }

    if (out < 1) {
        error = "Page numbers start at 1: " + value;
        return false;
    }
    if (out > kMaxPageNumber) {
        error = "Page number above " + std::to_string(kMaxPageNumber) + ": " + value;
        return false;
    }
    return true;
}

}  // namespace

bool parse_page_ranges(const std::string& text, std::vector<int>& out_pages, std::string& error) {
    out_pages.clear();
    if (trim(text).empty()) {
        return true;
    }

    std::set<int> pages;
    std::size_t start = 0;
    while (start <= text.size()) {
        std::size_t comma = text.find(',', start);
        if (comma == std::string::npos) {
            comma = text.size();
        }
        const std::string part = text.substr(start, comma - start);
        start = comma + 1;

        const std::size_t dash = part.find('-');
        if (dash == std::string::npos) {
            int page = 0;
            if (!parse_page_number(part, page, error)) {
                return false;
            }
            pages.insert(page - 1);
            continue;
        }

        int first = 0;
        int last = 0;
        if (!parse_page_number(part.substr(0, dash), first, error) ||
            !parse_page_number(part.substr(dash + 1), last, error)) {
            return false;
        }
        if (first > last) {
            error = "Reversed page range: " + trim(part);
            return false;
        }
        for (int page = first; page <= last; ++page) {
            pages.insert(page - 1);
        }
    }

    out_pages.assign(pages.begin(), pages.end());
    return true;
}

}  // namespace pdf_mt
