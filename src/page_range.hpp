#pragma once

#include <string>
#include <vector>

namespace pdf_mt {

constexpr int kMaxPageNumber = 100000;

// Parses 1-based "1,3,5-7" into sorted unique 0-based indices.
// An empty or blank string yields an empty list, which means every page.
// Page numbers above kMaxPageNumber are rejected.
bool parse_page_ranges(const std::string& text, std::vector<int>& out_pages, std::string& error);

}  // namespace pdf_mt
