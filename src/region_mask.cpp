#include "region_mask.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <utility>

namespace pdf_mt {

namespace {

constexpr std::array<std::pair<LayoutCategory, const char*>, 12> kCategoryNames = {{
    {LayoutCategory::Text, "text"},
    {LayoutCategory::Title, "title"},
    {LayoutCategory::PlainText, "plain_text"},
    {LayoutCategory::Figure, "figure"},
    {LayoutCategory::FigureCaption, "figure_caption"},
    {LayoutCategory::Table, "table"},
    {LayoutCategory::TableCaption, "table_caption"},
    {LayoutCategory::TableFootnote, "table_footnote"},
    {LayoutCategory::IsolatedFormula, "isolated_formula"},
    {LayoutCategory::FormulaCaption, "formula_caption"},
    {LayoutCategory::Abandon, "abandon"},
    {LayoutCategory::Unknown, "unknown"},
}};

std::size_t clamp_index(long value, std::size_t dim) {
    if (dim == 0 || value < 0) {
        return 0;
    }
    const auto last = static_cast<long>(dim - 1);
    return static_cast<std::size_t>(std::min(value, last));
}

struct CellRect {
    std::size_t row_begin = 0;
    std::size_t row_end = 0;
    std::size_t col_begin = 0;
    std::size_t col_end = 0;
};

// One pixel of padding on every side, flipped to top-down rows.
CellRect clip_box(const LayoutBox& box, std::size_t height, std::size_t width) {
    const long x0 = static_cast<long>(std::floor(box.x0));
    const long x1 = static_cast<long>(std::ceil(box.x1));
    const long y0 = static_cast<long>(std::floor(box.y0));
    const long y1 = static_cast<long>(std::ceil(box.y1));
    const long h = static_cast<long>(height);

    CellRect rect;
    rect.row_begin = clamp_index(h - y1 - 1, height);
    rect.row_end = clamp_index(h - y0 + 1, height);
    rect.col_begin = clamp_index(x0 - 1, width);
    rect.col_end = clamp_index(x1 + 1, width);
    return rect;
}

}  // namespace

LayoutCategory parse_layout_category(const std::string& name) {
    // DocLayout-YOLO spells this class without the "d".
    if (name == "isolate_formula") {
        return LayoutCategory::IsolatedFormula;
    }
    for (const auto& [category, label] : kCategoryNames) {
        if (name == label) {
            return category;
        }
    }
    return LayoutCategory::Unknown;
}

const char* layout_category_name(LayoutCategory category) {
    for (const auto& [candidate, label] : kCategoryNames) {
        if (candidate == category) {
            return label;
        }
    }
    return "unknown";
}

bool is_protected_category(LayoutCategory category) {
    switch (category) {
        case LayoutCategory::Figure:
        case LayoutCategory::Table:
        case LayoutCategory::IsolatedFormula:
        case LayoutCategory::FormulaCaption:
        case LayoutCategory::Abandon:
            return true;
        default:
            return false;
    }
}

RegionMask::RegionMask(std::size_t height, std::size_t width)
    : height_(height), width_(width), cells_(height * width, kBackgroundRegion) {}

int RegionMask::at(std::size_t row, std::size_t col) const {
    return cells_[row * width_ + col];
}

void RegionMask::fill(std::size_t row_begin, std::size_t row_end, std::size_t col_begin, std::size_t col_end, int id) {
    row_end = std::min(row_end, height_);
    col_end = std::min(col_end, width_);
    for (std::size_t row = row_begin; row < row_end; ++row) {
        auto first = cells_.begin() + static_cast<std::ptrdiff_t>(row * width_);
        std::fill(first + static_cast<std::ptrdiff_t>(col_begin), first + static_cast<std::ptrdiff_t>(col_end), id);
    }
}

int RegionMask::sample(double x, double y) const {
    if (!std::isfinite(x) || !std::isfinite(y) || x < 0.0 || y < 0.0) {
        return kBackgroundRegion;
    }

    const auto col = static_cast<std::size_t>(std::floor(x));
    const auto row = static_cast<std::size_t>(std::floor(y));
    if (row >= height_ || col >= width_) {
        return kBackgroundRegion;
    }
    return at(row, col);
}

RegionMask build_region_mask(std::size_t page_height, std::size_t page_width, const std::vector<LayoutBox>& boxes) {
    RegionMask mask(page_height, page_width);

    for (std::size_t i = 0; i < boxes.size(); ++i) {
        if (is_protected_category(boxes[i].category)) {
            continue;
        }
        const CellRect rect = clip_box(boxes[i], page_height, page_width);
        mask.fill(rect.row_begin, rect.row_end, rect.col_begin, rect.col_end, static_cast<int>(i) + 2);
    }

    for (const auto& box : boxes) {
        if (!is_protected_category(box.category)) {
            continue;
        }
        const CellRect rect = clip_box(box, page_height, page_width);
        mask.fill(rect.row_begin, rect.row_end, rect.col_begin, rect.col_end, kProtectedRegion);
    }

    return mask;
}

}  // namespace pdf_mt
