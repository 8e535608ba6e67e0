#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace pdf_mt {

enum class LayoutCategory {
    Text,
    Title,
    PlainText,
    Figure,
    FigureCaption,
    Table,
    TableCaption,
    TableFootnote,
    IsolatedFormula,
    FormulaCaption,
    Abandon,
    Unknown
};

// Unrecognized names map to LayoutCategory::Unknown.
LayoutCategory parse_layout_category(const std::string& name);
const char* layout_category_name(LayoutCategory category);

// Figures, tables, formulas and abandoned regions are never translated.
bool is_protected_category(LayoutCategory category);

// Rectangle in page pixels, y axis pointing up (x0 <= x1, y0 <= y1).
struct LayoutBox {
    LayoutCategory category = LayoutCategory::Unknown;
    double x0 = 0.0;
    double y0 = 0.0;
    double x1 = 0.0;
    double y1 = 0.0;
    double confidence = 0.0;
};

constexpr int kProtectedRegion = 0;
constexpr int kBackgroundRegion = 1;

inline bool is_protected(int region_id) {
    return region_id == kProtectedRegion;
}

// Row-major grid of region ids, row 0 at the top of the page.
class RegionMask {
public:
    RegionMask() = default;
    RegionMask(std::size_t height, std::size_t width);

    std::size_t height() const { return height_; }
    std::size_t width() const { return width_; }

    int at(std::size_t row, std::size_t col) const;

    // Stamps id over rows [row_begin, row_end) and cols [col_begin, col_end).
    void fill(std::size_t row_begin, std::size_t row_end, std::size_t col_begin, std::size_t col_end, int id);

    // Region id of the cell containing a top-down device point.
    // Points outside the grid count as ordinary text.
    int sample(double x, double y) const;

private:
    std::size_t height_ = 0;
    std::size_t width_ = 0;
    std::vector<int> cells_;
};

RegionMask build_region_mask(std::size_t page_height, std::size_t page_width, const std::vector<LayoutBox>& boxes);

}  // namespace pdf_mt
