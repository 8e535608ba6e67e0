#pragma once

#include "region_mask.hpp"

#include <cstddef>
#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace pdf_mt {

// RGB raster of one page at 72 dpi, rows top to bottom.
struct PageImage {
    int page_index = 0;
    int width = 0;
    int height = 0;
    int components = 3;
    std::vector<unsigned char> samples;
};

// floor(height / 32) * 32, never below 32.
int layout_tile_size(int raster_height);

class LayoutDetector {
public:
    virtual ~LayoutDetector() = default;

    // Must be safe to call from several workers at once.
    virtual bool detect(const PageImage& image, int tile_size, std::vector<LayoutBox>& out_boxes, std::string& error) const = 0;

    // False when detect() ignores the samples, so no raster has to be rendered.
    virtual bool needs_raster() const = 0;
};

// No boxes: the whole page is ordinary text.
class NullLayoutDetector final : public LayoutDetector {
public:
    bool detect(const PageImage& image, int tile_size, std::vector<LayoutBox>& out_boxes, std::string& error) const override;
    bool needs_raster() const override { return false; }
};

// Precomputed boxes from a sidecar file:
// <layout><page index="0"><box class="figure" x0=".." y0=".." x1=".." y1=".." confidence=".."/></page></layout>
class XmlLayoutDetector final : public LayoutDetector {
public:
    static bool load(const std::filesystem::path& path, XmlLayoutDetector& out_detector, std::string& error);
    static bool load_from_string(const std::string& xml, XmlLayoutDetector& out_detector, std::string& error);

    bool detect(const PageImage& image, int tile_size, std::vector<LayoutBox>& out_boxes, std::string& error) const override;
    bool needs_raster() const override { return false; }

    std::size_t page_count() const { return pages_.size(); }

private:
    std::map<int, std::vector<LayoutBox>> pages_;
};

}  // namespace pdf_mt
