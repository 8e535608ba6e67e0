#include "layout_detector.hpp"

#include <algorithm>
#include <utility>

#include <pugixml.hpp>

namespace pdf_mt {

namespace {

std::string local_name(const char* raw_name) {
    if (raw_name == nullptr) {
        return {};
    }
    std::string name(raw_name);
    const auto pos = name.find(':');
    if (pos == std::string::npos) {
        return name;
    }
    return name.substr(pos + 1);
}

bool read_box(const pugi::xml_node& node, LayoutBox& out_box, std::string& error) {
    static const char* const kCoordinates[] = {"x0", "y0", "x1", "y1"};
    for (const char* key : kCoordinates) {
        if (!node.attribute(key)) {
            error = std::string("box without ") + key + " attribute";
            return false;
        }
    }

    out_box.category = parse_layout_category(node.attribute("class").as_string("unknown"));
    out_box.x0 = node.attribute("x0").as_double();
    out_box.y0 = node.attribute("y0").as_double();
    out_box.x1 = node.attribute("x1").as_double();
    out_box.y1 = node.attribute("y1").as_double();
    out_box.confidence = node.attribute("confidence").as_double(1.0);

    if (out_box.x0 > out_box.x1) {
        std::swap(out_box.x0, out_box.x1);
    }
    if (out_box.y0 > out_box.y1) {
        std::swap(out_box.y0, out_box.y1);
    }
    return true;
}

bool collect_pages(const pugi::xml_document& doc, std::map<int, std::vector<LayoutBox>>& out_pages, std::string& error) {
    const auto root = doc.document_element();
    if (!root || local_name(root.name()) != "layout") {
        error = "root element must be <layout>";
        return false;
    }

    for (const auto& page : root.children()) {
        if (page.type() != pugi::node_element || local_name(page.name()) != "page") {
            continue;
        }
        const auto index_attr = page.attribute("index");
        if (!index_attr || index_attr.as_int(-1) < 0) {
            error = "<page> without a valid index attribute";
            return false;
        }

        auto& boxes = out_pages[index_attr.as_int()];
        for (const auto& node : page.children()) {
            if (node.type() != pugi::node_element || local_name(node.name()) != "box") {
                continue;
            }
            LayoutBox box;
            if (!read_box(node, box, error)) {
                error = "page " + std::to_string(index_attr.as_int()) + ": " + error;
                return false;
            }
            boxes.push_back(box);
        }
    }

    return true;
}

}  // namespace

int layout_tile_size(int raster_height) {
    return std::max(32, raster_height / 32 * 32);
}

bool NullLayoutDetector::detect(
    const PageImage& /*image*/,
    int /*tile_size*/,
    std::vector<LayoutBox>& out_boxes,
    std::string& /*error*/
) const {
    out_boxes.clear();
    return true;
}

bool XmlLayoutDetector::load(const std::filesystem::path& path, XmlLayoutDetector& out_detector, std::string& error) {
    out_detector = XmlLayoutDetector{};

    pugi::xml_document doc;
    const pugi::xml_parse_result parse = doc.load_file(path.c_str(), pugi::parse_default);
    if (!parse) {
        error = "Failed to parse layout XML " + path.string() + ": " + parse.description();
        return false;
    }

    if (!collect_pages(doc, out_detector.pages_, error)) {
        error = "Invalid layout XML " + path.string() + ": " + error;
        return false;
    }
    return true;
}

bool XmlLayoutDetector::load_from_string(const std::string& xml, XmlLayoutDetector& out_detector, std::string& error) {
    out_detector = XmlLayoutDetector{};

    pugi::xml_document doc;
    const pugi::xml_parse_result parse = doc.load_buffer(xml.data(), xml.size(), pugi::parse_default);
    if (!parse) {
        error = std::string("Failed to parse layout XML: ") + parse.description();
        return false;
    }

    if (!collect_pages(doc, out_detector.pages_, error)) {
        error = "Invalid layout XML: " + error;
        return false;
    }
    return true;
}

bool XmlLayoutDetector::detect(
    const PageImage& image,
    int /*tile_size*/,
    std::vector<LayoutBox>& out_boxes,
    std::string& /*error*/
) const {
    out_boxes.clear();
    const auto it = pages_.find(image.page_index);
    if (it != pages_.end()) {
        out_boxes = it->second;
    }
    return true;
}

}  // namespace pdf_mt
