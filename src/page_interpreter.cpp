#include "page_interpreter.hpp"

#include "log.hpp"
#include "text_util.hpp"

#include <algorithm>
#include <cmath>
#include <optional>
#include <utility>

namespace pdf_mt {

namespace {

constexpr double kAscent = 0.8;
constexpr double kDescent = -0.2;
constexpr double kLineHeight = 1.2;
constexpr double kKernSpaceThreshold = -250.0;
constexpr double kGapSpaceRatio = 0.25;
constexpr double kLineChangeRatio = 0.5;
constexpr double kFontScaleStep = 0.05;

enum class ShowKind {
    Tj,
    TJ,
    Quote,
    DoubleQuote
};

struct TextState {
    std::string font_name;
    double font_size = 0.0;
    double char_spacing = 0.0;
    double word_spacing = 0.0;
    double horizontal_scale = 1.0;
    double leading = 0.0;
    double rise = 0.0;
    int render_mode = 0;
};

struct GraphicsState {
    Matrix ctm;
    TextState text;
};

struct ShowRecord {
    std::size_t op_index = 0;
    ShowKind kind = ShowKind::Tj;
    double total_tx = 0.0;
    double size_scale = 0.0;
    int render_mode = 0;
};

struct TextRun {
    int region = kBackgroundRegion;
    std::vector<std::size_t> members;
    std::vector<ShowRecord> shows;
    std::u32string text;
    Rect bbox;
    double font_size = 0.0;
    bool has_prev = false;
    Point prev_end;
};

// Everything a show operation contributes, computed before deciding its fate.
struct ShowMeasure {
    double total_tx = 0.0;
    std::u32string text;
};

double number_operand(const ContentOperation& op, std::size_t index) {
    if (index >= op.operands.size() || op.operands[index].type != OperandType::Number) {
        return 0.0;
    }
    return op.operands[index].number;
}

bool has_numbers(const ContentOperation& op, std::size_t count) {
    if (op.operands.size() < count) {
        return false;
    }
    for (std::size_t i = op.operands.size() - count; i < op.operands.size(); ++i) {
        if (op.operands[i].type != OperandType::Number) {
            return false;
        }
    }
    return true;
}

bool is_string_operand(const Operand& operand) {
    return operand.type == OperandType::String || operand.type == OperandType::HexString;
}

bool is_show_operator(const std::string& name) {
    return name == "Tj" || name == "TJ" || name == "'" || name == "\"";
}

bool is_text_state_operator(const std::string& name) {
    return name == "Tc" || name == "Tw" || name == "Tz" || name == "TL" || name == "Tf" || name == "Ts" ||
        name == "Tr" || name == "Td" || name == "TD" || name == "Tm" || name == "T*";
}

class PageWalker {
public:
    PageWalker(
        const ContentStream& stream,
        const PageContent& page,
        const RegionMask& mask,
        CachedTranslator& translator,
        const TargetFont& target_font,
        const InterpreterOptions& options
    )
        : stream_(stream),
          page_(page),
          mask_(mask),
          translator_(translator),
          target_font_(target_font),
          options_(options) {
        gstack_.push_back(GraphicsState{});
    }

    bool run(PageOutput& out, std::string& error) {
        const auto& ops = stream_.operations;
        for (std::size_t i = 0; i < ops.size() && !failed_; ++i) {
            step(i);
        }
        if (!failed_) {
            flush_run();
        }
        if (failed_) {
            error = error_;
            return false;
        }

        body_ += stream_.trailing;

        out.stats = stats_;
        out.modified = modified_;
        if (!modified_) {
            out.content = serialize_content_stream(stream_);
            return true;
        }

        std::string content;
        content.reserve(body_.size() + overlay_.size() + 32);
        content += "q\n";
        content += body_;
        content += "\n";
        for (int i = 0; i < open_saves_; ++i) {
            content += "Q\n";
        }
        content += "Q\n";
        content += overlay_;
        out.content = std::move(content);
        return true;
    }

private:
    GraphicsState& gs() { return gstack_.back(); }

    void emit_raw(std::size_t index) { body_ += stream_.operations[index].raw; }

    void step(std::size_t index) {
        const ContentOperation& op = stream_.operations[index];

        if (is_show_operator(op.op)) {
            handle_show(index);
            return;
        }

        if (is_text_state_operator(op.op)) {
            apply_text_state(op);
            if (run_) {
                run_->members.push_back(index);
            } else {
                emit_raw(index);
            }
            return;
        }

        flush_run();
        if (failed_) {
            return;
        }

        if (op.op == "BT") {
            in_text_ = true;
            tm_ = Matrix{};
            tlm_ = Matrix{};
        } else if (op.op == "ET") {
            in_text_ = false;
        } else if (op.op == "q") {
            gstack_.push_back(gs());
            ++open_saves_;
        } else if (op.op == "Q") {
            if (gstack_.size() > 1) {
                gstack_.pop_back();
                --open_saves_;
            }
        } else if (op.op == "cm" && has_numbers(op, 6)) {
            const std::size_t base = op.operands.size() - 6;
            Matrix m;
            m.a = op.operands[base].number;
            m.b = op.operands[base + 1].number;
            m.c = op.operands[base + 2].number;
            m.d = op.operands[base + 3].number;
            m.e = op.operands[base + 4].number;
            m.f = op.operands[base + 5].number;
            gs().ctm = concat(m, gs().ctm);
        }
        emit_raw(index);
    }

    void move_line(double tx, double ty) {
        tlm_ = concat(Matrix::translation(tx, ty), tlm_);
        tm_ = tlm_;
    }

    void apply_text_state(const ContentOperation& op) {
        TextState& ts = gs().text;
        if (op.op == "Tc") {
            ts.char_spacing = number_operand(op, 0);
        } else if (op.op == "Tw") {
            ts.word_spacing = number_operand(op, 0);
        } else if (op.op == "Tz") {
            ts.horizontal_scale = number_operand(op, 0) / 100.0;
        } else if (op.op == "TL") {
            ts.leading = number_operand(op, 0);
        } else if (op.op == "Ts") {
            ts.rise = number_operand(op, 0);
        } else if (op.op == "Tr") {
            ts.render_mode = static_cast<int>(number_operand(op, 0));
        } else if (op.op == "Tf") {
            if (op.operands.size() >= 2 && op.operands[0].type == OperandType::Name) {
                ts.font_name = op.operands[0].bytes;
                ts.font_size = number_operand(op, 1);
            }
        } else if (op.op == "Td") {
            move_line(number_operand(op, 0), number_operand(op, 1));
        } else if (op.op == "TD") {
            ts.leading = -number_operand(op, 1);
            move_line(number_operand(op, 0), number_operand(op, 1));
        } else if (op.op == "Tm" && has_numbers(op, 6)) {
            Matrix m;
            m.a = op.operands[0].number;
            m.b = op.operands[1].number;
            m.c = op.operands[2].number;
            m.d = op.operands[3].number;
            m.e = op.operands[4].number;
            m.f = op.operands[5].number;
            tlm_ = m;
            tm_ = m;
        } else if (op.op == "T*") {
            move_line(0.0, -ts.leading);
        }
    }

    void measure_string(const PdfFontInfo* font, const std::string& bytes, ShowMeasure& out) {
        const TextState& ts = gs().text;
        if (font == nullptr) {
            return;
        }
        for (const auto& glyph : font->decode(bytes)) {
            double tx = glyph.width / 1000.0 * ts.font_size + ts.char_spacing;
            if (glyph.word_space) {
                tx += ts.word_spacing;
            }
            out.total_tx += tx * ts.horizontal_scale;
            out.text += glyph.unicode;
        }
    }

    ShowMeasure measure_show(const ContentOperation& op, const PdfFontInfo* font) {
        ShowMeasure measure;
        const TextState& ts = gs().text;

        if (op.op == "TJ") {
            if (op.operands.empty() || op.operands.back().type != OperandType::Array) {
                return measure;
            }
            for (const auto& item : op.operands.back().items) {
                if (is_string_operand(item)) {
                    measure_string(font, item.bytes, measure);
                } else if (item.type == OperandType::Number) {
                    measure.total_tx += -item.number / 1000.0 * ts.font_size * ts.horizontal_scale;
                    if (item.number < kKernSpaceThreshold) {
                        measure.text.push_back(U' ');
                    }
                }
            }
            return measure;
        }

        if (!op.operands.empty() && is_string_operand(op.operands.back())) {
            measure_string(font, op.operands.back().bytes, measure);
        }
        return measure;
    }

    void handle_show(std::size_t index) {
        const ContentOperation& op = stream_.operations[index];

        ShowKind kind = ShowKind::Tj;
        if (op.op == "TJ") {
            kind = ShowKind::TJ;
        } else if (op.op == "'") {
            kind = ShowKind::Quote;
            move_line(0.0, -gs().text.leading);
        } else if (op.op == "\"") {
            kind = ShowKind::DoubleQuote;
            gs().text.word_spacing = number_operand(op, 0);
            gs().text.char_spacing = number_operand(op, 1);
            move_line(0.0, -gs().text.leading);
        }

        const TextState& ts = gs().text;
        const auto font_it = page_.fonts.find(ts.font_name);
        const PdfFontInfo* font = font_it != page_.fonts.end() ? font_it->second.get() : nullptr;

        const Matrix text_to_user = concat(tm_, gs().ctm);
        const Point origin = text_to_user.apply(0.0, 0.0);
        const Point device = page_.user_to_device.apply(origin.x, origin.y);
        const int region = mask_.sample(device.x, device.y);

        const ShowMeasure measure = measure_show(op, font);
        const Matrix start_tm = tm_;
        tm_ = concat(Matrix::translation(measure.total_tx, 0.0), tm_);

        const bool untranslatable = !in_text_ || font == nullptr || font->is_type3() || ts.render_mode == 3;
        if (is_protected(region) || untranslatable) {
            flush_run();
            if (is_protected(region)) {
                ++stats_.spans_protected;
            }
            emit_raw(index);
            return;
        }

        if (run_ && run_->region != region) {
            flush_run();
            if (failed_) {
                return;
            }
        }
        if (!run_) {
            run_.emplace();
            run_->region = region;
            run_->font_size = ts.font_size * std::hypot(text_to_user.c, text_to_user.d);
        }

        TextRun& run = *run_;
        if (run.has_prev) {
            const double size = std::max(run.font_size, 1e-3);
            if (std::fabs(origin.y - run.prev_end.y) > kLineChangeRatio * size) {
                run.text.push_back(U'\n');
            } else if (origin.x - run.prev_end.x > kGapSpaceRatio * size) {
                run.text.push_back(U' ');
            }
        }
        run.text += measure.text;

        const Matrix start_to_user = concat(start_tm, gs().ctm);
        const double low = ts.rise + kDescent * ts.font_size;
        const double high = ts.rise + kAscent * ts.font_size;
        run.bbox.include(start_to_user.apply(0.0, low));
        run.bbox.include(start_to_user.apply(0.0, high));
        run.bbox.include(start_to_user.apply(measure.total_tx, low));
        run.bbox.include(start_to_user.apply(measure.total_tx, high));

        run.prev_end = concat(tm_, gs().ctm).apply(0.0, 0.0);
        run.has_prev = true;

        ShowRecord record;
        record.op_index = index;
        record.kind = kind;
        record.total_tx = measure.total_tx;
        record.size_scale = ts.font_size * ts.horizontal_scale;
        record.render_mode = ts.render_mode;
        run.shows.push_back(record);
        run.members.push_back(index);
    }

    std::string replacement_for(const ShowRecord& show) const {
        const ContentOperation& op = stream_.operations[show.op_index];

        if (show.size_scale == 0.0) {
            // No cursor advance can be expressed in TJ units; hide the glyphs instead.
            return "\n3 Tr" + op.raw + "\n" + std::to_string(show.render_mode) + " Tr";
        }

        std::string out = "\n";
        if (show.kind == ShowKind::Quote) {
            out += "T* ";
        } else if (show.kind == ShowKind::DoubleQuote) {
            out += format_pdf_number(number_operand(op, 0)) + " Tw " + format_pdf_number(number_operand(op, 1)) +
                " Tc T* ";
        }
        const double adjustment = -show.total_tx / show.size_scale * 1000.0;
        out += "[" + format_pdf_number(adjustment) + "] TJ";
        return out;
    }

    void layout_overlay(const TextRun& run, const std::string& translated) {
        const std::u32string runes = normalize_whitespace(utf8_to_runes(translated));
        if (runes.empty() || run.bbox.empty || run.font_size <= 0.0) {
            return;
        }

        const double width = std::max(run.bbox.width(), run.font_size);
        const double height = run.bbox.height();

        double scale = 1.0;
        double size = run.font_size;
        std::vector<std::u32string> lines;
        for (;;) {
            size = run.font_size * scale;
            lines = wrap_text(runes, width, size, target_font_);
            const auto max_lines = static_cast<std::size_t>(
                std::max(1.0, std::floor((height + (kLineHeight - 1.0) * size) / (kLineHeight * size)))
            );
            if (lines.size() <= max_lines) {
                break;
            }
            const double next = scale - kFontScaleStep;
            if (next < options_.min_font_scale - 1e-9) {
                log_debug(
                    "page " + std::to_string(page_.page_index) + ": dropped " +
                    std::to_string(lines.size() - max_lines) + " overflow line(s)"
                );
                lines.resize(max_lines);
                break;
            }
            scale = next;
        }

        for (std::size_t k = 0; k < lines.size(); ++k) {
            std::string shown;
            for (const char32_t rune : lines[k]) {
                shown += target_font_.encode(static_cast<std::uint32_t>(rune));
            }
            if (shown.empty()) {
                continue;
            }
            const double x = run.bbox.x0;
            const double y = run.bbox.y1 - kAscent * size - static_cast<double>(k) * kLineHeight * size;
            overlay_ += "BT /";
            overlay_ += kOverlayFontName;
            overlay_ += " " + format_pdf_number(size) + " Tf 1 0 0 1 " + format_pdf_number(x) + " " +
                format_pdf_number(y) + " Tm " + format_hex_string(shown) + " Tj ET\n";
        }
    }

    void flush_run() {
        if (!run_) {
            return;
        }
        TextRun run = std::move(*run_);
        run_.reset();

        const std::u32string span = normalize_whitespace(run.text);
        std::optional<std::string> translated;

        if (!has_letters(span)) {
            ++stats_.spans_skipped;
        } else {
            bool from_cache = false;
            TranslateResult result = translator_.translate(runes_to_utf8(span), from_cache);
            if (result.ok()) {
                ++(from_cache ? stats_.spans_cached : stats_.spans_translated);
                translated = std::move(result.text);
            } else {
                ++stats_.spans_fallback;
                log_debug("page " + std::to_string(page_.page_index) + ": keeping original text: " + result.error);
                if (options_.strict) {
                    failed_ = true;
                    error_ = "translation failed on page " + std::to_string(page_.page_index + 1) + ": " + result.error;
                    return;
                }
            }
        }

        std::size_t next_show = 0;
        for (const std::size_t member : run.members) {
            if (translated && next_show < run.shows.size() && run.shows[next_show].op_index == member) {
                body_ += replacement_for(run.shows[next_show]);
                ++next_show;
            } else {
                emit_raw(member);
            }
        }

        if (translated) {
            layout_overlay(run, *translated);
            modified_ = true;
        }
    }

    const ContentStream& stream_;
    const PageContent& page_;
    const RegionMask& mask_;
    CachedTranslator& translator_;
    const TargetFont& target_font_;
    const InterpreterOptions& options_;

    std::vector<GraphicsState> gstack_;
    Matrix tm_;
    Matrix tlm_;
    bool in_text_ = false;
    int open_saves_ = 0;

    std::optional<TextRun> run_;
    std::string body_;
    std::string overlay_;
    PageStats stats_;
    bool modified_ = false;
    bool failed_ = false;
    std::string error_;
};

}  // namespace

Matrix Matrix::translation(double tx, double ty) {
    Matrix m;
    m.e = tx;
    m.f = ty;
    return m;
}

Point Matrix::apply(double x, double y) const {
    return Point{x * a + y * c + e, x * b + y * d + f};
}

Matrix concat(const Matrix& first, const Matrix& second) {
    Matrix r;
    r.a = first.a * second.a + first.b * second.c;
    r.b = first.a * second.b + first.b * second.d;
    r.c = first.c * second.a + first.d * second.c;
    r.d = first.c * second.b + first.d * second.d;
    r.e = first.e * second.a + first.f * second.c + second.e;
    r.f = first.e * second.b + first.f * second.d + second.f;
    return r;
}

void Rect::include(const Point& p) {
    if (empty) {
        x0 = x1 = p.x;
        y0 = y1 = p.y;
        empty = false;
        return;
    }
    x0 = std::min(x0, p.x);
    y0 = std::min(y0, p.y);
    x1 = std::max(x1, p.x);
    y1 = std::max(y1, p.y);
}

PageStats& PageStats::operator+=(const PageStats& other) {
    spans_translated += other.spans_translated;
    spans_cached += other.spans_cached;
    spans_fallback += other.spans_fallback;
    spans_protected += other.spans_protected;
    spans_skipped += other.spans_skipped;
    return *this;
}

std::vector<std::u32string> wrap_text(
    const std::u32string& text,
    double max_width,
    double font_size,
    const TargetFont& font
) {
    std::vector<std::u32string> lines;
    std::u32string line;
    double line_width = 0.0;
    bool pending_space = false;
    const double space_width = font.advance(' ') * font_size;

    auto rune_width = [&](char32_t rune) {
        return font.advance(static_cast<std::uint32_t>(rune)) * font_size;
    };

    auto place = [&](const std::u32string& token, double token_width) {
        const double needed = (pending_space ? space_width : 0.0) + token_width;
        if (!line.empty() && line_width + needed > max_width) {
            lines.push_back(std::move(line));
            line = token;
            line_width = token_width;
        } else {
            if (pending_space && !line.empty()) {
                line.push_back(U' ');
            }
            line += token;
            line_width += needed;
        }
        pending_space = false;
    };

    std::u32string word;
    double word_width = 0.0;
    auto flush_word = [&]() {
        if (!word.empty()) {
            place(word, word_width);
            word.clear();
            word_width = 0.0;
        }
    };

    for (const char32_t rune : text) {
        const auto cp = static_cast<std::uint32_t>(rune);
        if (is_space_rune(cp)) {
            flush_word();
            if (!line.empty()) {
                pending_space = true;
            }
            continue;
        }
        if (is_cjk_rune(cp)) {
            flush_word();
            place(std::u32string(1, rune), rune_width(rune));
            continue;
        }
        word.push_back(rune);
        word_width += rune_width(rune);
    }
    flush_word();

    if (!line.empty()) {
        lines.push_back(std::move(line));
    }
    return lines;
}

PageInterpreter::PageInterpreter(CachedTranslator& translator, const TargetFont& target_font, InterpreterOptions options)
    : translator_(translator), target_font_(target_font), options_(options) {}

bool PageInterpreter::interpret(const PageContent& page, const RegionMask& mask, PageOutput& out, std::string& error) {
    out = PageOutput{};

    ContentStream stream;
    if (!parse_content_stream(page.content, stream, error)) {
        error = "page " + std::to_string(page.page_index + 1) + ": " + error;
        return false;
    }

    PageWalker walker(stream, page, mask, translator_, target_font_, options_);
    return walker.run(out, error);
}

}  // namespace pdf_mt
