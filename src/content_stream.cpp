#include "content_stream.hpp"

#include <cmath>
#include <cstdio>
#include <cstdlib>

namespace pdf_mt {

namespace {

bool is_whitespace(char c) {
    return c == ' ' || c == '\n' || c == '\r' || c == '\t' || c == '\f' || c == '\0';
}

bool is_delimiter(char c) {
    switch (c) {
        case '(':
        case ')':
        case '<':
        case '>':
        case '[':
        case ']':
        case '{':
        case '}':
        case '/':
        case '%':
            return true;
        default:
            return false;
    }
}

bool is_regular(char c) {
    return !is_whitespace(c) && !is_delimiter(c);
}

int hex_value(char c) {
    if (c >= '0' && c <= '9') {
        return c - '0';
    }
    if (c >= 'a' && c <= 'f') {
        return c - 'a' + 10;
    }
    if (c >= 'A' && c <= 'F') {
        return c - 'A' + 10;
    }
    return -1;
}

bool looks_numeric(std::string_view token) {
    if (token.empty()) {
        return false;
    }
    std::size_t i = 0;
    if (token[0] == '+' || token[0] == '-') {
        i = 1;
    }
    bool digits = false;
    bool dot = false;
    for (; i < token.size(); ++i) {
        if (token[i] >= '0' && token[i] <= '9') {
            digits = true;
        } else if (token[i] == '.' && !dot) {
            dot = true;
        } else {
            return false;
        }
    }
    return digits;
}

class Lexer {
public:
    explicit Lexer(std::string_view data) : data_(data) {}

    std::size_t position() const { return pos_; }
    bool at_end() const { return pos_ >= data_.size(); }

    void skip_whitespace_and_comments() {
        while (pos_ < data_.size()) {
            const char c = data_[pos_];
            if (is_whitespace(c)) {
                ++pos_;
            } else if (c == '%') {
                while (pos_ < data_.size() && data_[pos_] != '\n' && data_[pos_] != '\r') {
                    ++pos_;
                }
            } else {
                break;
            }
        }
    }

    // Reads one operand, or a keyword into out_keyword. Returns false on malformed input.
    bool read_object(Operand& out, std::string& out_keyword, std::string& error) {
        out = Operand{};
        out_keyword.clear();
        skip_whitespace_and_comments();
        if (at_end()) {
            error = "unexpected end of content stream";
            return false;
        }

        const char c = data_[pos_];
        if (c == '/') {
            ++pos_;
            out.type = OperandType::Name;
            return read_name(out.bytes);
        }
        if (c == '(') {
            ++pos_;
            out.type = OperandType::String;
            return read_literal_string(out.bytes, error);
        }
        if (c == '<') {
            if (pos_ + 1 < data_.size() && data_[pos_ + 1] == '<') {
                pos_ += 2;
                out.type = OperandType::Dict;
                return read_sequence(out.items, ">>", error);
            }
            ++pos_;
            out.type = OperandType::HexString;
            return read_hex_string(out.bytes, error);
        }
        if (c == '[') {
            ++pos_;
            out.type = OperandType::Array;
            return read_sequence(out.items, "]", error);
        }
        if (c == ']' || c == '>' || c == ')' || c == '{' || c == '}') {
            out_keyword.assign(1, c);
            ++pos_;
            if (c == '>' && pos_ < data_.size() && data_[pos_] == '>') {
                out_keyword = ">>";
                ++pos_;
            }
            return true;
        }

        const std::size_t start = pos_;
        while (pos_ < data_.size() && is_regular(data_[pos_])) {
            ++pos_;
        }
        const std::string_view token = data_.substr(start, pos_ - start);

        if (looks_numeric(token)) {
            out.type = OperandType::Number;
            out.number = std::strtod(std::string(token).c_str(), nullptr);
            return true;
        }
        if (token == "true" || token == "false") {
            out.type = OperandType::Boolean;
            out.boolean = token == "true";
            return true;
        }
        if (token == "null") {
            out.type = OperandType::Null;
            return true;
        }

        out_keyword.assign(token);
        return true;
    }

    // Consumes BI dictionary entries up to ID, the sample bytes, and the closing EI.
    bool read_inline_image(std::vector<Operand>& out_operands, std::string& error) {
        for (;;) {
            Operand operand;
            std::string keyword;
            if (!read_object(operand, keyword, error)) {
                return false;
            }
            if (keyword == "ID") {
                break;
            }
            if (!keyword.empty()) {
                error = "unexpected '" + keyword + "' in inline image dictionary";
                return false;
            }
            out_operands.push_back(std::move(operand));
        }

        if (pos_ < data_.size() && is_whitespace(data_[pos_])) {
            ++pos_;
        }
        const std::size_t start = pos_;
        while (pos_ + 1 < data_.size()) {
            const bool preceded = pos_ == start || is_whitespace(data_[pos_ - 1]);
            const bool followed = pos_ + 2 >= data_.size() || !is_regular(data_[pos_ + 2]);
            if (data_[pos_] == 'E' && data_[pos_ + 1] == 'I' && preceded && followed) {
                Operand payload;
                payload.type = OperandType::InlineImageData;
                payload.bytes.assign(data_.substr(start, pos_ - start));
                out_operands.push_back(std::move(payload));
                pos_ += 2;
                return true;
            }
            ++pos_;
        }
        error = "inline image without EI";
        return false;
    }

private:
    bool read_name(std::string& out) {
        while (pos_ < data_.size() && is_regular(data_[pos_])) {
            const char c = data_[pos_];
            if (c == '#' && pos_ + 2 < data_.size() && hex_value(data_[pos_ + 1]) >= 0 &&
                hex_value(data_[pos_ + 2]) >= 0) {
                out.push_back(static_cast<char>(hex_value(data_[pos_ + 1]) * 16 + hex_value(data_[pos_ + 2])));
                pos_ += 3;
                continue;
            }
            out.push_back(c);
            ++pos_;
        }
        return true;
    }

    bool read_literal_string(std::string& out, std::string& error) {
        int depth = 1;
        while (pos_ < data_.size()) {
            const char c = data_[pos_++];
            if (c == '\\') {
                if (pos_ >= data_.size()) {
                    break;
                }
                const char e = data_[pos_++];
                switch (e) {
                    case 'n':
                        out.push_back('\n');
                        break;
                    case 'r':
                        out.push_back('\r');
                        break;
                    case 't':
                        out.push_back('\t');
                        break;
                    case 'b':
                        out.push_back('\b');
                        break;
                    case 'f':
                        out.push_back('\f');
                        break;
                    case '\r':
                        if (pos_ < data_.size() && data_[pos_] == '\n') {
                            ++pos_;
                        }
                        break;
                    case '\n':
                        break;
                    default:
                        if (e >= '0' && e <= '7') {
                            int value = e - '0';
                            for (int n = 0; n < 2 && pos_ < data_.size() && data_[pos_] >= '0' && data_[pos_] <= '7'; ++n) {
                                value = value * 8 + (data_[pos_++] - '0');
                            }
                            out.push_back(static_cast<char>(value & 0xFF));
                        } else {
                            out.push_back(e);
                        }
                        break;
                }
                continue;
            }
            if (c == '(') {
                ++depth;
            } else if (c == ')') {
                if (--depth == 0) {
                    return true;
                }
            }
            out.push_back(c);
        }
        error = "unterminated literal string";
        return false;
    }

    bool read_hex_string(std::string& out, std::string& error) {
        int high = -1;
        while (pos_ < data_.size()) {
            const char c = data_[pos_++];
            if (c == '>') {
                if (high >= 0) {
                    out.push_back(static_cast<char>(high << 4));
                }
                return true;
            }
            if (is_whitespace(c)) {
                continue;
            }
            const int value = hex_value(c);
            if (value < 0) {
                error = std::string("invalid hex digit '") + c + "'";
                return false;
            }
            if (high < 0) {
                high = value;
            } else {
                out.push_back(static_cast<char>((high << 4) | value));
                high = -1;
            }
        }
        error = "unterminated hex string";
        return false;
    }

    bool read_sequence(std::vector<Operand>& out_items, const char* terminator, std::string& error) {
        for (;;) {
            Operand item;
            std::string keyword;
            if (!read_object(item, keyword, error)) {
                return false;
            }
            if (keyword == terminator) {
                return true;
            }
            if (!keyword.empty()) {
                error = "unexpected '" + keyword + "' inside " + (std::string(terminator) == "]" ? "array" : "dictionary");
                return false;
            }
            out_items.push_back(std::move(item));
        }
    }

    std::string_view data_;
    std::size_t pos_ = 0;
};

}  // namespace

bool parse_content_stream(std::string_view data, ContentStream& out_stream, std::string& error) {
    out_stream = ContentStream{};
    Lexer lexer(data);

    std::size_t op_start = 0;
    std::vector<Operand> operands;

    for (;;) {
        lexer.skip_whitespace_and_comments();
        if (lexer.at_end()) {
            break;
        }

        Operand operand;
        std::string keyword;
        if (!lexer.read_object(operand, keyword, error)) {
            error = "content stream offset " + std::to_string(lexer.position()) + ": " + error;
            return false;
        }

        if (keyword.empty()) {
            operands.push_back(std::move(operand));
            continue;
        }

        ContentOperation operation;
        operation.op = keyword;
        operation.operands = std::move(operands);
        operands.clear();

        if (keyword == "BI") {
            if (!lexer.read_inline_image(operation.operands, error)) {
                error = "content stream offset " + std::to_string(lexer.position()) + ": " + error;
                return false;
            }
        }

        operation.raw.assign(data.substr(op_start, lexer.position() - op_start));
        op_start = lexer.position();
        out_stream.operations.push_back(std::move(operation));
    }

    out_stream.trailing.assign(data.substr(op_start));
    return true;
}

std::string serialize_content_stream(const ContentStream& stream) {
    std::string out;
    for (const auto& operation : stream.operations) {
        out += operation.raw;
    }
    out += stream.trailing;
    return out;
}

std::string format_pdf_number(double value) {
    if (!std::isfinite(value)) {
        return "0";
    }
    if (std::fabs(value) < 0.00005) {
        return "0";
    }

    char buffer[64];
    std::snprintf(buffer, sizeof(buffer), "%.4f", value);
    std::string out(buffer);
    while (!out.empty() && out.back() == '0') {
        out.pop_back();
    }
    if (!out.empty() && out.back() == '.') {
        out.pop_back();
    }
    if (out == "-0") {
        return "0";
    }
    return out;
}

std::string format_hex_string(std::string_view bytes) {
    static constexpr char kDigits[] = "0123456789ABCDEF";
    std::string out;
    out.reserve(bytes.size() * 2 + 2);
    out.push_back('<');
    for (const char c : bytes) {
        const auto byte = static_cast<unsigned char>(c);
        out.push_back(kDigits[byte >> 4]);
        out.push_back(kDigits[byte & 0x0F]);
    }
    out.push_back('>');
    return out;
}

}  // namespace pdf_mt
