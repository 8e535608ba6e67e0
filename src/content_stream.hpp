#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace pdf_mt {

enum class OperandType {
    Null,
    Boolean,
    Number,
    Name,
    String,
    HexString,
    Array,
    Dict,
    InlineImageData
};

struct Operand {
    OperandType type = OperandType::Null;
    bool boolean = false;
    double number = 0.0;
    // Name without the slash, decoded string bytes, or raw inline image samples.
    std::string bytes;
    // Array elements, or dictionary keys and values alternating.
    std::vector<Operand> items;
};

struct ContentOperation {
    std::string op;
    std::vector<Operand> operands;
    // Source bytes since the end of the previous operation, this operator included.
    std::string raw;
};

// Concatenating every operation's raw bytes and then trailing reproduces the input.
struct ContentStream {
    std::vector<ContentOperation> operations;
    std::string trailing;
};

bool parse_content_stream(std::string_view data, ContentStream& out_stream, std::string& error);

std::string serialize_content_stream(const ContentStream& stream);

// Shortest decimal form with at most four fractional digits.
std::string format_pdf_number(double value);

// "<48656C6C6F>" style hex string.
std::string format_hex_string(std::string_view bytes);

}  // namespace pdf_mt
