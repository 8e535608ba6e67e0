#include "content_stream.hpp"

#include <gtest/gtest.h>

#include <string>

namespace pdf_mt {
namespace {

TEST(ContentStreamTest, SplitsOperatorsWithOperands) {
    ContentStream stream;
    std::string error;
    ASSERT_TRUE(parse_content_stream("q 1 0 0 1 72 700 cm BT /F1 12 Tf (Hi) Tj ET Q\n", stream, error)) << error;

    ASSERT_EQ(stream.operations.size(), 7u);
    EXPECT_EQ(stream.operations[0].op, "q");
    EXPECT_EQ(stream.operations[1].op, "cm");
    ASSERT_EQ(stream.operations[1].operands.size(), 6u);
    EXPECT_DOUBLE_EQ(stream.operations[1].operands[5].number, 700.0);
    EXPECT_EQ(stream.operations[3].op, "Tf");
    EXPECT_EQ(stream.operations[3].operands[0].type, OperandType::Name);
    EXPECT_EQ(stream.operations[3].operands[0].bytes, "F1");
    EXPECT_EQ(stream.operations[4].operands[0].type, OperandType::String);
    EXPECT_EQ(stream.operations[4].operands[0].bytes, "Hi");
    EXPECT_EQ(stream.trailing, "\n");
}

TEST(ContentStreamTest, SerializeReproducesInputExactly) {
    const std::string input =
        "%comment\n q\r\n0.5 g /GS0 gs\nBT/F1 9.5 Tf[(A)-120(B\\)c)]TJ 0 -12 TD<4142> Tj ET\n"
        "BI /W 2 /H 1 /BPC 8 /CS /G ID \x01\x02 EI Q  \n";
    ContentStream stream;
    std::string error;
    ASSERT_TRUE(parse_content_stream(input, stream, error)) << error;
    EXPECT_EQ(serialize_content_stream(stream), input);
}

TEST(ContentStreamTest, DecodesStringEscapesAndHex) {
    ContentStream stream;
    std::string error;
    ASSERT_TRUE(parse_content_stream("(a\\(b\\)\\101\\n(nested)) Tj <48 65 6c6C 6> Tj", stream, error)) << error;
    ASSERT_EQ(stream.operations.size(), 2u);
    EXPECT_EQ(stream.operations[0].operands[0].bytes, "a(b)A\n(nested)");
    EXPECT_EQ(stream.operations[1].operands[0].type, OperandType::HexString);
    EXPECT_EQ(stream.operations[1].operands[0].bytes, std::string("Hell\x60", 5));
}

TEST(ContentStreamTest, ParsesArraysDictsAndNames) {
    ContentStream stream;
    std::string error;
    ASSERT_TRUE(parse_content_stream("[(x) -250 (y)] TJ /Span <</MCID 3 /Alt (t)>> BDC /A#20B Do EMC", stream, error))
        << error;
    ASSERT_EQ(stream.operations.size(), 4u);

    const Operand& array = stream.operations[0].operands[0];
    ASSERT_EQ(array.type, OperandType::Array);
    ASSERT_EQ(array.items.size(), 3u);
    EXPECT_DOUBLE_EQ(array.items[1].number, -250.0);

    const Operand& dict = stream.operations[1].operands[1];
    ASSERT_EQ(dict.type, OperandType::Dict);
    ASSERT_EQ(dict.items.size(), 4u);
    EXPECT_EQ(dict.items[0].bytes, "MCID");

    EXPECT_EQ(stream.operations[2].operands[0].bytes, "A B");
}

TEST(ContentStreamTest, InlineImageDataIsKeptAsOnePayload) {
    ContentStream stream;
    std::string error;
    const std::string input = std::string("BI /W 1 /H 1 ID ") + std::string("E\0I", 3) + " EI Q";
    ASSERT_TRUE(parse_content_stream(input, stream, error)) << error;
    ASSERT_EQ(stream.operations.size(), 2u);
    EXPECT_EQ(stream.operations[0].op, "BI");
    ASSERT_FALSE(stream.operations[0].operands.empty());
    EXPECT_EQ(stream.operations[0].operands.back().type, OperandType::InlineImageData);
    // Samples run up to the whitespace that precedes EI.
    EXPECT_EQ(stream.operations[0].operands.back().bytes, std::string("E\0I ", 4));
    EXPECT_EQ(stream.operations[1].op, "Q");
}

TEST(ContentStreamTest, ReportsMalformedInput) {
    ContentStream stream;
    std::string error;
    EXPECT_FALSE(parse_content_stream("(never closed Tj", stream, error));
    EXPECT_NE(error.find("unterminated"), std::string::npos);

    error.clear();
    EXPECT_FALSE(parse_content_stream("<4G> Tj", stream, error));
    EXPECT_FALSE(error.empty());

    error.clear();
    EXPECT_FALSE(parse_content_stream("BI /W 1 ID abc", stream, error));
    EXPECT_FALSE(error.empty());
}

TEST(ContentStreamTest, FormatsNumbersCompactly) {
    EXPECT_EQ(format_pdf_number(12.0), "12");
    EXPECT_EQ(format_pdf_number(-0.5), "-0.5");
    EXPECT_EQ(format_pdf_number(1.23456), "1.2346");
    EXPECT_EQ(format_pdf_number(-0.00001), "0");
    EXPECT_EQ(format_hex_string("Hi\xFF"), "<4869FF>");
}

}  // namespace
}  // namespace pdf_mt
