#include <gtest/gtest.h>
#include <roomassign/errors.hpp>
#include <roomassign/grid.hpp>

using namespace roomassign;

// ─── Decoding ────────────────────────────────────────────────────────────────

TEST(CsvDecoder, SimpleRows)
{
    auto rows = CsvDecoder{}.decode_text("Name,PM,LO\nA,1,2\n");
    ASSERT_EQ(rows.size(), 2u);
    EXPECT_EQ(rows[0], (CellRow{"Name", "PM", "LO"}));
    EXPECT_EQ(rows[1], (CellRow{"A", "1", "2"}));
}

TEST(CsvDecoder, CrLfLineEndings)
{
    auto rows = CsvDecoder{}.decode_text("a,b\r\nc,d\r\n");
    ASSERT_EQ(rows.size(), 2u);
    EXPECT_EQ(rows[1], (CellRow{"c", "d"}));
}

TEST(CsvDecoder, NoTrailingNewline)
{
    auto rows = CsvDecoder{}.decode_text("a,b\nc,d");
    ASSERT_EQ(rows.size(), 2u);
    EXPECT_EQ(rows[1], (CellRow{"c", "d"}));
}

TEST(CsvDecoder, StripsByteOrderMark)
{
    auto rows = CsvDecoder{}.decode_text("\xEF\xBB\xBFName,a\nA,1\n");
    ASSERT_EQ(rows.size(), 2u);
    EXPECT_EQ(rows[0][0], "Name");
}

TEST(CsvDecoder, BlankLinesBecomeEmptyRows)
{
    auto rows = CsvDecoder{}.decode_text("h\n\nA,1\n\n\nB,2\n");
    ASSERT_EQ(rows.size(), 6u);
    EXPECT_TRUE(rows[1].empty());
    EXPECT_EQ(rows[2], (CellRow{"A", "1"}));
    EXPECT_TRUE(rows[3].empty());
    EXPECT_TRUE(rows[4].empty());
    EXPECT_EQ(rows[5], (CellRow{"B", "2"}));
}

TEST(CsvDecoder, EmptyFieldsArePreserved)
{
    auto rows = CsvDecoder{}.decode_text("A,,2,\n");
    ASSERT_EQ(rows.size(), 1u);
    EXPECT_EQ(rows[0], (CellRow{"A", "", "2", ""}));
}

TEST(CsvDecoder, QuotedFields)
{
    auto rows = CsvDecoder{}.decode_text("\"Smith, J\",\"say \"\"hi\"\"\",\"11am,2pm\"\n");
    ASSERT_EQ(rows.size(), 1u);
    EXPECT_EQ(rows[0], (CellRow{"Smith, J", "say \"hi\"", "11am,2pm"}));
}

TEST(CsvDecoder, QuotedNewlineStaysInField)
{
    auto rows = CsvDecoder{}.decode_text("\"line1\nline2\",x\ny,z\n");
    ASSERT_EQ(rows.size(), 2u);
    EXPECT_EQ(rows[0][0], "line1\nline2");
    EXPECT_EQ(rows[1], (CellRow{"y", "z"}));
}

TEST(CsvDecoder, QuoteAfterPaddingOpensField)
{
    auto rows = CsvDecoder{}.decode_text("a,  \"b,c\"\n");
    ASSERT_EQ(rows.size(), 1u);
    EXPECT_EQ(rows[0], (CellRow{"a", "b,c"}));
}

TEST(CsvDecoder, QuoteInsideFieldIsLiteral)
{
    auto rows = CsvDecoder{}.decode_text("ab\"c,d\n");
    ASSERT_EQ(rows.size(), 1u);
    EXPECT_EQ(rows[0], (CellRow{"ab\"c", "d"}));
}

TEST(CsvDecoder, UnterminatedQuoteFails)
{
    try
    {
        CsvDecoder{}.decode_text("a,b\n\"open,c\n");
        FAIL() << "expected SourceError";
    }
    catch (const SourceError& e)
    {
        EXPECT_EQ(e.kind(), ErrorKind::Source);
        EXPECT_NE(e.reason().find("line 2"), std::string::npos);
    }
}

TEST(CsvDecoder, EmptyInput)
{
    EXPECT_TRUE(CsvDecoder{}.decode_text("").empty());
}

TEST(CsvDecoder, DecodesBytes)
{
    const std::string    text = "x,y\n";
    std::vector<uint8_t> bytes(text.begin(), text.end());
    auto                 rows = CsvDecoder{}.decode(bytes);
    ASSERT_EQ(rows.size(), 1u);
    EXPECT_EQ(rows[0], (CellRow{"x", "y"}));
}

// ─── Encoding ────────────────────────────────────────────────────────────────

TEST(CsvEncoder, PlainFields)
{
    CellGrid rows = {{"Name", "Role"}, {"A", "PM"}};
    EXPECT_EQ(CsvEncoder{}.encode_text(rows), "Name,Role\nA,PM");
}

TEST(CsvEncoder, QuotesSpecialFields)
{
    CellGrid rows = {{"a,b", "say \"hi\"", "two\nlines", " pad", "ok"}};
    EXPECT_EQ(CsvEncoder{}.encode_text(rows),
              "\"a,b\",\"say \"\"hi\"\"\",\"two\nlines\",\" pad\",ok");
}

TEST(CsvEncoder, EmptyRowsAndCells)
{
    CellGrid rows = {{"Room 1"}, {}, {"A", "", "1"}};
    EXPECT_EQ(CsvEncoder{}.encode_text(rows), "Room 1\n\nA,,1");
}

TEST(CsvEncoder, EncodedTextDecodesBack)
{
    CellGrid rows = {{"Name", "Group"}, {"O'Brien, \"Pat\"", "11am;2pm"}, {}, {"B", ""}};
    auto     decoded = CsvDecoder{}.decode_text(CsvEncoder{}.encode_text(rows));
    ASSERT_EQ(decoded.size(), 4u);
    EXPECT_EQ(decoded[1], rows[1]);
    EXPECT_TRUE(decoded[2].empty());
    EXPECT_EQ(decoded[3], rows[3]);
}

TEST(CsvEncoder, ExtensionAndBytes)
{
    CsvEncoder enc;
    EXPECT_EQ(enc.extension(), ".csv");
    auto bytes = enc.encode({{"a"}});
    EXPECT_EQ(std::string(bytes.begin(), bytes.end()), "a");
}
