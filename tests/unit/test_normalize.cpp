#include <gtest/gtest.h>
#include <roomassign/errors.hpp>
#include <roomassign/normalize.hpp>

using namespace roomassign;

// ─── Imputation ──────────────────────────────────────────────────────────────

TEST(NormalizeRows, GroupColumnAndImputedPreference)
{
    CellGrid rows = {
        {"Name", "1st", "2nd", "Group"},
        {"A", "1", "2", "11am"},
        {"B", "", "1", ""},
    };

    auto request = normalize_rows(rows);
    ASSERT_EQ(request.participants.size(), 2u);

    const auto& a = request.participants[0];
    EXPECT_EQ(a.name, "A");
    EXPECT_EQ(a.preferences, (std::vector<int>{1, 2}));
    EXPECT_EQ(a.groups, (std::vector<std::string>{"11am"}));

    const auto& b = request.participants[1];
    EXPECT_EQ(b.name, "B");
    EXPECT_EQ(b.preferences, (std::vector<int>{2, 1}));
    EXPECT_TRUE(b.groups.empty());
}

TEST(NormalizeRows, AllBlanksShareOneFillValue)
{
    CellGrid rows = {
        {"Name", "PM", "LO", "DPM", "DLO", "GM", "MO", "GW", "OW"},
        {"A", "3", "", "7", "", "", "1", "", ""},
    };

    auto request = normalize_rows(rows);
    ASSERT_EQ(request.participants.size(), 1u);
    EXPECT_EQ(request.participants[0].preferences,
              (std::vector<int>{3, 8, 7, 8, 8, 1, 8, 8}));
}

TEST(NormalizeRows, RowWithoutExplicitValuesFillsWithOne)
{
    CellGrid rows = {
        {"Name", "a", "b", "c"},
        {"A", "", " ", ""},
    };

    auto request = normalize_rows(rows);
    EXPECT_EQ(request.participants[0].preferences, (std::vector<int>{1, 1, 1}));
}

TEST(NormalizeRows, NegativeAndSignedRanks)
{
    CellGrid rows = {
        {"Name", "a", "b", "c"},
        {"A", "-2", "+4", ""},
    };

    auto request = normalize_rows(rows);
    EXPECT_EQ(request.participants[0].preferences, (std::vector<int>{-2, 4, 5}));
}

TEST(NormalizeRows, CellsAreTrimmed)
{
    CellGrid rows = {
        {" Name ", " a ", " b "},
        {"  Alice  ", " 2 ", "\t1\t"},
    };

    auto request = normalize_rows(rows);
    EXPECT_EQ(request.participants[0].name, "Alice");
    EXPECT_EQ(request.participants[0].preferences, (std::vector<int>{2, 1}));
}

// ─── Group column ────────────────────────────────────────────────────────────

TEST(NormalizeRows, GroupHeaderIsCaseInsensitive)
{
    for (const char* header : {"group", "GROUP", "  Group  ", "gRoUp"})
    {
        CellGrid rows = {
            {"Name", "a", header},
            {"A", "1", "x;y"},
        };
        auto request = normalize_rows(rows);
        EXPECT_EQ(request.participants[0].preferences, (std::vector<int>{1})) << header;
        EXPECT_EQ(request.participants[0].groups, (std::vector<std::string>{"x", "y"})) << header;
    }
}

TEST(NormalizeRows, OtherTrailingHeaderIsAPreference)
{
    CellGrid rows = {
        {"Name", "a", "Groups"},
        {"A", "1", "2"},
    };

    auto request = normalize_rows(rows);
    EXPECT_EQ(request.participants[0].preferences, (std::vector<int>{1, 2}));
    EXPECT_TRUE(request.participants[0].groups.empty());
}

TEST(NormalizeRows, ShortRowWithGroupColumnHasNoPreferences)
{
    CellGrid rows = {
        {"Name", "a", "b", "Group"},
        {"A", "1", "2", "g"},
        {"B", "g2"},
    };

    // The last cell is always the group cell when the column is present.
    auto request = normalize_rows(rows);
    ASSERT_EQ(request.participants.size(), 2u);
    EXPECT_TRUE(request.participants[1].preferences.empty());
    EXPECT_EQ(request.participants[1].groups, (std::vector<std::string>{"g2"}));
}

TEST(SplitGroups, SeparatesOnSemicolon)
{
    EXPECT_EQ(split_groups("11am;2pm"), (std::vector<std::string>{"11am", "2pm"}));
    EXPECT_EQ(split_groups(" 11am ; 2pm ;"), (std::vector<std::string>{"11am", "2pm"}));
}

TEST(SplitGroups, EmptyOrWhitespaceIsUnconstrained)
{
    EXPECT_TRUE(split_groups("").empty());
    EXPECT_TRUE(split_groups("   ").empty());
    EXPECT_TRUE(split_groups(";;").empty());
}

TEST(SplitGroups, DropsRepeats)
{
    EXPECT_EQ(split_groups("a;b;a"), (std::vector<std::string>{"a", "b"}));
}

// ─── Rank parsing ────────────────────────────────────────────────────────────

TEST(ParseRank, AcceptsIntegers)
{
    EXPECT_EQ(parse_rank("0"), 0);
    EXPECT_EQ(parse_rank("12"), 12);
    EXPECT_EQ(parse_rank("-3"), -3);
    EXPECT_EQ(parse_rank("+7"), 7);
}

TEST(ParseRank, RejectsNonIntegers)
{
    EXPECT_FALSE(parse_rank("").has_value());
    EXPECT_FALSE(parse_rank("x").has_value());
    EXPECT_FALSE(parse_rank("2.5").has_value());
    EXPECT_FALSE(parse_rank("3a").has_value());
    EXPECT_FALSE(parse_rank("+").has_value());
    EXPECT_FALSE(parse_rank("+-1").has_value());
    EXPECT_FALSE(parse_rank("99999999999").has_value());
}

// ─── Skipped rows and errors ─────────────────────────────────────────────────

TEST(NormalizeRows, SkipsRowsWithEmptyName)
{
    CellGrid rows = {
        {"Name", "a", "b"},
        {},
        {"", "1", "2"},
        {"  ", "x"},
        {"A", "1", "2"},
    };

    auto request = normalize_rows(rows);
    ASSERT_EQ(request.participants.size(), 1u);
    EXPECT_EQ(request.participants[0].name, "A");
}

TEST(NormalizeRows, BlankRowsKeepLineNumbers)
{
    CellGrid rows = {
        {"Name", "a", "b"},
        {"A", "1", "2"},
        {},
        {""},
        {"C", "1", "bad"},
    };

    try
    {
        normalize_rows(rows);
        FAIL() << "expected CellParseError";
    }
    catch (const CellParseError& e)
    {
        EXPECT_EQ(e.line(), 5u);
        EXPECT_EQ(e.column(), 3u);
        EXPECT_EQ(e.text(), "bad");
    }
}

TEST(NormalizeRows, NonNumericPreferenceNamesColumnAndValue)
{
    CellGrid rows = {
        {"Name", "1st", "2nd"},
        {"C", "x", "2"},
    };

    try
    {
        normalize_rows(rows);
        FAIL() << "expected CellParseError";
    }
    catch (const CellParseError& e)
    {
        EXPECT_EQ(e.kind(), ErrorKind::CellParse);
        EXPECT_EQ(e.line(), 2u);
        EXPECT_EQ(e.column(), 2u);
        EXPECT_EQ(e.text(), "x");
        EXPECT_EQ(e.cells(), (std::vector<std::string>{"C", "x", "2"}));
        EXPECT_NE(std::string(e.what()).find("\"x\" at column 2"), std::string::npos);
    }
}

TEST(NormalizeRows, LargestRankWithBlankCannotBeFilled)
{
    CellGrid rows = {
        {"Name", "a", "b", "c"},
        {"A", "3", "2147483647", ""},
    };

    try
    {
        normalize_rows(rows);
        FAIL() << "expected CellParseError";
    }
    catch (const CellParseError& e)
    {
        EXPECT_EQ(e.line(), 2u);
        EXPECT_EQ(e.column(), 3u);
        EXPECT_EQ(e.text(), "2147483647");
    }
}

TEST(NormalizeRows, LargestRankWithoutBlanksIsKept)
{
    CellGrid rows = {
        {"Name", "a", "b"},
        {"A", "2147483647", "1"},
    };

    auto request = normalize_rows(rows);
    EXPECT_EQ(request.participants[0].preferences, (std::vector<int>{2147483647, 1}));
}

TEST(NormalizeRows, SingleRowIsStructuralError)
{
    CellGrid rows = {{"Name", "1st"}};
    try
    {
        normalize_rows(rows);
        FAIL() << "expected StructuralError";
    }
    catch (const StructuralError& e)
    {
        EXPECT_EQ(e.kind(), ErrorKind::Structural);
        EXPECT_EQ(e.row_count(), 1u);
    }
}

TEST(NormalizeRows, EmptyGridIsStructuralError)
{
    EXPECT_THROW(normalize_rows({}), StructuralError);
}

TEST(NormalizeRows, EmptyHeaderIsStructuralError)
{
    CellGrid rows = {{}, {"A", "1"}};
    EXPECT_THROW(normalize_rows(rows), StructuralError);
}

TEST(NormalizeRows, NameOnlyRowIsRowShapeError)
{
    CellGrid rows = {
        {"Name", "a"},
        {"A", "1"},
        {"B"},
    };

    try
    {
        normalize_rows(rows);
        FAIL() << "expected RowShapeError";
    }
    catch (const RowShapeError& e)
    {
        EXPECT_EQ(e.line(), 3u);
        EXPECT_EQ(e.cells(), (std::vector<std::string>{"B"}));
    }
}

TEST(NormalizeRows, NoParticipantsIsEmptyDatasetError)
{
    CellGrid rows = {
        {"Name", "a"},
        {"", "1"},
        {},
    };
    EXPECT_THROW(normalize_rows(rows), EmptyDatasetError);
}
