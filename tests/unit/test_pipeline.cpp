#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <roomassign/errors.hpp>
#include <roomassign/grid.hpp>
#include <roomassign/logger.hpp>
#include <roomassign/pipeline.hpp>

using namespace roomassign;

namespace
{

std::filesystem::path fresh_dir(const char* name)
{
    auto dir = std::filesystem::temp_directory_path() / name;
    std::filesystem::remove_all(dir);
    std::filesystem::create_directories(dir);
    return dir;
}

void write_text(const std::filesystem::path& path, const std::string& text)
{
    std::ofstream f(path, std::ios::binary);
    f << text;
}

}   // namespace

// ─── Request preparation ─────────────────────────────────────────────────────

TEST(PrepareRequest, DetectsFormat)
{
    auto prepared = prepare_request(example_rows(Format::BritishParliamentary));
    EXPECT_EQ(prepared.format, Format::BritishParliamentary);
    EXPECT_EQ(prepared.request.participants.size(), 3u);
}

TEST(PrepareRequest, RequestedFormatMustMatch)
{
    EXPECT_THROW(prepare_request(example_rows(Format::Traditional), Format::BritishParliamentary),
                 FormatMismatchError);
}

TEST(PrepareRequest, MismatchedRowsAreKeptAndWarned)
{
    std::vector<std::string> warnings;
    auto& logger = Logger::instance();
    logger.clear_sinks();
    logger.add_sink(
        [&](const Logger::LogEntry& e)
        {
            if (e.level == LogLevel::Warning)
                warnings.push_back(e.message);
        });

    CellGrid rows = example_rows(Format::Traditional);
    rows.push_back({"Dee", "1", "2", "3", "4", "5", ""});   // five preferences

    auto prepared = prepare_request(rows);
    logger.clear_sinks();

    EXPECT_EQ(prepared.format, Format::Traditional);
    ASSERT_EQ(prepared.request.participants.size(), 4u);
    EXPECT_EQ(prepared.request.participants[3].preferences.size(), 5u);
    ASSERT_EQ(warnings.size(), 1u);
    EXPECT_NE(warnings[0].find("Dee (5)"), std::string::npos);
}

TEST(LoadRequest, ReadsCsvFile)
{
    auto dir  = fresh_dir("roomassign_pipeline_csv");
    auto path = dir / "people.CSV";
    write_text(path,
               "Name,1st Aff,1st Neg,2nd Aff,2nd Neg,3rd Aff,3rd Neg,Group\r\n"
               "A,1,2,3,4,5,6,11am\r\n"
               "\r\n"
               "B,,,1,,,,\"11am;2pm\"\r\n");

    auto prepared = load_request(path.string());
    EXPECT_EQ(prepared.format, Format::Traditional);
    ASSERT_EQ(prepared.request.participants.size(), 2u);
    EXPECT_EQ(prepared.request.participants[1].preferences, (std::vector<int>{2, 2, 1, 2, 2, 2}));
    EXPECT_EQ(prepared.request.participants[1].groups, (std::vector<std::string>{"11am", "2pm"}));

    std::filesystem::remove_all(dir);
}

TEST(LoadRequest, ParseErrorReportsFileLine)
{
    auto dir  = fresh_dir("roomassign_pipeline_err");
    auto path = dir / "people.csv";
    write_text(path, "Name,a,b\nA,1,2\n\nC,x,2\n");

    try
    {
        load_request(path.string());
        FAIL() << "expected CellParseError";
    }
    catch (const CellParseError& e)
    {
        EXPECT_EQ(e.line(), 4u);
        EXPECT_EQ(e.column(), 2u);
    }

    std::filesystem::remove_all(dir);
}

// ─── Examples ────────────────────────────────────────────────────────────────

TEST(ExampleRows, TraditionalTemplate)
{
    auto rows = example_rows(Format::Traditional);
    ASSERT_EQ(rows.size(), 4u);
    EXPECT_EQ(rows[0].front(), "Name");
    EXPECT_EQ(rows[0][1], "1st Aff");
    EXPECT_EQ(rows[0].back(), "Group");
    EXPECT_EQ(rows[3].back(), "11am;2pm");
}

TEST(ExampleRows, BritishParliamentaryTemplate)
{
    auto rows = example_rows(Format::BritishParliamentary);
    ASSERT_EQ(rows.size(), 4u);
    EXPECT_EQ(rows[0].size(), 10u);
    EXPECT_EQ(rows[0][1], "PM");
    EXPECT_EQ(rows[3].back(), "morning");
}

// ─── Exports ─────────────────────────────────────────────────────────────────

TEST(WriteExports, WritesSelectedKinds)
{
    auto dir = fresh_dir("roomassign_pipeline_export");

    ScheduleResult result;
    result.rooms              = {{"Room 1", {{"A", "PM", 1, "11am"}}}};
    result.total_preference   = 1;
    result.average_preference = 1.0;

    ExportTargets targets;
    targets.csv                        = true;
    targets.xlsx                       = true;
    targets.directory                  = (dir / "out").string();
    targets.options.include_statistics = true;

    auto when    = std::chrono::system_clock::from_time_t(1709647629);
    auto written = write_exports(result, Format::BritishParliamentary, targets, when);

    ASSERT_EQ(written.size(), 2u);
    EXPECT_EQ(std::filesystem::path(written[0]).filename().string(),
              "debate_assignments_bp_2024-03-05T14-07-09.csv");
    EXPECT_EQ(std::filesystem::path(written[1]).filename().string(),
              "debate_assignments_bp_2024-03-05T14-07-09.xlsx");

    auto csv = decode_file(written[0]);
    EXPECT_EQ(csv[2], (CellRow{"A", "PM", "1", "11am"}));
    EXPECT_EQ(csv.back(), (CellRow{"Average Preference", "1"}));

    auto xlsx = decode_file(written[1]);
    EXPECT_EQ(xlsx[2], (CellRow{"A", "PM", "1", "11am"}));

    std::filesystem::remove_all(dir);
}

TEST(WriteExports, NothingSelected)
{
    ExportTargets targets;
    EXPECT_TRUE(write_exports(ScheduleResult{}, Format::Traditional, targets,
                              std::chrono::system_clock::now())
                    .empty());
}

// ─── Summary text ────────────────────────────────────────────────────────────

TEST(DescribeSummary, ListsIrregularRooms)
{
    ResultSummary summary;
    summary.total_rooms        = 2;
    summary.total_people       = 14;
    summary.average_preference = 1.8333;
    summary.expected_room_size = 8;
    summary.irregular_rooms    = {{"Room 2", 6}};

    auto text = describe_summary(summary, Format::BritishParliamentary);
    EXPECT_NE(text.find("British Parliamentary"), std::string::npos);
    EXPECT_NE(text.find("Total people:       14"), std::string::npos);
    EXPECT_NE(text.find("1.83"), std::string::npos);
    EXPECT_NE(text.find("Room 2: 6"), std::string::npos);
}
