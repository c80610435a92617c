#include <roomassign/pipeline.hpp>

#include <cstdio>
#include <filesystem>
#include <sstream>

#include <roomassign/grid.hpp>
#include <roomassign/logger.hpp>
#include <roomassign/normalize.hpp>

namespace roomassign
{

namespace
{

constexpr size_t MAX_NAMED_MISMATCHES = 5;

void warn_length_mismatches(const DebateRequest& request)
{
    auto mismatches = find_length_mismatches(request);
    if (mismatches.empty())
        return;

    const size_t expected = request.participants.front().preferences.size();

    std::string names;
    for (size_t i = 0; i < mismatches.size() && i < MAX_NAMED_MISMATCHES; ++i)
    {
        const auto& p = request.participants[mismatches[i]];
        if (!names.empty())
            names += ", ";
        names += p.name + " (" + std::to_string(p.preferences.size()) + ")";
    }
    if (mismatches.size() > MAX_NAMED_MISMATCHES)
        names += ", ...";

    ROOMASSIGN_LOG_WARN("pipeline",
                        "{} participant(s) do not have {} preferences: {}",
                        mismatches.size(),
                        expected,
                        names);
}

std::string format_average(double value)
{
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.2f", value);
    return buf;
}

}   // namespace

PreparedRequest prepare_request(const CellGrid& rows, std::optional<Format> requested)
{
    PreparedRequest prepared;
    prepared.request = normalize_rows(rows);
    prepared.format  = resolve_format(prepared.request, requested);
    warn_length_mismatches(prepared.request);

    ROOMASSIGN_LOG_INFO("pipeline",
                        "Loaded {} participants ({})",
                        prepared.request.participants.size(),
                        format_display_name(prepared.format));
    return prepared;
}

PreparedRequest load_request(const std::string& path, std::optional<Format> requested)
{
    ROOMASSIGN_LOG_DEBUG("pipeline", "Reading {}", path);
    return prepare_request(decode_file(path), requested);
}

std::vector<std::string> write_exports(const ScheduleResult&                 result,
                                       Format                                format,
                                       const ExportTargets&                  targets,
                                       std::chrono::system_clock::time_point when)
{
    std::vector<std::string> written;
    if (!targets.csv && !targets.xlsx)
        return written;

    const CellGrid rows = serialize_result(result, targets.options);
    const std::filesystem::path dir(targets.directory.empty() ? "." : targets.directory);

    auto write_one = [&](const GridEncoder& encoder, ExportKind kind)
    {
        auto path  = (dir / export_file_name(format, kind, when)).string();
        auto bytes = encoder.encode(rows);
        write_file_bytes(path, bytes);
        ROOMASSIGN_LOG_INFO("export", "Wrote {} ({} bytes)", path, bytes.size());
        written.push_back(std::move(path));
    };

    if (targets.csv)
        write_one(CsvEncoder{}, ExportKind::Csv);
    if (targets.xlsx)
        write_one(XlsxEncoder("Room Assignments", {PREFERENCE_COLUMN}), ExportKind::Xlsx);

    return written;
}

CellGrid example_rows(Format format)
{
    CellGrid rows;

    CellRow header{"Name"};
    for (auto role : role_names(format))
        header.emplace_back(role);
    header.emplace_back("Group");
    rows.push_back(std::move(header));

    struct Sample
    {
        const char*      name;
        std::vector<int> preferences;
        const char*      group;
    };

    std::vector<Sample> samples;
    if (format == Format::BritishParliamentary)
    {
        samples = {
            {"A", {1, 2, 3, 4, 5, 6, 7, 8}, ""},
            {"B", {7, 6, 5, 4, 3, 2, 1, 8}, ""},
            {"C", {8, 7, 6, 5, 4, 3, 2, 1}, "morning"},
        };
    }
    else
    {
        samples = {
            {"A", {1, 2, 3, 4, 5, 6}, "11am"},
            {"B", {5, 4, 3, 2, 1, 6}, ""},
            {"C", {6, 5, 4, 3, 2, 1}, "11am;2pm"},
        };
    }

    for (const auto& s : samples)
    {
        CellRow row{s.name};
        for (int p : s.preferences)
            row.push_back(std::to_string(p));
        row.emplace_back(s.group);
        rows.push_back(std::move(row));
    }
    return rows;
}

std::string describe_summary(const ResultSummary& summary, Format format)
{
    std::ostringstream os;
    os << "Format:             " << format_display_name(format) << "\n";
    os << "Total rooms:        " << summary.total_rooms << "\n";
    os << "Total people:       " << summary.total_people << "\n";
    os << "Average preference: " << format_average(summary.average_preference) << "\n";

    if (!summary.irregular_rooms.empty())
    {
        os << "Rooms without " << summary.expected_room_size << " people:\n";
        for (const auto& room : summary.irregular_rooms)
            os << "  " << room.name << ": " << room.size << "\n";
    }
    return os.str();
}

}   // namespace roomassign
