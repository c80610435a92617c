#include <roomassign/result_export.hpp>

#include <ctime>
#include <iomanip>
#include <sstream>

namespace roomassign
{

namespace
{

std::string format_average(double value)
{
    std::ostringstream os;
    os << value;
    return os.str();
}

}   // namespace

CellGrid serialize_result(const std::vector<Room>& rooms)
{
    CellGrid rows;
    rows.push_back({"Name", "Role", "Preference", "Group"});

    for (const auto& room : rooms)
    {
        rows.push_back({room.name});
        for (const auto& a : room.assignments)
            rows.push_back({a.name, a.role, std::to_string(a.preference), a.group});
        rows.emplace_back();
    }
    return rows;
}

CellGrid serialize_result(const ScheduleResult& result, const ExportOptions& options)
{
    CellGrid rows = serialize_result(result.rooms);
    if (options.include_statistics)
    {
        rows.emplace_back();
        rows.push_back({"Total Preference", std::to_string(result.total_preference)});
        rows.push_back({"Average Preference", format_average(result.average_preference)});
    }
    return rows;
}

std::string join_groups(const std::vector<std::string>& groups)
{
    std::string out;
    for (size_t i = 0; i < groups.size(); ++i)
    {
        if (i > 0)
            out += ';';
        out += groups[i];
    }
    return out;
}

std::string_view export_extension(ExportKind kind)
{
    switch (kind)
    {
        case ExportKind::Csv:
            return ".csv";
        case ExportKind::Xlsx:
            return ".xlsx";
    }
    return "";
}

std::string export_file_name(Format format,
                             ExportKind kind,
                             std::chrono::system_clock::time_point when)
{
    auto   time_t = std::chrono::system_clock::to_time_t(when);
    std::tm utc{};
    gmtime_r(&time_t, &utc);

    std::ostringstream os;
    os << "debate_assignments_" << format_tag(format) << '_'
       << std::put_time(&utc, "%Y-%m-%dT%H-%M-%S") << export_extension(kind);
    return os.str();
}

ResultSummary summarize(const ScheduleResult& result, Format format)
{
    ResultSummary summary;
    summary.total_rooms        = result.rooms.size();
    summary.average_preference = result.average_preference;
    summary.expected_room_size = role_count(format);

    for (const auto& room : result.rooms)
    {
        summary.total_people += room.assignments.size();
        if (room.assignments.size() != summary.expected_room_size)
            summary.irregular_rooms.push_back({room.name, room.assignments.size()});
    }
    return summary;
}

}   // namespace roomassign
