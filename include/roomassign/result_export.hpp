#pragma once

#include <chrono>
#include <cstddef>
#include <string>
#include <vector>

#include <roomassign/format.hpp>
#include <roomassign/model.hpp>

namespace roomassign
{

enum class ExportKind
{
    Csv,
    Xlsx
};

struct ExportOptions
{
    // Append "Total Preference" / "Average Preference" rows after the rooms.
    bool include_statistics = false;
};

// Column index of the numeric "Preference" field in serialized rows.
inline constexpr std::size_t PREFERENCE_COLUMN = 2;

/**
 * @brief Flatten room assignments into export rows.
 *
 * Layout: header `Name, Role, Preference, Group`; then per room a one-cell
 * row with the room name, one row per assignment, and an empty separator
 * row. The format is not encoded in the rows.
 */
CellGrid serialize_result(const std::vector<Room>& rooms);

CellGrid serialize_result(const ScheduleResult& result, const ExportOptions& options);

// Joins group labels with ';', the separator used on input.
std::string join_groups(const std::vector<std::string>& groups);

// "debate_assignments_<tag>_<YYYY-MM-DDTHH-MM-SS>.<csv|xlsx>" (UTC timestamp).
std::string export_file_name(Format format,
                             ExportKind kind,
                             std::chrono::system_clock::time_point when);

std::string_view export_extension(ExportKind kind);

// ─── Summary ─────────────────────────────────────────────────────────────────

struct ResultSummary
{
    struct IrregularRoom
    {
        std::string name;
        std::size_t size = 0;
    };

    std::size_t                total_rooms        = 0;
    std::size_t                total_people       = 0;
    double                     average_preference = 0.0;
    std::size_t                expected_room_size = 0;
    std::vector<IrregularRoom> irregular_rooms;
};

// Totals plus the rooms whose size differs from the format's role count.
ResultSummary summarize(const ScheduleResult& result, Format format);

}   // namespace roomassign
