#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace roomassign
{

// One decoded spreadsheet row: ordered text cells, untrimmed.
using CellRow = std::vector<std::string>;

// Ordered rows as produced by a GridDecoder or consumed by a GridEncoder.
using CellGrid = std::vector<CellRow>;

/**
 * @brief A debater and their ranking of every role slot.
 *
 * preferences[i] is the rank given to role slot i of the detected format
 * (lower is stronger). An empty groups list means the participant may be
 * placed in any room.
 */
struct Participant
{
    std::string              name;
    std::vector<int>         preferences;
    std::vector<std::string> groups;
};

// Body of one scheduler submission.
struct DebateRequest
{
    std::vector<Participant> participants;
};

// One seat in a returned room.
struct Assignment
{
    std::string name;
    std::string role;
    int         preference = 0;
    std::string group;   // Empty when the participant had no group
};

struct Room
{
    std::string             name;
    std::vector<Assignment> assignments;
};

// Scheduler response. Replaced wholesale by each accepted submission.
struct ScheduleResult
{
    std::vector<Room> rooms;
    int64_t           total_preference   = 0;
    double            average_preference = 0.0;
};

}   // namespace roomassign
