#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include <roomassign/format.hpp>
#include <roomassign/model.hpp>
#include <roomassign/result_export.hpp>

namespace roomassign
{

// A normalized request together with the format it will be submitted as.
struct PreparedRequest
{
    DebateRequest request;
    Format        format = Format::Traditional;
};

/// Normalize `rows` and resolve the format (see resolve_format()).
/// Participants whose preference count differs from the first one are kept,
/// and a warning names them.
PreparedRequest prepare_request(const CellGrid& rows, std::optional<Format> requested = std::nullopt);

// decode_file() followed by prepare_request().
PreparedRequest load_request(const std::string& path, std::optional<Format> requested = std::nullopt);

struct ExportTargets
{
    bool          csv  = false;
    bool          xlsx = false;
    std::string   directory = ".";
    ExportOptions options;
};

/// Serialize `result` and write one file per selected kind into
/// `targets.directory`. Returns the written paths. Throws SourceError.
std::vector<std::string> write_exports(const ScheduleResult&                 result,
                                       Format                                format,
                                       const ExportTargets&                  targets,
                                       std::chrono::system_clock::time_point when);

// Example input sheet for `format`: header plus three participants.
CellGrid example_rows(Format format);

// Multi-line, human-readable rendering of a summary.
std::string describe_summary(const ResultSummary& summary, Format format);

}   // namespace roomassign
