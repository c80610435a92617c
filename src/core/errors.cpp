#include <roomassign/errors.hpp>

#include <utility>

namespace roomassign
{

namespace
{

std::string join_cells(const std::vector<std::string>& cells)
{
    std::string out;
    for (size_t i = 0; i < cells.size(); ++i)
    {
        if (i > 0)
            out += ", ";
        out += cells[i];
    }
    return out;
}

}   // namespace

const char* error_kind_name(ErrorKind kind)
{
    switch (kind)
    {
        case ErrorKind::Structural:
            return "structural";
        case ErrorKind::RowShape:
            return "row-shape";
        case ErrorKind::CellParse:
            return "cell-parse";
        case ErrorKind::FormatMismatch:
            return "format-mismatch";
        case ErrorKind::EmptyDataset:
            return "empty-dataset";
        case ErrorKind::Transport:
            return "transport";
        case ErrorKind::Source:
            return "source";
    }
    return "unknown";
}

StructuralError::StructuralError(std::size_t row_count, const std::string& message)
    : Error(ErrorKind::Structural, message), row_count_(row_count)
{
}

RowShapeError::RowShapeError(std::size_t line, std::vector<std::string> cells)
    : Error(ErrorKind::RowShape,
            "Invalid row at line " + std::to_string(line)
                + ": must have at least name and one preference\nLine content: \""
                + join_cells(cells) + "\""),
      line_(line),
      cells_(std::move(cells))
{
}

CellParseError::CellParseError(std::size_t line,
                               std::size_t column,
                               std::string text,
                               std::vector<std::string> cells)
    : Error(ErrorKind::CellParse,
            "Error at line " + std::to_string(line) + ": Invalid preference value \"" + text
                + "\" at column " + std::to_string(column) + "\nLine content: \""
                + join_cells(cells) + "\""),
      line_(line),
      column_(column),
      text_(std::move(text)),
      cells_(std::move(cells))
{
}

FormatMismatchError::FormatMismatchError(std::size_t detected_length)
    : FormatMismatchError(detected_length,
                          "Invalid preference count: " + std::to_string(detected_length)
                              + ". Expected 6 (Traditional) or 8 (British Parliamentary).")
{
}

FormatMismatchError::FormatMismatchError(std::size_t detected_length, const std::string& message)
    : Error(ErrorKind::FormatMismatch, message), detected_length_(detected_length)
{
}

EmptyDatasetError::EmptyDatasetError()
    : Error(ErrorKind::EmptyDataset, "No valid participants found in data")
{
}

TransportError::TransportError(int status, std::string detail)
    : Error(ErrorKind::Transport,
            status > 0 ? detail + " (HTTP " + std::to_string(status) + ")" : detail),
      status_(status),
      detail_(std::move(detail))
{
}

SourceError::SourceError(std::string path, std::string reason)
    : Error(ErrorKind::Source, path.empty() ? reason : path + ": " + reason),
      path_(std::move(path)),
      reason_(std::move(reason))
{
}

}   // namespace roomassign
