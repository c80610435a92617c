#pragma once

#include <array>
#include <cstddef>
#include <stdexcept>
#include <string>
#include <vector>

namespace roomassign
{

enum class ErrorKind
{
    Structural,
    RowShape,
    CellParse,
    FormatMismatch,
    EmptyDataset,
    Transport,
    Source
};

const char* error_kind_name(ErrorKind kind);

// Base of every error raised while building or submitting a request.
// Callers branch on kind() and downcast for the contextual fields.
class Error : public std::runtime_error
{
   public:
    Error(ErrorKind kind, const std::string& message) : std::runtime_error(message), kind_(kind)
    {
    }

    ErrorKind kind() const noexcept { return kind_; }

   private:
    ErrorKind kind_;
};

// Grid has no header row, no data row, or an empty header.
class StructuralError : public Error
{
   public:
    StructuralError(std::size_t row_count, const std::string& message);

    std::size_t row_count() const noexcept { return row_count_; }

   private:
    std::size_t row_count_;
};

// A data row lacks the name + preference cells.
class RowShapeError : public Error
{
   public:
    RowShapeError(std::size_t line, std::vector<std::string> cells);

    std::size_t                     line() const noexcept { return line_; }
    const std::vector<std::string>& cells() const noexcept { return cells_; }

   private:
    std::size_t              line_;
    std::vector<std::string> cells_;
};

// A preference cell is neither blank nor a base-10 integer.
class CellParseError : public Error
{
   public:
    CellParseError(std::size_t line,
                   std::size_t column,
                   std::string text,
                   std::vector<std::string> cells);

    std::size_t                     line() const noexcept { return line_; }
    std::size_t                     column() const noexcept { return column_; }
    const std::string&              text() const noexcept { return text_; }
    const std::vector<std::string>& cells() const noexcept { return cells_; }

   private:
    std::size_t              line_;
    std::size_t              column_;
    std::string              text_;
    std::vector<std::string> cells_;
};

// Preference-list length does not map to a supported format.
class FormatMismatchError : public Error
{
   public:
    static constexpr std::array<std::size_t, 2> ACCEPTED_LENGTHS = {6, 8};

    explicit FormatMismatchError(std::size_t detected_length);
    FormatMismatchError(std::size_t detected_length, const std::string& message);

    std::size_t detected_length() const noexcept { return detected_length_; }

   private:
    std::size_t detected_length_;
};

class EmptyDatasetError : public Error
{
   public:
    EmptyDatasetError();
};

// Scheduler call failed. status() is 0 when no HTTP response was received.
class TransportError : public Error
{
   public:
    static constexpr const char* GENERIC_DETAIL = "Failed to process debate assignment";

    TransportError(int status, std::string detail);

    int                status() const noexcept { return status_; }
    const std::string& detail() const noexcept { return detail_; }

   private:
    int         status_;
    std::string detail_;
};

// Input or output file could not be read, written or decoded.
class SourceError : public Error
{
   public:
    SourceError(std::string path, std::string reason);

    const std::string& path() const noexcept { return path_; }
    const std::string& reason() const noexcept { return reason_; }

   private:
    std::string path_;
    std::string reason_;
};

}   // namespace roomassign
