#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <set>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include <roomassign/model.hpp>

namespace roomassign
{

// ─── Decoders ────────────────────────────────────────────────────────────────
// A decoder turns the raw bytes of one source file into a CellGrid.
// Failures are reported as SourceError.

class GridDecoder
{
   public:
    virtual ~GridDecoder() = default;

    virtual CellGrid decode(std::span<const uint8_t> bytes) const = 0;

    // Short name for logs ("csv", "xlsx").
    virtual std::string_view name() const = 0;
};

// Comma-separated text with double-quote escaping. Blank lines are kept as
// empty rows so row positions match file lines.
class CsvDecoder : public GridDecoder
{
   public:
    CellGrid         decode(std::span<const uint8_t> bytes) const override;
    std::string_view name() const override { return "csv"; }

    CellGrid decode_text(std::string_view text) const;
};

// OOXML workbook (.xlsx, .xlsm). Reads the first worksheet only.
class XlsxDecoder : public GridDecoder
{
   public:
    CellGrid         decode(std::span<const uint8_t> bytes) const override;
    std::string_view name() const override { return "xlsx"; }
};

// ─── Encoders ────────────────────────────────────────────────────────────────

class GridEncoder
{
   public:
    virtual ~GridEncoder() = default;

    virtual std::vector<uint8_t> encode(const CellGrid& rows) const = 0;

    // File extension including the dot.
    virtual std::string_view extension() const = 0;
};

class CsvEncoder : public GridEncoder
{
   public:
    std::vector<uint8_t> encode(const CellGrid& rows) const override;
    std::string_view     extension() const override { return ".csv"; }

    std::string encode_text(const CellGrid& rows) const;
};

class XlsxEncoder : public GridEncoder
{
   public:
    XlsxEncoder() = default;
    explicit XlsxEncoder(std::string sheet_name, std::set<std::size_t> numeric_columns = {});

    std::vector<uint8_t> encode(const CellGrid& rows) const override;
    std::string_view     extension() const override { return ".xlsx"; }

   private:
    std::string           sheet_name_ = "Sheet1";
    std::set<std::size_t> numeric_columns_;
};

// ─── File helpers ────────────────────────────────────────────────────────────

// Picks a decoder from the file extension (case-insensitive).
// Throws SourceError for unsupported extensions.
std::unique_ptr<GridDecoder> decoder_for_path(const std::string& path);

// Reads and decodes a file. Throws SourceError.
CellGrid decode_file(const std::string& path);

std::vector<uint8_t> read_file_bytes(const std::string& path);

// Writes bytes, creating parent directories. Throws SourceError.
void write_file_bytes(const std::string& path, std::span<const uint8_t> bytes);

}   // namespace roomassign
