#include <roomassign/grid.hpp>

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <iterator>

#include <roomassign/errors.hpp>
#include <roomassign/logger.hpp>

namespace roomassign
{

namespace
{

std::string lower_extension(const std::string& path)
{
    auto ext = std::filesystem::path(path).extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext;
}

}   // namespace

std::unique_ptr<GridDecoder> decoder_for_path(const std::string& path)
{
    const std::string ext = lower_extension(path);
    if (ext == ".csv")
        return std::make_unique<CsvDecoder>();
    if (ext == ".xlsx" || ext == ".xlsm")
        return std::make_unique<XlsxDecoder>();
    if (ext == ".xls" || ext == ".xlsb")
        throw SourceError(path,
                          "Binary Excel workbooks (" + ext
                              + ") are not supported; save the file as .xlsx or .csv");
    throw SourceError(path, "File must be a CSV (.csv) or Excel (.xlsx, .xlsm) file");
}

std::vector<uint8_t> read_file_bytes(const std::string& path)
{
    std::ifstream f(path, std::ios::binary);
    if (!f.is_open())
        throw SourceError(path, "Cannot open file");

    std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(f)),
                               std::istreambuf_iterator<char>());
    if (f.bad())
        throw SourceError(path, "Error reading file");
    return bytes;
}

void write_file_bytes(const std::string& path, std::span<const uint8_t> bytes)
{
    std::error_code ec;
    auto dir = std::filesystem::path(path).parent_path();
    if (!dir.empty())
        std::filesystem::create_directories(dir, ec);
    if (ec)
        throw SourceError(path, "Cannot create directory: " + ec.message());

    std::ofstream f(path, std::ios::binary | std::ios::trunc);
    if (!f.is_open())
        throw SourceError(path, "Cannot open file for writing");
    f.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    if (!f.good())
        throw SourceError(path, "Error writing file");
}

CellGrid decode_file(const std::string& path)
{
    auto decoder = decoder_for_path(path);
    auto bytes   = read_file_bytes(path);

    try
    {
        CellGrid rows = decoder->decode(bytes);
        ROOMASSIGN_LOG_INFO("grid", "Read {} rows from {} ({})", rows.size(), path, decoder->name());
        return rows;
    }
    catch (const SourceError& e)
    {
        // Decoders work on bytes and do not know the path.
        throw SourceError(path, e.reason());
    }
}

}   // namespace roomassign
