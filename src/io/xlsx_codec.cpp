#include <roomassign/grid.hpp>

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <cstring>
#include <iterator>
#include <limits>
#include <miniz.h>
#include <string>
#include <tinyxml2.h>

#include <roomassign/errors.hpp>
#include <roomassign/logger.hpp>

namespace roomassign
{

namespace
{

// ─── Zip container ───────────────────────────────────────────────────────────

// Read-only view of an in-memory zip archive. The caller keeps the bytes alive.
class ZipReader
{
   public:
    explicit ZipReader(std::span<const uint8_t> bytes)
    {
        std::memset(&archive_, 0, sizeof(archive_));
        if (!mz_zip_reader_init_mem(&archive_, bytes.data(), bytes.size(), 0))
            throw SourceError("", "Not a valid XLSX workbook (zip container unreadable)");
        open_ = true;
    }

    ~ZipReader()
    {
        if (open_)
            mz_zip_reader_end(&archive_);
    }

    ZipReader(const ZipReader&)            = delete;
    ZipReader& operator=(const ZipReader&) = delete;

    // Empty string when the entry is missing.
    std::string read(const std::string& name) const
    {
        const int index = mz_zip_reader_locate_file(&archive_, name.c_str(), nullptr, 0);
        if (index < 0)
            return {};
        size_t size = 0;
        void*  ptr  = mz_zip_reader_extract_to_heap(&archive_, static_cast<mz_uint>(index), &size, 0);
        if (!ptr)
            throw SourceError("", "Corrupt workbook entry: " + name);
        std::string data(static_cast<const char*>(ptr), size);
        mz_free(ptr);
        return data;
    }

   private:
    mutable mz_zip_archive archive_;
    bool                   open_ = false;
};

class ZipWriter
{
   public:
    ZipWriter()
    {
        std::memset(&archive_, 0, sizeof(archive_));
        if (!mz_zip_writer_init_heap(&archive_, 0, 0))
            throw SourceError("", "Cannot initialise zip writer");
        open_ = true;
    }

    ~ZipWriter()
    {
        if (open_)
            mz_zip_writer_end(&archive_);
    }

    ZipWriter(const ZipWriter&)            = delete;
    ZipWriter& operator=(const ZipWriter&) = delete;

    void add(const std::string& name, const std::string& data)
    {
        if (!mz_zip_writer_add_mem(&archive_, name.c_str(), data.data(), data.size(),
                                   MZ_DEFAULT_COMPRESSION))
            throw SourceError("", "Cannot add workbook entry: " + name);
    }

    std::vector<uint8_t> finish()
    {
        void*  buf  = nullptr;
        size_t size = 0;
        if (!mz_zip_writer_finalize_heap_archive(&archive_, &buf, &size))
            throw SourceError("", "Cannot finalise workbook archive");
        // Ownership of the heap buffer passes to us.
        std::vector<uint8_t> out(static_cast<const uint8_t*>(buf),
                                 static_cast<const uint8_t*>(buf) + size);
        mz_free(buf);
        return out;
    }

   private:
    mz_zip_archive archive_;
    bool           open_ = false;
};

// ─── XML helpers ─────────────────────────────────────────────────────────────

constexpr const char* NS_MAIN = "http://schemas.openxmlformats.org/spreadsheetml/2006/main";
constexpr const char* NS_REL =
    "http://schemas.openxmlformats.org/officeDocument/2006/relationships";
constexpr const char* NS_PKG_REL = "http://schemas.openxmlformats.org/package/2006/relationships";

// Element name without a namespace prefix ("x:row" -> "row").
std::string_view local_name(const char* name)
{
    std::string_view n(name ? name : "");
    auto colon = n.find(':');
    return colon == std::string_view::npos ? n : n.substr(colon + 1);
}

const tinyxml2::XMLElement* first_child(const tinyxml2::XMLElement* parent, std::string_view name)
{
    if (!parent)
        return nullptr;
    for (auto* e = parent->FirstChildElement(); e; e = e->NextSiblingElement())
    {
        if (local_name(e->Name()) == name)
            return e;
    }
    return nullptr;
}

const tinyxml2::XMLElement* next_sibling(const tinyxml2::XMLElement* elem, std::string_view name)
{
    for (auto* e = elem->NextSiblingElement(); e; e = e->NextSiblingElement())
    {
        if (local_name(e->Name()) == name)
            return e;
    }
    return nullptr;
}

void parse_xml(tinyxml2::XMLDocument& doc, const std::string& xml, const std::string& part)
{
    if (doc.Parse(xml.c_str(), xml.size()) != tinyxml2::XML_SUCCESS || !doc.RootElement())
        throw SourceError("", "Malformed workbook part: " + part);
}

// Concatenated text of every <t> descendant (rich text runs included).
std::string collect_text(const tinyxml2::XMLElement* elem)
{
    std::string out;
    for (auto* child = elem->FirstChildElement(); child; child = child->NextSiblingElement())
    {
        auto name = local_name(child->Name());
        if (name == "t")
        {
            if (const char* text = child->GetText())
                out += text;
        }
        else if (name == "r")
        {
            out += collect_text(child);
        }
    }
    return out;
}

std::vector<std::string> read_shared_strings(const ZipReader& zip)
{
    std::vector<std::string> values;
    const std::string        xml = zip.read("xl/sharedStrings.xml");
    if (xml.empty())
        return values;

    tinyxml2::XMLDocument doc;
    parse_xml(doc, xml, "xl/sharedStrings.xml");
    for (auto* si = first_child(doc.RootElement(), "si"); si; si = next_sibling(si, "si"))
        values.push_back(collect_text(si));
    return values;
}

// Attribute "<prefix>:id" on a <sheet> element, whatever the prefix.
std::string relationship_id(const tinyxml2::XMLElement* sheet)
{
    for (auto* attr = sheet->FirstAttribute(); attr; attr = attr->Next())
    {
        std::string_view name(attr->Name());
        if (name.find(':') != std::string_view::npos && local_name(attr->Name()) == "id")
            return attr->Value();
    }
    return {};
}

// Path of the first worksheet listed in the workbook.
std::string first_sheet_path(const ZipReader& zip)
{
    static const std::string FALLBACK = "xl/worksheets/sheet1.xml";

    const std::string workbook_xml = zip.read("xl/workbook.xml");
    if (workbook_xml.empty())
        throw SourceError("", "Workbook has no xl/workbook.xml part");

    tinyxml2::XMLDocument workbook;
    parse_xml(workbook, workbook_xml, "xl/workbook.xml");
    const auto* sheet = first_child(first_child(workbook.RootElement(), "sheets"), "sheet");
    if (!sheet)
        throw SourceError("", "Excel file must have at least one worksheet");

    const std::string rid      = relationship_id(sheet);
    const std::string rels_xml = zip.read("xl/_rels/workbook.xml.rels");
    if (rid.empty() || rels_xml.empty())
        return FALLBACK;

    tinyxml2::XMLDocument rels;
    parse_xml(rels, rels_xml, "xl/_rels/workbook.xml.rels");
    for (auto* rel = first_child(rels.RootElement(), "Relationship"); rel;
         rel       = next_sibling(rel, "Relationship"))
    {
        const char* id     = rel->Attribute("Id");
        const char* target = rel->Attribute("Target");
        if (!id || !target || rid != id)
            continue;
        std::string t(target);
        if (!t.empty() && t.front() == '/')
            return t.substr(1);
        return "xl/" + t;
    }
    return FALLBACK;
}

// "C12" -> column 2 (0-based), row 12 (1-based). Returns false on malformed refs.
// Largest worksheet Excel accepts: 1048576 rows by 16384 columns (XFD).
constexpr size_t MAX_SHEET_ROWS    = 1048576;
constexpr size_t MAX_SHEET_COLUMNS = 16384;

// Parses "B12" into a 0-based column and a 1-based row. Values past the sheet
// limits are clamped to limit + 1 so the caller can reject them.
bool parse_cell_ref(const char* ref, size_t& column, size_t& row)
{
    if (!ref)
        return false;
    size_t col = 0;
    size_t i   = 0;
    while (ref[i] >= 'A' && ref[i] <= 'Z')
    {
        col = std::min(col * 26 + static_cast<size_t>(ref[i] - 'A' + 1), MAX_SHEET_COLUMNS + 1);
        ++i;
    }
    if (i == 0 || ref[i] == '\0')
        return false;
    size_t r = 0;
    for (; ref[i] != '\0'; ++i)
    {
        if (ref[i] < '0' || ref[i] > '9')
            return false;
        r = std::min(r * 10 + static_cast<size_t>(ref[i] - '0'), MAX_SHEET_ROWS + 1);
    }
    column = col - 1;
    row    = r;
    return true;
}

std::string column_letters(size_t column)
{
    std::string letters;
    size_t      n = column + 1;
    while (n > 0)
    {
        const size_t rem = (n - 1) % 26;
        letters.insert(letters.begin(), static_cast<char>('A' + rem));
        n = (n - 1) / 26;
    }
    return letters;
}

// Numbers are stored as doubles; render integral values without a fraction.
std::string render_number(const char* text)
{
    if (!text)
        return {};
    char*        end   = nullptr;
    const double value = std::strtod(text, &end);
    if (end == text || *end != '\0' || !std::isfinite(value))
        return text;
    if (value == std::floor(value) && std::fabs(value) < 1e15)
        return std::to_string(static_cast<long long>(value));
    return text;
}

std::string read_cell(const tinyxml2::XMLElement* cell, const std::vector<std::string>& shared)
{
    const char* type  = cell->Attribute("t");
    const auto* value = first_child(cell, "v");
    const char* text  = value ? value->GetText() : nullptr;
    std::string_view t(type ? type : "n");

    if (t == "inlineStr")
    {
        const auto* is = first_child(cell, "is");
        return is ? collect_text(is) : std::string();
    }
    if (t == "s")
    {
        if (!text)
            return {};
        const long idx = std::strtol(text, nullptr, 10);
        if (idx < 0 || static_cast<size_t>(idx) >= shared.size())
            throw SourceError("", "Shared string index out of range: " + std::string(text));
        return shared[static_cast<size_t>(idx)];
    }
    if (t == "b")
        return text && std::strcmp(text, "1") == 0 ? "true" : "false";
    if (t == "n")
        return render_number(text);
    // "str" (formula result) and "e" (error) keep their literal value.
    return text ? text : "";
}

bool looks_numeric(const std::string& s)
{
    if (s.empty())
        return false;
    char* end = nullptr;
    std::strtod(s.c_str(), &end);
    return end == s.c_str() + s.size() && !std::isspace(static_cast<unsigned char>(s.front()));
}

std::string printed(tinyxml2::XMLPrinter& printer)
{
    // CStrSize() counts the terminating null.
    return std::string(printer.CStr(), static_cast<size_t>(printer.CStrSize() - 1));
}

}   // namespace

// ─── Decoding ────────────────────────────────────────────────────────────────

CellGrid XlsxDecoder::decode(std::span<const uint8_t> bytes) const
{
    ZipReader zip(bytes);

    const std::vector<std::string> shared     = read_shared_strings(zip);
    const std::string              sheet_path = first_sheet_path(zip);
    const std::string              sheet_xml  = zip.read(sheet_path);
    if (sheet_xml.empty())
        throw SourceError("", "Worksheet part missing: " + sheet_path);

    tinyxml2::XMLDocument doc;
    parse_xml(doc, sheet_xml, sheet_path);
    const auto* sheet_data = first_child(doc.RootElement(), "sheetData");

    CellGrid rows;
    if (!sheet_data)
        return rows;

    for (auto* row = first_child(sheet_data, "row"); row; row = next_sibling(row, "row"))
    {
        // Rows without "r" follow the previous one.
        const size_t row_number = row->UnsignedAttribute("r", static_cast<unsigned>(rows.size() + 1));
        if (row_number == 0 || row_number < rows.size() + 1)
            throw SourceError("", "Worksheet rows out of order at row " + std::to_string(row_number));
        if (row_number > MAX_SHEET_ROWS)
            throw SourceError("", "Worksheet row " + std::to_string(row_number)
                                      + " is past the last sheet row "
                                      + std::to_string(MAX_SHEET_ROWS));
        rows.resize(row_number - 1);

        CellRow cells;
        for (auto* cell = first_child(row, "c"); cell; cell = next_sibling(cell, "c"))
        {
            size_t column = cells.size();
            size_t ref_row = 0;
            if (cell->Attribute("r") && !parse_cell_ref(cell->Attribute("r"), column, ref_row))
                throw SourceError("", "Malformed cell reference: " + std::string(cell->Attribute("r")));
            if (column >= MAX_SHEET_COLUMNS)
                throw SourceError("", "Cell reference " + std::string(cell->Attribute("r"))
                                          + " is past the last sheet column");
            if (column < cells.size())
                throw SourceError("", "Worksheet cells out of order in row "
                                          + std::to_string(row_number));
            cells.resize(column);
            cells.push_back(read_cell(cell, shared));
        }

        while (!cells.empty() && cells.back().empty())
            cells.pop_back();
        rows.push_back(std::move(cells));
    }

    // Blank cells are not stored, so a row ending in an empty Group cell would
    // come back one column short. Pad non-empty rows to the header's width.
    auto header = std::find_if(rows.begin(), rows.end(), [](const CellRow& r) { return !r.empty(); });
    if (header != rows.end())
    {
        const size_t width = header->size();
        for (auto it = std::next(header); it != rows.end(); ++it)
        {
            if (!it->empty() && it->size() < width)
                it->resize(width);
        }
    }

    ROOMASSIGN_LOG_DEBUG("xlsx", "Decoded {} rows from {}", rows.size(), sheet_path);
    return rows;
}

// ─── Encoding ────────────────────────────────────────────────────────────────

XlsxEncoder::XlsxEncoder(std::string sheet_name, std::set<std::size_t> numeric_columns)
    : sheet_name_(std::move(sheet_name)), numeric_columns_(std::move(numeric_columns))
{
}

std::vector<uint8_t> XlsxEncoder::encode(const CellGrid& rows) const
{
    static const char* CONTENT_TYPES =
        "<?xml version=\"1.0\" encoding=\"UTF-8\" standalone=\"yes\"?>"
        "<Types xmlns=\"http://schemas.openxmlformats.org/package/2006/content-types\">"
        "<Default Extension=\"rels\" "
        "ContentType=\"application/vnd.openxmlformats-package.relationships+xml\"/>"
        "<Default Extension=\"xml\" ContentType=\"application/xml\"/>"
        "<Override PartName=\"/xl/workbook.xml\" "
        "ContentType=\"application/vnd.openxmlformats-officedocument.spreadsheetml.sheet.main+xml\"/>"
        "<Override PartName=\"/xl/worksheets/sheet1.xml\" "
        "ContentType=\"application/vnd.openxmlformats-officedocument.spreadsheetml.worksheet+xml\"/>"
        "</Types>";

    auto relationships = [](const char* type, const char* target)
    {
        tinyxml2::XMLPrinter p(nullptr, true);
        p.PushDeclaration("xml version=\"1.0\" encoding=\"UTF-8\" standalone=\"yes\"");
        p.OpenElement("Relationships");
        p.PushAttribute("xmlns", NS_PKG_REL);
        p.OpenElement("Relationship");
        p.PushAttribute("Id", "rId1");
        p.PushAttribute("Type", type);
        p.PushAttribute("Target", target);
        p.CloseElement();
        p.CloseElement();
        return printed(p);
    };

    tinyxml2::XMLPrinter workbook(nullptr, true);
    workbook.PushDeclaration("xml version=\"1.0\" encoding=\"UTF-8\" standalone=\"yes\"");
    workbook.OpenElement("workbook");
    workbook.PushAttribute("xmlns", NS_MAIN);
    workbook.PushAttribute("xmlns:r", NS_REL);
    workbook.OpenElement("sheets");
    workbook.OpenElement("sheet");
    workbook.PushAttribute("name", sheet_name_.c_str());
    workbook.PushAttribute("sheetId", 1);
    workbook.PushAttribute("r:id", "rId1");
    workbook.CloseElement();
    workbook.CloseElement();
    workbook.CloseElement();

    tinyxml2::XMLPrinter sheet(nullptr, true);
    sheet.PushDeclaration("xml version=\"1.0\" encoding=\"UTF-8\" standalone=\"yes\"");
    sheet.OpenElement("worksheet");
    sheet.PushAttribute("xmlns", NS_MAIN);
    sheet.OpenElement("sheetData");
    for (size_t r = 0; r < rows.size(); ++r)
    {
        sheet.OpenElement("row");
        sheet.PushAttribute("r", static_cast<unsigned>(r + 1));
        for (size_t c = 0; c < rows[r].size(); ++c)
        {
            const std::string& value = rows[r][c];
            if (value.empty())
                continue;

            const std::string ref = column_letters(c) + std::to_string(r + 1);
            sheet.OpenElement("c");
            sheet.PushAttribute("r", ref.c_str());
            if (numeric_columns_.count(c) && looks_numeric(value))
            {
                sheet.OpenElement("v");
                sheet.PushText(value.c_str());
                sheet.CloseElement();
            }
            else
            {
                sheet.PushAttribute("t", "inlineStr");
                sheet.OpenElement("is");
                sheet.OpenElement("t");
                sheet.PushAttribute("xml:space", "preserve");
                sheet.PushText(value.c_str());
                sheet.CloseElement();
                sheet.CloseElement();
            }
            sheet.CloseElement();
        }
        sheet.CloseElement();
    }
    sheet.CloseElement();
    sheet.CloseElement();

    ZipWriter zip;
    zip.add("[Content_Types].xml", CONTENT_TYPES);
    zip.add("_rels/.rels",
            relationships("http://schemas.openxmlformats.org/officeDocument/2006/relationships/"
                          "officeDocument",
                          "xl/workbook.xml"));
    zip.add("xl/workbook.xml", printed(workbook));
    zip.add("xl/_rels/workbook.xml.rels",
            relationships("http://schemas.openxmlformats.org/officeDocument/2006/relationships/"
                          "worksheet",
                          "worksheets/sheet1.xml"));
    zip.add("xl/worksheets/sheet1.xml", printed(sheet));
    return zip.finish();
}

}   // namespace roomassign
