#include <roomassign/grid.hpp>

#include <roomassign/errors.hpp>

namespace roomassign
{

namespace
{

bool needs_quotes(const std::string& field)
{
    if (field.empty())
        return false;
    if (field.front() == ' ' || field.back() == ' ')
        return true;
    return field.find_first_of(",\"\r\n") != std::string::npos;
}

}   // namespace

// ─── Decoding ────────────────────────────────────────────────────────────────

CellGrid CsvDecoder::decode(std::span<const uint8_t> bytes) const
{
    std::string_view text(reinterpret_cast<const char*>(bytes.data()), bytes.size());
    return decode_text(text);
}

CellGrid CsvDecoder::decode_text(std::string_view text) const
{
    if (text.starts_with("\xEF\xBB\xBF"))
        text.remove_prefix(3);

    CellGrid rows;
    CellRow  row;
    std::string field;
    bool in_quotes     = false;
    bool field_started = false;   // current record has content or a delimiter
    size_t line        = 1;
    size_t quote_line  = 0;

    auto end_field = [&]()
    {
        row.push_back(std::move(field));
        field.clear();
    };
    auto end_record = [&]()
    {
        if (field_started)
            end_field();
        rows.push_back(std::move(row));
        row.clear();
        field_started = false;
    };

    for (size_t i = 0; i < text.size(); ++i)
    {
        const char c = text[i];

        if (in_quotes)
        {
            if (c == '"')
            {
                if (i + 1 < text.size() && text[i + 1] == '"')
                {
                    field += '"';
                    ++i;
                }
                else
                {
                    in_quotes = false;
                }
            }
            else
            {
                if (c == '\n')
                    ++line;
                field += c;
            }
            continue;
        }

        switch (c)
        {
            case '"':
                field_started = true;
                // Opening quote only at the start of a field (after optional
                // padding); elsewhere it is literal.
                if (field.find_first_not_of(" \t") == std::string::npos)
                {
                    field.clear();
                    in_quotes  = true;
                    quote_line = line;
                }
                else
                {
                    field += c;
                }
                break;
            case ',':
                field_started = true;
                end_field();
                break;
            case '\r':
                if (i + 1 < text.size() && text[i + 1] == '\n')
                    ++i;
                ++line;
                end_record();
                break;
            case '\n':
                ++line;
                end_record();
                break;
            default:
                field_started = true;
                field += c;
                break;
        }
    }

    if (in_quotes)
        throw SourceError("",
                          "Unterminated quoted field starting at line "
                              + std::to_string(quote_line));

    // A trailing record terminator does not open a new row.
    if (field_started)
        end_record();

    return rows;
}

// ─── Encoding ────────────────────────────────────────────────────────────────

std::string CsvEncoder::encode_text(const CellGrid& rows) const
{
    std::string out;
    for (size_t r = 0; r < rows.size(); ++r)
    {
        if (r > 0)
            out += '\n';

        const auto& row = rows[r];
        for (size_t c = 0; c < row.size(); ++c)
        {
            if (c > 0)
                out += ',';

            const auto& field = row[c];
            if (!needs_quotes(field))
            {
                out += field;
                continue;
            }
            out += '"';
            for (char ch : field)
            {
                if (ch == '"')
                    out += '"';
                out += ch;
            }
            out += '"';
        }
    }
    return out;
}

std::vector<uint8_t> CsvEncoder::encode(const CellGrid& rows) const
{
    std::string text = encode_text(rows);
    return std::vector<uint8_t>(text.begin(), text.end());
}

}   // namespace roomassign
