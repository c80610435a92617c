#include <roomassign/normalize.hpp>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <limits>

#include <roomassign/errors.hpp>
#include <roomassign/logger.hpp>

namespace roomassign
{

namespace
{

bool is_group_header(const std::string& cell)
{
    static constexpr std::string_view GROUP = "group";
    if (cell.size() != GROUP.size())
        return false;
    for (size_t i = 0; i < cell.size(); ++i)
    {
        if (std::tolower(static_cast<unsigned char>(cell[i])) != GROUP[i])
            return false;
    }
    return true;
}

// Parses preference cells [first, last) of a trimmed row and imputes blanks.
std::vector<int> read_preferences(const std::vector<std::string>& values,
                                  size_t first,
                                  size_t last,
                                  size_t line)
{
    std::vector<std::optional<int>> provisional;
    provisional.reserve(last > first ? last - first : 0);

    for (size_t col = first; col < last; ++col)
    {
        const std::string& cell = values[col];
        if (cell.empty())
        {
            provisional.emplace_back(std::nullopt);
            continue;
        }
        auto rank = parse_rank(cell);
        if (!rank)
            throw CellParseError(line, col + 1, cell, values);
        provisional.emplace_back(*rank);
    }

    std::optional<int> highest;
    size_t             highest_col = first;
    bool               has_blank   = false;
    for (size_t k = 0; k < provisional.size(); ++k)
    {
        const auto& p = provisional[k];
        if (!p)
            has_blank = true;
        else if (!highest || *p > *highest)
        {
            highest     = p;
            highest_col = first + k;
        }
    }

    // Blanks are filled with highest + 1, which must still fit in an int.
    if (has_blank && highest && *highest == std::numeric_limits<int>::max())
        throw CellParseError(line, highest_col + 1, values[highest_col], values);
    const int fill = highest ? *highest + 1 : 1;

    std::vector<int> preferences;
    preferences.reserve(provisional.size());
    for (const auto& p : provisional)
        preferences.push_back(p.value_or(fill));
    return preferences;
}

}   // namespace

std::string trim(std::string_view text)
{
    size_t begin = 0;
    size_t end   = text.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(text[begin])))
        ++begin;
    while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1])))
        --end;
    return std::string(text.substr(begin, end - begin));
}

std::optional<int> parse_rank(std::string_view text)
{
    if (text.empty())
        return std::nullopt;

    // from_chars rejects a leading '+'
    std::string_view digits = text;
    if (digits.front() == '+')
    {
        digits.remove_prefix(1);
        if (digits.empty() || digits.front() == '-')
            return std::nullopt;
    }

    int value = 0;
    auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), value);
    if (ec != std::errc() || ptr != digits.data() + digits.size())
        return std::nullopt;
    return value;
}

std::vector<std::string> split_groups(std::string_view cell)
{
    std::vector<std::string> groups;
    size_t start = 0;
    while (start <= cell.size())
    {
        size_t end = cell.find(';', start);
        if (end == std::string_view::npos)
            end = cell.size();

        std::string token = trim(cell.substr(start, end - start));
        if (!token.empty() && std::find(groups.begin(), groups.end(), token) == groups.end())
            groups.push_back(std::move(token));

        start = end + 1;
    }
    return groups;
}

DebateRequest normalize_rows(const CellGrid& rows)
{
    if (rows.size() < 2)
        throw StructuralError(rows.size(),
                              "Data must have at least a header row and one data row");

    std::vector<std::string> headers;
    headers.reserve(rows[0].size());
    for (const auto& h : rows[0])
        headers.push_back(trim(h));

    if (headers.empty())
        throw StructuralError(rows.size(), "Header row is empty");

    const bool has_group_column = is_group_header(headers.back());

    DebateRequest request;
    for (size_t i = 1; i < rows.size(); ++i)
    {
        const size_t line = i + 1;

        std::vector<std::string> values;
        values.reserve(rows[i].size());
        for (const auto& cell : rows[i])
            values.push_back(trim(cell));

        if (values.empty() || values[0].empty())
            continue;

        if (values.size() < 2)
            throw RowShapeError(line, values);

        Participant participant;
        participant.name = values[0];

        if (has_group_column)
        {
            participant.preferences = read_preferences(values, 1, values.size() - 1, line);
            participant.groups      = split_groups(values.back());
        }
        else
        {
            participant.preferences = read_preferences(values, 1, values.size(), line);
        }

        request.participants.push_back(std::move(participant));
    }

    if (request.participants.empty())
        throw EmptyDatasetError();

    ROOMASSIGN_LOG_DEBUG("normalize",
                         "Parsed {} participants from {} rows (group column: {})",
                         request.participants.size(),
                         rows.size(),
                         has_group_column);
    return request;
}

}   // namespace roomassign
