#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <roomassign/model.hpp>

namespace roomassign
{

/**
 * @brief Convert a decoded grid into a validated participant list.
 *
 * Row 0 is the header: `Name, <role>..., [Group]`. A trailing header cell
 * equal to "group" (any case) makes the last cell of every data row a
 * `;`-separated group list. Data rows with an empty first cell are skipped.
 * Blank preference cells in a row all receive max(explicit) + 1, or 1 if
 * the row has no explicit value.
 *
 * Line numbers in errors are 1-based grid row positions.
 *
 * @throws StructuralError, RowShapeError, CellParseError, EmptyDatasetError
 */
DebateRequest normalize_rows(const CellGrid& rows);

// Split a group cell on ';', trimming tokens and dropping empty or repeated ones.
std::vector<std::string> split_groups(std::string_view cell);

// Strict base-10 integer: optional sign followed by digits, must fit int.
std::optional<int> parse_rank(std::string_view text);

std::string trim(std::string_view text);

}   // namespace roomassign
