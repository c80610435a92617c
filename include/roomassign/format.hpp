#pragma once

#include <cstddef>
#include <optional>
#include <span>
#include <string_view>
#include <vector>

#include <roomassign/model.hpp>

namespace roomassign
{

// Supported debate formats. Closed set: each variant fixes its role slots.
enum class Format
{
    Traditional,
    BritishParliamentary
};

// Ordered role names, one per preference column.
std::span<const std::string_view> role_names(Format format);

// Number of role slots; also the expected number of people per room.
std::size_t role_count(Format format);

// Short tag used in endpoint paths, file names and on the command line ("traditional", "bp").
std::string_view format_tag(Format format);

// Human-readable name, e.g. "British Parliamentary".
std::string_view format_display_name(Format format);

// Scheduler endpoint path for this format ("/traditional", "/bp").
std::string_view endpoint_path(Format format);

// Inverse of format_tag(). Returns std::nullopt for unknown tags.
std::optional<Format> parse_format_tag(std::string_view tag);

// Format whose role count equals `length`, if any.
std::optional<Format> format_for_length(std::size_t length);

/// Classify a request by the preference length of its first participant.
/// Throws EmptyDatasetError for an empty request and FormatMismatchError for a
/// length other than 6 or 8. Other participants are not inspected.
Format detect_format(const DebateRequest& request);

/// Like detect_format(), but when `requested` is set it must agree with the
/// detected format; otherwise FormatMismatchError is thrown.
Format resolve_format(const DebateRequest& request, std::optional<Format> requested);

/// Indices of participants whose preference length differs from the first one's.
std::vector<std::size_t> find_length_mismatches(const DebateRequest& request);

}   // namespace roomassign
