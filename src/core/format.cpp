#include <roomassign/format.hpp>

#include <array>
#include <string>

#include <roomassign/errors.hpp>

namespace roomassign
{

namespace
{

constexpr std::array<std::string_view, 6> TRADITIONAL_ROLES = {
    "1st Aff", "1st Neg", "2nd Aff", "2nd Neg", "3rd Aff", "3rd Neg"};

constexpr std::array<std::string_view, 8> BP_ROLES = {
    "PM", "LO", "DPM", "DLO", "GM", "MO", "GW", "OW"};

}   // namespace

std::span<const std::string_view> role_names(Format format)
{
    switch (format)
    {
        case Format::Traditional:
            return TRADITIONAL_ROLES;
        case Format::BritishParliamentary:
            return BP_ROLES;
    }
    return {};
}

std::size_t role_count(Format format)
{
    return role_names(format).size();
}

std::string_view format_tag(Format format)
{
    switch (format)
    {
        case Format::Traditional:
            return "traditional";
        case Format::BritishParliamentary:
            return "bp";
    }
    return "";
}

std::string_view format_display_name(Format format)
{
    switch (format)
    {
        case Format::Traditional:
            return "Traditional";
        case Format::BritishParliamentary:
            return "British Parliamentary";
    }
    return "";
}

std::string_view endpoint_path(Format format)
{
    switch (format)
    {
        case Format::Traditional:
            return "/traditional";
        case Format::BritishParliamentary:
            return "/bp";
    }
    return "";
}

std::optional<Format> parse_format_tag(std::string_view tag)
{
    if (tag == "traditional")
        return Format::Traditional;
    if (tag == "bp")
        return Format::BritishParliamentary;
    return std::nullopt;
}

std::optional<Format> format_for_length(std::size_t length)
{
    if (length == BP_ROLES.size())
        return Format::BritishParliamentary;
    if (length == TRADITIONAL_ROLES.size())
        return Format::Traditional;
    return std::nullopt;
}

Format detect_format(const DebateRequest& request)
{
    if (request.participants.empty())
        throw EmptyDatasetError();

    const std::size_t length = request.participants.front().preferences.size();
    auto format = format_for_length(length);
    if (!format)
        throw FormatMismatchError(length);
    return *format;
}

Format resolve_format(const DebateRequest& request, std::optional<Format> requested)
{
    Format detected = detect_format(request);
    if (requested && *requested != detected)
    {
        const std::size_t length = request.participants.front().preferences.size();
        throw FormatMismatchError(
            length,
            std::string(format_display_name(*requested)) + " requires "
                + std::to_string(role_count(*requested)) + " preferences, but "
                + std::to_string(length) + " were detected.");
    }
    return detected;
}

std::vector<std::size_t> find_length_mismatches(const DebateRequest& request)
{
    std::vector<std::size_t> mismatches;
    if (request.participants.empty())
        return mismatches;

    const std::size_t expected = request.participants.front().preferences.size();
    for (std::size_t i = 1; i < request.participants.size(); ++i)
    {
        if (request.participants[i].preferences.size() != expected)
            mismatches.push_back(i);
    }
    return mismatches;
}

}   // namespace roomassign
