#pragma once

#include <initializer_list>
#include <ostream>
#include <string_view>

namespace roast_control
{

/* Write one row of column names. */
inline void writeCsvHeader(std::ostream& out,
                           std::initializer_list<std::string_view> columns)
{
    std::string_view separator;
    for (const auto& column : columns)
    {
        out << separator << column;
        separator = ",";
    }
    out << "\n";
}

/* Write one row of values, each streamed with the stream's formatting. */
template <typename First, typename... Rest>
void writeCsvRow(std::ostream& out, const First& first, const Rest&... rest)
{
    out << first;
    ((out << "," << rest), ...);
    out << "\n";
}

} // namespace roast_control
