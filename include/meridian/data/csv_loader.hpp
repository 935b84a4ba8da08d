#pragma once

#include <meridian/core/market_data.hpp>
#include <cstdint>
#include <istream>
#include <optional>
#include <string>

namespace meridian::data {

/// Loads OHLCV bars from CSV.
/// Header row required; columns are matched case-insensitively:
/// timestamp|date|datetime|time, open, high, low, close [, volume].
/// Timestamps may be epoch seconds, epoch milliseconds, or
/// "YYYY-MM-DD", "YYYY-MM-DD HH:MM[:SS]", "YYYY-MM-DDTHH:MM[:SS][Z]" in UTC.
class CsvLoader {
public:
    /// Throws ValidationError if the file cannot be opened, a row is malformed,
    /// or the resulting series fails validation. Rows are sorted by timestamp.
    static core::PriceSeries load(const std::string& path);

    static core::PriceSeries parse(std::istream& in, const std::string& source = "<stream>");

    /// Epoch seconds for a timestamp field, std::nullopt if unparseable
    static std::optional<int64_t> parse_timestamp(const std::string& field);
};

} // namespace meridian::data
