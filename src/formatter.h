#pragma once

#include <string>

#include "units.h"

// Renders everything the command line prints on standard output
class Formatter {
public:
    // Shortest decimal text that reads back as exactly v, never in exponent form.
    // Example: 5.0 -> "5", 1e-7 -> "0.0000001", NaN -> "NaN"
    std::string formatNumber(double v) const;

    // "<value> <fromUnit> = <result> <toUnit>", units echoed as typed
    std::string formatResult(double value, const std::string& fromUnit,
                             double result, const std::string& toUnit) const;

    std::string formatVersion() const;
    std::string formatHelp(const std::string& program) const;
    std::string formatUnitList(const UnitRegistry& registry) const;
};
