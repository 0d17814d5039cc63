#pragma once

#include <string>
#include <vector>

#include "errors.h"
#include "units.h"

// Non-fatal findings raised while validating a conversion input
enum class ConversionWarning {
    NegativeLength
};

const char* warningMessage(ConversionWarning warning);

struct ConversionResult {
    double value;
    std::vector<ConversionWarning> warnings;
};

// Performs conversions via the category's base unit
class ConversionService {
public:
    explicit ConversionService(const UnitRegistry& registry);

    // Checks that both units share a category and that the input is physically valid,
    // then computes to.fromBase(from.toBase(value)).
    // throws CategoryMismatchError, BelowAbsoluteZeroError
    ConversionResult convert(double value, const Unit& from, const Unit& to) const;

    // Resolves the unit names (source first) and converts.
    // throws UnknownUnitError in addition to the above
    ConversionResult convert(double value, const std::string& fromUnit, const std::string& toUnit) const;

private:
    void validate(double value, const Unit& from, std::vector<ConversionWarning>& warnings) const;

    const UnitRegistry& registry_;
};
