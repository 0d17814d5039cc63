// converter.cpp: core implementation for unit conversion

#include "converter.h"

const char* warningMessage(ConversionWarning warning) {
    switch (warning) {
        case ConversionWarning::NegativeLength:
            return "Negative length doesn't make physical sense";
    }
    return "";
}

// ---------------- ConversionService -----------------

ConversionService::ConversionService(const UnitRegistry& registry)
    : registry_(registry) {}

ConversionResult ConversionService::convert(double value, const Unit& from, const Unit& to) const {
    if (from.category != to.category) {
        throw CategoryMismatchError(from.category, to.category);
    }

    ConversionResult result{ 0.0, {} };
    validate(value, from, result.warnings);

    // Convert to base, then from base to target
    double baseValue = from.toBase(value);
    result.value = to.fromBase(baseValue);
    return result;
}

ConversionResult ConversionService::convert(double value, const std::string& fromUnit, const std::string& toUnit) const {
    const Unit* from = registry_.lookup(fromUnit);
    if (from == nullptr) {
        throw UnknownUnitError(UnknownUnitError::Which::From, fromUnit);
    }
    const Unit* to = registry_.lookup(toUnit);
    if (to == nullptr) {
        throw UnknownUnitError(UnknownUnitError::Which::To, toUnit);
    }
    return convert(value, *from, *to);
}

void ConversionService::validate(double value, const Unit& from, std::vector<ConversionWarning>& warnings) const {
    switch (from.category) {
        case UnitCategory::Length:
            if (value < 0.0) {
                warnings.push_back(ConversionWarning::NegativeLength);
            }
            break;
        case UnitCategory::Temperature:
            // Checked on the input unit's own scale; the limit itself is valid
            if (value < from.absoluteZero) {
                throw BelowAbsoluteZeroError(from.name, value, from.absoluteZero);
            }
            break;
        case UnitCategory::Mass:
            break;
    }
}
