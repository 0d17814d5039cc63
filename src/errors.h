#pragma once

#include <stdexcept>
#include <string>

#include "units.h"

// Wrong number of command-line arguments for a conversion
class ArgumentCountError : public std::invalid_argument {
public:
    explicit ArgumentCountError(size_t count)
        : std::invalid_argument("expected 3 arguments, got " + std::to_string(count)),
          count_(count) {}

    size_t count() const { return count_; }

private:
    size_t count_;
};

// The value argument is not a floating-point number
class NumberParseError : public std::invalid_argument {
public:
    explicit NumberParseError(const std::string& text)
        : std::invalid_argument("not a valid number: '" + text + "'"),
          text_(text) {}

    const std::string& text() const { return text_; }

private:
    std::string text_;
};

// A unit name or alias that the registry does not know
class UnknownUnitError : public std::invalid_argument {
public:
    enum class Which { From, To };

    UnknownUnitError(Which which, const std::string& unitName)
        : std::invalid_argument("unknown unit: " + unitName),
          which_(which),
          unitName_(unitName) {}

    Which which() const { return which_; }
    const std::string& unitName() const { return unitName_; }

private:
    Which which_;
    std::string unitName_;
};

// Source and target units belong to different categories
class CategoryMismatchError : public std::invalid_argument {
public:
    CategoryMismatchError(UnitCategory fromCategory, UnitCategory toCategory)
        : std::invalid_argument(std::string("cannot convert ") + categoryName(fromCategory) +
                                " to " + categoryName(toCategory)),
          fromCategory_(fromCategory),
          toCategory_(toCategory) {}

    UnitCategory fromCategory() const { return fromCategory_; }
    UnitCategory toCategory() const { return toCategory_; }

private:
    UnitCategory fromCategory_;
    UnitCategory toCategory_;
};

// Temperature input below absolute zero on its own scale
class BelowAbsoluteZeroError : public std::domain_error {
public:
    BelowAbsoluteZeroError(const std::string& unitName, double value, double absoluteZero)
        : std::domain_error("temperature below absolute zero: " + std::to_string(value) + " " + unitName),
          unitName_(unitName),
          value_(value),
          absoluteZero_(absoluteZero) {}

    const std::string& unitName() const { return unitName_; }
    double value() const { return value_; }
    double absoluteZero() const { return absoluteZero_; }

private:
    std::string unitName_;
    double value_;
    double absoluteZero_;
};
