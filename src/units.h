#pragma once

#include <string>
#include <vector>
#include <utility>

enum class UnitCategory {
    Length,
    Temperature,
    Mass
};

// Display name of a category, e.g. "Length"
const char* categoryName(UnitCategory category);

// Core domain type: one unit and how it maps onto its category's base unit
// (meter for Length, Celsius for Temperature, kilogram for Mass)
struct Unit {
    using Transform = double (*)(double);

    std::string name;                 // Canonical symbol, e.g. "km"
    std::vector<std::string> aliases; // e.g. "kilometer", "kilometres"
    UnitCategory category;
    Transform toBase;                 // value in this unit -> value in base unit
    Transform fromBase;               // value in base unit -> value in this unit
    double absoluteZero;              // lowest valid value on this unit's own scale; -inf if unbounded

    // Case-insensitive match against the name or any alias
    bool matches(const std::string& input) const;
};

struct UnitGroup {
    UnitCategory category;
    std::vector<const Unit*> units;
};

// Read-only table of the supported units
class UnitRegistry {
public:
    // Process-wide registry holding the built-in units
    static const UnitRegistry& builtin();

    explicit UnitRegistry(std::vector<Unit> units);

    const Unit* lookup(const std::string& input) const; // nullptr if unknown
    bool has(const std::string& input) const;
    const Unit& get(const std::string& input) const;    // throws std::out_of_range if not found

    const std::vector<Unit>& units() const;

    // Groups in display order Length, Temperature, Mass; units keep table order
    std::vector<UnitGroup> listByCategory() const;

private:
    std::vector<Unit> units_;
};
