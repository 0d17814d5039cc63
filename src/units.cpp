// units.cpp: built-in unit table and lookup

#include "units.h"

#include <cctype>
#include <limits>
#include <stdexcept>

namespace {
    const double UNBOUNDED = -std::numeric_limits<double>::infinity();

    // Absolute zero on each temperature scale
    constexpr double CELSIUS_ABSOLUTE_ZERO = -273.15;
    constexpr double FAHRENHEIT_ABSOLUTE_ZERO = -459.67;
    constexpr double KELVIN_ABSOLUTE_ZERO = 0.0;

    bool equalsIgnoreCase(const std::string& a, const std::string& b) {
        if (a.size() != b.size()) {
            return false;
        }
        for (size_t i = 0; i < a.size(); ++i) {
            if (std::tolower(static_cast<unsigned char>(a[i])) != std::tolower(static_cast<unsigned char>(b[i]))) {
                return false;
            }
        }
        return true;
    }

    std::vector<Unit> builtinUnits() {
        return {
            // ---------------- Length (base: meter) -----------------
            Unit{ "km", { "kilometer", "kilometers", "kilometre", "kilometres" }, UnitCategory::Length,
                  [](double v) { return v * 1000.0; },
                  [](double v) { return v / 1000.0; }, UNBOUNDED },
            Unit{ "m", { "meter", "meters", "metre", "metres" }, UnitCategory::Length,
                  [](double v) { return v; },
                  [](double v) { return v; }, UNBOUNDED },
            Unit{ "cm", { "centimeter", "centimeters", "centimetre", "centimetres" }, UnitCategory::Length,
                  [](double v) { return v * 0.01; },
                  [](double v) { return v / 0.01; }, UNBOUNDED },
            Unit{ "mm", { "millimeter", "millimeters", "millimetre", "millimetres" }, UnitCategory::Length,
                  [](double v) { return v * 0.001; },
                  [](double v) { return v / 0.001; }, UNBOUNDED },
            Unit{ "mi", { "mile", "miles" }, UnitCategory::Length,
                  [](double v) { return v * 1609.344; },
                  [](double v) { return v / 1609.344; }, UNBOUNDED },
            Unit{ "yd", { "yard", "yards" }, UnitCategory::Length,
                  [](double v) { return v * 0.9144; },
                  [](double v) { return v / 0.9144; }, UNBOUNDED },
            Unit{ "ft", { "foot", "feet" }, UnitCategory::Length,
                  [](double v) { return v * 0.3048; },
                  [](double v) { return v / 0.3048; }, UNBOUNDED },
            Unit{ "in", { "inch", "inches" }, UnitCategory::Length,
                  [](double v) { return v * 0.0254; },
                  [](double v) { return v / 0.0254; }, UNBOUNDED },

            // ---------------- Temperature (base: Celsius) -----------------
            Unit{ "C", { "celsius", "centigrade" }, UnitCategory::Temperature,
                  [](double v) { return v; },
                  [](double v) { return v; }, CELSIUS_ABSOLUTE_ZERO },
            Unit{ "F", { "fahrenheit" }, UnitCategory::Temperature,
                  [](double v) { return (v - 32.0) * 5.0 / 9.0; },
                  [](double v) { return v * 9.0 / 5.0 + 32.0; }, FAHRENHEIT_ABSOLUTE_ZERO },
            Unit{ "K", { "kelvin" }, UnitCategory::Temperature,
                  [](double v) { return v - 273.15; },
                  [](double v) { return v + 273.15; }, KELVIN_ABSOLUTE_ZERO },

            // ---------------- Mass (base: kilogram) -----------------
            Unit{ "kg", { "kilogram", "kilograms" }, UnitCategory::Mass,
                  [](double v) { return v; },
                  [](double v) { return v; }, UNBOUNDED },
            Unit{ "g", { "gram", "grams" }, UnitCategory::Mass,
                  [](double v) { return v * 0.001; },
                  [](double v) { return v / 0.001; }, UNBOUNDED },
            Unit{ "mg", { "milligram", "milligrams" }, UnitCategory::Mass,
                  [](double v) { return v * 0.000001; },
                  [](double v) { return v / 0.000001; }, UNBOUNDED },
            Unit{ "lb", { "pound", "pounds" }, UnitCategory::Mass,
                  [](double v) { return v * 0.45359237; },
                  [](double v) { return v / 0.45359237; }, UNBOUNDED },
            Unit{ "oz", { "ounce", "ounces" }, UnitCategory::Mass,
                  [](double v) { return v * 0.028349523125; },
                  [](double v) { return v / 0.028349523125; }, UNBOUNDED },
            Unit{ "ton", { "tons", "tonne", "tonnes", "metric ton" }, UnitCategory::Mass,
                  [](double v) { return v * 1000.0; },
                  [](double v) { return v / 1000.0; }, UNBOUNDED },
        };
    }
}

const char* categoryName(UnitCategory category) {
    switch (category) {
        case UnitCategory::Length:
            return "Length";
        case UnitCategory::Temperature:
            return "Temperature";
        case UnitCategory::Mass:
            return "Mass";
    }
    return "Unknown";
}

bool Unit::matches(const std::string& input) const {
    if (equalsIgnoreCase(name, input)) {
        return true;
    }
    for (const auto& alias : aliases) {
        if (equalsIgnoreCase(alias, input)) {
            return true;
        }
    }
    return false;
}

// ---------------- UnitRegistry -----------------

const UnitRegistry& UnitRegistry::builtin() {
    static const UnitRegistry registry(builtinUnits());
    return registry;
}

UnitRegistry::UnitRegistry(std::vector<Unit> units)
    : units_(std::move(units)) {}

const Unit* UnitRegistry::lookup(const std::string& input) const {
    for (const auto& u : units_) {
        if (u.matches(input)) {
            return &u;
        }
    }
    return nullptr;
}

bool UnitRegistry::has(const std::string& input) const {
    return lookup(input) != nullptr;
}

const Unit& UnitRegistry::get(const std::string& input) const {
    const Unit* unit = lookup(input);
    if (unit == nullptr) {
        throw std::out_of_range("unit not found: " + input);
    }
    return *unit;
}

const std::vector<Unit>& UnitRegistry::units() const {
    return units_;
}

std::vector<UnitGroup> UnitRegistry::listByCategory() const {
    static const UnitCategory displayOrder[] = {
        UnitCategory::Length,
        UnitCategory::Temperature,
        UnitCategory::Mass,
    };

    std::vector<UnitGroup> groups;
    for (UnitCategory category : displayOrder) {
        UnitGroup group{ category, {} };
        for (const auto& u : units_) {
            if (u.category == category) {
                group.units.push_back(&u);
            }
        }
        groups.push_back(group);
    }
    return groups;
}
