#include "formatter.h"

#include <cmath>
#include <cstdlib>
#include <iomanip>
#include <sstream>

namespace {
    const char* const VERSION_STRING = "Unit Converter v3.0.0";

    // Largest precision ever needed for a double to round-trip in scientific form
    constexpr int MAX_SIGNIFICANT_PRECISION = 17;
}

std::string Formatter::formatNumber(double v) const {
    if (std::isnan(v)) {
        return "NaN";
    }
    if (std::isinf(v)) {
        return v < 0 ? "-inf" : "inf";
    }
    if (v == 0.0) {
        return std::signbit(v) ? "-0" : "0";
    }

    // Fewest significant digits that survive a round trip, e.g. "3.1068559611866697e+00"
    std::string sci;
    for (int precision = 0; precision <= MAX_SIGNIFICANT_PRECISION; ++precision) {
        std::ostringstream oss;
        oss << std::scientific << std::setprecision(precision) << v;
        sci = oss.str();
        if (std::strtod(sci.c_str(), nullptr) == v) {
            break;
        }
    }

    bool negative = sci[0] == '-';
    if (negative) {
        sci.erase(0, 1);
    }
    size_t ePos = sci.find('e');
    int exponent = std::atoi(sci.c_str() + ePos + 1);
    std::string digits;
    for (size_t i = 0; i < ePos; ++i) {
        if (sci[i] != '.') {
            digits += sci[i];
        }
    }
    while (digits.size() > 1 && digits.back() == '0') {
        digits.pop_back();
    }

    // Place the decimal point: digits are d0.d1d2... x 10^exponent
    long intDigits = static_cast<long>(exponent) + 1;
    std::string out;
    if (intDigits <= 0) {
        out = "0." + std::string(static_cast<size_t>(-intDigits), '0') + digits;
    } else if (static_cast<size_t>(intDigits) >= digits.size()) {
        out = digits + std::string(static_cast<size_t>(intDigits) - digits.size(), '0');
    } else {
        out = digits.substr(0, static_cast<size_t>(intDigits)) + "." + digits.substr(static_cast<size_t>(intDigits));
    }
    return negative ? "-" + out : out;
}

std::string Formatter::formatResult(double value, const std::string& fromUnit,
                                    double result, const std::string& toUnit) const {
    std::ostringstream oss;
    oss << formatNumber(value) << " " << fromUnit
        << " = " << formatNumber(result) << " " << toUnit << "\n";
    return oss.str();
}

std::string Formatter::formatVersion() const {
    return std::string(VERSION_STRING) + "\n";
}

std::string Formatter::formatHelp(const std::string& program) const {
    std::ostringstream oss;
    oss << VERSION_STRING << "\n";
    oss << "\n";
    oss << "USAGE:\n";
    oss << "    " << program << " <value> <from_unit> <to_unit>\n";
    oss << "\n";
    oss << "EXAMPLES:\n";
    oss << "    " << program << " 5 km mi\n";
    oss << "    " << program << " 100 feet meters\n";
    oss << "    " << program << " 100 C F\n";
    oss << "    " << program << " 150 kg lb\n";
    oss << "\n";
    oss << "OPTIONS:\n";
    oss << "    -h, --help       Show this help message\n";
    oss << "    -v, --version    Show version information\n";
    oss << "    -l, --list       List all supported units\n";
    oss << "\n";
    oss << "Note: Unit names are case-insensitive and support common aliases\n";
    return oss.str();
}

std::string Formatter::formatUnitList(const UnitRegistry& registry) const {
    std::ostringstream oss;
    oss << "Supported units:\n";
    oss << "\n";
    for (const auto& group : registry.listByCategory()) {
        oss << categoryName(group.category) << ":\n";
        for (const Unit* u : group.units) {
            oss << "  " << u->name << " ";
            if (!u->aliases.empty()) {
                oss << "(";
                for (size_t i = 0; i < u->aliases.size(); ++i) {
                    if (i > 0) oss << ", ";
                    oss << u->aliases[i];
                }
                oss << ")";
            }
            oss << "\n";
        }
        oss << "\n";
    }
    return oss.str();
}
