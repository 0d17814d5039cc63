#include <gtest/gtest.h>
#include <algorithm>
#include <cmath>
#include "converter.h"

namespace {
    const UnitRegistry& reg() { return UnitRegistry::builtin(); }

    double convertValue(double value, const std::string& from, const std::string& to) {
        ConversionService svc(reg());
        return svc.convert(value, from, to).value;
    }
}

TEST(ConversionServiceTest, KilometersToMiles) {
    EXPECT_NEAR(convertValue(5.0, "km", "mi"), 3.10686, 1e-5);
}

TEST(ConversionServiceTest, CelsiusToFahrenheit) {
    EXPECT_NEAR(convertValue(100.0, "C", "F"), 212.0, 1e-5);
    EXPECT_NEAR(convertValue(0.0, "C", "F"), 32.0, 1e-5);
}

TEST(ConversionServiceTest, KilogramsToPounds) {
    EXPECT_NEAR(convertValue(10.0, "kg", "lb"), 22.0462, 1e-4);
}

TEST(ConversionServiceTest, MilligramsToKilogramsAndGramsToMilligrams) {
    EXPECT_NEAR(convertValue(1000000.0, "mg", "kg"), 1.0, 1e-5);
    EXPECT_NEAR(convertValue(1.0, "g", "mg"), 1000.0, 1e-5);
}

TEST(ConversionServiceTest, KelvinToCelsius) {
    EXPECT_NEAR(convertValue(273.15, "K", "C"), 0.0, 1e-5);
}

TEST(ConversionServiceTest, FeetToMeterAndYard) {
    // 1 yard = 3 feet exactly with the international definitions
    EXPECT_NEAR(convertValue(1.0, "feet", "meter"), 0.3048, 1e-12);
    EXPECT_NEAR(convertValue(3.0, "ft", "yd"), 1.0, 1e-12);
    EXPECT_NEAR(convertValue(1.0, "mile", "yards"), 1760.0, 1e-9);
    EXPECT_NEAR(convertValue(12.0, "in", "ft"), 1.0, 1e-12);
}

TEST(ConversionServiceTest, AliasesConvertLikeSymbols) {
    EXPECT_DOUBLE_EQ(convertValue(2.5, "kilometres", "Miles"), convertValue(2.5, "km", "mi"));
    EXPECT_NEAR(convertValue(2.0, "metric ton", "KG"), 2000.0, 1e-9);
}

TEST(ConversionServiceTest, SameUnitReturnsSameValue) {
    ConversionService svc(reg());
    for (const auto& u : reg().units()) {
        for (double v : { 0.0, 1.0, 2.5, 1234.5678 }) {
            EXPECT_NEAR(svc.convert(v, u, u).value, v, 1e-9 * std::max(1.0, std::fabs(v))) << u.name;
        }
    }
}

TEST(ConversionServiceTest, RoundTripThroughBaseUnit) {
    for (const auto& u : reg().units()) {
        for (double v : { -1234.5, -1.0, 0.0, 0.001, 1.0, 42.42, 1e6 }) {
            EXPECT_NEAR(u.fromBase(u.toBase(v)), v, 1e-9 * std::max(1.0, std::fabs(v))) << u.name;
        }
    }
}

TEST(ConversionServiceTest, BaseUnitsUseIdentity) {
    for (const char* name : { "m", "C", "kg" }) {
        const Unit& u = reg().get(name);
        EXPECT_DOUBLE_EQ(u.toBase(12.75), 12.75) << name;
        EXPECT_DOUBLE_EQ(u.fromBase(12.75), 12.75) << name;
    }
}

TEST(ConversionServiceTest, DifferentCategoriesAlwaysRejected) {
    ConversionService svc(reg());
    for (const auto& from : reg().units()) {
        for (const auto& to : reg().units()) {
            if (from.category == to.category) {
                continue;
            }
            try {
                svc.convert(1.0, from, to);
                ADD_FAILURE() << from.name << " -> " << to.name << " did not throw";
            } catch (const CategoryMismatchError& ex) {
                EXPECT_EQ(ex.fromCategory(), from.category);
                EXPECT_EQ(ex.toCategory(), to.category);
            }
        }
    }
}

TEST(ConversionServiceTest, CategoryCheckPrecedesTemperatureCheck) {
    ConversionService svc(reg());
    EXPECT_THROW(svc.convert(-1000.0, "C", "m"), CategoryMismatchError);
}

// ---------------- Physical validity ----------------

TEST(ValidityTest, AbsoluteZeroBoundaryIsInclusive) {
    ConversionService svc(reg());
    EXPECT_NO_THROW(svc.convert(-273.15, "C", "F"));
    EXPECT_THROW(svc.convert(-273.16, "C", "F"), BelowAbsoluteZeroError);

    EXPECT_NO_THROW(svc.convert(0.0, "K", "C"));
    EXPECT_THROW(svc.convert(-0.01, "K", "C"), BelowAbsoluteZeroError);

    EXPECT_NO_THROW(svc.convert(-459.67, "F", "K"));
    EXPECT_THROW(svc.convert(-459.68, "F", "K"), BelowAbsoluteZeroError);
}

TEST(ValidityTest, ThresholdUsesInputScale) {
    ConversionService svc(reg());
    // -300 F is above absolute zero on the Fahrenheit scale even though -300 C is not
    EXPECT_NO_THROW(svc.convert(-300.0, "F", "C"));
    EXPECT_THROW(svc.convert(-300.0, "C", "F"), BelowAbsoluteZeroError);
}

TEST(ValidityTest, BelowAbsoluteZeroCarriesDetails) {
    ConversionService svc(reg());
    try {
        svc.convert(-5.0, "kelvin", "C");
        FAIL() << "expected BelowAbsoluteZeroError";
    } catch (const BelowAbsoluteZeroError& ex) {
        EXPECT_EQ(ex.unitName(), "K");
        EXPECT_DOUBLE_EQ(ex.value(), -5.0);
        EXPECT_DOUBLE_EQ(ex.absoluteZero(), 0.0);
    }
}

TEST(ValidityTest, NegativeLengthWarnsButConverts) {
    ConversionService svc(reg());
    auto result = svc.convert(-2.0, "m", "cm");
    EXPECT_NEAR(result.value, -200.0, 1e-9);
    ASSERT_EQ(result.warnings.size(), 1u);
    EXPECT_EQ(result.warnings[0], ConversionWarning::NegativeLength);
    EXPECT_STREQ(warningMessage(result.warnings[0]), "Negative length doesn't make physical sense");

    EXPECT_TRUE(svc.convert(0.0, "m", "cm").warnings.empty());
}

TEST(ValidityTest, NegativeMassIsNotChecked) {
    ConversionService svc(reg());
    auto result = svc.convert(-3.0, "kg", "g");
    EXPECT_NEAR(result.value, -3000.0, 1e-9);
    EXPECT_TRUE(result.warnings.empty());
}

// ---------------- Unit resolution ----------------

TEST(ConversionServiceTest, UnknownUnitsReportWhichSide) {
    ConversionService svc(reg());
    try {
        svc.convert(1.0, "bogus", "alsobogus");
        FAIL() << "expected UnknownUnitError";
    } catch (const UnknownUnitError& ex) {
        EXPECT_EQ(ex.which(), UnknownUnitError::Which::From);
        EXPECT_EQ(ex.unitName(), "bogus");
    }
    try {
        svc.convert(1.0, "m", "furlong");
        FAIL() << "expected UnknownUnitError";
    } catch (const UnknownUnitError& ex) {
        EXPECT_EQ(ex.which(), UnknownUnitError::Which::To);
        EXPECT_EQ(ex.unitName(), "furlong");
    }
}

TEST(ConversionServiceTest, WorksWithCustomRegistry) {
    UnitRegistry custom({
        Unit{ "m", {}, UnitCategory::Length,
              [](double v) { return v; }, [](double v) { return v; }, -HUGE_VAL },
        Unit{ "ft", { "feet" }, UnitCategory::Length,
              [](double v) { return v * 0.3048; }, [](double v) { return v / 0.3048; }, -HUGE_VAL },
    });
    ConversionService svc(custom);
    EXPECT_NEAR(svc.convert(1.0, "FEET", "m").value, 0.3048, 1e-12);
    EXPECT_THROW(svc.convert(1.0, "km", "m"), UnknownUnitError);
}
