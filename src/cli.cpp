#include "cli.h"

#include "converter.h"
#include "errors.h"
#include "formatter.h"
#include "input_parser.h"

#include <exception>

namespace {
    constexpr int EXIT_OK = 0;
    constexpr int EXIT_ERROR = 1;

    int convertCommand(const CliOptions& options, const std::string& program, std::ostream& out,
                       std::ostream& err, const UnitRegistry& registry) {
        InputParser parser;
        Formatter fmt;
        ConversionService service(registry);

        double value = 0.0;
        try {
            value = parser.parseValue(options.valueText);
        } catch (const NumberParseError& ex) {
            err << "Error: '" << ex.text() << "' is not a valid number" << std::endl;
            return EXIT_ERROR;
        }

        try {
            ConversionResult result = service.convert(value, options.fromUnit, options.toUnit);
            for (ConversionWarning w : result.warnings) {
                err << "Warning: " << warningMessage(w) << std::endl;
            }
            out << fmt.formatResult(value, options.fromUnit, result.value, options.toUnit);
            return EXIT_OK;
        } catch (const UnknownUnitError& ex) {
            err << "Error: Unknown unit '" << ex.unitName() << "'" << std::endl;
            err << "Try '" << program << " --list' to see supported units" << std::endl;
        } catch (const CategoryMismatchError& ex) {
            err << "Error: Cannot convert between different unit categories" << std::endl;
            err << "  " << options.fromUnit << " is a " << categoryName(ex.fromCategory()) << " unit" << std::endl;
            err << "  " << options.toUnit << " is a " << categoryName(ex.toCategory()) << " unit" << std::endl;
        } catch (const BelowAbsoluteZeroError&) {
            err << "Error: Temperature below absolute zero" << std::endl;
        }
        return EXIT_ERROR;
    }
}

int runCli(const std::vector<std::string>& args, std::ostream& out, std::ostream& err,
           const UnitRegistry& registry) {
    const std::string program = args.empty() ? "unit_converter" : args[0];
    std::vector<std::string> rest;
    if (!args.empty()) {
        rest.assign(args.begin() + 1, args.end());
    }

    InputParser parser;
    Formatter fmt;
    try {
        CliOptions options = parser.parseArguments(rest);
        switch (options.command) {
            case CliCommand::Help:
                out << fmt.formatHelp(program);
                return EXIT_OK;
            case CliCommand::Version:
                out << fmt.formatVersion();
                return EXIT_OK;
            case CliCommand::List:
                out << fmt.formatUnitList(registry);
                return EXIT_OK;
            case CliCommand::Convert:
                return convertCommand(options, program, out, err, registry);
        }
    } catch (const ArgumentCountError& ex) {
        err << "Error: Expected 3 arguments, got " << ex.count() << std::endl;
        err << "Usage: " << program << " <value> <from_unit> <to_unit>" << std::endl;
        err << "Try '" << program << " --help' for more information" << std::endl;
    } catch (const std::exception& ex) {
        err << "Error: " << ex.what() << std::endl;
    }
    return EXIT_ERROR;
}
