#pragma once

#include <string>
#include <vector>

enum class CliCommand {
    Help,
    Version,
    List,
    Convert
};

// Command-line configuration: what to do and, for Convert, with which inputs
struct CliOptions {
    CliCommand command;
    std::string valueText;  // e.g. "5"
    std::string fromUnit;   // as typed, e.g. "kilometers"
    std::string toUnit;     // as typed, e.g. "mi"
};

// Parses user inputs (arguments: "<value> <from> <to>" or a single flag)
class InputParser {
public:
    // args excludes the program name; throws ArgumentCountError
    CliOptions parseArguments(const std::vector<std::string>& args) const;

    // Whole-string floating-point literal, e.g. "2.5", "-1e3", "inf"; throws NumberParseError
    double parseValue(const std::string& text) const;
};
