#include "input_parser.h"

#include "errors.h"

#include <cctype>
#include <cstdlib>

CliOptions InputParser::parseArguments(const std::vector<std::string>& args) const {
    if (args.size() == 1) {
        const std::string& flag = args[0];
        if (flag == "--help" || flag == "-h") {
            return CliOptions{ CliCommand::Help, "", "", "" };
        } else if (flag == "--version" || flag == "-v") {
            return CliOptions{ CliCommand::Version, "", "", "" };
        } else if (flag == "--list" || flag == "-l") {
            return CliOptions{ CliCommand::List, "", "", "" };
        }
    }

    if (args.size() != 3) {
        throw ArgumentCountError(args.size());
    }
    return CliOptions{ CliCommand::Convert, args[0], args[1], args[2] };
}

double InputParser::parseValue(const std::string& text) const {
    if (text.empty()) {
        throw NumberParseError(text);
    }
    // strtod skips leading blanks; the literal must fill the whole argument
    if (std::isspace(static_cast<unsigned char>(text.front())) ||
        std::isspace(static_cast<unsigned char>(text.back()))) {
        throw NumberParseError(text);
    }
    // strtod also reads hex floats and "nan(...)", neither of which is a decimal literal
    size_t digits = (text[0] == '+' || text[0] == '-') ? 1 : 0;
    if (text.size() > digits + 1 && text[digits] == '0' && (text[digits + 1] == 'x' || text[digits + 1] == 'X')) {
        throw NumberParseError(text);
    }
    if (text.find('(') != std::string::npos) {
        throw NumberParseError(text);
    }

    char* end = nullptr;
    double v = std::strtod(text.c_str(), &end);
    if (end == text.c_str() || *end != '\0') {
        throw NumberParseError(text);
    }
    return v;
}
