#include "cli/ArgParse.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace batchfs {

namespace ArgParse {

Expected<std::string> takeValue(const std::vector<std::string>& args, size_t& i) {
    if (i + 1 >= args.size()) {
        return Error{ErrorCode::InvalidArgs, "option " + args[i] + " requires a value"};
    }
    ++i;
    return args[i];
}

Expected<uint64_t> parseUnsigned(const std::string& flag, const std::string& text) {
    bool digitsOnly = !text.empty() &&
        std::all_of(text.begin(), text.end(), [](char c) { return std::isdigit(static_cast<unsigned char>(c)); });
    if (!digitsOnly) {
        return Error{ErrorCode::InvalidArgs, flag + " expects a non-negative number, got '" + text + "'"};
    }
    try {
        return static_cast<uint64_t>(std::stoull(text));
    } catch (const std::out_of_range&) {
        return Error{ErrorCode::InvalidArgs, flag + " value out of range: " + text};
    }
}

std::string unescapeSeparator(const std::string& text) {
    if (text == "\\t") return "\t";
    return text;
}

bool isOption(const std::string& arg) {
    return arg.size() > 1 && arg[0] == '-';
}

}

}
