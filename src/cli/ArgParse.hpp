#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "util/Expected.hpp"

namespace batchfs {

/**
 * @brief Small helpers shared by the command argument parsers
 */
namespace ArgParse {

/// Value following args[i] for an option that needs one; advances i
Expected<std::string> takeValue(const std::vector<std::string>& args, size_t& i);

/// Parse a non-negative decimal number given for flag
Expected<uint64_t> parseUnsigned(const std::string& flag, const std::string& text);

/// Translate "\t" (backslash, t) typed on a shell into a real tab; other text is returned as is
std::string unescapeSeparator(const std::string& text);

/// True for "-x" / "--xyz" style arguments (a lone "-" is a positional)
bool isOption(const std::string& arg);

}

}
