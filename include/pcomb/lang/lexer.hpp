#pragma once

#include <pcomb/lang/item_token.hpp>
#include <pcomb/result.hpp>
#include <string>
#include <vector>

namespace pcomb {

// Lex item-language source into tokens. The stream always ends with an
// Eoi token; '#' starts a comment that runs to the end of the line.
Result<std::vector<ItemToken>> lex_items(const std::string& source,
                                         const std::string& filename = "<input>");

} // namespace pcomb
