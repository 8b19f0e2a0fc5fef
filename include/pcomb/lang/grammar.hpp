#pragma once

#include <pcomb/combinators.hpp>
#include <pcomb/lang/item_token.hpp>

namespace pcomb {

bool is_id(const ItemTokenType& t);
bool is_str(const ItemTokenType& t);

// item     := id "=" value
// document := Eoi | item* Eoi
ParserPtr<ItemTokenType> make_item_rule();
ParserPtr<ItemTokenType> make_item_grammar();

} // namespace pcomb
