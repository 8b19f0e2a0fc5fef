#include <pcomb/lang/grammar.hpp>

namespace pcomb {

using IT = ItemTokenType;

bool is_id(const ItemTokenType& t) {
    return t.kind == ItemKind::Id;
}

bool is_str(const ItemTokenType& t) {
    return t.kind == ItemKind::Str;
}

ParserPtr<IT> make_item_rule() {
    return sequence<IT>("item", false, parsers<IT>(
        predicate<IT>("id", false, is_id),
        of_type<IT>("=", false, IT::of(ItemKind::Equals)),
        predicate<IT>("value", false, is_str)
    ));
}

ParserPtr<IT> make_item_grammar() {
    return choice<IT>("document", false, parsers<IT>(
        of_type<IT>("_", false, IT::of(ItemKind::Eoi)),
        sequence<IT>("items", false, parsers<IT>(
            repeatable<IT>("fields", true, make_item_rule()),
            of_type<IT>("_", false, IT::of(ItemKind::Eoi))
        ))
    ));
}

} // namespace pcomb
