#pragma once

#include <pcomb/token.hpp>
#include <string>

namespace pcomb {

enum class ItemKind {
    // Punctuation
    Semicolon,  // ;
    Dollar,     // $
    Or,         // |
    Caret,      // ^
    LBracket,   // [
    RBracket,   // ]
    Equals,     // =
    LParen,     // (
    RParen,     // )

    // Special
    Eoi,

    // Carry text
    Id,
    Str
};

// Token type for the item language. Equality compares both the kind and
// the text, so OfType can target a specific identifier as well as a bare
// punctuation kind (whose text is empty).
struct ItemTokenType {
    ItemKind kind = ItemKind::Eoi;
    std::string text;

    static ItemTokenType of(ItemKind k) { return {k, ""}; }
    static ItemTokenType id(std::string name) { return {ItemKind::Id, std::move(name)}; }
    static ItemTokenType str(std::string value) { return {ItemKind::Str, std::move(value)}; }

    bool operator==(const ItemTokenType& o) const {
        return kind == o.kind && text == o.text;
    }
    bool operator!=(const ItemTokenType& o) const { return !(*this == o); }
};

using ItemToken = Token<ItemTokenType>;

// Kind name for debugging
const char* item_kind_name(ItemKind k);

// Kind name plus quoted text for Id and Str, e.g. Id "name"
std::string describe(const ItemTokenType& t);

} // namespace pcomb
