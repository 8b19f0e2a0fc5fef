#include <pcomb/lang/item_token.hpp>

namespace pcomb {

const char* item_kind_name(ItemKind k) {
    switch (k) {
    case ItemKind::Semicolon: return "Semicolon";
    case ItemKind::Dollar:    return "Dollar";
    case ItemKind::Or:        return "Or";
    case ItemKind::Caret:     return "Caret";
    case ItemKind::LBracket:  return "LBracket";
    case ItemKind::RBracket:  return "RBracket";
    case ItemKind::Equals:    return "Equals";
    case ItemKind::LParen:    return "LParen";
    case ItemKind::RParen:    return "RParen";
    case ItemKind::Eoi:       return "Eoi";
    case ItemKind::Id:        return "Id";
    case ItemKind::Str:       return "Str";
    }
    return "Unknown";
}

std::string describe(const ItemTokenType& t) {
    std::string out = item_kind_name(t.kind);
    if (t.kind == ItemKind::Id || t.kind == ItemKind::Str) {
        out += " \"";
        out += t.text;
        out += "\"";
    }
    return out;
}

} // namespace pcomb
