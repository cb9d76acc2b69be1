#include "lexer/token.hpp"

namespace vnc::lexer {

auto Token::is_word() const -> bool {
    if (kind == TokenKind::Identifier || kind == TokenKind::BoolLiteral) {
        return true;
    }
    return kind >= TokenKind::KwAs && kind <= TokenKind::KwWhere;
}

auto token_kind_to_string(TokenKind kind) -> std::string_view {
    switch (kind) {
    case TokenKind::Eof:
        return "end of file";
    case TokenKind::Error:
        return "error";
    case TokenKind::Identifier:
        return "identifier";
    case TokenKind::Lifetime:
        return "lifetime";
    case TokenKind::IntLiteral:
        return "integer literal";
    case TokenKind::FloatLiteral:
        return "float literal";
    case TokenKind::StringLiteral:
        return "string literal";
    case TokenKind::CharLiteral:
        return "char literal";
    case TokenKind::BoolLiteral:
        return "bool literal";
    case TokenKind::DocComment:
        return "doc comment";
    case TokenKind::InnerDocComment:
        return "inner doc comment";
    case TokenKind::KwAs:
        return "as";
    case TokenKind::KwAsync:
        return "async";
    case TokenKind::KwConst:
        return "const";
    case TokenKind::KwCrate:
        return "crate";
    case TokenKind::KwDyn:
        return "dyn";
    case TokenKind::KwEnum:
        return "enum";
    case TokenKind::KwExtern:
        return "extern";
    case TokenKind::KwFn:
        return "fn";
    case TokenKind::KwFor:
        return "for";
    case TokenKind::KwImpl:
        return "impl";
    case TokenKind::KwIn:
        return "in";
    case TokenKind::KwLet:
        return "let";
    case TokenKind::KwMod:
        return "mod";
    case TokenKind::KwMut:
        return "mut";
    case TokenKind::KwPub:
        return "pub";
    case TokenKind::KwSelfValue:
        return "self";
    case TokenKind::KwSelfType:
        return "Self";
    case TokenKind::KwStatic:
        return "static";
    case TokenKind::KwStruct:
        return "struct";
    case TokenKind::KwSuper:
        return "super";
    case TokenKind::KwTrait:
        return "trait";
    case TokenKind::KwType:
        return "type";
    case TokenKind::KwUnsafe:
        return "unsafe";
    case TokenKind::KwUse:
        return "use";
    case TokenKind::KwWhere:
        return "where";
    case TokenKind::LParen:
        return "(";
    case TokenKind::RParen:
        return ")";
    case TokenKind::LBracket:
        return "[";
    case TokenKind::RBracket:
        return "]";
    case TokenKind::LBrace:
        return "{";
    case TokenKind::RBrace:
        return "}";
    case TokenKind::Lt:
        return "<";
    case TokenKind::Gt:
        return ">";
    case TokenKind::Comma:
        return ",";
    case TokenKind::Semi:
        return ";";
    case TokenKind::Colon:
        return ":";
    case TokenKind::PathSep:
        return "::";
    case TokenKind::Arrow:
        return "->";
    case TokenKind::FatArrow:
        return "=>";
    case TokenKind::Dot:
        return ".";
    case TokenKind::DotDot:
        return "..";
    case TokenKind::DotDotEq:
        return "..=";
    case TokenKind::DotDotDot:
        return "...";
    case TokenKind::Eq:
        return "=";
    case TokenKind::EqEq:
        return "==";
    case TokenKind::Ne:
        return "!=";
    case TokenKind::Pound:
        return "#";
    case TokenKind::Bang:
        return "!";
    case TokenKind::Question:
        return "?";
    case TokenKind::Plus:
        return "+";
    case TokenKind::Minus:
        return "-";
    case TokenKind::Star:
        return "*";
    case TokenKind::Slash:
        return "/";
    case TokenKind::Percent:
        return "%";
    case TokenKind::Caret:
        return "^";
    case TokenKind::Amp:
        return "&";
    case TokenKind::AndAnd:
        return "&&";
    case TokenKind::Pipe:
        return "|";
    case TokenKind::OrOr:
        return "||";
    case TokenKind::At:
        return "@";
    case TokenKind::Dollar:
        return "$";
    case TokenKind::Tilde:
        return "~";
    }
    return "unknown";
}

} // namespace vnc::lexer
