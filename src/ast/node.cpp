//! # Syntax Tree Node Implementation

#include "ast/node.hpp"

namespace deadprop::ast {

// ============================================================================
// Token and Visibility Names
// ============================================================================

const char* token_name(Token token) {
    switch (token) {
    case Token::Root:
        return "ROOT";
    case Token::Script:
        return "SCRIPT";
    case Token::Block:
        return "BLOCK";
    case Token::Empty:
        return "EMPTY";
    case Token::ExprResult:
        return "EXPR_RESULT";
    case Token::Var:
        return "VAR";
    case Token::Let:
        return "LET";
    case Token::Const:
        return "CONST";
    case Token::Return:
        return "RETURN";
    case Token::If:
        return "IF";
    case Token::For:
        return "FOR";
    case Token::ForIn:
        return "FOR_IN";
    case Token::ForOf:
        return "FOR_OF";
    case Token::While:
        return "WHILE";
    case Token::DoWhile:
        return "DO";
    case Token::Throw:
        return "THROW";
    case Token::Name:
        return "NAME";
    case Token::This:
        return "THIS";
    case Token::Super:
        return "SUPER";
    case Token::StringLit:
        return "STRINGLIT";
    case Token::Number:
        return "NUMBER";
    case Token::True:
        return "TRUE";
    case Token::False:
        return "FALSE";
    case Token::Null:
        return "NULL";
    case Token::ArrayLit:
        return "ARRAYLIT";
    case Token::ObjectLit:
        return "OBJECTLIT";
    case Token::StringKey:
        return "STRING_KEY";
    case Token::GetterDef:
        return "GETTER_DEF";
    case Token::SetterDef:
        return "SETTER_DEF";
    case Token::MemberFunctionDef:
        return "MEMBER_FUNCTION_DEF";
    case Token::ComputedProp:
        return "COMPUTED_PROP";
    case Token::GetProp:
        return "GETPROP";
    case Token::GetElem:
        return "GETELEM";
    case Token::Call:
        return "CALL";
    case Token::New:
        return "NEW";
    case Token::Function:
        return "FUNCTION";
    case Token::ParamList:
        return "PARAM_LIST";
    case Token::Class:
        return "CLASS";
    case Token::ClassMembers:
        return "CLASS_MEMBERS";
    case Token::Not:
        return "NOT";
    case Token::Neg:
        return "NEG";
    case Token::TypeOf:
        return "TYPEOF";
    case Token::Inc:
        return "INC";
    case Token::Dec:
        return "DEC";
    case Token::Eq:
        return "EQ";
    case Token::Ne:
        return "NE";
    case Token::ShEq:
        return "SHEQ";
    case Token::ShNe:
        return "SHNE";
    case Token::Lt:
        return "LT";
    case Token::Gt:
        return "GT";
    case Token::Le:
        return "LE";
    case Token::Ge:
        return "GE";
    case Token::Add:
        return "ADD";
    case Token::Sub:
        return "SUB";
    case Token::Mul:
        return "MUL";
    case Token::Div:
        return "DIV";
    case Token::Mod:
        return "MOD";
    case Token::Exponent:
        return "EXPONENT";
    case Token::BitAnd:
        return "BITAND";
    case Token::BitOr:
        return "BITOR";
    case Token::BitXor:
        return "BITXOR";
    case Token::Lsh:
        return "LSH";
    case Token::Rsh:
        return "RSH";
    case Token::Ursh:
        return "URSH";
    case Token::And:
        return "AND";
    case Token::Or:
        return "OR";
    case Token::Coalesce:
        return "COALESCE";
    case Token::Hook:
        return "HOOK";
    case Token::Comma:
        return "COMMA";
    case Token::Cast:
        return "CAST";
    case Token::Assign:
        return "ASSIGN";
    case Token::AssignBitOr:
        return "ASSIGN_BITOR";
    case Token::AssignBitXor:
        return "ASSIGN_BITXOR";
    case Token::AssignBitAnd:
        return "ASSIGN_BITAND";
    case Token::AssignLsh:
        return "ASSIGN_LSH";
    case Token::AssignRsh:
        return "ASSIGN_RSH";
    case Token::AssignUrsh:
        return "ASSIGN_URSH";
    case Token::AssignAdd:
        return "ASSIGN_ADD";
    case Token::AssignSub:
        return "ASSIGN_SUB";
    case Token::AssignMul:
        return "ASSIGN_MUL";
    case Token::AssignExponent:
        return "ASSIGN_EXPONENT";
    case Token::AssignDiv:
        return "ASSIGN_DIV";
    case Token::AssignMod:
        return "ASSIGN_MOD";
    case Token::AssignOr:
        return "ASSIGN_OR";
    case Token::AssignAnd:
        return "ASSIGN_AND";
    case Token::AssignCoalesce:
        return "ASSIGN_COALESCE";
    }
    return "???";
}

const char* visibility_name(Visibility visibility) {
    switch (visibility) {
    case Visibility::Private:
        return "private";
    case Visibility::Package:
        return "package";
    case Visibility::Protected:
        return "protected";
    case Visibility::Public:
        return "public";
    case Visibility::Inherited:
        return "inherited";
    }
    return "???";
}

// ============================================================================
// Node
// ============================================================================

auto Node::add_child(Box<Node> child) -> Node* {
    check_state(child != nullptr, "add_child: null child under " + to_string());
    check_state(child->parent_ == nullptr, "add_child: node already has a parent");

    child->parent_ = this;
    if (!children_.empty()) {
        children_.back()->next_ = child.get();
    }
    children_.push_back(std::move(child));
    return children_.back().get();
}

auto Node::qualified_name() const -> std::optional<std::string> {
    switch (token_) {
    case Token::Name:
        if (string_.empty()) {
            return std::nullopt;
        }
        return string_;
    case Token::This:
        return std::string("this");
    case Token::Super:
        return std::string("super");
    case Token::GetProp: {
        const Node* target = first_child();
        if (!target) {
            return std::nullopt;
        }
        auto left = target->qualified_name();
        if (!left) {
            return std::nullopt;
        }
        return *left + "." + string_;
    }
    default:
        return std::nullopt;
    }
}

auto Node::matches_qualified_name(std::string_view name) const -> bool {
    auto qname = qualified_name();
    return qname && *qname == name;
}

auto Node::to_string() const -> std::string {
    std::string result = token_name(token_);
    if (!string_.empty()) {
        result += " ";
        result += string_;
    }
    if (span_.start.line > 0) {
        result += " " + std::to_string(span_.start.line) + ":" + std::to_string(span_.start.column);
    }
    return result;
}

} // namespace deadprop::ast
