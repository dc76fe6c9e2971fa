//! # Node Tokens
//!
//! The kinds of nodes in a JavaScript syntax tree. Only the shapes the
//! analysis passes inspect are modeled; everything else can be represented
//! with the generic expression and statement tokens.
//!
//! ## Child Layout
//!
//! | Token               | Children                               | String       |
//! |---------------------|----------------------------------------|--------------|
//! | `Script`            | statements                             | source name  |
//! | `ExprResult`        | expression                             |              |
//! | `GetProp`           | target                                 | property     |
//! | `Call` / `New`      | callee, arguments...                   |              |
//! | `Function`          | `Name`, `ParamList`, `Block`           |              |
//! | `Class`             | `Name`/`Empty`, superclass/`Empty`, `ClassMembers` | |
//! | `MemberFunctionDef` | `Function`                             | method name  |
//! | `StringKey`         | value                                  | key          |
//! | `Var`/`Let`/`Const` | `Name` (initializer is the name's child) |            |
//! | `For`               | init, condition, increment, body       |              |
//! | `Hook`              | condition, then, else                  |              |

#ifndef DEADPROP_AST_TOKEN_HPP
#define DEADPROP_AST_TOKEN_HPP

namespace deadprop::ast {

enum class Token {
    // Structure
    Root,
    Script,
    Block,
    Empty,

    // Statements
    ExprResult,
    Var,
    Let,
    Const,
    Return,
    If,
    For,
    ForIn,
    ForOf,
    While,
    DoWhile,
    Throw,

    // Primary expressions
    Name,
    This,
    Super,
    StringLit,
    Number,
    True,
    False,
    Null,
    ArrayLit,
    ObjectLit,

    // Object literal and class members
    StringKey,
    GetterDef,
    SetterDef,
    MemberFunctionDef,
    ComputedProp,

    // Access and calls
    GetProp,
    GetElem,
    Call,
    New,

    // Functions and classes
    Function,
    ParamList,
    Class,
    ClassMembers,

    // Operators
    Not,
    Neg,
    TypeOf,
    Inc,
    Dec,
    Eq,
    Ne,
    ShEq,
    ShNe,
    Lt,
    Gt,
    Le,
    Ge,
    Add,
    Sub,
    Mul,
    Div,
    Mod,
    Exponent,
    BitAnd,
    BitOr,
    BitXor,
    Lsh,
    Rsh,
    Ursh,
    And,
    Or,
    Coalesce,
    Hook,
    Comma,
    Cast,

    // Assignment
    Assign,
    AssignBitOr,
    AssignBitXor,
    AssignBitAnd,
    AssignLsh,
    AssignRsh,
    AssignUrsh,
    AssignAdd,
    AssignSub,
    AssignMul,
    AssignExponent,
    AssignDiv,
    AssignMod,
    AssignOr,
    AssignAnd,
    AssignCoalesce,
};

/// Returns the upper-case name of a token (e.g., "GETPROP").
const char* token_name(Token token);

} // namespace deadprop::ast

#endif // DEADPROP_AST_TOKEN_HPP
