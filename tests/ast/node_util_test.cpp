//! # Node Utility Tests
//!
//! Expression-result usage, annotation lookup and l-value resolution.

#include "ast/ir.hpp"
#include "ast/node_util.hpp"

#include <gtest/gtest.h>

using namespace deadprop;
using namespace deadprop::ast;

namespace {

/// Result usage of `expr` computed from its parent links.
bool result_used(const Node& expr) {
    auto path = collect_ancestors(expr);
    return is_expression_result_used(expr, AncestorChain(path));
}

} // namespace

// ============================================================================
// AncestorChain
// ============================================================================

TEST(AncestorChainTest, ParentAndPop) {
    auto file = ir::script("a.js", ir::expr_result(ir::qname("a.b")));
    const Node* getprop = file->first_child()->first_child();

    auto path = collect_ancestors(*getprop);
    ASSERT_EQ(path.size(), 2u);
    EXPECT_EQ(path.front(), file.get());

    AncestorChain chain(path);
    EXPECT_TRUE(chain.parent()->is_expr_result());
    EXPECT_EQ(chain.at(1), file.get());
    EXPECT_EQ(chain.at(2), nullptr);
    EXPECT_EQ(chain.pop().parent(), file.get());
    EXPECT_TRUE(chain.pop().pop().empty());
    EXPECT_EQ(chain.pop().pop().parent(), nullptr);
}

// ============================================================================
// Expression Result Usage
// ============================================================================

class ExpressionResultUsedTest : public ::testing::Test {
protected:
    NodePtr file;

    /// Wraps `stmt` in a script and returns its first expression.
    const Node& in_statement(NodePtr stmt) {
        file = ir::script("t.js", std::move(stmt));
        return *file->first_child()->first_child();
    }
};

TEST_F(ExpressionResultUsedTest, ExpressionStatementIsUnused) {
    const Node& n = in_statement(ir::expr_result(ir::inc(ir::qname("this.x"))));
    EXPECT_FALSE(result_used(n));
}

TEST_F(ExpressionResultUsedTest, AssignedValueIsUsed) {
    auto stmt = ir::expr_result(
        ir::assign(ir::name("y"), ir::binary(Token::AssignAdd, ir::qname("this.x"), ir::number(1))));
    const Node& assign = in_statement(std::move(stmt));
    EXPECT_TRUE(result_used(*assign.second_child()));
}

TEST_F(ExpressionResultUsedTest, ReturnValueIsUsed) {
    const Node& n = in_statement(ir::return_(ir::inc(ir::qname("this.x"))));
    EXPECT_TRUE(result_used(n));
}

TEST_F(ExpressionResultUsedTest, CastDefersToItsContext) {
    const Node& cast = in_statement(ir::expr_result(ir::cast(ir::inc(ir::qname("this.x")))));
    EXPECT_FALSE(result_used(*cast.first_child()));

    const Node& returned = in_statement(ir::return_(ir::cast(ir::inc(ir::qname("this.x")))));
    EXPECT_TRUE(result_used(*returned.first_child()));
}

TEST_F(ExpressionResultUsedTest, ConditionIsAlwaysUsed) {
    const Node& hook = in_statement(
        ir::expr_result(ir::hook(ir::inc(ir::qname("this.x")), ir::number(1), ir::number(2))));
    EXPECT_TRUE(result_used(*hook.first_child()));
    EXPECT_FALSE(result_used(*hook.second_child()));
}

TEST_F(ExpressionResultUsedTest, LogicalOperandsDeferToContext) {
    const Node& and_stmt =
        in_statement(ir::expr_result(ir::and_(ir::name("a"), ir::inc(ir::qname("this.x")))));
    EXPECT_TRUE(result_used(*and_stmt.first_child()));
    EXPECT_FALSE(result_used(*and_stmt.second_child()));

    const Node& or_ret = in_statement(ir::return_(ir::or_(ir::name("a"), ir::inc(ir::qname("this.x")))));
    EXPECT_TRUE(result_used(*or_ret.second_child()));
}

TEST_F(ExpressionResultUsedTest, CommaUsesOnlyLastOperandInUsedContext) {
    const Node& ret =
        in_statement(ir::return_(ir::comma(ir::inc(ir::qname("this.x")), ir::inc(ir::qname("this.y")))));
    EXPECT_FALSE(result_used(*ret.first_child()));
    EXPECT_TRUE(result_used(*ret.second_child()));

    const Node& stmt = in_statement(
        ir::expr_result(ir::comma(ir::inc(ir::qname("this.x")), ir::inc(ir::qname("this.y")))));
    EXPECT_FALSE(result_used(*stmt.second_child()));
}

TEST_F(ExpressionResultUsedTest, ForHeaderUsesOnlyCondition) {
    file = ir::script("t.js",
                      ir::for_(ir::inc(ir::qname("this.a")), ir::inc(ir::qname("this.b")),
                               ir::inc(ir::qname("this.c")), ir::block()));
    const Node* loop = file->first_child();
    EXPECT_FALSE(result_used(*loop->child_at(0)));
    EXPECT_TRUE(result_used(*loop->child_at(1)));
    EXPECT_FALSE(result_used(*loop->child_at(2)));
}

// ============================================================================
// Best JSDoc
// ============================================================================

TEST(BestJSDocInfoTest, OwnAnnotationWins) {
    auto n = ir::private_(ir::qname("this.x"));
    ASSERT_NE(get_best_jsdoc_info(*n), nullptr);
    EXPECT_EQ(get_best_jsdoc_info(*n)->visibility, Visibility::Private);
}

TEST(BestJSDocInfoTest, AssignmentTargetInheritsFromAssign) {
    auto stmt = ir::expr_result(ir::private_(ir::assign(ir::qname("this.x"), ir::number(1))));
    const Node* target = stmt->first_child()->first_child();

    ASSERT_NE(get_best_jsdoc_info(*target), nullptr);
    EXPECT_EQ(get_best_jsdoc_info(*target)->visibility, Visibility::Private);
}

TEST(BestJSDocInfoTest, ExpressionStatementAnnotationIsNotInherited) {
    auto stmt = ir::private_(ir::expr_result(ir::assign(ir::qname("this.x"), ir::number(1))));
    const Node* target = stmt->first_child()->first_child();
    EXPECT_EQ(get_best_jsdoc_info(*target), nullptr);
}

TEST(BestJSDocInfoTest, FunctionInheritsFromVariableDeclaration) {
    auto decl = ir::jsdoc(ir::var("Foo", ir::empty_function()), JSDocInfo::constructor_decl());
    const Node* fn = decl->first_child()->first_child();

    const JSDocInfo* info = get_best_jsdoc_info(*fn);
    ASSERT_NE(info, nullptr);
    EXPECT_TRUE(info->is_constructor);
}

TEST(BestJSDocInfoTest, MethodInheritsFromMemberDefinition) {
    auto member = ir::private_(ir::member_function("m", ir::empty_function()));
    const Node* fn = member->first_child();
    ASSERT_NE(get_best_jsdoc_info(*fn), nullptr);
}

TEST(BestJSDocInfoTest, ObjectLiteralValueInheritsFromKey) {
    auto lit = ir::object_lit(ir::private_(ir::string_key("k", ir::empty_function())));
    const Node* fn = lit->first_child()->first_child();
    ASSERT_NE(get_best_jsdoc_info(*fn), nullptr);
}

TEST(BestJSDocInfoTest, NoAnnotationAnywhere) {
    auto stmt = ir::expr_result(ir::assign(ir::qname("this.x"), ir::number(1)));
    EXPECT_EQ(get_best_jsdoc_info(*stmt->first_child()->first_child()), nullptr);
}

// ============================================================================
// Best L-Value
// ============================================================================

TEST(BestLValueTest, DeclaredFunctionAndClass) {
    auto file = ir::script("t.js", ir::function("f", ir::block()), ir::class_("C"));

    EXPECT_EQ(get_best_lvalue_name(get_best_lvalue(*file->first_child())), "f");
    EXPECT_EQ(get_best_lvalue_name(get_best_lvalue(*file->last_child())), "C");
}

TEST(BestLValueTest, AssignedToQualifiedName) {
    auto stmt = ir::expr_result(ir::assign(ir::qname("ns.Foo"), ir::class_("")));
    const Node* cls = stmt->first_child()->second_child();
    EXPECT_EQ(get_best_lvalue_name(get_best_lvalue(*cls)), "ns.Foo");
}

TEST(BestLValueTest, VariableInitializer) {
    auto decl = ir::const_("Bar", ir::or_(ir::name("existing"), ir::class_("")));
    const Node* cls = decl->first_child()->first_child()->second_child();
    EXPECT_EQ(get_best_lvalue_name(get_best_lvalue(*cls)), "Bar");
}

TEST(BestLValueTest, ObjectLiteralKeyIsPrefixedWithOwner) {
    auto stmt = ir::expr_result(
        ir::assign(ir::name("ns"), ir::object_lit(ir::string_key("Foo", ir::empty_function()))));
    const Node* fn = stmt->first_child()->second_child()->first_child()->first_child();
    EXPECT_EQ(get_best_lvalue_name(get_best_lvalue(*fn)), "ns.Foo");
}

TEST(BestLValueTest, AnonymousExpressionHasNoName) {
    auto stmt = ir::expr_result(ir::call(ir::name("register"), ir::class_("")));
    const Node* cls = stmt->first_child()->second_child();
    EXPECT_EQ(get_best_lvalue(*cls), nullptr);
    EXPECT_EQ(get_best_lvalue_name(nullptr), std::nullopt);
}

// ============================================================================
// Operator Classification
// ============================================================================

TEST(OperatorTest, AssignmentOps) {
    auto plain = ir::assign(ir::name("a"), ir::number(1));
    auto compound = ir::binary(Token::AssignCoalesce, ir::name("a"), ir::number(1));
    auto add = ir::binary(Token::Add, ir::name("a"), ir::number(1));

    EXPECT_TRUE(is_assignment_op(*plain));
    EXPECT_FALSE(is_compound_assignment_op(*plain));
    EXPECT_TRUE(is_assignment_op(*compound));
    EXPECT_TRUE(is_compound_assignment_op(*compound));
    EXPECT_FALSE(is_assignment_op(*add));
}
