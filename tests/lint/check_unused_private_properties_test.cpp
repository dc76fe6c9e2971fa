//! # Unused Private Property Check Tests
//!
//! Trees are built with `ast::ir`; the JavaScript each test models is shown
//! in a comment above it.

#include "ast/ir.hpp"
#include "lint/check_unused_private_properties.hpp"

#include <gtest/gtest.h>
#include <string>
#include <vector>

using namespace deadprop;
using namespace deadprop::ast::ir;
using deadprop::ast::JSDocInfo;
using deadprop::ast::NodePtr;
using deadprop::ast::Token;
using deadprop::compiler::AnalysisOptions;
using deadprop::compiler::Compiler;
using deadprop::lint::CheckUnusedPrivateProperties;

namespace {

/// `/** @constructor */ function <name>() { <body> }`
NodePtr constructor_fn(const std::string& id, NodePtr body) {
    return jsdoc(function(id, std::move(body)), JSDocInfo::constructor_decl());
}

/// `/** @private */ <target> = <value>;`
NodePtr private_assign(NodePtr target, NodePtr value) {
    return expr_result(private_(assign(std::move(target), std::move(value))));
}

} // namespace

class CheckUnusedPrivatePropertiesTest : public ::testing::Test {
protected:
    diag::CollectingErrorManager errors;
    AnalysisOptions options;

    void SetUp() override {
        options.set_check_level("unusedPrivateMembers", diag::CheckLevel::Warning);
    }

    /// Runs the check over `root` and returns the names of the properties
    /// reported, in report order.
    auto unused(const ast::Node& root) -> std::vector<std::string> {
        errors.clear();
        Compiler compiler(options, errors);
        compiler.passes().add_pass<CheckUnusedPrivateProperties>(compiler);
        compiler.process(root);
        return reported_names();
    }

    auto reported_names() const -> std::vector<std::string> {
        static const std::string prefix = "Private property ";
        static const std::string suffix = " is never read";
        std::vector<std::string> names;
        for (const auto& e : errors.all()) {
            EXPECT_EQ(e.type, &CheckUnusedPrivateProperties::UNUSED_PRIVATE_PROPERTY);
            const std::string& d = e.description;
            names.push_back(d.substr(prefix.size(), d.size() - prefix.size() - suffix.size()));
        }
        return names;
    }
};

using Names = std::vector<std::string>;

// ============================================================================
// Basic Reporting
// ============================================================================

// function Foo() { /** @private */ this.cache_ = null; }
TEST_F(CheckUnusedPrivatePropertiesTest, UnreadPropertyIsReported) {
    auto tree = script("foo.js",
                       constructor_fn("Foo", block(private_assign(at(qname("this.cache_"), 2, 3), null()))));

    EXPECT_EQ(unused(*tree), Names{"cache_"});
    ASSERT_EQ(errors.all().size(), 1u);
    EXPECT_EQ(errors.all()[0].to_string(),
              "foo.js:2:3: WARNING - [JSC_UNUSED_PRIVATE_PROPERTY] Private property cache_ is never "
              "read");
}

// function Foo() { /** @private */ this.cache_ = null; }
// Foo.prototype.get = function() { return this.cache_; };
TEST_F(CheckUnusedPrivatePropertiesTest, LaterReadSuppresses) {
    auto tree = script("foo.js",
                       constructor_fn("Foo", block(private_assign(qname("this.cache_"), null()))),
                       expr_result(assign(qname("Foo.prototype.get"),
                                          function("", block(return_(qname("this.cache_")))))));

    EXPECT_EQ(unused(*tree), Names{});
}

// function use(o) { return o.cache_; }
// function Foo() { /** @private */ this.cache_ = null; }
TEST_F(CheckUnusedPrivatePropertiesTest, EarlierReadOnAnyObjectSuppresses) {
    auto tree = script("foo.js", function("use", block(return_(qname("o.cache_")))),
                       constructor_fn("Foo", block(private_assign(qname("this.cache_"), null()))));

    EXPECT_EQ(unused(*tree), Names{});
}

// /** @private */ this.x;
TEST_F(CheckUnusedPrivatePropertiesTest, StubDeclarationIsReported) {
    auto tree = script("foo.js", expr_result(private_(qname("this.x"))));
    EXPECT_EQ(unused(*tree), Names{"x"});
}

// /** @private */ this.x = 1;  this.x = 2;
TEST_F(CheckUnusedPrivatePropertiesTest, AssignmentsAreNotReads) {
    auto tree = script("foo.js", private_assign(qname("this.x"), number(1)),
                       expr_result(assign(qname("this.x"), number(2))));
    EXPECT_EQ(unused(*tree), Names{"x"});
}

// this.pub = 1;
TEST_F(CheckUnusedPrivatePropertiesTest, NonPrivateDefinitionsAreIgnored) {
    auto tree = script("foo.js", expr_result(assign(qname("this.pub"), number(1))),
                       expr_result(jsdoc(assign(qname("this.prot"), number(1)),
                                         JSDocInfo::with_visibility(ast::Visibility::Protected))));
    EXPECT_EQ(unused(*tree), Names{});
}

// /** @private */ this.x = 1;  this.x.y = 2;
TEST_F(CheckUnusedPrivatePropertiesTest, NestedAccessIsARead) {
    auto tree = script("foo.js", private_assign(qname("this.x"), number(1)),
                       expr_result(assign(qname("this.x.y"), number(2))));
    EXPECT_EQ(unused(*tree), Names{});
}

// /** @private */ this.a = 1;  /** @private */ this.b = 1;  /** @private */ this.c = 1;  f(this.b);
TEST_F(CheckUnusedPrivatePropertiesTest, ReportsFollowEncounterOrder) {
    auto tree = script("foo.js", private_assign(qname("this.c"), number(1)),
                       private_assign(qname("this.a"), number(1)),
                       private_assign(qname("this.b"), number(1)),
                       expr_result(call(name("f"), qname("this.b"))));
    EXPECT_EQ(unused(*tree), (Names{"c", "a"}));
}

// ============================================================================
// Compound Assignments and Updates
// ============================================================================

// /** @private */ this.x = 0;  this.x += 1;
TEST_F(CheckUnusedPrivatePropertiesTest, DiscardedCompoundAssignmentIsNotARead) {
    auto tree = script("foo.js", private_assign(qname("this.x"), number(0)),
                       expr_result(binary(Token::AssignAdd, qname("this.x"), number(1))));
    EXPECT_EQ(unused(*tree), Names{"x"});
}

// /** @private */ this.x = 0;  y = (this.x += 1);
TEST_F(CheckUnusedPrivatePropertiesTest, ConsumedCompoundAssignmentIsARead) {
    auto tree = script("foo.js", private_assign(qname("this.x"), number(0)),
                       expr_result(assign(name("y"),
                                          binary(Token::AssignAdd, qname("this.x"), number(1)))));
    EXPECT_EQ(unused(*tree), Names{});
}

// /** @private */ this.n = 0;  this.n++;  for (;; this.n--) {}
TEST_F(CheckUnusedPrivatePropertiesTest, DiscardedUpdatesAreNotReads) {
    auto tree = script("foo.js", private_assign(qname("this.n"), number(0)),
                       expr_result(inc(qname("this.n"))),
                       for_(empty(), empty(), dec(qname("this.n")), block()));
    EXPECT_EQ(unused(*tree), Names{"n"});
}

// /** @private */ this.n = 0;  return this.n++;
TEST_F(CheckUnusedPrivatePropertiesTest, ReturnedUpdateIsARead) {
    auto tree = script("foo.js", private_assign(qname("this.n"), number(0)),
                       function("f", block(return_(inc(qname("this.n"))))));
    EXPECT_EQ(unused(*tree), Names{});
}

// /** @private */ this.n = 0;  while (this.n ||= 1) {}
TEST_F(CheckUnusedPrivatePropertiesTest, LogicalAssignmentInConditionIsARead) {
    auto tree = script("foo.js", private_assign(qname("this.n"), number(0)),
                       while_(binary(Token::AssignOr, qname("this.n"), number(1)), block()));
    EXPECT_EQ(unused(*tree), Names{});
}

// ============================================================================
// Static and Prototype Definitions
// ============================================================================

// /** @constructor */ function Foo() {}
// /** @private */ Foo.bar = function() {};
TEST_F(CheckUnusedPrivatePropertiesTest, StaticOnRegisteredConstructorIsReported) {
    auto tree = script("foo.js", constructor_fn("Foo", block()),
                       private_assign(qname("Foo.bar"), empty_function()));
    EXPECT_EQ(unused(*tree), Names{"bar"});
}

// ... plus  var reflected = {bar: 1};
TEST_F(CheckUnusedPrivatePropertiesTest, ObjectLiteralKeySuppressesStatic) {
    auto tree = script("foo.js", constructor_fn("Foo", block()),
                       private_assign(qname("Foo.bar"), empty_function()),
                       var("reflected", object_lit(string_key("bar", number(1)))));
    EXPECT_EQ(unused(*tree), Names{});
}

// /** @private */ Bar.baz = 1;   (Bar is not a constructor)
TEST_F(CheckUnusedPrivatePropertiesTest, StaticOnUnknownObjectIsAUse) {
    auto tree = script("foo.js", private_assign(qname("Bar.baz"), number(1)));
    EXPECT_EQ(unused(*tree), Names{});
}

// /** @constructor */ var ns.Foo = function() {};  /** @private */ ns.Foo.x = 1;
TEST_F(CheckUnusedPrivatePropertiesTest, ConstructorRegisteredThroughAssignment) {
    auto tree =
        script("foo.js",
               expr_result(jsdoc(assign(qname("ns.Foo"), empty_function()), JSDocInfo::constructor_decl())),
               private_assign(qname("ns.Foo.x"), number(1)));
    EXPECT_EQ(unused(*tree), Names{"x"});
}

// /** @interface */ var I = function() {};  /** @private */ I.x = 1;
TEST_F(CheckUnusedPrivatePropertiesTest, InterfacesAreRegistered) {
    auto tree = script("foo.js", jsdoc(var("I", empty_function()), JSDocInfo::interface_decl()),
                       private_assign(qname("I.x"), number(1)));
    EXPECT_EQ(unused(*tree), Names{"x"});
}

// function helper() {}  /** @private */ helper.x = 1;
TEST_F(CheckUnusedPrivatePropertiesTest, PlainFunctionsAreNotRegistered) {
    auto tree = script("foo.js", function("helper", block()),
                       private_assign(qname("helper.x"), number(1)));
    EXPECT_EQ(unused(*tree), Names{});
}

// /** @private */ Foo.prototype.m = function() {};
TEST_F(CheckUnusedPrivatePropertiesTest, PrototypeMethodIsReported) {
    auto tree = script("foo.js", private_assign(qname("Foo.prototype.m"), empty_function()));
    EXPECT_EQ(unused(*tree), Names{"m"});
}

// ... plus  this.m();
TEST_F(CheckUnusedPrivatePropertiesTest, CalledPrototypeMethodIsUsed) {
    auto tree = script("foo.js", private_assign(qname("Foo.prototype.m"), empty_function()),
                       expr_result(call(qname("this.m"))));
    EXPECT_EQ(unused(*tree), Names{});
}

// ============================================================================
// Classes
// ============================================================================

// class Foo { /** @private */ m() {}  /** @private */ static s() {} }
TEST_F(CheckUnusedPrivatePropertiesTest, PrivateClassMethodsAreReported) {
    auto tree = script("foo.js",
                       class_("Foo", private_(member_function("m", empty_function())),
                              private_(static_member_function("s", empty_function()))));
    EXPECT_EQ(unused(*tree), (Names{"m", "s"}));
}

// class Foo { /** @private */ m() {}  run() { this.m(); } }
TEST_F(CheckUnusedPrivatePropertiesTest, CalledClassMethodIsUsed) {
    auto tree = script(
        "foo.js", class_("Foo", private_(member_function("m", empty_function())),
                         member_function("run", function("", block(expr_result(call(qname("this.m"))))))));
    EXPECT_EQ(unused(*tree), Names{});
}

// class Foo { /** @private */ constructor() {} }
TEST_F(CheckUnusedPrivatePropertiesTest, ConstructorIsNeverReported) {
    auto tree = script("foo.js", class_("Foo", private_(member_function("constructor", empty_function()))));
    EXPECT_EQ(unused(*tree), Names{});
}

// class Foo {}  /** @private */ Foo.count = 0;
TEST_F(CheckUnusedPrivatePropertiesTest, StaticOnDeclaredClassIsReported) {
    auto tree = script("foo.js", class_("Foo"), private_assign(qname("Foo.count"), number(0)));
    EXPECT_EQ(unused(*tree), Names{"count"});
}

// register(class {});
TEST_F(CheckUnusedPrivatePropertiesTest, AnonymousClassIsNotRegistered) {
    auto tree = script("foo.js", expr_result(call(name("register"), class_(""))));

    Compiler compiler(options, errors);
    auto& pass = compiler.passes().add_pass<CheckUnusedPrivateProperties>(compiler);
    compiler.process(*tree);
    EXPECT_EQ(pass.registry().size(), 0u);
}

// ============================================================================
// Type Declarations
// ============================================================================

// /** @private @typedef {string} */ this.Alias;   /** @private @interface */ this.Shape = ...
TEST_F(CheckUnusedPrivatePropertiesTest, TypedefsAndInterfacesAreNotChecked) {
    JSDocInfo typedef_info = JSDocInfo::with_visibility(ast::Visibility::Private);
    typedef_info.has_typedef = true;
    JSDocInfo interface_info = JSDocInfo::with_visibility(ast::Visibility::Private);
    interface_info.is_interface = true;

    auto tree = script("foo.js", expr_result(jsdoc(qname("this.Alias"), typedef_info)),
                       expr_result(jsdoc(assign(qname("this.Shape"), empty_function()), interface_info)));
    EXPECT_EQ(unused(*tree), Names{});
}

// ============================================================================
// Reflection
// ============================================================================

// ... /** @private */ this.a = 1; this.b = 1; this.c = 1; this.d = 1;
// x = {a: 1, get b() {}, set c(v) {}, d() {}};
TEST_F(CheckUnusedPrivatePropertiesTest, EveryObjectLiteralKeyKindSuppresses) {
    auto tree = script("foo.js", private_assign(qname("this.a"), number(1)),
                       private_assign(qname("this.b"), number(1)),
                       private_assign(qname("this.c"), number(1)),
                       private_assign(qname("this.d"), number(1)),
                       private_assign(qname("this.e"), number(1)),
                       expr_result(assign(name("x"), object_lit(string_key("a", number(1)),
                                                                getter("b", empty_function()),
                                                                setter("c", empty_function()),
                                                                member_function("d", empty_function()),
                                                                computed_prop(string("e"), number(1))))));
    EXPECT_EQ(unused(*tree), Names{"e"});
}

// /** @private */ this.m = 1;  JSCompiler_renameProperty("m", this);
TEST_F(CheckUnusedPrivatePropertiesTest, RenamePropertyCallSuppresses) {
    auto tree = script("foo.js", private_assign(qname("this.m"), number(1)),
                       expr_result(call(name("JSCompiler_renameProperty"), string("m"), this_())));
    EXPECT_EQ(unused(*tree), Names{});
}

// /** @private */ this.m = 1;  $jscomp.reflectProperty(name, this);  JSCompiler_renameProperty();
TEST_F(CheckUnusedPrivatePropertiesTest, RenameCallNeedsStringArgument) {
    auto tree = script("foo.js", private_assign(qname("this.m"), number(1)),
                       expr_result(call(qname("$jscomp.reflectProperty"), name("m"), this_())),
                       expr_result(call(name("JSCompiler_renameProperty"))));
    EXPECT_EQ(unused(*tree), Names{"m"});
}

// /** @private */ this.m = 1;  goog.reflect.objectProperty("m", this);
TEST_F(CheckUnusedPrivatePropertiesTest, GoogReflectRequiresClosureConvention) {
    auto make_tree = [] {
        return script("foo.js", private_assign(qname("this.m"), number(1)),
                      expr_result(call(qname("goog.reflect.objectProperty"), string("m"), this_())));
    };

    EXPECT_EQ(unused(*make_tree()), Names{"m"});

    options.coding_convention = "closure";
    EXPECT_EQ(unused(*make_tree()), Names{});
}

// ============================================================================
// Files and Registry Scope
// ============================================================================

// a.js: /** @private */ this.x = 1;    b.js: f(this.x);
TEST_F(CheckUnusedPrivatePropertiesTest, UsesDoNotCrossFiles) {
    auto tree = root(script("a.js", private_assign(qname("this.x"), number(1))),
                     script("b.js", expr_result(call(name("f"), qname("this.x")))),
                     script("c.js", private_assign(qname("this.y"), number(1))));

    EXPECT_EQ(unused(*tree), (Names{"x", "y"}));
    EXPECT_EQ(errors.all()[0].source_name, "a.js");
    EXPECT_EQ(errors.all()[1].source_name, "c.js");
}

// a.js: class Foo {}    b.js: /** @private */ Foo.bar = 1;
TEST_F(CheckUnusedPrivatePropertiesTest, RegistryScopeControlsCrossFileStatics) {
    auto tree = root(script("a.js", class_("Foo")),
                     script("b.js", private_assign(qname("Foo.bar"), number(1))));

    EXPECT_EQ(options.registry_scope, compiler::RegistryScope::WholeCompilation);
    EXPECT_EQ(unused(*tree), Names{"bar"});

    options.registry_scope = compiler::RegistryScope::PerFile;
    EXPECT_EQ(unused(*tree), Names{});
}

// ============================================================================
// Levels and Idempotence
// ============================================================================

TEST_F(CheckUnusedPrivatePropertiesTest, DisabledByDefault) {
    auto tree = script("foo.js", private_assign(qname("this.x"), number(1)));

    options.check_levels.clear();
    EXPECT_EQ(unused(*tree), Names{});
    EXPECT_EQ(errors.warning_count(), 0u);

    options.set_check_level("JSC_UNUSED_PRIVATE_PROPERTY", diag::CheckLevel::Error);
    EXPECT_EQ(unused(*tree), Names{"x"});
    EXPECT_EQ(errors.error_count(), 1u);
}

TEST_F(CheckUnusedPrivatePropertiesTest, RunningTwiceGivesSameReports) {
    // Foo.bar precedes the class, so only a stale registry would change the result.
    auto tree = root(script("a.js", private_assign(qname("Foo.bar"), number(1)),
                            class_("Foo", private_(member_function("m", empty_function())))),
                     script("b.js", private_assign(qname("this.y"), number(1))));

    Compiler compiler(options, errors);
    compiler.passes().add_pass<CheckUnusedPrivateProperties>(compiler);

    compiler.process(*tree);
    auto first = reported_names();
    errors.clear();
    compiler.process(*tree);

    EXPECT_EQ(first, (Names{"m", "y"}));
    EXPECT_EQ(reported_names(), first);
}

// ============================================================================
// Classification and Invariants
// ============================================================================

TEST(ClassifyNodeTest, KindsOfInterest) {
    EXPECT_TRUE(std::holds_alternative<lint::PropertyReference>(*lint::classify_node(*qname("a.b"))));
    EXPECT_TRUE(std::holds_alternative<lint::FileBoundary>(*lint::classify_node(*script("a.js"))));
    EXPECT_TRUE(std::holds_alternative<lint::ClassDecl>(*lint::classify_node(*class_("C"))));
    EXPECT_TRUE(std::holds_alternative<lint::CallSite>(*lint::classify_node(*call(name("f")))));
    EXPECT_EQ(lint::classify_node(*name("a")), std::nullopt);
    EXPECT_EQ(lint::classify_node(*getelem(name("a"), string("b"))), std::nullopt);
}

TEST(PinningUseTest, PositionsThatAreNotReads) {
    auto stub = script("a.js", expr_result(qname("this.a")));
    const ast::Node* prop = stub->first_child()->first_child();
    auto path = ast::collect_ancestors(*prop);
    EXPECT_FALSE(lint::is_pinning_property_use(*prop, ast::AncestorChain(path)));

    auto value = script("a.js", expr_result(assign(name("y"), qname("this.a"))));
    prop = value->first_child()->first_child()->second_child();
    path = ast::collect_ancestors(*prop);
    EXPECT_TRUE(lint::is_pinning_property_use(*prop, ast::AncestorChain(path)));

    auto orphan = qname("this.a");
    EXPECT_THROW((void)lint::is_pinning_property_use(*orphan, ast::AncestorChain()), InvariantError);
}

TEST(InvariantTest, PropNameOfUnexpectedNodeThrows) {
    EXPECT_EQ(lint::get_prop_name(*qname("this.a")), "a");
    EXPECT_EQ(lint::get_prop_name(*member_function("m", empty_function())), "m");
    EXPECT_THROW((void)lint::get_prop_name(*name("a")), InvariantError);
    EXPECT_THROW((void)lint::get_prop_name(*string_key("k", number(1))), InvariantError);
}

TEST(InvariantTest, DefinitionCheckRequiresGetProp) {
    diag::CollectingErrorManager errors;
    Compiler compiler(AnalysisOptions{}, errors);
    CheckUnusedPrivateProperties check(compiler);

    EXPECT_TRUE(check.is_candidate_property_definition(*qname("this.a")));
    EXPECT_TRUE(check.is_candidate_property_definition(*qname("X.prototype.a")));
    EXPECT_FALSE(check.is_candidate_property_definition(*qname("X.a")));
    EXPECT_THROW((void)check.is_candidate_property_definition(*name("a")), InvariantError);
}
