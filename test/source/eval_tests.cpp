#include <array>
#include <cstdint>
#include <limits>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include <eval/environment.hpp>
#include <eval/evaluator.hpp>
#include <eval/object.hpp>
#include <gtest/gtest.h>
#include <lexer/lexer.hpp>
#include <parser/parser.hpp>

#include "testutils.hpp"

// NOLINTBEGIN(*-magic-numbers)
auto assert_integer_object(const object& obj, int64_t expected) -> void
{
    ASSERT_TRUE(obj.is<integer_value>()) << "got " << obj.type_name() << " instead: " << obj.inspect();
    auto actual = obj.as<integer_value>();
    ASSERT_EQ(actual, expected);
}

auto assert_decimal_object(const object& obj, double expected) -> void
{
    ASSERT_TRUE(obj.is<decimal_value>()) << "got " << obj.type_name() << " instead: " << obj.inspect();
    ASSERT_DOUBLE_EQ(obj.as<decimal_value>(), expected);
}

auto assert_boolean_object(const object& obj, bool expected) -> void
{
    ASSERT_TRUE(obj.is<bool>()) << "got " << obj.type_name() << " instead: " << obj.inspect();
    auto actual = obj.as<bool>();
    ASSERT_EQ(actual, expected);
}

auto assert_unit_object(const object& obj) -> void
{
    ASSERT_TRUE(obj.is_unit()) << "got " << obj.type_name() << " instead: " << obj.inspect();
}

auto assert_string_object(const object& obj, const std::string& expected) -> void
{
    ASSERT_TRUE(obj.is<string_value>()) << "got " << obj.type_name() << " instead: " << obj.inspect();
    const auto& actual = obj.as<string_value>();
    ASSERT_EQ(actual, expected);
}

auto assert_error_object(const object& obj, error_kind expected_kind, const std::string& expected_error_message = {})
    -> void
{
    ASSERT_TRUE(obj.is<error>()) << "got " << obj.type_name() << " instead: " << obj.inspect();
    const auto& actual = obj.as<error>();
    EXPECT_EQ(actual.kind, expected_kind) << actual.message;
    if (!expected_error_message.empty()) {
        EXPECT_EQ(actual.message, expected_error_message);
    }
}

TEST(eval, testEvalIntegerExpresssion)
{
    struct expression_test
    {
        std::string_view input;
        int64_t expected;
    };
    std::array expression_tests {
        expression_test {"5", 5},
        expression_test {"10", 10},
        expression_test {"-5", -5},
        expression_test {"-10", -10},
        expression_test {"5 + 5 + 5 + 5 - 10", 10},
        expression_test {"2 * 2 * 2 * 2 * 2", 32},
        expression_test {"-50 + 100 + -50", 0},
        expression_test {"5 * 2 + 10", 20},
        expression_test {"5 + 2 * 10", 25},
        expression_test {"20 + 2 * -10", 0},
        expression_test {"50 / 2 * 2 + 10", 60},
        expression_test {"2 * (5 + 10)", 30},
        expression_test {"3 * 3 * 3 + 10", 37},
        expression_test {"3 * (3 * 3) + 10", 37},
        expression_test {"(5 + 10 * 2 + 15 / 3) * 2 + -10", 50},
        expression_test {"7 / 2", 3},
        expression_test {"-7 / 2", -3},
        expression_test {"7 / -2", -3},
        expression_test {"7 % 3", 1},
        expression_test {"-7 % 3", -1},
    };
    for (const auto& test : expression_tests) {
        const auto evaluated = test_eval(test.input);
        assert_integer_object(evaluated, test.expected);
    }
}

TEST(eval, testIntegerArithmeticWraps)
{
    constexpr auto max = std::numeric_limits<int64_t>::max();
    constexpr auto min = std::numeric_limits<int64_t>::min();
    assert_integer_object(test_eval("9223372036854775807 + 1"), min);
    assert_integer_object(test_eval("-9223372036854775807 - 2"), max);
    assert_integer_object(test_eval("9223372036854775807 * 2"), -2);
    assert_integer_object(test_eval("let m = -9223372036854775807 - 1; m / -1"), min);
    assert_integer_object(test_eval("let m = -9223372036854775807 - 1; -m"), min);
    assert_integer_object(test_eval("let m = -9223372036854775807 - 1; m % -1"), 0);
}

TEST(eval, testDivisionByZero)
{
    assert_error_object(test_eval("5 / 0"), error_kind::division_by_zero, "division by zero: 5 / 0");
    assert_error_object(test_eval("5 % 0"), error_kind::modulus_by_zero, "modulus by zero: 5 % 0");
    assert_error_object(test_eval("let a = 1; let b = 0; a / b + 10"), error_kind::division_by_zero);
}

TEST(eval, testEvalDecimalExpresssion)
{
    struct expression_test
    {
        std::string_view input;
        double expected;
    };
    std::array expression_tests {
        expression_test {"1.5", 1.5},
        expression_test {"-2.5", -2.5},
        expression_test {"1.5 + 2", 3.5},
        expression_test {"2 * 1.25", 2.5},
        expression_test {"1 / 2.0", 0.5},
        expression_test {"7.5 % 2", 1.5},
        expression_test {"3.0 - 0.5", 2.5},
    };
    for (const auto& test : expression_tests) {
        assert_decimal_object(test_eval(test.input), test.expected);
    }
}

TEST(eval, testDecimalDivisionByZeroFollowsIeee)
{
    const auto result = test_eval("1.0 / 0");
    ASSERT_TRUE(result.is<decimal_value>());
    EXPECT_EQ(result.as<decimal_value>(), std::numeric_limits<double>::infinity());
}

TEST(eval, testEvalBooleanExpresssion)
{
    struct expression_test
    {
        std::string_view input;
        bool expected;
    };
    std::array expression_tests {
        expression_test {"true", true},
        expression_test {"false", false},
        expression_test {"1 < 2", true},
        expression_test {"1 > 2", false},
        expression_test {"1 < 1", false},
        expression_test {"1 > 1", false},
        expression_test {"1 <= 1", true},
        expression_test {"2 >= 3", false},
        expression_test {"1 == 1", true},
        expression_test {"1 != 1", false},
        expression_test {"1 == 2", false},
        expression_test {"1 != 2", true},
        expression_test {"1.5 < 2", true},
        expression_test {"2 == 2.0", true},
        expression_test {"true == true", true},
        expression_test {"true != false", true},
        expression_test {"(1 < 2) == true", true},
        expression_test {"true && false", false},
        expression_test {"true || false", true},
        expression_test {"!true", false},
        expression_test {"!!true", true},
        expression_test {R"("a" < "b")", true},
        expression_test {R"("abc" == "abc")", true},
        expression_test {R"("abc" != "abd")", true},
        expression_test {"(1 + 1) == 2", true},
    };
    for (const auto& test : expression_tests) {
        const auto evaluated = test_eval(test.input);
        assert_boolean_object(evaluated, test.expected);
    }
}

TEST(eval, testLogicalOperatorsEvaluateBothSides)
{
    const auto result = test_eval("let x = 1; let b = false && { x = 2; true }; x");
    assert_integer_object(result, 2);
}

TEST(eval, testStrings)
{
    assert_string_object(test_eval(R"("Hello" + " " + "World!")"), "Hello World!");
    assert_string_object(test_eval(R"("abc"[1])"), "b");
    assert_string_object(test_eval(R"("tab\there")"), "tab\there");
}

TEST(eval, testTypeMismatch)
{
    struct error_test
    {
        std::string_view input;
        std::string expected_message;
    };
    std::array error_tests {
        error_test {"5 + true;", "unsupported operand types for +: Integer and Boolean"},
        error_test {"5 + true; 5;", "unsupported operand types for +: Integer and Boolean"},
        error_test {"-true", "unsupported operand type for -: Boolean"},
        error_test {"!1", "unsupported operand type for !: Integer"},
        error_test {"true + false;", "unsupported operand types for +: Boolean and Boolean"},
        error_test {R"("a" - "b")", "unsupported operand types for -: String and String"},
        error_test {"true && 1", "unsupported operand types for &&: Boolean and Integer"},
        error_test {"[1] == [1]", "unsupported operand types for ==: Vector and Vector"},
        error_test {"if 1 { 2 }", "if condition must be Boolean, got Integer"},
        error_test {"if (10 > 1) { true + false; }", "unsupported operand types for +: Boolean and Boolean"},
        error_test {"[1, 2][true]", "Vector index must be Integer, got Boolean"},
        error_test {"map(\"a\", 1)[1]", "Map key must be String, got Integer"},
        error_test {"5[0]", "index operator not supported: Integer"},
        error_test {"let x = 5; x(1)", "x is not a function: Integer"},
    };
    for (const auto& test : error_tests) {
        assert_error_object(test_eval(test.input), error_kind::type_mismatch, test.expected_message);
    }
}

TEST(eval, testUndefinedVariable)
{
    assert_error_object(test_eval("foobar"), error_kind::undefined_variable, "identifier not found: foobar");
    assert_error_object(test_eval("y += 1"), error_kind::undefined_variable, "identifier not found: y");
    assert_error_object(test_eval("y++"), error_kind::undefined_variable);
}

TEST(eval, testLetStatements)
{
    struct let_test
    {
        std::string_view input;
        int64_t expected;
    };
    std::array let_tests {
        let_test {"let a = 5; a;", 5},
        let_test {"let x: i32 = 7; x", 7},
        let_test {"let a = 5 * 5; a;", 25},
        let_test {"let a = 5; let b = a; b;", 5},
        let_test {"let a = 5; let b = a; let c = a + b + 5; c;", 15},
        let_test {"let a = 5; let a = a + 1; a", 6},
    };
    for (const auto& test : let_tests) {
        assert_integer_object(test_eval(test.input), test.expected);
    }
}

TEST(eval, testLetYieldsValueAndDefaultsToUnit)
{
    assert_integer_object(test_eval("let a = 3;"), 3);
    assert_unit_object(test_eval("let a: i32; a"));
}

TEST(eval, testIfElseExpressions)
{
    assert_integer_object(test_eval("if true { 10 }"), 10);
    assert_unit_object(test_eval("if false { 10 }"));
    assert_integer_object(test_eval("if (1 < 2) { 10 }"), 10);
    assert_unit_object(test_eval("if 1 > 2 { 10 }"));
    assert_integer_object(test_eval("if 1 > 2 { 10 } else { 20 }"), 20);
    assert_integer_object(test_eval("if 1 < 2 { 10 } else { 20 }"), 10);
    assert_integer_object(test_eval("let x = 5; if x > 10 { 1 } else if x > 3 { 2 } else { 3 }"), 2);
    assert_integer_object(test_eval("let v = if false { 1 } else { 2 }; v * 10"), 20);
}

TEST(eval, testBlocks)
{
    assert_unit_object(test_eval("{ }"));
    assert_integer_object(test_eval("{ let a = 2; a * 3 }"), 6);
    assert_unit_object(test_eval(""));
}

TEST(eval, testWhileLoop)
{
    assert_integer_object(test_eval("let i = 0; let sum = 0; while i < 5 { sum += i; i++; } sum"), 10);
    assert_unit_object(test_eval("let i = 0; while i < 3 { i += 1; }"));
    assert_integer_object(test_eval("let i = 10; while i < 3 { i += 1; } i"), 10);
}

TEST(eval, testWhileConditionMustStayBoolean)
{
    auto [prgrm, _] = assert_program(R"r(
let c = true;
let iterations = 0;
while c {
    iterations += 1;
    if iterations == 2 { c = 5; }
}
)r");
    auto eval = evaluator {};
    const auto result = eval.evaluate(*prgrm);
    assert_error_object(result, error_kind::type_mismatch, "while condition must be Boolean, got Integer");
    const auto iterations = eval.env()->get("iterations");
    ASSERT_TRUE(iterations.has_value());
    assert_integer_object(iterations.value(), 2);
}

TEST(eval, testFunctionDeclarationAndCall)
{
    assert_integer_object(test_eval("func add(x: i32, y: i32) -> i32 { x + y } add(5, 3);"), 8);
    assert_integer_object(test_eval("func identity(x: dyn) { x; } identity(5);"), 5);
    assert_integer_object(test_eval("func double(x: i64) { x * 2; } double(5);"), 10);
    assert_integer_object(test_eval("func add(x: i64, y: i64) { x + y; } add(5 + 5, add(5, 5));"), 20);
    assert_unit_object(test_eval("func nothing() { } nothing()"));
}

TEST(eval, testFunctionDeclarationYieldsFunction)
{
    const auto result = test_eval("func add(a: i32, b: i32) { a + b }");
    ASSERT_TRUE(result.is<function_value>());
    const auto& func = result.as<function_value>();
    EXPECT_EQ(func.name, "add");
    EXPECT_EQ(func.parameters, (std::vector<std::string> {"a", "b"}));
    EXPECT_EQ(result.inspect(), "func add(a, b)");
}

TEST(eval, testArityMismatch)
{
    assert_error_object(test_eval("func add(x: i32, y: i32) { x + y } add(1)"),
                        error_kind::arity_mismatch,
                        "wrong number of arguments to add(): expected=2, got=1");
    assert_error_object(test_eval("func none() { 1 } none(1, 2)"), error_kind::arity_mismatch);
}

TEST(eval, testRecursion)
{
    const auto* input = R"r(
func fib(n: i64) -> i64 {
    if n < 2 { n } else { fib(n - 1) + fib(n - 2) }
}
fib(15)
)r";
    assert_integer_object(test_eval(input), 610);
}

TEST(eval, testClosuresSeeLaterDefinitions)
{
    const auto* input = R"r(
func first() { second() + 1 }
func second() { 41 }
first()
)r";
    assert_integer_object(test_eval(input), 42);
}

TEST(eval, testNestedFunctionsCaptureEnclosingScope)
{
    const auto* input = R"r(
func outer(x: i64) {
    func inner(y: i64) { x + y }
    inner(10)
}
outer(5)
)r";
    assert_integer_object(test_eval(input), 15);
}

TEST(eval, testCallScopesAreReleasedOnReturn)
{
    auto globals = std::make_shared<environment>();
    auto eval = evaluator {globals};
    {
        auto [prgrm, _] = assert_program("func outer(x: i64) { func inner(y: i64) { x + y } inner(1) } 0");
        eval.evaluate(*prgrm);
    }
    const auto holders = globals.use_count();
    auto [prgrm, _] = assert_program("let i = 0; let sum = 0; while i < 10 { sum += outer(i); i++; } sum");
    assert_integer_object(eval.evaluate(*prgrm), 55);
    EXPECT_EQ(globals.use_count(), holders);
    globals->break_cycle();
}

TEST(eval, testEscapingClosuresKeepTheirScope)
{
    {
        auto [prgrm, _] = assert_program("func make(n: i64) { func get() { n } get } let g = make(5); g()");
        auto eval = evaluator {};
        assert_integer_object(eval.evaluate(*prgrm), 5);
        const auto escaped = eval.env()->get("g");
        ASSERT_TRUE(escaped.has_value());
        ASSERT_TRUE(escaped->is<function_value>());
        escaped->as<function_value>().closure->break_cycle();
        eval.env()->break_cycle();
    }
    const auto* input = R"r(
let saved = 0;
func make() { let n = 7; func get() { n } saved = get; 0 }
make();
saved()
)r";
    auto [prgrm, _] = assert_program(input);
    auto eval = evaluator {{}, {.policy = assignment_policy::mutate_outer, .invoke_main = false}};
    assert_integer_object(eval.evaluate(*prgrm), 7);
    const auto escaped = eval.env()->get("saved");
    ASSERT_TRUE(escaped.has_value());
    ASSERT_TRUE(escaped->is<function_value>());
    escaped->as<function_value>().closure->break_cycle();
    eval.env()->break_cycle();
}

TEST(eval, testParametersDoNotLeak)
{
    assert_error_object(test_eval("func f(p: i32) { p } f(1); p"), error_kind::undefined_variable);
}

TEST(eval, testAssignmentDefinesLocallyByDefault)
{
    const auto* input = R"r(
let x = 1;
func set() { x = 2; x }
let inner = set();
x * 10 + inner
)r";
    assert_integer_object(test_eval(input), 12);
}

TEST(eval, testAssignmentMutatesOuterWhenConfigured)
{
    const auto* input = R"r(
let x = 1;
func set() { x = 2; x }
let inner = set();
x * 10 + inner
)r";
    assert_integer_object(test_eval(input, {.policy = assignment_policy::mutate_outer, .invoke_main = false}), 22);
}

TEST(eval, testCompoundAssignmentFollowsPolicy)
{
    const auto* input = R"r(
let count = 0;
func bump() { count += 1; count++; ++count; }
bump();
count
)r";
    assert_integer_object(test_eval(input), 0);
    assert_integer_object(test_eval(input, {.policy = assignment_policy::mutate_outer, .invoke_main = false}), 3);
}

TEST(eval, testAssignmentExpressions)
{
    struct assign_test
    {
        std::string_view input;
        int64_t expected;
    };
    std::array assign_tests {
        assign_test {"let x = 1; x = 5", 5},
        assign_test {"let x = 1; x = 5; x", 5},
        assign_test {"x = 3; x", 3},
        assign_test {"let x = 1; x += 4", 5},
        assign_test {"let x = 1; x -= 4", -3},
        assign_test {"let x = 1; x++", 2},
        assign_test {"let x = 1; x--", 0},
        assign_test {"let x = 1; ++x", 2},
        assign_test {"let x = 1; --x", 0},
        assign_test {"let x = 1; x++; x++; x", 3},
        assign_test {"let a = 0; let b = 0; a = b = 7; a + b", 14},
    };
    for (const auto& test : assign_tests) {
        assert_integer_object(test_eval(test.input), test.expected);
    }
    assert_decimal_object(test_eval("let f = 1.5; f += 1; f"), 2.5);
    assert_string_object(test_eval(R"(let s = "a"; s += "b"; s)"), "ab");
}

TEST(eval, testInvalidAssignmentTarget)
{
    assert_error_object(test_eval("1 = 2"), error_kind::invalid_assignment_target, "cannot assign to 1");
    assert_error_object(test_eval("let a = 1; let b = 2; a + b++"), error_kind::invalid_assignment_target);
    assert_error_object(test_eval("++5"), error_kind::invalid_assignment_target);
    assert_error_object(test_eval("let v = [1]; v[0] += 1"), error_kind::invalid_assignment_target);
    assert_error_object(test_eval("(1 + 2) = f()"), error_kind::invalid_assignment_target, "cannot assign to (1 + 2)");
    assert_error_object(test_eval("[0][0] -= missing"), error_kind::invalid_assignment_target);
}

TEST(eval, testInvalidAssignmentTargetSkipsTheValue)
{
    auto [prgrm, _] = assert_program("let n = 0; func touch() { n = 5; 0 } (n + 1) += touch();");
    auto eval = evaluator {{}, {.policy = assignment_policy::mutate_outer, .invoke_main = false}};
    assert_error_object(eval.evaluate(*prgrm), error_kind::invalid_assignment_target);
    const auto untouched = eval.env()->get("n");
    ASSERT_TRUE(untouched.has_value());
    assert_integer_object(untouched.value(), 0);
    eval.env()->break_cycle();
}

TEST(eval, testCompoundAssignmentReadsTargetFirst)
{
    const auto* input = R"r(
let x = 1;
func bump() { x = 10; 0 }
x += bump();
x
)r";
    assert_integer_object(test_eval(input, {.policy = assignment_policy::mutate_outer, .invoke_main = false}), 1);
    assert_integer_object(
        test_eval("let x = 1; func bump() { x = 10; 2 } x -= bump(); x",
                  {.policy = assignment_policy::mutate_outer, .invoke_main = false}),
        -1);
}

TEST(eval, testVectorLiterals)
{
    const auto result = test_eval("[1, 2 * 2, 3 + 3]");
    ASSERT_TRUE(result.is<vector_value>());
    const auto& vec = result.as<vector_value>();
    ASSERT_EQ(vec.size(), 3U);
    assert_integer_object(vec[0], 1);
    assert_integer_object(vec[1], 4);
    assert_integer_object(vec[2], 6);
    EXPECT_EQ(result.inspect(), "[1, 4, 6]");
}

TEST(eval, testIndexExpressions)
{
    struct index_test
    {
        std::string_view input;
        int64_t expected;
    };
    std::array index_tests {
        index_test {"[1, 2, 3][0]", 1},
        index_test {"[1, 2, 3][1]", 2},
        index_test {"[1, 2, 3][2]", 3},
        index_test {"let i = 0; [1][i];", 1},
        index_test {"[1, 2, 3][1 + 1];", 3},
        index_test {"let myArray = [1, 2, 3]; myArray[2];", 3},
        index_test {"let myArray = [1, 2, 3]; myArray[0] + myArray[1] + myArray[2];", 6},
        index_test {"let myArray = [1, 2, 3]; let i = myArray[0]; myArray[i]", 2},
        index_test {R"(map("a", 5, "b", 6)["b"])", 6},
        index_test {"[[1, 2], [3, 4]][1][0]", 3},
    };
    for (const auto& test : index_tests) {
        assert_integer_object(test_eval(test.input), test.expected);
    }
}

TEST(eval, testIndexOutOfBounds)
{
    assert_error_object(
        test_eval("[1, 2, 3][5]"), error_kind::index_out_of_bounds, "index 5 out of bounds for length 3");
    assert_error_object(test_eval("[1, 2, 3][-1]"), error_kind::index_out_of_bounds);
    assert_error_object(test_eval(R"("abc"[3])"), error_kind::index_out_of_bounds);
}

TEST(eval, testKeyNotFound)
{
    assert_error_object(test_eval(R"(map("a", 1)["b"])"), error_kind::key_not_found, R"(key not found: "b")");
}

TEST(eval, testCalleeResolution)
{
    assert_error_object(test_eval("nope(1)"), error_kind::unknown_function, "unknown function: nope");
    assert_integer_object(test_eval("func len(x: dyn) { 42 } len(\"abc\")"), 42);
    assert_integer_object(test_eval("let len = 5; len(\"abc\")"), 3);
}

TEST(eval, testErrorsStopEvaluation)
{
    auto [prgrm, _] = assert_program("let a = 1; let b = a / 0; let c = 3;");
    auto eval = evaluator {};
    assert_error_object(eval.evaluate(*prgrm), error_kind::division_by_zero);
    EXPECT_TRUE(eval.env()->get("a").has_value());
    EXPECT_FALSE(eval.env()->get("b").has_value());
    EXPECT_FALSE(eval.env()->get("c").has_value());
}

TEST(eval, testErrorsPropagateOutOfCalls)
{
    const auto* input = R"r(
func inner() { [1][3] }
func outer() { inner() + 1 }
outer()
)r";
    assert_error_object(test_eval(input), error_kind::index_out_of_bounds);
}

TEST(eval, testConcurrencyIsUnimplemented)
{
    assert_error_object(test_eval("channel()"), error_kind::unimplemented_node_kind);
    assert_error_object(test_eval("let ch = channel;"), error_kind::unimplemented_node_kind);
    assert_error_object(test_eval("send(ch, 1)"), error_kind::unimplemented_node_kind);
    assert_error_object(test_eval("recv(ch)"), error_kind::unimplemented_node_kind);
    assert_error_object(test_eval("await 1"), error_kind::unimplemented_node_kind);
}

TEST(eval, testMainIsInvokedWhenConfigured)
{
    const auto* input = R"r(
let base = 40;
func main() { base + 2 }
)r";
    assert_integer_object(test_eval(input, {.policy = assignment_policy::define_local, .invoke_main = true}), 42);
}

TEST(eval, testMainIsNotInvokedByDefault)
{
    const auto result = test_eval("func main() { 42 }");
    ASSERT_TRUE(result.is<function_value>());
}

TEST(eval, testMainIsSkippedAfterErrors)
{
    const auto* input = R"r(
func main() { 42 }
undefined_name
)r";
    assert_error_object(test_eval(input, {.policy = assignment_policy::define_local, .invoke_main = true}),
                        error_kind::undefined_variable);
}

TEST(eval, testMainErrorsArePropagated)
{
    assert_error_object(test_eval("func main() { 1 / 0 }", {.policy = assignment_policy::define_local, .invoke_main = true}),
                        error_kind::division_by_zero);
}

TEST(eval, testSharedBindingsShareTheirCell)
{
    const auto* input = R"r(
let a: @i64 = 1;
let b = a;
b += 5;
a
)r";
    assert_integer_object(test_eval(input), 6);
}

TEST(eval, testSharedBindingsAreWrittenThroughFromClosures)
{
    const auto* input = R"r(
let counter: @i64 = 0;
func bump() { counter += 1; counter = counter * 10; }
bump();
bump();
counter
)r";
    assert_integer_object(test_eval(input), 110);
    assert_integer_object(test_eval("let s: @i64 = 1; func bump() -> i64 { s = 10; 0 } s += bump(); s"), 1);
}

TEST(eval, testSharedValuesAreDereferencedAsOperands)
{
    assert_integer_object(test_eval("let a: @i64 = 4; a * a"), 16);
    assert_boolean_object(test_eval("let flag: @bool = true; if flag { true } else { false }"), true);
    assert_integer_object(test_eval("let i: @i64 = 1; [10, 20][i]"), 20);
    assert_integer_object(test_eval("func twice(v: i64) { v * 2 } let s: @i64 = 21; twice(s)"), 42);
    assert_integer_object(test_eval("let a: @i64 = 1; a"), 1);
}

TEST(eval, testReplStateSurvivesAcrossPrograms)
{
    auto eval = evaluator {};
    {
        auto [prgrm, _] = assert_program("func add(x: i64, y: i64) { x + y } let a: @i64 = 2;");
        eval.evaluate(*prgrm);
    }
    auto [prgrm, _] = assert_program("add(a, 40)");
    assert_integer_object(eval.evaluate(*prgrm), 42);
    eval.env()->break_cycle();
}

// NOLINTEND(*-magic-numbers)
