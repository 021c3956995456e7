#include <iostream>
#include <string_view>
#include <utility>

#include "testutils.hpp"

#include <eval/environment.hpp>
#include <eval/evaluator.hpp>
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <gtest/gtest.h>
#include <lexer/lexer.hpp>

auto assert_no_parse_errors(const parser& prsr) -> bool
{
    EXPECT_TRUE(prsr.errors().empty()) << "expected no errors, got: "
                                       << fmt::format("{}", fmt::join(prsr.errors(), ", "));
    return !prsr.errors().empty();
}

auto assert_program(std::string_view input) -> parsed_program
{
    auto prsr = parser {lexer {input}};
    auto prgrm = prsr.parse_program();
    if (assert_no_parse_errors(prsr)) {
        std::cerr << "while parsing: `" << input << "`";
    };
    return {std::move(prgrm), std::move(prsr)};
}

auto test_eval(std::string_view input, evaluator_options options) -> object
{
    auto [prgrm, prsr] = assert_program(input);
    auto eval = evaluator {{}, options};
    auto result = eval.evaluate(*prgrm);
    eval.env()->break_cycle();
    return result;
}
