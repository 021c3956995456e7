#include <cstddef>
#include <cstdlib>
#include <exception>
#include <fstream>
#include <iostream>
#include <iterator>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include <eval/environment.hpp>
#include <eval/evaluator.hpp>
#include <eval/object.hpp>
#include <fmt/core.h>
#include <fmt/format.h>
#include <lexer/lexer.hpp>
#include <parser/parser.hpp>

namespace
{
constexpr auto prompt = "aki> ";

auto print_parse_errors(const std::vector<std::string>& errors)
{
    std::cerr << "parser errors:\n";
    for (const auto& error : errors) {
        std::cerr << "    " << error << '\n';
    }
}

auto print_eval_error(const object& result)
{
    std::cerr << "evaluation error: " << result.inspect() << '\n';
}

struct command_line_args
{
    bool help {};
    bool debug {};
    bool no_main {};
    bool mutate_outer {};
    std::string_view file;
};

[[noreturn]] auto show_usage(std::string_view program, std::string_view error_msg = {})
{
    auto exit_code = EXIT_SUCCESS;
    if (!error_msg.empty()) {
        fmt::print("Error: {}\n", error_msg);
        exit_code = EXIT_FAILURE;
    }
    fmt::print("Usage: {} [-d] [-n] [-o] [-h] [<file>]\n\n", program);
    fmt::print("  -d  dump the parsed program and the global scope after each run\n");
    fmt::print("  -n  do not call main() after running a file\n");
    fmt::print("  -o  assignments update the nearest enclosing binding\n");
    fmt::print("  -h  show this help\n");
    // NOLINTBEGIN(concurrency-mt-unsafe)
    exit(exit_code);
    // NOLINTEND(concurrency-mt-unsafe)
}

auto parse_command_line(std::string_view program, int argc, char** argv) -> command_line_args
{
    command_line_args opts {};
    for (std::string_view arg : std::span(argv, static_cast<size_t>(argc))) {
        if (arg[0] == '-' && arg.size() == 1) {
            show_usage(program, fmt::format("invalid option {}", arg));
        }
        if (arg[0] == '-' && arg.size() > 1) {
            switch (arg[1]) {
                case 'h':
                    opts.help = true;
                    break;
                case 'd':
                    opts.debug = true;
                    break;
                case 'n':
                    opts.no_main = true;
                    break;
                case 'o':
                    opts.mutate_outer = true;
                    break;
                default: {
                    show_usage(program, fmt::format("invalid option {}", arg));
                }
            }
        } else {
            if (opts.file.empty()) {
                opts.file = arg;
            } else {
                fmt::print("ignoring file argument {}, already have one set.\n", arg);
            }
        }
    }
    return opts;
}

auto trim(std::string_view input) -> std::string_view
{
    constexpr auto whitespace = " \t\r\n";
    const auto begin = input.find_first_not_of(whitespace);
    if (begin == std::string_view::npos) {
        return {};
    }
    return input.substr(begin, input.find_last_not_of(whitespace) - begin + 1);
}

auto options_from(const command_line_args& opts, bool invoke_main) -> evaluator_options
{
    return evaluator_options {
        .policy = opts.mutate_outer ? assignment_policy::mutate_outer : assignment_policy::define_local,
        .invoke_main = invoke_main,
    };
}

auto run_file(const command_line_args& opts) -> int
{
    std::ifstream ifs(std::string {opts.file});
    if (!ifs) {
        std::cerr << "ERROR: could not open file: " << opts.file << '\n';
        return 1;
    }
    const std::string contents {(std::istreambuf_iterator<char>(ifs)), (std::istreambuf_iterator<char>())};
    auto prsr = parser {lexer {contents, opts.file}};
    auto prgrm = prsr.parse_program();
    if (!prsr.errors().empty()) {
        print_parse_errors(prsr.errors());
        return 1;
    }
    if (opts.debug) {
        fmt::print("{}\n", prgrm->string());
    }
    auto eval = evaluator {{}, options_from(opts, !opts.no_main)};
    const auto result = eval.evaluate(*prgrm);
    if (opts.debug) {
        eval.env()->debug();
    }
    eval.env()->break_cycle();
    if (result.is_error()) {
        print_eval_error(result);
        return 1;
    }
    if (!result.is_unit()) {
        std::cout << result.inspect() << '\n';
    }
    return 0;
}

auto run_repl(const command_line_args& opts) -> int
{
    std::cout << "This is the Aki programming language.\n";
    std::cout << "Feel free to type in commands, exit or quit to leave\n";
    auto eval = evaluator {{}, options_from(opts, false)};
    auto show_prompt = []() { std::cout << prompt << std::flush; };
    auto input = std::string {};
    show_prompt();
    while (getline(std::cin, input)) {
        const auto trimmed = trim(input);
        if (trimmed.empty()) {
            show_prompt();
            continue;
        }
        if (trimmed == "exit" || trimmed == "quit") {
            break;
        }
        auto prsr = parser {lexer {input}};
        auto prgrm = prsr.parse_program();
        if (!prsr.errors().empty()) {
            print_parse_errors(prsr.errors());
            show_prompt();
            continue;
        }
        if (opts.debug) {
            fmt::print("{}\n", prgrm->string());
        }
        const auto result = eval.evaluate(*prgrm);
        if (result.is_error()) {
            print_eval_error(result);
        } else if (!result.is_unit()) {
            std::cout << result.inspect() << '\n';
        }
        if (opts.debug) {
            eval.env()->debug();
        }
        show_prompt();
    }
    eval.env()->break_cycle();
    return 0;
}
}  // namespace

auto main(int argc, char* argv[]) -> int
{
    auto program = std::string_view(*argv);
    auto opts = parse_command_line(program, argc - 1, ++argv);
    if (opts.help) {
        show_usage(program);
    }
    try {
        if (!opts.file.empty()) {
            return run_file(opts);
        }
        return run_repl(opts);

    } catch (const std::exception& e) {
        std::cerr << "Caught an exception: " << e.what() << '\n';
        return 1;
    }
}
