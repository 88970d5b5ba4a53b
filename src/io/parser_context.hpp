/**
 * @file parser_context.hpp
 * @brief bison パーサーが組み立て中の状態
 */
#ifndef TANSAKU_CSP_IO_PARSER_CONTEXT_HPP
#define TANSAKU_CSP_IO_PARSER_CONTEXT_HPP

#include "tansaku_csp/io/problem_file.hpp"
#include <memory>
#include <string>
#include <vector>

struct ParserContext {
    std::unique_ptr<tansaku_csp::io::ProblemFile> problem =
        std::make_unique<tansaku_csp::io::ProblemFile>();
    bool has_error = false;
    std::string error_message;

    // リスト要素の一時バッファ（文の終わりで problem に移す）
    std::vector<tansaku_csp::Domain::value_type> cells;
    std::vector<std::string> names;
};

#endif // TANSAKU_CSP_IO_PARSER_CONTEXT_HPP
