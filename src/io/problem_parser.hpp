/**
 * @file problem_parser.hpp
 * @brief 問題ファイル（sudoku / palette / region 文）の読み込み
 *
 * flex/bison が生成する reentrant scanner と pure parser を駆動する。
 * scanner・入力ファイル・文字列バッファは例外が飛んでも解放される。
 */
#ifndef TANSAKU_CSP_IO_PROBLEM_PARSER_HPP
#define TANSAKU_CSP_IO_PROBLEM_PARSER_HPP

#include "tansaku_csp/io/problem_file.hpp"
#include <cstdio>
#include <memory>
#include <string>

// flex/bison 生成コードの宣言
typedef void* yyscan_t;
struct ParserContext;
struct yy_buffer_state;
typedef struct yy_buffer_state* YY_BUFFER_STATE;

int yylex_init(yyscan_t* scanner);
int yylex_destroy(yyscan_t scanner);
void yyset_in(FILE* in, yyscan_t scanner);
YY_BUFFER_STATE yy_scan_string(const char* str, yyscan_t scanner);
void yy_delete_buffer(YY_BUFFER_STATE buffer, yyscan_t scanner);
int yyparse(yyscan_t scanner, ParserContext* ctx);

namespace tansaku_csp {
namespace io {

/**
 * @brief 問題ファイルを読み込む
 * @throws std::runtime_error "Cannot open file: ..." または "Parse error: line N: ..."
 */
std::unique_ptr<ProblemFile> parse_file(const std::string& filename);

/**
 * @brief 文字列から読み込む（テスト用）
 * @throws std::runtime_error "Parse error: line N: ..."
 */
std::unique_ptr<ProblemFile> parse_string(const std::string& input);

} // namespace io
} // namespace tansaku_csp

#endif // TANSAKU_CSP_IO_PROBLEM_PARSER_HPP
