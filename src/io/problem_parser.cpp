#include "problem_parser.hpp"
#include "parser_context.hpp"
#include "parser.hpp"
#include <stdexcept>
#include <utility>

namespace tansaku_csp {
namespace io {

namespace {

// yylex_init / yylex_destroy の対
class ScannerGuard {
public:
    ScannerGuard() {
        if (yylex_init(&scanner_) != 0) {
            throw std::runtime_error("Cannot initialize the problem file scanner");
        }
    }
    ~ScannerGuard() { yylex_destroy(scanner_); }

    ScannerGuard(const ScannerGuard&) = delete;
    ScannerGuard& operator=(const ScannerGuard&) = delete;

    yyscan_t get() const { return scanner_; }

private:
    yyscan_t scanner_ = nullptr;
};

// yy_scan_string / yy_delete_buffer の対（scanner より先に破棄すること）
class StringBufferGuard {
public:
    StringBufferGuard(const std::string& input, yyscan_t scanner)
        : buffer_(yy_scan_string(input.c_str(), scanner))
        , scanner_(scanner) {}
    ~StringBufferGuard() { yy_delete_buffer(buffer_, scanner_); }

    StringBufferGuard(const StringBufferGuard&) = delete;
    StringBufferGuard& operator=(const StringBufferGuard&) = delete;

private:
    YY_BUFFER_STATE buffer_;
    yyscan_t scanner_;
};

using FilePtr = std::unique_ptr<FILE, decltype(&fclose)>;

// 入力をセット済みの scanner で構文解析し、ProblemFile を取り出す
std::unique_ptr<ProblemFile> run_parser(yyscan_t scanner) {
    ParserContext ctx;
    if (yyparse(scanner, &ctx) != 0 || ctx.has_error) {
        throw std::runtime_error("Parse error: " + ctx.error_message);
    }
    return std::move(ctx.problem);
}

} // namespace

std::unique_ptr<ProblemFile> parse_file(const std::string& filename) {
    FilePtr file(fopen(filename.c_str(), "r"), &fclose);
    if (!file) {
        throw std::runtime_error("Cannot open file: " + filename);
    }

    ScannerGuard scanner;
    yyset_in(file.get(), scanner.get());
    return run_parser(scanner.get());
}

std::unique_ptr<ProblemFile> parse_string(const std::string& input) {
    ScannerGuard scanner;
    StringBufferGuard buffer(input, scanner.get());
    return run_parser(scanner.get());
}

} // namespace io
} // namespace tansaku_csp
