//===----------------------------------------------------------------------===//
//
// Part of the Fountain project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file Parser.hpp
/// @brief Recursive descent parser for the Fountain language.
///
/// @details The parser pulls tokens from the Lexer on demand into a small
/// buffer and builds a Program. Each precedence level has its own method,
/// and each level only ever calls the level directly above it, so a
/// lower-precedence operator can appear inside a higher level only through
/// parentheses.
///
/// ## Grammar Overview
///
/// ```
/// program     = stmt* EOF
/// stmt        = simple_stmt ";"?
/// simple_stmt = block | print_stmt | if_stmt | for_stmt | fn_stmt
///             | "break" | "continue" | "return" expression?
///             | assert_stmt | assign_stmt | expr_stmt
/// block       = "do" stmt* "end"
/// if_stmt     = "if" expression "do" stmt* ("else" stmt*)? "end"
/// for_stmt    = "for" "do" stmt* "end"
/// fn_stmt     = "fn" IDENT "(" parameters? ")" stmt* "end"
/// assign_stmt = (IDENT | index | field) ("=" | "+=" | "-=" | "*=" | "/=") expression
/// expression  = disjunction ("if" disjunction "else" expression)?
/// ```
///
/// ## Error Handling
///
/// Only the first syntax error is reported (code F2000). Every parse method
/// returns nullptr once an error has been seen and callers unwind
/// immediately; there is no resynchronization.
///
/// ## Usage Example
///
/// ```cpp
/// DiagnosticEngine diag;
/// Lexer lexer(source, fileId, diag);
/// Parser parser(lexer, diag);
///
/// auto program = parser.parseProgram();
/// if (!program) {
///     // diag holds the lexical or syntax error
/// }
/// ```
///
/// @see Lexer.hpp - Token source
/// @see AST.hpp - AST node types
/// @see Resolver.hpp - Control-flow placement checks run after parsing
///
//===----------------------------------------------------------------------===//

#pragma once

#include "frontends/fountain/AST.hpp"
#include "frontends/fountain/Lexer.hpp"
#include "support/diagnostics.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace fountain::frontends::fountain
{

/// @brief Maximum nesting of unary/grouping expressions before the parser
///        refuses the input.
inline constexpr int kMaxExprDepth = 256;

/// @brief Maximum nesting of statements (blocks, ifs, loops, functions).
inline constexpr int kMaxStmtDepth = 256;

/// @brief Maximum number of arguments in a call or parameters in a declaration.
inline constexpr size_t kMaxArguments = 255;

/// @brief Recursive descent parser for Fountain.
class Parser
{
  public:
    /// @brief Create a parser reading from @p lexer.
    /// @param lexer Token source; borrowed, must outlive the parser.
    /// @param diag Diagnostic engine receiving syntax errors.
    Parser(Lexer &lexer, ::fountain::support::DiagnosticEngine &diag);

    /// @brief Parse a complete program.
    /// @return The program, or nullptr when a lexical or syntax error occurred.
    ProgramPtr parseProgram();

    /// @brief Parse a single expression followed by end of input.
    /// @details Used by tests and by tooling that evaluates bare expressions.
    ExprPtr parseStandaloneExpression();

    /// @brief Check if any errors occurred during parsing.
    [[nodiscard]] bool hasError() const
    {
        return hasError_;
    }

  private:
    //=========================================================================
    /// @name Token Handling
    /// @{
    //=========================================================================

    /// @brief Look ahead @p offset tokens, pulling from the lexer as needed.
    const Token &peek(size_t offset = 0);

    /// @brief Consume the current token and return it.
    Token advance();

    bool check(TokenKind kind, size_t offset = 0);

    /// @brief Consume the current token if it has kind @p kind.
    bool match(TokenKind kind, Token *out = nullptr);

    /// @brief Consume a token of kind @p kind or report "expected <what>".
    bool expect(TokenKind kind, const char *what, Token *out = nullptr);

    /// @brief True when the current token can begin an expression.
    bool atExpressionStart();

    /// @}
    //=========================================================================
    /// @name Error Handling
    /// @{
    //=========================================================================

    /// @brief Report an error at the current token.
    /// @details Errors at a lexer Error token are not reported again; the
    ///          lexer already described the problem.
    void error(const std::string &message);

    void errorAt(SourceLoc loc, const std::string &message);

    /// @brief RAII helper for bounded backtracking.
    /// @details Suppresses diagnostics while active. If not committed, restores
    ///          token position and error state when destroyed.
    class Speculation
    {
      public:
        explicit Speculation(Parser &parser);
        ~Speculation();

        Speculation(const Speculation &) = delete;
        Speculation &operator=(const Speculation &) = delete;

        void commit()
        {
            committed_ = true;
        }

      private:
        Parser &parser_;
        size_t savedPos_;
        bool savedHasError_;
        bool committed_{false};
    };

    /// @}
    //=========================================================================
    /// @name Statement Parsing
    /// @{
    //=========================================================================

    StmtPtr parseStatement();
    StmtPtr parseSimpleStatement();

    /// @brief Parse statements until one of the terminators (or EOF) is next.
    /// @return False when a nested statement failed to parse.
    bool parseStatementsUntil(StmtList &out, TokenKind terminator,
                              TokenKind alternate = TokenKind::Eof);

    /// @brief Parse `do stmt* end` after the `do` has been consumed.
    StmtPtr parseBlock(SourceLoc loc);
    StmtPtr parsePrintStmt(SourceLoc loc);
    StmtPtr parseIfStmt(SourceLoc loc);
    StmtPtr parseForStmt(SourceLoc loc);
    StmtPtr parseFnDecl(SourceLoc loc);
    StmtPtr parseReturnStmt(SourceLoc loc);
    StmtPtr parseAssertStmt(SourceLoc loc);

    /// @brief Parse an expression statement, turning it into an assignment
    ///        when an assignment operator follows a valid target.
    StmtPtr parseAssignOrExprStmt();

    /// @brief Parse `IDENT ("=" expression)?` entries of a parameter list.
    bool parseParameters(std::vector<Param> &out);

    /// @}
    //=========================================================================
    /// @name Expression Parsing
    /// @{
    //=========================================================================

    ExprPtr parseExpression();
    ExprPtr parseConditional();
    ExprPtr parseDisjunction();
    ExprPtr parseConjunction();
    ExprPtr parseEquality();
    ExprPtr parseComparison();
    ExprPtr parseTerm();
    ExprPtr parseFactor();
    ExprPtr parseUnary();

    /// @brief Parse a primary followed by any chain of calls, subscripts and
    ///        field accesses.
    ExprPtr parseCall();
    ExprPtr parsePrimary();

    /// @brief Parse the argument list after '(' up to and including ')'.
    bool parseArguments(std::vector<CallArg> &out);

    /// @brief Parse a table constructor after '{' up to and including '}'.
    ExprPtr parseTable(SourceLoc loc);

    /// @}

    Lexer &lexer_;
    ::fountain::support::DiagnosticEngine &diag_;

    /// @brief Buffered token stream for multi-token lookahead.
    std::vector<Token> tokens_;

    /// @brief Current position within the token buffer.
    size_t tokenPos_{0};

    bool hasError_{false};

    /// @brief Depth of speculative parsing scopes (suppresses diagnostics).
    int suppressionDepth_{0};

    int exprDepth_{0};
    int stmtDepth_{0};
};

} // namespace fountain::frontends::fountain
