#pragma once

#include <string>
#include <vector>
#include "Ast.hpp"
#include "../Lexer/Token.hpp"
#include "../Runtime/ScriptError.hpp"

namespace turtlescript {

/**
 * TurtleScript Parser
 *
 * Recursive descent for statements, binding-power (Pratt) parsing for
 * expressions. Stops at the first error by throwing ParseError; there is no
 * recovery. A token stream without a trailing Eof is treated as if it had one.
 */
class Parser {
public:
    explicit Parser(std::vector<Token> tokens);

    ast::BlockPtr parseProgram();

    // Single expression followed by end of input; used by tests and tools.
    ast::ExprPtr parseExpressionOnly();

private:
    std::vector<Token> tokens;
    size_t pos{0};
    Token eofToken;

    // Bounds AST height so that parsing, evaluation and destruction stay off the native stack limit.
    static constexpr int MAX_NESTING = 500;
    int depth{0};

    // Token access
    const Token& current() const;
    const Token& peek(size_t offset = 1) const;
    const Token& advance();
    bool check(TokenKind kind, const char* lexeme) const;
    bool checkKeyword(const char* word) const { return check(TokenKind::Keyword, word); }
    bool checkDelimiter(const char* d) const { return check(TokenKind::Delimiter, d); }
    bool checkOperator(const char* op) const { return check(TokenKind::Operator, op); }
    bool match(TokenKind kind, const char* lexeme);
    const Token& expect(TokenKind kind, const char* lexeme, const char* what);
    const Token& expectIdentifier(const char* what);
    bool atStatementEnd() const;
    void skipNewlines();
    void skipSeparators();

    // Statements
    ast::StmtPtr parseStatement();
    ast::StmtPtr parseVarDecl();
    ast::StmtPtr parseAssign();
    ast::StmtPtr parseIf();
    ast::StmtPtr parseWhile();
    ast::StmtPtr parseFor();
    ast::StmtPtr parseFunction();
    ast::StmtPtr parseReturn();
    ast::BlockPtr parseBlock();
    void expectStatementEnd(const ast::Stmt& stmt);

    // Expressions
    ast::ExprPtr parseExpression(int minBp = 0);
    ast::ExprPtr parsePrefix();
    ast::ExprPtr parsePrimary();
    std::vector<ast::ExprPtr> parseArgumentList();

    void descend(ErrorKind kind, const char* what, const char* expected);

    [[noreturn]] void error(ErrorKind kind, const std::string& message, const Token& at,
                            const std::string& expected);
};

} // namespace turtlescript
