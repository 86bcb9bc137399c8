#include "Parser.hpp"

#include <algorithm>

namespace turtlescript {

using namespace ast;

namespace {

struct InfixInfo {
    BinaryOperator op;
    int leftBp;
    int rightBp;
};

// Left/right binding powers; right-associative operators bind tighter on the left.
bool infixBindingPower(const Token& t, InfixInfo& out) {
    if (t.kind == TokenKind::Keyword) {
        if (t.lexeme == "or") { out = {BinaryOperator::Or, 1, 2}; return true; }
        if (t.lexeme == "and") { out = {BinaryOperator::And, 3, 4}; return true; }
        return false;
    }
    if (t.kind != TokenKind::Operator) return false;
    const std::string& s = t.lexeme;
    if (s == "==") { out = {BinaryOperator::Eq, 7, 8}; return true; }
    if (s == "!=") { out = {BinaryOperator::Ne, 7, 8}; return true; }
    if (s == "<") { out = {BinaryOperator::Lt, 9, 10}; return true; }
    if (s == ">") { out = {BinaryOperator::Gt, 9, 10}; return true; }
    if (s == "<=") { out = {BinaryOperator::Le, 9, 10}; return true; }
    if (s == ">=") { out = {BinaryOperator::Ge, 9, 10}; return true; }
    if (s == "+") { out = {BinaryOperator::Add, 11, 12}; return true; }
    if (s == "-") { out = {BinaryOperator::Sub, 11, 12}; return true; }
    if (s == "*") { out = {BinaryOperator::Mul, 13, 14}; return true; }
    if (s == "/") { out = {BinaryOperator::Div, 13, 14}; return true; }
    if (s == "%") { out = {BinaryOperator::Mod, 13, 14}; return true; }
    if (s == "^") { out = {BinaryOperator::Pow, 16, 15}; return true; }
    return false;
}

constexpr int kNotBp = 5;     // operand of `not` stops before `and`/`or`
constexpr int kNegateBp = 17; // unary minus binds tighter than `^`

bool endsWithBlock(const Stmt& s) {
    switch (s.kind) {
        case NodeKind::If:
        case NodeKind::While:
        case NodeKind::ForRange:
        case NodeKind::FunctionDecl:
            return true;
        default:
            return false;
    }
}

} // namespace

Parser::Parser(std::vector<Token> toks) : tokens(std::move(toks)) {
    if (!tokens.empty()) {
        eofToken.line = tokens.back().line;
        eofToken.column = tokens.back().column + static_cast<int>(tokens.back().lexeme.size());
    }
}

// ---- Token access ----

const Token& Parser::current() const {
    return pos < tokens.size() ? tokens[pos] : eofToken;
}

const Token& Parser::peek(size_t offset) const {
    return pos + offset < tokens.size() ? tokens[pos + offset] : eofToken;
}

const Token& Parser::advance() {
    const Token& t = current();
    if (pos < tokens.size() && t.kind != TokenKind::Eof) ++pos;
    return t;
}

bool Parser::check(TokenKind kind, const char* lexeme) const {
    return current().is(kind, lexeme);
}

bool Parser::match(TokenKind kind, const char* lexeme) {
    if (!check(kind, lexeme)) return false;
    advance();
    return true;
}

const Token& Parser::expect(TokenKind kind, const char* lexeme, const char* what) {
    if (!check(kind, lexeme)) {
        error(ErrorKind::MissingToken, std::string("Expected ") + what, current(), what);
    }
    return advance();
}

const Token& Parser::expectIdentifier(const char* what) {
    if (current().kind != TokenKind::Identifier) {
        error(ErrorKind::MissingToken, std::string("Expected ") + what, current(), what);
    }
    return advance();
}

bool Parser::atStatementEnd() const {
    const Token& t = current();
    return t.kind == TokenKind::Eof || t.is(TokenKind::Delimiter, "\n") ||
           t.is(TokenKind::Delimiter, ";") || t.is(TokenKind::Delimiter, "}");
}

void Parser::skipNewlines() {
    while (checkDelimiter("\n")) advance();
}

void Parser::skipSeparators() {
    while (checkDelimiter("\n") || checkDelimiter(";")) advance();
}

void Parser::error(ErrorKind kind, const std::string& message, const Token& at,
                   const std::string& expected) {
    throw ParseError(kind, message + ", found " + describeToken(at), at.line, at.column,
                     expected, describeToken(at));
}

void Parser::descend(ErrorKind kind, const char* what, const char* expected) {
    if (++depth > MAX_NESTING) {
        error(kind, std::string(what) + " nested too deeply", current(), expected);
    }
}

// ---- Statements ----

BlockPtr Parser::parseProgram() {
    auto program = std::make_unique<Block>(1, 1);

    skipSeparators();
    while (current().kind != TokenKind::Eof) {
        auto stmt = parseStatement();
        expectStatementEnd(*stmt);
        program->statements.push_back(std::move(stmt));
        skipSeparators();
    }
    return program;
}

ExprPtr Parser::parseExpressionOnly() {
    skipNewlines();
    auto e = parseExpression();
    skipSeparators();
    if (current().kind != TokenKind::Eof) {
        error(ErrorKind::UnexpectedToken, "Unexpected token after expression", current(), "end of input");
    }
    return e;
}

void Parser::expectStatementEnd(const Stmt& stmt) {
    if (endsWithBlock(stmt) || atStatementEnd()) return;
    error(ErrorKind::UnexpectedToken, "Unexpected token after statement", current(), "newline or ';'");
}

StmtPtr Parser::parseStatement() {
    const Token& t = current();

    if (t.kind == TokenKind::Keyword) {
        if (t.lexeme == "var" || t.lexeme == "let") return parseVarDecl();
        if (t.lexeme == "if") return parseIf();
        if (t.lexeme == "while") return parseWhile();
        if (t.lexeme == "for") return parseFor();
        if (t.lexeme == "function") return parseFunction();
        if (t.lexeme == "return") return parseReturn();
        if (t.lexeme == "else" || t.lexeme == "to" || t.lexeme == "step") {
            error(ErrorKind::UnexpectedToken, "Unexpected keyword at start of statement", t, "statement");
        }
    }

    if (t.kind == TokenKind::Identifier && peek().is(TokenKind::Operator, "=")) {
        return parseAssign();
    }

    if (t.kind == TokenKind::Delimiter && t.lexeme != "(") {
        error(ErrorKind::UnexpectedToken, "Unexpected token at start of statement", t, "statement");
    }

    auto expr = parseExpression();
    int line = expr->line;
    int column = expr->column;
    return std::make_unique<ExprStatement>(std::move(expr), line, column);
}

StmtPtr Parser::parseVarDecl() {
    Token kw = advance();
    const Token& name = expectIdentifier("variable name");
    std::string varName = name.lexeme;
    ExprPtr init;
    if (match(TokenKind::Operator, "=")) {
        init = parseExpression();
    }
    return std::make_unique<VarDecl>(varName, std::move(init), kw.line, kw.column);
}

StmtPtr Parser::parseAssign() {
    Token name = advance();
    advance(); // '='
    auto value = parseExpression();
    return std::make_unique<Assign>(name.lexeme, std::move(value), name.line, name.column);
}

StmtPtr Parser::parseIf() {
    Token kw = advance();
    auto condition = parseExpression();
    auto thenBlock = parseBlock();

    // `else` may sit on a later line; put the newlines back if it does not.
    size_t save = pos;
    skipNewlines();
    BlockPtr elseBlock;
    if (checkKeyword("else")) {
        advance();
        if (checkKeyword("if")) {
            const Token& ifTok = current();
            int entered = depth;
            descend(ErrorKind::UnexpectedToken, "Blocks", "statement");
            elseBlock = std::make_unique<Block>(ifTok.line, ifTok.column);
            elseBlock->statements.push_back(parseIf());
            depth = entered;
        } else {
            elseBlock = parseBlock();
        }
    } else {
        pos = save;
    }

    return std::make_unique<If>(std::move(condition), std::move(thenBlock), std::move(elseBlock),
                                kw.line, kw.column);
}

StmtPtr Parser::parseWhile() {
    Token kw = advance();
    auto condition = parseExpression();
    auto body = parseBlock();
    return std::make_unique<While>(std::move(condition), std::move(body), kw.line, kw.column);
}

StmtPtr Parser::parseFor() {
    Token kw = advance();
    std::string var = expectIdentifier("loop variable").lexeme;
    expect(TokenKind::Operator, "=", "'='");
    auto from = parseExpression();
    expect(TokenKind::Keyword, "to", "'to'");
    auto to = parseExpression();
    ExprPtr step;
    if (match(TokenKind::Keyword, "step")) {
        step = parseExpression();
    }
    auto body = parseBlock();
    return std::make_unique<ForRange>(std::move(var), std::move(from), std::move(to), std::move(step),
                                      std::move(body), kw.line, kw.column);
}

StmtPtr Parser::parseFunction() {
    Token kw = advance();
    std::string name = expectIdentifier("function name").lexeme;
    expect(TokenKind::Delimiter, "(", "'('");

    std::vector<std::string> params;
    if (!checkDelimiter(")")) {
        do {
            const Token& p = expectIdentifier("parameter name");
            if (std::find(params.begin(), params.end(), p.lexeme) != params.end()) {
                error(ErrorKind::UnexpectedToken, "Duplicate parameter '" + p.lexeme + "'", p,
                      "unique parameter name");
            }
            params.push_back(p.lexeme);
        } while (match(TokenKind::Delimiter, ","));
    }
    expect(TokenKind::Delimiter, ")", "')'");

    auto body = parseBlock();
    return std::make_unique<FunctionDecl>(std::move(name), std::move(params), std::move(body),
                                          kw.line, kw.column);
}

StmtPtr Parser::parseReturn() {
    Token kw = advance();
    ExprPtr value;
    if (!atStatementEnd()) {
        value = parseExpression();
    }
    return std::make_unique<Return>(std::move(value), kw.line, kw.column);
}

BlockPtr Parser::parseBlock() {
    skipNewlines();
    int entered = depth;
    descend(ErrorKind::UnexpectedToken, "Blocks", "statement");
    const Token& open = expect(TokenKind::Delimiter, "{", "'{'");
    auto block = std::make_unique<Block>(open.line, open.column);

    skipSeparators();
    while (!checkDelimiter("}")) {
        if (current().kind == TokenKind::Eof) {
            error(ErrorKind::MissingToken, "Expected '}'", current(), "'}'");
        }
        auto stmt = parseStatement();
        expectStatementEnd(*stmt);
        block->statements.push_back(std::move(stmt));
        skipSeparators();
    }
    advance(); // '}'
    depth = entered;
    return block;
}

// ---- Expressions ----

ExprPtr Parser::parseExpression(int minBp) {
    int entered = depth;
    descend(ErrorKind::InvalidExpression, "Expression", "expression");
    auto lhs = parsePrefix();

    while (true) {
        InfixInfo info;
        if (!infixBindingPower(current(), info)) break;
        if (info.leftBp < minBp) break;
        // Each folded operator deepens the left spine.
        descend(ErrorKind::InvalidExpression, "Expression", "expression");
        Token opTok = advance();
        auto rhs = parseExpression(info.rightBp);
        lhs = std::make_unique<BinaryOp>(std::move(lhs), info.op, std::move(rhs), opTok.line, opTok.column);
    }

    depth = entered;
    return lhs;
}

ExprPtr Parser::parsePrefix() {
    if (checkKeyword("not")) {
        Token opTok = advance();
        auto operand = parseExpression(kNotBp);
        return std::make_unique<UnaryOp>(UnaryOperator::Not, std::move(operand), opTok.line, opTok.column);
    }
    if (checkOperator("-")) {
        Token opTok = advance();
        auto operand = parseExpression(kNegateBp);
        return std::make_unique<UnaryOp>(UnaryOperator::Negate, std::move(operand), opTok.line, opTok.column);
    }
    return parsePrimary();
}

ExprPtr Parser::parsePrimary() {
    const Token& t = current();

    switch (t.kind) {
        case TokenKind::Number: {
            Token tok = advance();
            return std::make_unique<NumberLiteral>(tok.number, tok.line, tok.column);
        }
        case TokenKind::String: {
            Token tok = advance();
            return std::make_unique<StringLiteral>(tok.text, tok.line, tok.column);
        }
        case TokenKind::Keyword:
            if (t.lexeme == "true" || t.lexeme == "false") {
                Token tok = advance();
                return std::make_unique<BooleanLiteral>(tok.lexeme == "true", tok.line, tok.column);
            }
            break;
        case TokenKind::Identifier: {
            Token tok = advance();
            if (checkDelimiter("(")) {
                auto args = parseArgumentList();
                return std::make_unique<Call>(tok.lexeme, std::move(args), tok.line, tok.column);
            }
            return std::make_unique<Identifier>(tok.lexeme, tok.line, tok.column);
        }
        case TokenKind::Delimiter:
            if (t.lexeme == "(") {
                advance();
                skipNewlines();
                auto inner = parseExpression();
                skipNewlines();
                expect(TokenKind::Delimiter, ")", "')'");
                return inner;
            }
            break;
        default:
            break;
    }

    error(ErrorKind::InvalidExpression, "Expected expression", t, "expression");
}

// '(' [expr {',' expr}] ')'; newlines are allowed inside the parentheses.
std::vector<ExprPtr> Parser::parseArgumentList() {
    std::vector<ExprPtr> args;
    advance(); // '('
    skipNewlines();
    if (!checkDelimiter(")")) {
        do {
            skipNewlines();
            args.push_back(parseExpression());
            skipNewlines();
        } while (match(TokenKind::Delimiter, ","));
    }
    expect(TokenKind::Delimiter, ")", "')'");
    return args;
}

} // namespace turtlescript
