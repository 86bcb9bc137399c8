#pragma once

#include <ostream>
#include <string>
#include <vector>

#include "../Session/Session.hpp"

namespace turtlescript {

/**
 * Repl - line-oriented front end over a Session
 *
 * Fed one input line at a time so the same driver serves a blocking
 * std::getline loop and the SDL event loop polling stdin. A trailing
 * backslash continues the entry on the next line; the shell words exit,
 * quit, q, help, clear and reset are handled here.
 */
class Repl {
public:
    Repl(Session& session, std::ostream& out, std::ostream& err);

    // Handle one line. Returns false once the user asked to leave.
    bool feedLine(const std::string& line);

    const char* prompt() const { return buffer_.empty() ? "draw> " : "... "; }
    bool hasPendingInput() const { return !buffer_.empty(); }
    void cancelPending() { buffer_.clear(); }

    void printBanner();
    void printHelp();

    // Errors reported since construction
    size_t getErrorCount() const { return errorCount_; }

private:
    Session& session_;
    std::ostream& out_;
    std::ostream& err_;
    std::vector<std::string> buffer_;
    size_t errorCount_{0};

    void run(const std::string& source);
};

} // namespace turtlescript
