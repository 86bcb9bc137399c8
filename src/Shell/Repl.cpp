#include "Repl.hpp"

#include <algorithm>
#include <cctype>

namespace turtlescript {

namespace {

std::string trim(const std::string& s) {
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
    size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(start, end - start);
}

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

} // namespace

Repl::Repl(Session& session, std::ostream& out, std::ostream& err)
    : session_(session), out_(out), err_(err) {}

bool Repl::feedLine(const std::string& raw) {
    std::string line = trim(raw);
    if (line.empty()) return true;

    if (buffer_.empty()) {
        std::string word = lower(line);
        if (word == "exit" || word == "quit" || word == "q") {
            out_ << "Goodbye!" << std::endl;
            return false;
        }
        if (word == "help") {
            printHelp();
            return true;
        }
        if (word == "clear") {
            run("clear()");
            return true;
        }
        if (word == "reset") {
            run("reset()");
            return true;
        }
    }

    if (line.back() == '\\') {
        line.pop_back();
        buffer_.push_back(line);
        return true;
    }

    buffer_.push_back(line);
    std::string source;
    for (size_t i = 0; i < buffer_.size(); ++i) {
        if (i > 0) source += '\n';
        source += buffer_[i];
    }
    buffer_.clear();

    run(source);
    return true;
}

void Repl::run(const std::string& source) {
    RunResult result = session_.evalStatement(source);
    if (!result.ok()) {
        ++errorCount_;
        err_ << "Error: " << formatError(*result.error) << std::endl;
        return;
    }
    if (result.value) {
        out_ << reprValue(*result.value) << std::endl;
    }
}

void Repl::printBanner() {
    out_ << "============================================================\n";
    out_ << "TurtleScript - Interactive Mode\n";
    out_ << "============================================================\n";
    out_ << "Type 'help' for commands, 'exit' or 'quit' to exit\n";
    out_ << "Multi-line input: end line with '\\' to continue\n";
    out_ << "============================================================\n";
    out_ << std::endl;
}

void Repl::printHelp() {
    out_ << R"(
DRAWING COMMANDS:
  forward(d) / fd(d)              Move forward
  backward(d) / bk(d)             Move backward
  left(a) / lt(a)                 Turn left (counter-clockwise)
  right(a) / rt(a)                Turn right (clockwise)
  penup() / pu()                  Lift pen
  pendown() / pd()                Lower pen
  goto(x, y)                      Move to absolute position
  setheading(a) / seth(a)         Point the turtle at angle a (90 is up)
  home()                          Return to (0, 0) facing up
  circle(r) / circle(r, x, y)     Draw circle at current position or (x, y)
  rectangle(w, h [, x, y])        Draw rectangle
  line(x1, y1, x2, y2)            Draw line between two points
  polygon(x1, y1, x2, y2, ...)    Draw polygon
  arc(w, h [, angle [, x, y]])    Draw arc at current position or (x, y)
  color("name")                   Set pen color
  fill() / nofill()               Enable or disable filling
  width(n)                        Set pen width
  clear()                         Clear canvas
  reset()                         Reset pen position and settings
  show()                          Present the canvas
  hide()                          Accepted and ignored

CONTROL FLOW:
  if cond { ... } else { ... }
  while cond { ... }
  for i = start to end [step n] { ... }

VARIABLES AND FUNCTIONS:
  var name = value / let name = value
  name = value
  function name(a, b) { ... return value }

OPERATORS:
  + - * / % ^    == != < > <= >=    and or not

BUILT-IN FUNCTIONS:
  sin cos tan asin acos atan (degrees), sqrt abs floor ceil round
  min max random pi e xcor ycor heading print

SHELL COMMANDS:
  help, clear, reset, exit / quit / q
)" << std::endl;
}

} // namespace turtlescript
