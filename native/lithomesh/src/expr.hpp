// expr.hpp — Tiny arithmetic expression compiler for the coordinate functions.
//
// Expressions are written in the variables x, y (pixel column/row) and w, h
// (image width/height), e.g. "x", "10*sin(x/w*pi)", "-(y - h/2)^2 / 50".
//
// Grammar (lowest to highest precedence):
//   sum     := product (('+' | '-') product)*
//   product := unary (('*' | '/' | '%') unary)*
//   unary   := ('+' | '-') unary | power
//   power   := atom ('^' unary)?              right associative; -2^2 == -4
//   atom    := number | name | name '(' sum (',' sum)* ')' | '(' sum ')'
// Constants: pi, e. Functions: sqrt abs exp ln sin cos tan asin acos atan sinh
// cosh tanh asinh acosh atanh floor ceil round signum (1 argument), atan2
// (2 arguments), max min (1 or more arguments).
//
// Evaluation is done in double and narrowed to float at the end. Expressions
// are limited to 4096 characters and 256 levels of nesting.
//
#pragma once
#include "grid.hpp"
#include <string>

// Compile `text` into a callable. On failure, returns false and writes a
// message with the 1-based column of the problem to `err`.
bool compile_expression(const std::string& text, CoordFn& fn, std::string& err);
