// expr.cpp — Recursive-descent parser compiling to a postfix (RPN) program that
// is evaluated on a small value stack. Parser recursion is bounded by
// kMaxDepth; evaluation and destruction are iterative.
// Errors are reported with the column they were detected at; there is no
// recovery, the first error ends the parse.

#include "expr.hpp"
#include <cctype>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <memory>
#include <vector>

namespace {

constexpr double kPi = 3.14159265358979323846;
constexpr double kE = 2.71828182845904523536;

constexpr size_t kMaxLength = 4096; // characters per expression
constexpr int kMaxDepth = 256;      // nested '(', unary signs and '^'
constexpr size_t kLocalStack = 64;  // values evaluated without heap allocation

struct Op {
    enum Code { Num, Var, Neg, Add, Sub, Mul, Div, Mod, Pow, Fn1, Atan2, Max, Min } code;
    double value = 0;                 // Num
    int var = 0;                      // Var: 0..3 = x y w h
    double (*f1)(double) = nullptr;   // Fn1
    size_t argc = 0;                  // Max/Min
};

struct Program {
    std::vector<Op> ops;
    size_t max_stack = 0;

    double run(const double* vars) const {
        double local[kLocalStack];
        std::vector<double> heap;
        double* st = local;
        if(max_stack > kLocalStack) { heap.resize(max_stack); st = heap.data(); }
        size_t n = 0;
        for(const Op& op : ops) {
            switch(op.code) {
                case Op::Num: st[n++] = op.value; break;
                case Op::Var: st[n++] = vars[op.var]; break;
                case Op::Neg: st[n - 1] = -st[n - 1]; break;
                case Op::Fn1: st[n - 1] = op.f1(st[n - 1]); break;
                case Op::Add: --n; st[n - 1] += st[n]; break;
                case Op::Sub: --n; st[n - 1] -= st[n]; break;
                case Op::Mul: --n; st[n - 1] *= st[n]; break;
                case Op::Div: --n; st[n - 1] /= st[n]; break;
                case Op::Mod: --n; st[n - 1] = std::fmod(st[n - 1], st[n]); break;
                case Op::Pow: --n; st[n - 1] = std::pow(st[n - 1], st[n]); break;
                case Op::Atan2: --n; st[n - 1] = std::atan2(st[n - 1], st[n]); break;
                case Op::Max:
                case Op::Min: {
                    double* args = st + n - op.argc;
                    double acc = args[0];
                    for(size_t i = 1; i < op.argc; ++i)
                        acc = (op.code == Op::Max) ? std::fmax(acc, args[i]) : std::fmin(acc, args[i]);
                    n -= op.argc - 1;
                    st[n - 1] = acc;
                    break;
                }
            }
        }
        return st[0];
    }
};

double signum(double v) { return std::isnan(v) ? v : (std::signbit(v) ? -1.0 : 1.0); }

struct UnaryFn { const char* name; double (*f)(double); };

const UnaryFn kUnary[] = {
    {"sqrt", [](double v) { return std::sqrt(v); }},
    {"abs", [](double v) { return std::fabs(v); }},
    {"exp", [](double v) { return std::exp(v); }},
    {"ln", [](double v) { return std::log(v); }},
    {"sin", [](double v) { return std::sin(v); }},
    {"cos", [](double v) { return std::cos(v); }},
    {"tan", [](double v) { return std::tan(v); }},
    {"asin", [](double v) { return std::asin(v); }},
    {"acos", [](double v) { return std::acos(v); }},
    {"atan", [](double v) { return std::atan(v); }},
    {"sinh", [](double v) { return std::sinh(v); }},
    {"cosh", [](double v) { return std::cosh(v); }},
    {"tanh", [](double v) { return std::tanh(v); }},
    {"asinh", [](double v) { return std::asinh(v); }},
    {"acosh", [](double v) { return std::acosh(v); }},
    {"atanh", [](double v) { return std::atanh(v); }},
    {"floor", [](double v) { return std::floor(v); }},
    {"ceil", [](double v) { return std::ceil(v); }},
    {"round", [](double v) { return std::round(v); }},
    {"signum", signum},
};

class Parser {
public:
    Parser(const std::string& s, Program& prog, std::string& err) : s_(s), prog_(prog), err_(err) {}

    bool parse() {
        if(!sum()) return false;
        skip();
        if(pos_ < s_.size()) return fail(std::string("unexpected '") + s_[pos_] + "'");
        return true;
    }

private:
    bool fail(const std::string& msg) {
        if(err_.empty()) err_ = msg + " at column " + std::to_string(pos_ + 1);
        return false;
    }

    // Append an op and track the stack height it leaves behind.
    void emit(const Op& op, int delta) {
        prog_.ops.push_back(op);
        height_ += delta;
        if(height_ > 0 && (size_t)height_ > prog_.max_stack) prog_.max_stack = (size_t)height_;
    }
    void emit(Op::Code code, int delta) { Op op{code}; emit(op, delta); }

    void skip() { while(pos_ < s_.size() && std::isspace((unsigned char)s_[pos_])) ++pos_; }

    bool accept(char c) {
        skip();
        if(pos_ < s_.size() && s_[pos_] == c) { ++pos_; return true; }
        return false;
    }

    bool sum() {
        if(!product()) return false;
        for(;;) {
            Op::Code code;
            if(accept('+')) code = Op::Add; else if(accept('-')) code = Op::Sub; else return true;
            if(!product()) return false;
            emit(code, -1);
        }
    }

    bool product() {
        if(!unary()) return false;
        for(;;) {
            Op::Code code;
            if(accept('*')) code = Op::Mul; else if(accept('/')) code = Op::Div; else if(accept('%')) code = Op::Mod; else return true;
            if(!unary()) return false;
            emit(code, -1);
        }
    }

    // Every recursive path ('(', sign, '^', call arguments) passes through here.
    bool unary() {
        if(++depth_ > kMaxDepth) return fail("expression nested too deeply");
        bool ok;
        if(accept('-')) { ok = unary(); if(ok) emit(Op::Neg, 0); }
        else if(accept('+')) ok = unary();
        else ok = power();
        --depth_;
        return ok;
    }

    bool power() {
        if(!atom()) return false;
        if(accept('^')) {
            if(!unary()) return false;
            emit(Op::Pow, -1);
        }
        return true;
    }

    bool atom() {
        skip();
        if(pos_ >= s_.size()) return fail("unexpected end of expression");
        const char c = s_[pos_];
        if(c == '(') {
            ++pos_;
            if(!sum()) return false;
            if(!accept(')')) return fail("expected ')'");
            return true;
        }
        if(std::isdigit((unsigned char)c) || c == '.') return number();
        if(std::isalpha((unsigned char)c) || c == '_') return name();
        return fail(std::string("unexpected '") + c + "'");
    }

    bool number() {
        const char* begin = s_.c_str() + pos_;
        char* end = nullptr;
        double v = std::strtod(begin, &end);
        if(end == begin) return fail("malformed number");
        pos_ += (size_t)(end - begin);
        Op op{Op::Num}; op.value = v;
        emit(op, +1);
        return true;
    }

    bool name() {
        const size_t start = pos_;
        while(pos_ < s_.size() && (std::isalnum((unsigned char)s_[pos_]) || s_[pos_] == '_')) ++pos_;
        const std::string id = s_.substr(start, pos_ - start);

        skip();
        if(pos_ < s_.size() && s_[pos_] == '(') {
            ++pos_;
            size_t argc = 0;
            if(!accept(')')) {
                do {
                    if(!sum()) return false;
                    ++argc;
                } while(accept(','));
                if(!accept(')')) return fail("expected ')' or ',' in call to " + id);
            }
            return call(id, argc, start);
        }

        static const char* const kVars[] = {"x", "y", "w", "h"};
        for(int i = 0; i < 4; ++i) {
            if(id == kVars[i]) { Op op{Op::Var}; op.var = i; emit(op, +1); return true; }
        }
        if(id == "pi" || id == "e") { Op op{Op::Num}; op.value = (id == "pi") ? kPi : kE; emit(op, +1); return true; }
        pos_ = start;
        return fail("unknown variable '" + id + "'");
    }

    bool call(const std::string& id, size_t argc, size_t at) {
        Op op{Op::Fn1};
        size_t min_args = 1, max_args = 1;
        bool known = false;
        for(const UnaryFn& u : kUnary) {
            if(id == u.name) { op.f1 = u.f; known = true; break; }
        }
        if(!known) {
            if(id == "atan2") { op.code = Op::Atan2; min_args = max_args = 2; known = true; }
            else if(id == "max") { op.code = Op::Max; max_args = SIZE_MAX; known = true; }
            else if(id == "min") { op.code = Op::Min; max_args = SIZE_MAX; known = true; }
        }
        if(!known) { pos_ = at; return fail("unknown function '" + id + "'"); }
        if(argc < min_args || argc > max_args) {
            pos_ = at;
            return fail("wrong number of arguments to " + id + " (got " + std::to_string(argc) + ")");
        }
        op.argc = argc;
        emit(op, 1 - (int)argc);
        return true;
    }

    const std::string& s_;
    Program& prog_;
    std::string& err_;
    size_t pos_ = 0;
    int depth_ = 0;
    int height_ = 0;
};

} // namespace

bool compile_expression(const std::string& text, CoordFn& fn, std::string& err) {
    if(text.size() > kMaxLength) {
        err = "expression too long (" + std::to_string(text.size()) + " characters, limit "
            + std::to_string(kMaxLength) + ")";
        return false;
    }
    auto prog = std::make_shared<Program>();
    std::string perr;
    Parser parser(text, *prog, perr);
    if(!parser.parse()) { err = perr.empty() ? "invalid expression" : perr; return false; }
    // std::function must be copyable, so the program is shared between copies.
    std::shared_ptr<const Program> program = prog;
    fn = [program](float x, float y, float w, float h) -> float {
        const double vars[4] = {x, y, w, h};
        return (float)program->run(vars);
    };
    return true;
}
