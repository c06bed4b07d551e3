#include "expr.hpp"
#include <gtest/gtest.h>
#include <cmath>

namespace {

float eval(const std::string& text, float x = 0, float y = 0, float w = 0, float h = 0) {
    CoordFn fn; std::string err;
    EXPECT_TRUE(compile_expression(text, fn, err)) << text << ": " << err;
    return fn ? fn(x, y, w, h) : NAN;
}

std::string error_of(const std::string& text) {
    CoordFn fn; std::string err;
    EXPECT_FALSE(compile_expression(text, fn, err)) << text;
    return err;
}

} // namespace

TEST(Expr, Variables) {
    EXPECT_FLOAT_EQ(eval("x", 3, 4, 5, 6), 3);
    EXPECT_FLOAT_EQ(eval("y", 3, 4, 5, 6), 4);
    EXPECT_FLOAT_EQ(eval("w - h", 3, 4, 5, 6), -1);
    EXPECT_FLOAT_EQ(eval(" 7 "), 7);
}

TEST(Expr, Precedence) {
    EXPECT_FLOAT_EQ(eval("1 + 2 * 3"), 7);
    EXPECT_FLOAT_EQ(eval("(1 + 2) * 3"), 9);
    EXPECT_FLOAT_EQ(eval("10 - 4 - 3"), 3);
    EXPECT_FLOAT_EQ(eval("2 ^ 3 ^ 2"), 512);
    EXPECT_FLOAT_EQ(eval("-2 ^ 2"), -4);
    EXPECT_FLOAT_EQ(eval("2 ^ -1"), 0.5f);
    EXPECT_FLOAT_EQ(eval("7 % 3"), 1);
    EXPECT_FLOAT_EQ(eval("--x", 2), 2);
    EXPECT_FLOAT_EQ(eval("1.5e1 / 3"), 5);
}

TEST(Expr, FunctionsAndConstants) {
    EXPECT_NEAR(eval("sin(pi / 2)"), 1.0f, 1e-6f);
    EXPECT_NEAR(eval("cos(x / w * pi)", 5, 0, 10, 0), 0.0f, 1e-6f);
    EXPECT_NEAR(eval("ln(e)"), 1.0f, 1e-6f);
    EXPECT_FLOAT_EQ(eval("sqrt(16) + abs(-2)"), 6);
    EXPECT_FLOAT_EQ(eval("max(1, 7, 3)"), 7);
    EXPECT_FLOAT_EQ(eval("min(4)"), 4);
    EXPECT_FLOAT_EQ(eval("round(2.5) + floor(-0.5) + ceil(0.2)"), 3);
    EXPECT_FLOAT_EQ(eval("signum(-3) + signum(0)"), 0);
    EXPECT_NEAR(eval("atan2(1, 1)"), 0.785398f, 1e-5f);
}

TEST(Expr, CylinderExpression) {
    const float r = eval("20*cos(x/w*pi)", 0, 3, 100, 50);
    EXPECT_FLOAT_EQ(r, 20.0f);
}

TEST(Expr, ErrorsCarryColumn) {
    EXPECT_NE(error_of("x +").find("unexpected end"), std::string::npos);
    EXPECT_NE(error_of("x + q").find("unknown variable 'q' at column 5"), std::string::npos);
    EXPECT_NE(error_of("foo(1)").find("unknown function 'foo'"), std::string::npos);
    EXPECT_NE(error_of("atan2(1)").find("wrong number of arguments"), std::string::npos);
    EXPECT_NE(error_of("sin(1, 2)").find("wrong number of arguments"), std::string::npos);
    EXPECT_NE(error_of("(x").find("expected ')'"), std::string::npos);
    EXPECT_NE(error_of("x y").find("unexpected 'y' at column 3"), std::string::npos);
    EXPECT_NE(error_of("").find("unexpected end"), std::string::npos);
    EXPECT_NE(error_of("2 * $").find("unexpected '$'"), std::string::npos);
}

TEST(Expr, CompiledFunctionIsCopyable) {
    CoordFn fn; std::string err;
    ASSERT_TRUE(compile_expression("x * y + w", fn, err));
    CoordFn copy = fn;
    fn = nullptr;
    EXPECT_FLOAT_EQ(copy(2, 3, 4, 0), 10);
}

TEST(Expr, OversizedInputIsRejected) {
    CoordFn fn; std::string err;
    EXPECT_FALSE(compile_expression(std::string(200000, '(') + "1" + std::string(200000, ')'), fn, err));
    EXPECT_NE(err.find("too long"), std::string::npos) << err;

    std::string chain = "x";
    for(int i = 0; i < 300000; ++i) chain += "+1";
    err.clear();
    EXPECT_FALSE(compile_expression(chain, fn, err));
    EXPECT_NE(err.find("too long"), std::string::npos) << err;
}

TEST(Expr, NestingIsBounded) {
    EXPECT_NE(error_of(std::string(300, '(') + "1" + std::string(300, ')')).find("nested too deeply"), std::string::npos);
    EXPECT_NE(error_of(std::string(300, '-') + "1").find("nested too deeply"), std::string::npos);
    std::string tower = "2";
    for(int i = 0; i < 300; ++i) tower += "^1";
    EXPECT_NE(error_of(tower).find("nested too deeply"), std::string::npos);

    EXPECT_FLOAT_EQ(eval(std::string(200, '(') + "x" + std::string(200, ')'), 3), 3);
}

TEST(Expr, LongChainsEvaluateIteratively) {
    std::string chain = "x";
    for(int i = 0; i < 2000; ++i) chain += "+1";
    EXPECT_FLOAT_EQ(eval(chain, 5), 2005);

    // right-nested sums keep every partial value on the stack at once
    std::string deep;
    for(int i = 0; i < 200; ++i) deep += "1+(";
    deep += "x";
    deep += std::string(200, ')');
    EXPECT_FLOAT_EQ(eval(deep, 1), 201);

    EXPECT_FLOAT_EQ(eval("max(1, 2, 3, 4, 5, 6, 7, 8, 9) - min(9, 8, 7)"), 2);
}
