#include <gtest/gtest.h>
#include "test_env.hpp"

using namespace ebs;
using ebs::test::eval_script;
using ebs::test::run_script;

TEST(ControlFlow, WhileWithBreakAndContinue){
    auto run = run_script("var i = 0;\n"
                          "while true {\n"
                          "  i++;\n"
                          "  if i % 2 == 0 { continue; }\n"
                          "  if i > 7 { break; }\n"
                          "  print i;\n"
                          "}");
    EXPECT_EQ(run.out, "1\n3\n5\n7\n");
}

TEST(ControlFlow, DoWhileRunsBodyOnce){
    EXPECT_EQ(eval_script("var n = 10; do { n++; } while n < 5; return n;").as_int(), 11);
}

TEST(ControlFlow, ForLoopScopesItsCounter){
    auto run = run_script("var total = 0;\n"
                          "for (var i = 1; i <= 4; i++) total += i;\n"
                          "for (var i = 0; i < 3; i++) { if i == 1 { continue; } print i; }\n"
                          "print total;");
    EXPECT_EQ(run.out, "0\n2\n10\n");
}

TEST(ControlFlow, ForEachOverCollections){
    auto run = run_script("foreach v in [3, 4] { print v; }\n"
                          "foreach c in \"ab\" { print c; }\n"
                          "foreach k in {\"x\": 1, \"y\": 2} { print k; }\n"
                          "var q: queue<int>; call queue.enqueue(q, 9); foreach e in q print e;");
    EXPECT_EQ(run.out, "3\n4\na\nb\nx\ny\n9\n");
}

TEST(ControlFlow, ForEachIteratesASnapshot){
    Value r = eval_script("var a = [1, 2, 3]; var seen = 0;\n"
                          "foreach v in a { call array.push(a, v); seen++; }\n"
                          "return [seen, a.length];");
    EXPECT_EQ(r.as_array().items[0].as_int(), 3);
    EXPECT_EQ(r.as_array().items[1].as_int(), 6);
}

TEST(ControlFlow, ForEachRejectsScalars){
    try {
        run_script("var n = null;\nforeach x in n { }");
        FAIL() << "expected InterpreterError";
    } catch(const InterpreterError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::Null);
        EXPECT_EQ(e.loc().line, 2);
    }
    try {
        run_script("foreach x in 5 { }");
        FAIL() << "expected InterpreterError";
    } catch(const InterpreterError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::Type);
    }
}

TEST(ControlFlow, ConditionsMustBeBool){
    EXPECT_THROW(run_script("if 1 { }"), InterpreterError);
    EXPECT_THROW(run_script("while \"yes\" { }"), InterpreterError);
}

TEST(ControlFlow, ReturnLeavesNestedLoops){
    Value r = eval_script("function find(target) {\n"
                          "  for (var i = 0; i < 5; i++) {\n"
                          "    foreach j in [0, 1, 2] { if i * j == target { return [i, j]; } }\n"
                          "  }\n"
                          "  return null;\n"
                          "}\n"
                          "return find(6);");
    ASSERT_TRUE(r.is_array());
    EXPECT_EQ(r.as_array().items[0].as_int(), 3);
    EXPECT_EQ(r.as_array().items[1].as_int(), 2);
}

TEST(ControlFlow, TopLevelReturnStopsTheUnit){
    auto run = run_script("print \"a\"; return 5; print \"b\";");
    EXPECT_EQ(run.result.status, ExecutionResult::Status::Returned);
    EXPECT_EQ(run.result.value.as_int(), 5);
    EXPECT_EQ(run.out, "a\n");
    EXPECT_EQ(run_script("var x = 1;").result.status, ExecutionResult::Status::Completed);
}

TEST(ControlFlow, DefaultsAndNamedArguments){
    auto run = run_script("function greet(name: string, greeting: string = \"hi\", times: int = 1) {\n"
                          "  for (var i = 0; i < times; i++) print greeting + \" \" + name;\n"
                          "}\n"
                          "greet(\"ann\");\n"
                          "greet(\"bo\", times = 2, greeting = \"yo\");");
    EXPECT_EQ(run.out, "hi ann\nyo bo\nyo bo\n");
}

TEST(ControlFlow, DefaultsSeeEarlierParameters){
    EXPECT_EQ(eval_script("function area(w: int, h: int = w) return int { return w * h; } return area(4);").as_int(), 16);
}

TEST(ControlFlow, ArgumentBindingErrors){
    EXPECT_THROW(run_script("function f(a) { } f(1, 2);"), InterpreterError);
    EXPECT_THROW(run_script("function f(a) { } f(b = 1);"), InterpreterError);
    EXPECT_THROW(run_script("function f(a) { } f(1, a = 2);"), InterpreterError);
    EXPECT_THROW(run_script("function f(a) { } f();"), InterpreterError);
    EXPECT_THROW(run_script("function f(a: int) { } f(\"x\");"), TypeError);
}

TEST(ControlFlow, FunctionsCannotSeeCallerLocals){
    try {
        run_script("function peek() { return hidden; }\n"
                   "function outer() { var hidden = 1; return peek(); }\n"
                   "outer();");
        FAIL() << "expected InterpreterError";
    } catch(const InterpreterError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::NotFound);
        EXPECT_EQ(e.loc().line, 1);
    }
    EXPECT_EQ(eval_script("var g = 5; function read() { return g; } return read();").as_int(), 5);
}

TEST(ControlFlow, RecursionAndReturnTypeCoercion){
    EXPECT_EQ(eval_script("function fib(n: int) return int { if n < 2 { return n; } return fib(n - 1) + fib(n - 2); }\n"
                          "return fib(15);").as_int(), 610);
    Value half = eval_script("function half(n) return double { return n / 2; } return half(5);");
    ASSERT_TRUE(half.is_double());
    EXPECT_DOUBLE_EQ(half.as_double(), 2.0);
    EXPECT_TRUE(eval_script("function nothing() { } return nothing();").is_null());
}

TEST(ControlFlow, CallDepthIsLimited){
    std::ostringstream out;
    InterpreterOptions opts;
    opts.out = &out;
    opts.env.maxCallDepth = 32;
    Interpreter interp(standard_builtins(), opts);
    try {
        interp.run(parse("function down(n) { return down(n + 1); }\ndown(0);"));
        FAIL() << "expected InterpreterError";
    } catch(const InterpreterError& e) {
        EXPECT_NE(e.message().find("maximum call depth 32"), std::string::npos) << e.message();
    }
    EXPECT_EQ(interp.run(parse("function down(n) { if n == 0 { return 0; } return down(n - 1); }\nreturn down(20);")).value.as_int(), 0);
}

TEST(ControlFlow, FunctionsAreCaseInsensitive){
    EXPECT_EQ(eval_script("function Square(x) { return x * x; } return SQUARE(3);").as_int(), 9);
}
