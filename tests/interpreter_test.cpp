#include <gtest/gtest.h>
#include "test_env.hpp"
#include <limits>
#include <stdexcept>

using namespace ebs;
using ebs::test::eval_script;
using ebs::test::run_script;

namespace {

const char* kHostScript =
    "varset input in { var level: int = 1; }\n"
    "varset output out { var result: double; }\n"
    "varset shared inout { var note: string = \"n\"; }\n"
    "varset hidden internal { var secret: int = 7; }\n"
    "output.result = input.level * 2.5;\n"
    "shared.note = shared.note + \"!\";\n";

class HostAccessTest : public ::testing::Test {
protected:
    HostAccessTest(): interp_(standard_builtins(), options()) {}

    static InterpreterOptions options(){
        InterpreterOptions o;
        o.name = "plant";
        o.out = &out_;
        return o;
    }

    static std::ostringstream out_;
    Interpreter interp_;
};

std::ostringstream HostAccessTest::out_;

} // namespace

TEST(Interpreter, RecordAssignmentCoercesStringField){
    Value p = eval_script("var p: record{name:string, age:int};\n"
                          "p = {\"name\":\"Ann\",\"age\":\"30\"};\n"
                          "return p;");
    ASSERT_TRUE(p.is_object());
    const Value* age = p.as_object().find("age");
    ASSERT_NE(age, nullptr);
    ASSERT_TRUE(age->is_int());
    EXPECT_EQ(age->as_int(), 30);
    EXPECT_EQ(p.as_object().find("name")->as_string(), "Ann");
    EXPECT_EQ(eval_script("var p: record{name:string, age:int}; p = {\"name\":\"Ann\",\"age\":\"30\"}; return typeof p.age;").as_string(), "int");
}

TEST(Interpreter, NestedRecordAssignment){
    Value r = eval_script("var e: record{id:int, addr: record{city:string}};\n"
                          "e = {\"id\":1,\"addr\":{\"city\":\"NY\"}};\n"
                          "return e.addr.city == \"NY\";");
    ASSERT_TRUE(r.is_bool());
    EXPECT_TRUE(r.as_bool());
}

TEST(Interpreter, UndeclaredRecordFieldIsTypeError){
    try {
        run_script("var p: record{x:int}; p = {\"x\": 1, \"y\": 2};");
        FAIL() << "expected TypeError";
    } catch(const TypeError& e) {
        EXPECT_EQ(e.code(), "E3205");
        EXPECT_EQ(e.loc().line, 1);
    }
    EXPECT_THROW(run_script("var p: record{x:int}; p.y = 3;"), TypeError);
}

TEST(Interpreter, BlockShadowing){
    auto run = run_script("var x = 1;\n"
                          "{ var x = 2; print x; }\n"
                          "print x;\n"
                          "if true { var x = \"inner\"; print x; }\n"
                          "return x;");
    EXPECT_EQ(run.out, "2\n1\ninner\n");
    EXPECT_EQ(run.result.value.as_int(), 1);
}

TEST(Interpreter, ArithmeticAndComparison){
    EXPECT_EQ(eval_script("return 7 / 2;").as_int(), 3);
    EXPECT_DOUBLE_EQ(eval_script("return 7 / 2.0;").as_double(), 3.5);
    EXPECT_EQ(eval_script("return 2 ^ 10;").as_int(), 1024);
    EXPECT_DOUBLE_EQ(eval_script("return 2 ^ -1;").as_double(), 0.5);
    EXPECT_EQ(eval_script("return -7 % 3;").as_int(), -1);
    EXPECT_EQ(eval_script("return \"n=\" + 4;").as_string(), "n=4");
    EXPECT_TRUE(eval_script("return \"abc\" < \"abd\";").as_bool());
    EXPECT_TRUE(eval_script("return 1 == 1.0;").as_bool());
    EXPECT_TRUE(eval_script("return not (1 > 2) and (3 >= 3 or false);").as_bool());
    EXPECT_EQ(eval_script("return true ? \"y\" : \"n\";").as_string(), "y");
    EXPECT_EQ(eval_script("return typeof {\"a\": 1};").as_string(), "json");
}

TEST(Interpreter, LogicalOperatorsShortCircuit){
    // The right operand would raise if evaluated.
    EXPECT_FALSE(eval_script("return false && (1 / 0 == 1);").as_bool());
    EXPECT_TRUE(eval_script("return true || (1 / 0 == 1);").as_bool());
    EXPECT_THROW(eval_script("return 1 && true;"), InterpreterError);
}

TEST(Interpreter, TypedDeclarationsCoerceAndDefault){
    auto run = run_script("var a: int = \"12\"; var b: double; var c: string = 3; var d: int[3]; var e: bool;\n"
                          "print a + 1, b, c + c, d.length, e;");
    EXPECT_EQ(run.out, "13 0.0 33 3 false\n");
    EXPECT_THROW(run_script("var a: int = \"twelve\";"), TypeError);
}

TEST(Interpreter, CompositeAssignmentCopies){
    Value r = eval_script("var a = [1, 2]; var b = a; b[0] = 9; var o = {\"k\": a}; o.k[1] = 5;\n"
                          "return [a[0], a[1], b[0], o.k[1]];");
    const auto& items = r.as_array().items;
    ASSERT_EQ(items.size(), 4u);
    EXPECT_EQ(items[0].as_int(), 1);
    EXPECT_EQ(items[1].as_int(), 2);
    EXPECT_EQ(items[2].as_int(), 9);
    EXPECT_EQ(items[3].as_int(), 5);
}

TEST(Interpreter, ArraysGrowButFixedArraysDoNot){
    Value r = eval_script("var a: int[]; a[2] = 5; return a;");
    ASSERT_EQ(r.as_array().items.size(), 3u);
    EXPECT_EQ(r.as_array().items[0].as_int(), 0);
    try {
        run_script("var f: int[2]; f[2] = 1;");
        FAIL() << "expected InterpreterError";
    } catch(const InterpreterError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::Index);
    }
    EXPECT_THROW(run_script("var a = [1]; print a[3];"), InterpreterError);
}

TEST(Interpreter, IncrementAndCompoundAssignment){
    auto run = run_script("var i = 1; var j = i++; var k = ++i; i -= 1; i *= 10; var s = \"a\"; s += \"b\";\n"
                          "print i, j, k, s;");
    EXPECT_EQ(run.out, "20 1 3 ab\n");
}

TEST(Interpreter, ConstantsCannotBeReassigned){
    try {
        run_script("const limit = 3;\nlimit = 4;");
        FAIL() << "expected InterpreterError";
    } catch(const InterpreterError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::Access);
        EXPECT_EQ(e.loc().line, 2);
    }
}

TEST(Interpreter, UndefinedVariableReportsLocation){
    try {
        run_script("var a = 1;\nprint a + missing;");
        FAIL() << "expected InterpreterError";
    } catch(const InterpreterError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::NotFound);
        EXPECT_EQ(e.loc().line, 2);
        EXPECT_NE(e.message().find("missing"), std::string::npos);
    }
}

TEST(Interpreter, MemberAccessOnJsonAndRecords){
    EXPECT_TRUE(eval_script("var o = {\"a\": 1}; return o.b;").is_null());
    EXPECT_EQ(eval_script("var o = {\"length\": 9}; return o.length;").as_int(), 9);
    EXPECT_EQ(eval_script("return \"hello\"[1];").as_string(), "e");
    EXPECT_THROW(eval_script("var p: record{x:int}; return p.y;"), InterpreterError);
    EXPECT_THROW(eval_script("var n = null; return n.x;"), InterpreterError);
}

TEST(Interpreter, ScriptLevelGlobalsResetBetweenRuns){
    Interpreter interp(standard_builtins());
    interp.load(parse("varset keep inout { var runs: int = 0; }\nvar temp = 1;\nkeep.runs += 1;"));
    interp.run();
    interp.run();
    EXPECT_EQ(interp.get_var("keep.runs").as_int(), 2);
}

TEST_F(HostAccessTest, InVarSetAcceptsHostWritesBeforeRun){
    interp_.load(parse(kHostScript));
    interp_.set_var("plant.input.level", Value("4"));
    interp_.run();
    EXPECT_EQ(interp_.get_var("plant.input.level").as_int(), 4);
    EXPECT_DOUBLE_EQ(interp_.get_var("plant.output.result").as_double(), 10.0);
    EXPECT_DOUBLE_EQ(interp_.get_var("output.result").as_double(), 10.0);
    EXPECT_EQ(interp_.get_var("PLANT.Shared.Note").as_string(), "n!");
}

TEST_F(HostAccessTest, BindingsAreHostWrites){
    auto result = interp_.run(parse(kHostScript), Bindings{{"plant.input.level", Value(2)}});
    EXPECT_EQ(result.status, ExecutionResult::Status::Completed);
    EXPECT_DOUBLE_EQ(interp_.get_var("output.result").as_double(), 5.0);
    EXPECT_THROW(interp_.run(Bindings{{"plant.output.result", Value(1.0)}}), ScopeViolationError);
}

TEST_F(HostAccessTest, ScriptWriteToInVarSetFailsAfterStart){
    try {
        interp_.run(parse("varset input in { var level: int = 1; }\n"
                          "call vars.set(\"plant.input.level\", 5);"));
        FAIL() << "expected ScopeViolationError";
    } catch(const ScopeViolationError& e) {
        EXPECT_EQ(e.loc().line, 2);
    }
    EXPECT_EQ(interp_.get_var("input.level").as_int(), 1);
    EXPECT_THROW(interp_.run(parse("varset input in { var level: int = 1; }\ninput.level = 2;")), ScopeViolationError);
}

TEST_F(HostAccessTest, OutVarSetIsHostReadOnly){
    interp_.run(parse(kHostScript));
    try {
        interp_.set_var("plant.output.result", Value(1.0));
        FAIL() << "expected ScopeViolationError";
    } catch(const ScopeViolationError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::Access);
    }
    interp_.set_var("plant.shared.note", Value("host"));
    EXPECT_EQ(interp_.get_var("shared.note").as_string(), "host");
}

TEST_F(HostAccessTest, ListOmitsInternalVarSets){
    interp_.load(parse(kHostScript));
    std::vector<std::string> want = {"plant.input.level", "plant.output.result", "plant.shared.note"};
    EXPECT_EQ(interp_.list_vars(), want);
}

TEST_F(HostAccessTest, BadPathsAreNotFound){
    interp_.load(parse(kHostScript));
    for(const char* path : {"other.input.level", "plant.input.nope", "plant.nowhere.level", "level"}){
        SCOPED_TRACE(path);
        try {
            interp_.get_var(path);
            FAIL() << "expected InterpreterError";
        } catch(const InterpreterError& e) {
            EXPECT_EQ(e.kind(), ErrorKind::NotFound);
        }
    }
}

TEST_F(HostAccessTest, HostCallsScriptFunctions){
    interp_.load(parse("varset out_set out { var last: int; }\n"
                       "function twice(n: int) return int { out_set.last = n * 2; return out_set.last; }"));
    EXPECT_EQ(interp_.call_function("twice", {Value("21")}).as_int(), 42);
    EXPECT_EQ(interp_.submit_callback("TWICE", {Value(5)}).get().as_int(), 10);
    EXPECT_EQ(interp_.get_var("out_set.last").as_int(), 10);
    EXPECT_THROW(interp_.call_function("missing"), InterpreterError);
}

TEST(Interpreter, InstancesAreIndependent){
    auto program = "varset s inout { var v: int = 0; }\ns.v += 1;";
    Interpreter a(standard_builtins()), b(standard_builtins());
    a.run(parse(program));
    a.run();
    b.run(parse(program));
    EXPECT_EQ(a.get_var("s.v").as_int(), 2);
    EXPECT_EQ(b.get_var("s.v").as_int(), 1);
}

TEST(Interpreter, IntegerOverflowIsMathError){
    const char* cases[] = {
        "9223372036854775807 + 1",
        "(-9223372036854775807 - 1) - 1",
        "4611686018427387904 * 2",
        "(-9223372036854775807 - 1) / -1",
        "-(-9223372036854775807 - 1)",
        "3 ^ 40",
        "(-2) ^ 64",
    };
    for(const char* expr : cases){
        SCOPED_TRACE(expr);
        std::string src = std::string("var r = \"none\";\n"
                                      "try { var v = ") + expr + "; r = \"wrapped \" + v; }\n"
                          "exceptions { when MATH_ERROR(m) { r = m; } }\n"
                          "return r;";
        std::string msg = eval_script(src).as_string();
        EXPECT_NE(msg.find("integer overflow"), std::string::npos) << msg;
    }
    EXPECT_EQ(eval_script("var i = 9223372036854775807; try { i++; } exceptions { when MATH_ERROR { return -1; } } return i;").as_int(), -1);
    EXPECT_EQ(eval_script("var i = 4611686018427387904; try { i *= 2; } exceptions { when MATH_ERROR { return -1; } } return i;").as_int(), -1);
}

TEST(Interpreter, IntegerEdgesThatFit){
    EXPECT_EQ(eval_script("return (-9223372036854775807 - 1) % -1;").as_int(), 0);
    EXPECT_EQ(eval_script("return (-2) ^ 63;").as_int(), std::numeric_limits<int64_t>::min());
    EXPECT_EQ(eval_script("return 2 ^ 62;").as_int(), int64_t{1} << 62);
    EXPECT_EQ(eval_script("return 1 ^ 100000;").as_int(), 1);
    EXPECT_EQ(eval_script("return (-1) ^ 100001;").as_int(), -1);
    EXPECT_EQ(eval_script("return 0 ^ 0;").as_int(), 1);
    EXPECT_EQ(eval_script("return 9223372036854775806 + 1;").as_int(), std::numeric_limits<int64_t>::max());
}

TEST(Interpreter, MutatingBuiltinEvaluatesTargetIndexOnce){
    Value r = eval_script("var a = [[1], [2]]; var i = 0;\n"
                          "call array.push(a[i++], 9);\n"
                          "return [a, i];");
    EXPECT_EQ(display_string(r), "[[[1, 9], [2]], 1]");
    Value m = eval_script("var o = {\"q\": [[0], [0]]}; var n = 0;\n"
                          "function next() { n++; return n; }\n"
                          "call array.push(o.q[next() - 1], 5);\n"
                          "return [o, n];");
    EXPECT_EQ(display_string(m), "[{\"q\": [[0, 5], [0]]}, 1]");
}

TEST(Interpreter, HostHandlerStdExceptionBecomesScriptError){
    auto reg = BuiltinRegistry::Builder()
        .add("host.lookup", [](std::vector<Value>&, ExecContext&) -> Value {
            throw std::out_of_range("lookup table index 12");
        }, 0, 0)
        .build();
    auto run = run_script("var r = \"\";\n"
                          "try { call host.lookup(); } exceptions { when ANY_ERROR(m) { r = m; } }\n"
                          "return r;", {}, reg);
    EXPECT_NE(run.result.value.as_string().find("lookup table index 12"), std::string::npos) << run.result.value.as_string();
    try {
        run_script("var x = 1;\ncall host.lookup();", {}, reg);
        FAIL() << "expected InterpreterError";
    } catch(const InterpreterError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::Any);
        EXPECT_EQ(e.loc().line, 2);
    }
}

TEST(Interpreter, CastsConvertOrRaise){
    EXPECT_EQ(eval_script("return int(3.9);").as_int(), 3);
    EXPECT_EQ(eval_script("return int(-3.9);").as_int(), -3);
    EXPECT_EQ(eval_script("return int(\"42\") + 1;").as_int(), 43);
    EXPECT_DOUBLE_EQ(eval_script("return double(7) / 2;").as_double(), 3.5);
    EXPECT_EQ(eval_script("return string(12) + string(true);").as_string(), "12true");
    EXPECT_EQ(eval_script("return string([1, 2]);").as_string(), "[1, 2]");
    EXPECT_TRUE(eval_script("return bool(\"true\");").as_bool());
    EXPECT_THROW(run_script("return int(\"twelve\");"), TypeError);
    EXPECT_EQ(eval_script("try { return int(1e300); } exceptions { when MATH_ERROR { return -1; } }").as_int(), -1);
}

TEST(Interpreter, ChainedComparisonEvaluatesEachOperandOnce){
    EXPECT_TRUE(eval_script("return 1 < 2 <= 2;").as_bool());
    EXPECT_FALSE(eval_script("return 1 < 3 < 2;").as_bool());
    EXPECT_TRUE(eval_script("return \"a\" < \"b\" < \"c\";").as_bool());
    auto run = run_script("var n = 0;\n"
                          "function mid() { n++; return 5; }\n"
                          "var ok = 1 < mid() < 10;\n"
                          "var early = 9 < mid() < 10;\n"
                          "return [ok, early, n];");
    EXPECT_EQ(display_string(run.result.value), "[true, false, 2]");
    // Operands after the first false comparison are never evaluated.
    EXPECT_FALSE(eval_script("return 3 < 2 < (1 / 0);").as_bool());
}

TEST(Interpreter, RunWithProgramLoadsAndBindsInOneStep){
    Interpreter interp(standard_builtins());
    auto program = parse("varset cfg in { var gain: int = 1; }\n"
                         "varset res out { var value: int; }\n"
                         "res.value = cfg.gain * 10;\n"
                         "return res.value;");
    ExecutionResult r = interp.run(program, {{"cfg.gain", Value(4)}});
    EXPECT_EQ(r.status, ExecutionResult::Status::Returned);
    EXPECT_EQ(r.value.as_int(), 40);
    EXPECT_EQ(interp.get_var("res.value").as_int(), 40);
    // The loaded program and its varset values stay for later runs.
    EXPECT_EQ(interp.run().value.as_int(), 40);
}

TEST(Interpreter, ImportedFilesRunInPlace){
    ImportLoader loader = [](const std::string& path, const std::string&) -> std::optional<ImportSource> {
        if(path!="lib.ebs") return std::nullopt;
        return ImportSource{"lib.ebs", "varset lib inout { var calls: int = 0; }\n"
                                       "function twice(n) { lib.calls++; return n * 2; }\n"
                                       "var base = 5;\n"
                                       "print \"lib loaded\";\n"
                                       "return 99;\n"
                                       "print \"unreachable\";"};
    };
    std::ostringstream out;
    InterpreterOptions o;
    o.out = &out;
    Interpreter interp(standard_builtins(), o);
    auto program = Parser().set_import_loader(loader).parse("print \"start\";\nimport \"lib.ebs\";\nreturn twice(base);", "main.ebs");
    ExecutionResult r = interp.run(program);
    EXPECT_EQ(r.value.as_int(), 10);
    EXPECT_EQ(out.str(), "start\nlib loaded\n");
    EXPECT_EQ(interp.get_var("lib.calls").as_int(), 1);
}
