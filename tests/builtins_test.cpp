#include <gtest/gtest.h>
#include "test_env.hpp"

using namespace ebs;
using ebs::test::run_script;

namespace {

Value constant(std::vector<Value>&, ExecContext&){ return Value(int64_t{7}); }

} // namespace

TEST(BuiltinRegistry, NamesAreValidatedAndUnique){
    BuiltinRegistry::Builder b;
    b.add("host.answer", constant, 0, 0);
    EXPECT_THROW(b.add("HOST.Answer", constant), registry_error);
    EXPECT_THROW(b.add("answer", constant), registry_error);
    EXPECT_THROW(b.add("host.", constant), registry_error);
    EXPECT_THROW(b.add("9lives.x", constant), registry_error);
    EXPECT_THROW(b.add("host.empty", BuiltinFn{}), registry_error);
    EXPECT_THROW(b.add("host.bad", constant, 2, 1), registry_error);
    EXPECT_NO_THROW(b.add("a.b.c", constant));
    EXPECT_TRUE(b.contains("Host.Answer"));
}

TEST(BuiltinRegistry, LookupIsCaseInsensitive){
    auto reg = BuiltinRegistry::Builder().add("Media.LoadImage", constant).add("media.save", constant).build();
    ASSERT_NE(reg->find("MEDIA.loadimage"), nullptr);
    EXPECT_EQ(reg->find("media.LOADIMAGE")->name, "media.loadimage");
    EXPECT_EQ(reg->find("media.missing"), nullptr);
    std::vector<std::string> want = {"media.loadimage", "media.save"};
    EXPECT_EQ(reg->names(), want);
    EXPECT_EQ(BuiltinRegistry::empty()->size(), 0u);
}

TEST(BuiltinRegistry, StandardSetDoesNotCollide){
    BuiltinRegistry::Builder b;
    register_standard_builtins(b);
    EXPECT_THROW(register_string_builtins(b), registry_error);
    EXPECT_NO_THROW(b.add("app.extra", constant));
    auto reg = b.build();
    EXPECT_NE(reg->find("str.upper"), nullptr);
    EXPECT_NE(reg->find("app.extra"), nullptr);
}

TEST(BuiltinCalls, UnknownBuiltinNamesTheCallee){
    try {
        run_script("var x = 1;\ncall foo.bar();");
        FAIL() << "expected UnknownBuiltinError";
    } catch(const UnknownBuiltinError& e) {
        EXPECT_NE(std::string(e.message()).find("foo.bar"), std::string::npos);
        EXPECT_NE(std::string(e.what()).find("foo.bar"), std::string::npos);
        EXPECT_EQ(e.code(), "E6001");
        EXPECT_EQ(e.loc().line, 2);
    }
}

TEST(BuiltinCalls, RegistriesAreInjectedPerInterpreter){
    auto small = BuiltinRegistry::Builder().add("host.answer", constant, 0, 0).build();
    EXPECT_EQ(run_script("return host.answer();", {}, small).result.value.as_int(), 7);
    EXPECT_THROW(run_script("return host.answer();"), UnknownBuiltinError);
    EXPECT_THROW(run_script("return str.upper(\"a\");", {}, small), UnknownBuiltinError);
}

TEST(BuiltinCalls, ArityAndNamedArgumentsAreChecked){
    auto reg = BuiltinRegistry::Builder().add("host.pair", constant, 1, 2).build();
    EXPECT_NO_THROW(run_script("host.pair(1); host.pair(1, 2);", {}, reg));
    try {
        run_script("host.pair(1, 2, 3);", {}, reg);
        FAIL() << "expected InterpreterError";
    } catch(const InterpreterError& e) {
        EXPECT_NE(e.message().find("expects 1 to 2 argument(s), got 3"), std::string::npos) << e.message();
    }
    EXPECT_THROW(run_script("host.pair(1, b = 2);", {}, reg), InterpreterError);
}

TEST(BuiltinCalls, HostErrorsBecomeInterpreterErrorsAtTheCallSite){
    auto reg = BuiltinRegistry::Builder()
        .add("net.fetch", [](std::vector<Value>&, ExecContext&) -> Value {
            throw HostError("net.fetch: connection refused", ErrorKind::Network);
        })
        .build();
    try {
        run_script("var a = 1;\nvar b = net.fetch(\"x\");", {}, reg);
        FAIL() << "expected InterpreterError";
    } catch(const InterpreterError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::Network);
        EXPECT_EQ(e.message(), "net.fetch: connection refused");
        EXPECT_EQ(e.loc().line, 2);
    }
    auto run = run_script("try { net.fetch(); } exceptions { when NETWORK_ERROR(m) { print m; } }", {}, reg);
    EXPECT_EQ(run.out, "net.fetch: connection refused\n");
}

TEST(BuiltinCalls, HandlersSeeTheirCallSite){
    SourceLoc seen;
    auto reg = BuiltinRegistry::Builder()
        .add("host.where", [&seen](std::vector<Value>&, ExecContext& ctx) -> Value {
            seen = ctx.call_site();
            return Value();
        })
        .build();
    run_script("var a = 1;\n\n   host.where();", {}, reg);
    EXPECT_EQ(seen.line, 3);
    EXPECT_EQ(seen.col, 4);
}

TEST(BuiltinCalls, WriteBackStoresIntoTheArgument){
    auto reg = BuiltinRegistry::Builder()
        .add("host.bump", [](std::vector<Value>& a, ExecContext&) -> Value {
            a[0] = Value(a[0].as_int() + 1);
            return Value("done");
        }, 1, 1, true)
        .add("host.peek", [](std::vector<Value>& a, ExecContext&) -> Value {
            a[0] = Value(int64_t{-1});
            return Value();
        }, 1, 1)
        .build();
    auto run = run_script("var n = 1; var o = {\"k\": [5]};\n"
                          "var r = host.bump(n); host.bump(o.k[0]); host.peek(n);\n"
                          "print n, o.k[0], r; host.bump(41);", {}, reg);
    EXPECT_EQ(run.out, "2 6 done\n");
}

TEST(BuiltinCalls, WriteBackRespectsDeclaredTypes){
    auto reg = BuiltinRegistry::Builder()
        .add("host.stringify", [](std::vector<Value>& a, ExecContext&) -> Value {
            a[0] = Value("12");
            return Value();
        }, 1, 1, true)
        .build();
    auto run = run_script("var n: int = 0; host.stringify(n); print typeof n, n + 1;", {}, reg);
    EXPECT_EQ(run.out, "int 13\n");
}

TEST(BuiltinCalls, HandlersPrintThroughTheContext){
    auto reg = BuiltinRegistry::Builder()
        .add("host.log", [](std::vector<Value>& a, ExecContext& ctx) -> Value {
            ctx.out() << "[log] " << display_string(a.at(0)) << "\n";
            return Value();
        }, 1, 1)
        .build();
    EXPECT_EQ(run_script("host.log(\"ready\"); call host.log(3);", {}, reg).out, "[log] ready\n[log] 3\n");
}
