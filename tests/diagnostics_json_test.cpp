#include <gtest/gtest.h>
#include "test_env.hpp"

using namespace ebs;
using ebs::test::ScopedEnv;

TEST(DiagnosticsJson, EscapesControlCharacters){
    EXPECT_EQ(json_escape("a\"b\\c\n\t"), "\"a\\\"b\\\\c\\n\\t\"");
    EXPECT_EQ(json_escape(std::string("\x01", 1)), "\"\\u0001\"");
}

TEST(DiagnosticsJson, ParseErrorReport){
    try {
        parse("var x = 1;\nvar = 2;");
        FAIL() << "expected ParseError";
    } catch(const ParseError& e) {
        std::string js = diagnostics_to_json(e);
        EXPECT_EQ(js.rfind("{\"success\":false,\"errors\":[{\"code\":\"E2001\",\"category\":\"ParseError\",\"kind\":\"PARSE_ERROR\"", 0), 0u) << js;
        EXPECT_NE(js.find("\"line\":2,\"col\":5}"), std::string::npos) << js;
    }
}

TEST(DiagnosticsJson, RuntimeErrorReport){
    InterpreterError e(ErrorKind::Index, "index 3 out of range", SourceLoc{4, 2});
    EXPECT_EQ(diagnostics_to_json(e),
              "{\"success\":false,\"errors\":[{\"code\":\"E5001\",\"category\":\"InterpreterError\",\"kind\":\"INDEX_ERROR\","
              "\"message\":\"index 3 out of range\",\"line\":4,\"col\":2}]}");
    EXPECT_EQ(diagnostics_success_json(), "{\"success\":true,\"errors\":[]}");
}

TEST(DiagnosticsJson, PrintedOnlyWhenEnabled){
    UnknownBuiltinError e("unknown builtin 'foo.bar'", SourceLoc{1, 6});
    RuntimeEnv env;
    {
        env.diagJson = false;
        testing::internal::CaptureStderr();
        maybe_print_json(e, env);
        EXPECT_EQ(testing::internal::GetCapturedStderr(), "");
    }
    {
        env.diagJson = true;
        testing::internal::CaptureStderr();
        maybe_print_json(e, env);
        std::string err = testing::internal::GetCapturedStderr();
        EXPECT_NE(err.find("\"category\":\"UnknownBuiltinError\""), std::string::npos) << err;
        EXPECT_NE(err.find("foo.bar"), std::string::npos);
    }
}

TEST(DiagnosticsJson, FollowsResolvedEnvNotProcessEnv){
    UnknownBuiltinError e("unknown builtin 'foo.bar'", SourceLoc{1, 6});
    ScopedEnv on("EBS_DIAG_JSON", "1");
    RuntimeEnv env = detect_env();
    EXPECT_TRUE(env.diagJson);
    env.diagJson = false;
    testing::internal::CaptureStderr();
    maybe_print_json(e, env);
    EXPECT_EQ(testing::internal::GetCapturedStderr(), "");
}

TEST(RuntimeEnv, FlagsComeFromEnvironment){
    ScopedEnv trace("EBS_TRACE_EXEC", "yes");
    ScopedEnv calls("EBS_TRACE_CALLS", "0");
    ScopedEnv depth("EBS_MAX_CALL_DEPTH", "64");
    RuntimeEnv env = detect_env();
    EXPECT_TRUE(env.traceExec);
    EXPECT_FALSE(env.traceCalls);
    EXPECT_EQ(env.maxCallDepth, 64u);
    {
        ScopedEnv bad("EBS_MAX_CALL_DEPTH", "lots");
        EXPECT_EQ(detect_env().maxCallDepth, 512u);
    }
}
