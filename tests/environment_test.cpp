#include <gtest/gtest.h>
#include "ebs/environment.hpp"

using namespace ebs;

namespace {

Var make_var(std::string name, Value v, std::string varset = {}){
    Var out;
    out.name = std::move(name);
    out.type = DataType::any();
    out.value = std::move(v);
    out.varset = std::move(varset);
    return out;
}

} // namespace

TEST(Environment, InnerDeclarationShadowsOuter){
    Environment env;
    env.declare(make_var("x", 1));
    {
        ScopeGuard block(env, ScopeKind::Block);
        env.declare(make_var("X", 2));
        EXPECT_EQ(env.lookup("x")->value.as_int(), 2);
    }
    EXPECT_EQ(env.lookup("x")->value.as_int(), 1);
    EXPECT_EQ(env.depth(), 1u);
}

TEST(Environment, RedeclarationInSameScopeFails){
    Environment env;
    env.declare(make_var("count", 1));
    EXPECT_THROW(env.declare(make_var("COUNT", 2)), InterpreterError);
}

TEST(Environment, FunctionScopeHidesCallerLocals){
    Environment env;
    env.declare(make_var("g", "global"));
    ScopeGuard caller(env, ScopeKind::Function);
    env.declare(make_var("local", 1));
    {
        ScopeGuard callee(env, ScopeKind::Function);
        EXPECT_EQ(env.lookup("local"), nullptr);
        ASSERT_NE(env.lookup("g"), nullptr);
        EXPECT_EQ(env.lookup("g")->value.as_string(), "global");
        ScopeGuard inner(env, ScopeKind::Block);
        env.declare(make_var("tmp", 3));
        EXPECT_NE(env.lookup("tmp"), nullptr);
    }
    EXPECT_NE(env.lookup("local"), nullptr);
    EXPECT_EQ(env.lookup("tmp"), nullptr);
}

TEST(Environment, InVarSetRules){
    Environment env;
    env.define_varset("input", VarScope::In);
    const Var& v = env.declare(make_var("input.level", 1, "input"));
    EXPECT_NO_THROW(env.check_write(v, Access::Host));
    EXPECT_THROW(env.check_write(v, Access::Script), ScopeViolationError);
    env.set_started(true);
    EXPECT_THROW(env.check_write(v, Access::Host), ScopeViolationError);
    EXPECT_THROW(env.check_write(v, Access::Script), ScopeViolationError);
}

TEST(Environment, OutAndInOutVarSetRules){
    Environment env;
    env.define_varset("result", VarScope::Out);
    env.define_varset("shared", VarScope::InOut);
    env.define_varset("hidden", VarScope::Internal);
    const Var& out = env.declare(make_var("result.total", 0, "result"));
    const Var& both = env.declare(make_var("shared.flag", false, "shared"));
    const Var& hidden = env.declare(make_var("hidden.n", 0, "hidden"));
    env.set_started(true);
    EXPECT_NO_THROW(env.check_write(out, Access::Script));
    try {
        env.check_write(out, Access::Host);
        FAIL() << "expected ScopeViolationError";
    } catch(const ScopeViolationError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::Access);
        EXPECT_NE(e.message().find("out-scoped"), std::string::npos);
    }
    EXPECT_NO_THROW(env.check_write(both, Access::Script));
    EXPECT_NO_THROW(env.check_write(both, Access::Host));
    EXPECT_NO_THROW(env.check_write(hidden, Access::Script));
    EXPECT_NO_THROW(env.check_write(hidden, Access::Host));
}

TEST(Environment, LocalsAreUnrestricted){
    Environment env;
    env.set_started(true);
    ScopeGuard fn(env, ScopeKind::Function);
    const Var& v = env.declare(make_var("n", 1));
    EXPECT_NO_THROW(env.check_write(v, Access::Script));
}

TEST(Environment, VarSetsKeepDeclarationOrderAndCase){
    Environment env;
    env.define_varset("Zeta", VarScope::Visible);
    env.define_varset("alpha", VarScope::Out);
    VarSet& again = env.define_varset("ZETA", VarScope::In);
    EXPECT_EQ(again.scope, VarScope::Visible);
    auto sets = env.varsets();
    ASSERT_EQ(sets.size(), 2u);
    EXPECT_EQ(sets[0]->name, "Zeta");
    EXPECT_EQ(sets[1]->name, "alpha");
    EXPECT_EQ(Environment::member_key("Zeta", "Count"), "zeta.count");
    EXPECT_EQ(Environment::member_key(kScriptVarSet, "Count"), "count");
}

TEST(Environment, ResetKeepsVarSetMembersOnly){
    Environment env;
    env.define_varset(kScriptVarSet, VarScope::Internal).vars.push_back("tmp");
    env.define_varset("cfg", VarScope::InOut).vars.push_back("cfg.limit");
    env.declare(make_var("tmp", 1, kScriptVarSet));
    env.declare(make_var("cfg.limit", 5, "cfg"));
    env.push_scope(ScopeKind::Block);
    env.reset_to_globals();
    EXPECT_EQ(env.depth(), 1u);
    EXPECT_EQ(env.find_global("tmp"), nullptr);
    ASSERT_NE(env.find_global("cfg.limit"), nullptr);
    EXPECT_TRUE(env.find_varset(kScriptVarSet)->vars.empty());
    env.clear();
    EXPECT_EQ(env.find_varset("cfg"), nullptr);
}
