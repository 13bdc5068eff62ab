/*
 * Script builder tests - Shell-Gen
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <gtest/gtest.h>
#include <shell-gen/render/render.hpp>
#include <shell-gen/script/param.hpp>
#include <shell-gen/script/script.hpp>
#include <shell-gen/var/variables.hpp>

using namespace shellgen;

static std::string text_of(const Expr& e) {
    auto* c = std::get_if<CmdNode>(&e.node);
    return c ? c->text : std::string("<not a command>");
}

TEST(ScriptCapture, EnvironmentCarriedForward) {
    Script s;
    auto inner = s.capture([](Script& in) { new_var(in); });
    EXPECT_EQ(inner.size(), 1u);
    EXPECT_TRUE(s.exprs().empty());
    auto v = new_var(s);
    EXPECT_EQ(v.name(), "_v2");
}

TEST(ScriptRun, ResultHoldsExprsAndEnv) {
    auto r = run_script(Env{}, [](Script& s) {
        new_var(s, named_like("a"));
        cmd(s, "true");
    });
    ASSERT_EQ(r.exprs.size(), 2u);
    EXPECT_EQ(text_of(r.exprs[0]), "_a=");
    EXPECT_EQ(text_of(r.exprs[1]), "true");
    EXPECT_TRUE(r.env.has_var("_a"));
}

TEST(ScriptBind, ResultFlowsToNextStep) {
    Step<Var<std::string>> first = [](Script& s) { return new_var_containing(s, "x"); };
    Step<int> both = bind<Var<std::string>, int>(first, [](Var<std::string> v) -> Step<int> {
        return [v](Script& s) { cmd(s, "echo", v); return 7; };
    });
    Script s;
    EXPECT_EQ(both(s), 7);
    ASSERT_EQ(s.exprs().size(), 2u);
    EXPECT_EQ(text_of(s.exprs()[0]), "_v=x");
    EXPECT_EQ(text_of(s.exprs()[1]), "echo \"$_v\"");
}

TEST(ScriptSequence, InOrder) {
    auto exprs = gen(sequence([](Script& s) { cmd(s, "a"); }, [](Script& s) { cmd(s, "b"); }));
    ASSERT_EQ(exprs.size(), 2u);
    EXPECT_EQ(text_of(exprs[0]), "a");
    EXPECT_EQ(text_of(exprs[1]), "b");
}

TEST(ScriptCmd, ParameterCategories) {
    Script s;
    auto v = new_var(s, named_like("name"));
    cmd(s, "echo", "hello world", val(42), Quoted("*"), v, std::string("it's"));
    EXPECT_EQ(text_of(s.exprs().back()), "echo 'hello world' 42 * \"$_name\" 'it'\"'\"'s'");
}

TEST(ScriptCmd, CommandItselfIsAParam) {
    Script s;
    auto echo = new_var_containing(s, "echo");
    cmd(s, echo, "hi");
    EXPECT_EQ(text_of(s.exprs().back()), "\"$_v\" hi");
}

TEST(ScriptCmd, OutputIsCommandSubstitution) {
    Script s;
    cmd(s, "echo", "me:", Output{[](Script& o) { cmd(o, "whoami"); }});
    EXPECT_EQ(text_of(s.exprs().back()), "echo me: \"$(whoami)\"");
}

TEST(ScriptCmd, OutputNamesStayReserved) {
    Script s;
    cmd(s, "echo", Output{[](Script& o) { auto t = new_var_containing(o, "x"); cmd(o, "echo", t); }});
    EXPECT_EQ(text_of(s.exprs().back()), "echo \"$(_v=x; echo \"$_v\")\"");
    EXPECT_EQ(new_var(s).name(), "_v2");
}

TEST(ScriptCmd, WithVarRewritesExpansion) {
    Script s;
    auto user = new_var(s, named_like("user"));
    cmd(s, "rmdir", WithVar<std::string>{user, [](Quoted q) { return Quoted("/home/") + q; }});
    EXPECT_EQ(text_of(s.exprs().back()), "rmdir /home/\"$_user\"");
}

TEST(ScriptRun, PlainRunQuotesEveryWord) {
    Script s;
    run(s, "ls", {"-l", "my dir"});
    EXPECT_EQ(text_of(s.exprs().back()), "ls -l 'my dir'");
}

TEST(ScriptComment, AddsCommentNode) {
    Script s;
    comment(s, "hello");
    ASSERT_EQ(s.exprs().size(), 1u);
    auto* c = std::get_if<CommentNode>(&s.exprs()[0].node);
    ASSERT_NE(c, nullptr);
    EXPECT_EQ(c->text, "hello");
}
