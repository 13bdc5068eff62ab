/*
 * Control flow and error handling tests - Shell-Gen
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <gtest/gtest.h>
#include <shell-gen/control/control.hpp>
#include <shell-gen/render/render.hpp>
#include <shell-gen/script/error.hpp>
#include <shell-gen/var/func.hpp>
#include <shell-gen/var/variables.hpp>

using namespace shellgen;

static Block echo(const std::string& word) {
    return [word](Script& s) { cmd(s, "echo", word); };
}

TEST(ControlFor, MultiLineLayout) {
    std::string out = script([](Script& s) {
        for_cmd(s, [](Script& c) { cmd(c, "seq", "1", "3"); },
                [](Script& b, const Var<std::string>& x) { cmd(b, "echo", x); });
    });
    EXPECT_EQ(out, "#!/bin/sh\nfor _x in $(seq 1 3)\ndo :\n\techo \"$_x\"\ndone\n");
}

TEST(ControlFor, SingleLine) {
    std::string out = linear_script([](Script& s) {
        for_cmd(s, [](Script& c) { cmd(c, "seq", "1", "3"); },
                [](Script& b, const Var<std::string>& x) { cmd(b, "echo", x); });
    });
    EXPECT_EQ(out, "for _x in $(seq 1 3); do :; \techo \"$_x\"; done");
}

TEST(ControlFor, EmptyBodyStillHasNoOp) {
    std::string out = linear_script([](Script& s) {
        for_cmd(s, echo("a"), [](Script&, const Var<std::string>&) {});
    });
    EXPECT_EQ(out, "for _x in $(echo a); do :; done");
}

TEST(ControlFor, NestedLoopsGetDistinctNames) {
    std::string out = linear_script([](Script& s) {
        for_cmd(s, echo("a"), [](Script& b, const Var<std::string>&) {
            for_cmd(b, echo("b"), [](Script&, const Var<std::string>&) {});
        });
    });
    EXPECT_NE(out.find("for _x in"), std::string::npos);
    EXPECT_NE(out.find("for _x2 in"), std::string::npos);
}

TEST(ControlWhile, CommandSubstitutedCondition) {
    std::string out = linear_script([](Script& s) {
        while_cmd(s, echo("false"), echo("never"));
    });
    EXPECT_EQ(out, "while $(echo false); do :; \techo never; done");
}

TEST(ControlIf, SingleCommandInline) {
    std::string out = script([](Script& s) {
        if_cmd(s, [](Script& c) { cmd(c, "true"); }, echo("yes"), echo("no"));
    });
    EXPECT_EQ(out, "#!/bin/sh\nif true\nthen :\n\techo yes\nelse :\n\techo no\nfi\n");
}

TEST(ControlIf, SeveralCommandsWrapped) {
    std::string out = linear_script([](Script& s) {
        when_cmd(s, [](Script& c) { cmd(c, "a"); cmd(c, "b"); }, echo("yes"));
    });
    EXPECT_EQ(out, "if (\ta;\tb); then :; \techo yes; fi");
}

TEST(ControlIf, PipeConditionWrapped) {
    std::string out = linear_script([](Script& s) {
        when_cmd(s, [](Script& c) { pipe_to(c, echo("x"), [](Script& g) { cmd(g, "grep", "x"); }); }, echo("yes"));
    });
    EXPECT_EQ(out, "if (\techo x | \tgrep x); then :; \techo yes; fi");
}

TEST(ControlIf, Unless) {
    std::string out = linear_script([](Script& s) {
        unless_cmd(s, [](Script& c) { cmd(c, "false"); }, echo("ran"));
    });
    EXPECT_EQ(out, "if ! false; then :; \techo ran; fi");
}

TEST(ControlCase, Layout) {
    std::string out = script([](Script& s) {
        auto v = new_var(s);
        case_of(s, v, {{glob("a*"), echo("A")}, {Quoted("*"), echo("other")}});
    });
    EXPECT_EQ(out,
              "#!/bin/sh\n_v=\ncase \"$_v\" in a*) :\n\techo A\n: ;; *) :\n\techo other\n;; esac\n");
}

TEST(ControlCase, EmptyEmitsNothing) {
    auto exprs = gen([](Script& s) { case_of(s, positional_parameters(), {}); });
    EXPECT_TRUE(exprs.empty());
}

TEST(ControlFunc, DefinitionAndCall) {
    std::string out = script([](Script& s) {
        Func greet = func(s, named_like("greet"), echo("hi"));
        greet(s, "bob", val(2));
    });
    EXPECT_EQ(out, "#!/bin/sh\n_greet () { :\n\techo hi\n}\n_greet bob 2\n");
}

TEST(ControlFunc, UniqueNamesAcrossBodies) {
    Script s;
    Func f1 = func(s, named_like("f"), [](Script& b) { new_var(b); });
    Func f2 = func(s, named_like("f"), [](Script& b) { new_var(b); });
    Func anon = func(s, {}, [](Script&) {});
    EXPECT_EQ(f1.name(), "_f");
    EXPECT_EQ(f2.name(), "_f2");
    EXPECT_EQ(anon.name(), "_p");
    EXPECT_EQ(new_var(s).name(), "_v3");
}

TEST(ControlFailure, StopOnFailure) {
    EXPECT_EQ(linear_script([](Script& s) { stop_on_failure(s, true); stop_on_failure(s, false); }),
              "set -e; set +e");
}

TEST(ControlFailure, IgnoreRewritesEveryNodeKind) {
    RedirSpec to_f{RedirSpec::Type::ToFile, kStdout, "f"};
    std::vector<Expr> in = {
        make_cmd("a"),
        make_comment("keep"),
        make_subshell({make_cmd("b"), make_cmd("c")}),
        make_pipe(make_cmd("d"), make_cmd("e")),
        make_and(make_cmd("f"), make_cmd("g")),
        make_or(make_cmd("h"), make_cmd("i")),
        make_redir(make_cmd("j"), to_f),
    };
    auto out = ignore_failure_exprs(in);
    ASSERT_EQ(out.size(), in.size());
    EXPECT_EQ(linearize({out[0]}), "a || true");
    EXPECT_EQ(linearize({out[1]}), ": keep");
    EXPECT_EQ(linearize({out[2]}), "(\tb || \ttrue;\tc || \ttrue)");
    EXPECT_EQ(linearize({out[3]}), "d | { e || true; }");
    EXPECT_EQ(linearize({out[4]}), "f && g || true");
    EXPECT_EQ(linearize({out[5]}), "h || { i || true; }");
    EXPECT_EQ(linearize({out[6]}), "{ j || true; } > f");
    // the input is left as it was
    EXPECT_EQ(linearize({in[0]}), "a");
}

TEST(ControlFailure, IgnoreFailureBlock) {
    std::string out = linear_script([](Script& s) {
        ignore_failure(s, [](Script& b) { cmd(b, "false"); comment(b, "c"); cmd(b, "false"); });
    });
    EXPECT_EQ(out, "false || true; : c; false || true");
}

TEST(ControlCombine, MultiNodeSidesBecomeSubshells) {
    std::string out = linear_script([](Script& s) {
        pipe_to(s, [](Script& l) { cmd(l, "a"); cmd(l, "b"); }, echo("c"));
        and_then(s, echo("x"), echo("y"));
        or_else(s, echo("x"), echo("y"));
    });
    EXPECT_EQ(out, "(\ta;\tb) | echo c; echo x && echo y; echo x || echo y");
}

TEST(ControlRedirect, Helpers) {
    std::string out = linear_script([](Script& s) {
        redirect_to(s, [](Script& b) { cmd(b, "find", "/"); }, "/dev/null");
        redirect_to(s, echo("err"), "log file", kStderr);
        redirect_append(s, echo("x"), "log");
        redirect_from(s, [](Script& b) { cmd(b, "wc", "-l"); }, "in.txt");
        redirect_output(s, echo("x"), kStderr, kStdout);
        redirect_input(s, [](Script& b) { cmd(b, "cat"); }, kStdin, 3);
        to_stderr(s, echo("oops"));
    });
    EXPECT_EQ(out,
              "find / > /dev/null; echo err 2> 'log file'; echo x >> log; wc -l < in.txt; "
              "echo x 2>&1; cat <&3; echo oops >&2");
}

TEST(ControlRedirect, HereDocumentBothModes) {
    Block b = [](Script& s) { here_document(s, [](Script& c) { cmd(c, "cat"); }, "one\ntwo"); };
    EXPECT_EQ(script(b), "#!/bin/sh\ncat <<EOF\none\ntwo\nEOF\n");
    EXPECT_EQ(linear_script(b), "(\techo one;\techo two) | cat");
}

TEST(ControlEmpty, ConditionRejected) {
    Script s;
    Block nothing = [](Script&) {};
    EXPECT_THROW(when_cmd(s, nothing, echo("x")), ScriptError);
    EXPECT_THROW(unless_cmd(s, nothing, echo("x")), ScriptError);
    EXPECT_THROW(if_cmd(s, nothing, echo("x"), echo("y")), ScriptError);
    EXPECT_THROW(while_cmd(s, nothing, echo("x")), ScriptError);
    EXPECT_TRUE(s.exprs().empty());
}

TEST(ControlEmpty, OperandBecomesNoOp) {
    std::string out = linear_script([](Script& s) {
        Block nothing = [](Script&) {};
        pipe_to(s, nothing, [](Script& b) { cmd(b, "cat"); });
        and_then(s, echo("x"), nothing);
        or_else(s, nothing, echo("y"));
        redirect_to(s, nothing, "f");
    });
    EXPECT_EQ(out, ": | cat; echo x && :; : || echo y; : > f");
}
