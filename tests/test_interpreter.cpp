#include <gatedrepl/script/interpreter.hpp>
#include <gatedrepl/script/parser.hpp>

#include <gtest/gtest.h>

using namespace gatedrepl::script;

namespace {

class InterpreterTest : public ::testing::Test {
protected:
    InterpreterTest() : interp_(CapabilitySet::all(), ExecutionLimits()) {}

    std::string run(const std::string& source) {
        interp_.begin_execution();
        interp_.exec_module(Parser::parse(source));
        return interp_.take_output();
    }

    // Runs source and returns "Type: message" of the raised error
    std::string error_of(const std::string& source) {
        try {
            run(source);
        } catch (const ScriptError& e) {
            interp_.take_output();
            return e.type() + ": " + e.message();
        }
        return "";
    }

    Value global(const std::string& name) {
        Namespace::const_iterator it = interp_.globals().find(name);
        return it == interp_.globals().end() ? Value() : it->second;
    }

    Interpreter interp_;
};

class RecordingHost : public ScriptHost {
public:
    void write_output(const std::string& text) override { output += text; }
    std::string query_model(const std::string& prompt) override {
        prompts.push_back(prompt);
        return "answer to " + prompt;
    }

    std::string output;
    std::vector<std::string> prompts;
};

} // namespace

TEST_F(InterpreterTest, ArithmeticAndPrint) {
    EXPECT_EQ(run("print(1 + 2 * 3, 7 // 2, 7 % 3, -7 // 2, 2 ** 10)"), "7 3 1 -4 1024\n");
    EXPECT_EQ(run("print(7 / 2, 0.1 + 0.2, 1e16, 3.0)"), "3.5 0.30000000000000004 1e+16 3.0\n");
    EXPECT_EQ(run("print(1 == 1.0, True + 1, 5 > 3 > 1)"), "True 2 True\n");
    EXPECT_EQ(run("print('a', 'b', sep='-', end='!')"), "a-b!");
}

TEST_F(InterpreterTest, GlobalsPersistBetweenRuns) {
    run("x = 41");
    EXPECT_EQ(run("x += 1\nprint(x)"), "42\n");
    EXPECT_TRUE(global("x").is_int());
    EXPECT_EQ(global("x").as_int(), 42);
}

TEST_F(InterpreterTest, StringsAndFormatting) {
    EXPECT_EQ(run("s = 'Hello, World'\nprint(s.lower(), s.split(', '), len(s))"),
              "hello, world ['Hello', 'World'] 12\n");
    EXPECT_EQ(run("print('-'.join(['a', 'b', 'c']), 'abc'[::-1], 'abcdef'[1:4])"), "a-b-c cba bcd\n");
    EXPECT_EQ(run("n = 3.14159\nprint(f'{n:.2f} {n!r} {10:>4}|')"), "3.14 3.14159   10|\n");
    EXPECT_EQ(run("print('{} + {} = {total}'.format(1, 2, total=3))"), "1 + 2 = 3\n");
    EXPECT_EQ(run("print('%s has %d items' % ('cart', 3))"), "cart has 3 items\n");
    EXPECT_EQ(run("print(repr('it\\'s'), str(None))"), "\"it's\" None\n");
}

TEST_F(InterpreterTest, Containers) {
    EXPECT_EQ(run("d = {'b': 2, 'a': 1}\nd['c'] = 3\nprint(d, list(d.keys()), d.get('z', 0))"),
              "{'b': 2, 'a': 1, 'c': 3} ['b', 'a', 'c'] 0\n");
    EXPECT_EQ(run("a = [3, 1, 2]\nb = a\nb.append(0)\na.sort()\nprint(a, b is a)"), "[0, 1, 2, 3] True\n");
    EXPECT_EQ(run("t = (1,)\nprint(t, (1, 2) + (3,), {1, 2} & {2, 3})"), "(1,) (1, 2, 3) {2}\n");
    EXPECT_EQ(run("first, *rest = [1, 2, 3]\nprint(first, rest)"), "1 [2, 3]\n");
}

TEST_F(InterpreterTest, ComprehensionsAndIteration) {
    EXPECT_EQ(run("print([i * i for i in range(5) if i % 2 == 0])"), "[0, 4, 16]\n");
    EXPECT_EQ(run("print({k: len(k) for k in ['ab', 'c']})"), "{'ab': 2, 'c': 1}\n");
    EXPECT_EQ(run("print(sum(x for x in range(101)))"), "5050\n");
    EXPECT_EQ(run("print(list(zip('ab', [1, 2])), list(enumerate('xy', 1)))"),
              "[('a', 1), ('b', 2)] [(1, 'x'), (2, 'y')]\n");
    EXPECT_EQ(run("print(sorted(['bb', 'a', 'ccc'], key=len, reverse=True))"), "['ccc', 'bb', 'a']\n");
    EXPECT_EQ(run("print(list(map(lambda v: v + 1, [1, 2])), list(filter(None, [0, 1, '', 'x'])))"),
              "[2, 3] [1, 'x']\n");
}

TEST_F(InterpreterTest, ControlFlow) {
    EXPECT_EQ(run(
        "out = []\n"
        "for i in range(10):\n"
        "    if i == 2:\n"
        "        continue\n"
        "    if i > 4:\n"
        "        break\n"
        "    out.append(i)\n"
        "else:\n"
        "    out.append('done')\n"
        "n = 0\n"
        "while n < 3:\n"
        "    n += 1\n"
        "print(out, n)\n"), "[0, 1, 3, 4] 3\n");
}

TEST_F(InterpreterTest, FunctionsAndClosures) {
    EXPECT_EQ(run(
        "def counter():\n"
        "    count = 0\n"
        "    def bump(step=1):\n"
        "        nonlocal count\n"
        "        count += step\n"
        "        return count\n"
        "    return bump\n"
        "c = counter()\n"
        "c()\n"
        "print(c(5))\n"), "6\n");

    EXPECT_EQ(run(
        "def f(a, *args, scale=2, **kw):\n"
        "    return a * scale + sum(args) + len(kw)\n"
        "print(f(1, 2, 3, scale=10, x=1))\n"), "16\n");

    EXPECT_EQ(run(
        "def fib(n):\n"
        "    return n if n < 2 else fib(n - 1) + fib(n - 2)\n"
        "print(fib(15))\n"), "610\n");
}

TEST_F(InterpreterTest, ExceptionsAreCatchable) {
    EXPECT_EQ(run(
        "try:\n"
        "    {}['missing']\n"
        "except LookupError:\n"
        "    print('caught')\n"
        "finally:\n"
        "    print('cleanup')\n"), "caught\ncleanup\n");

    EXPECT_EQ(run(
        "try:\n"
        "    raise ValueError('bad value')\n"
        "except (TypeError, ValueError) as e:\n"
        "    print('got', e)\n"), "got bad value\n");

    EXPECT_EQ(run(
        "try:\n"
        "    x = 1 / 0\n"
        "except ArithmeticError:\n"
        "    x = -1\n"
        "else:\n"
        "    x = 0\n"
        "print(x)\n"), "-1\n");
}

TEST_F(InterpreterTest, UncaughtErrorsCarryLine) {
    try {
        run("a = 1\nb = undefined_name\n");
        FAIL() << "expected NameError";
    } catch (const ScriptError& e) {
        EXPECT_EQ(e.type(), "NameError");
        EXPECT_EQ(e.line(), 2);
        EXPECT_EQ(e.describe(), "NameError: name 'undefined_name' is not defined (line 2)");
    }
    EXPECT_EQ(global("a").as_int(), 1);

    EXPECT_EQ(error_of("1 // 0"), "ZeroDivisionError: integer division or modulo by zero");
    EXPECT_EQ(error_of("[1, 2][5]").substr(0, 11), "IndexError:");
    EXPECT_EQ(error_of("'a' + 1").substr(0, 10), "TypeError:");
    EXPECT_EQ(error_of("assert 1 == 2, 'mismatch'"), "AssertionError: mismatch");
}

TEST_F(InterpreterTest, NoEscapeHatches) {
    EXPECT_EQ(error_of("eval('1')"), "NameError: name 'eval' is not defined");
    EXPECT_EQ(error_of("open('/etc/passwd')"), "NameError: name 'open' is not defined");
    EXPECT_EQ(error_of("import os"), "ImportError: import of 'os' is not allowed in this sandbox");
    EXPECT_EQ(error_of("(1).__class__").substr(0, 15), "AttributeError:");
}

TEST_F(InterpreterTest, DisabledCapabilityIsReported) {
    CapabilitySet caps = CapabilitySet::all();
    caps.disable(Capability::OUTPUT).disable(Capability::MODULES);
    Interpreter restricted(caps, ExecutionLimits());
    restricted.begin_execution();

    try {
        restricted.exec_module(Parser::parse("print(1)"));
        FAIL() << "expected NameError";
    } catch (const ScriptError& e) {
        EXPECT_EQ(e.message(), "name 'print' is not defined (capability OUTPUT is disabled)");
    }
    try {
        restricted.exec_module(Parser::parse("import math"));
        FAIL() << "expected ImportError";
    } catch (const ScriptError& e) {
        EXPECT_EQ(e.message(), "imports are disabled in this sandbox (import of 'math')");
    }
}

TEST_F(InterpreterTest, StepBudgetIsFatal) {
    ExecutionLimits limits;
    limits.max_steps = 5000;
    interp_.set_limits(limits);

    try {
        run("try:\n    while True:\n        pass\nexcept Exception:\n    print('swallowed')\n");
        FAIL() << "expected TimeoutError";
    } catch (const ScriptError& e) {
        EXPECT_EQ(e.type(), "TimeoutError");
        EXPECT_TRUE(e.fatal());
        EXPECT_EQ(e.message(), "execution exceeded the step budget of 5000 steps");
    }
    EXPECT_EQ(interp_.take_output(), "");
}

TEST_F(InterpreterTest, RecursionAndSequenceLimits) {
    ExecutionLimits limits;
    limits.max_call_depth = 50;
    limits.max_sequence_length = 1000;
    interp_.set_limits(limits);

    EXPECT_EQ(error_of("def f(n):\n    return f(n + 1)\nf(0)\n"),
              "RecursionError: maximum recursion depth exceeded");
    EXPECT_EQ(error_of("x = list(range(5000))").substr(0, 12), "MemoryError:");
    EXPECT_EQ(error_of("x = 'ab' * 5000").substr(0, 12), "MemoryError:");
}

TEST_F(InterpreterTest, PaddingAndFormattingRespectSequenceLimit) {
    ExecutionLimits limits;
    limits.max_sequence_length = 1000;
    interp_.set_limits(limits);

    EXPECT_EQ(run("print(len('a'.center(1000)), len('7'.zfill(10)), len('%999s' % 'x'))"), "1000 10 999\n");
    EXPECT_EQ(error_of("s = 'a'.center(900000000)").substr(0, 12), "MemoryError:");
    EXPECT_EQ(error_of("s = 'a'.ljust(3000000000)").substr(0, 12), "MemoryError:");
    EXPECT_EQ(error_of("s = 'a'.rjust(5000, '*')").substr(0, 12), "MemoryError:");
    EXPECT_EQ(error_of("s = '1'.zfill(5000)").substr(0, 12), "MemoryError:");
    EXPECT_EQ(error_of("s = '%500s%600s' % ('a', 'b')").substr(0, 12), "MemoryError:");
    EXPECT_EQ(error_of("s = 'abc'.replace('', 'x' * 600)").substr(0, 12), "MemoryError:");
    EXPECT_EQ(error_of("s = '%200000s' % 'x'"), "ValueError: width too big");
    EXPECT_EQ(error_of("s = '%.5000f' % 1.5"), "ValueError: precision too big");
}

TEST_F(InterpreterTest, DeeplyNestedValuesAreReleased) {
    EXPECT_EQ(run("b = []\nfor i in range(200000):\n    b = [b]\nprint(len(b))"), "1\n");
    // Dropping the last reference frees the whole chain
    EXPECT_EQ(run("b = 0\nprint(b)"), "0\n");

    run("d = {}\nfor i in range(200000):\n    d = {'next': d}");
    EXPECT_EQ(run("d = None\nprint(d)"), "None\n");
}

TEST_F(InterpreterTest, DeepComparisonRaisesRecursionError) {
    run("a = []\nb = []\nt = ()\nfor i in range(5000):\n    a = [a]\n    b = [b]\n    t = (t,)");
    EXPECT_EQ(error_of("a == b"), "RecursionError: maximum recursion depth exceeded in comparison");
    EXPECT_EQ(error_of("a < b"), "RecursionError: maximum recursion depth exceeded in comparison");
    EXPECT_EQ(error_of("s = {t}"), "RecursionError: maximum recursion depth exceeded in comparison");
    EXPECT_EQ(run("print(a == a)"), "True\n");
}

TEST_F(InterpreterTest, SelfReferencingContainers) {
    EXPECT_EQ(run("a = [1]\na.append(a)\nprint(a)"), "[1, [...]]\n");
    EXPECT_EQ(run("d = {'k': 1}\nd['self'] = d\nprint(d)"), "{'k': 1, 'self': {...}}\n");
    EXPECT_EQ(run("pair = [a, a]\nprint(len(repr(pair)))"), "24\n");
}

TEST_F(InterpreterTest, HostReceivesOutputAndModelQueries) {
    RecordingHost host;
    interp_.set_host(&host);
    run("r = llm_query('what is 2+2')\nprint(r)");
    ASSERT_EQ(host.prompts.size(), 1u);
    EXPECT_EQ(host.prompts[0], "what is 2+2");
    EXPECT_EQ(host.output, "answer to what is 2+2\n");
    EXPECT_EQ(interp_.take_output(), "");
}

TEST_F(InterpreterTest, BoundSymbolsAreShadowedByGlobals) {
    Value ctx = Value::from_string("document text");
    interp_.bind_symbol("context", ctx);
    EXPECT_EQ(run("print(len(context))"), "13\n");
    EXPECT_EQ(run("context = 'mine'\nprint(context)"), "mine\n");
}

TEST_F(InterpreterTest, FinalVarReadsGlobals) {
    EXPECT_EQ(run("answer = 42\nprint(FINAL_VAR('answer'))"), "42\n");
    EXPECT_EQ(run("print(FINAL_VAR('nothing'))"), "Error: Variable 'nothing' not found\n");
}

TEST_F(InterpreterTest, TopLevelExpressionValue) {
    Module module = Parser::parse("3 * 7\n");
    ASSERT_EQ(module.body.size(), 1u);
    interp_.begin_execution();
    Value v = interp_.eval_top_level(*module.body[0]->value);
    EXPECT_EQ(v.repr(), "21");
}

TEST(ExceptionHierarchyTest, Matches) {
    EXPECT_TRUE(exception_matches("KeyError", "LookupError"));
    EXPECT_TRUE(exception_matches("RecursionError", "RuntimeError"));
    EXPECT_TRUE(exception_matches("TypeError", "Exception"));
    EXPECT_FALSE(exception_matches("ValueError", "TypeError"));
    EXPECT_TRUE(exception_matches("JSONDecodeError", "ValueError"));
}

TEST(CapabilitySetTest, ParseAndNames) {
    Capability cap;
    EXPECT_TRUE(CapabilitySet::parse("model_query", cap));
    EXPECT_EQ(cap, Capability::MODEL_QUERY);
    EXPECT_FALSE(CapabilitySet::parse("network", cap));

    CapabilitySet set;
    set.enable(Capability::OUTPUT).enable(Capability::CONTEXT);
    std::vector<std::string> names = set.names();
    ASSERT_EQ(names.size(), 2u);
    EXPECT_EQ(names[0], "OUTPUT");
    EXPECT_EQ(names[1], "CONTEXT");

    SymbolTable table = build_symbol_table(set);
    EXPECT_TRUE(table.find("print") != nullptr);
    EXPECT_TRUE(table.find("len") == nullptr);
    std::string group;
    EXPECT_TRUE(table.is_disabled("len", group));
    EXPECT_EQ(group, "INTROSPECTION");
}

TEST(InterpreterTeardownTest, CyclesAreBrokenWithTheNamespace) {
    Value list;
    Value dict;
    {
        Interpreter interp(CapabilitySet::all(), ExecutionLimits());
        interp.begin_execution();
        interp.exec_module(Parser::parse(
            "a = [1]\n"
            "a.append(a)\n"
            "d = {'list': a}\n"
            "d['self'] = d\n"
            "def outer():\n"
            "    def inner():\n"
            "        return inner\n"
            "    return inner\n"
            "f = outer()\n"));
        list = interp.globals()["a"];
        dict = interp.globals()["d"];
        EXPECT_EQ(list.list().items.size(), 2u);
        EXPECT_EQ(dict.dict().size(), 2u);
    }
    // Only these handles outlive the interpreter; the cycles inside are gone
    EXPECT_TRUE(list.list().items.empty());
    EXPECT_EQ(dict.dict().size(), 0u);
}
