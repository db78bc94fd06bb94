#include <gatedrepl/script/interpreter.hpp>
#include <gatedrepl/script/parser.hpp>

#include <gtest/gtest.h>

#include <limits>

using namespace gatedrepl;
using namespace gatedrepl::script;

namespace {

class ModulesTest : public ::testing::Test {
protected:
    ModulesTest() : interp_(CapabilitySet::all(), ExecutionLimits()) {}

    std::string run(const std::string& source) {
        interp_.begin_execution();
        interp_.exec_module(Parser::parse(source));
        return interp_.take_output();
    }

    std::string error_type(const std::string& source) {
        try {
            run(source);
        } catch (const ScriptError& e) {
            interp_.take_output();
            return e.type();
        }
        return "";
    }

    Interpreter interp_;
};

} // namespace

TEST_F(ModulesTest, Math) {
    EXPECT_EQ(run("import math\nprint(math.sqrt(16), math.floor(2.7), math.ceil(2.1), math.gcd(12, 18))"),
              "4.0 2 3 6\n");
    EXPECT_EQ(run("from math import factorial, pi\nprint(factorial(10), round(pi, 4))"), "3628800 3.1416\n");
    EXPECT_EQ(run("import math as m\nprint(m.isclose(0.1 + 0.2, 0.3), m.comb(5, 2))"), "True 10\n");
    EXPECT_EQ(error_type("import math\nmath.sqrt(-1)"), "ValueError");
    EXPECT_EQ(error_type("import math\nmath.factorial(-1)"), "ValueError");
    EXPECT_EQ(error_type("import math\nmath.system"), "AttributeError");
}

TEST_F(ModulesTest, JsonDumps) {
    EXPECT_EQ(run("import json\nprint(json.dumps({'b': [1, 2.5, None], 'a': True}))"),
              "{\"b\": [1, 2.5, null], \"a\": true}\n");
    EXPECT_EQ(run("import json\nprint(json.dumps({'b': 1, 'a': 2}, sort_keys=True))"),
              "{\"a\": 2, \"b\": 1}\n");
    EXPECT_EQ(run("import json\nprint(json.dumps([1, {'k': 'v'}], indent=2))"),
              "[\n  1,\n  {\n    \"k\": \"v\"\n  }\n]\n");
    EXPECT_EQ(run("import json\nprint(json.dumps({1: 'x'}))"), "{\"1\": \"x\"}\n");
    EXPECT_EQ(error_type("import json\njson.dumps({'f': print})"), "TypeError");
}

TEST_F(ModulesTest, JsonLoads) {
    EXPECT_EQ(run("import json\nd = json.loads('{\"items\": [1, 2, 3], \"name\": \"x\"}')\n"
                  "print(sum(d['items']), d['name'])"), "6 x\n");
    EXPECT_EQ(run(
        "import json\n"
        "try:\n"
        "    json.loads('{bad')\n"
        "except ValueError:\n"
        "    print('decode error')\n"), "decode error\n");
    EXPECT_EQ(run(
        "import json\n"
        "try:\n"
        "    json.loads('[')\n"
        "except json.JSONDecodeError:\n"
        "    print('specific')\n"), "specific\n");
}

TEST_F(ModulesTest, Regex) {
    EXPECT_EQ(run("import re\nprint(re.findall(r'\\d+', 'a1 b22 c333'))"), "['1', '22', '333']\n");
    EXPECT_EQ(run("import re\nprint(re.findall(r'(\\w)=(\\d)', 'a=1,b=2'))"), "[('a', '1'), ('b', '2')]\n");
    EXPECT_EQ(run("import re\nprint(re.sub(r'(\\w+)@(\\w+)', r'\\2 at \\1', 'me@host'))"), "host at me\n");
    EXPECT_EQ(run("import re\nprint(re.split(r'[,;]\\s*', 'a, b;c'))"), "['a', 'b', 'c']\n");
    EXPECT_EQ(run("import re\nprint(re.findall('abc', 'ABC abc', re.IGNORECASE))"), "['ABC', 'abc']\n");
    EXPECT_EQ(run("import re\nprint(re.escape('a.b'))"), "a\\.b\n");
    EXPECT_EQ(error_type("import re\nre.findall('(', 'x')"), "ValueError");
}

TEST_F(ModulesTest, RegexSubjectIsBounded) {
    EXPECT_EQ(run("import re\ntext = 'ab' * 50000\n"
                  "try:\n"
                  "    re.findall('(a|b)*', text)\n"
                  "except ValueError as e:\n"
                  "    print(e)\n"),
              "regular expression subject of 100000 characters exceeds the limit of 10000\n");
    EXPECT_EQ(error_type("import re\nre.sub('a', 'b', 'a' * 10001)"), "ValueError");
    EXPECT_EQ(error_type("import re\nre.split(',', ',' * 10001)"), "ValueError");
    EXPECT_EQ(run("import re\nprint(len(re.findall('a', 'a' * 10000)))"), "10000\n");

    ExecutionLimits limits;
    limits.max_regex_input = 0;
    interp_.set_limits(limits);
    EXPECT_EQ(run("import re\nprint(len(re.split(',', 'x,' * 20000)))"), "20001\n");
}

TEST_F(ModulesTest, AllowList) {
    const std::vector<std::string>& names = allowed_module_names();
    ASSERT_EQ(names.size(), 3u);

    Value module;
    EXPECT_TRUE(create_module("json", module));
    EXPECT_FALSE(create_module("os", module));
    EXPECT_EQ(error_type("import subprocess"), "ImportError");
    EXPECT_EQ(error_type("from os import path"), "ImportError");
    EXPECT_EQ(error_type("from math import nothing_here"), "ImportError");
}

TEST(JsonConversionTest, ValueToJson) {
    Value dict = Value::new_dict();
    dict.dict().set(Value::from_string("n"), Value::from_int(3));
    std::vector<Value> items;
    items.push_back(Value::from_float(1.5));
    items.push_back(Value::none());
    dict.dict().set(Value::from_string("list"), Value::new_list(items));

    Json out;
    ASSERT_TRUE(value_to_json(dict, out));
    EXPECT_EQ(out["n"], 3);
    EXPECT_TRUE(out["list"][1].is_null());

    Json ignored;
    EXPECT_FALSE(value_to_json(Value::new_builtin("print", nullptr), ignored));
    EXPECT_FALSE(value_to_json(Value::from_float(std::numeric_limits<double>::infinity()), ignored));
}

TEST(JsonConversionTest, ValueFromJson) {
    Json json = Json::parse(R"({"a": [1, "two", 3.5, false, null], "b": {"c": 18446744073709551615}})");
    Value v = value_from_json(json);
    ASSERT_TRUE(v.is_dict());
    const Value* a = v.dict().find(Value::from_string("a"));
    ASSERT_TRUE(a != nullptr);
    EXPECT_EQ(a->repr(), "[1, 'two', 3.5, False, None]");
    const Value* b = v.dict().find(Value::from_string("b"));
    ASSERT_TRUE(b != nullptr);
    EXPECT_TRUE(b->dict().find(Value::from_string("c"))->is_float());
}

TEST(JsonConversionTest, FrozenValuesRejectMutation) {
    Interpreter interp(CapabilitySet::all(), ExecutionLimits());
    Value data = value_from_json(Json::parse(R"({"rows": [1, 2]})"));
    freeze(data);
    interp.bind_symbol("context", data);
    interp.begin_execution();

    EXPECT_THROW(interp.exec_module(Parser::parse("context['rows'].append(3)")), ScriptError);
    EXPECT_THROW(interp.exec_module(Parser::parse("context['new'] = 1")), ScriptError);
    interp.exec_module(Parser::parse("copy = list(context['rows'])\ncopy.append(3)\nprint(len(copy))"));
    EXPECT_EQ(interp.take_output(), "3\n");
}
