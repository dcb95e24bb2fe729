#include <gtest/gtest.h>

#include "agent/tool_arguments.h"
#include "common/errors.h"
#include "common/json_utils.h"

using namespace PatchArbiter;

TEST(ShellQuoteTest, SafeStringsPassThrough) {
    EXPECT_EQ(ShellQuote("view"), "view");
    EXPECT_EQ(ShellQuote("/testbed/src/a_b-c.py"), "/testbed/src/a_b-c.py");
    EXPECT_EQ(ShellQuote("k=v,x:y@z%+"), "k=v,x:y@z%+");
}

TEST(ShellQuoteTest, QuotesEverythingElse) {
    EXPECT_EQ(ShellQuote(""), "''");
    EXPECT_EQ(ShellQuote("ls -la"), "'ls -la'");
    EXPECT_EQ(ShellQuote("echo $HOME"), "'echo $HOME'");
    EXPECT_EQ(ShellQuote("it's"), "'it'\"'\"'s'");
    EXPECT_EQ(ShellQuote("a\nb"), "'a\nb'");
}

TEST(ToolArgumentTest, ConvertsSupportedShapes) {
    EXPECT_EQ(std::get<std::string>(ToolArgumentFromJson("k", Json::Value("x"))), "x");
    EXPECT_EQ(std::get<int64_t>(ToolArgumentFromJson("k", Json::Value(12))), 12);
    EXPECT_EQ(std::get<bool>(ToolArgumentFromJson("k", Json::Value(true))), true);

    Json::Value list(Json::arrayValue);
    list.append(1);
    list.append(10);
    EXPECT_EQ(std::get<std::vector<int64_t>>(ToolArgumentFromJson("k", list)),
            (std::vector<int64_t>{1, 10}));
}

TEST(ToolArgumentTest, RejectsUnsupportedShapes) {
    EXPECT_THROW(ToolArgumentFromJson("k", Json::Value(Json::objectValue)), ToolArgumentError);
    EXPECT_THROW(ToolArgumentFromJson("k", Json::Value(Json::nullValue)), ToolArgumentError);
    EXPECT_THROW(ToolArgumentFromJson("k", Json::Value(3.0)), ToolArgumentError);

    Json::Value mixed(Json::arrayValue);
    mixed.append(1);
    mixed.append("two");
    EXPECT_THROW(ToolArgumentFromJson("k", mixed), ToolArgumentError);

    Json::Value huge = ParseJson(R"({"n": 18446744073709551615, "range": [18446744073709551615]})", "test");
    EXPECT_THROW(ToolArgumentFromJson("n", huge["n"]), ToolArgumentError);
    EXPECT_THROW(ToolArgumentFromJson("range", huge["range"]), ToolArgumentError);
    EXPECT_THROW(EncodeToolArguments(huge), ToolArgumentError);
}

TEST(ToolArgumentTest, EncodesForCommandLine) {
    EXPECT_EQ(EncodeToolArgument(ToolArgument(std::string("a b"))), "'a b'");
    EXPECT_EQ(EncodeToolArgument(ToolArgument(int64_t{7})), "7");
    EXPECT_EQ(EncodeToolArgument(ToolArgument(false)), "false");
    EXPECT_EQ(EncodeToolArgument(ToolArgument(std::vector<int64_t>{1, -1})), "'[1, -1]'");
}

TEST(ToolArgumentTest, EncodesObjectInKeyOrder) {
    Json::Value args = ParseJson(R"({"path": "/testbed/x.py", "command": "view", "view_range": [3, 9]})",
            "test");
    EXPECT_EQ(EncodeToolArguments(args), " --command view --path /testbed/x.py --view_range '[3, 9]'");

    EXPECT_EQ(EncodeToolArguments(Json::Value(Json::objectValue)), "");
}

TEST(ToolArgumentTest, EncodesMultilineEditText) {
    Json::Value args(Json::objectValue);
    args["old_str"] = "x = 'a'\ny = 2";
    EXPECT_EQ(EncodeToolArguments(args), " --old_str 'x = '\"'\"'a'\"'\"'\ny = 2'");
}

TEST(ToolArgumentTest, NonObjectArgumentsAreRejected) {
    EXPECT_THROW(EncodeToolArguments(Json::Value("{\"command\": ")), ToolArgumentError);

    Json::Value nested(Json::objectValue);
    nested["command"] = "ls";
    nested["options"]["verbose"] = true;
    EXPECT_THROW(EncodeToolArguments(nested), ToolArgumentError);
}

TEST(ToolArgumentTest, RejectsArgumentNamesThatAreNotIdentifiers) {
    Json::Value args(Json::objectValue);
    args["command x; touch /tmp/pwned #"] = "ls";
    EXPECT_THROW(EncodeToolArguments(args), ToolArgumentError);

    for (const char* key : {"", "1st", "old-str", "path name", "a$b"}) {
        Json::Value one(Json::objectValue);
        one[key] = "v";
        EXPECT_THROW(EncodeToolArguments(one), ToolArgumentError) << key;
    }

    Json::Value fine(Json::objectValue);
    fine["_private"] = 1;
    fine["old_str2"] = "x";
    EXPECT_EQ(EncodeToolArguments(fine), " --_private 1 --old_str2 x");
}
