// File: tests/tools/test_cli.cpp
// Purpose: Drive the ucindex subcommand handlers end to end on temporary
//          package trees and check their text output and exit status.
// Key invariants: Results go to `out`, problems to `err`; failures return 1.
// Ownership/Lifetime: Argument storage lives for the duration of each call.

#include <gtest/gtest.h>

#include "tests/common/TempPackageTree.hpp"
#include "tools/ucindex/cli.hpp"

#include <initializer_list>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

using namespace ucindex::tools;
using ucindex::tests::TempPackageTree;

namespace
{

using Handler = int (*)(ArgvView, std::ostream &, std::ostream &);

struct RunResult
{
    int status;
    std::string out;
    std::string err;
};

RunResult run(Handler handler, std::initializer_list<std::string> args)
{
    std::vector<std::string> storage(args);
    std::vector<char *> argv;
    for (auto &arg : storage)
        argv.push_back(arg.data());
    argv.push_back(nullptr);

    std::ostringstream out;
    std::ostringstream err;
    const int status =
        handler(ArgvView{static_cast<int>(storage.size()), argv.data()}, out, err);
    return RunResult{status, out.str(), err.str()};
}

constexpr std::string_view kActorSource = "class Actor extends Object;\n"
                                          "function Tick(float Delta);\n"
                                          "var int Health;\n";

} // namespace

TEST(CliParseTest, SharedOptionsAndPositionals)
{
    std::string a0 = "--root=/games/ut";
    std::string a1 = "--carry-class";
    std::string a2 = "Pawn";
    std::string a3 = "--encoded";
    char *argv[] = {a0.data(), a1.data(), a2.data(), a3.data()};

    CliOptions opts;
    std::ostringstream err;
    ASSERT_TRUE(parseCommandLine(ArgvView{4, argv}, opts, err));
    EXPECT_EQ(opts.rootPath, "/games/ut");
    EXPECT_TRUE(opts.carryClass);
    EXPECT_TRUE(opts.encoded);
    EXPECT_FALSE(opts.debug);
    EXPECT_EQ(opts.positional, std::vector<std::string>{"Pawn"});
    EXPECT_EQ(resolveRootPath(opts), "/games/ut");
}

TEST(CliParseTest, RootWithoutValueIsAnError)
{
    std::string a0 = "--root";
    char *argv[] = {a0.data()};
    CliOptions opts;
    std::ostringstream err;
    EXPECT_FALSE(parseCommandLine(ArgvView{1, argv}, opts, err));
    EXPECT_NE(err.str().find("--root requires a value"), std::string::npos);
}

TEST(CliParseTest, UnknownOptionIsAnError)
{
    auto result = run(cmdScan, {"--frobnicate"});
    EXPECT_EQ(result.status, 1);
    EXPECT_NE(result.err.find("unknown option: --frobnicate"), std::string::npos);
}

TEST(CliScanTest, ListsClassesAndSummary)
{
    TempPackageTree tree;
    tree.write("Engine/Classes/Actor.uc", kActorSource);
    tree.write("Engine/Classes/Pawn.uc", "class Pawn extends Actor;\n");

    auto result = run(cmdScan, {tree.root()});
    EXPECT_EQ(result.status, 0) << result.err;
    EXPECT_EQ(result.out,
              "Engine.Actor functions=1 variables=1\n"
              "Engine.Pawn functions=0 variables=0\n"
              "2 classes in 1 packages (2 files)\n");
}

TEST(CliScanTest, CarryClassFlagReachesScanner)
{
    TempPackageTree tree;
    tree.write("Core/Classes/A.uc", "class Alpha;\n");
    tree.write("Core/Classes/B.uc", "function Orphan();\n");

    auto plain = run(cmdScan, {tree.root()});
    EXPECT_NE(plain.out.find("Core.Alpha functions=0"), std::string::npos);

    auto carried = run(cmdScan, {tree.root(), "--carry-class"});
    EXPECT_NE(carried.out.find("Core.Alpha functions=1"), std::string::npos);
}

TEST(CliScanTest, UnreadableRootExitsWithOne)
{
    TempPackageTree tree;
    auto result = run(cmdScan, {(tree.path() / "nope").string()});
    EXPECT_EQ(result.status, 1);
    EXPECT_TRUE(result.out.empty());
    EXPECT_NE(result.err.find("error: root path is not a readable directory"), std::string::npos);
}

TEST(CliOutlineTest, PrintsOneBasedLines)
{
    TempPackageTree tree;
    const auto file = tree.write("Actor.uc", kActorSource);

    auto result = run(cmdOutline, {file.string()});
    EXPECT_EQ(result.status, 0) << result.err;
    EXPECT_EQ(result.out, "1 class Actor\n2 function Tick\n");
}

TEST(CliOutlineTest, MissingFileFails)
{
    TempPackageTree tree;
    auto result = run(cmdOutline, {(tree.path() / "Ghost.uc").string()});
    EXPECT_EQ(result.status, 1);
    EXPECT_FALSE(result.err.empty());
}

TEST(CliHighlightTest, PlainAndEncodedOutput)
{
    TempPackageTree tree;
    tree.write("Core/Classes/Object.uc", "class Object;\n");
    const auto file = tree.write("Actor.uc", kActorSource);

    auto plain = run(cmdHighlight, {"--root", tree.root(), file.string()});
    EXPECT_EQ(plain.status, 0) << plain.err;
    EXPECT_EQ(plain.out,
              "1:7 5 class\n"
              "1:21 6 class\n"
              "2:10 4 function\n"
              "3:9 6 variable\n");

    auto encoded = run(cmdHighlight, {"--root", tree.root(), "--encoded", file.string()});
    EXPECT_EQ(encoded.status, 0) << encoded.err;
    EXPECT_EQ(encoded.out,
              "0 6 5 0 0\n"
              "0 14 6 0 0\n"
              "1 9 4 1 0\n"
              "1 8 6 2 0\n");
}

TEST(CliCompleteTest, AppendsIndexedClasses)
{
    TempPackageTree tree;
    tree.write("Engine/Classes/Actor.uc", kActorSource);

    auto result = run(cmdComplete, {"--root", tree.root()});
    EXPECT_EQ(result.status, 0) << result.err;
    EXPECT_EQ(result.out.rfind("class\t0\n", 0), 0u);
    EXPECT_NE(result.out.find("\nrotator\t1\n"), std::string::npos);
    const std::string tail = "\nActor\t2\n";
    ASSERT_GE(result.out.size(), tail.size());
    EXPECT_EQ(result.out.substr(result.out.size() - tail.size()), tail);
}

TEST(CliShowTest, KnownAndUnknownClasses)
{
    TempPackageTree tree;
    tree.write("Engine/Classes/Actor.uc", kActorSource);

    auto known = run(cmdShow, {"--root", tree.root(), "Actor"});
    EXPECT_EQ(known.status, 0) << known.err;
    EXPECT_EQ(known.out,
              "class Actor (package Engine)\n"
              "functions: Tick\n"
              "variables: Health\n");

    auto unknown = run(cmdShow, {"--root", tree.root(), "Pawn"});
    EXPECT_EQ(unknown.status, 1);
    EXPECT_NE(unknown.err.find("unknown class: Pawn"), std::string::npos);
}

TEST(CliShowTest, HelpGoesToStdout)
{
    auto result = run(cmdShow, {"--help"});
    EXPECT_EQ(result.status, 0);
    EXPECT_NE(result.out.find("Usage: ucindex"), std::string::npos);
}

int main(int argc, char **argv)
{
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
