// File: tests/index/test_package_scanner.cpp
// Purpose: Exercise PackageScanner against throw-away package trees.
// Key invariants: Packages and files are visited in name order; an unreadable
//                 root is the only hard failure; rebuilding an unchanged tree
//                 gives an identical table.
// Ownership/Lifetime: Each test owns a TempPackageTree removed on exit.

#include <gtest/gtest.h>

#include "index/PackageScanner.hpp"
#include "support/diagnostics.hpp"
#include "support/source_loader.hpp"
#include "support/source_manager.hpp"
#include "tests/common/TempPackageTree.hpp"

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

using namespace ucindex;
using index::ClassRecord;
using index::PackageScanner;
using index::ScanOptions;
using index::SymbolTable;
using tests::TempPackageTree;

namespace
{

constexpr std::string_view kActorSource = "class Actor;\n"
                                          "function Tick(float Delta);\n"
                                          "var int Health;\n";

using Names = std::vector<std::string>;

} // namespace

TEST(PackageScannerTest, IndexesClassesFolder)
{
    TempPackageTree tree;
    tree.write("Core/Classes/Actor.uc", kActorSource);

    support::DiagnosticEngine diags;
    auto table = index::rebuildIndex(tree.root(), diags);
    ASSERT_TRUE(table) << table.error().message;

    const ClassRecord *actor = table.value().find("Actor");
    ASSERT_NE(actor, nullptr);
    EXPECT_EQ(actor->package, "Core");
    EXPECT_EQ(actor->functions, Names{"Tick"});
    EXPECT_EQ(actor->variables, Names{"Health"});
    EXPECT_EQ(diags.warningCount(), 0u);
}

TEST(PackageScannerTest, FallsBackToPackageRootWithoutClassesFolder)
{
    TempPackageTree tree;
    tree.write("MyMod/Pawn2.uc", "class Pawn2 extends Pawn;\nfunction Walk();\n");

    support::DiagnosticEngine diags;
    auto table = index::rebuildIndex(tree.root(), diags);
    ASSERT_TRUE(table);

    const ClassRecord *pawn = table.value().find("Pawn2");
    ASSERT_NE(pawn, nullptr);
    EXPECT_EQ(pawn->package, "MyMod");
    EXPECT_EQ(pawn->functions, Names{"Walk"});
}

TEST(PackageScannerTest, ClassesFolderShadowsPackageRoot)
{
    TempPackageTree tree;
    tree.write("Engine/Classes/Actor.uc", kActorSource);
    tree.write("Engine/Stray.uc", "class Stray;\n");

    support::DiagnosticEngine diags;
    auto table = index::rebuildIndex(tree.root(), diags);
    ASSERT_TRUE(table);
    EXPECT_TRUE(table.value().contains("Actor"));
    EXPECT_FALSE(table.value().contains("Stray"));
}

TEST(PackageScannerTest, OnlyDirectUcFilesAreRead)
{
    TempPackageTree tree;
    tree.write("Core/Classes/Object.uc", "class Object;\n");
    tree.write("Core/Classes/Notes.txt", "class NotSource;\n");
    tree.write("Core/Classes/Upper.UC", "class WrongCase;\n");
    tree.write("Core/Classes/Nested/Deep.uc", "class Deep;\n");
    tree.mkdir("Core/Classes/Folder.uc");

    support::DiagnosticEngine diags;
    auto table = index::rebuildIndex(tree.root(), diags);
    ASSERT_TRUE(table);
    EXPECT_EQ(table.value().classNames(), Names{"Object"});
}

TEST(PackageScannerTest, LooseFilesInRootAreNotPackages)
{
    TempPackageTree tree;
    tree.write("Loose.uc", "class Loose;\n");

    support::DiagnosticEngine diags;
    auto table = index::rebuildIndex(tree.root(), diags);
    ASSERT_TRUE(table);
    EXPECT_TRUE(table.value().empty());
}

TEST(PackageScannerTest, MixedLineEndingsAndByteOrderMark)
{
    TempPackageTree tree;
    tree.write("Core/Classes/Mixed.uc",
               "\xEF\xBB\xBF"
               "class Mixed;\r\nfunction A();\rfunction B();\nvar float Speed;");

    support::DiagnosticEngine diags;
    auto table = index::rebuildIndex(tree.root(), diags);
    ASSERT_TRUE(table);
    const ClassRecord *mixed = table.value().find("Mixed");
    ASSERT_NE(mixed, nullptr);
    EXPECT_EQ(mixed->functions, (Names{"A", "B"}));
    EXPECT_EQ(mixed->variables, Names{"Speed"});
}

TEST(PackageScannerTest, MembersBeforeAnyClassAreDiscarded)
{
    TempPackageTree tree;
    tree.write("Core/Classes/Orphan.uc", "function Early();\nclass Late;\nfunction OnTime();\n");

    support::DiagnosticEngine diags;
    auto table = index::rebuildIndex(tree.root(), diags);
    ASSERT_TRUE(table);
    const ClassRecord *late = table.value().find("Late");
    ASSERT_NE(late, nullptr);
    EXPECT_EQ(late->functions, Names{"OnTime"});
}

TEST(PackageScannerTest, StatesAreNotRecorded)
{
    TempPackageTree tree;
    tree.write("Core/Classes/Bot.uc", "class Bot;\nstate Roaming\nfunction Think();\n");

    support::DiagnosticEngine diags;
    auto table = index::rebuildIndex(tree.root(), diags);
    ASSERT_TRUE(table);
    const ClassRecord *bot = table.value().find("Bot");
    ASSERT_NE(bot, nullptr);
    EXPECT_EQ(bot->functions, Names{"Think"});
    EXPECT_TRUE(bot->variables.empty());
}

TEST(PackageScannerTest, SecondClassInFileTakesFollowingMembers)
{
    TempPackageTree tree;
    tree.write("Core/Classes/Pair.uc",
               "class First;\nvar int A;\nclass Second;\nvar int B;\nfunction F();\n");

    support::DiagnosticEngine diags;
    auto table = index::rebuildIndex(tree.root(), diags);
    ASSERT_TRUE(table);
    EXPECT_EQ(table.value().find("First")->variables, Names{"A"});
    EXPECT_EQ(table.value().find("Second")->variables, Names{"B"});
    EXPECT_EQ(table.value().find("Second")->functions, Names{"F"});
}

TEST(PackageScannerTest, CursorResetsPerFileByDefault)
{
    TempPackageTree tree;
    tree.write("Core/Classes/A.uc", "class Alpha;\nfunction One();\n");
    tree.write("Core/Classes/B.uc", "function Two();\nvar int Stray;\n");

    support::DiagnosticEngine diags;
    auto table = index::rebuildIndex(tree.root(), diags);
    ASSERT_TRUE(table);
    const ClassRecord *alpha = table.value().find("Alpha");
    ASSERT_NE(alpha, nullptr);
    EXPECT_EQ(alpha->functions, Names{"One"});
    EXPECT_TRUE(alpha->variables.empty());
}

TEST(PackageScannerTest, CarryClassOptionAttributesAcrossFiles)
{
    TempPackageTree tree;
    tree.write("Core/Classes/A.uc", "class Alpha;\nfunction One();\n");
    tree.write("Core/Classes/B.uc", "function Two();\nvar int Stray;\n");

    ScanOptions options;
    options.carryClassAcrossFiles = true;
    support::DiagnosticEngine diags;
    auto table = index::rebuildIndex(tree.root(), diags, options);
    ASSERT_TRUE(table);
    const ClassRecord *alpha = table.value().find("Alpha");
    ASSERT_NE(alpha, nullptr);
    EXPECT_EQ(alpha->functions, (Names{"One", "Two"}));
    EXPECT_EQ(alpha->variables, Names{"Stray"});
}

TEST(PackageScannerTest, DuplicateClassLastPackageWins)
{
    TempPackageTree tree;
    tree.write("Aaa/Classes/Actor.uc", "class Actor;\nfunction FromAaa();\n");
    tree.write("Zzz/Classes/Actor.uc", "class Actor;\nfunction FromZzz();\n");

    support::DiagnosticEngine diags;
    auto table = index::rebuildIndex(tree.root(), diags);
    ASSERT_TRUE(table);
    const ClassRecord *actor = table.value().find("Actor");
    ASSERT_NE(actor, nullptr);
    EXPECT_EQ(actor->package, "Zzz");
    EXPECT_EQ(actor->functions, Names{"FromZzz"});
}

TEST(PackageScannerTest, RebuildOfUnchangedTreeIsIdempotent)
{
    TempPackageTree tree;
    tree.write("Core/Classes/Object.uc", "class Object;\nfunction Destroy();\n");
    tree.write("Engine/Classes/Actor.uc", kActorSource);
    tree.write("Engine/Classes/Pawn.uc", "class Pawn extends Actor;\nvar float Speed;\n");

    support::DiagnosticEngine diags;
    auto first = index::rebuildIndex(tree.root(), diags);
    auto second = index::rebuildIndex(tree.root(), diags);
    ASSERT_TRUE(first);
    ASSERT_TRUE(second);
    EXPECT_EQ(first.value(), second.value());
    EXPECT_EQ(first.value().size(), 3u);
}

TEST(PackageScannerTest, MissingRootFailsWithIoError)
{
    TempPackageTree tree;
    support::DiagnosticEngine diags;
    auto table = index::rebuildIndex((tree.path() / "does-not-exist").string(), diags);
    ASSERT_FALSE(table);
    EXPECT_EQ(table.error().code, support::ErrorCode::IoError);
    EXPECT_EQ(table.error().severity, support::Severity::Error);
}

TEST(PackageScannerTest, RootThatIsAFileFailsWithIoError)
{
    TempPackageTree tree;
    const auto file = tree.write("plain.txt", "not a folder");
    support::DiagnosticEngine diags;
    auto table = index::rebuildIndex(file.string(), diags);
    ASSERT_FALSE(table);
    EXPECT_EQ(table.error().code, support::ErrorCode::IoError);
}

TEST(PackageScannerTest, StatsDescribeTheScan)
{
    TempPackageTree tree;
    tree.write("Core/Classes/Object.uc", "class Object;\n");
    tree.write("Engine/Classes/Actor.uc", kActorSource);
    tree.write("Engine/Classes/Pawn.uc", "class Pawn;\n");
    tree.mkdir("Empty");

    support::DiagnosticEngine diags;
    support::SourceManager sm;
    PackageScanner scanner(diags, sm);
    auto table = scanner.rebuildIndex(tree.root());
    ASSERT_TRUE(table);

    const auto &stats = scanner.stats();
    EXPECT_EQ(stats.packagesScanned, 3u);
    EXPECT_EQ(stats.packagesSkipped, 0u);
    EXPECT_EQ(stats.filesIndexed, 3u);
    EXPECT_EQ(stats.filesSkipped, 0u);
    EXPECT_EQ(stats.classDeclarations, 3u);
    EXPECT_EQ(sm.fileCount(), 3u);
}

TEST(PackageScannerTest, UnreadableFileIsSkippedAndScanContinues)
{
    TempPackageTree tree;
    tree.write("Core/Classes/A.uc", "class Alpha;\nfunction One();\n");
    const auto big = tree.write("Core/Classes/Big.uc", "class Big;\n");
    std::filesystem::resize_file(big, static_cast<std::uintmax_t>(support::kMaxSourceSize) + 1);
    tree.write("Core/Classes/C.uc", "class Gamma;\n");
    tree.write("Engine/Classes/Actor.uc", kActorSource);

    support::DiagnosticEngine diags;
    support::SourceManager sm;
    PackageScanner scanner(diags, sm);
    auto table = scanner.rebuildIndex(tree.root());
    ASSERT_TRUE(table);

    EXPECT_EQ(table.value().classNames(), (Names{"Actor", "Alpha", "Gamma"}));
    EXPECT_FALSE(table.value().contains("Big"));
    EXPECT_EQ(scanner.stats().filesIndexed, 3u);
    EXPECT_EQ(scanner.stats().filesSkipped, 1u);
    EXPECT_EQ(scanner.stats().packagesScanned, 2u);

    ASSERT_EQ(diags.warningCount(), 1u);
    EXPECT_EQ(diags.errorCount(), 0u);
    const support::Diagnostic &warning = diags.diagnostics().front();
    EXPECT_EQ(warning.severity, support::Severity::Warning);
    EXPECT_EQ(warning.code, support::ErrorCode::IoError);
    EXPECT_EQ(sm.getPath(warning.loc.file_id), big.lexically_normal().generic_string());
}

TEST(PackageScannerTest, CustomFolderAndExtension)
{
    TempPackageTree tree;
    tree.write("Core/Src/Thing.uci", "class Thing;\n");
    tree.write("Core/Src/Other.uc", "class Other;\n");

    ScanOptions options;
    options.classesFolder = "Src";
    options.sourceExtension = ".uci";
    support::DiagnosticEngine diags;
    auto table = index::rebuildIndex(tree.root(), diags, options);
    ASSERT_TRUE(table);
    EXPECT_EQ(table.value().classNames(), Names{"Thing"});
}

int main(int argc, char **argv)
{
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
