#include <catch2/catch.hpp>

#include <vector>

#include "FileScanner.hpp"
#include "TestUtils.hpp"

namespace
{
    std::vector<std::string> CollectNames(FileScanner& Scanner, const std::filesystem::path& Root, bool& Ok)
    {
        std::vector<std::string> Names;
        Ok = Scanner.Walk(Root.string(), [&Names, &Root](const ScannedFileInfo& File, std::string&)
        {
            Names.push_back(std::filesystem::relative(File.Path, Root).generic_string());
            return true;
        });
        return Names;
    }
}

TEST_CASE("Walk visits regular files depth first in lexical order", "[scanner]")
{
    TestUtils::TempDir Dir;
    TestUtils::WriteText(Dir / "src" / "b.bin", "b");
    TestUtils::WriteText(Dir / "src" / "a" / "z.bin", "z");
    TestUtils::WriteText(Dir / "src" / "a" / "deep" / "y.bin", "y");
    TestUtils::WriteText(Dir / "src" / "c.bin", "c");
    std::filesystem::create_directories(Dir / "src" / "empty");

    FileScanner Scanner;
    bool Ok = false;
    auto Names = CollectNames(Scanner, Dir / "src", Ok);

    REQUIRE(Ok);
    CHECK(Names == std::vector<std::string>{ "a/deep/y.bin", "a/z.bin", "b.bin", "c.bin" });
}

TEST_CASE("Walk reports sizes", "[scanner]")
{
    TestUtils::TempDir Dir;
    TestUtils::WriteSized(Dir / "src" / "sized.bin", 12345);

    FileScanner Scanner;
    uintmax_t Seen = 0;
    REQUIRE(Scanner.Walk((Dir / "src").string(), [&Seen](const ScannedFileInfo& File, std::string&)
    {
        Seen = File.Size;
        return true;
    }));
    CHECK(Seen == 12345);
}

TEST_CASE("Walk stops at the first visitor failure", "[scanner]")
{
    TestUtils::TempDir Dir;
    TestUtils::WriteText(Dir / "src" / "1.bin", "1");
    TestUtils::WriteText(Dir / "src" / "2.bin", "2");
    TestUtils::WriteText(Dir / "src" / "3.bin", "3");

    FileScanner Scanner;
    std::vector<std::string> Seen;
    bool Ok = Scanner.Walk((Dir / "src").string(), [&Seen](const ScannedFileInfo& File, std::string& Error)
    {
        Seen.push_back(File.Path.filename().string());
        if (Seen.size() == 2)
        {
            Error = "stop here";
            return false;
        }
        return true;
    });

    CHECK_FALSE(Ok);
    CHECK(Scanner.GetLastError() == "stop here");
    CHECK(Seen == std::vector<std::string>{ "1.bin", "2.bin" });
}

TEST_CASE("Walk of a missing root fails without visiting", "[scanner]")
{
    TestUtils::TempDir Dir;
    FileScanner Scanner;
    bool Ok = true;
    auto Names = CollectNames(Scanner, Dir / "missing", Ok);

    CHECK_FALSE(Ok);
    CHECK(Names.empty());
    CHECK(Scanner.GetLastError().find("Source path is not accessible") != std::string::npos);
}

TEST_CASE("Walk of a file root visits only that file", "[scanner]")
{
    TestUtils::TempDir Dir;
    TestUtils::WriteText(Dir / "single.bin", "x");

    FileScanner Scanner;
    std::vector<std::string> Seen;
    REQUIRE(Scanner.Walk((Dir / "single.bin").string(), [&Seen](const ScannedFileInfo& File, std::string&)
    {
        Seen.push_back(File.Path.filename().string());
        return true;
    }));
    CHECK(Seen == std::vector<std::string>{ "single.bin" });
}

#ifndef _WIN32
TEST_CASE("Walk skips symbolic links", "[scanner]")
{
    TestUtils::TempDir Dir;
    TestUtils::WriteText(Dir / "elsewhere" / "real.bin", "r");
    TestUtils::WriteText(Dir / "src" / "own.bin", "o");
    std::filesystem::create_symlink(Dir / "elsewhere" / "real.bin", Dir / "src" / "link.bin");
    std::filesystem::create_directory_symlink(Dir / "elsewhere", Dir / "src" / "linkdir");

    FileScanner Scanner;
    bool Ok = false;
    auto Names = CollectNames(Scanner, Dir / "src", Ok);

    REQUIRE(Ok);
    CHECK(Names == std::vector<std::string>{ "own.bin" });
}
#endif
