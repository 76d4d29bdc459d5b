
#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <string_view>

#include "errors.hpp"
#include "manifest.hpp"
#include "temp_dir.hpp"

using testing::ElementsAre;
using testing::HasSubstr;
using testing::IsEmpty;


namespace
{
    std::vector<std::filesystem::path> entries(const Manifest& manifest)
    {
        const auto view = manifest.entries();
        return std::vector<std::filesystem::path>(view.begin(), view.end());
    }
}


TEST(ManifestTest, splitsLinesInOrder)
{
    const auto manifest = Manifest::parse("/usr/lib/libSDL2.a\n/usr/include/SDL2/SDL.h\n/usr/bin/sdl2-config\n");

    EXPECT_THAT(entries(manifest), ElementsAre("/usr/lib/libSDL2.a", "/usr/include/SDL2/SDL.h", "/usr/bin/sdl2-config"));
}


TEST(ManifestTest, lastLineWithoutNewline)
{
    const auto manifest = Manifest::parse("/a\n/b");

    EXPECT_THAT(entries(manifest), ElementsAre("/a", "/b"));
}


TEST(ManifestTest, blankLinesAreSkipped)
{
    const auto manifest = Manifest::parse("\n/a\n\n\n/b\n\n");

    EXPECT_THAT(entries(manifest), ElementsAre("/a", "/b"));
}


TEST(ManifestTest, emptyContent)
{
    EXPECT_TRUE(Manifest::parse("").empty());
    EXPECT_TRUE(Manifest::parse("\n").empty());
}


TEST(ManifestTest, pathsAreTakenVerbatim)
{
    const auto manifest = Manifest::parse("/opt/my app/file name.txt\n /leading space\n");

    EXPECT_THAT(entries(manifest), ElementsAre("/opt/my app/file name.txt", " /leading space"));
}


TEST(ManifestTest, readsFile)
{
    const TempDir dir;
    const auto manifestFile = dir.createFile("install_manifest.txt", "/x/1\n/x/2\n");

    const auto manifest = Manifest::read(manifestFile);

    EXPECT_EQ(manifest.size(), 2);
    EXPECT_THAT(entries(manifest), ElementsAre("/x/1", "/x/2"));
}


TEST(ManifestTest, readsEmptyFile)
{
    const TempDir dir;
    const auto manifestFile = dir.createFile("install_manifest.txt", "");

    EXPECT_THAT(entries(Manifest::read(manifestFile)), IsEmpty());
}


TEST(ManifestTest, missingFileThrows)
{
    const TempDir dir;
    const auto manifestFile = dir.path() / "install_manifest.txt";

    try
    {
        Manifest::read(manifestFile);
        FAIL() << "ManifestNotFound expected";
    }
    catch (const ManifestNotFound& error)
    {
        EXPECT_EQ(error.manifest(), manifestFile);
        EXPECT_THAT(error.what(), HasSubstr(manifestFile.string()));
    }
}


TEST(ManifestTest, directoryThrows)
{
    const TempDir dir;
    const auto manifestDir = dir.path() / "install_manifest.txt";
    std::filesystem::create_directory(manifestDir);

    try
    {
        Manifest::read(manifestDir);
        FAIL() << "ManifestNotFound expected";
    }
    catch (const ManifestNotFound& error)
    {
        EXPECT_EQ(error.manifest(), manifestDir);
        EXPECT_THAT(error.what(), HasSubstr(manifestDir.string()));
    }
}


struct ParseParam
{
    std::string_view content;
    size_t entries;
};

class ManifestParseTest: public testing::TestWithParam<ParseParam> { };

INSTANTIATE_TEST_SUITE_P(
    LineEndings, ManifestParseTest,
    testing::Values(
        ParseParam{"/a", 1},
        ParseParam{"/a\n", 1},
        ParseParam{"/a\n/b\n/c\n", 3},
        ParseParam{"\n\n\n", 0},
        // windows line endings are not stripped, each line still counts once
        ParseParam{"/a\r\n/b\r\n", 2}
    )
);


TEST_P(ManifestParseTest, entryCount)
{
    const auto& [content, expectedEntries] = GetParam();

    EXPECT_EQ(Manifest::parse(content).size(), expectedEntries);
}
