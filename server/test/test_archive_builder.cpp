#include <gtest/gtest.h>
#include "archive_builder.hpp"
#include "errors.hpp"

#include <Poco/Zip/ZipArchive.h>
#include <Poco/Zip/ZipStream.h>
#include <Poco/StreamCopier.h>

#include <filesystem>
#include <fstream>
#include <map>
#include <sstream>
#include <system_error>

namespace fs = std::filesystem;

namespace {
    // File entries of a ZIP archive, name -> content. Directory entries are left out.
    std::map<std::string, std::string> readArchive(const std::string& bytes) {
        std::map<std::string, std::string> files;
        std::istringstream in(bytes, std::ios::in | std::ios::binary);
        Poco::Zip::ZipArchive archive(in);
        for (auto it = archive.headerBegin(); it != archive.headerEnd(); ++it) {
            if (!it->second.isFile()) continue;
            Poco::Zip::ZipInputStream zipin(in, it->second);
            std::string content;
            Poco::StreamCopier::copyToString(zipin, content);
            files[it->first] = content;
        }
        return files;
    }
}

class ArchiveBuilderTest : public ::testing::Test {
protected:
    fs::path base = fs::temp_directory_path() / "leak_test_archive_builder";
    fs::path root = base / "served";

    void SetUp() override {
        fs::remove_all(base);
        fs::create_directories(root / "photos" / "trip");
        fs::create_directories(root / "other");
        fs::create_directories(base / "outside");
        std::ofstream(root / "a.txt") << "alpha";
        std::ofstream(root / "photos" / "p1.jpg") << "jpeg-1";
        std::ofstream(root / "photos" / "trip" / "p2.jpg") << "jpeg-2";
        std::ofstream(root / "photos" / ".thumbs") << "hidden";
        std::ofstream(root / "other" / "a.txt") << "second alpha";
        std::ofstream(base / "outside" / "secret.txt") << "secret";
    }

    void TearDown() override {
        fs::remove_all(base);
    }
};

TEST_F(ArchiveBuilderTest, FileAndDirectorySelections) {
    PathResolver resolver(root);
    ArchiveBuilder builder(resolver);

    auto files = readArchive(builder.build({"/a.txt", "/photos/"}));
    ASSERT_EQ(files.size(), 3u);
    ASSERT_EQ(files["a.txt"], "alpha");
    ASSERT_EQ(files["photos/p1.jpg"], "jpeg-1");
    ASSERT_EQ(files["photos/trip/p2.jpg"], "jpeg-2");
}

TEST_F(ArchiveBuilderTest, HiddenFilesAreNotArchived) {
    PathResolver resolver(root);
    auto files = readArchive(ArchiveBuilder(resolver).build({"/photos"}));
    ASSERT_EQ(files.count("photos/.thumbs"), 0u);
}

TEST_F(ArchiveBuilderTest, SelectionsOutsideRootAreSkipped) {
    PathResolver resolver(root);
    auto files = readArchive(ArchiveBuilder(resolver).build({"/../outside/secret.txt", "/missing.txt", "/a.txt"}));
    ASSERT_EQ(files.size(), 1u);
    ASSERT_EQ(files["a.txt"], "alpha");
}

TEST_F(ArchiveBuilderTest, NothingValidGivesEmptyArchive) {
    PathResolver resolver(root);
    auto files = readArchive(ArchiveBuilder(resolver).build({"/../outside/secret.txt"}));
    ASSERT_TRUE(files.empty());
}

TEST_F(ArchiveBuilderTest, DuplicateEntryNamesKeepTheFirst) {
    PathResolver resolver(root);
    auto files = readArchive(ArchiveBuilder(resolver).build({"/a.txt", "/other/a.txt"}));
    ASSERT_EQ(files.size(), 1u);
    ASSERT_EQ(files["a.txt"], "alpha");
}

TEST_F(ArchiveBuilderTest, RootSelectionIsNamedAfterRootDirectory) {
    PathResolver resolver(root);
    auto files = readArchive(ArchiveBuilder(resolver).build({"/"}));
    ASSERT_EQ(files["served/a.txt"], "alpha");
    ASSERT_EQ(files["served/photos/trip/p2.jpg"], "jpeg-2");
}

TEST_F(ArchiveBuilderTest, SymlinksOutOfRootAndCyclesAreSkipped) {
    std::error_code ec;
    fs::create_directory_symlink(base / "outside", root / "photos" / "escape", ec);
    if (ec) GTEST_SKIP() << "symlinks not supported here";
    fs::create_directory_symlink(root / "photos", root / "photos" / "trip" / "loop", ec);
    if (ec) GTEST_SKIP() << "symlinks not supported here";

    PathResolver resolver(root);
    auto files = readArchive(ArchiveBuilder(resolver).build({"/photos/"}));
    for (const auto& [name, content] : files) {
        ASSERT_EQ(name.find("secret"), std::string::npos) << name;
    }
    ASSERT_EQ(files["photos/p1.jpg"], "jpeg-1");
}


TEST_F(ArchiveBuilderTest, NamesTheCodecRefusesDoNotSpoilTheArchive) {
    fs::create_directories(root / "odd" / "~");
    std::ofstream(root / "odd" / "~" / "x.txt") << "tilde dir";
    std::ofstream(root / "odd" / "a\\b.txt") << "backslash";
    std::ofstream(root / "odd" / "ok.txt") << "fine";
    std::ofstream(root / "~") << "tilde";

    PathResolver resolver(root);
    ArchiveBuilder builder(resolver);

    std::string bytes;
    ASSERT_NO_THROW(bytes = builder.build({"/odd/"}));
    auto files = readArchive(bytes);
    ASSERT_EQ(files["odd/ok.txt"], "fine");

    ASSERT_NO_THROW(bytes = builder.build({"/~", "/a.txt"}));
    files = readArchive(bytes);
    ASSERT_EQ(files["a.txt"], "alpha");
}

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
