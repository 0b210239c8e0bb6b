#include <functional>
#include <string>

#include <gtest/gtest.h>

#include "edashell/errors.hpp"
#include "edashell/path_translator.hpp"

using edashell::core::ErrorKind;
using edashell::core::PathTranslator;
using edashell::core::ToolError;

namespace {

ErrorKind kind_of(const std::function<void()>& fn) {
    try {
        fn();
    } catch (const ToolError& e) {
        return e.kind();
    }
    ADD_FAILURE() << "expected ToolError";
    return ErrorKind::InvalidInput;
}

} // namespace

class PathTranslatorTest : public ::testing::Test {
protected:
    PathTranslator translator_;
};

TEST_F(PathTranslatorTest, DriveLetterMapsToMountPoint) {
    EXPECT_EQ(translator_.to_foreign(R"(D:\work\top.v)"), "/mnt/d/work/top.v");
    EXPECT_EQ(translator_.to_foreign(R"(c:\)"), "/mnt/c/");
    EXPECT_EQ(translator_.to_foreign("E:"), "/mnt/e");
}

TEST_F(PathTranslatorTest, ForwardSlashesAreAccepted) {
    EXPECT_EQ(translator_.to_foreign("D:/work/top.v"), "/mnt/d/work/top.v");
}

TEST_F(PathTranslatorTest, MountPointMapsBackToUppercaseDrive) {
    EXPECT_EQ(translator_.to_native("/mnt/d/work/top.v"), R"(D:\work\top.v)");
    EXPECT_EQ(translator_.to_native("/mnt/c"), "C:");
}

TEST_F(PathTranslatorTest, RoundTripForEveryDriveLetter) {
    const std::string suffixes[] = {"", R"(\)", R"(\a)", R"(\My Designs\mux8_2to1.v)",
                                    R"(\deep\nested\dir\)"};
    for (char v = 'A'; v <= 'Z'; ++v) {
        for (const auto& s : suffixes) {
            const std::string native = std::string(1, v) + ":" + s;
            EXPECT_EQ(translator_.to_native(translator_.to_foreign(native)), native) << native;
        }
    }
}

TEST_F(PathTranslatorTest, UnsupportedDesignatorsFail) {
    EXPECT_EQ(kind_of([&] { translator_.to_foreign(""); }), ErrorKind::UnsupportedPath);
    EXPECT_EQ(kind_of([&] { translator_.to_foreign(R"(\\server\share\x.v)"); }), ErrorKind::UnsupportedPath);
    EXPECT_EQ(kind_of([&] { translator_.to_foreign("relative/x.v"); }), ErrorKind::UnsupportedPath);
    EXPECT_EQ(kind_of([&] { translator_.to_foreign(R"(1:\x.v)"); }), ErrorKind::UnsupportedPath);
    EXPECT_EQ(kind_of([&] { translator_.to_foreign("D:foo.v"); }), ErrorKind::UnsupportedPath);
    EXPECT_EQ(kind_of([&] { translator_.to_foreign("/home/user/x.v"); }), ErrorKind::UnsupportedPath);
}

TEST_F(PathTranslatorTest, PathsOutsideMountRootFail) {
    EXPECT_EQ(kind_of([&] { translator_.to_native("/home/user/x.v"); }), ErrorKind::UnsupportedPath);
    EXPECT_EQ(kind_of([&] { translator_.to_native("/mnt/"); }), ErrorKind::UnsupportedPath);
    EXPECT_EQ(kind_of([&] { translator_.to_native("/mnt/data/x.v"); }), ErrorKind::UnsupportedPath);
    EXPECT_EQ(kind_of([&] { translator_.to_native("/mntx/d/x.v"); }), ErrorKind::UnsupportedPath);
}

TEST_F(PathTranslatorTest, CustomMountRoot) {
    PathTranslator custom("/drives/");
    EXPECT_EQ(custom.mount_root(), "/drives");
    EXPECT_EQ(custom.to_foreign(R"(F:\x)"), "/drives/f/x");
    EXPECT_EQ(custom.to_native("/drives/f/x"), R"(F:\x)");
}

TEST_F(PathTranslatorTest, DrivePathDetection) {
    EXPECT_TRUE(PathTranslator::is_drive_path(R"(D:\x)"));
    EXPECT_TRUE(PathTranslator::is_drive_path("D:"));
    EXPECT_TRUE(PathTranslator::is_drive_path("d:/x"));
    EXPECT_FALSE(PathTranslator::is_drive_path("D:x"));
    EXPECT_FALSE(PathTranslator::is_drive_path("-gui"));
    EXPECT_FALSE(PathTranslator::is_drive_path("/usr/bin/yosys"));
}
