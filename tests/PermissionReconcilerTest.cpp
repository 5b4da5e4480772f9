#include "fakes/TempDir.hpp"
#include "System/PermissionReconciler.hpp"
#include "Virtualization/Utils/VmException.hpp"
#include <fstream>
#include <gtest/gtest.h>
#include <sys/stat.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace {

mode_t modeOf(const std::string& path) {
    struct stat st {};
    EXPECT_EQ(::stat(path.c_str(), &st), 0) << path;
    return st.st_mode & 07777;
}

PermissionSpec modeOnly(const std::string& mode) {
    PermissionSpec spec;
    spec.mode = mode;
    return spec;
}

} // namespace

TEST(PermissionParseTest, ParsesOctalModes) {
    EXPECT_EQ(PermissionReconciler::parseMode("0755"), std::optional<mode_t>(0755));
    EXPECT_EQ(PermissionReconciler::parseMode("640"), std::optional<mode_t>(0640));
    EXPECT_EQ(PermissionReconciler::parseMode("1777"), std::optional<mode_t>(01777));
    EXPECT_FALSE(PermissionReconciler::parseMode("").has_value());

    EXPECT_THROW(static_cast<void>(PermissionReconciler::parseMode("0789")), InvalidInputException);
    EXPECT_THROW(static_cast<void>(PermissionReconciler::parseMode("07555")), InvalidInputException);
    try {
        static_cast<void>(PermissionReconciler::parseMode("rwx"));
        FAIL() << "expected InvalidInputException";
    } catch (const InvalidInputException& e) {
        EXPECT_STREQ(e.what(), "Invalid permission mode: rwx");
    }
}

TEST(PermissionParseTest, ResolvesNumericAndNamedIds) {
    EXPECT_EQ(PermissionReconciler::resolveOwner("1234"), std::optional<uid_t>(1234));
    EXPECT_EQ(PermissionReconciler::resolveGroup("0"), std::optional<gid_t>(0));
    EXPECT_EQ(PermissionReconciler::resolveOwner("root"), std::optional<uid_t>(0));
    EXPECT_FALSE(PermissionReconciler::resolveGroup("").has_value());

    try {
        static_cast<void>(PermissionReconciler::resolveOwner("no-such-user-virtrecon"));
        FAIL() << "expected InvalidInputException";
    } catch (const InvalidInputException& e) {
        EXPECT_STREQ(e.what(), "Unable to resolve owner: no-such-user-virtrecon");
    }
    EXPECT_THROW(static_cast<void>(PermissionReconciler::resolveGroup("no-such-group-virtrecon")),
                 InvalidInputException);
}

TEST(PermissionReconcilerTest, ChangesOnlyWhatDiffers) {
    TempDir scratch;
    const auto file = scratch / "disk.img";
    std::ofstream(file) << "x";
    fs::permissions(file, fs::perms::owner_read | fs::perms::owner_write, fs::perm_options::replace);

    PermissionReconciler reconciler;
    PermissionSpec spec = modeOnly("0640");
    spec.owner = std::to_string(::geteuid());
    spec.group = std::to_string(::getegid());

    EXPECT_TRUE(reconciler.manage(file, spec));
    EXPECT_EQ(modeOf(file), 0640u);
    EXPECT_FALSE(reconciler.manage(file, spec));
    EXPECT_FALSE(reconciler.manage(file, PermissionSpec()));
}

TEST(PermissionReconcilerTest, RecursiveWalksTheTree) {
    TempDir scratch;
    fs::create_directories(scratch / "pool/sub");
    std::ofstream(scratch / "pool/sub/a.raw") << "a";
    fs::permissions(scratch / "pool/sub/a.raw", fs::perms::owner_all, fs::perm_options::replace);

    PermissionReconciler reconciler;
    EXPECT_TRUE(reconciler.manage(scratch / "pool", modeOnly("0750"), true));
    EXPECT_EQ(modeOf(scratch / "pool"), 0750u);
    EXPECT_EQ(modeOf(scratch / "pool/sub"), 0750u);
    EXPECT_EQ(modeOf(scratch / "pool/sub/a.raw"), 0750u);
}

TEST(PermissionReconcilerTest, DryRunTouchesNothing) {
    TempDir scratch;
    const auto file = scratch / "disk.img";
    std::ofstream(file) << "x";
    fs::permissions(file, fs::perms::owner_read | fs::perms::owner_write, fs::perm_options::replace);

    PermissionReconciler dryRun(true);
    EXPECT_TRUE(dryRun.manage(file, modeOnly("0644")));
    EXPECT_EQ(modeOf(file), 0600u);

    EXPECT_TRUE(dryRun.createWithPermissions(scratch / "new", modeOnly("0700"), true));
    EXPECT_FALSE(fs::exists(scratch / "new"));
}

TEST(PermissionReconcilerTest, MissingPathIsNotFound) {
    TempDir scratch;
    PermissionReconciler reconciler;
    try {
        reconciler.manage(scratch / "ghost", modeOnly("0644"));
        FAIL() << "expected NotFoundException";
    } catch (const NotFoundException& e) {
        EXPECT_EQ(std::string(e.what()), "Path does not exist: " + (scratch / "ghost"));
    }
}

TEST(PermissionReconcilerTest, CreatesDirectoriesAndFiles) {
    TempDir scratch;
    PermissionReconciler reconciler;

    const auto dir = scratch / "a/b/images";
    EXPECT_TRUE(reconciler.createWithPermissions(dir, modeOnly("0711"), true));
    ASSERT_TRUE(fs::is_directory(dir));
    EXPECT_EQ(modeOf(dir), 0711u);
    EXPECT_FALSE(reconciler.createWithPermissions(dir, modeOnly("0711"), true));

    const auto file = scratch / "a/disk.raw";
    EXPECT_TRUE(reconciler.createWithPermissions(file, modeOnly("0600"), false));
    ASSERT_TRUE(fs::is_regular_file(file));
    EXPECT_EQ(modeOf(file), 0600u);
}
