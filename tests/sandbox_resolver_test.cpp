#include <gtest/gtest.h>
#include "test_helpers.hpp"
#include "tools/SandboxResolver.hpp"

using namespace autopatch;
using autopatch::testing::write_text;

class SandboxResolverTest : public autopatch::testing::SandboxTest {};

static ErrorKind resolve_error(const SandboxResolver& r, const SandboxRoot& root, const std::string& p) {
    try {
        r.resolve(root, p);
    } catch (const PipelineError& e) {
        return e.kind();
    }
    return ErrorKind::NONE;
}

TEST_F(SandboxResolverTest, ResolvesPlainRelativePaths) {
    write_text(source("handlers/math.src"), "x");
    auto p = resolver_->resolve(roots_.source, "handlers/math.src");
    EXPECT_EQ(p, roots_.source.path / "handlers" / "math.src");
    EXPECT_EQ(SandboxResolver::relative_to(roots_.source, p), "handlers/math.src");
}

TEST_F(SandboxResolverTest, NonExistingTargetsInsideRootAreAllowed) {
    auto p = resolver_->resolve(roots_.workspace, "new/dir/file.txt");
    EXPECT_EQ(p, roots_.workspace.path / "new" / "dir" / "file.txt");
}

TEST_F(SandboxResolverTest, DotDotInsideRootIsNormalized) {
    fs::create_directories(source("a/b"));
    auto p = resolver_->resolve(roots_.source, "a/b/../c.txt");
    EXPECT_EQ(p, roots_.source.path / "a" / "c.txt");
}

TEST_F(SandboxResolverTest, RootItselfResolves) {
    EXPECT_EQ(resolver_->resolve(roots_.source, "."), roots_.source.path);
}

TEST_F(SandboxResolverTest, RejectsDotDotEscapes) {
    EXPECT_EQ(resolve_error(*resolver_, roots_.source, "../../etc/passwd"), ErrorKind::OUT_OF_BOUNDS_PATH);
    EXPECT_EQ(resolve_error(*resolver_, roots_.source, ".."), ErrorKind::OUT_OF_BOUNDS_PATH);
    EXPECT_EQ(resolve_error(*resolver_, roots_.source, "missing/../../x"), ErrorKind::OUT_OF_BOUNDS_PATH);
}

TEST_F(SandboxResolverTest, RejectsEmptyInput) {
    EXPECT_EQ(resolve_error(*resolver_, roots_.source, ""), ErrorKind::OUT_OF_BOUNDS_PATH);
}

TEST_F(SandboxResolverTest, RejectsAbsolutePathsOutsideRoot) {
    EXPECT_EQ(resolve_error(*resolver_, roots_.source, "/etc/passwd"), ErrorKind::OUT_OF_BOUNDS_PATH);
    EXPECT_EQ(resolve_error(*resolver_, roots_.source, roots_.workspace.path.string() + "/f"),
              ErrorKind::OUT_OF_BOUNDS_PATH);
}

TEST_F(SandboxResolverTest, AcceptsAbsolutePathsInsideRoot) {
    auto inside = (roots_.source.path / "ok.txt").string();
    EXPECT_EQ(resolver_->resolve(roots_.source, inside), roots_.source.path / "ok.txt");
}

TEST_F(SandboxResolverTest, SiblingWithSharedPrefixIsOutside) {
    fs::path evil = roots_.source.path.string() + "-evil";
    fs::create_directories(evil);
    write_text(evil / "x.txt", "x");
    EXPECT_EQ(resolve_error(*resolver_, roots_.source, "../source-evil/x.txt"), ErrorKind::OUT_OF_BOUNDS_PATH);
    EXPECT_FALSE(SandboxResolver::is_inside(evil / "x.txt", roots_.source.path));
}

TEST_F(SandboxResolverTest, RejectsSymlinkEscapes) {
    fs::path outside = base_ / "outside";
    write_text(outside / "secret.txt", "secret");
    fs::create_directory_symlink(outside, source("link"));
    fs::create_symlink(outside / "secret.txt", source("secret_link.txt"));

    EXPECT_EQ(resolve_error(*resolver_, roots_.source, "link/secret.txt"), ErrorKind::OUT_OF_BOUNDS_PATH);
    EXPECT_EQ(resolve_error(*resolver_, roots_.source, "secret_link.txt"), ErrorKind::OUT_OF_BOUNDS_PATH);
    EXPECT_EQ(resolve_error(*resolver_, roots_.source, "link/new_file.txt"), ErrorKind::OUT_OF_BOUNDS_PATH);
}

TEST_F(SandboxResolverTest, SymlinksStayingInsideAreFollowed) {
    write_text(source("real/a.txt"), "a");
    fs::create_directory_symlink(source("real"), source("alias"));
    EXPECT_EQ(resolver_->resolve(roots_.source, "alias/a.txt"), roots_.source.path / "real" / "a.txt");
}

TEST_F(SandboxResolverTest, RejectsDeviceFiles) {
    if (!fs::exists("/dev/null")) GTEST_SKIP() << "no /dev/null";
    fs::create_symlink("/dev/null", source("null"));
    EXPECT_EQ(resolve_error(*resolver_, roots_.source, "null"), ErrorKind::OUT_OF_BOUNDS_PATH);
}

TEST_F(SandboxResolverTest, CountsEveryResolution) {
    size_t before = resolver_->resolution_count();
    resolver_->resolve(roots_.workspace, "a.txt");
    resolve_error(*resolver_, roots_.workspace, "../x");
    EXPECT_EQ(resolver_->resolution_count(), before + 2);
}

TEST(SandboxResolverStatic, IsInsideComparesSegments) {
    EXPECT_TRUE(SandboxResolver::is_inside("/srv/app/x", "/srv/app"));
    EXPECT_TRUE(SandboxResolver::is_inside("/srv/app", "/srv/app"));
    EXPECT_TRUE(SandboxResolver::is_inside("/srv/app/x", "/srv/app/"));
    EXPECT_FALSE(SandboxResolver::is_inside("/srv/app-evil/x", "/srv/app"));
    EXPECT_FALSE(SandboxResolver::is_inside("/srv", "/srv/app"));
    EXPECT_FALSE(SandboxResolver::is_inside("/srv/app", ""));
}

TEST(SandboxResolverStatic, MakeRootRejectsEmptyAndFiles) {
    EXPECT_THROW(SandboxResolver::make_root(RootKind::SOURCE, ""), std::runtime_error);
    auto file = fs::temp_directory_path() / ("autopatch_root_file_" + std::to_string(::getpid()));
    write_text(file, "x");
    EXPECT_THROW(SandboxResolver::make_root(RootKind::SOURCE, file, false), std::runtime_error);
    fs::remove(file);
}
