#include <gtest/gtest.h>
#include "mcpfs/sandbox.hpp"
#include "mcpfs/error.hpp"
#include "test_support.hpp"
#include <filesystem>
#include <string>

using namespace mcpfs;
using mcpfs::testing::TempDir;

namespace {

RejectionKind kind_of(const Resolution& r) {
    EXPECT_TRUE(std::holds_alternative<Rejection>(r));
    return std::get<Rejection>(r).kind;
}

std::string path_of(const Resolution& r) {
    if (const auto* rej = std::get_if<Rejection>(&r)) {
        ADD_FAILURE() << "unexpected rejection: " << rej->message();
        return {};
    }
    return std::get<ResolvedPath>(r).path;
}

} // namespace

TEST(CleanPath, CollapsesDotsAndSeparators) {
    EXPECT_EQ(clean_path(""), ".");
    EXPECT_EQ(clean_path("/"), "/");
    EXPECT_EQ(clean_path("/a/./b/../c"), "/a/c");
    EXPECT_EQ(clean_path("//a//b/"), "/a/b");
    EXPECT_EQ(clean_path("/../x"), "/x");
    EXPECT_EQ(clean_path("a/../../b"), "../b");
    EXPECT_EQ(clean_path("a/b/.."), "a");
    EXPECT_EQ(clean_path("./"), ".");
}

TEST(IsWithin, RequiresSeparatorAfterRoot) {
    EXPECT_TRUE(is_within("/tmp/A", "/tmp/A"));
    EXPECT_TRUE(is_within("/tmp/A/x", "/tmp/A"));
    EXPECT_FALSE(is_within("/tmp/Abad", "/tmp/A"));
    EXPECT_FALSE(is_within("/tmp", "/tmp/A"));
    EXPECT_TRUE(is_within("/anything", "/"));
}

TEST(ExpandHome, OnlyBareTildeAndTildeSlash) {
    const std::optional<std::string> home = std::string("/home/u");
    EXPECT_EQ(expand_home("~", home), "/home/u");
    EXPECT_EQ(expand_home("~/x/y", home), "/home/u/x/y");
    EXPECT_EQ(expand_home("~user/x", home), "~user/x");
    EXPECT_EQ(expand_home("a/~", home), "a/~");
    EXPECT_EQ(expand_home("~/x", std::nullopt), "~/x");
}

class SandboxTest : public ::testing::Test {
protected:
    TempDir tmp;
    std::string root;
    std::string outside;
    std::unique_ptr<PathSandbox> sandbox;

    void SetUp() override {
        root = tmp.mkdir("A");
        outside = tmp.mkdir("outside");
        tmp.write("outside/secret.txt", "secret");
        tmp.write("A/x.txt", "hello");
        sandbox = std::make_unique<PathSandbox>(std::vector<std::string>{root}, tmp.path());
    }
};

TEST_F(SandboxTest, RejectsEmptyPath) {
    EXPECT_EQ(kind_of(sandbox->resolve("")), RejectionKind::InvalidPath);
}

TEST_F(SandboxTest, RejectsNulByte) {
    std::string bad = root + "/x.txt";
    bad.insert(bad.begin() + 3, '\0');
    EXPECT_EQ(kind_of(sandbox->resolve(bad)), RejectionKind::InvalidPath);
}

TEST_F(SandboxTest, AcceptsRootItself) {
    EXPECT_EQ(path_of(sandbox->resolve(root)), root);
    EXPECT_EQ(path_of(sandbox->resolve(root + "/")), root);
}

TEST_F(SandboxTest, RejectsRootParent) {
    EXPECT_EQ(kind_of(sandbox->resolve(tmp.path())), RejectionKind::PathNotAllowed);
}

TEST_F(SandboxTest, RejectsSiblingWithSharedPrefix) {
    tmp.write("Abad/x.txt", "evil");
    auto r = sandbox->resolve(tmp / "Abad/x.txt");
    EXPECT_EQ(kind_of(r), RejectionKind::PathNotAllowed);
    EXPECT_NE(std::get<Rejection>(r).message().find("not within allowed directories"), std::string::npos);
}

TEST_F(SandboxTest, AcceptsExistingFile) {
    EXPECT_EQ(path_of(sandbox->resolve(root + "/x.txt")), root + "/x.txt");
}

TEST_F(SandboxTest, RelativePathUsesStartDirectory) {
    PathSandbox rel({root}, root);
    EXPECT_EQ(path_of(rel.resolve("x.txt")), root + "/x.txt");
    EXPECT_EQ(path_of(rel.resolve("./sub/../x.txt")), root + "/x.txt");
    EXPECT_EQ(kind_of(rel.resolve("../outside/secret.txt")), RejectionKind::PathNotAllowed);
}

TEST_F(SandboxTest, DotDotCannotLeaveRoot) {
    EXPECT_EQ(kind_of(sandbox->resolve(root + "/../outside/secret.txt")),
              RejectionKind::PathNotAllowed);
}

TEST_F(SandboxTest, RejectsSymlinkPointingOutside) {
    tmp.symlink("A/link", outside);
    auto r = sandbox->resolve(root + "/link/secret.txt");
    EXPECT_EQ(kind_of(r), RejectionKind::SymlinkEscape);
    EXPECT_NE(std::get<Rejection>(r).message().find("symlink"), std::string::npos);
}

TEST_F(SandboxTest, RejectsRelativeSymlinkClimbingOut) {
    tmp.mkdir("A/sub");
    tmp.symlink("A/sub/up", "../../outside");
    EXPECT_EQ(kind_of(sandbox->resolve(root + "/sub/up/secret.txt")), RejectionKind::SymlinkEscape);
}

TEST_F(SandboxTest, FollowsSymlinkStayingInside) {
    tmp.write("A/inner/f.txt", "f");
    tmp.symlink("A/alias", root + "/inner");
    EXPECT_EQ(path_of(sandbox->resolve(root + "/alias/f.txt")), root + "/inner/f.txt");
}

TEST_F(SandboxTest, NewFileUnderExistingParent) {
    EXPECT_EQ(path_of(sandbox->resolve(root + "/new.txt")), root + "/new.txt");
}

TEST_F(SandboxTest, NewFileWithMissingParent) {
    EXPECT_EQ(kind_of(sandbox->resolve(root + "/no/such/new.txt")), RejectionKind::ParentMissing);
    EXPECT_EQ(path_of(sandbox->resolve(root + "/no/such/new.txt", MissingParents::Allow)),
              root + "/no/such/new.txt");
}

TEST_F(SandboxTest, NewFileBehindEscapingLink) {
    tmp.symlink("A/out", outside);
    EXPECT_EQ(kind_of(sandbox->resolve(root + "/out/new.txt")), RejectionKind::SymlinkEscape);
    EXPECT_EQ(kind_of(sandbox->resolve(root + "/out/new.txt", MissingParents::Allow)),
              RejectionKind::SymlinkEscape);
    EXPECT_EQ(kind_of(sandbox->resolve(root + "/out/a/b/new.txt", MissingParents::Allow)),
              RejectionKind::SymlinkEscape);
}

TEST_F(SandboxTest, RejectsDanglingSymlinkTarget) {
    tmp.symlink("A/dangle", outside + "/missing.txt");
    EXPECT_EQ(kind_of(sandbox->resolve(root + "/dangle")), RejectionKind::SymlinkEscape);
    EXPECT_EQ(kind_of(sandbox->resolve(root + "/dangle", MissingParents::Allow)),
              RejectionKind::SymlinkEscape);
}

TEST_F(SandboxTest, FileInTheMiddleIsAResolutionError) {
    EXPECT_EQ(kind_of(sandbox->resolve(root + "/x.txt/child")), RejectionKind::ResolutionError);
}

TEST_F(SandboxTest, RootReachedThroughSymlink) {
    std::string link = tmp.symlink("rootlink", root);
    PathSandbox linked({link}, tmp.path());
    ASSERT_EQ(linked.roots().size(), 1u);
    EXPECT_EQ(linked.roots()[0].path, link);
    EXPECT_EQ(linked.roots()[0].canonical, root);
    EXPECT_EQ(path_of(linked.resolve(link + "/x.txt")), root + "/x.txt");
    EXPECT_EQ(path_of(linked.resolve(link + "/new.txt")), link + "/new.txt");
}

TEST_F(SandboxTest, AcceptedPathsStayInsideRoots) {
    tmp.symlink("A/out", outside);
    tmp.symlink("A/self", root);
    tmp.mkdir("A/d");
    const std::vector<std::string> probes = {
        root, root + "/x.txt", root + "/out", root + "/out/secret.txt", root + "/self/x.txt",
        root + "/self/../outside/secret.txt", root + "/d/../../outside", root + "/d/new",
        root + "/./d/./new", root + "//x.txt", tmp.path(), outside, "/", "/etc/passwd",
        "relative/path", "~", "~/x",
    };
    for (const auto& probe : probes) {
        for (auto mode : {MissingParents::Reject, MissingParents::Allow}) {
            auto r = sandbox->resolve(probe, mode);
            const auto* ok = std::get_if<ResolvedPath>(&r);
            if (!ok) continue;
            std::error_code ec;
            auto real = std::filesystem::canonical(ok->path, ec);
            std::string check = ec ? clean_path(ok->path) : real.string();
            EXPECT_TRUE(is_within(check, root)) << probe << " -> " << ok->path;
        }
    }
}

TEST(SandboxConstruction, RejectsBadRoots) {
    TempDir tmp;
    std::string file = tmp.write("file.txt", "x");
    EXPECT_THROW(PathSandbox({}, tmp.path()), ConfigError);
    EXPECT_THROW(PathSandbox({tmp / "missing"}, tmp.path()), ConfigError);
    EXPECT_THROW(PathSandbox({file}, tmp.path()), ConfigError);
}

TEST(SandboxConstruction, CollapsesDuplicates) {
    TempDir tmp;
    std::string a = tmp.mkdir("a");
    PathSandbox sb({a, a + "/", tmp / "a/../a"}, tmp.path());
    EXPECT_EQ(sb.roots().size(), 1u);
}
