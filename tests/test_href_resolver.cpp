#include "links/href_resolver.h"

#include "test_support.h"

#include <gtest/gtest.h>

#include <filesystem>
#include <string>

using ink::links::FollowableLink;
using ink::links::ResolveOutcome;
using ink::test::FakeFileSystem;

namespace
{
class HrefResolverTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        fs.AddFile("/r/current.md");
        fs.AddFile("/r/docs/target.md");
        fs.AddFile("/r/docs/target.markdown");
        fs.AddFile("/r/docs/SPACE NAME.md");
        fs.AddFile("/r/docs/100%.md");
        fs.AddDir("/r/docs/dir.md");
        fs.AddFile("/r-extra/sibling.md");
        fs.AddFile("/outside/outside.md");
    }

    ResolveOutcome Resolve(const std::string& href, const std::string& current = "/r/current.md")
    {
        link = FollowableLink{};
        return ink::links::ResolveFollowableLink(fs, "/r", current, href, link, err);
    }

    FakeFileSystem fs;
    FollowableLink link;
    std::string err;
};
} // namespace

TEST(HrefClassifier, NormalizeStripsWhitespaceAndOneLayerOfAngleBrackets)
{
    EXPECT_EQ(ink::links::NormalizeHref("  docs/a.md \t"), "docs/a.md");
    EXPECT_EQ(ink::links::NormalizeHref("<docs/a.md>"), "docs/a.md");
    EXPECT_EQ(ink::links::NormalizeHref(" <docs/a.md> "), "docs/a.md");
    EXPECT_EQ(ink::links::NormalizeHref("<<docs/a.md>>"), "<docs/a.md>");
    EXPECT_EQ(ink::links::NormalizeHref("<docs/a.md"), "<docs/a.md");
}

TEST(HrefClassifier, SplitFragmentCutsAtFirstHash)
{
    std::string path;
    std::string frag;

    ink::links::SplitFragment("a.md#sec", path, frag);
    EXPECT_EQ(path, "a.md");
    EXPECT_EQ(frag, "sec");

    ink::links::SplitFragment("a.md#x#y", path, frag);
    EXPECT_EQ(path, "a.md");
    EXPECT_EQ(frag, "x#y");

    ink::links::SplitFragment("a.md", path, frag);
    EXPECT_EQ(path, "a.md");
    EXPECT_TRUE(frag.empty());
}

TEST(HrefClassifier, AbsoluteForms)
{
    EXPECT_TRUE(ink::links::IsAbsoluteOrUncPath("/etc/passwd"));
    EXPECT_TRUE(ink::links::IsAbsoluteOrUncPath("\\\\server\\share\\a.md"));
    EXPECT_TRUE(ink::links::IsAbsoluteOrUncPath("C:\\Windows\\a.md"));
    EXPECT_TRUE(ink::links::IsAbsoluteOrUncPath("c:a.md"));
    EXPECT_FALSE(ink::links::IsAbsoluteOrUncPath("docs/a.md"));
    EXPECT_FALSE(ink::links::IsAbsoluteOrUncPath("../a.md"));
    EXPECT_FALSE(ink::links::IsAbsoluteOrUncPath("1:a.md"));
}

TEST(HrefClassifier, FollowableHrefs)
{
    EXPECT_TRUE(ink::links::IsFollowableHref("docs/a.md"));
    EXPECT_TRUE(ink::links::IsFollowableHref("docs/a.markdown"));
    EXPECT_TRUE(ink::links::IsFollowableHref("README.MD"));
    EXPECT_TRUE(ink::links::IsFollowableHref("notes.Markdown#top"));
    EXPECT_TRUE(ink::links::IsFollowableHref("<docs/a.md>"));
    EXPECT_TRUE(ink::links::IsFollowableHref("../sibling.md"));
    EXPECT_TRUE(ink::links::IsFollowableHref("a.md#section.txt"));
}

TEST(HrefClassifier, RejectedHrefs)
{
    EXPECT_FALSE(ink::links::IsFollowableHref("https://example.com/docs/a.md"));
    EXPECT_FALSE(ink::links::IsFollowableHref("ftp://host/a.md"));
    EXPECT_FALSE(ink::links::IsFollowableHref("custom://a.md"));
    EXPECT_FALSE(ink::links::IsFollowableHref("mailto:someone@example.md"));
    EXPECT_FALSE(ink::links::IsFollowableHref("MAILTO:someone@example.md"));
    EXPECT_FALSE(ink::links::IsFollowableHref("/abs/a.md"));
    EXPECT_FALSE(ink::links::IsFollowableHref("\\\\server\\share\\a.md"));
    EXPECT_FALSE(ink::links::IsFollowableHref("C:\\Windows\\a.md"));
    EXPECT_FALSE(ink::links::IsFollowableHref("docs/a.txt"));
    EXPECT_FALSE(ink::links::IsFollowableHref("docs/a.txt#b.md"));
    EXPECT_FALSE(ink::links::IsFollowableHref("docs/a"));
    EXPECT_FALSE(ink::links::IsFollowableHref(""));
}

TEST(HrefClassifier, PercentDecode)
{
    std::string out;
    ASSERT_TRUE(ink::links::PercentDecode("SPACE%20NAME.md", out));
    EXPECT_EQ(out, "SPACE NAME.md");
    ASSERT_TRUE(ink::links::PercentDecode("%41%62%2f", out));
    EXPECT_EQ(out, "Ab/");
    ASSERT_TRUE(ink::links::PercentDecode("caf%C3%A9.md", out));
    EXPECT_EQ(out, "caf\xC3\xA9.md");

    out = "untouched";
    EXPECT_FALSE(ink::links::PercentDecode("100%", out));
    EXPECT_FALSE(ink::links::PercentDecode("%4", out));
    EXPECT_FALSE(ink::links::PercentDecode("%zz.md", out));
    EXPECT_EQ(out, "untouched");
}

TEST_F(HrefResolverTest, ResolvesRelativeToCurrentDocumentDirectory)
{
    ASSERT_EQ(Resolve("docs/target.md"), ResolveOutcome::Followable) << err;
    EXPECT_EQ(link.href, "docs/target.md");
    EXPECT_EQ(link.path, "docs/target.md");
    EXPECT_EQ(link.fragment, "");
    EXPECT_EQ(link.resolved_path, "/r/docs/target.md");
    EXPECT_EQ(link.resolved_note, "docs/target.md");
    EXPECT_TRUE(link.label.empty());

    ASSERT_EQ(Resolve("target.markdown", "/r/docs/index.md"), ResolveOutcome::Followable);
    EXPECT_EQ(link.resolved_path, "/r/docs/target.markdown");

    ASSERT_EQ(Resolve("../current.md", "/r/docs/index.md"), ResolveOutcome::Followable);
    EXPECT_EQ(link.resolved_path, "/r/current.md");
    EXPECT_EQ(link.resolved_note, "current.md");

    ASSERT_EQ(Resolve("./docs/../docs/./target.md"), ResolveOutcome::Followable);
    EXPECT_EQ(link.resolved_path, "/r/docs/target.md");
}

TEST_F(HrefResolverTest, FragmentIsKeptAndIgnoredForResolution)
{
    ASSERT_EQ(Resolve("docs/target.md#Section-2"), ResolveOutcome::Followable);
    EXPECT_EQ(link.href, "docs/target.md#Section-2");
    EXPECT_EQ(link.path, "docs/target.md");
    EXPECT_EQ(link.fragment, "Section-2");
    EXPECT_EQ(link.resolved_path, "/r/docs/target.md");
}

TEST_F(HrefResolverTest, AngleBracketsAreStrippedOnce)
{
    ASSERT_EQ(Resolve(" <docs/target.md> "), ResolveOutcome::Followable);
    EXPECT_EQ(link.href, "docs/target.md");

    EXPECT_EQ(Resolve("<<docs/target.md>>"), ResolveOutcome::NotFollowable);
}

TEST_F(HrefResolverTest, PercentEncodedPathIsDecoded)
{
    ASSERT_EQ(Resolve("docs/SPACE%20NAME.md"), ResolveOutcome::Followable);
    EXPECT_EQ(link.href, "docs/SPACE%20NAME.md");
    EXPECT_EQ(link.path, "docs/SPACE NAME.md");
    EXPECT_EQ(link.resolved_path, "/r/docs/SPACE NAME.md");
}

TEST_F(HrefResolverTest, MalformedPercentEscapeFallsBackToRawPath)
{
    ASSERT_EQ(Resolve("docs/100%.md"), ResolveOutcome::Followable);
    EXPECT_EQ(link.path, "docs/100%.md");
    EXPECT_EQ(link.resolved_path, "/r/docs/100%.md");
}

TEST_F(HrefResolverTest, EncodedSlashesStayRelativeToDocumentDirectory)
{
    // "%2Fdocs%2Ftarget.md" decodes to "/docs/target.md", joined under the document directory.
    ASSERT_EQ(Resolve("%2Fdocs%2Ftarget.md"), ResolveOutcome::Followable);
    EXPECT_EQ(link.resolved_path, "/r/docs/target.md");

    EXPECT_EQ(Resolve("..%2F..%2Foutside%2Foutside.md"), ResolveOutcome::NotFollowable);
}

TEST_F(HrefResolverTest, MissingFilesAndDirectoriesAreNotFollowable)
{
    EXPECT_EQ(Resolve("docs/missing.md"), ResolveOutcome::NotFollowable);
    EXPECT_EQ(Resolve("docs/dir.md"), ResolveOutcome::NotFollowable);
    EXPECT_TRUE(err.empty());
}

TEST_F(HrefResolverTest, TraversalOutOfRootIsNotFollowable)
{
    EXPECT_EQ(Resolve("../outside/outside.md"), ResolveOutcome::NotFollowable);
    EXPECT_EQ(Resolve("docs/../../outside/outside.md"), ResolveOutcome::NotFollowable);
}

TEST_F(HrefResolverTest, SiblingDirectorySharingRootPrefixIsOutside)
{
    EXPECT_EQ(Resolve("../r-extra/sibling.md"), ResolveOutcome::NotFollowable);
}

TEST_F(HrefResolverTest, SymlinkPointingOutsideRootIsNotFollowable)
{
    fs.AddSymlink("/r/escape", "/outside");
    EXPECT_EQ(Resolve("escape/outside.md"), ResolveOutcome::NotFollowable);

    fs.AddSymlink("/r/docs/leak.md", "/outside/outside.md");
    EXPECT_EQ(Resolve("docs/leak.md"), ResolveOutcome::NotFollowable);
}

TEST_F(HrefResolverTest, SymlinkInsideRootResolvesToItsTarget)
{
    fs.AddSymlink("/r/alias", "/r/docs");
    ASSERT_EQ(Resolve("alias/target.md"), ResolveOutcome::Followable);
    EXPECT_EQ(link.resolved_path, "/r/docs/target.md");
    EXPECT_EQ(link.resolved_note, "docs/target.md");
}

TEST_F(HrefResolverTest, SymlinkedRootIsEvaluatedBeforeContainment)
{
    fs.AddSymlink("/links/root", "/r");
    link = FollowableLink{};
    ASSERT_EQ(ink::links::ResolveFollowableLink(fs, "/links/root", "/links/root/current.md", "docs/target.md", link, err),
              ResolveOutcome::Followable);
    EXPECT_EQ(link.resolved_path, "/r/docs/target.md");
    EXPECT_EQ(link.resolved_note, "docs/target.md");
}

TEST_F(HrefResolverTest, RelativeRootUsesWorkingDirectory)
{
    fs.cwd = "/r";
    link = FollowableLink{};
    ASSERT_EQ(ink::links::ResolveFollowableLink(fs, ".", "current.md", "docs/target.md", link, err),
              ResolveOutcome::Followable);
    EXPECT_EQ(link.resolved_path, "/r/docs/target.md");
    EXPECT_EQ(link.resolved_note, "docs/target.md");
}

TEST_F(HrefResolverTest, ExternalAndAbsoluteHrefsAreRejectedBeforeTouchingTheFilesystem)
{
    fs.absolute_failures.insert("/r");
    EXPECT_EQ(Resolve("https://example.com/docs/target.md"), ResolveOutcome::NotFollowable);
    EXPECT_EQ(Resolve("mailto:test@example.com"), ResolveOutcome::NotFollowable);
    EXPECT_EQ(Resolve("/r/docs/target.md"), ResolveOutcome::NotFollowable);
    EXPECT_EQ(Resolve("docs/target.txt"), ResolveOutcome::NotFollowable);
    EXPECT_TRUE(err.empty());
}

TEST_F(HrefResolverTest, RootAbsoluteFailureIsAnError)
{
    fs.absolute_failures.insert("/r");
    EXPECT_EQ(Resolve("docs/target.md"), ResolveOutcome::Error);
    EXPECT_EQ(err.rfind("abs root dir: ", 0), 0u) << err;
}

TEST_F(HrefResolverTest, CandidateAbsoluteFailureIsAnError)
{
    fs.absolute_failures.insert("/r/docs/target.md");
    EXPECT_EQ(Resolve("docs/target.md"), ResolveOutcome::Error);
    EXPECT_EQ(err.rfind("abs resolved path: ", 0), 0u) << err;
}

#ifndef _WIN32
TEST(HrefResolverRealFs, SymlinkEscapeIsRejected)
{
    ink::test::TempDir tmp;
    const std::filesystem::path root = tmp.Path() / "root";
    const std::filesystem::path outside = tmp.Path() / "outside";
    ink::test::WriteFile(root / "current.md", "# Current\n");
    ink::test::WriteFile(outside / "outside.md", "# Outside\n");

    std::error_code ec;
    std::filesystem::create_directory_symlink(outside, root / "escape", ec);
    if (ec)
        GTEST_SKIP() << "symlinks not supported: " << ec.message();

    ink::links::RealFileSystem fs;
    FollowableLink link;
    std::string err;
    EXPECT_EQ(ink::links::ResolveFollowableLink(fs, root.string(), (root / "current.md").string(), "escape/outside.md",
                                                link, err),
              ResolveOutcome::NotFollowable);
    EXPECT_TRUE(err.empty()) << err;
}
#endif
