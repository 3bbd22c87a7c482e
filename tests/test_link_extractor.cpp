#include "links/link_extractor.h"

#include <gtest/gtest.h>

using ink::links::ExtractRawLinks;
using ink::links::RawLink;

TEST(LinkExtractor, InlineLink)
{
    const auto links = ExtractRawLinks("See [Target](docs/target.md).\n");
    ASSERT_EQ(links.size(), 1u);
    EXPECT_EQ(links[0].href, "docs/target.md");
    EXPECT_EQ(links[0].label, "Target");
}

TEST(LinkExtractor, ReferenceLinksResolveToTheirDefinitions)
{
    const auto full = ExtractRawLinks("See [Target][id].\n\n[id]: docs/target.md\n");
    ASSERT_EQ(full.size(), 1u);
    EXPECT_EQ(full[0].href, "docs/target.md");
    EXPECT_EQ(full[0].label, "Target");

    const auto collapsed = ExtractRawLinks("[Target][]\n\n[Target]: docs/target.md\n");
    ASSERT_EQ(collapsed.size(), 1u);
    EXPECT_EQ(collapsed[0].href, "docs/target.md");
    EXPECT_EQ(collapsed[0].label, "Target");

    const auto shortcut = ExtractRawLinks("[Target]\n\n[target]: docs/target.md\n");
    ASSERT_EQ(shortcut.size(), 1u);
    EXPECT_EQ(shortcut[0].href, "docs/target.md");
}

TEST(LinkExtractor, DocumentOrderIsPreserved)
{
    const auto links = ExtractRawLinks("# Index\n\n"
                                       "- [one](1.md)\n"
                                       "- [two](2.md)\n\n"
                                       "> quoted [three](3.md)\n\n"
                                       "| a | b |\n|---|---|\n| [four](4.md) | x |\n");
    ASSERT_EQ(links.size(), 4u);
    EXPECT_EQ(links[0].label, "one");
    EXPECT_EQ(links[1].label, "two");
    EXPECT_EQ(links[2].label, "three");
    EXPECT_EQ(links[3].label, "four");
    EXPECT_EQ(links[3].href, "4.md");
}

TEST(LinkExtractor, LabelConcatenatesTextOfNestedFormatting)
{
    const auto links = ExtractRawLinks("[**Bold** and *em* and `code`](a.md)\n");
    ASSERT_EQ(links.size(), 1u);
    EXPECT_EQ(links[0].label, "Bold and em and code");
}

TEST(LinkExtractor, LabelIsTrimmedAndEntitiesDecoded)
{
    const auto links = ExtractRawLinks("[ Fish &amp; Chips ](menu.md)\n");
    ASSERT_EQ(links.size(), 1u);
    EXPECT_EQ(links[0].label, "Fish & Chips");
}

TEST(LinkExtractor, LineBreakInsideLabelBecomesSpace)
{
    const auto links = ExtractRawLinks("[first\nsecond](a.md)\n");
    ASSERT_EQ(links.size(), 1u);
    EXPECT_EQ(links[0].label, "first second");
}

TEST(LinkExtractor, AngleBracketDestinationIsUnwrappedByTheParser)
{
    const auto links = ExtractRawLinks("See [Target](<docs/my target.md>).\n");
    ASSERT_EQ(links.size(), 1u);
    EXPECT_EQ(links[0].href, "docs/my target.md");
}

TEST(LinkExtractor, EmptyLabelIsStillExtracted)
{
    const auto links = ExtractRawLinks("See [](docs/target.md).\n");
    ASSERT_EQ(links.size(), 1u);
    EXPECT_EQ(links[0].href, "docs/target.md");
    EXPECT_TRUE(links[0].label.empty());
}

TEST(LinkExtractor, EmptyDestinationIsSkipped)
{
    EXPECT_TRUE(ExtractRawLinks("[label]()\n").empty());
    EXPECT_TRUE(ExtractRawLinks("[label](<>)\n").empty());
}

TEST(LinkExtractor, ImagesAreNotLinks)
{
    EXPECT_TRUE(ExtractRawLinks("![Alt](docs/target.md)\n").empty());
    EXPECT_TRUE(ExtractRawLinks("![see [inner](docs/target.md)](pic.png)\n").empty());
}

TEST(LinkExtractor, LinkWrappingAnImageIsALink)
{
    const auto links = ExtractRawLinks("[![logo](logo.png) Home](index.md)\n");
    ASSERT_EQ(links.size(), 1u);
    EXPECT_EQ(links[0].href, "index.md");
}

TEST(LinkExtractor, AutolinksAndBarePathsAreNotLinks)
{
    EXPECT_TRUE(ExtractRawLinks("See <https://example.com/a.md>.\n").empty());
    EXPECT_TRUE(ExtractRawLinks("See <docs/target.md>.\n").empty());
    EXPECT_TRUE(ExtractRawLinks("docs/target.md\n").empty());
    EXPECT_TRUE(ExtractRawLinks("https://example.com/a.md\n").empty());
}

TEST(LinkExtractor, CodeIsNotParsedForLinks)
{
    EXPECT_TRUE(ExtractRawLinks("`[x](a.md)`\n").empty());
    EXPECT_TRUE(ExtractRawLinks("```\n[x](a.md)\n```\n").empty());
}

TEST(LinkExtractor, ExternalLinksAreExtractedForTheClassifierToReject)
{
    const auto links = ExtractRawLinks("[Ext](https://example.com) and [Mail](mailto:a@b.c)\n");
    ASSERT_EQ(links.size(), 2u);
    EXPECT_EQ(links[0].href, "https://example.com");
    EXPECT_EQ(links[1].href, "mailto:a@b.c");
}

TEST(LinkExtractor, EmptyDocument)
{
    EXPECT_TRUE(ExtractRawLinks("").empty());
}
