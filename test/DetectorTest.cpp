#include <gtest/gtest.h>
#include "BlockDetector.h"

using md_streamman::ElementType;
using md_streamman::ParserConfig;
using md_streamman::impl::BlockTypeDetector;
using mdsm_impl::Verdict;

TEST(BlockTypeDetector, PartialMarkersWaitForMoreInput) {
	BlockTypeDetector det{ ParserConfig{} };
	for (const char* partial : { "```lan", "``", "#", "-", "1.", "|a|", ">", "$$" }) {
		EXPECT_EQ(det.detect(partial, false).verdict, Verdict::NeedMoreInput) << partial;
	}
}

TEST(BlockTypeDetector, PartialPlainTextIsRejectedEarly) {
	BlockTypeDetector det{ ParserConfig{} };
	for (const char* partial : { "Hello", "#hashtag", "2024 was", "**bo" }) {
		EXPECT_EQ(det.detect(partial, false).verdict, Verdict::NoMatch) << partial;
	}
}

TEST(BlockTypeDetector, EndOfInputSettlesPartialLines) {
	BlockTypeDetector det{ ParserConfig{} };
	auto d = det.detect("## Done", true);
	ASSERT_EQ(d.verdict, Verdict::Matched);
	EXPECT_EQ(d.type, ElementType::Header);
	EXPECT_EQ(d.metadata["level"], 2);
	EXPECT_EQ(d.consumed, 3u);
}

TEST(BlockTypeDetector, FenceOpenerCarriesLanguage) {
	BlockTypeDetector det{ ParserConfig{} };
	auto d = det.detect("~~~~ rust extra\nfn main() {}\n", false);
	ASSERT_EQ(d.verdict, Verdict::Matched);
	EXPECT_EQ(d.type, ElementType::Code);
	EXPECT_EQ(d.metadata["language"], "rust");
	EXPECT_EQ(d.metadata["fenceChar"], "~");
	EXPECT_EQ(d.metadata["fenceLength"], 4);
	EXPECT_EQ(d.startMarker, "~~~~");
	EXPECT_EQ(d.consumed, 16u);
	ASSERT_TRUE(d.fence.has_value());

	auto bare = det.detect("```\n", false);
	ASSERT_EQ(bare.verdict, Verdict::Matched);
	EXPECT_FALSE(bare.metadata.contains("language"));
}

TEST(BlockTypeDetector, OrderedListMetadata) {
	BlockTypeDetector det{ ParserConfig{} };
	auto d = det.detect("    7. seventh\n", false);
	ASSERT_EQ(d.verdict, Verdict::Matched);
	EXPECT_EQ(d.type, ElementType::List);
	EXPECT_EQ(d.metadata["ordered"], true);
	EXPECT_EQ(d.metadata["start"], 7);
	EXPECT_EQ(d.metadata["level"], 3);
	EXPECT_EQ(d.startMarker, "7.");
}

TEST(BlockTypeDetector, ListOutranksRule) {
	BlockTypeDetector det{ ParserConfig{} };
	auto rule = det.detect("---\n", false);
	ASSERT_EQ(rule.verdict, Verdict::Matched);
	EXPECT_EQ(rule.type, ElementType::HorizontalRule);
	EXPECT_TRUE(rule.atomic);
	EXPECT_EQ(rule.content, "---");

	auto item = det.detect("- - -x\n", false);
	ASSERT_EQ(item.verdict, Verdict::Matched);
	EXPECT_EQ(item.type, ElementType::List);
}

TEST(BlockTypeDetector, TableNeedsSeparatorLine) {
	BlockTypeDetector det{ ParserConfig{} };
	auto waiting = det.detect("| a | b |\n|--", false);
	EXPECT_EQ(waiting.verdict, Verdict::NeedMoreInput);

	auto table = det.detect("| a | b |\n|:--|--:|\n", false);
	ASSERT_EQ(table.verdict, Verdict::Matched);
	EXPECT_EQ(table.type, ElementType::Table);
	EXPECT_EQ(table.metadata["columns"], 2);
	EXPECT_EQ(table.metadata["alignments"], nlohmann::json::array({ "left", "right" }));
	EXPECT_EQ(table.consumed, 20u);

	auto notTable = det.detect("| a | b |\nplain\n", false);
	EXPECT_EQ(notTable.verdict, Verdict::NoMatch);
}

TEST(BlockTypeDetector, CustomMatcherWinsPriorityTie) {
	ParserConfig cfg{};
	md_streamman::CustomMatcher note{};
	note.name = "note";
	note.priority = md_streamman::priority::Heading;
	note.pattern = "# NOTE: (.*)";
	cfg.customMatchers.push_back(note);
	BlockTypeDetector det{ cfg };

	auto d = det.detect("# NOTE: check this\n", false);
	ASSERT_EQ(d.verdict, Verdict::Matched);
	EXPECT_EQ(d.type, ElementType::Custom);
	EXPECT_EQ(d.content, "check this");
	EXPECT_EQ(d.metadata["matcher"], "note");

	auto plain = det.detect("# Other\n", false);
	ASSERT_EQ(plain.verdict, Verdict::Matched);
	EXPECT_EQ(plain.type, ElementType::Header);
}

TEST(BlockTypeDetector, LowPriorityCustomLosesToBuiltin) {
	ParserConfig cfg{};
	md_streamman::CustomMatcher dashes{};
	dashes.name = "dashes";
	dashes.priority = 100;
	dashes.pattern = "-+";
	cfg.customMatchers.push_back(dashes);
	BlockTypeDetector det{ cfg };

	auto d = det.detect("---\n", false);
	ASSERT_EQ(d.verdict, Verdict::Matched);
	EXPECT_EQ(d.type, ElementType::HorizontalRule);
}

TEST(BlockTypeDetector, CustomMetadataCallback) {
	ParserConfig cfg{};
	md_streamman::CustomMatcher todo{};
	todo.name = "todo";
	todo.priority = 900;
	todo.prefix = "TODO";
	todo.pattern = "TODO\\((\\w+)\\): (.*)";
	todo.metadata = [](const std::smatch& m) {
		return md_streamman::Metadata{ { "owner", m[1].str() } };
	};
	cfg.customMatchers.push_back(todo);
	BlockTypeDetector det{ cfg };

	EXPECT_EQ(det.detect("TOD", false).verdict, Verdict::NeedMoreInput);
	EXPECT_EQ(det.detect("Tea", false).verdict, Verdict::NoMatch);

	auto d = det.detect("TODO(ana): ship it\n", false);
	ASSERT_EQ(d.verdict, Verdict::Matched);
	EXPECT_EQ(d.metadata["owner"], "ana");
	EXPECT_EQ(d.content, "ana");
}

TEST(BlockTypeDetector, BadCustomPatternIsSkipped) {
	ParserConfig cfg{};
	md_streamman::CustomMatcher broken{};
	broken.name = "broken";
	broken.priority = 900;
	broken.pattern = "([unclosed";
	cfg.customMatchers.push_back(broken);
	BlockTypeDetector det{ cfg };
	EXPECT_EQ(det.matcherCount(), BlockTypeDetector{ ParserConfig{} }.matcherCount());
}

TEST(BlockTypeDetector, DisabledTypesNeverMatch) {
	ParserConfig cfg{};
	cfg.enabledElements = std::set<ElementType>{ ElementType::Text, ElementType::List };
	BlockTypeDetector det{ cfg };

	EXPECT_EQ(det.detect("# Title\n", false).verdict, Verdict::NoMatch);
	EXPECT_EQ(det.detect("```js\n", false).verdict, Verdict::NoMatch);
	EXPECT_EQ(det.detect("- item\n", false).type, ElementType::List);
}
