#include <map>
#include <set>
#include <sstream>
#include <gtest/gtest.h>
#include "TestHelpers.h"
#include "MDStreamImpl.h"

using namespace mdsm_test;
using md_streamman::ElementType;
using md_streamman::Parser;
using md_streamman::ParserConfig;

namespace {
	// Checks begin -> delta* -> end for every element and returns the
	// (type, finalContent) pairs in Begin order.
	auto checkLifecycle(const std::vector<ParseEvent>& events) -> std::vector<std::pair<ElementType, std::string>> {
		std::vector<std::pair<ElementType, std::string>> res{};
		std::map<std::string, size_t> slot{};
		std::map<std::string, std::string> streamed{};
		std::set<std::string> ended{};

		for (const auto& ev : events) {
			const std::string& id = md_streamman::eventElementId(ev);
			if (const auto* b = std::get_if<BeginEvent>(&ev)) {
				EXPECT_EQ(slot.count(id), 0u) << "second begin for " << id;
				slot[id] = res.size();
				res.emplace_back(b->elementType, std::string{});
				continue;
			}
			EXPECT_EQ(slot.count(id), 1u) << "event before begin for " << id;
			EXPECT_EQ(ended.count(id), 0u) << "event after end for " << id;
			if (const auto* d = std::get_if<DeltaEvent>(&ev)) {
				EXPECT_FALSE(d->content.empty()) << "empty delta for " << id;
				streamed[id].append(d->content);
			}
			else if (const auto* e = std::get_if<EndEvent>(&ev)) {
				EXPECT_EQ(streamed[id], e->finalContent) << "deltas disagree with end for " << id;
				ended.insert(id);
				if (slot.count(id) != 0) {
					res[slot[id]].second = e->finalContent;
				}
			}
		}
		EXPECT_EQ(ended.size(), slot.size()) << "some element never ended";
		return res;
	}

	const char* mixedDocument =
		"# Release notes\n"
		"\n"
		"Intro with **bold**, `code` and a [link](https://example.com).\n"
		"Second line of the intro.\n"
		"\n"
		"- first item\n"
		"2. second item\n"
		"> quoted\n"
		"> still quoted\n"
		"\n"
		"```cpp\n"
		"int main() { return 0; }\n"
		"```\n"
		"| k | v |\n"
		"|---|---|\n"
		"| a | 1 |\n"
		"\n"
		"$$\n"
		"a^2 + b^2\n"
		"$$\n"
		"***\n"
		"Trailing paragraph with ~~old~~ text";
}

TEST(StreamingParser, LifecycleHoldsAtEveryChunkSize) {
	auto reference = checkLifecycle(feed(mixedDocument, 0));
	ASSERT_FALSE(reference.empty());
	for (size_t chunk : { 1, 2, 3, 7, 13, 64 }) {
		EXPECT_EQ(checkLifecycle(feed(mixedDocument, chunk)), reference) << "chunk size " << chunk;
	}
}

TEST(StreamingParser, LifecycleHoldsWithSlicedDeltas) {
	ParserConfig cfg{};
	cfg.maxDeltaChunkSize = 3;
	auto reference = checkLifecycle(feed(mixedDocument, 0));
	EXPECT_EQ(checkLifecycle(feed(mixedDocument, 5, cfg)), reference);
}

TEST(StreamingParser, CodeFenceMetadata) {
	auto events = feed("```typescript\nconst x = 1;\n```\n");
	auto code = beginsOf(events, ElementType::Code);
	ASSERT_EQ(code.size(), 1u);
	EXPECT_EQ(code[0].metadata["language"], "typescript");
	EXPECT_EQ(code[0].metadata["fenceChar"], "`");
	EXPECT_EQ(code[0].metadata["fenceLength"], 3);
	EXPECT_EQ(finalContentOf(events, code[0].elementId), "const x = 1;");
}

TEST(StreamingParser, CodeContentKeepsIndentation) {
	auto events = feed("```\n  indented\n\n\tTab\n```\n", 2);
	auto code = beginsOf(events, ElementType::Code);
	ASSERT_EQ(code.size(), 1u);
	EXPECT_EQ(finalContentOf(events, code[0].elementId), "  indented\n\n\tTab");
}

TEST(StreamingParser, UnterminatedFenceClosesOnComplete) {
	Parser parser{};
	auto first = parser.processChunk("```python\nprint(1)").drain();
	EXPECT_TRUE(only<EndEvent>(first).empty());

	auto rest = parser.complete().drain();
	auto ends = only<EndEvent>(rest);
	ASSERT_EQ(ends.size(), 1u);
	EXPECT_EQ(ends[0].finalContent, "print(1)");
}

TEST(StreamingParser, OrderedListMetadata) {
	auto events = feed("3. third\n4. fourth\n", 1);
	auto items = beginsOf(events, ElementType::List);
	ASSERT_EQ(items.size(), 2u);
	EXPECT_EQ(items[0].metadata["ordered"], true);
	EXPECT_EQ(items[0].metadata["start"], 3);
	EXPECT_EQ(items[0].metadata["level"], 1);
	EXPECT_EQ(items[1].metadata["start"], 4);
	EXPECT_EQ(finalContentOf(events, items[0].elementId), "third");
	EXPECT_EQ(finalContentOf(events, items[1].elementId), "fourth");
}

TEST(StreamingParser, HeadingEndsWithItsLine) {
	Parser parser{};
	auto events = parser.processChunk("## Title\nmore").drain();
	auto heads = beginsOf(events, ElementType::Header);
	ASSERT_EQ(heads.size(), 1u);
	EXPECT_EQ(heads[0].metadata["level"], 2);
	EXPECT_EQ(finalContentOf(events, heads[0].elementId), "Title");
}

TEST(StreamingParser, TextStreamsBeforeLineEnds) {
	Parser parser{};
	auto events = parser.processChunk("Hello wor").drain();
	auto texts = beginsOf(events, ElementType::Text);
	ASSERT_EQ(texts.size(), 1u);
	auto deltas = deltasOf(events, texts[0].elementId);
	ASSERT_FALSE(deltas.empty());
	EXPECT_EQ(deltas.front().substr(0, 5), "Hello");
}

TEST(StreamingParser, CompleteIsIdempotent) {
	Parser parser{};
	parser.processChunk("some text").drain();
	auto first = parser.complete().drain();
	EXPECT_EQ(only<EndEvent>(first).size(), 1u);
	EXPECT_TRUE(parser.complete().drain().empty());
}

TEST(StreamingParser, ChunkAfterCompleteIsRejected) {
	Parser parser{};
	parser.processChunk("x").drain();
	parser.complete().drain();
	EXPECT_THROW(parser.processChunk("y"), md_streamman::UsageError);
}

TEST(StreamingParser, ResetStartsAFreshDocument) {
	Parser parser{};
	auto first = feed(parser, "# One\nleftover", 0);
	parser.reset();
	EXPECT_FALSE(parser.isStreaming());

	auto second = feed(parser, "plain\n", 0);
	auto begins = only<BeginEvent>(second);
	ASSERT_EQ(begins.size(), 1u);
	EXPECT_EQ(begins[0].elementType, ElementType::Text);
	EXPECT_EQ(begins[0].elementId, "md-1");
	EXPECT_EQ(finalContentOf(second, "md-1"), "plain");
}

TEST(StreamingParser, ResetMidStreamDropsOpenElements) {
	Parser parser{};
	parser.processChunk("```\nhalf a block").drain();
	parser.reset();
	auto events = feed(parser, "after\n", 0);
	EXPECT_TRUE(beginsOf(events, ElementType::Code).empty());
	auto texts = beginsOf(events, ElementType::Text);
	ASSERT_EQ(texts.size(), 1u);
	EXPECT_EQ(finalContentOf(events, texts[0].elementId), "after");
}

TEST(StreamingParser, StreamingFlag) {
	Parser parser{};
	EXPECT_FALSE(parser.isStreaming());
	parser.processChunk("a").drain();
	EXPECT_TRUE(parser.isStreaming());
	parser.complete().drain();
	EXPECT_FALSE(parser.isStreaming());
}

TEST(StreamingParser, ConfigMustKeepText) {
	ParserConfig cfg{};
	cfg.enabledElements = std::set<ElementType>{ ElementType::Header };
	EXPECT_THROW(Parser{ cfg }, md_streamman::ConfigError);

	ParserConfig tables{};
	tables.enabledElements = std::set<ElementType>{ ElementType::Text };
	tables.tableOutputMode = md_streamman::TableOutputMode::Structured;
	EXPECT_THROW(Parser{ tables }, md_streamman::ConfigError);
}

TEST(StreamingParser, DisabledTypesFallBackToText) {
	ParserConfig cfg{};
	cfg.enabledElements = std::set<ElementType>{ ElementType::Text };
	auto events = feed("# Title\n- item\n", 0, cfg);
	auto begins = only<BeginEvent>(events);
	ASSERT_EQ(begins.size(), 1u);
	EXPECT_EQ(begins[0].elementType, ElementType::Text);
	EXPECT_EQ(finalContentOf(events, begins[0].elementId), "# Title\n- item");
}

TEST(StreamingParser, OversizedUndecidedPrefixIsFlushed) {
	ParserConfig cfg{};
	cfg.maxBufferSize = 8;
	Parser parser{ cfg };
	auto events = parser.processChunk("| aaaaaaaaaaaa").drain();
	auto ends = only<EndEvent>(events);
	ASSERT_FALSE(ends.empty());
	EXPECT_EQ(ends[0].finalContent, "| aaaaaa");
}

TEST(StreamingParser, DeltaSlicingKeepsFinalContent) {
	ParserConfig cfg{};
	cfg.maxDeltaChunkSize = 2;
	auto events = feed("Hello w\xC3\xB6rld\n", 0, cfg);
	auto texts = beginsOf(events, ElementType::Text);
	ASSERT_EQ(texts.size(), 1u);
	std::string joined{};
	for (const auto& d : deltasOf(events, texts[0].elementId)) {
		EXPECT_LE(mdsm_impl::codepointCount(d), 2u);
		joined.append(d);
	}
	EXPECT_EQ(joined, "Hello w\xC3\xB6rld");
	EXPECT_EQ(finalContentOf(events, texts[0].elementId), joined);
}

TEST(StreamingParser, SplitUtf8SequenceIsNeverEmittedHalfway) {
	Parser parser{};
	std::vector<ParseEvent> events{};
	for (auto& ev : parser.processChunk("h\xC3").drain()) {
		events.push_back(ev);
	}
	for (auto& ev : parser.processChunk("\xA9llo\n").drain()) {
		events.push_back(ev);
	}
	for (auto& ev : parser.complete().drain()) {
		events.push_back(ev);
	}
	for (const auto& d : only<DeltaEvent>(events)) {
		ASSERT_FALSE(d.content.empty());
		EXPECT_NE(static_cast<unsigned char>(d.content.back()), 0xC3u);
		EXPECT_NE(static_cast<unsigned char>(d.content.front()), 0xA9u);
	}
	auto texts = beginsOf(events, ElementType::Text);
	ASSERT_EQ(texts.size(), 1u);
	EXPECT_EQ(finalContentOf(events, texts[0].elementId), "h\xC3\xA9llo");
}

TEST(StreamingParser, EmphasisStripAndPreserve) {
	auto stripped = feed("a **b** c\n");
	auto texts = beginsOf(stripped, ElementType::Text);
	auto strong = beginsOf(stripped, ElementType::Strong);
	ASSERT_EQ(texts.size(), 1u);
	ASSERT_EQ(strong.size(), 1u);
	EXPECT_EQ(finalContentOf(stripped, texts[0].elementId), "a b c");
	EXPECT_EQ(finalContentOf(stripped, strong[0].elementId), "b");
	EXPECT_EQ(strong[0].metadata["parentId"], texts[0].elementId);
	EXPECT_EQ(strong[0].metadata["start"], 2);
	EXPECT_EQ(strong[0].metadata["end"], 3);

	ParserConfig cfg{};
	cfg.inlineEmphasisMode = md_streamman::InlineEmphasisMode::Preserve;
	auto kept = feed("a **b** c\n", 1, cfg);
	texts = beginsOf(kept, ElementType::Text);
	strong = beginsOf(kept, ElementType::Strong);
	ASSERT_EQ(texts.size(), 1u);
	ASSERT_EQ(strong.size(), 1u);
	EXPECT_EQ(finalContentOf(kept, texts[0].elementId), "a **b** c");
	EXPECT_EQ(finalContentOf(kept, strong[0].elementId), "b");
	EXPECT_EQ(strong[0].metadata["start"], 2);
	EXPECT_EQ(strong[0].metadata["end"], 7);
}

TEST(StreamingParser, InlineCodeIsMarked) {
	auto events = feed("run `make` now\n", 3);
	auto code = beginsOf(events, ElementType::Code);
	ASSERT_EQ(code.size(), 1u);
	EXPECT_EQ(code[0].metadata["inline"], true);
	EXPECT_EQ(finalContentOf(events, code[0].elementId), "make");
}

TEST(StreamingParser, StructuredTable) {
	ParserConfig cfg{};
	cfg.tableOutputMode = md_streamman::TableOutputMode::Structured;
	for (size_t chunk : { 0, 4 }) {
		auto events = feed("| a | b |\n|---|:-:|\n| 1 | 2 |\n", chunk, cfg);
		std::vector<ElementType> order{};
		for (const auto& b : only<BeginEvent>(events)) {
			order.push_back(b.elementType);
		}
		const std::vector<ElementType> expected{
			ElementType::Table, ElementType::THead, ElementType::Row, ElementType::Col, ElementType::Col,
			ElementType::TBody, ElementType::Row, ElementType::Col, ElementType::Col };
		ASSERT_EQ(order, expected) << "chunk size " << chunk;

		auto table = beginsOf(events, ElementType::Table)[0];
		EXPECT_EQ(finalContentOf(events, table.elementId), "| a | b |\n|---|:-:|\n| 1 | 2 |");
		EXPECT_EQ(table.metadata["columns"], 2);

		auto rows = beginsOf(events, ElementType::Row);
		EXPECT_EQ(rows[0].metadata["index"], 0);
		EXPECT_EQ(rows[1].metadata["index"], 1);
		EXPECT_EQ(finalContentOf(events, rows[1].elementId), "1 | 2");

		auto cols = beginsOf(events, ElementType::Col);
		EXPECT_TRUE(cols[0].metadata["alignment"].is_null());
		EXPECT_EQ(cols[1].metadata["alignment"], "center");
		EXPECT_EQ(cols[1].metadata["parentId"], rows[0].elementId);
		EXPECT_EQ(finalContentOf(events, cols[3].elementId), "2");
	}
}

TEST(StreamingParser, TextTableHasNoChildren) {
	auto events = feed("| a |\n|---|\n| 1 |\n");
	EXPECT_EQ(only<BeginEvent>(events).size(), 1u);
	EXPECT_TRUE(beginsOf(events, ElementType::Row).empty());
}

TEST(StreamingParser, ParagraphSplitting) {
	auto split = feed("one\n\ntwo\n");
	EXPECT_EQ(beginsOf(split, ElementType::Text).size(), 2u);

	ParserConfig cfg{};
	cfg.splitParagraphs = false;
	auto joined = feed("one\n\ntwo\n", 1, cfg);
	auto texts = beginsOf(joined, ElementType::Text);
	ASSERT_EQ(texts.size(), 1u);
	EXPECT_EQ(finalContentOf(joined, texts[0].elementId), "one\n\ntwo");
}

TEST(StreamingParser, PreserveWhitespace) {
	auto trimmed = feed("  indented  \n");
	EXPECT_EQ(only<EndEvent>(trimmed).at(0).finalContent, "indented");

	ParserConfig cfg{};
	cfg.preserveWhitespace = true;
	auto kept = feed("  indented  \n", 0, cfg);
	EXPECT_EQ(only<EndEvent>(kept).at(0).finalContent, "  indented  ");
}

TEST(StreamingParser, IdPrefixAndGenerator) {
	ParserConfig prefixed{};
	prefixed.idPrefix = "blk";
	auto events = feed("# A\n\ntext\n", 0, prefixed);
	auto begins = only<BeginEvent>(events);
	ASSERT_EQ(begins.size(), 2u);
	EXPECT_EQ(begins[0].elementId, "blk-1");
	EXPECT_EQ(begins[1].elementId, "blk-2");

	ParserConfig generated{};
	generated.idGenerator = [](ElementType type, md_streamman::ElementSerial n) {
		return std::string{ md_streamman::toString(type) } + "#" + std::to_string(n);
	};
	events = feed("# A\n\ntext\n", 0, generated);
	begins = only<BeginEvent>(events);
	ASSERT_EQ(begins.size(), 2u);
	EXPECT_EQ(begins[0].elementId, "header#1");
	EXPECT_EQ(begins[1].elementId, "text#2");
}

TEST(StreamingParser, CustomMatcherBlock) {
	ParserConfig cfg{};
	md_streamman::CustomMatcher note{};
	note.name = "note";
	note.priority = 800;
	note.prefix = "NOTE:";
	note.pattern = "NOTE: (.*)";
	cfg.customMatchers.push_back(note);
	auto events = feed("NOTE: check this\nplain\n", 2, cfg);
	auto custom = beginsOf(events, ElementType::Custom);
	ASSERT_EQ(custom.size(), 1u);
	EXPECT_EQ(custom[0].metadata["matcher"], "note");
	EXPECT_EQ(finalContentOf(events, custom[0].elementId), "check this");
	auto texts = beginsOf(events, ElementType::Text);
	ASSERT_EQ(texts.size(), 1u);
	EXPECT_EQ(finalContentOf(events, texts[0].elementId), "plain");
}

TEST(StreamingParser, EventStreamIteration) {
	Parser parser{};
	std::vector<ParseEvent> seen{};
	for (const auto& ev : parser.processChunk("# Hi\n")) {
		seen.push_back(ev);
	}
	ASSERT_GE(seen.size(), 3u);
	EXPECT_TRUE(std::holds_alternative<BeginEvent>(seen.front()));
	EXPECT_TRUE(std::holds_alternative<EndEvent>(seen.back()));
	EXPECT_EQ(std::get<EndEvent>(seen.back()).finalContent, "Hi");
}

TEST(StreamingParser, ParseMatchesStreaming) {
	Parser whole{};
	auto once = whole.parse(mixedDocument);
	EXPECT_EQ(checkLifecycle(once), checkLifecycle(feed(mixedDocument, 9)));
}

TEST(StreamingParser, FactoryAppliesConfig) {
	ParserConfig cfg{};
	cfg.idPrefix = "f";
	auto parser = md_streamman::createStreamingMarkdownParser(cfg);
	EXPECT_EQ(parser.config().idPrefix, "f");
	auto events = parser.parse("x");
	EXPECT_EQ(md_streamman::eventElementId(events.front()), "f-1");
}

TEST(StreamingParser, ConfigOnMovedFromParserThrows) {
	Parser parser{};
	Parser taken{ std::move(parser) };
	EXPECT_EQ(taken.config().idPrefix, ParserConfig{}.idPrefix);
	EXPECT_THROW(parser.config(), md_streamman::UsageError);
	EXPECT_FALSE(parser.isStreaming());
}

TEST(StreamingParser, ProcessStreamMatchesChunkedFeed) {
	auto reference = feed(mixedDocument, 4);
	for (size_t chunk : { 0, 4, 11 }) {
		std::istringstream in{ mixedDocument };
		Parser parser{};
		auto streamed = parser.processStream(in, chunk);
		EXPECT_EQ(checkLifecycle(streamed), checkLifecycle(reference)) << "chunk size " << chunk;
	}

	std::istringstream in{ mixedDocument };
	Parser parser{};
	std::vector<ParseEvent> sunk{};
	EXPECT_TRUE(parser.processStream(in, 4, [&sunk](const ParseEvent& ev) { sunk.push_back(ev); }));
	EXPECT_EQ(sunk.size(), reference.size());
	EXPECT_FALSE(parser.isStreaming());
	EXPECT_THROW(parser.processChunk("more"), md_streamman::UsageError);
}

TEST(StreamingParser, EmptyFenceClosesOnComplete) {
	Parser parser{};
	auto first = parser.processChunk("```js\n").drain();
	auto code = beginsOf(first, ElementType::Code);
	ASSERT_EQ(code.size(), 1u);
	EXPECT_EQ(code[0].metadata["language"], "js");
	EXPECT_TRUE(only<EndEvent>(first).empty());

	auto rest = parser.complete().drain();
	auto ends = only<EndEvent>(rest);
	ASSERT_EQ(ends.size(), 1u);
	EXPECT_EQ(ends[0].elementId, code[0].elementId);
	EXPECT_EQ(ends[0].finalContent, "");
	EXPECT_TRUE(deltasOf(rest, code[0].elementId).empty());
}

TEST(StreamingParser, OversizedFenceCandidateBecomesContent) {
	ParserConfig cfg{};
	cfg.maxBufferSize = 4;
	Parser parser{ cfg };
	auto first = parser.processChunk("```\n``````").drain();
	auto code = beginsOf(first, ElementType::Code);
	ASSERT_EQ(code.size(), 1u);
	auto early = deltasOf(first, code[0].elementId);
	ASSERT_EQ(early.size(), 1u);
	EXPECT_EQ(early[0], "``````");

	auto events = first;
	for (auto& ev : parser.processChunk("\nrest\n```\n").drain()) {
		events.push_back(std::move(ev));
	}
	for (auto& ev : parser.complete().drain()) {
		events.push_back(std::move(ev));
	}
	auto blocks = checkLifecycle(events);
	ASSERT_EQ(blocks.size(), 1u);
	EXPECT_EQ(blocks[0].first, ElementType::Code);
	EXPECT_EQ(blocks[0].second, "``````\nrest");
}

TEST(StreamingParser, OversizedLineIsCommittedEarly) {
	ParserConfig cfg{};
	cfg.maxBufferSize = 8;
	Parser parser{ cfg };
	const std::string tail = "*" + std::string(16, 'a');
	auto events = parser.processChunk("Intro " + tail).drain();
	auto texts = beginsOf(events, ElementType::Text);
	ASSERT_EQ(texts.size(), 1u);
	std::string streamed{};
	for (const auto& d : deltasOf(events, texts[0].elementId)) {
		streamed.append(d);
	}
	EXPECT_EQ(streamed, "Intro " + tail);
	EXPECT_TRUE(only<EndEvent>(events).empty());

	for (auto& ev : parser.complete().drain()) {
		events.push_back(std::move(ev));
	}
	auto blocks = checkLifecycle(events);
	ASSERT_EQ(blocks.size(), 1u);
	EXPECT_EQ(blocks[0].second, "Intro " + tail);
}

TEST(StreamingParser, CollidingGeneratedIdsStayUnique) {
	ParserConfig cfg{};
	cfg.idGenerator = [](ElementType, md_streamman::ElementSerial) {
		return std::string{ "same" };
	};
	auto events = feed("# A\n\ntext\n- item\n***\n", 1, cfg);
	auto begins = only<BeginEvent>(events);
	ASSERT_EQ(begins.size(), 4u);
	EXPECT_EQ(begins[0].elementId, "same");
	std::set<std::string> ids{};
	for (const auto& b : begins) {
		EXPECT_TRUE(ids.insert(b.elementId).second) << "duplicate id " << b.elementId;
	}
	checkLifecycle(events);
}

TEST(StreamingParser, InlineMath) {
	auto events = feed("Euler: $e^{i\\pi}+1=0$ and $$5 stays\n", 1);
	auto texts = beginsOf(events, ElementType::Text);
	ASSERT_EQ(texts.size(), 1u);
	EXPECT_EQ(finalContentOf(events, texts[0].elementId), "Euler: e^{i\\pi}+1=0 and $$5 stays");

	auto math = beginsOf(events, ElementType::Math);
	ASSERT_EQ(math.size(), 1u);
	EXPECT_EQ(math[0].metadata["inline"], true);
	EXPECT_EQ(math[0].metadata["parentId"], texts[0].elementId);
	EXPECT_EQ(math[0].metadata["start"], 7);
	EXPECT_EQ(finalContentOf(events, math[0].elementId), "e^{i\\pi}+1=0");

	auto block = beginsOf(feed("$$\nx\n$$\n"), ElementType::Math);
	ASSERT_EQ(block.size(), 1u);
	EXPECT_EQ(block[0].metadata["inline"], false);

	ParserConfig noMath{};
	noMath.enabledElements = std::set<ElementType>{ ElementType::Text };
	auto plain = feed("cost $x$\n", 0, noMath);
	EXPECT_TRUE(beginsOf(plain, ElementType::Math).empty());
	EXPECT_EQ(only<EndEvent>(plain).at(0).finalContent, "cost $x$");
}

TEST(StreamingParser, HeadingClosingSequenceIsDropped) {
	EXPECT_EQ(mdsm_impl::atxContentLength("Title ##"), 5u);
	EXPECT_EQ(mdsm_impl::atxContentLength("Title #  "), 5u);
	EXPECT_EQ(mdsm_impl::atxContentLength("C#"), 2u);
	EXPECT_EQ(mdsm_impl::atxContentLength("##"), 0u);
	EXPECT_EQ(mdsm_impl::atxContentLength("plain"), 5u);

	for (size_t chunk : { 0, 1, 3 }) {
		auto events = feed("# Title #\n## C# tips\n### Done ###   \n", chunk);
		auto heads = beginsOf(events, ElementType::Header);
		ASSERT_EQ(heads.size(), 3u);
		EXPECT_EQ(finalContentOf(events, heads[0].elementId), "Title") << "chunk size " << chunk;
		EXPECT_EQ(finalContentOf(events, heads[1].elementId), "C# tips") << "chunk size " << chunk;
		EXPECT_EQ(finalContentOf(events, heads[2].elementId), "Done") << "chunk size " << chunk;
		checkLifecycle(events);
	}
}
