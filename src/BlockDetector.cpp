/*
MIT License

Copyright (c) 2020 Christian Greyeyes

Permission is hereby granted, free of charge, to any person obtaining a copy
of this software and associated documentation files (the "Software"), to deal
in the Software without restriction, including without limitation the rights
to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
copies of the Software, and to permit persons to whom the Software is
furnished to do so, subject to the following conditions:

The above copyright notice and this permission notice shall be included in all
copies or substantial portions of the Software.

THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
SOFTWARE.
*/

#include <algorithm>
#include <spdlog/spdlog.h>
#include "BlockDetector.h"

using mdsm_impl::Verdict;

namespace {
	md_streamman::impl::Detection verdictOnly(Verdict v) {
		return { v, md_streamman::ElementType::Text, {}, {}, md_streamman::Metadata::object(), 0, false, {}, std::nullopt, std::nullopt };
	}
}

auto md_streamman::impl::alignmentName(ColumnAlignment a) -> nlohmann::json {
	switch (a) {
	case ColumnAlignment::Left:
		return "left";
	case ColumnAlignment::Center:
		return "center";
	case ColumnAlignment::Right:
		return "right";
	case ColumnAlignment::None:
		break;
	}
	return nullptr;
}

md_streamman::impl::BlockTypeDetector::BlockTypeDetector(const ParserConfig& config) {
	for (const auto& cm : config.customMatchers) {
		if (!config.isEnabled(cm.elementType)) {
			continue;
		}
		try {
			table_.push_back({ cm.priority, CompiledMatcher{ cm.name, std::regex{ cm.pattern, std::regex::ECMAScript }, cm.prefix, cm.elementType, cm.metadata } });
		}
		catch (const std::regex_error& e) {
			spdlog::warn("custom matcher '{}' ignored: bad pattern ({})", cm.name, e.what());
		}
	}

	auto addBuiltin = [&](ElementType type, builtin_e kind, Int prio) {
		if (config.isEnabled(type)) {
			table_.push_back({ prio, kind });
		}
	};
	addBuiltin(ElementType::Code, builtin_e::CodeFence, priority::CodeFence);
	addBuiltin(ElementType::Math, builtin_e::MathBlock, priority::MathBlock);
	addBuiltin(ElementType::Header, builtin_e::Heading, priority::Heading);
	addBuiltin(ElementType::List, builtin_e::List, priority::List);
	addBuiltin(ElementType::Quote, builtin_e::BlockQuote, priority::BlockQuote);
	addBuiltin(ElementType::Table, builtin_e::Table, priority::Table);
	addBuiltin(ElementType::HorizontalRule, builtin_e::HorizontalRule, priority::HorizontalRule);

	// customs were pushed first, so they keep precedence on equal priority
	std::stable_sort(table_.begin(), table_.end(), [](const MatcherDescriptor& a, const MatcherDescriptor& b) {
		return a.priority > b.priority;
	});
}

auto md_streamman::impl::BlockTypeDetector::detect(std::string_view unconsumed, bool endOfInput) const -> Detection {
	mdsm_impl::LineWindow win{ unconsumed, endOfInput };
	for (const auto& desc : table_) {
		Detection d = std::holds_alternative<builtin_e>(desc.matcher)
			? runBuiltin(std::get<builtin_e>(desc.matcher), win)
			: runCustom(std::get<CompiledMatcher>(desc.matcher), win);
		// a matcher still waiting for input blocks every lower one
		if (d.verdict != Verdict::NoMatch) {
			return d;
		}
	}
	return verdictOnly(Verdict::NoMatch);
}

auto md_streamman::impl::BlockTypeDetector::runBuiltin(builtin_e kind, const mdsm_impl::LineWindow& win) const -> Detection {
	const mdsm_impl::LineView line = *win.line(0);
	Detection d = verdictOnly(Verdict::NoMatch);

	switch (kind) {
	case builtin_e::CodeFence: {
		auto [v, fence] = mdsm_impl::tryFencedCodeOpener(line);
		if (v != Verdict::Matched) {
			return verdictOnly(v);
		}
		d.verdict = v;
		d.type = ElementType::Code;
		d.startMarker.assign(static_cast<size_t>(fence.length), static_cast<char>(fence.type));
		d.endMarker = d.startMarker;
		if (!fence.language.empty()) {
			d.metadata["language"] = fence.language;
		}
		d.metadata["fenceChar"] = std::string(1, static_cast<char>(fence.type));
		d.metadata["fenceLength"] = fence.length;
		d.consumed = win.lineEnd(0);
		d.fence = std::move(fence);
		return d;
	}
	case builtin_e::MathBlock: {
		auto [v, fence] = mdsm_impl::tryMathOpener(line);
		if (v != Verdict::Matched) {
			return verdictOnly(v);
		}
		d.verdict = v;
		d.type = ElementType::Math;
		d.startMarker = "$$";
		d.endMarker = "$$";
		d.metadata["display"] = true;
		d.metadata["inline"] = false;
		d.consumed = win.lineEnd(0);
		d.fence = std::move(fence);
		return d;
	}
	case builtin_e::Heading: {
		auto [v, info, len] = mdsm_impl::tryATXHeading(line);
		if (v != Verdict::Matched) {
			return verdictOnly(v);
		}
		d.verdict = v;
		d.type = ElementType::Header;
		d.startMarker.assign(info.lvl, '#');
		d.metadata["level"] = info.lvl;
		d.consumed = len;
		return d;
	}
	case builtin_e::List: {
		auto [v, info, len] = mdsm_impl::tryListItem(line);
		if (v != Verdict::Matched) {
			return verdictOnly(v);
		}
		d.verdict = v;
		d.type = ElementType::List;
		d.startMarker = std::string{ mdsm_impl::trimView(line.text.substr(0, len)) };
		d.metadata["ordered"] = info.ordered;
		d.metadata["level"] = info.indentWidth / 2 + 1;
		if (info.ordered) {
			d.metadata["start"] = info.orderedStart;
		}
		d.consumed = len;
		return d;
	}
	case builtin_e::BlockQuote: {
		auto [v, len] = mdsm_impl::tryBlockQuote(line);
		if (v != Verdict::Matched) {
			return verdictOnly(v);
		}
		d.verdict = v;
		d.type = ElementType::Quote;
		d.startMarker = ">";
		d.consumed = len;
		return d;
	}
	case builtin_e::Table: {
		auto [v, info] = mdsm_impl::tryTableStart(win);
		if (v != Verdict::Matched) {
			return verdictOnly(v);
		}
		d.verdict = v;
		d.type = ElementType::Table;
		d.startMarker = "|";
		auto aligns = nlohmann::json::array();
		for (auto a : info.alignments) {
			aligns.push_back(alignmentName(a));
		}
		d.metadata["alignments"] = std::move(aligns);
		d.metadata["columns"] = info.headerCells.size();
		d.consumed = win.lineEnd(1);
		d.table = std::move(info);
		return d;
	}
	case builtin_e::HorizontalRule: {
		auto [v, run] = mdsm_impl::tryThematicBreak(line);
		if (v != Verdict::Matched) {
			return verdictOnly(v);
		}
		d.verdict = v;
		d.type = ElementType::HorizontalRule;
		d.startMarker = std::string{ run };
		d.content = std::string{ run };
		d.consumed = win.lineEnd(0);
		d.atomic = true;
		return d;
	}
	}
	return d;
}

auto md_streamman::impl::BlockTypeDetector::runCustom(const CompiledMatcher& m, const mdsm_impl::LineWindow& win) const -> Detection {
	const mdsm_impl::LineView line = *win.line(0);
	if (!m.prefix.empty()) {
		size_t n = std::min(m.prefix.size(), line.text.size());
		if (line.text.compare(0, n, m.prefix, 0, n) != 0) {
			return verdictOnly(Verdict::NoMatch);
		}
		if (line.text.size() < m.prefix.size()) {
			return verdictOnly(line.complete ? Verdict::NoMatch : Verdict::NeedMoreInput);
		}
	}
	if (!line.complete) {
		return verdictOnly(Verdict::NeedMoreInput);
	}

	std::string text{ line.text };
	std::smatch match{};
	if (!std::regex_match(text, match, m.pattern)) {
		return verdictOnly(Verdict::NoMatch);
	}
	Detection d = verdictOnly(Verdict::Matched);
	d.type = m.type;
	d.startMarker = m.prefix;
	d.metadata["matcher"] = m.name;
	if (m.metadata) {
		Metadata extra = m.metadata(match);
		if (extra.is_object()) {
			d.metadata.update(extra);
		}
	}
	d.content = match.size() > 1 and match[1].matched ? match[1].str() : match[0].str();
	d.consumed = win.lineEnd(0);
	d.atomic = true;
	return d;
}
