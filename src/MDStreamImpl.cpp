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

#include <string>
#include <tuple>
#include <cctype>
#include <cstdint>
#include <charconv>
#include <algorithm>
#include "MDStreamImpl.h"

#include "tao/pegtl.hpp"

namespace {
	using mem_input = TAO_PEGTL_NAMESPACE::memory_input<TAO_PEGTL_NAMESPACE::tracking_mode::eager>;

	inline size_t consumedBy(const mem_input& in, std::string_view src) noexcept {
		return static_cast<size_t>(in.current() - src.data());
	}
}

mdsm_impl::LineWindow::LineWindow(std::string_view avail, bool endOfInput) noexcept
	: avail_{ avail }, endOfInput_{ endOfInput }, slots_{}, count_{ 0 } {
	size_t pos = 0;
	for (size_t k = 0; k < 2; ++k) {
		size_t nl = avail.find('\n', pos);
		std::string_view text{};
		bool terminated = nl != std::string_view::npos;
		if (terminated) {
			text = avail.substr(pos, nl - pos);
		}
		else {
			text = avail.substr(pos);
		}
		if (!text.empty() and text.back() == '\r') {
			text.remove_suffix(1);
		}
		slots_[k] = { { text, terminated or endOfInput }, terminated ? nl + 1 : avail.size() };
		++count_;
		if (!terminated) {
			break;
		}
		pos = nl + 1;
	}
}

auto mdsm_impl::LineWindow::line(size_t i) const noexcept -> std::optional<LineView> {
	if (i >= count_) {
		return std::nullopt;
	}
	return slots_[i].view;
}

size_t mdsm_impl::LineWindow::lineEnd(size_t i) const noexcept {
	return i < count_ ? slots_[i].end : avail_.size();
}

namespace mdlang {
	using namespace TAO_PEGTL_NAMESPACE;

	struct whitespace0 : one<' ', '\t'> {};
	struct indent0_3 : rep_max<3, one<' '>> {};
	struct blank_line : seq<star<whitespace0>, eof> {};
}

auto mdsm_impl::tryBlankLine(const LineView& line) noexcept -> Verdict {
	mem_input in{ line.text.data(), line.text.data() + line.text.size(), "blank" };
	if (!mdlang::parse<mdlang::blank_line>(in)) {
		return Verdict::NoMatch;
	}
	return line.complete ? Verdict::Matched : Verdict::NeedMoreInput;
}

namespace mdlang {
	using namespace TAO_PEGTL_NAMESPACE;

	template<char C>
	struct fence_run : seq<one<C>, one<C>, plus<one<C>>> {};
	struct fence_info_backtick : star<not_one<'`'>> {};
	struct fence_info_tilde : star<any> {};
	struct fence_opener : seq<indent0_3, sor<seq<fence_run<'`'>, fence_info_backtick>, seq<fence_run<'~'>, fence_info_tilde>>, eof> {};
	struct fence_opener_partial : seq<indent0_3, sor<seq<rep_max<2, one<'`'>>, eof>, seq<rep_max<2, one<'~'>>, eof>>> {};

	struct math_opener : seq<indent0_3, two<'$'>, star<whitespace0>, eof> {};
	struct math_opener_partial : seq<indent0_3, rep_max<2, one<'$'>>, star<whitespace0>, eof> {};

	template<char C>
	struct closer_run : plus<one<C>> {};
	template<char C>
	struct fence_closer : seq<indent0_3, closer_run<C>, star<whitespace0>, eof> {};
	template<char C>
	struct fence_closer_partial : seq<indent0_3, star<one<C>>, star<whitespace0>, eof> {};

	inline void takeLanguage(std::string_view info, FenceInfo& fence) {
		size_t b = info.find_first_not_of(" \t");
		if (b == std::string_view::npos) {
			return;
		}
		size_t e = info.find_first_of(" \t", b);
		fence.language = std::string{ info.substr(b, e == std::string_view::npos ? std::string_view::npos : e - b) };
	}

	template <typename Rule>
	struct fence_action : nothing<Rule> {};

	template <>
	struct fence_action<indent0_3> {
		template <typename ActionInput>
		static void apply(const ActionInput& in, FenceInfo& fence) noexcept {
			fence.indent = static_cast<md_streamman::TinyInt>(in.size());
		}
	};
	template <char C>
	struct fence_action<fence_run<C>> {
		template <typename ActionInput>
		static void apply(const ActionInput& in, FenceInfo& fence) noexcept {
			fence.length = static_cast<md_streamman::Int>(in.size());
			fence.type = static_cast<FenceInfo::symbol_e>(C);
		}
	};
	template <>
	struct fence_action<fence_info_backtick> {
		template <typename ActionInput>
		static void apply(const ActionInput& in, FenceInfo& fence) {
			takeLanguage(in.string_view(), fence);
		}
	};
	template <>
	struct fence_action<fence_info_tilde> {
		template <typename ActionInput>
		static void apply(const ActionInput& in, FenceInfo& fence) {
			takeLanguage(in.string_view(), fence);
		}
	};

	template <typename Rule>
	struct closer_action : nothing<Rule> {};
	template <char C>
	struct closer_action<closer_run<C>> {
		template <typename ActionInput>
		static void apply(const ActionInput& in, md_streamman::Int& run) noexcept {
			run = static_cast<md_streamman::Int>(in.size());
		}
	};

	template <char C>
	auto closeFence(const mdsm_impl::LineView& line, md_streamman::Int minLength) noexcept -> mdsm_impl::Verdict {
		using mdsm_impl::Verdict;
		mem_input in{ line.text.data(), line.text.data() + line.text.size(), "fence" };
		if (!line.complete) {
			return parse<fence_closer_partial<C>>(in) ? Verdict::NeedMoreInput : Verdict::NoMatch;
		}
		md_streamman::Int run = 0;
		if (parse<fence_closer<C>, closer_action>(in, run) and run >= minLength) {
			return Verdict::Matched;
		}
		return Verdict::NoMatch;
	}
}

auto mdsm_impl::tryFencedCodeOpener(const LineView& line) -> std::pair<Verdict, FenceInfo> {
	FenceInfo fence{ 0, FenceInfo::symbol_e::BackTick, 0, {} };
	mem_input in{ line.text.data(), line.text.data() + line.text.size(), "fence" };
	if (mdlang::parse<mdlang::fence_opener, mdlang::fence_action>(in, fence)) {
		// the info string is only final once the line is
		return { line.complete ? Verdict::Matched : Verdict::NeedMoreInput, fence };
	}
	if (line.complete) {
		return { Verdict::NoMatch, fence };
	}
	mem_input partial{ line.text.data(), line.text.data() + line.text.size(), "fence" };
	if (mdlang::parse<mdlang::fence_opener_partial>(partial)) {
		return { Verdict::NeedMoreInput, fence };
	}
	return { Verdict::NoMatch, fence };
}

auto mdsm_impl::tryMathOpener(const LineView& line) -> std::pair<Verdict, FenceInfo> {
	FenceInfo fence{ 2, FenceInfo::symbol_e::Dollar, 0, {} };
	mem_input in{ line.text.data(), line.text.data() + line.text.size(), "math" };
	if (!line.complete) {
		return { mdlang::parse<mdlang::math_opener_partial>(in) ? Verdict::NeedMoreInput : Verdict::NoMatch, fence };
	}
	return { mdlang::parse<mdlang::math_opener>(in) ? Verdict::Matched : Verdict::NoMatch, fence };
}

auto mdsm_impl::tryFenceCloser(const LineView& line, const FenceInfo& opener) noexcept -> Verdict {
	switch (opener.type) {
	case FenceInfo::symbol_e::BackTick:
		return mdlang::closeFence<'`'>(line, opener.length);
	case FenceInfo::symbol_e::Tilde:
		return mdlang::closeFence<'~'>(line, opener.length);
	case FenceInfo::symbol_e::Dollar:
		return mdlang::closeFence<'$'>(line, opener.length);
	}
	return Verdict::NoMatch;
}

namespace mdlang {
	using namespace TAO_PEGTL_NAMESPACE;

	struct atx_grammar_prefix : rep_min_max<1, 6, one<'#'>> {};
	struct atx_open : seq<indent0_3, atx_grammar_prefix, plus<whitespace0>> {};
	struct atx_empty : seq<indent0_3, atx_grammar_prefix, eof> {};

	template <typename Rule>
	struct atx_header_action : nothing<Rule> {};

	template <>
	struct atx_header_action<atx_grammar_prefix> {
		template <typename ActionInput>
		static void apply(const ActionInput& in, HeadingInfo& info) noexcept {
			info.lvl = static_cast<md_streamman::UTinyInt>(in.size());
		}
	};
}

auto mdsm_impl::tryATXHeading(const LineView& line) noexcept -> std::tuple<Verdict, HeadingInfo, size_t> {
	HeadingInfo info{ 0 };
	mem_input in{ line.text.data(), line.text.data() + line.text.size(), "atx" };
	if (mdlang::parse<mdlang::atx_open, mdlang::atx_header_action>(in, info)) {
		size_t len = consumedBy(in, line.text);
		// more blanks may follow on a partial line
		if (len == line.text.size() and !line.complete) {
			return { Verdict::NeedMoreInput, info, 0 };
		}
		return { Verdict::Matched, info, len };
	}
	info.lvl = 0;
	mem_input empty{ line.text.data(), line.text.data() + line.text.size(), "atx" };
	if (mdlang::parse<mdlang::atx_empty, mdlang::atx_header_action>(empty, info)) {
		if (!line.complete) {
			return { Verdict::NeedMoreInput, info, 0 };
		}
		return { Verdict::Matched, info, line.text.size() };
	}
	return { Verdict::NoMatch, info, 0 };
}

namespace mdlang {
	using namespace TAO_PEGTL_NAMESPACE;

	struct list_indent : star<whitespace0> {};
	struct list_bullet : one<'-', '*', '+'> {};
	struct list_ordinal : rep_min_max<1, 9, digit> {};
	struct list_marker : seq<list_indent, sor<list_bullet, seq<list_ordinal, one<'.'>>>> {};
	struct list_open : seq<list_marker, plus<whitespace0>> {};
	struct list_empty : seq<list_marker, eof> {};
	struct list_partial : seq<list_indent, opt<list_ordinal>, eof> {};

	template <typename Rule>
	struct list_action : nothing<Rule> {};

	template <>
	struct list_action<list_indent> {
		template <typename ActionInput>
		static void apply(const ActionInput& in, ListMarkerInfo& info) noexcept {
			md_streamman::UInt width = 0;
			for (char c : in.string_view()) {
				width += c == '\t' ? 4 : 1;
			}
			info.indentWidth = width;
		}
	};
	template <>
	struct list_action<list_bullet> {
		template <typename ActionInput>
		static void apply(const ActionInput& in, ListMarkerInfo& info) noexcept {
			info.symbolUsed = static_cast<ListMarkerInfo::symbol_e>(in.peek_char());
			info.ordered = false;
		}
	};
	template <>
	struct list_action<list_ordinal> {
		template <typename ActionInput>
		static void apply(const ActionInput& in, ListMarkerInfo& info) noexcept {
			auto sv = in.string_view();
			md_streamman::Int start = 0;
			std::from_chars(sv.data(), sv.data() + sv.size(), start);
			info.orderedStart = start;
			info.symbolUsed = ListMarkerInfo::symbol_e::dot;
			info.ordered = true;
		}
	};
}

auto mdsm_impl::tryListItem(const LineView& line) noexcept -> std::tuple<Verdict, ListMarkerInfo, size_t> {
	const ListMarkerInfo blank{ ListMarkerInfo::symbol_e::dash, false, 0, 0 };
	ListMarkerInfo info = blank;
	mem_input in{ line.text.data(), line.text.data() + line.text.size(), "list" };
	if (mdlang::parse<mdlang::list_open, mdlang::list_action>(in, info)) {
		size_t len = consumedBy(in, line.text);
		if (len == line.text.size() and !line.complete) {
			return { Verdict::NeedMoreInput, info, 0 };
		}
		return { Verdict::Matched, info, len };
	}
	info = blank;
	mem_input empty{ line.text.data(), line.text.data() + line.text.size(), "list" };
	if (mdlang::parse<mdlang::list_empty, mdlang::list_action>(empty, info)) {
		if (!line.complete) {
			return { Verdict::NeedMoreInput, info, 0 };
		}
		return { Verdict::Matched, info, line.text.size() };
	}
	info = blank;
	if (!line.complete) {
		mem_input partial{ line.text.data(), line.text.data() + line.text.size(), "list" };
		if (mdlang::parse<mdlang::list_partial>(partial)) {
			return { Verdict::NeedMoreInput, info, 0 };
		}
	}
	return { Verdict::NoMatch, info, 0 };
}

namespace mdlang {
	using namespace TAO_PEGTL_NAMESPACE;

	struct quote_open : seq<indent0_3, one<'>'>, opt<whitespace0>> {};
}

auto mdsm_impl::tryBlockQuote(const LineView& line) noexcept -> std::pair<Verdict, size_t> {
	mem_input in{ line.text.data(), line.text.data() + line.text.size(), "quote" };
	if (!mdlang::parse<mdlang::quote_open>(in)) {
		return { Verdict::NoMatch, 0 };
	}
	size_t len = consumedBy(in, line.text);
	if (len == line.text.size() and !line.complete) {
		return { Verdict::NeedMoreInput, 0 };
	}
	return { Verdict::Matched, len };
}

namespace mdlang {
	using namespace TAO_PEGTL_NAMESPACE;

	struct thematic_break_run : sor<rep_min<3, one<'-'>>, rep_min<3, one<'_'>>, rep_min<3, one<'*'>>> {};
	struct thematic_break_rule : seq<indent0_3, thematic_break_run, star<whitespace0>, eof> {};
	struct thematic_break_partial : seq<indent0_3, sor<plus<one<'-'>>, plus<one<'_'>>, plus<one<'*'>>>, star<whitespace0>, eof> {};

	template <typename Rule>
	struct thematic_break_action : nothing<Rule> {};
	template <>
	struct thematic_break_action<thematic_break_run> {
		template <typename ActionInput>
		static void apply(const ActionInput& in, std::string_view& run) noexcept {
			run = in.string_view();
		}
	};
}

auto mdsm_impl::tryThematicBreak(const LineView& line) noexcept -> std::pair<Verdict, std::string_view> {
	std::string_view run{};
	mem_input in{ line.text.data(), line.text.data() + line.text.size(), "hr" };
	if (!line.complete) {
		return { mdlang::parse<mdlang::thematic_break_partial>(in) ? Verdict::NeedMoreInput : Verdict::NoMatch, run };
	}
	if (mdlang::parse<mdlang::thematic_break_rule, mdlang::thematic_break_action>(in, run)) {
		return { Verdict::Matched, run };
	}
	return { Verdict::NoMatch, run };
}

namespace mdlang {
	using namespace TAO_PEGTL_NAMESPACE;

	struct table_align_cell : seq<opt<one<':'>>, plus<one<'-'>>, opt<one<':'>>, eof> {};
}

bool mdsm_impl::isWhitespace(char c) noexcept {
	return c == ' ' or c == '\t' or c == '\n' or c == '\r' or c == '\f' or c == '\v';
}

auto mdsm_impl::trimView(std::string_view sv) noexcept -> std::string_view {
	while (!sv.empty() and isWhitespace(sv.front())) {
		sv.remove_prefix(1);
	}
	while (!sv.empty() and isWhitespace(sv.back())) {
		sv.remove_suffix(1);
	}
	return sv;
}

size_t mdsm_impl::atxContentLength(std::string_view text) noexcept {
	size_t i = text.size();
	for (; i > 0 and (text[i - 1] == ' ' or text[i - 1] == '\t'); --i) {}
	const size_t trailing = i;
	for (; i > 0 and text[i - 1] == '#'; --i) {}
	if (i == trailing) {
		return text.size();
	}
	if (i != 0 and text[i - 1] != ' ' and text[i - 1] != '\t') {
		return text.size();
	}
	for (; i > 0 and (text[i - 1] == ' ' or text[i - 1] == '\t'); --i) {}
	return i;
}

bool mdsm_impl::isTableRow(std::string_view line) noexcept {
	auto trimmed = trimView(line);
	return trimmed.size() >= 2 and trimmed.front() == '|' and trimmed.back() == '|';
}

auto mdsm_impl::splitTableRow(std::string_view line) -> std::vector<std::string> {
	std::vector<std::string> cells{};
	if (!isTableRow(line)) {
		return cells;
	}
	auto content = trimView(line);
	content = content.substr(1, content.size() - 2);
	size_t pos = 0;
	while (true) {
		size_t bar = content.find('|', pos);
		auto cell = content.substr(pos, bar == std::string_view::npos ? std::string_view::npos : bar - pos);
		cells.emplace_back(trimView(cell));
		if (bar == std::string_view::npos) {
			break;
		}
		pos = bar + 1;
	}
	return cells;
}

auto mdsm_impl::tryTableStart(const LineWindow& win) -> std::pair<Verdict, TableInfo> {
	TableInfo info{};
	auto header = win.line(0);
	if (!header) {
		return { Verdict::NoMatch, info };
	}
	if (!header->complete) {
		size_t lead = header->text.find_first_not_of(" \t");
		if (lead == std::string_view::npos or header->text[lead] == '|') {
			return { Verdict::NeedMoreInput, info };
		}
		return { Verdict::NoMatch, info };
	}
	if (!isTableRow(header->text)) {
		return { Verdict::NoMatch, info };
	}
	auto separator = win.line(1);
	if (!separator) {
		return { Verdict::NoMatch, info };
	}
	if (!separator->complete) {
		if (separator->text.find_first_not_of("|:- \t") == std::string_view::npos) {
			return { Verdict::NeedMoreInput, info };
		}
		return { Verdict::NoMatch, info };
	}
	if (!isTableRow(separator->text)) {
		return { Verdict::NoMatch, info };
	}
	info.headerCells = splitTableRow(header->text);
	for (const auto& cell : splitTableRow(separator->text)) {
		mem_input in{ cell.data(), cell.data() + cell.size(), "table" };
		if (!mdlang::parse<mdlang::table_align_cell>(in)) {
			return { Verdict::NoMatch, TableInfo{} };
		}
		bool left = cell.front() == ':';
		bool right = cell.back() == ':';
		if (left and right) {
			info.alignments.push_back(ColumnAlignment::Center);
		}
		else if (left) {
			info.alignments.push_back(ColumnAlignment::Left);
		}
		else if (right) {
			info.alignments.push_back(ColumnAlignment::Right);
		}
		else {
			info.alignments.push_back(ColumnAlignment::None);
		}
	}
	if (info.alignments.size() != info.headerCells.size()) {
		return { Verdict::NoMatch, TableInfo{} };
	}
	return { Verdict::Matched, info };
}

size_t mdsm_impl::completeUtf8Prefix(std::string_view sv) noexcept {
	size_t i = sv.size();
	size_t steps = 0;
	while (i > 0 and steps < 4 and (static_cast<unsigned char>(sv[i - 1]) & 0xC0) == 0x80) {
		--i;
		++steps;
	}
	if (i == 0) {
		return sv.size();
	}
	auto lead = static_cast<unsigned char>(sv[i - 1]);
	size_t expected = 1;
	if ((lead & 0xE0) == 0xC0) {
		expected = 2;
	}
	else if ((lead & 0xF0) == 0xE0) {
		expected = 3;
	}
	else if ((lead & 0xF8) == 0xF0) {
		expected = 4;
	}
	if (sv.size() - (i - 1) < expected) {
		return i - 1;
	}
	return sv.size();
}

size_t mdsm_impl::codepointPrefix(std::string_view sv, size_t n) noexcept {
	size_t cps = 0;
	for (size_t i = 0; i < sv.size(); ++i) {
		if ((static_cast<unsigned char>(sv[i]) & 0xC0) != 0x80) {
			if (cps == n) {
				return i;
			}
			++cps;
		}
	}
	return sv.size();
}

size_t mdsm_impl::codepointCount(std::string_view sv) noexcept {
	return static_cast<size_t>(std::count_if(sv.begin(), sv.end(), [](char c) {
		return (static_cast<unsigned char>(c) & 0xC0) != 0x80;
	}));
}

namespace mdlang {
	using namespace TAO_PEGTL_NAMESPACE;

	struct code_body_double : plus<not_one<'`'>> {};
	struct code_span_double : seq<two<'`'>, code_body_double, two<'`'>> {};
	struct code_body_single : plus<not_one<'`'>> {};
	struct code_span_single : seq<one<'`'>, code_body_single, one<'`'>> {};
	struct strike_body : plus<not_one<'~'>> {};
	struct strike_span : seq<two<'~'>, strike_body, two<'~'>> {};
	struct strong_star_body : plus<not_one<'*'>> {};
	struct strong_star : seq<two<'*'>, strong_star_body, two<'*'>> {};
	struct strong_under_body : plus<not_one<'_'>> {};
	struct strong_under : seq<two<'_'>, strong_under_body, two<'_'>> {};
	struct em_star_body : plus<not_one<'*'>> {};
	struct em_star : seq<one<'*'>, em_star_body, one<'*'>> {};
	struct em_under_body : plus<not_one<'_'>> {};
	struct em_under : seq<one<'_'>, em_under_body, one<'_'>> {};
	struct link_text : plus<not_one<']'>> {};
	struct link_url : plus<not_one<')'>> {};
	struct link_span : seq<one<'['>, link_text, one<']'>, one<'('>, link_url, one<')'>> {};
	struct math_body : plus<not_one<'$'>> {};
	struct math_span : seq<one<'$'>, math_body, one<'$'>> {};

	struct InlineCapture {
		std::string_view inner;
		std::string_view url;
	};

	struct capture_inner {
		template <typename ActionInput>
		static void apply(const ActionInput& in, InlineCapture& cap) noexcept {
			cap.inner = in.string_view();
		}
	};

	template <typename Rule>
	struct inline_action : nothing<Rule> {};
	template <> struct inline_action<code_body_double> : capture_inner {};
	template <> struct inline_action<code_body_single> : capture_inner {};
	template <> struct inline_action<strike_body> : capture_inner {};
	template <> struct inline_action<strong_star_body> : capture_inner {};
	template <> struct inline_action<strong_under_body> : capture_inner {};
	template <> struct inline_action<em_star_body> : capture_inner {};
	template <> struct inline_action<em_under_body> : capture_inner {};
	template <> struct inline_action<link_text> : capture_inner {};
	template <> struct inline_action<math_body> : capture_inner {};
	template <>
	struct inline_action<link_url> {
		template <typename ActionInput>
		static void apply(const ActionInput& in, InlineCapture& cap) noexcept {
			cap.url = in.string_view();
		}
	};

	template <typename Rule>
	bool tryInline(std::string_view rest, InlineCapture& cap, size_t& consumed) noexcept {
		cap = {};
		mem_input in{ rest.data(), rest.data() + rest.size(), "inline" };
		if (!parse<Rule, inline_action>(in, cap)) {
			return false;
		}
		consumed = consumedBy(in, rest);
		return true;
	}
}

bool mdsm_impl::isInlineSpecial(char c) noexcept {
	return c == '`' or c == '~' or c == '*' or c == '_' or c == '[' or c == '$';
}

auto mdsm_impl::scanInline(std::string_view line, const InlineOptions& opts) -> std::vector<InlineSegment> {
	using md_streamman::ElementType;
	std::vector<InlineSegment> segments{};
	size_t plainStart = 0;
	size_t i = 0;

	auto flushPlain = [&](size_t upTo) {
		if (upTo > plainStart) {
			auto run = line.substr(plainStart, upTo - plainStart);
			segments.push_back({ ElementType::Text, run, run, {} });
		}
	};

	while (i < line.size()) {
		char c = line[i];
		if (!isInlineSpecial(c)) {
			++i;
			continue;
		}
		auto rest = line.substr(i);
		mdlang::InlineCapture cap{};
		size_t consumed = 0;
		bool hit = false;
		ElementType type = ElementType::Text;

		switch (c) {
		case '`':
			type = ElementType::Code;
			hit = opts.code and (mdlang::tryInline<mdlang::code_span_double>(rest, cap, consumed)
				or mdlang::tryInline<mdlang::code_span_single>(rest, cap, consumed));
			break;
		case '~':
			type = ElementType::Strikethrough;
			hit = opts.strikethrough and mdlang::tryInline<mdlang::strike_span>(rest, cap, consumed);
			break;
		case '*':
			if (opts.strong and mdlang::tryInline<mdlang::strong_star>(rest, cap, consumed)) {
				type = ElementType::Strong;
				hit = true;
			}
			else if (opts.emphasis and mdlang::tryInline<mdlang::em_star>(rest, cap, consumed)) {
				type = ElementType::Emphasis;
				hit = true;
			}
			break;
		case '_':
			// no intraword underscore emphasis
			if (i > 0 and std::isalnum(static_cast<unsigned char>(line[i - 1]))) {
				break;
			}
			if (opts.strong and mdlang::tryInline<mdlang::strong_under>(rest, cap, consumed)) {
				type = ElementType::Strong;
				hit = true;
			}
			else if (opts.emphasis and mdlang::tryInline<mdlang::em_under>(rest, cap, consumed)) {
				type = ElementType::Emphasis;
				hit = true;
			}
			break;
		case '[':
			type = ElementType::Link;
			hit = opts.link and mdlang::tryInline<mdlang::link_span>(rest, cap, consumed);
			break;
		case '$':
			// "$$" never opens inline math
			if (i + 1 < line.size() and line[i + 1] == '$') {
				++i;
				break;
			}
			type = ElementType::Math;
			hit = opts.math and mdlang::tryInline<mdlang::math_span>(rest, cap, consumed);
			break;
		default:
			break;
		}

		if (!hit) {
			++i;
			continue;
		}
		flushPlain(i);
		segments.push_back({ type, rest.substr(0, consumed), cap.inner, cap.url });
		i += consumed;
		plainStart = i;
	}
	flushPlain(line.size());
	return segments;
}
