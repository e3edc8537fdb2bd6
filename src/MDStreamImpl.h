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

#ifndef MD_STREAM_IMPL_H
#define MD_STREAM_IMPL_H
#include <string>
#include <string_view>
#include <optional>
#include <vector>
#include <tuple>
#include "md_streamman/ElementInfoTags.h"
#include "md_streamman/IntegralTypes.h"
#include "md_streamman/ParseEvents.h"

namespace mdsm_impl {
	enum class Verdict : uint8_t {
		Matched, NeedMoreInput, NoMatch
	};

	// A line without its terminator. complete is false while more bytes of the
	// same line may still arrive.
	struct LineView {
		std::string_view text;
		bool complete;
	};

	// The first two lines of the unconsumed input.
	class LineWindow {
	public:
		LineWindow(std::string_view avail, bool endOfInput) noexcept;

		auto line(size_t i) const noexcept -> std::optional<LineView>;
		size_t lineEnd(size_t i) const noexcept;
		auto available() const noexcept -> std::string_view { return avail_; }
		bool endOfInput() const noexcept { return endOfInput_; }
	private:
		struct Slot {
			LineView view;
			size_t end;
		};
		std::string_view avail_;
		bool endOfInput_;
		Slot slots_[2];
		size_t count_;
	};

	constexpr md_streamman::Int MIN_FENCE_SIZE = 3;

	auto tryBlankLine(const LineView& line) noexcept -> Verdict;
	auto tryFencedCodeOpener(const LineView& line) -> std::pair<Verdict, FenceInfo>;
	auto tryMathOpener(const LineView& line) -> std::pair<Verdict, FenceInfo>;
	auto tryFenceCloser(const LineView& line, const FenceInfo& opener) noexcept -> Verdict;
	auto tryATXHeading(const LineView& line) noexcept -> std::tuple<Verdict, HeadingInfo, size_t>;
	auto tryListItem(const LineView& line) noexcept -> std::tuple<Verdict, ListMarkerInfo, size_t>;
	auto tryBlockQuote(const LineView& line) noexcept -> std::pair<Verdict, size_t>;
	auto tryThematicBreak(const LineView& line) noexcept -> std::pair<Verdict, std::string_view>;
	auto tryTableStart(const LineWindow& win) -> std::pair<Verdict, TableInfo>;

	bool isTableRow(std::string_view line) noexcept;
	auto splitTableRow(std::string_view line) -> std::vector<std::string>;

	bool isWhitespace(char c) noexcept;
	auto trimView(std::string_view sv) noexcept -> std::string_view;
	// Heading text length without an optional closing run of '#'.
	// "Title ##" -> 5, "C#" -> 2, "##" -> 0
	size_t atxContentLength(std::string_view text) noexcept;

	// Length of the longest prefix that does not end inside a UTF-8 sequence.
	size_t completeUtf8Prefix(std::string_view sv) noexcept;
	// Byte length of the first n code points (or of sv when shorter).
	size_t codepointPrefix(std::string_view sv, size_t n) noexcept;
	size_t codepointCount(std::string_view sv) noexcept;

	struct InlineOptions {
		bool code;
		bool strikethrough;
		bool strong;
		bool emphasis;
		bool link;
		bool math;
	};

	// A plain run has type Text and inner == raw.
	struct InlineSegment {
		md_streamman::ElementType type;
		std::string_view raw;
		std::string_view inner;
		std::string_view url;
	};

	bool isInlineSpecial(char c) noexcept;
	auto scanInline(std::string_view line, const InlineOptions& opts) -> std::vector<InlineSegment>;
}
#endif
