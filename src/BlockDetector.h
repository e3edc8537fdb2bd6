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

#ifndef BLOCK_DETECTOR_H
#define BLOCK_DETECTOR_H
#include <regex>
#include <string>
#include <vector>
#include <variant>
#include <optional>
#include <string_view>
#include "md_streamman/ParserConfig.h"
#include "md_streamman/ElementInfoTags.h"
#include "MDStreamImpl.h"

namespace md_streamman {
	namespace impl {
		struct Detection {
			mdsm_impl::Verdict verdict;
			ElementType type;
			std::string startMarker;
			std::string endMarker;
			Metadata metadata;
			// bytes of input taken by the marker
			size_t consumed;
			// the element ends with the line it starts on
			bool atomic;
			std::string content;
			std::optional<FenceInfo> fence;
			std::optional<TableInfo> table;
		};

		class BlockTypeDetector {
		public:
			explicit BlockTypeDetector(const ParserConfig& config);

			auto detect(std::string_view unconsumed, bool endOfInput) const -> Detection;
			size_t matcherCount() const noexcept { return table_.size(); }
		private:
			enum class builtin_e : uint8_t {
				CodeFence,
				MathBlock,
				Heading,
				List,
				BlockQuote,
				Table,
				HorizontalRule
			};
			struct CompiledMatcher {
				std::string name;
				std::regex pattern;
				std::string prefix;
				ElementType type;
				std::function<Metadata(const std::smatch&)> metadata;
			};
			struct MatcherDescriptor {
				Int priority;
				std::variant<builtin_e, CompiledMatcher> matcher;
			};

			auto runBuiltin(builtin_e kind, const mdsm_impl::LineWindow& win) const -> Detection;
			auto runCustom(const CompiledMatcher& m, const mdsm_impl::LineWindow& win) const -> Detection;

			std::vector<MatcherDescriptor> table_;
		};

		auto alignmentName(ColumnAlignment a) -> nlohmann::json;
	}
}

#endif
