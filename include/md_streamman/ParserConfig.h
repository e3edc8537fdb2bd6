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

#ifndef PARSER_CONFIG_H
#define PARSER_CONFIG_H
#include <set>
#include <regex>
#include <string>
#include <vector>
#include <optional>
#include <stdexcept>
#include <functional>
#include "ParseEvents.h"
#include "IntegralTypes.h"
#include "mdstreamman_export.h"

namespace md_streamman {
	// Built-in block matcher priorities. Custom matchers are interleaved by
	// their own priority and are evaluated first on a tie.
	namespace priority {
		constexpr Int CodeFence = 700;
		constexpr Int MathBlock = 650;
		constexpr Int Heading = 600;
		constexpr Int List = 500;
		constexpr Int BlockQuote = 400;
		constexpr Int Table = 300;
		constexpr Int HorizontalRule = 200;
	}

	enum class InlineEmphasisMode : uint8_t {
		Strip, Preserve
	};

	enum class TableOutputMode : uint8_t {
		Text, Structured
	};

	struct CustomMatcher {
		std::string name;
		Int priority = 0;
		// ECMAScript regex that must match a whole line. Capture group 1, when
		// present, becomes the element content.
		std::string pattern;
		// Lines that cannot begin with this literal are rejected early, so
		// the matcher never holds back unrelated input.
		std::string prefix;
		ElementType elementType = ElementType::Custom;
		std::function<Metadata(const std::smatch&)> metadata;
	};

	struct AnnotationDetector {
		std::string name;
		std::string pattern;
		std::function<nlohmann::json(const std::smatch&)> attributes;
	};

	using IdGenerator = std::function<std::string(ElementType, ElementSerial)>;

	struct ParserConfig {
		// Unset means every element type is enabled.
		std::optional<std::set<ElementType>> enabledElements;
		std::vector<CustomMatcher> customMatchers;
		std::vector<AnnotationDetector> annotationDetectors;
		bool preserveWhitespace = false;
		bool splitParagraphs = true;
		size_t maxBufferSize = 10000;
		// Code points per Delta; 0 emits whatever is available.
		size_t maxDeltaChunkSize = 0;
		InlineEmphasisMode inlineEmphasisMode = InlineEmphasisMode::Strip;
		TableOutputMode tableOutputMode = TableOutputMode::Text;
		std::string idPrefix = "md";
		IdGenerator idGenerator;

		bool isEnabled(ElementType type) const noexcept {
			return !enabledElements or enabledElements->count(type) != 0;
		}
	};

	class ConfigError : public std::invalid_argument {
	public:
		explicit ConfigError(const std::string& what) : std::invalid_argument(what) {}
	};

	constexpr size_t DEFAULT_MAX_BUFFER_SIZE = 10000;

	MDSTREAMMAN_EXPORT auto configFromJson(const nlohmann::json& jc) -> ParserConfig;
	MDSTREAMMAN_EXPORT auto normalizeConfig(ParserConfig config) -> ParserConfig;
}

#endif
