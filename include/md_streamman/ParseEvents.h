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

#ifndef PARSE_EVENTS_H
#define PARSE_EVENTS_H
#include <string>
#include <string_view>
#include <variant>
#include <optional>
#include <nlohmann/json.hpp>
#include "mdstreamman_export.h"

namespace md_streamman {
	enum class ElementType : uint8_t {
		Text,
		Code,
		Header,
		List,
		Quote,
		Table,
		THead,
		TBody,
		Row,
		Col,
		TFoot,
		Math,
		Link,
		Emphasis,
		Strong,
		Strikethrough,
		HorizontalRule,
		Custom
	};

	MDSTREAMMAN_EXPORT auto toString(ElementType type) noexcept -> const char*;
	MDSTREAMMAN_EXPORT auto elementTypeFromString(std::string_view name) noexcept -> std::optional<ElementType>;

	using Metadata = nlohmann::json;

	// start and end are byte offsets into the owning element's finalContent.
	struct Annotation {
		std::string            type;
		size_t                start;
		size_t                  end;
		nlohmann::json   attributes;
	};

	struct BeginEvent {
		ElementType elementType;
		std::string   elementId;
		Metadata       metadata;
	};

	struct DeltaEvent {
		std::string elementId;
		std::string   content;
	};

	struct EndEvent {
		std::string    elementId;
		std::string finalContent;
	};

	struct AnnotationEvent {
		std::string elementId;
		Annotation annotation;
	};

	using ParseEvent = std::variant<BeginEvent, DeltaEvent, EndEvent, AnnotationEvent>;

	MDSTREAMMAN_EXPORT auto eventElementId(const ParseEvent& ev) noexcept -> const std::string&;
	MDSTREAMMAN_EXPORT auto toJson(const ParseEvent& ev) -> nlohmann::json;
	MDSTREAMMAN_EXPORT auto toJson(const Annotation& a) -> nlohmann::json;
}

#endif
