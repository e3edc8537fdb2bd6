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

#include "md_streamman/ParseEvents.h"

namespace {
	struct TypeName {
		md_streamman::ElementType type;
		const char* name;
	};
	constexpr TypeName typeNames[] = {
		{ md_streamman::ElementType::Text, "text" },
		{ md_streamman::ElementType::Code, "code" },
		{ md_streamman::ElementType::Header, "header" },
		{ md_streamman::ElementType::List, "list" },
		{ md_streamman::ElementType::Quote, "quote" },
		{ md_streamman::ElementType::Table, "table" },
		{ md_streamman::ElementType::THead, "thead" },
		{ md_streamman::ElementType::TBody, "tbody" },
		{ md_streamman::ElementType::Row, "row" },
		{ md_streamman::ElementType::Col, "col" },
		{ md_streamman::ElementType::TFoot, "tfoot" },
		{ md_streamman::ElementType::Math, "math" },
		{ md_streamman::ElementType::Link, "link" },
		{ md_streamman::ElementType::Emphasis, "emphasis" },
		{ md_streamman::ElementType::Strong, "strong" },
		{ md_streamman::ElementType::Strikethrough, "strikethrough" },
		{ md_streamman::ElementType::HorizontalRule, "horizontal_rule" },
		{ md_streamman::ElementType::Custom, "custom" }
	};
}

auto md_streamman::toString(ElementType type) noexcept -> const char* {
	for (const auto& tn : typeNames) {
		if (tn.type == type) {
			return tn.name;
		}
	}
	return "custom";
}

auto md_streamman::elementTypeFromString(std::string_view name) noexcept -> std::optional<ElementType> {
	for (const auto& tn : typeNames) {
		if (name == tn.name) {
			return tn.type;
		}
	}
	return std::nullopt;
}

auto md_streamman::eventElementId(const ParseEvent& ev) noexcept -> const std::string& {
	return std::visit([](const auto& e) -> const std::string& { return e.elementId; }, ev);
}

auto md_streamman::toJson(const Annotation& a) -> nlohmann::json {
	return { { "type", a.type }, { "start", a.start }, { "end", a.end }, { "attributes", a.attributes } };
}

auto md_streamman::toJson(const ParseEvent& ev) -> nlohmann::json {
	nlohmann::json jc = nlohmann::json::object();
	if (const auto* b = std::get_if<BeginEvent>(&ev)) {
		jc["event"] = "begin";
		jc["elementType"] = toString(b->elementType);
		jc["elementId"] = b->elementId;
		jc["metadata"] = b->metadata;
	}
	else if (const auto* d = std::get_if<DeltaEvent>(&ev)) {
		jc["event"] = "delta";
		jc["elementId"] = d->elementId;
		jc["content"] = d->content;
	}
	else if (const auto* e = std::get_if<EndEvent>(&ev)) {
		jc["event"] = "end";
		jc["elementId"] = e->elementId;
		jc["finalContent"] = e->finalContent;
	}
	else if (const auto* a = std::get_if<AnnotationEvent>(&ev)) {
		jc["event"] = "annotation";
		jc["elementId"] = a->elementId;
		jc["annotation"] = toJson(a->annotation);
	}
	return jc;
}
