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
#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include "md_streamman/ParserConfig.h"

namespace {
	using nlohmann::json;

	void readBool(const json& jc, const char* key, bool& dst) {
		auto it = jc.find(key);
		if (it == jc.end()) {
			return;
		}
		if (!it->is_boolean()) {
			spdlog::warn("config: '{}' must be a boolean; keeping {}", key, dst);
			return;
		}
		dst = it->get<bool>();
	}

	void readSize(const json& jc, const char* key, size_t& dst, size_t minimum) {
		auto it = jc.find(key);
		if (it == jc.end()) {
			return;
		}
		if (!it->is_number_integer() or it->get<int64_t>() < static_cast<int64_t>(minimum)) {
			spdlog::warn("config: '{}' must be an integer >= {}; keeping {}", key, minimum, dst);
			return;
		}
		dst = it->get<size_t>();
	}

	auto readString(const json& jc, const char* key) -> std::optional<std::string> {
		auto it = jc.find(key);
		if (it == jc.end()) {
			return std::nullopt;
		}
		if (!it->is_string()) {
			spdlog::warn("config: '{}' must be a string; ignored", key);
			return std::nullopt;
		}
		return it->get<std::string>();
	}

	auto readType(const json& jc, const char* key) -> std::optional<md_streamman::ElementType> {
		auto name = readString(jc, key);
		if (!name) {
			return std::nullopt;
		}
		auto type = md_streamman::elementTypeFromString(*name);
		if (!type) {
			spdlog::warn("config: unknown element type '{}'", *name);
		}
		return type;
	}
}

auto md_streamman::configFromJson(const nlohmann::json& jc) -> ParserConfig {
	ParserConfig cfg{};
	if (!jc.is_object()) {
		spdlog::warn("config: expected a JSON object; using defaults");
		return cfg;
	}

	if (auto it = jc.find("enabledElements"); it != jc.end()) {
		if (it->is_array()) {
			std::set<ElementType> enabled{};
			for (const auto& el : *it) {
				auto type = el.is_string() ? elementTypeFromString(el.get_ref<const std::string&>()) : std::nullopt;
				if (type) {
					enabled.insert(*type);
				}
				else {
					spdlog::warn("config: enabledElements entry {} is not an element type", el.dump());
				}
			}
			cfg.enabledElements = std::move(enabled);
		}
		else {
			spdlog::warn("config: 'enabledElements' must be an array; enabling everything");
		}
	}

	if (auto it = jc.find("customMatchers"); it != jc.end() and it->is_array()) {
		for (const auto& el : *it) {
			if (!el.is_object()) {
				spdlog::warn("config: custom matcher {} is not an object", el.dump());
				continue;
			}
			CustomMatcher cm{};
			cm.name = readString(el, "name").value_or("");
			cm.pattern = readString(el, "pattern").value_or("");
			cm.prefix = readString(el, "prefix").value_or("");
			if (auto p = el.find("priority"); p != el.end() and p->is_number_integer()) {
				cm.priority = p->get<Int>();
			}
			cm.elementType = readType(el, "elementType").value_or(ElementType::Custom);
			cfg.customMatchers.push_back(std::move(cm));
		}
	}

	if (auto it = jc.find("annotationDetectors"); it != jc.end() and it->is_array()) {
		for (const auto& el : *it) {
			if (!el.is_object()) {
				spdlog::warn("config: annotation detector {} is not an object", el.dump());
				continue;
			}
			AnnotationDetector ad{};
			ad.name = readString(el, "name").value_or("");
			ad.pattern = readString(el, "pattern").value_or("");
			cfg.annotationDetectors.push_back(std::move(ad));
		}
	}

	readBool(jc, "preserveWhitespace", cfg.preserveWhitespace);
	readBool(jc, "splitParagraphs", cfg.splitParagraphs);
	readSize(jc, "maxBufferSize", cfg.maxBufferSize, 1);
	readSize(jc, "maxDeltaChunkSize", cfg.maxDeltaChunkSize, 0);

	if (auto mode = readString(jc, "inlineEmphasisMode")) {
		if (*mode == "strip") {
			cfg.inlineEmphasisMode = InlineEmphasisMode::Strip;
		}
		else if (*mode == "preserve") {
			cfg.inlineEmphasisMode = InlineEmphasisMode::Preserve;
		}
		else {
			spdlog::warn("config: inlineEmphasisMode '{}' is not strip or preserve; using strip", *mode);
		}
	}
	if (auto mode = readString(jc, "tableOutputMode")) {
		if (*mode == "text") {
			cfg.tableOutputMode = TableOutputMode::Text;
		}
		else if (*mode == "structured") {
			cfg.tableOutputMode = TableOutputMode::Structured;
		}
		else {
			spdlog::warn("config: tableOutputMode '{}' is not text or structured; using text", *mode);
		}
	}
	if (auto prefix = readString(jc, "idPrefix")) {
		cfg.idPrefix = *prefix;
	}
	return cfg;
}

auto md_streamman::normalizeConfig(ParserConfig config) -> ParserConfig {
	if (config.enabledElements and config.enabledElements->count(ElementType::Text) == 0) {
		throw ConfigError("enabledElements must include text; it is the fallback for every other type");
	}
	if (config.tableOutputMode == TableOutputMode::Structured and !config.isEnabled(ElementType::Table)) {
		throw ConfigError("tableOutputMode is structured but table elements are disabled");
	}
	if (config.maxBufferSize == 0) {
		spdlog::warn("config: maxBufferSize 0 is unusable; using {}", DEFAULT_MAX_BUFFER_SIZE);
		config.maxBufferSize = DEFAULT_MAX_BUFFER_SIZE;
	}
	if (config.idPrefix.empty() and !config.idGenerator) {
		spdlog::warn("config: empty idPrefix; using 'md'");
		config.idPrefix = "md";
	}

	auto& matchers = config.customMatchers;
	for (size_t i = 0; i < matchers.size(); ++i) {
		if (matchers[i].name.empty()) {
			matchers[i].name = fmt::format("custom-{}", i + 1);
		}
	}
	matchers.erase(std::remove_if(matchers.begin(), matchers.end(), [](const CustomMatcher& cm) {
		if (cm.pattern.empty()) {
			spdlog::warn("config: custom matcher '{}' has no pattern; ignored", cm.name);
			return true;
		}
		return false;
	}), matchers.end());

	auto& detectors = config.annotationDetectors;
	detectors.erase(std::remove_if(detectors.begin(), detectors.end(), [](const AnnotationDetector& ad) {
		if (ad.name.empty() or ad.pattern.empty()) {
			spdlog::warn("config: annotation detector '{}' needs a name and a pattern; ignored", ad.name);
			return true;
		}
		return false;
	}), detectors.end());
	return config;
}
