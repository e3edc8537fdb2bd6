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

#include <spdlog/spdlog.h>
#include "AnnotationExtractor.h"

md_streamman::impl::AnnotationExtractor::AnnotationExtractor(const ParserConfig& config) {
	for (const auto& ad : config.annotationDetectors) {
		try {
			detectors_.push_back({ ad.name, std::regex{ ad.pattern, std::regex::ECMAScript }, ad.attributes });
		}
		catch (const std::regex_error& e) {
			spdlog::warn("annotation detector '{}' ignored: bad pattern ({})", ad.name, e.what());
		}
	}
}

bool md_streamman::impl::AnnotationExtractor::firstReport(const std::string& elementId, const Annotation& a) {
	return reported_[elementId].emplace(a.type, a.start, a.end).second;
}

auto md_streamman::impl::AnnotationExtractor::extract(const std::string& elementId, std::string_view content, size_t contentOffset, const std::vector<LinkSpan>& links) -> std::vector<Annotation> {
	std::vector<Annotation> found{};

	for (const auto& link : links) {
		Annotation a{ "url_citation", link.start, link.end, { { "url", link.url }, { "title", link.title } } };
		if (firstReport(elementId, a)) {
			found.push_back(std::move(a));
		}
	}

	if (detectors_.empty() or content.empty()) {
		return found;
	}
	std::string text{ content };
	for (const auto& det : detectors_) {
		for (auto it = std::sregex_iterator(text.begin(), text.end(), det.pattern); it != std::sregex_iterator(); ++it) {
			const std::smatch& m = *it;
			if (m.length(0) == 0) {
				continue;
			}
			size_t start = contentOffset + static_cast<size_t>(m.position(0));
			Annotation a{ det.name, start, start + static_cast<size_t>(m.length(0)), nlohmann::json::object() };
			a.attributes["match"] = m.str(0);
			if (det.attributes) {
				nlohmann::json extra = det.attributes(m);
				if (extra.is_object()) {
					a.attributes.update(extra);
				}
			}
			if (firstReport(elementId, a)) {
				found.push_back(std::move(a));
			}
		}
	}
	return found;
}

void md_streamman::impl::AnnotationExtractor::forget(const std::string& elementId) {
	reported_.erase(elementId);
}
