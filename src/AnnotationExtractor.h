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

#ifndef ANNOTATION_EXTRACTOR_H
#define ANNOTATION_EXTRACTOR_H
#include <set>
#include <regex>
#include <tuple>
#include <string>
#include <vector>
#include <functional>
#include <string_view>
#include <unordered_map>
#include "md_streamman/ParseEvents.h"
#include "md_streamman/ParserConfig.h"

namespace md_streamman {
	namespace impl {
		// A link already resolved by the inline scanner, in content offsets.
		struct LinkSpan {
			size_t start;
			size_t end;
			std::string url;
			std::string title;
		};

		class AnnotationExtractor {
		public:
			explicit AnnotationExtractor(const ParserConfig& config);

			// content is the newly committed slice of the element, which starts
			// at contentOffset in the element's content.
			auto extract(const std::string& elementId, std::string_view content, size_t contentOffset, const std::vector<LinkSpan>& links) -> std::vector<Annotation>;
			void forget(const std::string& elementId);
			void reset() noexcept { reported_.clear(); }
		private:
			bool firstReport(const std::string& elementId, const Annotation& a);

			struct CompiledDetector {
				std::string name;
				std::regex pattern;
				std::function<nlohmann::json(const std::smatch&)> attributes;
			};
			std::vector<CompiledDetector> detectors_;
			std::unordered_map<std::string, std::set<std::tuple<std::string, size_t, size_t>>> reported_;
		};
	}
}

#endif
