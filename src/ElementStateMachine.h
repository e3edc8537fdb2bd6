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

#ifndef ELEMENT_STATE_MACHINE_H
#define ELEMENT_STATE_MACHINE_H
#include <deque>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include "md_streamman/ParseEvents.h"
#include "md_streamman/ParserConfig.h"

namespace md_streamman {
	namespace impl {
		struct ParsingState {
			ElementType  elementType;
			std::string    elementId;
			std::string  startMarker;
			std::string    endMarker;
			// content as it will appear in End, minus held trailing whitespace
			std::string       buffer;
			Metadata        metadata;
			bool           processed;
			size_t           emitted;
			bool             trimmed;
			bool          sawContent;
			std::string heldWhitespace;
		};

		struct ContentSpan {
			size_t start;
			size_t end;
		};

		// Owns begin -> delta* -> end for every open element. Deltas of an
		// element always concatenate to its End content.
		class ElementStateMachine {
		public:
			ElementStateMachine(const ParserConfig& config, std::deque<ParseEvent>& sink) noexcept;

			auto begin(ElementType type, Metadata metadata, std::string startMarker = {}, std::string endMarker = {}, bool trimmed = true) -> std::string;
			// Returns where the non-blank part of text landed in the content.
			auto append(const std::string& id, std::string_view text) -> ContentSpan;
			void flush(const std::string& id);
			void annotate(const std::string& id, Annotation annotation);
			void end(const std::string& id);

			auto content(const std::string& id) const -> std::string_view;
			bool isOpen(const std::string& id) const noexcept { return open_.count(id) != 0; }
			size_t openCount() const noexcept { return open_.size(); }

			void reset() noexcept;
		private:
			auto nextId(ElementType type) -> std::string;
			auto find(const std::string& id) -> ParsingState*;
			void emitPending(ParsingState& st, bool all);

			const ParserConfig& config_;
			std::deque<ParseEvent>& sink_;
			std::unordered_map<std::string, ParsingState> open_;
			std::unordered_set<std::string> issued_;
			ElementSerial counter_;
		};
	}
}

#endif
