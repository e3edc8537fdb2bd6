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

#ifndef ORCHESTRATOR_H
#define ORCHESTRATOR_H
#include <deque>
#include <string>
#include <vector>
#include <optional>
#include <string_view>
#include "md_streamman/ParseEvents.h"
#include "md_streamman/ParserConfig.h"
#include "md_streamman/ElementInfoTags.h"
#include "AnnotationExtractor.h"
#include "ElementStateMachine.h"
#include "BlockDetector.h"
#include "MDStreamImpl.h"

namespace md_streamman {
	namespace impl {
		class Orchestrator {
		public:
			explicit Orchestrator(ParserConfig config);

			void append(std::string_view text);
			// Produces the next event, advancing the buffer as needed. When
			// finalizing, everything still open is flushed once the input
			// runs dry.
			bool pull(ParseEvent& out, bool finalizing);
			void requestCompletion() noexcept;
			void reset();

			bool finished() const noexcept { return finished_; }
			bool streaming() const noexcept { return started_ and !finished_; }
			auto config() const noexcept -> const ParserConfig& { return config_; }
		private:
			struct ActiveBlock {
				std::string id;
				ElementType type;
				bool inlineContent;
				bool singleLine;
				std::optional<FenceInfo> fence;
				size_t bodyLines;
				size_t pendingBlankLines;
				std::optional<TableInfo> table;
				std::string tbodyId;
				size_t rowIndex;
			};

			bool step(bool endOfInput);
			bool stepLineStart(std::string_view avail, bool endOfInput);
			bool stepFenceLine(std::string_view avail, bool endOfInput);
			bool stepMidLine(std::string_view avail, bool endOfInput);
			bool waitOrForce(std::string_view avail, bool endOfInput);

			void openParagraph();
			void openDetected(const Detection& d, const mdsm_impl::LineWindow& win);
			void openTable(const Detection& d, const mdsm_impl::LineWindow& win);
			void appendTableRow(std::string_view line);
			void emitRow(const std::string& parentId, const std::vector<std::string>& cells, size_t index, const std::vector<ColumnAlignment>& aligns);
			void emitAtomic(const Detection& d);
			void onBlankLine();
			void closeActive();
			void finalize();

			void beginLine();
			void streamSafePrefix();
			void commitLine();

			ParserConfig config_;
			std::deque<ParseEvent> events_;
			BlockTypeDetector detector_;
			AnnotationExtractor annotations_;
			ElementStateMachine elements_;
			mdsm_impl::InlineOptions inlineOpts_;

			std::string buffer_;
			size_t consumed_;
			bool atLineStart_;
			std::optional<ActiveBlock> active_;

			// the current line of an inline-bearing block
			std::string lineRaw_;
			size_t lineStreamed_;
			bool lineHalted_;
			size_t lineOffset_;

			bool started_;
			bool finished_;
			bool completionPending_;
		};
	}
}

#endif
