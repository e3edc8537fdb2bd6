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

// MDStreamMan.h : public surface of the streaming markdown parser.
#ifndef MD_STREAM_MAN_H
#define MD_STREAM_MAN_H
#include <iosfwd>
#include <string>
#include <functional>
#include <vector>
#include <iterator>
#include <optional>
#include <stdexcept>
#include <string_view>
#include "ParseEvents.h"
#include "ParserConfig.h"
#include "ElementInfoTags.h"
#include "mdstreamman_export.h"

namespace md_streamman {
	namespace impl {
		class Orchestrator;
	}

	class UsageError : public std::logic_error {
	public:
		explicit UsageError(const std::string& what) : std::logic_error(what) {}
	};

	// Lazy, single-pass view over the events produced by one processChunk() or
	// complete() call. Events are computed while pulling. The stream refers to
	// its Parser and must not outlive it.
	class EventStream {
	public:
		class iterator {
		public:
			using iterator_category = std::input_iterator_tag;
			using value_type = ParseEvent;
			using difference_type = std::ptrdiff_t;
			using pointer = const ParseEvent*;
			using reference = const ParseEvent&;

			iterator() noexcept : stream_{ nullptr } {}
			MDSTREAMMAN_EXPORT explicit iterator(EventStream* stream);

			reference operator*() const noexcept { return *current_; }
			pointer operator->() const noexcept { return &*current_; }

			MDSTREAMMAN_EXPORT iterator& operator++();
			void operator++(int) { ++*this; }

			bool operator==(const iterator& rhs) const noexcept { return stream_ == rhs.stream_; }
			bool operator!=(const iterator& rhs) const noexcept { return !operator==(rhs); }
		private:
			EventStream* stream_;
			std::optional<ParseEvent> current_;
		};

		MDSTREAMMAN_EXPORT auto next() -> std::optional<ParseEvent>;
		MDSTREAMMAN_EXPORT auto drain() -> std::vector<ParseEvent>;

		MDSTREAMMAN_EXPORT iterator begin();
		iterator end() noexcept { return iterator{}; }
	private:
		friend class Parser;
		EventStream(impl::Orchestrator* orch, bool finalizing) noexcept
			: orch_{ orch }, finalizing_{ finalizing }, exhausted_{ false } {}

		impl::Orchestrator* orch_;
		bool finalizing_;
		bool exhausted_;
	};

	class Parser {
	public:
		Parser(const Parser&) = delete;
		Parser& operator=(const Parser&) = delete;
		MDSTREAMMAN_EXPORT Parser(Parser&& o) noexcept;

		MDSTREAMMAN_EXPORT Parser();
		MDSTREAMMAN_EXPORT explicit Parser(ParserConfig config);
		MDSTREAMMAN_EXPORT virtual ~Parser();

		MDSTREAMMAN_EXPORT EventStream processChunk(std::string_view text);
		MDSTREAMMAN_EXPORT EventStream complete();
		MDSTREAMMAN_EXPORT void reset();

		MDSTREAMMAN_EXPORT auto parse(std::string_view text) -> std::vector<ParseEvent>;

		using EventSink = std::function<void(const ParseEvent&)>;
		// Reads `in` in pieces of chunkSize bytes (0 reads it whole), hands every
		// event to sink, then completes the document. False when the read failed.
		MDSTREAMMAN_EXPORT bool processStream(std::istream& in, size_t chunkSize, const EventSink& sink);
		MDSTREAMMAN_EXPORT auto processStream(std::istream& in, size_t chunkSize = 0) -> std::vector<ParseEvent>;

		MDSTREAMMAN_EXPORT bool isStreaming() const noexcept;
		MDSTREAMMAN_EXPORT auto config() const -> const ParserConfig&;
	private:
		impl::Orchestrator* orch_;
	};

	MDSTREAMMAN_EXPORT auto createStreamingMarkdownParser(ParserConfig config = {}) -> Parser;

	// Downstream consumption model: one record per element, folded from its
	// Begin/Delta/End/Annotation events in Begin order.
	struct BlockRecord {
		std::string id;
		ElementType type;
		std::string content;
		Metadata metadata;
		std::string parentId;
		std::vector<Annotation> annotations;
		bool closed;
	};

	MDSTREAMMAN_EXPORT auto foldEvents(const std::vector<ParseEvent>& events) -> std::vector<BlockRecord>;
	MDSTREAMMAN_EXPORT auto toJson(const BlockRecord& rec) -> nlohmann::json;
	MDSTREAMMAN_EXPORT bool jsonLinesExport(const std::vector<ParseEvent>& events, std::ostream& out);
	MDSTREAMMAN_EXPORT bool jsonLinesExport(const std::vector<BlockRecord>& records, std::ostream& out);
}

#endif
