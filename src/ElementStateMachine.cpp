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

#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include "ElementStateMachine.h"
#include "MDStreamImpl.h"

md_streamman::impl::ElementStateMachine::ElementStateMachine(const ParserConfig& config, std::deque<ParseEvent>& sink) noexcept
	: config_{ config }, sink_{ sink }, open_{}, issued_{}, counter_{ 0 } {}

auto md_streamman::impl::ElementStateMachine::nextId(ElementType type) -> std::string {
	++counter_;
	std::string id = config_.idGenerator ? config_.idGenerator(type, counter_) : fmt::format("{}-{}", config_.idPrefix, counter_);
	// ids stay unique for the whole document, closed elements included
	if (id.empty() or issued_.count(id) != 0) {
		spdlog::warn("id generator returned unusable id '{}'; using the default scheme", id);
		id = fmt::format("{}-{}", config_.idPrefix, counter_);
		while (issued_.count(id) != 0) {
			id = fmt::format("{}-{}", config_.idPrefix, ++counter_);
		}
	}
	issued_.insert(id);
	return id;
}

auto md_streamman::impl::ElementStateMachine::find(const std::string& id) -> ParsingState* {
	auto it = open_.find(id);
	return it == open_.end() ? nullptr : &it->second;
}

auto md_streamman::impl::ElementStateMachine::begin(ElementType type, Metadata metadata, std::string startMarker, std::string endMarker, bool trimmed) -> std::string {
	std::string id = nextId(type);
	if (!metadata.is_object()) {
		metadata = Metadata::object();
	}
	sink_.push_back(BeginEvent{ type, id, metadata });
	open_.emplace(id, ParsingState{ type, id, std::move(startMarker), std::move(endMarker), {}, std::move(metadata), false, 0, trimmed, false, {} });
	spdlog::debug("begin {} {}", toString(type), id);
	return id;
}

auto md_streamman::impl::ElementStateMachine::append(const std::string& id, std::string_view text) -> ContentSpan {
	ParsingState* st = find(id);
	if (st == nullptr) {
		spdlog::error("append to unknown element {}", id);
		return { 0, 0 };
	}
	if (!st->trimmed) {
		size_t start = st->buffer.size();
		st->buffer.append(text);
		emitPending(*st, false);
		return { start, st->buffer.size() };
	}

	if (!st->sawContent) {
		while (!text.empty() and mdsm_impl::isWhitespace(text.front())) {
			text.remove_prefix(1);
		}
	}
	std::string_view body = text;
	while (!body.empty() and mdsm_impl::isWhitespace(body.back())) {
		body.remove_suffix(1);
	}
	std::string_view tail = text.substr(body.size());
	if (body.empty()) {
		if (st->sawContent) {
			st->heldWhitespace.append(tail);
		}
		return { st->buffer.size(), st->buffer.size() };
	}

	st->buffer.append(st->heldWhitespace);
	st->heldWhitespace.assign(tail);
	size_t lead = 0;
	while (lead < body.size() and mdsm_impl::isWhitespace(body[lead])) {
		++lead;
	}
	size_t start = st->buffer.size() + lead;
	st->buffer.append(body);
	st->sawContent = true;
	emitPending(*st, false);
	return { start, st->buffer.size() };
}

void md_streamman::impl::ElementStateMachine::emitPending(ParsingState& st, bool all) {
	const size_t n = config_.maxDeltaChunkSize;
	while (st.emitted < st.buffer.size()) {
		std::string_view pending{ st.buffer };
		pending.remove_prefix(st.emitted);
		size_t take = pending.size();
		if (n > 0) {
			if (!all and mdsm_impl::codepointCount(pending) < n) {
				break;
			}
			take = mdsm_impl::codepointPrefix(pending, n);
		}
		sink_.push_back(DeltaEvent{ st.elementId, std::string{ pending.substr(0, take) } });
		st.emitted += take;
	}
}

void md_streamman::impl::ElementStateMachine::flush(const std::string& id) {
	if (ParsingState* st = find(id); st != nullptr) {
		emitPending(*st, true);
	}
}

void md_streamman::impl::ElementStateMachine::annotate(const std::string& id, Annotation annotation) {
	if (find(id) == nullptr) {
		spdlog::error("annotation for closed element {}", id);
		return;
	}
	sink_.push_back(AnnotationEvent{ id, std::move(annotation) });
}

void md_streamman::impl::ElementStateMachine::end(const std::string& id) {
	auto it = open_.find(id);
	if (it == open_.end()) {
		spdlog::error("end of unknown element {}", id);
		return;
	}
	ParsingState& st = it->second;
	emitPending(st, true);
	st.processed = true;
	spdlog::debug("end {} {} ({} bytes)", toString(st.elementType), id, st.buffer.size());
	sink_.push_back(EndEvent{ id, std::move(st.buffer) });
	open_.erase(it);
}

auto md_streamman::impl::ElementStateMachine::content(const std::string& id) const -> std::string_view {
	auto it = open_.find(id);
	return it == open_.end() ? std::string_view{} : std::string_view{ it->second.buffer };
}

void md_streamman::impl::ElementStateMachine::reset() noexcept {
	open_.clear();
	issued_.clear();
	counter_ = 0;
}
