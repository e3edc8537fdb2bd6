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

#include "md_streamman/MDStreamMan.h"
#include <istream>
#include <iterator>
#include <spdlog/spdlog.h>
#include "Orchestrator.h"

md_streamman::Parser::Parser(Parser&& o) noexcept : orch_{ o.orch_ } {
	o.orch_ = nullptr;
}

md_streamman::Parser::Parser() : Parser(ParserConfig{}) {}

md_streamman::Parser::Parser(ParserConfig config) : orch_{ new impl::Orchestrator{ std::move(config) } } {}

md_streamman::Parser::~Parser() {
	delete orch_;
}

md_streamman::EventStream md_streamman::Parser::processChunk(std::string_view text) {
	if (orch_ == nullptr) {
		throw UsageError("processChunk() on a moved-from parser");
	}
	if (orch_->finished()) {
		spdlog::error("processChunk() after complete(); the document is already closed");
		throw UsageError("processChunk() called after complete(); call reset() to start a new document");
	}
	orch_->append(text);
	return EventStream{ orch_, false };
}

md_streamman::EventStream md_streamman::Parser::complete() {
	if (orch_ == nullptr) {
		throw UsageError("complete() on a moved-from parser");
	}
	orch_->requestCompletion();
	return EventStream{ orch_, true };
}

void md_streamman::Parser::reset() {
	if (orch_ != nullptr) {
		orch_->reset();
	}
}

auto md_streamman::Parser::parse(std::string_view text) -> std::vector<ParseEvent> {
	auto events = processChunk(text).drain();
	auto tail = complete().drain();
	events.insert(events.end(), std::make_move_iterator(tail.begin()), std::make_move_iterator(tail.end()));
	return events;
}

bool md_streamman::Parser::isStreaming() const noexcept {
	return orch_ != nullptr and orch_->streaming();
}

bool md_streamman::Parser::processStream(std::istream& in, size_t chunkSize, const EventSink& sink) {
	auto pump = [&sink](EventStream stream) {
		for (const auto& ev : stream) {
			sink(ev);
		}
	};
	if (chunkSize == 0) {
		std::string whole{ std::istreambuf_iterator<char>{ in }, std::istreambuf_iterator<char>{} };
		pump(processChunk(whole));
	}
	else {
		std::string buffer(chunkSize, '\0');
		while (in.read(buffer.data(), static_cast<std::streamsize>(buffer.size())) or in.gcount() > 0) {
			pump(processChunk(std::string_view{ buffer.data(), static_cast<size_t>(in.gcount()) }));
		}
	}
	pump(complete());
	if (in.bad()) {
		spdlog::error("processStream: read error on the input stream");
		return false;
	}
	return true;
}

auto md_streamman::Parser::processStream(std::istream& in, size_t chunkSize) -> std::vector<ParseEvent> {
	std::vector<ParseEvent> events{};
	processStream(in, chunkSize, [&events](const ParseEvent& ev) { events.push_back(ev); });
	return events;
}

auto md_streamman::Parser::config() const -> const ParserConfig& {
	if (orch_ == nullptr) {
		throw UsageError("config() on a moved-from parser");
	}
	return orch_->config();
}

auto md_streamman::createStreamingMarkdownParser(ParserConfig config) -> Parser {
	return Parser{ std::move(config) };
}
