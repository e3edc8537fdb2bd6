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
#include "Orchestrator.h"

auto md_streamman::EventStream::next() -> std::optional<ParseEvent> {
	if (exhausted_ or orch_ == nullptr) {
		return std::nullopt;
	}
	ParseEvent ev{};
	if (orch_->pull(ev, finalizing_)) {
		return ev;
	}
	exhausted_ = true;
	return std::nullopt;
}

auto md_streamman::EventStream::drain() -> std::vector<ParseEvent> {
	std::vector<ParseEvent> res{};
	while (auto ev = next()) {
		res.push_back(std::move(*ev));
	}
	return res;
}

md_streamman::EventStream::iterator md_streamman::EventStream::begin() {
	return iterator{ this };
}

md_streamman::EventStream::iterator::iterator(EventStream* stream) : stream_{ stream } {
	++*this;
}

md_streamman::EventStream::iterator& md_streamman::EventStream::iterator::operator++() {
	if (stream_ == nullptr) {
		return *this;
	}
	current_ = stream_->next();
	if (!current_) {
		stream_ = nullptr;
	}
	return *this;
}
