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
#include <spdlog/spdlog.h>
#include "Orchestrator.h"

using mdsm_impl::Verdict;

namespace {
	std::string joinCells(const std::vector<std::string>& cells) {
		std::string row{};
		for (size_t i = 0; i < cells.size(); ++i) {
			if (i != 0) {
				row.append(" | ");
			}
			row.append(cells[i]);
		}
		return row;
	}
}

md_streamman::impl::Orchestrator::Orchestrator(ParserConfig config)
	: config_{ normalizeConfig(std::move(config)) },
	events_{},
	detector_{ config_ },
	annotations_{ config_ },
	elements_{ config_, events_ },
	inlineOpts_{
		config_.isEnabled(ElementType::Code),
		config_.isEnabled(ElementType::Strikethrough),
		config_.isEnabled(ElementType::Strong),
		config_.isEnabled(ElementType::Emphasis),
		config_.isEnabled(ElementType::Link),
		config_.isEnabled(ElementType::Math) },
	buffer_{},
	consumed_{ 0 },
	atLineStart_{ true },
	active_{},
	lineRaw_{},
	lineStreamed_{ 0 },
	lineHalted_{ false },
	lineOffset_{ 0 },
	started_{ false },
	finished_{ false },
	completionPending_{ false } {}

void md_streamman::impl::Orchestrator::append(std::string_view text) {
	if (consumed_ != 0) {
		buffer_.erase(0, consumed_);
		consumed_ = 0;
	}
	buffer_.append(text);
	started_ = true;
}

bool md_streamman::impl::Orchestrator::pull(ParseEvent& out, bool finalizing) {
	while (events_.empty()) {
		if (step(finalizing)) {
			continue;
		}
		if (finalizing and completionPending_) {
			completionPending_ = false;
			finalize();
			continue;
		}
		return false;
	}
	out = std::move(events_.front());
	events_.pop_front();
	return true;
}

void md_streamman::impl::Orchestrator::requestCompletion() noexcept {
	finished_ = true;
	completionPending_ = true;
}

void md_streamman::impl::Orchestrator::reset() {
	events_.clear();
	elements_.reset();
	annotations_.reset();
	buffer_.clear();
	consumed_ = 0;
	atLineStart_ = true;
	active_.reset();
	lineRaw_.clear();
	lineStreamed_ = 0;
	lineHalted_ = false;
	lineOffset_ = 0;
	started_ = false;
	finished_ = false;
	completionPending_ = false;
}

bool md_streamman::impl::Orchestrator::step(bool endOfInput) {
	// never look at a code point that is still being delivered
	const size_t limit = endOfInput ? buffer_.size() : mdsm_impl::completeUtf8Prefix(buffer_);
	if (consumed_ >= limit) {
		return false;
	}
	std::string_view avail{ buffer_.data() + consumed_, limit - consumed_ };
	if (atLineStart_) {
		if (active_ and active_->fence) {
			return stepFenceLine(avail, endOfInput);
		}
		return stepLineStart(avail, endOfInput);
	}
	return stepMidLine(avail, endOfInput);
}

bool md_streamman::impl::Orchestrator::stepLineStart(std::string_view avail, bool endOfInput) {
	mdsm_impl::LineWindow win{ avail, endOfInput };
	const mdsm_impl::LineView line = *win.line(0);

	switch (mdsm_impl::tryBlankLine(line)) {
	case Verdict::NeedMoreInput:
		return waitOrForce(avail, endOfInput);
	case Verdict::Matched:
		consumed_ += win.lineEnd(0);
		onBlankLine();
		return true;
	case Verdict::NoMatch:
		break;
	}

	if (active_ and active_->type == ElementType::Quote) {
		auto [v, len] = mdsm_impl::tryBlockQuote(line);
		if (v == Verdict::NeedMoreInput) {
			return waitOrForce(avail, endOfInput);
		}
		if (v == Verdict::Matched) {
			consumed_ += len;
			elements_.append(active_->id, "\n");
			beginLine();
			atLineStart_ = false;
			return true;
		}
		closeActive();
	}

	if (active_ and active_->type == ElementType::Table) {
		if (!line.complete) {
			size_t lead = line.text.find_first_not_of(" \t");
			if (lead != std::string_view::npos and line.text[lead] == '|') {
				return waitOrForce(avail, endOfInput);
			}
			closeActive();
		}
		else if (mdsm_impl::isTableRow(line.text)) {
			appendTableRow(line.text);
			consumed_ += win.lineEnd(0);
			return true;
		}
		else {
			closeActive();
		}
	}

	Detection d = detector_.detect(avail, endOfInput);
	if (d.verdict == Verdict::NeedMoreInput) {
		return waitOrForce(avail, endOfInput);
	}
	if (d.verdict == Verdict::Matched) {
		closeActive();
		openDetected(d, win);
		return true;
	}

	if (active_ and active_->type == ElementType::Text) {
		elements_.append(active_->id, std::string(active_->pendingBlankLines + 1, '\n'));
		active_->pendingBlankLines = 0;
	}
	else {
		closeActive();
		openParagraph();
	}
	beginLine();
	atLineStart_ = false;
	return true;
}

bool md_streamman::impl::Orchestrator::stepFenceLine(std::string_view avail, bool endOfInput) {
	mdsm_impl::LineWindow win{ avail, endOfInput };
	Verdict v = mdsm_impl::tryFenceCloser(*win.line(0), *active_->fence);
	if (v == Verdict::NeedMoreInput) {
		if (avail.size() <= config_.maxBufferSize) {
			return false;
		}
		spdlog::warn("fence candidate of {} bytes exceeds maxBufferSize; keeping it as content", avail.size());
		v = Verdict::NoMatch;
	}
	if (v == Verdict::Matched) {
		consumed_ += win.lineEnd(0);
		closeActive();
		return true;
	}
	if (active_->bodyLines != 0) {
		elements_.append(active_->id, "\n");
	}
	++active_->bodyLines;
	atLineStart_ = false;
	return true;
}

bool md_streamman::impl::Orchestrator::stepMidLine(std::string_view avail, bool endOfInput) {
	if (!active_) {
		openParagraph();
		beginLine();
	}
	size_t nl = avail.find('\n');

	if (active_->fence) {
		if (nl != std::string_view::npos) {
			auto body = avail.substr(0, nl);
			if (!body.empty() and body.back() == '\r') {
				body.remove_suffix(1);
			}
			elements_.append(active_->id, body);
			consumed_ += nl + 1;
			atLineStart_ = true;
			return true;
		}
		auto body = avail;
		if (body.back() == '\r') {
			// may be the first half of a CRLF
			if (!endOfInput and body.size() == 1) {
				return false;
			}
			body.remove_suffix(1);
			consumed_ += endOfInput ? 1 : 0;
		}
		elements_.append(active_->id, body);
		consumed_ += body.size();
		return true;
	}

	if (nl != std::string_view::npos) {
		lineRaw_.append(avail.substr(0, nl));
		consumed_ += nl + 1;
		commitLine();
		atLineStart_ = true;
		if (active_->singleLine) {
			closeActive();
		}
		return true;
	}
	lineRaw_.append(avail);
	consumed_ += avail.size();
	streamSafePrefix();
	if (lineRaw_.size() - lineStreamed_ > config_.maxBufferSize) {
		spdlog::warn("unterminated line of {} bytes exceeds maxBufferSize; committing it early", lineRaw_.size());
		commitLine();
	}
	return true;
}

bool md_streamman::impl::Orchestrator::waitOrForce(std::string_view avail, bool endOfInput) {
	if (!endOfInput and avail.size() <= config_.maxBufferSize) {
		return false;
	}
	size_t cut = avail.size();
	if (!endOfInput) {
		spdlog::warn("no block boundary within maxBufferSize ({} bytes); flushing the prefix as text", config_.maxBufferSize);
		cut = mdsm_impl::completeUtf8Prefix(avail.substr(0, config_.maxBufferSize));
		if (cut == 0) {
			cut = mdsm_impl::codepointPrefix(avail, 1);
		}
	}
	closeActive();
	auto prefix = avail.substr(0, cut);
	std::string id = elements_.begin(ElementType::Text, Metadata::object(), {}, {}, false);
	elements_.append(id, prefix);
	elements_.end(id);
	consumed_ += cut;
	atLineStart_ = prefix.back() == '\n';
	return true;
}

void md_streamman::impl::Orchestrator::openParagraph() {
	std::string id = elements_.begin(ElementType::Text, Metadata::object(), {}, {}, !config_.preserveWhitespace);
	active_ = ActiveBlock{ std::move(id), ElementType::Text, true, false, std::nullopt, 0, 0, std::nullopt, {}, 0 };
}

void md_streamman::impl::Orchestrator::openDetected(const Detection& d, const mdsm_impl::LineWindow& win) {
	if (d.atomic) {
		emitAtomic(d);
		consumed_ += d.consumed;
		return;
	}
	if (d.table) {
		openTable(d, win);
		consumed_ += d.consumed;
		return;
	}
	if (d.fence) {
		std::string id = elements_.begin(d.type, d.metadata, d.startMarker, d.endMarker, false);
		active_ = ActiveBlock{ std::move(id), d.type, false, false, d.fence, 0, 0, std::nullopt, {}, 0 };
		consumed_ += d.consumed;
		return;
	}
	std::string id = elements_.begin(d.type, d.metadata, d.startMarker, d.endMarker, !config_.preserveWhitespace);
	const bool singleLine = d.type != ElementType::Quote;
	active_ = ActiveBlock{ std::move(id), d.type, true, singleLine, std::nullopt, 0, 0, std::nullopt, {}, 0 };
	consumed_ += d.consumed;
	beginLine();
	atLineStart_ = false;
}

void md_streamman::impl::Orchestrator::emitAtomic(const Detection& d) {
	std::string id = elements_.begin(d.type, d.metadata, d.startMarker, d.endMarker, false);
	elements_.append(id, d.content);
	elements_.end(id);
}

void md_streamman::impl::Orchestrator::openTable(const Detection& d, const mdsm_impl::LineWindow& win) {
	const TableInfo& info = *d.table;
	std::string tableId = elements_.begin(ElementType::Table, d.metadata, d.startMarker, d.endMarker, false);
	std::string text{ mdsm_impl::trimView(win.line(0)->text) };
	text.push_back('\n');
	text.append(mdsm_impl::trimView(win.line(1)->text));
	elements_.append(tableId, text);

	std::string tbodyId{};
	if (config_.tableOutputMode == TableOutputMode::Structured) {
		std::string theadId = elements_.begin(ElementType::THead, Metadata{ { "parentId", tableId } }, {}, {}, false);
		elements_.append(theadId, joinCells(info.headerCells));
		emitRow(theadId, info.headerCells, 0, info.alignments);
		elements_.end(theadId);
		tbodyId = elements_.begin(ElementType::TBody, Metadata{ { "parentId", tableId } }, {}, {}, false);
	}
	active_ = ActiveBlock{ std::move(tableId), ElementType::Table, false, false, std::nullopt, 0, 0, info, std::move(tbodyId), 0 };
}

void md_streamman::impl::Orchestrator::appendTableRow(std::string_view line) {
	std::string text{ "\n" };
	text.append(mdsm_impl::trimView(line));
	elements_.append(active_->id, text);
	if (active_->tbodyId.empty()) {
		return;
	}
	auto cells = mdsm_impl::splitTableRow(line);
	cells.resize(active_->table->headerCells.size());
	if (active_->rowIndex != 0) {
		elements_.append(active_->tbodyId, "\n");
	}
	elements_.append(active_->tbodyId, joinCells(cells));
	emitRow(active_->tbodyId, cells, ++active_->rowIndex, active_->table->alignments);
}

void md_streamman::impl::Orchestrator::emitRow(const std::string& parentId, const std::vector<std::string>& cells, size_t index, const std::vector<ColumnAlignment>& aligns) {
	std::string rowId = elements_.begin(ElementType::Row, Metadata{ { "index", index }, { "parentId", parentId } }, {}, {}, false);
	for (size_t i = 0; i < cells.size(); ++i) {
		Metadata meta{ { "index", i }, { "parentId", rowId } };
		meta["alignment"] = i < aligns.size() ? alignmentName(aligns[i]) : nlohmann::json(nullptr);
		std::string colId = elements_.begin(ElementType::Col, std::move(meta), {}, {}, false);
		elements_.append(colId, cells[i]);
		elements_.end(colId);
	}
	elements_.append(rowId, joinCells(cells));
	elements_.end(rowId);
}

void md_streamman::impl::Orchestrator::onBlankLine() {
	if (active_ and active_->type == ElementType::Text and !config_.splitParagraphs) {
		++active_->pendingBlankLines;
		return;
	}
	closeActive();
}

void md_streamman::impl::Orchestrator::closeActive() {
	if (!active_) {
		return;
	}
	ActiveBlock blk = std::move(*active_);
	active_.reset();
	if (!blk.tbodyId.empty()) {
		elements_.end(blk.tbodyId);
	}
	elements_.end(blk.id);
	annotations_.forget(blk.id);
}

void md_streamman::impl::Orchestrator::finalize() {
	if (active_ and active_->inlineContent and !atLineStart_) {
		commitLine();
	}
	closeActive();
	buffer_.clear();
	consumed_ = 0;
	atLineStart_ = true;
	beginLine();
}

void md_streamman::impl::Orchestrator::beginLine() {
	lineRaw_.clear();
	lineStreamed_ = 0;
	lineHalted_ = false;
	lineOffset_ = active_ ? elements_.content(active_->id).size() : 0;
}

void md_streamman::impl::Orchestrator::streamSafePrefix() {
	if (lineHalted_) {
		return;
	}
	// an inline marker may still turn into a construct, so stop before it
	const bool heading = active_->type == ElementType::Header;
	size_t i = lineStreamed_;
	while (i < lineRaw_.size() and !mdsm_impl::isInlineSpecial(lineRaw_[i]) and lineRaw_[i] != '\r'
		and !(heading and lineRaw_[i] == '#')) {
		++i;
	}
	if (i < lineRaw_.size()) {
		lineHalted_ = true;
	}
	if (i > lineStreamed_) {
		elements_.append(active_->id, std::string_view{ lineRaw_ }.substr(lineStreamed_, i - lineStreamed_));
		lineStreamed_ = i;
	}
}

void md_streamman::impl::Orchestrator::commitLine() {
	if (!lineRaw_.empty() and lineRaw_.back() == '\r') {
		lineRaw_.pop_back();
	}
	if (active_->type == ElementType::Header) {
		lineRaw_.resize(mdsm_impl::atxContentLength(lineRaw_));
	}
	const std::string id = active_->id;
	const bool preserve = config_.inlineEmphasisMode == InlineEmphasisMode::Preserve;
	auto segments = mdsm_impl::scanInline(lineRaw_, inlineOpts_);
	size_t skip = lineStreamed_;
	std::vector<LinkSpan> links{};

	for (const auto& seg : segments) {
		if (seg.type == ElementType::Text) {
			auto run = seg.raw;
			size_t k = std::min(skip, run.size());
			run.remove_prefix(k);
			skip -= k;
			if (!run.empty()) {
				elements_.append(id, run);
			}
			continue;
		}
		ContentSpan span = elements_.append(id, preserve ? seg.raw : seg.inner);
		elements_.flush(id);

		Metadata meta{ { "parentId", id }, { "start", span.start }, { "end", span.end } };
		if (seg.type == ElementType::Link) {
			meta["url"] = std::string{ seg.url };
			meta["title"] = std::string{ seg.inner };
			links.push_back({ span.start, span.end, std::string{ seg.url }, std::string{ seg.inner } });
		}
		else if (seg.type == ElementType::Code or seg.type == ElementType::Math) {
			meta["inline"] = true;
		}
		std::string marker = seg.type == ElementType::Math ? "$" : "";
		std::string childId = elements_.begin(seg.type, std::move(meta), marker, marker, false);
		elements_.append(childId, seg.inner);
		elements_.end(childId);
	}

	auto content = elements_.content(id);
	auto slice = content.substr(std::min(lineOffset_, content.size()));
	for (auto& a : annotations_.extract(id, slice, lineOffset_, links)) {
		elements_.annotate(id, std::move(a));
	}

	lineRaw_.clear();
	lineStreamed_ = 0;
	lineHalted_ = false;
	lineOffset_ = elements_.content(id).size();
}
