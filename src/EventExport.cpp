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
#include <ostream>
#include <unordered_map>

auto md_streamman::foldEvents(const std::vector<ParseEvent>& events) -> std::vector<BlockRecord> {
	std::vector<BlockRecord> records{};
	std::unordered_map<std::string, size_t> byId{};

	auto lookup = [&](const std::string& id) -> BlockRecord* {
		auto it = byId.find(id);
		return it == byId.end() ? nullptr : &records[it->second];
	};

	for (const auto& ev : events) {
		if (const auto* b = std::get_if<BeginEvent>(&ev)) {
			std::string parent{};
			if (auto it = b->metadata.find("parentId"); it != b->metadata.end() and it->is_string()) {
				parent = it->get<std::string>();
			}
			byId[b->elementId] = records.size();
			records.push_back({ b->elementId, b->elementType, {}, b->metadata, std::move(parent), {}, false });
		}
		else if (const auto* d = std::get_if<DeltaEvent>(&ev)) {
			if (auto* rec = lookup(d->elementId)) {
				rec->content.append(d->content);
			}
		}
		else if (const auto* e = std::get_if<EndEvent>(&ev)) {
			if (auto* rec = lookup(e->elementId)) {
				rec->content = e->finalContent;
				rec->closed = true;
			}
		}
		else if (const auto* a = std::get_if<AnnotationEvent>(&ev)) {
			if (auto* rec = lookup(a->elementId)) {
				rec->annotations.push_back(a->annotation);
			}
		}
	}
	return records;
}

auto md_streamman::toJson(const BlockRecord& rec) -> nlohmann::json {
	nlohmann::json jc{
		{ "id", rec.id },
		{ "type", toString(rec.type) },
		{ "content", rec.content },
		{ "metadata", rec.metadata },
		{ "closed", rec.closed }
	};
	if (!rec.parentId.empty()) {
		jc["parentId"] = rec.parentId;
	}
	if (!rec.annotations.empty()) {
		auto& arr = jc["annotations"] = nlohmann::json::array();
		for (const auto& a : rec.annotations) {
			arr.push_back(toJson(a));
		}
	}
	return jc;
}

namespace {
	// invalid UTF-8 in content becomes U+FFFD instead of throwing
	auto dumpLine(const nlohmann::json& jc) -> std::string {
		return jc.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
	}
}

bool md_streamman::jsonLinesExport(const std::vector<ParseEvent>& events, std::ostream& out) {
	for (const auto& ev : events) {
		out << dumpLine(toJson(ev)) << '\n';
	}
	return static_cast<bool>(out);
}

bool md_streamman::jsonLinesExport(const std::vector<BlockRecord>& records, std::ostream& out) {
	for (const auto& rec : records) {
		out << dumpLine(toJson(rec)) << '\n';
	}
	return static_cast<bool>(out);
}
