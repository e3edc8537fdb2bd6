#ifndef STRING_PARTS_H
#define STRING_PARTS_H
#include <string_view>
using tgstr = const char*;
using tgsv = std::string_view;

tgstr includes =
"#include \"md_streamman/MDStreamMan.h\"\n#include <gtest/gtest.h>\n#include <map>\n#include <sstream>\n#include <string>\n#include <utility>\n#include <vector>\n\n";

tgstr anonNamespaceBegin = "namespace {\n";
tgstr anonNamespaceEnd = "}\n";

// Parses a document at several chunk sizes and compares the (type, content)
// pairs of every element, in Begin order.
tgstr chunkHelpers =
"    using Pairs = std::vector<std::pair<std::string, std::string>>;\n"
"\n"
"    Pairs pairsOf(const std::vector<md_streamman::ParseEvent>& events) {\n"
"        Pairs res;\n"
"        std::map<std::string, size_t> slot;\n"
"        for (const auto& ev : events) {\n"
"            if (const auto* b = std::get_if<md_streamman::BeginEvent>(&ev)) {\n"
"                slot[b->elementId] = res.size();\n"
"                res.emplace_back(md_streamman::toString(b->elementType), std::string{});\n"
"            }\n"
"            else if (const auto* e = std::get_if<md_streamman::EndEvent>(&ev)) {\n"
"                res[slot.at(e->elementId)].second = e->finalContent;\n"
"            }\n"
"        }\n"
"        return res;\n"
"    }\n"
"\n"
"    Pairs parseInChunks(std::string_view md, size_t chunk) {\n"
"        md_streamman::Parser parser{};\n"
"        std::vector<md_streamman::ParseEvent> events;\n"
"        if (chunk == 0) {\n"
"            for (const auto& ev : parser.processChunk(md)) events.push_back(ev);\n"
"        }\n"
"        else {\n"
"            for (size_t i = 0; i < md.size(); i += chunk) {\n"
"                for (const auto& ev : parser.processChunk(md.substr(i, chunk))) events.push_back(ev);\n"
"            }\n"
"        }\n"
"        for (const auto& ev : parser.complete()) events.push_back(ev);\n"
"        return pairsOf(events);\n"
"    }\n"
"\n"
"    Pairs parseFromStream(std::string_view md, size_t chunk) {\n"
"        md_streamman::Parser parser{};\n"
"        std::istringstream in{ std::string{ md } };\n"
"        return pairsOf(parser.processStream(in, chunk));\n"
"    }\n"
"\n"
"    void expectChunkInvariant(std::string_view md, const Pairs& expected) {\n"
"        for (size_t chunk : { 0, 1, 3, 5, 10 }) {\n"
"            EXPECT_EQ(parseInChunks(md, chunk), expected) << \"chunk size \" << chunk;\n"
"        }\n"
"        EXPECT_EQ(parseFromStream(md, 7), expected) << \"istream, chunk size 7\";\n"
"    }\n";

#endif
