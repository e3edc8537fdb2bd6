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

#include <vector>
#include <string>
#include <fstream>
#include <iostream>
#include <optional>

#include <CLI/CLI.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include "md_streamman/MDStreamMan.h"

namespace mdtrickle {
	enum class in_type : uint8_t {
		File, StdCIn
	};
	struct CmdArgInfo {
		in_type inSource;
		size_t chunkSize = 16;
		bool foldBlocks = false;
		bool verbose = false;
		bool structuredTables = false;
		bool preserveEmphasis = false;
		std::string configFile;
		std::string outFile;
		std::string idPrefix;
	};
}

void configureParser(CLI::App& cmdArgParser, mdtrickle::CmdArgInfo& argInfo);
void parseArgs(const CLI::App& argProcessor, mdtrickle::CmdArgInfo& res);
auto loadConfig(const mdtrickle::CmdArgInfo& argInfo) -> std::optional<md_streamman::ParserConfig>;
bool trickle(md_streamman::Parser& parser, std::istream& in, const mdtrickle::CmdArgInfo& argInfo, std::ostream& out);

int main(int argc, char* argv[])
{
	mdtrickle::CmdArgInfo cmdArgResult{};

	CLI::App argProcessor{ "Feeds markdown to the streaming parser in fixed-size chunks and prints the resulting events.", "mdtrickle" };

	configureParser(argProcessor, cmdArgResult);

	CLI11_PARSE(argProcessor, argc, argv);

	parseArgs(argProcessor, cmdArgResult);

	spdlog::set_default_logger(spdlog::stderr_color_mt("mdtrickle"));
	spdlog::set_level(cmdArgResult.verbose ? spdlog::level::debug : spdlog::level::warn);

	auto config = loadConfig(cmdArgResult);
	if (!config) {
		return 2;
	}

	std::optional<std::ofstream> outFile{};
	std::ostream* out = &std::cout;
	if (!cmdArgResult.outFile.empty()) {
		outFile.emplace(cmdArgResult.outFile);
		if (!*outFile) {
			spdlog::error("cannot open {} for writing", cmdArgResult.outFile);
			return 1;
		}
		out = &*outFile;
	}

	std::optional<md_streamman::Parser> parsey{};
	try {
		parsey.emplace(std::move(*config));
	}
	catch (const md_streamman::ConfigError& e) {
		spdlog::error("invalid configuration: {}", e.what());
		return 2;
	}

	if (cmdArgResult.inSource == mdtrickle::in_type::StdCIn) {
		return trickle(*parsey, std::cin, cmdArgResult, *out) ? 0 : 1;
	}

	int failTally = 0;
	for (const auto& inFilename : argProcessor.remaining()) {
		std::ifstream streamie{ inFilename, std::ios::binary };
		if (!streamie) {
			spdlog::error("file not found; skipping {}", inFilename);
			++failTally;
			continue;
		}
		parsey->reset();
		if (!trickle(*parsey, streamie, cmdArgResult, *out)) {
			++failTally;
		}
	}
	return failTally == 0 ? 0 : 1;
}

void configureParser(CLI::App& cmdArgParser, mdtrickle::CmdArgInfo& argInfo) {
	cmdArgParser.allow_extras();
	cmdArgParser.add_option("-n, --chunk-size", argInfo.chunkSize, "Bytes handed to the parser per call; 0 sends the whole input at once");
	cmdArgParser.add_option("-c, --config", argInfo.configFile, "JSON file with parser options")->check(CLI::ExistingFile);
	cmdArgParser.add_option("-o, --output", argInfo.outFile, "Write output to this file instead of stdout");
	cmdArgParser.add_option("--id-prefix", argInfo.idPrefix, "Prefix for generated element ids");
	cmdArgParser.add_flag("-b, --blocks", argInfo.foldBlocks, "Print one folded record per element instead of raw events");
	cmdArgParser.add_flag("--structured-tables", argInfo.structuredTables, "Emit thead/tbody/row/col elements for tables");
	cmdArgParser.add_flag("--preserve-emphasis", argInfo.preserveEmphasis, "Keep inline markers in element content");
	cmdArgParser.add_flag("-v, --verbose", argInfo.verbose, "Log element lifecycle to stderr");
}

void parseArgs(const CLI::App& argProcessor, mdtrickle::CmdArgInfo& res) {
	if (argProcessor.remaining_size() != 0) {
		res.inSource = mdtrickle::in_type::File;
	}
	else {
		res.inSource = mdtrickle::in_type::StdCIn;
	}
}

auto loadConfig(const mdtrickle::CmdArgInfo& argInfo) -> std::optional<md_streamman::ParserConfig> {
	md_streamman::ParserConfig config{};
	if (!argInfo.configFile.empty()) {
		std::ifstream fileIo{ argInfo.configFile };
		nlohmann::json jcee = nlohmann::json::parse(fileIo, nullptr, false);
		if (jcee.is_discarded()) {
			spdlog::error("{} is not valid JSON", argInfo.configFile);
			return std::nullopt;
		}
		config = md_streamman::configFromJson(jcee);
	}
	if (argInfo.structuredTables) {
		config.tableOutputMode = md_streamman::TableOutputMode::Structured;
	}
	if (argInfo.preserveEmphasis) {
		config.inlineEmphasisMode = md_streamman::InlineEmphasisMode::Preserve;
	}
	if (!argInfo.idPrefix.empty()) {
		config.idPrefix = argInfo.idPrefix;
	}
	return config;
}

bool trickle(md_streamman::Parser& parser, std::istream& in, const mdtrickle::CmdArgInfo& argInfo, std::ostream& out) {
	std::vector<md_streamman::ParseEvent> collected{};
	auto sink = [&](const md_streamman::ParseEvent& ev) {
		if (argInfo.foldBlocks) {
			collected.push_back(ev);
		}
		else {
			out << md_streamman::toJson(ev).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) << '\n';
		}
	};

	if (!parser.processStream(in, argInfo.chunkSize, sink)) {
		return false;
	}

	if (argInfo.foldBlocks) {
		return md_streamman::jsonLinesExport(md_streamman::foldEvents(collected), out);
	}
	return static_cast<bool>(out);
}

