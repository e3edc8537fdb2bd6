#include <iostream>
#include <fstream>
#include <algorithm>
#include <map>
#include <tuple>
#include <nlohmann/json.hpp>
#include <fmt/format.h>
#include <string>
#include "StringParts.h"

std::string outResult(nlohmann::json& jc, int indentLvl);
std::string func(nlohmann::json& jc, int indentLvl);
std::string body_(nlohmann::json::const_iterator it, size_t n, int indentLvl);
std::string expectedPairs(const nlohmann::json& expected);
std::map<nlohmann::json::iterator, size_t> organizeJson(nlohmann::json& root);

template<char OldVal, char NewVal, bool NeedEscape>
void escapeBackslashString(std::string& str);
void escapeForLiteral(std::string& str);
void removeChar(std::string& str, char c);

int main(int argc, char** argv) {
	if (argc != 3) {
		std::cerr << "usage: mdsm_testgen <fixtures.json> <output.cpp>\n";
		return 1;
	}
	nlohmann::json jcee{};
	std::fstream fileIo{ argv[1], std::fstream::in };
	if (!fileIo) {
		std::cerr << "File not found\n";
		return 1;
	}
	jcee = nlohmann::json::parse(fileIo, nullptr, false);
	if (jcee.is_discarded() or !jcee.is_array()) {
		std::cerr << argv[1] << ": expected a JSON array of cases\n";
		return 1;
	}
	for (auto& el : jcee) {
		escapeForLiteral(el["markdown"].get_ref<std::string&>());
		for (auto& pair : el["expected"]) {
			escapeForLiteral(pair[0].get_ref<std::string&>());
			escapeForLiteral(pair[1].get_ref<std::string&>());
		}
	}

	fileIo.close();

	fileIo.open(argv[2], std::fstream::out);
	fileIo << outResult(jcee, 0);
	return fileIo ? 0 : 1;
}

std::string outResult(nlohmann::json& jc, int indentLvl) {
	return std::string{ includes } + anonNamespaceBegin + chunkHelpers + anonNamespaceEnd + "\n" + func(jc, indentLvl);
}

std::string func(nlohmann::json& jc, int indentLvl) {
	std::string testName = "MDSMChunking";
	auto groups = organizeJson(jc);
	std::string res{};
	for (auto it = groups.begin(); it != groups.end(); ++it) {
		std::string body = body_(it->first, it->second, indentLvl + 1);
		std::string section = (*it->first)["section"].get<std::string>();
		removeChar(section, ' ');
		res.append(fmt::format("{0: <{3}}TEST({1}, {2}) {{\n{4}{0: <{3}}}}\n\n", "", testName, section, indentLvl * 4, body));
	}
	return res;
}

std::string body_(nlohmann::json::const_iterator it, size_t n, int indentLvl) {
	std::string res{};
	const std::string section = (*it)["section"].get<std::string>();
	for (size_t i = 0; i < n; ++it) {
		if ((*it)["section"].get<std::string>() != section) {
			continue;
		}
		res.append(fmt::format("{0: <{4}}const Pairs expected{3:0>4d} = {{ {2} }};\n"
			"{0: <{4}}expectChunkInvariant(\"{1}\", expected{3:0>4d});\n\n", "",
			(*it)["markdown"].get<std::string>(), expectedPairs((*it)["expected"]), (*it)["example"].get<unsigned int>(), indentLvl * 4));
		++i;
	}
	return res;
}

std::string expectedPairs(const nlohmann::json& expected) {
	std::string res{};
	for (const auto& pair : expected) {
		if (!res.empty()) {
			res.append(", ");
		}
		res.append(fmt::format("{{ \"{}\", \"{}\" }}", pair[0].get<std::string>(), pair[1].get<std::string>()));
	}
	return res;
}

std::map<nlohmann::json::iterator, size_t> organizeJson(nlohmann::json& root) {
	std::map<nlohmann::json::iterator, size_t> res{};
	std::map<std::string, nlohmann::json::iterator> lookup{};
	for (auto it = root.begin(); it != root.end(); ++it) {
		if (lookup.find((*it)["section"].get_ref<std::string&>()) != lookup.end()) {
			res[lookup[(*it)["section"].get_ref<std::string&>()]]++;
		}
		else {
			lookup.emplace(std::make_pair((*it)["section"].get<std::string>(), it));
			res.emplace(std::make_pair(it, 1ull));
		}
	}
	return res;
}

void escapeForLiteral(std::string& str) {
	escapeBackslashString<'\\', '\\', true>(str);
	escapeBackslashString<'\n', 'n', true>(str);
	escapeBackslashString<'\r', 'r', true>(str);
	escapeBackslashString<'\t', 't', true>(str);
	escapeBackslashString<'"', '"', true>(str);
}

template<char OldVal, char NewVal, bool NeedEscape>
void escapeBackslashString(std::string& str) {
	for (size_t i = 0; i < str.size(); ++i) {
		if (i = str.find(OldVal, i); i != std::string::npos) {
			str[i] = NewVal;
			if (NeedEscape) {
				str.insert(str.begin() + i, '\\');
			}
			++i;
		}
		else {
			break;
		}
	}
}

void removeChar(std::string& str, char c) {
	for (size_t i = 0; i < str.size(); ++i) {
		if (i = str.find(c, i); i != std::string::npos) {
			str.erase(i, 1);
			--i;
		}
		else {
			break;
		}
	}
}
