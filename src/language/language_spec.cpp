//===----------------------------------------------------------------------===//
//                         runnerd
//
// language/language_spec.cpp
//
// Language table
//===----------------------------------------------------------------------===//

#include "language/language_spec.hpp"
#include "common.hpp"
#include <algorithm>
#include <cctype>
#include <regex>

namespace runnerd {

namespace {

const std::vector<LanguageSpec>& LanguageTable() {
    static const std::vector<LanguageSpec> table = {
        {"python", "py",   "user_code", "python3 -u {file}", false, false},
        {"c",      "c",    "user_code", "gcc -fdiagnostics-color=never {file} -o main && ./main", false, false},
        {"cpp",    "cpp",  "user_code", "g++ -fdiagnostics-color=never {file} -o main && ./main", false, false},
        {"java",   "java", "user_code", "javac {file} && java {stem}", true, false},
        {"js",     "js",   "user_code", "node {file}", false, false},
        {"php",    "php",  "user_code", "php {file}", false, false},
        {"sql",    "sql",  "user_code", "", false, true},
    };
    return table;
}

void ReplaceAll(std::string& text, const std::string& from, const std::string& to) {
    size_t pos = 0;
    while ((pos = text.find(from, pos)) != std::string::npos) {
        text.replace(pos, from.size(), to);
        pos += to.size();
    }
}

} // anonymous namespace

const LanguageSpec* FindLanguage(const std::string& key) {
    for (const auto& spec : LanguageTable()) {
        if (spec.key == key) {
            return &spec;
        }
    }
    return nullptr;
}

std::vector<std::string> SupportedLanguages() {
    std::vector<std::string> keys;
    for (const auto& spec : LanguageTable()) {
        keys.push_back(spec.key);
    }
    return keys;
}

std::string NormalizeLanguageKey(const std::string& key) {
    auto begin = key.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return DEFAULT_LANGUAGE;
    }
    auto end = key.find_last_not_of(" \t\r\n");
    std::string lower = key.substr(begin, end - begin + 1);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower;
}

std::string FindEntrySymbol(const std::string& source) {
    static const std::regex pattern(R"(public\s+class\s+([A-Za-z_]\w*))");
    std::smatch match;
    if (std::regex_search(source, match, pattern)) {
        return match[1].str();
    }
    return "";
}

std::string ExpandCommand(const std::string& command_template,
                          const std::string& file,
                          const std::string& stem) {
    std::string command = command_template;
    ReplaceAll(command, "{file}", ShellQuote(file));
    ReplaceAll(command, "{stem}", ShellQuote(stem));
    return command;
}

std::string ShellQuote(const std::string& value) {
    if (!value.empty() &&
        std::all_of(value.begin(), value.end(), [](unsigned char c) {
            return std::isalnum(c) || c == '_' || c == '-' || c == '.' || c == '/';
        })) {
        return value;
    }

    std::string quoted = "'";
    for (char c : value) {
        if (c == '\'') {
            quoted += "'\"'\"'";
        } else {
            quoted += c;
        }
    }
    quoted += "'";
    return quoted;
}

} // namespace runnerd
