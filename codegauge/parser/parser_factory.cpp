#include "parser_factory.hpp"
#include "parser/languages/cpp_parser.hpp"
#include "parser/languages/python_parser.hpp"
#include <algorithm>
#include <filesystem>
#include <spdlog/spdlog.h>

namespace codegauge::parser {

ParserFactory ParserFactory::with_builtin_languages() {
    ParserFactory factory;
    factory.register_parser<languages::PythonParser>();
    factory.register_parser<languages::CppParser>();
    return factory;
}

void ParserFactory::register_parser(std::unique_ptr<ParserBase> parser) {
    if (!parser) {
        spdlog::error("Attempting to register null parser");
        return;
    }

    auto language_name = parser->get_language_name();
    auto extensions = parser->get_extensions();

    // Store the prototype
    parsers_[language_name] = std::move(parser);

    // Register extensions
    for (const auto& ext : extensions) {
        extensions_[ext] = language_name;
    }
    spdlog::debug("Registered {} parser ({} extensions)", language_name, extensions.size());
}

std::unique_ptr<ParserBase> ParserFactory::create_parser(const std::string &language) const {
    auto it = parsers_.find(language);
    if (it == parsers_.end()) {
        return nullptr;
    }

    auto parser = it->second->clone();
    if (!parser->initialize()) {
        spdlog::error("Failed to initialize {} parser", language);
        return nullptr;
    }
    return parser;
}

std::string ParserFactory::detect_language(const std::string& file_path) const {
    std::string ext = std::filesystem::path(file_path).extension().string();
    if (ext.empty()) return "";

    // Remove the dot from extension
    if (ext[0] == '.') {
        ext = ext.substr(1);
    }

    auto it = extensions_.find(ext);
    if (it != extensions_.end()) {
        spdlog::debug("Language detected: {} for file: {}", it->second, file_path);
        return it->second;
    }
    return "";
}

std::vector<std::string> ParserFactory::get_supported_languages() const {
    std::vector<std::string> languages;
    languages.reserve(parsers_.size());
    for (const auto& [lang, _] : parsers_) {
        languages.push_back(lang);
    }
    std::sort(languages.begin(), languages.end());
    return languages;
}

std::vector<std::string> ParserFactory::get_supported_extensions() const {
    std::vector<std::string> extensions;
    extensions.reserve(extensions_.size());
    for (const auto& [ext, _] : extensions_) {
        extensions.push_back(ext);
    }
    std::sort(extensions.begin(), extensions.end());
    return extensions;
}

} // namespace codegauge::parser
