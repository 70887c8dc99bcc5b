/**
 * @file types.cpp
 * @brief Language tag parsing.
 * @author Dimitris Kafetzis
 */

#include "core/types.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <utility>

namespace sandbox_engine {

namespace {

constexpr std::array<std::pair<std::string_view, Language>, 16> kLanguageTags{{
    {"javascript", Language::JavaScript},
    {"js",         Language::JavaScript},
    {"node",       Language::JavaScript},
    {"typescript", Language::TypeScript},
    {"ts",         Language::TypeScript},
    {"python",     Language::Python},
    {"py",         Language::Python},
    {"java",       Language::Java},
    {"cpp",        Language::Cpp},
    {"c++",        Language::Cpp},
    {"cxx",        Language::Cpp},
    {"c",          Language::C},
    {"go",         Language::Go},
    {"golang",     Language::Go},
    {"rust",       Language::Rust},
    {"rs",         Language::Rust},
}};

}  // anonymous namespace

Result<Language> parse_language(std::string_view tag) {
    std::string lowered(tag);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    for (const auto& [name, lang] : kLanguageTags) {
        if (lowered == name) return lang;
    }
    return Error{ErrorCode::UnsupportedLanguage,
                 "Unsupported language: " + std::string(tag)};
}

}  // namespace sandbox_engine
