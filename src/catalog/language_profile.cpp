/**
 * @file language_profile.cpp
 * @brief Built-in language catalog.
 * @author Dimitris Kafetzis
 */

#include "catalog/language_profile.hpp"

#include <algorithm>

namespace sandbox_engine {

namespace {

std::vector<LanguageProfile> builtin_profiles() {
    using Rule = FileNaming::Rule;
    return {
        LanguageProfile{
            .language = Language::JavaScript,
            .backend = IsolationBackend::InProcess,
            .image = "",
            .naming = {Rule::Fixed, "main.js", ""},
            .compile_command = std::nullopt,
            .run_command = "",
        },
        LanguageProfile{
            .language = Language::TypeScript,
            .backend = IsolationBackend::InProcess,
            .image = "",
            .naming = {Rule::Fixed, "main.ts", ""},
            .compile_command = std::nullopt,
            .run_command = "",
            .requires_transpile = true,
        },
        LanguageProfile{
            .language = Language::Python,
            .backend = IsolationBackend::Container,
            .image = "python:3.11-alpine",
            .naming = {Rule::Fixed, "main.py", ""},
            .compile_command = std::nullopt,
            .run_command = "python3 -u {source}",
        },
        LanguageProfile{
            .language = Language::Java,
            .backend = IsolationBackend::Container,
            .image = "eclipse-temurin:17-jdk-alpine",
            .naming = {Rule::TypeNameMatch, "Main.java", "Main"},
            .compile_command = "javac -d {out} {source}",
            .run_command = "java -cp {out} Main",
        },
        LanguageProfile{
            .language = Language::Cpp,
            .backend = IsolationBackend::Container,
            .image = "gcc:13",
            .naming = {Rule::Fixed, "main.cpp", ""},
            .compile_command = "g++ -std=c++17 -O2 -o {out}/main {source}",
            .run_command = "{out}/main",
        },
        LanguageProfile{
            .language = Language::C,
            .backend = IsolationBackend::Container,
            .image = "gcc:13",
            .naming = {Rule::Fixed, "main.c", ""},
            .compile_command = "gcc -O2 -o {out}/main {source} -lm",
            .run_command = "{out}/main",
        },
        LanguageProfile{
            .language = Language::Go,
            .backend = IsolationBackend::Container,
            .image = "golang:1.21-alpine",
            .naming = {Rule::Fixed, "main.go", ""},
            .compile_command = "GOCACHE={out}/cache go build -o {out}/main {source}",
            .run_command = "{out}/main",
        },
        LanguageProfile{
            .language = Language::Rust,
            .backend = IsolationBackend::Container,
            .image = "rust:1-alpine",
            .naming = {Rule::Fixed, "main.rs", ""},
            .compile_command = "rustc -O -o {out}/main {source}",
            .run_command = "{out}/main",
        },
    };
}

void replace_all(std::string& text, std::string_view token, std::string_view value) {
    size_t pos = 0;
    while ((pos = text.find(token, pos)) != std::string::npos) {
        text.replace(pos, token.size(), value);
        pos += value.size();
    }
}

}  // anonymous namespace

const LanguageCatalog& LanguageCatalog::instance() {
    static const LanguageCatalog catalog(builtin_profiles());
    return catalog;
}

LanguageCatalog::LanguageCatalog(std::vector<LanguageProfile> profiles)
    : profiles_(std::move(profiles)) {}

Result<const LanguageProfile*> LanguageCatalog::lookup(Language language) const {
    auto it = std::find_if(profiles_.begin(), profiles_.end(),
                           [language](const LanguageProfile& p) { return p.language == language; });
    if (it == profiles_.end()) {
        return Error{ErrorCode::UnsupportedLanguage,
                     "No profile registered for language: " + std::string(to_string(language))};
    }
    return &*it;
}

std::string LanguageCatalog::source_path(const LanguageProfile& profile) {
    return std::string(kSourceDir) + "/" + profile.naming.file_name;
}

std::string LanguageCatalog::render(std::string_view command_template,
                                    const LanguageProfile& profile) {
    std::string out(command_template);
    replace_all(out, "{source}", source_path(profile));
    replace_all(out, "{out}", kScratchDir);
    return out;
}

std::string LanguageCatalog::entry_command(const LanguageProfile& profile,
                                           const std::optional<std::string>& stdin_file) {
    std::string cmd = "mkdir -p " + std::string(kScratchDir);
    if (profile.compile_command) {
        cmd += " && " + render(*profile.compile_command, profile);
    }
    cmd += " && " + render(profile.run_command, profile);
    if (stdin_file) {
        cmd += " < " + std::string(kSourceDir) + "/" + *stdin_file;
    }
    return cmd;
}

}  // namespace sandbox_engine
