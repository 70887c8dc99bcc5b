/**
 * @file language_profile.hpp
 * @brief Per-language build/run descriptors and the static catalog.
 * @author Dimitris Kafetzis
 *
 * The catalog is initialized once and read-only afterwards. Backends are
 * generic over LanguageProfile: adding a language is a data change.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace sandbox_engine {

enum class IsolationBackend : uint8_t {
    InProcess,   ///< Restricted interpreter inside this process
    Container    ///< Ephemeral container per execution
};

[[nodiscard]] constexpr std::string_view to_string(IsolationBackend backend) noexcept {
    switch (backend) {
        case IsolationBackend::InProcess: return "in_process";
        case IsolationBackend::Container: return "container";
    }
    return "unknown";
}

/**
 * @brief How the source file must be named inside the workspace.
 *
 * TypeNameMatch marks languages whose compiler requires the file name to
 * equal the public type it declares. The type name is a fixed convention
 * (`type_name`), never inferred from the submitted code.
 */
struct FileNaming {
    enum class Rule : uint8_t { Fixed, TypeNameMatch } rule = Rule::Fixed;
    std::string file_name;
    std::string type_name;   ///< Only meaningful for TypeNameMatch
};

/**
 * @brief Build/run descriptor for one language.
 *
 * Command templates may reference `{source}` (absolute path of the source
 * file inside the unit) and `{out}` (writable scratch directory).
 */
struct LanguageProfile {
    Language language = Language::JavaScript;
    IsolationBackend backend = IsolationBackend::Container;
    std::string image;                            ///< Runtime/image reference ("" for in-process)
    FileNaming naming;
    std::optional<std::string> compile_command;
    std::string run_command;
    bool requires_transpile = false;              ///< In-process family needing a source transform
};

/**
 * @brief Static read-only map from language to profile.
 */
class LanguageCatalog {
public:
    static constexpr std::string_view kSourceDir = "/code";
    static constexpr std::string_view kScratchDir = "/tmp/build";

    /// The process-wide catalog.
    static const LanguageCatalog& instance();

    /// Build a catalog from explicit entries (tests).
    explicit LanguageCatalog(std::vector<LanguageProfile> profiles);

    [[nodiscard]] Result<const LanguageProfile*> lookup(Language language) const;
    [[nodiscard]] const std::vector<LanguageProfile>& profiles() const noexcept { return profiles_; }

    /// Absolute path of the source file inside the unit.
    [[nodiscard]] static std::string source_path(const LanguageProfile& profile);

    /// Substitute `{source}` and `{out}` in a command template.
    [[nodiscard]] static std::string render(std::string_view command_template,
                                            const LanguageProfile& profile);

    /**
     * @brief The unit's shell entry command.
     *
     * Chains compile-then-run with `&&` so a compile failure short-circuits
     * with a non-zero exit, and redirects stdin from `stdin_file` if given.
     */
    [[nodiscard]] static std::string entry_command(const LanguageProfile& profile,
                                                   const std::optional<std::string>& stdin_file);

private:
    std::vector<LanguageProfile> profiles_;
};

}  // namespace sandbox_engine
