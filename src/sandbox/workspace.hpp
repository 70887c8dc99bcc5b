/**
 * @file workspace.hpp
 * @brief Per-execution temporary directory, removed on destruction.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "core/logger.hpp"
#include "core/result.hpp"

#include <filesystem>
#include <string>
#include <string_view>

namespace sandbox_engine {

class Workspace {
public:
    /// Create `<root>/<name>-<random>`; `root` is created if missing.
    static Result<Workspace> create(const std::filesystem::path& root,
                                    std::string_view name,
                                    Logger* logger = nullptr);

    ~Workspace();

    Workspace(Workspace&& other) noexcept;
    Workspace& operator=(Workspace&& other) noexcept;
    Workspace(const Workspace&) = delete;
    Workspace& operator=(const Workspace&) = delete;

    /// Write `content` to `<workspace>/<file_name>`.
    Result<std::filesystem::path> write_file(std::string_view file_name, std::string_view content);

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

    /// Remove the directory tree now. Failures are logged, never thrown.
    void remove() noexcept;

private:
    Workspace(std::filesystem::path path, Logger* logger);

    std::filesystem::path path_;
    Logger* logger_ = nullptr;
};

}  // namespace sandbox_engine
