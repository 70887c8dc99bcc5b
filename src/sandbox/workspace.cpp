/**
 * @file workspace.cpp
 * @brief Workspace implementation.
 * @author Dimitris Kafetzis
 */

#include "sandbox/workspace.hpp"

#include <cstdio>
#include <fstream>
#include <random>
#include <system_error>

namespace sandbox_engine {

namespace {

// Submitted code is readable by the engine's user only.
constexpr auto kDirPerms = std::filesystem::perms::owner_all;
constexpr auto kFilePerms = std::filesystem::perms::owner_read | std::filesystem::perms::owner_write;

std::string random_suffix() {
    thread_local std::mt19937_64 rng{std::random_device{}()};
    char buf[17];
    std::snprintf(buf, sizeof(buf), "%016llx", static_cast<unsigned long long>(rng()));
    return buf;
}

}  // anonymous namespace

Workspace::Workspace(std::filesystem::path path, Logger* logger)
    : path_(std::move(path)), logger_(logger) {}

Result<Workspace> Workspace::create(const std::filesystem::path& root,
                                    std::string_view name,
                                    Logger* logger) {
    std::error_code ec;
    std::filesystem::create_directories(root, ec);
    if (ec) {
        return Error{ErrorCode::Internal,
                     "Cannot create workspace root " + root.string() + ": " + ec.message()};
    }

    auto dir = root / (std::string(name) + "-" + random_suffix());
    if (!std::filesystem::create_directory(dir, ec) || ec) {
        return Error{ErrorCode::Internal,
                     "Cannot create workspace " + dir.string() + ": "
                     + (ec ? ec.message() : std::string("already exists"))};
    }
    Workspace workspace(std::move(dir), logger);
    std::filesystem::permissions(workspace.path(), kDirPerms, ec);
    if (ec) {
        return Error{ErrorCode::Internal,
                     "Cannot restrict workspace " + workspace.path().string() + ": " + ec.message()};
    }
    return std::move(workspace);
}

Workspace::~Workspace() {
    remove();
}

Workspace::Workspace(Workspace&& other) noexcept
    : path_(std::move(other.path_)), logger_(other.logger_) {
    other.path_.clear();
}

Workspace& Workspace::operator=(Workspace&& other) noexcept {
    if (this != &other) {
        remove();
        path_ = std::move(other.path_);
        logger_ = other.logger_;
        other.path_.clear();
    }
    return *this;
}

Result<std::filesystem::path> Workspace::write_file(std::string_view file_name,
                                                    std::string_view content) {
    if (path_.empty()) {
        return Error{ErrorCode::Internal, "Workspace already removed"};
    }

    auto file = path_ / std::string(file_name);
    std::ofstream out(file, std::ios::binary | std::ios::trunc);
    if (!out) {
        return Error{ErrorCode::Internal, "Cannot open " + file.string()};
    }
    std::error_code ec;
    std::filesystem::permissions(file, kFilePerms, ec);
    if (ec) {
        return Error{ErrorCode::Internal, "Cannot restrict " + file.string() + ": " + ec.message()};
    }
    out.write(content.data(), static_cast<std::streamsize>(content.size()));
    out.close();
    if (!out) {
        return Error{ErrorCode::Internal, "Cannot write " + file.string()};
    }
    return file;
}

void Workspace::remove() noexcept {
    if (path_.empty()) return;

    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
    if (ec && logger_) {
        logger_->warn("Workspace cleanup failed for " + path_.string() + ": " + ec.message());
    }
    path_.clear();
}

}  // namespace sandbox_engine
