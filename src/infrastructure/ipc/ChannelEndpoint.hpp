#pragma once

#include <filesystem>
#include <string>

namespace relaunch::infra {

/**
 * @brief Resolves the directory holding per-application sockets and lock files.
 * @param configured Directory from configuration; empty selects the default.
 * @return configured if set, otherwise $XDG_RUNTIME_DIR, otherwise /tmp.
 */
std::filesystem::path resolveRuntimeDir(const std::filesystem::path& configured = {});

/**
 * @brief Path of the Unix domain socket for an application.
 * @throws core::ChannelError if the path does not fit into sockaddr_un.
 */
std::filesystem::path socketPathFor(const std::filesystem::path& runtimeDir,
                                    const std::string& applicationName);

/**
 * @brief Path of the exclusivity lock file for an application.
 */
std::filesystem::path lockPathFor(const std::filesystem::path& runtimeDir,
                                  const std::string& applicationName);

} // namespace relaunch::infra
