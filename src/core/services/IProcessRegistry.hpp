/**
 * @file IProcessRegistry.hpp
 * @brief Interface for enumerating and terminating processes by name.
 */

#pragma once

#include <memory>
#include <string>
#include <sys/types.h>
#include <vector>

namespace relaunch::core {

/**
 * @brief Handle to a live process obtained from an IProcessRegistry.
 *
 * Destroying the handle releases it.
 */
class IProcessHandle {
public:
    virtual ~IProcessHandle() = default;

    virtual pid_t id() const = 0;

    /**
     * @brief Forcibly terminates the process.
     *
     * A process that has already exited is not an error.
     * @throws std::system_error if the signal cannot be delivered.
     */
    virtual void terminate() = 0;
};

/**
 * @brief Host process table, injected so tests can substitute a fake one.
 *
 * @note Matching by name is environment-dependent: unrelated programs that
 *       share the name are matched as well.
 */
class IProcessRegistry {
public:
    virtual ~IProcessRegistry() = default;

    /**
     * @brief Lists live processes whose executable matches the name.
     * @param name Application name to match.
     * @return Handles to the matching processes, including the caller if it matches.
     */
    virtual std::vector<std::unique_ptr<IProcessHandle>> findByName(const std::string& name) = 0;

    virtual pid_t currentProcessId() const = 0;

    /**
     * @brief Returns the file name of the running executable, or an empty string.
     */
    virtual std::string currentExecutableName() const = 0;
};

} // namespace relaunch::core
