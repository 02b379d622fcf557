/**
 * @file IExclusivityOracle.hpp
 * @brief Interface answering whether the caller is the first live instance.
 */

#pragma once

#include <string>

namespace relaunch::core {

/**
 * @brief Per-host exclusivity primitive keyed by application name.
 *
 * A positive answer marks the caller as the holder. The claim is released
 * when the holder exits, however it exits.
 */
class IExclusivityOracle {
public:
    virtual ~IExclusivityOracle() = default;

    /**
     * @brief Checks whether this process is the first live holder of the name.
     * @param applicationName Exclusivity key.
     * @return True if the caller holds (or has just acquired) the claim.
     */
    virtual bool isFirstInstance(const std::string& applicationName) = 0;
};

} // namespace relaunch::core
