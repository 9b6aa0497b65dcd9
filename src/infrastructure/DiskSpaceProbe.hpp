/**
 * @file DiskSpaceProbe.hpp
 * @brief Free-space check guarding dispatch and archive writes.
 */

#pragma once
#include <cstdint>
#include <string>

namespace streamscribe::infrastructure {

/**
 * @class DiskSpaceProbe
 * @brief Reports free space on the volume holding a path.
 */
class DiskSpaceProbe {
public:
    virtual ~DiskSpaceProbe() = default;

    /** @brief Bytes available to an unprivileged writer on the volume of @p path. */
    virtual std::uintmax_t availableBytes(const std::string& path) const;

    /**
     * @brief Throws domain::DiskLowError when free space is below @p thresholdBytes.
     * A threshold of zero disables the check.
     */
    void ensureAvailable(const std::string& path, std::uintmax_t thresholdBytes) const;
};

} // namespace streamscribe::infrastructure
