#include "infrastructure/DiskSpaceProbe.hpp"
#include "domain/PipelineErrors.hpp"
#include <filesystem>
#include <iostream>
#include <limits>

namespace streamscribe::infrastructure {

namespace fs = std::filesystem;

std::uintmax_t DiskSpaceProbe::availableBytes(const std::string& path) const {
    std::error_code ec;
    fs::space_info info = fs::space(path, ec);
    if (ec) {
        // Unknown free space must not stop the pipeline on its own.
        std::cerr << "[DiskSpaceProbe] Cannot query free space on " << path << ": " << ec.message() << std::endl;
        return std::numeric_limits<std::uintmax_t>::max();
    }
    return info.available;
}

void DiskSpaceProbe::ensureAvailable(const std::string& path, std::uintmax_t thresholdBytes) const {
    if (thresholdBytes == 0) {
        return;
    }
    std::uintmax_t available = availableBytes(path);
    if (available < thresholdBytes) {
        throw domain::DiskLowError(path, available, thresholdBytes);
    }
}

} // namespace streamscribe::infrastructure
