#pragma once

#include "nineslice/core/types.hpp"

#include <cstdint>
#include <vector>

namespace nineslice::exporting {

// Destination-write capability the exporter delegates to. Implementations
// throw on failure; the exporter turns that into ExportIOError.
class ArtifactWriter {
public:
    virtual ~ArtifactWriter() = default;

    virtual void write(const fs::path& destination, const std::vector<uint8_t>& bytes) = 0;
};

// Writes to the local filesystem, creating parent directories as needed.
class FileArtifactWriter : public ArtifactWriter {
public:
    void write(const fs::path& destination, const std::vector<uint8_t>& bytes) override;
};

} // namespace nineslice::exporting
