#include "nineslice/export/artifact_writer.hpp"
#include "nineslice/core/errors.hpp"
#include "nineslice/core/utils.hpp"

#include <system_error>

namespace nineslice::exporting {

void FileArtifactWriter::write(const fs::path& destination, const std::vector<uint8_t>& bytes) {
    const fs::path parent = destination.parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        fs::create_directories(parent, ec);
        if (ec) {
            throw IOError("Cannot create directory " + parent.string() + ": " + ec.message());
        }
    }
    core::write_bytes(destination, bytes);
}

} // namespace nineslice::exporting
