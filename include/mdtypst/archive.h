#pragma once

#include <mdtypst/result.hpp>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>
#include <string_view>
#include <vector>

namespace mdtypst {

/**
 * TarExtractor - incremental tar reader writing entries under a directory
 *
 * Accepts data in arbitrary chunks. Understands ustar (with prefix), pax
 * extended headers (path, size) and GNU long names. Regular files and
 * directories are written; every other entry type is rejected, as is any
 * entry whose path is absolute or would leave the target directory.
 */
class TarExtractor {
public:
    static constexpr size_t BLOCK_SIZE = 512;

    explicit TarExtractor(std::filesystem::path target);

    Result<void> feed(const char* data, size_t len);

    // Fails if the archive ended in the middle of an entry.
    Result<void> finish();

    size_t entriesWritten() const noexcept { return _entries; }

private:
    enum class State : uint8_t {
        Header,      // expecting a header block
        FileData,    // copying entry bytes to _out
        MetaData,    // collecting pax / long name payload
        SkipPadding, // discarding padding up to the block boundary
        End          // saw the end-of-archive marker
    };

    Result<void> onHeader(const char* block);
    Result<void> onMetaComplete();
    Result<std::filesystem::path> resolveEntry(const std::string& name) const;

    std::filesystem::path _target;
    State _state = State::Header;
    std::string _block;        // partial header block
    uint64_t _remaining = 0;   // bytes left in current entry payload
    uint64_t _padding = 0;
    char _metaType = 0;
    std::string _meta;
    std::string _pendingPath;  // from pax 'path' or GNU 'L'
    uint64_t _pendingSize = 0;
    bool _hasPendingSize = false;
    std::ofstream _out;
    size_t _entries = 0;
};

// Inflate gzip data and extract the tar stream under `target`.
Result<void> extractTarGz(std::string_view compressed, const std::filesystem::path& target);

} // namespace mdtypst
