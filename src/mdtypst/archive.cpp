#include <mdtypst/archive.h>
#include <ytrace/ytrace.hpp>
#include <zlib.h>
#include <algorithm>
#include <cstring>

namespace mdtypst {

namespace {

constexpr uint64_t MAX_META_SIZE = 1u << 20;

// NUL-terminated (or full-width) header field
std::string field(const char* block, size_t offset, size_t width) {
    const char* begin = block + offset;
    const char* end = static_cast<const char*>(std::memchr(begin, '\0', width));
    return std::string(begin, end ? end : begin + width);
}

// Octal, or base-256 when the high bit of the first byte is set
Result<uint64_t> numeric(const char* block, size_t offset, size_t width) {
    const auto* p = reinterpret_cast<const unsigned char*>(block + offset);
    uint64_t value = 0;
    if (p[0] & 0x80) {
        value = p[0] & 0x7f;
        for (size_t i = 1; i < width; ++i) {
            if (value >> 55) return Err<uint64_t>("tar numeric field overflows");
            value = (value << 8) | p[i];
        }
        return Ok(value);
    }
    size_t i = 0;
    while (i < width && (p[i] == ' ' || p[i] == '\0')) ++i;
    for (; i < width && p[i] >= '0' && p[i] <= '7'; ++i) {
        if (value >> 60) return Err<uint64_t>("tar numeric field overflows");
        value = (value << 3) | static_cast<uint64_t>(p[i] - '0');
    }
    for (; i < width; ++i) {
        if (p[i] != ' ' && p[i] != '\0') return Err<uint64_t>("malformed tar numeric field");
    }
    return Ok(value);
}

bool isZeroBlock(const char* block) {
    for (size_t i = 0; i < TarExtractor::BLOCK_SIZE; ++i) {
        if (block[i] != '\0') return false;
    }
    return true;
}

Result<void> verifyChecksum(const char* block) {
    auto stored = numeric(block, 148, 8);
    if (!stored) return Err<void>("malformed tar header", stored);

    uint64_t sum = 0;
    for (size_t i = 0; i < TarExtractor::BLOCK_SIZE; ++i) {
        sum += (i >= 148 && i < 156) ? static_cast<unsigned char>(' ')
                                     : static_cast<unsigned char>(block[i]);
    }
    if (sum != *stored) return Err<void>("tar header checksum mismatch");
    return Ok();
}

uint64_t paddingFor(uint64_t size) {
    uint64_t rem = size % TarExtractor::BLOCK_SIZE;
    return rem == 0 ? 0 : TarExtractor::BLOCK_SIZE - rem;
}

} // namespace

//=============================================================================
// TarExtractor
//=============================================================================

TarExtractor::TarExtractor(std::filesystem::path target) : _target(std::move(target)) {}

Result<std::filesystem::path> TarExtractor::resolveEntry(const std::string& name) const {
    if (name.empty()) return Err<std::filesystem::path>("tar entry with empty name");
    if (name.front() == '/' || name.find('\\') != std::string::npos) {
        return Err<std::filesystem::path>("tar entry has an absolute or non-portable path: " + name);
    }

    std::filesystem::path rel;
    size_t start = 0;
    while (start <= name.size()) {
        size_t slash = name.find('/', start);
        if (slash == std::string::npos) slash = name.size();
        std::string part = name.substr(start, slash - start);
        start = slash + 1;
        if (part.empty() || part == ".") continue;
        if (part == "..") {
            return Err<std::filesystem::path>("tar entry escapes the target directory: " + name);
        }
        rel /= part;
    }
    return Ok(_target / rel);
}

Result<void> TarExtractor::onHeader(const char* block) {
    if (isZeroBlock(block)) {
        _state = State::End;
        return Ok();
    }
    if (auto res = verifyChecksum(block); !res) return res;

    auto size = numeric(block, 124, 12);
    if (!size) return Err<void>("malformed tar header", size);

    std::string name = field(block, 0, 100);
    if (field(block, 257, 5) == "ustar") {
        std::string prefix = field(block, 345, 155);
        if (!prefix.empty()) name = prefix + "/" + name;
    }
    if (!_pendingPath.empty()) {
        name = std::move(_pendingPath);
        _pendingPath.clear();
    }
    uint64_t entrySize = _hasPendingSize ? _pendingSize : *size;
    _hasPendingSize = false;

    const char type = block[156];
    switch (type) {
    case '0':
    case '\0':
    case '7': {
        auto path = resolveEntry(name);
        if (!path) return Err<void>("rejected archive", path);

        std::error_code ec;
        std::filesystem::create_directories(path->parent_path(), ec);
        if (ec) return Err<void>("cannot create directory " + path->parent_path().string() + ": " + ec.message());

        _out.open(*path, std::ios::binary | std::ios::trunc);
        if (!_out.is_open()) return Err<void>("cannot write " + path->string());
        ++_entries;

        _remaining = entrySize;
        _padding = paddingFor(entrySize);
        if (_remaining == 0) {
            _out.close();
            _state = _padding ? State::SkipPadding : State::Header;
        } else {
            _state = State::FileData;
        }
        return Ok();
    }
    case '5': {
        auto path = resolveEntry(name);
        if (!path) return Err<void>("rejected archive", path);
        std::error_code ec;
        std::filesystem::create_directories(*path, ec);
        if (ec) return Err<void>("cannot create directory " + path->string() + ": " + ec.message());
        _remaining = 0;
        _padding = paddingFor(entrySize);
        _state = _padding ? State::SkipPadding : State::Header;
        return Ok();
    }
    case 'x':  // pax header for the next entry
    case 'g':  // pax global header, ignored
    case 'L':  // GNU long name for the next entry
    case 'K':  // GNU long link name, ignored
        if (entrySize > MAX_META_SIZE) return Err<void>("tar metadata entry too large");
        _metaType = type;
        _meta.clear();
        _remaining = entrySize;
        _padding = paddingFor(entrySize);
        if (_remaining == 0) return onMetaComplete();
        _state = State::MetaData;
        return Ok();
    default:
        return Err<void>(std::string("unsupported tar entry type '") + type + "' for " + name);
    }
}

Result<void> TarExtractor::onMetaComplete() {
    if (_metaType == 'L') {
        _pendingPath = _meta.substr(0, _meta.find('\0'));
    } else if (_metaType == 'x') {
        // records: "<len> <key>=<value>\n"
        size_t pos = 0;
        while (pos < _meta.size()) {
            size_t space = _meta.find(' ', pos);
            if (space == std::string::npos) return Err<void>("malformed pax header");
            uint64_t len = 0;
            try {
                len = std::stoull(_meta.substr(pos, space - pos));
            } catch (const std::exception&) {
                return Err<void>("malformed pax record length");
            }
            if (len == 0 || pos + len > _meta.size()) return Err<void>("malformed pax record");
            std::string record = _meta.substr(space + 1, pos + len - space - 2);
            size_t eq = record.find('=');
            if (eq != std::string::npos) {
                std::string key = record.substr(0, eq);
                std::string value = record.substr(eq + 1);
                if (key == "path") {
                    _pendingPath = value;
                } else if (key == "size") {
                    try {
                        _pendingSize = std::stoull(value);
                        _hasPendingSize = true;
                    } catch (const std::exception&) {
                        return Err<void>("malformed pax size");
                    }
                }
            }
            pos += len;
        }
    }
    _meta.clear();
    _state = _padding ? State::SkipPadding : State::Header;
    return Ok();
}

Result<void> TarExtractor::feed(const char* data, size_t len) {
    size_t i = 0;
    while (i < len) {
        switch (_state) {
        case State::Header: {
            size_t take = std::min(BLOCK_SIZE - _block.size(), len - i);
            _block.append(data + i, take);
            i += take;
            if (_block.size() == BLOCK_SIZE) {
                auto res = onHeader(_block.data());
                _block.clear();
                if (!res) return res;
            }
            break;
        }
        case State::FileData: {
            size_t take = static_cast<size_t>(std::min<uint64_t>(_remaining, len - i));
            _out.write(data + i, static_cast<std::streamsize>(take));
            if (!_out) return Err<void>("failed writing extracted file");
            i += take;
            _remaining -= take;
            if (_remaining == 0) {
                _out.close();
                _state = _padding ? State::SkipPadding : State::Header;
            }
            break;
        }
        case State::MetaData: {
            size_t take = static_cast<size_t>(std::min<uint64_t>(_remaining, len - i));
            _meta.append(data + i, take);
            i += take;
            _remaining -= take;
            if (_remaining == 0) {
                if (auto res = onMetaComplete(); !res) return res;
            }
            break;
        }
        case State::SkipPadding: {
            size_t take = static_cast<size_t>(std::min<uint64_t>(_padding, len - i));
            i += take;
            _padding -= take;
            if (_padding == 0) _state = State::Header;
            break;
        }
        case State::End:
            // trailing zero blocks and record padding
            return Ok();
        }
    }
    return Ok();
}

Result<void> TarExtractor::finish() {
    if (_state == State::FileData || _state == State::MetaData || !_block.empty()) {
        return Err<void>("archive is truncated");
    }
    if (_entries == 0) {
        return Err<void>("archive contains no files");
    }
    return Ok();
}

//=============================================================================
// gzip
//=============================================================================

Result<void> extractTarGz(std::string_view compressed, const std::filesystem::path& target) {
    z_stream zs;
    std::memset(&zs, 0, sizeof(zs));
    // 16 + MAX_WBITS: expect a gzip wrapper
    if (inflateInit2(&zs, 16 + MAX_WBITS) != Z_OK) {
        return Err<void>("failed to initialize zlib");
    }

    TarExtractor tar(target);
    std::vector<char> chunk(64 * 1024);

    zs.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(compressed.data()));
    zs.avail_in = static_cast<uInt>(compressed.size());

    int ret = Z_OK;
    while (true) {
        zs.next_out = reinterpret_cast<Bytef*>(chunk.data());
        zs.avail_out = static_cast<uInt>(chunk.size());

        ret = inflate(&zs, Z_NO_FLUSH);
        if (ret == Z_BUF_ERROR) {
            inflateEnd(&zs);
            return Err<void>("gzip stream is truncated");
        }
        if (ret != Z_OK && ret != Z_STREAM_END) {
            std::string msg = zs.msg ? zs.msg : "inflate error " + std::to_string(ret);
            inflateEnd(&zs);
            return Err<void>("malformed gzip stream: " + msg);
        }

        size_t produced = chunk.size() - zs.avail_out;
        if (produced > 0) {
            if (auto res = tar.feed(chunk.data(), produced); !res) {
                inflateEnd(&zs);
                return res;
            }
        }

        if (ret == Z_STREAM_END) {
            // concatenated gzip members
            if (zs.avail_in > 0) {
                inflateReset(&zs);
                continue;
            }
            break;
        }
        if (zs.avail_in == 0 && produced == 0) {
            inflateEnd(&zs);
            return Err<void>("gzip stream is truncated");
        }
    }
    inflateEnd(&zs);

    if (auto res = tar.finish(); !res) return res;
    ydebug("extractTarGz: {} files into {}", tar.entriesWritten(), target.string());
    return Ok();
}

} // namespace mdtypst
