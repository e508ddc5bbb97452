#pragma once

//=============================================================================
// ScratchDir - temporary directory removed when the test ends
//=============================================================================

#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <vector>
#include <stdlib.h>

namespace mdtypst::test {

class ScratchDir {
public:
    ScratchDir() {
        std::string pattern = (std::filesystem::temp_directory_path() / "mdtypst-ut-XXXXXX").string();
        std::vector<char> buf(pattern.begin(), pattern.end());
        buf.push_back('\0');
        if (::mkdtemp(buf.data())) _path = buf.data();
    }

    ~ScratchDir() {
        std::error_code ec;
        if (!_path.empty()) std::filesystem::remove_all(_path, ec);
    }

    ScratchDir(const ScratchDir&) = delete;
    ScratchDir& operator=(const ScratchDir&) = delete;

    const std::filesystem::path& path() const { return _path; }

    std::filesystem::path write(const std::string& rel, const std::string& content) const {
        auto p = _path / rel;
        std::filesystem::create_directories(p.parent_path());
        std::ofstream(p, std::ios::binary) << content;
        return p;
    }

    static std::string read(const std::filesystem::path& p) {
        std::ifstream in(p, std::ios::binary);
        return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    }

private:
    std::filesystem::path _path;
};

} // namespace mdtypst::test
