#include <mdtypst/color-postprocessor.h>
#include <regex>

namespace mdtypst {

namespace {

const std::string BLACK = R"((?:#000000ff|#000000|#000|black|rgb\(\s*0\s*,\s*0\s*,\s*0\s*\)))";

// fill="#000000"  stroke='black'
const std::regex& attributePattern() {
    static const std::regex re(R"(\b(fill|stroke)(\s*=\s*)(["']))" + BLACK + R"(\3)",
                               std::regex::ECMAScript | std::regex::icase);
    return re;
}

// style="fill: #000; stroke:black"
const std::regex& propertyPattern() {
    static const std::regex re(R"(\b(fill|stroke)(\s*:\s*))" + BLACK + R"((?=\s*(?:;|!|\}|"|'|$)))",
                               std::regex::ECMAScript | std::regex::icase);
    return re;
}

} // namespace

std::string postprocessColors(std::string_view svg, ColorMode mode) {
    switch (mode) {
    case ColorMode::Static:
        return std::string(svg);
    case ColorMode::Auto: {
        std::string out = std::regex_replace(std::string(svg), attributePattern(), "$1$2$3currentColor$3");
        return std::regex_replace(out, propertyPattern(), "$1$2currentColor");
    }
    }
    return std::string(svg);
}

} // namespace mdtypst
