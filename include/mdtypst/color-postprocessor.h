#pragma once

#include <mdtypst/config.h>
#include <string>
#include <string_view>

namespace mdtypst {

/**
 * Rewrite SVG colors for the page theme.
 *
 * Auto: pure black fill/stroke values, as attributes or style properties,
 * become currentColor so formulas follow the surrounding text color.
 * Static: the input is returned unchanged.
 */
std::string postprocessColors(std::string_view svg, ColorMode mode);

} // namespace mdtypst
