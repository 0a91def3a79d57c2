#pragma once
#include <string>

namespace tc {

// Parse "#RGB", "#RRGGBB", "#RRGGBBAA", "rgb(r,g,b)" or "rgba(r,g,b,a)" into
// normalized floats. Returns false (leaving `out` untouched) on bad input.
bool parseColor(const std::string& text, float out[4]);

// Parse with a fallback colour applied on failure.
void parseColorOr(const std::string& text, const float fallback[4], float out[4]);

} // namespace tc
