#include "tc/render/Color.hpp"

#include <cstdio>
#include <cstdlib>

namespace tc {

static int hexDigit(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

static bool parseHex(const std::string& s, float out[4]) {
  const std::size_t n = s.size() - 1;
  if (n != 3 && n != 6 && n != 8) return false;

  int v[8];
  for (std::size_t i = 0; i < n; ++i) {
    v[i] = hexDigit(s[i + 1]);
    if (v[i] < 0) return false;
  }

  float rgba[4] = {0.0f, 0.0f, 0.0f, 1.0f};
  if (n == 3) {
    for (int i = 0; i < 3; ++i)
      rgba[i] = static_cast<float>(v[i] * 17) / 255.0f;
  } else {
    for (std::size_t i = 0; i < n / 2; ++i)
      rgba[i] = static_cast<float>(v[i * 2] * 16 + v[i * 2 + 1]) / 255.0f;
  }

  for (int i = 0; i < 4; ++i) out[i] = rgba[i];
  return true;
}

static bool parseFunctional(const std::string& s, float out[4]) {
  double r = 0, g = 0, b = 0, a = 1.0;
  int consumed = 0;
  if (s.compare(0, 5, "rgba(") == 0) {
    if (std::sscanf(s.c_str(), "rgba(%lf ,%lf ,%lf ,%lf )%n", &r, &g, &b, &a, &consumed) != 4)
      return false;
  } else if (s.compare(0, 4, "rgb(") == 0) {
    if (std::sscanf(s.c_str(), "rgb(%lf ,%lf ,%lf )%n", &r, &g, &b, &consumed) != 3)
      return false;
  } else {
    return false;
  }
  if (consumed != static_cast<int>(s.size())) return false;
  if (r < 0 || r > 255 || g < 0 || g > 255 || b < 0 || b > 255 || a < 0 || a > 1)
    return false;

  out[0] = static_cast<float>(r / 255.0);
  out[1] = static_cast<float>(g / 255.0);
  out[2] = static_cast<float>(b / 255.0);
  out[3] = static_cast<float>(a);
  return true;
}

bool parseColor(const std::string& text, float out[4]) {
  if (text.empty()) return false;
  if (text[0] == '#') return parseHex(text, out);
  return parseFunctional(text, out);
}

void parseColorOr(const std::string& text, const float fallback[4], float out[4]) {
  if (parseColor(text, out)) return;
  for (int i = 0; i < 4; ++i) out[i] = fallback[i];
}

} // namespace tc
