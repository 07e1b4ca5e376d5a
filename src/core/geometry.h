// Copyright 2026 The multicap Authors
// Integer rectangle math used by window occlusion and frame masking.

#ifndef MULTICAP_CORE_GEOMETRY_H_
#define MULTICAP_CORE_GEOMETRY_H_

#include <vector>

namespace multicap {
namespace internal {

/// Axis-aligned rectangle in screen pixels (top-left origin).
/// Covers [x, x + width) x [y, y + height).
struct Rect {
  int x = 0;
  int y = 0;
  int width = 0;
  int height = 0;

  int left() const { return x; }
  int top() const { return y; }
  int right() const { return x + width; }
  int bottom() const { return y + height; }
  bool IsEmpty() const { return width <= 0 || height <= 0; }

  bool operator==(const Rect& o) const {
    return x == o.x && y == o.y && width == o.width && height == o.height;
  }
  bool operator!=(const Rect& o) const { return !(*this == o); }
};

/// Intersection of two rectangles. Empty (width/height 0) when disjoint.
Rect Intersect(const Rect& a, const Rect& b);

/// True if `outer` fully contains `inner`.
bool Contains(const Rect& outer, const Rect& inner);

/// Subtract `cover` from `source`.
///
/// Returns 0..4 disjoint rectangles whose union is `source` minus its
/// intersection with `cover`:
///   - no overlap           -> { source }
///   - cover covers source  -> {}
///   - partial overlap      -> strips in the order top, bottom, left, right.
/// Top and bottom strips span the full source width; left and right strips
/// span only the height of the intersection.
std::vector<Rect> SubtractRect(const Rect& source, const Rect& cover);

/// Fold SubtractRect over `covers` (front-to-back) and return what remains
/// visible of `source`.
std::vector<Rect> SubtractAll(const Rect& source,
                              const std::vector<Rect>& covers);

}  // namespace internal
}  // namespace multicap

#endif  // MULTICAP_CORE_GEOMETRY_H_
