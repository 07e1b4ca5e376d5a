// Copyright 2026 The multicap Authors

#include "core/geometry.h"

#include <algorithm>

namespace multicap {
namespace internal {

Rect Intersect(const Rect& a, const Rect& b) {
  int left = (std::max)(a.left(), b.left());
  int top = (std::max)(a.top(), b.top());
  int right = (std::min)(a.right(), b.right());
  int bottom = (std::min)(a.bottom(), b.bottom());
  if (right <= left || bottom <= top) return Rect{};
  return Rect{left, top, right - left, bottom - top};
}

bool Contains(const Rect& outer, const Rect& inner) {
  return inner.left() >= outer.left() && inner.top() >= outer.top() &&
         inner.right() <= outer.right() && inner.bottom() <= outer.bottom();
}

std::vector<Rect> SubtractRect(const Rect& source, const Rect& cover) {
  std::vector<Rect> result;
  if (source.IsEmpty()) return result;

  Rect hit = Intersect(source, cover);
  if (hit.IsEmpty()) {
    result.push_back(source);
    return result;
  }
  if (hit == source) return result;

  result.reserve(4);

  // Top strip.
  if (hit.top() > source.top()) {
    result.push_back(
        Rect{source.x, source.y, source.width, hit.top() - source.top()});
  }
  // Bottom strip.
  if (hit.bottom() < source.bottom()) {
    result.push_back(Rect{source.x, hit.bottom(), source.width,
                          source.bottom() - hit.bottom()});
  }
  // Left strip, limited to the rows of the intersection.
  if (hit.left() > source.left()) {
    result.push_back(
        Rect{source.x, hit.y, hit.left() - source.left(), hit.height});
  }
  // Right strip.
  if (hit.right() < source.right()) {
    result.push_back(
        Rect{hit.right(), hit.y, source.right() - hit.right(), hit.height});
  }
  return result;
}

std::vector<Rect> SubtractAll(const Rect& source,
                              const std::vector<Rect>& covers) {
  std::vector<Rect> visible;
  if (source.IsEmpty()) return visible;
  visible.push_back(source);

  for (const auto& cover : covers) {
    if (visible.empty()) break;
    std::vector<Rect> next;
    next.reserve(visible.size());
    for (const auto& piece : visible) {
      auto rest = SubtractRect(piece, cover);
      next.insert(next.end(), rest.begin(), rest.end());
    }
    visible.swap(next);
  }
  return visible;
}

}  // namespace internal
}  // namespace multicap
