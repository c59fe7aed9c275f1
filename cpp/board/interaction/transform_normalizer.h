#pragma once

#include "board/core/types.h"

namespace board {

// Folds the transient visual scale (sx, sy) into persisted size, keeping the element
// center in place, and resets the scale to identity. Rotation is already persisted in
// `rot` and is carried through unchanged. Applying it twice yields the same result.
Element normalizeTransform(const Element& el, float minSize);

// Patch that turns `el` into normalizeTransform(el).
ElementPatch normalizedPatch(const Element& el, float minSize);

inline bool hasTransientScale(const Element& el) {
    return el.sx != 1.0f || el.sy != 1.0f;
}

} // namespace board
