#include "apps/preview/FrameKind.hpp"

namespace preview {

static_assert(FRAME_KINDS.size() == FRAME_KIND_COUNT, "kind table out of sync");

// Table rows must sit at the index of their enum value for Info() to work.
static constexpr bool tableOrdered() {
    for (std::size_t i = 0; i < FRAME_KINDS.size(); ++i) {
        if (static_cast<std::size_t>(FRAME_KINDS[i].kind) != i) return false;
    }
    return true;
}
static_assert(tableOrdered(), "FRAME_KINDS must follow FrameKind order");

bool FrameKindFromName(const std::string& name, FrameKind& out) {
    for (const auto& info : FRAME_KINDS) {
        if (name == info.name) {
            out = info.kind;
            return true;
        }
    }
    return false;
}

} // namespace preview
