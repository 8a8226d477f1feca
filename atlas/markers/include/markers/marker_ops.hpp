// Marker operation records emitted by a reconciliation pass
// Plain data; a rendering adapter turns them into engine calls

#pragma once

#include <math/types.hpp>

#include <cstdint>
#include <map>
#include <string>

namespace atlas::markers {

using namespace math;

// Logical state of one country's marker
struct MarkerState {
    std::string key;         // Country display name
    vec3 position;           // Globe-local, includes the height offset
    quat orientation;        // Local up points away from the globe
    int bin = 0;             // Quintile 0..4
    bool selected = false;   // Label shown, glow target
};

// Keyed by country; ordered so passes emit removals deterministically
using MarkerMap = std::map<std::string, MarkerState>;

enum class MarkerOpType : uint8_t {
    Create,   // Instantiate at position/orientation with bin colour
    Update,   // Animated move to position, recolour, selection refresh
    Remove    // Destroy
};

struct MarkerOp {
    MarkerOpType type;
    std::string key;
    vec3 position;
    quat orientation;
    int bin = 0;
    bool selected = false;
    float duration = 0.0f;   // Move animation length (updates only)

    static MarkerOp make_create(const MarkerState& state) {
        MarkerOp op{};
        op.type = MarkerOpType::Create;
        op.key = state.key;
        op.position = state.position;
        op.orientation = state.orientation;
        op.bin = state.bin;
        op.selected = state.selected;
        return op;
    }

    static MarkerOp make_update(const MarkerState& state, float duration) {
        MarkerOp op = make_create(state);
        op.type = MarkerOpType::Update;
        op.duration = duration;
        return op;
    }

    static MarkerOp make_remove(const std::string& key) {
        MarkerOp op{};
        op.type = MarkerOpType::Remove;
        op.key = key;
        return op;
    }
};

inline const char* op_type_name(MarkerOpType type) {
    switch (type) {
        case MarkerOpType::Create: return "create";
        case MarkerOpType::Update: return "update";
        case MarkerOpType::Remove: return "remove";
    }
    return "unknown";
}

} // namespace atlas::markers
