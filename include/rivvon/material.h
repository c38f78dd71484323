#pragma once

#include <cstdint>
#include <variant>

namespace rivvon {

// Opaque handle to a material owned by TileCache
struct MaterialHandle {
    uint32_t id;

    bool isValid() const { return id != 0; }
    static MaterialHandle invalid() { return {0}; }
    bool operator==(const MaterialHandle&) const = default;
};

// Samples one tile at the current layer
struct SingleTileMaterial {
    uint32_t tile;
};

// Samples `currentTile` and its successor, blended by the flow offset
struct FlowTileMaterial {
    uint64_t baseIndex;    // global segment index it was created for
    uint32_t currentTile;  // (baseIndex + tileFlowOffset) mod tileCount
    uint32_t nextTile;     // (currentTile + 1) mod tileCount
};

using MaterialKind = std::variant<SingleTileMaterial, FlowTileMaterial>;

inline bool isFlowMaterial(const MaterialKind& kind) {
    return std::holds_alternative<FlowTileMaterial>(kind);
}

} // namespace rivvon
