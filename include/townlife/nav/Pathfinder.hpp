#pragma once
// include/townlife/nav/Pathfinder.hpp
#include "townlife/world/WorldMap.hpp"

#include <vector>

namespace townlife::nav {

using NodePath = std::vector<NodeId>;

// Unweighted BFS over the map's node graph, first-found shortest path.
//   start == end            -> {start} (no search)
//   end blocked             -> {} (checked before search)
//   unknown start/end       -> {}
//   unreachable             -> {}
// A returned path never contains a blocked node.
NodePath FindPath(const world::WorldMap& map,
                  const NodeId& start,
                  const NodeId& end,
                  const world::NodeSet& blocked = {});

} // namespace townlife::nav
