#include "topology.hpp"


EdgeTopology Topology::generate(const GridSize& grid, cv::RNG& rng) {
    EdgeTopology topology{ grid, std::vector<PieceShape>(grid.rows * grid.cols) };

    for (int r = 0; r < grid.rows; ++r) {
        for (int c = 0; c + 1 < grid.cols; ++c) {
            bool tab = rng.uniform(0, 2) == 1;
            topology.at(r, c).right = tab ? EdgeType::Tab : EdgeType::Blank;
            topology.at(r, c + 1).left = tab ? EdgeType::Blank : EdgeType::Tab;
        }
    }

    for (int r = 0; r + 1 < grid.rows; ++r) {
        for (int c = 0; c < grid.cols; ++c) {
            bool tab = rng.uniform(0, 2) == 1;
            topology.at(r, c).bottom = tab ? EdgeType::Tab : EdgeType::Blank;
            topology.at(r + 1, c).top = tab ? EdgeType::Blank : EdgeType::Tab;
        }
    }

    return topology;
}

bool Topology::is_complementary(EdgeType a, EdgeType b) {
    return (a == EdgeType::Tab && b == EdgeType::Blank) || (a == EdgeType::Blank && b == EdgeType::Tab);
}

const char* Topology::to_string(EdgeType type) {
    switch (type) {
        case EdgeType::Tab:   return "tab";
        case EdgeType::Blank: return "blank";
        case EdgeType::Flat:  return "flat";
    }
    return "flat";
}

EdgeType Topology::edge_from_string(const std::string& name) {
    if (name == "tab") return EdgeType::Tab;
    if (name == "blank") return EdgeType::Blank;
    if (name == "flat") return EdgeType::Flat;
    throw ConfigError("Unknown edge type: " + name);
}
