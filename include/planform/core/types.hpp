#pragma once

#include <Eigen/Dense>
#include <map>
#include <string>

namespace planform {

// Matrix types (row index = y, column index = x)
using Matrix2Dd = Eigen::Matrix<double, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;
using Matrix2Df = Eigen::Matrix<float, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;
using VectorXd = Eigen::VectorXd;

// Named output images of one generation (C1..C6, P12, P34, P56, P1234, P123456)
using ImageSet = std::map<std::string, Matrix2Dd>;

// Lattice topology, selected by component_count
enum class Topology {
    UNSUPPORTED,
    SQUARE,     // 4 components
    HEXAGONAL   // 6 components
};

inline Topology topology_from_count(int component_count) {
    switch (component_count) {
        case 4: return Topology::SQUARE;
        case 6: return Topology::HEXAGONAL;
        default: return Topology::UNSUPPORTED;
    }
}

inline std::string topology_to_string(Topology topology) {
    switch (topology) {
        case Topology::SQUARE: return "SQUARE";
        case Topology::HEXAGONAL: return "HEXAGONAL";
        default: return "UNSUPPORTED";
    }
}

// Summary statistics of one image
struct ImageStats {
    double min;
    double max;
    double mean;
    double stddev;
};

} // namespace planform
