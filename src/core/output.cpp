/**
 * @file output.cpp
 * @brief CSV output
 */

#include "ilm/core/output.hpp"
#include "ilm/core/errors.hpp"
#include <fstream>
#include <iomanip>
#include <limits>

namespace ilm {

namespace {

std::ofstream open_output(const std::filesystem::path& path) {
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path());
    }
    std::ofstream file(path);
    if (!file.is_open()) {
        throw Error("Cannot open output file for writing: " + path.string());
    }
    file << std::setprecision(std::numeric_limits<Real>::max_digits10);
    return file;
}

} // namespace

void write_csv(const std::filesystem::path& path, const CartesianGrid& grid, const GridField& field) {
    if (field.n_points() != grid.n_points()) {
        throw ConfigurationError("write_csv: field does not match the grid");
    }

    std::ofstream file = open_output(path);
    const Index nc = field.n_components();

    file << "x,y";
    for (Index c = 0; c < nc; ++c) {
        file << ",value" << (nc > 1 ? std::to_string(c) : std::string());
    }
    file << "\n";

    for (Index j = 0; j < grid.ny(); ++j) {
        for (Index i = 0; i < grid.nx(); ++i) {
            const Index p = grid.index(i, j);
            file << grid.x(i) << "," << grid.y(j);
            for (Index c = 0; c < nc; ++c) {
                file << "," << field(p, c);
            }
            file << "\n";
        }
    }
}

void write_csv(const std::filesystem::path& path, const Surface& surface, const SurfaceField& field) {
    if (field.n_points() != surface.n_points()) {
        throw ConfigurationError("write_csv: field does not match the surface");
    }

    std::ofstream file = open_output(path);
    const Index nc = field.n_components();

    file << "x,y,ds";
    for (Index c = 0; c < nc; ++c) {
        file << ",value" << (nc > 1 ? std::to_string(c) : std::string());
    }
    file << "\n";

    for (Index k = 0; k < surface.n_points(); ++k) {
        const Vec2& X = surface.point(k);
        file << X.x() << "," << X.y() << "," << surface.ds()(k);
        for (Index c = 0; c < nc; ++c) {
            file << "," << field(k, c);
        }
        file << "\n";
    }
}

} // namespace ilm
