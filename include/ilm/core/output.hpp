/**
 * @file output.hpp
 * @brief Plain-text dumps of grid and surface data
 */

#pragma once

#include "types.hpp"
#include "field.hpp"
#include "grid.hpp"
#include "surface.hpp"
#include <filesystem>

namespace ilm {

/**
 * @brief Write a grid field as CSV rows "x,y,value[,value...]"
 *
 * One row per cell centre, in storage order.
 *
 * @throws Error if the file cannot be written
 * @throws ConfigurationError if the field does not live on the grid
 */
void write_csv(const std::filesystem::path& path, const CartesianGrid& grid, const GridField& field);

/**
 * @brief Write a surface field as CSV rows "x,y,ds,value[,value...]"
 */
void write_csv(const std::filesystem::path& path, const Surface& surface, const SurfaceField& field);

} // namespace ilm
