#include "SectorGrid.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

SectorGrid split_into_sectors(double airspace_size, double conflict_radius, int pad_mult)
{
    if (!(airspace_size > 0.0) || !std::isfinite(airspace_size))
        throw std::invalid_argument("airspace_size must be a positive finite number");
    if (!(conflict_radius > 0.0) || !std::isfinite(conflict_radius))
        throw std::invalid_argument("conflict_radius must be a positive finite number");
    // Width must exceed the radius so a conflict never skips an interval.
    if (pad_mult < 2)
        throw std::invalid_argument("pad_mult must be at least 2");

    const double width = conflict_radius * pad_mult;
    if (!std::isfinite(width))
        throw std::invalid_argument("conflict_radius * pad_mult overflows");

    const double intervals = std::ceil(airspace_size / width);
    if (intervals > kMaxSectorsPerAxis)
        throw std::invalid_argument("airspace_size / (conflict_radius * pad_mult) exceeds " +
                                    std::to_string(kMaxSectorsPerAxis) + " sectors per axis");

    SectorGrid grid;
    grid.boundaries.reserve(static_cast<std::size_t>(intervals) + 1);
    for (int k = 0;; ++k)
    {
        const double edge = k * width;
        if (edge >= airspace_size)
            break;
        grid.boundaries.push_back(edge);
    }
    grid.boundaries.push_back(airspace_size);
    grid.sectors_per_axis = static_cast<int>(grid.boundaries.size());

    return grid;
}

std::pair<int, int> map_coordinate(const std::vector<double> &boundaries, double position)
{
    auto it = std::upper_bound(boundaries.begin(), boundaries.end(), position);

    int hi = static_cast<int>(it - boundaries.begin());
    if (it == boundaries.end())
        hi = static_cast<int>(boundaries.size()) - 1;

    return std::make_pair(hi - 1, hi);
}

void assign_to_sectors(const std::vector<Drone> &drones, const SectorGrid &grid, SectorMap &sectors)
{
    sectors.reserve(drones.size() / 4 + 1);

    for (const Drone &d : drones)
    {
        const std::pair<int, int> xs = map_coordinate(grid.boundaries, d.x);
        const std::pair<int, int> ys = map_coordinate(grid.boundaries, d.y);

        // Every drone lands in four sectors so seams are covered by both neighbours.
        sectors[SectorKey{xs.first, ys.first}].push_back(&d);
        sectors[SectorKey{xs.first, ys.second}].push_back(&d);
        sectors[SectorKey{xs.second, ys.first}].push_back(&d);
        sectors[SectorKey{xs.second, ys.second}].push_back(&d);
    }

    for (auto &entry : sectors)
    {
        entry.second.shrink_to_fit();
    }
}
