#ifndef SECTORGRID_HPP
#define SECTORGRID_HPP

#include <cstddef>
#include <unordered_map>
#include <utility>
#include <vector>

struct Drone
{
    int id;
    double x;
    double y;
};

struct SectorKey
{
    int x, y;

    bool operator==(const SectorKey &other) const
    {
        return x == other.x && y == other.y;
    }
};

struct SectorHash
{
    std::size_t operator()(const SectorKey &k) const
    {
        std::size_t h = 73856093;
        h = h * 31 + k.x;
        h = h * 31 + k.y;
        return h ^ (h >> 16);
    }
};

// Sectors hold non-owning pointers; the drones must outlive the map.
typedef std::unordered_map<SectorKey, std::vector<const Drone *>, SectorHash> SectorMap;

// Upper bound on intervals per axis accepted by split_into_sectors.
const int kMaxSectorsPerAxis = 1 << 20;

struct SectorGrid
{
    // Cell edges along one axis, 0 .. airspace_size.
    std::vector<double> boundaries;
    // Sector indices per axis, one past the last interval.
    int sectors_per_axis;
};

// Overlapping sectors of width conflict_radius * pad_mult covering a square airspace.
// Throws std::invalid_argument on non-positive sizes, pad_mult < 2, or more than
// kMaxSectorsPerAxis intervals per axis.
SectorGrid split_into_sectors(double airspace_size, double conflict_radius, int pad_mult = 10);

// The two overlapping sector indices (lo, lo + 1) a coordinate falls into.
std::pair<int, int> map_coordinate(const std::vector<double> &boundaries, double position);

void assign_to_sectors(const std::vector<Drone> &drones, const SectorGrid &grid, SectorMap &sectors);

#endif // SECTORGRID_HPP
