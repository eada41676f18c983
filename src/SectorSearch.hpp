#ifndef SECTORSEARCH_HPP
#define SECTORSEARCH_HPP

#include "SectorGrid.hpp"
#include <vector>

struct SearchOptions
{
    int pad_mult = 10;  // sector width in conflict radii
    int limit = -1;     // process only the first `limit` drones, -1 for all
    bool debug = false; // log timings and counts
};

// Ids of drones closer than conflict_radius to another drone in the bucket.
// An id is repeated once per conflicting pair it belongs to.
std::vector<int> scan_sector(const std::vector<const Drone *> &bucket, double conflict_radius);

// Sorted distinct ids of drones in conflict. coords is a row-major n x 2 array.
std::vector<int> find_conflicts(
    const double *coords,
    int n,
    double conflict_radius,
    double airspace_size,
    const SearchOptions &options = SearchOptions());

// Main conflict counting function
int count_conflicts(
    const double *coords,
    int n,
    double conflict_radius,
    double airspace_size,
    const SearchOptions &options = SearchOptions());

// Un-sectored all-pairs search over the same prefix, for comparison.
int count_conflicts_brute_force(
    const double *coords,
    int n,
    double conflict_radius,
    int limit = -1);

#endif // SECTORSEARCH_HPP
