#include "SectorSearch.hpp"
#include <algorithm>
#include <chrono>
#include <cmath>
#include <stdexcept>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

#ifdef _OPENMP
#include <omp.h>
#endif

using Clock = std::chrono::steady_clock;

static double elapsed_ms(Clock::time_point since)
{
    return std::chrono::duration<double, std::milli>(Clock::now() - since).count();
}

static int checked_count(const double *coords, int n, int limit)
{
    if (n < 0)
        throw std::invalid_argument("number of drones must not be negative");
    if (n > 0 && coords == nullptr)
        throw std::invalid_argument("coords must not be null");
    if (limit < -1 || limit > n)
        throw std::invalid_argument("limit must be -1 or between 0 and " + std::to_string(n));

    return limit == -1 ? n : limit;
}

// Bounds are only enforced when airspace_size > 0.
static std::vector<Drone> make_drones(const double *coords, int count, double airspace_size)
{
    std::vector<Drone> drones;
    drones.reserve(count);

    for (int i = 0; i < count; ++i)
    {
        const double x = coords[i * 2 + 0];
        const double y = coords[i * 2 + 1];

        if (!std::isfinite(x) || !std::isfinite(y))
            throw std::invalid_argument("drone " + std::to_string(i) + " has a non-finite coordinate");

        if (airspace_size > 0.0 && (x < 0.0 || x > airspace_size || y < 0.0 || y > airspace_size))
            throw std::out_of_range("drone " + std::to_string(i) + " lies outside the airspace [0, " +
                                    std::to_string(airspace_size) + "]");

        drones.push_back(Drone{i, x, y});
    }
    return drones;
}

// Calls on_conflict(a, b) for every pair in the bucket closer than conflict_radius.
template <typename OnConflict>
static void for_each_conflict(const std::vector<const Drone *> &bucket, double conflict_radius, OnConflict on_conflict)
{
    if (bucket.size() < 2)
        return;

    // Only examine each combination once
    for (std::size_t a = 0; a < bucket.size(); ++a)
    {
        const Drone &da = *bucket[a];
        for (std::size_t b = a + 1; b < bucket.size(); ++b)
        {
            const Drone &db = *bucket[b];

            const double dx = da.x - db.x;
            const double dy = da.y - db.y;

            if (std::sqrt(dx * dx + dy * dy) < conflict_radius)
            {
                SPDLOG_TRACE("conflict: drone {} and drone {} closer than {}", da.id, db.id, conflict_radius);
                on_conflict(da, db);
            }
        }
    }
}

// One flag per drone id; a drone flagged by several pairs or sectors is set once.
static void flag_conflicts(const std::vector<const Drone *> &bucket, double conflict_radius, std::vector<char> &flags)
{
    for_each_conflict(bucket, conflict_radius, [&flags](const Drone &a, const Drone &b) {
        flags[a.id] = 1;
        flags[b.id] = 1;
    });
}

static std::vector<int> flagged_ids(const std::vector<char> &flags)
{
    std::vector<int> ids;
    for (std::size_t i = 0; i < flags.size(); ++i)
    {
        if (flags[i])
            ids.push_back(static_cast<int>(i));
    }
    return ids;
}

std::vector<int> scan_sector(const std::vector<const Drone *> &bucket, double conflict_radius)
{
    std::vector<int> conflicts;
    for_each_conflict(bucket, conflict_radius, [&conflicts](const Drone &a, const Drone &b) {
        conflicts.push_back(a.id);
        conflicts.push_back(b.id);
    });
    return conflicts;
}

std::vector<int> find_conflicts(
    const double *coords,
    int n,
    double conflict_radius,
    double airspace_size,
    const SearchOptions &options)
{
    const int count = checked_count(coords, n, options.limit);

    const Clock::time_point start_pre = Clock::now();

    const SectorGrid grid = split_into_sectors(airspace_size, conflict_radius, options.pad_mult);
    const std::vector<Drone> drones = make_drones(coords, count, airspace_size);

    SectorMap sectors;
    assign_to_sectors(drones, grid, sectors);

    std::vector<const std::vector<const Drone *> *> buckets;
    buckets.reserve(sectors.size());
    for (const auto &entry : sectors)
    {
        if (entry.second.size() >= 2)
            buckets.push_back(&entry.second);
    }

    if (options.debug)
        spdlog::info("Preprocessing {} drones into {} sectors ({} boundaries per axis) took {:.3f} ms",
                     count, sectors.size(), grid.boundaries.size(), elapsed_ms(start_pre));

    const Clock::time_point start_sector = Clock::now();

    std::vector<char> conflicted(count, 0);
    const int n_buckets = static_cast<int>(buckets.size());

#pragma omp parallel
    {
        std::vector<char> local_conflicted(count, 0);

#pragma omp for schedule(dynamic, 16) nowait
        for (int s = 0; s < n_buckets; ++s)
        {
            flag_conflicts(*buckets[s], conflict_radius, local_conflicted);
        }

#pragma omp critical
        {
            for (int i = 0; i < count; ++i)
            {
                if (local_conflicted[i])
                    conflicted[i] = 1;
            }
        }
    }

    std::vector<int> result = flagged_ids(conflicted);

    if (options.debug)
    {
        spdlog::info("Sector conflict processing of {} drones took {:.3f} ms. Number of conflicts: {}",
                     count, elapsed_ms(start_sector), result.size());

        if (options.limit != -1)
        {
            const Clock::time_point start_batch = Clock::now();
            const int batch = count_conflicts_brute_force(coords, n, conflict_radius, options.limit);
            spdlog::info("Batch processing all {} drones at once took {:.3f} ms. Number of conflicts: {}",
                         count, elapsed_ms(start_batch), batch);
        }
    }

    return result;
}

int count_conflicts(
    const double *coords,
    int n,
    double conflict_radius,
    double airspace_size,
    const SearchOptions &options)
{
    return static_cast<int>(find_conflicts(coords, n, conflict_radius, airspace_size, options).size());
}

int count_conflicts_brute_force(
    const double *coords,
    int n,
    double conflict_radius,
    int limit)
{
    const int count = checked_count(coords, n, limit);
    if (!(conflict_radius > 0.0) || !std::isfinite(conflict_radius))
        throw std::invalid_argument("conflict_radius must be a positive finite number");

    const std::vector<Drone> drones = make_drones(coords, count, 0.0);

    std::vector<const Drone *> all;
    all.reserve(drones.size());
    for (const Drone &d : drones)
        all.push_back(&d);

    std::vector<char> conflicted(count, 0);
    flag_conflicts(all, conflict_radius, conflicted);
    return static_cast<int>(std::count(conflicted.begin(), conflicted.end(), 1));
}
