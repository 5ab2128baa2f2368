#include <benchmark/benchmark.h>

#include <cstdint>
#include <vector>

#include "wcoord/core/geo.hpp"

using namespace wcoord::core;

static void BM_GeodesicDistanceShort(benchmark::State& state) {
    const GeoPoint a{52.5200, 13.4050};
    const GeoPoint b{52.5210, 13.4070};
    for (auto _ : state) {
        benchmark::DoNotOptimize(geodesic_distance_m(a, b));
    }
}
BENCHMARK(BM_GeodesicDistanceShort);

static void BM_GeodesicDistanceLong(benchmark::State& state) {
    const GeoPoint a{-37.9510, 144.4249};
    const GeoPoint b{-37.6528, 143.9265};
    for (auto _ : state) {
        benchmark::DoNotOptimize(geodesic_distance_m(a, b));
    }
}
BENCHMARK(BM_GeodesicDistanceLong);

static void BM_HaversineDistance(benchmark::State& state) {
    const GeoPoint a{52.5200, 13.4050};
    const GeoPoint b{48.1351, 11.5820};
    for (auto _ : state) {
        benchmark::DoNotOptimize(haversine_distance_m(a, b));
    }
}
BENCHMARK(BM_HaversineDistance);

static void BM_PathLength(benchmark::State& state) {
    const auto n = static_cast<std::size_t>(state.range(0));
    std::vector<GeoPoint> points;
    points.reserve(n);
    for (std::size_t i = 0; i < n; ++i) {
        points.push_back(GeoPoint{52.0 + 0.001 * static_cast<double>(i), 13.0 + 0.0005 * static_cast<double>(i % 7)});
    }
    for (auto _ : state) {
        benchmark::DoNotOptimize(path_length_km(points.data(), points.size()));
    }
    state.SetItemsProcessed(state.iterations() * static_cast<std::int64_t>(n));
}
BENCHMARK(BM_PathLength)->Arg(16)->Arg(256);
