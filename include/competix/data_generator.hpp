#ifndef COMPETIX_DATA_GENERATOR_HPP
#define COMPETIX_DATA_GENERATOR_HPP

#include "company.hpp"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace competix {

// Synthetic company records for benchmarking and end-to-end tests.
// Each company belongs to one of num_segments market segments; its product
// and customer descriptions are drawn from that segment's vocabulary with
// some shared filler words, and its tags from the segment's tag pool.
// A fraction empty_rate of records gets both descriptions blank.
std::vector<Company> generate_companies(size_t n, size_t num_segments,
                                        uint64_t seed, double empty_rate = 0.0);

// Segment of each generated company (i % num_segments).
std::vector<int> generate_segment_labels(size_t n, size_t num_segments);

}  // namespace competix

#endif  // COMPETIX_DATA_GENERATOR_HPP
