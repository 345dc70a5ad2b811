#pragma once

#include <cstdint>
#include <random>
#include <string>
#include <vector>

namespace shardsink {
/**
 * @brief Keys for spreading the records of one bundle across the key space.
 * @details Each instance draws its own random start and random odd step, so
 * two bundles never share a counter.
 */
class ReshardKeyGenerator
{
  public:
    ReshardKeyGenerator();

    /// For reproducible tests.
    explicit ReshardKeyGenerator(uint64_t seed);

    uint64_t next_key();
    uint64_t step() const;

  private:
    std::mt19937_64 engine_;
    uint64_t counter_;
    uint64_t step_;
};

using Bundle = std::vector<std::string>;

/**
 * @brief Redistribute records across @p n_output_bundles bundles.
 * @details Every record is tagged with a key from its input bundle's own
 * generator, grouped by key, and ungrouped. Record order across outputs is
 * not preserved.
 * @throws std::runtime_error if @p n_output_bundles is zero.
 */
std::vector<Bundle>
reshard_for_write(const std::vector<Bundle>& bundles, size_t n_output_bundles);
} // namespace shardsink
