#include "macros.hh"
#include "reshard.hh"

#include <map>

shardsink::ReshardKeyGenerator::ReshardKeyGenerator()
  : ReshardKeyGenerator(std::random_device{}())
{
}

shardsink::ReshardKeyGenerator::ReshardKeyGenerator(uint64_t seed)
  : engine_(seed)
{
    counter_ = engine_();
    step_ = engine_() | 1u;
}

uint64_t
shardsink::ReshardKeyGenerator::next_key()
{
    counter_ += step_; // wraps
    return counter_;
}

uint64_t
shardsink::ReshardKeyGenerator::step() const
{
    return step_;
}

std::vector<shardsink::Bundle>
shardsink::reshard_for_write(const std::vector<Bundle>& bundles,
                             size_t n_output_bundles)
{
    EXPECT(n_output_bundles > 0, "Number of output bundles must be positive.");

    // group by key
    std::map<uint64_t, std::vector<const std::string*>> groups;
    for (const auto& bundle : bundles) {
        ReshardKeyGenerator keys;
        for (const auto& record : bundle) {
            groups[keys.next_key()].push_back(&record);
        }
    }

    // ungroup
    std::vector<Bundle> resharded(n_output_bundles);
    for (const auto& [key, records] : groups) {
        auto& output = resharded[key % n_output_bundles];
        for (const auto* record : records) {
            output.push_back(*record);
        }
    }

    return resharded;
}
