#include <dedupstore/resolver.hpp>

#include <dedupstore/assert.hpp>

#include <algorithm>
#include <cstring>

namespace dedupstore {

namespace {

class verified_resolver final : public block_resolver {
public:
    hash_policy policy() const noexcept override { return hash_policy::verified; }

    std::optional<block_id> resolve(block_store& blocks, const working_set& created,
                                    const fingerprint& fp, const byte* data) const override {
        for (block_id id : candidates(blocks, created, fp)) {
            const bytes existing = blocks.read(id);
            if (std::memcmp(existing.data(), data, existing.size()) == 0)
                return id;
        }
        return {};
    }
};

class trusted_resolver final : public block_resolver {
public:
    hash_policy policy() const noexcept override { return hash_policy::trusted; }

    std::optional<block_id> resolve(block_store& blocks, const working_set& created,
                                    const fingerprint& fp, const byte* data) const override {
        unused(data);

        if (auto pos = created.find(fp); pos != created.end() && !pos->second.empty())
            return pos->second.front();

        auto ids = blocks.find(fp);
        if (ids.empty())
            return {};
        return ids.front();
    }
};

} // namespace

const char* to_string(hash_policy policy) {
    switch (policy) {
    case hash_policy::verified: return "verified";
    case hash_policy::trusted: return "trusted";
    }
    DEDUPSTORE_UNREACHABLE("Invalid hash policy.");
}

block_resolver::~block_resolver() {}

std::vector<block_id>
block_resolver::candidates(block_store& blocks, const working_set& created, const fingerprint& fp) {
    std::vector<block_id> result;
    if (auto pos = created.find(fp); pos != created.end())
        result = pos->second;

    for (block_id id : blocks.find(fp)) {
        if (std::find(result.begin(), result.end(), id) == result.end())
            result.push_back(id);
    }
    return result;
}

std::unique_ptr<block_resolver> make_resolver(hash_policy policy) {
    switch (policy) {
    case hash_policy::verified: return std::make_unique<verified_resolver>();
    case hash_policy::trusted: return std::make_unique<trusted_resolver>();
    }
    DEDUPSTORE_UNREACHABLE("Invalid hash policy.");
}

} // namespace dedupstore
