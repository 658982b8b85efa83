#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "domain/domain_model.hpp"

namespace jh::client::app {

struct MergeStats {
    std::size_t updated{0};
    std::size_t added{0};
    std::size_t skippedByUrl{0};
    std::size_t skippedBySignature{0};
    // id matches whose new url or signature was already held by another record
    std::size_t keptKeyFields{0};
};

// Reconciles the stored job collection with a batch reported by the worker.
//
// Duplicate keys, checked in this order for every incoming job:
//  - id             -> existing record is overwritten (last write wins)
//  - lowercased url -> incoming job is skipped
//  - signature      -> incoming job is skipped
// Anything else is appended and indexed, so duplicates inside one batch are
// caught as well.
//
// On an id match required fields are overwritten. Optional fields are merged
// only if incoming has a value, so a locally set hidden flag survives a
// re-emitted job that does not carry one. If the new url or signature is
// already held by a different record, the matched record keeps its old url,
// title and company.
struct JobMerger final {
    static std::vector<domain::Job> merge(const std::vector<domain::Job>& existing,
                                          const std::vector<domain::Job>& incoming,
                                          MergeStats* stats = nullptr);

    // merge({}, jobs): drops every record that collides with an earlier one.
    static std::vector<domain::Job> removeDuplicates(const std::vector<domain::Job>& jobs,
                                                     MergeStats* stats = nullptr);

    // True if any job in `jobs` shares the id, normalized url or signature.
    static bool collidesWithAny(const std::vector<domain::Job>& jobs, const domain::Job& job);

    // "company||title", lowercased, whitespace collapsed and trimmed.
    static std::string signature(const domain::Job& job);
    static std::string normalizedUrl(const domain::Job& job);

private:
    static void overwrite(domain::Job& dst, const domain::Job& in);
};

} // namespace jh::client::app
