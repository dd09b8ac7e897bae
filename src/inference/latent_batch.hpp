#pragma once

#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// LatentBatch - encoder outputs for many entities as of one cutoff
// ---------------------------------------------------------------------------
struct LatentBatch {
    int cutoff = 0;
    std::vector<std::string> entity_ids;
    std::vector<std::vector<float>> latents;  // parallel to entity_ids
    std::vector<std::string> skipped;         // no usable history before cutoff

    size_t size() const { return entity_ids.size(); }
    size_t latent_dim() const { return latents.empty() ? 0 : latents.front().size(); }
};
