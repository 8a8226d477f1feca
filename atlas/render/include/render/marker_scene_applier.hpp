// Applies reconciliation and landmark operations to a renderer,
// keeping the key -> handle table for live markers

#pragma once

#include <markers/landmark_placer.hpp>
#include <markers/marker_reconciler.hpp>
#include <render/marker_renderer.hpp>

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace atlas::render {

class MarkerSceneApplier {
public:
    // `renderer` must outlive the applier
    explicit MarkerSceneApplier(IMarkerRenderer& renderer) : renderer_(&renderer) {}

    void apply(const markers::ReconcileResult& result);
    void apply(const std::vector<markers::LandmarkOp>& ops);

    std::optional<MarkerHandle> handle_for(const std::string& key) const;
    size_t marker_count() const { return handles_.size(); }
    bool has_landmark() const { return landmark_.has_value(); }

private:
    void apply_glow(const std::optional<std::string>& target);

    IMarkerRenderer* renderer_;
    std::unordered_map<std::string, MarkerHandle> handles_;
    std::optional<LandmarkHandle> landmark_;
};

} // namespace atlas::render
