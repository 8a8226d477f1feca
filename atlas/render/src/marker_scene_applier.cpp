#include <render/marker_scene_applier.hpp>
#include <core/debug_log.hpp>

namespace atlas::render {

using markers::MarkerOpType;

void MarkerSceneApplier::apply(const markers::ReconcileResult& result) {
    for (const auto& op : result.operations) {
        switch (op.type) {
            case MarkerOpType::Create: {
                MarkerHandle handle = renderer_->create_marker(op.key, op.position, op.orientation, op.bin);
                renderer_->set_label_visible(handle, op.selected);
                handles_[op.key] = handle;
                break;
            }
            case MarkerOpType::Update: {
                auto it = handles_.find(op.key);
                if (it == handles_.end()) {
                    // Marker map and scene drifted apart; rebuild the entity
                    ATLAS_WARN("Update for unknown marker %s; recreating", op.key.c_str());
                    MarkerHandle handle = renderer_->create_marker(op.key, op.position, op.orientation, op.bin);
                    renderer_->set_label_visible(handle, op.selected);
                    handles_[op.key] = handle;
                    break;
                }
                renderer_->move_marker(it->second, op.position, op.duration);
                renderer_->recolor_marker(it->second, op.bin);
                renderer_->set_label_visible(it->second, op.selected);
                break;
            }
            case MarkerOpType::Remove: {
                auto it = handles_.find(op.key);
                if (it != handles_.end()) {
                    renderer_->remove_marker(it->second);
                    handles_.erase(it);
                }
                break;
            }
        }
    }
    apply_glow(result.glow_target);
}

void MarkerSceneApplier::apply_glow(const std::optional<std::string>& target) {
    for (const auto& [key, handle] : handles_) {
        renderer_->set_glow(handle, target && *target == key);
    }
}

void MarkerSceneApplier::apply(const std::vector<markers::LandmarkOp>& ops) {
    for (const auto& op : ops) {
        switch (op.type) {
            case markers::LandmarkOpType::Create:
                if (landmark_) renderer_->remove_landmark(*landmark_);
                landmark_ = renderer_->create_landmark(op.landmark);
                break;
            case markers::LandmarkOpType::Remove:
                if (landmark_) {
                    renderer_->remove_landmark(*landmark_);
                    landmark_.reset();
                }
                break;
        }
    }
}

std::optional<MarkerHandle> MarkerSceneApplier::handle_for(const std::string& key) const {
    auto it = handles_.find(key);
    if (it == handles_.end()) return std::nullopt;
    return it->second;
}

} // namespace atlas::render
