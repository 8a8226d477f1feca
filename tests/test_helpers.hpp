#pragma once
#include <gtest/gtest.h>
#include <core/errors.hpp>
#include <data/records.hpp>
#include <math/types.hpp>
#include <render/marker_renderer.hpp>

#include <cmath>
#include <cstdio>
#include <fstream>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace test_utils {

constexpr float POSITION_TOLERANCE = 1e-5f;

/**
 * Expectation helpers for vectors and rotations
 */
inline void expect_vec3_near(const atlas::math::vec3& actual, const atlas::math::vec3& expected,
                             float tolerance = POSITION_TOLERANCE) {
    EXPECT_NEAR(actual.x, expected.x, tolerance);
    EXPECT_NEAR(actual.y, expected.y, tolerance);
    EXPECT_NEAR(actual.z, expected.z, tolerance);
}

// q and -q are the same rotation
inline void expect_same_rotation(const atlas::math::quat& actual, const atlas::math::quat& expected,
                                 float tolerance = 1e-5f) {
    float d = actual.x * expected.x + actual.y * expected.y +
              actual.z * expected.z + actual.w * expected.w;
    EXPECT_NEAR(std::fabs(d), 1.0f, tolerance)
        << "rotations differ: (" << actual.x << ", " << actual.y << ", " << actual.z << ", "
        << actual.w << ") vs (" << expected.x << ", " << expected.y << ", " << expected.z
        << ", " << expected.w << ")";
}

/**
 * Sample builders
 */
inline atlas::data::MetricSample make_sample(const std::string& country,
                                             std::optional<double> value,
                                             std::optional<double> latitude = 10.0,
                                             std::optional<double> longitude = 20.0,
                                             int year = 2020) {
    atlas::data::MetricSample s;
    s.country = country;
    s.value = value;
    s.latitude = latitude;
    s.longitude = longitude;
    s.year = year;
    return s;
}

inline atlas::data::HistoryRow make_row(const std::string& country, int year,
                                        std::optional<double> ghg,
                                        std::optional<double> power = std::nullopt,
                                        std::optional<double> energy = std::nullopt) {
    atlas::data::HistoryRow row;
    row.country_name = country;
    row.country_code = country.substr(0, 3);
    row.year = year;
    row.values[atlas::data::metric_index(atlas::data::Metric::Ghg)] = ghg;
    row.values[atlas::data::metric_index(atlas::data::Metric::Power)] = power;
    row.values[atlas::data::metric_index(atlas::data::Metric::Energy)] = energy;
    return row;
}

/**
 * History sources
 */
class InMemoryHistorySource : public atlas::data::IHistorySource {
public:
    explicit InMemoryHistorySource(std::vector<atlas::data::HistoryRow> rows) : rows_(std::move(rows)) {}

    std::vector<atlas::data::HistoryRow> all_years_rows() const override {
        ++scan_count;
        return rows_;
    }

    mutable int scan_count = 0;

private:
    std::vector<atlas::data::HistoryRow> rows_;
};

class FailingHistorySource : public atlas::data::IHistorySource {
public:
    std::vector<atlas::data::HistoryRow> all_years_rows() const override {
        ++scan_count;
        throw atlas::FileUnavailableError("missing.csv");
    }

    mutable int scan_count = 0;
};

/**
 * Renderer that records every call
 */
class RecordingRenderer : public atlas::render::IMarkerRenderer {
public:
    struct LiveMarker {
        std::string key;
        atlas::math::vec3 position;
        int bin = 0;
        bool label = false;
        bool glow = false;
        int moves = 0;
    };

    atlas::render::MarkerHandle create_marker(const std::string& key, const atlas::math::vec3& position,
                                              const atlas::math::quat&, int bin) override {
        auto handle = next_handle_++;
        live[handle] = LiveMarker{key, position, bin, false, false, 0};
        ++creates;
        return handle;
    }

    void move_marker(atlas::render::MarkerHandle handle, const atlas::math::vec3& position,
                     float duration) override {
        live.at(handle).position = position;
        ++live.at(handle).moves;
        last_duration = duration;
        ++moves;
    }

    void recolor_marker(atlas::render::MarkerHandle handle, int bin) override {
        live.at(handle).bin = bin;
    }

    void set_label_visible(atlas::render::MarkerHandle handle, bool visible) override {
        live.at(handle).label = visible;
    }

    void set_glow(atlas::render::MarkerHandle handle, bool enabled) override {
        live.at(handle).glow = enabled;
    }

    void remove_marker(atlas::render::MarkerHandle handle) override {
        live.erase(handle);
        ++removes;
    }

    atlas::render::LandmarkHandle create_landmark(const atlas::markers::Landmark& landmark) override {
        auto handle = next_handle_++;
        landmarks[handle] = landmark;
        return handle;
    }

    void remove_landmark(atlas::render::LandmarkHandle handle) override {
        landmarks.erase(handle);
    }

    const LiveMarker* find(const std::string& key) const {
        for (const auto& [handle, marker] : live) {
            if (marker.key == key) return &marker;
        }
        return nullptr;
    }

    std::map<atlas::render::MarkerHandle, LiveMarker> live;
    std::map<atlas::render::LandmarkHandle, atlas::markers::Landmark> landmarks;
    int creates = 0;
    int moves = 0;
    int removes = 0;
    float last_duration = 0.0f;

private:
    atlas::render::MarkerHandle next_handle_ = 1;
};

/**
 * Temporary file removed when the guard goes out of scope
 */
class TempFile {
public:
    TempFile(const std::string& name, const std::string& contents)
        : path_(::testing::TempDir() + name) {
        std::ofstream out(path_);
        out << contents;
    }
    ~TempFile() { std::remove(path_.c_str()); }

    TempFile(const TempFile&) = delete;
    TempFile& operator=(const TempFile&) = delete;

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

} // namespace test_utils
