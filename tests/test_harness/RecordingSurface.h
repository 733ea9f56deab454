#ifndef CIRCUITSKETCH_TEST_RECORDING_SURFACE_H
#define CIRCUITSKETCH_TEST_RECORDING_SURFACE_H

#include "render/RenderSurface.h"

#include <algorithm>
#include <sstream>
#include <string>
#include <vector>

namespace circuitsketch::test {

/**
 * @brief RenderSurface that records every call as a short text line
 *
 * Lines look like "moveTo 0 0" or "strokeColor #000000"; tests compare
 * against them or count prefixes.
 */
class RecordingSurface : public render::RenderSurface {
public:
    void save() override { record("save"); ++depth_; }
    void restore() override { record("restore"); --depth_; }

    void setStrokeColor(const std::string& color) override { record("strokeColor " + color); }
    void setStrokeWidth(double width) override { record("strokeWidth " + num(width)); }
    void setStrokeDash(const std::vector<double>& pattern) override {
        std::string line = "strokeDash";
        for (double length : pattern) {
            line += " " + num(length);
        }
        record(line);
    }
    void setStrokeCap(render::LineCap cap) override {
        record(std::string("strokeCap ") + (cap == render::LineCap::Round ? "round" : "other"));
    }
    void setStrokeJoin(render::LineJoin join) override {
        record(std::string("strokeJoin ") + (join == render::LineJoin::Round ? "round" : "other"));
    }
    void setFillColor(const std::string& color) override { record("fillColor " + color); }

    void beginPath() override { record("beginPath"); }
    void moveTo(double x, double y) override { record("moveTo " + num(x) + " " + num(y)); }
    void lineTo(double x, double y) override { record("lineTo " + num(x) + " " + num(y)); }
    void closePath() override { record("closePath"); }
    void circle(double cx, double cy, double radius) override {
        record("circle " + num(cx) + " " + num(cy) + " " + num(radius));
    }
    void rectangle(double x, double y, double width, double height) override {
        record("rectangle " + num(x) + " " + num(y) + " " + num(width) + " " + num(height));
    }

    void stroke() override { record("stroke"); }
    void fill() override { record("fill"); }
    void fillText(const std::string& text, double x, double y) override {
        record("fillText " + text + " " + num(x) + " " + num(y));
    }

    const std::vector<std::string>& calls() const { return calls_; }
    int depth() const { return depth_; }

    size_t count(const std::string& prefix) const {
        return static_cast<size_t>(std::count_if(calls_.begin(), calls_.end(),
                                                 [&prefix](const std::string& call) {
                                                     return call.rfind(prefix, 0) == 0;
                                                 }));
    }

    bool contains(const std::string& call) const {
        return std::find(calls_.begin(), calls_.end(), call) != calls_.end();
    }

    void reset() {
        calls_.clear();
        depth_ = 0;
    }

private:
    static std::string num(double value) {
        std::ostringstream oss;
        oss << value;
        return oss.str();
    }

    void record(std::string call) { calls_.push_back(std::move(call)); }

    std::vector<std::string> calls_;
    int depth_ = 0;
};

} // namespace circuitsketch::test

#endif // CIRCUITSKETCH_TEST_RECORDING_SURFACE_H
