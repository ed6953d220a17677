#pragma once

#include "esp_err.h"

#include <array>
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>

// Numeric response curves applied to one scalar axis value at a time.
// Transforms are immutable once built and may be shared between sessions;
// everything that changes between calls lives in a State owned by the caller.
namespace transform
{

    constexpr std::size_t kMaxWindow = 64;

    enum class Kind
    {
        LinearDirect,
        LinearScaled,
        LinearNormalised,
        Exponential,
        Smoothed,
        Threshold,
        Adaptive,
    };

    using ParamMap = std::map<std::string, double>;

    struct ParamInfo
    {
        const char *name;
        double default_value;
    };

    struct KindInfo
    {
        Kind kind;
        const char *qualified_name; // "family.kind"
        bool stateful;
        std::vector<ParamInfo> params;

        bool has_param(const std::string &param) const;
    };

    // Built-in catalog of every kind the engine can evaluate.
    const std::vector<KindInfo> &kinds();
    const KindInfo *find_kind(const std::string &qualified_name);

    // Mutable per (device, axis) state: rolling window for smoothing and the
    // last sample for velocity based transforms.
    class State
    {
    public:
        void reset();

        // Push x into a rolling window of `window` samples (oldest evicted)
        // and return the mean of what the window currently holds.
        double push_and_mean(double x, std::size_t window);
        std::size_t window_count() const { return count_; }

        bool has_last = false;
        double last_x = 0.0;
        std::int64_t last_timestamp_us = 0;

    private:
        std::array<double, kMaxWindow> ring_{};
        std::size_t capacity_ = 0;
        std::size_t head_ = 0;
        std::size_t count_ = 0;
    };

    double linear_direct(double x, double deadzone, double scale);
    double linear_scaled(double x, double input_min, double input_max, double output_min, double output_max);
    double linear_normalised(double x, double deadzone, double max_magnitude);
    double exponential(double x, double base, double factor, double deadzone);
    double smoothed(double x, std::size_t window_size, State &state);
    double threshold(double x, double threshold, double high_value, double low_value);
    // Velocity over a fixed dt; 0 when dt is 0. With use_timestamps the
    // elapsed time between samples replaces dt.
    double adaptive(double x, double sensitivity, double dt, bool use_timestamps, std::int64_t timestamp_us, State &state);

    class Transform
    {
    public:
        virtual ~Transform() = default;

        virtual double evaluate(double x, std::int64_t timestamp_us, State &state) const = 0;
        virtual bool stateful() const = 0;

        const std::string &name() const { return name_; }
        const ParamMap &params() const { return params_; }

    protected:
        Transform(std::string name, ParamMap params)
            : name_(std::move(name)), params_(std::move(params))
        {
        }

    private:
        std::string name_;
        ParamMap params_;
    };

    // Build a transform from its qualified name and parameters. Parameters not
    // present in `params` take the built-in defaults. Unknown names, unknown
    // parameters and out-of-range values fail with MDOF_ERR_CONFIG and a
    // description in `problem`.
    esp_err_t make(const std::string &qualified_name,
                   const ParamMap &params,
                   std::unique_ptr<Transform> &out,
                   std::string &problem);

} // namespace transform
