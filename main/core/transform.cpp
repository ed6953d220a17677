#include "core/transform.hpp"

#include "core/mdof_err.hpp"
#include "esp_log.h"

#include <algorithm>
#include <cmath>
#include <cstdio>

namespace transform
{

    namespace
    {
        static const char *TAG = "transform";

        double clamp(double v, double lo, double hi)
        {
            return std::min(std::max(v, lo), hi);
        }

        class DirectTransform : public Transform
        {
        public:
            DirectTransform(std::string name, ParamMap p)
                : Transform(std::move(name), p), deadzone_(p["deadzone"]), scale_(p["scale"])
            {
            }
            double evaluate(double x, std::int64_t, State &) const override
            {
                return linear_direct(x, deadzone_, scale_);
            }
            bool stateful() const override { return false; }

        private:
            double deadzone_;
            double scale_;
        };

        class ScaledTransform : public Transform
        {
        public:
            ScaledTransform(std::string name, ParamMap p)
                : Transform(std::move(name), p),
                  in_min_(p["input_min"]), in_max_(p["input_max"]),
                  out_min_(p["output_min"]), out_max_(p["output_max"])
            {
            }
            double evaluate(double x, std::int64_t, State &) const override
            {
                return linear_scaled(x, in_min_, in_max_, out_min_, out_max_);
            }
            bool stateful() const override { return false; }

        private:
            double in_min_;
            double in_max_;
            double out_min_;
            double out_max_;
        };

        class NormalisedTransform : public Transform
        {
        public:
            NormalisedTransform(std::string name, ParamMap p)
                : Transform(std::move(name), p), deadzone_(p["deadzone"]), max_magnitude_(p["max_magnitude"])
            {
            }
            double evaluate(double x, std::int64_t, State &) const override
            {
                return linear_normalised(x, deadzone_, max_magnitude_);
            }
            bool stateful() const override { return false; }

        private:
            double deadzone_;
            double max_magnitude_;
        };

        class ExponentialTransform : public Transform
        {
        public:
            ExponentialTransform(std::string name, ParamMap p)
                : Transform(std::move(name), p), base_(p["base"]), factor_(p["factor"]), deadzone_(p["deadzone"])
            {
            }
            double evaluate(double x, std::int64_t, State &) const override
            {
                return exponential(x, base_, factor_, deadzone_);
            }
            bool stateful() const override { return false; }

        private:
            double base_;
            double factor_;
            double deadzone_;
        };

        class SmoothedTransform : public Transform
        {
        public:
            SmoothedTransform(std::string name, ParamMap p)
                : Transform(std::move(name), p), window_(static_cast<std::size_t>(p["window_size"]))
            {
            }
            double evaluate(double x, std::int64_t, State &state) const override
            {
                return smoothed(x, window_, state);
            }
            bool stateful() const override { return true; }

        private:
            std::size_t window_;
        };

        class ThresholdTransform : public Transform
        {
        public:
            ThresholdTransform(std::string name, ParamMap p)
                : Transform(std::move(name), p), threshold_(p["threshold"]), high_(p["high_value"]), low_(p["low_value"])
            {
            }
            double evaluate(double x, std::int64_t, State &) const override
            {
                return threshold(x, threshold_, high_, low_);
            }
            bool stateful() const override { return false; }

        private:
            double threshold_;
            double high_;
            double low_;
        };

        class AdaptiveTransform : public Transform
        {
        public:
            AdaptiveTransform(std::string name, ParamMap p)
                : Transform(std::move(name), p), sensitivity_(p["sensitivity"]), dt_(p["dt"]),
                  use_timestamps_(p["use_timestamps"] != 0.0)
            {
            }
            double evaluate(double x, std::int64_t timestamp_us, State &state) const override
            {
                return adaptive(x, sensitivity_, dt_, use_timestamps_, timestamp_us, state);
            }
            bool stateful() const override { return true; }

        private:
            double sensitivity_;
            double dt_;
            bool use_timestamps_;
        };

        // Range checks that cannot be expressed by defaults alone.
        bool check_params(Kind kind, const ParamMap &p, std::string &problem)
        {
            char buf[160];
            auto fail = [&](const char *what) {
                problem = what;
                return false;
            };

            for (const auto &kv : p)
            {
                if (!std::isfinite(kv.second))
                {
                    std::snprintf(buf, sizeof(buf), "parameter '%s' is not a finite number", kv.first.c_str());
                    return fail(buf);
                }
            }

            auto it = p.find("deadzone");
            if (it != p.end() && it->second < 0.0)
            {
                return fail("deadzone must be >= 0");
            }

            switch (kind)
            {
            case Kind::LinearScaled:
                if (!(p.at("input_min") < p.at("input_max")))
                    return fail("input_min must be less than input_max");
                if (p.at("output_min") == p.at("output_max"))
                    return fail("output_min and output_max must differ");
                break;
            case Kind::LinearNormalised:
                if (!(p.at("max_magnitude") > 0.0))
                    return fail("max_magnitude must be > 0");
                break;
            case Kind::Exponential:
                if (!(p.at("base") > 0.0) || p.at("base") == 1.0)
                    return fail("base must be > 0 and != 1");
                break;
            case Kind::Smoothed:
            {
                double w = p.at("window_size");
                if (w < 1.0 || w > static_cast<double>(kMaxWindow) || std::floor(w) != w)
                {
                    std::snprintf(buf, sizeof(buf), "window_size must be an integer in [1, %u]", static_cast<unsigned>(kMaxWindow));
                    return fail(buf);
                }
                break;
            }
            case Kind::Adaptive:
                if (p.at("dt") < 0.0)
                    return fail("dt must be >= 0");
                if (p.at("use_timestamps") != 0.0 && p.at("use_timestamps") != 1.0)
                    return fail("use_timestamps must be 0 or 1");
                break;
            default:
                break;
            }
            return true;
        }

    } // namespace

    bool KindInfo::has_param(const std::string &param) const
    {
        for (const auto &info : params)
        {
            if (param == info.name)
                return true;
        }
        return false;
    }

    const std::vector<KindInfo> &kinds()
    {
        static const std::vector<KindInfo> s_kinds = {
            {Kind::LinearDirect, "linear.direct", false, {{"deadzone", 0.1}, {"scale", 1.0}}},
            {Kind::LinearScaled, "linear.scaled", false, {{"input_min", -1.0}, {"input_max", 1.0}, {"output_min", -1.0}, {"output_max", 1.0}}},
            {Kind::LinearNormalised, "linear.normalised", false, {{"deadzone", 0.1}, {"max_magnitude", 1.0}}},
            {Kind::Exponential, "non_linear.exponential", false, {{"base", 2.0}, {"factor", 1.0}, {"deadzone", 0.1}}},
            {Kind::Smoothed, "non_linear.smoothed", true, {{"window_size", 5.0}}},
            {Kind::Threshold, "non_linear.threshold", false, {{"threshold", 0.5}, {"high_value", 1.0}, {"low_value", 0.0}}},
            {Kind::Adaptive, "non_linear.adaptive", true, {{"sensitivity", 1.0}, {"dt", 0.0}, {"use_timestamps", 0.0}}},
        };
        return s_kinds;
    }

    const KindInfo *find_kind(const std::string &qualified_name)
    {
        for (const auto &info : kinds())
        {
            if (qualified_name == info.qualified_name)
                return &info;
        }
        return nullptr;
    }

    void State::reset()
    {
        has_last = false;
        last_x = 0.0;
        last_timestamp_us = 0;
        capacity_ = 0;
        head_ = 0;
        count_ = 0;
    }

    double State::push_and_mean(double x, std::size_t window)
    {
        window = std::min(std::max<std::size_t>(window, 1), kMaxWindow);
        if (window != capacity_)
        {
            capacity_ = window;
            head_ = 0;
            count_ = 0;
        }

        ring_[head_] = x;
        head_ = (head_ + 1) % capacity_;
        if (count_ < capacity_)
            ++count_;

        double sum = 0.0;
        for (std::size_t i = 0; i < count_; ++i)
        {
            sum += ring_[i];
        }
        return sum / static_cast<double>(count_);
    }

    double linear_direct(double x, double deadzone, double scale)
    {
        if (std::fabs(x) < deadzone)
            return 0.0;
        return x * scale;
    }

    double linear_scaled(double x, double input_min, double input_max, double output_min, double output_max)
    {
        x = clamp(x, input_min, input_max);
        double t = (x - input_min) / (input_max - input_min);
        double y = output_min + t * (output_max - output_min);
        return clamp(y, std::min(output_min, output_max), std::max(output_min, output_max));
    }

    double linear_normalised(double x, double deadzone, double max_magnitude)
    {
        if (std::fabs(x) < deadzone)
            return 0.0;
        return clamp(x / max_magnitude, -1.0, 1.0);
    }

    double exponential(double x, double base, double factor, double deadzone)
    {
        double mag = std::fabs(x);
        if (mag < deadzone)
            return 0.0;
        double sign = (x < 0.0) ? -1.0 : 1.0;
        return sign * factor * (std::pow(base, mag) - 1.0) / (base - 1.0);
    }

    double smoothed(double x, std::size_t window_size, State &state)
    {
        return state.push_and_mean(x, window_size);
    }

    double threshold(double x, double threshold, double high_value, double low_value)
    {
        return (std::fabs(x) >= threshold) ? high_value : low_value;
    }

    double adaptive(double x, double sensitivity, double dt, bool use_timestamps, std::int64_t timestamp_us, State &state)
    {
        double velocity = 0.0;
        if (state.has_last)
        {
            double step = dt;
            if (use_timestamps)
            {
                step = static_cast<double>(timestamp_us - state.last_timestamp_us) / 1e6;
            }
            if (step > 0.0)
            {
                velocity = (x - state.last_x) / step;
            }
        }
        state.has_last = true;
        state.last_x = x;
        state.last_timestamp_us = timestamp_us;
        return velocity * sensitivity;
    }

    esp_err_t make(const std::string &qualified_name,
                   const ParamMap &params,
                   std::unique_ptr<Transform> &out,
                   std::string &problem)
    {
        out.reset();
        const KindInfo *info = find_kind(qualified_name);
        if (!info)
        {
            problem = "unknown transform '" + qualified_name + "'";
            return MDOF_ERR_CONFIG;
        }

        ParamMap resolved;
        for (const auto &p : info->params)
        {
            resolved[p.name] = p.default_value;
        }
        for (const auto &kv : params)
        {
            if (!info->has_param(kv.first))
            {
                problem = "transform '" + qualified_name + "' has no parameter '" + kv.first + "'";
                return MDOF_ERR_CONFIG;
            }
            resolved[kv.first] = kv.second;
        }

        std::string why;
        if (!check_params(info->kind, resolved, why))
        {
            problem = qualified_name + ": " + why;
            return MDOF_ERR_CONFIG;
        }

        switch (info->kind)
        {
        case Kind::LinearDirect:
            out.reset(new DirectTransform(qualified_name, resolved));
            break;
        case Kind::LinearScaled:
            out.reset(new ScaledTransform(qualified_name, resolved));
            break;
        case Kind::LinearNormalised:
            out.reset(new NormalisedTransform(qualified_name, resolved));
            break;
        case Kind::Exponential:
            out.reset(new ExponentialTransform(qualified_name, resolved));
            break;
        case Kind::Smoothed:
            out.reset(new SmoothedTransform(qualified_name, resolved));
            break;
        case Kind::Threshold:
            out.reset(new ThresholdTransform(qualified_name, resolved));
            break;
        case Kind::Adaptive:
            out.reset(new AdaptiveTransform(qualified_name, resolved));
            break;
        }

        ESP_LOGD(TAG, "built %s (%u params)", qualified_name.c_str(), static_cast<unsigned>(resolved.size()));
        return ESP_OK;
    }

} // namespace transform
