#include "core/command_template.hpp"

#include <cinttypes>
#include <cmath>
#include <cstdio>
#include <cstring>

namespace command
{

    namespace
    {
        // Beyond this the thousandths count no longer has an exact double.
        constexpr double kThousandthsLimit = 9.0e15;

        bool append(char *out, std::size_t out_len, std::size_t &pos, const char *src, std::size_t len)
        {
            if (pos + len >= out_len)
                return false;
            std::memcpy(out + pos, src, len);
            pos += len;
            out[pos] = '\0';
            return true;
        }
    } // namespace

    std::int64_t round_thousandths(double v)
    {
        if (!std::isfinite(v))
            return 0;

        double t = v * 1000.0;
        if (std::fabs(t) >= kThousandthsLimit)
            return static_cast<std::int64_t>(t > 0.0 ? kThousandthsLimit : -kThousandthsLimit);

        // fma() gives the sign of v*1000 - c without an intermediate rounding,
        // so q ends up as floor() of the exact product.
        double q = std::floor(t);
        if (std::fma(v, 1000.0, -q) < 0.0)
        {
            q -= 1.0;
        }
        else if (std::fma(v, 1000.0, -(q + 1.0)) >= 0.0)
        {
            q += 1.0;
        }

        double rem = std::fma(v, 1000.0, -(q + 0.5));
        if (rem > 0.0 || (rem == 0.0 && std::fmod(q, 2.0) != 0.0))
        {
            q += 1.0;
        }
        return static_cast<std::int64_t>(q);
    }

    std::size_t format_fixed3(double v, char *out, std::size_t out_len)
    {
        if (!out || out_len == 0)
            return 0;

        std::int64_t n = round_thousandths(v);
        bool negative = n < 0;
        std::uint64_t a = negative ? static_cast<std::uint64_t>(-n) : static_cast<std::uint64_t>(n);
        std::uint64_t whole = a / 1000u;
        unsigned frac = static_cast<unsigned>(a % 1000u);

        char frac_buf[4];
        if (frac == 0)
        {
            std::snprintf(frac_buf, sizeof(frac_buf), "0");
        }
        else
        {
            std::snprintf(frac_buf, sizeof(frac_buf), "%03u", frac);
            for (int i = 2; i > 0 && frac_buf[i] == '0'; --i)
            {
                frac_buf[i] = '\0';
            }
        }

        int len = std::snprintf(out, out_len, "%s%" PRIu64 ".%s", negative ? "-" : "", whole, frac_buf);
        if (len < 0)
        {
            out[0] = '\0';
            return 0;
        }
        return (static_cast<std::size_t>(len) < out_len) ? static_cast<std::size_t>(len) : out_len - 1;
    }

    std::string format_fixed3(double v)
    {
        char buf[32];
        std::size_t len = format_fixed3(v, buf, sizeof(buf));
        return std::string(buf, len);
    }

    esp_err_t Template::parse(const std::string &text, Template &out, std::string &problem)
    {
        Template t;
        t.text_ = text;
        std::string current;

        for (std::size_t i = 0; i < text.size(); ++i)
        {
            char c = text[i];
            if (c != '%')
            {
                current.push_back(c);
                continue;
            }

            std::size_t rest = text.size() - i - 1;
            if (rest >= 1 && text[i + 1] == '%')
            {
                current.push_back('%');
                i += 1;
            }
            else if (rest >= 3 && text.compare(i + 1, 3, ".3f") == 0)
            {
                t.segments_.push_back(current);
                current.clear();
                i += 3;
            }
            else if (rest >= 1 && (text[i + 1] == 'f' || text[i + 1] == 'd' || text[i + 1] == 's'))
            {
                t.segments_.push_back(current);
                current.clear();
                i += 1;
            }
            else
            {
                problem = "unsupported placeholder at offset " + std::to_string(i) + " in '" + text + "'";
                return ESP_ERR_INVALID_ARG;
            }
        }
        t.segments_.push_back(current);

        if (text.empty())
        {
            problem = "empty command template";
            return ESP_ERR_INVALID_ARG;
        }

        out = std::move(t);
        return ESP_OK;
    }

    esp_err_t Template::render(const Value *values, std::size_t count, char *out, std::size_t out_len, std::size_t &written) const
    {
        written = 0;
        if (!out || out_len == 0)
            return ESP_ERR_INVALID_ARG;
        out[0] = '\0';
        if (count != arity() || (count > 0 && !values))
            return ESP_ERR_INVALID_ARG;

        std::size_t pos = 0;
        for (std::size_t i = 0; i < segments_.size(); ++i)
        {
            const std::string &seg = segments_[i];
            if (!append(out, out_len, pos, seg.data(), seg.size()))
                return ESP_ERR_INVALID_SIZE;

            if (i + 1 == segments_.size())
                break;

            char num[32];
            std::size_t len = 0;
            if (values[i].kind == ValueKind::Integer)
            {
                int n = std::snprintf(num, sizeof(num), "%" PRId64, values[i].integer);
                len = (n > 0) ? static_cast<std::size_t>(n) : 0;
            }
            else
            {
                len = format_fixed3(values[i].real, num, sizeof(num));
            }
            if (!append(out, out_len, pos, num, len))
                return ESP_ERR_INVALID_SIZE;
        }

        written = pos;
        return ESP_OK;
    }

    esp_err_t Template::render(const std::vector<Value> &values, std::string &out) const
    {
        char buf[256];
        std::size_t written = 0;
        esp_err_t err = render(values.data(), values.size(), buf, sizeof(buf), written);
        if (err == ESP_OK)
        {
            out.assign(buf, written);
        }
        return err;
    }

} // namespace command
