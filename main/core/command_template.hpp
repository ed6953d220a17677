#pragma once

#include "esp_err.h"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace command
{

    enum class ValueKind
    {
        Real,
        Integer,
    };

    struct Value
    {
        ValueKind kind = ValueKind::Real;
        double real = 0.0;
        std::int64_t integer = 0;

        static Value of_real(double v)
        {
            Value out;
            out.real = v;
            return out;
        }
        static Value of_integer(std::int64_t v)
        {
            Value out;
            out.kind = ValueKind::Integer;
            out.integer = v;
            return out;
        }
    };

    // A command format string checked once at load time. Placeholders are
    // %.3f, %f, %d and %s (all positional, rendered by value kind); %% is a
    // literal percent. A template without placeholders is a literal command.
    class Template
    {
    public:
        static esp_err_t parse(const std::string &text, Template &out, std::string &problem);

        const std::string &text() const { return text_; }
        std::size_t arity() const { return segments_.empty() ? 0 : segments_.size() - 1; }
        bool is_literal() const { return arity() == 0; }

        // Render with exactly arity() values. Fails with ESP_ERR_INVALID_ARG
        // on an arity mismatch and ESP_ERR_INVALID_SIZE if `out` is too small.
        esp_err_t render(const Value *values, std::size_t count, char *out, std::size_t out_len, std::size_t &written) const;
        esp_err_t render(const std::vector<Value> &values, std::string &out) const;

    private:
        std::string text_;
        // Literal text between placeholders; size() == arity() + 1.
        std::vector<std::string> segments_;
    };

    // Round half-to-even at 3 decimals on the exact binary value of v and
    // return the thousandths count.
    std::int64_t round_thousandths(double v);

    // Shortest rendering of v rounded to 3 decimals, keeping at least one
    // fractional digit: 0.0394 -> "0.039", 0 -> "0.0", -1.5 -> "-1.5".
    // Returns the number of characters written (excluding the terminator).
    std::size_t format_fixed3(double v, char *out, std::size_t out_len);
    std::string format_fixed3(double v);

} // namespace command
