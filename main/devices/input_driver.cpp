#include "devices/input_driver.hpp"

#include <cctype>

namespace devices
{

    esp_err_t parse_hex_id(const std::string &text, std::uint16_t &out)
    {
        std::size_t i = 0;
        if (text.size() > 2 && text[0] == '0' && (text[1] == 'x' || text[1] == 'X'))
            i = 2;
        if (i == text.size() || text.size() - i > 4)
            return ESP_ERR_INVALID_ARG;

        unsigned value = 0;
        for (; i < text.size(); ++i)
        {
            unsigned char c = static_cast<unsigned char>(text[i]);
            if (!std::isxdigit(c))
                return ESP_ERR_INVALID_ARG;
            unsigned digit = std::isdigit(c) ? c - '0' : (std::tolower(c) - 'a' + 10);
            value = (value << 4) | digit;
        }
        out = static_cast<std::uint16_t>(value);
        return ESP_OK;
    }

} // namespace devices
