#include "config/config.hpp"

#include <cstdint>

extern "C"
{
    extern const uint8_t _binary_mdof_config_json_start[];
    extern const uint8_t _binary_mdof_config_json_end[];
}

namespace config
{

    esp_err_t load_embedded(Document &out, std::vector<std::string> &problems)
    {
        const char *start = reinterpret_cast<const char *>(_binary_mdof_config_json_start);
        const char *end = reinterpret_cast<const char *>(_binary_mdof_config_json_end);
        std::size_t len = static_cast<std::size_t>(end - start);
        // TEXT embedding appends a terminating NUL.
        if (len > 0 && start[len - 1] == '\0')
            --len;
        return parse(start, len, out, problems);
    }

} // namespace config
