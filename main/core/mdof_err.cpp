#include "core/mdof_err.hpp"

const char *mdof_err_to_name(esp_err_t err)
{
    switch (err)
    {
    case MDOF_ERR_CONFIG:
        return "MDOF_ERR_CONFIG";
    case MDOF_ERR_DEVICE_NOT_FOUND:
        return "MDOF_ERR_DEVICE_NOT_FOUND";
    case MDOF_ERR_DEVICE_DISCONNECTED:
        return "MDOF_ERR_DEVICE_DISCONNECTED";
    case MDOF_ERR_TRANSMIT:
        return "MDOF_ERR_TRANSMIT";
    default:
        return esp_err_to_name(err);
    }
}
