#pragma once

#include <string>
#include <cstdint>

namespace invoicing::domain {

/**
 * @brief Данные отправки, появляются у счёта начиная со статуса shipped
 */
struct TrackingInfo {
    std::string carrierName;
    std::string trackingCode;
    std::string shippingDate;
    int64_t numberOfPackages = 0;
};

} // namespace invoicing::domain
