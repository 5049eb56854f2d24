#include "drivescore/telemetry/sample.hpp"

#include <cmath>
#include <sstream>

#include "drivescore/common/errors.hpp"

namespace drivescore::telemetry {

void TelemetrySample::validate() const
{
    if (vehicle_id.empty()) {
        throw ::drivescore::errors::InputError(DRIVESCORE_LOC("TelemetrySample.vehicle_id must not be empty"));
    }

    const auto require_finite = [this](const std::optional<double>& value, const char* field) {
        if (value && !std::isfinite(*value)) {
            std::ostringstream oss;
            oss << "TelemetrySample." << field << " must be finite; got " << *value;
            throw ::drivescore::errors::InputError(DRIVESCORE_LOC(oss.str()), vehicle_id);
        }
    };

    require_finite(speed_mph, "speed_mph");
    require_finite(rpm, "rpm");
    require_finite(fuel_rate_gph, "fuel_rate_gph");
    require_finite(ecu_mpg, "ecu_mpg");
    require_finite(kalman_mpg, "kalman_mpg");
    require_finite(brake_pressure_psi, "brake_pressure_psi");

    if (gear && *gear < 1) {
        std::ostringstream oss;
        oss << "TelemetrySample.gear must be >= 1; got " << *gear;
        throw ::drivescore::errors::InputError(DRIVESCORE_LOC(oss.str()), vehicle_id);
    }

    const auto require_count = [this](const std::optional<int>& value, const char* field) {
        if (value && *value < 0) {
            std::ostringstream oss;
            oss << "TelemetrySample." << field << " must be non-negative; got " << *value;
            throw ::drivescore::errors::InputError(DRIVESCORE_LOC(oss.str()), vehicle_id);
        }
    };

    require_count(device_harsh_accel, "device_harsh_accel");
    require_count(device_harsh_brake, "device_harsh_brake");
}

} // namespace drivescore::telemetry
