#include "pid_registry.hpp"

namespace obd {

// Service 01 response as one multiplexed message:
// byte 0 = service (0x41), byte 1 = PID (mux switch), data from byte 2.
static const char* kService01Dbc = R"DBC(
VERSION ""

NS_ :

BS_:

BU_: ECU

BO_ 2024 OBD2_Service01: 8 ECU
 SG_ Service : 0|8@1+ (1,0) [0|255] "" ECU
 SG_ PID M : 8|8@1+ (1,0) [0|255] "" ECU
 SG_ FuelSystemStatus m3 : 16|8@1+ (1,0) [0|255] "" ECU
 SG_ CalculatedEngineLoad m4 : 16|8@1+ (0.392156862745098,0) [0|100] "%" ECU
 SG_ CoolantTemp m5 : 16|8@1+ (1,-40) [-40|215] "degC" ECU
 SG_ FuelPressure m10 : 16|8@1+ (3,0) [0|765] "kPa" ECU
 SG_ IntakeManifoldAbsolutePressure m11 : 16|8@1+ (1,0) [0|255] "kPa" ECU
 SG_ Rpm m12 : 23|16@0+ (0.25,0) [0|16383.75] "rpm" ECU
 SG_ VehicleSpeed m13 : 16|8@1+ (1,0) [0|255] "km/h" ECU
 SG_ IntakeAirTemperature m15 : 16|8@1+ (1,-40) [-40|215] "degC" ECU
 SG_ MafAirFlowRate m16 : 23|16@0+ (0.01,0) [0|655.35] "g/s" ECU
 SG_ ThrottlePosition m17 : 16|8@1+ (0.392156862745098,0) [0|100] "%" ECU
 SG_ ObdStandard m28 : 16|8@1+ (1,0) [0|255] "" ECU
 SG_ FuelLevel m47 : 16|8@1+ (0.392156862745098,0) [0|100] "%" ECU
 SG_ Gear m164 : 28|4@1+ (1,0) [0|15] "" ECU
 SG_ Odometer m166 : 23|32@0+ (0.1,0) [0|429496729.5] "km" ECU

CM_ SG_ 2024 FuelSystemStatus "Fuel system status, bank 1";
CM_ SG_ 2024 CalculatedEngineLoad "Calculated engine load";
CM_ SG_ 2024 CoolantTemp "Engine coolant temperature";
CM_ SG_ 2024 FuelPressure "Fuel pressure (gauge)";
CM_ SG_ 2024 IntakeManifoldAbsolutePressure "Intake manifold absolute pressure";
CM_ SG_ 2024 Rpm "Engine RPM";
CM_ SG_ 2024 VehicleSpeed "Vehicle speed";
CM_ SG_ 2024 IntakeAirTemperature "Intake air temperature";
CM_ SG_ 2024 MafAirFlowRate "MAF air flow rate";
CM_ SG_ 2024 ThrottlePosition "Throttle position";
CM_ SG_ 2024 ObdStandard "OBD standards this vehicle conforms to";
CM_ SG_ 2024 FuelLevel "Fuel tank level input";
CM_ SG_ 2024 Gear "Transmission actual gear";
CM_ SG_ 2024 Odometer "Odometer";

VAL_ 2024 FuelSystemStatus 0 "Motor off" 1 "Open loop due to insufficient engine temperature" 2 "Closed loop, using oxygen sensor feedback to determine fuel mix" 4 "Open loop due to engine load OR fuel cut due to deceleration" 8 "Open loop due to system failure" 16 "Closed loop, using at least one oxygen sensor but there is a fault in the feedback system" ;
VAL_ 2024 ObdStandard 1 "OBD-II as defined by the CARB" 2 "OBD as defined by the EPA" 3 "OBD and OBD-II" 4 "OBD-I" 5 "Not OBD compliant" 6 "EOBD (Europe)" 7 "EOBD and OBD-II" 8 "EOBD and OBD" 9 "EOBD, OBD and OBD II" 10 "JOBD (Japan)" 11 "JOBD and OBD II" 12 "JOBD and EOBD" 13 "JOBD, EOBD, and OBD II" 17 "Engine Manufacturer Diagnostics (EMD)" ;
)DBC";

const char* builtin_dbc() {
    return kService01Dbc;
}

} // namespace obd
