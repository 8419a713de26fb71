#pragma once

namespace obd {

// Adapter appends this after every complete response
constexpr char kPromptDelimiter = '>';

// Service 01 (current data) reply
constexpr const char* kResponseModeMarker = "41";

// Service 01 request prefix
constexpr const char* kRequestModePrefix = "01";

} // namespace obd
