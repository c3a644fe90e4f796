#pragma once

namespace logrca {
namespace obs {

inline constexpr const char* kErrEmptyInput = "E_EMPTY_INPUT";
inline constexpr const char* kErrMalformedRecord = "E_MALFORMED_RECORD";
inline constexpr const char* kErrModelTrainingFailed = "E_MODEL_TRAINING_FAILED";

inline constexpr const char* kErrInputReadFailed = "E_INPUT_READ_FAILED";
inline constexpr const char* kErrReportWriteFailed = "E_REPORT_WRITE_FAILED";
inline constexpr const char* kErrConfigInvalid = "E_CONFIG_INVALID";

} // namespace obs
} // namespace logrca
