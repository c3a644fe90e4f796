#pragma once

#include <stdexcept>
#include <string>

#include "obs/error_codes.h"

namespace logrca {

// Base for failures a caller is expected to handle per stage.
class RcaError : public std::runtime_error {
public:
    RcaError(const char* code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    [[nodiscard]] auto code() const -> const char* { return code_; }

private:
    const char* code_;
};

// No log events at all were handed to the analysis.
class EmptyInputError : public RcaError {
public:
    explicit EmptyInputError(const std::string& message)
        : RcaError(obs::kErrEmptyInput, message) {}
};

// A record lacks an identity field (trace_id, service).
class MalformedRecordError : public RcaError {
public:
    explicit MalformedRecordError(const std::string& message)
        : RcaError(obs::kErrMalformedRecord, message) {}
};

class ModelTrainingError : public RcaError {
public:
    explicit ModelTrainingError(const std::string& message)
        : RcaError(obs::kErrModelTrainingFailed, message) {}
};

} // namespace logrca
