// errors.h
#pragma once
#include <stdexcept>
#include <string>
#include <vector>

namespace vrpeasy
{

// What kind of constraint a rejected value violated.
enum class ValidationKind
{
    kType,        // wrong JSON/value type (integer, number, string, bool, list)
    kRange,       // numeric bound (>= 0, >= 1, <= 1022, <= 10000)
    kEnum,        // not a member of the legal set
    kTuple,       // not a 2-tuple
    kKeyMismatch, // registry key differs from the value's own key
    kCapacity     // registry is full
};

const char *to_string(ValidationKind kind);

// Raised at the exact mutation that broke a field/key/cardinality constraint.
class ValidationError : public std::runtime_error
{
public:
    ValidationError(std::string field,
                    ValidationKind kind,
                    const std::string &detail,
                    std::vector<std::string> legal_values = {});

    const std::string &field() const { return field_; }
    ValidationKind kind() const { return kind_; }
    const std::vector<std::string> &legal_values() const { return legal_values_; }

private:
    std::string field_;
    ValidationKind kind_;
    std::vector<std::string> legal_values_;
};

enum class ModelErrorCode
{
    kAddVehicleType,
    kDeleteVehicleType,
    kAddPoint,
    kDeletePoint,
    kAddLink,
    kDeleteLink,
    kMinVehicleTypes,
    kMinPoints,
    kMinLinks,
    kUnsupportedPlatform,
    kAlternateBackendLoad,
    kLibraryNotFound,
    kEngineInvocation,
    kExport
};

const char *default_message(ModelErrorCode code);

// Higher-level misuse of the model, and every engine loading/invocation failure.
class ModelError : public std::runtime_error
{
public:
    explicit ModelError(ModelErrorCode code);
    ModelError(ModelErrorCode code, const std::string &detail);

    ModelErrorCode code() const { return code_; }

private:
    ModelErrorCode code_;
};

} // namespace vrpeasy
