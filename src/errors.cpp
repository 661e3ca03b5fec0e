#include "errors.h"

#include <sstream>

namespace vrpeasy
{

    const char *to_string(ValidationKind kind)
    {
        switch (kind)
        {
        case ValidationKind::kType:
            return "type";
        case ValidationKind::kRange:
            return "range";
        case ValidationKind::kEnum:
            return "enum";
        case ValidationKind::kTuple:
            return "tuple";
        case ValidationKind::kKeyMismatch:
            return "key mismatch";
        case ValidationKind::kCapacity:
            return "capacity";
        }
        return "unknown";
    }

    static std::string validation_message(const std::string &field,
                                          const std::string &detail,
                                          const std::vector<std::string> &legal)
    {
        std::ostringstream out;
        out << field << " " << detail;
        if (!legal.empty())
        {
            out << " [";
            for (size_t i = 0; i < legal.size(); ++i)
            {
                if (i)
                    out << ", ";
                out << legal[i];
            }
            out << "]";
        }
        return out.str();
    }

    ValidationError::ValidationError(std::string field,
                                     ValidationKind kind,
                                     const std::string &detail,
                                     std::vector<std::string> legal_values)
        : std::runtime_error(validation_message(field, detail, legal_values)),
          field_(std::move(field)),
          kind_(kind),
          legal_values_(std::move(legal_values))
    {
    }

    const char *default_message(ModelErrorCode code)
    {
        switch (code)
        {
        case ModelErrorCode::kAddVehicleType:
            return "a vehicle type with this id already exists";
        case ModelErrorCode::kDeleteVehicleType:
            return "no vehicle type with this id";
        case ModelErrorCode::kAddPoint:
            return "a point with this id already exists";
        case ModelErrorCode::kDeletePoint:
            return "no point with this id";
        case ModelErrorCode::kAddLink:
            return "a link with this name already exists";
        case ModelErrorCode::kDeleteLink:
            return "no link with this name";
        case ModelErrorCode::kMinVehicleTypes:
            return "the model must have at least one vehicle type";
        case ModelErrorCode::kMinPoints:
            return "the model must have at least one point";
        case ModelErrorCode::kMinLinks:
            return "the model must have at least one link";
        case ModelErrorCode::kUnsupportedPlatform:
            return "unsupported platform: only Windows, Linux and macOS are supported";
        case ModelErrorCode::kAlternateBackendLoad:
            return "cannot load the alternate solver library given in cplex_path";
        case ModelErrorCode::kLibraryNotFound:
            return "cannot find the engine library";
        case ModelErrorCode::kEngineInvocation:
            return "the engine failed while solving the model";
        case ModelErrorCode::kExport:
            return "cannot write the exported document";
        }
        return "model error";
    }

    ModelError::ModelError(ModelErrorCode code)
        : std::runtime_error(default_message(code)), code_(code)
    {
    }

    ModelError::ModelError(ModelErrorCode code, const std::string &detail)
        : std::runtime_error(std::string(default_message(code)) + ": " + detail), code_(code)
    {
    }

} // namespace vrpeasy
