#include "common/errors.hpp"

namespace kgsea {

    const char* error_kind_name(ErrorKind k) {
        switch (k) {
        case ErrorKind::None:                    return "ok";
        case ErrorKind::InputError:              return "InputError";
        case ErrorKind::InsufficientOverlap:     return "InsufficientOverlap";
        case ErrorKind::DegenerateWeight:        return "DegenerateWeight";
        case ErrorKind::DegenerateNull:          return "DegenerateNull";
        case ErrorKind::ConfigError:             return "ConfigError";
        case ErrorKind::PermutationCountInvalid: return "PermutationCountInvalid";
        case ErrorKind::RunCancelled:            return "RunCancelled";
        }
        return "unknown";
    }

    GseaError::GseaError(ErrorKind kind, const std::string& msg)
        : std::runtime_error(std::string(error_kind_name(kind)) + ": " + msg), kind_(kind), detail_(msg) {}

    bool is_gene_set_scoped(ErrorKind k) {
        return k == ErrorKind::InputError
            || k == ErrorKind::InsufficientOverlap
            || k == ErrorKind::DegenerateWeight
            || k == ErrorKind::DegenerateNull;
    }

} // namespace kgsea
