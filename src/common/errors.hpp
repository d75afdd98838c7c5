#pragma once
#include <stdexcept>
#include <string>

namespace kgsea {

    enum class ErrorKind {
        None = 0,
        InputError,
        InsufficientOverlap,
        DegenerateWeight,
        DegenerateNull,
        ConfigError,
        PermutationCountInvalid,
        RunCancelled
    };

    const char* error_kind_name(ErrorKind k);

    // Base of every error raised by the engine. what() carries the context
    // (gene set id, hit count, intermediate values) for the log.
    class GseaError : public std::runtime_error {
    public:
        GseaError(ErrorKind kind, const std::string& msg);
        ErrorKind kind() const noexcept { return kind_; }
        // Message without the kind prefix.
        const std::string& detail() const noexcept { return detail_; }

    private:
        ErrorKind kind_;
        std::string detail_;
    };

    // Gene-set scoped errors: isolate the gene set, the batch goes on.
    class InputError : public GseaError {
    public:
        explicit InputError(const std::string& msg) : GseaError(ErrorKind::InputError, msg) {}
    };

    class InsufficientOverlap : public GseaError {
    public:
        explicit InsufficientOverlap(const std::string& msg) : GseaError(ErrorKind::InsufficientOverlap, msg) {}
    };

    class DegenerateWeight : public GseaError {
    public:
        explicit DegenerateWeight(const std::string& msg) : GseaError(ErrorKind::DegenerateWeight, msg) {}
    };

    class DegenerateNull : public GseaError {
    public:
        explicit DegenerateNull(const std::string& msg) : GseaError(ErrorKind::DegenerateNull, msg) {}
    };

    // Run-scoped errors: fatal before any gene set is scored.
    class ConfigError : public GseaError {
    public:
        explicit ConfigError(const std::string& msg) : GseaError(ErrorKind::ConfigError, msg) {}

    protected:
        ConfigError(ErrorKind kind, const std::string& msg) : GseaError(kind, msg) {}
    };

    class PermutationCountInvalid : public ConfigError {
    public:
        explicit PermutationCountInvalid(const std::string& msg)
            : ConfigError(ErrorKind::PermutationCountInvalid, msg) {}
    };

    class RunCancelled : public GseaError {
    public:
        explicit RunCancelled(const std::string& msg) : GseaError(ErrorKind::RunCancelled, msg) {}
    };

    // True for kinds that only exclude one gene set from a batch.
    bool is_gene_set_scoped(ErrorKind k);

} // namespace kgsea
