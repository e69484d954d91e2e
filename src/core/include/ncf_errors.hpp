#ifndef NCF_ERRORS_HPP
#define NCF_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace ncf {

/// Base of every error raised by netcurfew components.
class Error : public std::runtime_error {
public:
    explicit Error(const std::string& what) : std::runtime_error(what) {}
};

/// A privileged OS command failed or permission was denied.
class ConfigurationError : public Error {
public:
    explicit ConfigurationError(const std::string& what) : Error(what) {}
};

/// Hosts-file or certificate file read/write failure.
class IOError : public Error {
public:
    explicit IOError(const std::string& what) : Error(what) {}
};

/// Key generation, signing or PEM parsing failure.
class CertificateError : public Error {
public:
    explicit CertificateError(const std::string& what) : Error(what) {}
};

/// A managed chain's hook reference count is not what its state requires.
class StateInconsistencyError : public Error {
public:
    StateInconsistencyError(const std::string& chain, int hook_references)
        : Error("chain " + chain + " has " + std::to_string(hook_references) +
                " OUTPUT hooks, expected 1")
        , chain_(chain)
        , hook_references_(hook_references) {}

    const std::string& chain() const { return chain_; }
    int hook_references() const { return hook_references_; }

private:
    std::string chain_;
    int hook_references_;
};

} // namespace ncf

#endif // NCF_ERRORS_HPP
