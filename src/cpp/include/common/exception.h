#ifndef KGSCORE_EXCEPTION_H
#define KGSCORE_EXCEPTION_H

#include <exception>
#include <stdexcept>
#include <string>

struct KGScoreRuntimeException : public std::runtime_error {
   public:
    KGScoreRuntimeException(const std::string &message) : runtime_error(message) {}
};

struct UndefinedTensorException : public KGScoreRuntimeException {
   public:
    UndefinedTensorException() : KGScoreRuntimeException("Tensor undefined") {}
};

struct NANTensorException : public KGScoreRuntimeException {
   public:
    NANTensorException() : KGScoreRuntimeException("Tensor contains NANs") {}
};

/** Raised when embedding ranks or widths violate the shape contract of a score function. */
struct TensorSizeMismatchException : public KGScoreRuntimeException {
   public:
    TensorSizeMismatchException(const std::string &message) : KGScoreRuntimeException("Tensor size mismatch. " + message) {}
};

/** Raised when a hyperparameter falls outside of its enumerated set of values. */
struct UnsupportedConfigurationException : public KGScoreRuntimeException {
   public:
    UnsupportedConfigurationException(const std::string &message) : KGScoreRuntimeException("Unsupported configuration. " + message) {}
};

struct UnexpectedNullPtrException : public KGScoreRuntimeException {
   public:
    UnexpectedNullPtrException(std::string message = "") : KGScoreRuntimeException(message) {}
};

#endif  // KGSCORE_EXCEPTION_H
