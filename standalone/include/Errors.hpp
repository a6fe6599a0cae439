#pragma once
#include <cstddef>
#include <stdexcept>
#include <string>

namespace CropAdvisor {

enum class ErrorKind {
    Validation,
    BatchTooLarge,
    Inference,
    ModelUnavailable,
    ModelLoad,
    RetrainInProgress,
    TrainingFailed,
    NotAvailable,
};

const char* errorKindName(ErrorKind kind);

class AdvisorError : public std::runtime_error {
public:
    AdvisorError(ErrorKind kind, const std::string& what) : std::runtime_error(what), k(kind) {}
    ErrorKind kind() const { return k; }
private:
    ErrorKind k;
};

// Caller-fixable: a field is missing, non-numeric or outside its declared range.
class ValidationError : public AdvisorError {
public:
    ValidationError(const std::string& field, const std::string& bound, const std::string& what)
        : AdvisorError(ErrorKind::Validation, what), fieldName(field), boundText(bound) {}
    explicit ValidationError(const std::string& what) : AdvisorError(ErrorKind::Validation, what) {}
    const std::string& field() const { return fieldName; }
    const std::string& bound() const { return boundText; }
private:
    std::string fieldName;
    std::string boundText;
};

class BatchTooLargeError : public AdvisorError {
public:
    BatchTooLargeError(std::size_t size, std::size_t limit);
    std::size_t size() const { return n; }
private:
    std::size_t n;
};

class InferenceError : public AdvisorError {
public:
    explicit InferenceError(const std::string& what) : AdvisorError(ErrorKind::Inference, what) {}
protected:
    InferenceError(ErrorKind kind, const std::string& what) : AdvisorError(kind, what) {}
};

// No snapshot has been published yet.
class ModelUnavailableError : public InferenceError {
public:
    ModelUnavailableError() : InferenceError(ErrorKind::ModelUnavailable, "model not loaded") {}
};

class ModelLoadError : public AdvisorError {
public:
    explicit ModelLoadError(const std::string& what) : AdvisorError(ErrorKind::ModelLoad, what) {}
};

class RetrainInProgressError : public AdvisorError {
public:
    explicit RetrainInProgressError(unsigned int activeJob);
    unsigned int activeJob() const { return job; }
private:
    unsigned int job;
};

class TrainingFailedError : public AdvisorError {
public:
    explicit TrainingFailedError(const std::string& what) : AdvisorError(ErrorKind::TrainingFailed, what) {}
};

class NotAvailableError : public AdvisorError {
public:
    explicit NotAvailableError(const std::string& what) : AdvisorError(ErrorKind::NotAvailable, what) {}
};

}  // namespace CropAdvisor
