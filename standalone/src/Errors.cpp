#include "Errors.hpp"

namespace CropAdvisor {

const char* errorKindName(ErrorKind kind){
    switch(kind){
        case ErrorKind::Validation: return "ValidationError";
        case ErrorKind::BatchTooLarge: return "BatchTooLargeError";
        case ErrorKind::Inference: return "InferenceError";
        case ErrorKind::ModelUnavailable: return "ModelUnavailableError";
        case ErrorKind::ModelLoad: return "ModelLoadError";
        case ErrorKind::RetrainInProgress: return "RetrainInProgressError";
        case ErrorKind::TrainingFailed: return "TrainingFailedError";
        case ErrorKind::NotAvailable: return "NotAvailableError";
    }
    return "AdvisorError";
}

BatchTooLargeError::BatchTooLargeError(std::size_t size, std::size_t limit)
: AdvisorError(ErrorKind::BatchTooLarge,
               "Maximum " + std::to_string(limit) + " predictions per batch, got " + std::to_string(size)),
  n(size) {}

RetrainInProgressError::RetrainInProgressError(unsigned int activeJob)
: AdvisorError(ErrorKind::RetrainInProgress,
               "retrain job " + std::to_string(activeJob) + " is already in progress"),
  job(activeJob) {}

}  // namespace CropAdvisor
