#include "timecast/pipeline/prediction.hpp"

namespace timecast::pipeline {

std::string stageName(PipelineStage stage) {
	switch (stage) {
	case PipelineStage::Init:
		return "INIT";
	case PipelineStage::Validating:
		return "VALIDATING";
	case PipelineStage::Selecting:
		return "SELECTING";
	case PipelineStage::Retraining:
		return "RETRAINING";
	case PipelineStage::Forecasting:
		return "FORECASTING";
	case PipelineStage::Done:
		return "DONE";
	case PipelineStage::Failed:
		return "FAILED";
	}
	return "UNKNOWN";
}

std::string candidateStatusName(CandidateStatus status) {
	switch (status) {
	case CandidateStatus::Selected:
		return "selected";
	case CandidateStatus::Viable:
		return "viable";
	case CandidateStatus::TrainingFailed:
		return "training_failed";
	case CandidateStatus::PredictionFailed:
		return "prediction_failed";
	case CandidateStatus::ValidationFailed:
		return "validation_failed";
	case CandidateStatus::TimedOut:
		return "timed_out";
	case CandidateStatus::RetrainingFailed:
		return "retraining_failed";
	}
	return "unknown";
}

} // namespace timecast::pipeline
