#include "atsa/core/errors.hpp"

namespace atsa::core {

const char *toString(ErrorCode code) {
	switch (code) {
	case ErrorCode::DataFormat:
		return "data_format";
	case ErrorCode::InsufficientData:
		return "insufficient_data";
	case ErrorCode::UnknownModel:
		return "unknown_model";
	case ErrorCode::InvalidParameter:
		return "invalid_parameter";
	case ErrorCode::Fitting:
		return "fitting";
	case ErrorCode::State:
		return "state";
	}
	return "unknown";
}

void raise(const ErrorInfo &info) {
	switch (info.code) {
	case ErrorCode::DataFormat:
		throw DataFormatError(info.message);
	case ErrorCode::InsufficientData:
		throw InsufficientDataError(info.message);
	case ErrorCode::UnknownModel:
		throw UnknownModelError(info.message);
	case ErrorCode::InvalidParameter:
		throw InvalidParameterError(info.message);
	case ErrorCode::State:
		throw StateError(info.message);
	case ErrorCode::Fitting:
		break;
	}
	throw FittingError(info.message);
}

} // namespace atsa::core
