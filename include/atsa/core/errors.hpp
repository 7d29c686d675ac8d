#pragma once

#include <exception>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

namespace atsa::core {

/**
 * @brief Classification of every failure the library reports to callers.
 */
enum class ErrorCode {
	DataFormat,
	InsufficientData,
	UnknownModel,
	InvalidParameter,
	Fitting,
	State
};

/// Stable identifier for an error code (e.g. "insufficient_data").
const char *toString(ErrorCode code);

/**
 * @class Error
 * @brief Base class of all domain errors raised by the library.
 */
class Error : public std::runtime_error {
public:
	Error(ErrorCode code, const std::string &message) : std::runtime_error(message), code_(code) {
	}

	ErrorCode code() const noexcept {
		return code_;
	}

private:
	ErrorCode code_;
};

/// Input records are missing, malformed or lack the value column.
class DataFormatError : public Error {
public:
	explicit DataFormatError(const std::string &message) : Error(ErrorCode::DataFormat, message) {
	}
};

/// The series is shorter than an operation requires.
class InsufficientDataError : public Error {
public:
	explicit InsufficientDataError(const std::string &message) : Error(ErrorCode::InsufficientData, message) {
	}
};

/// The requested model type is not registered.
class UnknownModelError : public Error {
public:
	explicit UnknownModelError(const std::string &message) : Error(ErrorCode::UnknownModel, message) {
	}
};

/// A model configuration failed validation.
class InvalidParameterError : public Error {
public:
	explicit InvalidParameterError(const std::string &message) : Error(ErrorCode::InvalidParameter, message) {
	}
};

/// Parameter estimation failed or the input is structurally unusable for the model.
class FittingError : public Error {
public:
	explicit FittingError(const std::string &message) : Error(ErrorCode::Fitting, message) {
	}
};

/// A model was queried before it was fitted.
class StateError : public Error {
public:
	explicit StateError(const std::string &message) : Error(ErrorCode::State, message) {
	}
};

struct ErrorInfo {
	ErrorCode code = ErrorCode::Fitting;
	std::string message;
};

/// Throws the Error subclass matching @p info.
[[noreturn]] void raise(const ErrorInfo &info);

/**
 * @class Result
 * @brief Holds either a computed value or the error that prevented it.
 */
template <typename T>
class Result {
public:
	Result(T value) : state_(std::move(value)) {
	}

	Result(ErrorInfo error) : state_(std::move(error)) {
	}

	bool ok() const {
		return std::holds_alternative<T>(state_);
	}

	explicit operator bool() const {
		return ok();
	}

	/// Returns the value, re-raising the stored error when there is none.
	const T &value() const {
		if (!ok()) {
			raise(std::get<ErrorInfo>(state_));
		}
		return std::get<T>(state_);
	}

	T &value() {
		if (!ok()) {
			raise(std::get<ErrorInfo>(state_));
		}
		return std::get<T>(state_);
	}

	const ErrorInfo &error() const {
		if (ok()) {
			throw std::logic_error("Result holds a value, not an error.");
		}
		return std::get<ErrorInfo>(state_);
	}

private:
	std::variant<T, ErrorInfo> state_;
};

/**
 * @brief Runs @p fn and converts a thrown exception into a failed Result.
 *
 * Domain errors keep their code. Any other std::exception is a numeric
 * failure of the underlying procedure and is reported as ErrorCode::Fitting.
 */
template <typename Fn>
auto capture(Fn &&fn) -> Result<std::invoke_result_t<Fn>> {
	using Value = std::invoke_result_t<Fn>;
	try {
		return Result<Value>(std::forward<Fn>(fn)());
	} catch (const Error &e) {
		return Result<Value>(ErrorInfo {e.code(), e.what()});
	} catch (const std::exception &e) {
		return Result<Value>(ErrorInfo {ErrorCode::Fitting, e.what()});
	}
}

} // namespace atsa::core
