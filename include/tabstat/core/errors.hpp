#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace tabstat {

/**
 * @brief Machine-readable category of an analysis failure.
 */
enum class ErrorKind {
	MissingColumn,
	InsufficientData,
	UnderdeterminedSystem,
	InvalidParameter,
	ModelFitFailed
};

/**
 * @brief Stable identifier for an error kind, e.g. "MissingColumn".
 */
std::string_view toString(ErrorKind kind);

/**
 * @class AnalysisError
 * @brief Exception raised by every engine entry point.
 *
 * Carries the error kind plus a short diagnostic. what() renders both as
 * "<Kind>: <diagnostic>".
 */
class AnalysisError : public std::runtime_error {
public:
	AnalysisError(ErrorKind kind, const std::string &diagnostic);

	ErrorKind kind() const noexcept {
		return kind_;
	}

	const std::string &diagnostic() const noexcept {
		return diagnostic_;
	}

private:
	ErrorKind kind_;
	std::string diagnostic_;
};

class MissingColumnError : public AnalysisError {
public:
	explicit MissingColumnError(const std::string &column);

	const std::string &column() const noexcept {
		return column_;
	}

private:
	std::string column_;
};

class InsufficientDataError : public AnalysisError {
public:
	explicit InsufficientDataError(const std::string &diagnostic)
	    : AnalysisError(ErrorKind::InsufficientData, diagnostic) {
	}
};

class UnderdeterminedSystemError : public AnalysisError {
public:
	explicit UnderdeterminedSystemError(const std::string &diagnostic)
	    : AnalysisError(ErrorKind::UnderdeterminedSystem, diagnostic) {
	}
};

class InvalidParameterError : public AnalysisError {
public:
	explicit InvalidParameterError(const std::string &diagnostic)
	    : AnalysisError(ErrorKind::InvalidParameter, diagnostic) {
	}
};

class ModelFitFailedError : public AnalysisError {
public:
	explicit ModelFitFailedError(const std::string &diagnostic)
	    : AnalysisError(ErrorKind::ModelFitFailed, diagnostic) {
	}
};

} // namespace tabstat
