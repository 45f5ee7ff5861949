#include "tabstat/core/errors.hpp"

namespace tabstat {

std::string_view toString(ErrorKind kind) {
	switch (kind) {
	case ErrorKind::MissingColumn:
		return "MissingColumn";
	case ErrorKind::InsufficientData:
		return "InsufficientData";
	case ErrorKind::UnderdeterminedSystem:
		return "UnderdeterminedSystem";
	case ErrorKind::InvalidParameter:
		return "InvalidParameter";
	case ErrorKind::ModelFitFailed:
		return "ModelFitFailed";
	}
	return "Unknown";
}

AnalysisError::AnalysisError(ErrorKind kind, const std::string &diagnostic)
    : std::runtime_error(std::string(toString(kind)) + ": " + diagnostic), kind_(kind), diagnostic_(diagnostic) {
}

MissingColumnError::MissingColumnError(const std::string &column)
    : AnalysisError(ErrorKind::MissingColumn, "column '" + column + "' not found in table"), column_(column) {
}

} // namespace tabstat
