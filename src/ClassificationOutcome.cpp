#include "ClassificationOutcome.hpp"

namespace http_retry {

const char* toString(ErrorCategory category) {
	switch (category) {
#define ERROR_CATEGORY(name) \
	case ErrorCategory::name: \
		return #name;
		HTTP_RETRY_ERROR_CATEGORIES
#undef ERROR_CATEGORY
	}
	return "Unknown";
}

std::ostream& operator<<(std::ostream& os, ErrorCategory category) {
	return os << toString(category);
}

std::string toString(const RetryReason& reason) {
	return std::visit(
		[](const RetryableError& error) -> std::string {
			std::string s = "RetryableError(";
			s += toString(error.category);
			if (error.retryAfter)
				s += ", retryAfter=" + std::to_string(error.retryAfter->count()) + "ms";
			s += ")";
			return s;
		},
		reason);
}

ClassificationOutcome ClassificationOutcome::retryIndicated(RetryReason reason) {
	return ClassificationOutcome(RetryIndicated, std::move(reason));
}

ClassificationOutcome ClassificationOutcome::retryForbidden() {
	return ClassificationOutcome(RetryForbidden, std::nullopt);
}

ClassificationOutcome ClassificationOutcome::transientError() {
	return retryIndicated(RetryableError{ErrorCategory::Transient, std::nullopt});
}

ClassificationOutcome ClassificationOutcome::throttlingError() {
	return retryIndicated(RetryableError{ErrorCategory::Throttling, std::nullopt});
}

ClassificationOutcome ClassificationOutcome::serverError() {
	return retryIndicated(RetryableError{ErrorCategory::Server, std::nullopt});
}

ClassificationOutcome ClassificationOutcome::clientError() {
	return retryIndicated(RetryableError{ErrorCategory::Client, std::nullopt});
}

ClassificationOutcome ClassificationOutcome::explicitDelay(ErrorCategory category, std::chrono::milliseconds delay) {
	return retryIndicated(RetryableError{category, delay});
}

std::optional<ErrorCategory> ClassificationOutcome::errorCategory() const {
	if (!this->reason_) return std::nullopt;
	if (auto* error = std::get_if<RetryableError>(&*this->reason_))
		return error->category;
	return std::nullopt;
}

std::optional<std::chrono::milliseconds> ClassificationOutcome::retryAfter() const {
	if (!this->reason_) return std::nullopt;
	if (auto* error = std::get_if<RetryableError>(&*this->reason_))
		return error->retryAfter;
	return std::nullopt;
}

std::string ClassificationOutcome::toString() const {
	switch (this->kind_) {
		case NoOpinion:
			return "NoOpinion";
		case RetryForbidden:
			return "RetryForbidden";
		case RetryIndicated:
			return "RetryIndicated(" + (this->reason_ ? http_retry::toString(*this->reason_) : std::string()) + ")";
	}
	return "Unknown";
}

std::ostream& operator<<(std::ostream& os, const ClassificationOutcome& outcome) {
	return os << outcome.toString();
}

} // namespace http_retry
