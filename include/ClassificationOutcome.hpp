#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <variant>

namespace http_retry {

#define HTTP_RETRY_ERROR_CATEGORIES \
	ERROR_CATEGORY(Transient)       \
	ERROR_CATEGORY(Throttling)      \
	ERROR_CATEGORY(Server)          \
	ERROR_CATEGORY(Client)

enum class ErrorCategory : uint8_t {
#define ERROR_CATEGORY(name) name,
	HTTP_RETRY_ERROR_CATEGORIES
#undef ERROR_CATEGORY
};

const char* toString(ErrorCategory category);
std::ostream& operator<<(std::ostream& os, ErrorCategory category);

/**
 * A retry is warranted because the attempt failed with an error of the given
 * category. `retryAfter` is set when the failed party stated how long to wait.
 */
struct RetryableError {
	ErrorCategory category = ErrorCategory::Transient;
	std::optional<std::chrono::milliseconds> retryAfter;

	bool operator==(const RetryableError& other) const {
		return category == other.category && retryAfter == other.retryAfter;
	}
	bool operator!=(const RetryableError& other) const { return !(*this == other); }
};

// Why a retry is warranted. New alternatives may be added.
using RetryReason = std::variant<RetryableError>;

std::string toString(const RetryReason& reason);

/**
 * Verdict of one classifier, or the aggregate verdict of a chain.
 * Default constructed value is NoOpinion.
 */
class ClassificationOutcome {
public:
	enum Kind : uint8_t { NoOpinion, RetryIndicated, RetryForbidden };

	ClassificationOutcome() = default;

	static ClassificationOutcome noOpinion() { return ClassificationOutcome(); }
	static ClassificationOutcome retryIndicated(RetryReason reason);
	static ClassificationOutcome retryForbidden();

	// Shorthands over retryIndicated()
	static ClassificationOutcome transientError();
	static ClassificationOutcome throttlingError();
	static ClassificationOutcome serverError();
	static ClassificationOutcome clientError();
	static ClassificationOutcome explicitDelay(ErrorCategory category, std::chrono::milliseconds delay);

	Kind kind() const { return kind_; }
	bool isNoOpinion() const { return kind_ == NoOpinion; }
	bool isRetryIndicated() const { return kind_ == RetryIndicated; }
	bool isRetryForbidden() const { return kind_ == RetryForbidden; }

	// Only set for RetryIndicated
	const std::optional<RetryReason>& reason() const { return reason_; }

	// Convenience accessors for the RetryableError reason, nullopt otherwise
	std::optional<ErrorCategory> errorCategory() const;
	std::optional<std::chrono::milliseconds> retryAfter() const;

	bool operator==(const ClassificationOutcome& other) const {
		return kind_ == other.kind_ && reason_ == other.reason_;
	}
	bool operator!=(const ClassificationOutcome& other) const { return !(*this == other); }

	std::string toString() const;

private:
	ClassificationOutcome(Kind kind, std::optional<RetryReason> reason)
		: kind_(kind), reason_(std::move(reason)) {}

	Kind kind_ = NoOpinion;
	std::optional<RetryReason> reason_;
};

std::ostream& operator<<(std::ostream& os, const ClassificationOutcome& outcome);

} // namespace http_retry
