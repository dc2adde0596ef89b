#pragma once

#include "Classifier.hpp"

#include <chrono>
#include <optional>
#include <set>
#include <string>
#include <string_view>

namespace http_retry {

// ============ Built-in Classifiers ============

/**
 * Retry on transport failures that are likely to go away: DNS, connect,
 * TLS handshake, timeout, send/receive errors and truncated or empty
 * replies. Also retries a response that arrived but could not be parsed.
 */
class TransientErrorClassifier : public ClassifyRetry {
public:
    std::optional<ClassificationOutcome> classify(const AttemptContext& ctx,
                                                  const ClassificationOutcome& preceding) const override;
    std::string name() const override { return "Transient Errors"; }
    Priority priority() const override { return Priority::transientErrorClassifier(); }

    static bool isTransient(CURLcode code);
};

/**
 * Retry when the parsed error is declared retryable by the service's
 * interface contract, with the category the contract gives.
 */
class ModeledAsRetryableClassifier : public ClassifyRetry {
public:
    std::optional<ClassificationOutcome> classify(const AttemptContext& ctx,
                                                  const ClassificationOutcome& preceding) const override;
    std::string name() const override { return "Errors Modeled As Retryable"; }
    Priority priority() const override { return Priority::modeledAsRetryableClassifier(); }
};

/**
 * Retry on well known throttling and transient service error codes.
 * An explicit delay is taken from "x-amz-retry-after" (milliseconds) or,
 * failing that, "Retry-After" (seconds).
 */
class ServiceErrorCodeClassifier : public ClassifyRetry {
public:
    std::optional<ClassificationOutcome> classify(const AttemptContext& ctx,
                                                  const ClassificationOutcome& preceding) const override;
    std::string name() const override { return "Service Error Codes"; }
    Priority priority() const override { return Priority::serviceErrorCodeClassifier(); }

    static bool isThrottlingCode(std::string_view code);
    static bool isTransientCode(std::string_view code);
    static std::optional<std::chrono::milliseconds> retryAfter(const Headers& headers);
};

/**
 * Retry on configurable HTTP status codes.
 * Default: 500, 502, 503, 504 (Server Errors)
 */
class HttpStatusCodeClassifier : public ClassifyRetry {
public:
    HttpStatusCodeClassifier();
    explicit HttpStatusCodeClassifier(std::set<long> retryableStatusCodes);

    std::optional<ClassificationOutcome> classify(const AttemptContext& ctx,
                                                  const ClassificationOutcome& preceding) const override;
    std::string name() const override { return "HTTP Status Codes"; }
    Priority priority() const override { return Priority::httpStatusCodeClassifier(); }

    const std::set<long>& retryableStatusCodes() const { return codes_; }

    static const std::set<long>& defaultStatusCodes();

private:
    const std::set<long> codes_;
};

// Built-ins in registration order
ClassifierSequence defaultClassifiers();

} // namespace http_retry
