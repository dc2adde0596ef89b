#include "Classifiers.hpp"
#include "utils.hpp"

#include <algorithm>
#include <array>
#include <cstdint>
#include <memory>

namespace http_retry {

namespace {

constexpr std::array<std::string_view, 14> THROTTLING_ERRORS = {
    "Throttling",
    "ThrottlingException",
    "ThrottledException",
    "RequestThrottledException",
    "TooManyRequestsException",
    "ProvisionedThroughputExceededException",
    "TransactionInProgressException",
    "RequestLimitExceeded",
    "BandwidthLimitExceeded",
    "LimitExceededException",
    "RequestThrottled",
    "SlowDown",
    "PriorRequestNotComplete",
    "EC2ThrottledException",
};

constexpr std::array<std::string_view, 4> TRANSIENT_ERRORS = {
    "RequestTimeout",
    "RequestTimeoutException",
    "InternalError",
    "IDPCommunicationError",
};

template <size_t N>
bool contains(const std::array<std::string_view, N>& codes, std::string_view code) {
    return std::find(codes.begin(), codes.end(), code) != codes.end();
}

} // namespace

// ============ TransientErrorClassifier ============

bool TransientErrorClassifier::isTransient(CURLcode code) {
    switch (code) {
        case CURLE_COULDNT_RESOLVE_PROXY:
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_CONNECT:
        case CURLE_OPERATION_TIMEDOUT:
        case CURLE_SSL_CONNECT_ERROR:
        case CURLE_SEND_ERROR:
        case CURLE_RECV_ERROR:
        case CURLE_GOT_NOTHING:
        case CURLE_PARTIAL_FILE:
        case CURLE_HTTP2:
        case CURLE_HTTP2_STREAM:
            return true;
        default:
            return false;
    }
}

std::optional<ClassificationOutcome> TransientErrorClassifier::classify(const AttemptContext& ctx,
                                                                        const ClassificationOutcome&) const {
    if (ctx.hasTransportError()) {
        if (isTransient(ctx.transportError)) return ClassificationOutcome::transientError();
        return std::nullopt;
    }
    if (ctx.responseUnparseable) return ClassificationOutcome::transientError();
    return std::nullopt;
}

// ============ ModeledAsRetryableClassifier ============

std::optional<ClassificationOutcome> ModeledAsRetryableClassifier::classify(const AttemptContext& ctx,
                                                                            const ClassificationOutcome&) const {
    const ModeledError* error = ctx.parsedError();
    if (!error || !error->retryableCategory) return std::nullopt;
    return ClassificationOutcome::retryIndicated(RetryableError{*error->retryableCategory, std::nullopt});
}

// ============ ServiceErrorCodeClassifier ============

bool ServiceErrorCodeClassifier::isThrottlingCode(std::string_view code) {
    return contains(THROTTLING_ERRORS, code);
}

bool ServiceErrorCodeClassifier::isTransientCode(std::string_view code) {
    return contains(TRANSIENT_ERRORS, code);
}

std::optional<std::chrono::milliseconds> ServiceErrorCodeClassifier::retryAfter(const Headers& headers) {
    // Values that do not fit a millisecond count are ignored
    const uint64_t maxMillis = static_cast<uint64_t>(std::chrono::milliseconds::max().count());

    if (auto value = headers.get("x-amz-retry-after")) {
        auto millis = util::parseUnsigned(*value);
        if (millis && *millis <= maxMillis)
            return std::chrono::milliseconds(static_cast<std::chrono::milliseconds::rep>(*millis));
    }
    if (auto value = headers.get("retry-after")) {
        // HTTP-date form is not supported
        auto seconds = util::parseUnsigned(*value);
        if (seconds && *seconds <= maxMillis / 1000)
            return std::chrono::milliseconds(static_cast<std::chrono::milliseconds::rep>(*seconds * 1000));
    }
    return std::nullopt;
}

std::optional<ClassificationOutcome> ServiceErrorCodeClassifier::classify(const AttemptContext& ctx,
                                                                          const ClassificationOutcome&) const {
    const ModeledError* error = ctx.parsedError();
    if (!error || error->code.empty()) return std::nullopt;

    ErrorCategory category;
    if (isThrottlingCode(error->code)) {
        category = ErrorCategory::Throttling;
    } else if (isTransientCode(error->code)) {
        category = ErrorCategory::Transient;
    } else {
        return std::nullopt;
    }

    std::optional<std::chrono::milliseconds> delay;
    if (const HttpResponse* response = ctx.lastResponse())
        delay = retryAfter(response->headers);

    return ClassificationOutcome::retryIndicated(RetryableError{category, delay});
}

// ============ HttpStatusCodeClassifier ============

const std::set<long>& HttpStatusCodeClassifier::defaultStatusCodes() {
    static const std::set<long> codes = {500, 502, 503, 504};
    return codes;
}

HttpStatusCodeClassifier::HttpStatusCodeClassifier()
    : codes_(defaultStatusCodes()) {}

HttpStatusCodeClassifier::HttpStatusCodeClassifier(std::set<long> retryableStatusCodes)
    : codes_(std::move(retryableStatusCodes)) {}

std::optional<ClassificationOutcome> HttpStatusCodeClassifier::classify(const AttemptContext& ctx,
                                                                        const ClassificationOutcome&) const {
    const HttpResponse* response = ctx.lastResponse();
    if (!response) return std::nullopt;
    if (this->codes_.count(response->status) == 0) return std::nullopt;
    return ClassificationOutcome::serverError();
}

ClassifierSequence defaultClassifiers() {
    return {
        std::make_shared<TransientErrorClassifier>(),
        std::make_shared<ModeledAsRetryableClassifier>(),
        std::make_shared<ServiceErrorCodeClassifier>(),
        std::make_shared<HttpStatusCodeClassifier>(),
    };
}

} // namespace http_retry
