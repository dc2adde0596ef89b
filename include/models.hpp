#pragma once

#include "ClassificationOutcome.hpp"
#include "Headers.hpp"

#include <optional>
#include <string>
#include <utility>
#include <vector>

#ifdef __cplusplus
extern "C" {
#endif
#include <curl/curl.h>
#ifdef __cplusplus
}
#endif

namespace http_retry {

struct HttpResponse {
	long status = 0;

	Headers headers;
	std::string body;

	HttpResponse() = default;
	explicit HttpResponse(long status, Headers headers = Headers(), std::string body = std::string())
		: status(status), headers(std::move(headers)), body(std::move(body)) {}

	// From the raw pieces a libcurl transfer collects
	static HttpResponse fromCurl(long status, const std::vector<std::string>& headerLines, std::string body = std::string()) {
		return HttpResponse(status, Headers::parse(headerLines), std::move(body));
	}
};

/**
 * An error response that was successfully deserialized into the service's
 * modeled error shape.
 */
struct ModeledError {
	std::string code;                               // e.g. "ThrottlingException"
	std::string message;
	std::optional<ErrorCategory> retryableCategory; // set when the service contract marks the error retryable
};

/**
 * Read-only view of one finished attempt, handed to every classifier.
 * Exactly one of the following usually holds:
 *  - transportError != CURLE_OK: no response was received at all
 *  - response is set and error or output was parsed from it
 *  - response is set but could not be deserialized (responseUnparseable)
 */
struct AttemptContext {
	std::optional<HttpResponse> response;           // Raw response, absent if none was received
	std::optional<ModeledError> error;              // Parsed error, if deserialization produced one
	bool outputParsed = false;                      // Parsed a successful output
	bool responseUnparseable = false;               // A response arrived but could not be deserialized
	CURLcode transportError = CURLE_OK;             // CURLE_OK if an HTTP response was received

	static AttemptContext fromTransportError(CURLcode code) {
		AttemptContext ctx;
		ctx.transportError = code;
		return ctx;
	}

	static AttemptContext fromResponse(HttpResponse response) {
		AttemptContext ctx;
		ctx.response = std::move(response);
		return ctx;
	}

	static AttemptContext fromError(HttpResponse response, ModeledError error) {
		AttemptContext ctx;
		ctx.response = std::move(response);
		ctx.error = std::move(error);
		return ctx;
	}

	static AttemptContext fromOutput(HttpResponse response) {
		AttemptContext ctx;
		ctx.response = std::move(response);
		ctx.outputParsed = true;
		return ctx;
	}

	static AttemptContext fromUnparseableResponse(HttpResponse response) {
		AttemptContext ctx;
		ctx.response = std::move(response);
		ctx.responseUnparseable = true;
		return ctx;
	}

	bool hasTransportError() const { return transportError != CURLE_OK; }
	const HttpResponse* lastResponse() const { return response ? &*response : nullptr; }
	const ModeledError* parsedError() const { return error ? &*error : nullptr; }
};

// Human readable libcurl error, for diagnostics
inline std::string describe(CURLcode code) {
	return std::string(curl_easy_strerror(code)) + " (" + std::to_string(static_cast<int>(code)) + ")";
}

} // namespace http_retry
