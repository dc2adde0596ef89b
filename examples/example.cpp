#include "HttpRetry.hpp"

#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace {

struct CurlEasyDeleter {
	void operator()(CURL* handle) const { curl_easy_cleanup(handle); }
};

struct Transfer {
	std::vector<std::string> headerLines;
	std::string body;
};

size_t body_cb(void* ptr, size_t size, size_t nmemb, void* data) {
	Transfer* transfer = static_cast<Transfer*>(data);
	transfer->body.append(static_cast<const char*>(ptr), size * nmemb);
	return size * nmemb;
}

size_t header_cb(void* ptr, size_t size, size_t nmemb, void* data) {
	Transfer* transfer = static_cast<Transfer*>(data);

	const size_t len = size * nmemb;
	if (!ptr || len == 0)
		return len;

	std::string_view sv(static_cast<const char*>(ptr), len);
	if (!sv.empty() && sv.back() == '\n')
		sv.remove_suffix(1);
	if (!sv.empty() && sv.back() == '\r')
		sv.remove_suffix(1);

	transfer->headerLines.emplace_back(sv);
	return len;
}

// One blocking GET, turned into the attempt context classifiers read
http_retry::AttemptContext performAttempt(const std::string& url) {
	std::unique_ptr<CURL, CurlEasyDeleter> curl(curl_easy_init());
	if (!curl) throw std::runtime_error("curl_easy_init failed");

	Transfer transfer;
	curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
	curl_easy_setopt(curl.get(), CURLOPT_NOPROGRESS, 1L);
	curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
	curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, 10000L);
	curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, body_cb);
	curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &transfer);
	curl_easy_setopt(curl.get(), CURLOPT_HEADERFUNCTION, header_cb);
	curl_easy_setopt(curl.get(), CURLOPT_HEADERDATA, &transfer);

	CURLcode rc = curl_easy_perform(curl.get());
	if (rc != CURLE_OK)
		return http_retry::AttemptContext::fromTransportError(rc);

	long status = 0;
	curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &status);
	auto response = http_retry::HttpResponse::fromCurl(status, transfer.headerLines, std::move(transfer.body));
	if (status >= 400)
		return http_retry::AttemptContext::fromError(std::move(response), http_retry::ModeledError{});
	return http_retry::AttemptContext::fromOutput(std::move(response));
}

void printChain(const http_retry::ClassifierChain& chain) {
	std::cout << "Classifiers (evaluation order):" << std::endl;
	for (const auto& classifier : chain.classifiers())
		std::cout << "  " << classifier->name() << " @ " << classifier->priority() << std::endl;
}

void printOutcome(const std::string& label, const http_retry::ClassificationOutcome& outcome) {
	std::cout << label << ": " << outcome << std::endl;
}

} // namespace

int main(int argc, char** argv) {
	if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
		std::cerr << "curl_global_init failed" << std::endl;
		return 1;
	}

	http_retry::setLogLevel(spdlog::level::debug);

	// Client-wide layer: built-ins plus a rule treating 429 as throttling
	http_retry::RetryConfig client = http_retry::RetryConfig::standard();
	client.retryClassifier(http_retry::makeClassifier(
		"Too Many Requests", http_retry::Priority::after(http_retry::Priority::httpStatusCodeClassifier()),
		[](const http_retry::AttemptContext& ctx, const http_retry::ClassificationOutcome&)
			-> std::optional<http_retry::ClassificationOutcome> {
			const auto* response = ctx.lastResponse();
			if (!response || response->status != 429) return std::nullopt;
			return http_retry::ClassificationOutcome::throttlingError();
		}));

	// Per-call layer: never retry on 501
	http_retry::RetryConfig call;
	call.retryClassifier(http_retry::makeClassifier(
		"Not Implemented Is Final", http_retry::Priority::after(http_retry::Priority::transientErrorClassifier()),
		[](const http_retry::AttemptContext& ctx, const http_retry::ClassificationOutcome&)
			-> std::optional<http_retry::ClassificationOutcome> {
			const auto* response = ctx.lastResponse();
			if (!response || response->status != 501) return std::nullopt;
			return http_retry::ClassificationOutcome::retryForbidden();
		}));

	http_retry::ClassifierChain chain = client.freeze(call);
	printChain(chain);

	printOutcome("Connection reset",
				 chain.classify(http_retry::AttemptContext::fromTransportError(CURLE_RECV_ERROR)));
	printOutcome("503", chain.classify(http_retry::AttemptContext::fromResponse(http_retry::HttpResponse(503))));
	printOutcome("501", chain.classify(http_retry::AttemptContext::fromResponse(http_retry::HttpResponse(501))));

	std::vector<std::string> urls;
	for (int i = 1; i < argc; ++i)
		urls.emplace_back(argv[i]);
	if (urls.empty())
		urls = {"https://httpbin.org/status/503", "https://httpbin.org/status/429", "https://httpbin.invalid/"};

	for (const auto& url : urls) {
		http_retry::AttemptContext ctx;
		try {
			ctx = performAttempt(url);
		} catch (const std::exception& e) {
			std::cerr << url << ": " << e.what() << std::endl;
			continue;
		}
		if (ctx.hasTransportError())
			std::cout << url << " -> " << http_retry::describe(ctx.transportError) << std::endl;
		else
			std::cout << url << " -> HTTP " << ctx.response->status << std::endl;
		printOutcome("  outcome", chain.classify(ctx));
	}

	curl_global_cleanup();
	return 0;
}
