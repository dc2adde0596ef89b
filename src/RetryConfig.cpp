#include "RetryConfig.hpp"
#include "Classifiers.hpp"
#include "Logging.hpp"

namespace http_retry {

namespace {

ClassifierChain finalize(ClassifierSequence sequence) {
	ClassifierChain chain(std::move(sequence));
	if (chain.empty())
		logger()->warn("no retry classifiers are configured, attempts will never be retried");
	return chain;
}

} // namespace

RetryConfig RetryConfig::standard() {
	RetryConfig config;
	for (auto& classifier : defaultClassifiers())
		config.retryClassifier(std::move(classifier));
	return config;
}

RetryConfig& RetryConfig::retryClassifier(SharedClassifier classifier) {
	this->registry_.add(std::move(classifier));
	return *this;
}

RetryConfig& RetryConfig::setRetryClassifiers(ClassifierSequence classifiers) {
	this->registry_.replaceAll(std::move(classifiers));
	return *this;
}

ClassifierChain RetryConfig::freeze() {
	this->registry_.freeze();
	return finalize(this->registry_.effectiveSequence());
}

ClassifierChain RetryConfig::freeze(RetryConfig& operationOverride) {
	this->registry_.freeze();
	operationOverride.registry_.freeze();
	return finalize(ClassifierRegistry::merge(this->registry_, operationOverride.registry_));
}

} // namespace http_retry
