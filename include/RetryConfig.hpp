#pragma once

#include "ClassifierChain.hpp"
#include "ClassifierRegistry.hpp"

namespace http_retry {

/**
 * One configuration layer of retry classification (client-wide or per call).
 *
 * Builder-style setters mutate the layer's registry until the layer is
 * frozen by one of the freeze() overloads; later mutation throws
 * ConfigFrozen. The returned ClassifierChain is independent of the layer.
 */
class RetryConfig {
public:
	// Empty layer, typical for per-call overrides
	RetryConfig() = default;

	// Layer pre-populated with the built-in classifiers
	static RetryConfig standard();

	// Add one classifier
	RetryConfig& retryClassifier(SharedClassifier classifier);
	// Replace this layer's classifiers and supersede the layers below it
	RetryConfig& setRetryClassifiers(ClassifierSequence classifiers);

	const ClassifierRegistry& classifiers() const { return registry_; }
	bool frozen() const { return registry_.frozen(); }

	// Freeze this layer alone
	ClassifierChain freeze();
	// Freeze this layer and a per-call override layered on top of it
	ClassifierChain freeze(RetryConfig& operationOverride);

private:
	ClassifierRegistry registry_;
};

} // namespace http_retry
