#include "RetryConfig.hpp"
#include "Classifiers.hpp"
#include "MockClassifier.hpp"

#include <gtest/gtest.h>

#include <memory>
#include <set>
#include <string>
#include <vector>

using namespace http_retry;
using http_retry::test::fixed;

TEST(RetryConfig, standard_layer) {
	RetryConfig client = RetryConfig::standard();
	EXPECT_EQ(client.classifiers().size(), 4u);

	ClassifierChain chain = client.freeze();
	EXPECT_TRUE(client.frozen());
	EXPECT_EQ(chain.size(), 4u);
	EXPECT_EQ(chain.classify(AttemptContext::fromResponse(HttpResponse(503))), ClassificationOutcome::serverError());
}

TEST(RetryConfig, frozen_layer_rejects_changes) {
	RetryConfig client = RetryConfig::standard();
	client.freeze();

	EXPECT_THROW(client.retryClassifier(fixed("late", Priority(), ClassificationOutcome::retryForbidden())), ConfigFrozen);
	EXPECT_THROW(client.setRetryClassifiers({}), ConfigFrozen);

	// Freezing again is allowed and yields the same sequence
	EXPECT_EQ(client.freeze().size(), 4u);
}

TEST(RetryConfig, operation_additions_extend_client_layer) {
	RetryConfig client = RetryConfig::standard();
	RetryConfig call;
	call.retryClassifier(fixed("treat 404 as transient", Priority::after(Priority::defaultPriority()),
							   ClassificationOutcome::transientError()));

	ClassifierChain chain = client.freeze(call);
	EXPECT_TRUE(call.frozen());
	EXPECT_EQ(chain.size(), 5u);
	EXPECT_EQ(chain.names().back(), "treat 404 as transient");
	EXPECT_EQ(chain.classify(AttemptContext::fromResponse(HttpResponse(404))), ClassificationOutcome::transientError());
}

TEST(RetryConfig, equal_priority_layers_keep_registration_order) {
	Priority p1 = Priority::defaultPriority();

	RetryConfig client;
	client.retryClassifier(fixed("X", p1, ClassificationOutcome::noOpinion()))
		.retryClassifier(fixed("Y", p1, ClassificationOutcome::noOpinion()));
	RetryConfig call;
	call.retryClassifier(fixed("Z", p1, ClassificationOutcome::noOpinion()));

	EXPECT_EQ(client.freeze(call).names(), (std::vector<std::string>{"X", "Y", "Z"}));
}

TEST(RetryConfig, operation_replace_with_empty_disables_retries) {
	RetryConfig client = RetryConfig::standard();
	RetryConfig call;
	call.setRetryClassifiers({});

	ClassifierChain chain = client.freeze(call);
	EXPECT_TRUE(chain.empty());
	EXPECT_EQ(chain.classify(AttemptContext::fromResponse(HttpResponse(503))), ClassificationOutcome::noOpinion());
	EXPECT_EQ(chain.classify(AttemptContext::fromTransportError(CURLE_COULDNT_CONNECT)), ClassificationOutcome::noOpinion());
}

TEST(RetryConfig, operation_replace_supersedes_client_layer) {
	RetryConfig client = RetryConfig::standard();
	RetryConfig call;
	call.setRetryClassifiers({std::make_shared<HttpStatusCodeClassifier>(std::set<long>{429})});

	ClassifierChain chain = client.freeze(call);
	ASSERT_EQ(chain.size(), 1u);
	EXPECT_EQ(chain.classify(AttemptContext::fromResponse(HttpResponse(429))), ClassificationOutcome::serverError());
	EXPECT_EQ(chain.classify(AttemptContext::fromResponse(HttpResponse(503))), ClassificationOutcome::noOpinion());
	EXPECT_EQ(chain.classify(AttemptContext::fromTransportError(CURLE_RECV_ERROR)), ClassificationOutcome::noOpinion());
}

TEST(RetryConfig, chain_outlives_layers) {
	ClassifierChain chain;
	{
		RetryConfig client = RetryConfig::standard();
		chain = client.freeze();
	}
	EXPECT_EQ(chain.classify(AttemptContext::fromTransportError(CURLE_OPERATION_TIMEDOUT)),
			  ClassificationOutcome::transientError());
}
