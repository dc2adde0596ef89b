#include "ClassifierChain.hpp"
#include "ClassifierRegistry.hpp"
#include "Classifiers.hpp"
#include "MockClassifier.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <future>
#include <vector>

using namespace http_retry;
using http_retry::test::fixed;
using http_retry::test::makeMock;
using ::testing::_;
using ::testing::Return;

namespace {

ClassifierChain chainOf(ClassifierSequence classifiers) {
	ClassifierRegistry registry;
	registry.replaceAll(std::move(classifiers));
	return ClassifierChain(registry.effectiveSequence());
}

ClassifierChain standardChain() {
	return chainOf(defaultClassifiers());
}

} // namespace

TEST(ClassifierChain, empty_chain_has_no_opinion) {
	ClassifierChain chain;
	EXPECT_TRUE(chain.empty());
	EXPECT_EQ(chain.classify(AttemptContext::fromResponse(HttpResponse(503))), ClassificationOutcome::noOpinion());
	EXPECT_EQ(runClassifiers({}, AttemptContext::fromTransportError(CURLE_RECV_ERROR)), ClassificationOutcome::noOpinion());
}

TEST(ClassifierChain, abstention_identity) {
	Priority p = Priority::defaultPriority();
	AttemptContext ctx = AttemptContext::fromResponse(HttpResponse(500));

	ClassifierSequence classifiers;
	for (int i = 0; i != 8; ++i) {
		classifiers.push_back(fixed("abstain", Priority::before(p), ClassificationOutcome::noOpinion()));
		classifiers.push_back(makeClassifier("absent", p, [](const AttemptContext&, const ClassificationOutcome&) {
			return std::optional<ClassificationOutcome>();
		}));
		p = Priority::after(p);
		EXPECT_EQ(chainOf(classifiers).classify(ctx), ClassificationOutcome::noOpinion());
	}
}

TEST(ClassifierChain, higher_priority_overrides) {
	Priority p = Priority::defaultPriority();
	AttemptContext ctx = AttemptContext::fromResponse(HttpResponse(500));

	auto low = fixed("low", Priority::before(p), ClassificationOutcome::serverError());
	auto high = fixed("high", p, ClassificationOutcome::throttlingError());

	EXPECT_EQ(chainOf({low, high}).classify(ctx), ClassificationOutcome::throttlingError());
	// Registration order does not matter, priority does
	EXPECT_EQ(chainOf({high, low}).classify(ctx), ClassificationOutcome::throttlingError());
}

TEST(ClassifierChain, abstaining_higher_priority_keeps_result) {
	Priority p = Priority::defaultPriority();
	AttemptContext ctx = AttemptContext::fromResponse(HttpResponse(500));

	auto chain = chainOf({
		fixed("low", Priority::before(p), ClassificationOutcome::clientError()),
		fixed("high", p, ClassificationOutcome::noOpinion()),
	});
	EXPECT_EQ(chain.classify(ctx), ClassificationOutcome::clientError());
}

TEST(ClassifierChain, preceding_outcome_is_passed_along) {
	Priority p = Priority::defaultPriority();
	AttemptContext ctx = AttemptContext::fromResponse(HttpResponse(502));

	auto first = makeMock("first", Priority::before(p));
	auto second = makeMock("second", p);
	auto third = makeMock("third", Priority::after(p));

	::testing::InSequence sequence;
	EXPECT_CALL(*first, classify(_, ClassificationOutcome::noOpinion()))
		.WillOnce(Return(ClassificationOutcome::serverError()));
	EXPECT_CALL(*second, classify(_, ClassificationOutcome::serverError()))
		.WillOnce(Return(std::nullopt));
	EXPECT_CALL(*third, classify(_, ClassificationOutcome::serverError()))
		.WillOnce(Return(ClassificationOutcome::transientError()));

	EXPECT_EQ(chainOf({third, first, second}).classify(ctx), ClassificationOutcome::transientError());
}

TEST(ClassifierChain, veto_stops_evaluation) {
	Priority p = Priority::defaultPriority();
	AttemptContext ctx = AttemptContext::fromResponse(HttpResponse(503));

	auto lower = makeMock("lower", Priority::before(p));
	auto veto = makeMock("veto", p);
	auto higher = makeMock("higher", Priority::after(p));

	EXPECT_CALL(*lower, classify(_, _)).WillOnce(Return(ClassificationOutcome::serverError()));
	EXPECT_CALL(*veto, classify(_, ClassificationOutcome::serverError()))
		.WillOnce(Return(ClassificationOutcome::retryForbidden()));
	EXPECT_CALL(*higher, classify(_, _)).Times(0);

	EXPECT_EQ(chainOf({lower, veto, higher}).classify(ctx), ClassificationOutcome::retryForbidden());
}

TEST(ClassifierChain, veto_at_lowest_priority) {
	AttemptContext ctx = AttemptContext::fromError(
		HttpResponse(503), ModeledError{"ServiceBusy", "busy", ErrorCategory::Server});

	auto veto = fixed("veto", Priority::before(Priority::httpStatusCodeClassifier()),
					  ClassificationOutcome::retryForbidden());
	auto status = makeMock("status", Priority::httpStatusCodeClassifier());
	auto modeled = makeMock("modeled", Priority::modeledAsRetryableClassifier());
	EXPECT_CALL(*status, classify(_, _)).Times(0);
	EXPECT_CALL(*modeled, classify(_, _)).Times(0);

	EXPECT_EQ(chainOf({status, modeled, veto}).classify(ctx), ClassificationOutcome::retryForbidden());
}

TEST(ClassifierChain, deterministic) {
	ClassifierChain chain = standardChain();
	std::vector<AttemptContext> contexts = {
		AttemptContext::fromResponse(HttpResponse(503)),
		AttemptContext::fromTransportError(CURLE_OPERATION_TIMEDOUT),
		AttemptContext::fromError(HttpResponse::fromCurl(400, {"Retry-After: 3"}), ModeledError{"SlowDown", "", std::nullopt}),
		AttemptContext::fromOutput(HttpResponse(200)),
	};
	for (const auto& ctx : contexts) {
		ClassificationOutcome first = chain.classify(ctx);
		for (int i = 0; i != 10; ++i)
			EXPECT_EQ(chain.classify(ctx), first);
	}
}

TEST(ClassifierChain, shared_between_threads) {
	ClassifierChain chain = standardChain();
	AttemptContext ctx = AttemptContext::fromResponse(HttpResponse(504));

	std::vector<std::future<ClassificationOutcome>> results;
	for (int i = 0; i != 8; ++i)
		results.push_back(std::async(std::launch::async, [chain, &ctx] { return chain.classify(ctx); }));
	for (auto& result : results)
		EXPECT_EQ(result.get(), ClassificationOutcome::serverError());
}

TEST(ClassifierChain, scenario_server_error_status) {
	AttemptContext ctx = AttemptContext::fromResponse(HttpResponse(503));
	EXPECT_EQ(standardChain().classify(ctx), ClassificationOutcome::serverError());
}

TEST(ClassifierChain, scenario_connection_reset) {
	AttemptContext ctx = AttemptContext::fromTransportError(CURLE_RECV_ERROR);
	EXPECT_EQ(standardChain().classify(ctx), ClassificationOutcome::transientError());
}

TEST(ClassifierChain, scenario_no_retry_on_success) {
	EXPECT_EQ(standardChain().classify(AttemptContext::fromOutput(HttpResponse(200))), ClassificationOutcome::noOpinion());
	EXPECT_EQ(standardChain().classify(AttemptContext::fromError(HttpResponse(404), ModeledError{"NotFound", "", std::nullopt})),
			  ClassificationOutcome::noOpinion());
}

TEST(ClassifierChain, scenario_modeled_overrides_status) {
	// 500 says Server, the modeled contract says Throttling and runs later
	AttemptContext ctx = AttemptContext::fromError(
		HttpResponse(500), ModeledError{"Busy", "", ErrorCategory::Throttling});
	EXPECT_EQ(standardChain().classify(ctx), ClassificationOutcome::throttlingError());
}

TEST(ClassifierChain, scenario_error_code_with_delay) {
	AttemptContext ctx = AttemptContext::fromError(
		HttpResponse::fromCurl(503, {"HTTP/1.1 503 Slow Down", "x-amz-retry-after: 750"}),
		ModeledError{"SlowDown", "Please reduce your request rate.", std::nullopt});
	EXPECT_EQ(standardChain().classify(ctx),
			  ClassificationOutcome::explicitDelay(ErrorCategory::Throttling, std::chrono::milliseconds(750)));
}

TEST(ClassifierChain, scenario_veto_over_modeled_retryable) {
	AttemptContext ctx = AttemptContext::fromError(
		HttpResponse(503), ModeledError{"ServiceBusy", "busy", ErrorCategory::Transient});

	ClassifierSequence classifiers = defaultClassifiers();
	classifiers.push_back(makeClassifier(
		"never retry ServiceBusy", Priority::after(Priority::transientErrorClassifier()),
		[](const AttemptContext& attempt, const ClassificationOutcome&) -> std::optional<ClassificationOutcome> {
			const ModeledError* error = attempt.parsedError();
			if (error && error->code == "ServiceBusy") return ClassificationOutcome::retryForbidden();
			return std::nullopt;
		}));

	EXPECT_EQ(chainOf(classifiers).classify(ctx), ClassificationOutcome::retryForbidden());
}

TEST(ClassifierChain, names_in_evaluation_order) {
	EXPECT_EQ(standardChain().names(),
			  (std::vector<std::string>{"HTTP Status Codes", "Service Error Codes", "Errors Modeled As Retryable",
										"Transient Errors"}));
}
