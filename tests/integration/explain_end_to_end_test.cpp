/** \file explain_end_to_end_test.cpp
 *  \brief Explaining a vectorizer + classifier pipeline end to end.
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "lexplain/explain/classifier.hpp"
#include "lexplain/explain/text_explainer.hpp"
#include "lexplain/text/indexed_document.hpp"

#include <cctype>
#include <cmath>
#include <memory>
#include <random>
#include <string>
#include <string_view>
#include <utility>
#include <unordered_map>
#include <vector>

using namespace lexplain;
using namespace lexplain::explain;
using Catch::Matchers::WithinAbs;

namespace {

// Counts occurrences of a fixed vocabulary, lowercased.
class KeywordCounter final : public Vectorizer {
public:
    explicit KeywordCounter(std::vector<std::string> vocab) : vocab_(std::move(vocab)) {}

    auto transform(const std::vector<std::string>& documents) const -> FeatureRows override {
        FeatureRows rows;
        rows.reserve(documents.size());
        for (const auto& doc : documents) {
            std::unordered_map<std::string, double> counts;
            for (const auto& span : text::split_tokens(doc)) {
                std::string tok = doc.substr(span.start, span.length);
                for (char& c : tok) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
                counts[tok] += 1.0;
            }
            std::vector<double> row;
            for (const auto& w : vocab_) row.push_back(counts.count(w) ? counts[w] : 0.0);
            rows.push_back(std::move(row));
        }
        return rows;
    }

private:
    std::vector<std::string> vocab_;
};

// Binary logistic model over the keyword counts.
class Logistic final : public ProbabilisticClassifier {
public:
    Logistic(std::vector<double> coef, double bias) : coef_(std::move(coef)), bias_(bias) {}

    auto predict_proba(const FeatureRows& rows) const -> ProbabilityMatrix override {
        ProbabilityMatrix out;
        out.reserve(rows.size());
        for (const auto& row : rows) {
            double z = bias_;
            for (std::size_t j = 0; j < row.size(); ++j) z += coef_[j] * row[j];
            const double p = 1.0 / (1.0 + std::exp(-z));
            out.push_back({1.0 - p, p});
        }
        return out;
    }

private:
    std::vector<double> coef_;
    double bias_;
};

auto make_pipeline() -> ClassifierPipeline {
    auto vectorizer = std::make_shared<const KeywordCounter>(
        std::vector<std::string>{"good", "great", "bad", "boring"});
    auto model = std::make_shared<const Logistic>(std::vector<double>{2.0, 2.5, -2.0, -3.0}, 0.0);
    return ClassifierPipeline(vectorizer, model);
}

} // namespace

TEST_CASE("Pipeline adapter composes vectorizer and classifier", "[integration][pipeline]") {
    auto pipeline = make_pipeline();
    auto probs = pipeline.predict_proba({"good", "bad", "nothing"});
    REQUIRE(probs.size() == 3);
    REQUIRE(probs[0][1] > 0.85);
    REQUIRE(probs[1][1] < 0.15);
    REQUIRE_THAT(probs[2][1], WithinAbs(0.5, 1e-12));

    auto fn = pipeline.as_predict_fn();
    REQUIRE(fn({"great"}) == pipeline.predict_proba({"great"}));
}

TEST_CASE("Fixed-output classifier on a short review", "[integration][explainer]") {
    const std::string raw = "This is a good movie";
    auto predict = [&raw](const std::vector<std::string>& docs) {
        ProbabilityMatrix out;
        for (const auto& d : docs) {
            if (d == raw) out.push_back({0.1, 0.9});
            else if (d.find("good") != std::string::npos) out.push_back({0.3, 0.7});
            else out.push_back({0.8, 0.2});
        }
        return out;
    };

    auto explainer = TextExplainer::create(ExplainerConfig{}).value();
    ExplainOptions options;
    options.labels = {1};
    options.num_samples = 50;
    std::mt19937_64 rng(5);

    auto exp = explainer.explain_instance(raw, predict, options, rng);
    REQUIRE(exp.has_value());
    REQUIRE(exp->predict_proba == std::vector<double>{0.1, 0.9});
    REQUIRE(exp->local_exp.count(1) == 1);
    REQUIRE(exp->local_exp.at(1).size() <= options.num_features);
    REQUIRE(exp->document->raw_string() == raw);
}

TEST_CASE("Explaining a review through the pipeline", "[integration][explainer]") {
    auto pipeline = make_pipeline();
    const std::string review =
        "A great cast and a good script, but the pacing is boring. "
        "Still, a good film overall; not bad at all.";

    for (auto fs : {FeatureSelection::auto_select, FeatureSelection::forward_selection,
                    FeatureSelection::highest_weights, FeatureSelection::lasso_path}) {
        ExplainerConfig config;
        config.class_names = {"negative", "positive"};
        config.feature_selection = fs;
        auto explainer = TextExplainer::create(config).value();

        ExplainOptions options;
        options.labels = {1};
        options.num_features = 4;
        options.num_samples = 1000;
        std::mt19937_64 rng(99);

        auto exp = explainer.explain_instance(review, pipeline.as_predict_fn(), options, rng);
        REQUIRE(exp.has_value());
        REQUIRE(exp->class_names == config.class_names);

        auto words = exp->as_list(1);
        REQUIRE(words.has_value());
        REQUIRE(words->size() <= 4);
        REQUIRE_FALSE(words->empty());

        // The most influential words are the model's keywords, with matching signs.
        const auto& [top_word, top_weight] = words->front();
        const bool positive = top_word == "good" || top_word == "great";
        const bool negative = top_word == "bad" || top_word == "boring";
        REQUIRE((positive || negative));
        REQUIRE((positive ? top_weight > 0.0 : top_weight < 0.0));

        // Every highlighted span really is the word it claims to be.
        for (const auto& [id, weight] : exp->local_exp.at(1)) {
            const auto word = exp->document->feature_text(id).value();
            for (std::size_t off : exp->document->feature_positions(id).value()) {
                REQUIRE(std::string_view(review).substr(off, word.size()) == word);
            }
        }
    }
}

TEST_CASE("Neighborhood texts are scored in one batch", "[integration][explainer]") {
    std::size_t calls = 0;
    std::size_t rows = 0;
    auto pipeline = make_pipeline();
    PredictFn counting = [&](const std::vector<std::string>& docs) {
        ++calls;
        rows += docs.size();
        return pipeline.predict_proba(docs);
    };

    auto explainer = TextExplainer::create(ExplainerConfig{}).value();
    ExplainOptions options;
    options.labels = {0, 1};
    options.num_samples = 300;
    std::mt19937_64 rng(17);

    auto exp = explainer.explain_instance("good but boring, good but bad", counting, options, rng);
    REQUIRE(exp.has_value());
    REQUIRE(calls == 1);
    REQUIRE(rows == 300);
    REQUIRE(exp->local_exp.size() == 2);
}
