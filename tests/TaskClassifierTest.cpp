// =================================================================
// tests/TaskClassifierTest.cpp
// =================================================================
// Unit tests for TaskClassifier component.

#include "Switchboard/TaskClassifier.hpp"
#include "Switchboard/Errors.hpp"
#include "Switchboard/Logger.hpp"
#include <iostream>
#include <cassert>
#include <stdexcept>
#include <string>

using namespace Switchboard;

class TaskClassifierTest {
private:
    TaskClassifier classifier;

public:
    TaskClassifierTest() : classifier() {}

    void testExpertProof() {
        std::cout << "Testing expert reasoning classification..." << std::endl;

        auto result = classifier.classify("Prove that the square root of 2 is irrational");
        assert(result.complexity == ComplexityLevel::EXPERT && "Proof request should be EXPERT");
        assert(result.task_type == TaskType::REASONING && "Proof request should be REASONING");
        assert(result.matched_tier == "expert");
        assert(!result.is_default);

        auto symbols = classifier.classify("Evaluate ∫ x^2 dx from 0 to 1");
        assert(symbols.complexity == ComplexityLevel::EXPERT && "Integral sign is an expert marker");

        std::cout << "✓ Expert classification test passed" << std::endl;
    }

    void testComplexityTiers() {
        std::cout << "Testing complexity tiers..." << std::endl;

        auto simple = classifier.classify("What is the capital of France");
        assert(simple.complexity == ComplexityLevel::SIMPLE);
        assert(simple.matched_tier == "none");

        auto moderate = classifier.classify("Write a python function to sort a list");
        assert(moderate.complexity == ComplexityLevel::MODERATE);
        assert(moderate.matched_tier == "moderate");

        // Three distinct complex markers: implement, compare, distributed
        auto complex = classifier.classify("Implement a distributed cache and compare eviction strategies");
        assert(complex.complexity == ComplexityLevel::COMPLEX);

        // A single complex marker only reaches the moderate tier
        auto one_marker = classifier.classify("Please implement this");
        assert(one_marker.complexity == ComplexityLevel::MODERATE);

        std::cout << "✓ Complexity tier test passed" << std::endl;
    }

    void testStructuralSignals() {
        std::cout << "Testing structural signals..." << std::endl;

        auto questions = classifier.classify("Where is it? When did it start?");
        assert(questions.complexity == ComplexityLevel::MODERATE);
        assert(questions.matched_tier == "structure");

        auto fenced = classifier.classify("Look at this\n```\nx = 1\n```");
        assert(fenced.complexity == ComplexityLevel::MODERATE);

        std::string long_prompt(300, 'a');
        auto long_result = classifier.classify(long_prompt);
        assert(long_result.complexity == ComplexityLevel::MODERATE);

        std::cout << "✓ Structural signal test passed" << std::endl;
    }

    void testTaskTypes() {
        std::cout << "Testing task type selection..." << std::endl;

        auto coding = classifier.classify("Write a python function to sort a list");
        assert(coding.task_type == TaskType::CODING && "Two coding hits beat one creative hit");

        auto creative = classifier.classify("Write a short story about a dragon");
        assert(creative.task_type == TaskType::CREATIVE);

        auto general = classifier.classify("Summarize this article for me");
        assert(general.task_type == TaskType::GENERAL);

        auto research = classifier.classify("Find an academic paper on sleep");
        assert(research.task_type == TaskType::RESEARCH);

        // Equal hits: the earlier category wins
        auto tie = classifier.classify("debug the story");
        assert(tie.task_type == TaskType::CODING);

        auto none = classifier.classify("hello there");
        assert(none.task_type == TaskType::GENERAL);
        assert(none.category_hits.size() == 5);

        std::cout << "✓ Task type test passed" << std::endl;
    }

    void testEmptyPrompt() {
        std::cout << "Testing empty prompt handling..." << std::endl;

        auto empty = classifier.classify("");
        assert(empty.is_default);
        assert(empty.complexity == ComplexityLevel::SIMPLE);
        assert(empty.task_type == TaskType::GENERAL);
        assert(empty.matched_tier == "default");

        auto blank = classifier.classify("   \n\t ");
        assert(blank.is_default);

        std::cout << "✓ Empty prompt test passed" << std::endl;
    }

    void testDeterminism() {
        std::cout << "Testing determinism..." << std::endl;

        const std::string prompt = "Design a neural network architecture and evaluate its accuracy";
        auto first = classifier.classify(prompt);
        for (int i = 0; i < 20; ++i) {
            auto again = classifier.classify(prompt);
            assert(again.complexity == first.complexity);
            assert(again.task_type == first.task_type);
            assert(again.matched_tier == first.matched_tier);
            assert(again.category_hits == first.category_hits);
        }

        std::cout << "✓ Determinism test passed" << std::endl;
    }

    void testCustomRules() {
        std::cout << "Testing custom rules..." << std::endl;

        ClassificationRules rules;
        rules.tiers = {{ComplexityLevel::COMPLEX, {"kubernetes"}, 1}};
        rules.categories = {{TaskType::RESEARCH, {"cluster"}}};
        TaskClassifier custom(rules);

        auto result = custom.classify("Tune the Kubernetes cluster");
        assert(result.complexity == ComplexityLevel::COMPLEX);
        assert(result.task_type == TaskType::RESEARCH);

        ClassificationRules broken;
        broken.tiers = {{ComplexityLevel::EXPERT, {"(unclosed"}, 1}};
        bool threw = false;
        try {
            TaskClassifier bad(broken);
        } catch (const ConfigurationError&) {
            threw = true;
        }
        assert(threw && "Invalid regex should raise ConfigurationError");

        std::cout << "✓ Custom rules test passed" << std::endl;
    }

    void testTaskTypeUtilities() {
        std::cout << "Testing task type utilities..." << std::endl;

        for (auto type : getAllTaskTypes()) {
            assert(stringToTaskType(taskTypeToString(type)) == type);
        }
        assert(stringToTaskType("Advanced") == TaskType::RESEARCH);

        bool threw = false;
        try {
            stringToTaskType("astrology");
        } catch (const std::invalid_argument&) {
            threw = true;
        }
        assert(threw);

        std::cout << "✓ Task type utilities test passed" << std::endl;
    }

    void runAllTests() {
        std::cout << "=== TaskClassifier Component Tests ===" << std::endl;

        testExpertProof();
        testComplexityTiers();
        testStructuralSignals();
        testTaskTypes();
        testEmptyPrompt();
        testDeterminism();
        testCustomRules();
        testTaskTypeUtilities();

        std::cout << "All TaskClassifier tests passed!" << std::endl;
    }
};

int main() {
    try {
        Logger::getInstance().setConsoleLogging(false);
        Logger::getInstance().setFileLogging(false);

        TaskClassifierTest tests;
        tests.runAllTests();

        std::cout << "\n🎉 All TaskClassifier component tests passed!" << std::endl;
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
