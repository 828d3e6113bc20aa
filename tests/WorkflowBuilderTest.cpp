// =================================================================
// tests/WorkflowBuilderTest.cpp
// =================================================================
// Unit tests for TemplateCatalog and WorkflowBuilder components.

#include "Switchboard/WorkflowBuilder.hpp"
#include "Switchboard/Errors.hpp"
#include "Switchboard/Logger.hpp"
#include <iostream>
#include <cassert>
#include <cctype>
#include <map>

using namespace Switchboard;

namespace {

size_t indexOf(const std::vector<Task>& tasks, const std::string& id) {
    for (size_t i = 0; i < tasks.size(); ++i) {
        if (tasks[i].id == id) {
            return i;
        }
    }
    return tasks.size();
}

// Dependencies as positions, for comparing builds whose ids differ
std::vector<std::vector<size_t>> dependencyShape(const std::vector<Task>& tasks) {
    std::vector<std::vector<size_t>> shape;
    for (const auto& task : tasks) {
        std::vector<size_t> deps;
        for (const auto& dep : task.dependencies) {
            deps.push_back(indexOf(tasks, dep));
        }
        shape.push_back(deps);
    }
    return shape;
}

template<typename F>
bool throwsInvalidTemplate(F&& f) {
    try {
        f();
    } catch (const InvalidTemplateError&) {
        return true;
    }
    return false;
}

WorkflowTemplate simpleTemplate(const std::string& name) {
    WorkflowTemplate workflow;
    workflow.name = name;
    workflow.task_types = {TaskType::RESEARCH, TaskType::CODING, TaskType::GENERAL};
    return workflow;
}

} // namespace

class WorkflowBuilderTest {
private:
    TemplateCatalog catalog;
    WorkflowBuilder builder;

public:
    WorkflowBuilderTest() : catalog(TemplateCatalog::withBuiltins()), builder(catalog) {}

    void testLinearChain() {
        std::cout << "Testing linear chain template..." << std::endl;

        auto tasks = builder.build("code_development", "Build a rate limiter");
        assert(tasks.size() == 4);

        const TaskType expected[] = {TaskType::RESEARCH, TaskType::CODING, TaskType::REASONING, TaskType::GENERAL};
        for (size_t i = 0; i < tasks.size(); ++i) {
            assert(tasks[i].type == expected[i]);
            assert(!tasks[i].parallel_group && "Chain has no parallel groups");
            assert(tasks[i].state == TaskState::PENDING);
        }

        assert(tasks[0].dependencies.empty());
        for (size_t i = 1; i < tasks.size(); ++i) {
            assert(tasks[i].dependencies.size() == 1);
            assert(tasks[i].dependencies[0] == tasks[i - 1].id && "Each step follows the previous one");
        }

        std::cout << "✓ Linear chain test passed" << std::endl;
    }

    void testTaskIdsAndPrompts() {
        std::cout << "Testing task ids, prompts and context..." << std::endl;

        std::map<std::string, std::string> context{{"audience", "operators"}};
        auto tasks = builder.build("research_analysis", "quantum networking", context);
        assert(tasks.size() == 3);

        const std::string& id = tasks[1].id;
        assert(id.size() == 8 + std::string("-reasoning-1").size());
        for (size_t i = 0; i < 8; ++i) {
            assert(std::isxdigit(static_cast<unsigned char>(id[i])) && !std::isupper(static_cast<unsigned char>(id[i])));
        }
        assert(id.substr(8) == "-reasoning-1");
        assert(tasks[0].id.substr(0, 8) == id.substr(0, 8) && "Tasks share the workflow id");

        assert(tasks[0].prompt == "Research and gather information about: quantum networking");
        assert(tasks[2].prompt.find("comprehensive summary") != std::string::npos);
        for (const auto& task : tasks) {
            assert(task.context.at("audience") == "operators");
        }

        // research_analysis: general waits for both research and reasoning
        assert(tasks[2].dependencies.size() == 2);

        std::cout << "✓ Task id and prompt test passed" << std::endl;
    }

    void testParallelGroups() {
        std::cout << "Testing parallel groups..." << std::endl;

        auto docs = builder.build("technical_docs", "Document the scheduler");
        assert(docs.size() == 4);
        assert(!docs[0].parallel_group);
        assert(docs[1].parallel_group && docs[2].parallel_group);
        assert(*docs[1].parallel_group == *docs[2].parallel_group);
        assert(docs[1].parallel_group->find("-pg0") != std::string::npos);
        assert(!docs[3].parallel_group);
        assert(docs[3].dependencies.size() == 2);

        auto multi = builder.build("multi_domain", "Compare approaches");
        assert(multi.size() == 5);
        for (size_t i = 0; i < 4; ++i) {
            assert(multi[i].parallel_group && *multi[i].parallel_group == *multi[0].parallel_group);
            assert(multi[i].dependencies.empty());
        }
        assert(multi[4].dependencies.size() == 4);

        // Single-member sections do not form groups
        auto security = builder.build("network_security", "Audit the firewall");
        for (const auto& task : security) {
            assert(!task.parallel_group);
        }

        std::cout << "✓ Parallel group test passed" << std::endl;
    }

    void testDagByConstruction() {
        std::cout << "Testing every built-in template yields a DAG..." << std::endl;

        assert(catalog.size() == 8);
        for (const auto& workflow : catalog.listTemplates()) {
            auto tasks = builder.build(workflow.name, "anything");
            assert(tasks.size() == workflow.task_types.size());
            for (size_t i = 0; i < tasks.size(); ++i) {
                for (const auto& dep : tasks[i].dependencies) {
                    assert(indexOf(tasks, dep) < i && "Dependencies only point backwards");
                }
            }
        }

        std::cout << "✓ DAG test passed" << std::endl;
    }

    void testStructuralRoundTrip() {
        std::cout << "Testing repeated builds share structure..." << std::endl;

        for (const auto& workflow : catalog.listTemplates()) {
            auto first = builder.build(workflow.name, "same prompt");
            auto second = builder.build(workflow.name, "same prompt");
            assert(first.size() == second.size());
            for (size_t i = 0; i < first.size(); ++i) {
                assert(first[i].type == second[i].type);
                assert(first[i].prompt == second[i].prompt);
                assert(first[i].parallel_group.has_value() == second[i].parallel_group.has_value());
            }
            assert(dependencyShape(first) == dependencyShape(second));
        }

        std::cout << "✓ Structural round trip test passed" << std::endl;
    }

    void testUnknownTemplate() {
        std::cout << "Testing unknown template..." << std::endl;

        bool threw = false;
        try {
            builder.build("does_not_exist", "prompt");
        } catch (const UnknownTemplateError& e) {
            threw = true;
            assert(e.templateName() == "does_not_exist");
        }
        assert(threw);
        assert(!catalog.hasTemplate("does_not_exist"));

        std::cout << "✓ Unknown template test passed" << std::endl;
    }

    void testInvalidTemplates() {
        std::cout << "Testing invalid template rejection..." << std::endl;

        TemplateCatalog custom;

        auto undeclared_key = simpleTemplate("bad_key");
        undeclared_key.dependencies[TaskType::CREATIVE] = {TaskType::RESEARCH};
        assert(throwsInvalidTemplate([&] { custom.registerTemplate(undeclared_key); }));

        auto undeclared_prereq = simpleTemplate("bad_prereq");
        undeclared_prereq.dependencies[TaskType::CODING] = {TaskType::MULTIMODAL};
        assert(throwsInvalidTemplate([&] { custom.registerTemplate(undeclared_prereq); }));

        auto backwards = simpleTemplate("backwards");
        backwards.dependencies[TaskType::RESEARCH] = {TaskType::GENERAL};
        assert(throwsInvalidTemplate([&] { custom.registerTemplate(backwards); }));

        auto bad_section = simpleTemplate("bad_section");
        bad_section.parallel_sections = {{TaskType::RESEARCH, TaskType::CREATIVE}};
        assert(throwsInvalidTemplate([&] { custom.registerTemplate(bad_section); }));

        auto twice = simpleTemplate("twice");
        twice.parallel_sections = {{TaskType::RESEARCH, TaskType::CODING}, {TaskType::CODING, TaskType::GENERAL}};
        assert(throwsInvalidTemplate([&] { custom.registerTemplate(twice); }));

        auto dependent_section = simpleTemplate("dependent_section");
        dependent_section.dependencies[TaskType::CODING] = {TaskType::RESEARCH};
        dependent_section.dependencies[TaskType::GENERAL] = {TaskType::CODING};
        dependent_section.parallel_sections = {{TaskType::RESEARCH, TaskType::GENERAL}};
        assert(throwsInvalidTemplate([&] { custom.registerTemplate(dependent_section); }) &&
               "Transitive dependency inside a section would deadlock");

        WorkflowTemplate unnamed = simpleTemplate("");
        assert(throwsInvalidTemplate([&] { custom.registerTemplate(unnamed); }));

        assert(custom.size() == 0);

        std::cout << "✓ Invalid template test passed" << std::endl;
    }

    void testRegistrationAndReplacement() {
        std::cout << "Testing template registration and replacement..." << std::endl;

        TemplateCatalog custom = TemplateCatalog::withBuiltins();
        size_t before = custom.size();

        auto replacement = simpleTemplate("research_analysis");
        replacement.description = "Replaced";
        custom.registerTemplate(replacement);
        assert(custom.size() == before);
        assert(custom.getTemplate("research_analysis").description == "Replaced");
        assert(custom.listTemplates().front().name == "research_analysis" && "Replacement keeps its slot");

        custom.registerTemplate(simpleTemplate("extra"));
        assert(custom.size() == before + 1);
        assert(custom.listTemplates().back().name == "extra");

        std::cout << "✓ Registration test passed" << std::endl;
    }

    void testSuggestion() {
        std::cout << "Testing template suggestion..." << std::endl;

        assert(builder.suggestTemplate("Write a story about a lighthouse") == "creative_project");
        assert(builder.suggestTemplate("Deploy the docker container to staging") == "devops_infrastructure");
        assert(builder.suggestTemplate("Check the firewall policy for threats") == "network_security");
        assert(builder.suggestTemplate("hello") == "research_analysis");

        auto tasks = builder.buildFromPrompt("Write a story about a lighthouse");
        assert(tasks.size() == 4);
        assert(tasks[1].type == TaskType::CREATIVE);

        std::cout << "✓ Suggestion test passed" << std::endl;
    }

    void runAllTests() {
        std::cout << "=== WorkflowBuilder Component Tests ===" << std::endl;

        testLinearChain();
        testTaskIdsAndPrompts();
        testParallelGroups();
        testDagByConstruction();
        testStructuralRoundTrip();
        testUnknownTemplate();
        testInvalidTemplates();
        testRegistrationAndReplacement();
        testSuggestion();

        std::cout << "All WorkflowBuilder tests passed!" << std::endl;
    }
};

int main() {
    try {
        Logger::getInstance().setConsoleLogging(false);
        Logger::getInstance().setFileLogging(false);

        WorkflowBuilderTest tests;
        tests.runAllTests();

        std::cout << "\n🎉 All WorkflowBuilder component tests passed!" << std::endl;
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
