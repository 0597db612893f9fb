//
// Created by gregorian-rayne on 10/18/26.
//

#include "cie/hotspots/guidance.hpp"
#include "cie/hotspots/hotspot_classifier.hpp"
#include "cie/pipeline/file_analyzer.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <set>

namespace cie::hotspots
{
    class HotspotClassifierTest : public ::testing::Test {
    protected:
        std::vector<PerformanceHotspot> classify(const std::string& path, const std::string& content) {
            const pipeline::FileAnalyzer analyzer(config_);
            files_.push_back(std::make_shared<const FileArtifacts>(analyzer.analyze({path, content})));

            const auto context = linker::LinkContext::from(files_);
            auto program = linker::GlobalLinker(config_).link(context);
            EXPECT_TRUE(program.is_ok());
            return HotspotClassifier(config_).classify(context, program.value());
        }

        static std::size_t count_type(const std::vector<PerformanceHotspot>& hotspots, const HotspotType type) {
            return static_cast<std::size_t>(std::ranges::count(hotspots, type, &PerformanceHotspot::hotspot_type));
        }

        heuristics::HeuristicsConfig config_ = heuristics::HeuristicsConfig::defaults();
        std::vector<std::shared_ptr<const FileArtifacts>> files_;
    };

    TEST_F(HotspotClassifierTest, InterruptRegistrationIsOneSystemCall) {
        const auto hotspots = classify("irq.c",
            "static int setup(void) {\n"
            "    request_irq(IRQ_TIMER, timer_isr, 0, \"timer\", NULL);\n"
            "    return 0;\n"
            "}\n");

        ASSERT_EQ(hotspots.size(), 1u);
        const auto& hotspot = hotspots[0];
        EXPECT_EQ(hotspot.hotspot_type, HotspotType::SystemCall);
        EXPECT_EQ(hotspot.severity, Severity::Critical);
        EXPECT_EQ(hotspot.optimization_potential, Severity::High);
        EXPECT_EQ(hotspot.location.file_path, "irq.c");
        EXPECT_EQ(hotspot.location.line, 2u);
        EXPECT_EQ(hotspot.location.column, 4u);
        EXPECT_EQ(hotspot.function_name, "setup");
        EXPECT_FALSE(hotspot.description.empty());
        EXPECT_FALSE(hotspot.educational_context.empty());
    }

    TEST_F(HotspotClassifierTest, StraightLineCodeHasNoHotspots) {
        const auto hotspots = classify("math.rs", "fn add(a: u32, b: u32) -> u32 {\n    a + b\n}\n");
        EXPECT_TRUE(hotspots.empty());
    }

    TEST_F(HotspotClassifierTest, NestedLoopIsEscalated) {
        const auto hotspots = classify("grid.c",
            "void fill(int n) {\n"
            "    for (int i = 0; i < n; i++) {\n"
            "        for (int j = 0; j < n; j++) {\n"
            "        }\n"
            "    }\n"
            "}\n");

        ASSERT_EQ(count_type(hotspots, HotspotType::Loop), 2u);
        EXPECT_EQ(hotspots[0].severity, Severity::High);
        EXPECT_EQ(hotspots[0].location.line, 3u);
        EXPECT_EQ(hotspots[1].severity, Severity::Medium);
        EXPECT_EQ(hotspots[1].location.line, 2u);
    }

    TEST_F(HotspotClassifierTest, AllocationLockAndIoCalls) {
        const auto hotspots = classify("drv.c",
            "void handle(struct dev *d) {\n"
            "    char *buf = kmalloc(64, 0);\n"
            "    spin_lock(&d->lock);\n"
            "    printk(\"x\");\n"
            "}\n");

        EXPECT_EQ(count_type(hotspots, HotspotType::MemoryAllocation), 1u);
        EXPECT_EQ(count_type(hotspots, HotspotType::Synchronization), 1u);
        EXPECT_EQ(count_type(hotspots, HotspotType::IoBound), 1u);
        EXPECT_EQ(hotspots.size(), 3u);
    }

    TEST_F(HotspotClassifierTest, PointerChasingInLoop) {
        const auto hotspots = classify("list.c",
            "int length(struct node *n) {\n"
            "    int count = 0;\n"
            "    while (n) { count++; n = n->next; }\n"
            "    return count;\n"
            "}\n");

        EXPECT_EQ(count_type(hotspots, HotspotType::CacheMiss), 1u);
        EXPECT_EQ(count_type(hotspots, HotspotType::Loop), 1u);
    }

    TEST_F(HotspotClassifierTest, RustCloneInLoopAndMutex) {
        const auto hotspots = classify("queue.rs",
            "fn drain(items: Vec<Item>) {\n"
            "    let guard = Mutex::new(0);\n"
            "    for item in items.iter() {\n"
            "        let copy = item.clone();\n"
            "    }\n"
            "}\n");

        const auto clone = std::ranges::find_if(hotspots, [](const PerformanceHotspot& h) {
            return h.hotspot_type == HotspotType::MemoryAllocation && h.location.line == 4;
        });
        ASSERT_NE(clone, hotspots.end());
        EXPECT_EQ(clone->severity, Severity::High);
        EXPECT_EQ(clone->rule, "collection_copy");
        EXPECT_EQ(count_type(hotspots, HotspotType::Synchronization), 1u);
    }

    TEST_F(HotspotClassifierTest, AssemblyTrapInstruction) {
        const auto hotspots = classify("entry.S",
            "_start:\n"
            "    mov $60, %rax\n"
            "    syscall\n");

        ASSERT_EQ(hotspots.size(), 1u);
        EXPECT_EQ(hotspots[0].hotspot_type, HotspotType::SystemCall);
        EXPECT_EQ(hotspots[0].location.line, 3u);
        EXPECT_EQ(hotspots[0].rule, "trap_instruction");
    }

    TEST_F(HotspotClassifierTest, ComplexityBandsProduceCpuIntensive) {
        config_.complexity.medium_threshold = 1;
        config_.complexity.high_threshold = 5;
        const auto hotspots = classify("branch.c", "int f(int a) {\n    if (a) { a++; }\n    return a;\n}\n");

        ASSERT_EQ(count_type(hotspots, HotspotType::CpuIntensive), 1u);
        const auto cpu = std::ranges::find(hotspots, HotspotType::CpuIntensive, &PerformanceHotspot::hotspot_type);
        EXPECT_EQ(cpu->severity, Severity::Medium);
        EXPECT_EQ(cpu->rule, "complexity_medium");
        EXPECT_EQ(cpu->location.line, 1u);
    }

    TEST_F(HotspotClassifierTest, SameLineDifferentTypesAreAllReported) {
        const auto hotspots = classify("mix.c", "void f(void) {\n    free(lock_buffer()); sort(v); }\n");
        std::set<HotspotType> types;
        for (const auto& h : hotspots) {
            types.insert(h.hotspot_type);
        }
        EXPECT_TRUE(types.contains(HotspotType::MemoryAllocation));
        EXPECT_TRUE(types.contains(HotspotType::CpuIntensive));
    }

    TEST_F(HotspotClassifierTest, SortBySeverityThenPosition) {
        std::vector<PerformanceHotspot> hotspots(4);
        hotspots[0].severity = Severity::Low;
        hotspots[0].location = {"b.c", 1, 0};
        hotspots[1].severity = Severity::Critical;
        hotspots[1].location = {"b.c", 9, 0};
        hotspots[2].severity = Severity::Low;
        hotspots[2].location = {"a.c", 5, 0};
        hotspots[3].severity = Severity::Critical;
        hotspots[3].location = {"a.c", 7, 2};

        sort_hotspots(hotspots);

        EXPECT_EQ(hotspots[0].location.file_path, "a.c");
        EXPECT_EQ(hotspots[0].severity, Severity::Critical);
        EXPECT_EQ(hotspots[1].location.line, 9u);
        EXPECT_EQ(hotspots[2].location.file_path, "a.c");
        EXPECT_EQ(hotspots[3].location.file_path, "b.c");
        EXPECT_EQ(hotspots[3].severity, Severity::Low);
    }

    TEST_F(HotspotClassifierTest, ClassificationIsRepeatable) {
        const std::string source = "void f(int n) {\n    while (n) { kfree(p); n--; }\n}\n";
        const auto first = classify("r.c", source);
        files_.clear();
        const auto second = classify("r.c", source);

        ASSERT_EQ(first.size(), second.size());
        for (std::size_t i = 0; i < first.size(); ++i) {
            EXPECT_EQ(first[i].hotspot_type, second[i].hotspot_type);
            EXPECT_EQ(first[i].location, second[i].location);
            EXPECT_EQ(first[i].severity, second[i].severity);
        }
    }

    TEST_F(HotspotClassifierTest, OneSuggestionPerHotspot) {
        const auto hotspots = classify("drv.c", "void f(void) {\n    kmalloc(4, 0);\n    printk(\"x\");\n}\n");
        const auto suggestions = optimization_suggestions(hotspots);

        ASSERT_EQ(suggestions.size(), hotspots.size());
        for (std::size_t i = 0; i < hotspots.size(); ++i) {
            EXPECT_EQ(suggestions[i].location, hotspots[i].location);
            EXPECT_EQ(suggestions[i].priority, hotspots[i].severity);
            EXPECT_FALSE(suggestions[i].suggestion_type.empty());
            EXPECT_FALSE(suggestions[i].related_concepts.empty());
        }
    }

    TEST_F(HotspotClassifierTest, EveryTypeHasGuidance) {
        for (const auto type : {HotspotType::SystemCall, HotspotType::MemoryAllocation, HotspotType::Loop,
                                HotspotType::Synchronization, HotspotType::IoBound, HotspotType::CpuIntensive,
                                HotspotType::CacheMiss}) {
            EXPECT_FALSE(guidance_for(type).description.empty()) << to_string(type);
        }
        EXPECT_EQ(optimization_potential(Severity::Critical), Severity::High);
        EXPECT_EQ(optimization_potential(Severity::Low), Severity::Low);
    }

}  // namespace cie::hotspots
