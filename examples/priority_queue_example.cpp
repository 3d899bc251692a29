/**
 * @file priority_queue_example.cpp
 * @brief Several producer threads feed one PriorityTaskQueue, then it is drained
 *
 * Usage: priority_queue_example [config.yaml|config.json]
 *
 * Without an argument the queue runs with default settings. The drained output
 * lists every HIGH task before any MEDIUM task and every MEDIUM task before any
 * LOW task, with each producer's tasks of one priority in submission order.
 */

#include <taskq/common/debug.hpp>
#include <taskq/core/config/config_apply.hpp>
#include <taskq/core/config/config_loader.hpp>
#include <taskq/core/scheduler/priority_task_queue.hpp>

#include <iostream>
#include <string>
#include <thread>
#include <vector>

using namespace taskq;

namespace {

constexpr int PRODUCERS          = 4;
constexpr int TASKS_PER_PRODUCER = 6;

struct Job {
    int producer = 0;
    int index    = 0;
    std::string description;
};

core::Priority priority_for(int index) {
    switch (index % 3) {
        case 0:  return core::Priority::LOW;
        case 1:  return core::Priority::HIGH;
        default: return core::Priority::MEDIUM;
    }
}

}  // namespace

int main(int argc, char* argv[]) {
    common::debug::init_logging(common::debug::LogLevel::INFO);

    core::config::TaskqConfig config;
    if (argc > 1) {
        auto loader = core::config::create_config_loader();
        auto loaded = loader->load(argv[1]);
        if (!loaded) {
            std::cerr << "Failed to load configuration: " << loaded.error().to_string()
                      << std::endl;
            return 1;
        }
        config = loaded.value();

        auto logging = core::config::apply_logging_config(config.logging);
        if (!logging) {
            std::cerr << "Failed to configure logging: " << logging.error().to_string()
                      << std::endl;
            return 1;
        }
    }

    core::PriorityTaskQueue<Job> queue(core::config::make_queue_config(config.queue));

    std::vector<std::thread> producers;
    for (int p = 0; p < PRODUCERS; ++p) {
        producers.emplace_back([&queue, p] {
            common::debug::Logger::set_thread_name("producer-" + std::to_string(p));
            for (int i = 0; i < TASKS_PER_PRODUCER; ++i) {
                auto priority = priority_for(i);
                Job job{p, i, "job " + std::to_string(p) + "." + std::to_string(i)};
                auto result = queue.add(std::move(job), priority);
                if (!result) {
                    TASKQ_ERROR("add failed: " << result.error().to_string());
                }
            }
        });
    }
    for (auto& t : producers) {
        t.join();
    }

    auto snap = queue.snapshot();
    std::cout << "Queue '" << queue.name() << "' holds " << snap.total << " tasks (HIGH "
              << snap.high << ", MEDIUM " << snap.medium << ", LOW " << snap.low << ")"
              << std::endl;

    if (auto next = queue.peek(); next && next.value()) {
        std::cout << "Next up: " << next.value()->description << std::endl;
    }

    // Drain until the queue reports empty: nullopt in optional mode, QUEUE_EMPTY in strict mode
    while (true) {
        auto taken = queue.take();
        if (!taken) {
            if (taken.code() != common::ErrorCode::QUEUE_EMPTY) {
                std::cerr << "take failed: " << taken.error().to_string() << std::endl;
                return 1;
            }
            break;
        }
        if (!taken.value()) {
            break;
        }
        const Job& job = *taken.value();
        std::cout << "  " << job.description << " [" << core::priority_name(priority_for(job.index))
                  << "]" << std::endl;
    }

    const auto& stats = queue.stats();
    std::cout << "added=" << stats.tasks_added.load() << " taken=" << stats.tasks_taken.load()
              << " peak=" << stats.peak_size.load() << std::endl;

    common::debug::shutdown_logging();
    return 0;
}
