#include "ensemble/run_config.hpp"
#include "ensemble/work_queue.hpp"

#include <atomic>
#include <iostream>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <variant>
#include <vector>

int main() {
    using namespace ensemble;

    WorkQueue<int> fifo;
    for (int i = 0; i < 5; ++i) {
        fifo.push(i);
    }
    if (fifo.size() != 5) {
        std::cerr << "work_queue_test: expected size 5, got " << fifo.size() << '\n';
        return 1;
    }
    for (int i = 0; i < 5; ++i) {
        const int value = fifo.pop();
        if (value != i) {
            std::cerr << "work_queue_test: FIFO order broken, expected " << i << " got " << value << '\n';
            return 1;
        }
    }

    constexpr std::size_t kConsumers = 4;
    constexpr std::size_t kProducers = 2;
    constexpr std::size_t kPerProducer = 500;

    WorkQueue<QueueMessage> queue;
    std::mutex resultMutex;
    std::vector<std::string> received;
    std::atomic<std::size_t> tokens{0};

    std::vector<std::thread> consumers;
    for (std::size_t c = 0; c < kConsumers; ++c) {
        consumers.emplace_back([&]() {
            while (true) {
                QueueMessage message = queue.pop();
                if (std::holds_alternative<TerminationToken>(message)) {
                    tokens.fetch_add(1);
                    return;
                }
                std::lock_guard<std::mutex> lock(resultMutex);
                received.push_back(std::get<WorkItem>(message).directory.string());
            }
        });
    }

    std::vector<std::thread> producers;
    for (std::size_t p = 0; p < kProducers; ++p) {
        producers.emplace_back([&queue, p]() {
            for (std::size_t i = 0; i < kPerProducer; ++i) {
                WorkItem item{};
                item.directory = "run_" + std::to_string(p) + "_" + std::to_string(i);
                queue.push(std::move(item));
            }
        });
    }
    for (auto& producer : producers) {
        producer.join();
    }
    for (std::size_t c = 0; c < kConsumers; ++c) {
        queue.push(TerminationToken{});
    }
    for (auto& consumer : consumers) {
        consumer.join();
    }

    if (tokens.load() != kConsumers) {
        std::cerr << "work_queue_test: expected " << kConsumers << " tokens consumed, got " << tokens.load()
                  << '\n';
        return 1;
    }
    const std::set<std::string> unique(received.begin(), received.end());
    if (received.size() != kProducers * kPerProducer || unique.size() != received.size()) {
        std::cerr << "work_queue_test: items were lost or delivered twice (" << received.size() << " received, "
                  << unique.size() << " unique)\n";
        return 1;
    }
    if (queue.size() != 0) {
        std::cerr << "work_queue_test: queue should be drained\n";
        return 1;
    }

    return 0;
}
