#include "common/job.hpp"
#include <random>
#include <mutex>

std::string toString(JobKind kind) {
    return kind == JobKind::Backup ? "backup" : "restore";
}

std::string generateRunId() {
    static std::mutex generatorMutex;
    static std::mt19937_64 gen{std::random_device{}()};
    std::uniform_int_distribution<int> dis(0, 15);
    const char* hex = "0123456789abcdef";

    std::string id;
    id.reserve(32);
    std::lock_guard<std::mutex> lock(generatorMutex);
    for (int i = 0; i < 32; ++i) {
        id.push_back(hex[dis(gen)]);
    }
    return id;
}
