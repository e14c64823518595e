#include "FerryCore.h"
#include <iostream>
#include <string>

using namespace Ferry::Core;
using namespace Ferry::Core::Storage;
using namespace Ferry::Core::Transfer;

int main() {
    ProviderFactory factory;
    ProviderRegistry registry;
    registry.create(factory, "memory", {{"bucket", "source"}}, ProviderId("source"));
    registry.create(factory, "memory", {{"bucket", "target"}, {"max_concurrency", "2"}}, ProviderId("target"));

    // Seed a small tree
    auto source = registry.require("source");
    if (auto created = source->createDirectory("/photos"); !created) {
        FERRY_LOG_ERROR(created.error().describe());
        return 1;
    }
    for (int i = 0; i < 8; ++i) {
        std::string payload(256 * 1024 + i, static_cast<char>('a' + i));
        MemoryByteSource bytes(payload);
        auto written = source->write("/photos/img" + std::to_string(i) + ".raw", bytes, {});
        if (!written) {
            FERRY_LOG_ERROR(written.error().describe());
            return 1;
        }
    }

    auto root = source->stat("/photos");
    if (!root) {
        FERRY_LOG_ERROR(root.error().describe());
        return 1;
    }

    TransferPlanner planner(registry);
    auto plan = planner.plan(PlanRequest{"source", {MarkRequest{root.value(), OperationKind::Move}}, "target", "/"});
    std::cout << "Planned " << plan.size() << " tasks\n";

    TransferExecutor executor(registry, TransferExecutor::Config::fromEnvironment());
    Concurrency::CancellationSource cancel;
    auto summary = executor.execute(std::move(plan), cancel.token(), [](const TransferEvent& e) {
        std::cout << "task " << e.taskId << " " << taskKindToString(e.kind) << " " << taskStatusToString(e.status)
                  << " attempt " << e.attempt;
        if (e.status == TaskStatus::Done && e.kind == TaskKind::CopyBytes) {
            std::cout << " " << e.bytesTransferred << " bytes";
        }
        std::cout << "\n";
    });

    std::cout << summary.describe() << "\n";
    for (const auto& failure : summary.failures()) {
        std::cout << "  " << failure.sourcePath << ": " << failure.error.describe() << "\n";
    }
    return summary.succeeded() ? 0 : 2;
}
