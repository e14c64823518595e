#include "FerryCore.h"
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

using namespace Ferry::Core;
using namespace Ferry::Core::Storage;
using namespace Ferry::Core::Panes;

static void seedFile(const std::filesystem::path& path, const std::string& contents) {
    std::filesystem::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << contents;
}

static void printPane(const PaneView& view) {
    std::cout << (view.active ? "* " : "  ") << view.title << "\n";
    if (view.error) std::cout << "    ! " << *view.error << "\n";
    for (const auto& item : view.entries) {
        std::cout << (item.underCursor ? "    > " : "      ") << item.entry.name
                  << (item.entry.isDirectory() ? "/" : "");
        if (item.mark) std::cout << " [" << Transfer::operationKindToString(*item.mark) << "]";
        if (item.failureReason) std::cout << " (" << *item.failureReason << ")";
        std::cout << "\n";
    }
}

int main() {
    Logging::Logger::global().configureFromEnvironment();

    auto base = std::filesystem::temp_directory_path() / "ferry_session_example";
    std::filesystem::remove_all(base);
    seedFile(base / "home/user/a.txt", "0123456789");
    seedFile(base / "home/user/sub/b.txt", "hello");
    std::filesystem::create_directories(base / "buckets");

    ProviderFactory factory;
    ProviderRegistry registry;
    try {
        registry.create(factory, "local", {{"root", base.string()}}, ProviderId("local"));
        registry.create(factory, "bucket", {{"bucket", "backup"}, {"root", (base / "buckets").string()}},
                        ProviderId("backup"));
    } catch (const ConfigurationError& e) {
        FERRY_LOG_ERROR(std::string("Provider configuration rejected: ") + e.what());
        return 1;
    }

    DualPaneSession session(registry, PaneSpec{"local", "/home/user"}, PaneSpec{"backup", "/"},
                            Transfer::TransferExecutor::Config::fromEnvironment());
    session.setTransferObserver([](const Transfer::TransferEvent& e) {
        std::cout << "  task " << e.taskId << " " << Transfer::taskKindToString(e.kind) << " -> "
                  << Transfer::taskStatusToString(e.status);
        if (e.error) std::cout << " (" << e.error->describe() << ")";
        std::cout << "\n";
    });

    for (const auto& [path, kind] : {std::pair{"/home/user/sub", Transfer::OperationKind::Copy},
                                     std::pair{"/home/user/a.txt", Transfer::OperationKind::Move}}) {
        auto marked = session.dispatch(Actions::Mark{kind, std::string(path)});
        if (!marked.accepted) FERRY_LOG_WARNING("Mark rejected: " + marked.reason);
    }
    printPane(session.view(PaneSide::Left));

    auto result = session.dispatch(Actions::Commit{});
    if (!result.accepted) {
        FERRY_LOG_ERROR("Commit rejected: " + result.reason);
        return 1;
    }
    std::cout << "Summary: " << session.lastSummary()->describe() << "\n";

    printPane(session.view(PaneSide::Left));
    printPane(session.view(PaneSide::Right));

    for (const auto& error : session.errors()) {
        std::cout << error.component << ": " << error.error.describe() << "\n";
    }

    session.dispatch(Actions::Exit{});
    std::filesystem::remove_all(base);
    return 0;
}
