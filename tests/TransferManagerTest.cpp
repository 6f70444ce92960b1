#include "TransferManager.hpp"
#include "openxfer/LocalStrategy.hpp"
#include "TestUtil.hpp"
#include <QCoreApplication>
#include <QTimer>
#include <gtest/gtest.h>

using namespace openxfer;

namespace {

QCoreApplication& application() {
    static int argc = 1;
    static char name[] = "openxfer_cli_tests";
    static char* argv[] = {name, nullptr};
    static QCoreApplication app(argc, argv);
    return app;
}

// Runs the queue until it reports finished, or gives up after a few seconds.
void runToCompletion(TransferManager& manager) {
    QCoreApplication& app = application();
    QObject::connect(&manager, &TransferManager::finished, &app, &QCoreApplication::quit);
    QTimer::singleShot(0, &manager, &TransferManager::schedule);
    QTimer guard;
    guard.setSingleShot(true);
    QObject::connect(&guard, &QTimer::timeout, &app, &QCoreApplication::quit);
    guard.start(10000);
    app.exec();
}

} // namespace

class TransferManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        application();
        orchestrator->setStrategy(Protocol::Local, std::make_shared<LocalStrategy>(std::make_shared<TrashManager>()));
    }

    test::TempDir dir;
    std::shared_ptr<TransferOrchestrator> orchestrator =
        std::make_shared<TransferOrchestrator>(std::make_shared<TempFileManager>(StagingConfig{dir.file("staging")}));
};

TEST_F(TransferManagerTest, RunsQueueAndJoinsFinishedWorkers) {
    TransferManager manager(orchestrator);
    manager.setMaxConcurrent(2);
    for (int i = 0; i < 5; ++i) {
        const std::string name = "f" + std::to_string(i) + ".txt";
        test::writeFile(dir.file(name), name);
        manager.enqueueCopy(QString::fromStdString(dir.file(name)), QString::fromStdString(dir.file("out/" + name)));
    }
    runToCompletion(manager);

    EXPECT_EQ(manager.countWithStatus(TransferTask::Status::Done), 5);
    EXPECT_EQ(manager.workerCount(), 0u);
    EXPECT_EQ(test::readFile(dir.file("out/f4.txt")), "f4.txt");
}

TEST_F(TransferManagerTest, FailedAndCanceledTasks) {
    TransferManager manager(orchestrator);
    test::writeFile(dir.file("a.txt"), "a");
    const quint64 missing = manager.enqueueMove(QString::fromStdString(dir.file("none.txt")),
                                                QString::fromStdString(dir.file("b.txt")));
    const quint64 canceled = manager.enqueueCopy(QString::fromStdString(dir.file("a.txt")),
                                                 QString::fromStdString(dir.file("c.txt")));
    manager.cancelTask(canceled);
    runToCompletion(manager);

    for (const auto& t : manager.tasks()) {
        if (t.id == missing) {
            EXPECT_EQ(t.status, TransferTask::Status::Error);
            EXPECT_FALSE(t.error.isEmpty());
        }
        if (t.id == canceled) EXPECT_EQ(t.status, TransferTask::Status::Canceled);
    }
    EXPECT_FALSE(test::fileExists(dir.file("c.txt")));
    EXPECT_EQ(manager.workerCount(), 0u);
}
