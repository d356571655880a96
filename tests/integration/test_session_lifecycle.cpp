#include <gtest/gtest.h>
#include "torrentflow/session/session_manager.hpp"
#include "torrentflow/engine/local_engine.hpp"
#include "torrentflow/core/ipc_server.hpp"
#include "torrentflow/core/ipc_client.hpp"
#include "torrentflow/core/utils.hpp"
#include <unistd.h>
#include <algorithm>
#include <condition_variable>
#include <filesystem>
#include <mutex>
#include <thread>
#include <chrono>

using namespace torrentflow;
using namespace std::chrono_literals;

namespace {

const std::string HASH = "c12fe1c06bba254a9dc9f519b335aa7c1367a88a";
const std::string MAGNET = "magnet:?xt=urn:btih:" + HASH + "&dn=Sintel";

}

class SessionLifecycleTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir = std::filesystem::temp_directory_path() / "torrentflow_lifecycle_test";
        std::filesystem::remove_all(test_dir);
        std::filesystem::create_directories(test_dir / "source");

        engine::StorageConfig storage(test_dir / "downloads");
        storage.seed_piece_length = 16 * 1024;
        engine = std::make_shared<engine::LocalEngine>(storage);

        session::SessionManagerOptions options;
        options.tick_interval = 50ms;
        options.metadata_timeout = 150ms;
        options.seed_piece_length = 16 * 1024;
        manager = std::make_shared<session::SessionManager>(engine, options);
        manager->add_event_handler([this](const session::SessionEvent& event) {
            {
                std::lock_guard<std::mutex> lock(events_mutex);
                events.push_back(event);
            }
            events_cv.notify_all();
        });
    }

    void TearDown() override {
        manager.reset();
        engine.reset();
        std::filesystem::remove_all(test_dir);
    }

    std::filesystem::path write_source(const std::string& name, size_t size) {
        std::string data(size, '\0');
        for (size_t i = 0; i < size; ++i) {
            data[i] = static_cast<char>(i * 7 % 251);
        }
        auto path = test_dir / "source" / name;
        EXPECT_TRUE(core::utils::FileUtils::write_file(path, data));
        return path;
    }

    bool wait_for_event(session::SessionEventType type, std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(events_mutex);
        return events_cv.wait_for(lock, timeout, [&]() {
            return std::any_of(events.begin(), events.end(), [&](const session::SessionEvent& event) {
                return event.type == type;
            });
        });
    }

    std::filesystem::path test_dir;
    std::shared_ptr<engine::LocalEngine> engine;
    std::shared_ptr<session::SessionManager> manager;

    std::mutex events_mutex;
    std::condition_variable events_cv;
    std::vector<session::SessionEvent> events;
};

TEST_F(SessionLifecycleTest, SeedListAndRemoveWithFiles) {
    auto first = write_source("episode1.mkv", 50000);
    auto second = write_source("episode2.mkv", 30000);

    auto result = manager->add_local_for_seeding({first.string(), second.string()});
    ASSERT_TRUE(result.success()) << result.message;
    EXPECT_EQ(engine->transfer_count(), 1);

    auto all = manager->get_all();
    ASSERT_EQ(all.size(), 1);
    EXPECT_EQ(all[0].status, session::TransferStatus::COMPLETED);
    EXPECT_DOUBLE_EQ(all[0].progress, 100.0);
    EXPECT_EQ(all[0].total_size, 80000);
    EXPECT_EQ(all[0].name, "episode1.mkv");
    EXPECT_FALSE(all[0].eta.has_value());

    auto stats = manager->get_stats();
    EXPECT_EQ(stats.session_count, 1);
    EXPECT_EQ(stats.active_transfers, 0);

    auto removed = manager->remove(result.session_id, true);
    EXPECT_TRUE(removed.success()) << removed.message;
    EXPECT_FALSE(std::filesystem::exists(first));
    EXPECT_FALSE(std::filesystem::exists(second));
    EXPECT_EQ(engine->transfer_count(), 0);
}

TEST_F(SessionLifecycleTest, DescriptorPicksUpDataOnDisk) {
    auto payload = write_source("movie.mkv", 40000);
    auto descriptor = metainfo::DescriptorBuilder(16 * 1024).build({payload});
    auto descriptor_path = test_dir / "movie.torrent";
    ASSERT_TRUE(descriptor.save_to_file(descriptor_path));

    std::filesystem::create_directories(test_dir / "downloads");
    std::filesystem::copy_file(payload, test_dir / "downloads" / "movie.mkv");

    auto result = manager->add_by_descriptor_file(descriptor_path.string());
    ASSERT_TRUE(result.success()) << result.message;
    EXPECT_TRUE(wait_for_event(session::SessionEventType::ADDED, 1s));

    auto snapshot = manager->get(result.session_id);
    ASSERT_TRUE(snapshot.has_value());
    EXPECT_EQ(snapshot->status, session::TransferStatus::COMPLETED);
    EXPECT_EQ(snapshot->bytes_completed, 40000);
    ASSERT_EQ(snapshot->files.size(), 1);
    EXPECT_EQ(snapshot->files[0].path, (test_dir / "downloads" / "movie.mkv").string());
}

TEST_F(SessionLifecycleTest, MagnetWithoutPeersTimesOut) {
    manager->start(false);

    ASSERT_TRUE(manager->add_by_magnet(MAGNET).success());
    ASSERT_TRUE(wait_for_event(session::SessionEventType::METADATA_TIMEOUT, 3s));

    auto snapshot = manager->get(HASH);
    ASSERT_TRUE(snapshot.has_value());
    EXPECT_EQ(snapshot->name, "Sintel");
    EXPECT_FALSE(snapshot->metadata_known);
    EXPECT_EQ(snapshot->status, session::TransferStatus::PAUSED);

    ASSERT_TRUE(manager->remove(HASH, true).success());
    manager->stop();
}

TEST_F(SessionLifecycleTest, DaemonSocketRoundTrip) {
    const std::string socket_path = "/tmp/torrentflow_it_" + std::to_string(getpid()) + ".sock";

    manager->start();
    core::IPCServer server(manager, socket_path);
    ASSERT_TRUE(server.start());

    core::IPCClient client(socket_path);
    EXPECT_TRUE(client.is_daemon_running());

    core::IPCRequest add;
    add.command = "add-magnet";
    add.parameters["uri"] = MAGNET;
    auto added = client.send_request(add);
    ASSERT_TRUE(added.has_value());
    EXPECT_TRUE(added->success) << added->message;
    EXPECT_EQ(added->data["id"], HASH);

    core::IPCRequest list;
    list.command = "list";
    auto listed = client.send_request(list);
    ASSERT_TRUE(listed.has_value());
    EXPECT_EQ(listed->data["count"], "1");
    EXPECT_EQ(listed->data["t0.name"], "Sintel");

    int frames = 0;
    std::optional<core::IPCResponse> tick;
    bool connected = client.watch([&](const core::IPCResponse& frame) {
        ++frames;
        if (frame.data.count("type") && frame.data.at("type") == "tick" && frame.data.at("count") == "1") {
            tick = frame;
            return false;
        }
        return true;
    });

    EXPECT_TRUE(connected);
    ASSERT_TRUE(tick.has_value());
    EXPECT_GE(frames, 2);
    EXPECT_EQ(tick->data.at("t0.id"), HASH);
    EXPECT_EQ(tick->data.at("stats.sessions"), "1");

    server.stop();
    manager->stop();
    EXPECT_FALSE(client.is_daemon_running());
}

TEST_F(SessionLifecycleTest, ServedClientsAreReleased) {
    const std::string socket_path = "/tmp/torrentflow_it_clients_" + std::to_string(getpid()) + ".sock";

    manager->start();
    core::IPCServer server(manager, socket_path);
    ASSERT_TRUE(server.start());

    core::IPCClient client(socket_path);
    core::IPCRequest status;
    status.command = "status";
    for (int i = 0; i < 400; ++i) {
        auto response = client.send_request(status);
        ASSERT_TRUE(response.has_value()) << "request " << i;
        EXPECT_TRUE(response->success);
    }

    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (server.get_active_clients() > 0 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    EXPECT_EQ(server.get_active_clients(), 0u);

    server.stop();
    manager->stop();
}

TEST_F(SessionLifecycleTest, TransferHeldOutsideTheManagerIsDuplicate) {
    auto link = metainfo::MagnetLink::parse(MAGNET);
    ASSERT_TRUE(link.has_value());
    auto outside = engine->add_magnet(*link);

    auto result = manager->add_by_magnet(MAGNET);
    EXPECT_EQ(result.error, session::SessionError::DUPLICATE_ID);
    EXPECT_EQ(result.session_id, HASH);
    EXPECT_FALSE(manager->get_registry().contains(HASH));

    outside->drop();
    EXPECT_TRUE(manager->add_by_magnet(MAGNET).success());
}
