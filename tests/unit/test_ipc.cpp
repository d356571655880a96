#include <gtest/gtest.h>
#include "torrentflow/core/ipc_protocol.hpp"
#include "torrentflow/core/ipc_server.hpp"
#include "torrentflow/session/session_manager.hpp"
#include "fake_engine.hpp"
#include <algorithm>

using namespace torrentflow;
using namespace torrentflow::core;

namespace {

const std::string HASH = "c12fe1c06bba254a9dc9f519b335aa7c1367a88a";
const std::string MAGNET = "magnet:?xt=urn:btih:" + HASH + "&dn=Big%20Buck%20Bunny";

IPCRequest make_request(const std::string& command, std::map<std::string, std::string> parameters = {}) {
    IPCRequest request;
    request.command = command;
    request.parameters = std::move(parameters);
    return request;
}

}

TEST(IPCProtocolTest, RequestRoundTrip) {
    auto request = make_request("add-magnet", {{"uri", MAGNET}, {"note", "two words; and=more"}});

    auto line = encode_request(request);
    EXPECT_EQ(line.back(), '\n');
    EXPECT_EQ(std::count(line.begin(), line.end(), ' '), 2);

    auto parsed = parse_request(line);
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed->command, "add-magnet");
    EXPECT_EQ(parsed->parameters.at("uri"), MAGNET);
    EXPECT_EQ(parsed->parameters.at("note"), "two words; and=more");
}

TEST(IPCProtocolTest, ParseRequestRejectsMalformed) {
    EXPECT_FALSE(parse_request("").has_value());
    EXPECT_FALSE(parse_request("   \n").has_value());
    EXPECT_FALSE(parse_request("pause id").has_value());
    EXPECT_FALSE(parse_request("pause =abc").has_value());
    EXPECT_FALSE(parse_request("pause id=%zz").has_value());
    EXPECT_FALSE(parse_request("pause bad!key=1").has_value());

    auto bare = parse_request("status\r\n");
    ASSERT_TRUE(bare.has_value());
    EXPECT_EQ(bare->command, "status");
    EXPECT_TRUE(bare->parameters.empty());
}

TEST(IPCProtocolTest, ResponseRoundTrip) {
    auto response = IPCResponse::ok("line one\nline two");
    response.data["t0.name"] = "Big Buck Bunny\n(2008)";
    response.data["t0.eta"] = "";

    auto block = encode_response(response);
    EXPECT_NE(block.find("\nEND\n"), std::string::npos);

    auto parsed = parse_response(block);
    ASSERT_TRUE(parsed.has_value());
    EXPECT_TRUE(parsed->success);
    EXPECT_EQ(parsed->message, "line one line two");
    EXPECT_EQ(parsed->data.at("t0.name"), "Big Buck Bunny\n(2008)");
    EXPECT_EQ(parsed->data.at("t0.eta"), "");
}

TEST(IPCProtocolTest, ParseResponseRequiresEndMarker) {
    EXPECT_FALSE(parse_response("SUCCESS\nok\nkey=value\n").has_value());
    EXPECT_FALSE(parse_response("MAYBE\nok\nEND\n").has_value());
    EXPECT_FALSE(parse_response("ERROR\n").has_value());
    EXPECT_FALSE(parse_response("SUCCESS\nok\nnot a pair\nEND\n").has_value());

    auto error = parse_response("ERROR\nSession not found\nEND\n");
    ASSERT_TRUE(error.has_value());
    EXPECT_FALSE(error->success);
    EXPECT_EQ(error->message, "Session not found");
}

class IPCServerTest : public ::testing::Test {
protected:
    void SetUp() override {
        engine = std::make_shared<test::FakeEngine>();
        session::SessionManagerOptions options;
        options.tick_interval = std::chrono::milliseconds(250);
        manager = std::make_shared<session::SessionManager>(engine, options);
        server = std::make_unique<IPCServer>(manager, "/tmp/torrentflow_ipc_unit.sock");
    }

    void TearDown() override {
        server.reset();
        manager.reset();
    }

    std::shared_ptr<test::FakeEngine> engine;
    std::shared_ptr<session::SessionManager> manager;
    std::unique_ptr<IPCServer> server;
};

TEST_F(IPCServerTest, Status) {
    auto response = server->handle_request(make_request("status"));

    EXPECT_TRUE(response.success);
    EXPECT_EQ(response.data["daemon_running"], "true");
    EXPECT_EQ(response.data["session_count"], "0");
    EXPECT_EQ(response.data["broadcasting"], "false");
    EXPECT_EQ(response.data["tick_interval_ms"], "250");
    EXPECT_EQ(response.data["stats.sessions"], "0");
}

TEST_F(IPCServerTest, AddMagnetThenList) {
    auto added = server->handle_request(make_request("add-magnet", {{"uri", MAGNET}}));
    ASSERT_TRUE(added.success) << added.message;
    EXPECT_EQ(added.data["id"], HASH);
    EXPECT_EQ(added.data["error"], "success");

    auto list = server->handle_request(make_request("list"));
    ASSERT_TRUE(list.success);
    EXPECT_EQ(list.data["count"], "1");
    EXPECT_EQ(list.data["t0.id"], HASH);
    EXPECT_EQ(list.data["t0.name"], "Big Buck Bunny");
    EXPECT_EQ(list.data["t0.source"], "magnet");
    EXPECT_EQ(list.data["t0.metadata"], "false");
    EXPECT_EQ(list.data["t0.status"], "paused");
    EXPECT_EQ(list.data["t0.progress"], "0.00");
    EXPECT_EQ(list.data["t0.eta"], "");
    EXPECT_EQ(list.data.count("t0.files"), 0);
}

TEST_F(IPCServerTest, DuplicateAddReportsError) {
    ASSERT_TRUE(server->handle_request(make_request("add-magnet", {{"uri", MAGNET}})).success);

    auto again = server->handle_request(make_request("add-magnet", {{"uri", MAGNET}}));

    EXPECT_FALSE(again.success);
    EXPECT_EQ(again.data["error"], "duplicate id");
    EXPECT_EQ(again.data["id"], HASH);
}

TEST_F(IPCServerTest, GetIncludesFiles) {
    ASSERT_TRUE(manager->add_by_magnet(MAGNET).success());
    engine->state(HASH)->deliver_metadata("bbb", 300, {
        {"bbb/video.mp4", "/tmp/bbb/video.mp4", 200, 100},
        {"bbb/readme.txt", "/tmp/bbb/readme.txt", 100, 0},
    });

    auto response = server->handle_request(make_request("get", {{"id", HASH}}));

    ASSERT_TRUE(response.success);
    EXPECT_EQ(response.data["id"], HASH);
    EXPECT_EQ(response.data["metadata"], "true");
    EXPECT_EQ(response.data["size"], "300");
    EXPECT_EQ(response.data["files"], "2");
    EXPECT_EQ(response.data["f0.name"], "bbb/video.mp4");
    EXPECT_EQ(response.data["f0.progress"], "50.00");
    EXPECT_EQ(response.data["f1.path"], "/tmp/bbb/readme.txt");
    EXPECT_EQ(response.data["f1.completed"], "0");
}

TEST_F(IPCServerTest, GetUnknown) {
    auto response = server->handle_request(make_request("get", {{"id", "nope"}}));
    EXPECT_FALSE(response.success);
    EXPECT_EQ(response.data["error"], "not found");
}

TEST_F(IPCServerTest, PauseResumeRemove) {
    ASSERT_TRUE(manager->add_by_magnet(MAGNET).success());

    EXPECT_TRUE(server->handle_request(make_request("pause", {{"id", HASH}})).success);
    EXPECT_TRUE(server->handle_request(make_request("resume", {{"id", HASH}})).success);

    auto removed = server->handle_request(make_request("remove", {{"id", HASH}, {"delete_files", "false"}}));
    EXPECT_TRUE(removed.success);
    EXPECT_EQ(removed.message, "Transfer removed");
    EXPECT_TRUE(manager->get_all().empty());

    auto again = server->handle_request(make_request("remove", {{"id", HASH}}));
    EXPECT_FALSE(again.success);
    EXPECT_EQ(again.data["error"], "not found");
}

TEST_F(IPCServerTest, InvalidInputsAreReported) {
    auto bad_magnet = server->handle_request(make_request("add-magnet", {{"uri", "magnet:?dn=x"}}));
    EXPECT_FALSE(bad_magnet.success);
    EXPECT_EQ(bad_magnet.data["error"], "invalid input");

    auto missing_file = server->handle_request(make_request("add-file", {{"path", "/nonexistent/a.torrent"}}));
    EXPECT_FALSE(missing_file.success);
    EXPECT_EQ(missing_file.data["error"], "not found");

    auto no_paths = server->handle_request(make_request("seed"));
    EXPECT_FALSE(no_paths.success);
    EXPECT_EQ(no_paths.data["error"], "invalid input");
}

TEST_F(IPCServerTest, MissingParameters) {
    for (const std::string command : {"get", "pause", "resume", "remove"}) {
        auto response = server->handle_request(make_request(command));
        EXPECT_FALSE(response.success) << command;
        EXPECT_EQ(response.message, "Missing parameter: id") << command;
    }

    EXPECT_EQ(server->handle_request(make_request("add-magnet")).message, "Missing parameter: uri");
    EXPECT_EQ(server->handle_request(make_request("add-file", {{"path", ""}})).message, "Missing parameter: path");
}

TEST_F(IPCServerTest, UnknownCommand) {
    auto response = server->handle_request(make_request("shutdown"));
    EXPECT_FALSE(response.success);
    EXPECT_EQ(response.message, "Unknown command: shutdown");
}

TEST_F(IPCServerTest, Stats) {
    ASSERT_TRUE(manager->add_by_magnet(MAGNET).success());

    auto response = server->handle_request(make_request("stats"));

    ASSERT_TRUE(response.success);
    EXPECT_EQ(response.data["stats.sessions"], "1");
    EXPECT_EQ(response.data["stats.active"], "1");
    EXPECT_EQ(response.data["stats.download"], "0");
}

TEST(IPCFrameTest, BatchFrame) {
    session::SnapshotBatch batch;
    batch.tick = 7;
    session::TransferSnapshot snapshot;
    snapshot.id = HASH;
    snapshot.name = "bbb";
    snapshot.status = session::TransferStatus::DOWNLOADING;
    snapshot.progress = 12.5;
    snapshot.download_rate = 2048;
    snapshot.eta = std::chrono::seconds(90);
    batch.snapshots.push_back(snapshot);
    batch.stats.total_download_rate = 2048;
    batch.stats.session_count = 1;

    auto frame = make_batch_frame(batch);

    EXPECT_TRUE(frame.success);
    EXPECT_EQ(frame.data["type"], "tick");
    EXPECT_EQ(frame.data["tick"], "7");
    EXPECT_EQ(frame.data["count"], "1");
    EXPECT_EQ(frame.data["t0.status"], "downloading");
    EXPECT_EQ(frame.data["t0.progress"], "12.50");
    EXPECT_EQ(frame.data["t0.down"], "2048");
    EXPECT_EQ(frame.data["t0.eta"], "90");
    EXPECT_EQ(frame.data["stats.download"], "2048");
    EXPECT_EQ(frame.data["stats.sessions"], "1");
}
