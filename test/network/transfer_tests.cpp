// End-to-end file transfer over loopback TCP
#include <catch2/catch_test_macros.hpp>
#include <catch2/generators/catch_generators.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include "networking.hpp"
#include "security.hpp"
#include "loopback.hpp"
#include <atomic>

using namespace networking;
using namespace lanbeam_test;
using namespace std::chrono_literals;
using Catch::Matchers::ContainsSubstring;

namespace {

constexpr uint32_t MiB = 1024 * 1024;

} // namespace

TEST_CASE("Transfer - output matches input", "[transfer]") {
    auto size = GENERATE(as<std::size_t>{}, 1, 4095, 4096, 4097, 65536 * 3 + 17);
    auto chunk = GENERATE(as<uint32_t>{}, 4096, 65536);

    ScratchDir src("rt_src");
    ScratchDir dst("rt_dst");
    const std::string content = make_content(size, static_cast<uint32_t>(size));
    write_file(src / "payload.bin", content);

    ReceiveLog log;
    ControlServer server(loopback_server(), accept_into(dst.path(), log));
    server.start();

    transfer::Sender sender(src / "payload.bin", chunk);
    transfer::SendResult result = sender.send("127.0.0.1", server.port());

    CHECK(result.bytes_sent == size);
    CHECK(result.chunks_sent == protocol::chunk_count(size, chunk));
    CHECK(result.local_sha256 == security::sha256_hex(content));
    CHECK(result.remote_sha256 == result.local_sha256);
    CHECK(read_file(dst / "payload.bin") == content);
    CHECK_FALSE(std::filesystem::exists(dst / "payload.bin.part"));
}

TEST_CASE("Transfer - 3 MiB in 1 MiB chunks", "[transfer]") {
    ScratchDir src("3m_src");
    ScratchDir dst("3m_dst");
    const std::string content = make_content(3 * MiB);
    write_file(src / "video.mp4", content);

    ReceiveLog log;
    ControlServer server(loopback_server(), accept_into(dst.path(), log));
    server.start();

    transfer::Sender sender(src / "video.mp4", MiB);
    REQUIRE(sender.total_chunks() == 3);

    std::vector<std::pair<uint64_t, std::size_t>> sent;
    transfer::SendResult result = sender.send("127.0.0.1", server.port(), send_control_offer,
        [&](uint64_t index, std::size_t bytes) { sent.emplace_back(index, bytes); });

    REQUIRE(wait_until([&]() { return log.complete_count() == 1; }));
    std::this_thread::sleep_for(100ms);
    auto completes = log.completes();
    REQUIRE(completes.size() == 1);

    const transfer::CompleteMeta& meta = completes.front();
    CHECK(meta.ok);
    CHECK(meta.error.empty());
    CHECK(meta.bytes_transferred == 3 * MiB);
    CHECK(meta.session_id == result.session_id);
    CHECK(meta.sha256 == result.local_sha256);
    CHECK(meta.save_path == (dst.path() / "video.mp4").lexically_normal());

    auto starts = log.starts();
    REQUIRE(starts.size() == 1);
    CHECK(starts.front().filename == "video.mp4");
    CHECK(starts.front().size == 3 * MiB);
    CHECK(starts.front().total_chunks == 3);
    CHECK(starts.front().session_id == result.session_id);

    // Both sides report every chunk, in order
    const std::vector<std::pair<uint64_t, std::size_t>> expected{{0, MiB}, {1, MiB}, {2, MiB}};
    CHECK(sent == expected);
    CHECK(log.progress() == expected);

    CHECK(read_file(dst / "video.mp4") == content);
}

TEST_CASE("Transfer - empty file", "[transfer]") {
    ScratchDir src("empty_src");
    ScratchDir dst("empty_dst");
    write_file(src / "empty.txt", "");

    ReceiveLog log;
    ControlServer server(loopback_server(), accept_into(dst.path(), log));
    server.start();

    transfer::Sender sender(src / "empty.txt");
    transfer::SendResult result = sender.send("127.0.0.1", server.port());

    CHECK(result.bytes_sent == 0);
    CHECK(result.chunks_sent == 0);
    CHECK(result.remote_sha256 == security::sha256_hex(""));
    REQUIRE(std::filesystem::exists(dst / "empty.txt"));
    CHECK(std::filesystem::file_size(dst / "empty.txt") == 0);

    REQUIRE(wait_until([&]() { return log.complete_count() == 1; }));
    CHECK(log.completes().front().ok);
}

TEST_CASE("Transfer - renamed on the wire", "[transfer]") {
    ScratchDir src("ren_src");
    ScratchDir dst("ren_dst");
    write_file(src / "local-name.dat", make_content(5000));

    ReceiveLog log;
    ControlServer server(loopback_server(), accept_into(dst.path(), log));
    server.start();

    transfer::Sender sender(src / "local-name.dat", 1024, "shared name.dat");
    sender.send("127.0.0.1", server.port());

    CHECK(read_file(dst / "shared name.dat") == make_content(5000));
    CHECK_FALSE(std::filesystem::exists(dst / "local-name.dat"));
}

TEST_CASE("Transfer - sender side failures", "[transfer]") {
    ScratchDir src("sf_src");

    SECTION("Source must be a regular file") {
        CHECK_THROWS_AS(transfer::Sender(src / "missing.bin"), transfer::TransferError);
        CHECK_THROWS_AS(transfer::Sender(src.path()), transfer::TransferError);
    }

    SECTION("Zero chunk size") {
        write_file(src / "a.bin", "abc");
        CHECK_THROWS_AS(transfer::Sender(src / "a.bin", 0), transfer::TransferError);
    }

    SECTION("Handshake failure leaves nothing streamed") {
        write_file(src / "a.bin", "abc");
        transfer::Sender sender(src / "a.bin");
        bool progressed = false;
        auto refusing = [](const std::string&, unsigned short, const protocol::Offer&,
                           std::chrono::milliseconds) -> ControlConnection {
            throw HandshakeError(HandshakeError::Reason::Rejected, "Offer rejected: busy");
        };
        CHECK_THROWS_AS(sender.send("127.0.0.1", 1, refusing,
                                    [&](uint64_t, std::size_t) { progressed = true; }),
                        HandshakeError);
        CHECK_FALSE(progressed);
    }
}

TEST_CASE("Transfer - sender cancels mid-stream", "[transfer]") {
    ScratchDir src("cancel_src");
    ScratchDir dst("cancel_dst");
    write_file(src / "big.bin", make_content(64 * 4096));

    ReceiveLog log;
    ControlServer server(loopback_server(), accept_into(dst.path(), log));
    server.start();

    transfer::Sender sender(src / "big.bin", 4096);
    CHECK_THROWS_AS(sender.send("127.0.0.1", server.port(), send_control_offer,
                                [&](uint64_t index, std::size_t) {
                                    if (index == 2) sender.cancel();
                                }),
                    transfer::TransferError);

    REQUIRE(wait_until([&]() { return log.complete_count() == 1; }));
    const transfer::CompleteMeta meta = log.completes().front();
    CHECK_FALSE(meta.ok);
    CHECK_THAT(meta.error, ContainsSubstring("cancelled by sender"));
    CHECK(meta.bytes_transferred == 3 * 4096);
    CHECK_FALSE(std::filesystem::exists(dst / "big.bin"));
    CHECK_FALSE(std::filesystem::exists(dst / "big.bin.part"));
}

TEST_CASE("Transfer - receiver cancels mid-stream", "[transfer]") {
    ScratchDir src("rcancel_src");
    ScratchDir dst("rcancel_dst");
    write_file(src / "big.bin", make_content(64 * 4096));

    ReceiveLog log;
    auto accept = accept_into(dst.path(), log);
    ControlServer server(loopback_server(), [&](const protocol::Offer& offer) {
        auto receiver = accept(offer);
        transfer::Receiver* target = receiver.get();
        receiver->set_progress_callback([target](uint64_t index, std::size_t) {
            if (index == 2) target->cancel();
        });
        return receiver;
    });
    server.start();

    transfer::Sender sender(src / "big.bin", 4096);
    CHECK_THROWS_AS(sender.send("127.0.0.1", server.port()), transfer::TransferError);

    REQUIRE(wait_until([&]() { return log.complete_count() == 1; }));
    const transfer::CompleteMeta meta = log.completes().front();
    CHECK_FALSE(meta.ok);
    CHECK_THAT(meta.error, ContainsSubstring("cancelled"));
    CHECK_FALSE(std::filesystem::exists(dst / "big.bin"));
    CHECK_FALSE(std::filesystem::exists(dst / "big.bin.part"));
}

TEST_CASE("Transfer - on_start fires before anything is written", "[transfer]") {
    ScratchDir src("start_src");
    ScratchDir dst("start_dst");
    write_file(src / "doc.pdf", make_content(10000));

    std::atomic<bool> staged_before_start{true};
    std::atomic<int> start_calls{0};
    ControlServer server(loopback_server(), [&](const protocol::Offer& offer) {
        return std::make_unique<transfer::Receiver>(offer.filename, offer.chunk_size, offer.total_chunks,
            dst.path(),
            [&](const transfer::StartMeta& meta) {
                ++start_calls;
                staged_before_start = std::filesystem::exists(meta.save_path.string() + transfer::PART_SUFFIX) ||
                                      std::filesystem::exists(meta.save_path);
            });
    });
    server.start();

    transfer::Sender sender(src / "doc.pdf", 4096);
    sender.send("127.0.0.1", server.port());
    CHECK(start_calls == 1);
    CHECK_FALSE(staged_before_start);
}

TEST_CASE("Transfer - misbehaving sender", "[transfer]") {
    ScratchDir dst("bad_dst");
    ReceiveLog log;
    ControlServer server(loopback_server(), accept_into(dst.path(), log));
    server.start();

    const protocol::Offer offer = protocol::make_offer("three.bin", 12, 4);
    const std::string chunk(4, 'x');
    RawClient client(server.port());
    const uint32_t session_id = client.offer(offer);

    SECTION("Connection drops after the first chunk") {
        client.send_raw(protocol::CommandType::CHUNK, chunk, session_id, 0);
        client.close();
    }

    SECTION("Chunk out of order") {
        client.send_raw(protocol::CommandType::CHUNK, chunk, session_id, 1);
        protocol::PacketHeader reply = client.read_header();
        CHECK(protocol::is_command(reply, protocol::CommandType::CANCEL));
        CHECK(reply.session_id == session_id);
    }

    SECTION("Chunk for another session") {
        client.send_raw(protocol::CommandType::CHUNK, chunk, session_id + 1, 0);
        CHECK(protocol::is_command(client.read_header(), protocol::CommandType::CANCEL));
    }

    SECTION("Chunk of the wrong length") {
        client.send_raw(protocol::CommandType::CHUNK, "xyz", session_id, 0);
        CHECK(protocol::is_command(client.read_header(), protocol::CommandType::CANCEL));
    }

    SECTION("Explicit cancel") {
        client.send_raw(protocol::CommandType::CHUNK, chunk, session_id, 0);
        client.send_header(protocol::make_header(protocol::CommandType::CANCEL, 0, session_id));
    }

    REQUIRE(wait_until([&]() { return log.complete_count() == 1; }));
    const transfer::CompleteMeta meta = log.completes().front();
    CHECK_FALSE(meta.ok);
    CHECK_FALSE(meta.error.empty());
    CHECK(meta.session_id == session_id);
    CHECK_FALSE(std::filesystem::exists(dst / "three.bin"));
    CHECK_FALSE(std::filesystem::exists(dst / "three.bin.part"));
}

TEST_CASE("Transfer - staging file cannot be created", "[transfer]") {
    ScratchDir src("disk_src");
    ScratchDir dst("disk_dst");
    write_file(src / "report.bin", make_content(20000));
    // A regular file where the destination directory should be
    write_file(dst / "blocked", "not a directory");

    ReceiveLog log;
    ControlServer server(loopback_server(), accept_into(dst / "blocked", log));
    server.start();

    transfer::Sender sender(src / "report.bin", 4096);
    CHECK_THROWS_AS(sender.send("127.0.0.1", server.port()), transfer::TransferError);

    REQUIRE(wait_until([&]() { return log.complete_count() == 1; }));
    std::this_thread::sleep_for(100ms);
    auto completes = log.completes();
    REQUIRE(completes.size() == 1);
    CHECK_FALSE(completes.front().ok);
    CHECK_FALSE(completes.front().error.empty());
    CHECK(completes.front().bytes_transferred == 0);
    CHECK(log.progress().empty());
    CHECK(read_file(dst / "blocked") == "not a directory");
    CHECK_FALSE(std::filesystem::exists(dst / "report.bin.part"));
}

TEST_CASE("Transfer - source shrinks after the offer is built", "[transfer]") {
    ScratchDir src("shrink_src");
    ScratchDir dst("shrink_dst");
    write_file(src / "log.txt", make_content(10 * 4096));

    ReceiveLog log;
    ControlServer server(loopback_server(), accept_into(dst.path(), log));
    server.start();

    transfer::Sender sender(src / "log.txt", 4096);
    REQUIRE(sender.total_chunks() == 10);
    std::filesystem::resize_file(src / "log.txt", 2 * 4096 + 100);

    try {
        sender.send("127.0.0.1", server.port());
        FAIL("send should have failed");
    } catch (const transfer::TransferError& e) {
        CHECK_THAT(e.what(), ContainsSubstring("unreadable at chunk 2"));
    }

    // The receiver is told through CANCEL and cleans up
    REQUIRE(wait_until([&]() { return log.complete_count() == 1; }));
    const transfer::CompleteMeta meta = log.completes().front();
    CHECK_FALSE(meta.ok);
    CHECK_THAT(meta.error, ContainsSubstring("cancelled by sender"));
    CHECK(meta.bytes_transferred == 2 * 4096);
    CHECK_FALSE(std::filesystem::exists(dst / "log.txt"));
    CHECK_FALSE(std::filesystem::exists(dst / "log.txt.part"));
}
