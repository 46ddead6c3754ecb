#include <gtest/gtest.h>

#include "engine.hpp"
#include "errors.hpp"
#include "security.hpp"
#include "test_util.hpp"

#include <boost/asio.hpp>

#include <condition_variable>
#include <mutex>
#include <thread>

using namespace std::chrono_literals;

namespace {

config::Options fast_options()
{
    config::Options o;
    o.port = 0;
    o.poll_interval = 20ms;
    o.retry_backoff = 50ms;
    o.peer_wait_timeout = 10s;
    o.connect_timeout = 2s;
    o.accept_timeout = 5s;
    o.metadata_timeout = 5s;
    o.read_timeout = 5s;
    o.write_timeout = 5s;
    o.sweep_interval = 0s;
    return o;
}

// Thread-safe sink that keeps every event and exposes the issued code
class Recorder {
public:
    events::EventCallback callback() {
        return [this](const events::TransferEvent& event) {
            std::lock_guard<std::mutex> lock(mutex_);
            events_.push_back(event);
            if (event.kind == events::EventKind::CodeIssued) code_ = event.code;
            cv_.notify_all();
        };
    }

    std::string wait_code(std::chrono::milliseconds timeout = 10s) {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait_for(lock, timeout, [this] { return !code_.empty(); });
        return code_;
    }

    std::vector<int> progress() const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<int> out;
        for (const auto& e : events_) {
            if (e.kind == events::EventKind::Progress) out.push_back(e.percent);
        }
        return out;
    }

    size_t count_messages_containing(const std::string& needle) const {
        std::lock_guard<std::mutex> lock(mutex_);
        size_t n = 0;
        for (const auto& e : events_) {
            if (e.message.find(needle) != std::string::npos) ++n;
        }
        return n;
    }

    std::optional<events::TransferEvent> last_error() const {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto it = events_.rbegin(); it != events_.rend(); ++it) {
            if (it->kind == events::EventKind::Error) return *it;
        }
        return std::nullopt;
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::vector<events::TransferEvent> events_;
    std::string code_;
};

// Manually advanced clock for registry expiry
class FakeClock {
public:
    session::SessionRegistry::Clock fn() {
        return [this] { return now_.load(); };
    }
    void advance(std::chrono::seconds s) { now_ = now_.load() + s; }

private:
    std::atomic<std::chrono::steady_clock::time_point> now_{std::chrono::steady_clock::now()};
};

bool wait_for_idle(transfer::Engine& engine, std::chrono::milliseconds timeout)
{
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (engine.active_workers() == 0) return true;
        std::this_thread::sleep_for(10ms);
    }
    return engine.active_workers() == 0;
}

void expect_strictly_increasing_to_100(const std::vector<int>& progress)
{
    ASSERT_FALSE(progress.empty());
    for (size_t i = 1; i < progress.size(); ++i) {
        EXPECT_LT(progress[i - 1], progress[i]) << "at index " << i;
    }
    EXPECT_EQ(progress.back(), 100);
}

void expect_no_temporaries(const std::filesystem::path& dir)
{
    EXPECT_EQ(test_util::count_with_suffix(dir, config::PART_SUFFIX), 0u);
    EXPECT_EQ(test_util::count_with_suffix(dir, config::DECOMPRESS_SUFFIX), 0u);
    EXPECT_EQ(test_util::count_with_suffix(dir, config::COMPRESSED_SUFFIX), 0u);
}

} // namespace

TEST(EngineTest, TransfersFileEndToEnd)
{
    test_util::TempDir src_dir("fluxcode_src");
    test_util::TempDir out_dir("fluxcode_out");
    const auto src = src_dir / "payload.bin";
    test_util::write_random_file(src, 5ULL * 1024 * 1024);

    Recorder sender;
    Recorder receiver;
    transfer::Engine engine(fast_options());

    const std::string send_id = engine.send(src.string(), "p@ss", sender.callback());
    const std::string code = sender.wait_code();
    ASSERT_TRUE(security::is_valid_code(code));

    auto handle = engine.receive(out_dir.path().string(), "p@ss", code, receiver.callback());

    auto received = engine.wait(handle.transfer_id(), 30s);
    auto sent = engine.wait(send_id, 30s);
    ASSERT_TRUE(received.has_value());
    ASSERT_TRUE(sent.has_value());
    EXPECT_EQ(received->status, session::TransferStatus::Completed) << received->error_message;
    EXPECT_EQ(sent->status, session::TransferStatus::Completed) << sent->error_message;

    const auto dest = out_dir / "payload.bin";
    EXPECT_EQ(received->file_path, dest.string());
    EXPECT_EQ(received->file_name, "payload.bin");
    EXPECT_EQ(received->original_size, 5ULL * 1024 * 1024);
    EXPECT_EQ(received->transfer_code, code);
    EXPECT_EQ(sent->transfer_code, code);
    EXPECT_EQ(sent->progress, 100);
    EXPECT_EQ(test_util::read_file(dest), test_util::read_file(src));

    expect_strictly_increasing_to_100(sender.progress());
    expect_strictly_increasing_to_100(receiver.progress());
    expect_no_temporaries(out_dir.path());

    EXPECT_FALSE(engine.registry().lookup(code).has_value());
    EXPECT_TRUE(wait_for_idle(engine, 2s));
    EXPECT_EQ(engine.transfers().size(), 2u);
}

TEST(EngineTest, LargeFileIsCompressedInTransit)
{
    test_util::TempDir src_dir("fluxcode_src");
    test_util::TempDir out_dir("fluxcode_out");
    const auto src = src_dir / "log.txt";
    test_util::write_text_file(src, config::COMPRESSION_THRESHOLD + 1);

    Recorder sender;
    Recorder receiver;
    transfer::Engine engine(fast_options());

    const std::string send_id = engine.send(src.string(), "p@ss", sender.callback());
    auto handle = engine.receive(out_dir.path().string(), "p@ss", sender.wait_code(), receiver.callback());

    auto received = engine.wait(handle.transfer_id(), 60s);
    auto sent = engine.wait(send_id, 60s);
    ASSERT_TRUE(received.has_value());
    ASSERT_EQ(received->status, session::TransferStatus::Completed) << received->error_message;
    EXPECT_EQ(sent->status, session::TransferStatus::Completed);

    EXPECT_LT(received->compressed_size, received->original_size);
    EXPECT_EQ(receiver.count_messages_containing("Decompressing file..."), 1u);
    EXPECT_EQ(test_util::read_file(out_dir / "log.txt"), test_util::read_file(src));
    expect_no_temporaries(out_dir.path());
    expect_no_temporaries(src_dir.path());
}

TEST(EngineTest, WrongPasswordFailsWithCryptoError)
{
    test_util::TempDir src_dir("fluxcode_src");
    test_util::TempDir out_dir("fluxcode_out");
    const auto src = src_dir / "secret.bin";
    test_util::write_random_file(src, 256 * 1024);

    Recorder sender;
    Recorder receiver;
    transfer::Engine engine(fast_options());

    const std::string send_id = engine.send(src.string(), "p@ss", sender.callback());
    auto handle = engine.receive(out_dir.path().string(), "guess", sender.wait_code(), receiver.callback());

    auto received = engine.wait(handle.transfer_id(), 30s);
    ASSERT_TRUE(received.has_value());
    EXPECT_EQ(received->status, session::TransferStatus::Failed);
    EXPECT_EQ(received->error_kind, errors::ErrorKind::Crypto);

    auto error = receiver.last_error();
    ASSERT_TRUE(error.has_value());
    EXPECT_EQ(error->error, errors::ErrorKind::Crypto);

    EXPECT_FALSE(std::filesystem::exists(out_dir / "secret.bin"));
    expect_no_temporaries(out_dir.path());

    auto sent = engine.wait(send_id, 30s);
    ASSERT_TRUE(sent.has_value());
    EXPECT_TRUE(session::is_terminal(sent->status));
    EXPECT_TRUE(wait_for_idle(engine, 2s));
}

TEST(EngineTest, SenderCancelWhileWaitingForPeer)
{
    test_util::TempDir src_dir("fluxcode_src");
    const auto src = src_dir / "big.txt";
    test_util::write_text_file(src, config::COMPRESSION_THRESHOLD + 1);

    config::Options options = fast_options();
    options.poll_interval = 200ms;
    Recorder sender;
    transfer::Engine engine(options);

    const std::string send_id = engine.send(src.string(), "p@ss", sender.callback());
    const std::string code = sender.wait_code();
    ASSERT_FALSE(code.empty());
    EXPECT_EQ(test_util::count_with_suffix(src_dir.path(), config::COMPRESSED_SUFFIX), 1u);

    const auto start = std::chrono::steady_clock::now();
    ASSERT_TRUE(engine.cancel(send_id));
    auto sent = engine.wait(send_id, 5s);
    const auto elapsed = std::chrono::steady_clock::now() - start;

    ASSERT_TRUE(sent.has_value());
    EXPECT_EQ(sent->status, session::TransferStatus::Cancelled);
    EXPECT_EQ(sent->error_kind, errors::ErrorKind::Cancelled);
    EXPECT_LT(elapsed, options.poll_interval + 300ms);

    EXPECT_FALSE(engine.registry().lookup(code).has_value());
    expect_no_temporaries(src_dir.path());
    EXPECT_TRUE(wait_for_idle(engine, 2s));
    EXPECT_FALSE(engine.cancel(send_id));
}

TEST(EngineTest, SenderCancelMidStream)
{
    test_util::TempDir src_dir("fluxcode_src");
    test_util::TempDir out_dir("fluxcode_out");
    const auto src = src_dir / "movie.bin";
    test_util::write_random_file(src, 5ULL * 1024 * 1024);

    Recorder sender;
    Recorder receiver;
    transfer::Engine engine(fast_options());

    // Cancel from the event path once a few percent are on the wire
    engine.events().subscribe([&engine](const events::TransferEvent& event) {
        if (event.kind != events::EventKind::Progress || event.percent < 5) return;
        auto record = engine.status(event.transfer_id);
        if (record && record->role == session::TransferRole::Send) {
            engine.cancel(event.transfer_id);
        }
    });

    const std::string send_id = engine.send(src.string(), "p@ss", sender.callback());
    auto handle = engine.receive(out_dir.path().string(), "p@ss", sender.wait_code(), receiver.callback());

    auto sent = engine.wait(send_id, 30s);
    auto received = engine.wait(handle.transfer_id(), 30s);
    ASSERT_TRUE(sent.has_value());
    ASSERT_TRUE(received.has_value());
    EXPECT_EQ(sent->status, session::TransferStatus::Cancelled);
    EXPECT_NE(received->status, session::TransferStatus::Completed);
    EXPECT_TRUE(session::is_terminal(received->status));

    EXPECT_FALSE(std::filesystem::exists(out_dir / "movie.bin"));
    expect_no_temporaries(out_dir.path());
    EXPECT_TRUE(wait_for_idle(engine, 2s));
}

TEST(EngineTest, ReceiverCloseStopsListening)
{
    test_util::TempDir out_dir("fluxcode_out");
    Recorder receiver;
    transfer::Engine engine(fast_options());
    ASSERT_TRUE(engine.registry().register_session("314159", "peer"));

    auto handle = engine.receive(out_dir.path().string(), "p@ss", "314159", receiver.callback());

    // Wait until the listener has claimed the code
    for (int i = 0; i < 200; ++i) {
        auto s = engine.registry().lookup("314159");
        if (s && s->listen_port) break;
        std::this_thread::sleep_for(10ms);
    }
    handle.close();

    auto received = engine.wait(handle.transfer_id(), 5s);
    ASSERT_TRUE(received.has_value());
    EXPECT_EQ(received->status, session::TransferStatus::Cancelled);
    EXPECT_FALSE(engine.registry().lookup("314159").has_value());
    EXPECT_TRUE(wait_for_idle(engine, 2s));
}

TEST(EngineTest, ExpiredCodeIsRejected)
{
    test_util::TempDir out_dir("fluxcode_out");
    FakeClock clock;
    auto registry = std::make_shared<session::SessionRegistry>(std::chrono::seconds(600), clock.fn());
    Recorder receiver;
    transfer::Engine engine(fast_options(), registry);

    ASSERT_TRUE(registry->register_session("271828", "peer"));
    clock.advance(std::chrono::seconds(601));

    auto handle = engine.receive(out_dir.path().string(), "p@ss", "271828", receiver.callback());
    auto received = engine.wait(handle.transfer_id(), 5s);
    ASSERT_TRUE(received.has_value());
    EXPECT_EQ(received->status, session::TransferStatus::Failed);
    EXPECT_EQ(received->error_kind, errors::ErrorKind::Rendezvous);
}

TEST(EngineTest, SenderGivesUpWhenItsCodeExpires)
{
    test_util::TempDir src_dir("fluxcode_src");
    const auto src = src_dir / "note.txt";
    test_util::write_file(src, "hello");

    FakeClock clock;
    auto registry = std::make_shared<session::SessionRegistry>(std::chrono::seconds(600), clock.fn());
    Recorder sender;
    transfer::Engine engine(fast_options(), registry);

    const std::string send_id = engine.send(src.string(), "p@ss", sender.callback());
    const std::string code = sender.wait_code();
    ASSERT_FALSE(code.empty());
    clock.advance(std::chrono::seconds(601));

    auto sent = engine.wait(send_id, 5s);
    ASSERT_TRUE(sent.has_value());
    EXPECT_EQ(sent->status, session::TransferStatus::Failed);
    EXPECT_EQ(sent->error_kind, errors::ErrorKind::Rendezvous);
}

TEST(EngineTest, PortInUseExhaustsBindAttempts)
{
    test_util::TempDir out_dir("fluxcode_out");
    boost::asio::io_context io;
    boost::asio::ip::tcp::acceptor blocker(io, boost::asio::ip::tcp::endpoint(boost::asio::ip::tcp::v4(), 0));

    config::Options options = fast_options();
    options.port = blocker.local_endpoint().port();
    Recorder receiver;
    transfer::Engine engine(options);
    ASSERT_TRUE(engine.registry().register_session("161803", "peer"));

    auto handle = engine.receive(out_dir.path().string(), "p@ss", "161803", receiver.callback());
    auto received = engine.wait(handle.transfer_id(), 10s);

    ASSERT_TRUE(received.has_value());
    EXPECT_EQ(received->status, session::TransferStatus::Failed);
    EXPECT_EQ(received->error_kind, errors::ErrorKind::Network);
    EXPECT_NE(received->error_message.find("after 3 attempts"), std::string::npos) << received->error_message;
    EXPECT_EQ(receiver.count_messages_containing("Bind attempt"), 2u);

    EXPECT_FALSE(engine.registry().lookup("161803").has_value());
    EXPECT_TRUE(wait_for_idle(engine, 2s));
}

TEST(EngineTest, SecondReceiverCannotStealClaimedCode)
{
    test_util::TempDir src_dir("fluxcode_src");
    test_util::TempDir first_dir("fluxcode_out");
    test_util::TempDir second_dir("fluxcode_out");
    const auto src = src_dir / "shared.bin";
    test_util::write_random_file(src, 64 * 1024);

    // A long poll keeps the sender from connecting until both receivers have run
    config::Options options = fast_options();
    options.poll_interval = 3s;
    options.accept_timeout = 20s;

    Recorder sender;
    Recorder first;
    Recorder second;
    transfer::Engine engine(options);

    const std::string send_id = engine.send(src.string(), "p@ss", sender.callback());
    const std::string code = sender.wait_code();
    ASSERT_TRUE(security::is_valid_code(code));

    auto first_handle = engine.receive(first_dir.path().string(), "p@ss", code, first.callback());

    std::optional<session::TransferSession> claimed;
    const auto deadline = std::chrono::steady_clock::now() + 5s;
    while (std::chrono::steady_clock::now() < deadline) {
        claimed = engine.registry().lookup(code);
        if (claimed && claimed->status == session::SessionStatus::Connected) break;
        std::this_thread::sleep_for(10ms);
    }
    ASSERT_TRUE(claimed.has_value());
    ASSERT_EQ(claimed->status, session::SessionStatus::Connected);

    auto second_handle = engine.receive(second_dir.path().string(), "p@ss", code, second.callback());
    auto rejected = engine.wait(second_handle.transfer_id(), 10s);
    ASSERT_TRUE(rejected.has_value());
    EXPECT_EQ(rejected->status, session::TransferStatus::Failed);
    EXPECT_EQ(rejected->error_kind, errors::ErrorKind::Rendezvous);

    // The losing receiver leaves the winner's session intact
    auto still_live = engine.registry().lookup(code);
    ASSERT_TRUE(still_live.has_value());
    EXPECT_EQ(still_live->status, session::SessionStatus::Connected);
    EXPECT_EQ(still_live->listen_port, claimed->listen_port);

    auto received = engine.wait(first_handle.transfer_id(), 30s);
    auto sent = engine.wait(send_id, 30s);
    ASSERT_TRUE(received.has_value());
    ASSERT_TRUE(sent.has_value());
    EXPECT_EQ(received->status, session::TransferStatus::Completed) << received->error_message;
    EXPECT_EQ(sent->status, session::TransferStatus::Completed) << sent->error_message;
    EXPECT_EQ(test_util::read_file(first_dir / "shared.bin"), test_util::read_file(src));
    EXPECT_FALSE(std::filesystem::exists(second_dir / "shared.bin"));

    EXPECT_FALSE(engine.registry().lookup(code).has_value());
    EXPECT_TRUE(wait_for_idle(engine, 2s));
}

TEST(EngineTest, InvalidInputsFailFast)
{
    test_util::TempDir dir("fluxcode_out");
    transfer::Engine engine(fast_options());

    const std::string send_id = engine.send((dir / "missing.bin").string(), "p@ss");
    auto handle = engine.receive(dir.path().string(), "p@ss", "12ab");

    auto sent = engine.wait(send_id, 5s);
    auto received = engine.wait(handle.transfer_id(), 5s);
    ASSERT_TRUE(sent.has_value());
    ASSERT_TRUE(received.has_value());
    EXPECT_EQ(sent->error_kind, errors::ErrorKind::Input);
    EXPECT_EQ(received->error_kind, errors::ErrorKind::Input);
    EXPECT_EQ(engine.registry().size(), 0u);

    EXPECT_FALSE(engine.cancel("no-such-transfer"));
    EXPECT_FALSE(engine.status("no-such-transfer").has_value());
}

TEST(EngineTest, NarrowCallbackAdapter)
{
    test_util::TempDir dir("fluxcode_out");
    transfer::Engine engine(fast_options());

    std::mutex mutex;
    std::vector<std::string> messages;
    const std::string id = engine.send((dir / "missing.bin").string(), "p@ss",
        events::adapt([&](const std::string& transfer_id, int, const std::string& message) {
            std::lock_guard<std::mutex> lock(mutex);
            messages.push_back(transfer_id + " " + message);
        }));

    ASSERT_TRUE(engine.wait(id, 5s).has_value());
    std::lock_guard<std::mutex> lock(mutex);
    ASSERT_FALSE(messages.empty());
    EXPECT_EQ(messages.back().rfind(id, 0), 0u);
}

TEST(EngineTest, PeriodicSweepDropsExpiredCodes)
{
    FakeClock clock;
    auto registry = std::make_shared<session::SessionRegistry>(std::chrono::seconds(600), clock.fn());
    config::Options options = fast_options();
    options.sweep_interval = 1s;
    transfer::Engine engine(options, registry);

    registry->register_session("111111", "a");
    clock.advance(std::chrono::seconds(601));

    const auto deadline = std::chrono::steady_clock::now() + 5s;
    while (registry->size() != 0 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(50ms);
    }
    EXPECT_EQ(registry->size(), 0u);
}

TEST(EngineTest, InvalidOptionsAreRejected)
{
    config::Options options = fast_options();
    options.bind_attempts = 0;
    EXPECT_THROW(transfer::Engine engine(options), errors::InputError);
}
