#include "engine/command_engine.hpp"

#include "common/clock.hpp"
#include "network/resp_protocol.hpp"

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <gtest/gtest.h>

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace ember::engine {

namespace asio = boost::asio;
using namespace std::chrono_literals;

class CommandEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        storage_.set_listener(&coordinator_);
    }

    void TearDown() override {
        storage_.set_listener(nullptr);
    }

    // Run a non-blocking command and return its RESP encoding.
    std::string run(const Request& request) {
        return network::serialize_reply(engine_.execute_now(request));
    }

    // Start `request` as client `id` through the blocking path.  The reply's
    // encoding lands in `out` once ioc_ runs.
    void spawn(blocking::ClientId id, Request request, std::optional<std::string>& out) {
        asio::co_spawn(
            ioc_,
            [this, id, request = std::move(request), &out]() -> asio::awaitable<void> {
                ClientContext client;
                client.id = id;
                client.executor = ioc_.get_executor();
                client.on_block = [this] { ++blocked_; };
                auto parsed = parse_command(request);
                const Command& command = std::get<Command>(parsed);
                Reply reply = co_await engine_.execute(command, client);
                out = network::serialize_reply(reply);
            },
            asio::detached);
    }

    asio::io_context ioc_;
    MockClock clock_;
    Storage storage_{clock_};
    blocking::BlockingCoordinator coordinator_;
    ServerStats stats_;
    CommandEngine engine_{storage_, coordinator_, stats_};
    int blocked_ = 0;
};

// ── Connection / strings ──────────────────────────────────────────────────────

TEST_F(CommandEngineTest, PingAndEcho) {
    EXPECT_EQ(run({"PING"}), "+PONG\r\n");
    EXPECT_EQ(run({"ping", "hi"}), "$2\r\nhi\r\n");
    EXPECT_EQ(run({"ECHO", "hello"}), "$5\r\nhello\r\n");
}

TEST_F(CommandEngineTest, CommandNamesAreCaseInsensitive) {
    EXPECT_EQ(run({"sEt", "k", "v"}), "+OK\r\n");
    EXPECT_EQ(run({"get", "k"}), "$1\r\nv\r\n");
}

TEST_F(CommandEngineTest, UnknownCommand) {
    EXPECT_EQ(run({"FOO", "a", "b"}),
              "-ERR unknown command 'FOO', with args beginning with: 'a' 'b' \r\n");
    EXPECT_EQ(run({"FOO"}), "-ERR unknown command 'FOO', with args beginning with: \r\n");
}

TEST_F(CommandEngineTest, UnknownCommandArgumentsCannotSplitTheReply) {
    const std::string wire = run({"foo", "a\r\n:1"});
    EXPECT_EQ(wire, "-ERR unknown command 'foo', with args beginning with: 'a  :1' \r\n");
    EXPECT_EQ(wire.find("\r\n"), wire.size() - 2);
}

TEST_F(CommandEngineTest, WrongArity) {
    EXPECT_EQ(run({"GET"}), "-ERR wrong number of arguments for 'get' command\r\n");
    EXPECT_EQ(run({"GET", "a", "b"}), "-ERR wrong number of arguments for 'get' command\r\n");
    EXPECT_EQ(run({"PING", "a", "b"}), "-ERR wrong number of arguments for 'ping' command\r\n");
    EXPECT_EQ(run({"XADD", "s", "*", "f"}),
              "-ERR wrong number of arguments for 'xadd' command\r\n");
}

TEST_F(CommandEngineTest, SetAndGet) {
    EXPECT_EQ(run({"GET", "k"}), "$-1\r\n");
    EXPECT_EQ(run({"SET", "k", "v"}), "+OK\r\n");
    EXPECT_EQ(run({"GET", "k"}), "$1\r\nv\r\n");
}

TEST_F(CommandEngineTest, SetPxExpiresAfterDeadline) {
    EXPECT_EQ(run({"SET", "k", "v", "PX", "100"}), "+OK\r\n");
    clock_.advance(99ms);
    EXPECT_EQ(run({"GET", "k"}), "$1\r\nv\r\n");
    clock_.advance(1ms);
    EXPECT_EQ(run({"GET", "k"}), "$-1\r\n");
}

TEST_F(CommandEngineTest, SetExUsesSeconds) {
    EXPECT_EQ(run({"SET", "k", "v", "ex", "2"}), "+OK\r\n");
    clock_.advance(1999ms);
    EXPECT_EQ(run({"GET", "k"}), "$1\r\nv\r\n");
    clock_.advance(1ms);
    EXPECT_EQ(run({"GET", "k"}), "$-1\r\n");
}

TEST_F(CommandEngineTest, SetOptionErrors) {
    EXPECT_EQ(run({"SET", "k", "v", "PX", "0"}),
              "-ERR invalid expire time in 'set' command\r\n");
    EXPECT_EQ(run({"SET", "k", "v", "EX", "-5"}),
              "-ERR invalid expire time in 'set' command\r\n");
    EXPECT_EQ(run({"SET", "k", "v", "PX", "soon"}),
              "-ERR value is not an integer or out of range\r\n");
    EXPECT_EQ(run({"SET", "k", "v", "NX"}), "-ERR syntax error\r\n");
    EXPECT_EQ(run({"SET", "k", "v", "PX"}), "-ERR syntax error\r\n");
    EXPECT_EQ(run({"SET", "k", "v", "PX", "1", "EX", "1"}), "-ERR syntax error\r\n");
    EXPECT_EQ(run({"GET", "k"}), "$-1\r\n");
}

TEST_F(CommandEngineTest, SetRejectsUnrepresentableExpire) {
    EXPECT_EQ(run({"SET", "k", "v", "PX", "9223372036854775807"}),
              "-ERR invalid expire time in 'set' command\r\n");
    EXPECT_EQ(run({"SET", "k", "v", "EX", "9223372036854775"}),
              "-ERR invalid expire time in 'set' command\r\n");
    EXPECT_EQ(run({"GET", "k"}), "$-1\r\n");

    // Thirty years still fits.
    EXPECT_EQ(run({"SET", "k", "v", "EX", "946080000"}), "+OK\r\n");
    clock_.advance(24h);
    EXPECT_EQ(run({"GET", "k"}), "$1\r\nv\r\n");
}

TEST_F(CommandEngineTest, Incr) {
    EXPECT_EQ(run({"INCR", "n"}), ":1\r\n");
    EXPECT_EQ(run({"INCR", "n"}), ":2\r\n");
    run({"SET", "s", "abc"});
    EXPECT_EQ(run({"INCR", "s"}), "-ERR value is not an integer or out of range\r\n");
}

TEST_F(CommandEngineTest, WrongTypeIsReported) {
    run({"RPUSH", "l", "a"});
    EXPECT_EQ(run({"GET", "l"}),
              "-WRONGTYPE Operation against a key holding the wrong kind of value\r\n");
    EXPECT_EQ(run({"INCR", "l"}),
              "-WRONGTYPE Operation against a key holding the wrong kind of value\r\n");
    EXPECT_EQ(run({"XADD", "l", "*", "f", "v"}),
              "-WRONGTYPE Operation against a key holding the wrong kind of value\r\n");
}

TEST_F(CommandEngineTest, Type) {
    run({"SET", "s", "v"});
    run({"RPUSH", "l", "a"});
    run({"XADD", "x", "1-1", "f", "v"});
    EXPECT_EQ(run({"TYPE", "s"}), "+string\r\n");
    EXPECT_EQ(run({"TYPE", "l"}), "+list\r\n");
    EXPECT_EQ(run({"TYPE", "x"}), "+stream\r\n");
    EXPECT_EQ(run({"TYPE", "none"}), "+none\r\n");
}

// ── Lists ─────────────────────────────────────────────────────────────────────

TEST_F(CommandEngineTest, PushRangeAndLen) {
    EXPECT_EQ(run({"RPUSH", "l", "a", "b"}), ":2\r\n");
    EXPECT_EQ(run({"LPUSH", "l", "z"}), ":3\r\n");
    EXPECT_EQ(run({"LRANGE", "l", "0", "-1"}),
              "*3\r\n$1\r\nz\r\n$1\r\na\r\n$1\r\nb\r\n");
    EXPECT_EQ(run({"LRANGE", "l", "5", "10"}), "*0\r\n");
    EXPECT_EQ(run({"LRANGE", "l", "a", "1"}),
              "-ERR value is not an integer or out of range\r\n");
    EXPECT_EQ(run({"LLEN", "l"}), ":3\r\n");
    EXPECT_EQ(run({"LLEN", "missing"}), ":0\r\n");
}

TEST_F(CommandEngineTest, LpopWithoutCount) {
    run({"RPUSH", "l", "a"});
    EXPECT_EQ(run({"LPOP", "l"}), "$1\r\na\r\n");
    EXPECT_EQ(run({"LPOP", "l"}), "$-1\r\n");
}

TEST_F(CommandEngineTest, LpopWithCount) {
    run({"RPUSH", "l", "a", "b", "c"});
    EXPECT_EQ(run({"LPOP", "l", "2"}), "*2\r\n$1\r\na\r\n$1\r\nb\r\n");
    EXPECT_EQ(run({"LPOP", "l", "0"}), "*0\r\n");
    EXPECT_EQ(run({"LPOP", "l", "10"}), "*1\r\n$1\r\nc\r\n");
    EXPECT_EQ(run({"LPOP", "l", "1"}), "*-1\r\n");
    EXPECT_EQ(run({"LPOP", "l", "-1"}), "-ERR value is out of range, must be positive\r\n");
    EXPECT_EQ(run({"LPOP", "l", "1", "2"}),
              "-ERR wrong number of arguments for 'lpop' command\r\n");
}

TEST_F(CommandEngineTest, BlpopOutsideBlockingPathNeverWaits) {
    EXPECT_EQ(run({"BLPOP", "l", "0"}), "*-1\r\n");
    run({"RPUSH", "l", "a"});
    EXPECT_EQ(run({"BLPOP", "x", "l", "0"}), "*2\r\n$1\r\nl\r\n$1\r\na\r\n");
}

TEST_F(CommandEngineTest, BlpopTimeoutValidation) {
    EXPECT_EQ(run({"BLPOP", "l", "-1"}), "-ERR timeout is negative\r\n");
    EXPECT_EQ(run({"BLPOP", "l", "soon"}), "-ERR timeout is not a float or out of range\r\n");
}

// ── Streams ───────────────────────────────────────────────────────────────────

TEST_F(CommandEngineTest, XaddAndXrange) {
    EXPECT_EQ(run({"XADD", "s", "1-1", "temp", "36"}), "$3\r\n1-1\r\n");
    EXPECT_EQ(run({"XADD", "s", "1-*", "temp", "37"}), "$3\r\n1-2\r\n");
    EXPECT_EQ(run({"XADD", "s", "2-0", "a", "1", "b", "2"}), "$3\r\n2-0\r\n");

    EXPECT_EQ(run({"XRANGE", "s", "-", "+", "COUNT", "1"}),
              "*1\r\n*2\r\n$3\r\n1-1\r\n*2\r\n$4\r\ntemp\r\n$2\r\n36\r\n");
    EXPECT_EQ(run({"XRANGE", "s", "2", "+"}),
              "*1\r\n*2\r\n$3\r\n2-0\r\n*4\r\n$1\r\na\r\n$1\r\n1\r\n$1\r\nb\r\n$1\r\n2\r\n");
    // A bare end millisecond covers every sequence number in it.
    EXPECT_EQ(run({"XRANGE", "s", "1", "1", "COUNT", "5"}).substr(0, 4), "*2\r\n");
    EXPECT_EQ(run({"XRANGE", "s", "-", "+", "COUNT", "0"}), "*0\r\n");
    EXPECT_EQ(run({"XRANGE", "missing", "-", "+"}), "*0\r\n");
}

TEST_F(CommandEngineTest, XaddErrors) {
    EXPECT_EQ(run({"XADD", "s", "0-0", "f", "v"}),
              "-ERR The ID specified in XADD must be greater than 0-0\r\n");
    run({"XADD", "s", "5-5", "f", "v"});
    EXPECT_EQ(run({"XADD", "s", "5-5", "f", "v"}),
              "-ERR The ID specified in XADD is equal or smaller than the target stream top item\r\n");
    EXPECT_EQ(run({"XADD", "s", "bad", "f", "v"}),
              "-ERR Invalid stream ID specified as stream command argument\r\n");
}

TEST_F(CommandEngineTest, XrangeErrors) {
    EXPECT_EQ(run({"XRANGE", "s", "x", "+"}),
              "-ERR Invalid stream ID specified as stream command argument\r\n");
    EXPECT_EQ(run({"XRANGE", "s", "-", "+", "LIMIT", "1"}), "-ERR syntax error\r\n");
}

TEST_F(CommandEngineTest, XreadReturnsOnlyStreamsWithNewEntries) {
    run({"XADD", "a", "1-1", "f", "v"});
    run({"XADD", "b", "1-1", "g", "w"});

    EXPECT_EQ(run({"XREAD", "STREAMS", "a", "b", "0", "1-1"}),
              "*1\r\n*2\r\n$1\r\na\r\n*1\r\n*2\r\n$3\r\n1-1\r\n*2\r\n$1\r\nf\r\n$1\r\nv\r\n");
    EXPECT_EQ(run({"XREAD", "STREAMS", "a", "$"}), "*-1\r\n");
}

TEST_F(CommandEngineTest, XreadCountLimitsEachStream) {
    run({"XADD", "a", "1-1", "f", "1"});
    run({"XADD", "a", "1-2", "f", "2"});
    const auto reply = run({"XREAD", "COUNT", "1", "STREAMS", "a", "0-0"});
    EXPECT_NE(reply.find("1-1"), std::string::npos);
    EXPECT_EQ(reply.find("1-2"), std::string::npos);
}

TEST_F(CommandEngineTest, XreadArgumentErrors) {
    EXPECT_EQ(run({"XREAD", "STREAMS", "a", "b", "0"}),
              "-ERR Unbalanced 'xread' list of streams: for each stream key an ID or '$' "
              "must be specified.\r\n");
    EXPECT_EQ(run({"XREAD", "FOO", "1", "STREAMS", "a", "0"}), "-ERR syntax error\r\n");
    EXPECT_EQ(run({"XREAD", "BLOCK", "-1", "STREAMS", "a", "0"}), "-ERR timeout is negative\r\n");
    EXPECT_EQ(run({"XREAD", "STREAMS", "a", "x-y"}),
              "-ERR Invalid stream ID specified as stream command argument\r\n");
}

// ── INFO ──────────────────────────────────────────────────────────────────────

TEST_F(CommandEngineTest, InfoDefaultHasAllSections) {
    const auto reply = run({"INFO"});
    for (const char* section : {"# Server", "# Clients", "# Stats", "# Replication",
                                "# Keyspace"}) {
        EXPECT_NE(reply.find(section), std::string::npos) << section;
    }
    EXPECT_NE(reply.find("role:master"), std::string::npos);
    EXPECT_NE(reply.find("master_repl_offset:0"), std::string::npos);
}

TEST_F(CommandEngineTest, InfoSingleSection) {
    run({"SET", "a", "1"});
    run({"SET", "b", "2", "PX", "1000"});
    const auto reply = run({"INFO", "KEYSPACE"});
    EXPECT_EQ(reply.find("# Server"), std::string::npos);
    EXPECT_NE(reply.find("db0:keys=2,expires=1,avg_ttl=0"), std::string::npos);
}

TEST_F(CommandEngineTest, InfoReplicationIdIsStable) {
    const auto first = run({"INFO", "replication"});
    const auto pos = first.find("master_replid:");
    ASSERT_NE(pos, std::string::npos);
    const auto id = first.substr(pos + 14, 40);
    EXPECT_EQ(id.find_first_not_of("0123456789abcdef"), std::string::npos);
    EXPECT_NE(run({"INFO", "replication"}).find(id), std::string::npos);
}

// ── EXEC batches ──────────────────────────────────────────────────────────────

TEST_F(CommandEngineTest, BatchRunsInOrderAndKeepsErrorsInTheirSlot) {
    run({"SET", "s", "abc"});
    const Reply reply = engine_.execute_batch({
        {"SET", "n", "1"},
        {"INCR", "s"},
        {"INCR", "n"},
        {"GET", "n"},
    });
    EXPECT_EQ(network::serialize_reply(reply),
              "*4\r\n+OK\r\n-ERR value is not an integer or out of range\r\n:2\r\n$1\r\n2\r\n");
}

TEST_F(CommandEngineTest, BatchBlpopDoesNotWait) {
    const Reply reply = engine_.execute_batch({{"BLPOP", "l", "0"}, {"RPUSH", "l", "a"}});
    EXPECT_EQ(network::serialize_reply(reply), "*2\r\n*-1\r\n:1\r\n");
}

// ── Blocking path ─────────────────────────────────────────────────────────────

TEST_F(CommandEngineTest, BlpopServedImmediatelyWhenDataExists) {
    run({"RPUSH", "l", "a"});
    std::optional<std::string> reply;
    spawn(1, {"BLPOP", "l", "0"}, reply);
    ioc_.run();
    EXPECT_EQ(reply, "*2\r\n$1\r\nl\r\n$1\r\na\r\n");
    EXPECT_EQ(blocked_, 0);
}

TEST_F(CommandEngineTest, BlpopWakesOnPush) {
    std::optional<std::string> reply;
    spawn(1, {"BLPOP", "l", "0"}, reply);
    ioc_.poll();
    EXPECT_FALSE(reply.has_value());
    EXPECT_EQ(blocked_, 1);

    EXPECT_EQ(run({"RPUSH", "l", "a"}), ":1\r\n");
    ioc_.run();
    EXPECT_EQ(reply, "*2\r\n$1\r\nl\r\n$1\r\na\r\n");
    EXPECT_EQ(run({"LLEN", "l"}), ":0\r\n");
}

TEST_F(CommandEngineTest, BlpopClientsAreServedFirstComeFirstServed) {
    std::optional<std::string> first, second;
    spawn(1, {"BLPOP", "l", "0"}, first);
    ioc_.poll();
    spawn(2, {"BLPOP", "l", "0"}, second);
    ioc_.poll();

    run({"RPUSH", "l", "x"});
    ioc_.poll();
    EXPECT_EQ(first, "*2\r\n$1\r\nl\r\n$1\r\nx\r\n");
    EXPECT_FALSE(second.has_value());

    run({"RPUSH", "l", "y"});
    ioc_.run();
    EXPECT_EQ(second, "*2\r\n$1\r\nl\r\n$1\r\ny\r\n");
}

TEST_F(CommandEngineTest, BlpopTimesOutWithNullArray) {
    std::optional<std::string> reply;
    spawn(1, {"BLPOP", "l", "0.05"}, reply);
    ioc_.run();
    EXPECT_EQ(reply, "*-1\r\n");
    EXPECT_EQ(coordinator_.blocked_clients(), 0u);
}

TEST_F(CommandEngineTest, BlpopCancelledClientLeavesDataAlone) {
    std::optional<std::string> reply;
    spawn(5, {"BLPOP", "l", "0"}, reply);
    ioc_.poll();
    coordinator_.cancel_client(5);
    ioc_.run();
    EXPECT_EQ(reply, "*-1\r\n");

    run({"RPUSH", "l", "a"});
    EXPECT_EQ(run({"LLEN", "l"}), ":1\r\n");
}

TEST_F(CommandEngineTest, XreadBlockWakesEveryReader) {
    run({"XADD", "s", "1-1", "f", "old"});

    std::optional<std::string> r1, r2;
    spawn(1, {"XREAD", "BLOCK", "0", "STREAMS", "s", "$"}, r1);
    spawn(2, {"XREAD", "BLOCK", "0", "STREAMS", "s", "1-1"}, r2);
    ioc_.poll();
    EXPECT_FALSE(r1 || r2);

    run({"XADD", "s", "2-1", "f", "new"});
    ioc_.run();

    const std::string expected =
        "*1\r\n*2\r\n$1\r\ns\r\n*1\r\n*2\r\n$3\r\n2-1\r\n*2\r\n$1\r\nf\r\n$3\r\nnew\r\n";
    EXPECT_EQ(r1, expected);
    EXPECT_EQ(r2, expected);
}

TEST_F(CommandEngineTest, XreadBlockReturnsExistingEntriesWithoutWaiting) {
    run({"XADD", "s", "1-1", "f", "v"});
    std::optional<std::string> reply;
    spawn(1, {"XREAD", "BLOCK", "1000", "STREAMS", "s", "0"}, reply);
    ioc_.run();
    ASSERT_TRUE(reply.has_value());
    EXPECT_NE(reply->find("1-1"), std::string::npos);
    EXPECT_EQ(blocked_, 0);
}

TEST_F(CommandEngineTest, XreadBlockTimesOutWithNullArray) {
    std::optional<std::string> reply;
    spawn(1, {"XREAD", "BLOCK", "50", "STREAMS", "s", "$"}, reply);
    ioc_.run();
    EXPECT_EQ(reply, "*-1\r\n");
}

TEST_F(CommandEngineTest, HugeBlockTimeoutsWaitInsteadOfExpiring) {
    std::optional<std::string> xread_reply, blpop_reply;
    spawn(1, {"XREAD", "BLOCK", "9223372036854775807", "STREAMS", "s", "$"}, xread_reply);
    spawn(2, {"BLPOP", "l", "9000000000000"}, blpop_reply);
    ioc_.poll();
    EXPECT_FALSE(xread_reply.has_value());
    EXPECT_FALSE(blpop_reply.has_value());
    EXPECT_EQ(coordinator_.blocked_clients(), 2u);

    run({"XADD", "s", "1-1", "f", "v"});
    run({"RPUSH", "l", "a"});
    ioc_.run();
    ASSERT_TRUE(xread_reply.has_value());
    EXPECT_NE(xread_reply->find("1-1"), std::string::npos);
    EXPECT_EQ(blpop_reply, "*2\r\n$1\r\nl\r\n$1\r\na\r\n");
}

TEST_F(CommandEngineTest, XreadDollarIgnoresEntriesAddedBeforeTheCall) {
    run({"XADD", "s", "1-1", "f", "v"});
    std::optional<std::string> reply;
    spawn(1, {"XREAD", "BLOCK", "50", "STREAMS", "s", "$"}, reply);
    ioc_.run();
    EXPECT_EQ(reply, "*-1\r\n");
}

} // namespace ember::engine
