#include "engine/session_dispatcher.hpp"

#include "common/clock.hpp"
#include "network/resp_protocol.hpp"

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <gtest/gtest.h>

#include <optional>
#include <string>

namespace ember::engine {

namespace asio = boost::asio;

class SessionDispatcherTest : public ::testing::Test {
protected:
    void SetUp() override {
        storage_.set_listener(&coordinator_);
    }

    void TearDown() override {
        storage_.set_listener(nullptr);
    }

    static ClientContext client_for(blocking::ClientId id, asio::io_context& ioc) {
        ClientContext client;
        client.id = id;
        client.executor = ioc.get_executor();
        return client;
    }

    // Dispatch one request on `dispatcher` and return its RESP encoding.
    std::string send(SessionDispatcher& dispatcher, Request request) {
        std::optional<std::string> out;
        asio::co_spawn(
            ioc_,
            [&]() -> asio::awaitable<void> {
                Reply reply = co_await dispatcher.dispatch(request);
                out = network::serialize_reply(reply);
            },
            asio::detached);
        ioc_.run();
        ioc_.restart();
        EXPECT_TRUE(out.has_value());
        return out.value_or("");
    }

    std::string send(Request request) {
        return send(dispatcher_, std::move(request));
    }

    asio::io_context ioc_;
    MockClock clock_;
    Storage storage_{clock_};
    blocking::BlockingCoordinator coordinator_;
    ServerStats stats_;
    CommandEngine engine_{storage_, coordinator_, stats_};
    SessionDispatcher dispatcher_{engine_, stats_, client_for(1, ioc_)};
};

TEST_F(SessionDispatcherTest, ExecutesOutsideTransaction) {
    EXPECT_EQ(send({"SET", "k", "v"}), "+OK\r\n");
    EXPECT_EQ(send({"GET", "k"}), "$1\r\nv\r\n");
    EXPECT_EQ(stats_.total_commands.load(), 2u);
}

TEST_F(SessionDispatcherTest, QueuesUntilExec) {
    EXPECT_EQ(send({"MULTI"}), "+OK\r\n");
    EXPECT_EQ(send({"SET", "k", "1"}), "+QUEUED\r\n");
    EXPECT_EQ(send({"INCR", "k"}), "+QUEUED\r\n");
    EXPECT_TRUE(dispatcher_.transaction().queuing());
    EXPECT_EQ(dispatcher_.transaction().queued(), 2u);

    // Nothing ran yet.
    EXPECT_EQ(storage_.type_of("k"), ValueType::None);

    EXPECT_EQ(send({"EXEC"}), "*2\r\n+OK\r\n:2\r\n");
    EXPECT_FALSE(dispatcher_.transaction().queuing());
    EXPECT_EQ(send({"GET", "k"}), "$1\r\n2\r\n");
}

TEST_F(SessionDispatcherTest, EmptyExec) {
    send({"MULTI"});
    EXPECT_EQ(send({"exec"}), "*0\r\n");
}

TEST_F(SessionDispatcherTest, RuntimeErrorOccupiesItsSlot) {
    send({"SET", "s", "abc"});
    send({"MULTI"});
    send({"INCR", "s"});
    send({"SET", "t", "1"});
    EXPECT_EQ(send({"EXEC"}),
              "*2\r\n-ERR value is not an integer or out of range\r\n+OK\r\n");
    EXPECT_EQ(send({"GET", "t"}), "$1\r\n1\r\n");
}

TEST_F(SessionDispatcherTest, UnknownCommandAbortsExec) {
    send({"MULTI"});
    send({"SET", "a", "1"});
    EXPECT_EQ(send({"NOPE"}), "-ERR unknown command 'NOPE', with args beginning with: \r\n");
    EXPECT_EQ(send({"EXEC"}),
              "-EXECABORT Transaction discarded because of previous errors.\r\n");
    EXPECT_EQ(storage_.type_of("a"), ValueType::None);
    EXPECT_FALSE(dispatcher_.transaction().queuing());
}

TEST_F(SessionDispatcherTest, ArityErrorWhileQueuingAbortsExec) {
    send({"MULTI"});
    EXPECT_EQ(send({"GET"}), "-ERR wrong number of arguments for 'get' command\r\n");
    EXPECT_EQ(send({"EXEC"}),
              "-EXECABORT Transaction discarded because of previous errors.\r\n");
}

TEST_F(SessionDispatcherTest, DiscardDropsQueue) {
    send({"MULTI"});
    send({"SET", "a", "1"});
    EXPECT_EQ(send({"DISCARD"}), "+OK\r\n");
    EXPECT_FALSE(dispatcher_.transaction().queuing());
    EXPECT_EQ(send({"GET", "a"}), "$-1\r\n");
}

TEST_F(SessionDispatcherTest, NestedMultiIsRejectedButTransactionContinues) {
    send({"MULTI"});
    EXPECT_EQ(send({"MULTI"}), "-ERR MULTI calls can not be nested\r\n");
    send({"SET", "a", "1"});
    EXPECT_EQ(send({"EXEC"}), "*1\r\n+OK\r\n");
}

TEST_F(SessionDispatcherTest, ExecAndDiscardWithoutMulti) {
    EXPECT_EQ(send({"EXEC"}), "-ERR EXEC without MULTI\r\n");
    EXPECT_EQ(send({"DISCARD"}), "-ERR DISCARD without MULTI\r\n");
}

TEST_F(SessionDispatcherTest, BlockingCommandInsideExecDoesNotWait) {
    send({"MULTI"});
    EXPECT_EQ(send({"BLPOP", "q", "0"}), "+QUEUED\r\n");
    EXPECT_EQ(send({"EXEC"}), "*1\r\n*-1\r\n");
}

TEST_F(SessionDispatcherTest, TransactionsArePerConnection) {
    SessionDispatcher other{engine_, stats_, client_for(2, ioc_)};
    send({"MULTI"});
    send({"SET", "a", "1"});

    EXPECT_EQ(send(other, {"SET", "a", "other"}), "+OK\r\n");
    EXPECT_FALSE(other.transaction().queuing());

    EXPECT_EQ(send({"EXEC"}), "*1\r\n+OK\r\n");
    EXPECT_EQ(send(other, {"GET", "a"}), "$1\r\n1\r\n");
}

} // namespace ember::engine
