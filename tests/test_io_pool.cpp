#include <catch2/catch.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/steady_timer.hpp>
#include <future>
#include <set>
#include <thread>

#include "IoContextPool.hpp"

using namespace switchboard;
using namespace std::chrono_literals;

TEST_CASE("pool hands out its contexts round-robin", "[io_pool]") {
    infra::IoContextPool pool(3);
    CHECK(pool.size() == 3);

    std::set<asio::io_context*> seen;
    for (int i = 0; i < 6; ++i) {
        seen.insert(&pool.get_io_context());
    }
    CHECK(seen.size() == 3);

    CHECK_THROWS_AS(infra::IoContextPool(0), std::invalid_argument);
}

TEST_CASE("drain lets queued work finish", "[io_pool]") {
    infra::IoContextPool pool(2);
    pool.run();

    std::promise<std::thread::id> ran;
    auto fut = ran.get_future();
    asio::post(pool.get_io_context(), [&ran] { ran.set_value(std::this_thread::get_id()); });

    REQUIRE(fut.wait_for(2s) == std::future_status::ready);
    CHECK(fut.get() != std::this_thread::get_id());
    CHECK(pool.drain(2000ms));
}

TEST_CASE("drain stops contexts that stay busy", "[io_pool]") {
    infra::IoContextPool pool(1);
    pool.run();

    asio::steady_timer timer(pool.get_io_context(), 30s);
    timer.async_wait([](const boost::system::error_code&) {});

    const auto started = std::chrono::steady_clock::now();
    CHECK_FALSE(pool.drain(50ms));
    CHECK(std::chrono::steady_clock::now() - started < 5s);
}
