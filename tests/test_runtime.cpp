#include <chtest.hpp>

#include <keyco/runtime/delivery_context.h>
#include <keyco/runtime/io_context_pool.h>

#include <boost/asio/post.hpp>

#include <chrono>
#include <future>
#include <stdexcept>
#include <thread>

TEST_CASE("IoContextPool caps the default thread count") {
    auto n = keyco::IoContextPool::DefaultThreads();
    REQUIRE(n >= 1);
    REQUIRE(n <= keyco::IoContextPool::kMaxDefaultThreads);

    keyco::IoContextPool pool(0);
    REQUIRE(pool.size() == n);

    keyco::IoContextPool wide(3);
    REQUIRE(wide.size() == 3);
}

TEST_CASE("IoContextPool runs handlers on its workers") {
    keyco::IoContextPool pool(2);
    REQUIRE(pool.size() == 2);
    pool.Start();
    REQUIRE(pool.running());

    std::promise<std::thread::id> ran;
    auto fut = ran.get_future();
    boost::asio::post(pool.Next(), [&] { ran.set_value(std::this_thread::get_id()); });
    REQUIRE(fut.wait_for(std::chrono::seconds(5)) == std::future_status::ready);
    REQUIRE(fut.get() != std::this_thread::get_id());

    pool.Stop();
    REQUIRE(!pool.running());
}

TEST_CASE("DeliveryContext serializes posts on one thread") {
    keyco::DeliveryContext delivery;
    delivery.Start();
    REQUIRE(!delivery.InDeliveryThread());

    std::promise<bool> done;
    auto fut = done.get_future();
    int order = 0;
    delivery.Post([&] { order = 1; });
    delivery.Post([&] { throw std::runtime_error("callback failure"); });
    delivery.Post([&] { done.set_value(order == 1 && delivery.InDeliveryThread()); });

    REQUIRE(fut.wait_for(std::chrono::seconds(5)) == std::future_status::ready);
    REQUIRE(fut.get());
    delivery.Stop();
    delivery.Stop();
}
