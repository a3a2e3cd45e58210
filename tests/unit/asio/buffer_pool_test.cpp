#include <catch2/catch_test_macros.hpp>
#include <conduit/asio/buffer_pool.hpp>

#include <thread>
#include <vector>

using namespace conduit::asio;

TEST_CASE("Buffer pool acquire and release", "[buffer_pool][unit]") {

    SECTION("default buffers are 32 KiB") {
        buffer_pool pool;
        REQUIRE(pool.buffer_size() == 32 * 1024);
        REQUIRE(pool.acquire().size() == 32 * 1024);
    }

    SECTION("released buffers are reused") {
        buffer_pool pool(1024);
        auto buffer = pool.acquire();
        auto* storage = buffer.data();
        pool.release(std::move(buffer));
        REQUIRE(pool.idle() == 1);

        auto reused = pool.acquire();
        REQUIRE(reused.data() == storage);
        REQUIRE(pool.idle() == 0);
    }

    SECTION("buffers of a different size are dropped") {
        buffer_pool pool(1024);
        pool.release(buffer_pool::buffer(10));
        REQUIRE(pool.idle() == 0);
    }

    SECTION("idle buffers are capped") {
        buffer_pool pool(16, 2);
        auto b1 = pool.acquire();
        auto b2 = pool.acquire();
        auto b3 = pool.acquire();
        pool.release(std::move(b1));
        pool.release(std::move(b2));
        pool.release(std::move(b3));
        REQUIRE(pool.idle() == 2);
    }
}

TEST_CASE("Buffer pool leases", "[buffer_pool][unit]") {
    buffer_pool pool(64);

    SECTION("lease returns its buffer when destroyed") {
        {
            auto lease = pool.borrow();
            REQUIRE(lease.size() == 64);
            REQUIRE(lease.data() != nullptr);
            REQUIRE(pool.idle() == 0);
        }
        REQUIRE(pool.idle() == 1);
    }

    SECTION("moved lease releases once") {
        {
            auto first = pool.borrow();
            auto second = std::move(first);
            REQUIRE(second.size() == 64);
        }
        REQUIRE(pool.idle() == 1);
    }
}

TEST_CASE("Buffer pool concurrent use", "[buffer_pool][unit]") {
    buffer_pool pool(256, 8);

    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&pool] {
            for (int i = 0; i < 1000; ++i) {
                auto lease = pool.borrow();
                lease.data()[0] = static_cast<uint8_t>(i);
            }
        });
    }
    for (auto& t : threads) t.join();

    REQUIRE(pool.idle() <= 8);
    REQUIRE(pool.idle() > 0);
}
