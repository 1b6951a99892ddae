#include <catch2/catch.hpp>
#include <h2bridge/h2bridge.hpp>

#include <atomic>
#include <memory>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include "../test_main.cpp"

using namespace h2bridge;
using namespace h2bridge::http;
using namespace h2bridge::test;

TEST_CASE("concurrent requests for one key build a single pool", "[adapter][concurrency]") {
    auto transport = std::make_shared<fake_transport>();
    transport->set_creation_delay(scaled_ms(50));
    http2_adapter adapter(transport);

    const int num_threads = 8;
    std::atomic<int> ok{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < num_threads; ++i) {
        threads.emplace_back([&]() {
            send_options options;
            options.verify = false;
            options.trust_env = false;
            request req;
            req.url = "https://example.com/";
            if (adapter.send(req, options).status_code == 200) {
                ok.fetch_add(1);
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    REQUIRE(ok.load() == num_threads);
    REQUIRE(transport->created() == 1);
    REQUIRE(transport->pools().front()->requests().size() == static_cast<size_t>(num_threads));
}

TEST_CASE("distinct keys are built independently", "[pool][concurrency]") {
    auto transport = std::make_shared<fake_transport>();
    transport->set_creation_delay(scaled_ms(20));
    pool::pool_manager manager(transport, 16);

    const int num_keys = 6;
    std::vector<std::shared_ptr<transport::connection_pool>> pools(num_keys * 2);
    std::vector<std::thread> threads;
    for (int i = 0; i < num_keys * 2; ++i) {
        threads.emplace_back([&, i]() {
            pool::pool_context ctx;
            ctx.retries = static_cast<size_t>(i % num_keys);
            pools[i] = manager.connection_from_context(ctx);
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    REQUIRE(transport->created() == num_keys);
    REQUIRE(manager.size() == static_cast<size_t>(num_keys));
    for (int i = 0; i < num_keys; ++i) {
        REQUIRE(pools[i] == pools[i + num_keys]);
    }
    std::set<transport::connection_pool*> unique;
    for (const auto& p : pools) unique.insert(p.get());
    REQUIRE(unique.size() == static_cast<size_t>(num_keys));
}

TEST_CASE("a failed build is shared by its waiters and not cached", "[pool][concurrency]") {
    auto transport = std::make_shared<fake_transport>();
    transport->set_creation_delay(scaled_ms(50));
    transport->fail_next_creations(1);
    pool::pool_manager manager(transport);

    std::atomic<int> failures{0};
    std::atomic<int> successes{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < 4; ++i) {
        threads.emplace_back([&]() {
            try {
                manager.connection_from_context(pool::pool_context{});
                successes.fetch_add(1);
            } catch (const std::runtime_error&) {
                failures.fetch_add(1);
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    REQUIRE(failures.load() >= 1);
    REQUIRE(failures.load() + successes.load() == 4);
    // Whatever succeeded was built after the failure; the key works now
    REQUIRE(manager.connection_from_context(pool::pool_context{}) != nullptr);
    REQUIRE(manager.size() == 1);
}

TEST_CASE("concurrent bodies keep their own byte order", "[adapter][concurrency]") {
    auto transport = std::make_shared<fake_transport>([](const transport::request& req) {
        fake_reply reply;
        // Body derived from the path so every response is distinct
        const auto body = req.url.substr(req.url.rfind('/') + 1) + make_payload(50000);
        reply.headers = {{"Content-Encoding", "br"}};
        reply.fragments = fragment(brotli_compress(body), 999);
        return reply;
    });
    http2_adapter adapter(transport);

    const int num_threads = 6;
    std::atomic<int> matched{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < num_threads; ++i) {
        threads.emplace_back([&, i]() {
            send_options options;
            options.verify = false;
            options.trust_env = false;
            options.stream_chunk_size = 4096;
            request req;
            req.url = "http://example.com/" + std::to_string(i);
            auto resp = adapter.send(req, options);
            std::string body;
            auto reader = resp.iter_content();
            while (auto chunk = reader.next()) {
                body += *chunk;
            }
            if (body == std::to_string(i) + make_payload(50000)) {
                matched.fetch_add(1);
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    REQUIRE(matched.load() == num_threads);
}
