#include "test_support.h"

#include "errors.h"
#include "wallet/key_cache.h"

#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

using namespace tollgate;

int main(){
    // Concurrent callers share a single resolver run
    {
        KeyCache cache;
        std::atomic<int> runs{0};
        KeyCache::Resolver slow = [&]() {
            ++runs;
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
            auto k = std::make_shared<ResolvedKey>();
            k->priv.assign(32, 0x42);
            k->address = "0x7E5F4552091A69125d5DFCb7b8C2659029395Bdf";
            return k;
        };

        std::vector<std::shared_ptr<const ResolvedKey>> seen(8);
        std::vector<std::thread> ts;
        for (size_t i = 0; i < seen.size(); ++i)
            ts.emplace_back([&, i] { seen[i] = cache.get_or_resolve(slow); });
        for (auto& t : ts) t.join();

        TEST_CHECK(runs == 1, "resolver ran exactly once");
        for (const auto& k : seen) TEST_CHECK(k && k == seen[0], "every caller got the same key");
        TEST_CHECK(cache.has(), "key cached");

        cache.get_or_resolve(slow);
        TEST_CHECK(runs == 1, "cached key reused");

        cache.clear();
        TEST_CHECK(!cache.has(), "clear drops the key");
        TEST_CHECK(seen[0]->priv == std::vector<uint8_t>(32, 0), "clear wipes the bytes in place");
        cache.get_or_resolve(slow);
        TEST_CHECK(runs == 2, "resolves again after clear");
    }

    // Failures reach every waiter and are not cached
    {
        KeyCache cache;
        std::atomic<int> runs{0};
        KeyCache::Resolver failing = [&]() -> std::shared_ptr<ResolvedKey> {
            ++runs;
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
            throw EngineError(ErrorCode::DECRYPT_FAILED, "bad password");
        };

        std::atomic<int> failures{0};
        std::vector<std::thread> ts;
        for (int i = 0; i < 4; ++i) {
            ts.emplace_back([&] {
                try {
                    cache.get_or_resolve(failing);
                } catch (const EngineError& e) {
                    if (e.code() == ErrorCode::DECRYPT_FAILED) ++failures;
                }
            });
        }
        for (auto& t : ts) t.join();
        TEST_CHECK(failures == 4, "all waiters see the failure");
        TEST_CHECK(runs == 1, "one resolver run for the concurrent batch");
        TEST_CHECK(!cache.has(), "failure not cached");

        auto ok = cache.get_or_resolve([] {
            auto k = std::make_shared<ResolvedKey>();
            k->priv.assign(32, 1);
            k->address = "0x1";
            return k;
        });
        TEST_CHECK(ok && ok->address == "0x1", "next call retries the resolver");
    }

    // Session passwords
    {
        SessionPasswordCache pw;
        int prompts = 0;
        auto prompt = [&](const std::string&) { ++prompts; return std::string("hunter22X"); };
        TEST_CHECK(pw.get_or_prompt("0xABC", prompt) == "hunter22X", "prompted");
        TEST_CHECK(pw.get_or_prompt("0xabc", prompt) == "hunter22X", "address lookup is case-insensitive");
        TEST_CHECK(prompts == 1, "prompt once per address");
        TEST_CHECK(pw.size() == 1 && pw.has("0xAbC"), "one entry");
        TEST_CHECK(pw.remove("0xabc") && !pw.has("0xabc"), "remove");
        pw.get_or_prompt("0xdef", prompt);
        pw.clear();
        TEST_CHECK(pw.size() == 0, "clear");
    }

    std::printf("test_key_cache: OK\n");
    return 0;
}
