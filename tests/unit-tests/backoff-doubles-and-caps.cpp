#include "retry.policy.hh"
#include "unit.test.macros.hh"

#include <chrono>
#include <thread>

using namespace std::chrono_literals;

namespace {
void
default_backoff()
{
    stow::Backoff backoff;

    EXPECT_EQ(long long, backoff.next().count(), 15);
    EXPECT_EQ(long long, backoff.next().count(), 30);
    EXPECT_EQ(long long, backoff.next().count(), 60);
    EXPECT_EQ(long long, backoff.next().count(), 120);

    // 15 * 2^10 = 15360 > 15000
    for (auto i = 0; i < 6; ++i) {
        (void)backoff.next();
    }
    EXPECT_EQ(long long, backoff.next().count(), 15'000);
    EXPECT_EQ(long long, backoff.next().count(), 15'000);
    EXPECT_EQ(long long, backoff.current().count(), 15'000);
}

void
custom_backoff()
{
    stow::Backoff backoff(1ms, 5ms);

    EXPECT_EQ(long long, backoff.next().count(), 1);
    EXPECT_EQ(long long, backoff.next().count(), 2);
    EXPECT_EQ(long long, backoff.next().count(), 4);
    EXPECT_EQ(long long, backoff.next().count(), 5);
    EXPECT_EQ(long long, backoff.next().count(), 5);
}

void
sleep_is_interrupted_by_stop()
{
    std::stop_source source;

    std::thread stopper([&] {
        std::this_thread::sleep_for(20ms);
        source.request_stop();
    });

    const auto start = std::chrono::steady_clock::now();
    const bool completed = stow::sleep_for(10s, source.get_token());
    const auto elapsed = std::chrono::steady_clock::now() - start;
    stopper.join();

    CHECK(!completed);
    EXPECT(elapsed < 5s, "Sleep was not interrupted");
}

void
sleep_runs_to_completion()
{
    std::stop_source source;

    const auto start = std::chrono::steady_clock::now();
    CHECK(stow::sleep_for(10ms, source.get_token()));
    EXPECT(std::chrono::steady_clock::now() - start >= 10ms,
           "Sleep returned early");
}
} // namespace

int
main()
{
    int retval = 1;

    try {
        default_backoff();
        custom_backoff();
        sleep_is_interrupted_by_stop();
        sleep_runs_to_completion();

        retval = 0;
    } catch (const std::exception& exc) {
        LOG_ERROR("Exception: ", exc.what());
    }

    return retval;
}
